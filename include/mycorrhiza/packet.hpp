/**
 * @file packet.hpp
 * @brief Mesh packet model and the 32-byte header wire codec.
 *
 * @details
 * ## Wire format
 * ```
 *  0      1      2          3      4 ............ 19  20..21       22 ......... 29  30..31
 * +------+------+----------+------+---------------+-------------+----------------+--------+
 * |flags | ttl  |hop_count | type |  destination  | payload_len | payload_hash   |reserved|
 * +------+------+----------+------+---------------+-------------+----------------+--------+
 *  then payload_len bytes of payload, then 64 bytes of signature iff flags.SIGNED
 * ```
 * All multi-byte integers are big-endian. `payload_hash` is the first 8 bytes
 * of SHA-256(payload). There is no source address: where the origin matters
 * it is established by a signature through the crypto capability.
 *
 * ## Flag bits
 * 7 ENCRYPTED, 6 SIGNED, 5 PRIORITY, 4 FRAGMENTED, 3..0 reserved (written as
 * zero, ignored on receipt).
 *
 * ## Decode contract
 * - fewer than 32 bytes                       -> DecodeError::Truncated
 * - payload_len (+64 if SIGNED) != remaining  -> DecodeError::LengthMismatch
 * - fresh payload hash != header hash         -> DecodeError::HashMismatch
 *
 * The length check runs before the payload vector is sized, so a corrupt or
 * hostile header can never make the decoder allocate more than the bytes it
 * was actually handed.
 *
 * ## Forwarding mutation
 * Intermediate nodes only ever touch `ttl` and `hop_count` (increment_hop()).
 * The signature covers the header with those two bytes zeroed, so a signed
 * packet stays verifiable at every hop.
 */
#ifndef MYCORRHIZA_PACKET_HPP
#define MYCORRHIZA_PACKET_HPP

#include <array>
#include <vector>
#include <stddef.h>
#include <stdint.h>
#include "mycorrhiza/address.hpp"

namespace mycorrhiza {

static constexpr size_t   HEADER_SIZE       = 32;
static constexpr size_t   SIGNATURE_SIZE    = 64;
static constexpr size_t   PAYLOAD_HASH_SIZE = 8;
static constexpr size_t   MAX_PAYLOAD       = 65535;
static constexpr uint8_t  DEFAULT_TTL       = 32;

/// Header flag bits.
enum : uint8_t {
  FLAG_ENCRYPTED  = 0x80,
  FLAG_SIGNED     = 0x40,
  FLAG_PRIORITY   = 0x20,
  FLAG_FRAGMENTED = 0x10,
  FLAG_RESERVED   = 0x0F   ///< must be zero on send
};

enum class PacketType : uint8_t {
  Data         = 0x01,
  Announce     = 0x02,
  PathRequest  = 0x03,
  PathResponse = 0x04,
  Ack          = 0x05,
  Keepalive    = 0x06
};

enum class DecodeError : uint8_t {
  None = 0,
  Truncated,
  LengthMismatch,
  HashMismatch
};

using PayloadHash = std::array<uint8_t, PAYLOAD_HASH_SIZE>;
using Signature   = std::array<uint8_t, SIGNATURE_SIZE>;

struct PacketHeader {
  uint8_t     flags{0};
  uint8_t     ttl{DEFAULT_TTL};
  uint8_t     hop_count{0};
  PacketType  type{PacketType::Data};
  Address     destination{};
  uint16_t    payload_len{0};    ///< filled by encode(); checked by decode()
  PayloadHash payload_hash{};    ///< filled by encode(); checked by decode()

  bool is_signed()     const { return (flags & FLAG_SIGNED) != 0; }
  bool is_encrypted()  const { return (flags & FLAG_ENCRYPTED) != 0; }
  bool is_fragmented() const { return (flags & FLAG_FRAGMENTED) != 0; }
  bool is_priority()   const { return (flags & FLAG_PRIORITY) != 0; }
};

bool operator==(const PacketHeader& a, const PacketHeader& b);
inline bool operator!=(const PacketHeader& a, const PacketHeader& b) { return !(a == b); }

/**
 * @brief A decoded packet. The payload owns exactly payload_len bytes.
 */
struct Packet {
  PacketHeader         header{};
  std::vector<uint8_t> payload;
  bool                 has_signature{false};
  Signature            signature{};
};

/**
 * @brief Serialize header + payload (+ signature) into @p out.
 *
 * `payload_len` and `payload_hash` are computed from @p payload, reserved
 * flag bits are cleared and SIGNED is set iff @p signature is non-null.
 *
 * @param header     source of flags, ttl, hop_count, type and destination
 * @param payload    payload bytes (may be null when @p n is 0)
 * @param n          payload length
 * @param signature  optional 64-byte signature trailer
 * @param out        cleared, then filled with the wire bytes
 * @retval false  payload larger than 65535 bytes, or header marked SIGNED
 *                with no signature supplied; @p out is left empty
 */
bool encode(const PacketHeader& header, const uint8_t* payload, size_t n,
            const Signature* signature, std::vector<uint8_t>& out);

/// Convenience overload for an in-memory Packet.
bool encode(const Packet& packet, std::vector<uint8_t>& out);

/**
 * @brief Parse and validate wire bytes.
 * @return DecodeError::None on success, with @p out fully populated.
 */
DecodeError decode(const uint8_t* data, size_t n, Packet& out);

/// Hop bookkeeping for forwarders: hop_count+1 (saturating), ttl-1 (clamped at 0).
void increment_hop(PacketHeader& header);

/**
 * @brief Bytes a signature covers: the encoded header with ttl and hop_count
 * zeroed, followed by the payload.
 */
void signing_data(const PacketHeader& header, const uint8_t* payload, size_t n,
                  std::vector<uint8_t>& out);

const char* to_string(DecodeError e);
const char* to_string(PacketType t);

} // namespace mycorrhiza

#endif // MYCORRHIZA_PACKET_HPP
