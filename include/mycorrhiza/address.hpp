/**
 * @file address.hpp
 * @brief 128-bit identifiers: node addresses and transfer ids.
 *
 * @details
 * PURPOSE
 * -------
 * An Address is the only routing key in the mesh. It is the first 16 bytes of
 * SHA-256 over a node's signing public key, so it is stable for as long as
 * the key is, reveals nothing about the key, and costs no coordination to
 * allocate. Transfer ids have the same shape but a different meaning, so both
 * are instances of one tagged template and cannot be mixed up at call sites.
 *
 * DESIGN NOTES
 * ------------
 * - Plain aggregate over std::array: trivially copyable, fits in ETL
 *   containers, compares byte-exact.
 * - operator< gives a total order so ids can key an etl::map.
 * - Hex helpers return an etl::string<32> so they are usable on MCUs without
 *   touching the heap.
 *
 * EXAMPLE
 * -------
 * @code
 *   mycorrhiza::Address a;
 *   if (mycorrhiza::parse_hex("00112233445566778899aabbccddeeff", a)) {
 *     auto hex = mycorrhiza::to_hex(a);   // etl::string<32>
 *   }
 * @endcode
 */
#ifndef MYCORRHIZA_ADDRESS_HPP
#define MYCORRHIZA_ADDRESS_HPP

#include <array>
#include <stddef.h>
#include <stdint.h>
#include <string.h>
#include "etl/string.h"

namespace mycorrhiza {

static constexpr size_t ID_SIZE = 16;   ///< bytes in an address or transfer id

/**
 * @brief Fixed 16-byte identifier, tagged by meaning.
 * @tparam Tag  empty marker type; keeps Address and TransferId distinct.
 */
template <typename Tag>
struct Id128 {
  std::array<uint8_t, ID_SIZE> bytes{};

  const uint8_t* data() const { return bytes.data(); }
  uint8_t*       data()       { return bytes.data(); }

  /// @return true when every byte is zero (the "unknown" value).
  bool is_zero() const {
    for (uint8_t b : bytes) if (b != 0) return false;
    return true;
  }

  /// Copy exactly ID_SIZE bytes from @p src.
  static Id128 from_bytes(const uint8_t* src) {
    Id128 id;
    memcpy(id.bytes.data(), src, ID_SIZE);
    return id;
  }

  friend bool operator==(const Id128& a, const Id128& b) { return a.bytes == b.bytes; }
  friend bool operator!=(const Id128& a, const Id128& b) { return !(a == b); }
  friend bool operator<(const Id128& a, const Id128& b) {
    return memcmp(a.bytes.data(), b.bytes.data(), ID_SIZE) < 0;
  }
};

struct AddressTag {};
struct TransferTag {};

using Address    = Id128<AddressTag>;   ///< node address (routing key)
using TransferId = Id128<TransferTag>;  ///< file transfer identifier

using HexStr = etl::string<ID_SIZE * 2>;

/**
 * @brief Derive a node address from its signing public key.
 *
 * @param public_key  signing public key bytes
 * @param n           number of key bytes (32 for Ed25519)
 * @return first 16 bytes of SHA-256(public_key)
 */
Address derive_address(const uint8_t* public_key, size_t n);

/// Lowercase hex rendering of an id (always 32 characters).
template <typename Tag>
HexStr to_hex(const Id128<Tag>& id);

/**
 * @brief Parse 32 hex characters (either case) into an id.
 * @retval true   @p out holds the parsed value
 * @retval false  wrong length or a non-hex character; @p out untouched
 */
template <typename Tag>
bool parse_hex(const char* text, Id128<Tag>& out);

/// Short form for logs: first 16 hex characters.
template <typename Tag>
etl::string<16> short_hex(const Id128<Tag>& id) {
  HexStr full = to_hex(id);
  return etl::string<16>(full.c_str(), 16);
}

} // namespace mycorrhiza

#endif // MYCORRHIZA_ADDRESS_HPP
