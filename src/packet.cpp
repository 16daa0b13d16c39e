// -----------------------------------------------------------------------------
// packet.cpp - header codec implementation
//
// API & wire layout: see include/mycorrhiza/packet.hpp
// Tests: tests/test_packet.cpp
// -----------------------------------------------------------------------------
#include "mycorrhiza/packet.hpp"
#include "mycorrhiza/hash.hpp"

#include <string.h>

namespace mycorrhiza {

namespace {

// field offsets inside the 32-byte header
constexpr size_t OFF_FLAGS = 0;
constexpr size_t OFF_TTL   = 1;
constexpr size_t OFF_HOPS  = 2;
constexpr size_t OFF_TYPE  = 3;
constexpr size_t OFF_DEST  = 4;
constexpr size_t OFF_LEN   = 20;
constexpr size_t OFF_HASH  = 22;
constexpr size_t OFF_RSVD  = 30;

void put_header(const PacketHeader& h, uint16_t len, const PayloadHash& hash,
                uint8_t* out) {
  out[OFF_FLAGS] = h.flags;
  out[OFF_TTL]   = h.ttl;
  out[OFF_HOPS]  = h.hop_count;
  out[OFF_TYPE]  = static_cast<uint8_t>(h.type);
  memcpy(out + OFF_DEST, h.destination.data(), ID_SIZE);
  out[OFF_LEN]     = static_cast<uint8_t>(len >> 8);
  out[OFF_LEN + 1] = static_cast<uint8_t>(len & 0xFF);
  memcpy(out + OFF_HASH, hash.data(), PAYLOAD_HASH_SIZE);
  out[OFF_RSVD]     = 0;
  out[OFF_RSVD + 1] = 0;
}

PayloadHash hash_of(const uint8_t* payload, size_t n) {
  PayloadHash h{};
  truncated_sha256(payload, n, h.data(), PAYLOAD_HASH_SIZE);
  return h;
}

} // namespace

bool operator==(const PacketHeader& a, const PacketHeader& b) {
  return a.flags == b.flags && a.ttl == b.ttl && a.hop_count == b.hop_count &&
         a.type == b.type && a.destination == b.destination &&
         a.payload_len == b.payload_len && a.payload_hash == b.payload_hash;
}

// -----------------------------------------------------------------------------
// encode()
// PRE:    payload fits in u16; SIGNED header implies a signature was supplied.
// OUT:    header | payload | signature?  (exact size, single reservation)
// -----------------------------------------------------------------------------
bool encode(const PacketHeader& header, const uint8_t* payload, size_t n,
            const Signature* signature, std::vector<uint8_t>& out) {
  out.clear();
  if (n > MAX_PAYLOAD) return false;
  if (header.is_signed() && !signature) return false;

  PacketHeader h = header;
  h.flags = static_cast<uint8_t>(h.flags & ~FLAG_RESERVED);
  if (signature) h.flags |= FLAG_SIGNED;

  const PayloadHash hash = hash_of(payload, n);

  out.resize(HEADER_SIZE + n + (signature ? SIGNATURE_SIZE : 0));
  put_header(h, static_cast<uint16_t>(n), hash, out.data());
  if (n) memcpy(out.data() + HEADER_SIZE, payload, n);
  if (signature) memcpy(out.data() + HEADER_SIZE + n, signature->data(), SIGNATURE_SIZE);
  return true;
}

bool encode(const Packet& packet, std::vector<uint8_t>& out) {
  return encode(packet.header, packet.payload.data(), packet.payload.size(),
                packet.has_signature ? &packet.signature : nullptr, out);
}

// -----------------------------------------------------------------------------
// decode()
// PRE:    nothing; any byte soup is acceptable input.
// POLICY: lengths are validated against n before anything is allocated.
// -----------------------------------------------------------------------------
DecodeError decode(const uint8_t* data, size_t n, Packet& out) {
  if (!data || n < HEADER_SIZE) return DecodeError::Truncated;

  PacketHeader h;
  h.flags     = static_cast<uint8_t>(data[OFF_FLAGS] & ~FLAG_RESERVED);  // ignored on receipt
  h.ttl       = data[OFF_TTL];
  h.hop_count = data[OFF_HOPS];
  h.type      = static_cast<PacketType>(data[OFF_TYPE]);
  h.destination = Address::from_bytes(data + OFF_DEST);
  h.payload_len = static_cast<uint16_t>((data[OFF_LEN] << 8) | data[OFF_LEN + 1]);
  memcpy(h.payload_hash.data(), data + OFF_HASH, PAYLOAD_HASH_SIZE);

  const size_t trailer  = h.is_signed() ? SIGNATURE_SIZE : 0;
  const size_t remaining = n - HEADER_SIZE;
  if (remaining != static_cast<size_t>(h.payload_len) + trailer) {
    return DecodeError::LengthMismatch;
  }

  const uint8_t* payload = data + HEADER_SIZE;
  if (hash_of(payload, h.payload_len) != h.payload_hash) {
    return DecodeError::HashMismatch;
  }

  out.header = h;
  out.payload.assign(payload, payload + h.payload_len);
  out.has_signature = h.is_signed();
  if (out.has_signature) {
    memcpy(out.signature.data(), payload + h.payload_len, SIGNATURE_SIZE);
  } else {
    out.signature.fill(0);
  }
  return DecodeError::None;
}

void increment_hop(PacketHeader& header) {
  if (header.hop_count < 0xFF) ++header.hop_count;
  if (header.ttl > 0) --header.ttl;
}

void signing_data(const PacketHeader& header, const uint8_t* payload, size_t n,
                  std::vector<uint8_t>& out) {
  PacketHeader h = header;
  h.flags = static_cast<uint8_t>((h.flags & ~FLAG_RESERVED) | FLAG_SIGNED);
  h.ttl = 0;
  h.hop_count = 0;
  out.resize(HEADER_SIZE + n);
  put_header(h, static_cast<uint16_t>(n), hash_of(payload, n), out.data());
  if (n) memcpy(out.data() + HEADER_SIZE, payload, n);
}

const char* to_string(DecodeError e) {
  switch (e) {
    case DecodeError::None:           return "none";
    case DecodeError::Truncated:      return "truncated";
    case DecodeError::LengthMismatch: return "length_mismatch";
    case DecodeError::HashMismatch:   return "hash_mismatch";
  }
  return "unknown";
}

const char* to_string(PacketType t) {
  switch (t) {
    case PacketType::Data:         return "DATA";
    case PacketType::Announce:     return "ANNOUNCE";
    case PacketType::PathRequest:  return "PATH_REQUEST";
    case PacketType::PathResponse: return "PATH_RESPONSE";
    case PacketType::Ack:          return "ACK";
    case PacketType::Keepalive:    return "KEEPALIVE";
  }
  return "UNKNOWN";
}

} // namespace mycorrhiza
