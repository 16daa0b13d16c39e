// -----------------------------------------------------------------------------
// address.cpp - address derivation and hex helpers
//
// API: see include/mycorrhiza/address.hpp
// -----------------------------------------------------------------------------
#include "mycorrhiza/address.hpp"
#include "mycorrhiza/hash.hpp"

namespace mycorrhiza {

namespace {

const char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

Address derive_address(const uint8_t* public_key, size_t n) {
  Address a;
  truncated_sha256(public_key, n, a.data(), ID_SIZE);
  return a;
}

template <typename Tag>
HexStr to_hex(const Id128<Tag>& id) {
  HexStr out;
  for (uint8_t b : id.bytes) {
    out += HEX_DIGITS[b >> 4];
    out += HEX_DIGITS[b & 0x0F];
  }
  return out;
}

template <typename Tag>
bool parse_hex(const char* text, Id128<Tag>& out) {
  if (!text) return false;
  Id128<Tag> tmp;
  for (size_t i = 0; i < ID_SIZE; ++i) {
    // a NUL inside the first 32 chars fails hex_value, so short input is caught here
    int hi = hex_value(text[2 * i]);
    if (hi < 0) return false;
    int lo = hex_value(text[2 * i + 1]);
    if (lo < 0) return false;
    tmp.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  if (text[2 * ID_SIZE] != '\0') return false;   // trailing garbage
  out = tmp;
  return true;
}

// Explicit instantiations for the two id kinds.
template HexStr to_hex<AddressTag>(const Id128<AddressTag>&);
template HexStr to_hex<TransferTag>(const Id128<TransferTag>&);
template bool parse_hex<AddressTag>(const char*, Id128<AddressTag>&);
template bool parse_hex<TransferTag>(const char*, Id128<TransferTag>&);

} // namespace mycorrhiza
