// -----------------------------------------------------------------------------
// hash.cpp - SHA-256 and randomness backends
//
// API: see include/mycorrhiza/hash.hpp
//
// Desktop builds link OpenSSL (libcrypto). ARDUINO builds use the mbedTLS
// copy that ships with the ESP32 SDK.
// -----------------------------------------------------------------------------
#include "mycorrhiza/hash.hpp"

#include <string.h>

#ifdef ARDUINO
#include <esp_random.h>
#include <mbedtls/sha256.h>
#else
#include <openssl/evp.h>
#include <openssl/rand.h>
#endif

namespace mycorrhiza {

#ifdef ARDUINO

namespace {

void free_context(void* p) {
  std::unique_ptr<mbedtls_sha256_context> c(static_cast<mbedtls_sha256_context*>(p));
  if (c) mbedtls_sha256_free(c.get());
}

} // namespace

Sha256::Sha256() : ctx_(nullptr, &free_context) {
  auto c = std::make_unique<mbedtls_sha256_context>();
  mbedtls_sha256_init(c.get());
  mbedtls_sha256_starts(c.get(), 0);   // 0 = SHA-256, not SHA-224
  ctx_.reset(c.release());
}

Sha256::~Sha256() = default;

void Sha256::update(const uint8_t* data, size_t n) {
  if (n == 0) return;
  mbedtls_sha256_update(static_cast<mbedtls_sha256_context*>(ctx_.get()), data, n);
}

Digest Sha256::finish() {
  Digest d{};
  mbedtls_sha256_finish(static_cast<mbedtls_sha256_context*>(ctx_.get()), d.data());
  return d;
}

bool random_bytes(uint8_t* out, size_t n) {
  esp_fill_random(out, n);          // hardware RNG; cannot fail
  return true;
}

#else

namespace {

void free_context(void* p) {
  EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(p));
}

} // namespace

Sha256::Sha256() : ctx_(EVP_MD_CTX_new(), &free_context) {
  if (ctx_ && EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_.get()), EVP_sha256(), nullptr) != 1) {
    ctx_.reset();
  }
}

Sha256::~Sha256() = default;

void Sha256::update(const uint8_t* data, size_t n) {
  if (!ctx_ || n == 0) return;
  EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_.get()), data, n);
}

Digest Sha256::finish() {
  Digest d{};
  if (!ctx_) return d;
  unsigned int len = 0;
  unsigned char md[EVP_MAX_MD_SIZE];
  EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_.get()), md, &len);
  memcpy(d.data(), md, len < DIGEST_SIZE ? len : DIGEST_SIZE);
  return d;
}

bool random_bytes(uint8_t* out, size_t n) {
  return RAND_bytes(out, static_cast<int>(n)) == 1;
}

#endif

// ---------- backend-independent helpers ----------

Digest sha256(const uint8_t* data, size_t n) {
  Sha256 h;
  h.update(data, n);
  return h.finish();
}

void truncated_sha256(const uint8_t* data, size_t n, uint8_t* out, size_t out_len) {
  Digest d = sha256(data, n);
  if (out_len > DIGEST_SIZE) out_len = DIGEST_SIZE;
  memcpy(out, d.data(), out_len);
}

} // namespace mycorrhiza
