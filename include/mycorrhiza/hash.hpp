/**
 * @file hash.hpp
 * @brief SHA-256 and system randomness used by the transport core.
 *
 * @details
 * The core needs exactly three one-way hash uses: the 8-byte payload hash in
 * every packet header, the 16-byte address derived from a public key, and the
 * 16-byte transfer id. None of them is a signature; signing and encryption go
 * through the crypto capability (identity.hpp) instead.
 *
 * BACKENDS
 * --------
 * - Linux / desktop: OpenSSL EVP digest API and RAND_bytes.
 * - ARDUINO (ESP32): mbedTLS SHA-256 shipped with the SDK and esp_fill_random.
 *
 * Both produce identical digests; only the plumbing differs.
 */
#ifndef MYCORRHIZA_HASH_HPP
#define MYCORRHIZA_HASH_HPP

#include <array>
#include <memory>
#include <stddef.h>
#include <stdint.h>

namespace mycorrhiza {

static constexpr size_t DIGEST_SIZE = 32;
using Digest = std::array<uint8_t, DIGEST_SIZE>;

/**
 * @class Sha256
 * @brief Incremental SHA-256 for inputs assembled from several pieces.
 *
 * Owns the backend context; not copyable. finish() may be called once.
 */
class Sha256 {
public:
  Sha256();
  ~Sha256();
  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  void   update(const uint8_t* data, size_t n);
  Digest finish();

private:
  /// EVP_MD_CTX* or mbedtls_sha256_context*; the deleter matches the backend.
  std::unique_ptr<void, void (*)(void*)> ctx_;
};

/// One-shot SHA-256.
Digest sha256(const uint8_t* data, size_t n);

/**
 * @brief First @p out_len bytes of SHA-256(data).
 * @param out_len  at most DIGEST_SIZE
 */
void truncated_sha256(const uint8_t* data, size_t n, uint8_t* out, size_t out_len);

/**
 * @brief Fill @p out with cryptographically strong random bytes.
 * @return false if the platform source failed (desktop only).
 */
bool random_bytes(uint8_t* out, size_t n);

} // namespace mycorrhiza

#endif // MYCORRHIZA_HASH_HPP
