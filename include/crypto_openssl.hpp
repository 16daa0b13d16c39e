#pragma once
/**
 * @file crypto_openssl.hpp
 * @brief ICrypto on top of OpenSSL (Linux hosts).
 *
 * @details
 * - Signatures: Ed25519 over the packet signing data.
 * - Sealing: ephemeral X25519 key agreement with the recipient's encryption
 *   key, HKDF-SHA256 (no salt, info "mycorrhizal_e2ee_v1") to a 32-byte key,
 *   ChaCha20-Poly1305 with a random 12-byte nonce.
 *
 * Sealed layout:
 * ```
 *   ephemeral_public(32) | nonce(12) | ciphertext | tag(16)
 * ```
 * Every call returns false on any OpenSSL failure and leaves no key
 * material behind in temporaries it owns.
 */

#include "mycorrhiza/identity.hpp"

namespace mycorrhiza {

class OpenSslCrypto : public ICrypto {
public:
  static constexpr size_t NONCE_SIZE = 12;
  static constexpr size_t TAG_SIZE   = 16;
  static constexpr size_t SEAL_OVERHEAD = KEY_SIZE + NONCE_SIZE + TAG_SIZE;

  bool generate_identity(IdentityBlob& out) override;
  bool sign(const IdentityBlob& self, const uint8_t* msg, size_t n, Signature& out) override;
  bool verify(const KeyBytes& signing_public, const uint8_t* msg, size_t n,
              const Signature& sig) override;
  bool encrypt(const KeyBytes& recipient_encryption_public, const uint8_t* in, size_t n,
               std::vector<uint8_t>& out) override;
  bool decrypt(const IdentityBlob& self, const uint8_t* in, size_t n,
               std::vector<uint8_t>& out) override;
};

} // namespace mycorrhiza
