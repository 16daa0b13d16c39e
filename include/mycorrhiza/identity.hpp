/**
 * @file identity.hpp
 * @brief The node's own key material, the crypto capability, and blob persistence.
 *
 * @details
 * The core never implements cryptography. It holds an opaque 128-byte
 * IdentityBlob and asks an ICrypto implementation to generate, sign, verify,
 * encrypt and decrypt. Only the two public halves are interpreted here: the
 * signing key derives the node address, and both travel in ANNOUNCE payloads.
 *
 * Blob layout (128 bytes):
 * ```
 *   0..31    signing private key (Ed25519 seed)
 *   32..63   signing public key
 *   64..95   encryption private key (X25519)
 *   96..127  encryption public key
 * ```
 */
#ifndef MYCORRHIZA_IDENTITY_HPP
#define MYCORRHIZA_IDENTITY_HPP

#include <array>
#include <optional>
#include <vector>
#include <stddef.h>
#include <stdint.h>
#include "mycorrhiza/address.hpp"
#include "mycorrhiza/identity_cache.hpp"
#include "mycorrhiza/packet.hpp"

namespace mycorrhiza {

static constexpr size_t IDENTITY_BLOB_SIZE = 4 * KEY_SIZE;

struct IdentityBlob {
  std::array<uint8_t, IDENTITY_BLOB_SIZE> bytes{};

  const uint8_t* signing_private() const    { return bytes.data(); }
  const uint8_t* signing_public() const     { return bytes.data() + KEY_SIZE; }
  const uint8_t* encryption_private() const { return bytes.data() + 2 * KEY_SIZE; }
  const uint8_t* encryption_public() const  { return bytes.data() + 3 * KEY_SIZE; }

  /// The public half as announced to peers.
  PublicKey public_key() const;

  /// derive_address(signing public key).
  Address address() const;
};

/**
 * @class ICrypto
 * @brief Signing, verification and end-to-end encryption capability.
 *
 * Every call returns false on any failure; outputs are unspecified then.
 */
class ICrypto {
public:
  virtual ~ICrypto() = default;

  /// Fresh signing + encryption key pairs.
  virtual bool generate_identity(IdentityBlob& out) = 0;

  /// Detached 64-byte signature over @p msg with our signing key.
  virtual bool sign(const IdentityBlob& self, const uint8_t* msg, size_t n, Signature& out) = 0;

  virtual bool verify(const KeyBytes& signing_public, const uint8_t* msg, size_t n,
                      const Signature& sig) = 0;

  /// Seal @p in for the holder of @p recipient_encryption_public.
  virtual bool encrypt(const KeyBytes& recipient_encryption_public, const uint8_t* in, size_t n,
                       std::vector<uint8_t>& out) = 0;

  /// Open a payload sealed for us.
  virtual bool decrypt(const IdentityBlob& self, const uint8_t* in, size_t n,
                       std::vector<uint8_t>& out) = 0;
};

/**
 * @class IIdentityStore
 * @brief Load / save of the 128-byte blob (flash, file, ...).
 */
class IIdentityStore {
public:
  virtual ~IIdentityStore() = default;
  virtual std::optional<IdentityBlob> load() = 0;
  virtual bool save(const IdentityBlob& blob) = 0;
};

/**
 * @brief Load the stored identity, or generate and store a new one.
 *
 * @param created  set true when a fresh identity was generated
 * @return nullopt if nothing was stored and generation failed; a generated
 *         identity is returned even if saving it failed (@p saved = false)
 */
std::optional<IdentityBlob> load_or_create(IIdentityStore& store, ICrypto& crypto,
                                           bool* created = nullptr, bool* saved = nullptr);

} // namespace mycorrhiza

#endif // MYCORRHIZA_IDENTITY_HPP
