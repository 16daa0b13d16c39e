// -----------------------------------------------------------------------------
// crypto_openssl.cpp - Ed25519 / X25519 / ChaCha20-Poly1305 via OpenSSL EVP
//
// API: see include/crypto_openssl.hpp
// Tests: tests/test_crypto_openssl.cpp
//
// Notes for maintainers:
// - Raw 32-byte keys in and out (EVP_PKEY_new_raw_*_key / get_raw_*_key);
//   no PEM or DER anywhere.
// - Every EVP object is owned by a unique_ptr so early returns cannot leak.
// -----------------------------------------------------------------------------
#include "crypto_openssl.hpp"
#include "mycorrhiza/hash.hpp"

#include <memory>
#include <string.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>

namespace mycorrhiza {

namespace {

const char HKDF_INFO[] = "mycorrhizal_e2ee_v1";

struct PkeyFree    { void operator()(EVP_PKEY* p) const     { EVP_PKEY_free(p); } };
struct PkeyCtxFree { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
struct MdCtxFree   { void operator()(EVP_MD_CTX* p) const   { EVP_MD_CTX_free(p); } };
struct CipherFree  { void operator()(EVP_CIPHER_CTX* p) const { EVP_CIPHER_CTX_free(p); } };

using PkeyPtr    = std::unique_ptr<EVP_PKEY, PkeyFree>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxFree>;
using MdCtxPtr   = std::unique_ptr<EVP_MD_CTX, MdCtxFree>;
using CipherPtr  = std::unique_ptr<EVP_CIPHER_CTX, CipherFree>;

/// Wipes a stack key on scope exit.
struct Scrub {
  uint8_t* p;
  size_t   n;
  ~Scrub() { OPENSSL_cleanse(p, n); }
};

PkeyPtr private_key(int type, const uint8_t* raw) {
  return PkeyPtr(EVP_PKEY_new_raw_private_key(type, nullptr, raw, KEY_SIZE));
}

PkeyPtr public_key(int type, const uint8_t* raw) {
  return PkeyPtr(EVP_PKEY_new_raw_public_key(type, nullptr, raw, KEY_SIZE));
}

// Fresh key pair of @p type, raw halves written to priv / pub.
bool keypair(int type, uint8_t* priv, uint8_t* pub) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(type, nullptr));
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) return false;

  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) return false;
  PkeyPtr key(raw);

  size_t priv_len = KEY_SIZE, pub_len = KEY_SIZE;
  return EVP_PKEY_get_raw_private_key(key.get(), priv, &priv_len) == 1 && priv_len == KEY_SIZE &&
         EVP_PKEY_get_raw_public_key(key.get(), pub, &pub_len) == 1 && pub_len == KEY_SIZE;
}

// X25519(ours, theirs) -> HKDF-SHA256 -> 32-byte key.
bool derive_key(EVP_PKEY* ours, const uint8_t* their_public, uint8_t* key_out) {
  PkeyPtr theirs = public_key(EVP_PKEY_X25519, their_public);
  if (!theirs) return false;

  uint8_t shared[KEY_SIZE];
  Scrub wipe{shared, sizeof(shared)};
  size_t shared_len = sizeof(shared);

  PkeyCtxPtr dh(EVP_PKEY_CTX_new(ours, nullptr));
  if (!dh || EVP_PKEY_derive_init(dh.get()) <= 0 ||
      EVP_PKEY_derive_set_peer(dh.get(), theirs.get()) <= 0 ||
      EVP_PKEY_derive(dh.get(), shared, &shared_len) <= 0 || shared_len != KEY_SIZE) {
    return false;
  }

  PkeyCtxPtr kdf(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
  size_t key_len = KEY_SIZE;
  return kdf && EVP_PKEY_derive_init(kdf.get()) > 0 &&
         EVP_PKEY_CTX_set_hkdf_md(kdf.get(), EVP_sha256()) > 0 &&
         EVP_PKEY_CTX_set1_hkdf_key(kdf.get(), shared, static_cast<int>(shared_len)) > 0 &&
         EVP_PKEY_CTX_add1_hkdf_info(kdf.get(), reinterpret_cast<const unsigned char*>(HKDF_INFO),
                                     static_cast<int>(sizeof(HKDF_INFO) - 1)) > 0 &&
         EVP_PKEY_derive(kdf.get(), key_out, &key_len) > 0 && key_len == KEY_SIZE;
}

} // namespace

// ---------- public ----------

bool OpenSslCrypto::generate_identity(IdentityBlob& out) {
  uint8_t* b = out.bytes.data();
  return keypair(EVP_PKEY_ED25519, b, b + KEY_SIZE) &&
         keypair(EVP_PKEY_X25519, b + 2 * KEY_SIZE, b + 3 * KEY_SIZE);
}

bool OpenSslCrypto::sign(const IdentityBlob& self, const uint8_t* msg, size_t n, Signature& out) {
  PkeyPtr key = private_key(EVP_PKEY_ED25519, self.signing_private());
  MdCtxPtr md(EVP_MD_CTX_new());
  if (!key || !md) return false;

  size_t sig_len = out.size();
  return EVP_DigestSignInit(md.get(), nullptr, nullptr, nullptr, key.get()) == 1 &&
         EVP_DigestSign(md.get(), out.data(), &sig_len, msg, n) == 1 &&
         sig_len == SIGNATURE_SIZE;
}

bool OpenSslCrypto::verify(const KeyBytes& signing_public, const uint8_t* msg, size_t n,
                           const Signature& sig) {
  PkeyPtr key = public_key(EVP_PKEY_ED25519, signing_public.data());
  MdCtxPtr md(EVP_MD_CTX_new());
  if (!key || !md) return false;

  return EVP_DigestVerifyInit(md.get(), nullptr, nullptr, nullptr, key.get()) == 1 &&
         EVP_DigestVerify(md.get(), sig.data(), sig.size(), msg, n) == 1;
}

// -----------------------------------------------------------------------------
// encrypt()
// PRE:  recipient key is an X25519 public key.
// OUT:  ephemeral_public | nonce | ciphertext | tag; the ephemeral private
//       half never leaves this function.
// -----------------------------------------------------------------------------
bool OpenSslCrypto::encrypt(const KeyBytes& recipient_encryption_public, const uint8_t* in,
                            size_t n, std::vector<uint8_t>& out) {
  out.clear();

  uint8_t eph_priv[KEY_SIZE], eph_pub[KEY_SIZE], key[KEY_SIZE], nonce[NONCE_SIZE];
  Scrub wipe_priv{eph_priv, sizeof(eph_priv)};
  Scrub wipe_key{key, sizeof(key)};

  if (!keypair(EVP_PKEY_X25519, eph_priv, eph_pub)) return false;
  PkeyPtr eph = private_key(EVP_PKEY_X25519, eph_priv);
  if (!eph || !derive_key(eph.get(), recipient_encryption_public.data(), key)) return false;
  if (!random_bytes(nonce, sizeof(nonce))) return false;

  CipherPtr c(EVP_CIPHER_CTX_new());
  if (!c || EVP_EncryptInit_ex(c.get(), EVP_chacha20_poly1305(), nullptr, key, nonce) != 1) {
    return false;
  }

  out.resize(SEAL_OVERHEAD + n);
  memcpy(out.data(), eph_pub, KEY_SIZE);
  memcpy(out.data() + KEY_SIZE, nonce, NONCE_SIZE);
  uint8_t* ct = out.data() + KEY_SIZE + NONCE_SIZE;

  int len = 0, fin = 0;
  if ((n > 0 && EVP_EncryptUpdate(c.get(), ct, &len, in, static_cast<int>(n)) != 1) ||
      EVP_EncryptFinal_ex(c.get(), ct + len, &fin) != 1 ||
      EVP_CIPHER_CTX_ctrl(c.get(), EVP_CTRL_AEAD_GET_TAG, TAG_SIZE, ct + n) != 1) {
    out.clear();
    return false;
  }
  return true;
}

bool OpenSslCrypto::decrypt(const IdentityBlob& self, const uint8_t* in, size_t n,
                            std::vector<uint8_t>& out) {
  out.clear();
  if (!in || n < SEAL_OVERHEAD) return false;

  const uint8_t* eph_pub = in;
  const uint8_t* nonce   = in + KEY_SIZE;
  const uint8_t* ct      = in + KEY_SIZE + NONCE_SIZE;
  const size_t   ct_len  = n - SEAL_OVERHEAD;
  const uint8_t* tag     = ct + ct_len;

  uint8_t key[KEY_SIZE];
  Scrub wipe_key{key, sizeof(key)};
  PkeyPtr ours = private_key(EVP_PKEY_X25519, self.encryption_private());
  if (!ours || !derive_key(ours.get(), eph_pub, key)) return false;

  CipherPtr c(EVP_CIPHER_CTX_new());
  if (!c || EVP_DecryptInit_ex(c.get(), EVP_chacha20_poly1305(), nullptr, key, nonce) != 1) {
    return false;
  }

  out.resize(ct_len);
  int len = 0, fin = 0;
  if ((ct_len > 0 && EVP_DecryptUpdate(c.get(), out.data(), &len, ct, static_cast<int>(ct_len)) != 1) ||
      EVP_CIPHER_CTX_ctrl(c.get(), EVP_CTRL_AEAD_SET_TAG, TAG_SIZE, const_cast<uint8_t*>(tag)) != 1 ||
      EVP_DecryptFinal_ex(c.get(), out.data() + len, &fin) != 1) {   // tag mismatch lands here
    OPENSSL_cleanse(out.data(), out.size());
    out.clear();
    return false;
  }
  return true;
}

} // namespace mycorrhiza
