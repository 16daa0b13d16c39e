// -----------------------------------------------------------------------------
// identity.cpp - identity blob accessors, load-or-create
//
// API: see include/mycorrhiza/identity.hpp
// -----------------------------------------------------------------------------
#include "mycorrhiza/identity.hpp"

#include <string.h>

namespace mycorrhiza {

PublicKey IdentityBlob::public_key() const {
  PublicKey k;
  memcpy(k.signing.data(), signing_public(), KEY_SIZE);
  memcpy(k.encryption.data(), encryption_public(), KEY_SIZE);
  return k;
}

Address IdentityBlob::address() const {
  return derive_address(signing_public(), KEY_SIZE);
}

std::optional<IdentityBlob> load_or_create(IIdentityStore& store, ICrypto& crypto,
                                           bool* created, bool* saved) {
  if (created) *created = false;
  if (saved)   *saved = false;

  if (auto blob = store.load()) {
    if (saved) *saved = true;
    return blob;
  }

  IdentityBlob fresh;
  if (!crypto.generate_identity(fresh)) return std::nullopt;
  if (created) *created = true;
  const bool ok = store.save(fresh);
  if (saved) *saved = ok;
  return fresh;
}

} // namespace mycorrhiza
