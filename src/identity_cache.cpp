// -----------------------------------------------------------------------------
// identity_cache.cpp - peer key cache
//
// API: see include/mycorrhiza/identity_cache.hpp
// -----------------------------------------------------------------------------
#include "mycorrhiza/identity_cache.hpp"

namespace mycorrhiza {

IdentityCache::IdentityCache(size_t capacity, uint32_t horizon_ms)
: horizon_ms_(horizon_ms) {
  arena_.set_capacity(capacity);
}

bool IdentityCache::observe(const Address& address, const PublicKey& key,
                            const PeerMeta& meta) {
  const bool known = arena_.find(address) != nullptr;
  arena_.insert(address, IdentityEntry{key, meta});   // insert also refreshes recency
  return !known;
}

std::optional<PublicKey> IdentityCache::lookup(const Address& address) const {
  if (const IdentityEntry* e = arena_.find(address)) return e->key;
  return std::nullopt;
}

std::optional<uint8_t> IdentityCache::interface_of(const Address& address) const {
  if (const IdentityEntry* e = arena_.find(address)) return e->meta.interface_id;
  return std::nullopt;
}

size_t IdentityCache::evict_stale(uint32_t now_ms) {
  const uint32_t horizon = horizon_ms_;
  return arena_.erase_if([now_ms, horizon](const Address&, const IdentityEntry& e) {
    return static_cast<uint32_t>(now_ms - e.meta.last_seen_ms) > horizon;  // wrap-safe
  });
}

} // namespace mycorrhiza
