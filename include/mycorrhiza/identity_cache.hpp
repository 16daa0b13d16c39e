/**
 * @file identity_cache.hpp
 * @brief Address -> public key material, with last-seen metadata.
 *
 * @details
 * Every verified ANNOUNCE lands here. The cache is the trust-relevant state a
 * signature check would consult (who owns which key), but it performs no
 * verification itself; the Node does that through the crypto capability
 * before calling observe().
 *
 * Bounded by an LruArena: when full, the peer heard from longest ago is
 * forgotten first. evict_stale() drops peers silent for longer than the
 * configured horizon.
 */
#ifndef MYCORRHIZA_IDENTITY_CACHE_HPP
#define MYCORRHIZA_IDENTITY_CACHE_HPP

#include <array>
#include <optional>
#include <stdint.h>
#include "mycorrhiza/address.hpp"
#include "mycorrhiza/lru_arena.hpp"
#include "mycorrhiza/profile.hpp"

namespace mycorrhiza {

static constexpr size_t KEY_SIZE = 32;
using KeyBytes = std::array<uint8_t, KEY_SIZE>;

/// Public half of a node identity as carried in an ANNOUNCE payload.
struct PublicKey {
  KeyBytes signing{};     ///< Ed25519 verify key; the address is derived from this
  KeyBytes encryption{};  ///< X25519 key for end-to-end encryption

  friend bool operator==(const PublicKey& a, const PublicKey& b) {
    return a.signing == b.signing && a.encryption == b.encryption;
  }
};

/// Where and when a peer was last heard.
struct PeerMeta {
  uint8_t  interface_id{0};
  uint8_t  hop_count{0};
  int16_t  rssi{0};
  uint32_t last_seen_ms{0};
};

struct IdentityEntry {
  PublicKey key{};
  PeerMeta  meta{};
};

class IdentityCache {
public:
  using Arena = LruArena<Address, IdentityEntry, Profile::IDENTITY_SLOTS>;

  static constexpr uint32_t HORIZON_MS_DEFAULT = 3600u * 1000u;  ///< one hour

  explicit IdentityCache(size_t capacity = Profile::IDENTITY_SLOTS,
                         uint32_t horizon_ms = HORIZON_MS_DEFAULT);

  /**
   * @brief Record or refresh a peer.
   * @retval true   the address was not cached before (new peer)
   * @retval false  an existing entry was refreshed
   */
  bool observe(const Address& address, const PublicKey& key, const PeerMeta& meta);

  std::optional<PublicKey> lookup(const Address& address) const;

  /// Interface the peer was last heard on.
  std::optional<uint8_t> interface_of(const Address& address) const;

  const IdentityEntry* entry(const Address& address) const { return arena_.find(address); }

  /// Remove peers unseen for longer than the horizon. @return number removed.
  size_t evict_stale(uint32_t now_ms);

  size_t size() const     { return arena_.size(); }
  size_t capacity() const { return arena_.capacity(); }
  void   set_capacity(size_t c) { arena_.set_capacity(c); }

  uint32_t horizon_ms() const { return horizon_ms_; }
  void set_horizon_ms(uint32_t v) { horizon_ms_ = v; }

  /// Visit peers oldest first: f(const Address&, const IdentityEntry&).
  template <typename F>
  void for_each(F f) const { arena_.for_each(f); }

private:
  Arena    arena_;
  uint32_t horizon_ms_;
};

} // namespace mycorrhiza

#endif // MYCORRHIZA_IDENTITY_CACHE_HPP
