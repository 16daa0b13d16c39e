/**
 * @file route_table.hpp
 * @brief Bounded, expiring map from destination address to best next hop.
 *
 * @details
 * PURPOSE
 * -------
 * The forwarding engine asks one question per transit packet: "which link,
 * towards which neighbour, gets me closer to this destination?" The route
 * table answers it from what ANNOUNCE packets have taught the node.
 *
 * REPLACEMENT POLICY
 * ------------------
 * When a destination already has a route, a newly learned path:
 *   - replaces it if its hop count is strictly lower, or the old route expired;
 *   - otherwise, if it arrives through the same next hop on the same link,
 *     only refreshes last_seen (the path is still alive);
 *   - otherwise (equal or worse hops through a different neighbour) is
 *     ignored, unless the tie-break policy is PreferNewest and the hop counts
 *     are equal, in which case the newer path wins.
 * A single stale re-announce from a far neighbour therefore cannot make the
 * route flap.
 *
 * EXPIRY AND CAPACITY
 * -------------------
 * Each route carries its own lifetime (taken from the interface mode it was
 * learned on). lookup() never returns an expired route and deletes it on the
 * spot; sweep() clears all expired routes in one pass. When the arena is full
 * the least recently seen route is evicted to admit a new one.
 *
 * @see InterfaceMode for the lifetimes per mode.
 */
#ifndef MYCORRHIZA_ROUTE_TABLE_HPP
#define MYCORRHIZA_ROUTE_TABLE_HPP

#include <optional>
#include <stdint.h>
#include "mycorrhiza/address.hpp"
#include "mycorrhiza/lru_arena.hpp"
#include "mycorrhiza/profile.hpp"

namespace mycorrhiza {

/// Equal-hop, different-next-hop resolution.
enum class TieBreak : uint8_t {
  PreferExisting = 0,  ///< keep the current route (default)
  PreferNewest   = 1   ///< switch to the path heard most recently
};

struct Route {
  Address  destination{};
  Address  next_hop{};        ///< all-zero: any neighbour on interface_id
  uint8_t  interface_id{0};
  uint8_t  hop_count{0};
  uint32_t last_seen_ms{0};
  uint32_t lifetime_ms{0};

  bool expired(uint32_t now_ms) const {
    return static_cast<uint32_t>(now_ms - last_seen_ms) > lifetime_ms;
  }
};

/// What update() did with a learned path.
enum class RouteUpdate : uint8_t {
  Added,      ///< no route existed
  Replaced,   ///< better (or, per policy, newer) path took over
  Refreshed,  ///< same next hop; last_seen bumped
  Kept        ///< learned path ignored
};

class RouteTable {
public:
  using Arena = LruArena<Address, Route, Profile::ROUTE_SLOTS>;

  static constexpr uint32_t LIFETIME_MS_DEFAULT = 1800u * 1000u;  ///< 30 minutes

  explicit RouteTable(size_t capacity = Profile::ROUTE_SLOTS,
                      TieBreak tie_break = TieBreak::PreferExisting);

  /**
   * @brief Offer a learned path to @p destination.
   *
   * @param destination   announcing node
   * @param next_hop      neighbour it was heard through (zero if unknown)
   * @param interface_id  link it was heard on
   * @param hop_count     hops from here to the destination (>= 1)
   * @param now_ms        current time
   * @param lifetime_ms   route lifetime; 0 selects LIFETIME_MS_DEFAULT
   * @return the action taken
   */
  RouteUpdate update(const Address& destination, const Address& next_hop,
                     uint8_t interface_id, uint8_t hop_count, uint32_t now_ms,
                     uint32_t lifetime_ms = 0);

  /// Current route, or nullopt. An expired route is removed and not returned.
  std::optional<Route> lookup(const Address& destination, uint32_t now_ms);

  bool remove(const Address& destination) { return arena_.erase(destination); }

  /// Remove all expired routes. @return number removed.
  size_t sweep(uint32_t now_ms);

  size_t size() const     { return arena_.size(); }
  size_t capacity() const { return arena_.capacity(); }
  void   set_capacity(size_t c) { arena_.set_capacity(c); }

  TieBreak tie_break() const { return tie_break_; }
  void set_tie_break(TieBreak t) { tie_break_ = t; }

  /// Visit routes, least recently seen first.
  template <typename F>
  void for_each(F f) const {
    arena_.for_each([&f](const Address&, const Route& r) { f(r); });
  }

  /// Evictions caused by capacity pressure since construction.
  uint32_t evictions() const { return evictions_; }

private:
  Arena    arena_;
  TieBreak tie_break_;
  uint32_t evictions_{0};
};

const char* to_string(RouteUpdate u);
const char* to_string(TieBreak t);
bool parse_tie_break(const char* text, TieBreak& out);

} // namespace mycorrhiza

#endif // MYCORRHIZA_ROUTE_TABLE_HPP
