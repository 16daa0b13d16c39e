// -----------------------------------------------------------------------------
// route_table.cpp - route learning, expiry and eviction
//
// API & policy description: see include/mycorrhiza/route_table.hpp
// Tests: tests/test_route_table.cpp
// -----------------------------------------------------------------------------
#include "mycorrhiza/route_table.hpp"

#include <string.h>

namespace mycorrhiza {

RouteTable::RouteTable(size_t capacity, TieBreak tie_break)
: tie_break_(tie_break) {
  arena_.set_capacity(capacity);
}

// -----------------------------------------------------------------------------
// update()
// PRE:    hop_count counts the link we heard it on (direct neighbour = 1).
// POLICY: strictly better hops or expired incumbent -> replace;
//         same neighbour on same link -> refresh only;
//         equal hops via another neighbour -> tie-break policy;
//         anything else -> keep.
// OUT:    at most one Route per destination; a full arena drops its oldest.
// -----------------------------------------------------------------------------
RouteUpdate RouteTable::update(const Address& destination, const Address& next_hop,
                               uint8_t interface_id, uint8_t hop_count,
                               uint32_t now_ms, uint32_t lifetime_ms) {
  Route fresh;
  fresh.destination  = destination;
  fresh.next_hop     = next_hop;
  fresh.interface_id = interface_id;
  fresh.hop_count    = hop_count;
  fresh.last_seen_ms = now_ms;
  fresh.lifetime_ms  = lifetime_ms ? lifetime_ms : LIFETIME_MS_DEFAULT;

  Route* existing = arena_.find(destination);
  if (!existing) {
    bool evicted = false;
    arena_.insert(destination, fresh, &evicted);
    if (evicted) ++evictions_;
    return RouteUpdate::Added;
  }

  if (hop_count < existing->hop_count || existing->expired(now_ms)) {
    arena_.insert(destination, fresh);           // overwrite + mark freshest
    return RouteUpdate::Replaced;
  }

  const bool same_path = existing->next_hop == next_hop &&
                         existing->interface_id == interface_id;
  if (same_path) {
    existing->last_seen_ms = now_ms;             // path still alive; hops unchanged
    arena_.touch(destination);
    return RouteUpdate::Refreshed;
  }

  if (tie_break_ == TieBreak::PreferNewest && hop_count == existing->hop_count) {
    arena_.insert(destination, fresh);
    return RouteUpdate::Replaced;
  }

  return RouteUpdate::Kept;
}

std::optional<Route> RouteTable::lookup(const Address& destination, uint32_t now_ms) {
  const Route* r = arena_.find(destination);
  if (!r) return std::nullopt;
  if (r->expired(now_ms)) {
    arena_.erase(destination);
    return std::nullopt;
  }
  return *r;
}

size_t RouteTable::sweep(uint32_t now_ms) {
  return arena_.erase_if([now_ms](const Address&, const Route& r) {
    return r.expired(now_ms);
  });
}

const char* to_string(RouteUpdate u) {
  switch (u) {
    case RouteUpdate::Added:     return "added";
    case RouteUpdate::Replaced:  return "replaced";
    case RouteUpdate::Refreshed: return "refreshed";
    case RouteUpdate::Kept:      return "kept";
  }
  return "unknown";
}

const char* to_string(TieBreak t) {
  return t == TieBreak::PreferNewest ? "prefer_newest" : "prefer_existing";
}

bool parse_tie_break(const char* text, TieBreak& out) {
  if (!text) return false;
  if (strcmp(text, "prefer_existing") == 0) { out = TieBreak::PreferExisting; return true; }
  if (strcmp(text, "prefer_newest") == 0)   { out = TieBreak::PreferNewest;   return true; }
  return false;
}

} // namespace mycorrhiza
