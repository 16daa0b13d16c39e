// -----------------------------------------------------------------------------
// interface_mode.cpp - policy table
//
// API: see include/mycorrhiza/interface_mode.hpp
// -----------------------------------------------------------------------------
#include "mycorrhiza/interface_mode.hpp"

#include <string.h>

namespace mycorrhiza {

namespace {

const ModePolicy POLICIES[] = {
  //  mode                      name            budget fwd    max hops        expiry  announce
  { InterfaceMode::Full,        "full",          20,   true,  HOPS_UNLIMITED, 1800,   300 },
  { InterfaceMode::Gateway,     "gateway",       20,   true,  HOPS_UNLIMITED, 1800,   300 },
  { InterfaceMode::Boundary,    "boundary",      20,   true,  3,              1800,   300 },
  { InterfaceMode::AccessPoint, "access_point",  0,    false, 0,              1800,   0   },
  { InterfaceMode::Roaming,     "roaming",       20,   true,  HOPS_UNLIMITED, 300,    60  },
};

} // namespace

const ModePolicy& policy_for(InterfaceMode mode) {
  for (const ModePolicy& p : POLICIES) {
    if (p.mode == mode) return p;
  }
  return POLICIES[0];
}

bool permits_announce_forward(const ModePolicy& policy, uint8_t hop_count) {
  if (!policy.forward_announces) return false;
  if (policy.max_forward_hops == HOPS_UNLIMITED) return true;
  return hop_count <= policy.max_forward_hops;
}

uint32_t announce_budget_bps(const ModePolicy& policy, uint32_t bandwidth_bps) {
  return static_cast<uint32_t>(
      (static_cast<uint64_t>(bandwidth_bps) * policy.announce_budget_permille) / 1000u);
}

const char* to_string(InterfaceMode mode) {
  return policy_for(mode).name;
}

bool parse_mode(const char* text, InterfaceMode& out) {
  if (!text) return false;
  for (const ModePolicy& p : POLICIES) {
    if (strcmp(text, p.name) == 0) { out = p.mode; return true; }
  }
  return false;
}

} // namespace mycorrhiza
