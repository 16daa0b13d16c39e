/**
 * @file interface_mode.hpp
 * @brief Interface modes and their bandwidth / forwarding policy records.
 *
 * @details
 * A node attaches each link in one of five modes. The mode is looked up once
 * into a ModePolicy record; the forwarding engine reads the record instead of
 * branching on the mode all over the place.
 *
 * | mode         | budget | fwd announces | max fwd hops | route expiry | self-announce |
 * |--------------|--------|---------------|--------------|--------------|---------------|
 * | FULL         | 2 %    | yes           | unlimited    | 1800 s       | 300 s         |
 * | GATEWAY      | 2 %    | yes           | unlimited    | 1800 s       | 300 s         |
 * | BOUNDARY     | 2 %    | yes           | 3            | 1800 s       | 300 s         |
 * | ACCESS_POINT | 0 %    | no            | -            | 1800 s       | never         |
 * | ROAMING      | 2 %    | yes           | unlimited    | 300 s        | 60 s          |
 *
 * Budget is the share of the link's bandwidth that re-broadcast announces may
 * consume, expressed in per-mille so MCU builds stay integer-only.
 */
#ifndef MYCORRHIZA_INTERFACE_MODE_HPP
#define MYCORRHIZA_INTERFACE_MODE_HPP

#include <stdint.h>

namespace mycorrhiza {

enum class InterfaceMode : uint8_t {
  Full        = 0x01,  ///< full mesh participation
  Gateway     = 0x02,  ///< bridges segments (LoRa <-> IP)
  Boundary    = 0x03,  ///< joins networks, only local announces cross
  AccessPoint = 0x04,  ///< quiet: never re-broadcasts or self-announces
  Roaming     = 0x05   ///< mobile: short route lifetime, frequent announces
};

static constexpr uint8_t HOPS_UNLIMITED = 0xFF;

struct ModePolicy {
  InterfaceMode mode;
  const char*   name;
  uint16_t      announce_budget_permille;  ///< share of bandwidth for announces
  bool          forward_announces;         ///< re-broadcast announces at all
  uint8_t       max_forward_hops;          ///< filter distant sources; HOPS_UNLIMITED = none
  uint32_t      route_expiry_s;            ///< route lifetime when learned here
  uint32_t      announce_interval_s;       ///< own announce period; 0 = never
};

/// Policy record for @p mode (unknown values fall back to FULL).
const ModePolicy& policy_for(InterfaceMode mode);

/**
 * @brief May an announce that will carry @p hop_count be queued on this link?
 * @param hop_count  the hop count the re-broadcast copy will carry
 */
bool permits_announce_forward(const ModePolicy& policy, uint8_t hop_count);

/// Bits per second available for announces on a link of @p bandwidth_bps.
uint32_t announce_budget_bps(const ModePolicy& policy, uint32_t bandwidth_bps);

const char* to_string(InterfaceMode mode);

/// Parse "full", "gateway", "boundary", "access_point", "roaming".
bool parse_mode(const char* text, InterfaceMode& out);

} // namespace mycorrhiza

#endif // MYCORRHIZA_INTERFACE_MODE_HPP
