/**
 * @file profile.hpp
 * @brief Compile-time arena sizes for the two deployment profiles.
 *
 * @details
 * Every table in the core (routes, identities, transfers, fragment slots,
 * duplicate ring, event queue) is a fixed-capacity ETL container sized here.
 * The algorithm is the same on both profiles; only these numbers change.
 *
 * PROFILES
 * --------
 * - Constrained: selected automatically on `ARDUINO` builds, or by defining
 *   `MYCORRHIZA_PROFILE_CONSTRAINED=1`. Sized for an ESP32-class MCU with a
 *   few hundred kilobytes of RAM.
 * - Capable: the default on Linux. Sized for a Raspberry Pi or a laptop
 *   running a long-lived node.
 *
 * Runtime configuration (NodeConfig) may lower a capacity, never raise it
 * above the slot count compiled in.
 */
#ifndef MYCORRHIZA_PROFILE_HPP
#define MYCORRHIZA_PROFILE_HPP

#include <stddef.h>
#include <stdint.h>

#ifndef MYCORRHIZA_PROFILE_CONSTRAINED
#  ifdef ARDUINO
#    define MYCORRHIZA_PROFILE_CONSTRAINED 1
#  else
#    define MYCORRHIZA_PROFILE_CONSTRAINED 0
#  endif
#endif

namespace mycorrhiza {

struct Profile {
#if MYCORRHIZA_PROFILE_CONSTRAINED
  static constexpr const char* NAME        = "constrained";
  static constexpr size_t ROUTE_SLOTS      = 100;  ///< route table arena
  static constexpr size_t IDENTITY_SLOTS   = 50;   ///< identity cache arena
  static constexpr size_t TRANSFER_SLOTS   = 2;    ///< concurrent inbound transfers
  static constexpr size_t FRAGMENT_SLOTS   = 64;   ///< shared 200-byte reassembly slots
  static constexpr size_t SEEN_SLOTS       = 64;   ///< duplicate-suppression ring
  static constexpr size_t EVENT_SLOTS      = 16;   ///< client event queue
  static constexpr size_t ANNOUNCE_SLOTS   = 8;    ///< per-interface announce queue
  static constexpr size_t INTERFACE_SLOTS  = 2;    ///< attached links
#else
  static constexpr const char* NAME        = "capable";
  static constexpr size_t ROUTE_SLOTS      = 1024;
  static constexpr size_t IDENTITY_SLOTS   = 1024;
  static constexpr size_t TRANSFER_SLOTS   = 10;
  static constexpr size_t FRAGMENT_SLOTS   = 512;
  static constexpr size_t SEEN_SLOTS       = 512;
  static constexpr size_t EVENT_SLOTS      = 64;
  static constexpr size_t ANNOUNCE_SLOTS   = 32;
  static constexpr size_t INTERFACE_SLOTS  = 4;
#endif
};

} // namespace mycorrhiza

#endif // MYCORRHIZA_PROFILE_HPP
