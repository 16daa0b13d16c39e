/**
 * @file config.hpp
 * @brief Node configuration record and its JSON form.
 *
 * @details
 * One NodeConfig drives a Node (limits, timers, policy) and, on hosts, the
 * set of interfaces to open. It is a plain value: load it, tweak it with
 * command-line flags, hand it to the Node.
 *
 * ## JSON
 * ```json
 * {
 *   "name": "node",
 *   "max_hops": 128, "default_ttl": 32,
 *   "announce_interval_s": 0, "auto_announce": true,
 *   "route_capacity": 1024, "identity_capacity": 1024, "transfer_capacity": 10,
 *   "fragment_capacity": 512,
 *   "identity_horizon_s": 3600, "transfer_timeout_s": 60,
 *   "retransmit_timeout_ms": 3000, "max_retries": 5, "fragment_size": 200,
 *   "duplicate_window_s": 30, "tie_break": "prefer_existing",
 *   "sign_packets": true, "broadcast_fallback": true,
 *   "interfaces": [
 *     { "name": "udp0", "mode": "full", "bandwidth_bps": 100000000,
 *       "listen_port": 4242, "peers": ["127.0.0.1:4243"] }
 *   ]
 * }
 * ```
 * Missing keys keep their defaults, unknown keys are ignored. A document that
 * does not parse, has a value of the wrong type, or names an unknown mode or
 * tie-break is rejected as a whole.
 *
 * ## Dual backend
 * - Desktop/Linux: nlohmann::json.
 * - ARDUINO: ArduinoJson with a fixed StaticJsonDocument, so parsing has a
 *   known memory ceiling on the MCU.
 */
#ifndef MYCORRHIZA_CONFIG_HPP
#define MYCORRHIZA_CONFIG_HPP

#include <string>
#include <stdint.h>
#include "etl/string.h"
#include "etl/vector.h"
#include "mycorrhiza/interface_mode.hpp"
#include "mycorrhiza/profile.hpp"
#include "mycorrhiza/route_table.hpp"

namespace mycorrhiza {

static constexpr size_t MAX_PEERS_PER_INTERFACE = 8;

using PeerStr = etl::string<64>;   ///< "host:port"

struct InterfaceConfig {
  etl::string<16> name{"if0"};
  InterfaceMode   mode{InterfaceMode::Full};
  uint32_t        bandwidth_bps{0};           ///< 0 = link's own estimate
  uint16_t        listen_port{0};
  etl::vector<PeerStr, MAX_PEERS_PER_INTERFACE> peers;
};

struct NodeConfig {
  etl::string<32> name{"node"};
  uint8_t  max_hops{128};
  uint8_t  default_ttl{32};
  uint32_t announce_interval_s{0};             ///< 0 = interface mode default
  bool     auto_announce{true};
  uint16_t route_capacity{static_cast<uint16_t>(Profile::ROUTE_SLOTS)};
  uint16_t identity_capacity{static_cast<uint16_t>(Profile::IDENTITY_SLOTS)};
  uint16_t transfer_capacity{static_cast<uint16_t>(Profile::TRANSFER_SLOTS)};
  uint16_t fragment_capacity{static_cast<uint16_t>(Profile::FRAGMENT_SLOTS)};  ///< reassembly slots
  uint32_t identity_horizon_s{3600};
  uint32_t transfer_timeout_s{60};
  uint32_t retransmit_timeout_ms{3000};
  uint8_t  max_retries{5};
  uint8_t  fragment_size{200};
  uint32_t duplicate_window_s{30};
  TieBreak tie_break{TieBreak::PreferExisting};
  bool     sign_packets{true};
  bool     broadcast_fallback{true};
  etl::vector<InterfaceConfig, Profile::INTERFACE_SLOTS> interfaces;

  /// Longest seconds value that still fits in a uint32_t of milliseconds.
  static constexpr uint32_t MAX_SECONDS = UINT32_MAX / 1000u;

  /// Clamp capacities to the compiled profile, sizes to wire limits and
  /// second counts to MAX_SECONDS.
  void clamp();
};

/**
 * @brief Merge a JSON document into @p cfg.
 * @retval false  malformed document; @p cfg is left unchanged
 */
bool config_from_json(const std::string& text, NodeConfig& cfg);

/// Serialize every field (defaults included).
std::string config_to_json(const NodeConfig& cfg);

/**
 * @brief Split "host:port".
 * @retval false  no colon, empty host, or port outside 1..65535
 */
bool parse_peer(const char* text, etl::string<64>& host, uint16_t& port);

} // namespace mycorrhiza

#endif // MYCORRHIZA_CONFIG_HPP
