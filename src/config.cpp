/**
 * @file config.cpp
 * @brief JSON load/save for NodeConfig on both backends.
 * @details
 *   Desktop/Linux builds use nlohmann::json; ARDUINO builds use ArduinoJson
 *   with a StaticJsonDocument so the MCU never allocates while parsing.
 *   Both paths parse into a scratch copy and commit only on full success.
 *
 *   Tests: tests/test_config.cpp
 */
#include "mycorrhiza/config.hpp"
#include "mycorrhiza/fragment.hpp"

#include <limits>
#include <stdlib.h>
#include <string.h>

#ifdef ARDUINO

#include <ArduinoJson.hpp>
using ArduinoJson::StaticJsonDocument;
using ArduinoJson::deserializeJson;
using ArduinoJson::serializeJson;
using ArduinoJson::JsonArray;
using ArduinoJson::JsonObject;

#else

#include "nlohmann/json.hpp"
using json = nlohmann::json;

#endif

namespace mycorrhiza {

void NodeConfig::clamp() {
  if (route_capacity == 0    || route_capacity > Profile::ROUTE_SLOTS)
    route_capacity = static_cast<uint16_t>(Profile::ROUTE_SLOTS);
  if (identity_capacity == 0 || identity_capacity > Profile::IDENTITY_SLOTS)
    identity_capacity = static_cast<uint16_t>(Profile::IDENTITY_SLOTS);
  if (transfer_capacity == 0 || transfer_capacity > Profile::TRANSFER_SLOTS)
    transfer_capacity = static_cast<uint16_t>(Profile::TRANSFER_SLOTS);
  if (fragment_capacity == 0 || fragment_capacity > Profile::FRAGMENT_SLOTS)
    fragment_capacity = static_cast<uint16_t>(Profile::FRAGMENT_SLOTS);
  if (fragment_size == 0 || fragment_size > FRAGMENT_DATA_MAX)
    fragment_size = FRAGMENT_DATA_MAX;
  if (max_hops == 0) max_hops = 1;
  if (announce_interval_s > MAX_SECONDS) announce_interval_s = MAX_SECONDS;
  if (identity_horizon_s > MAX_SECONDS)  identity_horizon_s  = MAX_SECONDS;
  if (transfer_timeout_s > MAX_SECONDS)  transfer_timeout_s  = MAX_SECONDS;
  if (duplicate_window_s > MAX_SECONDS)  duplicate_window_s  = MAX_SECONDS;
}

bool parse_peer(const char* text, etl::string<64>& host, uint16_t& port) {
  if (!text) return false;
  const char* colon = strrchr(text, ':');
  if (!colon || colon == text) return false;
  char* end = nullptr;
  const unsigned long p = strtoul(colon + 1, &end, 10);
  if (end == colon + 1 || *end != '\0' || p == 0 || p > 65535) return false;
  host.assign(text, static_cast<size_t>(colon - text));
  port = static_cast<uint16_t>(p);
  return true;
}

#ifdef ARDUINO

// ---------- ArduinoJson backend ----------

bool config_from_json(const std::string& text, NodeConfig& cfg) {
  StaticJsonDocument<2048> doc;
  if (deserializeJson(doc, text)) return false;
  JsonObject obj = doc.as<JsonObject>();
  if (obj.isNull()) return false;

  NodeConfig next = cfg;
  if (const char* name = obj["name"]) next.name.assign(name);
  next.max_hops              = obj["max_hops"]              | next.max_hops;
  next.default_ttl           = obj["default_ttl"]           | next.default_ttl;
  next.announce_interval_s   = obj["announce_interval_s"]   | next.announce_interval_s;
  next.auto_announce         = obj["auto_announce"]         | next.auto_announce;
  next.route_capacity        = obj["route_capacity"]        | next.route_capacity;
  next.identity_capacity     = obj["identity_capacity"]     | next.identity_capacity;
  next.transfer_capacity     = obj["transfer_capacity"]     | next.transfer_capacity;
  next.fragment_capacity     = obj["fragment_capacity"]     | next.fragment_capacity;
  next.identity_horizon_s    = obj["identity_horizon_s"]    | next.identity_horizon_s;
  next.transfer_timeout_s    = obj["transfer_timeout_s"]    | next.transfer_timeout_s;
  next.retransmit_timeout_ms = obj["retransmit_timeout_ms"] | next.retransmit_timeout_ms;
  next.max_retries           = obj["max_retries"]           | next.max_retries;
  next.fragment_size         = obj["fragment_size"]         | next.fragment_size;
  next.duplicate_window_s    = obj["duplicate_window_s"]    | next.duplicate_window_s;
  next.sign_packets          = obj["sign_packets"]          | next.sign_packets;
  next.broadcast_fallback    = obj["broadcast_fallback"]    | next.broadcast_fallback;

  if (const char* tb = obj["tie_break"]) {
    if (!parse_tie_break(tb, next.tie_break)) return false;
  }

  JsonArray ifaces = obj["interfaces"];
  if (!ifaces.isNull()) {
    next.interfaces.clear();
    for (JsonObject i : ifaces) {
      if (next.interfaces.full()) return false;
      InterfaceConfig ic;
      if (const char* n = i["name"]) ic.name.assign(n);
      if (const char* m = i["mode"]) {
        if (!parse_mode(m, ic.mode)) return false;
      }
      ic.bandwidth_bps = i["bandwidth_bps"] | ic.bandwidth_bps;
      ic.listen_port   = i["listen_port"]   | ic.listen_port;
      JsonArray peers = i["peers"];
      for (const char* p : peers) {
        if (!p || ic.peers.full()) return false;
        ic.peers.push_back(PeerStr(p));
      }
      next.interfaces.push_back(ic);
    }
  }

  next.clamp();
  cfg = next;
  return true;
}

std::string config_to_json(const NodeConfig& cfg) {
  StaticJsonDocument<2048> doc;
  JsonObject obj = doc.to<JsonObject>();
  obj["name"]                  = cfg.name.c_str();
  obj["max_hops"]              = cfg.max_hops;
  obj["default_ttl"]           = cfg.default_ttl;
  obj["announce_interval_s"]   = cfg.announce_interval_s;
  obj["auto_announce"]         = cfg.auto_announce;
  obj["route_capacity"]        = cfg.route_capacity;
  obj["identity_capacity"]     = cfg.identity_capacity;
  obj["transfer_capacity"]     = cfg.transfer_capacity;
  obj["fragment_capacity"]     = cfg.fragment_capacity;
  obj["identity_horizon_s"]    = cfg.identity_horizon_s;
  obj["transfer_timeout_s"]    = cfg.transfer_timeout_s;
  obj["retransmit_timeout_ms"] = cfg.retransmit_timeout_ms;
  obj["max_retries"]           = cfg.max_retries;
  obj["fragment_size"]         = cfg.fragment_size;
  obj["duplicate_window_s"]    = cfg.duplicate_window_s;
  obj["tie_break"]             = to_string(cfg.tie_break);
  obj["sign_packets"]          = cfg.sign_packets;
  obj["broadcast_fallback"]    = cfg.broadcast_fallback;

  JsonArray ifaces = obj.createNestedArray("interfaces");
  for (const InterfaceConfig& ic : cfg.interfaces) {
    JsonObject i = ifaces.createNestedObject();
    i["name"]          = ic.name.c_str();
    i["mode"]          = to_string(ic.mode);
    i["bandwidth_bps"] = ic.bandwidth_bps;
    i["listen_port"]   = ic.listen_port;
    JsonArray peers = i.createNestedArray("peers");
    for (const PeerStr& p : ic.peers) peers.add(p.c_str());
  }

  std::string out;
  out.reserve(doc.memoryUsage());
  serializeJson(doc, out);
  return out;
}

#else

// ---------- nlohmann::json backend ----------

namespace {

constexpr size_t PEER_TEXT_MAX = 64;

// Absent key: keep default. Present but negative, fractional, non-numeric or
// too wide for T: reject.
template <typename T>
bool read_uint(const json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number_integer()) return false;
  if (it->is_number_unsigned()) {
    const uint64_t v = it->get<uint64_t>();
    if (v > std::numeric_limits<T>::max()) return false;
    out = static_cast<T>(v);
    return true;
  }
  const int64_t v = it->get<int64_t>();
  if (v < 0 || static_cast<uint64_t>(v) > std::numeric_limits<T>::max()) return false;
  out = static_cast<T>(v);
  return true;
}

bool read_bool(const json& j, const char* key, bool& out) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_boolean()) return false;
  out = it->get<bool>();
  return true;
}

template <size_t N>
bool read_string(const json& j, const char* key, etl::string<N>& out) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_string()) return false;
  const std::string& s = it->get_ref<const std::string&>();
  if (s.size() > N) return false;
  out.assign(s.c_str(), s.size());
  return true;
}

bool read_interface(const json& j, InterfaceConfig& ic) {
  if (!j.is_object()) return false;
  if (!read_string(j, "name", ic.name)) return false;

  auto mode = j.find("mode");
  if (mode != j.end()) {
    if (!mode->is_string()) return false;
    if (!parse_mode(mode->get_ref<const std::string&>().c_str(), ic.mode)) return false;
  }
  if (!read_uint(j, "bandwidth_bps", ic.bandwidth_bps)) return false;
  if (!read_uint(j, "listen_port", ic.listen_port)) return false;

  auto peers = j.find("peers");
  if (peers != j.end()) {
    if (!peers->is_array()) return false;
    for (const json& p : *peers) {
      if (!p.is_string() || ic.peers.full()) return false;
      const std::string& s = p.get_ref<const std::string&>();
      if (s.size() > PEER_TEXT_MAX) return false;
      ic.peers.push_back(PeerStr(s.c_str()));
    }
  }
  return true;
}

} // namespace

bool config_from_json(const std::string& text, NodeConfig& cfg) {
  try {
    const json j = json::parse(text);
    if (!j.is_object()) return false;

    NodeConfig next = cfg;
    if (!read_string(j, "name", next.name))                           return false;
    if (!read_uint(j, "max_hops", next.max_hops))                     return false;
    if (!read_uint(j, "default_ttl", next.default_ttl))               return false;
    if (!read_uint(j, "announce_interval_s", next.announce_interval_s)) return false;
    if (!read_bool(j, "auto_announce", next.auto_announce))           return false;
    if (!read_uint(j, "route_capacity", next.route_capacity))         return false;
    if (!read_uint(j, "identity_capacity", next.identity_capacity))   return false;
    if (!read_uint(j, "transfer_capacity", next.transfer_capacity))   return false;
    if (!read_uint(j, "fragment_capacity", next.fragment_capacity))   return false;
    if (!read_uint(j, "identity_horizon_s", next.identity_horizon_s)) return false;
    if (!read_uint(j, "transfer_timeout_s", next.transfer_timeout_s)) return false;
    if (!read_uint(j, "retransmit_timeout_ms", next.retransmit_timeout_ms)) return false;
    if (!read_uint(j, "max_retries", next.max_retries))               return false;
    if (!read_uint(j, "fragment_size", next.fragment_size))           return false;
    if (!read_uint(j, "duplicate_window_s", next.duplicate_window_s)) return false;
    if (!read_bool(j, "sign_packets", next.sign_packets))             return false;
    if (!read_bool(j, "broadcast_fallback", next.broadcast_fallback)) return false;

    auto tb = j.find("tie_break");
    if (tb != j.end()) {
      if (!tb->is_string()) return false;
      if (!parse_tie_break(tb->get_ref<const std::string&>().c_str(), next.tie_break)) return false;
    }

    auto ifaces = j.find("interfaces");
    if (ifaces != j.end()) {
      if (!ifaces->is_array()) return false;
      next.interfaces.clear();
      for (const json& i : *ifaces) {
        if (next.interfaces.full()) return false;
        InterfaceConfig ic;
        if (!read_interface(i, ic)) return false;
        next.interfaces.push_back(ic);
      }
    }

    next.clamp();
    cfg = next;
    return true;
  } catch (const json::exception&) {
    return false;
  }
}

std::string config_to_json(const NodeConfig& cfg) {
  json j;
  j["name"]                  = cfg.name.c_str();
  j["max_hops"]              = cfg.max_hops;
  j["default_ttl"]           = cfg.default_ttl;
  j["announce_interval_s"]   = cfg.announce_interval_s;
  j["auto_announce"]         = cfg.auto_announce;
  j["route_capacity"]        = cfg.route_capacity;
  j["identity_capacity"]     = cfg.identity_capacity;
  j["transfer_capacity"]     = cfg.transfer_capacity;
  j["fragment_capacity"]     = cfg.fragment_capacity;
  j["identity_horizon_s"]    = cfg.identity_horizon_s;
  j["transfer_timeout_s"]    = cfg.transfer_timeout_s;
  j["retransmit_timeout_ms"] = cfg.retransmit_timeout_ms;
  j["max_retries"]           = cfg.max_retries;
  j["fragment_size"]         = cfg.fragment_size;
  j["duplicate_window_s"]    = cfg.duplicate_window_s;
  j["tie_break"]             = to_string(cfg.tie_break);
  j["sign_packets"]          = cfg.sign_packets;
  j["broadcast_fallback"]    = cfg.broadcast_fallback;

  json ifaces = json::array();
  for (const InterfaceConfig& ic : cfg.interfaces) {
    json i;
    i["name"]          = ic.name.c_str();
    i["mode"]          = to_string(ic.mode);
    i["bandwidth_bps"] = ic.bandwidth_bps;
    i["listen_port"]   = ic.listen_port;
    json peers = json::array();
    for (const PeerStr& p : ic.peers) peers.push_back(p.c_str());
    i["peers"] = peers;
    ifaces.push_back(i);
  }
  j["interfaces"] = ifaces;
  return j.dump(2);
}

#endif

} // namespace mycorrhiza
