/**
 * @file main.cpp
 * @brief mycorrhiza-node: a desktop mesh node over UDP links.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and merge them over the JSON config
 *    ($XDG_CONFIG_HOME/mycorrhiza/node.json).
 *  - Load or create the node identity ($XDG_DATA_HOME/mycorrhiza/identity.dat)
 *    through the OpenSSL crypto capability.
 *  - Open one UdpLink per configured interface and attach it to the Node.
 *  - Run the cooperative loop: tick -> drain events -> sleep.
 *  - Accept console lines (`!info`, `!send <addr> <text>`, ...) on stdin from a
 *    reader thread; the Node is shared through SharedNode.
 *
 * Output:
 *  - Events on stdout, one per line, as key=value (default) or JSON (--format json).
 *  - Diagnostics on stderr as `status=... reason=...` lines.
 *  - Completed file transfers are written to --download-dir when given.
 */

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <unistd.h> // isatty, STDIN_FILENO

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "crypto_openssl.hpp"
#include "download.hpp"
#include "host_paths.hpp"
#include "identity_store.hpp"
#include "shared_node.hpp"
#include "mycorrhiza/config.hpp"
#include "mycorrhiza/console.hpp"
#include "mycorrhiza/transport/udp_link.hpp"

using json = nlohmann::ordered_json;   // keeps "event" first in each line
namespace fs = std::filesystem;
using namespace mycorrhiza;

// ---------- small utilities ----------

static std::atomic<bool> g_running{true};

static void on_signal(int) { g_running = false; }

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

static std::string hex(const Address& a)    { return to_hex(a).c_str(); }
static std::string hex(const TransferId& t) { return to_hex(t).c_str(); }

// Printable form of a DATA payload: bytes outside 0x20..0x7E become '.'.
static std::string printable(const std::vector<uint8_t>& data) {
  std::string s;
  s.reserve(data.size());
  for (uint8_t b : data) s.push_back((b >= 0x20 && b < 0x7F) ? static_cast<char>(b) : '.');
  return s;
}

// ---------- event output ----------

static json event_json(const Event& ev) {
  json j;
  j["event"] = to_string(ev.kind);
  switch (ev.kind) {
    case EventKind::DataDelivered:
      j["from"]  = ev.peer_known ? hex(ev.peer) : std::string("unknown");
      j["bytes"] = ev.data.size();
      j["text"]  = printable(ev.data);
      j["iface"] = ev.interface_id;
      break;
    case EventKind::PeerDiscovered:
      j["address"] = hex(ev.peer);
      j["hops"]    = ev.hop_count;
      j["iface"]   = ev.interface_id;
      break;
    case EventKind::TransferProgress:
      j["id"]       = hex(ev.transfer_id);
      j["received"] = ev.received;
      j["expected"] = ev.expected;
      if (ev.error != TransferError::None) j["error"] = to_string(ev.error);
      break;
    case EventKind::TransferComplete:
      j["id"]    = hex(ev.transfer_id);
      j["from"]  = ev.peer_known ? hex(ev.peer) : std::string("unknown");
      j["bytes"] = ev.data.size();
      if (ev.has_meta) j["name"] = ev.meta.filename.c_str();
      break;
    case EventKind::TransferFailed:
      j["id"]       = hex(ev.transfer_id);
      j["error"]    = to_string(ev.error);
      j["received"] = ev.received;
      j["expected"] = ev.expected;
      break;
    case EventKind::DeliveryFailed:
      j["dest"]   = hex(ev.peer);
      j["reason"] = to_string(ev.reason);
      break;
  }
  return j;
}

// key=value rendering of the same fields, strings quoted when they may hold spaces.
static std::string event_kv(const json& j) {
  std::string out;
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (!out.empty()) out += ' ';
    out += it.key();
    out += '=';
    out += it->is_string() ? (it.key() == "text" || it.key() == "name" ? it->dump()
                                                                        : it->get<std::string>())
                           : it->dump();
  }
  return out;
}

// ---------- stdin console ----------

// Reads lines from stdin until EOF, "quit", or shutdown. Replies go to stdout.
static void console_loop(SharedNode& shared) {
  pollfd pfd{STDIN_FILENO, POLLIN, 0};
  std::string line;
  while (g_running) {
    int pr = ::poll(&pfd, 1, 200);
    if (pr == 0) continue;
    if (pr < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (!std::getline(std::cin, line)) break;       // EOF: the node keeps running
    if (line == "quit" || line == "exit") { g_running = false; break; }

    std::vector<std::string> replies;
    const bool handled = shared.with([&](Node& n) {
      Console console(n);
      return console.execute(line, replies);
    });
    if (!handled) {
      if (!line.empty()) std::cout << "ERROR:Commands start with '!' (try !info)\n" << std::flush;
      continue;
    }
    for (const auto& r : replies) std::cout << r << "\n";
    std::cout << std::flush;
  }
}

int main(int argc, char** argv) {
  CLI::App app{"mycorrhiza-node: mesh node over UDP links"};

  std::string opt_config;
  std::string opt_identity;
  std::string opt_name;
  std::string opt_format = "kv";
  std::string opt_download_dir;
  std::string opt_mode = "full";
  std::vector<std::string> opt_peers;
  uint16_t opt_listen_port = 0;
  uint32_t opt_tick_ms = 20;
  uint32_t opt_announce_interval = 0;
  int      opt_duration_s = 0;
  bool opt_no_sign = false;
  bool opt_no_stdin = false;
  bool opt_save_config = false;
  bool opt_print_config = false;
  bool opt_no_color = false;

  app.add_option("--config", opt_config, "Config file (default $XDG_CONFIG_HOME/mycorrhiza/node.json)");
  app.add_option("--identity", opt_identity, "Identity file (default $XDG_DATA_HOME/mycorrhiza/identity.dat)");
  app.add_option("--name", opt_name, "Node name (logs only)");
  app.add_option("--listen-port", opt_listen_port, "Replace configured interfaces with one UDP interface on this port");
  app.add_option("--peer", opt_peers, "With --listen-port: host:port of a neighbour (repeatable)");
  app.add_option("--mode", opt_mode, "With --listen-port: interface mode")
      ->check(CLI::IsMember({"full", "gateway", "boundary", "access_point", "roaming"}));
  app.add_option("--announce-interval", opt_announce_interval, "Seconds between self-announces (0 = mode default)");
  app.add_flag("--no-sign", opt_no_sign, "Send DATA unsigned");
  app.add_option("--download-dir", opt_download_dir, "Save completed file transfers here");
  app.add_option("--format", opt_format, "Event format: kv|json")->check(CLI::IsMember({"kv", "json"}));
  app.add_option("--tick-ms", opt_tick_ms, "Loop period in ms")->capture_default_str()
      ->check(CLI::Range(uint32_t{1}, uint32_t{1000}));
  app.add_option("--duration", opt_duration_s, "Exit after N seconds (0 = run until signal or quit)");
  app.add_flag("--no-stdin", opt_no_stdin, "Do not read console commands from stdin");
  app.add_flag("--save-config", opt_save_config, "Write the merged config back to --config");
  app.add_flag("--print-config", opt_print_config, "Print the merged config as JSON and exit");
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && opt_format == "kv";

  // ---- config: defaults <- file <- flags ----
  const fs::path config_path = opt_config.empty() ? config_dir() / "node.json" : fs::path(opt_config);
  NodeConfig cfg;
  if (auto bytes = read_file(config_path)) {
    if (!config_from_json(std::string(bytes->begin(), bytes->end()), cfg)) {
      std::cerr << ansi.red("status=error reason=bad_config path=" + config_path.string()) << "\n";
      return 2;
    }
  } else if (!opt_config.empty()) {
    std::cerr << "status=error reason=config_missing path=" << config_path.string() << "\n";
    return 2;
  }

  if (!opt_name.empty()) cfg.name.assign(opt_name.c_str(), opt_name.size() < cfg.name.max_size()
                                                           ? opt_name.size() : cfg.name.max_size());
  if (opt_announce_interval) cfg.announce_interval_s = opt_announce_interval;
  if (opt_no_sign) cfg.sign_packets = false;

  if (opt_listen_port) {
    InterfaceConfig itf;
    itf.name = "udp0";
    itf.listen_port = opt_listen_port;
    if (!parse_mode(opt_mode.c_str(), itf.mode)) {
      std::cerr << "status=error reason=bad_mode mode=" << opt_mode << "\n";
      return 2;
    }
    for (const auto& p : opt_peers) {
      etl::string<64> host;
      uint16_t port = 0;
      if (!parse_peer(p.c_str(), host, port) || itf.peers.full()) {
        std::cerr << "status=error reason=bad_peer peer=" << p << "\n";
        return 2;
      }
      itf.peers.push_back(PeerStr(p.c_str()));
    }
    cfg.interfaces.clear();
    cfg.interfaces.push_back(itf);
  }
  cfg.clamp();

  if (opt_print_config) {
    std::cout << config_to_json(cfg) << "\n";
    return 0;
  }
  if (opt_save_config) {
    if (!atomic_write(config_path, config_to_json(cfg) + "\n")) {
      std::cerr << "status=error reason=config_write_failed path=" << config_path.string() << "\n";
      return 1;
    }
    std::cerr << "status=ok config=" << config_path.string() << "\n";
  }
  if (cfg.interfaces.empty()) {
    std::cerr << "status=error reason=no_interfaces hint=\"--listen-port <port> --peer host:port\"\n";
    return 2;
  }

  // ---- identity ----
  OpenSslCrypto crypto;
  FileIdentityStore store = opt_identity.empty() ? FileIdentityStore()
                                                 : FileIdentityStore(fs::path(opt_identity));
  bool created = false, saved = true;
  auto identity = load_or_create(store, crypto, &created, &saved);
  if (!identity) {
    std::cerr << "status=error reason=identity_unavailable path=" << store.path().string() << "\n";
    return 1;
  }
  if (created && !saved) {
    std::cerr << "status=warn reason=identity_not_saved path=" << store.path().string()
              << " note=address_changes_on_restart\n";
  }

  // ---- links, then the node that refers to them ----
  std::vector<std::unique_ptr<transport::UdpLink>> links;
  for (const auto& itf : cfg.interfaces) {
    std::vector<std::string> peers;
    for (const auto& p : itf.peers) peers.emplace_back(p.c_str());
    auto link = std::make_unique<transport::UdpLink>(itf.listen_port, peers, itf.name.c_str());
    transport::Config lc;
    lc.bandwidth_bps = itf.bandwidth_bps;
    if (!link->begin(lc)) {
      std::cerr << "status=error reason=link_open_failed iface=" << itf.name.c_str()
                << " port=" << itf.listen_port << "\n";
      return 1;
    }
    links.push_back(std::move(link));
  }

  SharedNode shared(*identity, cfg, &crypto);
  for (size_t i = 0; i < links.size(); ++i) {
    const InterfaceConfig& itf = cfg.interfaces[i];
    auto id = shared.with([&](Node& n) { return n.add_interface(*links[i], itf.mode, itf.bandwidth_bps); });
    if (!id) {
      std::cerr << "status=error reason=too_many_interfaces iface=" << itf.name.c_str() << "\n";
      return 1;
    }
  }

  const std::string self = shared.with([](Node& n) { return hex(n.address()); });
  std::cout << ansi.bold("status=ok") << " name=" << cfg.name.c_str()
            << " address=" << self
            << " identity=" << (created ? "created" : "loaded")
            << ansi.dim(" interfaces=" + std::to_string(links.size())) << "\n" << std::flush;

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  std::thread console;
  if (!opt_no_stdin) console = std::thread(console_loop, std::ref(shared));

  // ---- loop ----
  const uint32_t start = now_ms_steady32();
  Event ev;
  while (g_running) {
    const uint32_t now = now_ms_steady32();
    if (opt_duration_s > 0 &&
        static_cast<uint32_t>(now - start) >= static_cast<uint32_t>(opt_duration_s) * 1000u) break;

    shared.tick(now);
    while (shared.get_event(ev)) {
      const json j = event_json(ev);
      std::cout << (opt_format == "json" ? j.dump() : event_kv(j)) << "\n";

      if (ev.kind == EventKind::TransferComplete && !opt_download_dir.empty()) {
        ReceivedFile file;
        file.id       = ev.transfer_id;
        file.sender   = ev.peer_known ? ev.peer : Address{};
        file.filename = ev.has_meta ? ev.meta.filename.c_str() : "";
        file.data     = ev.data;
        const fs::path path = fs::path(opt_download_dir) / safe_filename(file);
        if (!atomic_write(path, file.data.data(), file.data.size())) {
          std::cerr << "status=error reason=download_write_failed path=" << path.string() << "\n";
        } else {
          std::cout << "event=file_saved path=" << path.string() << "\n";
        }
      }
    }
    std::cout << std::flush;
    std::this_thread::sleep_for(std::chrono::milliseconds(opt_tick_ms));
  }

  g_running = false;
  if (console.joinable()) console.join();

  const Counters c = shared.with([](Node& n) { return n.counters(); });
  std::cerr << "status=stopped rx=" << c.rx << " tx=" << c.tx
            << " delivered=" << c.delivered << " forwarded=" << c.forwarded << "\n";
  return 0;
}
