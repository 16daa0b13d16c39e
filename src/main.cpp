#include <iostream>
#include <string>
#include <vector>
#include <cstdint>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>         // access()
#include "CLI/CLI11.hpp"

#include "download.hpp"           // DownloadAssembler, safe_filename()
#include "host_paths.hpp"         // runtime_dir(), atomic_write()
#include "node_registry.hpp"      // discover_nodes(), save_registry(), create_symlinks()
#include "serial_io.hpp"          // open_serial(), write_line(), read_item(), close_serial()
#include "uploader.hpp"           // Uploader
#include "mycorrhiza/address.hpp"

namespace fs = std::filesystem;
using namespace mycorrhiza;

// Resolve alias path in user runtime dir:
//   $XDG_RUNTIME_DIR/mycorrhiza/mycorrhiza-node-<first 8 hex>
static std::string alias_for(const std::string& address) {
  return (runtime_dir() / ("mycorrhiza-node-" + address.substr(0, 8))).string();
}

static bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Print every item until the device stays quiet for timeout_ms.
// Returns the number of lines printed.
static size_t drain_lines(int fd, kiss::StreamDemux& demux, int timeout_ms) {
  size_t lines = 0;
  kiss::Item item;
  while (read_item(fd, demux, item, timeout_ms)) {
    if (item.kind == kiss::Item::Kind::Line) {
      std::cout << item.line.c_str() << "\n";
      ++lines;
    } else if (item.kind == kiss::Item::Kind::Error) {
      std::cerr << "status=warn reason=framing error=" << kiss::to_string(item.error) << "\n";
    }
  }
  return lines;
}

// -----------------------------------------------------------------------------
// listen()
// Print console lines as they come; turn download frame runs into files in
// out_dir. duration_s 0 runs until the port goes away.
// -----------------------------------------------------------------------------
static int listen(int fd, kiss::StreamDemux& demux, const fs::path& out_dir, int duration_s) {
  using clock = std::chrono::steady_clock;
  const auto until = clock::now() + std::chrono::seconds(duration_s);
  DownloadAssembler downloads;
  kiss::Item item;

  while (duration_s == 0 || clock::now() < until) {
    bool hangup = false;
    if (!read_item(fd, demux, item, 1000, &hangup)) {
      if (hangup) {
        std::cerr << "status=error reason=device_gone\n";
        return 1;
      }
      continue;
    }
    if (item.kind == kiss::Item::Kind::Line) {
      std::cout << item.line.c_str() << "\n" << std::flush;
      continue;
    }
    if (item.kind == kiss::Item::Kind::Error) {
      std::cerr << "status=warn reason=framing error=" << kiss::to_string(item.error) << "\n";
      continue;
    }

    ReceivedFile file;
    const auto r = downloads.on_frame(item.frame, file);
    if (r == DownloadAssembler::Result::Orphan || r == DownloadAssembler::Result::Malformed) {
      std::cerr << "status=warn reason=download_" << to_string(r)
                << " command=" << kiss::to_string(static_cast<kiss::Command>(item.frame.command)) << "\n";
      continue;
    }
    if (r != DownloadAssembler::Result::Complete) continue;

    const fs::path path = out_dir / safe_filename(file);
    const bool saved = atomic_write(path, file.data.data(), file.data.size());
    std::cout << "event=file_received id=" << to_hex(file.id).c_str()
              << " sender=" << (file.sender.is_zero() ? std::string("unknown")
                                                       : std::string(to_hex(file.sender).c_str()))
              << " bytes=" << file.data.size()
              << " size_ok=" << (file.size_matches() ? 1 : 0)
              << " path=" << path.string()
              << " saved=" << (saved ? 1 : 0) << "\n" << std::flush;
  }
  return 0;
}

int main(int argc, char** argv) {
  CLI::App app{"mycorrhiza-ctl: talk to a serial-attached mesh node"};

  // ---- console commands ----
  bool info=false, announce=false, peers=false, routes=false, transfers=false;
  std::vector<std::string> send_args;   // --send <address> <text>
  std::vector<std::string> upload_args; // --upload <address> <file>
  std::string raw_cmd;                  // --cmd "!anything"
  bool do_listen=false;

  // ---- discovery / targeting ----
  bool do_scan=false, make_aliases=false;
  std::string node_addr;                // --node <address or prefix>
  std::string dev="/dev/ttyACM0";
  CLI::Option* opt_dev = app.add_option("--dev", dev, "Serial device (e.g. /dev/serial/by-id/...)");

  // ---- io settings ----
  int timeout_ms=1500, baud=115200, boot_delay_ms=400, duration_s=0;
  uint32_t retransmit_ms=3000;
  unsigned retries=5;
  std::string out_dir=".";

  app.add_flag("--info",      info,      "Node address, table sizes, counters");
  app.add_flag("--announce",  announce,  "Send an announce now");
  app.add_flag("--peers",     peers,     "List cached identities");
  app.add_flag("--routes",    routes,    "List routes");
  app.add_flag("--transfers", transfers, "List inbound transfers in progress");
  app.add_option("--send", send_args, "Send text: --send <address> <text>")->expected(2);
  app.add_option("--upload", upload_args, "Send a file: --upload <address> <path>")->expected(2);
  app.add_option("--cmd", raw_cmd, "Raw console line, e.g. \"!routes\"");
  app.add_flag("--listen", do_listen, "Print console output and save received files");

  app.add_flag("--scan", do_scan, "Scan and list nodes (address/dev/online), saves registry");
  app.add_flag("--aliases", make_aliases,
               "With --scan: create $XDG_RUNTIME_DIR/mycorrhiza/mycorrhiza-node-<addr8> symlinks");
  app.add_option("--node", node_addr, "Target node by address or address prefix");

  app.add_option("--timeout", timeout_ms, "Quiet time that ends a reply (ms)");
  app.add_option("--baud", baud, "Baud rate (default 115200)");
  app.add_option("--boot-delay", boot_delay_ms, "Delay after open (ms) to let USB reset");
  app.add_option("--duration", duration_s, "With --listen: stop after N seconds (0 = forever)");
  app.add_option("--out-dir", out_dir, "With --listen: where received files go");
  app.add_option("--retransmit-ms", retransmit_ms, "With --upload: resend a chunk after this long");
  app.add_option("--retries", retries, "With --upload: resends per chunk before giving up")
      ->check(CLI::Range(0u, 255u));

  CLI11_PARSE(app, argc, argv);

  // -------- scan mode --------
  if (do_scan) {
    auto nodes = discover_nodes();
    for (const auto& n : nodes) {
      std::cout << "address=" << (n.address.empty() ? "-" : n.address)
                << " dev=" << n.dev_path
                << " online=" << (n.online ? 1 : 0) << "\n";
    }
    bool ok = save_registry(nodes);
    if (make_aliases) ok = create_symlinks(nodes) && ok;
    return ok ? 0 : 1;
  }

  // -------- choose exactly one command --------
  int cmds = 0;
  cmds += info ? 1 : 0;
  cmds += announce ? 1 : 0;
  cmds += peers ? 1 : 0;
  cmds += routes ? 1 : 0;
  cmds += transfers ? 1 : 0;
  cmds += (send_args.size()==2) ? 1 : 0;
  cmds += (upload_args.size()==2) ? 1 : 0;
  cmds += (!raw_cmd.empty()) ? 1 : 0;
  cmds += do_listen ? 1 : 0;

  if (cmds != 1) {
    std::cerr << "status=error reason=need_exactly_one_command\n";
    return 2;
  }

  // ===== Target resolution =====
  const bool dev_explicit = (opt_dev && opt_dev->count() > 0);

  if (!node_addr.empty()) {
    std::string link = node_addr.size() >= 8 ? alias_for(node_addr) : std::string();
    if (!link.empty() && access(link.c_str(), R_OK) == 0) {
      dev = link;
    } else {
      auto nodes = discover_nodes();
      if (!save_registry(nodes)) std::cerr << "status=warn reason=registry_not_saved\n";
      std::vector<NodeInfo> hits;
      for (const auto& n : nodes) {
        if (n.online && starts_with(n.address, node_addr)) hits.push_back(n);
      }
      if (hits.empty()) {
        std::cerr << "status=error reason=node_not_found address=" << node_addr << "\n";
        return 4;
      }
      if (hits.size() > 1) {
        std::cerr << "status=error reason=ambiguous_address prefix=" << node_addr << "\n";
        for (const auto& n : hits) std::cerr << "candidate address=" << n.address << " dev=" << n.dev_path << "\n";
        return 5;
      }
      dev = hits.front().dev_path;
    }
  } else if (!dev_explicit) {
    auto nodes = discover_nodes();
    if (!save_registry(nodes)) std::cerr << "status=warn reason=registry_not_saved\n";

    int online_count = 0;
    std::string last_dev;
    for (const auto& n : nodes) {
      if (n.online) { online_count++; last_dev = n.dev_path; }
    }

    if (online_count == 1) {
      dev = last_dev;
    } else if (online_count > 1) {
      std::cerr << "status=error reason=multiple_nodes_connected need_target\n";
      for (const auto& n : nodes) {
        if (n.online) std::cerr << "candidate address=" << n.address << " dev=" << n.dev_path << "\n";
      }
      return 5;
    } else {
      std::cerr << "status=error reason=no_nodes_online\n";
      return 6;
    }
  }

  // -------- build the console line, if any --------
  std::string line;
  if (info)           line = "!info";
  else if (announce)  line = "!announce";
  else if (peers)     line = "!peers";
  else if (routes)    line = "!routes";
  else if (transfers) line = "!transfers";
  else if (!raw_cmd.empty()) line = raw_cmd;
  else if (send_args.size()==2) {
    Address check;
    if (!parse_hex(send_args[0].c_str(), check)) {
      std::cerr << "status=error reason=bad_address address=" << send_args[0] << "\n";
      return 2;
    }
    line = "!send " + send_args[0] + " " + send_args[1];
  }

  // Upload input is read before the port is opened (opening resets many boards).
  Address upload_dest;
  std::vector<uint8_t> upload_data;
  std::string upload_name;
  if (upload_args.size()==2) {
    if (!parse_hex(upload_args[0].c_str(), upload_dest)) {
      std::cerr << "status=error reason=bad_address address=" << upload_args[0] << "\n";
      return 2;
    }
    std::ifstream in(upload_args[1], std::ios::binary);
    if (!in) {
      std::cerr << "status=error reason=file_open_failed path=" << upload_args[1] << "\n";
      return 2;
    }
    upload_data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    upload_name = fs::path(upload_args[1]).filename().string();
  }

  // -------- talk to the device --------
  int fd = open_serial(dev, baud, boot_delay_ms);
  if (fd < 0) {
    std::cerr << "status=error reason=open_failed dev=" << dev << "\n";
    return 1;
  }
  kiss::StreamDemux demux;
  int rc = 0;

  if (do_listen) {
    rc = listen(fd, demux, fs::path(out_dir), duration_s);
  } else if (!upload_args.empty()) {
    UploadOptions opts;
    opts.retransmit_ms = retransmit_ms;
    opts.max_retries   = static_cast<uint8_t>(retries);
    Uploader up(fd, demux, opts);
    up.on_line([](const std::string& l) { std::cout << l << "\n"; });

    const UploadResult r = up.send(upload_dest, upload_name, upload_data);
    if (r.ok()) {
      std::cout << "status=ok bytes=" << upload_data.size()
                << " fragments=" << r.fragment_count
                << " chunks=" << r.chunks
                << " writes=" << r.chunk_writes << "\n";
    } else {
      std::cerr << "status=error reason=" << (r.io_error ? "write_failed" : to_string(r.error))
                << " chunks=" << r.chunks << " writes=" << r.chunk_writes << "\n";
      rc = r.io_error ? 1 : 3;
    }
  } else {
    if (!write_line(fd, line)) {
      close_serial(fd);
      std::cerr << "status=error reason=write_failed\n";
      return 1;
    }
    if (drain_lines(fd, demux, timeout_ms) == 0) {
      std::cerr << "status=error reason=timeout\n";
      rc = 3;
    }
  }

  close_serial(fd);
  return rc;
}
