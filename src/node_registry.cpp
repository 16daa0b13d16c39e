// ============================================================================
// node_registry.cpp - implementation for node_registry.hpp
// For API/overview see the matching .hpp. Tests: tests/test_node_registry.cpp
// ============================================================================

/**
 * @file node_registry.cpp
 */

#include "node_registry.hpp"
#include "host_paths.hpp"
#include "serial_io.hpp"
#include "mycorrhiza/address.hpp"

#include "nlohmann/json.hpp"

#include <chrono>
#include <glob.h>             // glob(3) for tty fallbacks when /dev/serial/by-id is absent
#include <iostream>
#include <system_error>       // std::error_code for non-throwing filesystem ops
#include <utility>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace mycorrhiza {

// ---------------------------------------------------------------------------
// Probe-time constants.
// - PROBE_BAUD:       firmware console rate.
// - PROBE_TIMEOUT_MS: whole probe per device, so a scan stays bounded.
// - PROBE_BOOT_MS:    settle time after open (USB CDC resets on open).
// ---------------------------------------------------------------------------
static constexpr int PROBE_BAUD       = 115200;
static constexpr int PROBE_TIMEOUT_MS = 1500;
static constexpr int PROBE_BOOT_MS    = 400;

static const char* const NODE_PREFIX = "NODE:";


// -------- helpers --------

/*
 * append_glob()
 * -------------
 * Append the matches of a glob() pattern. glob() allocates; always globfree().
 */
static void append_glob(std::vector<std::string>& out, const char* pattern) {
    glob_t g{};
    if (glob(pattern, 0, nullptr, &g) == 0) {
        for (size_t i = 0; i < g.gl_pathc; ++i)
            out.emplace_back(g.gl_pathv[i]);
    }
    globfree(&g);
}

static fs::path registry_file(const fs::path& path) {
    return path.empty() ? config_dir() / "devices.json" : path;
}


// -------- public API --------

bool parse_node_line(const std::string& line, std::string& address) {
    if (line.rfind(NODE_PREFIX, 0) != 0) return false;
    const std::string hex = line.substr(std::char_traits<char>::length(NODE_PREFIX));

    Address a;
    if (!parse_hex(hex.c_str(), a)) return false;
    address = to_hex(a).c_str();                      // normalized lowercase
    return true;
}

/*
 * probe_address()
 * ---------------
 * Phases:
 *   1) open port (with boot delay),
 *   2) write "!info",
 *   3) read items until a NODE: line or the deadline; frames and other
 *      lines (PEER:, MSG: chatter) are skipped,
 *   4) close port.
 */
std::string probe_address(const std::string& dev_path) {
    int fd = open_serial(dev_path, PROBE_BAUD, PROBE_BOOT_MS);
    if (fd < 0) return {};

    std::string address;
    if (write_line(fd, "!info")) {
        using clock = std::chrono::steady_clock;
        const auto deadline = clock::now() + std::chrono::milliseconds(PROBE_TIMEOUT_MS);
        kiss::StreamDemux demux;
        kiss::Item item;
        while (address.empty()) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - clock::now()).count();
            if (left <= 0 || !read_item(fd, demux, item, static_cast<int>(left))) break;
            if (item.kind != kiss::Item::Kind::Line) continue;
            parse_node_line(item.line.c_str(), address);
        }
    }

    close_serial(fd);
    return address;
}

/*
 * discover_nodes()
 * ----------------
 * Prefer /dev/serial/by-id for stable names, fall back to tty globs, probe
 * every candidate. Errors just mean fewer entries or online=false.
 */
std::vector<NodeInfo> discover_nodes() {
    std::vector<NodeInfo> result;
    std::vector<std::string> candidates;

    std::error_code ec;
    const fs::path by_id("/dev/serial/by-id");
    if (fs::is_directory(by_id, ec)) {
        for (fs::directory_iterator it(by_id, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_symlink(ec)) continue;
            std::error_code cec;
            auto canon = fs::canonical(it->path(), cec);
            if (!cec) candidates.push_back(canon.string());
        }
    } else {
        append_glob(candidates, "/dev/ttyACM*");
        append_glob(candidates, "/dev/ttyUSB*");
    }

    for (const auto& dev : candidates) {
        std::string address = probe_address(dev);
        result.push_back({address, dev, !address.empty()});
    }
    return result;
}

bool save_registry(const std::vector<NodeInfo>& nodes, const fs::path& path) {
    json arr = json::array();
    for (const auto& n : nodes) {
        arr.push_back({{"address", n.address}, {"dev_path", n.dev_path}, {"online", n.online}});
    }

    const fs::path file = registry_file(path);
    if (!atomic_write(file, arr.dump(2) + "\n")) {
        std::cerr << "status=error reason=registry_write_failed path=" << file.string() << "\n";
        return false;
    }
    return true;
}

std::optional<std::vector<NodeInfo>> load_registry(const fs::path& path) {
    auto bytes = read_file(registry_file(path));
    if (!bytes) return std::nullopt;

    json arr = json::parse(bytes->begin(), bytes->end(), nullptr, /*allow_exceptions*/false);
    if (!arr.is_array()) return std::nullopt;

    std::vector<NodeInfo> nodes;
    for (const auto& e : arr) {
        if (!e.is_object()) return std::nullopt;
        NodeInfo n;
        try {
            n.address  = e.value("address", std::string());
            n.dev_path = e.value("dev_path", std::string());
            n.online   = e.value("online", false);
        } catch (const json::exception&) {            // wrong value types
            return std::nullopt;
        }
        nodes.push_back(std::move(n));
    }
    return nodes;
}

/*
 * create_symlinks()
 * -----------------
 *   <runtime_dir>/mycorrhiza-node-<first 8 hex> -> <device path>
 * Old links are replaced. Offline or unnamed entries are skipped.
 */
bool create_symlinks(const std::vector<NodeInfo>& nodes) {
    std::error_code ec;
    fs::path dir = runtime_dir();
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "status=error reason=alias_dir path=" << dir.string()
                  << " error=\"" << ec.message() << "\"\n";
        return false;
    }

    for (const auto& n : nodes) {
        if (!n.online || n.address.size() < 8) continue;
        fs::path link = dir / ("mycorrhiza-node-" + n.address.substr(0, 8));
        fs::remove(link, ec);                         // missing link is fine
        fs::create_symlink(n.dev_path, link, ec);
        if (ec) {
            std::cerr << "status=error reason=alias_failed address=" << n.address
                      << " error=\"" << ec.message() << "\"\n";
            return false;
        }
    }
    return true;
}

} // namespace mycorrhiza
