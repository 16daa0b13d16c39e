#pragma once
/**
 * @file node_registry.hpp
 * @brief Discover serial-attached mesh nodes, remember them, and give them stable names.
 *
 * @details
 * PURPOSE
 * -------
 * A workstation may have several boards plugged in, and /dev/ttyACM* numbers
 * shuffle on every replug. The registry finds the nodes, asks each for its
 * mesh address, and records the answer so tools can say "the node with
 * address 3f2a..." instead of "/dev/ttyACM1".
 *
 * DISCOVERY
 * ---------
 * 1. Candidates: /dev/serial/by-id/* (resolved to canonical paths) when
 *    that directory exists, else /dev/ttyACM* and /dev/ttyUSB*.
 * 2. Probe: open the port, write `!info`, read lines until `NODE:<hex>`
 *    arrives or the probe timeout passes.
 * 3. A device that answers is online; the rest are recorded offline.
 *
 * FILES
 * -----
 * - `config_dir()/devices.json`:
 *   `[{"address":"<32 hex>","dev_path":"/dev/ttyACM0","online":true}, ...]`
 * - `runtime_dir()/mycorrhiza-node-<first 8 hex>` -> device path, online only.
 *
 * Nothing throws. I/O problems are printed to std::cerr as key=value lines
 * and reported through the return value.
 */

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mycorrhiza {

/**
 * @struct NodeInfo
 * @brief One discovered serial device.
 */
struct NodeInfo {
    std::string address;  /**< 32 hex chars reported by the node; empty when offline. */
    std::string dev_path; /**< Canonical device path, e.g. "/dev/ttyACM0". */
    bool online{false};   /**< Answered the probe. */
};

/// Probe every candidate device. Never throws; slow (one probe timeout per dead port).
std::vector<NodeInfo> discover_nodes();

/**
 * @brief Ask the node on @p dev_path for its address.
 * @return 32 lowercase hex chars, or empty on open failure, timeout or garbage.
 */
std::string probe_address(const std::string& dev_path);

/**
 * @brief Pull the address out of a console `NODE:<hex>` line.
 * @return false when @p line is not a NODE line or the hex is not an address
 */
bool parse_node_line(const std::string& line, std::string& address);

/// Write devices.json. @p path defaults to config_dir()/devices.json.
bool save_registry(const std::vector<NodeInfo>& nodes,
                   const std::filesystem::path& path = {});

/// Read devices.json; nullopt if missing or malformed.
std::optional<std::vector<NodeInfo>> load_registry(const std::filesystem::path& path = {});

/// Recreate runtime_dir()/mycorrhiza-node-<short address> symlinks for online nodes.
bool create_symlinks(const std::vector<NodeInfo>& nodes);

} // namespace mycorrhiza
