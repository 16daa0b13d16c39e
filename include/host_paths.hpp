#pragma once
/**
 * @file host_paths.hpp
 * @brief Where host programs keep their files, and how they write them.
 *
 * @details
 * | what            | location                                              |
 * |-----------------|-------------------------------------------------------|
 * | node.json       | `$XDG_CONFIG_HOME/mycorrhiza` (else `~/.config/...`)  |
 * | devices.json    | same directory as node.json                           |
 * | identity.dat    | `$XDG_DATA_HOME/mycorrhiza` (else `~/.local/share/...`) |
 * | device symlinks | `$XDG_RUNTIME_DIR/mycorrhiza` (else `/run/user/<uid>/...`) |
 *
 * Every writer goes through atomic_write(): the bytes land in `<file>.tmp`
 * and are renamed over the target, so a crash never leaves half a file.
 * Nothing here throws; failures come back as false / nullopt.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mycorrhiza {

std::filesystem::path config_dir();
std::filesystem::path data_dir();
std::filesystem::path runtime_dir();

/**
 * @brief Write @p n bytes to @p path via a temporary file and rename.
 * Creates missing parent directories. @return false on any I/O failure.
 */
bool atomic_write(const std::filesystem::path& path, const uint8_t* data, std::size_t n);

inline bool atomic_write(const std::filesystem::path& path, const std::string& text) {
  return atomic_write(path, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

/// Whole file contents; nullopt if it does not exist or cannot be read.
std::optional<std::vector<uint8_t>> read_file(const std::filesystem::path& path);

/// Monotonic milliseconds truncated to 32 bits, the Node's clock.
uint32_t now_ms_steady32();

} // namespace mycorrhiza
