// -----------------------------------------------------------------------------
// host_paths.cpp - XDG directories and atomic file writes
//
// API: see include/host_paths.hpp
// Tests: tests/test_identity_store.cpp
// -----------------------------------------------------------------------------
#include "host_paths.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <system_error>
#include <unistd.h>        // getuid

namespace fs = std::filesystem;

namespace mycorrhiza {

// ---------------------------------------------------------------------------
// xdg_base()
// ----------
// $<var> if set and non-empty, else $HOME/<fallback>. With no HOME either the
// result is relative to the working directory; callers still get a path.
// ---------------------------------------------------------------------------
static fs::path xdg_base(const char* var, const char* fallback) {
    if (const char* x = std::getenv(var); x && *x) return fs::path(x);
    const char* home = std::getenv("HOME");
    return fs::path(home ? home : "") / fallback;
}

fs::path config_dir() { return xdg_base("XDG_CONFIG_HOME", ".config") / "mycorrhiza"; }
fs::path data_dir()   { return xdg_base("XDG_DATA_HOME", ".local/share") / "mycorrhiza"; }

fs::path runtime_dir() {
    if (const char* x = std::getenv("XDG_RUNTIME_DIR"); x && *x)
        return fs::path(x) / "mycorrhiza";
    return fs::path("/run/user") / std::to_string(getuid()) / "mycorrhiza";
}

// ---------------------------------------------------------------------------
// atomic_write()
// --------------
// 1) create parent dirs, 2) write <path>.tmp, 3) rename over <path>.
// A failed rename removes the temporary so no stale .tmp piles up.
// ---------------------------------------------------------------------------
bool atomic_write(const fs::path& path, const uint8_t* data, std::size_t n) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) return false;
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) return false;
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(n));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }
    return true;
}

std::optional<std::vector<uint8_t>> read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;

    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    if (in.bad()) return std::nullopt;
    return bytes;
}

uint32_t now_ms_steady32() {
    using namespace std::chrono;
    auto ms = duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
    return static_cast<uint32_t>(ms & 0xFFFFFFFFu);
}

} // namespace mycorrhiza
