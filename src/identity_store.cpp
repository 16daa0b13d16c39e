// -----------------------------------------------------------------------------
// identity_store.cpp - identity blob file
//
// API: see include/identity_store.hpp
// Tests: tests/test_identity_store.cpp
// -----------------------------------------------------------------------------
#include "identity_store.hpp"
#include "host_paths.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace mycorrhiza {

FileIdentityStore::FileIdentityStore() : path_(data_dir() / "identity.dat") {}

std::optional<IdentityBlob> FileIdentityStore::load() {
    auto bytes = read_file(path_);
    if (!bytes || bytes->size() != IDENTITY_BLOB_SIZE) return std::nullopt;

    IdentityBlob blob;
    std::copy(bytes->begin(), bytes->end(), blob.bytes.begin());
    return blob;
}

bool FileIdentityStore::save(const IdentityBlob& blob) {
    if (!atomic_write(path_, blob.bytes.data(), blob.bytes.size())) return false;

    std::error_code ec;
    fs::permissions(path_, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    return !ec;
}

} // namespace mycorrhiza
