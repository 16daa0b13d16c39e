#pragma once
/**
 * @file identity_store.hpp
 * @brief IIdentityStore backed by a 128-byte file (Linux hosts).
 *
 * The file holds the raw IdentityBlob and nothing else. It is written with
 * owner-only permissions because half of it is private key material.
 */

#include <filesystem>
#include <optional>
#include <utility>
#include "mycorrhiza/identity.hpp"

namespace mycorrhiza {

class FileIdentityStore : public IIdentityStore {
public:
  /// Default location: data_dir() / "identity.dat".
  FileIdentityStore();
  explicit FileIdentityStore(std::filesystem::path path) : path_(std::move(path)) {}

  /// nullopt when the file is missing or not exactly 128 bytes.
  std::optional<IdentityBlob> load() override;
  bool save(const IdentityBlob& blob) override;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace mycorrhiza
