#pragma once
/**
 * @file download.hpp
 * @brief Collects FILE_RECEIVED / FILE_DATA / FILE_COMPLETE frames back into files.
 *
 * A node hands every reassembled mesh transfer to its host as one
 * FILE_RECEIVED header, a run of FILE_DATA chunks and a FILE_COMPLETE
 * trailer, all tagged with the transfer id. Downloads for different ids may
 * interleave; each is tracked separately until its trailer arrives.
 */

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "mycorrhiza/address.hpp"
#include "mycorrhiza/kiss.hpp"

namespace mycorrhiza {

struct ReceivedFile {
  TransferId           id{};
  Address              sender{};            ///< zero when the node could not tell
  std::string          filename;            ///< as sent; may be empty or contain '/'
  uint32_t             declared_size{0};    ///< size field of FILE_RECEIVED
  std::vector<uint8_t> data;

  bool size_matches() const { return data.size() == declared_size; }
};

class DownloadAssembler {
public:
  enum class Result : uint8_t {
    Ignored,    ///< not a download frame
    Progress,   ///< header or data accepted
    Complete,   ///< @c done holds the finished file
    Orphan,     ///< data or trailer for an id with no header
    Malformed   ///< shorter than its fixed fields
  };

  Result on_frame(const kiss::Frame& frame, ReceivedFile& done);

  size_t pending() const { return open_.size(); }

private:
  std::map<TransferId, ReceivedFile> open_;
};

const char* to_string(DownloadAssembler::Result r);

/**
 * @brief File name safe to create inside a download directory.
 *
 * Keeps the last path component, replaces control characters, and falls
 * back to the transfer id in hex when nothing usable is left ("", ".", "..").
 */
std::string safe_filename(const ReceivedFile& file);

} // namespace mycorrhiza
