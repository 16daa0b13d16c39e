// -----------------------------------------------------------------------------
// download.cpp - device -> host file frames back into files
//
// API: see include/download.hpp
// Tests: tests/test_file_bridge.cpp
// -----------------------------------------------------------------------------
#include "download.hpp"

#include <utility>

namespace mycorrhiza {

const char* to_string(DownloadAssembler::Result r) {
  switch (r) {
    case DownloadAssembler::Result::Ignored:   return "ignored";
    case DownloadAssembler::Result::Progress:  return "progress";
    case DownloadAssembler::Result::Complete:  return "complete";
    case DownloadAssembler::Result::Orphan:    return "orphan";
    case DownloadAssembler::Result::Malformed: return "malformed";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// on_frame()
// POLICY: a second FILE_RECEIVED for an open id restarts that download.
// -----------------------------------------------------------------------------
DownloadAssembler::Result DownloadAssembler::on_frame(const kiss::Frame& frame, ReceivedFile& done) {
  const std::vector<uint8_t>& p = frame.payload;

  switch (static_cast<kiss::Command>(frame.command)) {
    case kiss::Command::FileReceived: {
      // tid(16) sender(16) name_len(1) name size(4)
      if (p.size() < 2 * ID_SIZE + 1) return Result::Malformed;
      const size_t name_len = p[2 * ID_SIZE];
      const size_t need = 2 * ID_SIZE + 1 + name_len + 4;
      if (p.size() < need) return Result::Malformed;

      ReceivedFile f;
      f.id     = TransferId::from_bytes(p.data());
      f.sender = Address::from_bytes(p.data() + ID_SIZE);
      f.filename.assign(reinterpret_cast<const char*>(p.data() + 2 * ID_SIZE + 1), name_len);
      const uint8_t* s = p.data() + 2 * ID_SIZE + 1 + name_len;
      f.declared_size = (static_cast<uint32_t>(s[0]) << 24) | (static_cast<uint32_t>(s[1]) << 16) |
                        (static_cast<uint32_t>(s[2]) << 8)  |  static_cast<uint32_t>(s[3]);
      f.data.reserve(f.declared_size);
      const TransferId id = f.id;
      open_[id] = std::move(f);
      return Result::Progress;
    }
    case kiss::Command::FileData: {
      if (p.size() < ID_SIZE) return Result::Malformed;
      auto it = open_.find(TransferId::from_bytes(p.data()));
      if (it == open_.end()) return Result::Orphan;
      it->second.data.insert(it->second.data.end(), p.begin() + ID_SIZE, p.end());
      return Result::Progress;
    }
    case kiss::Command::FileComplete: {
      if (p.size() < ID_SIZE) return Result::Malformed;
      auto it = open_.find(TransferId::from_bytes(p.data()));
      if (it == open_.end()) return Result::Orphan;
      done = std::move(it->second);
      open_.erase(it);
      return Result::Complete;
    }
    default:
      return Result::Ignored;
  }
}

std::string safe_filename(const ReceivedFile& file) {
  std::string name = file.filename;
  const auto slash = name.find_last_of('/');
  if (slash != std::string::npos) name = name.substr(slash + 1);
  for (char& c : name) {
    if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) c = '_';
  }
  if (name.empty() || name == "." || name == "..") name = to_hex(file.id).c_str();
  return name;
}

} // namespace mycorrhiza
