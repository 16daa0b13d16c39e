// -----------------------------------------------------------------------------
// uploader.cpp - FILE_INFO / FILE_START / FILE_CHUNK / FILE_END driver
//
// API: see include/uploader.hpp
// Tests: tests/test_uploader.cpp
// -----------------------------------------------------------------------------
#include "uploader.hpp"
#include "host_paths.hpp"
#include "serial_io.hpp"
#include "mycorrhiza/file_bridge.hpp"
#include "mycorrhiza/fragment.hpp"

#include <chrono>
#include <utility>

namespace mycorrhiza {

namespace {

// Read timeout while waiting for acks; bounds how late a retransmit fires.
constexpr int ACK_POLL_MS = 50;

} // namespace

void Uploader::dispatch_line(const kiss::Item& item) {
  if (item.kind == kiss::Item::Kind::Line && on_line_) on_line_(item.line.c_str());
}

// Skip lines and unrelated frames until FILE_READY or the reply timeout.
bool Uploader::wait_ready(std::vector<uint8_t>& payload) {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::chrono::milliseconds(opts_.reply_timeout_ms);

  kiss::Item item;
  for (;;) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - clock::now()).count();
    if (left <= 0 || !read_item(fd_, demux_, item, static_cast<int>(left))) return false;

    if (item.kind == kiss::Item::Kind::Frame &&
        item.frame.command == static_cast<uint8_t>(kiss::Command::FileReady)) {
      payload = item.frame.payload;
      return true;
    }
    dispatch_line(item);
  }
}

// -----------------------------------------------------------------------------
// send()
// PRE:  fd open, device idle (no upload of ours in progress).
// OUT:  result.error None once FILE_END went out after the last CHUNK_ACK.
// -----------------------------------------------------------------------------
UploadResult Uploader::send(const Address& destination, const std::string& filename,
                            const std::vector<uint8_t>& data) {
  UploadResult res;

  FileOffer offer;
  offer.destination = destination;
  if (filename.size() > offer.filename.max_size()) {
    res.error = TransferError::TooLarge;
    return res;
  }
  offer.filename.assign(filename.c_str(), filename.size());
  offer.size = static_cast<uint32_t>(data.size());

  std::vector<uint8_t> offer_bytes;
  build_file_offer(offer, offer_bytes);

  // 1) FILE_INFO: the device sizes the transfer.
  std::vector<uint8_t> ready;
  if (!write_frame(fd_, kiss::Command::FileInfo, offer_bytes)) {
    res.io_error = true;
    res.error    = TransferError::Cancelled;
    return res;
  }
  if (!wait_ready(ready)) {
    res.error = TransferError::TransferTimeout;
    return res;
  }
  if (ready.size() >= 2) res.fragment_count = static_cast<uint16_t>((ready[0] << 8) | ready[1]);
  if (res.fragment_count > MAX_FRAGMENTS) {
    res.error = TransferError::TooLarge;
    return res;
  }

  // 2) FILE_START: opens the device-side upload.
  if (!write_frame(fd_, kiss::Command::FileStart, offer_bytes)) {
    res.io_error = true;
    res.error    = TransferError::Cancelled;
    return res;
  }
  if (!wait_ready(ready)) {
    res.error = TransferError::TransferTimeout;   // busy device answers nothing
    return res;
  }

  // 3) chunks: seq(u16 BE) | data
  std::vector<std::vector<uint8_t>> chunks;
  for (size_t off = 0; off < data.size(); off += CHUNK_SIZE) {
    const size_t n = data.size() - off < CHUNK_SIZE ? data.size() - off : CHUNK_SIZE;
    const uint16_t seq = static_cast<uint16_t>(chunks.size());
    std::vector<uint8_t> c;
    c.reserve(2 + n);
    c.push_back(static_cast<uint8_t>(seq >> 8));
    c.push_back(static_cast<uint8_t>(seq & 0xFF));
    c.insert(c.end(), data.begin() + static_cast<std::ptrdiff_t>(off),
             data.begin() + static_cast<std::ptrdiff_t>(off + n));
    chunks.push_back(std::move(c));
  }
  res.chunks = chunks.size();

  if (!chunks.empty()) {
    TransferSender sender(opts_.retransmit_ms, opts_.max_retries, opts_.window);
    const TransferId local_id = make_transfer_id(data.data(), data.size(), now_ms_steady32());
    if (!sender.start(local_id, std::move(chunks))) {
      res.error = TransferError::TooLarge;        // more chunks than a transfer holds
      return res;
    }

    kiss::Item item;
    while (sender.active()) {
      if (auto idx = sender.next_to_send(now_ms_steady32())) {
        if (!write_frame(fd_, kiss::Command::FileChunk, sender.item(*idx))) {
          sender.cancel();
          res.io_error = true;
          break;
        }
        ++res.chunk_writes;
        continue;
      }
      if (!sender.active()) break;                // retries ran out

      if (!read_item(fd_, demux_, item, ACK_POLL_MS)) continue;
      if (item.kind == kiss::Item::Kind::Frame &&
          item.frame.command == static_cast<uint8_t>(kiss::Command::ChunkAck) &&
          item.frame.payload.size() >= 2) {
        sender.acknowledge(static_cast<uint16_t>((item.frame.payload[0] << 8) | item.frame.payload[1]));
      } else {
        dispatch_line(item);
      }
    }

    if (!sender.complete()) {
      res.error = sender.error();
      return res;
    }
  }

  // 4) FILE_END: device flushes its last fragment and the FINAL marker.
  if (!write_frame(fd_, kiss::Command::FileEnd, {})) {
    res.io_error = true;
    res.error    = TransferError::Cancelled;
  }
  return res;
}

} // namespace mycorrhiza
