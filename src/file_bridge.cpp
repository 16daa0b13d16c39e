// -----------------------------------------------------------------------------
// file_bridge.cpp - serial file protocol on the device side
//
// API: see include/mycorrhiza/file_bridge.hpp
// Tests: tests/test_file_bridge.cpp
// -----------------------------------------------------------------------------
#include "mycorrhiza/file_bridge.hpp"

#include <utility>

namespace mycorrhiza {

namespace {

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>(v >> 24));
  out.push_back(static_cast<uint8_t>(v >> 16));
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

kiss::Frame make_frame(kiss::Command c) {
  kiss::Frame f;
  f.command = static_cast<uint8_t>(c);
  return f;
}

} // namespace

bool parse_file_offer(const uint8_t* p, size_t n, FileOffer& out) {
  if (!p || n < ID_SIZE + 1) return false;
  const size_t name_len = p[ID_SIZE];
  if (n < ID_SIZE + 1 + name_len + 4) return false;

  out.destination = Address::from_bytes(p);
  out.filename.assign(reinterpret_cast<const char*>(p + ID_SIZE + 1), name_len);
  const uint8_t* s = p + ID_SIZE + 1 + name_len;
  out.size = (static_cast<uint32_t>(s[0]) << 24) | (static_cast<uint32_t>(s[1]) << 16) |
             (static_cast<uint32_t>(s[2]) << 8)  |  static_cast<uint32_t>(s[3]);
  return true;
}

void build_file_offer(const FileOffer& offer, std::vector<uint8_t>& out) {
  out.clear();
  out.insert(out.end(), offer.destination.bytes.begin(), offer.destination.bytes.end());
  out.push_back(static_cast<uint8_t>(offer.filename.size()));
  out.insert(out.end(), offer.filename.begin(), offer.filename.end());
  put_u32(out, offer.size);
}

// ---------- public ----------

TransferError FileBridge::on_frame(const kiss::Frame& frame, std::vector<kiss::Frame>& replies) {
  switch (static_cast<kiss::Command>(frame.command)) {
    case kiss::Command::FileInfo: {
      FileOffer offer;
      if (!parse_file_offer(frame.payload.data(), frame.payload.size(), offer)) {
        return TransferError::Malformed;
      }
      FileMetadata meta;
      meta.filename = offer.filename;
      meta.size     = offer.size;
      std::vector<uint8_t> block;
      encode_metadata(meta, block);

      const size_t count = fragment_count(block.size() + offer.size, node_.config().fragment_size);
      if (count > MAX_FRAGMENTS) return TransferError::TooLarge;

      kiss::Frame ready = make_frame(kiss::Command::FileReady);
      put_u16(ready.payload, static_cast<uint16_t>(count));
      replies.push_back(std::move(ready));
      return TransferError::None;
    }
    case kiss::Command::FileStart: return start(frame, replies);
    case kiss::Command::FileChunk: return chunk(frame, replies);
    case kiss::Command::FileEnd:   return finish();
    default:
      return TransferError::Malformed;             // device -> host codes, or unknown
  }
}

bool FileBridge::on_event(const Event& ev, std::vector<kiss::Frame>& out) const {
  if (ev.kind != EventKind::TransferComplete) return false;

  kiss::Frame head = make_frame(kiss::Command::FileReceived);
  head.payload.insert(head.payload.end(), ev.transfer_id.bytes.begin(), ev.transfer_id.bytes.end());
  head.payload.insert(head.payload.end(), ev.peer.bytes.begin(), ev.peer.bytes.end());
  const FileName name = ev.has_meta ? ev.meta.filename : FileName();
  head.payload.push_back(static_cast<uint8_t>(name.size()));
  head.payload.insert(head.payload.end(), name.begin(), name.end());
  put_u32(head.payload, static_cast<uint32_t>(ev.data.size()));
  out.push_back(std::move(head));

  for (size_t off = 0; off < ev.data.size(); off += FILE_DATA_CHUNK) {
    const size_t n = ev.data.size() - off < FILE_DATA_CHUNK ? ev.data.size() - off
                                                             : FILE_DATA_CHUNK;
    kiss::Frame data = make_frame(kiss::Command::FileData);
    data.payload.insert(data.payload.end(), ev.transfer_id.bytes.begin(), ev.transfer_id.bytes.end());
    data.payload.insert(data.payload.end(), ev.data.begin() + static_cast<std::ptrdiff_t>(off),
                        ev.data.begin() + static_cast<std::ptrdiff_t>(off + n));
    out.push_back(std::move(data));
  }

  kiss::Frame done = make_frame(kiss::Command::FileComplete);
  done.payload.insert(done.payload.end(), ev.transfer_id.bytes.begin(), ev.transfer_id.bytes.end());
  out.push_back(std::move(done));
  return true;
}

// ---------- upload ----------

// -----------------------------------------------------------------------------
// start()
// POLICY: one upload at a time; a second FILE_START is refused without reply.
// OUT:    metadata block waits in `pending` so it leads fragment 0.
// -----------------------------------------------------------------------------
TransferError FileBridge::start(const kiss::Frame& frame, std::vector<kiss::Frame>& replies) {
  if (upload_.active) return TransferError::DuplicateTransferStart;

  FileOffer offer;
  if (!parse_file_offer(frame.payload.data(), frame.payload.size(), offer)) {
    return TransferError::Malformed;
  }

  Upload up;
  FileMetadata meta;
  meta.filename = offer.filename;
  meta.size     = offer.size;
  encode_metadata(meta, up.pending);
  if (fragment_count(up.pending.size() + offer.size, node_.config().fragment_size) > MAX_FRAGMENTS) {
    return TransferError::TooLarge;
  }

  up.active      = true;
  up.destination = offer.destination;
  up.id          = make_transfer_id(frame.payload.data(), frame.payload.size(), node_.now());
  upload_ = std::move(up);

  replies.push_back(make_frame(kiss::Command::FileReady));
  return TransferError::None;
}

TransferError FileBridge::chunk(const kiss::Frame& frame, std::vector<kiss::Frame>& replies) {
  if (!upload_.active) return TransferError::Cancelled;
  if (frame.payload.size() < 2) return TransferError::Malformed;

  const uint16_t seq = static_cast<uint16_t>((frame.payload[0] << 8) | frame.payload[1]);
  kiss::Frame ack = make_frame(kiss::Command::ChunkAck);
  put_u16(ack.payload, seq);

  if (upload_.any_chunk && seq < upload_.next_seq) {  // host retransmit: ack only
    replies.push_back(std::move(ack));
    return TransferError::None;
  }

  upload_.pending.insert(upload_.pending.end(), frame.payload.begin() + 2, frame.payload.end());
  const size_t frag_size = node_.config().fragment_size;
  while (upload_.pending.size() >= frag_size) {
    if (!flush(0)) {
      upload_ = Upload{};
      return TransferError::TooLarge;
    }
  }

  upload_.any_chunk = true;
  upload_.next_seq  = static_cast<uint16_t>(seq + 1);
  replies.push_back(std::move(ack));
  return TransferError::None;
}

// -----------------------------------------------------------------------------
// finish()
// OUT:    any partial fragment goes out, then an empty FINAL marker at the
//         last index. The receiver still needs that index's data to finish.
// -----------------------------------------------------------------------------
TransferError FileBridge::finish() {
  if (!upload_.active) return TransferError::Cancelled;

  if (!upload_.pending.empty() && !flush(0)) {
    upload_ = Upload{};
    return TransferError::TooLarge;
  }

  const uint8_t last = static_cast<uint8_t>(upload_.next_index ? upload_.next_index - 1 : 0);
  std::vector<uint8_t> marker;
  build_fragment(upload_.id, last, FRAG_FINAL, nullptr, 0, marker);
  if (node_.send_data(upload_.destination, marker.data(), marker.size(), FLAG_FRAGMENTED) ==
      SendResult::Failed) {
    ++send_failures_;
  }

  upload_ = Upload{};
  return TransferError::None;
}

bool FileBridge::flush(uint8_t flags) {
  if (upload_.next_index >= MAX_FRAGMENTS) return false;

  const size_t frag_size = node_.config().fragment_size;
  const size_t n = upload_.pending.size() < frag_size ? upload_.pending.size() : frag_size;
  if (upload_.next_index == 0) flags |= FRAG_META;

  std::vector<uint8_t> fragment;
  build_fragment(upload_.id, static_cast<uint8_t>(upload_.next_index), flags,
                 upload_.pending.data(), n, fragment);
  if (node_.send_data(upload_.destination, fragment.data(), fragment.size(), FLAG_FRAGMENTED) ==
      SendResult::Failed) {
    ++send_failures_;                              // receiver times out; host already has its ack
  }

  upload_.pending.erase(upload_.pending.begin(),
                        upload_.pending.begin() + static_cast<std::ptrdiff_t>(n));
  ++upload_.next_index;
  return true;
}

} // namespace mycorrhiza
