// -----------------------------------------------------------------------------
// kiss.cpp - KISS encoder, decoder state machine, text/frame demultiplexer
//
// API & frame layout: see include/mycorrhiza/kiss.hpp
// Tests: tests/test_kiss.cpp
// -----------------------------------------------------------------------------
#include "mycorrhiza/kiss.hpp"

namespace mycorrhiza {
namespace kiss {

const char* to_string(Error e) {
  switch (e) {
    case Error::None:           return "none";
    case Error::UnknownCommand: return "unknown_command";
    case Error::BadEscape:      return "bad_escape";
    case Error::Overflow:       return "overflow";
  }
  return "unknown";
}

const char* to_string(Command c) {
  switch (c) {
    case Command::FileInfo:     return "FILE_INFO";
    case Command::FileStart:    return "FILE_START";
    case Command::FileChunk:    return "FILE_CHUNK";
    case Command::FileEnd:      return "FILE_END";
    case Command::FileReady:    return "FILE_READY";
    case Command::ChunkAck:     return "CHUNK_ACK";
    case Command::FileReceived: return "FILE_RECEIVED";
    case Command::FileData:     return "FILE_DATA";
    case Command::FileComplete: return "FILE_COMPLETE";
  }
  return "UNKNOWN";
}

namespace {

inline void put_escaped(uint8_t b, std::vector<uint8_t>& out) {
  if (b == FEND) {
    out.push_back(FESC);
    out.push_back(TFEND);
  } else if (b == FESC) {
    out.push_back(FESC);
    out.push_back(TFESC);
  } else {
    out.push_back(b);
  }
}

} // namespace

void encode(uint8_t command, const uint8_t* payload, size_t n, std::vector<uint8_t>& out) {
  out.clear();
  out.reserve(2 * (n + 1) + 2);     // worst case: everything escapes
  out.push_back(FEND);
  put_escaped(command, out);
  for (size_t i = 0; i < n; ++i) put_escaped(payload[i], out);
  out.push_back(FEND);
}

// -----------------------------------------------------------------------------
// Decoder::feed()
// POLICY:
//   - FEND always ends the current frame (if non-empty) and opens the next.
//   - Right after a frame closed, a command byte opens a frame without its
//     own FEND; anything else drops back to IDLE.
//   - Bad escape or overflow drops the frame and returns to IDLE; the next
//     FEND resynchronizes.
// -----------------------------------------------------------------------------
Feed Decoder::feed(uint8_t b, Frame& frame, Error& error) {
  error = Error::None;

  if (b == FEND) {
    if (state == State::InFrame && !buf.empty()) {
      frame.command = buf[0];
      frame.payload.assign(buf.begin() + 1, buf.end());
      buf.clear();
      state = State::Closed;
      if (!is_known(frame.command)) error = Error::UnknownCommand;
      return Feed::Frame;
    }
    if (state == State::Escaped) {          // FESC FEND: broken frame
      buf.clear();
      state = State::Idle;
      error = Error::BadEscape;
      return Feed::Error;
    }
    buf.clear();                            // opening delimiter or separator
    state = State::InFrame;
    return Feed::Nothing;
  }

  switch (state) {
    case State::Idle:
      return Feed::Nothing;                 // not ours: text or noise

    case State::Closed:
      if (!is_known(b)) {
        state = State::Idle;
        return Feed::Nothing;
      }
      buf.clear();                          // shared delimiter: b opens a frame
      state = State::InFrame;
      break;

    case State::Escaped:
      if (b == TFEND)      b = FEND;
      else if (b == TFESC) b = FESC;
      else {
        buf.clear();
        state = State::Idle;
        error = Error::BadEscape;
        return Feed::Error;
      }
      state = State::InFrame;
      break;

    case State::InFrame:
      if (b == FESC) {
        state = State::Escaped;
        return Feed::Nothing;
      }
      break;
  }

  if (buf.size() >= FRAME_MAX) {
    buf.clear();
    state = State::Idle;
    error = Error::Overflow;
    return Feed::Error;
  }
  buf.push_back(b);
  return Feed::Nothing;
}

// -----------------------------------------------------------------------------
// StreamDemux::feed()
// PRE:    one byte of the raw serial stream.
// POLICY: the decoder owns every byte from an opening FEND to the closing
//         FEND; all other bytes are line text.
// -----------------------------------------------------------------------------
bool StreamDemux::feed(uint8_t b, Item& out) {
  if (decoder_.claims(b)) {
    Error err = Error::None;
    const Feed r = decoder_.feed(b, out.frame, err);
    if (r == Feed::Frame) {
      out.kind  = Item::Kind::Frame;
      out.error = err;
      return true;
    }
    if (r == Feed::Error) {
      out.kind  = Item::Kind::Error;
      out.error = err;
      return true;
    }
    return false;
  }
  if (decoder_.state == Decoder::State::Closed) decoder_.state = Decoder::State::Idle;

  if (b == '\n') {
    if (discarding_) {
      discarding_ = false;
      return false;
    }
    if (!line_.empty() && line_.back() == '\r') line_.pop_back();
    if (line_.empty()) return false;
    out.kind  = Item::Kind::Line;
    out.line  = line_;
    out.error = Error::None;
    line_.clear();
    return true;
  }

  if (discarding_) return false;
  if (line_.full()) {
    line_.clear();
    discarding_ = true;
    out.kind  = Item::Kind::Error;
    out.error = Error::Overflow;
    return true;
  }
  line_.push_back(static_cast<char>(b));
  return false;
}

} // namespace kiss
} // namespace mycorrhiza
