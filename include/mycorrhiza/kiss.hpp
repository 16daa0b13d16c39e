/**
 * @file kiss.hpp
 * @brief KISS framing for the host <-> device serial channel, plus a text/frame demultiplexer.
 *
 * @details
 * OVERVIEW
 * --------
 * The serial link between a host and a node carries two things at once:
 * human-readable console lines (`!info`, `!send ...`) and binary file-transfer
 * commands. Binary payloads travel inside KISS frames so any byte value,
 * newlines included, survives; everything outside a frame is text.
 *
 * FRAME
 * -----
 * ```
 *   FEND | command | escaped payload ... | FEND
 *   0xC0      1 byte                       0xC0
 * ```
 * Inside the payload:
 *   FEND (0xC0) -> FESC TFEND (0xDB 0xDC)
 *   FESC (0xDB) -> FESC TFESC (0xDB 0xDD)
 *
 * DECODER
 * -------
 * States: IDLE (between frames), CLOSED (a frame just ended), IN_FRAME,
 * ESCAPED. feed() takes one
 * byte at a time and never blocks, so it runs from a poll loop or a UART ISR.
 * - FEND FEND (nothing between) is a separator, not a frame.
 * - FESC followed by anything but TFEND/TFESC drops the frame (BadEscape);
 *   the decoder resynchronizes at the next FEND.
 * - A command byte outside 0x10..0x18 still yields the frame, flagged
 *   UnknownCommand, so the caller can log it.
 * - A frame longer than FRAME_MAX is dropped (Overflow).
 * - A closing FEND directly followed by a command byte also opens the next
 *   frame (shared delimiter). A frame cut short by a device reset then costs
 *   one bogus frame, not the frame behind it as well.
 *
 * COMMANDS
 * --------
 * | byte | name          | direction     | payload                                       |
 * |------|---------------|---------------|-----------------------------------------------|
 * | 0x10 | FILE_INFO     | host->device  | dest(16) name_len(1) name size(u32 BE)        |
 * | 0x11 | FILE_START    | host->device  | same as FILE_INFO                             |
 * | 0x12 | FILE_CHUNK    | host->device  | seq(u16 BE) data                              |
 * | 0x13 | FILE_END      | host->device  | empty                                         |
 * | 0x14 | FILE_READY    | device->host  | fragment_count(u16 BE) or empty               |
 * | 0x15 | CHUNK_ACK     | device->host  | seq(u16 BE)                                   |
 * | 0x16 | FILE_RECEIVED | device->host  | tid(16) sender(16) name_len(1) name size(u32) |
 * | 0x17 | FILE_DATA     | device->host  | tid(16) data(<=250)                           |
 * | 0x18 | FILE_COMPLETE | device->host  | tid(16)                                       |
 *
 * EXAMPLE
 * -------
 * @code
 *   mycorrhiza::kiss::StreamDemux demux;
 *   mycorrhiza::kiss::Item item;
 *   for (uint8_t b : incoming) {
 *     if (!demux.feed(b, item)) continue;
 *     if (item.kind == Item::Kind::Line)  console.handle(item.line);
 *     if (item.kind == Item::Kind::Frame) bridge.on_frame(item.frame);
 *   }
 * @endcode
 */
#ifndef MYCORRHIZA_KISS_HPP
#define MYCORRHIZA_KISS_HPP

#include <vector>
#include <stddef.h>
#include <stdint.h>
#include "etl/string.h"

namespace mycorrhiza {
namespace kiss {

static constexpr uint8_t FEND  = 0xC0;  ///< frame delimiter
static constexpr uint8_t FESC  = 0xDB;  ///< escape introducer
static constexpr uint8_t TFEND = 0xDC;  ///< escaped FEND
static constexpr uint8_t TFESC = 0xDD;  ///< escaped FESC

static constexpr size_t FRAME_MAX = 1024;  ///< command + unescaped payload
static constexpr size_t LINE_MAX  = 256;   ///< console line, terminator excluded

enum class Command : uint8_t {
  FileInfo     = 0x10,
  FileStart    = 0x11,
  FileChunk    = 0x12,
  FileEnd      = 0x13,
  FileReady    = 0x14,
  ChunkAck     = 0x15,
  FileReceived = 0x16,
  FileData     = 0x17,
  FileComplete = 0x18
};

enum class Error : uint8_t {
  None = 0,
  UnknownCommand,
  BadEscape,
  Overflow
};

inline bool is_known(uint8_t command) { return command >= 0x10 && command <= 0x18; }

const char* to_string(Error e);
const char* to_string(Command c);

struct Frame {
  uint8_t              command{0};
  std::vector<uint8_t> payload;
};

/**
 * @brief Encode one frame; @p out is cleared first.
 * Reserves the worst case (every byte escaped) up front.
 */
void encode(uint8_t command, const uint8_t* payload, size_t n, std::vector<uint8_t>& out);

inline void encode(Command command, const uint8_t* payload, size_t n, std::vector<uint8_t>& out) {
  encode(static_cast<uint8_t>(command), payload, n, out);
}

/// What one fed byte produced.
enum class Feed : uint8_t {
  Nothing,  ///< byte consumed, no event
  Frame,    ///< @c frame holds a complete frame (error may be UnknownCommand)
  Error     ///< a frame was dropped; @c error says why
};

/**
 * @brief Byte-at-a-time KISS decoder.
 */
struct Decoder {
  enum class State : uint8_t { Idle, Closed, InFrame, Escaped };

  State                state = State::Idle;
  std::vector<uint8_t> buf;              ///< command byte + payload so far

  /**
   * @param b      next byte from the stream
   * @param frame  receives the frame on Feed::Frame
   * @param error  set on Feed::Error, and to UnknownCommand alongside Feed::Frame
   */
  Feed feed(uint8_t b, Frame& frame, Error& error);

  /// True while bytes belong to a frame (IN_FRAME or ESCAPED).
  bool in_frame() const { return state == State::InFrame || state == State::Escaped; }

  /// Would @p b be consumed as frame data rather than line text?
  bool claims(uint8_t b) const {
    return b == FEND || in_frame() || (state == State::Closed && is_known(b));
  }

  void reset() { state = State::Idle; buf.clear(); }
};

/// One demultiplexed unit of the serial stream.
struct Item {
  enum class Kind : uint8_t { Line, Frame, Error };
  Kind                  kind{Kind::Line};
  etl::string<LINE_MAX> line;            ///< Kind::Line, without "\r\n"
  Frame                 frame;           ///< Kind::Frame
  Error                 error{Error::None};
};

/**
 * @brief Splits a serial byte stream into text lines and KISS frames.
 *
 * Bytes outside frames accumulate into a line until '\n'; a trailing '\r' is
 * stripped and empty lines are skipped. A line longer than LINE_MAX is
 * discarded up to its terminator and reported once as Overflow.
 */
class StreamDemux {
public:
  /// @return true when @p out holds a new item.
  bool feed(uint8_t b, Item& out);

  void reset() { decoder_.reset(); line_.clear(); discarding_ = false; }

private:
  Decoder               decoder_;
  etl::string<LINE_MAX> line_;
  bool                  discarding_{false};
};

} // namespace kiss
} // namespace mycorrhiza

#endif // MYCORRHIZA_KISS_HPP
