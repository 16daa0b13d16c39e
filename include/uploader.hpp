#pragma once
/**
 * @file uploader.hpp
 * @brief Host side of the serial file protocol: push one file to a node for mesh delivery.
 *
 * @details
 * SEQUENCE
 * --------
 * ```
 *   host                                    device
 *   FILE_INFO  dest|name_len|name|size  ->
 *                                       <-  FILE_READY fragment_count
 *   FILE_START dest|name_len|name|size  ->
 *                                       <-  FILE_READY (empty)
 *   FILE_CHUNK seq|<=200 bytes          ->
 *                                       <-  CHUNK_ACK seq          (repeat)
 *   FILE_END                            ->
 * ```
 * Chunks go through a TransferSender: each chunk is resent after
 * `retransmit_ms` without its CHUNK_ACK, and a chunk that runs out of
 * retries abandons the upload (RetriesExhausted). FILE_END is sent only
 * after every chunk was acknowledged.
 *
 * Console lines that arrive in between (`MSG:...`, `PEER:...`) are handed
 * to the line handler, if one is set, and otherwise dropped.
 *
 * The uploader never opens or closes the port; the caller owns @c fd and
 * the StreamDemux, so it can keep reading the same stream afterwards.
 */

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "mycorrhiza/address.hpp"
#include "mycorrhiza/kiss.hpp"
#include "mycorrhiza/transfer_manager.hpp"

namespace mycorrhiza {

struct UploadOptions {
  uint32_t retransmit_ms{3000};
  uint8_t  max_retries{5};
  uint16_t window{1};               ///< chunks in flight; the firmware acks in order
  int      reply_timeout_ms{3000};  ///< wait for each FILE_READY
};

struct UploadResult {
  TransferError error{TransferError::None};
  bool     io_error{false};         ///< a write to the port failed
  uint16_t fragment_count{0};       ///< as announced by FILE_READY
  size_t   chunks{0};
  size_t   chunk_writes{0};         ///< chunks + retransmissions

  bool ok() const { return error == TransferError::None && !io_error; }
};

class Uploader {
public:
  static constexpr size_t CHUNK_SIZE = 200;

  using LineHandler = std::function<void(const std::string&)>;

  Uploader(int fd, kiss::StreamDemux& demux, UploadOptions opts = {})
  : fd_(fd), demux_(demux), opts_(opts) {}

  void on_line(LineHandler h) { on_line_ = std::move(h); }

  /**
   * @brief Run the whole sequence for one file.
   *
   * @return error TooLarge (name over 255 bytes, or more fragments than a
   *         transfer can hold), TransferTimeout (no FILE_READY),
   *         RetriesExhausted, or Cancelled together with io_error
   */
  UploadResult send(const Address& destination, const std::string& filename,
                    const std::vector<uint8_t>& data);

private:
  bool wait_ready(std::vector<uint8_t>& payload);
  void dispatch_line(const kiss::Item& item);

  int                fd_;
  kiss::StreamDemux& demux_;
  UploadOptions      opts_;
  LineHandler        on_line_;
};

} // namespace mycorrhiza
