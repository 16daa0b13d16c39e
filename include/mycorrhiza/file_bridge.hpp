/**
 * @file file_bridge.hpp
 * @brief Device side of the serial file protocol: KISS frames <-> Node transfers.
 *
 * @details
 * Upload (host -> device -> mesh):
 * ```
 *   FILE_INFO  dest|name_len|name|size   -> FILE_READY fragment_count(u16)
 *   FILE_START dest|name_len|name|size   -> FILE_READY (empty)
 *   FILE_CHUNK seq(u16)|data             -> fragments via Node::send_data, CHUNK_ACK seq
 *   FILE_END                             -> remainder + empty FINAL marker
 * ```
 * Chunk bytes are packed into full fragments (metadata block first); a
 * partial fragment waits for the next chunk or FILE_END. A chunk whose seq
 * was already processed is acknowledged again and not resent.
 *
 * Download (mesh -> device -> host), from a TransferComplete event:
 * ```
 *   FILE_RECEIVED transfer_id|sender|name_len|name|size
 *   FILE_DATA     transfer_id|<=250 bytes        (repeated)
 *   FILE_COMPLETE transfer_id
 * ```
 *
 * The bridge never prints; on_frame() returns the error for the caller to log.
 */
#ifndef MYCORRHIZA_FILE_BRIDGE_HPP
#define MYCORRHIZA_FILE_BRIDGE_HPP

#include <vector>
#include <stdint.h>
#include "mycorrhiza/address.hpp"
#include "mycorrhiza/events.hpp"
#include "mycorrhiza/fragment.hpp"
#include "mycorrhiza/kiss.hpp"
#include "mycorrhiza/node.hpp"
#include "mycorrhiza/transfer_manager.hpp"

namespace mycorrhiza {

static constexpr size_t FILE_DATA_CHUNK = 250;   ///< bytes per FILE_DATA frame

/// Parsed FILE_INFO / FILE_START payload.
struct FileOffer {
  Address  destination{};
  FileName filename;
  uint32_t size{0};
};

/**
 * @brief Parse `dest(16) | name_len(u8) | name | size(u32 BE)`.
 * @retval false  shorter than its own length fields claim
 */
bool parse_file_offer(const uint8_t* p, size_t n, FileOffer& out);

/// Build the FILE_INFO / FILE_START payload (host side uses this too).
void build_file_offer(const FileOffer& offer, std::vector<uint8_t>& out);

class FileBridge {
public:
  explicit FileBridge(Node& node) : node_(node) {}

  /**
   * @brief Handle one host -> device frame.
   *
   * @param replies  frames to write back to the host (appended)
   * @return TransferError::None, or why the frame was refused
   *         (Malformed, DuplicateTransferStart, TooLarge, Cancelled when no
   *         upload is open)
   */
  TransferError on_frame(const kiss::Frame& frame, std::vector<kiss::Frame>& replies);

  /**
   * @brief Turn a TransferComplete event into the download frame sequence.
   * @return false for any other event kind (nothing appended)
   */
  bool on_event(const Event& ev, std::vector<kiss::Frame>& out) const;

  bool              uploading() const { return upload_.active; }
  const TransferId& upload_id() const { return upload_.id; }
  uint16_t          fragments_sent() const { return upload_.next_index; }
  uint32_t          send_failures() const { return send_failures_; }  ///< fragments no link took

private:
  struct Upload {
    bool       active{false};
    TransferId id{};
    Address    destination{};
    std::vector<uint8_t> pending;   ///< bytes of the fragment being filled
    uint16_t   next_index{0};
    uint16_t   next_seq{0};
    bool       any_chunk{false};
  };

  TransferError start(const kiss::Frame& frame, std::vector<kiss::Frame>& replies);
  TransferError chunk(const kiss::Frame& frame, std::vector<kiss::Frame>& replies);
  TransferError finish();
  bool          flush(uint8_t flags);

  Node&    node_;
  Upload   upload_;
  uint32_t send_failures_{0};
};

} // namespace mycorrhiza

#endif // MYCORRHIZA_FILE_BRIDGE_HPP
