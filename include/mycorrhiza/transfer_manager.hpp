/**
 * @file transfer_manager.hpp
 * @brief Inbound reassembly and outbound acknowledged sending of file transfers.
 *
 * @details
 * ## Reassembler (receive side)
 * ```
 *   fragment ─► parse ─► find/create state ─► store by index ─► complete?
 *                 │            │                    │              │
 *             Malformed    evict LRA           pool slot       concat 0..final
 *                         (registry full)    (shared pool)      + destroy
 * ```
 * - One state per transfer id, kept in an LruArena ordered by last activity.
 * - Fragment data lives in a fixed pool of 200-byte slots shared by all
 *   transfers. A full pool evicts the least recently active *other* transfer;
 *   if the current one is the only user, the fragment is rejected (BufferFull).
 * - Duplicates overwrite idempotently and do not change the received count.
 * - Completion is signalled only by FINAL: once the final index is known and
 *   every index 0..final holds data, the stream is concatenated and the state
 *   destroyed. Known final with gaps reports IncompleteTransfer and keeps
 *   waiting until the gaps fill or the inactivity timeout fires.
 *
 * ## TransferSender (send side)
 * Holds the ordered payloads of one outbound transfer and decides what to
 * (re)send: unsent items first, then items whose retransmit timeout elapsed,
 * never more than @c window unacknowledged at once. An item that would need
 * more than @c max_retries resends abandons the transfer (RetriesExhausted).
 * cancel() drops everything at once; nothing is sent afterwards.
 *
 * All time arguments are the caller's uint32 millisecond clock; differences
 * are wrap-safe.
 */
#ifndef MYCORRHIZA_TRANSFER_MANAGER_HPP
#define MYCORRHIZA_TRANSFER_MANAGER_HPP

#include <array>
#include <optional>
#include <vector>
#include <stdint.h>
#include "etl/vector.h"
#include "mycorrhiza/address.hpp"
#include "mycorrhiza/fragment.hpp"
#include "mycorrhiza/lru_arena.hpp"
#include "mycorrhiza/profile.hpp"

namespace mycorrhiza {

enum class TransferError : uint8_t {
  None = 0,
  TransferTimeout,
  IncompleteTransfer,
  DuplicateTransferStart,
  RetriesExhausted,
  Cancelled,
  BufferFull,
  TooLarge,
  Malformed
};

const char* to_string(TransferError e);

/// Progress snapshot; expected is 0 until the final index is known.
struct TransferProgress {
  TransferId id{};
  Address    sender{};
  uint16_t   received{0};
  uint16_t   expected{0};
};

/// Result of Reassembler::on_fragment().
struct FragmentOutcome {
  enum class Kind : uint8_t {
    Stored,      ///< kept; transfer still open
    Complete,    ///< stream handed out, state destroyed
    Incomplete,  ///< final known, indices missing (error = IncompleteTransfer)
    Rejected     ///< not stored (error says why)
  };
  Kind             kind{Kind::Rejected};
  TransferError    error{TransferError::None};
  TransferProgress progress{};
  bool             has_meta{false};   ///< Complete only: stream starts with metadata
  bool             evicted{false};    ///< another transfer was dropped to make room
  TransferId       evicted_id{};
  TransferProgress evicted_progress{}; ///< the dropped transfer as it stood
};

class Reassembler {
public:
  static constexpr uint32_t TIMEOUT_MS_DEFAULT = 60u * 1000u;

  explicit Reassembler(size_t capacity = Profile::TRANSFER_SLOTS,
                       uint32_t timeout_ms = TIMEOUT_MS_DEFAULT);

  /**
   * @brief Open a transfer explicitly (FILE_START-style).
   * @retval TransferError::DuplicateTransferStart  a live state has this id
   */
  TransferError begin(const TransferId& id, uint32_t now_ms, const Address& sender = Address{});

  /**
   * @brief Process one fragment payload.
   *
   * @param payload    fragment bytes (header + data)
   * @param sender     originator if known (zero otherwise)
   * @param completed  receives the concatenated stream on Kind::Complete
   */
  FragmentOutcome on_fragment(const uint8_t* payload, size_t n, uint32_t now_ms,
                              const Address& sender, std::vector<uint8_t>& completed);

  /// Drop a transfer and free its slots. @return false if unknown.
  bool cancel(const TransferId& id);

  /**
   * @brief Destroy transfers idle longer than the timeout.
   * @param on_timeout  called as f(const TransferProgress&) for each one
   * @return number destroyed
   */
  template <typename F>
  size_t sweep(uint32_t now_ms, F on_timeout) {
    size_t removed = 0;
    for (;;) {
      const TransferId* stale = nullptr;
      transfers_.for_each([&](const TransferId& id, const Inbound& t) {
        if (!stale && static_cast<uint32_t>(now_ms - t.last_activity_ms) > timeout_ms_) stale = &id;
      });
      if (!stale) break;
      const TransferId id = *stale;
      if (auto p = progress(id)) on_timeout(*p);
      release(id);
      ++removed;
    }
    return removed;
  }

  std::optional<TransferProgress> progress(const TransferId& id) const;

  /// Visit open transfers, least recently active first.
  template <typename F>
  void for_each(F f) const {
    transfers_.for_each([&](const TransferId& id, const Inbound& t) { f(snapshot(id, t)); });
  }

  size_t active() const   { return transfers_.size(); }
  size_t capacity() const { return transfers_.capacity(); }
  void   set_capacity(size_t c);

  size_t free_slots() const { return free_.size(); }
  size_t slot_capacity() const { return slot_capacity_; }

  /**
   * @brief Limit the fragment pool to @p c slots, clamped to
   *        [1, Profile::FRAGMENT_SLOTS]. Open transfers are dropped.
   */
  void set_slot_capacity(size_t c);

  uint32_t timeout_ms() const { return timeout_ms_; }
  void set_timeout_ms(uint32_t v) { timeout_ms_ = v; }

private:
  static constexpr uint16_t NO_SLOT = 0xFFFF;

  struct Inbound {
    std::array<uint16_t, MAX_FRAGMENTS> slot;
    Address  sender{};
    uint32_t last_activity_ms{0};
    uint16_t received{0};
    int16_t  final_index{-1};
    bool     meta{false};

    Inbound() { slot.fill(NO_SLOT); }
  };

  struct Slot {
    uint8_t data[FRAGMENT_DATA_MAX];
    uint8_t size;
  };

  Inbound* open(const TransferId& id, uint32_t now_ms, const Address& sender,
                FragmentOutcome& outcome);
  bool take_slot(const TransferId& owner, uint16_t& out, FragmentOutcome& outcome);
  void release(const TransferId& id);
  bool complete(const Inbound& t) const;
  void assemble(const Inbound& t, std::vector<uint8_t>& out) const;
  static TransferProgress snapshot(const TransferId& id, const Inbound& t);

  LruArena<TransferId, Inbound, Profile::TRANSFER_SLOTS> transfers_;
  Slot pool_[Profile::FRAGMENT_SLOTS];
  etl::vector<uint16_t, Profile::FRAGMENT_SLOTS> free_;
  size_t   slot_capacity_{Profile::FRAGMENT_SLOTS};
  uint32_t timeout_ms_;
};

class TransferSender {
public:
  static constexpr uint32_t RETRANSMIT_MS_DEFAULT = 3000;
  static constexpr uint8_t  MAX_RETRIES_DEFAULT   = 5;

  explicit TransferSender(uint32_t retransmit_timeout_ms = RETRANSMIT_MS_DEFAULT,
                          uint8_t max_retries = MAX_RETRIES_DEFAULT,
                          uint16_t window = 1);

  /**
   * @brief Load a new transfer.
   * @retval false  one is already active, there are no items, or more than 256
   */
  bool start(const TransferId& id, std::vector<std::vector<uint8_t>> items);

  /**
   * @brief Index of the next item to put on the wire, marking it sent at @p now_ms.
   *
   * nullopt when nothing is due (window full, waiting for timeouts, done,
   * or failed). Check error() after a nullopt.
   */
  std::optional<uint16_t> next_to_send(uint32_t now_ms);

  const std::vector<uint8_t>& item(uint16_t index) const { return items_[index]; }

  /// Mark @p index delivered. @return false if out of range or not active.
  bool acknowledge(uint16_t index);

  /// Abandon now; releases the payloads. error() becomes Cancelled.
  void cancel();

  bool active() const   { return active_; }
  bool complete() const { return !items_.empty() && acked_ == items_.size(); }
  TransferError error() const { return error_; }
  const TransferId& id() const { return id_; }
  size_t total() const { return items_.size(); }
  size_t acked() const { return acked_; }

private:
  struct Track {
    bool     acked{false};
    uint8_t  attempts{0};
    uint32_t sent_at_ms{0};
  };

  void fail(TransferError e);

  std::vector<std::vector<uint8_t>> items_;
  std::vector<Track> track_;
  TransferId    id_{};
  uint32_t      retransmit_ms_;
  uint8_t       max_retries_;
  uint16_t      window_;
  size_t        acked_{0};
  bool          active_{false};
  TransferError error_{TransferError::None};
};

} // namespace mycorrhiza

#endif // MYCORRHIZA_TRANSFER_MANAGER_HPP
