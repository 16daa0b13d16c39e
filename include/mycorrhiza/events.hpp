/**
 * @file events.hpp
 * @brief Drop reasons and the client-facing event record produced by a Node.
 *
 * @details
 * The Node never calls back into the application. Everything a client may
 * care about (a delivered payload, a new peer, transfer progress, a failed
 * send) is queued as an Event and drained with Node::get_event().
 *
 * Field use by kind:
 * | kind             | fields                                                        |
 * |------------------|---------------------------------------------------------------|
 * | DataDelivered    | peer (+peer_known), data, interface_id, hop_count              |
 * | PeerDiscovered   | peer, interface_id, hop_count                                  |
 * | TransferProgress | transfer_id, peer, received, expected (0 = unknown)            |
 * | TransferComplete | transfer_id, peer, data (body), has_meta + meta                |
 * | TransferFailed   | transfer_id, peer, error, received, expected                   |
 * | DeliveryFailed   | peer (destination), reason                                     |
 */
#ifndef MYCORRHIZA_EVENTS_HPP
#define MYCORRHIZA_EVENTS_HPP

#include <vector>
#include <stdint.h>
#include "mycorrhiza/address.hpp"
#include "mycorrhiza/fragment.hpp"
#include "mycorrhiza/transfer_manager.hpp"

namespace mycorrhiza {

enum class DropReason : uint8_t {
  None = 0,
  TtlExhausted,
  NoRoute,
  LoopAvoided,
  HopLimit,
  Duplicate,
  Malformed,
  BadAnnounce,
  BadSignature
};

static constexpr size_t DROP_REASON_COUNT = 9;

const char* to_string(DropReason r);

enum class EventKind : uint8_t {
  DataDelivered,
  PeerDiscovered,
  TransferProgress,
  TransferComplete,
  TransferFailed,
  DeliveryFailed
};

const char* to_string(EventKind k);

struct Event {
  EventKind     kind{EventKind::DataDelivered};
  Address       peer{};               ///< sender, discovered peer, or failed destination
  bool          peer_known{false};    ///< peer was established (signature or announce)
  TransferId    transfer_id{};
  uint16_t      received{0};
  uint16_t      expected{0};
  TransferError error{TransferError::None};
  DropReason    reason{DropReason::None};
  uint8_t       interface_id{0};
  uint8_t       hop_count{0};
  bool          has_meta{false};
  FileMetadata  meta{};
  std::vector<uint8_t> data;
};

} // namespace mycorrhiza

#endif // MYCORRHIZA_EVENTS_HPP
