// -----------------------------------------------------------------------------
// transfer_manager.cpp - reassembly registry, fragment pool, ack-driven sender
//
// API & policy: see include/mycorrhiza/transfer_manager.hpp
// Tests: tests/test_transfer_manager.cpp
// -----------------------------------------------------------------------------
#include "mycorrhiza/transfer_manager.hpp"

#include <string.h>

namespace mycorrhiza {

const char* to_string(TransferError e) {
  switch (e) {
    case TransferError::None:                   return "none";
    case TransferError::TransferTimeout:        return "transfer_timeout";
    case TransferError::IncompleteTransfer:     return "incomplete_transfer";
    case TransferError::DuplicateTransferStart: return "duplicate_transfer_start";
    case TransferError::RetriesExhausted:       return "retries_exhausted";
    case TransferError::Cancelled:              return "cancelled";
    case TransferError::BufferFull:             return "buffer_full";
    case TransferError::TooLarge:               return "too_large";
    case TransferError::Malformed:              return "malformed";
  }
  return "unknown";
}

// ---------- Reassembler: public ----------

Reassembler::Reassembler(size_t capacity, uint32_t timeout_ms)
: timeout_ms_(timeout_ms) {
  transfers_.set_capacity(capacity);
  set_slot_capacity(Profile::FRAGMENT_SLOTS);
}

void Reassembler::set_slot_capacity(size_t c) {
  if (c == 0) c = 1;
  if (c > Profile::FRAGMENT_SLOTS) c = Profile::FRAGMENT_SLOTS;
  transfers_.clear();
  free_.clear();
  for (size_t i = c; i > 0; --i) {
    free_.push_back(static_cast<uint16_t>(i - 1));   // slot 0 handed out first
  }
  slot_capacity_ = c;
}

void Reassembler::set_capacity(size_t c) {
  if (c == 0) c = 1;
  while (transfers_.size() > c) {
    const TransferId oldest = *transfers_.oldest_key();
    release(oldest);                                  // frees pool slots first
  }
  transfers_.set_capacity(c);
}

TransferError Reassembler::begin(const TransferId& id, uint32_t now_ms, const Address& sender) {
  if (transfers_.find(id)) return TransferError::DuplicateTransferStart;
  FragmentOutcome ignored;
  open(id, now_ms, sender, ignored);
  return TransferError::None;
}

// -----------------------------------------------------------------------------
// on_fragment()
// PRE:    payload is the DATA packet payload of a FRAGMENTED packet.
// POLICY:
//   - malformed header or data > 200           -> Rejected(Malformed)
//   - index beyond a known final, or a FINAL
//     below an index already stored             -> Rejected(Malformed)
//   - marker (empty FINAL) only fixes the final index; the data for that
//     index must still arrive on its own
//   - no pool slot and no other transfer to evict -> Rejected(BufferFull)
// OUT:    Stored / Incomplete / Complete; Complete destroys the state.
// -----------------------------------------------------------------------------
FragmentOutcome Reassembler::on_fragment(const uint8_t* payload, size_t n, uint32_t now_ms,
                                         const Address& sender, std::vector<uint8_t>& completed) {
  FragmentOutcome o;
  FragmentView f;
  if (!parse_fragment(payload, n, f)) {
    o.error = TransferError::Malformed;
    return o;
  }
  const TransferId id = f.transfer_id;
  o.progress.id = id;

  Inbound* t = transfers_.touch(id);
  if (!t) t = open(id, now_ms, sender, o);
  t->last_activity_ms = now_ms;
  if (t->sender.is_zero() && !sender.is_zero()) t->sender = sender;

  if (t->final_index >= 0 && f.index > t->final_index) {
    o.error = TransferError::Malformed;
    o.progress = snapshot(id, *t);
    return o;
  }
  if (f.is_final()) {
    for (size_t i = static_cast<size_t>(f.index) + 1; i < MAX_FRAGMENTS; ++i) {
      if (t->slot[i] != NO_SLOT) {
        o.error = TransferError::Malformed;
        o.progress = snapshot(id, *t);
        return o;
      }
    }
  }

  if (!f.is_marker()) {
    uint16_t& s = t->slot[f.index];
    if (s == NO_SLOT) {
      uint16_t fresh = NO_SLOT;
      if (!take_slot(id, fresh, o)) {
        o.error = TransferError::BufferFull;
        o.progress = snapshot(id, *t);
        return o;
      }
      s = fresh;
      ++t->received;
    }
    memcpy(pool_[s].data, f.data, f.size);       // duplicates overwrite idempotently
    pool_[s].size = static_cast<uint8_t>(f.size);
  }
  if (f.is_final()) t->final_index = f.index;
  if (f.index == 0 && f.has_meta()) t->meta = true;

  o.progress = snapshot(id, *t);
  if (t->final_index < 0) {
    o.kind = FragmentOutcome::Kind::Stored;
    return o;
  }
  if (!complete(*t)) {
    o.kind  = FragmentOutcome::Kind::Incomplete;
    o.error = TransferError::IncompleteTransfer;
    return o;
  }

  assemble(*t, completed);
  o.kind     = FragmentOutcome::Kind::Complete;
  o.has_meta = t->meta;
  release(id);
  return o;
}

bool Reassembler::cancel(const TransferId& id) {
  if (!transfers_.find(id)) return false;
  release(id);
  return true;
}

std::optional<TransferProgress> Reassembler::progress(const TransferId& id) const {
  if (const Inbound* t = transfers_.find(id)) return snapshot(id, *t);
  return std::nullopt;
}

// ---------- Reassembler: private ----------

Reassembler::Inbound* Reassembler::open(const TransferId& id, uint32_t now_ms,
                                        const Address& sender, FragmentOutcome& outcome) {
  if (transfers_.size() >= transfers_.capacity()) {
    const TransferId oldest = *transfers_.oldest_key();
    outcome.evicted          = true;
    outcome.evicted_id       = oldest;
    outcome.evicted_progress = snapshot(oldest, *transfers_.find(oldest));
    release(oldest);
  }
  Inbound fresh;
  fresh.sender = sender;
  fresh.last_activity_ms = now_ms;
  return transfers_.insert(id, fresh);
}

bool Reassembler::take_slot(const TransferId& owner, uint16_t& out, FragmentOutcome& outcome) {
  if (free_.empty()) {
    const TransferId* victim = nullptr;
    transfers_.for_each([&](const TransferId& id, const Inbound&) {
      if (!victim && id != owner) victim = &id;       // least recently active first
    });
    if (!victim) return false;
    const TransferId v = *victim;
    outcome.evicted          = true;
    outcome.evicted_id       = v;
    outcome.evicted_progress = snapshot(v, *transfers_.find(v));
    release(v);
    if (free_.empty()) return false;
  }
  out = free_.back();
  free_.pop_back();
  return true;
}

void Reassembler::release(const TransferId& id) {
  const Inbound* t = transfers_.find(id);
  if (!t) return;
  for (uint16_t s : t->slot) {
    if (s != NO_SLOT) free_.push_back(s);
  }
  transfers_.erase(id);
}

bool Reassembler::complete(const Inbound& t) const {
  if (t.final_index < 0) return false;
  for (int i = 0; i <= t.final_index; ++i) {
    if (t.slot[static_cast<size_t>(i)] == NO_SLOT) return false;
  }
  return true;
}

void Reassembler::assemble(const Inbound& t, std::vector<uint8_t>& out) const {
  out.clear();
  out.reserve(static_cast<size_t>(t.final_index + 1) * FRAGMENT_DATA_MAX);
  for (int i = 0; i <= t.final_index; ++i) {
    const Slot& s = pool_[t.slot[static_cast<size_t>(i)]];
    out.insert(out.end(), s.data, s.data + s.size);
  }
}

TransferProgress Reassembler::snapshot(const TransferId& id, const Inbound& t) {
  TransferProgress p;
  p.id       = id;
  p.sender   = t.sender;
  p.received = t.received;
  p.expected = t.final_index >= 0 ? static_cast<uint16_t>(t.final_index + 1) : 0;
  return p;
}

// ---------- TransferSender ----------

TransferSender::TransferSender(uint32_t retransmit_timeout_ms, uint8_t max_retries, uint16_t window)
: retransmit_ms_(retransmit_timeout_ms),
  max_retries_(max_retries),
  window_(window ? window : 1) {}

bool TransferSender::start(const TransferId& id, std::vector<std::vector<uint8_t>> items) {
  if (active_) return false;
  if (items.empty() || items.size() > MAX_FRAGMENTS) return false;
  items_  = std::move(items);
  track_.assign(items_.size(), Track{});
  id_     = id;
  acked_  = 0;
  error_  = TransferError::None;
  active_ = true;
  return true;
}

// -----------------------------------------------------------------------------
// next_to_send()
// POLICY: lowest index first. An unsent item goes out only while fewer than
//         `window` items are in flight; a sent item is due again once its
//         retransmit timeout elapsed. The item that would exceed max_retries
//         resends fails the whole transfer.
// -----------------------------------------------------------------------------
std::optional<uint16_t> TransferSender::next_to_send(uint32_t now_ms) {
  if (!active_) return std::nullopt;

  size_t in_flight = 0;
  for (const Track& t : track_) {
    if (!t.acked && t.attempts > 0) ++in_flight;
  }

  for (size_t i = 0; i < track_.size(); ++i) {
    Track& t = track_[i];
    if (t.acked) continue;

    if (t.attempts == 0) {
      if (in_flight >= window_) continue;
      t.attempts   = 1;
      t.sent_at_ms = now_ms;
      return static_cast<uint16_t>(i);
    }

    if (static_cast<uint32_t>(now_ms - t.sent_at_ms) < retransmit_ms_) continue;
    if (t.attempts > max_retries_) {
      fail(TransferError::RetriesExhausted);
      return std::nullopt;
    }
    ++t.attempts;
    t.sent_at_ms = now_ms;
    return static_cast<uint16_t>(i);
  }
  return std::nullopt;
}

bool TransferSender::acknowledge(uint16_t index) {
  if (!active_ || index >= track_.size()) return false;
  Track& t = track_[index];
  if (!t.acked) {
    t.acked = true;
    ++acked_;
  }
  if (acked_ == track_.size()) active_ = false;
  return true;
}

void TransferSender::cancel() {
  fail(TransferError::Cancelled);
}

void TransferSender::fail(TransferError e) {
  error_  = e;
  active_ = false;
  acked_  = 0;
  items_.clear();
  track_.clear();
}

} // namespace mycorrhiza
