// -----------------------------------------------------------------------------
// node.cpp - receive pipeline, forwarding, announce propagation, sending
//
// API & field descriptions:
//   see include/mycorrhiza/node.hpp
//
// Scenario tests:
//   tests/test_node_forwarding.cpp, tests/test_node_announce.cpp
//
// NOTE: the order of checks in on_receive() is part of the contract: decode,
// duplicate ring, announce handling, local delivery, then ttl / hop limit /
// route for forwarding.
// -----------------------------------------------------------------------------
#include "mycorrhiza/node.hpp"

#include <string.h>
#include <utility>

namespace mycorrhiza {

namespace {

constexpr size_t PAYLOAD_HASH_OFFSET = 22;   // within the encoded header

constexpr uint8_t CALLER_FLAGS = FLAG_ENCRYPTED | FLAG_PRIORITY | FLAG_FRAGMENTED;

uint8_t next_hop_count(uint8_t h) {
  return h == 0xFF ? h : static_cast<uint8_t>(h + 1);
}

} // namespace

const char* to_string(DropReason r) {
  switch (r) {
    case DropReason::None:         return "none";
    case DropReason::TtlExhausted: return "ttl_exhausted";
    case DropReason::NoRoute:      return "no_route";
    case DropReason::LoopAvoided:  return "loop_avoided";
    case DropReason::HopLimit:     return "hop_limit";
    case DropReason::Duplicate:    return "duplicate";
    case DropReason::Malformed:    return "malformed";
    case DropReason::BadAnnounce:  return "bad_announce";
    case DropReason::BadSignature: return "bad_signature";
  }
  return "unknown";
}

const char* to_string(EventKind k) {
  switch (k) {
    case EventKind::DataDelivered:    return "data";
    case EventKind::PeerDiscovered:   return "peer";
    case EventKind::TransferProgress: return "transfer_progress";
    case EventKind::TransferComplete: return "transfer_complete";
    case EventKind::TransferFailed:   return "transfer_failed";
    case EventKind::DeliveryFailed:   return "delivery_failed";
  }
  return "unknown";
}

const char* to_string(Action a) {
  switch (a) {
    case Action::DeliverLocal: return "deliver_local";
    case Action::Forward:      return "forward";
    case Action::Drop:         return "drop";
  }
  return "unknown";
}

const char* to_string(SendResult r) {
  switch (r) {
    case SendResult::Sent:      return "sent";
    case SendResult::Broadcast: return "broadcast";
    case SendResult::Failed:    return "failed";
  }
  return "unknown";
}

// ---------- public ----------

Node::Node(const IdentityBlob& identity, const NodeConfig& config, ICrypto* crypto)
: identity_(identity),
  address_(identity.address()),
  config_(config),
  crypto_(crypto) {
  config_.clamp();                                   // profile ceilings, wire limits
  routes_.set_capacity(config_.route_capacity);
  routes_.set_tie_break(config_.tie_break);
  identities_.set_capacity(config_.identity_capacity);
  identities_.set_horizon_ms(config_.identity_horizon_s * 1000u);
  reassembler_.set_capacity(config_.transfer_capacity);
  reassembler_.set_slot_capacity(config_.fragment_capacity);
  reassembler_.set_timeout_ms(config_.transfer_timeout_s * 1000u);
}

std::optional<uint8_t> Node::add_interface(transport::ILink& link, InterfaceMode mode,
                                           uint32_t bandwidth_bps) {
  if (interfaces_.full()) return std::nullopt;

  Interface itf;
  itf.link          = &link;
  itf.policy        = &policy_for(mode);
  itf.bandwidth_bps = bandwidth_bps ? bandwidth_bps : link.bandwidth_bps();
  itf.budget_bps    = announce_budget_bps(*itf.policy, itf.bandwidth_bps);

  const uint32_t cap_bits = itf.budget_bps > ANNOUNCE_MAX_BITS ? itf.budget_bps
                                                               : ANNOUNCE_MAX_BITS;
  itf.bucket_cap_mbits = static_cast<uint64_t>(cap_bits) * 1000u;
  itf.bucket_mbits     = itf.bucket_cap_mbits;       // starts full
  itf.last_refill_ms   = now_ms_;

  if (rx_buf_.size() < link.mtu()) rx_buf_.resize(link.mtu());

  interfaces_.push_back(std::move(itf));
  return static_cast<uint8_t>(interfaces_.size() - 1);
}

// -----------------------------------------------------------------------------
// on_receive()
// PRE:    interface_id names an attached interface.
// POLICY: malformed and duplicate packets never reach the routing logic;
//         ANNOUNCE is always handled here, whatever its destination, and is
//         remembered only once it has been validated.
// OUT:    exactly one verdict; drops are counted per reason.
// -----------------------------------------------------------------------------
Verdict Node::on_receive(uint8_t interface_id, const uint8_t* data, size_t n,
                         const transport::RxMeta& meta) {
  ++counters_.rx;
  if (interface_id >= interfaces_.size()) return drop(DropReason::Malformed);

  Packet packet;
  if (decode(data, n, packet) != DecodeError::None) {
    ++counters_.decode_errors;
    return drop(DropReason::Malformed);
  }

  if (seen_before(packet.header)) return drop(DropReason::Duplicate);

  if (packet.header.type == PacketType::Announce) {
    return handle_announce(interface_id, packet, meta);
  }
  remember(packet.header);

  if (packet.header.destination == address_) return deliver(interface_id, packet);

  return forward(interface_id, packet);
}

void Node::tick(uint32_t now_ms) {
  now_ms_ = now_ms;

  // 1) drain links (bounded per link so one chatty link cannot starve the rest)
  for (size_t i = 0; i < interfaces_.size(); ++i) {
    transport::ILink* link = interfaces_[i].link;
    link->poll();
    for (size_t k = 0; k < RECV_PER_TICK; ++k) {
      size_t len = 0;
      transport::RxMeta meta;
      const transport::RxResult r = link->recv(rx_buf_.data(), rx_buf_.size(), len, meta);
      if (r == transport::RxResult::None) break;
      if (r == transport::RxResult::Error) { ++counters_.rx_errors; continue; }
      on_receive(static_cast<uint8_t>(i), rx_buf_.data(), len, meta);
    }
  }

  // 2) own announces on interfaces whose interval elapsed (or never announced)
  if (config_.auto_announce) {
    std::vector<uint8_t> bytes;
    bool built = false;
    for (size_t i = 0; i < interfaces_.size(); ++i) {
      Interface& itf = interfaces_[i];
      const uint32_t interval = announce_interval_ms(itf);
      if (interval == 0) continue;
      if (itf.announced && static_cast<uint32_t>(now_ms_ - itf.last_announce_ms) < interval) continue;
      if (!built) {
        if (!build_announce(bytes)) break;
        built = true;
      }
      itf.announced = true;
      itf.last_announce_ms = now_ms_;
      if (transmit(static_cast<uint8_t>(i), bytes)) ++counters_.announces_sent;
    }
  }

  // 3) release queued re-broadcasts under each budget
  for (Interface& itf : interfaces_) drain_announces(itf);

  // 4) expiry
  routes_.sweep(now_ms_);
  identities_.evict_stale(now_ms_);
  reassembler_.sweep(now_ms_, [this](const TransferProgress& p) {
    transfer_failed(p, TransferError::TransferTimeout);
  });
  expire_seen();
}

size_t Node::announce() {
  std::vector<uint8_t> bytes;
  if (!build_announce(bytes)) return 0;

  size_t sent = 0;
  for (size_t i = 0; i < interfaces_.size(); ++i) {
    Interface& itf = interfaces_[i];
    if (itf.policy->announce_interval_s == 0) continue;   // mode never self-announces
    itf.announced = true;
    itf.last_announce_ms = now_ms_;
    if (transmit(static_cast<uint8_t>(i), bytes)) {
      ++sent;
      ++counters_.announces_sent;
    }
  }
  return sent;
}

// -----------------------------------------------------------------------------
// send_data()
// POLICY: route known -> its interface only; otherwise broadcast on every
//         interface when broadcast_fallback is on; otherwise DeliveryFailed.
// OUT:    the packet is remembered in the duplicate ring so an echo coming
//         back over another neighbour is not processed again.
// -----------------------------------------------------------------------------
SendResult Node::send_data(const Address& destination, const uint8_t* payload, size_t n,
                           uint8_t flags) {
  if (n > MAX_PAYLOAD) return SendResult::Failed;

  PacketHeader h;
  h.type        = PacketType::Data;
  h.destination = destination;
  h.ttl         = config_.default_ttl;
  h.flags       = static_cast<uint8_t>(flags & CALLER_FLAGS);

  const uint8_t* body = payload;
  size_t len = n;
  std::vector<uint8_t> sealed;
  if (h.is_encrypted()) {
    const std::optional<PublicKey> key = identities_.lookup(destination);
    if (!crypto_ || !key || !crypto_->encrypt(key->encryption, payload, n, sealed) ||
        sealed.size() > MAX_PAYLOAD) {
      ++counters_.tx_errors;
      return SendResult::Failed;
    }
    body = sealed.data();
    len  = sealed.size();
  }

  Signature sig;
  const Signature* sig_ptr = nullptr;
  if (crypto_ && config_.sign_packets) {
    std::vector<uint8_t> covered;
    signing_data(h, body, len, covered);
    if (!crypto_->sign(identity_, covered.data(), covered.size(), sig)) {
      ++counters_.tx_errors;
      return SendResult::Failed;
    }
    sig_ptr = &sig;
  }

  std::vector<uint8_t> bytes;
  if (!encode(h, body, len, sig_ptr, bytes)) return SendResult::Failed;

  memcpy(h.payload_hash.data(), bytes.data() + PAYLOAD_HASH_OFFSET, PAYLOAD_HASH_SIZE);
  remember(h);

  if (const std::optional<Route> route = routes_.lookup(destination, now_ms_)) {
    return transmit(route->interface_id, bytes) ? SendResult::Sent : SendResult::Failed;
  }

  if (config_.broadcast_fallback && !interfaces_.empty()) {
    size_t sent = 0;
    for (size_t i = 0; i < interfaces_.size(); ++i) {
      if (transmit(static_cast<uint8_t>(i), bytes)) ++sent;
    }
    return sent ? SendResult::Broadcast : SendResult::Failed;
  }

  Event ev;
  ev.kind   = EventKind::DeliveryFailed;
  ev.peer   = destination;
  ev.reason = DropReason::NoRoute;
  push_event(std::move(ev));
  return SendResult::Failed;
}

std::optional<TransferId> Node::send_file(const Address& destination, const uint8_t* data,
                                          size_t n, const FileMetadata* meta) {
  if (meta && meta->size != n) return std::nullopt;
  const TransferId id = make_transfer_id(data, n, now_ms_);
  std::vector<std::vector<uint8_t>> fragments;
  if (!split(id, data, n, meta, config_.fragment_size, fragments)) return std::nullopt;

  for (size_t i = 0; i < fragments.size(); ++i) {
    const SendResult r = send_data(destination, fragments[i].data(), fragments[i].size(),
                                   FLAG_FRAGMENTED);
    if (r == SendResult::Failed && i == 0) return std::nullopt;   // later losses time out remotely
  }
  return id;
}

bool Node::get_event(Event& out) {
  if (events_.empty()) return false;
  out = std::move(events_.front());
  events_.pop_front();
  return true;
}

const char* Node::interface_name(uint8_t id) const {
  return id < interfaces_.size() ? interfaces_[id].link->name() : "";
}

InterfaceMode Node::interface_mode(uint8_t id) const {
  return id < interfaces_.size() ? interfaces_[id].policy->mode : InterfaceMode::Full;
}

uint32_t Node::interface_bandwidth(uint8_t id) const {
  return id < interfaces_.size() ? interfaces_[id].bandwidth_bps : 0;
}

size_t Node::announce_queue_size(uint8_t id) const {
  return id < interfaces_.size() ? interfaces_[id].queue.size() : 0;
}

// ---------- receive path ----------

// -----------------------------------------------------------------------------
// handle_announce()
// PRE:    payload = signing key (32) | encryption key (32) [| ignored tail]
// POLICY: destination must be derive_address(signing key); our own announce
//         coming back is a loop; a SIGNED announce is verified when we can.
// OUT:    identity cached, route learned, copy queued on every other
//         interface whose mode admits the new hop count.
// -----------------------------------------------------------------------------
Verdict Node::handle_announce(uint8_t iface, const Packet& packet,
                              const transport::RxMeta& meta) {
  if (packet.payload.size() < ANNOUNCE_PAYLOAD_SIZE) return drop(DropReason::Malformed);

  PublicKey key;
  memcpy(key.signing.data(), packet.payload.data(), KEY_SIZE);
  memcpy(key.encryption.data(), packet.payload.data() + KEY_SIZE, KEY_SIZE);

  const Address announcer = derive_address(key.signing.data(), KEY_SIZE);
  if (announcer != packet.header.destination) return drop(DropReason::BadAnnounce);
  if (announcer == address_) return drop(DropReason::LoopAvoided);

  if (packet.header.is_signed() && crypto_) {
    std::vector<uint8_t> covered;
    signing_data(packet.header, packet.payload.data(), packet.payload.size(), covered);
    if (!crypto_->verify(key.signing, covered.data(), covered.size(), packet.signature)) {
      return drop(DropReason::BadSignature);
    }
  }
  remember(packet.header);

  const uint8_t hops = next_hop_count(packet.header.hop_count);
  const Interface& ingress = interfaces_[iface];

  PeerMeta pm;
  pm.interface_id = iface;
  pm.hop_count    = hops;
  pm.rssi         = meta.rssi;
  pm.last_seen_ms = now_ms_;
  if (identities_.observe(announcer, key, pm)) {
    Event ev;
    ev.kind         = EventKind::PeerDiscovered;
    ev.peer         = announcer;
    ev.peer_known   = true;
    ev.interface_id = iface;
    ev.hop_count    = hops;
    push_event(std::move(ev));
  }

  Address next_hop;                                  // zero: any neighbour on iface
  if (packet.header.hop_count == 0)  next_hop = announcer;
  else if (meta.has_source)          next_hop = meta.link_source;
  routes_.update(announcer, next_hop, iface, hops, now_ms_,
                 ingress.policy->route_expiry_s * 1000u);

  if (packet.header.ttl == 0 || hops > config_.max_hops) {
    return Verdict{Action::DeliverLocal, DropReason::None};
  }

  Packet copy = packet;
  increment_hop(copy.header);
  std::vector<uint8_t> bytes;
  if (!encode(copy, bytes)) return Verdict{Action::DeliverLocal, DropReason::None};

  bool queued = false;
  for (size_t i = 0; i < interfaces_.size(); ++i) {
    if (i == iface) continue;
    if (!permits_announce_forward(*interfaces_[i].policy, copy.header.hop_count)) continue;
    enqueue_announce(static_cast<uint8_t>(i), copy.header.hop_count, bytes);
    queued = true;
  }
  return Verdict{queued ? Action::Forward : Action::DeliverLocal, DropReason::None};
}

Verdict Node::deliver(uint8_t iface, const Packet& packet) {
  if (packet.header.type != PacketType::Data) {
    ++counters_.delivered;
    return Verdict{Action::DeliverLocal, DropReason::None};
  }

  Address sender;
  const bool known = identify_sender(packet, sender);

  const uint8_t* body = packet.payload.data();
  size_t len = packet.payload.size();
  std::vector<uint8_t> plain;
  if (packet.header.is_encrypted()) {
    if (!crypto_ || !crypto_->decrypt(identity_, body, len, plain)) {
      return drop(DropReason::Malformed);
    }
    body = plain.data();
    len  = plain.size();
  }
  ++counters_.delivered;

  if (packet.header.is_fragmented()) return deliver_fragment(packet, body, len, sender, known);

  Event ev;
  ev.kind         = EventKind::DataDelivered;
  ev.peer         = sender;
  ev.peer_known   = known;
  ev.interface_id = iface;
  ev.hop_count    = packet.header.hop_count;
  ev.data.assign(body, body + len);
  push_event(std::move(ev));
  return Verdict{Action::DeliverLocal, DropReason::None};
}

Verdict Node::deliver_fragment(const Packet& packet, const uint8_t* payload, size_t n,
                               const Address& sender, bool sender_known) {
  std::vector<uint8_t> stream;
  const FragmentOutcome out = reassembler_.on_fragment(payload, n, now_ms_, sender, stream);

  if (out.evicted) transfer_failed(out.evicted_progress, TransferError::BufferFull);

  Event ev;
  ev.transfer_id = out.progress.id;
  ev.peer        = out.progress.sender;
  ev.peer_known  = sender_known;
  ev.received    = out.progress.received;
  ev.expected    = out.progress.expected;
  ev.hop_count   = packet.header.hop_count;

  switch (out.kind) {
    case FragmentOutcome::Kind::Stored:
      ev.kind = EventKind::TransferProgress;
      break;

    case FragmentOutcome::Kind::Incomplete:
      ev.kind  = EventKind::TransferProgress;
      ev.error = TransferError::IncompleteTransfer;
      break;

    case FragmentOutcome::Kind::Complete: {
      size_t body_offset = 0;
      if (out.has_meta) {
        if (!extract_metadata(stream.data(), stream.size(), ev.meta, body_offset)) {
          transfer_failed(out.progress, TransferError::Malformed);
          return drop(DropReason::Malformed);
        }
        if (stream.size() - body_offset != ev.meta.size) {     // declared size is binding
          transfer_failed(out.progress, TransferError::IncompleteTransfer);
          return drop(DropReason::Malformed);
        }
        ev.has_meta = true;
      }
      ev.kind = EventKind::TransferComplete;
      ev.data.assign(stream.begin() + static_cast<std::ptrdiff_t>(body_offset), stream.end());
      break;
    }

    case FragmentOutcome::Kind::Rejected:
      if (out.error == TransferError::Malformed) return drop(DropReason::Malformed);
      ev.kind  = out.error == TransferError::BufferFull ? EventKind::TransferProgress   // still open
                                                        : EventKind::TransferFailed;
      ev.error = out.error;
      break;
  }

  push_event(std::move(ev));
  return Verdict{Action::DeliverLocal, DropReason::None};
}

// -----------------------------------------------------------------------------
// forward()
// POLICY: ttl 0 never leaves; the incremented hop count must stay within
//         max_hops; a route pointing back out of the ingress link is a loop.
// -----------------------------------------------------------------------------
Verdict Node::forward(uint8_t iface, Packet& packet) {
  if (packet.header.ttl == 0) return drop(DropReason::TtlExhausted);
  if (next_hop_count(packet.header.hop_count) > config_.max_hops ||
      packet.header.hop_count == 0xFF) {
    return drop(DropReason::HopLimit);
  }

  const std::optional<Route> route = routes_.lookup(packet.header.destination, now_ms_);
  if (!route) return drop(DropReason::NoRoute);
  if (route->interface_id == iface) return drop(DropReason::LoopAvoided);

  increment_hop(packet.header);
  std::vector<uint8_t> bytes;
  if (!encode(packet, bytes)) return drop(DropReason::Malformed);

  if (transmit(route->interface_id, bytes)) ++counters_.forwarded;
  return Verdict{Action::Forward, DropReason::None};
}

Verdict Node::drop(DropReason reason) {
  ++counters_.drops[static_cast<size_t>(reason)];
  return Verdict{Action::Drop, reason};
}

// The header carries no source: the sender is whoever's cached key verifies
// the signature. Unsigned packets, or no matching key, leave it unknown.
bool Node::identify_sender(const Packet& packet, Address& sender) {
  if (!crypto_ || !packet.has_signature) return false;

  std::vector<uint8_t> covered;
  signing_data(packet.header, packet.payload.data(), packet.payload.size(), covered);

  bool found = false;
  identities_.for_each([&](const Address& address, const IdentityEntry& entry) {
    if (found) return;
    if (crypto_->verify(entry.key.signing, covered.data(), covered.size(), packet.signature)) {
      sender = address;
      found = true;
    }
  });
  return found;
}

// ---------- send helpers ----------

bool Node::build_announce(std::vector<uint8_t>& out) {
  uint8_t payload[ANNOUNCE_PAYLOAD_SIZE];
  memcpy(payload, identity_.signing_public(), KEY_SIZE);
  memcpy(payload + KEY_SIZE, identity_.encryption_public(), KEY_SIZE);

  PacketHeader h;
  h.type        = PacketType::Announce;
  h.destination = address_;
  h.ttl         = config_.default_ttl;

  if (crypto_ && config_.sign_packets) {
    std::vector<uint8_t> covered;
    signing_data(h, payload, sizeof(payload), covered);
    Signature sig;
    if (!crypto_->sign(identity_, covered.data(), covered.size(), sig)) return false;
    return encode(h, payload, sizeof(payload), &sig, out);
  }
  return encode(h, payload, sizeof(payload), nullptr, out);
}

bool Node::transmit(uint8_t iface, const std::vector<uint8_t>& bytes) {
  transport::ILink* link = interfaces_[iface].link;
  if (bytes.size() > link->mtu() ||
      link->send(bytes.data(), bytes.size()) != transport::TxResult::Ok) {
    ++counters_.tx_errors;
    return false;
  }
  ++counters_.tx;
  return true;
}

// -----------------------------------------------------------------------------
// enqueue_announce()
// POLICY: queue stays sorted by (hop_count, arrival). When full, the worst
//         entry goes: the newcomer itself if it is no better than the tail.
// -----------------------------------------------------------------------------
void Node::enqueue_announce(uint8_t iface, uint8_t hop_count, const std::vector<uint8_t>& bytes) {
  Interface& itf = interfaces_[iface];

  if (itf.queue.full()) {
    ++counters_.announce_queue_drops;
    if (itf.queue.back().hop_count <= hop_count) return;
    itf.queue.pop_back();
  }

  QueuedAnnounce a;
  a.hop_count = hop_count;
  a.seq       = ++announce_seq_;
  a.bytes     = bytes;

  auto pos = itf.queue.begin();
  while (pos != itf.queue.end() && pos->hop_count <= hop_count) ++pos;
  itf.queue.insert(pos, std::move(a));
}

void Node::refill(Interface& itf) {
  const uint32_t elapsed = static_cast<uint32_t>(now_ms_ - itf.last_refill_ms);
  itf.last_refill_ms = now_ms_;
  const uint64_t filled = itf.bucket_mbits + static_cast<uint64_t>(elapsed) * itf.budget_bps;
  itf.bucket_mbits = filled > itf.bucket_cap_mbits ? itf.bucket_cap_mbits : filled;
}

void Node::drain_announces(Interface& itf) {
  const bool throttled = itf.bandwidth_bps != 0;
  refill(itf);

  while (!itf.queue.empty()) {
    QueuedAnnounce& a = itf.queue.front();
    const uint64_t cost = static_cast<uint64_t>(a.bytes.size()) * 8u * 1000u;
    if (throttled && itf.bucket_mbits < cost) break;

    if (a.bytes.size() > itf.link->mtu()) {
      ++counters_.tx_errors;
    } else {
      const transport::TxResult r = itf.link->send(a.bytes.data(), a.bytes.size());
      if (r == transport::TxResult::Busy) break;   // retry next tick, order kept
      if (r == transport::TxResult::Ok) {
        ++counters_.tx;
        ++counters_.announces_forwarded;
        if (throttled) itf.bucket_mbits -= cost;
      } else {
        ++counters_.tx_errors;
      }
    }
    itf.queue.erase(itf.queue.begin());
  }
}

uint32_t Node::announce_interval_ms(const Interface& itf) const {
  if (itf.policy->announce_interval_s == 0) return 0;   // mode never self-announces
  const uint32_t s = config_.announce_interval_s ? config_.announce_interval_s
                                                 : itf.policy->announce_interval_s;
  return s * 1000u;
}

// ---------- duplicate ring ----------

bool Node::seen_before(const PacketHeader& header) const {
  if (!dedupe_enabled()) return false;
  const uint32_t window = config_.duplicate_window_s * 1000u;
  for (const Seen& s : seen_) {
    if (static_cast<uint32_t>(now_ms_ - s.at_ms) > window) continue;
    if (s.type != header.type || s.destination != header.destination ||
        s.hash != header.payload_hash) {
      continue;
    }
    // an announce over a shorter path than any copy seen so far is news
    if (header.type == PacketType::Announce && header.hop_count < s.hop_count) continue;
    return true;
  }
  return false;
}

void Node::remember(const PacketHeader& header) {
  if (!dedupe_enabled()) return;
  if (seen_.full()) seen_.pop_front();
  Seen s;
  s.type        = header.type;
  s.destination = header.destination;
  s.hash        = header.payload_hash;
  s.hop_count   = header.hop_count;
  s.at_ms       = now_ms_;
  seen_.push_back(s);
}

void Node::expire_seen() {
  const uint32_t window = config_.duplicate_window_s * 1000u;
  while (!seen_.empty() && static_cast<uint32_t>(now_ms_ - seen_.front().at_ms) > window) {
    seen_.pop_front();
  }
}

// ---------- events ----------

void Node::push_event(Event&& ev) {
  if (events_.full()) {
    events_.pop_front();                              // oldest goes first
    ++counters_.events_dropped;
  }
  events_.push_back(std::move(ev));
}

void Node::transfer_failed(const TransferProgress& p, TransferError error) {
  Event ev;
  ev.kind        = EventKind::TransferFailed;
  ev.transfer_id = p.id;
  ev.peer        = p.sender;
  ev.received    = p.received;
  ev.expected    = p.expected;
  ev.error       = error;
  push_event(std::move(ev));
}

} // namespace mycorrhiza
