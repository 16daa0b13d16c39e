/**
 * @file node.hpp
 * @brief Node: the owned context of one mesh participant.
 *
 * @details
 * A Node holds everything a mesh participant needs: its identity, the route
 * table, the identity cache, the inbound transfer registry, the attached
 * links with their announce queues, the duplicate-suppression ring and the
 * client event queue. There is no module-level state; two Nodes in one
 * process (a test scenario, a simulator) never interfere.
 *
 * The Node does not own a clock or a thread. The caller feeds time through
 * tick(now_ms) and pushes datagrams either by letting tick() poll the links
 * or by calling on_receive() directly.
 *
 * ## Receive pipeline
 * ```
 *   bytes ─► decode ─► seen? ─► ANNOUNCE ─► verify ─► learn ─► queue re-broadcast
 *             │          │          │
 *         Malformed  Duplicate      └─ other ─► dest == self ─► deliver (data / fragment)
 *                                                │
 *                                          ttl, hop limit, route ─► forward / drop
 * ```
 *
 * ## Announce propagation
 * Every interface owns a bounded queue of announces waiting to go out, ordered
 * by (hop_count, arrival). A token bucket sized from the interface mode's
 * budget releases them: an interface with 2 % of 10 kbit/s spends at most
 * 200 bit/s on re-broadcasts. When the queue is full the worst entry (most
 * hops, newest) is dropped. Links that report no bandwidth are unthrottled.
 *
 * **Typical usage:**
 * @code
 *   mycorrhiza::Node node(identity, cfg, &crypto);
 *   node.add_interface(lora, mycorrhiza::InterfaceMode::Full);
 *
 *   for (;;) {
 *     node.tick(millis());
 *     mycorrhiza::Event ev;
 *     while (node.get_event(ev)) {
 *       // hand to the client
 *     }
 *   }
 * @endcode
 */
#ifndef MYCORRHIZA_NODE_HPP
#define MYCORRHIZA_NODE_HPP

#include <optional>
#include <vector>
#include <stddef.h>
#include <stdint.h>
#include "etl/deque.h"
#include "etl/vector.h"
#include "mycorrhiza/address.hpp"
#include "mycorrhiza/config.hpp"
#include "mycorrhiza/events.hpp"
#include "mycorrhiza/fragment.hpp"
#include "mycorrhiza/identity.hpp"
#include "mycorrhiza/identity_cache.hpp"
#include "mycorrhiza/interface_mode.hpp"
#include "mycorrhiza/packet.hpp"
#include "mycorrhiza/profile.hpp"
#include "mycorrhiza/route_table.hpp"
#include "mycorrhiza/transfer_manager.hpp"
#include "mycorrhiza/transport/link.hpp"

namespace mycorrhiza {

enum class Action : uint8_t { DeliverLocal, Forward, Drop };

/// Outcome of on_receive() for one datagram.
struct Verdict {
  Action     action{Action::Drop};
  DropReason reason{DropReason::None};
};

enum class SendResult : uint8_t {
  Sent,       ///< handed to the link of a known route
  Broadcast,  ///< no route; sent on every interface
  Failed      ///< nothing went out (see DeliveryFailed event / counters)
};

const char* to_string(Action a);
const char* to_string(SendResult r);

struct Counters {
  uint32_t rx{0};                  ///< datagrams handed to on_receive()
  uint32_t tx{0};                  ///< datagrams accepted by a link
  uint32_t delivered{0};
  uint32_t forwarded{0};
  uint32_t drops[DROP_REASON_COUNT]{};
  uint32_t decode_errors{0};
  uint32_t rx_errors{0};           ///< link reported a receive error
  uint32_t tx_errors{0};           ///< link refused, or datagram above its MTU
  uint32_t announces_sent{0};      ///< own announces
  uint32_t announces_forwarded{0}; ///< released from announce queues
  uint32_t announce_queue_drops{0};
  uint32_t events_dropped{0};      ///< oldest event discarded on overflow

  uint32_t dropped(DropReason r) const { return drops[static_cast<size_t>(r)]; }
};

class Node {
public:
  static constexpr size_t   RECV_PER_TICK = 8;  ///< datagrams drained per link per tick()
  static constexpr size_t   ANNOUNCE_PAYLOAD_SIZE = 2 * KEY_SIZE;
  /// Largest announce on the wire, in bits: the token bucket never holds less.
  static constexpr uint32_t ANNOUNCE_MAX_BITS =
      (HEADER_SIZE + ANNOUNCE_PAYLOAD_SIZE + SIGNATURE_SIZE) * 8;

  /**
   * @brief Build a node around an identity.
   *
   * @param identity  own key material; the address is derived from it
   * @param config    limits and policy (clamped to the compiled profile)
   * @param crypto    optional capability; without it nothing is signed,
   *                  verified, encrypted or decrypted
   */
  explicit Node(const IdentityBlob& identity, const NodeConfig& config = NodeConfig{},
                ICrypto* crypto = nullptr);

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  /**
   * @brief Attach a link. The Node does not own it and never calls begin().
   *
   * @param bandwidth_bps  0 = ask the link
   * @return interface id, or nullopt when all interface slots are taken
   */
  std::optional<uint8_t> add_interface(transport::ILink& link, InterfaceMode mode,
                                       uint32_t bandwidth_bps = 0);

  /**
   * @brief Process one received datagram.
   *
   * Uses the time of the last tick()/set_time(). Forwarded packets and
   * queued announces are sent from here (forward) or from tick() (announces).
   */
  Verdict on_receive(uint8_t interface_id, const uint8_t* data, size_t n,
                     const transport::RxMeta& meta = transport::RxMeta{});

  /**
   * @brief Advance time and run every periodic duty.
   *
   * Polls links, self-announces when an interval elapsed, releases queued
   * announces under each token bucket, and sweeps routes, identities,
   * stale transfers and the duplicate ring.
   */
  void tick(uint32_t now_ms);

  /**
   * @brief Broadcast our ANNOUNCE now on every interface whose mode self-announces.
   * @return number of interfaces it went out on
   */
  size_t announce();

  /**
   * @brief Originate a DATA packet.
   *
   * @param flags  FLAG_ENCRYPTED / FLAG_PRIORITY / FLAG_FRAGMENTED; SIGNED is
   *               decided by the node (crypto attached and sign_packets on)
   * @return Failed also when encryption was asked for and the destination's
   *         key is not cached
   */
  SendResult send_data(const Address& destination, const uint8_t* payload, size_t n,
                       uint8_t flags = 0);

  /**
   * @brief Fragment @p data (with optional metadata block) and send every fragment.
   *
   * Receivers hold a completed stream to the metadata's size field, so
   * @p meta must declare exactly @p n bytes.
   * @return the transfer id, or nullopt when empty, too large, the declared
   *         size disagrees with @p n, or the first fragment failed
   */
  std::optional<TransferId> send_file(const Address& destination, const uint8_t* data, size_t n,
                                      const FileMetadata* meta = nullptr);

  /// Pop the oldest pending event. @return false when the queue is empty.
  bool get_event(Event& out);

  void     set_time(uint32_t now_ms) { now_ms_ = now_ms; }
  uint32_t now() const { return now_ms_; }

  const Address&    address() const { return address_; }
  PublicKey         public_key() const { return identity_.public_key(); }
  const NodeConfig& config() const { return config_; }
  const Counters&   counters() const { return counters_; }
  bool              has_crypto() const { return crypto_ != nullptr; }

  RouteTable&          routes() { return routes_; }
  const RouteTable&    routes() const { return routes_; }
  IdentityCache&       identities() { return identities_; }
  const IdentityCache& identities() const { return identities_; }
  const Reassembler&   transfers() const { return reassembler_; }

  size_t        interface_count() const { return interfaces_.size(); }
  const char*   interface_name(uint8_t id) const;
  InterfaceMode interface_mode(uint8_t id) const;
  uint32_t      interface_bandwidth(uint8_t id) const;
  size_t        announce_queue_size(uint8_t id) const;
  size_t        pending_events() const { return events_.size(); }

private:
  struct QueuedAnnounce {
    uint8_t  hop_count{0};
    uint32_t seq{0};
    std::vector<uint8_t> bytes;
  };

  struct Interface {
    transport::ILink* link{nullptr};
    const ModePolicy* policy{nullptr};
    uint32_t bandwidth_bps{0};
    uint32_t budget_bps{0};
    uint64_t bucket_mbits{0};       ///< tokens in millibits (bps x ms)
    uint64_t bucket_cap_mbits{0};
    uint32_t last_refill_ms{0};
    uint32_t last_announce_ms{0};
    bool     announced{false};
    etl::vector<QueuedAnnounce, Profile::ANNOUNCE_SLOTS> queue;
  };

  struct Seen {
    PacketType  type{PacketType::Data};
    Address     destination{};
    PayloadHash hash{};
    uint8_t     hop_count{0};
    uint32_t    at_ms{0};
  };

  Verdict handle_announce(uint8_t iface, const Packet& packet, const transport::RxMeta& meta);
  Verdict deliver(uint8_t iface, const Packet& packet);
  Verdict deliver_fragment(const Packet& packet, const uint8_t* payload, size_t n,
                           const Address& sender, bool sender_known);
  Verdict forward(uint8_t iface, Packet& packet);
  Verdict drop(DropReason reason);

  bool identify_sender(const Packet& packet, Address& sender);
  bool build_announce(std::vector<uint8_t>& out);
  bool transmit(uint8_t iface, const std::vector<uint8_t>& bytes);
  void enqueue_announce(uint8_t iface, uint8_t hop_count, const std::vector<uint8_t>& bytes);
  void drain_announces(Interface& itf);
  void refill(Interface& itf);
  uint32_t announce_interval_ms(const Interface& itf) const;

  bool seen_before(const PacketHeader& header) const;
  bool dedupe_enabled() const { return config_.duplicate_window_s != 0; }
  void remember(const PacketHeader& header);
  void expire_seen();

  void push_event(Event&& ev);
  void transfer_failed(const TransferProgress& p, TransferError error);

  IdentityBlob identity_;
  Address      address_;
  NodeConfig   config_;
  ICrypto*     crypto_;

  RouteTable    routes_;
  IdentityCache identities_;
  Reassembler   reassembler_;

  etl::vector<Interface, Profile::INTERFACE_SLOTS> interfaces_;
  etl::deque<Seen, Profile::SEEN_SLOTS>            seen_;
  etl::deque<Event, Profile::EVENT_SLOTS>          events_;

  std::vector<uint8_t> rx_buf_;     ///< sized to the largest attached MTU
  Counters counters_;
  uint32_t now_ms_{0};
  uint32_t announce_seq_{0};
};

} // namespace mycorrhiza

#endif // MYCORRHIZA_NODE_HPP
