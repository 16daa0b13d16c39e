#pragma once
/**
 * @file shared_node.hpp
 * @brief A Node behind one mutex, for hosts that drive it from several threads.
 *
 * The Node itself is single-threaded. A host that reads sockets on one
 * thread and takes console commands on another wraps it here: every call
 * holds the lock for the whole operation, so the Node only ever sees one
 * caller at a time. with() runs a longer sequence under a single lock.
 *
 * @code
 *   SharedNode shared(identity, cfg, &crypto);
 *   shared.tick(now_ms_steady32());
 *   shared.with([&](Node& n) { console.execute(line, replies); });
 * @endcode
 */

#include <memory>
#include <mutex>
#include <utility>
#include "mycorrhiza/node.hpp"

namespace mycorrhiza {

class SharedNode {
public:
  SharedNode(const IdentityBlob& identity, const NodeConfig& cfg = {}, ICrypto* crypto = nullptr)
  : node_(std::make_unique<Node>(identity, cfg, crypto)) {}

  SharedNode(const SharedNode&) = delete;
  SharedNode& operator=(const SharedNode&) = delete;

  /// Run @p f(Node&) under the lock and return its result.
  template <typename F>
  auto with(F&& f) -> decltype(f(std::declval<Node&>())) {
    std::lock_guard<std::mutex> lock(mu_);
    return f(*node_);
  }

  void tick(uint32_t now_ms) {
    std::lock_guard<std::mutex> lock(mu_);
    node_->tick(now_ms);
  }

  Verdict on_receive(uint8_t iface, const uint8_t* data, size_t n,
                     const transport::RxMeta& meta = {}) {
    std::lock_guard<std::mutex> lock(mu_);
    return node_->on_receive(iface, data, n, meta);
  }

  SendResult send_data(const Address& dest, const uint8_t* payload, size_t n, uint8_t flags = 0) {
    std::lock_guard<std::mutex> lock(mu_);
    return node_->send_data(dest, payload, n, flags);
  }

  size_t announce() {
    std::lock_guard<std::mutex> lock(mu_);
    return node_->announce();
  }

  bool get_event(Event& out) {
    std::lock_guard<std::mutex> lock(mu_);
    return node_->get_event(out);
  }

private:
  std::mutex            mu_;
  std::unique_ptr<Node> node_;
};

} // namespace mycorrhiza
