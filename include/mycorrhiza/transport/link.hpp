#pragma once
/**
 * @file link.hpp
 * @brief Minimal, Node-agnostic link interface for mesh interfaces (LoRa, UDP, test fakes).
 *
 * Header-only on purpose for easy embedding. A link moves whole datagrams:
 * one recv() is one encoded packet, one send() is one encoded packet.
 */

#include <cstddef>
#include <cstdint>
#include "mycorrhiza/address.hpp"

namespace mycorrhiza::transport {

// Return codes kept simple for embedded sanity.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

struct Config {
  uint16_t mtu{255};            // LoRa SX126x FIFO; UDP links raise it
  uint32_t bandwidth_bps{0};    // 0 = link's own estimate
};

/// Per-datagram receive metadata.
struct RxMeta {
  int16_t rssi{0};              // dBm; 0 when the medium has no notion of it
  bool    has_source{false};    // link layer knows which neighbour sent it
  Address link_source{};        // valid iff has_source
};

/**
 * @brief Link trait every interface implementation can rely on.
 *
 * Contract:
 *  - begin(cfg) opens the port / radio; false on failure.
 *  - poll() does non-blocking service work (ISR flags, FIFO, socket drain).
 *  - recv(buf,cap,len,meta) pulls one datagram; RxResult::None when idle.
 *  - send(buf,len) transmits one datagram; never blocks for long (Busy instead).
 *  - name() is a short identifier for logs/diagnostics.
 *  - bandwidth_bps() is the link's raw rate; it sizes the announce budget.
 */
class ILink {
public:
  virtual ~ILink() = default;
  virtual bool        begin(const Config& cfg) = 0;
  virtual void        end() = 0;
  virtual void        poll() = 0;
  virtual RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len, RxMeta& meta) = 0;
  virtual TxResult    send(const uint8_t* data, std::size_t len) = 0;
  virtual const char* name() const = 0;
  virtual std::size_t mtu() const = 0;
  virtual uint32_t    bandwidth_bps() const = 0;
};

} // namespace mycorrhiza::transport
