#pragma once
/**
 * @file udp_link.hpp
 * @brief UDP "radio" for desktop meshes (header-only, non-blocking, Linux).
 *
 * Each UdpLink binds one local port and treats a fixed list of peer
 * endpoints as everyone in radio range: send() delivers the datagram to
 * every peer, recv() returns whatever any of them sent. Several processes
 * on one machine, each listing the others' ports, form a mesh.
 *
 * UDP carries no mesh addresses, so RxMeta::has_source stays false and the
 * Node learns next hops from announces alone, as on LoRa.
 */

#if !defined(__linux__)
#  error "udp_link.hpp is Linux-only."
#endif

#include "mycorrhiza/transport/link.hpp"
#include <string>
#include <vector>
#include <cerrno>
#include <cstring>
#include <utility>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace mycorrhiza::transport {

class UdpLink : public ILink {
public:
  static constexpr uint16_t MTU_DEFAULT       = 1400;        // stays under a 1500-byte Ethernet frame
  static constexpr uint32_t BANDWIDTH_DEFAULT = 100000000;   // 100 Mbit/s

  UdpLink(uint16_t listen_port, std::vector<std::string> peers, std::string name = "udp")
  : port_(listen_port), peer_text_(std::move(peers)), name_(std::move(name)) {}

  ~UdpLink() override { end(); }

  UdpLink(const UdpLink&) = delete;
  UdpLink& operator=(const UdpLink&) = delete;

  /// Binds 0.0.0.0:listen_port and resolves every peer; false if any step fails.
  bool begin(const Config& cfg) override {
    end();
    mtu_       = cfg.mtu > 255 ? cfg.mtu : MTU_DEFAULT;   // the LoRa default means "not set" here
    bandwidth_ = cfg.bandwidth_bps ? cfg.bandwidth_bps : BANDWIDTH_DEFAULT;

    peers_.clear();
    for (const auto& p : peer_text_) {
      sockaddr_in sa{};
      if (!resolve(p, sa)) return false;
      peers_.push_back(sa);
    }

    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) return false;
    int one = 1;
    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) != 0 || flags < 0 ||
        ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) != 0) {
      end();
      return false;
    }

    sockaddr_in local{};
    local.sin_family      = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port        = htons(port_);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&local), sizeof(local)) != 0) {
      end();
      return false;
    }
    return true;
  }

  void end() override {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  }

  void poll() override { /* nothing: non-blocking socket */ }

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len, RxMeta& meta) override {
    out_len = 0;
    meta = RxMeta{};
    if (fd_ < 0 || !out || cap == 0) return RxResult::Error;
    ssize_t r = ::recvfrom(fd_, out, cap, MSG_TRUNC, nullptr, nullptr);
    if (r < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return RxResult::None;
      return RxResult::Error;
    }
    if (static_cast<std::size_t>(r) > cap) return RxResult::Error;   // truncated datagram
    out_len = static_cast<std::size_t>(r);
    return out_len ? RxResult::Ok : RxResult::None;
  }

  /// One copy per peer. Busy only when every peer's send would block.
  TxResult send(const uint8_t* data, std::size_t len) override {
    if (fd_ < 0 || !data || !len || len > mtu_) return TxResult::Error;
    std::size_t ok = 0, busy = 0;
    for (const auto& sa : peers_) {
      ssize_t w = ::sendto(fd_, data, len, 0, reinterpret_cast<const sockaddr*>(&sa), sizeof(sa));
      if (w == static_cast<ssize_t>(len)) ++ok;
      else if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) ++busy;
    }
    if (ok) return TxResult::Ok;
    if (busy == peers_.size() && busy) return TxResult::Busy;
    return peers_.empty() ? TxResult::Ok : TxResult::Error;   // alone on the channel
  }

  const char* name() const override { return name_.c_str(); }
  std::size_t mtu() const override { return mtu_; }
  uint32_t    bandwidth_bps() const override { return bandwidth_; }

  uint16_t    listen_port() const { return port_; }
  std::size_t peer_count() const { return peers_.size(); }

private:
  // "host:port" -> IPv4 sockaddr (names go through getaddrinfo).
  static bool resolve(const std::string& text, sockaddr_in& out) {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0) return false;
    const std::string host = text.substr(0, colon);
    const std::string port = text.substr(colon + 1);

    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* res = nullptr;
    if (::getaddrinfo(host.c_str(), port.c_str(), &hints, &res) != 0 || !res) return false;
    std::memcpy(&out, res->ai_addr, sizeof(out));
    ::freeaddrinfo(res);
    return true;
  }

  int fd_{-1};
  uint16_t port_;
  std::vector<std::string> peer_text_;
  std::vector<sockaddr_in> peers_;
  std::string name_;
  std::size_t mtu_{MTU_DEFAULT};
  uint32_t bandwidth_{BANDWIDTH_DEFAULT};
};

} // namespace mycorrhiza::transport
