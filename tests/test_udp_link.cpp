#include <doctest/doctest.h>
#include <string>
#include <vector>
#include <unistd.h>
#include "mycorrhiza/transport/udp_link.hpp"
#include "test_support.hpp"

using namespace mycorrhiza;
using namespace mycorrhiza::test;
using transport::UdpLink;

// Loopback ports well clear of the default 4242 a running node would use.
static constexpr uint16_t PORT_A = 47311;
static constexpr uint16_t PORT_B = 47312;

static std::string loopback(uint16_t port) { return "127.0.0.1:" + std::to_string(port); }

// Datagrams on loopback arrive almost at once, but not synchronously.
static transport::RxResult wait_recv(UdpLink& link, std::vector<uint8_t>& out) {
    out.assign(2048, 0);
    std::size_t len = 0;
    transport::RxMeta meta;
    for (int i = 0; i < 200; ++i) {
        const transport::RxResult r = link.recv(out.data(), out.size(), len, meta);
        if (r != transport::RxResult::None) {
            out.resize(len);
            return r;
        }
        ::usleep(1000);
    }
    out.clear();
    return transport::RxResult::None;
}

TEST_CASE("UdpLink delivers one datagram per send to each listed peer") {
    UdpLink a(PORT_A, {loopback(PORT_B)}, "udp-a");
    UdpLink b(PORT_B, {loopback(PORT_A)}, "udp-b");
    REQUIRE(a.begin(transport::Config{}));
    REQUIRE(b.begin(transport::Config{}));
    CHECK(a.mtu() == UdpLink::MTU_DEFAULT);
    CHECK(a.bandwidth_bps() == UdpLink::BANDWIDTH_DEFAULT);
    CHECK(a.peer_count() == 1);

    const std::vector<uint8_t> msg = {1, 2, 3, 4, 5};
    CHECK(a.send(msg.data(), msg.size()) == transport::TxResult::Ok);

    std::vector<uint8_t> got;
    REQUIRE(wait_recv(b, got) == transport::RxResult::Ok);
    CHECK(got == msg);

    std::size_t len = 7;
    transport::RxMeta meta;
    uint8_t buf[16];
    CHECK(b.recv(buf, sizeof(buf), len, meta) == transport::RxResult::None);
    CHECK(len == 0);
    CHECK_FALSE(meta.has_source);
}

TEST_CASE("UdpLink refuses oversize sends and bad peers") {
    transport::Config cfg;
    cfg.mtu = 300;
    UdpLink a(PORT_A, {loopback(PORT_B)});
    REQUIRE(a.begin(cfg));
    CHECK(a.mtu() == 300);
    const std::vector<uint8_t> big(301, 0xAA);
    CHECK(a.send(big.data(), big.size()) == transport::TxResult::Error);

    UdpLink bad(PORT_B, {"no-port-here"});
    CHECK_FALSE(bad.begin(transport::Config{}));

    UdpLink closed(PORT_B, {});
    const uint8_t one = 1;
    CHECK(closed.send(&one, 1) == transport::TxResult::Error);   // never opened
}

TEST_CASE("A datagram larger than the receive buffer is an error, not a short read") {
    UdpLink a(PORT_A, {loopback(PORT_B)});
    UdpLink b(PORT_B, {});
    REQUIRE(a.begin(transport::Config{}));
    REQUIRE(b.begin(transport::Config{}));

    const std::vector<uint8_t> msg(100, 0x5A);
    REQUIRE(a.send(msg.data(), msg.size()) == transport::TxResult::Ok);

    uint8_t small[10];
    std::size_t len = 0;
    transport::RxMeta meta;
    transport::RxResult r = transport::RxResult::None;
    for (int i = 0; i < 200 && r == transport::RxResult::None; ++i) {
        r = b.recv(small, sizeof(small), len, meta);
        if (r == transport::RxResult::None) ::usleep(1000);
    }
    CHECK(r == transport::RxResult::Error);
}

TEST_CASE("Two nodes discover each other over loopback UDP") {
    UdpLink la(PORT_A, {loopback(PORT_B)}, "udp-a");
    UdpLink lb(PORT_B, {loopback(PORT_A)}, "udp-b");
    REQUIRE(la.begin(transport::Config{}));
    REQUIRE(lb.begin(transport::Config{}));

    auto a = make_node(1);
    auto b = make_node(2);
    REQUIRE(a->add_interface(la, InterfaceMode::Full));
    REQUIRE(b->add_interface(lb, InterfaceMode::Full));

    CHECK(a->announce() == 1);
    uint32_t now = 0;
    for (int i = 0; i < 200 && b->routes().size() == 0; ++i) {
        now += 1;
        b->tick(now);
        ::usleep(1000);
    }
    auto route = b->routes().lookup(a->address(), now);
    REQUIRE(route.has_value());
    CHECK(route->hop_count == 1);
    CHECK(route->next_hop == a->address());
    CHECK(b->identities().size() == 1);
}
