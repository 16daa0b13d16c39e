#include <doctest/doctest.h>
#include <thread>
#include <vector>
#include "shared_node.hpp"
#include "test_support.hpp"

using namespace mycorrhiza;
using namespace mycorrhiza::test;

TEST_CASE("SharedNode serialises receive and timer paths from two threads") {
    NodeConfig cfg;
    cfg.auto_announce = false;
    cfg.duplicate_window_s = 0;                       // every copy counts
    SharedNode shared(make_identity(1), cfg);
    FakeLink link("radio");
    REQUIRE(shared.with([&](Node& n) { return n.add_interface(link, InterfaceMode::Full); }));

    constexpr int ROUNDS = 200;
    const std::vector<uint8_t> announce = announce_bytes(make_identity(5), 0);

    std::thread rx([&] {
        for (int i = 0; i < ROUNDS; ++i) shared.on_receive(0, announce.data(), announce.size());
    });
    for (int i = 0; i < ROUNDS; ++i) shared.tick(static_cast<uint32_t>(i));
    rx.join();

    const Counters c = shared.with([](Node& n) { return n.counters(); });
    CHECK(c.rx == ROUNDS);

    Event ev;
    size_t peers = 0;
    while (shared.get_event(ev)) peers += ev.kind == EventKind::PeerDiscovered ? 1 : 0;
    CHECK(peers == 1);
}

TEST_CASE("with() hands back the callable's result") {
    SharedNode shared(make_identity(2));
    const Address self = shared.with([](Node& n) { return n.address(); });
    CHECK(self == make_identity(2).address());
    CHECK(shared.announce() == 0);                    // no interfaces yet
}
