#include <doctest/doctest.h>
#include <string>
#include <vector>
#include "mycorrhiza/console.hpp"
#include "test_support.hpp"

using namespace mycorrhiza;
using namespace mycorrhiza::test;

struct Desk {
    FakeLink link{"radio"};
    std::unique_ptr<Node> node = make_node(1);
    Console console{*node};
    std::vector<std::string> out;

    Desk() { node->add_interface(link, InterfaceMode::Full); }

    std::vector<std::string>& run(const std::string& line) {
        out.clear();
        REQUIRE(console.execute(line, out));
        return out;
    }
};

static std::string hex_of(const Address& a) { return to_hex(a).c_str(); }

TEST_CASE("Lines without a leading '!' are not commands") {
    Desk d;
    std::vector<std::string> out;
    CHECK_FALSE(d.console.execute("hello", out));
    CHECK_FALSE(d.console.execute("   ", out));
    CHECK(out.empty());
}

TEST_CASE("!info reports the node and its counters") {
    Desk d;
    feed(*d.node, 0, announce_bytes(make_identity(5), 0));
    const auto& r = d.run("  !info  ");
    REQUIRE(r.size() == 5);
    CHECK(r[0] == "NODE:" + hex_of(d.node->address()));
    CHECK(r[1] == "ROUTES:1");
    CHECK(r[2] == "PEERS:1");
    CHECK(r[3] == "TX:0 RX:1");
    CHECK(r[4] == "DROPS:0");
}

TEST_CASE("!announce sends on every announcing interface") {
    Desk d;
    const auto& r = d.run("!announce");
    REQUIRE(r.size() == 2);
    CHECK(r[0] == "INFO:Sending announce...");
    CHECK(r[1] == "ANNOUNCED:1");
    CHECK(d.link.sent.size() == 1);
}

TEST_CASE("!send validates its arguments and reports how the packet left") {
    Desk d;
    const IdentityBlob peer = make_identity(5);
    const std::string addr = hex_of(peer.address());
    const std::string shown = std::string(short_hex(peer.address()).c_str());

    SUBCASE("no route floods") {
        CHECK(d.run("!send " + addr + " hi there") == std::vector<std::string>{"FLOODED:" + shown});
        REQUIRE(d.link.sent.size() == 1);
        Packet p;
        REQUIRE(decode(d.link.sent[0].data(), d.link.sent[0].size(), p) == DecodeError::None);
        CHECK(std::string(p.payload.begin(), p.payload.end()) == "hi there");
    }
    SUBCASE("known route") {
        feed(*d.node, 0, announce_bytes(peer, 0));
        CHECK(d.run("!send " + addr + " hi") == std::vector<std::string>{"SENT:" + shown});
    }
    SUBCASE("missing message") {
        CHECK(d.run("!send " + addr) ==
              std::vector<std::string>{"ERROR:Usage: !send <address> <message>"});
    }
    SUBCASE("bad address") {
        CHECK(d.run("!send xyz hi") == std::vector<std::string>{"ERROR:Invalid address: xyz"});
        CHECK(d.link.sent.empty());
    }
}

TEST_CASE("!broadcast sends one packet per cached peer") {
    Desk d;
    CHECK(d.run("!broadcast hello") == std::vector<std::string>{"ERROR:No peers discovered yet"});
    CHECK(d.run("!broadcast") == std::vector<std::string>{"ERROR:Usage: !broadcast <message>"});

    feed(*d.node, 0, announce_bytes(make_identity(5), 0));
    feed(*d.node, 0, announce_bytes(make_identity(6), 1));
    CHECK(d.run("!broadcast hello") == std::vector<std::string>{"BROADCAST:2 peers"});
    CHECK(d.link.sent.size() == 2);
}

TEST_CASE("!peers and !routes list the tables") {
    Desk d;
    const IdentityBlob peer = make_identity(5);
    Address neighbour;
    neighbour.bytes.fill(0x0E);
    feed(*d.node, 0, announce_bytes(peer, 2), from(neighbour));

    const std::vector<std::string> peers = d.run("!peers");
    REQUIRE(peers.size() == 2);
    CHECK(peers[0] == "PEERS:1");
    CHECK(peers[1] == "PEER:" + hex_of(peer.address()) + ":3:0");

    const std::vector<std::string> routes = d.run("!routes");
    REQUIRE(routes.size() == 2);
    CHECK(routes[0] == "ROUTES:1");
    CHECK(routes[1] == "ROUTE:" + hex_of(peer.address()) + ":" + hex_of(neighbour) + ":0:3");
}

TEST_CASE("!transfers lists open reassemblies") {
    Desk d;
    CHECK(d.run("!transfers") == std::vector<std::string>{"TRANSFERS:0"});

    TransferId id;
    id.bytes.fill(0x21);
    std::vector<uint8_t> fragment;
    const uint8_t data[4] = {1, 2, 3, 4};
    build_fragment(id, 0, 0, data, sizeof(data), fragment);
    PacketHeader h;
    h.flags       = FLAG_FRAGMENTED;
    h.destination = d.node->address();
    std::vector<uint8_t> wire;
    REQUIRE(encode(h, fragment.data(), fragment.size(), nullptr, wire));
    feed(*d.node, 0, wire);

    const std::vector<std::string> r = d.run("!transfers");
    REQUIRE(r.size() == 2);
    CHECK(r[0] == "TRANSFERS:1");
    CHECK(r[1] == "TRANSFER:" + std::string(to_hex(id).c_str()) + ":1/0");
}

TEST_CASE("Unknown commands get an error and a hint") {
    Desk d;
    const auto& r = d.run("!reboot now");
    REQUIRE(r.size() == 2);
    CHECK(r[0] == "ERROR:Unknown command: !reboot now");
    CHECK(r[1].rfind("ERROR:Try:", 0) == 0);
    CHECK(console_command("!reboot") == ConsoleCommand::Unknown);
    CHECK(console_command("!routes") == ConsoleCommand::Routes);
}

TEST_CASE("Events render as console lines") {
    Event ev;
    std::string line;

    ev.kind = EventKind::DataDelivered;
    ev.data = {'y', 'o'};
    REQUIRE(Console::render_event(ev, line));
    CHECK(line == "MSG:unknown:yo");

    ev.peer_known = true;
    ev.peer.bytes.fill(0x01);
    REQUIRE(Console::render_event(ev, line));
    CHECK(line == "MSG:01010101010101010101010101010101:yo");

    ev.kind = EventKind::DeliveryFailed;
    REQUIRE(Console::render_event(ev, line));
    CHECK(line == "ERROR:No route: 01010101010101010101010101010101");

    ev.kind     = EventKind::TransferFailed;
    ev.error    = TransferError::TransferTimeout;
    ev.received = 2;
    ev.expected = 0;
    REQUIRE(Console::render_event(ev, line));
    CHECK(line.find(":transfer_timeout:2/0") != std::string::npos);

    ev.kind = EventKind::TransferComplete;
    CHECK_FALSE(Console::render_event(ev, line));
}
