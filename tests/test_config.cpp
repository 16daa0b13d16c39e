#include <doctest/doctest.h>
#include <string>
#include "mycorrhiza/config.hpp"
#include "nlohmann/json.hpp"

using namespace mycorrhiza;

TEST_CASE("Defaults follow the compiled profile") {
    NodeConfig cfg;
    CHECK(cfg.max_hops == 128);
    CHECK(cfg.default_ttl == 32);
    CHECK(cfg.route_capacity == Profile::ROUTE_SLOTS);
    CHECK(cfg.identity_capacity == Profile::IDENTITY_SLOTS);
    CHECK(cfg.transfer_capacity == Profile::TRANSFER_SLOTS);
    CHECK(cfg.transfer_timeout_s == 60);
    CHECK(cfg.fragment_size == 200);
    CHECK(cfg.tie_break == TieBreak::PreferExisting);
    CHECK(cfg.interfaces.empty());
}

TEST_CASE("Every field survives a trip through JSON") {
    NodeConfig cfg;
    cfg.name = "relay-7";
    cfg.max_hops = 12;
    cfg.announce_interval_s = 45;
    cfg.auto_announce = false;
    cfg.route_capacity = 64;
    cfg.fragment_capacity = 96;
    cfg.fragment_size = 150;
    cfg.duplicate_window_s = 0;
    cfg.tie_break = TieBreak::PreferNewest;
    cfg.sign_packets = false;
    InterfaceConfig ic;
    ic.name = "udp1";
    ic.mode = InterfaceMode::Gateway;
    ic.bandwidth_bps = 9600;
    ic.listen_port = 4300;
    ic.peers.push_back(PeerStr("10.0.0.2:4301"));
    cfg.interfaces.push_back(ic);

    NodeConfig back;
    REQUIRE(config_from_json(config_to_json(cfg), back));
    CHECK(std::string(back.name.c_str()) == "relay-7");
    CHECK(back.max_hops == 12);
    CHECK(back.announce_interval_s == 45);
    CHECK_FALSE(back.auto_announce);
    CHECK(back.route_capacity == 64);
    CHECK(back.fragment_capacity == 96);
    CHECK(back.fragment_size == 150);
    CHECK(back.duplicate_window_s == 0);
    CHECK(back.tie_break == TieBreak::PreferNewest);
    CHECK_FALSE(back.sign_packets);
    REQUIRE(back.interfaces.size() == 1);
    CHECK(std::string(back.interfaces[0].name.c_str()) == "udp1");
    CHECK(back.interfaces[0].mode == InterfaceMode::Gateway);
    CHECK(back.interfaces[0].bandwidth_bps == 9600);
    CHECK(back.interfaces[0].listen_port == 4300);
    REQUIRE(back.interfaces[0].peers.size() == 1);
    CHECK(std::string(back.interfaces[0].peers[0].c_str()) == "10.0.0.2:4301");
}

TEST_CASE("The saved document names modes and tie-breaks as text") {
    NodeConfig cfg;
    InterfaceConfig ic;
    ic.mode = InterfaceMode::AccessPoint;
    cfg.interfaces.push_back(ic);
    const nlohmann::json j = nlohmann::json::parse(config_to_json(cfg));
    CHECK(j.at("tie_break") == "prefer_existing");
    CHECK(j.at("interfaces").at(0).at("mode") == "access_point");
}

TEST_CASE("Missing keys keep their values, unknown keys are ignored") {
    NodeConfig cfg;
    cfg.default_ttl = 9;
    REQUIRE(config_from_json(R"({"max_hops": 5, "colour": "green"})", cfg));
    CHECK(cfg.max_hops == 5);
    CHECK(cfg.default_ttl == 9);
}

TEST_CASE("A bad document is rejected whole and leaves the config unchanged") {
    NodeConfig cfg;
    cfg.max_hops = 7;
    const char* bad[] = {
        "not json",
        "[1, 2]",
        R"({"max_hops": "lots"})",
        R"({"max_hops": 300})",
        R"({"default_ttl": -1})",
        R"({"route_capacity": 1.5})",
        R"({"auto_announce": 1})",
        R"({"tie_break": "random"})",
        R"({"interfaces": {}})",
        R"({"interfaces": [{"mode": "mesh"}]})",
        R"({"interfaces": [{"peers": [42]}]})",
        R"({"max_hops": 3, "interfaces": [{"listen_port": 70000}]})",
    };
    for (const char* doc : bad) {
        CAPTURE(doc);
        CHECK_FALSE(config_from_json(doc, cfg));
        CHECK(cfg.max_hops == 7);
    }
}

TEST_CASE("Loaded values are clamped to the profile and wire limits") {
    NodeConfig cfg;
    REQUIRE(config_from_json(R"({"route_capacity": 60000, "fragment_size": 250, "max_hops": 0})", cfg));
    CHECK(cfg.route_capacity == Profile::ROUTE_SLOTS);
    CHECK(cfg.fragment_size == 200);
    CHECK(cfg.max_hops == 1);
}

TEST_CASE("parse_peer() needs host:port with a port in 1..65535") {
    etl::string<64> host;
    uint16_t port = 0;
    REQUIRE(parse_peer("192.168.1.9:4242", host, port));
    CHECK(std::string(host.c_str()) == "192.168.1.9");
    CHECK(port == 4242);
    REQUIRE(parse_peer("[::1]:80", host, port));
    CHECK(std::string(host.c_str()) == "[::1]");

    CHECK_FALSE(parse_peer("nohost", host, port));
    CHECK_FALSE(parse_peer(":4242", host, port));
    CHECK_FALSE(parse_peer("h:0", host, port));
    CHECK_FALSE(parse_peer("h:65536", host, port));
    CHECK_FALSE(parse_peer("h:12x", host, port));
    CHECK_FALSE(parse_peer("h:", host, port));
    CHECK_FALSE(parse_peer(nullptr, host, port));
}

TEST_CASE("clamp() keeps second counts convertible to milliseconds") {
    NodeConfig cfg;
    cfg.announce_interval_s = 5000000;
    cfg.identity_horizon_s  = UINT32_MAX;
    cfg.transfer_timeout_s  = NodeConfig::MAX_SECONDS + 1;
    cfg.duplicate_window_s  = NodeConfig::MAX_SECONDS;
    cfg.fragment_capacity   = 0;
    cfg.clamp();
    CHECK(cfg.announce_interval_s == NodeConfig::MAX_SECONDS);
    CHECK(cfg.identity_horizon_s == NodeConfig::MAX_SECONDS);
    CHECK(cfg.transfer_timeout_s == NodeConfig::MAX_SECONDS);
    CHECK(cfg.duplicate_window_s == NodeConfig::MAX_SECONDS);
    CHECK(cfg.fragment_capacity == Profile::FRAGMENT_SLOTS);
    CHECK(static_cast<uint64_t>(cfg.transfer_timeout_s) * 1000u <= UINT32_MAX);
}
