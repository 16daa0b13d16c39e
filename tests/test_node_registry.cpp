#include <doctest/doctest.h>
#include <filesystem>
#include <string>
#include <vector>
#include <stdlib.h>
#include "host_paths.hpp"
#include "node_registry.hpp"
#include "test_support.hpp"

using namespace mycorrhiza;
using namespace mycorrhiza::test;
namespace fs = std::filesystem;

TEST_CASE("parse_node_line() accepts NODE:<32 hex> and normalizes case") {
    std::string addr;
    REQUIRE(parse_node_line("NODE:00112233445566778899AABBCCDDEEFF", addr));
    CHECK(addr == "00112233445566778899aabbccddeeff");

    addr = "unchanged";
    CHECK_FALSE(parse_node_line("PEER:00112233445566778899aabbccddeeff", addr));
    CHECK_FALSE(parse_node_line("NODE:0011", addr));
    CHECK_FALSE(parse_node_line("NODE:", addr));
    CHECK_FALSE(parse_node_line(" NODE:00112233445566778899aabbccddeeff", addr));
    CHECK(addr == "unchanged");
}

TEST_CASE("The device registry round-trips through devices.json") {
    TempDir tmp;
    const fs::path file = tmp.path / "devices.json";
    const std::vector<NodeInfo> nodes = {
        {"00112233445566778899aabbccddeeff", "/dev/ttyACM0", true},
        {"", "/dev/ttyUSB3", false},
    };
    REQUIRE(save_registry(nodes, file));

    auto back = load_registry(file);
    REQUIRE(back.has_value());
    REQUIRE(back->size() == 2);
    CHECK((*back)[0].address == nodes[0].address);
    CHECK((*back)[0].dev_path == "/dev/ttyACM0");
    CHECK((*back)[0].online);
    CHECK((*back)[1].address.empty());
    CHECK_FALSE((*back)[1].online);
}

TEST_CASE("A missing or malformed registry loads as nothing") {
    TempDir tmp;
    CHECK_FALSE(load_registry(tmp.path / "absent.json").has_value());

    const fs::path file = tmp.path / "devices.json";
    REQUIRE(atomic_write(file, std::string("{not json")));
    CHECK_FALSE(load_registry(file).has_value());
    REQUIRE(atomic_write(file, std::string(R"({"address": "x"})")));
    CHECK_FALSE(load_registry(file).has_value());
    REQUIRE(atomic_write(file, std::string(R"([{"address": 5}])")));
    CHECK_FALSE(load_registry(file).has_value());
    REQUIRE(atomic_write(file, std::string("[]")));
    auto empty = load_registry(file);
    REQUIRE(empty.has_value());
    CHECK(empty->empty());
}

TEST_CASE("Online nodes get a stable alias symlink") {
    TempDir tmp;
    setenv("XDG_RUNTIME_DIR", tmp.path.c_str(), 1);
    const std::vector<NodeInfo> nodes = {
        {"3f2a0000000000000000000000000000", "/dev/ttyACM1", true},
        {"9999000000000000000000000000000", "/dev/ttyACM2", false},
    };
    REQUIRE(create_symlinks(nodes));
    REQUIRE(create_symlinks(nodes));                  // replaces the old link

    const fs::path link = tmp.path / "mycorrhiza" / "mycorrhiza-node-3f2a0000";
    CHECK(fs::is_symlink(link));
    CHECK(fs::read_symlink(link) == fs::path("/dev/ttyACM1"));
    CHECK_FALSE(fs::exists(fs::symlink_status(tmp.path / "mycorrhiza" / "mycorrhiza-node-99990000")));
    unsetenv("XDG_RUNTIME_DIR");
}
