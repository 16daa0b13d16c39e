#include <doctest/doctest.h>
#include <string>
#include <vector>
#include "mycorrhiza/hash.hpp"
#include "mycorrhiza/packet.hpp"

using namespace mycorrhiza;

static Address addr(uint8_t fill) {
    Address a;
    a.bytes.fill(fill);
    return a;
}

TEST_CASE("Header layout is 32 bytes, big-endian length, truncated SHA-256 hash") {
    PacketHeader h;
    h.flags       = FLAG_PRIORITY;
    h.ttl         = 7;
    h.hop_count   = 2;
    h.type        = PacketType::Data;
    h.destination = addr(0xAB);

    const std::string text = "hello";
    std::vector<uint8_t> wire;
    REQUIRE(encode(h, reinterpret_cast<const uint8_t*>(text.data()), text.size(), nullptr, wire));

    REQUIRE(wire.size() == HEADER_SIZE + text.size());
    CHECK(wire[0] == FLAG_PRIORITY);
    CHECK(wire[1] == 7);
    CHECK(wire[2] == 2);
    CHECK(wire[3] == 0x01);
    for (size_t i = 4; i < 20; ++i) CHECK(wire[i] == 0xAB);
    CHECK(wire[20] == 0x00);
    CHECK(wire[21] == 0x05);

    const Digest d = sha256(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    for (size_t i = 0; i < PAYLOAD_HASH_SIZE; ++i) CHECK(wire[22 + i] == d[i]);
    CHECK(wire[30] == 0);
    CHECK(wire[31] == 0);
}

TEST_CASE("decode() restores every field and owns the payload") {
    PacketHeader h;
    h.flags       = FLAG_ENCRYPTED | FLAG_FRAGMENTED;
    h.type        = PacketType::Announce;
    h.destination = addr(0x11);
    const uint8_t body[3] = {1, 2, 3};
    std::vector<uint8_t> wire;
    REQUIRE(encode(h, body, sizeof(body), nullptr, wire));

    Packet p;
    REQUIRE(decode(wire.data(), wire.size(), p) == DecodeError::None);
    CHECK(p.header.type == PacketType::Announce);
    CHECK(p.header.destination == addr(0x11));
    CHECK(p.header.is_encrypted());
    CHECK(p.header.is_fragmented());
    CHECK_FALSE(p.header.is_signed());
    CHECK(p.header.payload_len == 3);
    CHECK(p.payload == std::vector<uint8_t>{1, 2, 3});
    CHECK_FALSE(p.has_signature);
}

TEST_CASE("Signed packets carry a 64-byte trailer") {
    PacketHeader h;
    h.destination = addr(0x22);
    Signature sig;
    for (size_t i = 0; i < sig.size(); ++i) sig[i] = static_cast<uint8_t>(i);
    const uint8_t body[2] = {9, 9};

    std::vector<uint8_t> wire;
    REQUIRE(encode(h, body, sizeof(body), &sig, wire));
    CHECK(wire.size() == HEADER_SIZE + 2 + SIGNATURE_SIZE);
    CHECK((wire[0] & FLAG_SIGNED) != 0);

    Packet p;
    REQUIRE(decode(wire.data(), wire.size(), p) == DecodeError::None);
    CHECK(p.has_signature);
    CHECK(p.signature == sig);
}

TEST_CASE("encode() refuses SIGNED without a signature and clears reserved bits") {
    PacketHeader h;
    h.flags = FLAG_SIGNED;
    std::vector<uint8_t> wire;
    CHECK_FALSE(encode(h, nullptr, 0, nullptr, wire));
    CHECK(wire.empty());

    h.flags = FLAG_RESERVED;
    REQUIRE(encode(h, nullptr, 0, nullptr, wire));
    CHECK(wire[0] == 0);
}

TEST_CASE("encode() rejects payloads beyond 65535 bytes") {
    std::vector<uint8_t> big(MAX_PAYLOAD + 1, 0x5A);
    std::vector<uint8_t> wire;
    CHECK_FALSE(encode(PacketHeader{}, big.data(), big.size(), nullptr, wire));
}

TEST_CASE("decode() reports truncation, length and hash errors") {
    const uint8_t body[4] = {1, 2, 3, 4};
    std::vector<uint8_t> wire;
    REQUIRE(encode(PacketHeader{}, body, sizeof(body), nullptr, wire));
    Packet p;

    SUBCASE("shorter than a header") {
        CHECK(decode(wire.data(), 31, p) == DecodeError::Truncated);
        CHECK(decode(nullptr, 0, p) == DecodeError::Truncated);
    }
    SUBCASE("payload_len disagrees with the bytes present") {
        CHECK(decode(wire.data(), wire.size() - 1, p) == DecodeError::LengthMismatch);
        wire.push_back(0);
        CHECK(decode(wire.data(), wire.size(), p) == DecodeError::LengthMismatch);
    }
    SUBCASE("header claims a huge payload") {
        wire[20] = 0xFF;
        wire[21] = 0xFF;
        CHECK(decode(wire.data(), wire.size(), p) == DecodeError::LengthMismatch);
    }
    SUBCASE("SIGNED flag without the trailer") {
        wire[0] |= FLAG_SIGNED;
        CHECK(decode(wire.data(), wire.size(), p) == DecodeError::LengthMismatch);
    }
    SUBCASE("payload altered in flight") {
        wire[HEADER_SIZE] ^= 0xFF;
        CHECK(decode(wire.data(), wire.size(), p) == DecodeError::HashMismatch);
    }
}

TEST_CASE("Reserved flag bits are ignored on receipt") {
    std::vector<uint8_t> wire;
    REQUIRE(encode(PacketHeader{}, nullptr, 0, nullptr, wire));
    wire[0] |= 0x0F;
    Packet p;
    REQUIRE(decode(wire.data(), wire.size(), p) == DecodeError::None);
    CHECK(p.header.flags == 0);
}

TEST_CASE("increment_hop() saturates hop_count and clamps ttl") {
    PacketHeader h;
    h.ttl = 1;
    h.hop_count = 0xFE;
    increment_hop(h);
    CHECK(h.ttl == 0);
    CHECK(h.hop_count == 0xFF);
    increment_hop(h);
    CHECK(h.ttl == 0);
    CHECK(h.hop_count == 0xFF);
}

TEST_CASE("Signed bytes do not change when a forwarder bumps ttl and hop_count") {
    PacketHeader h;
    h.destination = addr(0x33);
    const uint8_t body[2] = {4, 2};

    std::vector<uint8_t> before, after;
    signing_data(h, body, sizeof(body), before);
    increment_hop(h);
    increment_hop(h);
    signing_data(h, body, sizeof(body), after);
    CHECK(before == after);

    h.destination = addr(0x34);
    signing_data(h, body, sizeof(body), after);
    CHECK(before != after);
}

TEST_CASE("Zero-length payloads round-trip") {
    std::vector<uint8_t> wire;
    REQUIRE(encode(PacketHeader{}, nullptr, 0, nullptr, wire));
    CHECK(wire.size() == HEADER_SIZE);
    Packet p;
    REQUIRE(decode(wire.data(), wire.size(), p) == DecodeError::None);
    CHECK(p.payload.empty());
}

TEST_CASE("Sha256 fed in pieces matches the one-shot digest") {
    const std::string text = "abc";
    const Digest whole = sha256(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    CHECK(whole[0] == 0xBA);
    CHECK(whole[1] == 0x78);
    CHECK(whole[31] == 0xAD);

    Sha256 h;
    h.update(reinterpret_cast<const uint8_t*>("a"), 1);
    h.update(nullptr, 0);
    h.update(reinterpret_cast<const uint8_t*>("bc"), 2);
    CHECK(h.finish() == whole);

    for (int i = 0; i < 64; ++i) {
        Sha256 unfinished;                           // context released without finish()
        unfinished.update(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    }
}
