#include <doctest/doctest.h>
#include <string>
#include <vector>
#include "mycorrhiza/kiss.hpp"

using namespace mycorrhiza;
using namespace mycorrhiza::kiss;

// Feed a whole buffer, collecting frames and errors in order.
struct Collected {
    std::vector<Frame> frames;
    std::vector<Error> errors;          // one per Feed::Error, UnknownCommand per frame
};

static Collected decode_all(Decoder& d, const std::vector<uint8_t>& bytes) {
    Collected c;
    for (uint8_t b : bytes) {
        Frame f;
        Error e = Error::None;
        const Feed r = d.feed(b, f, e);
        if (r == Feed::Frame) {
            c.frames.push_back(f);
            if (e != Error::None) c.errors.push_back(e);
        } else if (r == Feed::Error) {
            c.errors.push_back(e);
        }
    }
    return c;
}

static std::vector<Item> demux_all(StreamDemux& d, const std::vector<uint8_t>& bytes) {
    std::vector<Item> items;
    Item it;
    for (uint8_t b : bytes) {
        if (d.feed(b, it)) items.push_back(it);
    }
    return items;
}

static std::vector<uint8_t> text(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

TEST_CASE("encode() escapes FEND and FESC inside the payload") {
    const std::vector<uint8_t> payload = {0x01, FEND, 0x02, FESC, 0x03};
    std::vector<uint8_t> wire;
    encode(Command::FileChunk, payload.data(), payload.size(), wire);
    const std::vector<uint8_t> expected = {FEND, 0x12, 0x01, FESC, TFEND, 0x02,
                                           FESC, TFESC, 0x03, FEND};
    CHECK(wire == expected);
}

TEST_CASE("Decoder returns the command and the unescaped payload") {
    const std::vector<uint8_t> payload = {FEND, FESC, 0x00, 0xFF};
    std::vector<uint8_t> wire;
    encode(Command::FileData, payload.data(), payload.size(), wire);

    Decoder d;
    const Collected c = decode_all(d, wire);
    REQUIRE(c.frames.size() == 1);
    CHECK(c.errors.empty());
    CHECK(c.frames[0].command == static_cast<uint8_t>(Command::FileData));
    CHECK(c.frames[0].payload == payload);
}

TEST_CASE("Back-to-back FENDs separate frames and yield nothing themselves") {
    Decoder d;
    const std::vector<uint8_t> wire = {FEND, FEND, FEND, 0x13, FEND, FEND, 0x18, 0xAA, FEND};
    const Collected c = decode_all(d, wire);
    REQUIRE(c.frames.size() == 2);
    CHECK(c.frames[0].command == 0x13);
    CHECK(c.frames[0].payload.empty());
    CHECK(c.frames[1].command == 0x18);
    CHECK(c.frames[1].payload == std::vector<uint8_t>{0xAA});
}

TEST_CASE("A closing FEND shared with the next frame still opens it") {
    Decoder d;
    const std::vector<uint8_t> wire = {FEND, 0x15, 0x00, 0x01, FEND, 0x15, 0x00, 0x02, FEND};
    const Collected c = decode_all(d, wire);
    REQUIRE(c.frames.size() == 2);
    CHECK(c.frames[1].payload == std::vector<uint8_t>{0x00, 0x02});
}

TEST_CASE("Bytes outside a frame are ignored") {
    Decoder d;
    const std::vector<uint8_t> wire = {'h', 'i', FEND, 0x14, FEND, 'x', 0x14, FEND};
    const Collected c = decode_all(d, wire);
    REQUIRE(c.frames.size() == 1);
    CHECK(d.state == Decoder::State::InFrame);
}

TEST_CASE("A bad escape drops the frame and the decoder resynchronizes") {
    Decoder d;
    SUBCASE("unknown byte after FESC") {
        const std::vector<uint8_t> wire = {FEND, 0x12, FESC, 0x41, 0x42, FEND, 0x13, FEND};
        const Collected c = decode_all(d, wire);
        REQUIRE(c.errors.size() == 1);
        CHECK(c.errors[0] == Error::BadEscape);
        REQUIRE(c.frames.size() == 1);
        CHECK(c.frames[0].command == 0x13);
    }
    SUBCASE("FEND straight after FESC") {
        const std::vector<uint8_t> wire = {FEND, 0x12, FESC, FEND};
        const Collected c = decode_all(d, wire);
        REQUIRE(c.errors.size() == 1);
        CHECK(c.errors[0] == Error::BadEscape);
        CHECK(c.frames.empty());
        CHECK(d.state == Decoder::State::Idle);
    }
}

TEST_CASE("Unknown command bytes are delivered but flagged") {
    Decoder d;
    const Collected c = decode_all(d, {FEND, 0x42, 0x01, FEND});
    REQUIRE(c.frames.size() == 1);
    CHECK(c.frames[0].command == 0x42);
    REQUIRE(c.errors.size() == 1);
    CHECK(c.errors[0] == Error::UnknownCommand);
}

TEST_CASE("Frames beyond FRAME_MAX are dropped as overflow") {
    Decoder d;
    std::vector<uint8_t> wire = {FEND, 0x12};
    wire.insert(wire.end(), FRAME_MAX, 0x55);
    wire.push_back(FEND);
    const Collected c = decode_all(d, wire);
    CHECK(c.frames.empty());
    REQUIRE(c.errors.size() == 1);
    CHECK(c.errors[0] == Error::Overflow);
}

TEST_CASE("StreamDemux separates console lines from frames") {
    StreamDemux d;
    std::vector<uint8_t> stream = text("!info\r\n");
    std::vector<uint8_t> frame;
    const uint8_t ack[2] = {0x00, 0x07};
    encode(Command::ChunkAck, ack, sizeof(ack), frame);
    stream.insert(stream.end(), frame.begin(), frame.end());
    const std::vector<uint8_t> tail = text("!peers\n\n");
    stream.insert(stream.end(), tail.begin(), tail.end());

    const std::vector<Item> items = demux_all(d, stream);
    REQUIRE(items.size() == 3);
    CHECK(items[0].kind == Item::Kind::Line);
    CHECK(std::string(items[0].line.c_str()) == "!info");
    CHECK(items[1].kind == Item::Kind::Frame);
    CHECK(items[1].frame.command == static_cast<uint8_t>(Command::ChunkAck));
    CHECK(items[1].frame.payload == std::vector<uint8_t>{0x00, 0x07});
    CHECK(items[2].kind == Item::Kind::Line);
    CHECK(std::string(items[2].line.c_str()) == "!peers");
}

TEST_CASE("Text right after a frame is not mistaken for the next frame") {
    StreamDemux d;
    const std::vector<uint8_t> stream = {FEND, 0x18, FEND, 'o', 'k', '\n'};
    const std::vector<Item> items = demux_all(d, stream);
    REQUIRE(items.size() == 2);
    CHECK(items[0].kind == Item::Kind::Frame);
    CHECK(items[1].kind == Item::Kind::Line);
    CHECK(std::string(items[1].line.c_str()) == "ok");
}

TEST_CASE("An overlong line is reported once and discarded to its end") {
    StreamDemux d;
    std::vector<uint8_t> stream(LINE_MAX + 10, 'a');
    stream.push_back('\n');
    const std::vector<uint8_t> next = text("!routes\n");
    stream.insert(stream.end(), next.begin(), next.end());

    const std::vector<Item> items = demux_all(d, stream);
    REQUIRE(items.size() == 2);
    CHECK(items[0].kind == Item::Kind::Error);
    CHECK(items[0].error == Error::Overflow);
    CHECK(std::string(items[1].line.c_str()) == "!routes");
}

TEST_CASE("A line of exactly LINE_MAX characters is accepted") {
    StreamDemux d;
    std::vector<uint8_t> stream(LINE_MAX, 'b');
    stream.push_back('\n');
    const std::vector<Item> items = demux_all(d, stream);
    REQUIRE(items.size() == 1);
    CHECK(items[0].kind == Item::Kind::Line);
    CHECK(items[0].line.size() == LINE_MAX);
}

TEST_CASE("Command and error names") {
    CHECK(std::string(to_string(Command::FileReady)) == "FILE_READY");
    CHECK(std::string(to_string(Error::BadEscape)) == "bad_escape");
}
