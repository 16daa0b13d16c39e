#include <doctest/doctest.h>
#include <string>
#include <vector>
#include <sys/socket.h>
#include <unistd.h>
#include "mycorrhiza/file_bridge.hpp"
#include "mycorrhiza/kiss.hpp"
#include "serial_io.hpp"
#include "uploader.hpp"

using namespace mycorrhiza;

// A connected socket pair stands in for the serial port: the uploader owns
// one end, the test plays the device on the other.
struct FakePort {
    int host = -1;
    int device = -1;

    FakePort() {
        int sv[2];
        REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);
        host = sv[0];
        device = sv[1];
    }
    ~FakePort() {
        close_serial(host);
        close_serial(device);
    }

    void reply(kiss::Command c, const std::vector<uint8_t>& payload = {}) {
        REQUIRE(write_frame(device, c, payload));
    }

    // Everything the host wrote so far, decoded.
    std::vector<kiss::Frame> written() {
        std::vector<kiss::Frame> frames;
        kiss::Decoder dec;
        uint8_t buf[512];
        for (;;) {
            const ssize_t n = ::recv(device, buf, sizeof(buf), MSG_DONTWAIT);
            if (n <= 0) break;
            for (ssize_t i = 0; i < n; ++i) {
                kiss::Frame f;
                kiss::Error e = kiss::Error::None;
                if (dec.feed(buf[i], f, e) == kiss::Feed::Frame) frames.push_back(f);
            }
        }
        return frames;
    }
};

static Address dest() {
    Address a;
    a.bytes.fill(0x3D);
    return a;
}

TEST_CASE("An upload walks FILE_INFO, FILE_START, chunks and FILE_END") {
    FakePort port;
    port.reply(kiss::Command::FileReady, {0x00, 0x02});
    port.reply(kiss::Command::FileReady);
    port.reply(kiss::Command::ChunkAck, {0x00, 0x00});
    const std::string chatter = "MSG:unknown:hi\n";
    REQUIRE(::write(port.device, chatter.data(), chatter.size()) == static_cast<ssize_t>(chatter.size()));
    port.reply(kiss::Command::ChunkAck, {0x00, 0x01});

    kiss::StreamDemux demux;
    Uploader up(port.host, demux);
    std::vector<std::string> lines;
    up.on_line([&](const std::string& l) { lines.push_back(l); });

    std::vector<uint8_t> data(300);
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<uint8_t>(i);
    const UploadResult res = up.send(dest(), "f.bin", data);

    CHECK(res.ok());
    CHECK(res.fragment_count == 2);
    CHECK(res.chunks == 2);
    CHECK(res.chunk_writes == 2);
    CHECK(lines == std::vector<std::string>{"MSG:unknown:hi"});

    const std::vector<kiss::Frame> sent = port.written();
    REQUIRE(sent.size() == 5);
    CHECK(sent[0].command == static_cast<uint8_t>(kiss::Command::FileInfo));
    CHECK(sent[1].command == static_cast<uint8_t>(kiss::Command::FileStart));
    CHECK(sent[0].payload == sent[1].payload);

    FileOffer offer;
    REQUIRE(parse_file_offer(sent[0].payload.data(), sent[0].payload.size(), offer));
    CHECK(offer.destination == dest());
    CHECK(std::string(offer.filename.c_str()) == "f.bin");
    CHECK(offer.size == 300);

    CHECK(sent[2].command == static_cast<uint8_t>(kiss::Command::FileChunk));
    REQUIRE(sent[2].payload.size() == 2 + Uploader::CHUNK_SIZE);
    CHECK(sent[2].payload[1] == 0);
    CHECK(sent[2].payload[2] == 0);
    REQUIRE(sent[3].payload.size() == 2 + 100);
    CHECK(sent[3].payload[1] == 1);
    CHECK(sent[3].payload[2] == 200);
    CHECK(sent[4].command == static_cast<uint8_t>(kiss::Command::FileEnd));
    CHECK(sent[4].payload.empty());
}

TEST_CASE("A silent device times the upload out after FILE_INFO") {
    FakePort port;
    kiss::StreamDemux demux;
    UploadOptions opts;
    opts.reply_timeout_ms = 100;
    Uploader up(port.host, demux, opts);

    const UploadResult res = up.send(dest(), "f.bin", std::vector<uint8_t>(10, 1));
    CHECK(res.error == TransferError::TransferTimeout);
    CHECK_FALSE(res.io_error);
    const std::vector<kiss::Frame> sent = port.written();
    REQUIRE(sent.size() == 1);
    CHECK(sent[0].command == static_cast<uint8_t>(kiss::Command::FileInfo));
}

TEST_CASE("Unacknowledged chunks are resent until the retries run out") {
    FakePort port;
    port.reply(kiss::Command::FileReady, {0x00, 0x01});
    port.reply(kiss::Command::FileReady);

    kiss::StreamDemux demux;
    UploadOptions opts;
    opts.retransmit_ms = 20;
    opts.max_retries   = 1;
    Uploader up(port.host, demux, opts);

    const UploadResult res = up.send(dest(), "f.bin", std::vector<uint8_t>(10, 1));
    CHECK(res.error == TransferError::RetriesExhausted);
    CHECK(res.chunk_writes == 2);

    const std::vector<kiss::Frame> sent = port.written();
    REQUIRE(sent.size() == 4);                         // INFO, START, CHUNK, CHUNK
    CHECK(sent[3].command == static_cast<uint8_t>(kiss::Command::FileChunk));
}

TEST_CASE("An empty file goes straight from FILE_START to FILE_END") {
    FakePort port;
    port.reply(kiss::Command::FileReady, {0x00, 0x01});
    port.reply(kiss::Command::FileReady);

    kiss::StreamDemux demux;
    Uploader up(port.host, demux);
    const UploadResult res = up.send(dest(), "empty", {});
    CHECK(res.ok());
    CHECK(res.chunks == 0);

    const std::vector<kiss::Frame> sent = port.written();
    REQUIRE(sent.size() == 3);
    CHECK(sent[2].command == static_cast<uint8_t>(kiss::Command::FileEnd));
}

TEST_CASE("A name longer than 255 bytes is refused before anything is written") {
    FakePort port;
    kiss::StreamDemux demux;
    Uploader up(port.host, demux);
    const UploadResult res = up.send(dest(), std::string(256, 'n'), {1, 2, 3});
    CHECK(res.error == TransferError::TooLarge);
    CHECK(port.written().empty());
}
