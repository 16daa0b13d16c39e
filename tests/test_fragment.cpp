#include <doctest/doctest.h>
#include <string>
#include <vector>
#include "mycorrhiza/fragment.hpp"

using namespace mycorrhiza;

static TransferId tid(uint8_t fill) {
    TransferId id;
    id.bytes.fill(fill);
    return id;
}

static std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

TEST_CASE("Fragment header is id, index, flags, then data") {
    const std::vector<uint8_t> data = {1, 2, 3};
    std::vector<uint8_t> wire;
    build_fragment(tid(0x7E), 4, FRAG_FINAL, data.data(), data.size(), wire);

    REQUIRE(wire.size() == FRAGMENT_HEADER_SIZE + 3);
    for (size_t i = 0; i < ID_SIZE; ++i) CHECK(wire[i] == 0x7E);
    CHECK(wire[16] == 4);
    CHECK(wire[17] == FRAG_FINAL);

    FragmentView f;
    REQUIRE(parse_fragment(wire.data(), wire.size(), f));
    CHECK(f.transfer_id == tid(0x7E));
    CHECK(f.index == 4);
    CHECK(f.is_final());
    CHECK_FALSE(f.has_meta());
    CHECK_FALSE(f.is_marker());
    CHECK(std::vector<uint8_t>(f.data, f.data + f.size) == data);
}

TEST_CASE("parse_fragment() rejects short headers and oversized data") {
    FragmentView f;
    std::vector<uint8_t> wire(FRAGMENT_HEADER_SIZE - 1, 0);
    CHECK_FALSE(parse_fragment(wire.data(), wire.size(), f));
    CHECK_FALSE(parse_fragment(nullptr, 0, f));

    wire.assign(FRAGMENT_HEADER_SIZE + FRAGMENT_DATA_MAX + 1, 0);
    CHECK_FALSE(parse_fragment(wire.data(), wire.size(), f));

    wire.resize(FRAGMENT_HEADER_SIZE);
    wire[17] = FRAG_FINAL;
    REQUIRE(parse_fragment(wire.data(), wire.size(), f));
    CHECK(f.is_marker());
    CHECK(f.data == nullptr);
}

TEST_CASE("Metadata block carries filename, size and mime type") {
    FileMetadata meta;
    meta.filename  = "notes.txt";
    meta.size      = 1234;
    meta.mime_type = "text/plain";

    std::vector<uint8_t> block;
    encode_metadata(meta, block);
    const std::string text = "filename=notes.txt\nsize=1234\nmime_type=text/plain";
    REQUIRE(block.size() == 2 + text.size());
    CHECK(block[0] == 0);
    CHECK(block[1] == text.size());
    CHECK(std::string(block.begin() + 2, block.end()) == text);

    block.push_back('X');                        // first file byte
    FileMetadata back;
    size_t offset = 0;
    REQUIRE(extract_metadata(block.data(), block.size(), back, offset));
    CHECK(offset == 2 + text.size());
    CHECK(std::string(back.filename.c_str()) == "notes.txt");
    CHECK(back.size == 1234);
    CHECK(std::string(back.mime_type.c_str()) == "text/plain");
}

TEST_CASE("extract_metadata() skips unknown keys and bare lines") {
    const std::string text = "colour=blue\nfilename=a.bin\njunk\nsize=7";
    std::vector<uint8_t> block = {0, static_cast<uint8_t>(text.size())};
    block.insert(block.end(), text.begin(), text.end());

    FileMetadata meta;
    size_t offset = 0;
    REQUIRE(extract_metadata(block.data(), block.size(), meta, offset));
    CHECK(std::string(meta.filename.c_str()) == "a.bin");
    CHECK(meta.size == 7);
    CHECK(meta.mime_type.empty());
}

TEST_CASE("extract_metadata() rejects a length running past the stream") {
    std::vector<uint8_t> block = {0, 50, 'a', 'b'};
    FileMetadata meta;
    size_t offset = 0;
    CHECK_FALSE(extract_metadata(block.data(), block.size(), meta, offset));
    CHECK_FALSE(extract_metadata(block.data(), 1, meta, offset));
}

TEST_CASE("fragment_count() rounds up and never returns zero") {
    CHECK(fragment_count(0) == 1);
    CHECK(fragment_count(1) == 1);
    CHECK(fragment_count(200) == 1);
    CHECK(fragment_count(201) == 2);
    CHECK(fragment_count(450, 100) == 5);
    CHECK(fragment_count(450, 0) == 3);          // 0 selects the maximum
}

TEST_CASE("split() numbers fragments and flags the last one") {
    std::vector<uint8_t> file(450);
    for (size_t i = 0; i < file.size(); ++i) file[i] = static_cast<uint8_t>(i);

    std::vector<std::vector<uint8_t>> frags;
    REQUIRE(split(tid(1), file.data(), file.size(), nullptr, 200, frags));
    REQUIRE(frags.size() == 3);

    std::vector<uint8_t> joined;
    for (size_t i = 0; i < frags.size(); ++i) {
        FragmentView f;
        REQUIRE(parse_fragment(frags[i].data(), frags[i].size(), f));
        CHECK(f.transfer_id == tid(1));
        CHECK(f.index == i);
        CHECK(f.is_final() == (i == 2));
        CHECK_FALSE(f.has_meta());
        joined.insert(joined.end(), f.data, f.data + f.size);
    }
    CHECK(frags[2].size() == FRAGMENT_HEADER_SIZE + 50);
    CHECK(joined == file);
}

TEST_CASE("split() puts the metadata block in front and flags index 0") {
    FileMetadata meta;
    meta.filename = "x";
    meta.size     = 3;
    const std::vector<uint8_t> file = bytes_of("abc");

    std::vector<std::vector<uint8_t>> frags;
    REQUIRE(split(tid(2), file.data(), file.size(), &meta, 10, frags));

    std::vector<uint8_t> stream;
    encode_metadata(meta, stream);
    stream.insert(stream.end(), file.begin(), file.end());
    REQUIRE(frags.size() == fragment_count(stream.size(), 10));

    FragmentView first;
    REQUIRE(parse_fragment(frags[0].data(), frags[0].size(), first));
    CHECK(first.has_meta());
    for (size_t i = 1; i < frags.size(); ++i) CHECK((frags[i][17] & FRAG_META) == 0);
}

TEST_CASE("split() refuses an empty stream") {
    std::vector<std::vector<uint8_t>> frags;
    CHECK_FALSE(split(tid(3), nullptr, 0, nullptr, 200, frags));
    CHECK(frags.empty());

    FileMetadata meta;
    meta.filename = "empty.txt";
    REQUIRE(split(tid(3), nullptr, 0, &meta, 200, frags));
    REQUIRE(frags.size() == 1);
    FragmentView f;
    REQUIRE(parse_fragment(frags[0].data(), frags[0].size(), f));
    CHECK(f.is_final());
    CHECK_FALSE(f.is_marker());
}

TEST_CASE("split() refuses files needing more than 256 fragments") {
    std::vector<uint8_t> big(MAX_TRANSFER_BYTES + 1, 0x11);
    std::vector<std::vector<uint8_t>> frags;
    CHECK_FALSE(split(tid(4), big.data(), big.size(), nullptr, 200, frags));
    CHECK(frags.empty());

    big.pop_back();
    REQUIRE(split(tid(4), big.data(), big.size(), nullptr, 200, frags));
    CHECK(frags.size() == MAX_FRAGMENTS);
    CHECK(frags.back()[16] == 255);
}

TEST_CASE("Transfer ids depend on the data and the clock") {
    const std::vector<uint8_t> a = bytes_of("same");
    CHECK_FALSE(make_transfer_id(a.data(), a.size(), 1) == make_transfer_id(a.data(), a.size(), 2));
    CHECK_FALSE(make_transfer_id(a.data(), a.size(), 1).is_zero());
}
