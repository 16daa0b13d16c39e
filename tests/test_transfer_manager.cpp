#include <doctest/doctest.h>
#include <memory>
#include <vector>
#include "mycorrhiza/fragment.hpp"
#include "mycorrhiza/transfer_manager.hpp"

using namespace mycorrhiza;

static TransferId tid(uint8_t fill) {
    TransferId id;
    id.bytes.fill(fill);
    return id;
}

static std::vector<uint8_t> frag(const TransferId& id, uint8_t index, uint8_t flags,
                                 std::vector<uint8_t> data) {
    std::vector<uint8_t> out;
    build_fragment(id, index, flags, data.data(), data.size(), out);
    return out;
}

// The fragment pool makes a Reassembler too big for a comfortable stack frame.
static std::unique_ptr<Reassembler> reassembler(size_t capacity = Profile::TRANSFER_SLOTS,
                                                uint32_t timeout_ms = Reassembler::TIMEOUT_MS_DEFAULT) {
    return std::make_unique<Reassembler>(capacity, timeout_ms);
}

static FragmentOutcome push(Reassembler& r, const std::vector<uint8_t>& f, uint32_t now = 0,
                            std::vector<uint8_t>* out = nullptr) {
    std::vector<uint8_t> scratch;
    return r.on_fragment(f.data(), f.size(), now, Address{}, out ? *out : scratch);
}

TEST_CASE("Fragments in order complete the transfer and free its state") {
    auto r = reassembler();
    const TransferId id = tid(1);
    std::vector<uint8_t> stream;

    FragmentOutcome o = push(*r, frag(id, 0, 0, {1, 2}));
    CHECK(o.kind == FragmentOutcome::Kind::Stored);
    CHECK(o.progress.received == 1);
    CHECK(o.progress.expected == 0);

    o = push(*r, frag(id, 1, FRAG_FINAL, {3}), 0, &stream);
    CHECK(o.kind == FragmentOutcome::Kind::Complete);
    CHECK(o.progress.expected == 2);
    CHECK(stream == std::vector<uint8_t>{1, 2, 3});
    CHECK(r->active() == 0);
    CHECK(r->free_slots() == Profile::FRAGMENT_SLOTS);
}

TEST_CASE("Out of order arrival waits for the gap and reports it") {
    auto r = reassembler();
    const TransferId id = tid(2);
    std::vector<uint8_t> stream;

    CHECK(push(*r, frag(id, 2, FRAG_FINAL, {30})).kind == FragmentOutcome::Kind::Incomplete);
    FragmentOutcome o = push(*r, frag(id, 0, 0, {10}));
    CHECK(o.kind == FragmentOutcome::Kind::Incomplete);
    CHECK(o.error == TransferError::IncompleteTransfer);
    CHECK(o.progress.received == 2);
    CHECK(o.progress.expected == 3);

    o = push(*r, frag(id, 1, 0, {20}), 0, &stream);
    CHECK(o.kind == FragmentOutcome::Kind::Complete);
    CHECK(stream == std::vector<uint8_t>{10, 20, 30});
}

TEST_CASE("Duplicate fragments do not change the received count") {
    auto r = reassembler();
    const TransferId id = tid(3);
    push(*r, frag(id, 0, 0, {1}));
    const FragmentOutcome o = push(*r, frag(id, 0, 0, {1}));
    CHECK(o.kind == FragmentOutcome::Kind::Stored);
    CHECK(o.progress.received == 1);
}

TEST_CASE("An empty FINAL marker fixes the last index but is not data") {
    auto r = reassembler();
    const TransferId id = tid(4);
    std::vector<uint8_t> stream;
    push(*r, frag(id, 0, 0, {1, 1}));
    push(*r, frag(id, 1, 0, {2, 2}));

    SUBCASE("marker on an index already holding data") {
        const FragmentOutcome o = push(*r, frag(id, 1, FRAG_FINAL, {}), 0, &stream);
        CHECK(o.kind == FragmentOutcome::Kind::Complete);
        CHECK(o.progress.received == 2);
        CHECK(o.progress.expected == 2);
        CHECK(stream == std::vector<uint8_t>{1, 1, 2, 2});
    }
    SUBCASE("marker past the stored data leaves a gap") {
        const FragmentOutcome o = push(*r, frag(id, 2, FRAG_FINAL, {}), 0, &stream);
        CHECK(o.kind == FragmentOutcome::Kind::Incomplete);
        CHECK(o.error == TransferError::IncompleteTransfer);
        CHECK(o.progress.received == 2);
        CHECK(o.progress.expected == 3);
        CHECK(r->free_slots() == Profile::FRAGMENT_SLOTS - 2);
    }
}

TEST_CASE("A marker that overtakes its data waits for the data") {
    auto r = reassembler();
    const TransferId id = tid(8);
    std::vector<uint8_t> stream;
    const std::vector<uint8_t> head(FRAGMENT_DATA_MAX, 0x11);
    const std::vector<uint8_t> tail(50, 0x22);

    push(*r, frag(id, 0, FRAG_META, head));
    FragmentOutcome o = push(*r, frag(id, 1, FRAG_FINAL, {}), 0, &stream);
    CHECK(o.kind == FragmentOutcome::Kind::Incomplete);
    CHECK(o.progress.received == 1);
    CHECK(stream.empty());

    o = push(*r, frag(id, 1, 0, tail), 0, &stream);
    REQUIRE(o.kind == FragmentOutcome::Kind::Complete);
    CHECK(o.has_meta);
    REQUIRE(stream.size() == FRAGMENT_DATA_MAX + 50);
    CHECK(stream.back() == 0x22);
}

TEST_CASE("Losing the last data fragment ends in a timeout, not a short stream") {
    auto r = reassembler(4, 1000);
    const TransferId id = tid(9);
    push(*r, frag(id, 0, 0, {1}), 0);
    const FragmentOutcome o = push(*r, frag(id, 1, FRAG_FINAL, {}), 0);   // data for 1 never came
    CHECK(o.kind == FragmentOutcome::Kind::Incomplete);

    std::vector<TransferProgress> timed_out;
    CHECK(r->sweep(1001, [&](const TransferProgress& p) { timed_out.push_back(p); }) == 1);
    REQUIRE(timed_out.size() == 1);
    CHECK(timed_out[0].received == 1);
    CHECK(timed_out[0].expected == 2);
}

TEST_CASE("Fragments that contradict the known final index are malformed") {
    auto r = reassembler();
    const TransferId id = tid(5);

    SUBCASE("index beyond the final") {
        push(*r, frag(id, 2, FRAG_FINAL, {1}));
        const FragmentOutcome o = push(*r, frag(id, 3, 0, {1}));
        CHECK(o.kind == FragmentOutcome::Kind::Rejected);
        CHECK(o.error == TransferError::Malformed);
    }
    SUBCASE("final below a stored index") {
        push(*r, frag(id, 4, 0, {1}));
        const FragmentOutcome o = push(*r, frag(id, 1, FRAG_FINAL, {1}));
        CHECK(o.error == TransferError::Malformed);
    }
    SUBCASE("unparsable payload") {
        const std::vector<uint8_t> junk(5, 0);
        const FragmentOutcome o = push(*r, junk);
        CHECK(o.kind == FragmentOutcome::Kind::Rejected);
        CHECK(o.error == TransferError::Malformed);
    }
}

TEST_CASE("Metadata flag on index 0 is reported on completion") {
    auto r = reassembler();
    const FragmentOutcome o = push(*r, frag(tid(6), 0, FRAG_FINAL | FRAG_META, {0, 0}));
    CHECK(o.kind == FragmentOutcome::Kind::Complete);
    CHECK(o.has_meta);
}

TEST_CASE("begin() refuses an id that is already open") {
    auto r = reassembler();
    CHECK(r->begin(tid(7), 0) == TransferError::None);
    CHECK(r->begin(tid(7), 5) == TransferError::DuplicateTransferStart);
    CHECK(r->active() == 1);
}

TEST_CASE("A full registry evicts the least recently active transfer") {
    auto r = reassembler(2);
    push(*r, frag(tid(1), 0, 0, {1}), 0);
    push(*r, frag(tid(2), 0, 0, {1}), 1);
    push(*r, frag(tid(1), 1, 0, {1}), 2);       // 2 is now the oldest

    const FragmentOutcome o = push(*r, frag(tid(3), 0, 0, {1}), 3);
    CHECK(o.evicted);
    CHECK(o.evicted_id == tid(2));
    CHECK(o.evicted_progress.id == tid(2));
    CHECK(o.evicted_progress.received == 1);
    CHECK(r->active() == 2);
    CHECK_FALSE(r->progress(tid(2)).has_value());
    CHECK(r->progress(tid(1))->received == 2);
}

TEST_CASE("An exhausted fragment pool evicts another transfer's slots") {
    auto r = reassembler();
    const std::vector<uint8_t> chunk(FRAGMENT_DATA_MAX, 0xAA);
    const size_t per_transfer = Profile::FRAGMENT_SLOTS / 2;
    REQUIRE(per_transfer <= MAX_FRAGMENTS);
    for (size_t i = 0; i < per_transfer; ++i) push(*r, frag(tid(1), static_cast<uint8_t>(i), 0, chunk), 0);
    for (size_t i = 0; i < per_transfer; ++i) push(*r, frag(tid(2), static_cast<uint8_t>(i), 0, chunk), 1);
    REQUIRE(r->free_slots() == 0);

    const FragmentOutcome o = push(*r, frag(tid(3), 0, 0, chunk), 2);
    CHECK(o.kind == FragmentOutcome::Kind::Stored);
    CHECK(o.evicted);
    CHECK(o.evicted_id == tid(1));
    CHECK(o.evicted_progress.received == per_transfer);
    CHECK(o.evicted_progress.expected == 0);
    CHECK(r->free_slots() == per_transfer - 1);
}

TEST_CASE("sweep() times out transfers idle strictly longer than the timeout") {
    auto r = reassembler(4, 1000);
    push(*r, frag(tid(1), 0, 0, {1}), 0);
    push(*r, frag(tid(1), 1, 0, {1}), 0);
    push(*r, frag(tid(2), 0, 0, {1}), 500);

    std::vector<TransferProgress> timed_out;
    auto collect = [&](const TransferProgress& p) { timed_out.push_back(p); };

    CHECK(r->sweep(1000, collect) == 0);
    CHECK(r->sweep(1001, collect) == 1);
    REQUIRE(timed_out.size() == 1);
    CHECK(timed_out[0].id == tid(1));
    CHECK(timed_out[0].received == 2);
    CHECK(r->active() == 1);
    CHECK(r->sweep(1501, collect) == 1);
    CHECK(r->active() == 0);
}

TEST_CASE("cancel() frees the transfer and its slots") {
    auto r = reassembler();
    push(*r, frag(tid(1), 0, 0, {1}));
    CHECK(r->cancel(tid(1)));
    CHECK_FALSE(r->cancel(tid(1)));
    CHECK(r->free_slots() == Profile::FRAGMENT_SLOTS);
}

TEST_CASE("Shrinking the registry drops the oldest transfers") {
    auto r = reassembler(4);
    for (uint8_t i = 1; i <= 4; ++i) push(*r, frag(tid(i), 0, 0, {1}), i);
    r->set_capacity(2);
    CHECK(r->active() == 2);
    CHECK(r->progress(tid(4)).has_value());
    CHECK_FALSE(r->progress(tid(1)).has_value());
}

// ---------- sender ----------

static std::vector<std::vector<uint8_t>> items(size_t n) {
    std::vector<std::vector<uint8_t>> v;
    for (size_t i = 0; i < n; ++i) v.push_back({static_cast<uint8_t>(i)});
    return v;
}

TEST_CASE("Stop-and-wait sender moves on only after an ack") {
    TransferSender s(3000, 5, 1);
    REQUIRE(s.start(tid(1), items(3)));
    CHECK(s.next_to_send(0) == std::optional<uint16_t>(0));
    CHECK_FALSE(s.next_to_send(10).has_value());
    CHECK(s.acknowledge(0));
    CHECK(s.next_to_send(20) == std::optional<uint16_t>(1));
    CHECK(s.acknowledge(1));
    CHECK(s.next_to_send(30) == std::optional<uint16_t>(2));
    CHECK(s.acknowledge(2));
    CHECK(s.complete());
    CHECK_FALSE(s.active());
    CHECK_FALSE(s.next_to_send(40).has_value());
    CHECK(s.error() == TransferError::None);
}

TEST_CASE("A window keeps several items in flight") {
    TransferSender s(3000, 5, 2);
    REQUIRE(s.start(tid(1), items(3)));
    CHECK(s.next_to_send(0) == std::optional<uint16_t>(0));
    CHECK(s.next_to_send(0) == std::optional<uint16_t>(1));
    CHECK_FALSE(s.next_to_send(0).has_value());
    s.acknowledge(1);
    CHECK(s.next_to_send(1) == std::optional<uint16_t>(2));
    CHECK(s.acked() == 1);
}

TEST_CASE("Unacknowledged items are resent until the retries run out") {
    TransferSender s(3000, 2, 1);
    REQUIRE(s.start(tid(1), items(1)));
    CHECK(s.next_to_send(0) == std::optional<uint16_t>(0));
    CHECK_FALSE(s.next_to_send(2999).has_value());
    CHECK(s.next_to_send(3000) == std::optional<uint16_t>(0));
    CHECK(s.next_to_send(6000) == std::optional<uint16_t>(0));
    CHECK_FALSE(s.next_to_send(9000).has_value());
    CHECK(s.error() == TransferError::RetriesExhausted);
    CHECK_FALSE(s.active());
}

TEST_CASE("cancel() stops the sender for good") {
    TransferSender s;
    REQUIRE(s.start(tid(1), items(2)));
    s.next_to_send(0);
    s.cancel();
    CHECK(s.error() == TransferError::Cancelled);
    CHECK_FALSE(s.active());
    CHECK(s.total() == 0);
    CHECK_FALSE(s.next_to_send(5000).has_value());
    CHECK_FALSE(s.acknowledge(0));
}

TEST_CASE("start() needs an idle sender and 1 to 256 items") {
    TransferSender s;
    CHECK_FALSE(s.start(tid(1), {}));
    CHECK_FALSE(s.start(tid(1), items(MAX_FRAGMENTS + 1)));
    REQUIRE(s.start(tid(1), items(1)));
    CHECK_FALSE(s.start(tid(2), items(1)));
    CHECK(s.id() == tid(1));
}
