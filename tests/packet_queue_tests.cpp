#define BOOST_TEST_MODULE PacketQueueTests
#include <boost/test/unit_test.hpp>

#include "protocol/protocol.hpp"
#include "world/packet_queue.hpp"
#include <stdexcept>
#include <vector>

using namespace strata::protocol;
using namespace strata::world;

// ============================================================================
// Broadcast queue
// ============================================================================

BOOST_AUTO_TEST_SUITE(BroadcastQueueTests)

BOOST_AUTO_TEST_CASE(TestDrainKeepsArrivalOrderPerChunk) {
    PacketBroadcastQueue queue;
    PacketData a{1}, b{2}, c{3}, d{4}, e{5};

    queue.enqueue(0, 0, a);
    queue.enqueue(1, 0, c);
    queue.enqueue(0, 0, b);
    queue.enqueue(1, 0, {d, e});

    BOOST_CHECK_EQUAL(queue.pending_chunks(), 2u);
    BOOST_CHECK_EQUAL(queue.pending_messages(), 5u);

    auto batches = queue.drain_all();
    BOOST_REQUIRE_EQUAL(batches.size(), 2u);
    BOOST_CHECK(batches.at(chunk_hash(0, 0)) == (std::vector<PacketData>{a, b}));
    BOOST_CHECK(batches.at(chunk_hash(1, 0)) == (std::vector<PacketData>{c, d, e}));
}

BOOST_AUTO_TEST_CASE(TestSecondDrainIsEmpty) {
    PacketBroadcastQueue queue;
    queue.enqueue(3, 3, PacketData{9});
    queue.drain_all();

    BOOST_CHECK(queue.empty());
    BOOST_CHECK(queue.drain_all().empty());
}

BOOST_AUTO_TEST_CASE(TestEmptyBatchIsNoOp) {
    PacketBroadcastQueue queue;
    std::vector<PacketData> none;
    queue.enqueue(0, 0, std::span<const PacketData>(none));

    BOOST_CHECK(queue.empty());
    BOOST_CHECK_EQUAL(queue.pending_chunks(), 0u);
    BOOST_CHECK(queue.drain_all().empty());
}

BOOST_AUTO_TEST_CASE(TestSpanBatchAppendsInOrder) {
    PacketBroadcastQueue queue;
    std::vector<PacketData> batch{{1}, {2}, {3}};
    queue.enqueue(-2, 5, std::span<const PacketData>(batch));

    auto drained = queue.drain_all();
    BOOST_CHECK(drained.at(chunk_hash(-2, 5)) == batch);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Compiled chunk cache
// ============================================================================

BOOST_AUTO_TEST_SUITE(ChunkPacketCacheTests)

BOOST_AUTO_TEST_CASE(TestInvalidateTouchesOneChunk) {
    ChunkPacketCache cache;
    cache.store(0, 0, PacketData{1});
    cache.store(0, 1, PacketData{2});

    cache.invalidate(0, 0);

    BOOST_CHECK(cache.find(0, 0) == nullptr);
    BOOST_REQUIRE(cache.find(0, 1) != nullptr);
    BOOST_CHECK(*cache.find(0, 1) == PacketData{2});
    BOOST_CHECK_EQUAL(cache.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestStoreReplaces) {
    ChunkPacketCache cache;
    cache.store(4, 4, PacketData{1});
    const auto& stored = cache.store(4, 4, PacketData{7, 7});
    BOOST_CHECK(stored == (PacketData{7, 7}));
    BOOST_CHECK_EQUAL(cache.size(), 1u);

    cache.clear();
    BOOST_CHECK(!cache.contains(4, 4));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Wire messages
// ============================================================================

BOOST_AUTO_TEST_SUITE(WireFormatTests)

BOOST_AUTO_TEST_CASE(TestLevelEventLayout) {
    LevelEventMsg msg;
    msg.event_id = LevelEventId::StartRain;
    msg.data = 5;
    auto packet = build_packet(MessageType::LevelEvent, msg);

    BOOST_CHECK_EQUAL(PacketHeader::serialized_size(), 5u);
    BOOST_CHECK_EQUAL(packet.size(), 5u + LevelEventMsg::serialized_size());
    BOOST_CHECK_EQUAL(packet[0], static_cast<uint8_t>(MessageType::LevelEvent));

    BufferReader r(packet);
    auto hdr = read_header(r);
    BOOST_CHECK_EQUAL(hdr.payload_size, 18u);
    BOOST_CHECK_EQUAL(r.read<uint16_t>(), 3001);
}

BOOST_AUTO_TEST_CASE(TestFullChunkDataCarriesPayload) {
    FullChunkDataMsg msg;
    msg.chunk_x = -3;
    msg.chunk_z = 9;
    msg.payload = {10, 20, 30, 40};
    auto packet = build_packet(MessageType::FullChunkData, msg);

    BufferReader r(packet);
    auto hdr = read_header(r);
    BOOST_CHECK(hdr.type == MessageType::FullChunkData);
    BOOST_CHECK_EQUAL(hdr.payload_size, 16u);

    FullChunkDataMsg decoded;
    decoded.deserialize(r);
    BOOST_CHECK_EQUAL(decoded.chunk_x, -3);
    BOOST_CHECK_EQUAL(decoded.chunk_z, 9);
    BOOST_CHECK(decoded.payload == msg.payload);
    BOOST_CHECK_EQUAL(r.remaining_size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestEntityExitLayout) {
    EntityExitMsg msg;
    msg.entity_id = 77;
    msg.reason = ExitReason::ChangedDimension;
    msg.target_dimension = 1;
    auto packet = build_packet(MessageType::EntityExit, msg);

    BufferReader r(packet);
    auto hdr = read_header(r);
    BOOST_CHECK_EQUAL(hdr.payload_size, 9u);
    BOOST_CHECK_EQUAL(r.read<uint32_t>(), 77u);
    BOOST_CHECK_EQUAL(r.read<uint8_t>(), 1);
    BOOST_CHECK_EQUAL(r.read<int32_t>(), 1);

    EntityExitMsg despawn;
    BOOST_CHECK(despawn.reason == ExitReason::Despawned);
    BOOST_CHECK_EQUAL(despawn.target_dimension, -1);
}

BOOST_AUTO_TEST_CASE(TestTruncatedPacketThrows) {
    BlockUpdateMsg msg;
    msg.block_id = 1;
    auto packet = build_packet(MessageType::BlockUpdate, msg);
    packet.pop_back();

    BufferReader r(packet);
    BOOST_CHECK_THROW(read_header(r), std::out_of_range);

    PacketData header_only{1, 0};
    BufferReader short_reader(header_only);
    BOOST_CHECK_THROW(read_header(short_reader), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(TestFixedBufferWriterRejectsOverflow) {
    uint8_t raw[3] = {};
    BufferWriter w{std::span<uint8_t>(raw)};
    w.write<uint16_t>(1);
    BOOST_CHECK_THROW(w.write<uint16_t>(2), std::out_of_range);
    BOOST_CHECK_EQUAL(w.offset(), 2u);
}

BOOST_AUTO_TEST_SUITE_END()
