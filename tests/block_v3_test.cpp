#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <tpview.hpp>

#include "ring_fixture.hpp"

using namespace tpview;
using namespace tpview::test;

class BlockV3Test : public ::testing::Test {
protected:
    static constexpr size_t block_size = 4096;

    AlignedBuffer buffer{block_size};

    std::span<uint8_t> block() { return buffer.span(); }

    detail::V3BlockHeader& block_header() {
        return reinterpret_cast<detail::V3BlockDesc*>(buffer.data())->hdr.bh1;
    }

    static PacketSpec packet(size_t payload_len, uint8_t seed, uint32_t nsec = 0) {
        PacketSpec spec;
        spec.data = make_ethernet_frame(payload_len, 0x0800, seed);
        spec.sub_seconds = nsec;
        return spec;
    }

    BlockSpec three_packets() {
        BlockSpec spec;
        spec.packets.push_back(packet(60, 0x10, 100));
        spec.packets.push_back(packet(200, 0x20, 200));
        spec.packets.push_back(packet(33, 0x30, 300));
        return spec;
    }
};

TEST_F(BlockV3Test, AdvanceVisitsEveryPacketThenStops) {
    auto spec = three_packets();
    write_v3_block(block(), spec);

    auto result = V3BlockView::parse(block());
    ASSERT_TRUE(result.has_value()) << result.error().message();
    auto& view = *result;

    std::vector<std::vector<uint8_t>> seen;
    std::vector<bool> advanced;
    ASSERT_TRUE(view.has_packet());
    while (true) {
        auto raw = view.raw_payload();
        seen.emplace_back(raw.begin(), raw.end());
        bool more = view.advance();
        advanced.push_back(more);
        if (!more) {
            break;
        }
    }

    EXPECT_EQ(advanced, (std::vector<bool>{true, true, false}));
    ASSERT_EQ(seen.size(), 3u);
    for (size_t i = 0; i < seen.size(); ++i) {
        EXPECT_EQ(seen[i], spec.packets[i].data) << "packet " << i;
    }
    EXPECT_FALSE(view.has_packet());
    EXPECT_EQ(view.error(), ValidationError::none);
}

TEST_F(BlockV3Test, SinglePacketBlockAdvanceIsFalse) {
    BlockSpec spec;
    spec.packets.push_back(packet(64, 1));
    write_v3_block(block(), spec);

    auto result = V3BlockView::parse(block());
    ASSERT_TRUE(result.has_value());

    EXPECT_TRUE(result->has_packet());
    EXPECT_FALSE(result->advance());
    EXPECT_FALSE(result->has_packet());
}

TEST_F(BlockV3Test, ComputesStrideWhenNextOffsetIsZero) {
    auto spec = three_packets();
    spec.explicit_next_offset = false;
    auto offsets = write_v3_block(block(), spec);

    auto result = V3BlockView::parse(block());
    ASSERT_TRUE(result.has_value());
    auto& view = *result;

    for (size_t i = 0; i < offsets.size(); ++i) {
        EXPECT_EQ(view.next_offset(), 0u);
        EXPECT_EQ(view.packet_index(), i);
        EXPECT_EQ(view.raw_payload().data(), buffer.data() + offsets[i] +
                                                 default_mac_offset<detail::V3PacketHeader>());
        EXPECT_EQ(view.timestamp().nanoseconds(), spec.packets[i].sub_seconds);
        bool more = view.advance();
        EXPECT_EQ(more, i + 1 < offsets.size());
    }
    EXPECT_EQ(view.error(), ValidationError::none);
}

TEST_F(BlockV3Test, FollowsExplicitNextOffset) {
    auto spec = three_packets();
    auto offsets = write_v3_block(block(), spec);

    auto result = V3BlockView::parse(block());
    ASSERT_TRUE(result.has_value());
    auto& view = *result;

    EXPECT_EQ(view.next_offset(), offsets[1] - offsets[0]);
    ASSERT_TRUE(view.advance());
    EXPECT_EQ(view.capture_length(), spec.packets[1].data.size());
    EXPECT_EQ(view.next_offset(), offsets[2] - offsets[1]);
}

TEST_F(BlockV3Test, BlockMetadata) {
    auto spec = three_packets();
    spec.sequence = 77;
    auto offsets = write_v3_block(block(), spec);

    auto result = V3BlockView::parse(block());
    ASSERT_TRUE(result.has_value());
    auto& view = *result;

    EXPECT_EQ(view.status(), status::user);
    EXPECT_EQ(view.block_version(), static_cast<uint32_t>(TPACKET_V3));
    EXPECT_EQ(view.private_offset(), 0u);
    EXPECT_EQ(view.packet_count(), 3u);
    EXPECT_FALSE(view.empty());
    EXPECT_EQ(view.sequence_number(), 77u);
    EXPECT_EQ(view.block_length(),
              offsets.back() + v3_packet_stride(spec.packets.back()));
    EXPECT_EQ(view.first_packet_time(), CaptureTime(1'700'000'000, 100));
    EXPECT_EQ(view.last_packet_time(), CaptureTime(1'700'000'000, 300));
    EXPECT_FALSE(view.timed_out());
    EXPECT_EQ(view.slot_size(), block_size);
}

TEST_F(BlockV3Test, TimedOutBlock) {
    BlockSpec spec;
    spec.packets.push_back(packet(10, 0));
    spec.block_status = status::user | status::block_timeout;
    write_v3_block(block(), spec);

    auto result = V3BlockView::parse(block());
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->timed_out());
}

TEST_F(BlockV3Test, PerPacketMetadata) {
    BlockSpec spec;
    PacketSpec tagged = packet(40, 1);
    tagged.status = status::user | status::vlan_valid | status::vlan_tpid_valid;
    tagged.vlan_tci = 0x6123; // PCP 3, VID 0x123
    tagged.vlan_tpid = 0x8100;
    tagged.rx_hash = 0xDEADBEEF;
    tagged.ifindex = 3;
    tagged.wire_length = 9000;
    PacketSpec plain = packet(40, 2);
    plain.ifindex = 4;
    spec.packets = {tagged, plain};
    write_v3_block(block(), spec);

    auto result = V3BlockView::parse(block());
    ASSERT_TRUE(result.has_value());
    auto& view = *result;

    EXPECT_EQ(view.interface_index(), 3);
    EXPECT_EQ(view.vlan_id(), 0x123);
    EXPECT_EQ(view.vlan_tci(), 0x6123);
    ASSERT_TRUE(view.vlan_tpid().has_value());
    EXPECT_EQ(*view.vlan_tpid(), 0x8100);
    EXPECT_EQ(view.rx_hash(), 0xDEADBEEFu);
    EXPECT_EQ(view.wire_length(), 9000u);
    EXPECT_TRUE(view.truncated());
    EXPECT_EQ(view.packet_status() & status::vlan_valid, status::vlan_valid);

    auto bytes = view.payload(CaptureOptions{.add_vlan_header = true});
    ASSERT_EQ(bytes.size(), tagged.data.size() + vlan_header_len);
    EXPECT_EQ(bytes[14], 0x61);
    EXPECT_EQ(bytes[15], 0x23);

    ASSERT_TRUE(view.advance());
    EXPECT_EQ(view.interface_index(), 4);
    EXPECT_EQ(view.vlan_id(), no_vlan);
    EXPECT_FALSE(view.vlan_tpid().has_value());
    EXPECT_FALSE(view.truncated());
    EXPECT_FALSE(view.payload(CaptureOptions{.add_vlan_header = true}).owns_storage());
}

TEST_F(BlockV3Test, ReleaseAfterExhaustionClearsBlockStatus) {
    auto spec = three_packets();
    write_v3_block(block(), spec);

    auto result = V3BlockView::parse(block());
    ASSERT_TRUE(result.has_value());
    while (result->advance()) {
    }

    std::move(*result).release();

    EXPECT_FALSE(result->is_armed());
    EXPECT_EQ(result->status(), 0u);
    EXPECT_EQ(block_header().block_status, status::kernel);
    EXPECT_FALSE(is_user_owned(TpacketVersion::v3, block()));
}

TEST_F(BlockV3Test, EmptyBlockParsesAndReleases) {
    BlockSpec spec;
    spec.block_status = status::user | status::block_timeout;
    write_v3_block(block(), spec);

    auto result = V3BlockView::parse(block());
    ASSERT_TRUE(result.has_value()) << result.error().message();
    auto& view = *result;

    EXPECT_TRUE(view.empty());
    EXPECT_FALSE(view.has_packet());
    EXPECT_FALSE(view.advance());
    EXPECT_EQ(view.error(), ValidationError::none);

    std::move(view).release();
    EXPECT_EQ(block_header().block_status, status::kernel);
}

TEST_F(BlockV3Test, KernelOwnedBlockIsRejected) {
    auto spec = three_packets();
    spec.block_status = status::kernel;
    write_v3_block(block(), spec);

    auto result = V3BlockView::parse(block());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationError::slot_not_ready);
    EXPECT_EQ(result.error().version, TpacketVersion::v3);
}

TEST_F(BlockV3Test, BlockLengthBeyondSlotIsRejected) {
    write_v3_block(block(), three_packets());
    block_header().blk_len = block_size + 16;

    auto result = V3BlockView::parse(block());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationError::block_length_mismatch);
}

TEST_F(BlockV3Test, FirstPacketOutsideBlockIsRejected) {
    write_v3_block(block(), three_packets());
    block_header().offset_to_first_pkt = block_size - 16;

    auto result = V3BlockView::parse(block());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationError::first_packet_out_of_bounds);
}

TEST_F(BlockV3Test, FirstPacketSnaplenPastBlockIsRejected) {
    auto offsets = write_v3_block(block(), three_packets());
    packet_at(block(), offsets[0])->tp_snaplen = block_size;

    auto result = V3BlockView::parse(block());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationError::payload_out_of_bounds);
}

TEST_F(BlockV3Test, CorruptNextOffsetEndsIteration) {
    auto offsets = write_v3_block(block(), three_packets());
    packet_at(block(), offsets[0])->tp_next_offset = block_size;

    auto result = V3BlockView::parse(block());
    ASSERT_TRUE(result.has_value());
    auto& view = *result;

    EXPECT_FALSE(view.advance());
    EXPECT_FALSE(view.has_packet());
    EXPECT_EQ(view.error(), ValidationError::next_packet_out_of_bounds);

    // Still releasable
    std::move(view).release();
    EXPECT_EQ(block_header().block_status, status::kernel);
}

TEST_F(BlockV3Test, NextPacketWithOversizedSnaplenEndsIteration) {
    auto offsets = write_v3_block(block(), three_packets());
    packet_at(block(), offsets[1])->tp_snaplen = block_size;

    auto result = V3BlockView::parse(block());
    ASSERT_TRUE(result.has_value());

    EXPECT_FALSE(result->advance());
    EXPECT_EQ(result->error(), ValidationError::next_packet_out_of_bounds);
}

TEST_F(BlockV3Test, MovedViewKeepsCursor) {
    write_v3_block(block(), three_packets());

    auto result = V3BlockView::parse(block());
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->advance());

    V3BlockView moved = std::move(*result);
    EXPECT_FALSE(result->is_armed());
    EXPECT_TRUE(moved.is_armed());
    EXPECT_EQ(moved.packet_index(), 1u);
    EXPECT_TRUE(moved.advance());
    EXPECT_FALSE(moved.advance());
}

TEST_F(BlockV3Test, PacketsPastBlockLengthAreNotVisited) {
    // Stale packet left from an earlier fill sits past blk_len
    auto offsets = write_v3_block(block(), three_packets());
    block_header().blk_len = static_cast<uint32_t>(offsets[2]);

    auto result = V3BlockView::parse(block());
    ASSERT_TRUE(result.has_value()) << result.error().message();

    EXPECT_TRUE(result->advance());
    EXPECT_FALSE(result->advance());
    EXPECT_EQ(result->error(), ValidationError::next_packet_out_of_bounds);
}

TEST_F(BlockV3Test, FirstPacketPastBlockLengthIsRejected) {
    write_v3_block(block(), three_packets());
    block_header().blk_len = first_packet_offset;

    auto result = V3BlockView::parse(block());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationError::first_packet_out_of_bounds);
}

// =============================================================================
// Views that lose their block without release()
// =============================================================================

TEST_F(BlockV3Test, MoveAssignOverOwningViewHandsBlockBack) {
    AlignedBuffer other(block_size);
    write_v3_block(block(), three_packets());
    write_v3_block(other.span(), three_packets());

    auto first = V3BlockView::parse(block());
    auto second = V3BlockView::parse(other.span());
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    *first = std::move(*second);
    EXPECT_FALSE(is_user_owned(TpacketVersion::v3, block()));
    EXPECT_TRUE(is_user_owned(TpacketVersion::v3, other.span()));

    while (first->advance()) {
    }
    std::move(*first).release();

    EXPECT_FALSE(is_user_owned(TpacketVersion::v3, block()));
    EXPECT_FALSE(is_user_owned(TpacketVersion::v3, other.span()));
}

TEST_F(BlockV3Test, DroppedViewHandsBlockBack) {
    write_v3_block(block(), three_packets());

    {
        auto result = V3BlockView::parse(block());
        ASSERT_TRUE(result.has_value());
        EXPECT_TRUE(result->advance());
    }

    EXPECT_EQ(block_header().block_status, status::kernel);
}

#ifndef NDEBUG
TEST_F(BlockV3Test, MoveAssignOverOwningViewWarnsInDebugBuilds) {
    AlignedBuffer other(block_size);
    write_v3_block(block(), three_packets());
    write_v3_block(other.span(), three_packets());

    auto first = V3BlockView::parse(block());
    auto second = V3BlockView::parse(other.span());
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    testing::internal::CaptureStderr();
    *first = std::move(*second);
    std::string output = testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("move-assigned over a block view that still owns its block"),
              std::string::npos);
}
#endif // NDEBUG
