// SPDX-License-Identifier: MIT

#pragma once

#include <span>
#include <stdexcept>
#include <string>

#include <cstddef>
#include <cstdint>
#include <tpview/capture_header.hpp>
#include <tpview/types.hpp>

#include "detail/kernel_abi.hpp"
#include "detail/parse_result.hpp"

namespace tpview {

/**
 * @brief Geometry of an RX ring, as passed to PACKET_RX_RING
 *
 * frame_size is only meaningful for V1/V2 rings; V3 rings hand out whole
 * blocks.
 */
struct RingGeometry {
    TpacketVersion version = TpacketVersion::v3;
    size_t block_size = 0;
    size_t block_count = 0;
    size_t frame_size = 0;
};

/**
 * @brief Slot addressing over a mapped RX ring
 *
 * The region is owned by whoever mapped it; RingRegion neither maps nor
 * unmaps it and only hands out spans of individual slots. A slot is a frame
 * for V1/V2 rings and a block for V3 rings.
 *
 * V1/V2 frames never straddle blocks: frame i lives in block
 * i / frames_per_block at offset (i % frames_per_block) * frame_size, the
 * same arithmetic the kernel uses to locate frames.
 *
 * Example usage:
 * @code
 * RingRegion ring({static_cast<uint8_t*>(map), map_len},
 *                 {TpacketVersion::v3, block_size, block_count, 0});
 * for (size_t i = 0; ring.ready(i); i = ring.next_index(i)) {
 *     auto hdr = ring.open(i);
 *     ...
 * }
 * @endcode
 */
class RingRegion {
public:
    /**
     * @brief Describe an already-mapped ring
     *
     * @param area The mapped region
     * @param geometry The geometry the ring was configured with
     * @throws std::invalid_argument if the geometry is empty, misaligned, or
     *         larger than the region
     */
    RingRegion(std::span<uint8_t> area, const RingGeometry& geometry)
        : area_(area),
          geometry_(geometry) {
        if (area_.data() == nullptr || geometry_.block_size == 0 || geometry_.block_count == 0) {
            throw std::invalid_argument("RingRegion: empty region or geometry");
        }
        if (geometry_.block_size % detail::ring_alignment != 0) {
            throw std::invalid_argument("RingRegion: block_size (" +
                                        std::to_string(geometry_.block_size) +
                                        ") is not a multiple of TPACKET_ALIGNMENT");
        }
        if (geometry_.block_size > area_.size() / geometry_.block_count) {
            throw std::invalid_argument("RingRegion: geometry (" +
                                        std::to_string(geometry_.block_count) + " x " +
                                        std::to_string(geometry_.block_size) +
                                        ") exceeds mapped length " +
                                        std::to_string(area_.size()));
        }

        if (geometry_.version == TpacketVersion::v3) {
            frames_per_block_ = 1;
            slot_size_ = geometry_.block_size;
        } else {
            if (geometry_.frame_size == 0 || geometry_.frame_size > geometry_.block_size ||
                geometry_.frame_size % detail::ring_alignment != 0) {
                throw std::invalid_argument("RingRegion: frame_size (" +
                                            std::to_string(geometry_.frame_size) +
                                            ") must be a non-zero multiple of "
                                            "TPACKET_ALIGNMENT no larger than block_size");
            }
            frames_per_block_ = geometry_.block_size / geometry_.frame_size;
            slot_size_ = geometry_.frame_size;
        }
        slot_count_ = frames_per_block_ * geometry_.block_count;
    }

    TpacketVersion version() const noexcept { return geometry_.version; }
    const RingGeometry& geometry() const noexcept { return geometry_; }

    /// Number of frames (V1/V2) or blocks (V3) in the ring
    size_t slot_count() const noexcept { return slot_count_; }

    /// Bytes in one slot
    size_t slot_size() const noexcept { return slot_size_; }

    /// Index following `index`, wrapping at the end of the ring
    size_t next_index(size_t index) const noexcept {
        return index + 1 < slot_count_ ? index + 1 : 0;
    }

    /**
     * @brief Byte offset of a slot from the start of the region
     * @param index Slot index (must be < slot_count())
     */
    size_t slot_offset(size_t index) const noexcept {
        size_t block = index / frames_per_block_;
        size_t frame = index % frames_per_block_;
        return block * geometry_.block_size + frame * slot_size_;
    }

    /**
     * @brief Bytes of one slot
     * @return Slot span, or an empty span if index is out of range
     */
    std::span<uint8_t> slot(size_t index) const noexcept {
        if (index >= slot_count_) {
            return {};
        }
        return area_.subspan(slot_offset(index), slot_size_);
    }

    /**
     * @brief Check whether the kernel has handed a slot to user space
     */
    bool ready(size_t index) const noexcept { return is_user_owned(geometry_.version, slot(index)); }

    /**
     * @brief Build a header view over a slot
     *
     * @param index Slot index
     * @return ParseResult<CaptureHeader>; out-of-range indices fail with
     *         buffer_too_small
     */
    [[nodiscard]] ParseResult<CaptureHeader> open(size_t index) const noexcept {
        return CaptureHeader::parse(geometry_.version, slot(index));
    }

private:
    std::span<uint8_t> area_;
    RingGeometry geometry_;
    size_t frames_per_block_ = 1;
    size_t slot_size_ = 0;
    size_t slot_count_ = 0;
};

} // namespace tpview
