#pragma once

#include <optional>
#include <span>

#include <cstddef>
#include <cstdint>
#include <tpview/capture_time.hpp>
#include <tpview/options.hpp>
#include <tpview/types.hpp>
#include <tpview/vlan.hpp>

#include "detail/diagnostics.hpp"
#include "detail/kernel_abi.hpp"
#include "detail/parse_result.hpp"
#include "detail/status_word.hpp"

namespace tpview {

/**
 * Header view over one TPACKET_V3 block
 *
 * A block carries a block descriptor followed by packet_count() packets,
 * each with its own tpacket3_hdr. The view keeps a cursor on the current
 * packet; the packet accessors (timestamp, payload, lengths, VLAN, hash,
 * interface index) describe the packet under the cursor.
 *
 * Lifecycle:
 * - parse() validates the block descriptor and the first packet
 * - advance() moves to the next packet, returning false once the block
 *   is exhausted
 * - std::move(view).release() hands the whole block back to the kernel;
 *   it belongs after advance() has returned false
 *
 * Bounds:
 * Every packet position is checked against blk_len before the cursor
 * moves onto it. A position outside the block ends iteration early:
 * advance() returns false and error() reports next_packet_out_of_bounds.
 * The block must still be released.
 *
 * Packet accessors require has_packet(). A block retired by timeout may
 * hold zero packets; such a view only supports the block accessors,
 * advance() and release().
 *
 * Usage:
 *   auto result = V3BlockView::parse(block_bytes);
 *   if (result.has_value()) {
 *       auto& block = *result;
 *       if (block.has_packet()) {
 *           do {
 *               consume(block.payload(options));
 *           } while (block.advance());
 *       }
 *       std::move(block).release();
 *   }
 */
class V3BlockView {
private:
    using BlockDesc = detail::V3BlockDesc;
    using PacketHeader = detail::V3PacketHeader;

    BlockDesc* block_;
    size_t block_size_;
    size_t packet_bound_; // blk_len: packets must end at or before this offset
    size_t packet_offset_; // From the block start to the current packet header
    uint32_t packet_count_;
    uint32_t used_;
    bool exhausted_;
    ValidationError error_;

    // Private constructor - use parse() to construct
    V3BlockView(std::span<uint8_t> slot, size_t packet_bound, uint32_t packet_count,
                size_t first_offset) noexcept
        : block_(reinterpret_cast<BlockDesc*>(slot.data())),
          block_size_(slot.size()),
          packet_bound_(packet_bound),
          packet_offset_(first_offset),
          packet_count_(packet_count),
          used_(0),
          exhausted_(false),
          error_(ValidationError::none) {}

    /**
     * Check that a packet header at `offset` and its captured bytes lie
     * before `bound` (the validated blk_len)
     */
    static ValidationError check_packet(const uint8_t* base, size_t bound,
                                        size_t offset) noexcept {
        if (offset % alignof(PacketHeader) != 0 ||
            bound < detail::header_span_bytes<PacketHeader> ||
            offset > bound - detail::header_span_bytes<PacketHeader>) {
            return ValidationError::next_packet_out_of_bounds;
        }
        const auto* pkt = reinterpret_cast<const PacketHeader*>(base + offset);
        if (offset + pkt->tp_mac + pkt->tp_snaplen > bound) {
            return ValidationError::payload_out_of_bounds;
        }
        return ValidationError::none;
    }

    uint8_t* base() const noexcept { return reinterpret_cast<uint8_t*>(block_); }

    PacketHeader* packet() const noexcept {
        return reinterpret_cast<PacketHeader*>(base() + packet_offset_);
    }

    detail::V3BlockHeader& block_header() const noexcept { return block_->hdr.bh1; }

    // Return a block the view still owns to the kernel; used when a view is
    // overwritten or destroyed without release()
    void hand_back(const char* what) noexcept {
        if (block_ == nullptr) {
            return;
        }
        detail::contract_warning(what);
        detail::store_status(block_header().block_status, uint32_t{status::kernel});
        block_ = nullptr;
    }

public:
    static constexpr TpacketVersion version = TpacketVersion::v3;

    /**
     * @brief Parse a user-owned TPACKET_V3 block
     *
     * Validates:
     * 1. The slot holds a block descriptor and is suitably aligned
     * 2. block_status carries TP_STATUS_USER
     * 3. blk_len covers the descriptor and does not exceed the slot
     * 4. The first packet (if any) and its captured bytes lie inside blk_len
     *
     * @param slot Block bytes inside the mapped ring
     * @return ParseResult<V3BlockView> containing either the view or error
     */
    [[nodiscard]] static ParseResult<V3BlockView> parse(std::span<uint8_t> slot) noexcept {
        if (slot.data() == nullptr || slot.size() < sizeof(BlockDesc)) {
            return make_parse_error(ValidationError::buffer_too_small, version, 0, slot);
        }
        if (reinterpret_cast<uintptr_t>(slot.data()) % alignof(BlockDesc) != 0) {
            return make_parse_error(ValidationError::misaligned_slot, version, 0, slot);
        }

        auto* block = reinterpret_cast<BlockDesc*>(slot.data());
        uint32_t status_word = detail::load_status(block->hdr.bh1.block_status);
        if ((status_word & status::user) == 0) {
            return make_parse_error(ValidationError::slot_not_ready, version, status_word, slot);
        }

        const auto& bh = block->hdr.bh1;
        if (bh.blk_len < sizeof(BlockDesc) || bh.blk_len > slot.size()) {
            return make_parse_error(ValidationError::block_length_mismatch, version, status_word,
                                    slot);
        }

        if (bh.num_pkts > 0) {
            if (slot.size() < detail::header_span_bytes<PacketHeader>) {
                return make_parse_error(ValidationError::buffer_too_small, version, status_word,
                                        slot);
            }
            ValidationError error = check_packet(slot.data(), bh.blk_len, bh.offset_to_first_pkt);
            if (error == ValidationError::next_packet_out_of_bounds) {
                error = ValidationError::first_packet_out_of_bounds;
            }
            if (error != ValidationError::none) {
                return make_parse_error(error, version, status_word, slot);
            }
        }

        return V3BlockView(slot, bh.blk_len, bh.num_pkts, bh.offset_to_first_pkt);
    }

    V3BlockView(const V3BlockView&) = delete;
    V3BlockView& operator=(const V3BlockView&) = delete;

    V3BlockView(V3BlockView&& other) noexcept
        : block_(other.block_),
          block_size_(other.block_size_),
          packet_bound_(other.packet_bound_),
          packet_offset_(other.packet_offset_),
          packet_count_(other.packet_count_),
          used_(other.used_),
          exhausted_(other.exhausted_),
          error_(other.error_) {
        other.block_ = nullptr;
    }

    V3BlockView& operator=(V3BlockView&& other) noexcept {
        if (this != &other) {
            hand_back("move-assigned over a block view that still owns its block");
            block_ = other.block_;
            block_size_ = other.block_size_;
            packet_bound_ = other.packet_bound_;
            packet_offset_ = other.packet_offset_;
            packet_count_ = other.packet_count_;
            used_ = other.used_;
            exhausted_ = other.exhausted_;
            error_ = other.error_;
            other.block_ = nullptr;
        }
        return *this;
    }

    ~V3BlockView() { hand_back("block view destroyed without release()"); }

    // ========================================================================
    // Ownership and iteration
    // ========================================================================

    /**
     * Get the block status word (acquire load, no side effect)
     *
     * A released or moved-from view reports TP_STATUS_KERNEL.
     */
    uint64_t status() const noexcept {
        if (block_ == nullptr) {
            return status::kernel;
        }
        return detail::load_status(block_header().block_status);
    }

    /**
     * Move the cursor to the next packet in the block
     *
     * The next packet sits tp_next_offset bytes past the current one, or,
     * when the kernel left tp_next_offset zero, at the aligned end of the
     * current packet's captured bytes.
     *
     * @return true if the cursor now points at another packet, false once
     *         the block is exhausted (the caller should then release it)
     */
    bool advance() noexcept {
        if (block_ == nullptr || exhausted_) {
            detail::contract_warning("advance() on an exhausted or released block");
            return false;
        }

        ++used_;
        if (used_ >= packet_count_) {
            exhausted_ = true;
            return false;
        }

        const PacketHeader* current = packet();
        size_t step = current->tp_next_offset != 0
                          ? current->tp_next_offset
                          : detail::tp_align(static_cast<size_t>(current->tp_snaplen) +
                                             current->tp_mac);
        size_t next = packet_offset_ + step;

        if (step == 0 || check_packet(base(), packet_bound_, next) != ValidationError::none) {
            error_ = ValidationError::next_packet_out_of_bounds;
            exhausted_ = true;
            return false;
        }

        packet_offset_ = next;
        return true;
    }

    /**
     * Hand the block back to the kernel
     *
     * Clears block_status with release ordering. Consumes the view: call
     * as std::move(view).release() after advance() has returned false.
     */
    void release() && noexcept {
        if (block_ == nullptr) {
            detail::contract_warning("release() on a block view that was already released");
            return;
        }
        if (!exhausted_ && packet_count_ > 0) {
            detail::contract_warning("release() before advance() reported the block exhausted");
        }
        detail::store_status(block_header().block_status, uint32_t{status::kernel});
        block_ = nullptr;
    }

    /// Check whether this view still owns its block
    bool is_armed() const noexcept { return block_ != nullptr; }

    /// True while the cursor points at a packet
    bool has_packet() const noexcept { return !exhausted_ && used_ < packet_count_; }

    /// Zero-based index of the packet under the cursor
    uint32_t packet_index() const noexcept { return used_; }

    /// Why iteration stopped early, or ValidationError::none
    ValidationError error() const noexcept { return error_; }

    // ========================================================================
    // Block accessors
    // ========================================================================

    uint32_t block_version() const noexcept { return block_->version; }
    uint32_t private_offset() const noexcept { return block_->offset_to_priv; }

    /// Number of packets the kernel stored in this block
    uint32_t packet_count() const noexcept { return packet_count_; }

    bool empty() const noexcept { return packet_count_ == 0; }

    /// Bytes of the block in use (descriptor, private area and packets)
    uint32_t block_length() const noexcept { return block_header().blk_len; }

    uint64_t sequence_number() const noexcept { return block_header().seq_num; }

    /// Block was retired by the timer rather than by filling up
    bool timed_out() const noexcept { return (status() & status::block_timeout) != 0; }

    // tpacket_bd_ts is filled with nanoseconds for TPACKET_V3
    CaptureTime first_packet_time() const noexcept {
        return CaptureTime(block_header().ts_first_pkt.ts_sec, block_header().ts_first_pkt.ts_nsec);
    }

    CaptureTime last_packet_time() const noexcept {
        return CaptureTime(block_header().ts_last_pkt.ts_sec, block_header().ts_last_pkt.ts_nsec);
    }

    size_t slot_size() const noexcept { return block_size_; }

    // ========================================================================
    // Current packet accessors (require has_packet())
    // ========================================================================

    /// Per-packet status bits (VLAN validity, checksum, timestamp source)
    uint32_t packet_status() const noexcept { return packet()->tp_status; }

    CaptureTime timestamp() const noexcept {
        return CaptureTime(packet()->tp_sec, packet()->tp_nsec);
    }

    uint32_t wire_length() const noexcept { return packet()->tp_len; }
    uint32_t capture_length() const noexcept { return packet()->tp_snaplen; }
    uint16_t mac_offset() const noexcept { return packet()->tp_mac; }
    uint16_t net_offset() const noexcept { return packet()->tp_net; }
    bool truncated() const noexcept { return packet()->tp_len > packet()->tp_snaplen; }

    /// Offset from the current packet header to the next one (0 = compute)
    uint32_t next_offset() const noexcept { return packet()->tp_next_offset; }

    /**
     * Captured bytes exactly as the kernel wrote them
     * @return Span into the block, valid until release()
     */
    std::span<const uint8_t> raw_payload() const noexcept {
        const PacketHeader* pkt = packet();
        return {reinterpret_cast<const uint8_t*>(pkt) + pkt->tp_mac, pkt->tp_snaplen};
    }

    /**
     * Packet bytes, with the 802.1Q tag re-inserted when requested
     */
    PacketBytes payload(const CaptureOptions& options) const {
        return reinsert_vlan(raw_payload(), vlan_tci(), options.add_vlan_header);
    }

    /**
     * Index of the interface the packet was seen on
     *
     * Read from the address record at TPACKET_ALIGN(sizeof(tpacket3_hdr))
     * past the current packet header.
     */
    int interface_index() const noexcept {
        const auto* record = reinterpret_cast<const detail::AddressRecord*>(
            reinterpret_cast<const uint8_t*>(packet()) +
            detail::address_record_offset<PacketHeader>);
        return record->sll_ifindex;
    }

    /// Raw tag control information (low 16 bits of tp_vlan_tci)
    uint16_t vlan_tci() const noexcept {
        return static_cast<uint16_t>(packet()->hv1.tp_vlan_tci);
    }

    /**
     * VLAN id reported out-of-band
     * @return 12-bit VLAN id if TP_STATUS_VLAN_VALID is set, otherwise no_vlan
     */
    int vlan_id() const noexcept {
        if ((packet_status() & status::vlan_valid) == 0) {
            return no_vlan;
        }
        return static_cast<int>(packet()->hv1.tp_vlan_tci & vlan_vid_mask);
    }

    /**
     * Tag protocol id reported out-of-band
     * @return TPID if TP_STATUS_VLAN_TPID_VALID is set, otherwise std::nullopt
     */
    std::optional<uint16_t> vlan_tpid() const noexcept {
        if ((packet_status() & status::vlan_tpid_valid) == 0) {
            return std::nullopt;
        }
        return packet()->hv1.tp_vlan_tpid;
    }

    /// Receive hash (filled when the ring was set up with TP_FT_REQ_FILL_RXHASH)
    uint32_t rx_hash() const noexcept { return packet()->hv1.tp_rxhash; }
};

} // namespace tpview
