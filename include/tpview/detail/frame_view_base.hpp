#pragma once

#include <span>
#include <type_traits>

#include <cstddef>
#include <cstdint>
#include <tpview/types.hpp>

#include "diagnostics.hpp"
#include "kernel_abi.hpp"
#include "status_word.hpp"

namespace tpview::detail {

/**
 * Base class for single-frame header views (TPACKET_V1 and TPACKET_V2)
 *
 * Holds the frame header pointer and implements everything the two
 * generations share: ownership, lengths, offsets, the trailing address
 * record, and the terminal advance(). Derived classes add the parts that
 * differ between generations (timestamp unit, VLAN fields).
 *
 * Views are move-only. The moved-from view is disarmed so a slot can be
 * handed back to the kernel at most once.
 *
 * This is an implementation detail - users should use V1FrameView or
 * V2FrameView directly.
 *
 * @tparam Header Kernel frame header type
 */
template <typename Header>
class FrameViewBase {
protected:
    using status_type = std::remove_cvref_t<decltype(Header::tp_status)>;

    Header* hdr_;
    size_t slot_size_;

    explicit FrameViewBase(std::span<uint8_t> slot) noexcept
        : hdr_(reinterpret_cast<Header*>(slot.data())),
          slot_size_(slot.size()) {}

    /**
     * Check that a slot can be viewed as a user-owned frame
     *
     * @param slot Frame bytes
     * @param status_out Receives the status word if it was read
     * @return ValidationError::none on success, or specific error code
     */
    static ValidationError validate_frame(std::span<uint8_t> slot, uint64_t& status_out) noexcept {
        // 1. Header and address record must fit
        if (slot.data() == nullptr || slot.size() < header_span_bytes<Header>) {
            return ValidationError::buffer_too_small;
        }

        // 2. Status word must be naturally aligned for atomic access
        if (reinterpret_cast<uintptr_t>(slot.data()) % alignof(Header) != 0) {
            return ValidationError::misaligned_slot;
        }

        // 3. Only a user-owned frame may be read past the status word
        auto* hdr = reinterpret_cast<Header*>(slot.data());
        status_out = load_status(hdr->tp_status);
        if ((status_out & status::user) == 0) {
            return ValidationError::slot_not_ready;
        }

        // 4. Captured bytes must stay inside the frame
        if (static_cast<size_t>(hdr->tp_mac) + hdr->tp_snaplen > slot.size()) {
            return ValidationError::payload_out_of_bounds;
        }

        return ValidationError::none;
    }

    /**
     * Return a frame the view still owns to the kernel
     *
     * Used when a view is overwritten or destroyed without release().
     */
    void hand_back(const char* what) noexcept {
        if (hdr_ == nullptr) {
            return;
        }
        contract_warning(what);
        store_status(hdr_->tp_status, static_cast<status_type>(status::kernel));
        hdr_ = nullptr;
    }

public:
    FrameViewBase(const FrameViewBase&) = delete;
    FrameViewBase& operator=(const FrameViewBase&) = delete;

    FrameViewBase(FrameViewBase&& other) noexcept
        : hdr_(other.hdr_),
          slot_size_(other.slot_size_) {
        other.hdr_ = nullptr;
    }

    FrameViewBase& operator=(FrameViewBase&& other) noexcept {
        if (this != &other) {
            hand_back("move-assigned over a frame view that still owns its frame");
            hdr_ = other.hdr_;
            slot_size_ = other.slot_size_;
            other.hdr_ = nullptr;
        }
        return *this;
    }

    ~FrameViewBase() { hand_back("frame view destroyed without release()"); }

    /**
     * Get the raw status word (acquire load, no side effect)
     *
     * A released or moved-from view reports TP_STATUS_KERNEL.
     */
    uint64_t status() const noexcept {
        if (hdr_ == nullptr) {
            return status::kernel;
        }
        return load_status(hdr_->tp_status);
    }

    /**
     * Hand the frame back to the kernel
     *
     * Clears the status word with release ordering. Consumes the view:
     * call as std::move(view).release(). Payload bytes obtained from this
     * view must not be used afterwards.
     */
    void release() && noexcept {
        if (hdr_ == nullptr) {
            contract_warning("release() on a frame view that was already released");
            return;
        }
        store_status(hdr_->tp_status, static_cast<status_type>(status::kernel));
        hdr_ = nullptr;
    }

    /**
     * Check whether this view still owns its frame
     */
    bool is_armed() const noexcept { return hdr_ != nullptr; }

    /**
     * Single-frame headers hold exactly one packet
     * @return Always false
     */
    bool advance() noexcept { return false; }

    /// Original length of the packet on the wire
    uint32_t wire_length() const noexcept { return hdr_->tp_len; }

    /// Bytes of the packet present in the frame (snaplen)
    uint32_t capture_length() const noexcept { return hdr_->tp_snaplen; }

    /// Offset from the frame start to the link-layer header
    uint16_t mac_offset() const noexcept { return hdr_->tp_mac; }

    /// Offset from the frame start to the network-layer header
    uint16_t net_offset() const noexcept { return hdr_->tp_net; }

    /// Packet was cut short by the snapshot length
    bool truncated() const noexcept { return hdr_->tp_len > hdr_->tp_snaplen; }

    /**
     * Captured bytes exactly as the kernel wrote them
     * @return Span into the frame, valid until release()
     */
    std::span<const uint8_t> raw_payload() const noexcept {
        return {reinterpret_cast<const uint8_t*>(hdr_) + hdr_->tp_mac, hdr_->tp_snaplen};
    }

    /**
     * Index of the interface the packet was seen on
     *
     * Read from the address record the kernel places at
     * TPACKET_ALIGN(sizeof(header)) past the frame start.
     */
    int interface_index() const noexcept {
        const auto* record = reinterpret_cast<const AddressRecord*>(
            reinterpret_cast<const uint8_t*>(hdr_) + address_record_offset<Header>);
        return record->sll_ifindex;
    }

    /// Size of the frame this view covers
    size_t slot_size() const noexcept { return slot_size_; }
};

} // namespace tpview::detail
