#pragma once

#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <variant>

#include <cstdint>
#include <tpview/block_v3.hpp>
#include <tpview/capture_info.hpp>
#include <tpview/frame_v1.hpp>
#include <tpview/frame_v2.hpp>
#include <tpview/header_concepts.hpp>
#include <tpview/types.hpp>

#include "detail/kernel_abi.hpp"
#include "detail/parse_result.hpp"
#include "detail/status_word.hpp"

namespace tpview {

static_assert(CaptureHeaderLike<V1FrameView>);
static_assert(CaptureHeaderLike<V2FrameView>);
static_assert(CaptureHeaderLike<V3BlockView>);

/**
 * @brief Type-safe variant holding one validated header view
 */
using HeaderVariant = std::variant<V1FrameView, V2FrameView, V3BlockView>;

/**
 * Header view for whichever ring generation was negotiated
 *
 * The generation is chosen once, when the ring loop calls parse() with the
 * version it configured; every later call dispatches on the held view. For
 * V1/V2 advance() is always false, for V3 it walks the block.
 *
 * Usage:
 * @code
 *   auto hdr = CaptureHeader::parse(TpacketVersion::v3, slot);
 *   if (!hdr) {
 *       return;  // hdr.error().code == ValidationError::slot_not_ready etc.
 *   }
 *   if (hdr->has_packet()) {
 *       do {
 *           handle(hdr->capture_info(), hdr->payload(options));
 *       } while (hdr->advance());
 *   }
 *   std::move(*hdr).release();
 * @endcode
 */
class CaptureHeader {
public:
    explicit CaptureHeader(V1FrameView&& view) noexcept : view_(std::move(view)) {}
    explicit CaptureHeader(V2FrameView&& view) noexcept : view_(std::move(view)) {}
    explicit CaptureHeader(V3BlockView&& view) noexcept : view_(std::move(view)) {}

    /**
     * @brief Parse a ring slot as the given ABI generation
     *
     * @param version Generation negotiated with PACKET_VERSION
     * @param slot Frame (V1/V2) or block (V3) bytes
     * @return ParseResult<CaptureHeader> containing either the header or error
     */
    [[nodiscard]] static ParseResult<CaptureHeader> parse(TpacketVersion version,
                                                          std::span<uint8_t> slot) noexcept {
        switch (version) {
            case TpacketVersion::v1:
                return V1FrameView::parse(slot).map(
                    [](V1FrameView&& v) { return CaptureHeader(std::move(v)); });
            case TpacketVersion::v2:
                return V2FrameView::parse(slot).map(
                    [](V2FrameView&& v) { return CaptureHeader(std::move(v)); });
            case TpacketVersion::v3:
                return V3BlockView::parse(slot).map(
                    [](V3BlockView&& v) { return CaptureHeader(std::move(v)); });
        }
        return make_parse_error(ValidationError::unsupported_version, version, 0, slot);
    }

    TpacketVersion version() const noexcept {
        return std::visit([](const auto& v) { return std::decay_t<decltype(v)>::version; },
                          view_);
    }

    uint64_t status() const noexcept {
        return std::visit([](const auto& v) { return v.status(); }, view_);
    }

    /**
     * Hand the slot back to the kernel; consumes the header
     */
    void release() && noexcept {
        std::visit([](auto& v) { std::move(v).release(); }, view_);
    }

    bool is_armed() const noexcept {
        return std::visit([](const auto& v) { return v.is_armed(); }, view_);
    }

    /**
     * Move to the next packet in the slot
     * @return false for V1/V2, and for V3 once the block is exhausted
     */
    bool advance() noexcept {
        return std::visit([](auto& v) { return v.advance(); }, view_);
    }

    /// True while the header points at a packet
    bool has_packet() const noexcept {
        if (const auto* block = std::get_if<V3BlockView>(&view_)) {
            return block->has_packet();
        }
        return is_armed();
    }

    CaptureTime timestamp() const noexcept {
        return std::visit([](const auto& v) { return v.timestamp(); }, view_);
    }

    PacketBytes payload(const CaptureOptions& options) const {
        return std::visit([&options](const auto& v) { return v.payload(options); }, view_);
    }

    std::span<const uint8_t> raw_payload() const noexcept {
        return std::visit([](const auto& v) { return v.raw_payload(); }, view_);
    }

    uint32_t wire_length() const noexcept {
        return std::visit([](const auto& v) { return v.wire_length(); }, view_);
    }

    uint32_t capture_length() const noexcept {
        return std::visit([](const auto& v) { return v.capture_length(); }, view_);
    }

    int interface_index() const noexcept {
        return std::visit([](const auto& v) { return v.interface_index(); }, view_);
    }

    int vlan_id() const noexcept {
        return std::visit([](const auto& v) { return v.vlan_id(); }, view_);
    }

    CaptureInfo capture_info() const noexcept {
        return std::visit([](const auto& v) { return tpview::capture_info(v); }, view_);
    }

    /// Access the generation-specific view (block metadata, VLAN TPID, hash)
    const HeaderVariant& view() const noexcept { return view_; }
    HeaderVariant& view() noexcept { return view_; }

private:
    HeaderVariant view_;
};

static_assert(std::is_nothrow_move_constructible_v<CaptureHeader>);

/**
 * Read a slot's status word without constructing a view
 *
 * Acquire load, so a TP_STATUS_USER result makes the slot's contents
 * visible to the caller.
 *
 * @param version Generation the ring was configured with
 * @param slot Frame (V1/V2) or block (V3) bytes
 * @return Status word, or std::nullopt if the slot cannot hold one
 */
inline std::optional<uint64_t> slot_status(TpacketVersion version,
                                           std::span<uint8_t> slot) noexcept {
    auto readable = [&slot]<typename Header>(std::type_identity<Header>) {
        return slot.data() != nullptr && slot.size() >= sizeof(Header) &&
               reinterpret_cast<uintptr_t>(slot.data()) % alignof(Header) == 0;
    };

    switch (version) {
        case TpacketVersion::v1:
            if (!readable(std::type_identity<detail::V1FrameHeader>{})) {
                return std::nullopt;
            }
            return detail::load_status(
                reinterpret_cast<detail::V1FrameHeader*>(slot.data())->tp_status);
        case TpacketVersion::v2:
            if (!readable(std::type_identity<detail::V2FrameHeader>{})) {
                return std::nullopt;
            }
            return detail::load_status(
                reinterpret_cast<detail::V2FrameHeader*>(slot.data())->tp_status);
        case TpacketVersion::v3:
            if (!readable(std::type_identity<detail::V3BlockDesc>{})) {
                return std::nullopt;
            }
            return detail::load_status(
                reinterpret_cast<detail::V3BlockDesc*>(slot.data())->hdr.bh1.block_status);
    }
    return std::nullopt;
}

/**
 * Check whether a slot has been handed to user space
 */
inline bool is_user_owned(TpacketVersion version, std::span<uint8_t> slot) noexcept {
    auto word = slot_status(version, slot);
    return word.has_value() && (*word & status::user) != 0;
}

} // namespace tpview
