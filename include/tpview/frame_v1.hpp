#pragma once

#include <span>

#include <cstdint>
#include <tpview/capture_time.hpp>
#include <tpview/options.hpp>
#include <tpview/types.hpp>
#include <tpview/vlan.hpp>

#include "detail/frame_view_base.hpp"
#include "detail/parse_result.hpp"

namespace tpview {

/**
 * Header view over one TPACKET_V1 frame
 *
 * The oldest ring generation: one frame holds one packet, timestamps are
 * seconds + microseconds, and there is no out-of-band VLAN field.
 *
 * Usage:
 *   auto result = V1FrameView::parse(slot);
 *   if (result.has_value()) {
 *       auto bytes = result->payload(options);
 *       std::move(*result).release();
 *   }
 */
class V1FrameView : public detail::FrameViewBase<detail::V1FrameHeader> {
private:
    // Private constructor - use parse() to construct
    explicit V1FrameView(std::span<uint8_t> slot) noexcept : FrameViewBase(slot) {}

public:
    static constexpr TpacketVersion version = TpacketVersion::v1;

    /**
     * @brief Parse a user-owned TPACKET_V1 frame
     *
     * @param slot Frame bytes inside the mapped ring
     * @return ParseResult<V1FrameView> containing either the view or error
     */
    [[nodiscard]] static ParseResult<V1FrameView> parse(std::span<uint8_t> slot) noexcept {
        uint64_t status_word = 0;
        ValidationError error = validate_frame(slot, status_word);
        if (error != ValidationError::none) {
            return make_parse_error(error, version, status_word, slot);
        }
        return V1FrameView(slot);
    }

    /// Capture time; the kernel reports microseconds for this generation
    CaptureTime timestamp() const noexcept {
        return CaptureTime::from_microseconds(hdr_->tp_sec, hdr_->tp_usec);
    }

    /**
     * Packet bytes
     *
     * V1 carries no VLAN metadata, so the bytes are always borrowed.
     */
    PacketBytes payload(const CaptureOptions& options) const {
        return reinsert_vlan(raw_payload(), vlan_tci(), options.add_vlan_header);
    }

    /// V1 never reports VLAN metadata
    uint16_t vlan_tci() const noexcept { return 0; }

    /// V1 never reports VLAN metadata
    int vlan_id() const noexcept { return no_vlan; }
};

} // namespace tpview
