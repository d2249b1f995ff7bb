#pragma once

#include <optional>
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
 * Header view over one TPACKET_V2 frame
 *
 * One frame holds one packet. Timestamps are seconds + nanoseconds and the
 * kernel may report a stripped 802.1Q tag in tp_vlan_tci/tp_vlan_tpid.
 */
class V2FrameView : public detail::FrameViewBase<detail::V2FrameHeader> {
private:
    // Private constructor - use parse() to construct
    explicit V2FrameView(std::span<uint8_t> slot) noexcept : FrameViewBase(slot) {}

public:
    static constexpr TpacketVersion version = TpacketVersion::v2;

    /**
     * @brief Parse a user-owned TPACKET_V2 frame
     *
     * @param slot Frame bytes inside the mapped ring
     * @return ParseResult<V2FrameView> containing either the view or error
     */
    [[nodiscard]] static ParseResult<V2FrameView> parse(std::span<uint8_t> slot) noexcept {
        uint64_t status_word = 0;
        ValidationError error = validate_frame(slot, status_word);
        if (error != ValidationError::none) {
            return make_parse_error(error, version, status_word, slot);
        }
        return V2FrameView(slot);
    }

    CaptureTime timestamp() const noexcept { return CaptureTime(hdr_->tp_sec, hdr_->tp_nsec); }

    /**
     * Packet bytes, with the 802.1Q tag re-inserted when requested
     *
     * @param options add_vlan_header enables tag re-insertion
     * @return Borrowed slot bytes, or an owned copy carrying the tag
     */
    PacketBytes payload(const CaptureOptions& options) const {
        return reinsert_vlan(raw_payload(), vlan_tci(), options.add_vlan_header);
    }

    /// Raw tag control information as written by the kernel
    uint16_t vlan_tci() const noexcept { return hdr_->tp_vlan_tci; }

    /**
     * VLAN id reported out-of-band
     * @return 12-bit VLAN id if TP_STATUS_VLAN_VALID is set, otherwise no_vlan
     */
    int vlan_id() const noexcept {
        if ((status() & status::vlan_valid) == 0) {
            return no_vlan;
        }
        return hdr_->tp_vlan_tci & vlan_vid_mask;
    }

    /**
     * Tag protocol id reported out-of-band
     * @return TPID if TP_STATUS_VLAN_TPID_VALID is set, otherwise std::nullopt
     */
    std::optional<uint16_t> vlan_tpid() const noexcept {
        if ((status() & status::vlan_tpid_valid) == 0) {
            return std::nullopt;
        }
        return hdr_->tp_vlan_tpid;
    }
};

} // namespace tpview
