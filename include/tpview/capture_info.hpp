#pragma once

#include <cstdint>
#include <tpview/capture_time.hpp>
#include <tpview/header_concepts.hpp>
#include <tpview/types.hpp>

namespace tpview {

/**
 * Metadata snapshot of the packet a header view currently points at
 *
 * Plain value; stays valid after the view is released.
 */
struct CaptureInfo {
    CaptureTime timestamp{};
    uint32_t capture_length{0}; ///< Bytes present in the ring
    uint32_t wire_length{0};    ///< Bytes seen on the wire
    int interface_index{0};
    int vlan_id{no_vlan};       ///< Out-of-band VLAN id, or no_vlan

    bool truncated() const noexcept { return wire_length > capture_length; }
};

/**
 * Take a CaptureInfo snapshot of the current packet
 */
template <CaptureHeaderLike Header>
CaptureInfo capture_info(const Header& hdr) noexcept {
    return CaptureInfo{.timestamp = hdr.timestamp(),
                       .capture_length = hdr.capture_length(),
                       .wire_length = hdr.wire_length(),
                       .interface_index = hdr.interface_index(),
                       .vlan_id = hdr.vlan_id()};
}

} // namespace tpview
