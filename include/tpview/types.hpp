#pragma once

#include <cstdint>
#include <linux/if_packet.h>

namespace tpview {

/**
 * Ring ABI generation negotiated with PACKET_VERSION
 *
 * Enumerator values match the kernel's TPACKET_V1/V2/V3 so the value read
 * back from getsockopt(PACKET_VERSION) converts directly.
 */
enum class TpacketVersion : uint8_t {
    v1 = TPACKET_V1, ///< One packet per frame, microsecond timestamps
    v2 = TPACKET_V2, ///< One packet per frame, nanosecond timestamps, VLAN fields
    v3 = TPACKET_V3  ///< Many packets per block
};

/**
 * Human-readable name of a ring ABI generation
 */
constexpr const char* version_string(TpacketVersion v) noexcept {
    switch (v) {
        case TpacketVersion::v1:
            return "TPACKET_V1";
        case TpacketVersion::v2:
            return "TPACKET_V2";
        case TpacketVersion::v3:
            return "TPACKET_V3";
    }
    return "TPACKET_UNKNOWN";
}

/**
 * Status word bits for receive rings
 *
 * A slot is kernel-owned while status is TP_STATUS_KERNEL (zero); the
 * kernel sets TP_STATUS_USER together with the informational bits when it
 * hands the slot over.
 */
namespace status {
inline constexpr uint32_t kernel = TP_STATUS_KERNEL;
inline constexpr uint32_t user = TP_STATUS_USER;
inline constexpr uint32_t copy = TP_STATUS_COPY;
inline constexpr uint32_t losing = TP_STATUS_LOSING;
inline constexpr uint32_t csum_not_ready = TP_STATUS_CSUMNOTREADY;
inline constexpr uint32_t vlan_valid = TP_STATUS_VLAN_VALID;
inline constexpr uint32_t block_timeout = TP_STATUS_BLK_TMO;
inline constexpr uint32_t vlan_tpid_valid = TP_STATUS_VLAN_TPID_VALID;
inline constexpr uint32_t csum_valid = TP_STATUS_CSUM_VALID;
inline constexpr uint32_t ts_software = TP_STATUS_TS_SOFTWARE;
inline constexpr uint32_t ts_raw_hardware = TP_STATUS_TS_RAW_HARDWARE;
} // namespace status

/// VLAN id returned when the kernel reported no out-of-band tag
inline constexpr int no_vlan = -1;

/**
 * Reasons a slot cannot be turned into a header view
 */
enum class ValidationError : uint8_t {
    none = 0,                  ///< Slot is well-formed
    unsupported_version,       ///< Version is not v1, v2 or v3
    buffer_too_small,          ///< Slot cannot hold the header and address record
    misaligned_slot,           ///< Slot start is not aligned for the header's status word
    slot_not_ready,            ///< Status word does not carry TP_STATUS_USER
    payload_out_of_bounds,     ///< mac offset + snaplen runs past the slot
    block_length_mismatch,     ///< Block length is smaller than its header or exceeds the slot
    first_packet_out_of_bounds, ///< offset_to_first_pkt places the packet outside the block
    next_packet_out_of_bounds  ///< A computed next-packet position leaves the block
};

/**
 * Get human-readable string for a validation error
 */
constexpr const char* validation_error_string(ValidationError error) noexcept {
    switch (error) {
        case ValidationError::none:
            return "No error";
        case ValidationError::unsupported_version:
            return "Unsupported TPACKET version";
        case ValidationError::buffer_too_small:
            return "Slot too small for header and address record";
        case ValidationError::misaligned_slot:
            return "Slot is not aligned for its header";
        case ValidationError::slot_not_ready:
            return "Slot is still owned by the kernel";
        case ValidationError::payload_out_of_bounds:
            return "Packet data extends beyond the slot";
        case ValidationError::block_length_mismatch:
            return "Block length does not fit the slot";
        case ValidationError::first_packet_out_of_bounds:
            return "First packet offset lies outside the block";
        case ValidationError::next_packet_out_of_bounds:
            return "Next packet offset lies outside the block";
    }
    return "Unknown error";
}

} // namespace tpview
