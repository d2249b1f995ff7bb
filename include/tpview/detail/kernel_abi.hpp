#pragma once

#include <cstddef>
#include <cstdint>
#include <linux/if_packet.h>

namespace tpview::detail {

// ============================================================================
// Kernel ring ABI
//
// The structures below are the kernel's own definitions from
// <linux/if_packet.h>. They are overlaid directly on memory shared with the
// kernel, so every offset is pinned with a static_assert: a header that
// drifts from the layout the kernel writes must fail to compile.
// ============================================================================

using V1FrameHeader = ::tpacket_hdr;    ///< TPACKET_V1 frame header
using V2FrameHeader = ::tpacket2_hdr;   ///< TPACKET_V2 frame header
using V3PacketHeader = ::tpacket3_hdr;  ///< TPACKET_V3 per-packet header
using V3BlockDesc = ::tpacket_block_desc; ///< TPACKET_V3 block descriptor
using V3BlockHeader = ::tpacket_hdr_v1; ///< Block sub-header inside V3BlockDesc
using AddressRecord = ::sockaddr_ll;    ///< Trailing link-layer address record

/// Ring alignment boundary, as the kernel defines it
inline constexpr size_t ring_alignment = TPACKET_ALIGNMENT;

static_assert((ring_alignment & (ring_alignment - 1)) == 0,
              "TPACKET_ALIGNMENT must be a power of two");

/**
 * Round a byte count up to the ring alignment boundary
 *
 * Same arithmetic as the kernel's TPACKET_ALIGN() macro.
 *
 * @param x Byte count
 * @return Smallest multiple of ring_alignment that is >= x
 */
constexpr size_t tp_align(size_t x) noexcept {
    return (x + ring_alignment - 1) & ~(ring_alignment - 1);
}

// V1 frame header: status is an unsigned long (8 bytes on LP64)
static_assert(offsetof(V1FrameHeader, tp_status) == 0);
static_assert(offsetof(V1FrameHeader, tp_len) == sizeof(unsigned long));
static_assert(offsetof(V1FrameHeader, tp_snaplen) == sizeof(unsigned long) + 4);
static_assert(offsetof(V1FrameHeader, tp_mac) == sizeof(unsigned long) + 8);
static_assert(offsetof(V1FrameHeader, tp_net) == sizeof(unsigned long) + 10);
static_assert(offsetof(V1FrameHeader, tp_sec) == sizeof(unsigned long) + 12);
static_assert(offsetof(V1FrameHeader, tp_usec) == sizeof(unsigned long) + 16);

// V2 frame header
static_assert(offsetof(V2FrameHeader, tp_status) == 0);
static_assert(offsetof(V2FrameHeader, tp_len) == 4);
static_assert(offsetof(V2FrameHeader, tp_snaplen) == 8);
static_assert(offsetof(V2FrameHeader, tp_mac) == 12);
static_assert(offsetof(V2FrameHeader, tp_net) == 14);
static_assert(offsetof(V2FrameHeader, tp_sec) == 16);
static_assert(offsetof(V2FrameHeader, tp_nsec) == 20);
static_assert(offsetof(V2FrameHeader, tp_vlan_tci) == 24);
static_assert(offsetof(V2FrameHeader, tp_vlan_tpid) == 26);
static_assert(sizeof(V2FrameHeader) == 32);

// V3 packet header
static_assert(offsetof(V3PacketHeader, tp_next_offset) == 0);
static_assert(offsetof(V3PacketHeader, tp_sec) == 4);
static_assert(offsetof(V3PacketHeader, tp_nsec) == 8);
static_assert(offsetof(V3PacketHeader, tp_snaplen) == 12);
static_assert(offsetof(V3PacketHeader, tp_len) == 16);
static_assert(offsetof(V3PacketHeader, tp_status) == 20);
static_assert(offsetof(V3PacketHeader, tp_mac) == 24);
static_assert(offsetof(V3PacketHeader, tp_net) == 26);
static_assert(offsetof(V3PacketHeader, hv1) == 28);
static_assert(sizeof(V3PacketHeader) == 48);

// V3 block descriptor
static_assert(offsetof(V3BlockDesc, version) == 0);
static_assert(offsetof(V3BlockDesc, offset_to_priv) == 4);
static_assert(offsetof(V3BlockDesc, hdr) == 8);
static_assert(offsetof(V3BlockHeader, block_status) == 0);
static_assert(offsetof(V3BlockHeader, num_pkts) == 4);
static_assert(offsetof(V3BlockHeader, offset_to_first_pkt) == 8);
static_assert(offsetof(V3BlockHeader, blk_len) == 12);
static_assert(offsetof(V3BlockHeader, seq_num) == 16);
static_assert(offsetof(V3BlockHeader, ts_first_pkt) == 24);
static_assert(offsetof(V3BlockHeader, ts_last_pkt) == 32);

// Trailing address record: only sll_ifindex is consumed
static_assert(offsetof(AddressRecord, sll_ifindex) == 4);
static_assert(sizeof(AddressRecord) == 20);

/**
 * Byte offset from a header's start to its trailing address record
 *
 * @tparam Header Kernel header type (frame header or v3 packet header)
 */
template <typename Header>
inline constexpr size_t address_record_offset = tp_align(sizeof(Header));

/**
 * Bytes a slot must hold for a header plus its trailing address record
 */
template <typename Header>
inline constexpr size_t header_span_bytes = address_record_offset<Header> + sizeof(AddressRecord);

static_assert(header_span_bytes<V1FrameHeader> == TPACKET_HDRLEN);
static_assert(header_span_bytes<V2FrameHeader> == TPACKET2_HDRLEN);
static_assert(header_span_bytes<V3PacketHeader> == TPACKET3_HDRLEN);

} // namespace tpview::detail
