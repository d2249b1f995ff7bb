#pragma once

/**
 * @file tpview.hpp
 * @brief Convenience header for the tpview library
 *
 * Zero-copy header views over PACKET_RX_RING slots for all three ring ABI
 * generations.
 *
 * Primary types:
 * - CaptureHeader: generation-independent view, built with CaptureHeader::parse()
 * - V1FrameView, V2FrameView: single-packet frame headers
 * - V3BlockView: multi-packet block header with a packet cursor
 * - RingRegion: slot addressing over an already-mapped ring
 * - ParseResult: Result wrapper with either a valid view or ParseError
 */

#include "tpview/block_v3.hpp"
#include "tpview/capture_header.hpp"
#include "tpview/capture_info.hpp"
#include "tpview/capture_time.hpp"
#include "tpview/detail/parse_error.hpp"
#include "tpview/detail/parse_result.hpp"
#include "tpview/frame_v1.hpp"
#include "tpview/frame_v2.hpp"
#include "tpview/header_concepts.hpp"
#include "tpview/options.hpp"
#include "tpview/ring_region.hpp"
#include "tpview/types.hpp"
#include "tpview/vlan.hpp"

namespace tpview {

/// Round a byte count up to TPACKET_ALIGNMENT
using detail::tp_align;

/// TPACKET_ALIGNMENT as the kernel headers define it
using detail::ring_alignment;

} // namespace tpview
