#pragma once

#include <concepts>
#include <span>
#include <utility>

#include <cstddef>
#include <cstdint>
#include <tpview/capture_time.hpp>
#include <tpview/options.hpp>
#include <tpview/types.hpp>
#include <tpview/vlan.hpp>

namespace tpview {

/**
 * Capability set shared by every ring header view.
 *
 * V1FrameView, V2FrameView and V3BlockView all satisfy this concept; the
 * ring-reading loop only needs these operations.
 */
template <typename T>
concept CaptureHeaderLike = requires(T& hdr, const T& view, const CaptureOptions& opts) {
    { T::version } -> std::convertible_to<TpacketVersion>;
    { view.status() } -> std::same_as<uint64_t>;
    { view.timestamp() } -> std::same_as<CaptureTime>;
    { view.payload(opts) } -> std::same_as<PacketBytes>;
    { view.raw_payload() } -> std::same_as<std::span<const uint8_t>>;
    { view.wire_length() } -> std::same_as<uint32_t>;
    { view.capture_length() } -> std::same_as<uint32_t>;
    { view.interface_index() } -> std::same_as<int>;
    { view.vlan_id() } -> std::same_as<int>;
    { view.is_armed() } -> std::same_as<bool>;
    { hdr.advance() } -> std::same_as<bool>;
    { std::move(hdr).release() } -> std::same_as<void>;
};

} // namespace tpview
