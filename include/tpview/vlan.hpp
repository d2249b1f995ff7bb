#pragma once

#include <span>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace tpview {

inline constexpr size_t eth_addr_len = 6;     ///< Bytes in one MAC address
inline constexpr size_t vlan_header_len = 4;  ///< Bytes in an 802.1Q tag
inline constexpr uint16_t vlan_tpid_8021q = 0x8100;
inline constexpr uint16_t vlan_vid_mask = 0x0FFF;

/**
 * Packet bytes handed to the caller by payload()
 *
 * Either borrows the ring slot (the common case, no copy) or owns a
 * rebuilt frame when an 802.1Q tag had to be re-inserted. Borrowed bytes
 * are valid only until the header view that produced them is released.
 */
class PacketBytes {
public:
    PacketBytes() noexcept = default;

    /// Borrow bytes that live elsewhere (normally the ring slot)
    explicit PacketBytes(std::span<const uint8_t> borrowed) noexcept
        : borrowed_(borrowed) {}

    /// Take ownership of a rebuilt frame
    explicit PacketBytes(std::vector<uint8_t>&& owned) noexcept
        : owned_(std::move(owned)),
          is_owned_(true) {}

    std::span<const uint8_t> bytes() const noexcept {
        return is_owned_ ? std::span<const uint8_t>(owned_) : borrowed_;
    }

    const uint8_t* data() const noexcept { return bytes().data(); }
    size_t size() const noexcept { return bytes().size(); }
    bool empty() const noexcept { return size() == 0; }

    /// True when the bytes were copied out of the ring
    bool owns_storage() const noexcept { return is_owned_; }

    uint8_t operator[](size_t i) const noexcept { return bytes()[i]; }

    operator std::span<const uint8_t>() const noexcept { return bytes(); }

private:
    std::span<const uint8_t> borrowed_{};
    std::vector<uint8_t> owned_{};
    bool is_owned_{false};
};

/**
 * Rebuild in-band 802.1Q framing for a packet whose tag was stripped
 *
 * When tci is zero or insertion is disabled the input is returned as a
 * borrowed view. Otherwise the result is the two MAC addresses, the tag
 * (TPID 0x8100 followed by the TCI in network byte order), then the rest
 * of the original frame.
 *
 * Frames shorter than the two MAC addresses are returned unchanged.
 *
 * @param frame Link-layer frame starting at the destination MAC
 * @param tci Tag control information reported by the kernel
 * @param enabled CaptureOptions::add_vlan_header
 */
inline PacketBytes reinsert_vlan(std::span<const uint8_t> frame, uint16_t tci, bool enabled) {
    constexpr size_t mac_pair = eth_addr_len * 2;
    if (tci == 0 || !enabled || frame.size() < mac_pair) {
        return PacketBytes(frame);
    }

    std::vector<uint8_t> out;
    out.reserve(frame.size() + vlan_header_len);
    out.insert(out.end(), frame.begin(), frame.begin() + mac_pair);
    out.push_back(static_cast<uint8_t>(vlan_tpid_8021q >> 8));
    out.push_back(static_cast<uint8_t>(vlan_tpid_8021q & 0xFF));
    out.push_back(static_cast<uint8_t>((tci >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(tci & 0xFF));
    out.insert(out.end(), frame.begin() + mac_pair, frame.end());
    return PacketBytes(std::move(out));
}

} // namespace tpview
