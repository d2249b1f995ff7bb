#pragma once

#include <chrono>
#include <compare>

#include <cstdint>
#include <ctime>

namespace tpview {

/**
 * Capture timestamp of one packet
 *
 * ## Storage
 * uint32_t seconds + uint32_t nanoseconds, the widths every ring ABI
 * generation writes. V1 frames report microseconds; from_microseconds()
 * scales them so all generations compare in the same unit.
 */
class CaptureTime {
public:
    static constexpr uint32_t NANOSECONDS_PER_SECOND = 1'000'000'000U;
    static constexpr uint32_t NANOSECONDS_PER_MICROSECOND = 1'000U;

    constexpr CaptureTime() noexcept = default;

    constexpr CaptureTime(uint32_t sec, uint32_t nsec) noexcept
        : seconds_(sec),
          nanoseconds_(nsec) {}

    /// Build from a seconds + microseconds pair (TPACKET_V1)
    static constexpr CaptureTime from_microseconds(uint32_t sec, uint32_t usec) noexcept {
        return CaptureTime(sec, usec * NANOSECONDS_PER_MICROSECOND);
    }

    constexpr uint32_t seconds() const noexcept { return seconds_; }
    constexpr uint32_t nanoseconds() const noexcept { return nanoseconds_; }

    /// Total nanoseconds since the epoch
    constexpr int64_t to_nanoseconds() const noexcept {
        return static_cast<int64_t>(seconds_) * NANOSECONDS_PER_SECOND + nanoseconds_;
    }

    std::chrono::system_clock::time_point to_chrono() const noexcept {
        auto since_epoch = std::chrono::seconds(seconds_) + std::chrono::nanoseconds(nanoseconds_);
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
    }

    std::timespec to_timespec() const noexcept {
        std::timespec ts{};
        ts.tv_sec = static_cast<std::time_t>(seconds_);
        ts.tv_nsec = static_cast<long>(nanoseconds_);
        return ts;
    }

    // Ordering compares the instant; the kernel never writes nsec >= 1e9
    constexpr auto operator<=>(const CaptureTime& other) const noexcept {
        return to_nanoseconds() <=> other.to_nanoseconds();
    }
    constexpr bool operator==(const CaptureTime& other) const noexcept {
        return to_nanoseconds() == other.to_nanoseconds();
    }

private:
    uint32_t seconds_{0};
    uint32_t nanoseconds_{0};
};

} // namespace tpview
