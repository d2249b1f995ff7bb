#pragma once

#include <span>

#include <cstdint>
#include <tpview/types.hpp>

namespace tpview {

/**
 * @brief Error information from a slot that failed validation
 *
 * Carries the validation error, the ABI generation the slot was read as,
 * the status word observed at parse time, and the slot bytes themselves.
 *
 * This is a trivially copyable type (span is just pointer + size).
 */
struct ParseError {
    ValidationError code;             ///< The validation error that occurred
    TpacketVersion version;           ///< ABI generation the slot was parsed as
    uint64_t status;                  ///< Status word seen when parsing stopped
    std::span<const uint8_t> raw_bytes; ///< Slot bytes for debugging

    /**
     * @brief Get a human-readable error message
     * @return Static string describing the validation error
     */
    [[nodiscard]] const char* message() const noexcept { return validation_error_string(code); }
};

} // namespace tpview
