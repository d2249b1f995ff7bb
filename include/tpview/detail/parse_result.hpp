#pragma once

#include "../expected.hpp"
#include "parse_error.hpp"

namespace tpview {

/**
 * @brief Result type for slot parsing operations
 *
 * Alias for expected<T, ParseError>. Holds either a validated header view
 * or a ParseError with details about what went wrong.
 *
 * Usage:
 * @code
 *   auto result = tpview::V2FrameView::parse(slot);
 *   if (result.has_value()) {
 *       auto bytes = result->payload(options);
 *   } else {
 *       std::cerr << result.error().message() << "\n";
 *   }
 * @endcode
 *
 * @tparam T The type of the successfully parsed view
 */
template <typename T>
using ParseResult = expected<T, ParseError>;

/**
 * @brief Factory function for creating parse errors
 *
 * @param code The validation error code
 * @param version The ABI generation that was being parsed
 * @param status The status word observed (zero if never read)
 * @param bytes The slot bytes that failed to parse
 * @return unexpected<ParseError> suitable for returning from parse functions
 */
inline auto make_parse_error(ValidationError code, TpacketVersion version, uint64_t status,
                             std::span<const uint8_t> bytes) noexcept {
    return unexpected(
        ParseError{.code = code, .version = version, .status = status, .raw_bytes = bytes});
}

} // namespace tpview
