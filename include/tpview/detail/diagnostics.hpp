#pragma once

#include <cstdio>

namespace tpview::detail {

// Debug-build report of a caller contract violation. Release builds stay
// silent; the violating call is ignored rather than corrupting the ring.
inline void contract_warning([[maybe_unused]] const char* what) noexcept {
#ifndef NDEBUG
    std::fprintf(stderr, "WARNING: tpview: %s\n", what);
#endif
}

} // namespace tpview::detail
