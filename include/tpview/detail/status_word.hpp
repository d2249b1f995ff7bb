#pragma once

#include <atomic>
#include <type_traits>

namespace tpview::detail {

// The status word is the only field written by both the kernel and this
// process. Reads use acquire so packet data is observed after the kernel's
// TP_STATUS_USER store; the release store orders every preceding read of
// the slot before the kernel may reuse it.

template <typename Word>
[[nodiscard]] inline Word load_status(Word& word) noexcept {
    static_assert(std::is_unsigned_v<Word>);
    return std::atomic_ref<Word>(word).load(std::memory_order_acquire);
}

template <typename Word>
inline void store_status(Word& word, Word value) noexcept {
    static_assert(std::is_unsigned_v<Word>);
    std::atomic_ref<Word>(word).store(value, std::memory_order_release);
}

} // namespace tpview::detail
