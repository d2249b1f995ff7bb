#pragma once

namespace tpview {

/**
 * Per-read capture options
 *
 * Passed to payload() on every header view.
 */
struct CaptureOptions {
    /// Re-insert an 802.1Q tag the kernel stripped and reported out-of-band
    bool add_vlan_header = false;
};

} // namespace tpview
