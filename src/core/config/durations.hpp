#pragma once
#include <chrono>

namespace acpbridge::core::config {

    // Upper bound for any timeout taken from config or the wire (about 31 years).
    constexpr long long kMaxTimeoutMillis = 1000000000000LL;

    // Converts seconds to milliseconds, saturating at kMaxTimeoutMillis.
    // NaN and non-positive values map to zero.
    inline std::chrono::milliseconds seconds_to_millis(const double seconds) {
        if (!(seconds > 0.0)) {
            return std::chrono::milliseconds(0);
        }
        const double millis = seconds * 1000.0;
        if (millis >= static_cast<double>(kMaxTimeoutMillis)) {
            return std::chrono::milliseconds(kMaxTimeoutMillis);
        }
        return std::chrono::milliseconds(static_cast<long long>(millis));
    }

} // namespace acpbridge::core::config
