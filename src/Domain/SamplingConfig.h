#pragma once

#include <algorithm>

namespace Domain::Sampling
{

// Refresh cadence (milliseconds)
inline constexpr int REFRESH_INTERVAL_DEFAULT_MS = 3000;
inline constexpr int REFRESH_INTERVAL_MIN_MS = 250;
inline constexpr int REFRESH_INTERVAL_MAX_MS = 60'000;

template<typename T> [[nodiscard]] constexpr T clampRefreshInterval(T value)
{
    return std::clamp(value, static_cast<T>(REFRESH_INTERVAL_MIN_MS), static_cast<T>(REFRESH_INTERVAL_MAX_MS));
}

} // namespace Domain::Sampling
