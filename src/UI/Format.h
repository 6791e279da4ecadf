#pragma once

#include "UI/Numeric.h"

#include <chrono>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace UI::Format
{

inline constexpr double BYTES_PER_MIB = 1024.0 * 1024.0;
inline constexpr double BYTES_PER_GIB = 1024.0 * 1024.0 * 1024.0;

/// Row value for the "RAM (MB)" column: one decimal, binary megabytes.
[[nodiscard]] inline auto formatMegabytes(std::uint64_t bytes) -> std::string
{
    return std::format("{:.1f}", Numeric::toDouble(bytes) / BYTES_PER_MIB);
}

/// "12.34 GB" (binary gigabytes, two decimals).
[[nodiscard]] inline auto formatGigabytes(std::uint64_t bytes) -> std::string
{
    return std::format("{:.2f} GB", Numeric::toDouble(bytes) / BYTES_PER_GIB);
}

/// Memory summary label. nullopt renders as "<label>: Error".
[[nodiscard]] inline auto memoryLabel(std::string_view label, std::optional<std::uint64_t> bytes) -> std::string
{
    if (!bytes.has_value())
    {
        return std::format("{}: Error", label);
    }
    return std::format("{}: {}", label, formatGigabytes(*bytes));
}

/// Placeholder label shown before the first sample arrives.
[[nodiscard]] inline auto pendingMemoryLabel(std::string_view label) -> std::string
{
    return std::format("{}: ... GB", label);
}

[[nodiscard]] inline auto formatPid(std::int32_t pid) -> std::string
{
    return std::format("{}", pid);
}

/// "3 s", "1.5 s" or "250 ms"
[[nodiscard]] inline auto formatInterval(std::chrono::milliseconds interval) -> std::string
{
    const auto ms = interval.count();
    if (ms < 1000)
    {
        return std::format("{} ms", ms);
    }
    if (ms % 1000 == 0)
    {
        return std::format("{} s", ms / 1000);
    }
    return std::format("{:.1f} s", static_cast<double>(ms) / 1000.0);
}

template<std::integral T> [[nodiscard]] inline auto formatCountWithLabel(T value, std::string_view singular, std::string_view plural) -> std::string
{
    return std::format("{} {}", value, value == T{1} ? singular : plural);
}

} // namespace UI::Format
