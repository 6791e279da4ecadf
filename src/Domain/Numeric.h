#pragma once

#include <concepts>
#include <cstdint>
#include <utility>

namespace Domain::Numeric
{

template<typename T>
    requires(std::integral<T> || std::floating_point<T>)
[[nodiscard]] constexpr auto toDouble(T value) noexcept -> double
{
    return static_cast<double>(value);
}

/// Safe narrowing conversion with fallback value.
/// Returns fallback if value is out of range for target type.
template<std::integral To, std::integral From> [[nodiscard]] constexpr auto narrowOr(From value, To fallback) noexcept -> To
{
    if (!std::in_range<To>(value))
    {
        return fallback;
    }
    return static_cast<To>(value);
}

/// a - b, clamped at zero. OS memory counters are sampled non-atomically and may cross.
[[nodiscard]] constexpr auto saturatingSub(std::uint64_t a, std::uint64_t b) noexcept -> std::uint64_t
{
    return (a > b) ? (a - b) : 0;
}

} // namespace Domain::Numeric
