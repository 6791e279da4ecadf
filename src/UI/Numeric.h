#pragma once

#include "Domain/Numeric.h"

#include <algorithm>

namespace UI::Numeric
{

using Domain::Numeric::toDouble;

/// Fraction in [0, 1]; 0 when @p whole is not positive (content fits, nothing to scroll).
[[nodiscard]] constexpr auto fractionOf(float part, float whole) noexcept -> float
{
    if (whole <= 0.0F)
    {
        return 0.0F;
    }
    return std::clamp(part / whole, 0.0F, 1.0F);
}

} // namespace UI::Numeric
