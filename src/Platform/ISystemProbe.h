#pragma once

#include "SystemTypes.h"

#include <optional>

namespace Platform
{

/// Interface for platform-specific system-wide memory totals.
class ISystemProbe
{
  public:
    virtual ~ISystemProbe() = default;

    ISystemProbe() = default;
    ISystemProbe(const ISystemProbe&) = default;
    ISystemProbe& operator=(const ISystemProbe&) = default;
    ISystemProbe(ISystemProbe&&) = default;
    ISystemProbe& operator=(ISystemProbe&&) = default;

    /// Returns raw memory counters, or std::nullopt if the OS source could not be read.
    [[nodiscard]] virtual std::optional<MemoryCounters> readMemory() = 0;
};

} // namespace Platform
