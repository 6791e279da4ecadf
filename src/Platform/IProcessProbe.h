#pragma once

#include "ProcessTypes.h"

#include <vector>

namespace Platform
{

/// Interface for platform-specific process enumeration.
/// Implementations read raw values from OS APIs; ordering and classification
/// happen in the domain layer.
class IProcessProbe
{
  public:
    virtual ~IProcessProbe() = default;

    IProcessProbe() = default;
    IProcessProbe(const IProcessProbe&) = default;
    IProcessProbe& operator=(const IProcessProbe&) = default;
    IProcessProbe(IProcessProbe&&) = default;
    IProcessProbe& operator=(IProcessProbe&&) = default;

    /// Returns counters for all processes visible to the caller (stateless read).
    /// Processes that vanish or deny access mid-enumeration are omitted, never reported as errors.
    [[nodiscard]] virtual std::vector<ProcessCounters> enumerate() = 0;
};

} // namespace Platform
