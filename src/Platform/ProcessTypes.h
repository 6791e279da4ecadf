#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace Platform
{

/// Raw per-process values read from the OS.
/// Fields the OS could not provide for this process are left empty; the domain layer
/// decides how to present them.
struct ProcessCounters
{
    std::int32_t pid = 0;
    std::optional<std::string> name;      // Short command name (comm on Linux)
    std::optional<std::uint64_t> rssBytes; // Resident set size
};

} // namespace Platform
