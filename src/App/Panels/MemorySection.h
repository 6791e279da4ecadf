#pragma once

#include "Domain/ProcessRecord.h"

#include <optional>
#include <string>

namespace App::MemorySection
{

/// Text of the three RAM summary labels
struct MemoryLabels
{
    std::string used;
    std::string available;
    std::string total;
    bool isError = false; // The last memory read failed
};

/// Build labels for the current state.
/// @param hasSample False until the first sample is applied (labels show a placeholder).
/// @param memory Summary of the last applied sample; nullopt renders "Error".
[[nodiscard]] MemoryLabels buildLabels(bool hasSample, const std::optional<Domain::SystemMemorySummary>& memory);

/// Render the labels on one line.
void renderMemorySection(const MemoryLabels& labels);

} // namespace App::MemorySection
