#include "MemorySection.h"

#include "UI/Format.h"
#include "UI/Theme.h"

#include <imgui.h>

namespace App::MemorySection
{

namespace
{

constexpr const char* USED_LABEL = "Used RAM";
constexpr const char* AVAILABLE_LABEL = "Available RAM";
constexpr const char* TOTAL_LABEL = "Total RAM";

} // namespace

MemoryLabels buildLabels(bool hasSample, const std::optional<Domain::SystemMemorySummary>& memory)
{
    using UI::Format::memoryLabel;
    using UI::Format::pendingMemoryLabel;

    if (!hasSample)
    {
        return {
            .used = pendingMemoryLabel(USED_LABEL),
            .available = pendingMemoryLabel(AVAILABLE_LABEL),
            .total = pendingMemoryLabel(TOTAL_LABEL),
            .isError = false,
        };
    }

    if (!memory.has_value())
    {
        return {
            .used = memoryLabel(USED_LABEL, std::nullopt),
            .available = memoryLabel(AVAILABLE_LABEL, std::nullopt),
            .total = memoryLabel(TOTAL_LABEL, std::nullopt),
            .isError = true,
        };
    }

    return {
        .used = memoryLabel(USED_LABEL, memory->usedBytes),
        .available = memoryLabel(AVAILABLE_LABEL, memory->availableBytes),
        .total = memoryLabel(TOTAL_LABEL, memory->totalBytes),
        .isError = false,
    };
}

void renderMemorySection(const MemoryLabels& labels)
{
    const auto& theme = UI::Theme::get();

    if (labels.isError)
    {
        ImGui::PushStyleColor(ImGuiCol_Text, theme.scheme().textError);
    }

    const float spacing = ImGui::GetStyle().ItemSpacing.x * 4.0F;
    ImGui::TextUnformatted(labels.used.c_str());
    ImGui::SameLine(0.0F, spacing);
    ImGui::TextUnformatted(labels.available.c_str());
    ImGui::SameLine(0.0F, spacing);
    ImGui::TextUnformatted(labels.total.c_str());

    if (labels.isError)
    {
        ImGui::PopStyleColor();
    }
}

} // namespace App::MemorySection
