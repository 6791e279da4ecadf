#include "ProcessesPanel.h"

#include "App/UserConfig.h"
#include "Domain/ProcessSampler.h"
#include "Platform/Factory.h"
#include "UI/Format.h"
#include "UI/Numeric.h"
#include "UI/Theme.h"

#include <imgui.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <memory>
#include <string>
#include <utility>

#include <unistd.h>

namespace App
{

namespace
{

constexpr float PID_COLUMN_WIDTH = 80.0F;
constexpr float MEMORY_COLUMN_WIDTH = 120.0F;
constexpr float ACTION_BUTTON_WIDTH = 190.0F;
constexpr float REFRESH_BUTTON_WIDTH = 140.0F;

void rightAlignedText(const std::string& text)
{
    const float available = ImGui::GetContentRegionAvail().x;
    const float width = ImGui::CalcTextSize(text.c_str()).x;
    if (available > width)
    {
        ImGui::SetCursorPosX(ImGui::GetCursorPosX() + available - width);
    }
    ImGui::TextUnformatted(text.c_str());
}

} // namespace

ProcessesPanel::ProcessesPanel() : Panel("Processes")
{
}

ProcessesPanel::~ProcessesPanel()
{
    onDetach();
}

void ProcessesPanel::onAttach()
{
    const auto& settings = UserConfig::get().settings();
    m_ShowMemorySummary = settings.showMemorySummary;

    auto policy = settings.makeEssentialPolicy();
    spdlog::info("ProcessesPanel: protecting {} PIDs and {} names", policy.protectedPids().size(), policy.protectedNames().size());

    auto sampler = std::make_unique<Domain::ProcessSampler>(Platform::makeProcessProbe(), Platform::makeSystemProbe(), policy);
    m_Sampler = std::make_unique<Domain::BackgroundSampler>(
        std::move(sampler), Domain::SamplerConfig{.interval = std::chrono::milliseconds(settings.refreshIntervalMs)});

    m_Terminator = std::make_unique<Domain::ProcessTerminator>(Platform::makeProcessActions(), std::move(policy));
    m_Terminator->setSelfPid(static_cast<std::int32_t>(::getpid()));

    // Initial population so the first frame is not empty
    if (!m_Model.apply(m_Sampler->sampleNow(), m_View).has_value())
    {
        spdlog::warn("ProcessesPanel: initial sample was not applied");
    }
    refreshMemoryLabels();

    m_Sampler->setCallback([this](Domain::Sample sample) { m_Model.submit(std::move(sample)); });
    m_Sampler->start();

    spdlog::info("ProcessesPanel: initialized with {} processes", m_View.rows().size());
}

void ProcessesPanel::onDetach()
{
    if (!m_Sampler)
    {
        return;
    }

    // After stop() returns the sampler thread can no longer reach m_Model.
    m_Sampler->stop();
    m_Sampler->setCallback({});
    m_Sampler.reset();
    m_Terminator.reset();
    spdlog::debug("ProcessesPanel: detached");
}

void ProcessesPanel::onUpdate([[maybe_unused]] float deltaTime)
{
    if (m_Model.applyPending(m_View).has_value())
    {
        refreshMemoryLabels();
    }
}

void ProcessesPanel::setSamplingInterval(std::chrono::milliseconds interval)
{
    if (m_Sampler)
    {
        m_Sampler->setInterval(interval);
    }
}

void ProcessesPanel::requestRefresh()
{
    if (m_Sampler)
    {
        m_Sampler->requestRefresh();
    }
}

void ProcessesPanel::refreshMemoryLabels()
{
    m_MemoryLabels = MemorySection::buildLabels(m_Model.hasSample(), m_Model.memory());
}

void ProcessesPanel::render(bool* open)
{
    const ImGuiWindowFlags windowFlags = ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoResize |
                                         ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoBringToFrontOnFocus |
                                         ImGuiWindowFlags_NoSavedSettings;

    if (!ImGui::Begin(m_Name.c_str(), open, windowFlags))
    {
        ImGui::End();
        return;
    }

    if (!m_Sampler)
    {
        const auto& theme = UI::Theme::get();
        ImGui::TextColored(theme.scheme().textError, "Process sampler not initialized");
        ImGui::End();
        return;
    }

    if (m_ShowMemorySummary)
    {
        MemorySection::renderMemorySection(m_MemoryLabels);
        ImGui::Separator();
    }

    renderProcessTable();
    renderActionButtons();
    renderCleanupConfirmation();
    renderNotice();

    ImGui::End();
}

void ProcessesPanel::renderProcessTable()
{
    const auto& theme = UI::Theme::get();
    const ImGuiStyle& style = ImGui::GetStyle();

    // Leave room for the button row below the table
    const float buttonRowHeight = ImGui::GetFrameHeightWithSpacing() + style.ItemSpacing.y;
    const float tableHeight = std::max(ImGui::GetContentRegionAvail().y - buttonRowHeight, ImGui::GetFrameHeight() * 4.0F);

    const ImGuiTableFlags tableFlags = ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersOuter | ImGuiTableFlags_BordersV |
                                       ImGuiTableFlags_ScrollY | ImGuiTableFlags_Resizable | ImGuiTableFlags_SizingFixedFit;

    if (!ImGui::BeginTable("ProcessTable", 3, tableFlags, ImVec2(0.0F, tableHeight)))
    {
        return;
    }

    ImGui::TableSetupScrollFreeze(0, 1); // Freeze header row
    ImGui::TableSetupColumn("PID", ImGuiTableColumnFlags_WidthFixed, PID_COLUMN_WIDTH);
    ImGui::TableSetupColumn("Process", ImGuiTableColumnFlags_WidthStretch);
    ImGui::TableSetupColumn("RAM (MB)", ImGuiTableColumnFlags_WidthFixed, MEMORY_COLUMN_WIDTH);
    ImGui::TableHeadersRow();

    // Scroll restore computed against the previous frame's extent
    const auto pendingScroll = m_View.takePendingScroll();
    if (pendingScroll.has_value())
    {
        ImGui::SetScrollY(*pendingScroll * ImGui::GetScrollMaxY());
    }
    const auto ensureVisiblePid = m_View.takePendingEnsureVisible();

    const float headerBottom = ImGui::GetWindowPos().y + ImGui::GetFrameHeight();
    const float viewBottom = ImGui::GetWindowPos().y + ImGui::GetWindowHeight();
    const auto selectedPid = m_View.selectedPid();

    for (const auto& row : m_View.rows())
    {
        ImGui::TableNextRow();
        ImGui::PushStyleColor(ImGuiCol_Text, theme.rowColor(row.isEssential));

        ImGui::TableSetColumnIndex(0);
        const bool isSelected = selectedPid.has_value() && *selectedPid == row.pid;
        // Handle-based ID keeps ImGui state attached to the row, not its position
        const std::string label = std::format("{}##row{}", UI::Format::formatPid(row.pid), row.handle);
        if (ImGui::Selectable(label.c_str(), isSelected, ImGuiSelectableFlags_SpanAllColumns))
        {
            m_View.userSelect(row.pid);
        }

        if (ensureVisiblePid.has_value() && *ensureVisiblePid == row.pid)
        {
            // Scroll only as far as needed
            if (ImGui::GetItemRectMin().y < headerBottom)
            {
                ImGui::SetScrollHereY(0.0F);
            }
            else if (ImGui::GetItemRectMax().y > viewBottom)
            {
                ImGui::SetScrollHereY(1.0F);
            }
        }

        ImGui::TableSetColumnIndex(1);
        ImGui::TextUnformatted(row.displayName.c_str());

        ImGui::TableSetColumnIndex(2);
        rightAlignedText(UI::Format::formatMegabytes(row.residentMemoryBytes));

        ImGui::PopStyleColor();
    }

    if (!pendingScroll.has_value())
    {
        m_View.observeScroll(UI::Numeric::fractionOf(ImGui::GetScrollY(), ImGui::GetScrollMaxY()));
    }

    ImGui::EndTable();
}

void ProcessesPanel::renderActionButtons()
{
    const auto& theme = UI::Theme::get();
    const bool canTerminate = m_Terminator && m_Terminator->canTerminate();

    ImGui::BeginDisabled(!canTerminate);

    ImGui::PushStyleColor(ImGuiCol_Button, theme.scheme().dangerButton);
    ImGui::PushStyleColor(ImGuiCol_ButtonHovered, theme.scheme().dangerButtonHovered);
    ImGui::PushStyleColor(ImGuiCol_ButtonActive, theme.scheme().dangerButtonActive);
    if (ImGui::Button("Terminate Selected", ImVec2(ACTION_BUTTON_WIDTH, 0.0F)))
    {
        terminateSelected();
    }
    ImGui::PopStyleColor(3);
    if (ImGui::IsItemHovered(ImGuiHoveredFlags_AllowWhenDisabled))
    {
        ImGui::SetTooltip("Send SIGTERM to the selected process");
    }

    ImGui::SameLine();
    if (ImGui::Button("Clean All Non-Essential", ImVec2(ACTION_BUTTON_WIDTH, 0.0F)))
    {
        m_ConfirmCleanup = true;
    }
    if (ImGui::IsItemHovered(ImGuiHoveredFlags_AllowWhenDisabled))
    {
        ImGui::SetTooltip("Send SIGTERM to every listed process that is not protected");
    }

    ImGui::EndDisabled();

    ImGui::SameLine();
    if (ImGui::Button("Refresh Now", ImVec2(REFRESH_BUTTON_WIDTH, 0.0F)))
    {
        requestRefresh();
    }
}

void ProcessesPanel::renderCleanupConfirmation()
{
    if (m_ConfirmCleanup)
    {
        ImGui::OpenPopup("Confirm Cleanup");
        m_ConfirmCleanup = false;
    }

    if (ImGui::BeginPopupModal("Confirm Cleanup", nullptr, ImGuiWindowFlags_AlwaysAutoResize))
    {
        ImGui::TextUnformatted("Send SIGTERM to every non-essential process in the list?");
        ImGui::Spacing();
        ImGui::Separator();
        ImGui::Spacing();

        if (ImGui::Button("Yes", ImVec2(120, 0)))
        {
            ImGui::CloseCurrentPopup();
            cleanNonEssential();
        }

        ImGui::SameLine();

        if (ImGui::Button("No", ImVec2(120, 0)))
        {
            ImGui::CloseCurrentPopup();
        }

        ImGui::EndPopup();
    }
}

void ProcessesPanel::renderNotice()
{
    if (m_OpenNotice)
    {
        ImGui::OpenPopup("###ProcessNotice");
        m_OpenNotice = false;
    }

    const std::string title = std::format("{}###ProcessNotice", m_Notice.title);
    if (!ImGui::BeginPopupModal(title.c_str(), nullptr, ImGuiWindowFlags_AlwaysAutoResize))
    {
        return;
    }

    const auto& scheme = UI::Theme::get().scheme();
    switch (m_Notice.kind)
    {
    case Notice::Kind::Info:
        ImGui::TextUnformatted(m_Notice.message.c_str());
        break;
    case Notice::Kind::Warning:
        ImGui::TextColored(scheme.textWarning, "%s", m_Notice.message.c_str());
        break;
    case Notice::Kind::Error:
        ImGui::TextColored(scheme.textError, "%s", m_Notice.message.c_str());
        break;
    }

    if (!m_Notice.details.empty())
    {
        ImGui::Spacing();
        ImGui::TextColored(scheme.textMuted, "%s", m_Notice.details.c_str());
    }

    ImGui::Spacing();
    ImGui::Separator();
    ImGui::Spacing();

    if (ImGui::Button("OK", ImVec2(120, 0)) || ImGui::IsKeyPressed(ImGuiKey_Enter) || ImGui::IsKeyPressed(ImGuiKey_Escape))
    {
        ImGui::CloseCurrentPopup();
    }

    ImGui::EndPopup();
}

void ProcessesPanel::showNotice(Notice notice)
{
    m_Notice = std::move(notice);
    m_OpenNotice = true;
}

void ProcessesPanel::terminateSelected()
{
    const auto* row = m_View.selectedRow();
    if (row == nullptr)
    {
        showNotice({.kind = Notice::Kind::Info, .title = "No selection", .message = "Please select a process first.", .details = {}});
        return;
    }

    const auto result = m_Terminator->terminate(row->pid, row->displayName);
    switch (result.outcome)
    {
    case Domain::TerminateOutcome::Sent:
        m_LastActionMessage = std::format("Sent SIGTERM to {} (PID {})", result.name, result.pid);
        requestRefresh();
        break;
    case Domain::TerminateOutcome::NotFound:
        m_LastActionMessage = std::format("{} (PID {}) has already exited", result.name, result.pid);
        requestRefresh();
        break;
    case Domain::TerminateOutcome::Blocked:
        m_LastActionMessage = result.message;
        showNotice({.kind = Notice::Kind::Warning, .title = "Essential process", .message = result.message, .details = {}});
        break;
    case Domain::TerminateOutcome::PermissionDenied:
        m_LastActionMessage = result.message;
        showNotice({.kind = Notice::Kind::Error, .title = "Permission denied", .message = result.message, .details = {}});
        break;
    case Domain::TerminateOutcome::Failed:
        m_LastActionMessage = result.message;
        showNotice({.kind = Notice::Kind::Error, .title = "Terminate failed", .message = result.message, .details = {}});
        break;
    }
}

void ProcessesPanel::cleanNonEssential()
{
    // Operates on what the user sees, not on a fresh sample
    const auto report = m_Terminator->cleanNonEssential(m_Model.displayedRows());

    std::string details;
    for (const auto& failure : report.failures)
    {
        if (!details.empty())
        {
            details += '\n';
        }
        details += failure.message;
    }

    m_LastActionMessage = std::format("Sent terminate signal to {} processes.", report.sent);
    showNotice({
        .kind = report.failures.empty() ? Notice::Kind::Info : Notice::Kind::Warning,
        .title = "Cleanup",
        .message = m_LastActionMessage,
        .details = std::move(details),
    });

    requestRefresh();
}

} // namespace App
