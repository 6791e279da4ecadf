#include "ShellLayer.h"

#include "Core/Application.h"
#include "Domain/SamplingConfig.h"
#include "UI/Format.h"
#include "UI/Theme.h"
#include "UserConfig.h"

#include <imgui.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <limits>
#include <string>

#include <sys/wait.h>
#include <unistd.h>

namespace App
{

namespace
{

constexpr std::array<int, 6> REFRESH_STOPS = {250, 500, 1000, 3000, 5000, 10'000};

[[nodiscard]] float statusBarHeight()
{
    return ImGui::GetFrameHeight() + (ImGui::GetStyle().WindowPadding.y * 2.0F);
}

[[nodiscard]] int snapRefreshIntervalMs(int value)
{
    // Snap only when within a fifth of the stop
    int best = value;
    int bestDist = std::numeric_limits<int>::max();

    for (const int stop : REFRESH_STOPS)
    {
        const int dist = std::abs(value - stop);
        if (dist <= stop / 5 && dist < bestDist)
        {
            best = stop;
            bestDist = dist;
        }
    }

    return best;
}

/// Open a file with the desktop's default application
void openFileWithDefaultEditor(const std::filesystem::path& filePath)
{
    if (!std::filesystem::exists(filePath))
    {
        spdlog::error("Cannot open file: {} does not exist", filePath.string());
        return;
    }

    // Double-fork so xdg-open is reparented to init and never becomes a zombie
    const pid_t pid = fork();
    if (pid == -1)
    {
        spdlog::error("Failed to fork process for xdg-open: {}", strerror(errno));
        return;
    }

    if (pid == 0)
    {
        const pid_t grandchild = fork();
        if (grandchild == -1)
        {
            _exit(EXIT_FAILURE);
        }

        if (grandchild == 0)
        {
            const std::string pathStr = filePath.string();
            execlp("xdg-open", "xdg-open", pathStr.c_str(), nullptr);
            _exit(EXIT_FAILURE);
        }
        _exit(0);
    }

    int status = 0;
    if (waitpid(pid, &status, 0) == -1)
    {
        spdlog::error("waitpid failed while waiting for xdg-open child process: {}", strerror(errno));
        return;
    }
    spdlog::info("Opened config file with xdg-open: {}", filePath.string());
}

} // namespace

ShellLayer::ShellLayer() : Layer("ShellLayer")
{
}

void ShellLayer::onAttach()
{
    spdlog::info("{} attached", name());

    // Settings were loaded in main() to size the window; the layout needs a live ImGui context.
    auto& config = UserConfig::get();
    config.applyImGuiLayout();

    m_ShowMemorySummary = config.settings().showMemorySummary;
    m_ProcessesPanel.onAttach();
    m_ProcessesPanel.setShowMemorySummary(m_ShowMemorySummary);
}

void ShellLayer::onDetach()
{
    auto& config = UserConfig::get();
    config.captureImGuiLayout();

    auto& settings = config.settings();
    settings.showMemorySummary = m_ShowMemorySummary;

    const auto geometry = Core::Application::get().getWindow().restoredGeometry();
    settings.windowWidth = geometry.Width;
    settings.windowHeight = geometry.Height;
    settings.windowPosX = geometry.PosX;
    settings.windowPosY = geometry.PosY;
    settings.windowMaximized = geometry.Maximized;

    config.save();

    m_ProcessesPanel.onDetach();
    spdlog::info("{} detached", name());
}

void ShellLayer::onUpdate(float deltaTime)
{
    m_ProcessesPanel.onUpdate(deltaTime);
}

void ShellLayer::onRender()
{
    if (!ImGui::GetIO().WantTextInput && ImGui::IsKeyPressed(ImGuiKey_F5, false))
    {
        m_ProcessesPanel.requestRefresh();
    }

    renderMenuBar();
    placeProcessesPanel();
    m_ProcessesPanel.render(nullptr);
    renderStatusBar();
}

void ShellLayer::placeProcessesPanel() const
{
    // The main menu bar already shrinks the viewport work area
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(ImVec2(viewport->WorkSize.x, viewport->WorkSize.y - statusBarHeight()));
}

void ShellLayer::renderMenuBar()
{
    if (!ImGui::BeginMainMenuBar())
    {
        return;
    }

    if (ImGui::BeginMenu("File"))
    {
        if (ImGui::MenuItem("Exit", "Alt+F4"))
        {
            Core::Application::get().stop();
        }
        ImGui::EndMenu();
    }

    if (ImGui::BeginMenu("View"))
    {
        if (ImGui::MenuItem("Memory Summary", nullptr, &m_ShowMemorySummary))
        {
            m_ProcessesPanel.setShowMemorySummary(m_ShowMemorySummary);
        }

        ImGui::Separator();
        renderRefreshSlider();

        if (ImGui::MenuItem("Refresh Now", "F5"))
        {
            m_ProcessesPanel.requestRefresh();
        }
        ImGui::EndMenu();
    }

    if (ImGui::BeginMenu("Tools"))
    {
        if (ImGui::MenuItem("Open Config File..."))
        {
            auto& config = UserConfig::get();
            // Write first so there is something to open on a fresh install
            config.save();
            openFileWithDefaultEditor(config.configPath());
        }
        ImGui::EndMenu();
    }

    ImGui::EndMainMenuBar();
}

void ShellLayer::renderRefreshSlider()
{
    auto& settings = UserConfig::get().settings();
    const int beforeMs = settings.refreshIntervalMs;
    int refreshIntervalMs = beforeMs;

    ImGui::SetNextItemWidth(220.0F);
    const bool sliderChanged = ImGui::SliderInt("Refresh (ms)",
                                                &refreshIntervalMs,
                                                Domain::Sampling::REFRESH_INTERVAL_MIN_MS,
                                                Domain::Sampling::REFRESH_INTERVAL_MAX_MS,
                                                "%d",
                                                ImGuiSliderFlags_Logarithmic | ImGuiSliderFlags_AlwaysClamp);

    const bool editFinished = ImGui::IsItemDeactivatedAfterEdit();
    if (editFinished)
    {
        refreshIntervalMs = snapRefreshIntervalMs(refreshIntervalMs);
    }

    if (sliderChanged || refreshIntervalMs != beforeMs)
    {
        settings.refreshIntervalMs = Domain::Sampling::clampRefreshInterval(refreshIntervalMs);
        m_ProcessesPanel.setSamplingInterval(std::chrono::milliseconds(settings.refreshIntervalMs));
    }

    // One immediate sample per drag, not one per frame while dragging
    if (editFinished)
    {
        m_ProcessesPanel.requestRefresh();
    }
}

void ShellLayer::renderStatusBar() const
{
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    const float height = statusBarHeight();

    ImGui::SetNextWindowPos(ImVec2(viewport->WorkPos.x, viewport->WorkPos.y + viewport->WorkSize.y - height));
    ImGui::SetNextWindowSize(ImVec2(viewport->WorkSize.x, height));

    const ImGuiWindowFlags windowFlags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoScrollWithMouse |
                                         ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_NoNav;

    const auto& theme = UI::Theme::get();
    ImGui::PushStyleColor(ImGuiCol_WindowBg, theme.scheme().statusBarBg);
    ImGui::PushStyleColor(ImGuiCol_Border, theme.scheme().border);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 0.0F);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowBorderSize, 1.0F);
    const float verticalPadding = (height - ImGui::GetFontSize()) * 0.5F;
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(8.0F, verticalPadding));

    if (ImGui::Begin("##StatusBar", nullptr, windowFlags))
    {
        const auto& settings = UserConfig::get().settings();
        const std::string summary =
            UI::Format::formatCountWithLabel(m_ProcessesPanel.processCount(), "process", "processes") + " | refreshed every " +
            UI::Format::formatInterval(std::chrono::milliseconds(settings.refreshIntervalMs));
        ImGui::TextUnformatted(summary.c_str());

        const auto& message = m_ProcessesPanel.lastActionMessage();
        if (!message.empty())
        {
            const float width = ImGui::CalcTextSize(message.c_str()).x;
            ImGui::SameLine(std::max(ImGui::GetWindowWidth() - width - 16.0F, ImGui::GetCursorPosX() + 24.0F));
            ImGui::TextColored(theme.scheme().textMuted, "%s", message.c_str());
        }
    }
    ImGui::End();
    ImGui::PopStyleVar(3);
    ImGui::PopStyleColor(2);
}

} // namespace App
