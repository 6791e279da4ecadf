#pragma once

#include "App/Panel.h"
#include "App/Panels/MemorySection.h"
#include "App/ProcessListView.h"
#include "Domain/BackgroundSampler.h"
#include "Domain/ProcessListModel.h"
#include "Domain/ProcessTerminator.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace App
{

/// Panel showing processes ranked by resident memory, the RAM summary and the
/// terminate actions. Sampling runs on a BackgroundSampler; each new sample is
/// reconciled into the row list on the UI thread in onUpdate().
class ProcessesPanel : public Panel
{
  public:
    ProcessesPanel();
    ~ProcessesPanel() override;

    ProcessesPanel(const ProcessesPanel&) = delete;
    ProcessesPanel& operator=(const ProcessesPanel&) = delete;
    ProcessesPanel(ProcessesPanel&&) = delete;
    ProcessesPanel& operator=(ProcessesPanel&&) = delete;

    /// Take an initial sample, then start the background sampler.
    void onAttach() override;

    /// Stop the sampler before anything it feeds is destroyed.
    void onDetach() override;

    /// Apply the newest pending sample, if any.
    void onUpdate(float deltaTime) override;

    void render(bool* open) override;

    [[nodiscard]] std::size_t processCount() const
    {
        return m_View.rows().size();
    }

    /// Set the refresh interval (clamped by the sampler).
    void setSamplingInterval(std::chrono::milliseconds interval);

    /// Sample immediately on the sampler thread.
    void requestRefresh();

    void setShowMemorySummary(bool show)
    {
        m_ShowMemorySummary = show;
    }

    /// Result of the most recent user action, for the status bar.
    [[nodiscard]] const std::string& lastActionMessage() const noexcept
    {
        return m_LastActionMessage;
    }

  private:
    /// Modal message shown after an action
    struct Notice
    {
        enum class Kind : std::uint8_t
        {
            Info,
            Warning,
            Error,
        };

        Kind kind = Kind::Info;
        std::string title;
        std::string message;
        std::string details; // Optional multi-line list (cleanup failures)
    };

    void renderActionButtons();
    void renderProcessTable();
    void renderNotice();

    void renderCleanupConfirmation();

    void terminateSelected();
    void cleanNonEssential();
    void showNotice(Notice notice);
    void refreshMemoryLabels();

    std::unique_ptr<Domain::BackgroundSampler> m_Sampler;
    std::unique_ptr<Domain::ProcessTerminator> m_Terminator;
    Domain::ProcessListModel m_Model;
    ProcessListView m_View;

    MemorySection::MemoryLabels m_MemoryLabels;
    bool m_ShowMemorySummary = true;

    Notice m_Notice;
    bool m_OpenNotice = false;
    bool m_ConfirmCleanup = false;
    std::string m_LastActionMessage;
};

} // namespace App
