#pragma once

#include "Core/Layer.h"
#include "Panels/ProcessesPanel.h"

namespace App
{

/// Main window chrome: menu bar, the process panel filling the work area and a status bar.
class ShellLayer : public Core::Layer
{
  public:
    ShellLayer();
    ~ShellLayer() override = default;

    ShellLayer(const ShellLayer&) = delete;
    ShellLayer& operator=(const ShellLayer&) = delete;
    ShellLayer(ShellLayer&&) = delete;
    ShellLayer& operator=(ShellLayer&&) = delete;

    void onAttach() override;
    void onDetach() override;
    void onUpdate(float deltaTime) override;
    void onRender() override;

  private:
    void renderMenuBar();
    void renderRefreshSlider();
    void renderStatusBar() const;
    void placeProcessesPanel() const;

    ProcessesPanel m_ProcessesPanel;
    bool m_ShowMemorySummary = true;
};

} // namespace App
