// ImGui-dependent half of UserConfig; linked only into the application.

#include "UserConfig.h"

#include <imgui.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <string>

namespace App
{

void UserConfig::applyImGuiLayout() const
{
    if (m_Settings.imguiLayout.empty())
    {
        spdlog::debug("No ImGui layout state to restore");
        return;
    }

    spdlog::debug("Restoring ImGui layout state ({} bytes)", m_Settings.imguiLayout.size());
    ImGui::LoadIniSettingsFromMemory(m_Settings.imguiLayout.c_str(), m_Settings.imguiLayout.size());
}

void UserConfig::captureImGuiLayout()
{
    std::size_t iniSize = 0;
    const char* iniData = ImGui::SaveIniSettingsToMemory(&iniSize);
    // The returned buffer is only valid until the next ImGui call; copy it now.
    if (iniData != nullptr && iniSize > 0)
    {
        m_Settings.imguiLayout = std::string{iniData, iniSize};
        spdlog::debug("Captured ImGui layout state ({} bytes)", iniSize);
    }
    else
    {
        m_Settings.imguiLayout.clear();
        spdlog::debug("No ImGui layout state to capture");
    }
}

} // namespace App
