#pragma once

#include "Domain/EssentialProcessPolicy.h"
#include "Domain/SamplingConfig.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace App
{

/// User configuration settings that persist across sessions
struct UserSettings
{
    // Sampling / refresh interval (milliseconds)
    int refreshIntervalMs = Domain::Sampling::REFRESH_INTERVAL_DEFAULT_MS;

    // Protected processes; when set they replace the built-in lists
    std::optional<std::vector<std::int32_t>> protectedPids;
    std::optional<std::vector<std::string>> protectedNames;

    // Panel visibility
    bool showMemorySummary = true;

    // Window state
    int windowWidth = 760;
    int windowHeight = 560;
    std::optional<int> windowPosX;
    std::optional<int> windowPosY;
    bool windowMaximized = false;

    // ImGui layout state, INI-format string from ImGui::SaveIniSettingsToMemory()
    std::string imguiLayout;

    /// Policy built from the protection settings, falling back to the defaults per list.
    [[nodiscard]] Domain::EssentialProcessPolicy makeEssentialPolicy() const;
};

/**
 * @brief Manages user configuration persistence
 *
 * Saves/loads user preferences to a TOML file in the XDG config directory:
 * $XDG_CONFIG_HOME/memsweep/config.toml (or ~/.config/memsweep/config.toml).
 */
class UserConfig
{
  public:
    /// Get the singleton instance
    static auto get() -> UserConfig&;

    UserConfig(const UserConfig&) = delete;
    auto operator=(const UserConfig&) -> UserConfig& = delete;
    UserConfig(UserConfig&&) = delete;
    auto operator=(UserConfig&&) -> UserConfig& = delete;

    /// Load settings from config file (call on startup)
    void load();

    /// Save settings to config file
    void save() const;

    [[nodiscard]] auto settings() const -> const UserSettings&
    {
        return m_Settings;
    }

    [[nodiscard]] auto settings() -> UserSettings&
    {
        return m_Settings;
    }

    /// Apply ImGui layout state from settings
    void applyImGuiLayout() const;

    /// Capture current ImGui layout state into settings
    void captureImGuiLayout();

    [[nodiscard]] auto configPath() const -> const std::filesystem::path&
    {
        return m_ConfigPath;
    }

    /// Parse @p path. Missing files and parse errors yield defaults (logged).
    [[nodiscard]] static auto loadSettingsFrom(const std::filesystem::path& path) -> UserSettings;

    /// Write @p settings to @p path, creating the parent directory. Returns false on failure.
    static auto saveSettingsTo(const UserSettings& settings, const std::filesystem::path& path) -> bool;

  private:
    UserConfig();
    ~UserConfig() = default;

    std::filesystem::path m_ConfigPath;
    UserSettings m_Settings;
    bool m_IsLoaded = false;

    static auto getConfigDirectory() -> std::filesystem::path;
};

} // namespace App
