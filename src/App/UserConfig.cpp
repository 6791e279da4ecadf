#include "UserConfig.h"

#include "Domain/Numeric.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>
#include <utility>

#include <toml++/toml.hpp>

#include <pwd.h>
#include <unistd.h>

namespace App
{

namespace
{

constexpr int WINDOW_POS_ABS_MAX = 100'000;
constexpr int WINDOW_SIZE_MIN = 200;
constexpr int WINDOW_SIZE_MAX = 16'384;

[[nodiscard]] bool isSaneWindowPositionComponent(int value)
{
    return std::abs(value) <= WINDOW_POS_ABS_MAX;
}

[[nodiscard]] auto readEnvVarString(const char* name) -> std::optional<std::string>
{
    const char* value = std::getenv(name); // NOLINT(concurrency-mt-unsafe)
    if (value == nullptr || value[0] == '\0')
    {
        return std::nullopt;
    }
    return std::string(value);
}

[[nodiscard]] auto readPidArray(const toml::array& array) -> std::vector<std::int32_t>
{
    std::vector<std::int32_t> pids;
    for (const auto& node : array)
    {
        if (auto val = node.value<std::int64_t>())
        {
            if (std::in_range<std::int32_t>(*val) && *val >= 0)
            {
                pids.push_back(static_cast<std::int32_t>(*val));
                continue;
            }
        }
        spdlog::warn("Ignoring invalid entry in [protection] pids");
    }
    return pids;
}

[[nodiscard]] auto readNameArray(const toml::array& array) -> std::vector<std::string>
{
    std::vector<std::string> names;
    for (const auto& node : array)
    {
        if (auto val = node.value<std::string>(); val.has_value() && !val->empty())
        {
            names.push_back(*val);
            continue;
        }
        spdlog::warn("Ignoring invalid entry in [protection] names");
    }
    return names;
}

} // namespace

Domain::EssentialProcessPolicy UserSettings::makeEssentialPolicy() const
{
    return Domain::EssentialProcessPolicy(protectedPids.value_or(Domain::EssentialProcessPolicy::defaultProtectedPids()),
                                          protectedNames.value_or(Domain::EssentialProcessPolicy::defaultProtectedNames()));
}

auto UserConfig::get() -> UserConfig&
{
    static UserConfig instance;
    return instance;
}

UserConfig::UserConfig()
{
    m_ConfigPath = getConfigDirectory() / "config.toml";
    spdlog::debug("Config path: {}", m_ConfigPath.string());
}

auto UserConfig::getConfigDirectory() -> std::filesystem::path
{
    if (auto xdgConfig = readEnvVarString("XDG_CONFIG_HOME"))
    {
        return std::filesystem::path(*xdgConfig) / "memsweep";
    }

    if (auto homeEnv = readEnvVarString("HOME"))
    {
        return std::filesystem::path(*homeEnv) / ".config" / "memsweep";
    }

    // Last resort: use passwd entry
    if (const auto* pw = getpwuid(getuid()))
    {
        return std::filesystem::path(pw->pw_dir) / ".config" / "memsweep";
    }

    return std::filesystem::current_path();
}

void UserConfig::load()
{
    if (m_IsLoaded)
    {
        return;
    }
    m_IsLoaded = true;
    m_Settings = loadSettingsFrom(m_ConfigPath);
}

void UserConfig::save() const
{
    if (!saveSettingsTo(m_Settings, m_ConfigPath))
    {
        spdlog::warn("User settings were not saved; changes will be lost on exit");
    }
}

auto UserConfig::loadSettingsFrom(const std::filesystem::path& path) -> UserSettings
{
    UserSettings settings;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        spdlog::info("No config file found at {}, using defaults", path.string());
        return settings;
    }

    try
    {
        auto config = toml::parse_file(path.string());

        if (auto val = config["sampling"]["interval_ms"].value<std::int64_t>())
        {
            settings.refreshIntervalMs =
                Domain::Sampling::clampRefreshInterval(Domain::Numeric::narrowOr<int>(*val, Domain::Sampling::REFRESH_INTERVAL_DEFAULT_MS));
        }

        // Protection lists replace the built-in ones only when present
        if (const auto* pids = config["protection"]["pids"].as_array())
        {
            settings.protectedPids = readPidArray(*pids);
        }
        if (const auto* names = config["protection"]["names"].as_array())
        {
            settings.protectedNames = readNameArray(*names);
        }

        if (auto val = config["panels"]["memory"].value<bool>())
        {
            settings.showMemorySummary = *val;
        }

        // Window state
        if (auto val = config["window"]["width"].value<std::int64_t>())
        {
            const int width = Domain::Numeric::narrowOr<int>(*val, settings.windowWidth);
            settings.windowWidth = std::clamp(width, WINDOW_SIZE_MIN, WINDOW_SIZE_MAX);
        }
        if (auto val = config["window"]["height"].value<std::int64_t>())
        {
            const int height = Domain::Numeric::narrowOr<int>(*val, settings.windowHeight);
            settings.windowHeight = std::clamp(height, WINDOW_SIZE_MIN, WINDOW_SIZE_MAX);
        }
        if (auto val = config["window"]["x"].value<std::int64_t>())
        {
            const int x = Domain::Numeric::narrowOr<int>(*val, WINDOW_POS_ABS_MAX + 1);
            if (isSaneWindowPositionComponent(x))
            {
                settings.windowPosX = x;
            }
        }
        if (auto val = config["window"]["y"].value<std::int64_t>())
        {
            const int y = Domain::Numeric::narrowOr<int>(*val, WINDOW_POS_ABS_MAX + 1);
            if (isSaneWindowPositionComponent(y))
            {
                settings.windowPosY = y;
            }
        }
        if (auto val = config["window"]["maximized"].value<bool>())
        {
            settings.windowMaximized = *val;
        }

        if (auto layout = config["imgui_layout"].value<std::string>())
        {
            settings.imguiLayout = *layout;
        }

        spdlog::info("Loaded config from {}", path.string());
    }
    catch (const toml::parse_error& err)
    {
        spdlog::error("Failed to parse config file {}: {}", path.string(), err.what());
        return UserSettings{};
    }

    return settings;
}

auto UserConfig::saveSettingsTo(const UserSettings& settings, const std::filesystem::path& path) -> bool
{
    const std::filesystem::path configDir = path.parent_path();
    if (!configDir.empty() && !std::filesystem::exists(configDir))
    {
        std::error_code ec;
        std::filesystem::create_directories(configDir, ec);
        if (ec)
        {
            spdlog::error("Failed to create config directory {}: {}", configDir.string(), ec.message());
            return false;
        }
    }

    auto windowTable = toml::table{
        {"width", settings.windowWidth},
        {"height", settings.windowHeight},
        {"maximized", settings.windowMaximized},
    };
    if (settings.windowPosX.has_value())
    {
        windowTable.insert("x", *settings.windowPosX);
    }
    if (settings.windowPosY.has_value())
    {
        windowTable.insert("y", *settings.windowPosY);
    }

    auto config = toml::table{
        {"sampling", toml::table{{"interval_ms", Domain::Sampling::clampRefreshInterval(settings.refreshIntervalMs)}}},
        {"panels", toml::table{{"memory", settings.showMemorySummary}}},
        {"window", windowTable},
    };

    auto protectionTable = toml::table{};
    if (settings.protectedPids.has_value())
    {
        auto pids = toml::array{};
        for (const auto pid : *settings.protectedPids)
        {
            pids.push_back(static_cast<std::int64_t>(pid));
        }
        protectionTable.insert("pids", std::move(pids));
    }
    if (settings.protectedNames.has_value())
    {
        auto names = toml::array{};
        for (const auto& name : *settings.protectedNames)
        {
            names.push_back(name);
        }
        protectionTable.insert("names", std::move(names));
    }
    if (!protectionTable.empty())
    {
        config.insert("protection", std::move(protectionTable));
    }

    if (!settings.imguiLayout.empty())
    {
        config.insert("imgui_layout", settings.imguiLayout);
    }

    std::ofstream file(path);
    if (!file)
    {
        spdlog::error("Failed to open config file for writing: {}", path.string());
        return false;
    }

    file << "# MemSweep user configuration\n";
    file << "# This file is auto-generated. Manual edits are preserved.\n";
    file << "# Notes:\n";
    file << "# - sampling: interval_ms controls refresh cadence (ms, 250-60000).\n";
    file << "# - protection: pids = [..] and names = [..] replace the built-in protected process lists.\n";
    file << "# - imgui_layout: auto-generated window layout state.\n\n";
    file << config;

    if (!file)
    {
        spdlog::error("Failed to write config file: {}", path.string());
        return false;
    }

    spdlog::info("Saved config to {}", path.string());
    return true;
}

} // namespace App
