#include "App/ShellLayer.h"
#include "App/UserConfig.h"
#include "Core/Application.h"
#include "UI/UILayer.h"
#include "version.h"

#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <print>
#include <vector>

#include <unistd.h>

namespace
{
// Console plus a truncated log file in the temp directory, so a session launched
// from a desktop entry can still be diagnosed.
void setupLogging()
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::filesystem::path logPath;
    try
    {
        logPath = std::filesystem::temp_directory_path() / "memsweep.log";
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true));
    }
    catch (const std::exception& e)
    {
        // Console logging still works
        std::println(stderr, "Failed to initialize file logging: {}", e.what());
        logPath.clear();
    }

    spdlog::set_default_logger(std::make_shared<spdlog::logger>("MemSweep", sinks.begin(), sinks.end()));

    if (!logPath.empty())
    {
        spdlog::info("Log file: {}", logPath.string());
    }
}

auto runApp() -> int
{
    setupLogging();

#ifndef NDEBUG
    spdlog::set_level(spdlog::level::debug);
    spdlog::flush_on(spdlog::level::debug);
#endif

    spdlog::info("{} v{} ({} build)", memsweep::Version::PROJECT_NAME, memsweep::Version::STRING, memsweep::Version::BUILD_TYPE);
    spdlog::debug("Compiler: {} {}", memsweep::Version::COMPILER_ID, memsweep::Version::COMPILER_VERSION);
    spdlog::debug("Built: {} {}", memsweep::Version::BUILD_DATE, memsweep::Version::BUILD_TIME);

    if (::geteuid() != 0)
    {
        spdlog::warn("Running without root privileges. You may not be able to terminate some processes.");
    }

    // Load user configuration early so the window opens with the saved geometry.
    auto& userConfig = App::UserConfig::get();
    userConfig.load();
    const auto& settings = userConfig.settings();

    const Core::ApplicationSpecification appSpec{
        .Name = "MemSweep",
        .Geometry =
            {
                .Width = settings.windowWidth,
                .Height = settings.windowHeight,
                .PosX = settings.windowPosX,
                .PosY = settings.windowPosY,
                .Maximized = settings.windowMaximized,
            },
        .VSync = true,
    };

    try
    {
        Core::Application app(appSpec);

        // Push UI layer (initializes the ImGui backends)
        app.pushLayer<UI::UILayer>();

        // Push shell layer (menu, process panel, status bar)
        app.pushLayer<App::ShellLayer>();

        app.run();
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }

    return 0;
}

} // namespace

auto main() -> int
{
    return runApp();
}
