#include "Application.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <ranges>
#include <stdexcept>
#include <utility>

// clang-format off
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
// clang-format on

namespace Core
{

Application* Application::s_Instance = nullptr;

namespace
{
constexpr float MAX_DELTA_TIME = 0.1F;

void glfwErrorCallback(int error, const char* description)
{
    spdlog::error("[GLFW Error {}]: {}", error, description);
}

[[nodiscard]] float now()
{
    return static_cast<float>(glfwGetTime());
}
} // namespace

Application::Application(ApplicationSpecification spec) : m_Spec(std::move(spec))
{
    if (s_Instance != nullptr)
    {
        throw std::logic_error("Application already exists");
    }

    spdlog::info("Initializing {}", m_Spec.Name);

    glfwSetErrorCallback(glfwErrorCallback);
    if (glfwInit() == GLFW_FALSE)
    {
        spdlog::critical("Failed to initialize GLFW");
        throw std::runtime_error("Failed to initialize GLFW");
    }

    try
    {
        m_Window = std::make_unique<Window>(WindowSpecification{
            .Title = m_Spec.Name,
            .Geometry = m_Spec.Geometry,
            .VSync = m_Spec.VSync,
        });
    }
    catch (const std::runtime_error&)
    {
        glfwTerminate();
        throw;
    }

    s_Instance = this;
}

Application::~Application()
{
    // Layers detach newest first: the shell saves settings and stops its sampler
    // while the ImGui context owned by the UI layer is still alive.
    for (auto& layer : std::views::reverse(m_LayerStack))
    {
        layer->onDetach();
    }
    m_LayerStack.clear();
    m_Window.reset();

    glfwTerminate();
    s_Instance = nullptr;
}

void Application::run()
{
    m_Running = true;
    float lastTime = now();

    spdlog::info("Entering main loop");

    while (m_Running)
    {
        const bool iconified = m_Window->isIconified();
        if (iconified)
        {
            glfwWaitEventsTimeout(m_Spec.IconifiedWaitSeconds);
        }
        else
        {
            glfwPollEvents();
        }

        if (m_Window->shouldClose())
        {
            break;
        }

        const float currentTime = now();
        const float deltaTime = std::min(currentTime - lastTime, MAX_DELTA_TIME);
        lastTime = currentTime;

        runFrame(deltaTime, !iconified);
    }

    m_Running = false;
    spdlog::info("Exiting main loop");
}

void Application::runFrame(float deltaTime, bool render)
{
    for (const auto& layer : m_LayerStack)
    {
        layer->onUpdate(deltaTime);
    }

    if (!render)
    {
        return;
    }

    for (const auto& layer : m_LayerStack)
    {
        layer->onRender();
    }
    for (const auto& layer : m_LayerStack)
    {
        layer->onPostRender();
    }

    m_Window->swapBuffers();
}

void Application::stop()
{
    m_Running = false;
    m_Window->requestClose();
}

Application& Application::get()
{
    if (s_Instance == nullptr)
    {
        throw std::logic_error("Application does not exist");
    }
    return *s_Instance;
}

} // namespace Core
