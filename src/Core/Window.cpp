#include "Window.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <string_view>
#include <utility>

// GLFW pulls in the system GL header; only GL 1.1 entry points are used here.
#include <GLFW/glfw3.h>

namespace Core
{

namespace
{
[[nodiscard]] int clampDimension(const int value) noexcept
{
    return std::clamp(value, MIN_WINDOW_DIMENSION, MAX_WINDOW_DIMENSION);
}

[[nodiscard]] std::string_view glString(GLenum name)
{
    const auto* bytes = glGetString(name);
    if (bytes == nullptr)
    {
        return "<unknown>";
    }

    const auto* chars = reinterpret_cast<const char*>(bytes); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
    return std::string_view(chars);
}

[[nodiscard]] Window* windowFrom(GLFWwindow* handle)
{
    return static_cast<Window*>(glfwGetWindowUserPointer(handle));
}
} // namespace

Window::Window(WindowSpecification spec) : m_Spec(std::move(spec))
{
    auto& geometry = m_Spec.Geometry;
    geometry.Width = clampDimension(geometry.Width);
    geometry.Height = clampDimension(geometry.Height);
    m_Restored = geometry;

    spdlog::info("Creating window: {} ({}x{}{})", m_Spec.Title, geometry.Width, geometry.Height, geometry.Maximized ? ", maximized" : "");

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    // Position is applied after creation; keep the window hidden until then so it does not jump.
    glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
#ifndef NDEBUG
    glfwWindowHint(GLFW_OPENGL_DEBUG_CONTEXT, GLFW_TRUE);
#endif

    // NOLINTNEXTLINE(cppcoreguidelines-prefer-member-initializer) - glfwWindowHint must be called before glfwCreateWindow
    m_Handle = glfwCreateWindow(geometry.Width, geometry.Height, m_Spec.Title.c_str(), nullptr, nullptr);
    if (m_Handle == nullptr)
    {
        spdlog::critical("Failed to create GLFW window");
        throw std::runtime_error("Failed to create GLFW window");
    }

    glfwMakeContextCurrent(m_Handle);
    spdlog::debug("OpenGL: {} / {} / {}", glString(GL_VENDOR), glString(GL_RENDERER), glString(GL_VERSION));

    glfwSwapInterval(m_Spec.VSync ? 1 : 0);
    glfwSetWindowSizeLimits(m_Handle, MIN_WINDOW_DIMENSION, MIN_WINDOW_DIMENSION, GLFW_DONT_CARE, GLFW_DONT_CARE);

    glfwSetWindowUserPointer(m_Handle, this);
    glfwSetFramebufferSizeCallback(m_Handle, [](GLFWwindow* /*handle*/, int width, int height) { glViewport(0, 0, width, height); });
    glfwSetWindowSizeCallback(m_Handle, [](GLFWwindow* handle, int /*width*/, int /*height*/) { windowFrom(handle)->trackRestoredGeometry(); });
    glfwSetWindowPosCallback(m_Handle, [](GLFWwindow* handle, int /*x*/, int /*y*/) { windowFrom(handle)->trackRestoredGeometry(); });

    if (geometry.PosX.has_value() && geometry.PosY.has_value())
    {
        glfwSetWindowPos(m_Handle, *geometry.PosX, *geometry.PosY);
    }
    if (geometry.Maximized)
    {
        glfwMaximizeWindow(m_Handle);
    }
    glfwShowWindow(m_Handle);
}

Window::~Window()
{
    if (m_Handle != nullptr)
    {
        glfwDestroyWindow(m_Handle);
        m_Handle = nullptr;
    }
}

void Window::swapBuffers() const
{
    glfwSwapBuffers(m_Handle);
}

bool Window::shouldClose() const
{
    return glfwWindowShouldClose(m_Handle) != 0;
}

void Window::requestClose() const
{
    glfwSetWindowShouldClose(m_Handle, GLFW_TRUE);
}

bool Window::isIconified() const
{
    return glfwGetWindowAttrib(m_Handle, GLFW_ICONIFIED) != 0;
}

bool Window::isMaximized() const
{
    return glfwGetWindowAttrib(m_Handle, GLFW_MAXIMIZED) != 0;
}

void Window::trackRestoredGeometry()
{
    if (isMaximized() || isIconified())
    {
        return;
    }

    int width = 0;
    int height = 0;
    glfwGetWindowSize(m_Handle, &width, &height);
    m_Restored.Width = clampDimension(width);
    m_Restored.Height = clampDimension(height);

    int x = 0;
    int y = 0;
    glfwGetWindowPos(m_Handle, &x, &y);
    m_Restored.PosX = x;
    m_Restored.PosY = y;
}

WindowGeometry Window::restoredGeometry() const
{
    WindowGeometry geometry = m_Restored;
    geometry.Maximized = isMaximized();
    return geometry;
}

} // namespace Core
