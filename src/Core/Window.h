#pragma once

#include <optional>
#include <string>

struct GLFWwindow;

namespace Core
{

/// Size, position and maximized state as persisted between runs.
/// Size and position describe the restored (non-maximized) window.
struct WindowGeometry
{
    int Width = 760;
    int Height = 560;
    std::optional<int> PosX;
    std::optional<int> PosY;
    bool Maximized = false;
};

struct WindowSpecification
{
    std::string Title = "MemSweep";
    WindowGeometry Geometry;
    bool VSync = true;
};

inline constexpr int MIN_WINDOW_DIMENSION = 200;
inline constexpr int MAX_WINDOW_DIMENSION = 16'384;

class Window
{
  public:
    /// Creates the window and makes its GL context current. Throws std::runtime_error on failure.
    explicit Window(WindowSpecification spec = WindowSpecification());
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;
    Window(Window&&) = delete;
    Window& operator=(Window&&) = delete;

    void swapBuffers() const;

    [[nodiscard]] bool shouldClose() const;
    void requestClose() const;

    /// Minimized windows skip rendering; the caller should wait for events instead.
    [[nodiscard]] bool isIconified() const;
    [[nodiscard]] bool isMaximized() const;

    [[nodiscard]] GLFWwindow* getHandle() const
    {
        return m_Handle;
    }

    /// Geometry to save on exit: the last size and position seen while neither
    /// maximized nor minimized, plus the current maximized flag.
    [[nodiscard]] WindowGeometry restoredGeometry() const;

  private:
    void trackRestoredGeometry();

    WindowSpecification m_Spec;
    WindowGeometry m_Restored;
    GLFWwindow* m_Handle = nullptr;
};

} // namespace Core
