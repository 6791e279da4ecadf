#pragma once

#include "Layer.h"
#include "Window.h"

#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace Core
{

struct ApplicationSpecification
{
    std::string Name = "MemSweep";
    WindowGeometry Geometry;
    bool VSync = true;
    /// How long a minimized window blocks in the event queue per loop iteration.
    /// Layers still get onUpdate() so background results keep draining.
    double IconifiedWaitSeconds = 0.25;
};

/// GLFW lifetime, the main window and the layer stack.
/// Exactly one instance may exist at a time; Application::get() reaches it from layers.
class Application
{
  public:
    /// Initializes GLFW and opens the main window. Throws std::runtime_error on failure
    /// and std::logic_error if another Application is alive.
    explicit Application(ApplicationSpecification spec = ApplicationSpecification());
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    void run();

    /// Leave the main loop after the current frame.
    void stop();

    template<typename T, typename... Args>
        requires std::is_base_of_v<Layer, T>
    void pushLayer(Args&&... args)
    {
        auto& layer = m_LayerStack.emplace_back(std::make_unique<T>(std::forward<Args>(args)...));
        layer->onAttach();
    }

    [[nodiscard]] Window& getWindow() const
    {
        return *m_Window;
    }

    [[nodiscard]] static Application& get();

  private:
    void runFrame(float deltaTime, bool render);

    ApplicationSpecification m_Spec;
    std::unique_ptr<Window> m_Window;
    std::vector<std::unique_ptr<Layer>> m_LayerStack;
    bool m_Running = false;

    static Application* s_Instance;
};

} // namespace Core
