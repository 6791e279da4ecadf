#pragma once

#include <string>
#include <utility>

namespace Core
{

/// One slice of the frame. The Application calls, for every layer in push order:
/// onUpdate() every loop iteration (also while minimized), then onRender() and
/// onPostRender() when the window is visible. onDetach() runs in reverse push order.
class Layer
{
  public:
    explicit Layer(std::string name) : m_Name(std::move(name))
    {
    }

    virtual ~Layer() = default;

    Layer(const Layer&) = delete;
    Layer& operator=(const Layer&) = delete;
    Layer(Layer&&) = delete;
    Layer& operator=(Layer&&) = delete;

    virtual void onAttach()
    {
    }
    virtual void onDetach()
    {
    }
    virtual void onUpdate([[maybe_unused]] float deltaTime)
    {
    }
    virtual void onRender()
    {
    }
    /// Runs after every layer rendered; the UI layer submits the ImGui draw data here.
    virtual void onPostRender()
    {
    }

    [[nodiscard]] const std::string& name() const noexcept
    {
        return m_Name;
    }

  protected:
    std::string m_Name;
};

} // namespace Core
