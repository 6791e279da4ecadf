#pragma once

#include <string>
#include <utility>

namespace App
{

/// An ImGui window owned and placed by ShellLayer.
///
/// Lifetime follows the shell: onAttach() once the GL context and ImGui exist,
/// onUpdate() then render() every frame, onDetach() before the context goes away.
/// Anything that runs on another thread (samplers, workers) must be started in
/// onAttach() and fully stopped in onDetach().
class Panel
{
  public:
    explicit Panel(std::string name) : m_Name(std::move(name))
    {
    }

    virtual ~Panel() = default;

    Panel(const Panel&) = delete;
    Panel& operator=(const Panel&) = delete;
    Panel(Panel&&) = delete;
    Panel& operator=(Panel&&) = delete;

    virtual void onAttach()
    {
    }

    virtual void onDetach()
    {
    }

    /// Per-frame, non-drawing work such as draining results from background threads.
    virtual void onUpdate([[maybe_unused]] float deltaTime)
    {
    }

    /// Draw the window. @p open may be nullptr for a window without a close button.
    virtual void render(bool* open) = 0;

    /// ImGui window name; also the key under which ImGui persists its settings.
    [[nodiscard]] const std::string& name() const noexcept
    {
        return m_Name;
    }

  protected:
    std::string m_Name;
};

} // namespace App
