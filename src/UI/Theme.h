#pragma once

#include <imgui.h>

#include <cstdint>
#include <string>

namespace UI
{

/// Color scheme: row tags, semantic text colors and the ImGui chrome colors we override.
struct ColorScheme
{
    std::string name;

    // Process row tags
    ImVec4 essentialRow{};    // Protected processes
    ImVec4 nonEssentialRow{}; // Everything that may be terminated

    // Semantic UI colors
    ImVec4 textPrimary{};
    ImVec4 textDisabled{};
    ImVec4 textMuted{};   // Dimmed/secondary text (labels, hints)
    ImVec4 textError{};   // Error messages
    ImVec4 textWarning{}; // Warning messages
    ImVec4 textSuccess{}; // Success messages

    // Danger button colors
    ImVec4 dangerButton{};
    ImVec4 dangerButtonHovered{};
    ImVec4 dangerButtonActive{};

    // ImGui style colors
    ImVec4 windowBg{};
    ImVec4 childBg{};
    ImVec4 popupBg{};
    ImVec4 border{};
    ImVec4 frameBg{};
    ImVec4 frameBgHovered{};
    ImVec4 frameBgActive{};
    ImVec4 menuBarBg{};
    ImVec4 statusBarBg{}; // Status bar background (distinct from window/menu)
    ImVec4 button{};
    ImVec4 buttonHovered{};
    ImVec4 buttonActive{};
    ImVec4 header{};
    ImVec4 headerHovered{};
    ImVec4 headerActive{};
    ImVec4 tableHeaderBg{};
    ImVec4 tableBorderStrong{};
    ImVec4 tableBorderLight{};
    ImVec4 tableRowBgAlt{};
    ImVec4 modalWindowDimBg{};
};

/// Global theme - provides the color scheme and applies it to ImGui
class Theme
{
  public:
    /// Get the singleton instance
    static auto get() -> Theme&;

    Theme(const Theme&) = delete;
    auto operator=(const Theme&) -> Theme& = delete;
    Theme(Theme&&) = delete;
    auto operator=(Theme&&) -> Theme& = delete;

    /// Apply current theme colors to ImGui style
    void applyImGuiStyle() const;

    [[nodiscard]] auto scheme() const -> const ColorScheme&
    {
        return m_Scheme;
    }

    /// Row tag color for a process
    [[nodiscard]] auto rowColor(bool isEssential) const -> const ImVec4&
    {
        return isEssential ? m_Scheme.essentialRow : m_Scheme.nonEssentialRow;
    }

  private:
    Theme();
    ~Theme() = default;

    ColorScheme m_Scheme;
};

// Helper to convert hex color to ImVec4 (compile-time friendly)
constexpr ImVec4 hexToImVec4(std::uint32_t hex, float alpha = 1.0F)
{
    return ImVec4(static_cast<float>((hex >> 16) & 0xFF) / 255.0F,
                  static_cast<float>((hex >> 8) & 0xFF) / 255.0F,
                  static_cast<float>(hex & 0xFF) / 255.0F,
                  alpha);
}

} // namespace UI
