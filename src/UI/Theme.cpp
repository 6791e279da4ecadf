#include "Theme.h"

#include <spdlog/spdlog.h>

namespace UI
{

namespace
{

[[nodiscard]] ColorScheme makeDefaultScheme()
{
    ColorScheme s;
    s.name = "Slate";

    s.essentialRow = hexToImVec4(0xFF5C5C);
    s.nonEssentialRow = hexToImVec4(0x5CD67A);

    s.textPrimary = ImVec4(0.90F, 0.92F, 0.96F, 1.0F);
    s.textDisabled = ImVec4(0.55F, 0.58F, 0.62F, 1.0F);
    s.textMuted = ImVec4(0.65F, 0.68F, 0.72F, 1.0F);
    s.textError = hexToImVec4(0xFF5C5C);
    s.textWarning = hexToImVec4(0xF5C542);
    s.textSuccess = hexToImVec4(0x5CD67A);

    s.dangerButton = ImVec4(0.70F, 0.12F, 0.12F, 1.0F);
    s.dangerButtonHovered = ImVec4(0.85F, 0.18F, 0.18F, 1.0F);
    s.dangerButtonActive = ImVec4(0.55F, 0.08F, 0.08F, 1.0F);

    s.windowBg = hexToImVec4(0x1B1E24);
    s.childBg = ImVec4(0.0F, 0.0F, 0.0F, 0.0F);
    s.popupBg = hexToImVec4(0x22262E, 0.97F);
    s.border = ImVec4(0.43F, 0.43F, 0.50F, 0.50F);
    s.frameBg = hexToImVec4(0x2A2F38);
    s.frameBgHovered = hexToImVec4(0x343A45);
    s.frameBgActive = hexToImVec4(0x3D4450);
    s.menuBarBg = hexToImVec4(0x23272F);
    s.statusBarBg = hexToImVec4(0x15171C);
    s.button = ImVec4(0.26F, 0.59F, 0.98F, 0.40F);
    s.buttonHovered = ImVec4(0.26F, 0.59F, 0.98F, 1.0F);
    s.buttonActive = ImVec4(0.06F, 0.53F, 0.98F, 1.0F);
    s.header = ImVec4(0.26F, 0.59F, 0.98F, 0.31F);
    s.headerHovered = ImVec4(0.26F, 0.59F, 0.98F, 0.80F);
    s.headerActive = ImVec4(0.26F, 0.59F, 0.98F, 1.0F);
    s.tableHeaderBg = hexToImVec4(0x2A2F38);
    s.tableBorderStrong = ImVec4(0.31F, 0.31F, 0.35F, 1.0F);
    s.tableBorderLight = ImVec4(0.23F, 0.23F, 0.25F, 1.0F);
    s.tableRowBgAlt = ImVec4(1.0F, 1.0F, 1.0F, 0.04F);
    s.modalWindowDimBg = ImVec4(0.0F, 0.0F, 0.0F, 0.45F);
    return s;
}

} // namespace

auto Theme::get() -> Theme&
{
    static Theme instance;
    return instance;
}

Theme::Theme() : m_Scheme(makeDefaultScheme())
{
}

void Theme::applyImGuiStyle() const
{
    ImGuiStyle& style = ImGui::GetStyle();
    const auto& s = m_Scheme;

    style.Colors[ImGuiCol_Text] = s.textPrimary;
    style.Colors[ImGuiCol_TextDisabled] = s.textDisabled;
    style.Colors[ImGuiCol_WindowBg] = s.windowBg;
    style.Colors[ImGuiCol_ChildBg] = s.childBg;
    style.Colors[ImGuiCol_PopupBg] = s.popupBg;
    style.Colors[ImGuiCol_Border] = s.border;
    style.Colors[ImGuiCol_FrameBg] = s.frameBg;
    style.Colors[ImGuiCol_FrameBgHovered] = s.frameBgHovered;
    style.Colors[ImGuiCol_FrameBgActive] = s.frameBgActive;
    style.Colors[ImGuiCol_MenuBarBg] = s.menuBarBg;
    style.Colors[ImGuiCol_Button] = s.button;
    style.Colors[ImGuiCol_ButtonHovered] = s.buttonHovered;
    style.Colors[ImGuiCol_ButtonActive] = s.buttonActive;
    style.Colors[ImGuiCol_Header] = s.header;
    style.Colors[ImGuiCol_HeaderHovered] = s.headerHovered;
    style.Colors[ImGuiCol_HeaderActive] = s.headerActive;
    style.Colors[ImGuiCol_TableHeaderBg] = s.tableHeaderBg;
    style.Colors[ImGuiCol_TableBorderStrong] = s.tableBorderStrong;
    style.Colors[ImGuiCol_TableBorderLight] = s.tableBorderLight;
    style.Colors[ImGuiCol_TableRowBgAlt] = s.tableRowBgAlt;
    style.Colors[ImGuiCol_ModalWindowDimBg] = s.modalWindowDimBg;

    // Style settings
    style.WindowRounding = 4.0F;
    style.ChildRounding = 4.0F;
    style.FrameRounding = 2.0F;
    style.PopupRounding = 4.0F;
    style.ScrollbarRounding = 4.0F;
    style.GrabRounding = 2.0F;

    style.WindowBorderSize = 1.0F;
    style.PopupBorderSize = 1.0F;
    style.FrameBorderSize = 0.0F;

    style.WindowPadding = ImVec2(8.0F, 8.0F);
    style.FramePadding = ImVec2(6.0F, 4.0F);
    style.ItemSpacing = ImVec2(8.0F, 4.0F);
    style.ScrollbarSize = 14.0F;

    spdlog::debug("Applied theme: {}", s.name);
}

} // namespace UI
