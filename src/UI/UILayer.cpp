#include "UILayer.h"

#include "Core/Application.h"
#include "UI/Theme.h"

#include <spdlog/spdlog.h>

#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>

namespace UI
{

UILayer::UILayer() : Layer("UILayer")
{
}

void UILayer::applyContentScale()
{
    constexpr float BASE_FONT_PX = 14.0F;

    float scaleX = 1.0F;
    float scaleY = 1.0F;
    glfwGetWindowContentScale(Core::Application::get().getWindow().getHandle(), &scaleX, &scaleY);
    m_ContentScale = scaleX > 0.0F ? scaleX : 1.0F;

    ImFontConfig fontConfig;
    fontConfig.SizePixels = BASE_FONT_PX * m_ContentScale;
    ImGui::GetIO().Fonts->AddFontDefault(&fontConfig);

    ImGui::GetStyle().ScaleAllSizes(m_ContentScale);
    spdlog::debug("Default font at {:.1f}px (content scale {:.2f})", fontConfig.SizePixels, m_ContentScale);
}

void UILayer::onAttach()
{
    spdlog::info("Initializing ImGui");

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();

    ImGuiIO& imguiIO = ImGui::GetIO();
    imguiIO.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    // Layout state lives in the TOML config, not imgui.ini
    imguiIO.IniFilename = nullptr;

    ImGui::StyleColorsDark();
    Theme::get().applyImGuiStyle();
    applyContentScale();

    GLFWwindow* window = Core::Application::get().getWindow().getHandle();
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init("#version 330 core");

    spdlog::info("ImGui initialized successfully");
}

void UILayer::onDetach()
{
    spdlog::info("Shutting down ImGui");

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
}

void UILayer::onRender()
{
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    // Clear with the theme's window background so resizes never flash another color
    const ImVec4& bgColor = ImGui::GetStyle().Colors[ImGuiCol_WindowBg];
    glClearColor(bgColor.x, bgColor.y, bgColor.z, bgColor.w);
    glClear(GL_COLOR_BUFFER_BIT);
}

void UILayer::onPostRender()
{
    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
}

} // namespace UI
