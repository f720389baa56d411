#include <chatviz/gui/views/gui_interface.h>
#include <chatviz/gui/render/theme_utils.h>
#include <chatviz/core/event_dispatch.h>

#include <stdexcept>
#include <iostream>

#include <GLFW/glfw3.h>
#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>

namespace chatviz {
namespace gui {

namespace {
    constexpr int kInitialWidth = 1400;
    constexpr int kInitialHeight = 860;
    constexpr const char* kWindowTitle = "chatviz - graph view";

    // Requests a 3.x core context and returns the matching GLSL version string.
    const char* requestCoreContext() {
#if defined(__APPLE__)
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 2);
        glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
        glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
        return "#version 150";
#else
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
        glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
        return "#version 330";
#endif
    }
}

GuiInterface::GuiInterface(ThemeType theme) : current_theme(theme) {}

GuiInterface::~GuiInterface() {
    if (window) {
        shutdown();
    }
}

void GuiInterface::initialize() {
    glfwSetErrorCallback(EventDispatch::glfw_error_callback);
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

    const char* glsl_version = requestCoreContext();
    window = glfwCreateWindow(kInitialWidth, kInitialHeight, kWindowTitle, nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window");
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    // Scroll arrives through the window user pointer; see EventDispatch.
    glfwSetWindowUserPointer(window, this);
    glfwSetScrollCallback(window, EventDispatch::custom_glfw_scroll_callback);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::GetIO().ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ThemeUtils::setTheme(*this, current_theme);

    bool glfw_backend = ImGui_ImplGlfw_InitForOpenGL(window, true);
    bool gl_backend = glfw_backend && ImGui_ImplOpenGL3_Init(glsl_version);
    if (!gl_backend) {
        if (glfw_backend) ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        window = nullptr;
        glfwTerminate();
        throw std::runtime_error(glfw_backend ? "Failed to initialize ImGui OpenGL3 backend"
                                              : "Failed to initialize ImGui GLFW backend");
    }

    imgui_init_done = true;
    std::cout << "GUI Initialized Successfully." << std::endl;
}

void GuiInterface::shutdown() {
    if (!window) return;

    if (imgui_init_done) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        imgui_init_done = false;
    }

    glfwDestroyWindow(window);
    window = nullptr;
    glfwTerminate();
    std::cout << "GUI Shutdown Complete." << std::endl;
}

GLFWwindow* GuiInterface::getWindow() const {
    return window;
}

ImVec2 GuiInterface::getAndClearScrollOffsets() {
    std::lock_guard<std::mutex> lock(input_mutex);
    ImVec2 offsets(accumulated_scroll_x, accumulated_scroll_y);
    accumulated_scroll_x = 0.0f;
    accumulated_scroll_y = 0.0f;
    return offsets;
}

} // namespace gui
} // namespace chatviz
