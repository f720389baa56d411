#pragma once

#include <chatviz/config/visualizer_config.h> // ThemeType
#include <imgui.h> // Required for ImVec2
#include <mutex>

// Forward declaration for GLFW window handle
struct GLFWwindow;

namespace chatviz {
namespace gui {

/*
 * Owns the GLFW window and the Dear ImGui context.
 * initialize() throws std::runtime_error when any layer fails to come up.
 */
class GuiInterface {
public:
    explicit GuiInterface(ThemeType theme);
    ~GuiInterface();

    GuiInterface(const GuiInterface&)            = delete;
    GuiInterface& operator=(const GuiInterface&) = delete;

    void initialize();
    void shutdown();

    GLFWwindow* getWindow() const;
    ThemeType getTheme() const { return current_theme; }

    // Method for GUI thread to get and clear accumulated scroll offsets
    ImVec2 getAndClearScrollOffsets();

public:
    // Public members for direct access from callbacks and utils
    GLFWwindow* window = nullptr;
    float accumulated_scroll_x = 0.0f;
    float accumulated_scroll_y = 0.0f;
    std::mutex input_mutex;
    ThemeType current_theme = ThemeType::DARK;

private:
    bool imgui_init_done = false;
};

} // namespace gui
} // namespace chatviz
