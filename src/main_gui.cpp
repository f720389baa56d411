#include <chatviz/chat/chat_message.h>
#include <chatviz/chat/visualizer_pane.h>
#include <chatviz/config/visualizer_config.h>
#include <chatviz/core/frame_scheduler.h>
#include <chatviz/db/settings_store.h>
#include <chatviz/db/sqlite_connection.h>
#include <chatviz/graph/graph_visualizer.h>
#include <chatviz/gui/render/graph_renderer.h>
#include <chatviz/gui/render/theme_utils.h>
#include <chatviz/gui/views/gui_interface.h>
#include <chatviz/gui/views/main_gui_views.h>

#include <GLFW/glfw3.h>
#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

using namespace chatviz;

namespace {

// Replaces the log with the transcript at path. Returns false when the file cannot be read.
bool load_transcript(const std::string& path, chat::MessageLog& log) {
    std::ifstream file(path);
    if (!file) {
        std::cerr << "Warning: Could not open transcript " << path << std::endl;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    log.Clear();
    std::size_t accepted = log.IngestStream(buffer.str());
    std::cout << "Loaded " << accepted << " message(s) from " << path << std::endl;
    return true;
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::unique_ptr<db::SQLiteConnection> connection;
    try {
        connection = std::make_unique<db::SQLiteConnection>();
    } catch (const std::exception& e) {
        std::cerr << "Warning: settings database unavailable (" << e.what()
                  << "), using an in-memory store." << std::endl;
        connection = std::make_unique<db::SQLiteConnection>(":memory:");
    }
    db::SettingsStore settings(*connection);
    config::VisualizerConfig visualizer_config = config::VisualizerConfig::Load(settings);

    gui::GuiInterface gui_ui(visualizer_config.theme);
    try {
        gui_ui.initialize();
    } catch (const std::exception& e) {
        std::cerr << "GUI Initialization failed: " << e.what() << std::endl;
        return 1;
    }

    core::FrameScheduler scheduler;
    graph::GraphVisualizer::Options options;
    options.physics = visualizer_config.physics;
    options.gestures = visualizer_config.gestures;
    graph::GraphVisualizer visualizer(scheduler, options);
    gui::GraphRenderer renderer(visualizer);
    chat::MessageLog messages;
    chat::VisualizerPane pane(visualizer);

    const std::string transcript_path = argc > 1 ? argv[1] : "";
    if (!transcript_path.empty()) {
        load_transcript(transcript_path, messages);
    } else {
        std::cout << "Usage: " << argv[0] << " <transcript.ndjson>" << std::endl;
    }

    gui::ViewContext ctx{messages, pane, visualizer, renderer, visualizer_config, settings, transcript_path};

    GLFWwindow* window = gui_ui.getWindow();

    // --- Main Render Loop ---
    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        if (ImGui::IsKeyPressed(ImGuiKey_F5, false)) ctx.reload_requested = true;
        if (ctx.reload_requested) {
            ctx.reload_requested = false;
            if (!transcript_path.empty()) load_transcript(transcript_path, messages);
        }

        pane.Update(messages.Messages());
        scheduler.RunFrame();

        gui::drawAllViews(ctx, gui_ui);

        // Rendering
        ImGui::Render();
        int display_w, display_h;
        glfwGetFramebufferSize(window, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        ImVec4 clear_color = ImGui::GetStyle().Colors[ImGuiCol_WindowBg];
        glClearColor(clear_color.x, clear_color.y, clear_color.z, clear_color.w);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window);
    }

    // --- Cleanup ---
    visualizer.Unmount();
    try {
        settings.saveSetting(config::kThemeKey, config::ThemeName(visualizer_config.theme));
    } catch (const std::exception& e) {
        std::cerr << "Warning: Failed to save theme: " << e.what() << std::endl;
    }

    try {
        gui_ui.shutdown();
    } catch (const std::exception& e) {
        std::cerr << "Error during GUI shutdown: " << e.what() << std::endl;
    }

    std::cout << "Exiting." << std::endl;
    return 0;
}
