#include <chatviz/gui/views/main_gui_views.h>
#include <chatviz/gui/views/gui_interface.h>
#include <chatviz/gui/render/graph_renderer.h>
#include <chatviz/gui/render/theme_utils.h>
#include <chatviz/chat/chat_message.h>
#include <chatviz/chat/visualizer_pane.h>
#include <chatviz/config/visualizer_config.h>
#include <chatviz/db/settings_store.h>
#include <chatviz/graph/graph_visualizer.h>

#include <imgui.h>

#include <iostream>
#include <string>

namespace chatviz {
namespace gui {

namespace {

const ImVec4 darkUserColor = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);
const ImVec4 darkToolColor = ImVec4(1.0f, 1.0f, 0.0f, 1.0f);
const ImVec4 lightUserColor = ImVec4(0.0f, 0.5f, 0.0f, 1.0f);
const ImVec4 lightToolColor = ImVec4(0.8f, 0.4f, 0.0f, 1.0f);
const ImVec4 placeholderColor = ImVec4(0.33f, 0.33f, 0.33f, 1.0f);

void drawSettings(ViewContext& ctx, GuiInterface& gui) {
    if (!ImGui::CollapsingHeader("Settings")) return;

    ImGui::Indent();
    ImGui::Text("Theme:"); ImGui::SameLine();
    ThemeType chosen = ctx.config.theme;
    if (ImGui::RadioButton("Dark", chosen == ThemeType::DARK)) chosen = ThemeType::DARK;
    ImGui::SameLine();
    if (ImGui::RadioButton("White", chosen == ThemeType::WHITE)) chosen = ThemeType::WHITE;
    if (chosen != ctx.config.theme) {
        ctx.config.theme = chosen;
        ThemeUtils::setTheme(gui, chosen);
        try {
            ctx.settings.saveSetting(config::kThemeKey, config::ThemeName(chosen));
        } catch (const std::exception& e) {
            std::cerr << "Warning: Failed to save theme: " << e.what() << std::endl;
        }
    }

    bool anywhere = ctx.config.gestures.double_tap_scope == graph::DoubleTapScope::kAnywhere;
    if (ImGui::Checkbox("Double-click anywhere resets view", &anywhere)) {
        ctx.config.gestures.double_tap_scope =
            anywhere ? graph::DoubleTapScope::kAnywhere : graph::DoubleTapScope::kEmptySpace;
        ctx.visualizer.SetGestureOptions(ctx.config.gestures);
        try {
            ctx.settings.saveSetting(config::kDoubleTapScopeKey,
                                     config::DoubleTapScopeName(ctx.config.gestures.double_tap_scope));
        } catch (const std::exception& e) {
            std::cerr << "Warning: Failed to save gesture setting: " << e.what() << std::endl;
        }
    }
    ImGui::Unindent();
}

void drawTranscript(ViewContext& ctx, ThemeType theme) {
    ImGui::TextDisabled("%s", ctx.transcript_path.empty() ? "(no transcript)" : ctx.transcript_path.c_str());
    ImGui::SameLine();
    if (ImGui::SmallButton("Reload")) ctx.reload_requested = true;
    ImGui::Separator();

    for (const auto& msg : ctx.messages.Messages()) {
        ImVec4 color = ImGui::GetStyleColorVec4(ImGuiCol_Text);
        if (msg.role == "user") {
            color = (theme == ThemeType::DARK) ? darkUserColor : lightUserColor;
        } else if (msg.role == "tool") {
            color = (theme == ThemeType::DARK) ? darkToolColor : lightToolColor;
        }
        ImGui::PushStyleColor(ImGuiCol_Text, color);
        std::string header = msg.role + "  " + msg.timestamp;
        if (msg.view) header += "  [" + *msg.view + "]";
        ImGui::TextUnformatted(header.c_str());
        ImGui::PopStyleColor();
        ImGui::TextWrapped("%s", msg.content.c_str());
        ImGui::Spacing();
    }
}

void drawVisualizer(ViewContext& ctx, ThemeType theme, float wheel_steps) {
    if (ctx.pane.State() != chat::PaneState::kGraph) {
        ImGui::PushStyleColor(ImGuiCol_Text, placeholderColor);
        ImGui::TextWrapped("%s", ctx.pane.PlaceholderText().c_str());
        ImGui::PopStyleColor();
        return;
    }

    if (graph::ForceSimulation* sim = ctx.visualizer.Simulation()) {
        ImGui::Text("Nodes: %zu  Edges: %zu", sim->Model()->NodeCount(), sim->Model()->Edges().size());
        ImGui::SameLine();
        if (sim->IsCooled()) {
            ImGui::TextColored(placeholderColor, "SETTLED");
        } else {
            ImGui::TextColored(ImVec4(0, 1, 0, 1), "RUNNING (alpha %.3f)", sim->Alpha());
        }
        ImGui::SameLine();
        if (ImGui::SmallButton("Reheat")) sim->Reheat(1.0f);
        ImGui::SameLine();
        if (ImGui::SmallButton("Reset View")) ctx.visualizer.Viewport().Reset();
    }
    ctx.renderer.Render(theme, wheel_steps);
}

} // anonymous namespace

void drawAllViews(ViewContext& ctx, GuiInterface& gui) {
    ImVec2 scroll_offsets = gui.getAndClearScrollOffsets();
    const ThemeType theme = ctx.config.theme;

    const ImVec2 display_size = ImGui::GetIO().DisplaySize;
    ImGui::SetNextWindowPos(ImVec2(0.0f, 0.0f));
    ImGui::SetNextWindowSize(display_size);
    ImGui::Begin("Main", nullptr, ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
                                  ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);

    drawSettings(ctx, gui);

    const float chat_width = ImGui::GetContentRegionAvail().x * 0.35f;
    ImGui::BeginChild("ChatPane", ImVec2(chat_width, 0), true);
    drawTranscript(ctx, theme);
    ImGui::EndChild();

    ImGui::SameLine();
    ImGui::BeginChild("VisualizerPane", ImVec2(0, 0), true,
                      ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse);
    drawVisualizer(ctx, theme, scroll_offsets.y);
    ImGui::EndChild();

    ImGui::End();
}

} // namespace gui
} // namespace chatviz
