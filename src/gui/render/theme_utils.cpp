#include <chatviz/gui/render/theme_utils.h>
#include <chatviz/gui/views/gui_interface.h>

#include <algorithm>

namespace chatviz {
namespace gui {
namespace ThemeUtils {

void applyDarkTheme() {
    ImGui::StyleColorsDark();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 4.0f;
    style.FrameRounding = 3.0f;
    style.Colors[ImGuiCol_WindowBg] = ImVec4(0.05f, 0.05f, 0.05f, 1.0f);
    style.Colors[ImGuiCol_ChildBg] = ImVec4(0.08f, 0.08f, 0.09f, 1.0f);
    style.Colors[ImGuiCol_Border] = ImVec4(0.2f, 0.2f, 0.2f, 1.0f);
}

void applyWhiteTheme() {
    ImGui::StyleColorsLight();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 4.0f;
    style.FrameRounding = 3.0f;
    style.Colors[ImGuiCol_WindowBg] = ImVec4(0.97f, 0.97f, 0.98f, 1.0f);
    style.Colors[ImGuiCol_ChildBg] = ImVec4(1.0f, 1.0f, 1.0f, 1.0f);
}

void setTheme(GuiInterface& gui, ThemeType theme) {
    gui.current_theme = theme;
    switch (theme) {
        case ThemeType::DARK:
            applyDarkTheme();
            break;
        case ThemeType::WHITE:
            applyWhiteTheme();
            break;
    }
}

const GraphPalette& GetGraphPalette(ThemeType theme) {
    static const GraphPalette dark = {
        IM_COL32(13, 13, 13, 255),     // background
        IM_COL32(51, 51, 51, 255),     // border
        IM_COL32(15, 207, 236, 255),   // node fill
        IM_COL32(78, 205, 196, 255),   // node hovered
        IM_COL32(255, 107, 107, 255),  // node selected
        IM_COL32(255, 255, 255, 255),  // node stroke
        IM_COL32(255, 71, 87, 255),    // selected stroke
        IM_COL32(153, 153, 153, 255),  // edge
        IM_COL32(78, 205, 196, 255),   // edge hovered
        IM_COL32(255, 107, 107, 255),  // edge selected
        IM_COL32(220, 220, 225, 255),  // text
        IM_COL32(0, 0, 0, 200)         // label background
    };
    static const GraphPalette white = {
        IM_COL32(250, 250, 255, 255),
        IM_COL32(180, 180, 185, 255),
        IM_COL32(15, 207, 236, 255),
        IM_COL32(78, 205, 196, 255),
        IM_COL32(255, 107, 107, 255),
        IM_COL32(60, 60, 65, 255),
        IM_COL32(255, 71, 87, 255),
        IM_COL32(120, 120, 125, 255),
        IM_COL32(78, 205, 196, 255),
        IM_COL32(255, 107, 107, 255),
        IM_COL32(30, 30, 35, 255),
        IM_COL32(255, 255, 255, 220)
    };
    return theme == ThemeType::WHITE ? white : dark;
}

ImU32 WithOpacity(ImU32 color, float opacity) {
    ImU32 alpha = (color >> IM_COL32_A_SHIFT) & 0xFF;
    float clamped = std::max(0.0f, std::min(1.0f, opacity));
    ImU32 scaled = static_cast<ImU32>(static_cast<float>(alpha) * clamped + 0.5f);
    return (color & ~IM_COL32_A_MASK) | (scaled << IM_COL32_A_SHIFT);
}

} // namespace ThemeUtils
} // namespace gui
} // namespace chatviz
