#pragma once

#include <chatviz/config/visualizer_config.h> // ThemeType
#include <imgui.h> // For ImU32

namespace chatviz {
namespace gui {

class GuiInterface;

// Colors for one theme's graph canvas.
struct GraphPalette {
    ImU32 background;
    ImU32 border;
    ImU32 node_fill;
    ImU32 node_hovered;
    ImU32 node_selected;
    ImU32 node_stroke;
    ImU32 node_selected_stroke;
    ImU32 edge;
    ImU32 edge_hovered;
    ImU32 edge_selected;
    ImU32 text;
    ImU32 label_background;
};

namespace ThemeUtils {

void applyDarkTheme();
void applyWhiteTheme();
void setTheme(GuiInterface& gui, ThemeType theme);

const GraphPalette& GetGraphPalette(ThemeType theme);
// Same color with its alpha multiplied by opacity.
ImU32 WithOpacity(ImU32 color, float opacity);

} // namespace ThemeUtils
} // namespace gui
} // namespace chatviz
