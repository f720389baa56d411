#include <chatviz/graph/render/viewport_transform.h>
#include <algorithm>

namespace chatviz {
namespace graph {

ImVec2 ViewportTransform::WorldToScreen(const ImVec2& world_pos) const {
    float screen_x = (world_pos.x * scale) + translate_x;
    float screen_y = (world_pos.y * scale) + translate_y;
    return ImVec2(screen_x, screen_y);
}

ImVec2 ViewportTransform::ScreenToWorld(const ImVec2& screen_pos) const {
    if (scale == 0.0f) return ImVec2(0, 0);
    float world_x = (screen_pos.x - translate_x) / scale;
    float world_y = (screen_pos.y - translate_y) / scale;
    return ImVec2(world_x, world_y);
}

float ViewportController::ClampScale(float scale) {
    return std::max(kMinScale, std::min(kMaxScale, scale));
}

void ViewportController::Pan(const ImVec2& delta) {
    if (delta.x == 0.0f && delta.y == 0.0f) return;
    transform_.translate_x += delta.x;
    transform_.translate_y += delta.y;
    ++revision_;
}

void ViewportController::SetTranslate(const ImVec2& translate) {
    transform_.translate_x = translate.x;
    transform_.translate_y = translate.y;
    ++revision_;
}

void ViewportController::SetScale(float scale) {
    transform_.scale = ClampScale(scale);
    ++revision_;
}

void ViewportController::ZoomAt(const ImVec2& anchor, float wheel_steps) {
    ImVec2 world_anchor = transform_.ScreenToWorld(anchor);
    transform_.scale = ClampScale(transform_.scale + kWheelStep * wheel_steps);
    transform_.translate_x = anchor.x - world_anchor.x * transform_.scale;
    transform_.translate_y = anchor.y - world_anchor.y * transform_.scale;
    ++revision_;
}

void ViewportController::Reset() {
    transform_ = ViewportTransform();
    ++revision_;
}

} // namespace graph
} // namespace chatviz
