#ifndef CHATVIZ_VIEWPORT_TRANSFORM_H
#define CHATVIZ_VIEWPORT_TRANSFORM_H

#include <imgui.h> // For ImVec2
#include <cstdint>

namespace chatviz {
namespace graph {

// Maps simulation space to screen space: screen = sim * scale + translate.
struct ViewportTransform {
    float scale = 1.0f;
    float translate_x = 0.0f;
    float translate_y = 0.0f;

    ImVec2 WorldToScreen(const ImVec2& world_pos) const;
    ImVec2 ScreenToWorld(const ImVec2& screen_pos) const;
};

/*
 * Owns the viewport transform. Every mutation bumps Revision() so cached
 * frame geometry can tell it is stale.
 */
class ViewportController {
public:
    static constexpr float kMinScale = 0.5f;
    static constexpr float kMaxScale = 3.0f;
    static constexpr float kWheelStep = 0.1f;

    const ViewportTransform& Transform() const { return transform_; }
    std::uint64_t Revision() const { return revision_; }

    void Pan(const ImVec2& delta);
    void SetTranslate(const ImVec2& translate);
    // Clamped to [kMinScale, kMaxScale]; translate is left untouched.
    void SetScale(float scale);
    // Wheel zoom that keeps the simulation point under anchor fixed on screen.
    void ZoomAt(const ImVec2& anchor, float wheel_steps);
    void Reset();

    static float ClampScale(float scale);

private:
    ViewportTransform transform_;
    std::uint64_t revision_ = 0;
};

} // namespace graph
} // namespace chatviz

#endif // CHATVIZ_VIEWPORT_TRANSFORM_H
