#ifndef CHATVIZ_GRAPH_VISUALIZER_H
#define CHATVIZ_GRAPH_VISUALIZER_H

#include <chatviz/core/frame_scheduler.h>
#include <chatviz/graph/graph_types.h>
#include <chatviz/graph/interaction/gesture_recognizer.h>
#include <chatviz/graph/interaction/info_panel.h>
#include <chatviz/graph/interaction/selection_state.h>
#include <chatviz/graph/layout/force_simulation.h>
#include <chatviz/graph/render/frame_geometry.h>
#include <chatviz/graph/render/viewport_transform.h>

#include <memory>
#include <optional>
#include <string>

namespace chatviz {
namespace graph {

/*
 * Owns everything behind one interactive graph view: the model, its running
 * simulation, viewport, selection and gestures. At most one simulation is
 * alive; replacing the payload stops the old one before the new one starts.
 */
class GraphVisualizer : public GestureHost {
public:
    struct Options {
        ForceSimulation::Params physics;
        GestureRecognizer::Options gestures;
        ImVec2 viewport_size;

        Options();
    };

    explicit GraphVisualizer(core::FrameScheduler& scheduler, const Options& options = Options());
    ~GraphVisualizer() override;

    GraphVisualizer(const GraphVisualizer&) = delete;
    GraphVisualizer& operator=(const GraphVisualizer&) = delete;

    // No-op when identity_key matches the mounted payload.
    void SetPayload(const std::string& identity_key, const GraphPayload& payload);
    void Unmount();
    bool IsMounted() const { return simulation_ != nullptr; }
    const std::string& IdentityKey() const { return identity_key_; }

    void SetViewportSize(const ImVec2& size);
    const ImVec2& ViewportSize() const { return options_.viewport_size; }
    void SetGestureOptions(const GestureRecognizer::Options& options);

    // Input in canvas-local screen coordinates.
    void OnPointerDown(const PointerEvent& event);
    void OnPointerMove(const PointerEvent& event);
    void OnPointerUp(const PointerEvent& event);
    void OnHover(const ImVec2& screen_pos);
    void OnWheel(const ImVec2& anchor, float steps);
    void DismissInfoPanel();

    // Rebuilt lazily whenever the snapshot or the transform changed; nullptr when unmounted.
    const FrameGeometry* CurrentFrame();
    InfoPanelModel InfoPanel() const;
    std::optional<HoverLabel> CurrentHoverLabel();

    const SelectionState& Selection() const { return selection_; }
    ViewportController& Viewport() { return viewport_; }
    const ViewportController& Viewport() const { return viewport_; }
    const GestureRecognizer& Gestures() const { return gestures_; }
    ForceSimulation* Simulation() { return simulation_.get(); }
    const GraphModel* Model() const { return model_.get(); }

    // Bumped on every simulation tick; the GUI uses it to know the view changed.
    std::uint64_t RedrawCount() const { return redraw_count_; }

    // GestureHost
    std::optional<HitResult> HitTest(const ImVec2& screen_pos) const override;
    std::optional<ImVec2> NodeWorldPosition(const NodeId& id) const override;
    void BeginNodeDrag(const NodeId& id) override;
    void DragNodeTo(const NodeId& id, const ImVec2& world_pos) override;
    void EndNodeDrag(const NodeId& id) override;

private:
    ImVec2 Center() const;
    void RefreshFrame() const;

    core::FrameScheduler& scheduler_;
    Options options_;

    std::string identity_key_;
    std::shared_ptr<const GraphModel> model_;
    std::unique_ptr<ForceSimulation> simulation_;

    ViewportController viewport_;
    SelectionState selection_;
    GestureRecognizer gestures_;

    mutable std::optional<FrameGeometry> frame_;
    std::uint64_t redraw_count_ = 0;
};

} // namespace graph
} // namespace chatviz

#endif // CHATVIZ_GRAPH_VISUALIZER_H
