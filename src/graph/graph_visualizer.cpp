#include <chatviz/graph/graph_visualizer.h>

#include <iostream>

namespace chatviz {
namespace graph {

GraphVisualizer::Options::Options() : viewport_size(800.0f, 600.0f) {}

GraphVisualizer::GraphVisualizer(core::FrameScheduler& scheduler, const Options& options)
    : scheduler_(scheduler),
      options_(options),
      gestures_(*this, viewport_, selection_, options.gestures) {}

GraphVisualizer::~GraphVisualizer() {
    Unmount();
}

ImVec2 GraphVisualizer::Center() const {
    return ImVec2(options_.viewport_size.x * 0.5f, options_.viewport_size.y * 0.5f);
}

void GraphVisualizer::SetPayload(const std::string& identity_key, const GraphPayload& payload) {
    if (simulation_ && identity_key == identity_key_) return;

    // The old simulation must be gone before its replacement can tick.
    gestures_.Cancel();
    if (simulation_) {
        simulation_->Stop();
        simulation_.reset();
    }
    selection_.Dismiss();
    frame_.reset();

    model_ = GraphModel::Build(payload);
    identity_key_ = identity_key;

    simulation_ = std::make_unique<ForceSimulation>(model_, Center(), options_.physics);
    simulation_->SetTickObserver([this](const LayoutSnapshot&) { ++redraw_count_; });
    simulation_->Start(scheduler_);

    std::cout << "Graph mounted: " << model_->NodeCount() << " nodes, "
              << model_->Edges().size() << " edges" << std::endl;
}

void GraphVisualizer::Unmount() {
    gestures_.Cancel();
    if (simulation_) {
        simulation_->Stop();
        simulation_.reset();
    }
    model_.reset();
    identity_key_.clear();
    selection_.Dismiss();
    frame_.reset();
}

void GraphVisualizer::SetViewportSize(const ImVec2& size) {
    if (size.x == options_.viewport_size.x && size.y == options_.viewport_size.y) return;
    options_.viewport_size = size;
    if (simulation_) simulation_->SetCenter(Center());
}

void GraphVisualizer::SetGestureOptions(const GestureRecognizer::Options& options) {
    options_.gestures = options;
    gestures_.SetOptions(options);
}

void GraphVisualizer::OnPointerDown(const PointerEvent& event) {
    if (!IsMounted()) return;
    gestures_.PointerDown(event);
}

void GraphVisualizer::OnPointerMove(const PointerEvent& event) {
    if (!IsMounted()) return;
    gestures_.PointerMove(event);
}

void GraphVisualizer::OnPointerUp(const PointerEvent& event) {
    if (!IsMounted()) return;
    gestures_.PointerUp(event);
}

void GraphVisualizer::OnHover(const ImVec2& screen_pos) {
    if (!IsMounted()) return;
    gestures_.Hover(screen_pos);
}

void GraphVisualizer::OnWheel(const ImVec2& anchor, float steps) {
    if (!IsMounted()) return;
    gestures_.Wheel(anchor, steps);
}

void GraphVisualizer::DismissInfoPanel() {
    gestures_.Dismiss();
}

void GraphVisualizer::RefreshFrame() const {
    if (!simulation_ || !model_) {
        frame_.reset();
        return;
    }
    auto snapshot = simulation_->Snapshot();
    if (frame_ && frame_->Matches(snapshot->version, viewport_.Revision())) return;
    frame_ = BuildFrameGeometry(*model_, *snapshot, viewport_.Transform(), viewport_.Revision());
}

const FrameGeometry* GraphVisualizer::CurrentFrame() {
    RefreshFrame();
    return frame_ ? &*frame_ : nullptr;
}

InfoPanelModel GraphVisualizer::InfoPanel() const {
    if (!model_) return InfoPanelModel();
    return BuildInfoPanel(selection_, *model_);
}

std::optional<HoverLabel> GraphVisualizer::CurrentHoverLabel() {
    const FrameGeometry* frame = CurrentFrame();
    if (!frame) return std::nullopt;
    return BuildHoverLabel(selection_, *model_, *frame);
}

std::optional<HitResult> GraphVisualizer::HitTest(const ImVec2& screen_pos) const {
    RefreshFrame();
    if (!frame_) return std::nullopt;

    std::optional<HitTarget> target = frame_->overlays.HitTest(screen_pos);
    if (!target) return std::nullopt;

    HitResult result;
    result.kind = target->kind;
    if (target->kind == OverlayKind::kNode) {
        result.node_id = model_->Nodes()[target->element].id;
    } else {
        result.edge_id = target->element;
    }
    return result;
}

std::optional<ImVec2> GraphVisualizer::NodeWorldPosition(const NodeId& id) const {
    if (!simulation_ || !model_) return std::nullopt;
    auto index = model_->IndexOf(id);
    if (!index) return std::nullopt;
    auto snapshot = simulation_->Snapshot();
    if (*index >= snapshot->positions.size()) return std::nullopt;
    return snapshot->positions[*index];
}

void GraphVisualizer::BeginNodeDrag(const NodeId& id) {
    if (!simulation_) return;
    if (auto index = model_->IndexOf(id)) simulation_->BeginDrag(*index);
}

void GraphVisualizer::DragNodeTo(const NodeId& id, const ImVec2& world_pos) {
    if (!simulation_) return;
    if (auto index = model_->IndexOf(id)) simulation_->DragTo(*index, world_pos);
}

void GraphVisualizer::EndNodeDrag(const NodeId& id) {
    if (!simulation_) return;
    if (auto index = model_->IndexOf(id)) simulation_->EndDrag(*index);
}

} // namespace graph
} // namespace chatviz
