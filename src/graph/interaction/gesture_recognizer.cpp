#include <chatviz/graph/interaction/gesture_recognizer.h>

#include <algorithm>
#include <cmath>

namespace chatviz {
namespace graph {

namespace {

float Movement(const ImVec2& from, const ImVec2& to) {
    float dx = to.x - from.x;
    float dy = to.y - from.y;
    return std::sqrt(dx * dx + dy * dy);
}

} // anonymous namespace

const char* GestureStateName(GestureState state) {
    switch (state) {
        case GestureState::kIdle: return "idle";
        case GestureState::kPending: return "pending";
        case GestureState::kPanning: return "panning";
        case GestureState::kPinching: return "pinching";
        case GestureState::kDraggingNode: return "dragging-node";
        case GestureState::kPressingEdge: return "pressing-edge";
    }
    return "unknown";
}

GestureRecognizer::Options::Options()
    : tap_slop(5.0f),
      tap_max_duration(200),
      pan_claim_threshold(10.0f),
      double_tap_window(300),
      pinch_sensitivity(0.01f),
      double_tap_scope(DoubleTapScope::kEmptySpace) {}

GestureRecognizer::GestureRecognizer(GestureHost& host, ViewportController& viewport,
                                     SelectionState& selection, const Options& options)
    : host_(host), viewport_(viewport), selection_(selection), options_(options) {}

void GestureRecognizer::RegisterGrant(const PointerEvent& event, bool counts) {
    if (!counts) return;
    if (last_grant_time_ && event.time - *last_grant_time_ < options_.double_tap_window) {
        viewport_.Reset();
        last_grant_time_.reset();
        return;
    }
    last_grant_time_ = event.time;
}

bool GestureRecognizer::IsTap(float max_movement, GestureClock::time_point start,
                              GestureClock::time_point end) const {
    return max_movement <= options_.tap_slop && end - start < options_.tap_max_duration;
}

void GestureRecognizer::PointerDown(const PointerEvent& event) {
    if (node_pointers_.count(event.pointer_id) || edge_presses_.count(event.pointer_id)) return;
    if (background_ && background_->pointers.count(event.pointer_id)) return;

    const bool anywhere = options_.double_tap_scope == DoubleTapScope::kAnywhere;
    std::optional<HitResult> hit = host_.HitTest(event.position);

    if (hit && hit->kind == OverlayKind::kNode) {
        RegisterGrant(event, anywhere);
        // One record per node: a second pointer on a held node is ignored.
        if (node_presses_.count(hit->node_id)) return;

        NodePress press;
        press.pointer_id = event.pointer_id;
        press.start_pointer = event.position;
        press.start_time = event.time;
        std::optional<ImVec2> world = host_.NodeWorldPosition(hit->node_id);
        press.start_world = world ? *world : viewport_.Transform().ScreenToWorld(event.position);

        node_presses_[hit->node_id] = press;
        node_pointers_[event.pointer_id] = hit->node_id;
        selection_.HoverNode(hit->node_id);
        return;
    }

    if (hit && hit->kind == OverlayKind::kEdge) {
        RegisterGrant(event, anywhere);
        EdgePress press;
        press.edge_id = hit->edge_id;
        press.start_pointer = event.position;
        press.start_time = event.time;
        edge_presses_[event.pointer_id] = press;
        selection_.HoverEdge(hit->edge_id);
        return;
    }

    if (background_) {
        RegisterGrant(event, anywhere);
        background_->pointers[event.pointer_id] = event.position;
        if (!background_->pinching) {
            background_->claimed = true;
            BeginPinch(background_->last_position.y);
        }
        return;
    }

    RegisterGrant(event, true);
    BackgroundPress press;
    press.primary_pointer = event.pointer_id;
    press.grant_position = event.position;
    press.last_position = event.position;
    press.pointers[event.pointer_id] = event.position;
    background_ = press;
    if (event.touch_count >= 2) {
        background_->claimed = true;
        BeginPinch(event.position.y);
    }
}

void GestureRecognizer::BeginPinch(float anchor_y) {
    background_->pinching = true;
    background_->scale_at_pinch_start = viewport_.Transform().scale;
    background_->pinch_anchor_y = anchor_y;
}

void GestureRecognizer::PointerMove(const PointerEvent& event) {
    auto node_it = node_pointers_.find(event.pointer_id);
    if (node_it != node_pointers_.end()) {
        const NodeId& id = node_it->second;
        NodePress& press = node_presses_[id];
        press.max_movement = std::max(press.max_movement, Movement(press.start_pointer, event.position));
        if (!press.dragging && press.max_movement > options_.tap_slop) {
            press.dragging = true;
            host_.BeginNodeDrag(id);
        }
        if (press.dragging) {
            const float scale = viewport_.Transform().scale;
            ImVec2 world(press.start_world.x + (event.position.x - press.start_pointer.x) / scale,
                         press.start_world.y + (event.position.y - press.start_pointer.y) / scale);
            host_.DragNodeTo(id, world);
        }
        return;
    }

    auto edge_it = edge_presses_.find(event.pointer_id);
    if (edge_it != edge_presses_.end()) {
        EdgePress& press = edge_it->second;
        press.max_movement = std::max(press.max_movement, Movement(press.start_pointer, event.position));
        return;
    }

    if (background_ && background_->pointers.count(event.pointer_id)) {
        MoveBackground(event);
    }
}

void GestureRecognizer::MoveBackground(const PointerEvent& event) {
    BackgroundPress& press = *background_;
    press.pointers[event.pointer_id] = event.position;
    if (event.pointer_id != press.primary_pointer) return;

    const bool multi_touch = event.touch_count >= 2 || press.pointers.size() >= 2;

    if (!press.claimed) {
        float dx = event.position.x - press.grant_position.x;
        float dy = event.position.y - press.grant_position.y;
        if (!multi_touch && std::fabs(dx) <= options_.pan_claim_threshold &&
            std::fabs(dy) <= options_.pan_claim_threshold) {
            return;
        }
        press.claimed = true;
        if (multi_touch) {
            BeginPinch(press.grant_position.y);
        } else {
            // The claim applies everything moved since the grant.
            press.last_position = press.grant_position;
        }
    } else if (multi_touch && !press.pinching) {
        BeginPinch(event.position.y);
    } else if (!multi_touch && press.pinching) {
        // Down to one touch: pan from here on.
        press.pinching = false;
        press.last_position = event.position;
    }

    if (press.pinching) {
        float dy = event.position.y - press.pinch_anchor_y;
        viewport_.SetScale(press.scale_at_pinch_start + dy * options_.pinch_sensitivity);
    } else {
        viewport_.Pan(ImVec2(event.position.x - press.last_position.x,
                             event.position.y - press.last_position.y));
    }
    press.last_position = event.position;
}

void GestureRecognizer::PointerUp(const PointerEvent& event) {
    auto node_it = node_pointers_.find(event.pointer_id);
    if (node_it != node_pointers_.end()) {
        NodeId id = node_it->second;
        node_pointers_.erase(node_it);
        auto press_it = node_presses_.find(id);
        if (press_it != node_presses_.end()) {
            NodePress press = press_it->second;
            node_presses_.erase(press_it);
            press.max_movement = std::max(press.max_movement, Movement(press.start_pointer, event.position));
            if (press.dragging) {
                host_.EndNodeDrag(id);
            } else if (IsTap(press.max_movement, press.start_time, event.time)) {
                selection_.SelectNode(id);
            }
        }
        selection_.HoverNode(std::nullopt);
        return;
    }

    auto edge_it = edge_presses_.find(event.pointer_id);
    if (edge_it != edge_presses_.end()) {
        EdgePress press = edge_it->second;
        edge_presses_.erase(edge_it);
        press.max_movement = std::max(press.max_movement, Movement(press.start_pointer, event.position));
        if (IsTap(press.max_movement, press.start_time, event.time)) {
            selection_.SelectEdge(press.edge_id);
        }
        selection_.HoverEdge(std::nullopt);
        return;
    }

    if (background_ && background_->pointers.count(event.pointer_id)) {
        ReleaseBackground(event);
    }
}

void GestureRecognizer::ReleaseBackground(const PointerEvent& event) {
    BackgroundPress& press = *background_;
    press.pointers.erase(event.pointer_id);
    if (press.pointers.empty()) {
        background_.reset();
        return;
    }
    if (event.pointer_id == press.primary_pointer) {
        // Hand the gesture to a remaining pointer without jumping the view.
        auto next = press.pointers.begin();
        press.primary_pointer = next->first;
        press.grant_position = next->second;
        press.last_position = next->second;
        if (press.pinching) {
            BeginPinch(next->second.y);
        }
    }
    if (press.pinching && press.pointers.size() < 2 && event.touch_count < 2) {
        // One finger left: it pans from where it is now.
        press.pinching = false;
        press.last_position = press.pointers[press.primary_pointer];
    }
}

void GestureRecognizer::Hover(const ImVec2& screen_pos) {
    if (IsActive()) return;
    std::optional<HitResult> hit = host_.HitTest(screen_pos);
    if (!hit) {
        selection_.ClearHover();
    } else if (hit->kind == OverlayKind::kNode) {
        selection_.HoverNode(hit->node_id);
        selection_.HoverEdge(std::nullopt);
    } else {
        selection_.HoverEdge(hit->edge_id);
        selection_.HoverNode(std::nullopt);
    }
}

void GestureRecognizer::Wheel(const ImVec2& anchor, float steps) {
    if (steps == 0.0f) return;
    viewport_.ZoomAt(anchor, steps);
}

void GestureRecognizer::Dismiss() {
    selection_.Dismiss();
}

void GestureRecognizer::Cancel() {
    for (const auto& [id, press] : node_presses_) {
        if (press.dragging) host_.EndNodeDrag(id);
    }
    node_presses_.clear();
    node_pointers_.clear();
    edge_presses_.clear();
    background_.reset();
    last_grant_time_.reset();
}

GestureState GestureRecognizer::State() const {
    if (!node_presses_.empty()) return GestureState::kDraggingNode;
    if (!edge_presses_.empty()) return GestureState::kPressingEdge;
    if (background_) {
        if (background_->pinching) return GestureState::kPinching;
        if (background_->claimed) return GestureState::kPanning;
        return GestureState::kPending;
    }
    return GestureState::kIdle;
}

bool GestureRecognizer::IsActive() const {
    return State() != GestureState::kIdle;
}

} // namespace graph
} // namespace chatviz
