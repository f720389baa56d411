#ifndef CHATVIZ_GESTURE_RECOGNIZER_H
#define CHATVIZ_GESTURE_RECOGNIZER_H

#include <chatviz/core/id_types.h>
#include <chatviz/graph/interaction/overlay_regions.h>
#include <chatviz/graph/interaction/selection_state.h>
#include <chatviz/graph/render/viewport_transform.h>

#include <imgui.h>

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace chatviz {
namespace graph {

using GestureClock = std::chrono::steady_clock;

struct PointerEvent {
    int pointer_id = 0;
    ImVec2 position;            // Screen space
    GestureClock::time_point time;
    int touch_count = 1;        // Touch points reported by the platform for this event
};

enum class GestureState {
    kIdle,
    kPending,        // Background press not yet claimed as pan or pinch
    kPanning,
    kPinching,
    kDraggingNode,
    kPressingEdge
};

const char* GestureStateName(GestureState state);

enum class DoubleTapScope {
    kEmptySpace,     // Only presses on empty space that start a new gesture count
    kAnywhere        // Every press counts, wherever it lands
};

struct HitResult {
    OverlayKind kind;
    NodeId node_id;              // Set for node hits
    EdgeId edge_id = 0;          // Set for edge hits
};

// What the recognizer needs from the graph it drives.
class GestureHost {
public:
    virtual ~GestureHost() = default;

    virtual std::optional<HitResult> HitTest(const ImVec2& screen_pos) const = 0;
    virtual std::optional<ImVec2> NodeWorldPosition(const NodeId& id) const = 0;
    virtual void BeginNodeDrag(const NodeId& id) = 0;
    virtual void DragNodeTo(const NodeId& id, const ImVec2& world_pos) = 0;
    virtual void EndNodeDrag(const NodeId& id) = 0;
};

/*
 * Turns raw pointer events into taps, node drags, edge presses, pans,
 * pinches and double-tap resets.
 *
 * A press is granted to the topmost overlay under it: node, then edge,
 * then background. Node presses are tracked per node id so taps and drags on
 * different nodes resolve independently. Background presses only become a
 * pan or pinch once movement passes the claim threshold or a second touch
 * appears. Selection is only ever written here.
 */
class GestureRecognizer {
public:
    struct Options {
        float tap_slop;
        std::chrono::milliseconds tap_max_duration;
        float pan_claim_threshold;
        std::chrono::milliseconds double_tap_window;
        float pinch_sensitivity;
        DoubleTapScope double_tap_scope;

        Options();
    };

    GestureRecognizer(GestureHost& host, ViewportController& viewport, SelectionState& selection,
                      const Options& options = Options());

    void PointerDown(const PointerEvent& event);
    void PointerMove(const PointerEvent& event);
    void PointerUp(const PointerEvent& event);

    // Pointer motion with no press in progress.
    void Hover(const ImVec2& screen_pos);
    void Wheel(const ImVec2& anchor, float steps);
    void Dismiss();
    // Drops every in-flight gesture, ending any node drag.
    void Cancel();

    GestureState State() const;
    bool IsActive() const;

    const Options& GetOptions() const { return options_; }
    void SetOptions(const Options& options) { options_ = options; }

private:
    struct NodePress {
        int pointer_id = 0;
        ImVec2 start_pointer;
        ImVec2 start_world;
        GestureClock::time_point start_time;
        float max_movement = 0.0f;
        bool dragging = false;
    };

    struct EdgePress {
        EdgeId edge_id = 0;
        ImVec2 start_pointer;
        GestureClock::time_point start_time;
        float max_movement = 0.0f;
    };

    struct BackgroundPress {
        int primary_pointer = 0;
        ImVec2 grant_position;
        ImVec2 last_position;
        std::map<int, ImVec2> pointers;
        bool claimed = false;
        bool pinching = false;
        float scale_at_pinch_start = 1.0f;
        float pinch_anchor_y = 0.0f;
    };

    void RegisterGrant(const PointerEvent& event, bool counts);
    void BeginPinch(float anchor_y);
    bool IsTap(float max_movement, GestureClock::time_point start, GestureClock::time_point end) const;
    void MoveBackground(const PointerEvent& event);
    void ReleaseBackground(const PointerEvent& event);

    GestureHost& host_;
    ViewportController& viewport_;
    SelectionState& selection_;
    Options options_;

    std::map<NodeId, NodePress> node_presses_;
    std::map<int, NodeId> node_pointers_;
    std::map<int, EdgePress> edge_presses_;
    std::optional<BackgroundPress> background_;

    std::optional<GestureClock::time_point> last_grant_time_;
};

} // namespace graph
} // namespace chatviz

#endif // CHATVIZ_GESTURE_RECOGNIZER_H
