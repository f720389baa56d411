#ifndef CHATVIZ_FORCE_SIMULATION_H
#define CHATVIZ_FORCE_SIMULATION_H

#include <chatviz/core/frame_scheduler.h>
#include <chatviz/graph/graph_types.h>
#include <chatviz/graph/layout/spatial_hash.h>

#include <imgui.h>

#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace chatviz {
namespace graph {

/*
 * Velocity-Verlet force layout for one GraphModel.
 * Each tick: alpha update, link, many-body, centering, collision, integration.
 * The simulation owns the positions and is their only writer; everyone else
 * reads the immutable snapshot published after every tick.
 */
class ForceSimulation {
public:
    struct Params {
        float link_distance;
        float link_strength;      // Multiplier on the 1 / min(degree) link stiffness
        float charge_strength;
        float collision_radius;
        float collision_strength;
        float center_strength;
        float velocity_decay;
        float alpha_min;
        float alpha_decay;
        float drag_alpha_target;
        float energy_threshold;   // Mean kinetic energy below which an unpinned, untargeted layout counts as settled
        float initial_radius;

        Params();
    };

    using TickObserver = std::function<void(const LayoutSnapshot&)>;

    ForceSimulation(std::shared_ptr<const GraphModel> model, const ImVec2& center, const Params& params = Params());
    ~ForceSimulation();

    ForceSimulation(const ForceSimulation&) = delete;
    ForceSimulation& operator=(const ForceSimulation&) = delete;

    // Registers the per-frame tick. Ignored once stopped.
    void Start(core::FrameScheduler& scheduler);
    // Advances one step. Returns false when the layout is cooled or stopped.
    bool Tick();
    // Cancels the frame task. Irreversible.
    void Stop();

    bool IsStopped() const { return stopped_; }
    bool IsCooled() const { return cooled_; }
    bool IsScheduled() const { return task_.IsActive(); }

    void BeginDrag(NodeIndex index);
    void DragTo(NodeIndex index, const ImVec2& position);
    void EndDrag(NodeIndex index);
    bool IsPinned(NodeIndex index) const;

    void Reheat(float alpha);
    void SetCenter(const ImVec2& center);
    const ImVec2& Center() const { return center_; }

    float Alpha() const { return alpha_; }
    float AlphaTarget() const { return alpha_target_; }
    float KineticEnergy() const;
    std::uint64_t TickCount() const { return tick_count_; }

    std::shared_ptr<const LayoutSnapshot> Snapshot() const { return snapshot_; }
    void SetTickObserver(TickObserver observer) { observer_ = std::move(observer); }

    const std::shared_ptr<const GraphModel>& Model() const { return model_; }
    const Params& GetParams() const { return params_; }

private:
    friend struct ForceSimulationDetail;

    void Resume();
    void Publish();

    std::shared_ptr<const GraphModel> model_;
    Params params_;
    ImVec2 center_;

    std::vector<ImVec2> positions_;
    std::vector<ImVec2> velocities_;
    std::vector<std::optional<ImVec2>> pins_;
    int active_drags_ = 0;

    float alpha_ = 1.0f;
    float alpha_target_ = 0.0f;
    bool cooled_ = false;
    bool stopped_ = false;
    std::uint64_t tick_count_ = 0;

    SpatialHash spatial_hash_;
    std::mt19937 rng_{123}; // fixed seed for reproducible layouts

    core::FrameScheduler* scheduler_ = nullptr;
    core::FrameScheduler::Handle task_;

    std::shared_ptr<const LayoutSnapshot> snapshot_;
    TickObserver observer_;
};

} // namespace graph
} // namespace chatviz

#endif // CHATVIZ_FORCE_SIMULATION_H
