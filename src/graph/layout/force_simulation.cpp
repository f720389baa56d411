#include <chatviz/graph/layout/force_simulation.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace chatviz {
namespace graph {

namespace {
    constexpr float kPi = 3.14159265358979323846f;
    // Golden-angle step of the initial phyllotaxis spiral
    const float kInitialAngle = kPi * (3.0f - std::sqrt(5.0f));
    constexpr float kMinDistanceSquared = 1.0f;
}

ForceSimulation::Params::Params()
    : link_distance(120.0f),
      link_strength(1.0f),
      charge_strength(-400.0f),
      collision_radius(25.0f),
      collision_strength(1.0f),
      center_strength(1.0f),
      velocity_decay(0.4f),
      alpha_min(0.001f),
      alpha_decay(1.0f - std::pow(0.001f, 1.0f / 300.0f)),
      drag_alpha_target(0.3f),
      energy_threshold(0.01f),
      initial_radius(10.0f) {}

struct ForceSimulationDetail {
    // Tiny deterministic offset used to break exact coincidences.
    static float Jiggle(ForceSimulation& sim) {
        std::uniform_real_distribution<float> dist(0.0f, 1.0f);
        return (dist(sim.rng_) - 0.5f) * 1e-6f;
    }

    static void InitializePositions(ForceSimulation& sim) {
        const auto& nodes = sim.model_->Nodes();
        sim.positions_.resize(nodes.size());
        sim.velocities_.assign(nodes.size(), ImVec2(0.0f, 0.0f));
        sim.pins_.assign(nodes.size(), std::nullopt);

        for (size_t i = 0; i < nodes.size(); ++i) {
            if (nodes[i].seed) {
                sim.positions_[i] = *nodes[i].seed;
                continue;
            }
            float radius = sim.params_.initial_radius * std::sqrt(0.5f + static_cast<float>(i));
            float angle = static_cast<float>(i) * kInitialAngle;
            sim.positions_[i] = ImVec2(sim.center_.x + radius * std::cos(angle),
                                       sim.center_.y + radius * std::sin(angle));
        }
    }

    static void ApplyLinkForce(ForceSimulation& sim) {
        const auto& degrees = sim.model_->Degrees();
        auto& x = sim.positions_;
        auto& v = sim.velocities_;

        for (const auto& edge : sim.model_->Edges()) {
            const NodeIndex s = edge.source_index;
            const NodeIndex t = edge.target_index;
            if (s == t) continue;

            float dx = x[t].x + v[t].x - x[s].x - v[s].x;
            float dy = x[t].y + v[t].y - x[s].y - v[s].y;
            if (dx == 0.0f) dx = Jiggle(sim);
            if (dy == 0.0f) dy = Jiggle(sim);

            float length = std::sqrt(dx * dx + dy * dy);
            if (length <= 0.0f) continue;

            const float deg_s = static_cast<float>(degrees[s]);
            const float deg_t = static_cast<float>(degrees[t]);
            const float strength = sim.params_.link_strength / std::min(deg_s, deg_t);
            const float bias = deg_s / (deg_s + deg_t);

            float k = (length - sim.params_.link_distance) / length * sim.alpha_ * strength;
            dx *= k;
            dy *= k;

            v[t].x -= dx * bias;
            v[t].y -= dy * bias;
            v[s].x += dx * (1.0f - bias);
            v[s].y += dy * (1.0f - bias);
        }
    }

    static void ApplyManyBodyForce(ForceSimulation& sim) {
        auto& x = sim.positions_;
        auto& v = sim.velocities_;
        const size_t count = x.size();

        for (size_t i = 0; i < count; ++i) {
            for (size_t j = 0; j < count; ++j) {
                if (i == j) continue;
                float dx = x[j].x - x[i].x;
                float dy = x[j].y - x[i].y;
                if (dx == 0.0f) dx = Jiggle(sim);
                if (dy == 0.0f) dy = Jiggle(sim);

                float l2 = dx * dx + dy * dy;
                if (l2 < kMinDistanceSquared) l2 = std::sqrt(kMinDistanceSquared * l2);
                if (l2 <= 0.0f) continue;

                float w = sim.params_.charge_strength * sim.alpha_ / l2;
                v[i].x += dx * w;
                v[i].y += dy * w;
            }
        }
    }

    static void ApplyCenterForce(ForceSimulation& sim) {
        auto& x = sim.positions_;
        if (x.empty()) return;

        float sx = 0.0f;
        float sy = 0.0f;
        for (const auto& p : x) {
            sx += p.x;
            sy += p.y;
        }
        const float n = static_cast<float>(x.size());
        sx = (sx / n - sim.center_.x) * sim.params_.center_strength;
        sy = (sy / n - sim.center_.y) * sim.params_.center_strength;

        for (auto& p : x) {
            p.x -= sx;
            p.y -= sy;
        }
    }

    static void ApplyCollisionForce(ForceSimulation& sim) {
        auto& x = sim.positions_;
        auto& v = sim.velocities_;
        const size_t count = x.size();
        if (count < 2) return;

        const float ri = sim.params_.collision_radius;
        const float rj = sim.params_.collision_radius;
        const float r = ri + rj;
        const float ri2 = ri * ri;
        const float rj2 = rj * rj;
        const float weight = rj2 / (ri2 + rj2);

        std::vector<ImVec2> predicted(count);
        for (size_t i = 0; i < count; ++i) {
            predicted[i] = ImVec2(x[i].x + v[i].x, x[i].y + v[i].y);
        }
        sim.spatial_hash_.Insert(predicted);

        for (size_t i = 0; i < count; ++i) {
            const float xi = x[i].x + v[i].x;
            const float yi = x[i].y + v[i].y;

            std::vector<int> neighbors = sim.spatial_hash_.Query(ImVec2(xi, yi), r);
            for (int j_index : neighbors) {
                if (j_index <= static_cast<int>(i)) continue;
                const size_t j = static_cast<size_t>(j_index);

                float dx = xi - x[j].x - v[j].x;
                float dy = yi - x[j].y - v[j].y;
                float l = dx * dx + dy * dy;
                if (l >= r * r) continue;

                if (dx == 0.0f) {
                    dx = Jiggle(sim);
                    l += dx * dx;
                }
                if (dy == 0.0f) {
                    dy = Jiggle(sim);
                    l += dy * dy;
                }
                l = std::sqrt(l);
                if (l <= 0.0f) continue;

                float k = (r - l) / l * sim.params_.collision_strength;
                dx *= k;
                dy *= k;

                v[i].x += dx * weight;
                v[i].y += dy * weight;
                v[j].x -= dx * (1.0f - weight);
                v[j].y -= dy * (1.0f - weight);
            }
        }
    }

    static void Integrate(ForceSimulation& sim) {
        const float retain = 1.0f - sim.params_.velocity_decay;
        for (size_t i = 0; i < sim.positions_.size(); ++i) {
            if (sim.pins_[i]) {
                sim.positions_[i] = *sim.pins_[i];
                sim.velocities_[i] = ImVec2(0.0f, 0.0f);
                continue;
            }
            ImVec2& vel = sim.velocities_[i];
            vel.x *= retain;
            vel.y *= retain;
            sim.positions_[i].x += vel.x;
            sim.positions_[i].y += vel.y;

            if (!std::isfinite(sim.positions_[i].x) || !std::isfinite(sim.positions_[i].y)) {
                std::cerr << "Warning: non-finite position for node " << sim.model_->Nodes()[i].id
                          << ", resetting to center" << std::endl;
                sim.positions_[i] = sim.center_;
                vel = ImVec2(0.0f, 0.0f);
            }
        }
    }

    static bool AnyPinned(const ForceSimulation& sim) {
        return std::any_of(sim.pins_.begin(), sim.pins_.end(),
                           [](const std::optional<ImVec2>& pin) { return pin.has_value(); });
    }
};

ForceSimulation::ForceSimulation(std::shared_ptr<const GraphModel> model, const ImVec2& center, const Params& params)
    : model_(std::move(model)),
      params_(params),
      center_(center),
      spatial_hash_(params.collision_radius * 2.0f) {
    if (!model_) {
        throw std::invalid_argument("ForceSimulation requires a graph model");
    }
    ForceSimulationDetail::InitializePositions(*this);
    Publish();
}

ForceSimulation::~ForceSimulation() {
    Stop();
}

void ForceSimulation::Start(core::FrameScheduler& scheduler) {
    if (stopped_) return;
    scheduler_ = &scheduler;
    cooled_ = false;
    Resume();
}

bool ForceSimulation::Tick() {
    if (stopped_ || cooled_) return false;

    alpha_ += (alpha_target_ - alpha_) * params_.alpha_decay;

    ForceSimulationDetail::ApplyLinkForce(*this);
    ForceSimulationDetail::ApplyManyBodyForce(*this);
    ForceSimulationDetail::ApplyCenterForce(*this);
    ForceSimulationDetail::ApplyCollisionForce(*this);
    ForceSimulationDetail::Integrate(*this);
    ++tick_count_;

    bool settled = alpha_target_ == 0.0f && !ForceSimulationDetail::AnyPinned(*this) &&
                   KineticEnergy() < params_.energy_threshold;
    if (alpha_ < params_.alpha_min || settled) {
        cooled_ = true;
        task_.Cancel();
    }

    Publish();
    return !cooled_;
}

void ForceSimulation::Stop() {
    stopped_ = true;
    task_.Cancel();
    scheduler_ = nullptr;
}

void ForceSimulation::Resume() {
    if (stopped_) return;
    cooled_ = false;
    if (scheduler_ && !task_.IsActive()) {
        task_ = scheduler_->ScheduleRecurring([this]() { Tick(); });
    }
}

void ForceSimulation::Publish() {
    auto snapshot = std::make_shared<LayoutSnapshot>();
    snapshot->version = tick_count_;
    snapshot->alpha = alpha_;
    snapshot->positions = positions_;
    snapshot->pinned.resize(pins_.size());
    for (size_t i = 0; i < pins_.size(); ++i) {
        snapshot->pinned[i] = pins_[i].has_value();
    }
    snapshot_ = std::move(snapshot);

    if (observer_ && tick_count_ > 0) {
        observer_(*snapshot_);
    }
}

void ForceSimulation::BeginDrag(NodeIndex index) {
    if (stopped_ || index >= positions_.size()) return;
    if (!pins_[index]) ++active_drags_;
    pins_[index] = positions_[index];
    alpha_target_ = params_.drag_alpha_target;
    Resume();
}

void ForceSimulation::DragTo(NodeIndex index, const ImVec2& position) {
    if (stopped_ || index >= positions_.size() || !pins_[index]) return;
    pins_[index] = position;
}

void ForceSimulation::EndDrag(NodeIndex index) {
    if (stopped_ || index >= positions_.size() || !pins_[index]) return;
    pins_[index].reset();
    if (--active_drags_ <= 0) {
        active_drags_ = 0;
        alpha_target_ = 0.0f;
    }
}

bool ForceSimulation::IsPinned(NodeIndex index) const {
    return index < pins_.size() && pins_[index].has_value();
}

void ForceSimulation::Reheat(float alpha) {
    if (stopped_) return;
    alpha_ = std::max(0.0f, std::min(1.0f, alpha));
    Resume();
}

void ForceSimulation::SetCenter(const ImVec2& center) {
    if (center_.x == center.x && center_.y == center.y) return;
    center_ = center;
    Resume();
}

float ForceSimulation::KineticEnergy() const {
    float total = 0.0f;
    size_t moving = 0;
    for (size_t i = 0; i < velocities_.size(); ++i) {
        if (pins_[i]) continue;
        const ImVec2& vel = velocities_[i];
        total += 0.5f * (vel.x * vel.x + vel.y * vel.y);
        ++moving;
    }
    return moving == 0 ? 0.0f : total / static_cast<float>(moving);
}

} // namespace graph
} // namespace chatviz
