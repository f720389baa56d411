#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace chatviz {
namespace core {

/*
 * Cooperative, single-threaded driver for recurring per-frame work.
 * The GUI loop calls RunFrame() once per animation frame; every live task
 * runs exactly once in registration order. Nothing here is thread-safe.
 */
class FrameScheduler {
public:
    using Callback = std::function<void()>;

    /*
     * Move-only ownership of one scheduled task. Destroying or cancelling the
     * handle removes the task immediately, even from inside RunFrame().
     */
    class Handle {
    public:
        Handle() = default;
        ~Handle();

        Handle(const Handle&) = delete;
        Handle& operator=(const Handle&) = delete;
        Handle(Handle&& other) noexcept;
        Handle& operator=(Handle&& other) noexcept;

        void Cancel();
        bool IsActive() const;

    private:
        friend class FrameScheduler;
        struct State;
        Handle(std::weak_ptr<State> state, std::uint64_t task_id);

        std::weak_ptr<State> state_;
        std::uint64_t task_id_ = 0;
    };

    FrameScheduler();
    ~FrameScheduler();

    FrameScheduler(const FrameScheduler&) = delete;
    FrameScheduler& operator=(const FrameScheduler&) = delete;

    [[nodiscard]] Handle ScheduleRecurring(Callback callback);

    // Runs every task that is live when the frame starts. Tasks added during the frame wait for the next one.
    void RunFrame();

    std::size_t LiveTaskCount() const;
    std::uint64_t FrameCount() const { return frame_count_; }

private:
    std::shared_ptr<Handle::State> state_;
    std::uint64_t frame_count_ = 0;
};

} // namespace core
} // namespace chatviz
