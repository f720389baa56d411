#include <chatviz/core/frame_scheduler.h>

#include <algorithm>
#include <utility>

namespace chatviz {
namespace core {

struct FrameScheduler::Handle::State {
    struct Task {
        std::uint64_t id;
        Callback callback;
        bool cancelled;
    };

    std::vector<Task> tasks;
    std::uint64_t next_id = 1;

    Task* Find(std::uint64_t id) {
        auto it = std::find_if(tasks.begin(), tasks.end(), [id](const Task& t) { return t.id == id; });
        return it == tasks.end() ? nullptr : &*it;
    }

    void Compact() {
        tasks.erase(std::remove_if(tasks.begin(), tasks.end(), [](const Task& t) { return t.cancelled; }),
                    tasks.end());
    }
};

FrameScheduler::Handle::Handle(std::weak_ptr<State> state, std::uint64_t task_id)
    : state_(std::move(state)), task_id_(task_id) {}

FrameScheduler::Handle::~Handle() {
    Cancel();
}

FrameScheduler::Handle::Handle(Handle&& other) noexcept
    : state_(std::move(other.state_)), task_id_(other.task_id_) {
    other.state_.reset();
    other.task_id_ = 0;
}

FrameScheduler::Handle& FrameScheduler::Handle::operator=(Handle&& other) noexcept {
    if (this != &other) {
        Cancel();
        state_ = std::move(other.state_);
        task_id_ = other.task_id_;
        other.state_.reset();
        other.task_id_ = 0;
    }
    return *this;
}

void FrameScheduler::Handle::Cancel() {
    if (auto state = state_.lock()) {
        if (State::Task* task = state->Find(task_id_)) {
            task->cancelled = true;
            // Release captured state now; the slot itself is compacted after the running frame.
            task->callback = nullptr;
        }
    }
    state_.reset();
    task_id_ = 0;
}

bool FrameScheduler::Handle::IsActive() const {
    auto state = state_.lock();
    if (!state) return false;
    const State::Task* task = state->Find(task_id_);
    return task != nullptr && !task->cancelled;
}

FrameScheduler::FrameScheduler() : state_(std::make_shared<Handle::State>()) {}

FrameScheduler::~FrameScheduler() = default;

FrameScheduler::Handle FrameScheduler::ScheduleRecurring(Callback callback) {
    const std::uint64_t id = state_->next_id++;
    state_->tasks.push_back({id, std::move(callback), false});
    return Handle(state_, id);
}

void FrameScheduler::RunFrame() {
    ++frame_count_;

    std::vector<std::uint64_t> due;
    due.reserve(state_->tasks.size());
    for (const auto& task : state_->tasks) {
        if (!task.cancelled) due.push_back(task.id);
    }

    for (std::uint64_t id : due) {
        // Look the task up again: an earlier callback may have cancelled it, or grown the vector.
        Handle::State::Task* task = state_->Find(id);
        if (task == nullptr || task->cancelled || !task->callback) continue;
        Callback callback = task->callback;
        callback();
    }

    state_->Compact();
}

std::size_t FrameScheduler::LiveTaskCount() const {
    return static_cast<std::size_t>(std::count_if(state_->tasks.begin(), state_->tasks.end(),
                                                  [](const Handle::State::Task& t) { return !t.cancelled; }));
}

} // namespace core
} // namespace chatviz
