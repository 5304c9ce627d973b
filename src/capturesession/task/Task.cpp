#include <capturesession/task/Task.hpp>

namespace CS {

std::string_view taskStateToString(TaskState state) {
    switch (state) {
        case TaskState::NotStarted:
            return "NotStarted";
        case TaskState::Starting:
            return "Starting";
        case TaskState::Running:
            return "Running";
        case TaskState::Completed:
            return "Completed";
        case TaskState::Failed:
            return "Failed";
    }
    return "Unknown";
}

auto Task::state() const -> TaskState {
    return this->state_.load(std::memory_order_acquire);
}

auto Task::hasStarted() const -> bool {
    return state() != TaskState::NotStarted;
}

auto Task::isCompleted() const -> bool {
    return state() == TaskState::Completed;
}

auto Task::isFailed() const -> bool {
    return state() == TaskState::Failed;
}

auto Task::label() const -> std::string const& {
    return this->label_;
}

auto Task::tryStart() -> bool {
    auto expected = TaskState::NotStarted;
    return this->state_.compare_exchange_strong(expected, TaskState::Starting, std::memory_order_acq_rel);
}

auto Task::transitionToRunning() -> bool {
    auto expected = TaskState::Starting;
    return this->state_.compare_exchange_strong(expected, TaskState::Running, std::memory_order_acq_rel);
}

auto Task::markCompleted() -> bool {
    auto expected = TaskState::Running;
    return this->state_.compare_exchange_strong(expected, TaskState::Completed, std::memory_order_acq_rel);
}

auto Task::markFailed() -> bool {
    auto current = state();
    while (current != TaskState::Completed) {
        if (this->state_.compare_exchange_weak(current, TaskState::Failed, std::memory_order_acq_rel)) {
            return true;
        }
    }
    return false;
}

} // namespace CS
