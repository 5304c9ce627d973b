#pragma once
#include "TaskState.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace CS {

/**
 * Task: a unit of work scheduled on an Executor.
 *
 * Tasks are always heap-allocated and shared: the executor keeps the task
 * alive until it has run, callers may keep a reference to observe its state.
 *
 * State moves NotStarted -> Starting (accepted) -> Running -> Completed, or
 * to Failed from anything but Completed. Only the executor drives it.
 */
struct Task {
    template <typename FunctionType>
    static auto Create(std::string label, FunctionType&& fun) -> std::shared_ptr<Task> {
        auto task      = std::shared_ptr<Task>(new Task{});
        task->label_   = std::move(label);
        task->function = std::forward<FunctionType>(fun);
        return task;
    }

    auto state() const -> TaskState;
    auto hasStarted() const -> bool;
    auto isCompleted() const -> bool;
    auto isFailed() const -> bool;
    auto label() const -> std::string const&;

private:
    friend class SerialExecutor;

    Task()                       = default;
    Task(const Task&)            = delete;
    Task& operator=(const Task&) = delete;
    Task(Task&&)                 = delete;
    Task& operator=(Task&&)      = delete;

    auto tryStart() -> bool;
    auto transitionToRunning() -> bool;
    auto markCompleted() -> bool;
    auto markFailed() -> bool;

    std::atomic<TaskState> state_{TaskState::NotStarted};
    std::function<void()>  function;
    std::string            label_;
};

} // namespace CS
