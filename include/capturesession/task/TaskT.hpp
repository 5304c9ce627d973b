#pragma once

#include <capturesession/core/Error.hpp>
#include <capturesession/task/Executor.hpp>
#include <capturesession/task/Future.hpp>
#include <capturesession/task/Task.hpp>

#include <exception>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace CS {

/**
 * TaskT<T>: a Task whose callable produces Expected<T> and fulfills a
 * FutureT<Expected<T>>.
 *
 * The future always resolves: a refused submission resolves it with the
 * executor's error, and anything thrown by the callable resolves it with
 * Error::Code::UnknownError before the executor marks the task failed.
 *
 *   auto task   = TaskT<Uri>::Create("finalize", [] { return Expected<Uri>{"content://1"}; });
 *   auto future = task->schedule(executor);
 *   auto result = future.get(); // std::optional<Expected<Uri>>
 */
template <typename T>
class TaskT {
public:
    using result_type = Expected<T>;

    TaskT(TaskT const&)            = delete;
    TaskT& operator=(TaskT const&) = delete;

    template <typename F>
    static auto Create(std::string label, F&& func) -> std::shared_ptr<TaskT<T>> {
        auto self  = std::shared_ptr<TaskT<T>>(new TaskT<T>());
        auto state = self->promise_.shared_state();

        self->task_ = Task::Create(std::move(label), [st = std::move(state), fn = std::forward<F>(func)]() mutable {
            try {
                st->set_value(fn());
            } catch (std::exception const& e) {
                st->set_value(std::unexpected(Error{Error::Code::UnknownError, e.what()}));
                throw;
            } catch (...) {
                st->set_value(std::unexpected(Error{Error::Code::UnknownError, "non-standard exception"}));
                throw;
            }
        });
        return self;
    }

    // Submit to exec and return the future. Never returns an unresolvable future.
    auto schedule(Executor& exec) -> FutureT<result_type> {
        if (auto error = exec.submit(task_)) {
            promise_.set_value(std::unexpected(*error));
        }
        return promise_.get_future();
    }

    auto future() const -> FutureT<result_type> { return promise_.get_future(); }
    auto task() const -> std::shared_ptr<Task> { return task_; }

private:
    TaskT() = default;

    PromiseT<result_type> promise_;
    std::shared_ptr<Task> task_;
};

} // namespace CS
