#pragma once

#include <capturesession/core/Error.hpp>

#include <cstddef>
#include <memory>
#include <optional>

namespace CS {

struct Task;

/**
 * Executor: interface for scheduling and executing Tasks
 *
 * Contract
 * --------
 * - submit(...) returns std::nullopt on success, or an Error on refusal
 *   (executor shutting down, capacity exceeded, task already started).
 * - shutdown() stops accepting new tasks, lets already queued tasks run and
 *   joins the workers.
 * - waitIdle() blocks until nothing is queued or running.
 *
 * Thread-safety
 * -------------
 * Implementations must be thread-safe for concurrent submit() calls and
 * for shutdown() to be called while tasks may still be in flight.
 */
struct Executor {
    virtual ~Executor() = default;

    virtual auto submit(std::shared_ptr<Task> task) -> std::optional<Error> = 0;
    virtual auto shutdown() -> void                                         = 0;
    virtual auto waitIdle() -> void                                         = 0;

    // Implementation-defined capacity (number of live workers).
    virtual auto size() const -> std::size_t = 0;
};

} // namespace CS
