#pragma once
#include <capturesession/task/Executor.hpp>
#include <capturesession/task/Task.hpp>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace CS {

/**
 * SerialExecutor: one worker thread draining a FIFO queue.
 *
 * Tasks run strictly in submission order and never concurrently with each
 * other. Used both for background finalize/preview work and as the event
 * delivery context.
 */
class SerialExecutor : public Executor {
public:
    // capacity == 0 means unbounded.
    explicit SerialExecutor(std::string threadName, std::size_t capacity = 0);
    ~SerialExecutor() override;

    SerialExecutor(SerialExecutor const&)                    = delete;
    auto operator=(SerialExecutor const&) -> SerialExecutor& = delete;

    auto submit(std::shared_ptr<Task> task) -> std::optional<Error> override;
    auto shutdown() -> void override;
    auto waitIdle() -> void override;
    auto size() const -> std::size_t override;

    auto pending() const -> std::size_t;
    auto isWorkerThread() const -> bool;

private:
    auto workerFunction() -> void;

    std::string                       threadName;
    std::size_t                       capacity;
    std::deque<std::shared_ptr<Task>> tasks;
    mutable std::mutex                mutex;
    std::mutex                        joinMutex;
    std::condition_variable           taskCV;
    std::condition_variable           idleCV;
    bool                              shuttingDown = false;
    bool                              busy         = false;
    std::thread::id                   workerId;
    std::jthread                      worker;
};

} // namespace CS
