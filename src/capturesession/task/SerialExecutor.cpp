#include <capturesession/task/SerialExecutor.hpp>
#include <capturesession/log/TaggedLogger.hpp>

#include <exception>

namespace CS {

SerialExecutor::SerialExecutor(std::string threadName, std::size_t capacity)
    : threadName(std::move(threadName))
    , capacity(capacity) {
    cs_log("SerialExecutor constructing " + this->threadName, "SerialExecutor");
    std::lock_guard<std::mutex> lock(this->mutex);
    this->worker   = std::jthread(&SerialExecutor::workerFunction, this);
    this->workerId = this->worker.get_id();
}

SerialExecutor::~SerialExecutor() {
    cs_log("SerialExecutor destroying " + this->threadName, "SerialExecutor");
    shutdown();
}

auto SerialExecutor::submit(std::shared_ptr<Task> task) -> std::optional<Error> {
    if (!task) {
        return Error{Error::Code::UnknownError, "Null task"};
    }
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown) {
            cs_log("SerialExecutor::submit refused: shutting down", "SerialExecutor");
            return Error{Error::Code::ExecutorShutdown, this->threadName + " is shutting down"};
        }
        if (this->capacity != 0 && this->tasks.size() >= this->capacity) {
            return Error{Error::Code::CapacityExceeded,
                         this->threadName + " queue is full (" + std::to_string(this->capacity) + ")"};
        }
        if (!task->tryStart()) {
            return Error{Error::Code::UnknownError, "Task '" + task->label() + "' was already submitted ("
                                                          + std::string{taskStateToString(task->state())} + ")"};
        }
        this->tasks.push_back(std::move(task));
    }
    this->taskCV.notify_one();
    return std::nullopt;
}

auto SerialExecutor::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->shuttingDown = true;
    }
    this->taskCV.notify_all();

    // Queued tasks are drained by the worker before it exits.
    std::lock_guard<std::mutex> joinLock(this->joinMutex);
    if (this->worker.joinable() && !isWorkerThread()) {
        this->worker.join();
        cs_log("SerialExecutor " + this->threadName + " joined", "SerialExecutor");
    }
}

auto SerialExecutor::waitIdle() -> void {
    if (isWorkerThread()) {
        // Waiting on ourselves would never return.
        cs_log("SerialExecutor::waitIdle called from its own worker; ignoring", "SerialExecutor", "Warning");
        return;
    }
    std::unique_lock<std::mutex> lock(this->mutex);
    this->idleCV.wait(lock, [this] { return this->tasks.empty() && !this->busy; });
}

auto SerialExecutor::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->shuttingDown ? 0 : 1;
}

auto SerialExecutor::pending() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->tasks.size() + (this->busy ? 1 : 0);
}

auto SerialExecutor::isWorkerThread() const -> bool {
    return std::this_thread::get_id() == this->workerId;
}

auto SerialExecutor::workerFunction() -> void {
#ifdef CS_LOG_DEBUG
    set_thread_name(this->threadName);
#endif
    while (true) {
        std::shared_ptr<Task> task;
        {
            std::unique_lock<std::mutex> lock(this->mutex);
            this->taskCV.wait(lock, [this] { return this->shuttingDown || !this->tasks.empty(); });

            if (this->tasks.empty()) {
                // shuttingDown with nothing left to run
                break;
            }
            task = std::move(this->tasks.front());
            this->tasks.pop_front();
            this->busy = true;
        }

        task->transitionToRunning();
        try {
            task->function();
            task->markCompleted();
        } catch (std::exception const& e) {
            task->markFailed();
            cs_log("Task '" + task->label() + "' threw: " + e.what(), "SerialExecutor", "Error");
        } catch (...) {
            task->markFailed();
            cs_log("Task '" + task->label() + "' threw a non-standard exception", "SerialExecutor", "Error");
        }
        task.reset();

        {
            std::lock_guard<std::mutex> lock(this->mutex);
            this->busy = false;
            if (this->tasks.empty()) {
                this->idleCV.notify_all();
            }
        }
    }
    cs_log("SerialExecutor " + this->threadName + " worker exit", "SerialExecutor");
    std::lock_guard<std::mutex> lock(this->mutex);
    this->idleCV.notify_all();
}

} // namespace CS
