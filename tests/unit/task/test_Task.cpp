#include <capturesession/task/SerialExecutor.hpp>
#include <capturesession/task/Task.hpp>
#include <doctest/doctest.h>

#include <future>
#include <stdexcept>

using namespace CS;

TEST_SUITE("task.state") {
TEST_CASE("Task state follows the executor") {
    SerialExecutor executor("test-task");

    SUBCASE("A new task has not started") {
        auto task = Task::Create("idle", [] {});
        CHECK(task->state() == TaskState::NotStarted);
        CHECK_FALSE(task->hasStarted());
        CHECK_FALSE(task->isCompleted());
        CHECK_FALSE(task->isFailed());
    }

    SUBCASE("Running while the callable executes, then Completed") {
        std::promise<void> entered;
        std::promise<void> release;
        auto               gate = release.get_future();
        auto               task = Task::Create("gated", [&] {
            entered.set_value();
            gate.wait();
        });

        REQUIRE_FALSE(executor.submit(task).has_value());
        entered.get_future().wait();
        CHECK(task->state() == TaskState::Running);
        CHECK(task->hasStarted());

        release.set_value();
        executor.waitIdle();
        CHECK(task->state() == TaskState::Completed);
        CHECK_FALSE(task->isFailed());
    }

    SUBCASE("A throwing callable ends Failed") {
        auto task = Task::Create("throws", [] { throw std::runtime_error("boom"); });
        REQUIRE_FALSE(executor.submit(task).has_value());
        executor.waitIdle();
        CHECK(task->state() == TaskState::Failed);
        CHECK_FALSE(task->isCompleted());
    }

    SUBCASE("A finished task cannot be submitted again") {
        auto task = Task::Create("once", [] {});
        REQUIRE_FALSE(executor.submit(task).has_value());
        executor.waitIdle();

        auto error = executor.submit(task);
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::UnknownError);
        CHECK(error->message.value_or("").find("(Completed)") != std::string::npos);
        CHECK(task->isCompleted());
    }
}

TEST_CASE("taskStateToString names every state") {
    CHECK(taskStateToString(TaskState::NotStarted) == "NotStarted");
    CHECK(taskStateToString(TaskState::Starting) == "Starting");
    CHECK(taskStateToString(TaskState::Running) == "Running");
    CHECK(taskStateToString(TaskState::Completed) == "Completed");
    CHECK(taskStateToString(TaskState::Failed) == "Failed");
    CHECK(taskStateToString(static_cast<TaskState>(42)) == "Unknown");
}
}
