#include <capturesession/task/SerialExecutor.hpp>
#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace CS;
using namespace std::chrono_literals;

TEST_CASE("SerialExecutor Misc") {
    SUBCASE("Basic task execution") {
        SerialExecutor   executor("test-serial");
        std::atomic<int> counter{0};

        auto task = Task::Create("increment", [&counter] { counter++; });
        CHECK_FALSE(executor.submit(task).has_value());
        executor.waitIdle();

        CHECK(counter == 1);
        CHECK(task->isCompleted());
        CHECK(task->label() == "increment");
    }

    SUBCASE("Tasks run in submission order on one thread") {
        SerialExecutor               executor("test-serial");
        std::vector<int>             order;
        std::vector<std::thread::id> threads;
        const int                    NUM_TASKS = 100;

        for (int i = 0; i < NUM_TASKS; ++i) {
            auto error = executor.submit(Task::Create("ordered", [&order, &threads, i] {
                order.push_back(i);
                threads.push_back(std::this_thread::get_id());
            }));
            CHECK_FALSE(error.has_value());
        }
        executor.waitIdle();

        REQUIRE(order.size() == NUM_TASKS);
        for (int i = 0; i < NUM_TASKS; ++i) {
            CHECK(order[i] == i);
            CHECK(threads[i] == threads[0]);
        }
        CHECK(threads[0] != std::this_thread::get_id());
    }

    SUBCASE("Shutdown behavior") {
        SUBCASE("Clean shutdown with no tasks") {
            SerialExecutor executor("test-serial");
            CHECK(executor.size() == 1);
            executor.shutdown();
            CHECK(executor.size() == 0);
        }

        SUBCASE("Shutdown drains pending tasks") {
            SerialExecutor   executor("test-serial");
            std::atomic<int> counter{0};
            for (int i = 0; i < 10; ++i) {
                auto error = executor.submit(Task::Create("slow", [&counter] {
                    std::this_thread::sleep_for(2ms);
                    counter++;
                }));
                CHECK_FALSE(error.has_value());
            }
            executor.shutdown();
            CHECK(counter == 10);
            CHECK(executor.pending() == 0);
        }

        SUBCASE("Submit after shutdown is refused") {
            SerialExecutor executor("test-serial");
            executor.shutdown();
            auto task  = Task::Create("late", [] {});
            auto error = executor.submit(task);
            REQUIRE(error.has_value());
            CHECK(error->code == Error::Code::ExecutorShutdown);
            CHECK_FALSE(task->hasStarted());
        }

        SUBCASE("Double shutdown safety") {
            SerialExecutor executor("test-serial");
            executor.shutdown();
            executor.shutdown();
            CHECK(executor.size() == 0);
        }
    }

    SUBCASE("Refused submissions") {
        SerialExecutor executor("test-serial");

        SUBCASE("Null task") {
            auto error = executor.submit(nullptr);
            REQUIRE(error.has_value());
            CHECK(error->code == Error::Code::UnknownError);
        }

        SUBCASE("Same task twice") {
            auto task = Task::Create("once", [] {});
            CHECK_FALSE(executor.submit(task).has_value());
            auto error = executor.submit(task);
            REQUIRE(error.has_value());
            CHECK(error->code == Error::Code::UnknownError);
        }
    }

    SUBCASE("Capacity limits the queue") {
        SerialExecutor          executor("test-bounded", 1);
        std::mutex              mutex;
        std::condition_variable cv;
        bool                    release = false;
        bool                    running = false;

        auto blocker = Task::Create("blocker", [&] {
            std::unique_lock<std::mutex> lock(mutex);
            running = true;
            cv.notify_all();
            cv.wait(lock, [&] { return release; });
        });
        REQUIRE_FALSE(executor.submit(blocker).has_value());
        {
            std::unique_lock<std::mutex> lock(mutex);
            REQUIRE(cv.wait_for(lock, 5s, [&] { return running; }));
        }

        CHECK_FALSE(executor.submit(Task::Create("queued", [] {})).has_value());
        auto error = executor.submit(Task::Create("overflow", [] {}));
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::CapacityExceeded);

        {
            std::lock_guard<std::mutex> lock(mutex);
            release = true;
        }
        cv.notify_all();
        executor.waitIdle();
        CHECK(executor.pending() == 0);
    }

    SUBCASE("A throwing task is marked failed and the worker keeps going") {
        SerialExecutor   executor("test-serial");
        std::atomic<int> counter{0};

        auto failing = Task::Create("throws", [] { throw std::runtime_error("task failure"); });
        CHECK_FALSE(executor.submit(failing).has_value());
        CHECK_FALSE(executor.submit(Task::Create("after", [&counter] { counter++; })).has_value());
        executor.waitIdle();

        CHECK(failing->isFailed());
        CHECK(counter == 1);
    }

    SUBCASE("waitIdle from the worker returns immediately") {
        SerialExecutor    executor("test-serial");
        std::atomic<bool> returned{false};
        std::atomic<bool> onWorker{false};
        CHECK_FALSE(executor.submit(Task::Create("self-wait", [&] {
                                onWorker = executor.isWorkerThread();
                                executor.waitIdle();
                                returned = true;
                            }))
                            .has_value());
        executor.waitIdle();
        CHECK(onWorker);
        CHECK(returned);
        CHECK_FALSE(executor.isWorkerThread());
    }
}
