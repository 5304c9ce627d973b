#include <doctest/doctest.h>

#include "session/CaptureSessionImpl.hpp"
#include "session/SessionRegistry.hpp"

#include <thread>
#include <vector>

using namespace CS;
using namespace CS::Detail;

namespace {

auto makeSession(std::string title) -> std::shared_ptr<CaptureSessionImpl> {
    return std::make_shared<CaptureSessionImpl>(std::weak_ptr<ManagerContext>{}, std::move(title), std::nullopt);
}

} // namespace

TEST_CASE("SessionRegistry") {
    SessionRegistry registry;
    auto            a = makeSession("a");
    auto            b = makeSession("b");

    SUBCASE("Insert and find") {
        CHECK(registry.insert("content://1", a));
        CHECK(registry.contains("content://1"));
        CHECK(registry.find("content://1") == a);
        CHECK(registry.find("content://2") == nullptr);
        CHECK(registry.size() == 1);
    }

    SUBCASE("Duplicate insert keeps the first entry") {
        CHECK(registry.insert("content://1", a));
        CHECK_FALSE(registry.insert("content://1", b));
        CHECK(registry.find("content://1") == a);
    }

    SUBCASE("Remove only removes the owner's entry") {
        REQUIRE(registry.insert("content://1", a));
        CHECK_FALSE(registry.remove("content://1", b.get()));
        CHECK(registry.contains("content://1"));
        CHECK(registry.remove("content://1", a.get()));
        CHECK_FALSE(registry.contains("content://1"));
        CHECK_FALSE(registry.remove("content://1", a.get()));
    }

    SUBCASE("sessions lists every entry") {
        REQUIRE(registry.insert("content://1", a));
        REQUIRE(registry.insert("content://2", b));
        auto all = registry.sessions();
        CHECK(all.size() == 2);
    }

    SUBCASE("Concurrent inserts and removes") {
        constexpr int            kThreads    = 4;
        constexpr int            kPerThread  = 200;
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&registry, t] {
                for (int i = 0; i < kPerThread; ++i) {
                    auto session = makeSession("s");
                    auto uri     = "content://" + std::to_string(t) + "/" + std::to_string(i);
                    CHECK(registry.insert(uri, session));
                    if (i % 2 == 0) {
                        CHECK(registry.remove(uri, session.get()));
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        CHECK(registry.size() == static_cast<std::size_t>(kThreads * kPerThread / 2));
    }
}
