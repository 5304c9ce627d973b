#include <doctest/doctest.h>

#include "session/ErrorMessageStore.hpp"

#include <algorithm>

using namespace CS::Detail;

TEST_CASE("ErrorMessageStore") {
    ErrorMessageStore store;

    SUBCASE("Empty store") {
        CHECK_FALSE(store.has("content://1"));
        CHECK_FALSE(store.get("content://1").has_value());
        CHECK_FALSE(store.clear("content://1"));
        CHECK(store.size() == 0);
    }

    SUBCASE("Put overwrites, clear removes") {
        store.put("content://1", "disk full");
        store.put("content://1", "still full");
        CHECK(store.has("content://1"));
        CHECK(store.get("content://1") == std::optional<std::string>{"still full"});
        CHECK(store.size() == 1);

        CHECK(store.clear("content://1"));
        CHECK_FALSE(store.has("content://1"));
    }

    SUBCASE("Entries") {
        store.put("content://1", "a");
        store.put("content://2", "b");
        auto entries = store.entries();
        std::sort(entries.begin(), entries.end());
        REQUIRE(entries.size() == 2);
        CHECK(entries[0] == std::pair<CS::Uri, std::string>{"content://1", "a"});
        CHECK(entries[1] == std::pair<CS::Uri, std::string>{"content://2", "b"});
    }
}
