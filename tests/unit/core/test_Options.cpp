#include <capturesession/core/Options.hpp>
#include <doctest/doctest.h>

#include "CaptureSessionTestHelper.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>

using namespace CS;

namespace {

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str())) {
            original = std::string(existing);
        }
        if (value) {
            setenv(this->key.c_str(), value, 1);
        } else {
            unsetenv(this->key.c_str());
        }
    }
    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;
    ~EnvGuard() {
        if (original) {
            setenv(key.c_str(), original->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }

private:
    std::string                key;
    std::optional<std::string> original;
};

} // namespace

TEST_SUITE("core.options") {
TEST_CASE("Defaults") {
    CaptureSessionOptions options;
    CHECK(options.temp_sessions_directory == "TEMP_SESSIONS");
    CHECK(options.temp_file_extension == ".jpg");
    CHECK(options.mime_type == kJpegMimeType);
    CHECK(options.background_queue_capacity == 0);
    CHECK(validateOptions(options).has_value());
}

TEST_CASE("optionsFromJson overlays present keys") {
    auto document = nlohmann::json{{"temp_sessions_directory", "PENDING"},
                                   {"background_queue_capacity", 16},
                                   {"unrelated", true}};
    auto options  = optionsFromJson(document);
    REQUIRE(options.has_value());
    CHECK(options->temp_sessions_directory == "PENDING");
    CHECK(options->background_queue_capacity == 16);
    CHECK(options->temp_file_extension == ".jpg");

    SUBCASE("Round trip through optionsToJson") {
        auto again = optionsFromJson(optionsToJson(*options));
        REQUIRE(again.has_value());
        CHECK(again->temp_sessions_directory == "PENDING");
        CHECK(again->background_queue_capacity == 16);
    }
}

TEST_CASE("optionsFromJson rejects bad documents") {
    CHECK(optionsFromJson(nlohmann::json::array()).error().code == Error::Code::MalformedInput);
    CHECK(optionsFromJson(nlohmann::json{{"mime_type", 3}}).error().code == Error::Code::MalformedInput);
    CHECK(optionsFromJson(nlohmann::json{{"background_queue_capacity", -1}}).error().code == Error::Code::MalformedInput);
    CHECK(optionsFromJson(nlohmann::json{{"temp_sessions_directory", "a/b"}}).error().code == Error::Code::MalformedInput);
    CHECK(optionsFromJson(nlohmann::json{{"mime_type", ""}}).error().code == Error::Code::MalformedInput);
}

TEST_CASE("loadOptionsFile") {
    CS::Test::TempDirectory directory;

    SUBCASE("Missing file") {
        auto loaded = loadOptionsFile(directory.path / "missing.json");
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().code == Error::Code::NotFound);
    }

    SUBCASE("Invalid JSON") {
        auto path = directory.path / "broken.json";
        std::ofstream(path) << "{ not json";
        auto loaded = loadOptionsFile(path);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error().code == Error::Code::MalformedInput);
    }

    SUBCASE("Valid file") {
        auto path = directory.path / "options.json";
        std::ofstream(path) << R"({"temp_file_extension": ".jpeg", "delivery_thread_name": "events"})";
        auto loaded = loadOptionsFile(path);
        REQUIRE(loaded.has_value());
        CHECK(loaded->temp_file_extension == ".jpeg");
        CHECK(loaded->delivery_thread_name == "events");
    }
}

TEST_CASE("applyEnvironmentOverrides") {
    SUBCASE("Variables override fields") {
        EnvGuard dir("CAPTURESESSION_TEMP_DIR", "CAPTURES");
        EnvGuard ext("CAPTURESESSION_TEMP_EXTENSION", ".jpeg");
        EnvGuard mime("CAPTURESESSION_MIME_TYPE", "image/heic");
        EnvGuard capacity("CAPTURESESSION_BACKGROUND_QUEUE_CAPACITY", "8");

        auto options = applyEnvironmentOverrides(CaptureSessionOptions{});
        REQUIRE(options.has_value());
        CHECK(options->temp_sessions_directory == "CAPTURES");
        CHECK(options->temp_file_extension == ".jpeg");
        CHECK(options->mime_type == "image/heic");
        CHECK(options->background_queue_capacity == 8);
    }

    SUBCASE("Unset variables leave fields alone") {
        EnvGuard dir("CAPTURESESSION_TEMP_DIR", nullptr);
        EnvGuard capacity("CAPTURESESSION_BACKGROUND_QUEUE_CAPACITY", nullptr);
        CaptureSessionOptions base;
        base.temp_sessions_directory = "KEEP";
        auto options                 = applyEnvironmentOverrides(base);
        REQUIRE(options.has_value());
        CHECK(options->temp_sessions_directory == "KEEP");
    }

    SUBCASE("A non-numeric capacity is rejected") {
        EnvGuard capacity("CAPTURESESSION_BACKGROUND_QUEUE_CAPACITY", "many");
        auto     options = applyEnvironmentOverrides(CaptureSessionOptions{});
        REQUIRE_FALSE(options.has_value());
        CHECK(options.error().code == Error::Code::MalformedInput);
    }
}
}
