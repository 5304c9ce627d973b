#include <capturesession/core/Options.hpp>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string_view>
#include <system_error>

namespace CS {

namespace {

using json = nlohmann::json;

auto read_string(json const& document, char const* key, std::string& out) -> Expected<void> {
    auto it = document.find(key);
    if (it == document.end()) {
        return {};
    }
    if (!it->is_string()) {
        return std::unexpected(Error{Error::Code::MalformedInput, std::string{"option '"} + key + "' must be a string"});
    }
    out = it->get<std::string>();
    return {};
}

auto read_size(json const& document, char const* key, std::size_t& out) -> Expected<void> {
    auto it = document.find(key);
    if (it == document.end()) {
        return {};
    }
    if (!it->is_number_integer() || (!it->is_number_unsigned() && it->get<std::int64_t>() < 0)) {
        return std::unexpected(
                Error{Error::Code::MalformedInput, std::string{"option '"} + key + "' must be a non-negative integer"});
    }
    out = it->get<std::size_t>();
    return {};
}

auto parse_size(std::string_view text) -> std::optional<std::size_t> {
    std::size_t value = 0;
    auto [ptr, ec]    = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

auto validateOptions(CaptureSessionOptions const& options) -> Expected<void> {
    if (options.temp_sessions_directory.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "temp_sessions_directory must not be empty"});
    }
    if (options.temp_sessions_directory.find('/') != std::string::npos) {
        return std::unexpected(Error{Error::Code::MalformedInput, "temp_sessions_directory must be a single path component"});
    }
    if (options.mime_type.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "mime_type must not be empty"});
    }
    return {};
}

auto optionsFromJson(json const& document, CaptureSessionOptions base) -> Expected<CaptureSessionOptions> {
    if (!document.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "options document must be a JSON object"});
    }
    for (auto result : {read_string(document, "temp_sessions_directory", base.temp_sessions_directory),
                        read_string(document, "temp_file_extension", base.temp_file_extension),
                        read_string(document, "mime_type", base.mime_type),
                        read_string(document, "background_thread_name", base.background_thread_name),
                        read_string(document, "delivery_thread_name", base.delivery_thread_name),
                        read_size(document, "background_queue_capacity", base.background_queue_capacity)}) {
        if (!result) {
            return std::unexpected(result.error());
        }
    }
    if (auto valid = validateOptions(base); !valid) {
        return std::unexpected(valid.error());
    }
    return base;
}

auto loadOptionsFile(std::filesystem::path const& path, CaptureSessionOptions base) -> Expected<CaptureSessionOptions> {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error{Error::Code::NotFound, "cannot open options file " + path.string()});
    }
    auto document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "options file " + path.string() + " is invalid JSON"});
    }
    return optionsFromJson(document, std::move(base));
}

auto applyEnvironmentOverrides(CaptureSessionOptions options) -> Expected<CaptureSessionOptions> {
    if (char const* value = std::getenv("CAPTURESESSION_TEMP_DIR")) {
        options.temp_sessions_directory = value;
    }
    if (char const* value = std::getenv("CAPTURESESSION_TEMP_EXTENSION")) {
        options.temp_file_extension = value;
    }
    if (char const* value = std::getenv("CAPTURESESSION_MIME_TYPE")) {
        options.mime_type = value;
    }
    if (char const* value = std::getenv("CAPTURESESSION_BACKGROUND_QUEUE_CAPACITY")) {
        auto parsed = parse_size(value);
        if (!parsed) {
            return std::unexpected(Error{Error::Code::MalformedInput,
                                         std::string{"CAPTURESESSION_BACKGROUND_QUEUE_CAPACITY is not a number: "} + value});
        }
        options.background_queue_capacity = *parsed;
    }
    if (auto valid = validateOptions(options); !valid) {
        return std::unexpected(valid.error());
    }
    return options;
}

auto optionsToJson(CaptureSessionOptions const& options) -> json {
    return json{{"temp_sessions_directory", options.temp_sessions_directory},
                {"temp_file_extension", options.temp_file_extension},
                {"mime_type", options.mime_type},
                {"background_thread_name", options.background_thread_name},
                {"delivery_thread_name", options.delivery_thread_name},
                {"background_queue_capacity", options.background_queue_capacity}};
}

} // namespace CS
