#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace CS {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        AlreadyStarted,
        NotStarted,
        SessionClosed,
        UnknownSession,
        DuplicateIdentifier,
        StorageUnavailable,
        TempFileReadFailure,
        MetadataExtractionFailure,
        PlaceholderFailure,
        InvalidTitle,
        MalformedInput,
        NotFound,
        ExecutorShutdown,
        CapacityExceeded
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::AlreadyStarted:
        return "already_started";
    case Error::Code::NotStarted:
        return "not_started";
    case Error::Code::SessionClosed:
        return "session_closed";
    case Error::Code::UnknownSession:
        return "unknown_session";
    case Error::Code::DuplicateIdentifier:
        return "duplicate_identifier";
    case Error::Code::StorageUnavailable:
        return "storage_unavailable";
    case Error::Code::TempFileReadFailure:
        return "temp_file_read_failure";
    case Error::Code::MetadataExtractionFailure:
        return "metadata_extraction_failure";
    case Error::Code::PlaceholderFailure:
        return "placeholder_failure";
    case Error::Code::InvalidTitle:
        return "invalid_title";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::ExecutorShutdown:
        return "executor_shutdown";
    case Error::Code::CapacityExceeded:
        return "capacity_exceeded";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace CS
