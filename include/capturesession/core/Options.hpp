#pragma once

#include <capturesession/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace CS {

struct CaptureSessionOptions {
    // Subdirectory requested from SessionStorageManager for per-session temp files.
    std::string temp_sessions_directory = "TEMP_SESSIONS";
    std::string temp_file_extension     = ".jpg";
    // Handed to PlaceholderManager::finishPlaceholder.
    std::string mime_type               = "image/jpeg";
    std::string background_thread_name  = "capture-background";
    std::string delivery_thread_name    = "capture-delivery";
    // 0 = unbounded. Applies to the background queue only; events are never dropped.
    std::size_t background_queue_capacity = 0;
};

// MalformedInput when a field cannot be used as configured.
[[nodiscard]] auto validateOptions(CaptureSessionOptions const& options) -> Expected<void>;

// Overlay the keys present in document onto base. Unknown keys are ignored.
[[nodiscard]] auto optionsFromJson(nlohmann::json const& document, CaptureSessionOptions base = {})
        -> Expected<CaptureSessionOptions>;

[[nodiscard]] auto loadOptionsFile(std::filesystem::path const& path, CaptureSessionOptions base = {})
        -> Expected<CaptureSessionOptions>;

/**
 * Overlay CAPTURESESSION_* environment variables:
 *   CAPTURESESSION_TEMP_DIR, CAPTURESESSION_TEMP_EXTENSION, CAPTURESESSION_MIME_TYPE,
 *   CAPTURESESSION_BACKGROUND_QUEUE_CAPACITY
 */
[[nodiscard]] auto applyEnvironmentOverrides(CaptureSessionOptions options) -> Expected<CaptureSessionOptions>;

[[nodiscard]] auto optionsToJson(CaptureSessionOptions const& options) -> nlohmann::json;

} // namespace CS
