#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace CS {

// Identifiers, placeholder output locations and final media locations are all URIs.
using Uri   = std::string;
using Bytes = std::vector<std::uint8_t>;

// Notification handle handed out by ProcessingNotificationManager::notifyStart.
using NotificationId = int;

inline constexpr NotificationId kUnsetNotificationId = -1;

// Returned by progress lookups when no started session holds the identifier.
inline constexpr int kUnknownProgress = -1;

inline constexpr std::string_view kJpegMimeType = "image/jpeg";

struct Location {
    double                     latitude  = 0.0;
    double                     longitude = 0.0;
    std::optional<double>      altitude;
    std::optional<std::string> provider;
};

struct ImageBounds {
    int width  = 0;
    int height = 0;
};

/**
 * Embedded per-image attributes carried alongside the pixel data.
 *
 * The core never interprets the block; it is handed through to the
 * placeholder and media collaborators untouched.
 */
struct ImageMetadata {
    Bytes exif;            // APP1 payload, "Exif\0\0" header included
    int   orientation = 0; // degrees clockwise
};

// Handle to the provisional entry created by PlaceholderManager.
struct PlaceholderSession {
    Uri                                   outputUri;
    std::string                           title;
    std::chrono::system_clock::time_point createdAt{};
};

enum class SessionState {
    Created,
    Started,
    Done,
    Failed,
    Cancelled
};

[[nodiscard]] constexpr auto sessionStateToString(SessionState state) -> std::string_view {
    switch (state) {
    case SessionState::Created:
        return "created";
    case SessionState::Started:
        return "started";
    case SessionState::Done:
        return "done";
    case SessionState::Failed:
        return "failed";
    case SessionState::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto isTerminal(SessionState state) -> bool {
    return state == SessionState::Done || state == SessionState::Failed || state == SessionState::Cancelled;
}

} // namespace CS
