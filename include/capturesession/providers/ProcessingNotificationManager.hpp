#pragma once

#include <capturesession/core/Types.hpp>

#include <string>

namespace CS {

/**
 * ProcessingNotificationManager: surfaces in-flight processing to the user
 * (system notification, status bar, ...). Rendering is entirely up to the
 * implementation; the core only hands over progress and status text.
 *
 * Implementations must be thread-safe.
 */
struct ProcessingNotificationManager {
    virtual ~ProcessingNotificationManager() = default;

    // Returns a handle that identifies the notification in later calls.
    virtual auto notifyStart(std::string const& message) -> NotificationId = 0;

    virtual auto setProgress(int percent, NotificationId id) -> void              = 0;
    virtual auto setStatus(std::string const& message, NotificationId id) -> void = 0;
    virtual auto notifyCompletion(NotificationId id) -> void                      = 0;
};

} // namespace CS
