#pragma once

#include <capturesession/CaptureSession.hpp>
#include <capturesession/SessionListener.hpp>
#include <capturesession/core/Error.hpp>
#include <capturesession/core/Options.hpp>
#include <capturesession/core/Types.hpp>
#include <capturesession/providers/ImageInspector.hpp>
#include <capturesession/providers/MediaSaver.hpp>
#include <capturesession/providers/PlaceholderManager.hpp>
#include <capturesession/providers/ProcessingNotificationManager.hpp>
#include <capturesession/providers/SessionStorageManager.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace CS {

namespace Detail {
struct ManagerContext;
}

// Collaborators the manager drives. inspector defaults to JpegImageInspector.
struct CaptureSessionProviders {
    std::shared_ptr<PlaceholderManager>            placeholders;
    std::shared_ptr<ProcessingNotificationManager> notifications;
    std::shared_ptr<MediaSaver>                    mediaSaver;
    std::shared_ptr<SessionStorageManager>         storage;
    std::shared_ptr<ImageInspector>                inspector;
};

/**
 * CaptureSessionManager: creates capture sessions and answers queries about
 * the ones in flight.
 *
 * Sessions register themselves under their placeholder URI once started and
 * leave the registry when they finish, fail or are cancelled. Lifecycle events
 * are delivered to SessionListeners on a single delivery thread, in the order
 * the producing operations completed.
 *
 * Destroying the manager drains queued background work and pending events.
 * Sessions that outlive it report SessionClosed from every operation that
 * needs a collaborator.
 */
class CaptureSessionManager {
public:
    [[nodiscard]] static auto Create(CaptureSessionProviders providers, CaptureSessionOptions options = {})
            -> Expected<std::unique_ptr<CaptureSessionManager>>;

    ~CaptureSessionManager();

    CaptureSessionManager(CaptureSessionManager const&)            = delete;
    CaptureSessionManager& operator=(CaptureSessionManager const&) = delete;

    auto createSession(std::string title, std::optional<Location> location = std::nullopt)
            -> std::shared_ptr<CaptureSession>;
    // Empty title and no location.
    auto createAnonymousSession() -> std::shared_ptr<CaptureSession>;

    // Bypasses sessions and placeholders entirely.
    auto saveImage(Bytes const&                          bytes,
                   std::string const&                    title,
                   std::chrono::system_clock::time_point date,
                   std::optional<Location> const&        location,
                   int                                   width,
                   int                                   height,
                   int                                   orientation,
                   std::optional<ImageMetadata> const&   metadata,
                   OnMediaSavedListener                  listener) -> void;

    // Listeners are held weakly; the caller keeps them alive.
    auto addSessionListener(std::shared_ptr<SessionListener> const& listener) -> void;
    auto removeSessionListener(std::shared_ptr<SessionListener> const& listener) -> void;

    // kUnknownProgress when no started session has this URI.
    auto getSessionProgress(Uri const& uri) const -> int;
    auto getSessionProgressMessage(Uri const& uri) const -> Expected<std::string>;
    auto getSessionDirectory(std::string const& subDirectory) -> Expected<std::filesystem::path>;

    auto hasErrorMessage(Uri const& uri) const -> bool;
    auto getErrorMessage(Uri const& uri) const -> std::optional<std::string>;
    auto removeErrorMessage(Uri const& uri) -> void;

    auto activeSessionCount() const -> std::size_t;
    auto snapshot() const -> nlohmann::json;

    auto waitUntilIdle() -> void;
    auto shutdown() -> void;

    auto options() const -> CaptureSessionOptions const&;

private:
    explicit CaptureSessionManager(std::shared_ptr<Detail::ManagerContext> context);

    std::shared_ptr<Detail::ManagerContext> context;
};

} // namespace CS
