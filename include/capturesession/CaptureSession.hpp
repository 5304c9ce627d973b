#pragma once

#include <capturesession/core/Error.hpp>
#include <capturesession/core/Types.hpp>
#include <capturesession/task/Future.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace CS {

/**
 * CaptureSession: tracks one captured item from placeholder creation to the
 * final save or failure.
 *
 * Lifecycle
 * ---------
 *   Created --startSession--> Started --finalize----> Done
 *                                     --fail--------> Failed
 *                                     --cancel------> Cancelled
 *
 * Every accessor and mutator is serialized on the session's own lock, so a
 * session can be driven from several threads. Lifecycle events are delivered
 * asynchronously to the manager's SessionListeners.
 *
 * Sessions are created by CaptureSessionManager and always owned through a
 * std::shared_ptr.
 */
class CaptureSession {
public:
    virtual ~CaptureSession() = default;

    virtual auto title() const -> std::string const&                  = 0;
    virtual auto location() const -> std::optional<Location>          = 0;
    virtual auto setLocation(std::optional<Location> location) -> void = 0;
    virtual auto state() const -> SessionState                        = 0;

    /**
     * Starts the session with a freshly inserted placeholder built from seed.
     * Allocates the placeholder and the notification, registers the session
     * under the placeholder's URI and publishes Queued.
     *
     * Errors: AlreadyStarted if the session has left Created; any error from
     * the placeholder collaborator; DuplicateIdentifier if another started
     * session holds the same URI. On error the session stays in Created.
     */
    [[nodiscard]] virtual auto startSession(Bytes const& seed, std::string progressMessage) -> Expected<void> = 0;

    // As startSession, converting an existing media item into the placeholder.
    [[nodiscard]] virtual auto startSessionFromUri(Uri const& existing, std::string progressMessage)
            -> Expected<void> = 0;

    // Clamped to [0, 100]. Publishes Progress.
    virtual auto setProgress(int percent) -> Expected<void> = 0;
    virtual auto progress() const -> int                    = 0;

    virtual auto progressMessage() const -> std::string                  = 0;
    virtual auto setProgressMessage(std::string const& message) -> void = 0;

    /**
     * Turns the placeholder into the final media item, deregisters the
     * session and publishes Done with the final location. A collaborator
     * error fails the session with that error as reason.
     */
    virtual auto finalize(Bytes const&                        bytes,
                          int                                 width,
                          int                                 height,
                          int                                 orientation,
                          std::optional<ImageMetadata> const& metadata) -> Expected<Uri> = 0;

    /**
     * Reads the temp file on the background queue, decodes its dimensions,
     * reads metadata best-effort and finalizes. An unreadable temp file, or a
     * background queue that refuses the work, fails the session. The future
     * resolves with the final location or the error.
     */
    virtual auto finalizeFromTempFile() -> FutureT<Expected<Uri>> = 0;

    // Records reason in the error store, deregisters and publishes Failed.
    virtual auto fail(std::string const& reason) -> Expected<void> = 0;

    /**
     * Deregisters a started session and moves it to Cancelled. Publishes no
     * event and leaves the placeholder and the notification to their
     * collaborators. No-op in any other state.
     */
    virtual auto cancel() -> void = 0;

    // Refreshes the placeholder preview from the temp file and publishes Updated.
    // A refused submission only resolves the future; the next update retries.
    virtual auto onPreviewUpdated() -> FutureT<Expected<void>> = 0;

    // <sessionRoot>/<temp dir>/<title>/<title><ext>. Creates nothing.
    virtual auto tempFilePath() const -> Expected<std::filesystem::path> = 0;
    // Same path, provisioning the temp directory through the storage provider
    // and creating the title directory and an empty file if absent.
    virtual auto ensureTempFile() -> Expected<std::filesystem::path> = 0;

    virtual auto uri() const -> std::optional<Uri>                       = 0;
    virtual auto contentUri() const -> std::optional<Uri>                = 0;
    virtual auto hasPath() const -> bool                                 = 0;
    virtual auto notificationId() const -> NotificationId                = 0;
    virtual auto placeholder() const -> std::optional<PlaceholderSession> = 0;
};

} // namespace CS
