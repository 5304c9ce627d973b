#pragma once

#include <capturesession/CaptureSession.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace CS::Detail {

struct ManagerContext;

class CaptureSessionImpl final : public CaptureSession, public std::enable_shared_from_this<CaptureSessionImpl> {
public:
    CaptureSessionImpl(std::weak_ptr<ManagerContext> context, std::string title, std::optional<Location> location);

    CaptureSessionImpl(CaptureSessionImpl const&)            = delete;
    CaptureSessionImpl& operator=(CaptureSessionImpl const&) = delete;

    auto title() const -> std::string const& override;
    auto location() const -> std::optional<Location> override;
    auto setLocation(std::optional<Location> location) -> void override;
    auto state() const -> SessionState override;

    auto startSession(Bytes const& seed, std::string progressMessage) -> Expected<void> override;
    auto startSessionFromUri(Uri const& existing, std::string progressMessage) -> Expected<void> override;

    auto setProgress(int percent) -> Expected<void> override;
    auto progress() const -> int override;
    auto progressMessage() const -> std::string override;
    auto setProgressMessage(std::string const& message) -> void override;

    auto finalize(Bytes const&                        bytes,
                  int                                 width,
                  int                                 height,
                  int                                 orientation,
                  std::optional<ImageMetadata> const& metadata) -> Expected<Uri> override;
    auto finalizeFromTempFile() -> FutureT<Expected<Uri>> override;
    auto fail(std::string const& reason) -> Expected<void> override;
    auto cancel() -> void override;
    auto onPreviewUpdated() -> FutureT<Expected<void>> override;

    auto tempFilePath() const -> Expected<std::filesystem::path> override;
    auto ensureTempFile() -> Expected<std::filesystem::path> override;

    auto uri() const -> std::optional<Uri> override;
    auto contentUri() const -> std::optional<Uri> override;
    auto hasPath() const -> bool override;
    auto notificationId() const -> NotificationId override;
    auto placeholder() const -> std::optional<PlaceholderSession> override;

    // Progress if the session is Started, std::nullopt otherwise.
    auto activeProgress() const -> std::optional<int>;
    auto activeProgressMessage() const -> std::optional<std::string>;

private:
    using PlaceholderFactory = std::function<Expected<PlaceholderSession>(ManagerContext&)>;

    auto lockContext() const -> Expected<std::shared_ptr<ManagerContext>>;
    auto requireStarted() const -> Expected<void>; // mutex held
    auto start(PlaceholderFactory const& makePlaceholder, std::string progressMessage) -> Expected<void>;
    auto failLocked(ManagerContext& context, std::string const& reason) -> void;
    auto readTempFile() const -> Expected<Bytes>;
    auto failFromBackground(Error const& error, std::string const& reason) -> Error;

    // Bodies of the background tasks.
    auto runFinalizeFromTempFile() -> Expected<Uri>;
    auto runPreviewUpdate() -> Expected<void>;

    std::weak_ptr<ManagerContext> const context;
    std::string const                   title_;

    mutable std::mutex                mutex;
    std::optional<Location>           location_;
    SessionState                      state_          = SessionState::Created;
    int                               progress_       = 0;
    std::string                       progressMessage_;
    NotificationId                    notificationId_ = kUnsetNotificationId;
    std::optional<PlaceholderSession> placeholder_;
    std::optional<Uri>                uri_;
    std::optional<Uri>                contentUri_;
};

} // namespace CS::Detail
