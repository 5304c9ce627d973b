#include "session/CaptureSessionImpl.hpp"
#include "session/ManagerContext.hpp"

#include <capturesession/log/TaggedLogger.hpp>
#include <capturesession/task/TaskT.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <system_error>

namespace CS::Detail {

namespace fs = std::filesystem;

namespace {

// Titles become directory and file names, so they must be one plain path component.
auto isSafePathComponent(std::string const& name) -> bool {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of(std::string{"/\\\0", 3}) == std::string::npos;
}

} // namespace

CaptureSessionImpl::CaptureSessionImpl(std::weak_ptr<ManagerContext> context, std::string title, std::optional<Location> location)
    : context{std::move(context)}
    , title_{std::move(title)}
    , location_{std::move(location)} {}

auto CaptureSessionImpl::title() const -> std::string const& {
    return title_;
}

auto CaptureSessionImpl::location() const -> std::optional<Location> {
    std::lock_guard<std::mutex> lock(mutex);
    return location_;
}

auto CaptureSessionImpl::setLocation(std::optional<Location> location) -> void {
    std::lock_guard<std::mutex> lock(mutex);
    location_ = std::move(location);
}

auto CaptureSessionImpl::state() const -> SessionState {
    std::lock_guard<std::mutex> lock(mutex);
    return state_;
}

auto CaptureSessionImpl::lockContext() const -> Expected<std::shared_ptr<ManagerContext>> {
    if (auto locked = context.lock()) {
        return locked;
    }
    return std::unexpected(Error{Error::Code::SessionClosed, "capture session manager has been destroyed"});
}

auto CaptureSessionImpl::requireStarted() const -> Expected<void> {
    if (state_ == SessionState::Started) {
        return {};
    }
    if (state_ == SessionState::Created) {
        return std::unexpected(Error{Error::Code::NotStarted, "session '" + title_ + "' has not been started"});
    }
    return std::unexpected(Error{Error::Code::SessionClosed,
                                 "session '" + title_ + "' is " + std::string{sessionStateToString(state_)}});
}

auto CaptureSessionImpl::startSession(Bytes const& seed, std::string progressMessage) -> Expected<void> {
    return start(
            [this, &seed](ManagerContext& ctx) {
                return ctx.placeholders->insertPlaceholder(title_, seed, std::chrono::system_clock::now());
            },
            std::move(progressMessage));
}

auto CaptureSessionImpl::startSessionFromUri(Uri const& existing, std::string progressMessage) -> Expected<void> {
    return start([&existing](ManagerContext& ctx) { return ctx.placeholders->convertToPlaceholder(existing); },
                 std::move(progressMessage));
}

auto CaptureSessionImpl::start(PlaceholderFactory const& makePlaceholder, std::string progressMessage) -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex);
    if (state_ != SessionState::Created) {
        cs_log("startSession called twice on '" + title_ + "'", "CaptureSession", "Error");
        return std::unexpected(Error{Error::Code::AlreadyStarted, "startSession cannot be called a second time"});
    }
    auto ctx = lockContext();
    if (!ctx) {
        return std::unexpected(ctx.error());
    }
    auto& context = **ctx;

    auto placeholder = makePlaceholder(context);
    if (!placeholder) {
        cs_log("Placeholder allocation failed for '" + title_ + "': " + describeError(placeholder.error()), "CaptureSession", "Error");
        return std::unexpected(placeholder.error());
    }
    Uri const uri = placeholder->outputUri;
    if (uri.empty()) {
        return std::unexpected(Error{Error::Code::PlaceholderFailure, "placeholder for '" + title_ + "' has no output uri"});
    }
    if (!context.registry.insert(uri, shared_from_this())) {
        return std::unexpected(Error{Error::Code::DuplicateIdentifier, "a started session already uses " + uri});
    }

    progressMessage_ = std::move(progressMessage);
    notificationId_  = context.notifications->notifyStart(progressMessage_);
    placeholder_     = std::move(*placeholder);
    uri_             = uri;
    state_           = SessionState::Started;
    cs_log("Session '" + title_ + "' started as " + uri, "CaptureSession");
    context.listeners.publish(SessionEvent::queued(uri));
    return {};
}

auto CaptureSessionImpl::setProgress(int percent) -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex);
    if (auto started = requireStarted(); !started) {
        return started;
    }
    auto ctx = lockContext();
    if (!ctx) {
        return std::unexpected(ctx.error());
    }
    progress_ = std::clamp(percent, 0, 100);
    (*ctx)->notifications->setProgress(progress_, notificationId_);
    (*ctx)->listeners.publish(SessionEvent::progress(*uri_, progress_));
    return {};
}

auto CaptureSessionImpl::progress() const -> int {
    std::lock_guard<std::mutex> lock(mutex);
    return progress_;
}

auto CaptureSessionImpl::progressMessage() const -> std::string {
    std::lock_guard<std::mutex> lock(mutex);
    return progressMessage_;
}

auto CaptureSessionImpl::setProgressMessage(std::string const& message) -> void {
    std::lock_guard<std::mutex> lock(mutex);
    progressMessage_ = message;
    if (state_ != SessionState::Started) {
        return;
    }
    if (auto ctx = lockContext()) {
        (*ctx)->notifications->setStatus(progressMessage_, notificationId_);
    }
}

auto CaptureSessionImpl::finalize(Bytes const&                        bytes,
                                  int                                 width,
                                  int                                 height,
                                  int                                 orientation,
                                  std::optional<ImageMetadata> const& metadata) -> Expected<Uri> {
    std::lock_guard<std::mutex> lock(mutex);
    if (auto started = requireStarted(); !started) {
        return std::unexpected(started.error());
    }
    auto ctx = lockContext();
    if (!ctx) {
        return std::unexpected(ctx.error());
    }
    auto& context = **ctx;

    auto finalUri = context.placeholders->finishPlaceholder(*placeholder_,
                                                            location_,
                                                            orientation,
                                                            metadata,
                                                            bytes,
                                                            width,
                                                            height,
                                                            context.options.mime_type);
    if (!finalUri) {
        failLocked(context, describeError(finalUri.error()));
        return std::unexpected(finalUri.error());
    }

    contentUri_ = *finalUri;
    context.notifications->notifyCompletion(notificationId_);
    context.registry.remove(*uri_, this);
    state_ = SessionState::Done;
    cs_log("Session " + *uri_ + " saved as " + *contentUri_, "CaptureSession");
    context.listeners.publish(SessionEvent::done(*contentUri_));
    return *contentUri_;
}

auto CaptureSessionImpl::fail(std::string const& reason) -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex);
    if (auto started = requireStarted(); !started) {
        return started;
    }
    auto ctx = lockContext();
    if (!ctx) {
        return std::unexpected(ctx.error());
    }
    failLocked(**ctx, reason);
    return {};
}

auto CaptureSessionImpl::failLocked(ManagerContext& context, std::string const& reason) -> void {
    progressMessage_ = reason;
    context.notifications->notifyCompletion(notificationId_);
    context.registry.remove(*uri_, this);
    Uri const key = contentUri_.value_or(placeholder_->outputUri);
    context.errors.put(key, reason);
    state_ = SessionState::Failed;
    cs_log("Session " + key + " failed: " + reason, "CaptureSession", "Warning");
    context.listeners.publish(SessionEvent::failed(key, reason));
}

auto CaptureSessionImpl::cancel() -> void {
    std::lock_guard<std::mutex> lock(mutex);
    if (state_ != SessionState::Started) {
        return;
    }
    if (auto ctx = lockContext()) {
        (*ctx)->registry.remove(*uri_, this);
    }
    state_ = SessionState::Cancelled;
    cs_log("Session " + *uri_ + " cancelled", "CaptureSession");
}

auto CaptureSessionImpl::tempFilePath() const -> Expected<fs::path> {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!uri_) {
            return std::unexpected(Error{Error::Code::NotStarted, "cannot resolve the temp file of a session that has not been started"});
        }
    }
    if (!isSafePathComponent(title_)) {
        return std::unexpected(Error{Error::Code::InvalidTitle, "session title '" + title_ + "' cannot name a temp file"});
    }
    auto ctx = lockContext();
    if (!ctx) {
        return std::unexpected(ctx.error());
    }
    auto directory = (*ctx)->storage->resolveSessionDirectory((*ctx)->options.temp_sessions_directory);
    if (!directory) {
        return std::unexpected(directory.error());
    }
    return *directory / title_ / (title_ + (*ctx)->options.temp_file_extension);
}

auto CaptureSessionImpl::ensureTempFile() -> Expected<fs::path> {
    auto path = tempFilePath();
    if (!path) {
        return path;
    }
    auto ctx = lockContext();
    if (!ctx) {
        return std::unexpected(ctx.error());
    }
    auto directory = (*ctx)->storage->getSessionDirectory((*ctx)->options.temp_sessions_directory);
    if (!directory) {
        cs_log("Could not get temp session directory: " + describeError(directory.error()), "CaptureSession", "Error");
        return std::unexpected(directory.error());
    }
    std::error_code ec;
    fs::create_directories(path->parent_path(), ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::StorageUnavailable,
                                     "could not create " + path->parent_path().string() + ": " + ec.message()});
    }
    if (!fs::exists(*path, ec)) {
        std::ofstream out(*path, std::ios::binary);
        if (!out) {
            return std::unexpected(Error{Error::Code::StorageUnavailable, "could not create temp file " + path->string()});
        }
    }
    return path;
}

auto CaptureSessionImpl::readTempFile() const -> Expected<Bytes> {
    auto path = tempFilePath();
    if (!path) {
        return std::unexpected(Error{Error::Code::TempFileReadFailure, describeError(path.error())});
    }
    std::ifstream in(*path, std::ios::binary);
    if (!in) {
        return std::unexpected(Error{Error::Code::TempFileReadFailure, "could not open " + path->string()});
    }
    Bytes bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return std::unexpected(Error{Error::Code::TempFileReadFailure, "could not read " + path->string()});
    }
    return bytes;
}

auto CaptureSessionImpl::failFromBackground(Error const& error, std::string const& reason) -> Error {
    if (auto failed = fail(reason); !failed) {
        cs_log("Could not fail session '" + title_ + "': " + describeError(failed.error()), "CaptureSession", "Warning");
    }
    return error;
}

auto CaptureSessionImpl::finalizeFromTempFile() -> FutureT<Expected<Uri>> {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (auto started = requireStarted(); !started) {
            return makeReadyFuture<Expected<Uri>>(std::unexpected(started.error()));
        }
    }
    auto ctx = lockContext();
    if (!ctx) {
        return makeReadyFuture<Expected<Uri>>(std::unexpected(ctx.error()));
    }
    auto self = shared_from_this();
    auto task = TaskT<Uri>::Create("finalizeFromTempFile:" + title_, [self] { return self->runFinalizeFromTempFile(); });
    if (auto refused = (*ctx)->background.submit(task->task())) {
        cs_log("Finalization of '" + title_ + "' refused: " + describeError(*refused), "CaptureSession", "Error");
        return makeReadyFuture<Expected<Uri>>(
                std::unexpected(failFromBackground(*refused, "Could not schedule finalization: " + describeError(*refused))));
    }
    return task->future();
}

auto CaptureSessionImpl::runFinalizeFromTempFile() -> Expected<Uri> {
    auto ctx = lockContext();
    if (!ctx) {
        return std::unexpected(ctx.error());
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (auto started = requireStarted(); !started) {
            // Cancelled or finished while queued; nothing to do.
            return std::unexpected(started.error());
        }
    }

    auto bytes = readTempFile();
    if (!bytes) {
        return std::unexpected(failFromBackground(bytes.error(), "Could not read temp file: " + describeError(bytes.error())));
    }
    auto bounds = (*ctx)->inspector->decodeBounds(*bytes);
    if (!bounds) {
        return std::unexpected(failFromBackground(bounds.error(), "Could not decode temp file: " + describeError(bounds.error())));
    }

    std::optional<ImageMetadata> metadata;
    if (auto read = (*ctx)->inspector->readMetadata(*bytes)) {
        metadata = std::move(*read);
    } else {
        cs_log("Could not read exif for '" + title_ + "': " + describeError(read.error()), "CaptureSession", "Warning");
    }
    int const orientation = metadata ? metadata->orientation : 0;
    return finalize(*bytes, bounds->width, bounds->height, orientation, metadata);
}

auto CaptureSessionImpl::onPreviewUpdated() -> FutureT<Expected<void>> {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (auto started = requireStarted(); !started) {
            return makeReadyFuture<Expected<void>>(std::unexpected(started.error()));
        }
    }
    auto ctx = lockContext();
    if (!ctx) {
        return makeReadyFuture<Expected<void>>(std::unexpected(ctx.error()));
    }
    auto self = shared_from_this();
    auto task = TaskT<void>::Create("previewUpdate:" + title_, [self] { return self->runPreviewUpdate(); });
    return task->schedule((*ctx)->background);
}

auto CaptureSessionImpl::runPreviewUpdate() -> Expected<void> {
    auto ctx = lockContext();
    if (!ctx) {
        return std::unexpected(ctx.error());
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (auto started = requireStarted(); !started) {
            return started;
        }
    }

    auto bytes = readTempFile();
    if (!bytes) {
        return std::unexpected(failFromBackground(bytes.error(), "Could not read temp file: " + describeError(bytes.error())));
    }
    // A preview written mid-update may not parse yet; the next update will retry.
    auto bounds = (*ctx)->inspector->decodeBounds(*bytes);
    if (!bounds) {
        cs_log("Skipping preview update for '" + title_ + "': " + describeError(bounds.error()), "CaptureSession", "Warning");
        return std::unexpected(bounds.error());
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (auto started = requireStarted(); !started) {
        return started;
    }
    auto replaced = (*ctx)->placeholders->replacePlaceholder(*placeholder_, *bytes, bounds->width, bounds->height);
    if (!replaced) {
        cs_log("Preview replacement failed for " + *uri_ + ": " + describeError(replaced.error()), "CaptureSession", "Warning");
        return replaced;
    }
    (*ctx)->listeners.publish(SessionEvent::updated(placeholder_->outputUri));
    return {};
}

auto CaptureSessionImpl::uri() const -> std::optional<Uri> {
    std::lock_guard<std::mutex> lock(mutex);
    return uri_;
}

auto CaptureSessionImpl::contentUri() const -> std::optional<Uri> {
    std::lock_guard<std::mutex> lock(mutex);
    return contentUri_;
}

auto CaptureSessionImpl::hasPath() const -> bool {
    std::lock_guard<std::mutex> lock(mutex);
    return uri_.has_value();
}

auto CaptureSessionImpl::notificationId() const -> NotificationId {
    std::lock_guard<std::mutex> lock(mutex);
    return notificationId_;
}

auto CaptureSessionImpl::placeholder() const -> std::optional<PlaceholderSession> {
    std::lock_guard<std::mutex> lock(mutex);
    return placeholder_;
}

auto CaptureSessionImpl::activeProgress() const -> std::optional<int> {
    std::lock_guard<std::mutex> lock(mutex);
    if (state_ != SessionState::Started) {
        return std::nullopt;
    }
    return progress_;
}

auto CaptureSessionImpl::activeProgressMessage() const -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(mutex);
    if (state_ != SessionState::Started) {
        return std::nullopt;
    }
    return progressMessage_;
}

} // namespace CS::Detail
