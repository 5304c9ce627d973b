#include <capturesession/CaptureSessionManager.hpp>
#include <capturesession/image/JpegImageInspector.hpp>
#include <capturesession/log/TaggedLogger.hpp>

#include "session/CaptureSessionImpl.hpp"
#include "session/ManagerContext.hpp"

namespace CS {

auto CaptureSessionManager::Create(CaptureSessionProviders providers, CaptureSessionOptions options)
        -> Expected<std::unique_ptr<CaptureSessionManager>> {
    if (!providers.placeholders || !providers.notifications || !providers.mediaSaver || !providers.storage) {
        return std::unexpected(Error{Error::Code::InvalidError, "every capture session provider must be set"});
    }
    if (auto valid = validateOptions(options); !valid) {
        return std::unexpected(valid.error());
    }
    if (!providers.inspector) {
        providers.inspector = std::make_shared<JpegImageInspector>();
    }
    auto context = std::make_shared<Detail::ManagerContext>(std::move(options),
                                                            std::move(providers.placeholders),
                                                            std::move(providers.notifications),
                                                            std::move(providers.mediaSaver),
                                                            std::move(providers.storage),
                                                            std::move(providers.inspector));
    cs_log("CaptureSessionManager created", "CaptureSessionManager");
    return std::unique_ptr<CaptureSessionManager>(new CaptureSessionManager(std::move(context)));
}

CaptureSessionManager::CaptureSessionManager(std::shared_ptr<Detail::ManagerContext> context)
    : context{std::move(context)} {}

CaptureSessionManager::~CaptureSessionManager() {
    this->shutdown();
}

auto CaptureSessionManager::createSession(std::string title, std::optional<Location> location)
        -> std::shared_ptr<CaptureSession> {
    return std::make_shared<Detail::CaptureSessionImpl>(this->context, std::move(title), std::move(location));
}

auto CaptureSessionManager::createAnonymousSession() -> std::shared_ptr<CaptureSession> {
    return this->createSession(std::string{}, std::nullopt);
}

auto CaptureSessionManager::saveImage(Bytes const&                          bytes,
                                      std::string const&                    title,
                                      std::chrono::system_clock::time_point date,
                                      std::optional<Location> const&        location,
                                      int                                   width,
                                      int                                   height,
                                      int                                   orientation,
                                      std::optional<ImageMetadata> const&   metadata,
                                      OnMediaSavedListener                  listener) -> void {
    this->context->mediaSaver->addImage(bytes, title, date, location, width, height, orientation, metadata, std::move(listener));
}

auto CaptureSessionManager::addSessionListener(std::shared_ptr<SessionListener> const& listener) -> void {
    this->context->listeners.addListener(listener);
}

auto CaptureSessionManager::removeSessionListener(std::shared_ptr<SessionListener> const& listener) -> void {
    this->context->listeners.removeListener(listener);
}

auto CaptureSessionManager::getSessionProgress(Uri const& uri) const -> int {
    if (auto session = this->context->registry.find(uri)) {
        return session->activeProgress().value_or(kUnknownProgress);
    }
    return kUnknownProgress;
}

auto CaptureSessionManager::getSessionProgressMessage(Uri const& uri) const -> Expected<std::string> {
    if (auto session = this->context->registry.find(uri)) {
        if (auto message = session->activeProgressMessage()) {
            return *message;
        }
    }
    return std::unexpected(Error{Error::Code::UnknownSession, "no started session for " + uri});
}

auto CaptureSessionManager::getSessionDirectory(std::string const& subDirectory) -> Expected<std::filesystem::path> {
    auto directory = this->context->storage->getSessionDirectory(subDirectory);
    if (!directory && directory.error().code != Error::Code::StorageUnavailable) {
        return std::unexpected(Error{Error::Code::StorageUnavailable, describeError(directory.error())});
    }
    return directory;
}

auto CaptureSessionManager::hasErrorMessage(Uri const& uri) const -> bool {
    return this->context->errors.has(uri);
}

auto CaptureSessionManager::getErrorMessage(Uri const& uri) const -> std::optional<std::string> {
    return this->context->errors.get(uri);
}

auto CaptureSessionManager::removeErrorMessage(Uri const& uri) -> void {
    this->context->errors.clear(uri);
}

auto CaptureSessionManager::activeSessionCount() const -> std::size_t {
    return this->context->registry.size();
}

auto CaptureSessionManager::snapshot() const -> nlohmann::json {
    auto sessions = nlohmann::json::array();
    for (auto const& session : this->context->registry.sessions()) {
        sessions.push_back({{"uri", session->uri().value_or(Uri{})},
                            {"title", session->title()},
                            {"progress", session->progress()},
                            {"message", session->progressMessage()},
                            {"state", std::string{sessionStateToString(session->state())}}});
    }
    auto errors = nlohmann::json::object();
    for (auto const& [uri, reason] : this->context->errors.entries()) {
        errors[uri] = reason;
    }
    return nlohmann::json{{"active_sessions", std::move(sessions)},
                          {"error_messages", std::move(errors)},
                          {"options", optionsToJson(this->context->options)}};
}

auto CaptureSessionManager::waitUntilIdle() -> void {
    this->context->waitUntilIdle();
}

auto CaptureSessionManager::shutdown() -> void {
    this->context->shutdown();
}

auto CaptureSessionManager::options() const -> CaptureSessionOptions const& {
    return this->context->options;
}

} // namespace CS
