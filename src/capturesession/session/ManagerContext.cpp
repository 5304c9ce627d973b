#include "session/ManagerContext.hpp"

namespace CS::Detail {

ManagerContext::ManagerContext(CaptureSessionOptions                          options,
                               std::shared_ptr<PlaceholderManager>            placeholders,
                               std::shared_ptr<ProcessingNotificationManager> notifications,
                               std::shared_ptr<MediaSaver>                    mediaSaver,
                               std::shared_ptr<SessionStorageManager>         storage,
                               std::shared_ptr<ImageInspector>                inspector)
    : options{std::move(options)}
    , placeholders{std::move(placeholders)}
    , notifications{std::move(notifications)}
    , mediaSaver{std::move(mediaSaver)}
    , storage{std::move(storage)}
    , inspector{std::move(inspector)}
    , delivery{this->options.delivery_thread_name}
    , background{this->options.background_thread_name, this->options.background_queue_capacity}
    , listeners{delivery} {}

ManagerContext::~ManagerContext() {
    shutdown();
}

auto ManagerContext::waitUntilIdle() -> void {
    // Background work may publish events, so it has to settle first.
    background.waitIdle();
    delivery.waitIdle();
}

auto ManagerContext::shutdown() -> void {
    background.shutdown();
    delivery.shutdown();
}

} // namespace CS::Detail
