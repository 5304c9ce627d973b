#pragma once

#include <capturesession/core/Options.hpp>
#include <capturesession/providers/ImageInspector.hpp>
#include <capturesession/providers/MediaSaver.hpp>
#include <capturesession/providers/PlaceholderManager.hpp>
#include <capturesession/providers/ProcessingNotificationManager.hpp>
#include <capturesession/providers/SessionStorageManager.hpp>
#include <capturesession/task/SerialExecutor.hpp>

#include "session/ErrorMessageStore.hpp"
#include "session/ListenerHub.hpp"
#include "session/SessionRegistry.hpp"

#include <memory>

namespace CS::Detail {

/**
 * State shared by a manager and the sessions it created.
 *
 * The manager holds the only strong reference; sessions hold a weak_ptr and
 * treat an expired context as a closed manager. shutdown() drains the
 * background queue before the delivery queue so events published by
 * background work are still delivered.
 */
struct ManagerContext {
    ManagerContext(CaptureSessionOptions                          options,
                   std::shared_ptr<PlaceholderManager>            placeholders,
                   std::shared_ptr<ProcessingNotificationManager> notifications,
                   std::shared_ptr<MediaSaver>                    mediaSaver,
                   std::shared_ptr<SessionStorageManager>         storage,
                   std::shared_ptr<ImageInspector>                inspector);
    ~ManagerContext();

    ManagerContext(ManagerContext const&)            = delete;
    ManagerContext& operator=(ManagerContext const&) = delete;

    auto waitUntilIdle() -> void;
    auto shutdown() -> void;

    CaptureSessionOptions const                          options;
    std::shared_ptr<PlaceholderManager> const            placeholders;
    std::shared_ptr<ProcessingNotificationManager> const notifications;
    std::shared_ptr<MediaSaver> const                    mediaSaver;
    std::shared_ptr<SessionStorageManager> const         storage;
    std::shared_ptr<ImageInspector> const                inspector;

    SerialExecutor    delivery;
    SerialExecutor    background;
    ListenerHub       listeners;
    SessionRegistry   registry;
    ErrorMessageStore errors;
};

} // namespace CS::Detail
