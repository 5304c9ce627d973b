#include "session/ListenerHub.hpp"

#include <capturesession/core/Error.hpp>
#include <capturesession/log/TaggedLogger.hpp>
#include <capturesession/task/Task.hpp>

#include <algorithm>
#include <exception>

namespace CS::Detail {

namespace {

auto sameListener(std::weak_ptr<SessionListener> const& held, std::shared_ptr<SessionListener> const& listener) -> bool {
    return !held.owner_before(listener) && !listener.owner_before(held);
}

} // namespace

auto sessionEventKindToString(SessionEvent::Kind kind) -> std::string_view {
    switch (kind) {
    case SessionEvent::Kind::Queued:
        return "queued";
    case SessionEvent::Kind::Progress:
        return "progress";
    case SessionEvent::Kind::Done:
        return "done";
    case SessionEvent::Kind::Failed:
        return "failed";
    case SessionEvent::Kind::Updated:
        return "updated";
    }
    return "unknown";
}

ListenerHub::ListenerHub(Executor& delivery)
    : delivery{delivery} {}

auto ListenerHub::addListener(std::shared_ptr<SessionListener> const& listener) -> void {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(listenersMutex);
    // Drop listeners that died without being removed.
    std::erase_if(listeners, [](auto const& held) { return held.expired(); });
    auto present = std::any_of(listeners.begin(), listeners.end(), [&](auto const& held) { return sameListener(held, listener); });
    if (!present) {
        listeners.emplace_back(listener);
    }
}

auto ListenerHub::removeListener(std::shared_ptr<SessionListener> const& listener) -> void {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(listenersMutex);
    std::erase_if(listeners, [&](auto const& held) { return held.expired() || sameListener(held, listener); });
}

auto ListenerHub::listenerCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(listenersMutex);
    return static_cast<std::size_t>(
            std::count_if(listeners.begin(), listeners.end(), [](auto const& held) { return !held.expired(); }));
}

auto ListenerHub::publish(SessionEvent event) -> void {
    Listeners snapshot;
    {
        std::lock_guard<std::mutex> lock(listenersMutex);
        snapshot = listeners;
    }
    auto const label = std::string{"deliver:"} + std::string{sessionEventKindToString(event.kind)};
    auto task = Task::Create(label, [event = std::move(event), snapshot = std::move(snapshot)] { deliver(event, snapshot); });
    if (auto error = delivery.submit(std::move(task))) {
        cs_log("Dropping " + label + " event: " + describeError(*error), "ListenerHub", "Warning");
    }
}

auto ListenerHub::deliver(SessionEvent const& event, Listeners const& listeners) -> void {
    for (auto const& held : listeners) {
        auto listener = held.lock();
        if (!listener) {
            continue;
        }
        try {
            switch (event.kind) {
            case SessionEvent::Kind::Queued:
                listener->onSessionQueued(event.uri);
                break;
            case SessionEvent::Kind::Progress:
                listener->onSessionProgress(event.uri, event.percent);
                break;
            case SessionEvent::Kind::Done:
                listener->onSessionDone(event.uri);
                break;
            case SessionEvent::Kind::Failed:
                listener->onSessionFailed(event.uri, event.reason);
                break;
            case SessionEvent::Kind::Updated:
                listener->onSessionUpdated(event.uri);
                break;
            }
        } catch (std::exception const& e) {
            cs_log(std::string{"Listener threw on "} + std::string{sessionEventKindToString(event.kind)} + " for " + event.uri
                           + ": " + e.what(),
                   "ListenerHub", "Error");
        }
    }
}

} // namespace CS::Detail
