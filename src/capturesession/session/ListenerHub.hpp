#pragma once

#include <capturesession/SessionListener.hpp>
#include <capturesession/core/Types.hpp>
#include <capturesession/task/Executor.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace CS::Detail {

struct SessionEvent {
    enum class Kind {
        Queued,
        Progress,
        Done,
        Failed,
        Updated
    };

    Kind        kind;
    Uri         uri;
    int         percent = 0;
    std::string reason;

    static auto queued(Uri uri) -> SessionEvent { return {Kind::Queued, std::move(uri)}; }
    static auto progress(Uri uri, int percent) -> SessionEvent { return {Kind::Progress, std::move(uri), percent}; }
    static auto done(Uri uri) -> SessionEvent { return {Kind::Done, std::move(uri)}; }
    static auto failed(Uri uri, std::string reason) -> SessionEvent {
        return {Kind::Failed, std::move(uri), 0, std::move(reason)};
    }
    static auto updated(Uri uri) -> SessionEvent { return {Kind::Updated, std::move(uri)}; }
};

auto sessionEventKindToString(SessionEvent::Kind kind) -> std::string_view;

/**
 * Listener set plus ordered event fan-out.
 *
 * publish() snapshots the listener set and hands the event to the delivery
 * executor, which must run tasks one at a time in submission order. The
 * listener lock is held only while copying the set, never during delivery, so
 * add/remove never wait on a slow listener and a listener may add or remove
 * listeners from inside a callback.
 */
class ListenerHub {
public:
    explicit ListenerHub(Executor& delivery);

    // Adding a listener that is already present has no effect.
    auto addListener(std::shared_ptr<SessionListener> const& listener) -> void;
    auto removeListener(std::shared_ptr<SessionListener> const& listener) -> void;
    auto listenerCount() const -> std::size_t;

    auto publish(SessionEvent event) -> void;

private:
    using Listeners = std::vector<std::weak_ptr<SessionListener>>;

    static auto deliver(SessionEvent const& event, Listeners const& listeners) -> void;

    Executor&          delivery;
    Listeners          listeners;
    mutable std::mutex listenersMutex;
};

} // namespace CS::Detail
