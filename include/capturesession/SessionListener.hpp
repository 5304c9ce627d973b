#pragma once

#include <capturesession/core/Types.hpp>

#include <string>

namespace CS {

/**
 * SessionListener: observer of capture session lifecycle events.
 *
 * All callbacks are invoked on the manager's delivery thread, one at a time,
 * so implementations do not need to be thread-safe. Callbacks should return
 * quickly; a slow listener delays every later event.
 */
struct SessionListener {
    virtual ~SessionListener() = default;

    virtual void onSessionQueued(Uri const& /*uri*/) {}
    virtual void onSessionProgress(Uri const& /*uri*/, int /*percent*/) {}
    virtual void onSessionDone(Uri const& /*uri*/) {}
    virtual void onSessionFailed(Uri const& /*uri*/, std::string const& /*reason*/) {}
    virtual void onSessionUpdated(Uri const& /*uri*/) {}
};

} // namespace CS
