#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <functional>

namespace lanscout::network {

/**
 * DiscoveryBackend - Abstract interface for one discovery transport.
 *
 * Implementations: MulticastReceiver (UDP announcements) and the platform
 * mDNS browser. A backend reports what it sees through the callbacks below;
 * it never touches another component's state. Callbacks may be invoked from
 * a thread other than the one that called start().
 *
 * Progress convention: 0.0 while idle or starting, 0.5 once the transport is
 * ready, 1.0 once at least one server has been produced.
 */
class DiscoveryBackend {
public:
    virtual ~DiscoveryBackend() = default;

    /**
     * Start discovering. No-op (returning ok) if already running.
     * On failure the backend stays stopped and on_error is also invoked.
     */
    virtual Result<void, Error> start() = 0;

    /**
     * Stop discovering and drop all tracked state. Safe when not running.
     */
    virtual void stop() = 0;

    /**
     * Coarse pause: stop() that remembers the caller wanted a pause.
     */
    virtual void pause() = 0;

    /**
     * Undo pause(): start() again.
     */
    virtual Result<void, Error> resume() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;
    [[nodiscard]] virtual bool is_paused() const = 0;

    /**
     * Rank used to resolve conflicting reports of the same ServerKey.
     * Higher wins.
     */
    [[nodiscard]] virtual int priority() const = 0;

    /**
     * Tag stamped on every record this backend produces.
     */
    [[nodiscard]] virtual ServerSource source() const = 0;

    // Callbacks
    std::function<void(ServerRecord)> on_server_added;
    std::function<void(ServerKey)> on_server_removed;
    std::function<void(bool)> on_scanning_changed;
    std::function<void(double)> on_progress_changed;
    std::function<void(Error)> on_error;
};

} // namespace lanscout::network
