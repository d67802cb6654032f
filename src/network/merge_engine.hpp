#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "network/discovery_backend.hpp"

#include <QObject>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace lanscout::network {

/**
 * MergeEngine - Merges several discovery backends into one server list.
 *
 * The merged map is keyed by (host, port). On conflicting reports the
 * backend with the strictly higher priority() wins; equal or lower priority
 * reports from another backend are discarded. A removal only takes effect
 * when it comes from the backend that owns the merged record.
 *
 * All backend events are applied on the thread this object lives in.
 * Events raised on other threads are queued onto it, so the merged map has
 * a single writer.
 *
 * Every event is stamped with its backend's session number when raised.
 * start(), stop(), pause() and resume() open a new session, and events from
 * an earlier one are dropped on arrival (removals excepted, they can only
 * shrink the view). A queued Added can therefore never land after the
 * backend has been stopped.
 *
 * State machine: Idle -> Scanning (start), Scanning -> Paused (pause),
 * Paused -> Scanning (resume), Scanning/Paused -> Idle (stop).
 */
class MergeEngine : public QObject {
    Q_OBJECT

public:
    enum class Phase {
        Idle,
        Scanning,
        Paused,
    };

    explicit MergeEngine(std::vector<std::unique_ptr<DiscoveryBackend>> backends,
                         QObject* parent = nullptr);
    ~MergeEngine() override;

    /**
     * Clear the merged view and start every backend. No-op unless Idle.
     */
    void start();

    /**
     * Stop every backend. No-op when Idle.
     */
    void stop();

    void pause();
    void resume();

    /**
     * Look up a merged server by key. Has no effect on discovery.
     */
    [[nodiscard]] std::optional<ServerRecord> select_server(const ServerKey& key) const;

    /**
     * The snapshot most recently delivered through stateChanged().
     */
    [[nodiscard]] const MergedState& state() const { return published_; }

    [[nodiscard]] Phase phase() const { return phase_; }

    /**
     * Most recent backend failure of the current session, if any.
     */
    [[nodiscard]] const std::optional<Error>& last_error() const { return last_error_; }

    [[nodiscard]] size_t backend_count() const { return backends_.size(); }

signals:
    void stateChanged(const lanscout::MergedState& state);
    void backendFailed(lanscout::ServerSource source, const lanscout::Error& error);

private:
    struct BackendSlot {
        std::unique_ptr<DiscoveryBackend> backend;
        // Read on whichever thread raises an event.
        std::unique_ptr<std::atomic<quint64>> session;
        bool scanning = false;
        double progress = 0.0;
    };

    struct MergedEntry {
        ServerRecord record;
        size_t owner;
        int priority;
    };

    void wire(size_t index);
    void post(std::function<void()> fn);
    void begin_session();
    [[nodiscard]] quint64 session_of(size_t index) const;
    [[nodiscard]] bool is_stale(size_t index, quint64 session) const;

    void apply_added(size_t index, ServerRecord record);
    void apply_removed(size_t index, const ServerKey& key);
    void apply_scanning(size_t index, bool scanning);
    void apply_progress(size_t index, double progress);
    void apply_error(size_t index, const Error& error);

    void publish();

    std::vector<BackendSlot> backends_;
    std::unordered_map<ServerKey, MergedEntry> merged_;
    MergedState published_;
    Phase phase_ = Phase::Idle;
    std::optional<Error> last_error_;
    std::atomic<bool> shutting_down_{false};
};

const char* to_string(MergeEngine::Phase phase) noexcept;

} // namespace lanscout::network

Q_DECLARE_METATYPE(lanscout::Error)
Q_DECLARE_METATYPE(lanscout::ServerSource)
