#include "network/merge_engine.hpp"

#include "core/logging.hpp"

#include <QMetaObject>
#include <QThread>

#include <algorithm>

namespace lanscout::network {

const char* to_string(MergeEngine::Phase phase) noexcept {
    switch (phase) {
        case MergeEngine::Phase::Idle: return "idle";
        case MergeEngine::Phase::Scanning: return "scanning";
        case MergeEngine::Phase::Paused: return "paused";
    }
    return "unknown";
}

MergeEngine::MergeEngine(std::vector<std::unique_ptr<DiscoveryBackend>> backends,
                         QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<lanscout::MergedState>();
    qRegisterMetaType<lanscout::Error>();
    qRegisterMetaType<lanscout::ServerSource>();

    backends_.reserve(backends.size());
    for (auto& backend : backends) {
        if (!backend) continue;
        backends_.push_back(BackendSlot{std::move(backend),
                                        std::make_unique<std::atomic<quint64>>(0)});
        wire(backends_.size() - 1);
    }
}

MergeEngine::~MergeEngine() {
    // Events raised while the backends wind down are dropped by post().
    shutting_down_ = true;
    for (auto& slot : backends_) {
        slot.backend->stop();
    }
    // Stopped backends raise nothing more, so the callbacks can go.
    for (auto& slot : backends_) {
        slot.backend->on_server_added = nullptr;
        slot.backend->on_server_removed = nullptr;
        slot.backend->on_scanning_changed = nullptr;
        slot.backend->on_progress_changed = nullptr;
        slot.backend->on_error = nullptr;
    }
}

void MergeEngine::wire(size_t index) {
    auto& backend = *backends_[index].backend;

    backend.on_server_added = [this, index](ServerRecord record) {
        const auto session = session_of(index);
        post([this, index, session, record = std::move(record)]() mutable {
            if (is_stale(index, session)) {
                qCDebug(lanscoutMergeLog).noquote()
                    << "Dropping stale report for" << record.display_name();
                return;
            }
            apply_added(index, std::move(record));
        });
    };
    backend.on_server_removed = [this, index](ServerKey key) {
        post([this, index, key = std::move(key)]() { apply_removed(index, key); });
    };
    backend.on_scanning_changed = [this, index](bool scanning) {
        const auto session = session_of(index);
        post([this, index, session, scanning]() {
            if (!is_stale(index, session)) apply_scanning(index, scanning);
        });
    };
    backend.on_progress_changed = [this, index](double progress) {
        const auto session = session_of(index);
        post([this, index, session, progress]() {
            if (!is_stale(index, session)) apply_progress(index, progress);
        });
    };
    backend.on_error = [this, index](Error error) {
        const auto session = session_of(index);
        post([this, index, session, error = std::move(error)]() {
            if (is_stale(index, session)) {
                qCDebug(lanscoutMergeLog) << "Dropping stale error:"
                                          << QString::fromStdString(error.message);
                return;
            }
            apply_error(index, error);
        });
    };
}

quint64 MergeEngine::session_of(size_t index) const {
    return backends_[index].session->load();
}

bool MergeEngine::is_stale(size_t index, quint64 session) const {
    return session != session_of(index);
}

void MergeEngine::begin_session() {
    for (auto& slot : backends_) {
        slot.session->fetch_add(1);
    }
}

void MergeEngine::post(std::function<void()> fn) {
    if (shutting_down_) {
        return;
    }
    if (QThread::currentThread() == thread()) {
        fn();
        return;
    }
    // Queued onto our thread; dropped by Qt if we are destroyed first.
    QMetaObject::invokeMethod(this, std::move(fn), Qt::QueuedConnection);
}

void MergeEngine::start() {
    if (phase_ != Phase::Idle) {
        return;
    }

    qCInfo(lanscoutMergeLog) << "Starting discovery with" << backends_.size() << "backend(s)";

    merged_.clear();
    last_error_.reset();
    for (auto& slot : backends_) {
        slot.scanning = false;
        slot.progress = 0.0;
    }
    phase_ = Phase::Scanning;
    begin_session();

    for (auto& slot : backends_) {
        auto started = slot.backend->start();
        if (started.is_err()) {
            // Already delivered through on_error.
            qCDebug(lanscoutMergeLog) << to_string(slot.backend->source())
                                      << "backend did not start";
        }
    }

    publish();
}

void MergeEngine::stop() {
    if (phase_ == Phase::Idle) {
        return;
    }

    phase_ = Phase::Idle;
    begin_session();
    for (auto& slot : backends_) {
        slot.backend->stop();
    }
    merged_.clear();

    publish();
    qCInfo(lanscoutMergeLog) << "Discovery stopped";
}

void MergeEngine::pause() {
    if (phase_ != Phase::Scanning) {
        return;
    }

    phase_ = Phase::Paused;
    begin_session();
    for (auto& slot : backends_) {
        slot.backend->pause();
    }
    publish();
}

void MergeEngine::resume() {
    if (phase_ != Phase::Paused) {
        return;
    }

    phase_ = Phase::Scanning;
    begin_session();
    for (auto& slot : backends_) {
        auto resumed = slot.backend->resume();
        if (resumed.is_err()) {
            qCDebug(lanscoutMergeLog) << to_string(slot.backend->source())
                                      << "backend did not resume";
        }
    }
    publish();
}

std::optional<ServerRecord> MergeEngine::select_server(const ServerKey& key) const {
    auto it = merged_.find(key);
    if (it == merged_.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

void MergeEngine::apply_added(size_t index, ServerRecord record) {
    if (phase_ != Phase::Scanning) {
        return;
    }

    const auto& backend = *backends_[index].backend;
    record.source = backend.source();
    const auto key = record.key();
    const int priority = backend.priority();

    auto it = merged_.find(key);
    if (it == merged_.end()) {
        qCInfo(lanscoutMergeLog).noquote() << to_string(record.source) << "discovered:"
                                           << record.display_name();
        merged_.emplace(key, MergedEntry{std::move(record), index, priority});
        publish();
        return;
    }

    auto& entry = it->second;
    if (entry.owner == index || entry.priority < priority) {
        if (entry.owner != index) {
            qCInfo(lanscoutMergeLog).noquote()
                << to_string(record.source) << "overrides" << to_string(entry.record.source)
                << "for" << key.to_string();
        }
        entry.record = std::move(record);
        entry.owner = index;
        entry.priority = priority;
        publish();
        return;
    }

    qCDebug(lanscoutMergeLog).noquote()
        << to_string(record.source) << "duplicate (already found by"
        << to_string(entry.record.source) << "):" << record.display_name();
}

void MergeEngine::apply_removed(size_t index, const ServerKey& key) {
    auto it = merged_.find(key);
    if (it == merged_.end()) {
        return;
    }
    if (it->second.owner != index) {
        qCDebug(lanscoutMergeLog).noquote()
            << to_string(backends_[index].backend->source()) << "removal ignored for"
            << key.to_string() << "- owned by" << to_string(it->second.record.source);
        return;
    }

    qCInfo(lanscoutMergeLog).noquote() << "Server gone:" << it->second.record.display_name();
    merged_.erase(it);
    publish();
}

void MergeEngine::apply_scanning(size_t index, bool scanning) {
    backends_[index].scanning = scanning;
    publish();
}

void MergeEngine::apply_progress(size_t index, double progress) {
    backends_[index].progress = std::clamp(progress, 0.0, 1.0);
    publish();
}

void MergeEngine::apply_error(size_t index, const Error& error) {
    auto& slot = backends_[index];
    slot.scanning = false;
    slot.progress = 0.0;
    last_error_ = error;

    qCWarning(lanscoutMergeLog).noquote()
        << to_string(slot.backend->source()) << "backend failed:"
        << QString::fromStdString(error.message);

    emit backendFailed(slot.backend->source(), error);
    publish();
}

void MergeEngine::publish() {
    MergedState next;
    next.servers.reserve(merged_.size());
    for (const auto& [key, entry] : merged_) {
        next.servers.push_back(entry.record);
    }
    std::sort(next.servers.begin(), next.servers.end(), server_display_less);

    double total = 0.0;
    for (const auto& slot : backends_) {
        next.is_scanning = next.is_scanning || slot.scanning;
        total += slot.progress;
    }
    next.progress = backends_.empty() ? 0.0 : total / static_cast<double>(backends_.size());
    next.is_paused = phase_ == Phase::Paused;

    if (next == published_) {
        return;
    }
    published_ = std::move(next);
    emit stateChanged(published_);
}

} // namespace lanscout::network
