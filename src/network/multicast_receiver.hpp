#pragma once

#include "network/discovery_backend.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QObject>
#include <QAbstractSocket>

#include <chrono>
#include <functional>
#include <memory>
#include <unordered_map>

class QUdpSocket;
class QTimer;

namespace lanscout::network {

/**
 * UDP multicast announcement receiver.
 *
 * Listens on 239.255.255.250:12345 for JSON announcements and keeps one
 * presence entry per (host, port). Entries not refreshed for longer than
 * kStaleTimeout are evicted by a sweep running every kSweepInterval.
 *
 * Both the socket notifications and the sweep timer are delivered by the
 * event loop of the thread this object lives in, so the presence map is
 * only ever touched from that thread.
 */
class MulticastReceiver : public QObject, public DiscoveryBackend {
    Q_OBJECT

public:
    using Clock = std::function<std::chrono::milliseconds()>;

    static constexpr const char* kGroupAddress = "239.255.255.250";
    static constexpr quint16 kPort = 12345;
    static constexpr std::chrono::milliseconds kStaleTimeout{30'000};
    static constexpr std::chrono::milliseconds kSweepInterval{10'000};
    static constexpr int kPriority = 0;

    /**
     * @param clock monotonic time source; defaults to std::chrono::steady_clock.
     */
    explicit MulticastReceiver(Clock clock = {}, QObject* parent = nullptr);
    ~MulticastReceiver() override;

    Result<void, Error> start() override;
    void stop() override;
    void pause() override;
    Result<void, Error> resume() override;

    [[nodiscard]] bool is_running() const override { return running_; }
    [[nodiscard]] bool is_paused() const override { return paused_; }
    [[nodiscard]] int priority() const override { return kPriority; }
    [[nodiscard]] ServerSource source() const override { return ServerSource::Multicast; }

    /**
     * Feed one datagram through the receive path. Returns false if it was
     * dropped (receiver not running, or payload failed to decode).
     */
    bool ingest(const QByteArray& datagram);

    /**
     * Evict every entry whose last sighting is older than kStaleTimeout.
     * Runs on the sweep timer; public so eviction can be driven directly.
     */
    void sweep();

    [[nodiscard]] size_t tracked_count() const { return presence_.size(); }
    [[nodiscard]] quint64 dropped_datagram_count() const { return dropped_; }
    [[nodiscard]] double progress() const { return progress_; }

protected:
    // Transport seam. The default implementation binds a QUdpSocket and joins
    // the multicast group; it must leave no socket behind on failure.
    virtual Result<void, Error> open_transport();
    virtual void close_transport();

private slots:
    void onReadyRead();
    void onSocketError(QAbstractSocket::SocketError error);

private:
    struct PresenceEntry {
        ServerRecord record;
        std::chrono::milliseconds last_seen;
    };

    void set_progress(double value);
    void set_scanning(bool value);
    void report_error(const Error& error);

    Clock clock_;
    std::unique_ptr<QUdpSocket> socket_;
    std::unique_ptr<QTimer> sweep_timer_;
    const QHostAddress group_;

    bool running_ = false;
    bool paused_ = false;
    bool socket_error_reported_ = false;
    double progress_ = 0.0;
    quint64 dropped_ = 0;

    std::unordered_map<ServerKey, PresenceEntry> presence_;
};

} // namespace lanscout::network
