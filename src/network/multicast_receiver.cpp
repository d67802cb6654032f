#include "network/multicast_receiver.hpp"

#include "core/logging.hpp"
#include "network/announcement_codec.hpp"

#include <QTimer>
#include <QUdpSocket>

#include <vector>

namespace lanscout::network {
namespace {

std::chrono::milliseconds steady_now() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch());
}

} // namespace

MulticastReceiver::MulticastReceiver(Clock clock, QObject* parent)
    : QObject(parent)
    , clock_(clock ? std::move(clock) : Clock(steady_now))
    , sweep_timer_(std::make_unique<QTimer>(this))
    , group_(QString::fromLatin1(kGroupAddress))
{
    sweep_timer_->setInterval(kSweepInterval);
    connect(sweep_timer_.get(), &QTimer::timeout, this, &MulticastReceiver::sweep);
}

MulticastReceiver::~MulticastReceiver() {
    // The owner may already be half torn down; do not call back into it.
    on_server_added = nullptr;
    on_server_removed = nullptr;
    on_scanning_changed = nullptr;
    on_progress_changed = nullptr;
    on_error = nullptr;
    stop();
}

Result<void, Error> MulticastReceiver::open_transport() {
    if (socket_) {
        return Result<void, Error>::ok();
    }

    socket_ = std::make_unique<QUdpSocket>(this);

    if (!socket_->bind(QHostAddress::AnyIPv4,
                       kPort,
                       QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        const auto code = socket_->error();
        auto msg = "bind to port " + std::to_string(kPort) + " failed: " +
                   socket_->errorString().toStdString();
        socket_.reset();
        if (code == QAbstractSocket::AddressInUseError) {
            return Result<void, Error>::err(Error::configuration(std::move(msg), code));
        }
        return Result<void, Error>::err(Error::transport(std::move(msg), code));
    }

    if (!socket_->joinMulticastGroup(group_)) {
        const auto code = socket_->error();
        auto msg = std::string("join multicast group ") + kGroupAddress + " failed: " +
                   socket_->errorString().toStdString();
        socket_.reset();
        return Result<void, Error>::err(Error::transport(std::move(msg), code));
    }

    connect(socket_.get(), &QUdpSocket::readyRead, this, &MulticastReceiver::onReadyRead);
    connect(socket_.get(), &QAbstractSocket::errorOccurred, this, &MulticastReceiver::onSocketError);

    return Result<void, Error>::ok();
}

void MulticastReceiver::close_transport() {
    if (!socket_) return;

    disconnect(socket_.get(), nullptr, this, nullptr);
    if (!socket_->leaveMulticastGroup(group_)) {
        qCDebug(lanscoutMulticastLog) << "leaveMulticastGroup failed:" << socket_->errorString();
    }
    // stop() may run from inside this socket's readyRead handler.
    auto* socket = socket_.release();
    socket->close();
    socket->deleteLater();
}

Result<void, Error> MulticastReceiver::start() {
    if (running_) {
        return Result<void, Error>::ok();
    }

    qCInfo(lanscoutMulticastLog).nospace() << "Starting multicast listener on "
                                           << kGroupAddress << ":" << kPort;

    presence_.clear();
    auto opened = open_transport();
    if (opened.is_err()) {
        report_error(opened.unwrap_err());
        return opened;
    }

    running_ = true;
    socket_error_reported_ = false;
    sweep_timer_->start();

    set_scanning(true);
    set_progress(0.5);
    return Result<void, Error>::ok();
}

void MulticastReceiver::stop() {
    paused_ = false;
    if (!running_) {
        presence_.clear();
        return;
    }

    running_ = false;
    sweep_timer_->stop();
    close_transport();

    // Emit lost for everything still tracked.
    auto tracked = std::move(presence_);
    presence_.clear();
    if (on_server_removed) {
        for (const auto& [key, entry] : tracked) {
            on_server_removed(key);
        }
    }

    set_scanning(false);
    set_progress(0.0);
    qCInfo(lanscoutMulticastLog) << "Stopped multicast listener";
}

void MulticastReceiver::pause() {
    stop();
    paused_ = true;
}

Result<void, Error> MulticastReceiver::resume() {
    paused_ = false;
    return start();
}

bool MulticastReceiver::ingest(const QByteArray& datagram) {
    if (!running_) return false;

    auto decoded = decode_announcement(datagram);
    if (decoded.is_err()) {
        ++dropped_;
        qCDebug(lanscoutMulticastLog) << "Dropping announcement:"
                                      << QString::fromStdString(decoded.unwrap_err().message);
        return false;
    }

    auto record = std::move(decoded).unwrap();
    const auto now = clock_();
    const auto key = record.key();

    auto it = presence_.find(key);
    if (it != presence_.end()) {
        // Heartbeat from a known server: refresh silently.
        it->second.last_seen = now;
        it->second.record = std::move(record);
        return true;
    }

    qCInfo(lanscoutMulticastLog) << "Discovered server:" << record.display_name();
    presence_.emplace(key, PresenceEntry{record, now});
    if (on_server_added) on_server_added(std::move(record));
    // The callback may have stopped us.
    if (running_) set_progress(1.0);
    return true;
}

void MulticastReceiver::sweep() {
    if (!running_) return;

    const auto now = clock_();
    std::vector<ServerKey> stale;
    stale.reserve(presence_.size());

    for (const auto& [key, entry] : presence_) {
        const auto elapsed = now - entry.last_seen;
        if (elapsed > kStaleTimeout) {
            qCInfo(lanscoutMulticastLog).nospace()
                << "Removing stale server: " << entry.record.display_name()
                << " (last seen " << elapsed.count() / 1000 << "s ago)";
            stale.push_back(key);
        }
    }

    for (const auto& key : stale) {
        presence_.erase(key);
        if (on_server_removed) on_server_removed(key);
    }
}

void MulticastReceiver::onReadyRead() {
    while (socket_ && running_ && socket_->hasPendingDatagrams()) {
        QByteArray datagram;
        datagram.resize(static_cast<qsizetype>(socket_->pendingDatagramSize()));

        const auto read = socket_->readDatagram(datagram.data(), datagram.size());
        if (read < 0) {
            // Socket closed underneath us; this ends reception.
            break;
        }
        datagram.resize(read);
        ingest(datagram);
    }
}

void MulticastReceiver::onSocketError(QAbstractSocket::SocketError error) {
    if (!running_) return;

    if (error == QAbstractSocket::RemoteHostClosedError) {
        qCDebug(lanscoutMulticastLog) << "Socket closed";
        return;
    }
    if (socket_error_reported_) return;
    socket_error_reported_ = true;

    const auto msg = socket_ ? socket_->errorString() : QStringLiteral("socket gone");
    qCWarning(lanscoutMulticastLog) << "Receive error:" << msg;
}

void MulticastReceiver::set_progress(double value) {
    if (progress_ == value) return;
    progress_ = value;
    if (on_progress_changed) on_progress_changed(value);
}

void MulticastReceiver::set_scanning(bool value) {
    if (on_scanning_changed) on_scanning_changed(value);
}

void MulticastReceiver::report_error(const Error& error) {
    qCWarning(lanscoutMulticastLog).nospace()
        << "Multicast listener failed (" << to_string(error.kind) << "): "
        << QString::fromStdString(error.message);
    if (on_error) on_error(error);
}

} // namespace lanscout::network
