#include <QCoreApplication>
#include <QEventLoop>
#include <QHostAddress>
#include <QTimer>
#include <QUdpSocket>

#include "network/announcement_codec.hpp"
#include "network/multicast_receiver.hpp"

// Sends one announcement to the multicast group over loopback and checks the
// receiver on this host picks it up. Exit codes: 0 seen, 1 receiver failed
// to start, 2 not seen within the timeout.
int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    using lanscout::network::MulticastReceiver;

    MulticastReceiver receiver;

    lanscout::ServerRecord announced;
    announced.name = QStringLiteral("Loopback");
    announced.host = QStringLiteral("127.0.0.1");
    announced.port = 18080;
    announced.api_url = QStringLiteral("http://127.0.0.1:18080");
    announced.ws_url = QStringLiteral("ws://127.0.0.1:18080");

    bool seen = false;
    receiver.on_server_added = [&](lanscout::ServerRecord record) {
        seen = seen || (record.key() == announced.key() && record.name == announced.name);
    };
    receiver.on_error = [](lanscout::Error error) {
        qCritical().noquote() << "receiver error:" << QString::fromStdString(error.message);
    };

    if (receiver.start().is_err()) {
        return 1;
    }

    QUdpSocket sender;
    sender.setSocketOption(QAbstractSocket::MulticastTtlOption, 1);
    sender.setSocketOption(QAbstractSocket::MulticastLoopbackOption, 1);
    const QHostAddress group(QString::fromLatin1(MulticastReceiver::kGroupAddress));
    const auto payload = lanscout::network::encode_announcement(announced);

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    timeout.setInterval(3000);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    // Re-send periodically; the first datagram can race the group join.
    QTimer poll;
    poll.setInterval(100);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (seen) {
            loop.quit();
            return;
        }
        if (sender.writeDatagram(payload, group, MulticastReceiver::kPort) < 0) {
            qWarning().noquote() << "send failed:" << sender.errorString();
        }
    });

    timeout.start();
    poll.start();
    loop.exec();

    receiver.stop();
    return seen ? 0 : 2;
}
