#include <QCoreApplication>
#include <QCommandLineParser>
#include <QHostAddress>
#include <QLoggingCategory>
#include <QTextStream>
#include <QTimer>
#include <QUdpSocket>

#include "cli/announce.hpp"
#include "cli/snapshot_format.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "network/announcement_codec.hpp"
#include "network/backend_factory.hpp"
#include "network/merge_engine.hpp"
#include "network/multicast_receiver.hpp"

namespace {

int run_browse(QCoreApplication& app, int seconds, bool json, bool urls) {
    using lanscout::network::MergeEngine;

    const auto config = lanscout::DiscoveryConfig::from_environment();
    MergeEngine engine(lanscout::network::createBackends(config));

    QTextStream out(stdout);
    QObject::connect(&engine, &MergeEngine::stateChanged, &app,
                     [&out, json, urls](const lanscout::MergedState& state) {
        if (json) {
            out << lanscout::cli::format_snapshot_json(state);
        } else {
            out << lanscout::cli::format_snapshot(state, {.includeUrls = urls});
        }
        out.flush();
    });
    QObject::connect(&engine, &MergeEngine::backendFailed, &app,
                     [](lanscout::ServerSource source, const lanscout::Error& error) {
        QTextStream(stderr) << lanscout::to_string(source) << " discovery failed: "
                            << QString::fromStdString(error.message) << QLatin1Char('\n');
    });

    engine.start();

    if (!engine.state().is_scanning && engine.last_error()) {
        // Every backend failed to start; nothing to wait for.
        engine.stop();
        return 1;
    }

    if (seconds > 0) {
        QTimer::singleShot(seconds * 1000, &app, [&app]() { app.quit(); });
    }
    const int rc = app.exec();
    engine.stop();
    return rc;
}

int run_announce(QCoreApplication& app, const lanscout::cli::AnnounceOptions& options,
                 int interval_ms, int count) {
    using lanscout::network::MulticastReceiver;

    const auto record = lanscout::cli::build_announcement(options);
    if (record.is_err()) {
        QTextStream(stderr) << QString::fromStdString(record.unwrap_err().message) << QLatin1Char('\n');
        return 2;
    }

    const auto payload = lanscout::network::encode_announcement(record.unwrap());
    const QHostAddress group(QString::fromLatin1(MulticastReceiver::kGroupAddress));

    QUdpSocket socket;
    socket.setSocketOption(QAbstractSocket::MulticastTtlOption, 1);
    socket.setSocketOption(QAbstractSocket::MulticastLoopbackOption, 1);

    int sent = 0;
    int failures = 0;
    QTimer timer;
    timer.setInterval(interval_ms);

    auto send_once = [&]() {
        const auto written = socket.writeDatagram(payload, group, MulticastReceiver::kPort);
        if (written < 0) {
            ++failures;
            qCWarning(lanscoutToolsLog) << "Announcement send failed:" << socket.errorString();
        } else {
            qCDebug(lanscoutToolsLog) << "Announced" << record.unwrap().display_name();
        }
        ++sent;
        if (count > 0 && sent >= count) {
            timer.stop();
            app.exit(failures == sent ? 1 : 0);
        }
    };

    QObject::connect(&timer, &QTimer::timeout, &app, send_once);
    qCInfo(lanscoutToolsLog).noquote() << "Announcing" << record.unwrap().display_name()
                                       << "every" << interval_ms << "ms";
    timer.start();
    QTimer::singleShot(0, &app, send_once);
    return app.exec();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("lanscout");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("lanscout");
    app.setOrganizationDomain("lanscout.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("LAN server discovery (multicast + mDNS)"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption secondsOption(
        QStringList{QStringLiteral("seconds")},
        QStringLiteral("browse: stop after this many seconds (default: run until interrupted)."),
        QStringLiteral("n"), QStringLiteral("0"));
    parser.addOption(secondsOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("browse: print one JSON object per snapshot."));
    parser.addOption(jsonOption);

    const QCommandLineOption urlsOption(
        QStringList{QStringLiteral("urls")},
        QStringLiteral("browse: include API and WebSocket URLs."));
    parser.addOption(urlsOption);

    const QCommandLineOption nameOption(
        QStringList{QStringLiteral("name")},
        QStringLiteral("announce: server name."),
        QStringLiteral("name"));
    parser.addOption(nameOption);

    const QCommandLineOption hostOption(
        QStringList{QStringLiteral("host")},
        QStringLiteral("announce: advertised host."),
        QStringLiteral("host"));
    parser.addOption(hostOption);

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("port")},
        QStringLiteral("announce: advertised port."),
        QStringLiteral("port"));
    parser.addOption(portOption);

    const QCommandLineOption apiUrlOption(
        QStringList{QStringLiteral("api-url")},
        QStringLiteral("announce: API base URL (default http://host:port)."),
        QStringLiteral("url"));
    parser.addOption(apiUrlOption);

    const QCommandLineOption wsUrlOption(
        QStringList{QStringLiteral("ws-url")},
        QStringLiteral("announce: WebSocket URL (default ws://host:port)."),
        QStringLiteral("url"));
    parser.addOption(wsUrlOption);

    const QCommandLineOption intervalOption(
        QStringList{QStringLiteral("interval-ms")},
        QStringLiteral("announce: delay between announcements."),
        QStringLiteral("ms"), QStringLiteral("2000"));
    parser.addOption(intervalOption);

    const QCommandLineOption countOption(
        QStringList{QStringLiteral("count")},
        QStringLiteral("announce: number of announcements (default: forever)."),
        QStringLiteral("n"), QStringLiteral("0"));
    parser.addOption(countOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable discovery debug logging (also sets LANSCOUT_DEBUG_DISCOVERY=1)."));
    parser.addOption(debugOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run: 'browse' or 'announce'."));
    parser.process(app);

    if (parser.isSet(debugOption)) {
        qputenv("LANSCOUT_DEBUG_DISCOVERY", "1");
    }

    const auto config = lanscout::DiscoveryConfig::from_environment();
    if (config.log_to_file) {
        lanscout::install_file_logging();
        qCInfo(lanscoutToolsLog) << "Logging to" << lanscout::default_log_file_path();
    }
    if (config.debug_logging) {
        lanscout::enable_debug_logging();
    }

    const auto positional = parser.positionalArguments();
    const auto command = positional.isEmpty() ? QStringLiteral("browse") : positional.first();

    if (command == QStringLiteral("browse")) {
        return run_browse(app,
                          parser.value(secondsOption).toInt(),
                          parser.isSet(jsonOption),
                          parser.isSet(urlsOption));
    }

    if (command == QStringLiteral("announce")) {
        lanscout::cli::AnnounceOptions options;
        options.name = parser.value(nameOption);
        options.host = parser.value(hostOption);
        options.port = parser.value(portOption);
        options.apiUrl = parser.value(apiUrlOption);
        options.wsUrl = parser.value(wsUrlOption);

        const int interval = parser.value(intervalOption).toInt();
        return run_announce(app, options, interval > 0 ? interval : 2000,
                            parser.value(countOption).toInt());
    }

    QTextStream(stderr) << "Unknown command: " << command << QLatin1Char('\n');
    parser.showHelp(2);
}
