#include "cli/snapshot_format.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <cmath>

namespace lanscout::cli {
namespace {

[[nodiscard]] QString yes_no(bool value) {
    return value ? QStringLiteral("yes") : QStringLiteral("no");
}

} // namespace

QString format_snapshot(const MergedState& state, const SnapshotFormatOptions& options) {
    QString out = QStringLiteral("scanning=%1 paused=%2 progress=%3% servers=%4\n")
                      .arg(yes_no(state.is_scanning),
                           yes_no(state.is_paused))
                      .arg(static_cast<int>(std::lround(state.progress * 100.0)))
                      .arg(static_cast<qlonglong>(state.servers.size()));

    for (const auto& server : state.servers) {
        out += QStringLiteral("  %1 [%2]\n")
                   .arg(server.display_name(), QString::fromLatin1(to_string(server.source)));
        if (options.includeUrls) {
            out += QStringLiteral("    api: %1\n    ws:  %2\n").arg(server.api_url, server.ws_url);
        }
    }
    return out;
}

QString format_snapshot_json(const MergedState& state) {
    QJsonArray servers;
    for (const auto& server : state.servers) {
        QJsonObject obj;
        obj[QStringLiteral("name")] = server.name;
        obj[QStringLiteral("host")] = server.host;
        obj[QStringLiteral("port")] = static_cast<int>(server.port);
        obj[QStringLiteral("apiURL")] = server.api_url;
        obj[QStringLiteral("wsURL")] = server.ws_url;
        obj[QStringLiteral("source")] = QString::fromLatin1(to_string(server.source));
        servers.append(obj);
    }

    QJsonObject root;
    root[QStringLiteral("isScanning")] = state.is_scanning;
    root[QStringLiteral("isPaused")] = state.is_paused;
    root[QStringLiteral("progress")] = state.progress;
    root[QStringLiteral("servers")] = servers;
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Compact)) + QLatin1Char('\n');
}

} // namespace lanscout::cli
