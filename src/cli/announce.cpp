#include "cli/announce.hpp"

namespace lanscout::cli {

Result<ServerRecord> build_announcement(const AnnounceOptions& options) {
    const auto name = options.name.trimmed();
    const auto host = options.host.trimmed();

    if (name.isEmpty()) {
        return Result<ServerRecord>::err(Error::configuration("--name is required"));
    }
    if (host.isEmpty()) {
        return Result<ServerRecord>::err(Error::configuration("--host is required"));
    }

    bool ok = false;
    const auto port = options.port.trimmed().toUInt(&ok);
    if (!ok || port == 0 || port > 65535) {
        return Result<ServerRecord>::err(
            Error::configuration("--port must be between 1 and 65535"));
    }

    ServerRecord record;
    record.name = name;
    record.host = host;
    record.port = static_cast<quint16>(port);
    record.api_url = options.apiUrl.isEmpty()
        ? QStringLiteral("http://%1:%2").arg(host).arg(port)
        : options.apiUrl;
    record.ws_url = options.wsUrl.isEmpty()
        ? QStringLiteral("ws://%1:%2").arg(host).arg(port)
        : options.wsUrl;
    record.source = ServerSource::Multicast;
    return Result<ServerRecord>::ok(std::move(record));
}

} // namespace lanscout::cli
