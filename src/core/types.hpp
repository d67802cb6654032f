#pragma once

#include <QHash>
#include <QMetaType>
#include <QString>

#include <cstdint>
#include <functional>
#include <vector>

namespace lanscout {

/**
 * ServerSource - Which discovery backend produced a record.
 */
enum class ServerSource {
    Multicast,
    Mdns,
};

const char* to_string(ServerSource source) noexcept;

/**
 * ServerKey - The merge key of a server: (host, port).
 *
 * Two records with the same key are the same logical server regardless of
 * which backend reported them or what name they advertise.
 */
struct ServerKey {
    QString host;
    quint16 port{0};

    [[nodiscard]] QString to_string() const {
        return QStringLiteral("%1:%2").arg(host).arg(port);
    }

    bool operator==(const ServerKey& other) const = default;
};

/**
 * ServerRecord - A discovered server's advertised identity.
 *
 * host is kept exactly as advertised; it is never resolved here.
 * api_url and ws_url are opaque to discovery.
 */
struct ServerRecord {
    QString host;
    quint16 port{0};
    QString api_url;
    QString ws_url;
    QString name;
    ServerSource source{ServerSource::Multicast};

    [[nodiscard]] ServerKey key() const { return ServerKey{host, port}; }

    [[nodiscard]] QString display_name() const {
        return QStringLiteral("%1 (%2:%3)").arg(name, host).arg(port);
    }

    bool operator==(const ServerRecord& other) const = default;
};

/**
 * MergedState - Immutable snapshot of the merged discovery view.
 *
 * servers is sorted by name and holds at most one record per ServerKey.
 */
struct MergedState {
    std::vector<ServerRecord> servers;
    bool is_scanning = false;
    bool is_paused = false;
    double progress = 0.0;

    bool operator==(const MergedState& other) const = default;
};

// Sort order of MergedState::servers: name, then host, then port.
bool server_display_less(const ServerRecord& a, const ServerRecord& b);

} // namespace lanscout

inline size_t qHash(const lanscout::ServerKey& key, size_t seed = 0) noexcept {
    return qHashMulti(seed, key.host, key.port);
}

namespace std {
    template<>
    struct hash<lanscout::ServerKey> {
        size_t operator()(const lanscout::ServerKey& key) const noexcept {
            return ::qHash(key);
        }
    };
}

Q_DECLARE_METATYPE(lanscout::ServerRecord)
Q_DECLARE_METATYPE(lanscout::MergedState)
