#pragma once

#include "core/types.hpp"

#include <QMap>
#include <QString>

#include <map>
#include <optional>
#include <vector>

namespace lanscout::network {

// DNS-SD service type the servers publish.
inline constexpr const char* kMdnsServiceType = "_simpleyes._tcp";

/**
 * ResolvedService - What an mDNS resolver hands back for one instance.
 */
struct ResolvedService {
    QString instance_name;
    QString address;             // textual address, may carry a %zone suffix
    quint16 port{0};             // SRV port
    QMap<QString, QString> txt;  // TXT key/value pairs
};

/**
 * Build the ServerRecord for a resolved service.
 *
 * TXT keys: apiPort and wsPort override the SRV port for the API and
 * realtime endpoints, name overrides the instance name. The record's port is
 * the API port. Returns nullopt for link-local IPv6 results (an IPv4
 * resolution of the same instance is expected) and for unusable addresses.
 */
std::optional<ServerRecord> record_from_resolved(const ResolvedService& service);

/**
 * One resolution of a service instance. mDNS reports an instance separately
 * per network interface and address family.
 */
struct ResolutionId {
    int interface = 0;
    int protocol = 0;
    QString instance_name;

    bool operator<(const ResolutionId& other) const;
};

/**
 * ResolutionTable - Tracks every live resolution and publishes one record
 * per service instance.
 *
 * The published record is the current one while it is still resolved, an
 * IPv4 resolution otherwise, and an IPv6 one only when nothing else is left.
 * An instance is withdrawn once its last resolution is lost.
 */
class ResolutionTable {
public:
    // What a browser should report after an update. Removal comes first.
    struct Change {
        std::optional<ServerKey> removed;
        std::optional<ServerRecord> added;
    };

    Change resolved(const ResolutionId& id, ServerRecord record);
    Change lost(const ResolutionId& id);

    // Forget everything; returns the keys that were published.
    std::vector<ServerKey> clear();

    [[nodiscard]] size_t published_count() const { return published_.size(); }

private:
    Change republish(const QString& instance_name);
    [[nodiscard]] bool published_elsewhere(const QString& instance_name, const ServerKey& key) const;

    std::map<ResolutionId, ServerRecord> resolutions_;
    std::map<QString, ServerKey> published_;
};

} // namespace lanscout::network
