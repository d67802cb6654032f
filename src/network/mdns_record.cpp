#include "network/mdns_record.hpp"

#include <algorithm>
#include <tuple>

namespace lanscout::network {
namespace {

std::optional<quint16> txt_port(const QMap<QString, QString>& txt, const QString& key) {
    auto it = txt.constFind(key);
    if (it == txt.constEnd()) return std::nullopt;

    bool ok = false;
    const auto value = it.value().trimmed().toUInt(&ok);
    if (!ok || value == 0 || value > 65535) return std::nullopt;
    return static_cast<quint16>(value);
}

QString strip_zone(const QString& address) {
    const auto percent = address.indexOf(QLatin1Char('%'));
    return percent < 0 ? address : address.left(percent);
}

bool is_ipv6(const QString& address) {
    return address.contains(QLatin1Char(':'));
}

} // namespace

std::optional<ServerRecord> record_from_resolved(const ResolvedService& service) {
    const auto host = strip_zone(service.address.trimmed());
    if (host.isEmpty()) {
        return std::nullopt;
    }
    if (is_ipv6(host) && host.toLower().startsWith(QStringLiteral("fe80:"))) {
        return std::nullopt;
    }

    const auto api_port = txt_port(service.txt, QStringLiteral("apiPort")).value_or(service.port);
    const auto ws_port = txt_port(service.txt, QStringLiteral("wsPort")).value_or(service.port);
    if (api_port == 0) {
        return std::nullopt;
    }

    // IPv6 literals need brackets inside a URL authority.
    const auto url_host = is_ipv6(host) ? QStringLiteral("[%1]").arg(host) : host;

    ServerRecord record;
    record.host = host;
    record.port = api_port;
    record.api_url = QStringLiteral("http://%1:%2").arg(url_host).arg(api_port);
    record.ws_url = QStringLiteral("ws://%1:%2").arg(url_host).arg(ws_port);
    record.source = ServerSource::Mdns;

    const auto custom = service.txt.value(QStringLiteral("name")).trimmed();
    record.name = custom.isEmpty() ? service.instance_name : custom;
    return record;
}

bool ResolutionId::operator<(const ResolutionId& other) const {
    return std::tie(interface, protocol, instance_name) <
           std::tie(other.interface, other.protocol, other.instance_name);
}

ResolutionTable::Change ResolutionTable::resolved(const ResolutionId& id, ServerRecord record) {
    resolutions_[id] = std::move(record);
    return republish(id.instance_name);
}

ResolutionTable::Change ResolutionTable::lost(const ResolutionId& id) {
    if (resolutions_.erase(id) == 0) {
        return {};
    }
    return republish(id.instance_name);
}

std::vector<ServerKey> ResolutionTable::clear() {
    std::vector<ServerKey> keys;
    for (const auto& [name, key] : published_) {
        if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
            keys.push_back(key);
        }
    }
    resolutions_.clear();
    published_.clear();
    return keys;
}

bool ResolutionTable::published_elsewhere(const QString& instance_name, const ServerKey& key) const {
    for (const auto& [name, published] : published_) {
        if (name != instance_name && published == key) return true;
    }
    return false;
}

ResolutionTable::Change ResolutionTable::republish(const QString& instance_name) {
    Change change;
    auto published = published_.find(instance_name);

    const ServerRecord* best = nullptr;
    const ServerRecord* current = nullptr;
    for (const auto& [id, record] : resolutions_) {
        if (id.instance_name != instance_name) continue;
        if (published != published_.end() && record.key() == published->second) {
            current = &record;
        }
        if (!best || (is_ipv6(best->host) && !is_ipv6(record.host))) {
            best = &record;
        }
    }
    if (current && (is_ipv6(best->host) || !is_ipv6(current->host))) {
        best = current;
    }

    if (!best) {
        if (published != published_.end()) {
            const auto key = published->second;
            published_.erase(published);
            if (!published_elsewhere(instance_name, key)) change.removed = key;
        }
        return change;
    }

    if (published != published_.end() && published->second != best->key() &&
        !published_elsewhere(instance_name, published->second)) {
        change.removed = published->second;
    }
    published_[instance_name] = best->key();
    change.added = *best;
    return change;
}

} // namespace lanscout::network
