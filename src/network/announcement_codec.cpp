#include "network/announcement_codec.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>

#include <cmath>

namespace lanscout::network {
namespace {

constexpr auto kName = QLatin1String("name");
constexpr auto kHost = QLatin1String("host");
constexpr auto kPort = QLatin1String("port");
constexpr auto kApiUrl = QLatin1String("apiURL");
constexpr auto kWsUrl = QLatin1String("wsURL");

Result<QString, Error> require_string(const QJsonObject& obj, QLatin1String field) {
    const auto value = obj.value(field);
    if (value.isUndefined()) {
        return Result<QString, Error>::err(
            Error::decode("missing field: " + std::string(field.data(), field.size())));
    }
    if (!value.isString()) {
        return Result<QString, Error>::err(
            Error::decode("field is not a string: " + std::string(field.data(), field.size())));
    }
    return Result<QString, Error>::ok(value.toString());
}

Result<quint16, Error> require_port(const QJsonObject& obj) {
    const auto value = obj.value(kPort);
    if (value.isUndefined()) {
        return Result<quint16, Error>::err(Error::decode("missing field: port"));
    }
    if (!value.isDouble()) {
        return Result<quint16, Error>::err(Error::decode("field is not an integer: port"));
    }

    const double raw = value.toDouble();
    if (std::trunc(raw) != raw) {
        return Result<quint16, Error>::err(Error::decode("field is not an integer: port"));
    }
    if (raw < 1 || raw > 65535) {
        return Result<quint16, Error>::err(Error::decode("port out of range"));
    }
    return Result<quint16, Error>::ok(static_cast<quint16>(raw));
}

} // namespace

QByteArray encode_announcement(const ServerRecord& record) {
    QJsonObject obj;
    obj[kName] = record.name;
    obj[kHost] = record.host;
    obj[kPort] = static_cast<int>(record.port);
    obj[kApiUrl] = record.api_url;
    obj[kWsUrl] = record.ws_url;
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

Result<ServerRecord, Error> decode_announcement(const QByteArray& datagram) {
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(datagram, &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        return Result<ServerRecord, Error>::err(
            Error::decode("invalid json: " + parse_error.errorString().toStdString()));
    }
    if (!doc.isObject()) {
        return Result<ServerRecord, Error>::err(Error::decode("payload is not a json object"));
    }

    const auto obj = doc.object();

    auto name = require_string(obj, kName);
    if (name.is_err()) return Result<ServerRecord, Error>::err(name.unwrap_err());
    auto host = require_string(obj, kHost);
    if (host.is_err()) return Result<ServerRecord, Error>::err(host.unwrap_err());
    auto port = require_port(obj);
    if (port.is_err()) return Result<ServerRecord, Error>::err(port.unwrap_err());
    auto api_url = require_string(obj, kApiUrl);
    if (api_url.is_err()) return Result<ServerRecord, Error>::err(api_url.unwrap_err());
    auto ws_url = require_string(obj, kWsUrl);
    if (ws_url.is_err()) return Result<ServerRecord, Error>::err(ws_url.unwrap_err());

    ServerRecord record;
    record.name = std::move(name).unwrap();
    record.host = std::move(host).unwrap();
    record.port = port.unwrap();
    record.api_url = std::move(api_url).unwrap();
    record.ws_url = std::move(ws_url).unwrap();
    record.source = ServerSource::Multicast;

    return Result<ServerRecord, Error>::ok(std::move(record));
}

} // namespace lanscout::network
