#include "core/config.hpp"
#include "core/logging.hpp"

#include <QtGlobal>

namespace lanscout {
namespace {

bool env_flag(const char* name) {
    const auto value = qEnvironmentVariable(name).trimmed().toLower();
    return value == QStringLiteral("1") || value == QStringLiteral("true");
}

} // namespace

BackendSelection parse_backend_selection(const QString& value, bool* recognized) {
    const auto v = value.trimmed().toLower();
    if (recognized) *recognized = true;

    if (v.isEmpty() || v == QStringLiteral("all")) return BackendSelection::All;
    if (v == QStringLiteral("multicast") || v == QStringLiteral("udp")) {
        return BackendSelection::MulticastOnly;
    }
    if (v == QStringLiteral("mdns")) return BackendSelection::MdnsOnly;

    if (recognized) *recognized = false;
    return BackendSelection::All;
}

DiscoveryConfig DiscoveryConfig::from_environment() {
    DiscoveryConfig config;

    const auto raw = qEnvironmentVariable("LANSCOUT_DISCOVERY_BACKENDS");
    bool recognized = true;
    config.backends = parse_backend_selection(raw, &recognized);
    if (!recognized) {
        qCWarning(lanscoutMergeLog) << "Unknown LANSCOUT_DISCOVERY_BACKENDS value" << raw
                                    << "- using all backends";
    }

    config.debug_logging = env_flag("LANSCOUT_DEBUG_DISCOVERY");
    config.log_to_file = env_flag("LANSCOUT_LOG_FILE");
    return config;
}

} // namespace lanscout
