#pragma once

#include <QString>

namespace lanscout {

/**
 * BackendSelection - Which discovery backends a session runs.
 */
enum class BackendSelection {
    All,
    MulticastOnly,
    MdnsOnly,
};

/**
 * DiscoveryConfig - Process configuration read from the environment.
 *
 * Protocol constants (multicast group, port, timeouts) are fixed and live
 * next to the code that uses them; only deployment knobs are here.
 *
 *   LANSCOUT_DISCOVERY_BACKENDS  all | multicast | mdns   (default: all)
 *   LANSCOUT_DEBUG_DISCOVERY     1 | true enables lanscout.* debug output
 *   LANSCOUT_LOG_FILE            1 | true appends log output to a file
 */
struct DiscoveryConfig {
    BackendSelection backends = BackendSelection::All;
    bool debug_logging = false;
    bool log_to_file = false;

    [[nodiscard]] static DiscoveryConfig from_environment();

    [[nodiscard]] bool wants_multicast() const {
        return backends != BackendSelection::MdnsOnly;
    }
    [[nodiscard]] bool wants_mdns() const {
        return backends != BackendSelection::MulticastOnly;
    }
};

// Parses a LANSCOUT_DISCOVERY_BACKENDS value; unknown values select All.
BackendSelection parse_backend_selection(const QString& value, bool* recognized = nullptr);

} // namespace lanscout
