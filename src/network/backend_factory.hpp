#pragma once

#include "core/config.hpp"
#include "network/discovery_backend.hpp"

#include <memory>
#include <vector>

namespace lanscout::network {

// Priority of every mDNS backend; above MulticastReceiver::kPriority.
inline constexpr int kMdnsPriority = 1;

/**
 * Create the platform-appropriate mDNS backend.
 *
 * Linux builds with Avahi get an Avahi service browser. Elsewhere a
 * fallback is returned whose start() fails with a Configuration error.
 */
std::unique_ptr<DiscoveryBackend> createMdnsBackend();

/**
 * Create the backend set selected by config (multicast and/or mDNS).
 */
std::vector<std::unique_ptr<DiscoveryBackend>> createBackends(const DiscoveryConfig& config);

} // namespace lanscout::network
