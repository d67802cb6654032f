#include "network/backend_factory.hpp"

#include "core/logging.hpp"
#include "network/multicast_receiver.hpp"

namespace lanscout::network {

#ifdef LANSCOUT_HAS_AVAHI
// Implemented in platform/linux/avahi_browse_backend.cpp
std::unique_ptr<DiscoveryBackend> createAvahiBrowseBackend();
#endif

namespace {

// Fallback backend for platforms without native mDNS support
class FallbackMdnsBackend final : public DiscoveryBackend {
public:
    Result<void, Error> start() override {
        Error error = Error::configuration("mDNS not available on this platform");
        if (on_error) on_error(error);
        return Result<void, Error>::err(std::move(error));
    }

    void stop() override { paused_ = false; }

    void pause() override { paused_ = true; }

    Result<void, Error> resume() override {
        paused_ = false;
        return start();
    }

    [[nodiscard]] bool is_running() const override { return false; }
    [[nodiscard]] bool is_paused() const override { return paused_; }
    [[nodiscard]] int priority() const override { return kMdnsPriority; }
    [[nodiscard]] ServerSource source() const override { return ServerSource::Mdns; }

private:
    bool paused_ = false;
};

} // namespace

std::unique_ptr<DiscoveryBackend> createMdnsBackend() {
#ifdef LANSCOUT_HAS_AVAHI
    return createAvahiBrowseBackend();
#else
    return std::make_unique<FallbackMdnsBackend>();
#endif
}

std::vector<std::unique_ptr<DiscoveryBackend>> createBackends(const DiscoveryConfig& config) {
    std::vector<std::unique_ptr<DiscoveryBackend>> backends;
    if (config.wants_mdns()) {
        backends.push_back(createMdnsBackend());
    }
    if (config.wants_multicast()) {
        backends.push_back(std::make_unique<MulticastReceiver>());
    }
    qCDebug(lanscoutMergeLog) << "Created" << backends.size() << "discovery backend(s)";
    return backends;
}

} // namespace lanscout::network
