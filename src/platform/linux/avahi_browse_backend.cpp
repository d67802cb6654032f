#include "network/backend_factory.hpp"

#ifdef LANSCOUT_HAS_AVAHI

#include "core/logging.hpp"
#include "network/mdns_record.hpp"

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/address.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/strlst.h>
#include <avahi-common/thread-watch.h>

#include <atomic>
#include <string>
#include <unordered_set>
#include <vector>

namespace lanscout::network {

/**
 * Avahi-based mDNS browser for Linux.
 *
 * Avahi callbacks run on the threaded poll's own thread. Everything they
 * touch is also touched by start()/stop() only while holding the poll lock.
 */
class AvahiBrowseBackend final : public DiscoveryBackend {
public:
    AvahiBrowseBackend() = default;

    ~AvahiBrowseBackend() override {
        // stop() takes the poll lock, so no callback is running once it returns.
        stop();
        release_client();
    }

    Result<void, Error> start() override {
        if (running_) {
            return Result<void, Error>::ok();
        }

        if (client_failed_) {
            // The daemon went away (or restarted); start over with a new client.
            release_client();
            client_failed_ = false;
        }
        auto client = ensure_client();
        if (client.is_err()) {
            report_error(client.unwrap_err());
            return client;
        }

        avahi_threaded_poll_lock(threaded_poll_);
        browser_ = avahi_service_browser_new(
            client_,
            AVAHI_IF_UNSPEC,
            AVAHI_PROTO_UNSPEC,
            kMdnsServiceType,
            nullptr,  // domain
            static_cast<AvahiLookupFlags>(0),
            browse_callback,
            this
        );
        const int ret = browser_ ? AVAHI_OK : avahi_client_errno(client_);
        if (browser_) {
            running_ = true;
            got_result_ = false;
            if (on_scanning_changed) on_scanning_changed(true);
            if (on_progress_changed) on_progress_changed(0.5);
        }
        avahi_threaded_poll_unlock(threaded_poll_);

        if (ret != AVAHI_OK) {
            auto error = Error::transport(
                "Failed to create service browser: " + std::string(avahi_strerror(ret)), ret);
            report_error(error);
            return Result<void, Error>::err(std::move(error));
        }

        qCInfo(lanscoutMdnsLog) << "Browsing for" << kMdnsServiceType << "services";
        return Result<void, Error>::ok();
    }

    void stop() override {
        paused_ = false;
        if (!threaded_poll_) return;

        std::vector<ServerKey> gone;
        bool was_running = false;

        avahi_threaded_poll_lock(threaded_poll_);
        was_running = running_;
        release_lookups();
        gone = table_.clear();
        avahi_threaded_poll_unlock(threaded_poll_);

        if (!was_running) return;

        if (on_server_removed) {
            for (const auto& key : gone) on_server_removed(key);
        }
        if (on_scanning_changed) on_scanning_changed(false);
        if (on_progress_changed) on_progress_changed(0.0);
        qCInfo(lanscoutMdnsLog) << "Stopped browsing";
    }

    void pause() override {
        stop();
        paused_ = true;
    }

    Result<void, Error> resume() override {
        paused_ = false;
        return start();
    }

    [[nodiscard]] bool is_running() const override { return running_; }
    [[nodiscard]] bool is_paused() const override { return paused_; }
    [[nodiscard]] int priority() const override { return kMdnsPriority; }
    [[nodiscard]] ServerSource source() const override { return ServerSource::Mdns; }

private:
    AvahiThreadedPoll* threaded_poll_ = nullptr;
    AvahiClient* client_ = nullptr;
    AvahiServiceBrowser* browser_ = nullptr;
    std::unordered_set<AvahiServiceResolver*> resolvers_;
    ResolutionTable table_;

    std::atomic<bool> running_{false};
    std::atomic<bool> client_failed_{false};
    bool paused_ = false;
    bool got_result_ = false;

    Result<void, Error> ensure_client() {
        if (client_) return Result<void, Error>::ok();

        threaded_poll_ = avahi_threaded_poll_new();
        if (!threaded_poll_) {
            return Result<void, Error>::err(Error::transport("Failed to create Avahi poll"));
        }

        int error = 0;
        client_ = avahi_client_new(
            avahi_threaded_poll_get(threaded_poll_),
            static_cast<AvahiClientFlags>(0),
            client_callback,
            this,
            &error
        );

        if (!client_) {
            avahi_threaded_poll_free(threaded_poll_);
            threaded_poll_ = nullptr;
            // Usually means avahi-daemon is not running.
            return Result<void, Error>::err(Error::configuration(
                "Failed to create Avahi client: " + std::string(avahi_strerror(error)), error));
        }

        if (avahi_threaded_poll_start(threaded_poll_) < 0) {
            avahi_client_free(client_);
            client_ = nullptr;
            avahi_threaded_poll_free(threaded_poll_);
            threaded_poll_ = nullptr;
            return Result<void, Error>::err(Error::transport("Failed to start Avahi poll thread"));
        }

        return Result<void, Error>::ok();
    }

    // Not on the poll thread, and no browser may be left.
    void release_client() {
        if (threaded_poll_) {
            avahi_threaded_poll_stop(threaded_poll_);
        }
        if (client_) {
            avahi_client_free(client_);
            client_ = nullptr;
        }
        if (threaded_poll_) {
            avahi_threaded_poll_free(threaded_poll_);
            threaded_poll_ = nullptr;
        }
    }

    // Caller holds the poll lock (or is on the poll thread).
    void release_lookups() {
        running_ = false;
        for (auto* resolver : resolvers_) {
            avahi_service_resolver_free(resolver);
        }
        resolvers_.clear();
        if (browser_) {
            avahi_service_browser_free(browser_);
            browser_ = nullptr;
        }
    }

    void report_error(const Error& error) {
        qCWarning(lanscoutMdnsLog).nospace()
            << "mDNS browser failed (" << to_string(error.kind) << "): "
            << QString::fromStdString(error.message);
        if (on_error) on_error(error);
    }

    // Poll thread.
    void fail(Error error) {
        const bool was_running = running_;
        release_lookups();
        const auto gone = table_.clear();
        if (on_server_removed) {
            for (const auto& key : gone) on_server_removed(key);
        }
        if (was_running && on_scanning_changed) on_scanning_changed(false);
        report_error(error);
    }

    static void client_callback(AvahiClient* client, AvahiClientState state, void* userdata) {
        auto* self = static_cast<AvahiBrowseBackend*>(userdata);

        switch (state) {
            case AVAHI_CLIENT_FAILURE:
                self->client_failed_ = true;
                if (self->running_) {
                    const int err = avahi_client_errno(client);
                    self->fail(Error::transport(
                        "Avahi client failure: " + std::string(avahi_strerror(err)), err));
                }
                break;
            case AVAHI_CLIENT_S_RUNNING:
            case AVAHI_CLIENT_S_COLLISION:
            case AVAHI_CLIENT_S_REGISTERING:
            case AVAHI_CLIENT_CONNECTING:
                break;
        }
    }

    static void browse_callback(AvahiServiceBrowser* browser,
                                AvahiIfIndex interface,
                                AvahiProtocol protocol,
                                AvahiBrowserEvent event,
                                const char* name,
                                const char* type,
                                const char* domain,
                                AvahiLookupResultFlags /*flags*/,
                                void* userdata) {
        auto* self = static_cast<AvahiBrowseBackend*>(userdata);
        if (!self->running_) return;

        switch (event) {
            case AVAHI_BROWSER_NEW: {
                qCDebug(lanscoutMdnsLog) << "Service found:" << name;
                auto* resolver = avahi_service_resolver_new(
                    avahi_service_browser_get_client(browser),
                    interface,
                    protocol,
                    name,
                    type,
                    domain,
                    AVAHI_PROTO_UNSPEC,
                    static_cast<AvahiLookupFlags>(0),
                    resolve_callback,
                    userdata
                );
                if (!resolver) {
                    const int err = avahi_client_errno(avahi_service_browser_get_client(browser));
                    qCWarning(lanscoutMdnsLog) << "Failed to resolve" << name << ":"
                                               << avahi_strerror(err);
                    break;
                }
                self->resolvers_.insert(resolver);
                break;
            }

            case AVAHI_BROWSER_REMOVE: {
                qCDebug(lanscoutMdnsLog) << "Service removed:" << name
                                         << "on interface" << interface;
                self->report(self->table_.lost(resolution_id(interface, protocol, name)));
                break;
            }

            case AVAHI_BROWSER_FAILURE: {
                const int err = avahi_client_errno(avahi_service_browser_get_client(browser));
                self->fail(Error::transport(
                    "Service browser failure: " + std::string(avahi_strerror(err)), err));
                break;
            }

            case AVAHI_BROWSER_ALL_FOR_NOW:
            case AVAHI_BROWSER_CACHE_EXHAUSTED:
                break;
        }
    }

    static void resolve_callback(AvahiServiceResolver* resolver,
                                 AvahiIfIndex interface,
                                 AvahiProtocol protocol,
                                 AvahiResolverEvent event,
                                 const char* name,
                                 const char* /*type*/,
                                 const char* /*domain*/,
                                 const char* /*host_name*/,
                                 const AvahiAddress* address,
                                 uint16_t port,
                                 AvahiStringList* txt,
                                 AvahiLookupResultFlags /*flags*/,
                                 void* userdata) {
        auto* self = static_cast<AvahiBrowseBackend*>(userdata);
        self->resolvers_.erase(resolver);

        if (event == AVAHI_RESOLVER_FOUND && self->running_) {
            self->handle_resolved(resolution_id(interface, protocol, name), address, port, txt);
        } else if (event == AVAHI_RESOLVER_FAILURE) {
            qCDebug(lanscoutMdnsLog) << "Resolve failed for" << name;
        }

        avahi_service_resolver_free(resolver);
    }

    static ResolutionId resolution_id(AvahiIfIndex interface, AvahiProtocol protocol,
                                      const char* name) {
        return ResolutionId{static_cast<int>(interface), static_cast<int>(protocol),
                            QString::fromUtf8(name)};
    }

    // Poll thread.
    void report(const ResolutionTable::Change& change) {
        if (change.removed && on_server_removed) on_server_removed(*change.removed);
        if (!change.added) return;

        if (on_server_added) on_server_added(*change.added);
        if (!got_result_) {
            got_result_ = true;
            if (on_progress_changed) on_progress_changed(1.0);
        }
    }

    void handle_resolved(const ResolutionId& id,
                         const AvahiAddress* address,
                         uint16_t port,
                         AvahiStringList* txt) {
        ResolvedService service;
        service.instance_name = id.instance_name;
        service.port = port;

        char addr_str[AVAHI_ADDRESS_STR_MAX];
        avahi_address_snprint(addr_str, sizeof(addr_str), address);
        service.address = QString::fromUtf8(addr_str);

        for (AvahiStringList* item = txt; item; item = avahi_string_list_get_next(item)) {
            char* key = nullptr;
            char* value = nullptr;
            if (avahi_string_list_get_pair(item, &key, &value, nullptr) == 0) {
                service.txt.insert(QString::fromUtf8(key),
                                   value ? QString::fromUtf8(value) : QString());
                avahi_free(key);
                avahi_free(value);
            }
        }

        auto record = record_from_resolved(service);
        if (!record) {
            qCDebug(lanscoutMdnsLog) << "Skipping unusable address" << service.address
                                     << "for" << service.instance_name;
            return;
        }

        qCInfo(lanscoutMdnsLog) << "Resolved server:" << record->display_name();
        report(table_.resolved(id, std::move(*record)));
    }
};

std::unique_ptr<DiscoveryBackend> createAvahiBrowseBackend() {
    return std::make_unique<AvahiBrowseBackend>();
}

} // namespace lanscout::network

#endif // LANSCOUT_HAS_AVAHI
