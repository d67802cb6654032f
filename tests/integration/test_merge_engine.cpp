#include <catch2/catch_test_macros.hpp>

#include "support/discovery_fakes.hpp"
#include "network/merge_engine.hpp"

#include <QCoreApplication>

#include <memory>
#include <thread>
#include <vector>

using namespace lanscout;
using namespace lanscout::network;
using namespace lanscout::testing;

namespace {

// Engine over one multicast-like (priority 0) and one mDNS-like (priority 1)
// fake. The raw pointers stay valid for the engine's lifetime.
struct Harness {
    FakeBackend* multicast = nullptr;
    FakeBackend* mdns = nullptr;
    std::unique_ptr<MergeEngine> engine;
    std::vector<MergedState> snapshots;

    Harness() {
        auto low = std::make_unique<FakeBackend>(ServerSource::Multicast, 0);
        auto high = std::make_unique<FakeBackend>(ServerSource::Mdns, 1);
        multicast = low.get();
        mdns = high.get();

        std::vector<std::unique_ptr<DiscoveryBackend>> backends;
        backends.push_back(std::move(high));
        backends.push_back(std::move(low));
        engine = std::make_unique<MergeEngine>(std::move(backends));

        QObject::connect(engine.get(), &MergeEngine::stateChanged, engine.get(),
                         [this](const MergedState& state) { snapshots.push_back(state); });
    }
};

const ServerKey kOffice{QStringLiteral("192.168.1.10"), 8080};

} // namespace

TEST_CASE("MergeEngine: start scans every backend", "[integration][merge]") {
    Harness h;
    h.engine->start();

    REQUIRE(h.engine->phase() == MergeEngine::Phase::Scanning);
    REQUIRE(h.multicast->start_calls == 1);
    REQUIRE(h.mdns->start_calls == 1);
    REQUIRE(h.engine->state().is_scanning);
    REQUIRE(h.engine->state().progress == 0.5);
    REQUIRE(h.engine->state().servers.empty());
    REQUIRE_FALSE(h.snapshots.empty());
}

TEST_CASE("MergeEngine: start twice is the same as once", "[integration][merge]") {
    Harness h;
    h.engine->start();
    const auto after_first = h.engine->state();
    const auto notifications = h.snapshots.size();

    h.engine->start();
    REQUIRE(h.multicast->start_calls == 1);
    REQUIRE(h.mdns->start_calls == 1);
    REQUIRE(h.engine->state() == after_first);
    REQUIRE(h.snapshots.size() == notifications);
}

TEST_CASE("MergeEngine: stop when idle does nothing", "[integration][merge]") {
    Harness h;
    h.engine->stop();
    REQUIRE(h.snapshots.empty());
    REQUIRE(h.multicast->stop_calls == 0);
    REQUIRE(h.engine->phase() == MergeEngine::Phase::Idle);
}

TEST_CASE("MergeEngine: one entry per host and port", "[integration][merge]") {
    Harness h;
    h.engine->start();

    h.multicast->announce(make_server(QStringLiteral("Office"), QStringLiteral("192.168.1.10"), 8080));
    h.multicast->announce(make_server(QStringLiteral("Office"), QStringLiteral("192.168.1.10"), 8080));
    h.mdns->announce(make_server(QStringLiteral("Office"), QStringLiteral("192.168.1.10"), 8080));
    h.mdns->announce(make_server(QStringLiteral("Lab"), QStringLiteral("192.168.1.10"), 9090));

    const auto& servers = h.engine->state().servers;
    REQUIRE(servers.size() == 2);
    REQUIRE(servers[0].name == QStringLiteral("Lab"));
    REQUIRE(servers[1].name == QStringLiteral("Office"));
}

TEST_CASE("MergeEngine: higher priority wins regardless of arrival order", "[integration][merge]") {
    SECTION("multicast first") {
        Harness h;
        h.engine->start();
        h.multicast->announce(make_server(QStringLiteral("Office"), QStringLiteral("192.168.1.10"), 8080));
        h.mdns->announce(make_server(QStringLiteral("Office-mDNS"), QStringLiteral("192.168.1.10"), 8080));

        const auto selected = h.engine->select_server(kOffice);
        REQUIRE(selected.has_value());
        REQUIRE(selected->name == QStringLiteral("Office-mDNS"));
        REQUIRE(selected->source == ServerSource::Mdns);
    }

    SECTION("mDNS first") {
        Harness h;
        h.engine->start();
        h.mdns->announce(make_server(QStringLiteral("Office-mDNS"), QStringLiteral("192.168.1.10"), 8080));
        const auto notifications = h.snapshots.size();
        h.multicast->announce(make_server(QStringLiteral("Office"), QStringLiteral("192.168.1.10"), 8080));

        REQUIRE(h.engine->select_server(kOffice)->name == QStringLiteral("Office-mDNS"));
        // The discarded report changes nothing but progress.
        REQUIRE(h.engine->state().servers.size() == 1);
        REQUIRE(h.snapshots.size() == notifications + 1);
    }
}

TEST_CASE("MergeEngine: equal priority from another backend is discarded", "[integration][merge]") {
    auto first = std::make_unique<FakeBackend>(ServerSource::Multicast, 0);
    auto second = std::make_unique<FakeBackend>(ServerSource::Multicast, 0);
    auto* a = first.get();
    auto* b = second.get();
    std::vector<std::unique_ptr<DiscoveryBackend>> backends;
    backends.push_back(std::move(first));
    backends.push_back(std::move(second));
    MergeEngine engine(std::move(backends));
    engine.start();

    a->announce(make_server(QStringLiteral("First"), QStringLiteral("192.168.1.10"), 8080));
    b->announce(make_server(QStringLiteral("Second"), QStringLiteral("192.168.1.10"), 8080));
    REQUIRE(engine.select_server(kOffice)->name == QStringLiteral("First"));

    // Only the owner's removal counts.
    b->withdraw(kOffice);
    REQUIRE(engine.select_server(kOffice).has_value());
}

TEST_CASE("MergeEngine: a backend refreshing its own record replaces it", "[integration][merge]") {
    Harness h;
    h.engine->start();
    h.multicast->announce(make_server(QStringLiteral("Office"), QStringLiteral("192.168.1.10"), 8080));
    h.multicast->announce(make_server(QStringLiteral("Office 2"), QStringLiteral("192.168.1.10"), 8080));

    REQUIRE(h.engine->state().servers.size() == 1);
    REQUIRE(h.engine->state().servers.front().name == QStringLiteral("Office 2"));
}

TEST_CASE("MergeEngine: removals only apply to the owning backend", "[integration][merge]") {
    Harness h;
    h.engine->start();
    h.multicast->announce(make_server(QStringLiteral("Office"), QStringLiteral("192.168.1.10"), 8080));
    h.mdns->announce(make_server(QStringLiteral("Office-mDNS"), QStringLiteral("192.168.1.10"), 8080));
    h.multicast->announce(make_server(QStringLiteral("Lab"), QStringLiteral("192.168.1.11"), 8080));

    h.multicast->withdraw(kOffice);
    REQUIRE(h.engine->select_server(kOffice)->name == QStringLiteral("Office-mDNS"));

    h.mdns->withdraw(ServerKey{QStringLiteral("192.168.1.11"), 8080});
    REQUIRE(h.engine->state().servers.size() == 2);

    h.mdns->withdraw(kOffice);
    REQUIRE_FALSE(h.engine->select_server(kOffice).has_value());
    REQUIRE(h.engine->state().servers.size() == 1);

    h.multicast->withdraw(ServerKey{QStringLiteral("192.168.1.11"), 8080});
    REQUIRE(h.engine->state().servers.empty());
}

TEST_CASE("MergeEngine: scanning and progress aggregate over backends", "[integration][merge]") {
    Harness h;
    h.engine->start();
    REQUIRE(h.engine->state().progress == 0.5);

    h.mdns->announce(make_server(QStringLiteral("Office"), QStringLiteral("192.168.1.10"), 8080));
    REQUIRE(h.engine->state().progress == 0.75);

    h.multicast->fail_now(Error::transport("socket closed"));
    REQUIRE(h.engine->state().is_scanning);
    REQUIRE(h.engine->state().progress == 0.5);

    h.mdns->fail_now(Error::transport("daemon went away"));
    REQUIRE_FALSE(h.engine->state().is_scanning);
    REQUIRE(h.engine->state().progress == 0.0);
}

TEST_CASE("MergeEngine: every backend failing to start leaves an empty idle view",
          "[integration][merge]") {
    auto low = std::make_unique<FakeBackend>(ServerSource::Multicast, 0);
    auto high = std::make_unique<FakeBackend>(ServerSource::Mdns, 1);
    low->fail_with = Error::configuration("bind to port 12345 failed: address in use");
    high->fail_with = Error::configuration("mDNS not available on this platform");

    std::vector<std::unique_ptr<DiscoveryBackend>> backends;
    backends.push_back(std::move(high));
    backends.push_back(std::move(low));
    MergeEngine engine(std::move(backends));

    std::vector<ServerSource> failed;
    QObject::connect(&engine, &MergeEngine::backendFailed, &engine,
                     [&failed](ServerSource source, const Error&) { failed.push_back(source); });

    engine.start();

    REQUIRE_FALSE(engine.state().is_scanning);
    REQUIRE(engine.state().servers.empty());
    REQUIRE(engine.state().progress == 0.0);
    REQUIRE(engine.last_error().has_value());
    REQUIRE(engine.last_error()->kind == ErrorKind::Configuration);
    REQUIRE(failed == std::vector<ServerSource>{ServerSource::Mdns, ServerSource::Multicast});
}

TEST_CASE("MergeEngine: pause and resume", "[integration][merge]") {
    Harness h;

    h.engine->pause();
    h.engine->resume();
    REQUIRE(h.engine->phase() == MergeEngine::Phase::Idle);
    REQUIRE(h.snapshots.empty());

    h.engine->start();
    h.engine->pause();
    REQUIRE(h.engine->phase() == MergeEngine::Phase::Paused);
    REQUIRE(h.engine->state().is_paused);
    REQUIRE_FALSE(h.engine->state().is_scanning);
    REQUIRE(h.multicast->is_paused());
    REQUIRE(h.mdns->is_paused());

    h.engine->resume();
    REQUIRE(h.engine->phase() == MergeEngine::Phase::Scanning);
    REQUIRE_FALSE(h.engine->state().is_paused);
    REQUIRE(h.engine->state().is_scanning);
    REQUIRE(h.multicast->start_calls == 2);

    h.engine->pause();
    h.engine->stop();
    REQUIRE(h.engine->phase() == MergeEngine::Phase::Idle);
    REQUIRE_FALSE(h.engine->state().is_paused);
}

TEST_CASE("MergeEngine: stop discards the session and start rebuilds it", "[integration][merge]") {
    Harness h;
    h.engine->start();
    h.mdns->announce(make_server(QStringLiteral("Office"), QStringLiteral("192.168.1.10"), 8080));

    h.engine->stop();
    REQUIRE(h.engine->state().servers.empty());
    REQUIRE_FALSE(h.engine->state().is_scanning);

    // Late report for the finished session.
    h.mdns->announce(make_server(QStringLiteral("Office"), QStringLiteral("192.168.1.10"), 8080));
    REQUIRE(h.engine->state().servers.empty());

    h.engine->start();
    REQUIRE(h.engine->state().servers.empty());
    REQUIRE_FALSE(h.engine->last_error().has_value());
}

TEST_CASE("MergeEngine: select_server does not touch discovery", "[integration][merge]") {
    Harness h;
    REQUIRE_FALSE(h.engine->select_server(kOffice).has_value());

    h.engine->start();
    h.multicast->announce(make_server(QStringLiteral("Office"), QStringLiteral("192.168.1.10"), 8080));
    const auto notifications = h.snapshots.size();

    const auto selected = h.engine->select_server(kOffice);
    REQUIRE(selected.has_value());
    REQUIRE(selected->api_url == QStringLiteral("http://192.168.1.10:8080"));
    REQUIRE(h.snapshots.size() == notifications);
    REQUIRE(h.engine->phase() == MergeEngine::Phase::Scanning);
}

TEST_CASE("MergeEngine: every notification carries the full current snapshot",
          "[integration][merge]") {
    Harness h;
    h.engine->start();
    h.multicast->announce(make_server(QStringLiteral("Office"), QStringLiteral("192.168.1.10"), 8080));
    h.mdns->announce(make_server(QStringLiteral("Lab"), QStringLiteral("192.168.1.11"), 8080));

    REQUIRE(h.snapshots.back() == h.engine->state());
    REQUIRE(h.snapshots.back().servers.size() == 2);
    for (size_t i = 1; i < h.snapshots.size(); ++i) {
        REQUIRE_FALSE(h.snapshots[i] == h.snapshots[i - 1]);
    }
}

TEST_CASE("MergeEngine: events from other threads are applied on the engine thread",
          "[integration][merge]") {
    Harness h;
    h.engine->start();

    std::thread worker([&h]() {
        h.mdns->announce(make_server(QStringLiteral("Office"), QStringLiteral("192.168.1.10"), 8080));
        h.mdns->announce(make_server(QStringLiteral("Lab"), QStringLiteral("192.168.1.11"), 8080));
        h.mdns->withdraw(ServerKey{QStringLiteral("192.168.1.11"), 8080});
    });
    worker.join();

    REQUIRE(h.engine->state().servers.empty());

    QCoreApplication::processEvents();

    REQUIRE(h.engine->state().servers.size() == 1);
    REQUIRE(h.engine->state().servers.front().name == QStringLiteral("Office"));
}

TEST_CASE("MergeEngine: reports queued before a pause are not applied after it",
          "[integration][merge]") {
    Harness h;
    h.engine->start();

    std::thread worker([&h]() {
        h.mdns->announce(make_server(QStringLiteral("Office"), QStringLiteral("192.168.1.10"), 8080));
    });
    worker.join();

    h.engine->pause();
    QCoreApplication::processEvents();
    REQUIRE(h.engine->state().servers.empty());
    REQUIRE_FALSE(h.engine->state().is_scanning);

    h.engine->resume();
    QCoreApplication::processEvents();
    REQUIRE(h.engine->state().servers.empty());
    REQUIRE(h.engine->state().progress == 0.5);
}

TEST_CASE("MergeEngine: reports queued before a restart stay in the old session",
          "[integration][merge]") {
    Harness h;
    h.engine->start();

    std::thread worker([&h]() {
        h.mdns->announce(make_server(QStringLiteral("Office"), QStringLiteral("192.168.1.10"), 8080));
        h.mdns->fail_now(Error::transport("daemon went away"));
    });
    worker.join();

    h.engine->stop();
    h.engine->start();
    QCoreApplication::processEvents();

    REQUIRE(h.engine->state().servers.empty());
    REQUIRE(h.engine->state().is_scanning);
    REQUIRE_FALSE(h.engine->last_error().has_value());
}

TEST_CASE("MergeEngine: removals queued from another thread still apply",
          "[integration][merge]") {
    Harness h;
    h.engine->start();
    h.mdns->announce(make_server(QStringLiteral("Office"), QStringLiteral("192.168.1.10"), 8080));
    REQUIRE(h.engine->state().servers.size() == 1);

    std::thread worker([&h]() { h.mdns->withdraw(kOffice); });
    worker.join();

    h.engine->pause();
    h.engine->resume();
    QCoreApplication::processEvents();
    REQUIRE(h.engine->state().servers.empty());
}

TEST_CASE("MergeEngine: stopping a paused engine clears the backends' pause",
          "[integration][merge]") {
    Harness h;
    h.engine->start();
    h.engine->pause();
    h.engine->stop();

    REQUIRE_FALSE(h.multicast->is_paused());
    REQUIRE_FALSE(h.mdns->is_paused());

    h.engine->start();
    REQUIRE(h.multicast->is_running());
    REQUIRE_FALSE(h.multicast->is_paused());
    REQUIRE_FALSE(h.engine->state().is_paused);
}

TEST_CASE("MergeEngine: destruction stops backends without publishing", "[integration][merge]") {
    auto backend = std::make_unique<FakeBackend>(ServerSource::Mdns, 1);
    auto* fake = backend.get();
    int stop_calls_seen = 0;
    std::vector<std::unique_ptr<DiscoveryBackend>> backends;
    backends.push_back(std::move(backend));

    auto engine = std::make_unique<MergeEngine>(std::move(backends));
    engine->start();
    fake->announce(make_server(QStringLiteral("Office"), QStringLiteral("192.168.1.10"), 8080));

    int notifications = 0;
    QObject::connect(engine.get(), &MergeEngine::stateChanged, engine.get(),
                     [&notifications](const MergedState&) { ++notifications; });
    // Runs while the backend is still attached, before it is destroyed.
    fake->on_scanning_changed = [&stop_calls_seen, fake, inner = fake->on_scanning_changed](bool s) {
        if (!s) stop_calls_seen = fake->stop_calls;
        inner(s);
    };

    engine.reset();

    REQUIRE(stop_calls_seen == 1);
    REQUIRE(notifications == 0);
}
