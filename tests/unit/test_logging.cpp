#include <catch2/catch_test_macros.hpp>

#include "core/logging.hpp"

#include <QLoggingCategory>
#include <QStandardPaths>

TEST_CASE("Logging: default log file lives under the app data directory", "[unit][logging]") {
    const auto path = lanscout::default_log_file_path();
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);

    REQUIRE_FALSE(path.isEmpty());
    REQUIRE(path.startsWith(base));
    REQUIRE(path.endsWith(QStringLiteral("logs/lanscout.log")));
}

TEST_CASE("Logging: categories default to info and debug can be enabled", "[unit][logging]") {
    REQUIRE(lanscoutMergeLog().isInfoEnabled());
    REQUIRE_FALSE(lanscoutMergeLog().isDebugEnabled());

    lanscout::enable_debug_logging();
    REQUIRE(lanscoutMergeLog().isDebugEnabled());
    REQUIRE(lanscoutMulticastLog().isDebugEnabled());
    REQUIRE(lanscoutMdnsLog().isDebugEnabled());

    QLoggingCategory::setFilterRules(QString());
    REQUIRE_FALSE(lanscoutMergeLog().isDebugEnabled());
}
