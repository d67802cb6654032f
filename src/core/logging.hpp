#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lanscoutMulticastLog)
Q_DECLARE_LOGGING_CATEGORY(lanscoutMdnsLog)
Q_DECLARE_LOGGING_CATEGORY(lanscoutMergeLog)
Q_DECLARE_LOGGING_CATEGORY(lanscoutToolsLog)

namespace lanscout {

// Installs a Qt message handler that appends every message to a log file
// and still writes it to stderr.
void install_file_logging();

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Turns on debug output for every lanscout.* category.
void enable_debug_logging();

} // namespace lanscout
