#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <QString>

namespace lanscout::cli {

struct AnnounceOptions {
    QString name;
    QString host;
    QString port;
    QString apiUrl;   // empty: http://<host>:<port>
    QString wsUrl;    // empty: ws://<host>:<port>
};

// Validates the announce command's arguments and builds the record to send.
[[nodiscard]] Result<ServerRecord> build_announcement(const AnnounceOptions& options);

} // namespace lanscout::cli
