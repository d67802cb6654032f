#pragma once

#include "core/types.hpp"

#include <QString>

namespace lanscout::cli {

struct SnapshotFormatOptions {
    bool includeUrls = false;
};

// Human-readable listing of a merged snapshot:
//   scanning=yes paused=no progress=75% servers=2
//     Office (192.168.1.10:8080) [mdns]
QString format_snapshot(const MergedState& state, const SnapshotFormatOptions& options = {});

// One compact JSON object per snapshot, suitable for line-oriented consumers.
QString format_snapshot_json(const MergedState& state);

} // namespace lanscout::cli
