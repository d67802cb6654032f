#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <QByteArray>

namespace lanscout::network {

// Multicast announcement message helpers (used by MulticastReceiver).
// Kept separate so encode/decode can be tested without sockets.
//
// Wire format: one UDP datagram carrying one compact UTF-8 JSON object
//   { "name": string, "host": string, "port": integer,
//     "apiURL": string, "wsURL": string }

QByteArray encode_announcement(const ServerRecord& record);

// Decoded records are tagged ServerSource::Multicast. Errors are ErrorKind::Decode.
Result<ServerRecord, Error> decode_announcement(const QByteArray& datagram);

} // namespace lanscout::network
