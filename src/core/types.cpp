#include "core/types.hpp"
#include "core/result.hpp"

#include <tuple>

namespace lanscout {

const char* to_string(ServerSource source) noexcept {
    switch (source) {
        case ServerSource::Multicast: return "multicast";
        case ServerSource::Mdns: return "mdns";
    }
    return "unknown";
}

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Decode: return "decode";
        case ErrorKind::Configuration: return "configuration";
    }
    return "unknown";
}

bool server_display_less(const ServerRecord& a, const ServerRecord& b) {
    return std::forward_as_tuple(a.name, a.host, a.port) <
           std::forward_as_tuple(b.name, b.host, b.port);
}

} // namespace lanscout
