#pragma once

#define KAVACH_VERSION "0.4.0"
#define KAVACH_PROTOCOL_VERSION_MAJOR 1
#define KAVACH_PROTOCOL_VERSION_MINOR 0

namespace kavach {
namespace version {

// Client protocol is served when the major matches and the daemon's minor
// is at least the client's
inline bool protocol_compatible(int major, int minor) {
    return major == KAVACH_PROTOCOL_VERSION_MAJOR &&
           minor >= 0 && minor <= KAVACH_PROTOCOL_VERSION_MINOR;
}

} // namespace version
} // namespace kavach
