#pragma once

#include <ostream>

namespace mypv {

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    // connected, but last requests failed
    DEGRADED
};

inline const char*
connectionStateName(ConnectionState state) {
    switch(state) {
        case ConnectionState::DISCONNECTED: return "disconnected";
        case ConnectionState::CONNECTING: return "connecting";
        case ConnectionState::CONNECTED: return "connected";
        case ConnectionState::DEGRADED: return "degraded";
    }
    return "unknown";
}

inline std::ostream&
operator<<(std::ostream& strm, ConnectionState state) {
    return strm << connectionStateName(state);
}

}
