#pragma once
#include <string>

// Session lifecycle. Failed is terminal until start() is called again.
enum class ConnectionState {
    Idle,
    Connecting,
    Authenticating,
    Ready,
    Degraded,
    Closed,
    Failed
};

inline const char* toString(ConnectionState s) {
    switch (s) {
        case ConnectionState::Idle:           return "Idle";
        case ConnectionState::Connecting:     return "Connecting";
        case ConnectionState::Authenticating: return "Authenticating";
        case ConnectionState::Ready:          return "Ready";
        case ConnectionState::Degraded:       return "Degraded";
        case ConnectionState::Closed:         return "Closed";
        case ConnectionState::Failed:         return "Failed";
    }
    return "Unknown";
}

inline bool isTransitionAllowed(ConnectionState from, ConnectionState to) {
    using S = ConnectionState;
    switch (from) {
        case S::Idle:
            return to == S::Connecting || to == S::Closed;
        case S::Connecting:
            return to == S::Authenticating || to == S::Degraded || to == S::Failed || to == S::Closed;
        case S::Authenticating:
            return to == S::Ready || to == S::Degraded || to == S::Failed || to == S::Closed;
        case S::Ready:
            return to == S::Degraded || to == S::Closed;
        case S::Degraded:
            // Failed: credentials rejected while re-signing for the next attempt
            return to == S::Connecting || to == S::Closed || to == S::Failed;
        case S::Closed:
        case S::Failed:
            return to == S::Connecting;
    }
    return false;
}
