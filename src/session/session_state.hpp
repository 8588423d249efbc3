#pragma once

namespace mirador {

// Lifecycle of the single mirroring session.
// Idle -> FetchingServer -> DeployingServer -> NegotiatingEncoder -> Starting -> Running
// Any state -> Stopping -> Idle (failures unwind straight back to Idle)
enum class SessionState {
    Idle,
    FetchingServer,
    DeployingServer,
    NegotiatingEncoder,
    Starting,
    Running,
    Stopping,
};

inline const char* sessionStateToString(SessionState s) {
    switch (s) {
        case SessionState::Idle:               return "Idle";
        case SessionState::FetchingServer:     return "FetchingServer";
        case SessionState::DeployingServer:    return "DeployingServer";
        case SessionState::NegotiatingEncoder: return "NegotiatingEncoder";
        case SessionState::Starting:           return "Starting";
        case SessionState::Running:            return "Running";
        case SessionState::Stopping:           return "Stopping";
    }
    return "Unknown";
}

// True while start() is still working through the deployment sequence
inline bool isStarting(SessionState s) {
    return s == SessionState::FetchingServer || s == SessionState::DeployingServer ||
           s == SessionState::NegotiatingEncoder || s == SessionState::Starting;
}

} // namespace mirador
