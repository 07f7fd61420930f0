#pragma once

#include <string>

enum class DomainState {
    NoState,
    Running,
    Blocked,
    Paused,
    ShuttingDown,
    ShutOff,
    Crashed,
    Suspended,
    Unknown
};

// Reference to a hypervisor-managed domain. Valid for the duration of one call.
struct VMHandle {
    std::string name;
    DomainState state = DomainState::Unknown;

    bool isRunning() const { return state == DomainState::Running; }
};

enum class HypervisorError {
    None,
    NotConnected,
    DomainNotFound,
    SnapshotNotFound,
    AgentUnresponsive,
    OperationFailed
};

struct SnapshotCreateOptions {
    bool diskOnly = true;
    bool atomic = true;
};

// Names match the <state> element libvirt writes into snapshot XML.
inline std::string domainStateToString(DomainState state) {
    switch (state) {
        case DomainState::NoState:      return "nostate";
        case DomainState::Running:      return "running";
        case DomainState::Blocked:      return "blocked";
        case DomainState::Paused:       return "paused";
        case DomainState::ShuttingDown: return "shutdown";
        case DomainState::ShutOff:      return "shutoff";
        case DomainState::Crashed:      return "crashed";
        case DomainState::Suspended:    return "pmsuspended";
        default:                        return "unknown";
    }
}

inline DomainState domainStateFromString(const std::string& name) {
    if (name == "nostate") return DomainState::NoState;
    if (name == "running") return DomainState::Running;
    if (name == "blocked") return DomainState::Blocked;
    if (name == "paused") return DomainState::Paused;
    if (name == "shutdown") return DomainState::ShuttingDown;
    if (name == "shutoff") return DomainState::ShutOff;
    if (name == "crashed") return DomainState::Crashed;
    if (name == "pmsuspended") return DomainState::Suspended;
    return DomainState::Unknown;
}
