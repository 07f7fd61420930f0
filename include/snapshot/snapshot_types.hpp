#pragma once

#include "vm/vm_types.hpp"
#include <string>
#include <vector>

enum class SnapshotKind {
    ExternalMemoryAndDisk,
    ExternalDiskOnly,
    Internal,
    Unknown
};

inline std::string snapshotKindToString(SnapshotKind kind) {
    switch (kind) {
        case SnapshotKind::ExternalMemoryAndDisk: return "External (Memory + Disk)";
        case SnapshotKind::ExternalDiskOnly:      return "External (Disk Only)";
        case SnapshotKind::Internal:              return "Internal";
        default:                                  return "Unknown";
    }
}

struct SnapshotDescriptor {
    std::string name;
    std::string description;
    long long creationTime = 0;  // seconds since epoch
    DomainState vmState = DomainState::Unknown;
    std::vector<std::string> diskFiles;  // overlay file per disk
    std::vector<std::string> diskTargets;  // device name per overlay, same order
    SnapshotKind kind = SnapshotKind::Unknown;
    bool parsed = false;  // false for placeholder entries
};

// A file-backed disk of a domain and the overlay a snapshot will redirect it to.
struct DiskOverlay {
    std::string target;       // e.g. vda
    std::string sourceFile;
    std::string overlayFile;
};

enum class SnapshotError {
    None,
    InvalidName,
    VmNotFound,
    NotFound,
    AlreadyExists,
    NoDisks,
    HypervisorFailure,
    ConsistencyFailure
};
