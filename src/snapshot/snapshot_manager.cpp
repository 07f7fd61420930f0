#include "snapshot/snapshot_manager.hpp"
#include "snapshot/snapshot_xml.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <regex>

SnapshotManager::SnapshotManager(std::shared_ptr<HypervisorConnection> connection, int agentTimeoutSeconds)
    : connection_(connection)
    , resolver_(connection)
    , agent_(connection, agentTimeoutSeconds)
    , lastErrorCode_(SnapshotError::None) {
}

bool SnapshotManager::create(const std::string& vmName, const std::string& snapshotName,
                             const std::string& description, bool freezeFilesystem) {
    VMHandle vm;
    if (!beginOperation(vmName, snapshotName, true, vm)) {
        return false;
    }

    std::vector<std::string> existing;
    if (!connection_->listSnapshotNames(vm.name, existing)) {
        return fail(SnapshotError::HypervisorFailure, "Failed to list snapshots: " + connection_->getLastError());
    }
    if (std::find(existing.begin(), existing.end(), snapshotName) != existing.end()) {
        return fail(SnapshotError::AlreadyExists,
                    "Snapshot '" + snapshotName + "' already exists on VM '" + vm.name + "'");
    }

    Logger::info("Creating external snapshot '" + snapshotName + "' of VM '" + vm.name + "'");

    bool freezeAttempted = false;
    if (freezeFilesystem && vm.isRunning()) {
        freezeAttempted = true;
        if (agent_.freeze(vm.name)) {
            Logger::info("Guest filesystems frozen on " + vm.name);
        } else {
            warn("Filesystem freeze failed, continuing without quiescing: " + agent_.getLastError());
        }
    } else if (freezeFilesystem) {
        Logger::debug("VM '" + vm.name + "' is not running, skipping filesystem freeze");
    }

    bool created = false;
    try {
        created = createWithOverlays(vm, snapshotName, description);
    } catch (const std::exception& e) {
        created = fail(SnapshotError::HypervisorFailure, std::string("Snapshot creation failed: ") + e.what());
    }

    // Thaw on every path that attempted a freeze, including a failed freeze.
    if (freezeAttempted) {
        if (agent_.thaw(vm.name)) {
            Logger::info("Guest filesystems thawed on " + vm.name);
        } else {
            warn("Filesystem thaw failed: " + agent_.getLastError());
        }
    }

    if (created) {
        Logger::info("Snapshot '" + snapshotName + "' created");
    }
    return created;
}

bool SnapshotManager::revert(const std::string& vmName, const std::string& snapshotName) {
    VMHandle vm;
    if (!beginOperation(vmName, snapshotName, true, vm)) {
        return false;
    }

    SnapshotDescriptor descriptor;
    if (!loadDescriptor(vm.name, snapshotName, descriptor)) {
        return false;
    }

    Logger::info("Reverting VM '" + vm.name + "' to snapshot '" + snapshotName + "'");
    bool startRunning = descriptor.vmState == DomainState::Running;
    if (!connection_->revertToSnapshot(vm.name, snapshotName, startRunning)) {
        if (connection_->getLastErrorCode() == HypervisorError::SnapshotNotFound) {
            return fail(SnapshotError::NotFound, "Snapshot '" + snapshotName + "' not found");
        }
        return fail(SnapshotError::HypervisorFailure, "Revert failed: " + connection_->getLastError());
    }

    DomainState state = DomainState::Unknown;
    if (connection_->getDomainState(vm.name, state)) {
        if (descriptor.vmState != DomainState::Unknown && state != descriptor.vmState) {
            warn("VM '" + vm.name + "' is " + domainStateToString(state) + " after revert, snapshot recorded " +
                 domainStateToString(descriptor.vmState));
        }
    } else {
        warn("Could not read VM state after revert: " + connection_->getLastError());
    }

    Logger::info("VM '" + vm.name + "' reverted to '" + snapshotName + "'");
    return true;
}

bool SnapshotManager::remove(const std::string& vmName, const std::string& snapshotName) {
    VMHandle vm;
    if (!beginOperation(vmName, snapshotName, true, vm)) {
        return false;
    }

    SnapshotDescriptor descriptor;
    if (!loadDescriptor(vm.name, snapshotName, descriptor)) {
        return false;
    }

    if (vm.isRunning()) {
        warn("VM '" + vm.name + "' is running while deleting snapshot '" + snapshotName + "'");
    }

    if (!connection_->deleteSnapshot(vm.name, snapshotName, true)) {
        if (connection_->getLastErrorCode() == HypervisorError::SnapshotNotFound) {
            return fail(SnapshotError::NotFound, "Snapshot '" + snapshotName + "' not found");
        }
        return fail(SnapshotError::HypervisorFailure, "Delete failed: " + connection_->getLastError());
    }

    Logger::info("Snapshot '" + snapshotName + "' metadata removed from VM '" + vm.name + "'");
    for (const auto& file : descriptor.diskFiles) {
        Logger::info("Overlay file left on disk: " + file);
    }
    return true;
}

bool SnapshotManager::list(const std::string& vmName, std::vector<SnapshotDescriptor>& snapshots) {
    VMHandle vm;
    if (!beginOperation(vmName, std::string(), false, vm)) {
        return false;
    }

    std::vector<std::string> names;
    if (!connection_->listSnapshotNames(vm.name, names)) {
        return fail(SnapshotError::HypervisorFailure, "Failed to list snapshots: " + connection_->getLastError());
    }

    snapshots.clear();
    for (const auto& name : names) {
        SnapshotDescriptor descriptor;
        std::string xml;
        std::string parseError;
        if (!connection_->getSnapshotXML(vm.name, name, xml)) {
            parseError = connection_->getLastError();
        } else if (!SnapshotXml::parseSnapshotXML(xml, descriptor, parseError)) {
            descriptor = SnapshotDescriptor();
        }

        if (!descriptor.parsed) {
            descriptor.name = name;
            descriptor.description = "Error reading snapshot: " + parseError;
            descriptor.kind = SnapshotKind::Unknown;
            warn("Could not read snapshot '" + name + "': " + parseError);
        }
        snapshots.push_back(descriptor);
    }

    std::stable_sort(snapshots.begin(), snapshots.end(),
                     [](const SnapshotDescriptor& a, const SnapshotDescriptor& b) {
                         return a.creationTime < b.creationTime;
                     });
    return true;
}

std::string SnapshotManager::getLastError() const {
    return lastError_;
}

SnapshotError SnapshotManager::getLastErrorCode() const {
    return lastErrorCode_;
}

ErrorCategory SnapshotManager::getLastErrorCategory() const {
    switch (lastErrorCode_) {
        case SnapshotError::None:
            return ErrorCategory::None;
        case SnapshotError::InvalidName:
        case SnapshotError::NotFound:
        case SnapshotError::AlreadyExists:
            return ErrorCategory::Configuration;
        case SnapshotError::ConsistencyFailure:
            return ErrorCategory::Consistency;
        default:
            return ErrorCategory::Environment;
    }
}

const std::vector<std::string>& SnapshotManager::getWarnings() const {
    return warnings_;
}

bool SnapshotManager::isValidName(const std::string& name) {
    static const std::regex namePattern("^[A-Za-z0-9._-]+$");
    return std::regex_match(name, namePattern);
}

bool SnapshotManager::beginOperation(const std::string& vmName, const std::string& snapshotName,
                                     bool requireName, VMHandle& vm) {
    lastError_.clear();
    lastErrorCode_ = SnapshotError::None;
    warnings_.clear();

    if (requireName && !isValidName(snapshotName)) {
        return fail(SnapshotError::InvalidName, "Invalid snapshot name '" + snapshotName + "'");
    }
    if (!resolver_.resolve(vmName, vm)) {
        return fail(SnapshotError::VmNotFound, resolver_.getLastError());
    }
    return true;
}

bool SnapshotManager::createWithOverlays(const VMHandle& vm, const std::string& snapshotName,
                                         const std::string& description) {
    std::string domainXml;
    if (!connection_->getDomainXML(vm.name, domainXml)) {
        return fail(SnapshotError::HypervisorFailure,
                    "Failed to read configuration of VM '" + vm.name + "': " + connection_->getLastError());
    }

    std::vector<std::string> excluded;
    std::vector<DiskOverlay> overlays = SnapshotXml::planOverlays(domainXml, snapshotName, &excluded);
    for (const auto& target : excluded) {
        warn("Disk " + target + " is not a file-backed image, excluding it from snapshot '" + snapshotName + "'");
    }
    if (overlays.empty()) {
        return fail(SnapshotError::NoDisks, "VM '" + vm.name + "' has no file-backed disks to snapshot");
    }
    for (const auto& overlay : overlays) {
        Logger::debug("Disk " + overlay.target + ": " + overlay.sourceFile + " -> " + overlay.overlayFile);
        if (std::filesystem::exists(overlay.overlayFile)) {
            warn("Overlay file already exists: " + overlay.overlayFile);
        }
    }

    std::string snapshotXml = SnapshotXml::buildSnapshotXML(snapshotName, description, overlays, excluded);
    SnapshotCreateOptions options;
    options.diskOnly = true;
    options.atomic = true;
    if (!connection_->createSnapshot(vm.name, snapshotXml, options)) {
        return fail(SnapshotError::HypervisorFailure, "Hypervisor refused snapshot: " + connection_->getLastError());
    }

    std::vector<std::string> missing;
    for (const auto& overlay : overlays) {
        if (!std::filesystem::exists(overlay.overlayFile)) {
            missing.push_back(overlay.overlayFile);
        }
    }
    if (!missing.empty()) {
        std::string message = "Snapshot '" + snapshotName + "' reported success but overlay files are missing:";
        for (const auto& file : missing) {
            message += " " + file;
        }
        return fail(SnapshotError::ConsistencyFailure, message);
    }
    return true;
}

bool SnapshotManager::loadDescriptor(const std::string& vmName, const std::string& snapshotName,
                                     SnapshotDescriptor& descriptor) {
    std::string xml;
    if (!connection_->getSnapshotXML(vmName, snapshotName, xml)) {
        if (connection_->getLastErrorCode() == HypervisorError::SnapshotNotFound) {
            return fail(SnapshotError::NotFound,
                        "Snapshot '" + snapshotName + "' not found on VM '" + vmName + "'");
        }
        return fail(SnapshotError::HypervisorFailure, connection_->getLastError());
    }

    std::string error;
    if (!SnapshotXml::parseSnapshotXML(xml, descriptor, error)) {
        warn("Could not parse descriptor of snapshot '" + snapshotName + "': " + error);
        descriptor = SnapshotDescriptor();
        descriptor.name = snapshotName;
    }
    return true;
}

bool SnapshotManager::fail(SnapshotError code, const std::string& message) {
    lastErrorCode_ = code;
    lastError_ = message;
    Logger::error(message);
    return false;
}

void SnapshotManager::warn(const std::string& message) {
    warnings_.push_back(message);
    Logger::warning(message);
}
