#pragma once

#include "common/error_category.hpp"
#include "snapshot/guest_agent.hpp"
#include "snapshot/snapshot_types.hpp"
#include "vm/hypervisor_connection.hpp"
#include "vm/vm_resolver.hpp"
#include <memory>
#include <string>
#include <vector>

// External disk-only snapshot lifecycle for one hypervisor connection.
// Calls against the same VM must be serialized by the caller.
class SnapshotManager {
public:
    SnapshotManager(std::shared_ptr<HypervisorConnection> connection, int agentTimeoutSeconds = 10);

    bool create(const std::string& vmName, const std::string& snapshotName,
                const std::string& description, bool freezeFilesystem);
    bool revert(const std::string& vmName, const std::string& snapshotName);

    // Removes hypervisor metadata only. Overlay files stay on disk.
    bool remove(const std::string& vmName, const std::string& snapshotName);

    bool list(const std::string& vmName, std::vector<SnapshotDescriptor>& snapshots);

    std::string getLastError() const;
    SnapshotError getLastErrorCode() const;
    ErrorCategory getLastErrorCategory() const;

    // Non-fatal conditions raised by the last operation.
    const std::vector<std::string>& getWarnings() const;

    static bool isValidName(const std::string& name);

private:
    bool beginOperation(const std::string& vmName, const std::string& snapshotName,
                        bool requireName, VMHandle& vm);
    bool createWithOverlays(const VMHandle& vm, const std::string& snapshotName, const std::string& description);
    bool loadDescriptor(const std::string& vmName, const std::string& snapshotName, SnapshotDescriptor& descriptor);
    bool fail(SnapshotError code, const std::string& message);
    void warn(const std::string& message);

    std::shared_ptr<HypervisorConnection> connection_;
    VMResolver resolver_;
    GuestAgent agent_;
    std::string lastError_;
    SnapshotError lastErrorCode_;
    std::vector<std::string> warnings_;
};
