#pragma once

#include "vm/vm_types.hpp"
#include <string>
#include <vector>

// Hypervisor management operations used by the snapshot engine and the
// VM resolver. Every method returns false on failure and records the
// cause in getLastError()/getLastErrorCode().
class HypervisorConnection {
public:
    virtual ~HypervisorConnection() = default;

    // Connection management
    virtual bool connect(const std::string& uri) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Domain queries
    virtual bool getDomainState(const std::string& domain, DomainState& state) = 0;
    virtual bool getDomainXML(const std::string& domain, std::string& xml) = 0;

    // Snapshot primitives
    virtual bool createSnapshot(const std::string& domain, const std::string& snapshotXml,
                                const SnapshotCreateOptions& options) = 0;
    virtual bool listSnapshotNames(const std::string& domain, std::vector<std::string>& names) = 0;
    virtual bool getSnapshotXML(const std::string& domain, const std::string& snapshot, std::string& xml) = 0;
    // startRunning asks for the domain to be running afterwards even when the
    // snapshot carries no memory state.
    virtual bool revertToSnapshot(const std::string& domain, const std::string& snapshot, bool startRunning) = 0;
    virtual bool deleteSnapshot(const std::string& domain, const std::string& snapshot, bool metadataOnly) = 0;

    // Guest agent
    virtual bool agentCommand(const std::string& domain, const std::string& command,
                              int timeoutSeconds, std::string& response) = 0;

    virtual std::string getLastError() const = 0;
    virtual HypervisorError getLastErrorCode() const = 0;
};
