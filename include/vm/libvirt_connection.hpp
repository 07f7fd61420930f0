#pragma once

#include "vm/hypervisor_connection.hpp"
#include <libvirt/libvirt.h>
#include <string>
#include <vector>

class LibvirtConnection : public HypervisorConnection {
public:
    LibvirtConnection();
    ~LibvirtConnection() override;

    LibvirtConnection(const LibvirtConnection&) = delete;
    LibvirtConnection& operator=(const LibvirtConnection&) = delete;

    bool connect(const std::string& uri) override;
    void disconnect() override;
    bool isConnected() const override;

    bool getDomainState(const std::string& domain, DomainState& state) override;
    bool getDomainXML(const std::string& domain, std::string& xml) override;

    bool createSnapshot(const std::string& domain, const std::string& snapshotXml,
                        const SnapshotCreateOptions& options) override;
    bool listSnapshotNames(const std::string& domain, std::vector<std::string>& names) override;
    bool getSnapshotXML(const std::string& domain, const std::string& snapshot, std::string& xml) override;
    bool revertToSnapshot(const std::string& domain, const std::string& snapshot, bool startRunning) override;
    bool deleteSnapshot(const std::string& domain, const std::string& snapshot, bool metadataOnly) override;

    bool agentCommand(const std::string& domain, const std::string& command,
                      int timeoutSeconds, std::string& response) override;

    std::string getLastError() const override;
    HypervisorError getLastErrorCode() const override;

private:
    virDomainPtr lookupDomain(const std::string& domain);
    virDomainSnapshotPtr lookupSnapshot(virDomainPtr dom, const std::string& snapshot);
    void setError(const std::string& context);
    void setError(HypervisorError code, const std::string& message);

    virConnectPtr conn_;
    std::string lastError_;
    HypervisorError lastErrorCode_;
};
