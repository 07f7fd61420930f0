#include "vm/libvirt_connection.hpp"
#include "common/logger.hpp"
#include <libvirt/libvirt-qemu.h>
#include <libvirt/virterror.h>
#include <cstdlib>

namespace {

DomainState fromVirState(int state) {
    switch (state) {
        case VIR_DOMAIN_NOSTATE:     return DomainState::NoState;
        case VIR_DOMAIN_RUNNING:     return DomainState::Running;
        case VIR_DOMAIN_BLOCKED:     return DomainState::Blocked;
        case VIR_DOMAIN_PAUSED:      return DomainState::Paused;
        case VIR_DOMAIN_SHUTDOWN:    return DomainState::ShuttingDown;
        case VIR_DOMAIN_SHUTOFF:     return DomainState::ShutOff;
        case VIR_DOMAIN_CRASHED:     return DomainState::Crashed;
        case VIR_DOMAIN_PMSUSPENDED: return DomainState::Suspended;
        default:                     return DomainState::Unknown;
    }
}

// Takes ownership of a string allocated by libvirt.
std::string takeString(char* value) {
    if (!value) {
        return std::string();
    }
    std::string result(value);
    free(value);
    return result;
}

} // namespace

LibvirtConnection::LibvirtConnection()
    : conn_(nullptr)
    , lastError_("")
    , lastErrorCode_(HypervisorError::None) {
}

LibvirtConnection::~LibvirtConnection() {
    disconnect();
}

bool LibvirtConnection::connect(const std::string& uri) {
    if (isConnected()) {
        disconnect();
    }

    conn_ = virConnectOpenAuth(uri.c_str(), virConnectAuthPtrDefault, 0);
    if (!conn_) {
        setError("Failed to connect to hypervisor at " + uri);
        lastErrorCode_ = HypervisorError::NotConnected;
        return false;
    }

    Logger::debug("Connected to hypervisor at " + uri);
    return true;
}

void LibvirtConnection::disconnect() {
    if (conn_) {
        virConnectClose(conn_);
        conn_ = nullptr;
    }
}

bool LibvirtConnection::isConnected() const {
    return conn_ != nullptr;
}

bool LibvirtConnection::getDomainState(const std::string& domain, DomainState& state) {
    virDomainPtr dom = lookupDomain(domain);
    if (!dom) {
        return false;
    }

    int virState = 0;
    int reason = 0;
    bool ok = virDomainGetState(dom, &virState, &reason, 0) == 0;
    if (ok) {
        state = fromVirState(virState);
    } else {
        setError("Failed to get state of domain " + domain);
    }
    virDomainFree(dom);
    return ok;
}

bool LibvirtConnection::getDomainXML(const std::string& domain, std::string& xml) {
    virDomainPtr dom = lookupDomain(domain);
    if (!dom) {
        return false;
    }

    char* desc = virDomainGetXMLDesc(dom, 0);
    virDomainFree(dom);
    if (!desc) {
        setError("Failed to get XML description of domain " + domain);
        return false;
    }
    xml = takeString(desc);
    return true;
}

bool LibvirtConnection::createSnapshot(const std::string& domain, const std::string& snapshotXml,
                                       const SnapshotCreateOptions& options) {
    virDomainPtr dom = lookupDomain(domain);
    if (!dom) {
        return false;
    }

    unsigned int flags = 0;
    if (options.diskOnly) {
        flags |= VIR_DOMAIN_SNAPSHOT_CREATE_DISK_ONLY;
    }
    if (options.atomic) {
        flags |= VIR_DOMAIN_SNAPSHOT_CREATE_ATOMIC;
    }

    virDomainSnapshotPtr snap = virDomainSnapshotCreateXML(dom, snapshotXml.c_str(), flags);
    virDomainFree(dom);
    if (!snap) {
        setError("Failed to create snapshot on domain " + domain);
        return false;
    }
    virDomainSnapshotFree(snap);
    return true;
}

bool LibvirtConnection::listSnapshotNames(const std::string& domain, std::vector<std::string>& names) {
    virDomainPtr dom = lookupDomain(domain);
    if (!dom) {
        return false;
    }

    virDomainSnapshotPtr* snaps = nullptr;
    int count = virDomainListAllSnapshots(dom, &snaps, 0);
    virDomainFree(dom);
    if (count < 0) {
        setError("Failed to list snapshots of domain " + domain);
        return false;
    }

    names.clear();
    for (int i = 0; i < count; ++i) {
        const char* name = virDomainSnapshotGetName(snaps[i]);
        if (name) {
            names.emplace_back(name);
        }
        virDomainSnapshotFree(snaps[i]);
    }
    free(snaps);
    return true;
}

bool LibvirtConnection::getSnapshotXML(const std::string& domain, const std::string& snapshot, std::string& xml) {
    virDomainPtr dom = lookupDomain(domain);
    if (!dom) {
        return false;
    }

    virDomainSnapshotPtr snap = lookupSnapshot(dom, snapshot);
    virDomainFree(dom);
    if (!snap) {
        return false;
    }

    char* desc = virDomainSnapshotGetXMLDesc(snap, 0);
    virDomainSnapshotFree(snap);
    if (!desc) {
        setError("Failed to get XML description of snapshot " + snapshot);
        return false;
    }
    xml = takeString(desc);
    return true;
}

bool LibvirtConnection::revertToSnapshot(const std::string& domain, const std::string& snapshot, bool startRunning) {
    virDomainPtr dom = lookupDomain(domain);
    if (!dom) {
        return false;
    }

    virDomainSnapshotPtr snap = lookupSnapshot(dom, snapshot);
    virDomainFree(dom);
    if (!snap) {
        return false;
    }

    unsigned int flags = startRunning ? VIR_DOMAIN_SNAPSHOT_REVERT_RUNNING : 0;
    bool ok = virDomainRevertToSnapshot(snap, flags) == 0;
    if (!ok) {
        setError("Failed to revert domain " + domain + " to snapshot " + snapshot);
    }
    virDomainSnapshotFree(snap);
    return ok;
}

bool LibvirtConnection::deleteSnapshot(const std::string& domain, const std::string& snapshot, bool metadataOnly) {
    virDomainPtr dom = lookupDomain(domain);
    if (!dom) {
        return false;
    }

    virDomainSnapshotPtr snap = lookupSnapshot(dom, snapshot);
    virDomainFree(dom);
    if (!snap) {
        return false;
    }

    unsigned int flags = metadataOnly ? VIR_DOMAIN_SNAPSHOT_DELETE_METADATA_ONLY : 0;
    bool ok = virDomainSnapshotDelete(snap, flags) == 0;
    if (!ok) {
        setError("Failed to delete snapshot " + snapshot);
    }
    virDomainSnapshotFree(snap);
    return ok;
}

bool LibvirtConnection::agentCommand(const std::string& domain, const std::string& command,
                                     int timeoutSeconds, std::string& response) {
    virDomainPtr dom = lookupDomain(domain);
    if (!dom) {
        return false;
    }

    char* reply = virDomainQemuAgentCommand(dom, command.c_str(), timeoutSeconds, 0);
    virDomainFree(dom);
    if (!reply) {
        setError("Guest agent command failed on domain " + domain);
        return false;
    }
    response = takeString(reply);
    return true;
}

std::string LibvirtConnection::getLastError() const {
    return lastError_;
}

HypervisorError LibvirtConnection::getLastErrorCode() const {
    return lastErrorCode_;
}

virDomainPtr LibvirtConnection::lookupDomain(const std::string& domain) {
    if (!isConnected()) {
        setError(HypervisorError::NotConnected, "Not connected to hypervisor");
        return nullptr;
    }

    virDomainPtr dom = virDomainLookupByName(conn_, domain.c_str());
    if (!dom) {
        setError("Failed to look up domain " + domain);
    }
    return dom;
}

virDomainSnapshotPtr LibvirtConnection::lookupSnapshot(virDomainPtr dom, const std::string& snapshot) {
    virDomainSnapshotPtr snap = virDomainSnapshotLookupByName(dom, snapshot.c_str(), 0);
    if (!snap) {
        setError("Failed to look up snapshot " + snapshot);
    }
    return snap;
}

void LibvirtConnection::setError(const std::string& context) {
    virErrorPtr err = virGetLastError();
    HypervisorError code = HypervisorError::OperationFailed;
    if (err) {
        switch (err->code) {
            case VIR_ERR_NO_DOMAIN:
                code = HypervisorError::DomainNotFound;
                break;
            case VIR_ERR_NO_DOMAIN_SNAPSHOT:
                code = HypervisorError::SnapshotNotFound;
                break;
            case VIR_ERR_AGENT_UNRESPONSIVE:
                code = HypervisorError::AgentUnresponsive;
                break;
            default:
                break;
        }
    }
    setError(code, context + ": " + std::string(virGetLastErrorMessage()));
}

void LibvirtConnection::setError(HypervisorError code, const std::string& message) {
    lastErrorCode_ = code;
    lastError_ = message;
    Logger::debug(message);
}
