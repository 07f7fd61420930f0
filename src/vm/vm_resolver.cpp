#include "vm/vm_resolver.hpp"
#include "common/logger.hpp"

VMResolver::VMResolver(std::shared_ptr<HypervisorConnection> connection)
    : connection_(std::move(connection))
    , lastErrorCode_(HypervisorError::None) {
}

bool VMResolver::resolve(const std::string& name, VMHandle& handle) {
    lastError_.clear();
    lastErrorCode_ = HypervisorError::None;

    if (name.empty()) {
        lastError_ = "VM name is empty";
        lastErrorCode_ = HypervisorError::DomainNotFound;
        return false;
    }
    if (!connection_ || !connection_->isConnected()) {
        lastError_ = "Not connected to hypervisor";
        lastErrorCode_ = HypervisorError::NotConnected;
        return false;
    }

    DomainState state = DomainState::Unknown;
    if (!connection_->getDomainState(name, state)) {
        lastErrorCode_ = connection_->getLastErrorCode();
        if (lastErrorCode_ == HypervisorError::DomainNotFound) {
            lastError_ = "VM '" + name + "' not found";
        } else {
            lastError_ = connection_->getLastError();
        }
        return false;
    }

    handle.name = name;
    handle.state = state;
    Logger::debug("Resolved VM " + name + " (" + domainStateToString(state) + ")");
    return true;
}

std::string VMResolver::getLastError() const {
    return lastError_;
}

HypervisorError VMResolver::getLastErrorCode() const {
    return lastErrorCode_;
}
