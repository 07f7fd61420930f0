#pragma once

#include "vm/hypervisor_connection.hpp"
#include <memory>
#include <string>

class VMResolver {
public:
    explicit VMResolver(std::shared_ptr<HypervisorConnection> connection);

    bool resolve(const std::string& name, VMHandle& handle);
    std::string getLastError() const;
    HypervisorError getLastErrorCode() const;

private:
    std::shared_ptr<HypervisorConnection> connection_;
    std::string lastError_;
    HypervisorError lastErrorCode_;
};
