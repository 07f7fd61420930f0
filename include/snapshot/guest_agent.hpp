#pragma once

#include "vm/hypervisor_connection.hpp"
#include <memory>
#include <string>

// Filesystem quiescing through the in-guest agent.
class GuestAgent {
public:
    GuestAgent(std::shared_ptr<HypervisorConnection> connection, int timeoutSeconds);

    bool freeze(const std::string& domain);
    bool thaw(const std::string& domain);
    std::string getLastError() const;

    // The agent acknowledges with {"return": ...} or an empty object.
    static bool isSuccessResponse(const std::string& response);

private:
    bool execute(const std::string& domain, const std::string& command);

    std::shared_ptr<HypervisorConnection> connection_;
    int timeoutSeconds_;
    std::string lastError_;
};
