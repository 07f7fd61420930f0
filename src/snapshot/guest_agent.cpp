#include "snapshot/guest_agent.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

GuestAgent::GuestAgent(std::shared_ptr<HypervisorConnection> connection, int timeoutSeconds)
    : connection_(std::move(connection))
    , timeoutSeconds_(timeoutSeconds) {
}

bool GuestAgent::freeze(const std::string& domain) {
    return execute(domain, "guest-fsfreeze-freeze");
}

bool GuestAgent::thaw(const std::string& domain) {
    return execute(domain, "guest-fsfreeze-thaw");
}

std::string GuestAgent::getLastError() const {
    return lastError_;
}

bool GuestAgent::isSuccessResponse(const std::string& response) {
    try {
        json reply = json::parse(response);
        if (!reply.is_object()) {
            return false;
        }
        return reply.empty() || reply.contains("return");
    } catch (const json::parse_error&) {
        return false;
    }
}

bool GuestAgent::execute(const std::string& domain, const std::string& command) {
    lastError_.clear();
    json request = {{"execute", command}};

    std::string response;
    if (!connection_->agentCommand(domain, request.dump(), timeoutSeconds_, response)) {
        lastError_ = command + " failed: " + connection_->getLastError();
        return false;
    }
    if (!isSuccessResponse(response)) {
        lastError_ = command + " returned unexpected response: " + response;
        return false;
    }

    Logger::debug(command + " succeeded on " + domain);
    return true;
}
