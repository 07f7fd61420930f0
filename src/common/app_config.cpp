#include "common/app_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

template <typename T>
void readValue(const json& section, const char* sectionName, const char* key, T& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid value for ") + sectionName + "." + key + ": " + e.what());
    }
}

void readPositive(const json& section, const char* sectionName, const char* key, int& target) {
    readValue(section, sectionName, key, target);
    if (target <= 0) {
        throw std::runtime_error(std::string(sectionName) + "." + key + " must be positive");
    }
}

const json& sectionOf(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end()) {
        return empty;
    }
    if (!it->is_object()) {
        throw std::runtime_error(std::string("Config section '") + name + "' must be an object");
    }
    return *it;
}

} // namespace

AppConfig AppConfig::loadFromString(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Failed to parse config: ") + e.what());
    }
    if (!root.is_object()) {
        throw std::runtime_error("Config root must be an object");
    }

    AppConfig config;

    const json& libvirt = sectionOf(root, "libvirt");
    readValue(libvirt, "libvirt", "uri", config.libvirt.uri);

    const json& vm = sectionOf(root, "vm");
    readValue(vm, "vm", "default_name", config.vm.defaultName);
    readValue(vm, "vm", "default_snapshot", config.vm.defaultSnapshot);
    readPositive(vm, "vm", "readiness_timeout_seconds", config.vm.readinessTimeoutSeconds);
    readPositive(vm, "vm", "readiness_poll_seconds", config.vm.readinessPollSeconds);
    readPositive(vm, "vm", "agent_timeout_seconds", config.vm.agentTimeoutSeconds);

    const json& ssh = sectionOf(root, "ssh");
    readValue(ssh, "ssh", "user", config.ssh.user);
    readValue(ssh, "ssh", "key_path", config.ssh.keyPath);
    readPositive(ssh, "ssh", "port", config.ssh.port);
    readPositive(ssh, "ssh", "connect_timeout_seconds", config.ssh.connectTimeoutSeconds);
    readPositive(ssh, "ssh", "command_timeout_seconds", config.ssh.commandTimeoutSeconds);
    readPositive(ssh, "ssh", "interactive_poll_ms", config.ssh.interactivePollMs);
    readValue(ssh, "ssh", "editor_warmup_ms", config.ssh.editorWarmupMs);

    const json& challenges = sectionOf(root, "challenges");
    readValue(challenges, "challenges", "directory", config.challenges.directory);

    const json& logging = sectionOf(root, "logging");
    readValue(logging, "logging", "path", config.logging.path);
    std::string levelName;
    readValue(logging, "logging", "level", levelName);
    if (!levelName.empty() && !Logger::parseLevel(levelName, config.logging.level)) {
        throw std::runtime_error("Unknown log level: " + levelName);
    }

    return config;
}

AppConfig AppConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str());
}
