#include "main/cli_common.hpp"
#include "common/clock.hpp"
#include "common/logger.hpp"
#include "ssh/libssh_connection.hpp"
#include "vm/libvirt_connection.hpp"
#include <iostream>
#include <stdexcept>

bool parseSshOption(int& i, int argc, char** argv, SshCredential& credential) {
    std::string arg = argv[i];
    if (arg == "--host") {
        credential.host = requireValue(i, argc, argv);
    } else if (arg == "--port") {
        credential.port = requireIntValue(i, argc, argv);
    } else if (arg == "--user") {
        credential.username = requireValue(i, argc, argv);
    } else if (arg == "--key") {
        credential.keyPath = requireValue(i, argc, argv);
    } else if (arg == "--passphrase") {
        credential.passphrase = requireValue(i, argc, argv);
    } else {
        return false;
    }
    return true;
}

std::string requireValue(int& i, int argc, char** argv) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string("Missing value for ") + argv[i]);
    }
    return argv[++i];
}

int requireIntValue(int& i, int argc, char** argv) {
    std::string option = argv[i];
    std::string value = requireValue(i, argc, argv);
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid number for " + option + ": " + value);
    }
}

bool makeContext(const AppConfig& config, bool connectHypervisor, PracticeContext& context, std::string& error) {
    context.config = config;

    SshOptions options;
    options.connectTimeoutSeconds = config.ssh.connectTimeoutSeconds;
    options.pollIntervalMs = config.ssh.interactivePollMs;
    options.editorWarmupMs = config.ssh.editorWarmupMs;
    context.ssh = std::make_shared<SshManager>(std::make_shared<LibsshConnector>(),
                                               std::make_shared<SystemClock>(), options);

    if (connectHypervisor) {
        auto hypervisor = std::make_shared<LibvirtConnection>();
        if (!hypervisor->connect(config.libvirt.uri)) {
            error = hypervisor->getLastError();
            return false;
        }
        context.hypervisor = hypervisor;
    }
    return true;
}

void printOperationResult(const OperationResult& result, const std::string& successMessage) {
    for (const auto& warning : result.warnings) {
        std::cout << "warning: " << warning << "\n";
    }
    if (result.success) {
        std::cout << successMessage << "\n";
    } else {
        std::cerr << "error (" << errorCategoryToString(result.category) << "): " << result.error << "\n";
    }
}
