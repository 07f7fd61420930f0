#include "main/challenge_main.hpp"
#include "main/cli_common.hpp"
#include "main/snapshot_main.hpp"
#include "main/ssh_main.hpp"
#include "common/app_config.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>

void printUsage() {
    std::cout << "Usage: practicevm [global options] [command] [options]\n"
              << "Commands:\n"
              << "  snapshot   - External snapshot operations\n"
              << "  ssh        - Remote command execution and file transfer\n"
              << "  challenge  - Challenge validation\n"
              << "\n"
              << "Global options:\n"
              << "  --config FILE       JSON configuration file\n"
              << "  --log-level LEVEL   DEBUG, INFO, WARNING, ERROR or FATAL\n"
              << "  --quiet             Do not echo log lines to the console\n"
              << "  -h, --help          Show this help message\n"
              << "  -v, --version       Show version information\n";
}

int main(int argc, char** argv) {
    std::string configPath;
    std::string levelName;
    bool quiet = false;

    int i = 1;
    for (; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return kExitSuccess;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "practicevm version 1.0.0\n";
            return kExitSuccess;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            levelName = argv[++i];
        } else if (arg == "--quiet") {
            quiet = true;
        } else {
            break;
        }
    }

    if (i >= argc) {
        std::cerr << "Error: No command specified" << std::endl;
        printUsage();
        return kExitUsage;
    }

    AppConfig config;
    try {
        if (!configPath.empty()) {
            config = AppConfig::loadFromFile(configPath);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailure;
    }
    if (!levelName.empty() && !Logger::parseLevel(levelName, config.logging.level)) {
        std::cerr << "Error: Unknown log level: " << levelName << std::endl;
        return kExitUsage;
    }

    Logger::setConsoleOutput(!quiet);
    if (!Logger::initialize(config.logging.path, config.logging.level)) {
        std::cerr << "Failed to initialize logger" << std::endl;
        return kExitFailure;
    }

    std::string command = argv[i];
    int subArgc = argc - i;
    char** subArgv = argv + i;

    int status = kExitUsage;
    try {
        if (command == "snapshot") {
            status = snapshotMain(subArgc, subArgv, config);
        } else if (command == "ssh") {
            status = sshMain(subArgc, subArgv, config);
        } else if (command == "challenge") {
            status = challengeMain(subArgc, subArgv, config);
        } else {
            std::cerr << "Error: Unknown command: " << command << std::endl;
            Logger::error("Unknown command: " + command);
            printUsage();
        }
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        Logger::error("Error in main: " + std::string(e.what()));
        status = kExitFailure;
    }

    Logger::shutdown();
    return status;
}
