#include "main/ssh_main.hpp"
#include "main/cli_common.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <stdexcept>

void printSshUsage() {
    std::cout << "Usage: practicevm ssh [command] [options]\n"
              << "Commands:\n"
              << "  run CMD        - Run a command and print its output\n"
              << "  interactive CMD - Run a command in a pseudo-terminal\n"
              << "  wait           - Wait until the VM accepts SSH commands\n"
              << "  copy           - Copy a local file to the VM over SFTP\n"
              << "\n"
              << "Options:\n"
              << "  --host HOST           VM address\n"
              << "  --port PORT           SSH port (default from config)\n"
              << "  --user USER           SSH user (default from config)\n"
              << "  --key PATH            Private key (default from config)\n"
              << "  --passphrase TEXT     Private key passphrase\n"
              << "  --timeout SECONDS     Command or readiness timeout\n"
              << "  --poll SECONDS        Readiness poll interval\n"
              << "  --local PATH          Local file for copy\n"
              << "  --remote PATH         Remote destination for copy\n"
              << "  --no-create-dirs      Do not create missing remote directories\n";
}

int sshMain(int argc, char** argv, const AppConfig& config) {
    if (argc < 2) {
        printSshUsage();
        return kExitUsage;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        printSshUsage();
        return kExitSuccess;
    }

    SshCredential credential = credentialFromConfig(config, "");
    std::string remoteCommand;
    std::string localPath;
    std::string remotePath;
    int timeout = 0;
    int poll = 0;
    bool createDirs = true;

    try {
        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];
            if (parseSshOption(i, argc, argv, credential)) {
                continue;
            } else if (arg == "--timeout") {
                timeout = requireIntValue(i, argc, argv);
            } else if (arg == "--poll") {
                poll = requireIntValue(i, argc, argv);
            } else if (arg == "--local") {
                localPath = requireValue(i, argc, argv);
            } else if (arg == "--remote") {
                remotePath = requireValue(i, argc, argv);
            } else if (arg == "--no-create-dirs") {
                createDirs = false;
            } else if (arg.rfind("--", 0) == 0) {
                std::cerr << "Unknown option: " << arg << "\n";
                printSshUsage();
                return kExitUsage;
            } else {
                remoteCommand += (remoteCommand.empty() ? "" : " ") + arg;
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return kExitUsage;
    }

    PracticeContext context;
    std::string error;
    if (!makeContext(config, false, context, error)) {
        std::cerr << "error: " << error << "\n";
        return kExitFailure;
    }

    try {
        if (command == "run" || command == "interactive") {
            CommandResult result = command == "run"
                ? runCommand(context, credential, remoteCommand, timeout)
                : runInteractiveCommand(context, credential, remoteCommand, timeout);
            std::cout << result.stdoutText;
            std::cerr << result.stderrText;
            if (!result.ok()) {
                std::cerr << "error (" << errorCategoryToString(result.category) << "): " << result.error << "\n";
                return kExitFailure;
            }
            return result.exitStatus == 0 ? kExitSuccess : kExitFailure;
        } else if (command == "wait") {
            OperationResult result = waitForSSHReady(context, credential, timeout, poll);
            printOperationResult(result, "SSH is ready on " + credential.host);
            return result.success ? kExitSuccess : kExitFailure;
        } else if (command == "copy") {
            OperationResult result = copyFile(context, credential, localPath, remotePath, createDirs);
            printOperationResult(result, "Copied " + localPath + " to " + credential.host + ":" + remotePath);
            return result.success ? kExitSuccess : kExitFailure;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return kExitUsage;
    }

    std::cerr << "Unknown ssh command: " << command << "\n";
    printSshUsage();
    return kExitUsage;
}
