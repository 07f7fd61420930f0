#include "main/challenge_main.hpp"
#include "main/cli_common.hpp"
#include "challenge/challenge_loader.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <stdexcept>

void printChallengeUsage() {
    std::cout << "Usage: practicevm challenge [command] [options]\n"
              << "Commands:\n"
              << "  check FILE    - Validate a challenge definition without contacting a VM\n"
              << "  list [DIR]    - List valid challenges (default directory from config)\n"
              << "  run FILE      - Run a challenge and print the verdict as JSON\n"
              << "\n"
              << "Run options:\n"
              << "  --host/--port/--user/--key/--passphrase  SSH target\n"
              << "  --timeout SECONDS       Per-command timeout\n"
              << "  --simulate              Execute the user_action_simulation command\n"
              << "  --hints N               Reveal the first N hints (their cost is deducted)\n"
              << "  --vm NAME               VM for the safety snapshot\n"
              << "  --safety-snapshot NAME  Snapshot the VM before setup\n"
              << "  --revert-after          Revert to the safety snapshot afterwards\n"
              << "  --delete-after          Delete the safety snapshot afterwards\n";
}

namespace {

int checkCommand(const std::string& path) {
    ChallengeLoader loader;
    ChallengeDefinition definition;
    if (!loader.loadFile(path, definition)) {
        for (const auto& error : loader.getErrors()) {
            std::cerr << error << "\n";
        }
        return kExitFailure;
    }
    std::cout << "'" << definition.id << "' is valid: " << definition.validation.size() << " assertion(s), "
              << definition.setup.size() << " setup step(s), " << definition.hints.size() << " hint(s)\n"
              << "sha256 " << definition.digest << "\n";
    return kExitSuccess;
}

int listCommand(const std::string& directory) {
    ChallengeLoader loader;
    auto definitions = loader.loadDirectory(directory);
    for (const auto& definition : definitions) {
        std::cout << definition.id << "\t" << definition.name << "\t" << definition.difficulty
                  << "\t" << definition.score << "\n";
    }
    for (const auto& error : loader.getErrors()) {
        std::cerr << error << "\n";
    }
    return loader.getErrors().empty() ? kExitSuccess : kExitFailure;
}

} // namespace

int challengeMain(int argc, char** argv, const AppConfig& config) {
    if (argc < 2) {
        printChallengeUsage();
        return kExitUsage;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        printChallengeUsage();
        return kExitSuccess;
    }
    if (command == "list") {
        return listCommand(argc > 2 ? argv[2] : config.challenges.directory);
    }
    if (argc < 3) {
        std::cerr << "Missing challenge file\n";
        printChallengeUsage();
        return kExitUsage;
    }
    std::string path = argv[2];
    if (command == "check") {
        return checkCommand(path);
    }
    if (command != "run") {
        std::cerr << "Unknown challenge command: " << command << "\n";
        printChallengeUsage();
        return kExitUsage;
    }

    ChallengeRunOptions options;
    options.credential = credentialFromConfig(config, "");
    options.commandTimeoutSeconds = config.ssh.commandTimeoutSeconds;
    options.vmName = config.vm.defaultName;
    int hintCount = 0;

    try {
        for (int i = 3; i < argc; i++) {
            std::string arg = argv[i];
            if (parseSshOption(i, argc, argv, options.credential)) {
                continue;
            } else if (arg == "--timeout") {
                options.commandTimeoutSeconds = requireIntValue(i, argc, argv);
            } else if (arg == "--simulate") {
                options.simulateUserAction = true;
            } else if (arg == "--hints") {
                hintCount = requireIntValue(i, argc, argv);
            } else if (arg == "--vm") {
                options.vmName = requireValue(i, argc, argv);
            } else if (arg == "--safety-snapshot") {
                options.safetySnapshot = requireValue(i, argc, argv);
            } else if (arg == "--revert-after") {
                options.revertAfter = true;
            } else if (arg == "--delete-after") {
                options.deleteSnapshotAfter = true;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printChallengeUsage();
                return kExitUsage;
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return kExitUsage;
    }

    ChallengeLoader loader;
    ChallengeDefinition definition;
    if (!loader.loadFile(path, definition)) {
        for (const auto& error : loader.getErrors()) {
            std::cerr << error << "\n";
        }
        return kExitFailure;
    }

    PracticeContext context;
    std::string error;
    if (!makeContext(config, !options.safetySnapshot.empty(), context, error)) {
        std::cerr << "error: " << error << "\n";
        return kExitFailure;
    }

    HintLedger hints(definition.hints, definition.score);
    for (int i = 0; i < hintCount; ++i) {
        auto hint = hints.revealNext();
        if (!hint) {
            break;
        }
        std::cerr << "Hint " << hints.revealedCount() << " (cost " << hint->cost << "): " << hint->text << "\n";
    }

    // stdout carries the JSON verdict only.
    Logger::setConsoleOutput(false);
    try {
        ValidationVerdict verdict = runChallenge(context, definition, options, &hints);
        std::cout << verdict.toJson().dump(2) << std::endl;
        return verdict.passed ? kExitSuccess : kExitFailure;
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return kExitUsage;
    }
}
