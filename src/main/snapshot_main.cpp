#include "main/snapshot_main.hpp"
#include "main/cli_common.hpp"
#include "common/logger.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

void printSnapshotUsage() {
    std::cout << "Usage: practicevm snapshot [command] [options]\n"
              << "Commands:\n"
              << "  create    - Create an external disk-only snapshot\n"
              << "  revert    - Revert a VM to a snapshot\n"
              << "  delete    - Delete snapshot metadata (overlay files are kept)\n"
              << "  list      - List snapshots of a VM\n"
              << "\n"
              << "Options:\n"
              << "  --vm NAME             VM name (default from config)\n"
              << "  --name SNAPSHOT       Snapshot name (default from config)\n"
              << "  --description TEXT    Snapshot description\n"
              << "  --no-freeze           Do not quiesce guest filesystems\n";
}

namespace {

std::string formatTime(long long seconds) {
    if (seconds <= 0) {
        return "-";
    }
    std::time_t time = static_cast<std::time_t>(seconds);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace

int snapshotMain(int argc, char** argv, const AppConfig& config) {
    if (argc < 2) {
        printSnapshotUsage();
        return kExitUsage;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        printSnapshotUsage();
        return kExitSuccess;
    }
    if (command != "create" && command != "revert" && command != "delete" && command != "list") {
        std::cerr << "Unknown snapshot command: " << command << "\n";
        printSnapshotUsage();
        return kExitUsage;
    }

    std::string vmName = config.vm.defaultName;
    std::string snapshotName = config.vm.defaultSnapshot;
    std::string description;
    bool freeze = true;

    try {
        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--vm") {
                vmName = requireValue(i, argc, argv);
            } else if (arg == "--name") {
                snapshotName = requireValue(i, argc, argv);
            } else if (arg == "--description") {
                description = requireValue(i, argc, argv);
            } else if (arg == "--no-freeze") {
                freeze = false;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printSnapshotUsage();
                return kExitUsage;
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return kExitUsage;
    }

    if (vmName.empty()) {
        std::cerr << "No VM specified (use --vm or vm.default_name in the config file)\n";
        return kExitUsage;
    }

    PracticeContext context;
    std::string error;
    if (!makeContext(config, true, context, error)) {
        std::cerr << "error: " << error << "\n";
        return kExitFailure;
    }

    OperationResult result;
    if (command == "create") {
        if (description.empty()) {
            description = "Snapshot " + snapshotName + " of " + vmName;
        }
        result = createSnapshot(context, vmName, snapshotName, description, freeze);
        printOperationResult(result, "Snapshot '" + snapshotName + "' created");
    } else if (command == "revert") {
        result = revertSnapshot(context, vmName, snapshotName);
        printOperationResult(result, "VM '" + vmName + "' reverted to '" + snapshotName + "'");
    } else if (command == "delete") {
        result = deleteSnapshot(context, vmName, snapshotName);
        printOperationResult(result, "Snapshot '" + snapshotName + "' deleted (overlay files kept)");
    } else {
        std::vector<SnapshotDescriptor> snapshots;
        result = listSnapshots(context, vmName, snapshots);
        if (result.success) {
            std::cout << std::left << std::setw(24) << "NAME" << std::setw(21) << "CREATED"
                      << std::setw(10) << "STATE" << std::setw(26) << "KIND" << "DESCRIPTION\n";
            for (const auto& snapshot : snapshots) {
                std::cout << std::left << std::setw(24) << snapshot.name
                          << std::setw(21) << formatTime(snapshot.creationTime)
                          << std::setw(10) << domainStateToString(snapshot.vmState)
                          << std::setw(26) << snapshotKindToString(snapshot.kind)
                          << snapshot.description << "\n";
            }
        } else {
            printOperationResult(result, "");
        }
    }

    return result.success ? kExitSuccess : kExitFailure;
}
