#include "api/practice_api.hpp"
#include "challenge/challenge_loader.hpp"
#include "common/logger.hpp"
#include "snapshot/snapshot_manager.hpp"

namespace {

std::shared_ptr<SnapshotManager> makeSnapshotManager(PracticeContext& context) {
    if (!context.hypervisor) {
        return nullptr;
    }
    return std::make_shared<SnapshotManager>(context.hypervisor, context.config.vm.agentTimeoutSeconds);
}

OperationResult fromSnapshotManager(bool success, const SnapshotManager& manager) {
    OperationResult result;
    result.success = success;
    result.warnings = manager.getWarnings();
    if (!success) {
        result.error = manager.getLastError();
        result.category = manager.getLastErrorCategory();
    }
    return result;
}

OperationResult noHypervisor() {
    OperationResult result;
    result.error = "No hypervisor connection configured";
    result.category = ErrorCategory::Configuration;
    return result;
}

OperationResult fromSshManager(bool success, const SshManager& ssh) {
    OperationResult result;
    result.success = success;
    if (!success) {
        result.error = ssh.getLastError();
        result.category = ssh.getLastErrorCategory();
    }
    return result;
}

int orDefault(int value, int fallback) {
    return value > 0 ? value : fallback;
}

} // namespace

OperationResult createSnapshot(PracticeContext& context, const std::string& vmName, const std::string& snapshotName,
                               const std::string& description, bool freezeFilesystem) {
    auto manager = makeSnapshotManager(context);
    if (!manager) {
        return noHypervisor();
    }
    bool success = manager->create(vmName, snapshotName, description, freezeFilesystem);
    return fromSnapshotManager(success, *manager);
}

OperationResult revertSnapshot(PracticeContext& context, const std::string& vmName, const std::string& snapshotName) {
    auto manager = makeSnapshotManager(context);
    if (!manager) {
        return noHypervisor();
    }
    bool success = manager->revert(vmName, snapshotName);
    return fromSnapshotManager(success, *manager);
}

OperationResult deleteSnapshot(PracticeContext& context, const std::string& vmName, const std::string& snapshotName) {
    auto manager = makeSnapshotManager(context);
    if (!manager) {
        return noHypervisor();
    }
    bool success = manager->remove(vmName, snapshotName);
    return fromSnapshotManager(success, *manager);
}

OperationResult listSnapshots(PracticeContext& context, const std::string& vmName,
                              std::vector<SnapshotDescriptor>& snapshots) {
    auto manager = makeSnapshotManager(context);
    if (!manager) {
        return noHypervisor();
    }
    bool success = manager->list(vmName, snapshots);
    return fromSnapshotManager(success, *manager);
}

CommandResult runCommand(PracticeContext& context, const SshCredential& credential, const std::string& command,
                         int timeoutSeconds) {
    return context.ssh->execute(credential, command,
                                orDefault(timeoutSeconds, context.config.ssh.commandTimeoutSeconds));
}

CommandResult runInteractiveCommand(PracticeContext& context, const SshCredential& credential,
                                    const std::string& command, int timeoutSeconds) {
    return context.ssh->executeInteractive(credential, command,
                                           orDefault(timeoutSeconds, context.config.ssh.commandTimeoutSeconds));
}

OperationResult waitForSSHReady(PracticeContext& context, const SshCredential& credential,
                                int timeoutSeconds, int pollIntervalSeconds) {
    bool ready = context.ssh->waitReady(credential,
                                        orDefault(timeoutSeconds, context.config.vm.readinessTimeoutSeconds),
                                        orDefault(pollIntervalSeconds, context.config.vm.readinessPollSeconds));
    return fromSshManager(ready, *context.ssh);
}

OperationResult copyFile(PracticeContext& context, const SshCredential& credential, const std::string& localPath,
                         const std::string& remotePath, bool createDirs) {
    bool copied = context.ssh->copyFile(credential, localPath, remotePath, createDirs);
    return fromSshManager(copied, *context.ssh);
}

int findWorkingCredential(PracticeContext& context, const std::vector<SshCredential>& candidates,
                          int timeoutSeconds) {
    int timeout = orDefault(timeoutSeconds, context.config.ssh.connectTimeoutSeconds);
    for (size_t i = 0; i < candidates.size(); ++i) {
        CommandResult result = context.ssh->execute(candidates[i], "true", timeout);
        if (result.succeeded()) {
            Logger::info("Using credential " + candidates[i].target());
            return static_cast<int>(i);
        }
        Logger::debug("Credential " + candidates[i].target() + " rejected: " +
                      (result.ok() ? "exit status " + std::to_string(result.exitStatus) : result.error));
    }
    Logger::warning("No working SSH credential among " + std::to_string(candidates.size()) + " candidate(s)");
    return -1;
}

ValidationVerdict runChallenge(PracticeContext& context, const std::string& challengePath,
                               const ChallengeRunOptions& options, const HintLedger* hints) {
    ChallengeLoader loader;
    ChallengeDefinition definition;
    if (!loader.loadFile(challengePath, definition)) {
        ValidationVerdict verdict;
        verdict.phase = RunPhase::Load;
        verdict.category = ErrorCategory::Configuration;
        verdict.error = "Invalid challenge definition: " + loader.getLastError();
        Logger::error(verdict.error);
        return verdict;
    }
    return runChallenge(context, definition, options, hints);
}

ValidationVerdict runChallenge(PracticeContext& context, const ChallengeDefinition& definition,
                               const ChallengeRunOptions& options, const HintLedger* hints) {
    ChallengeRunner runner(context.ssh, makeSnapshotManager(context));
    return runner.run(definition, options, hints);
}

SshCredential credentialFromConfig(const AppConfig& config, const std::string& host) {
    SshCredential credential;
    credential.host = host;
    credential.port = config.ssh.port;
    credential.username = config.ssh.user;
    credential.keyPath = config.ssh.keyPath;
    return credential;
}
