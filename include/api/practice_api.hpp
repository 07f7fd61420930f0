#pragma once

#include "challenge/challenge_runner.hpp"
#include "challenge/hint_ledger.hpp"
#include "challenge/validation_verdict.hpp"
#include "common/app_config.hpp"
#include "common/error_category.hpp"
#include "snapshot/snapshot_types.hpp"
#include "ssh/ssh_manager.hpp"
#include "vm/hypervisor_connection.hpp"
#include <memory>
#include <string>
#include <vector>

// Collaborators shared by every caller-facing operation. The hypervisor
// connection may be null for callers that only use SSH and challenges.
struct PracticeContext {
    std::shared_ptr<HypervisorConnection> hypervisor;
    std::shared_ptr<SshManager> ssh;
    AppConfig config;
};

struct OperationResult {
    bool success = false;
    std::string error;
    ErrorCategory category = ErrorCategory::None;
    std::vector<std::string> warnings;
};

// Snapshot lifecycle
OperationResult createSnapshot(PracticeContext& context, const std::string& vmName, const std::string& snapshotName,
                               const std::string& description, bool freezeFilesystem = true);
OperationResult revertSnapshot(PracticeContext& context, const std::string& vmName, const std::string& snapshotName);
OperationResult deleteSnapshot(PracticeContext& context, const std::string& vmName, const std::string& snapshotName);
OperationResult listSnapshots(PracticeContext& context, const std::string& vmName,
                              std::vector<SnapshotDescriptor>& snapshots);

// Remote execution. A timeout of 0 uses the configured default.
CommandResult runCommand(PracticeContext& context, const SshCredential& credential, const std::string& command,
                         int timeoutSeconds = 0);
CommandResult runInteractiveCommand(PracticeContext& context, const SshCredential& credential,
                                    const std::string& command, int timeoutSeconds = 0);
OperationResult waitForSSHReady(PracticeContext& context, const SshCredential& credential,
                                int timeoutSeconds = 0, int pollIntervalSeconds = 0);
OperationResult copyFile(PracticeContext& context, const SshCredential& credential, const std::string& localPath,
                         const std::string& remotePath, bool createDirs = true);

// Returns the index of the first credential that can run a trivial command, or -1.
int findWorkingCredential(PracticeContext& context, const std::vector<SshCredential>& candidates,
                          int timeoutSeconds = 0);

// Loads the definition at challengePath and runs it.
ValidationVerdict runChallenge(PracticeContext& context, const std::string& challengePath,
                               const ChallengeRunOptions& options, const HintLedger* hints = nullptr);
ValidationVerdict runChallenge(PracticeContext& context, const ChallengeDefinition& definition,
                               const ChallengeRunOptions& options, const HintLedger* hints = nullptr);

SshCredential credentialFromConfig(const AppConfig& config, const std::string& host);
