#pragma once

#include "challenge/challenge_definition.hpp"
#include "challenge/hint_ledger.hpp"
#include "challenge/validation_verdict.hpp"
#include "snapshot/snapshot_manager.hpp"
#include "ssh/ssh_manager.hpp"
#include <memory>
#include <string>

struct ChallengeRunOptions {
    SshCredential credential;
    int commandTimeoutSeconds = 30;
    bool simulateUserAction = false;

    // Safety snapshot taken before setup. Requires vmName.
    std::string vmName;
    std::string safetySnapshot;
    bool revertAfter = false;
    bool deleteSnapshotAfter = false;
};

// Drives one challenge run: optional safety snapshot, setup, optional
// simulated learner action, then every assertion in declared order.
class ChallengeRunner {
public:
    // snapshots may be null when no safety snapshot is requested.
    ChallengeRunner(std::shared_ptr<SshManager> ssh, std::shared_ptr<SnapshotManager> snapshots);

    ValidationVerdict run(const ChallengeDefinition& definition, const ChallengeRunOptions& options,
                          const HintLedger* hints = nullptr);

private:
    void execute(const ChallengeDefinition& definition, const ChallengeRunOptions& options,
                 ValidationVerdict& verdict);
    bool runSetupStep(const SetupStep& step, size_t index, const ChallengeRunOptions& options,
                      ValidationVerdict& verdict);
    void cleanup(const ChallengeRunOptions& options, ValidationVerdict& verdict);
    void failRun(ValidationVerdict& verdict, RunPhase phase, ErrorCategory category, const std::string& message);

    std::shared_ptr<SshManager> ssh_;
    std::shared_ptr<SnapshotManager> snapshots_;
};
