#include "challenge/challenge_runner.hpp"
#include "challenge/assertion_evaluator.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>

ChallengeRunner::ChallengeRunner(std::shared_ptr<SshManager> ssh, std::shared_ptr<SnapshotManager> snapshots)
    : ssh_(std::move(ssh))
    , snapshots_(std::move(snapshots)) {
}

ValidationVerdict ChallengeRunner::run(const ChallengeDefinition& definition, const ChallengeRunOptions& options,
                                       const HintLedger* hints) {
    ValidationVerdict verdict;
    verdict.challengeId = definition.id;
    verdict.challengeName = definition.name;
    verdict.digest = definition.digest;
    verdict.maxScore = definition.score;

    Logger::info("Running challenge '" + definition.id + "' against " + options.credential.target());

    bool snapshotTaken = false;
    if (!options.safetySnapshot.empty()) {
        verdict.phase = RunPhase::Snapshot;
        if (!snapshots_ || options.vmName.empty()) {
            failRun(verdict, RunPhase::Snapshot, ErrorCategory::Configuration,
                  "A safety snapshot requires a VM name and a hypervisor connection");
        } else if (!snapshots_->create(options.vmName, options.safetySnapshot,
                                       "Safety snapshot before challenge " + definition.id, true)) {
            failRun(verdict, RunPhase::Snapshot, snapshots_->getLastErrorCategory(),
                  "Safety snapshot failed: " + snapshots_->getLastError());
        } else {
            snapshotTaken = true;
            const auto& warnings = snapshots_->getWarnings();
            verdict.warnings.insert(verdict.warnings.end(), warnings.begin(), warnings.end());
        }
    }

    if (verdict.error.empty()) {
        execute(definition, options, verdict);
    }
    if (snapshotTaken) {
        cleanup(options, verdict);
    }

    if (hints) {
        verdict.hintPenalty = hints->penalty();
        verdict.hintsUsed = hints->revealedCount();
    }
    verdict.awardedScore = verdict.passed ? std::max(0, definition.score - verdict.hintPenalty) : 0;
    if (verdict.passed) {
        verdict.flag = definition.flag;
    }

    Logger::info("Challenge '" + definition.id + "' " + (verdict.passed ? "passed" : "failed") + " (" +
                 std::to_string(verdict.outcomes.size() - verdict.failedCount()) + "/" +
                 std::to_string(verdict.outcomes.size()) + " assertions, score " +
                 std::to_string(verdict.awardedScore) + "/" + std::to_string(verdict.maxScore) + ")");
    return verdict;
}

void ChallengeRunner::execute(const ChallengeDefinition& definition, const ChallengeRunOptions& options,
                              ValidationVerdict& verdict) {
    verdict.phase = RunPhase::Setup;
    for (size_t i = 0; i < definition.setup.size(); ++i) {
        if (!runSetupStep(definition.setup[i], i, options, verdict)) {
            return;
        }
    }

    if (options.simulateUserAction && definition.userActionSimulation) {
        verdict.phase = RunPhase::Simulation;
        Logger::info("Simulating user action: " + *definition.userActionSimulation);
        CommandResult result = ssh_->execute(options.credential, *definition.userActionSimulation,
                                             options.commandTimeoutSeconds);
        if (!result.ok()) {
            failRun(verdict, RunPhase::Simulation, result.category, "User action simulation failed: " + result.error);
            return;
        }
        if (result.exitStatus != 0) {
            failRun(verdict, RunPhase::Simulation, ErrorCategory::Environment,
                  "User action simulation exited with status " + std::to_string(result.exitStatus) + ": " +
                  utils::trim(result.stderrText));
            return;
        }
    }

    verdict.phase = RunPhase::Validation;
    AssertionEvaluator evaluator(*ssh_, options.credential, options.commandTimeoutSeconds);
    for (size_t i = 0; i < definition.validation.size(); ++i) {
        verdict.outcomes.push_back(evaluator.evaluate(definition.validation[i], i));
    }

    verdict.passed = !verdict.outcomes.empty() && verdict.failedCount() == 0;
    if (!verdict.passed) {
        verdict.category = ErrorCategory::Assertion;
    }
    verdict.phase = RunPhase::Complete;
}

bool ChallengeRunner::runSetupStep(const SetupStep& step, size_t index, const ChallengeRunOptions& options,
                                   ValidationVerdict& verdict) {
    const std::string label = "Setup step " + std::to_string(index + 1) + " (" + step.type + ")";

    if (const auto* command = std::get_if<RunCommandStep>(&step.action)) {
        Logger::info(label + ": " + command->command);
        std::string wrapped = AssertionEvaluator::asUser(command->command, command->userContext,
                                                         options.credential.username);
        CommandResult result = ssh_->execute(options.credential, wrapped, options.commandTimeoutSeconds);
        if (!result.ok()) {
            failRun(verdict, RunPhase::Setup, result.category, label + " failed: " + result.error);
            return false;
        }
        if (result.exitStatus != command->expectedExitStatus) {
            failRun(verdict, RunPhase::Setup, ErrorCategory::Environment,
                  label + " exited with status " + std::to_string(result.exitStatus) + " (expected " +
                  std::to_string(command->expectedExitStatus) + "): " + utils::trim(result.stderrText));
            return false;
        }
        return true;
    }

    const auto& copy = std::get<CopyFileStep>(step.action);
    Logger::info(label + ": " + copy.localPath + " -> " + copy.remotePath);
    if (!ssh_->copyFile(options.credential, copy.localPath, copy.remotePath, copy.createDirs)) {
        ErrorCategory category = ssh_->getLastErrorCategory();
        if (category == ErrorCategory::None) {
            category = ErrorCategory::Environment;
        }
        failRun(verdict, RunPhase::Setup, category, label + " failed: " + ssh_->getLastError());
        return false;
    }
    return true;
}

void ChallengeRunner::cleanup(const ChallengeRunOptions& options, ValidationVerdict& verdict) {
    if (options.revertAfter) {
        if (snapshots_->revert(options.vmName, options.safetySnapshot)) {
            Logger::info("Reverted '" + options.vmName + "' to '" + options.safetySnapshot + "'");
        } else {
            verdict.warnings.push_back("Revert to safety snapshot failed: " + snapshots_->getLastError());
        }
    }
    if (options.deleteSnapshotAfter) {
        if (!snapshots_->remove(options.vmName, options.safetySnapshot)) {
            verdict.warnings.push_back("Deleting safety snapshot failed: " + snapshots_->getLastError());
        }
    }
}

void ChallengeRunner::failRun(ValidationVerdict& verdict, RunPhase phase, ErrorCategory category,
                            const std::string& message) {
    verdict.passed = false;
    verdict.phase = phase;
    verdict.category = category;
    verdict.error = message;
    Logger::error(message);
}
