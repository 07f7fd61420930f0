#include <gtest/gtest.h>
#include "challenge/challenge_loader.hpp"
#include "challenge/challenge_runner.hpp"
#include "test_fakes.hpp"
#include <algorithm>
#include <filesystem>
#include <memory>

namespace {

FakeReply replyWith(const std::string& out, int status = 0) {
    FakeReply reply;
    reply.stdoutText = out;
    reply.exitStatus = status;
    return reply;
}

} // namespace

class ChallengeRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<FakeClock>();
        connector_ = std::make_shared<FakeSshConnector>(clock_);
        ssh_ = std::make_shared<SshManager>(connector_, clock_);

        options_.credential.host = "192.168.122.50";
        options_.credential.username = "student";
        options_.credential.keyPath = dir_.write("id_ed25519", "key");
        std::filesystem::permissions(options_.credential.keyPath,
                                     std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace);

        connector_->respond("stat -L -c '%F|%U|%G|%a' -- '/opt/app/ready'", replyWith("", 1));
        connector_->respond("stat -L -c '%F|%U|%G|%a' -- '/etc/motd'", replyWith("regular file|root|root|644\n"));
        connector_->respond("ss -lnt", replyWith("State Recv-Q Send-Q Local Peer\nLISTEN 0 128 0.0.0.0:22 0.0.0.0:*\n"));
    }

    void TearDown() override {}

    ChallengeDefinition load(const std::string& yaml) {
        ChallengeLoader loader;
        ChallengeDefinition definition;
        EXPECT_TRUE(loader.loadText(yaml, "yaml", dir_.path(), definition)) << loader.getLastError();
        return definition;
    }

    size_t countCommands(const std::string& fragment) const {
        return static_cast<size_t>(std::count_if(connector_->commands.begin(), connector_->commands.end(),
                                                 [&fragment](const std::string& c) {
                                                     return c.find(fragment) != std::string::npos;
                                                 }));
    }

    TempDir dir_;
    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<FakeSshConnector> connector_;
    std::shared_ptr<SshManager> ssh_;
    ChallengeRunOptions options_;
};

TEST_F(ChallengeRunnerTest, MissingFileFailsOneAssertion) {
    ChallengeDefinition definition = load(R"(
id: ready-file
name: Create the ready marker
description: Touch /opt/app/ready
setup:
  - type: run_command
    command: echo ok
validation:
  - type: check_file_exists
    path: /opt/app/ready
    expected_state: true
flag: FLAG{ready}
)");

    ChallengeRunner runner(ssh_, nullptr);
    ValidationVerdict verdict = runner.run(definition, options_);

    EXPECT_FALSE(verdict.passed);
    EXPECT_EQ(verdict.phase, RunPhase::Complete);
    EXPECT_TRUE(verdict.error.empty());
    EXPECT_EQ(verdict.category, ErrorCategory::Assertion);
    ASSERT_EQ(verdict.outcomes.size(), 1u);
    EXPECT_EQ(verdict.failedCount(), 1u);
    EXPECT_EQ(verdict.outcomes[0].observed, "false");
    EXPECT_EQ(verdict.outcomes[0].expected, "true");
    EXPECT_EQ(verdict.awardedScore, 0);
    EXPECT_TRUE(verdict.flag.empty());
    EXPECT_EQ(connector_->commands.front(), "echo ok");

    nlohmann::json json = verdict.toJson();
    EXPECT_FALSE(json["passed"].get<bool>());
    EXPECT_FALSE(json.contains("flag"));
    EXPECT_EQ(json["failed_count"].get<size_t>(), 1u);
}

TEST_F(ChallengeRunnerTest, EveryAssertionEvaluated) {
    ChallengeDefinition definition = load(R"(
id: all-checks
name: All checks
description: d
validation:
  - type: check_file_exists
    path: /opt/app/ready
    expected_state: true
  - type: check_port_listening
    port: 22
    expected_state: true
  - type: check_file_exists
    path: /etc/motd
    expected_state: true
    permissions: "644"
)");

    ChallengeRunner runner(ssh_, nullptr);
    ValidationVerdict verdict = runner.run(definition, options_);

    EXPECT_FALSE(verdict.passed);
    ASSERT_EQ(verdict.outcomes.size(), 3u);
    EXPECT_FALSE(verdict.outcomes[0].passed);
    EXPECT_TRUE(verdict.outcomes[1].passed);
    EXPECT_TRUE(verdict.outcomes[2].passed);
    EXPECT_EQ(verdict.outcomes[2].index, 2u);
    EXPECT_EQ(countCommands("ss -lnt"), 1u);
    EXPECT_EQ(countCommands("/etc/motd"), 1u);
}

TEST_F(ChallengeRunnerTest, PassAwardsScoreMinusHints) {
    ChallengeDefinition definition = load(R"(
id: ssh-port
name: SSH listens
description: d
score: 50
validation:
  - type: check_port_listening
    port: 22
    expected_state: true
hints:
  - text: Look at ss -lnt
    cost: 5
  - text: sshd listens on 22
    cost: 10
  - text: unused
    cost: 20
flag: FLAG{ssh}
)");

    HintLedger hints(definition.hints, definition.score);
    hints.revealNext();
    hints.revealNext();

    ChallengeRunner runner(ssh_, nullptr);
    ValidationVerdict verdict = runner.run(definition, options_, &hints);

    EXPECT_TRUE(verdict.passed);
    EXPECT_EQ(verdict.category, ErrorCategory::None);
    EXPECT_EQ(verdict.maxScore, 50);
    EXPECT_EQ(verdict.hintPenalty, 15);
    EXPECT_EQ(verdict.hintsUsed, 2u);
    EXPECT_EQ(verdict.awardedScore, 35);
    EXPECT_EQ(verdict.flag, "FLAG{ssh}");

    nlohmann::json json = verdict.toJson();
    EXPECT_EQ(json["score"]["awarded"].get<int>(), 35);
    EXPECT_EQ(json["flag"].get<std::string>(), "FLAG{ssh}");
}

TEST_F(ChallengeRunnerTest, SetupFailureStopsRun) {
    connector_->respond("systemctl start nginx", replyWith("", 5));
    ChallengeDefinition definition = load(R"(
id: nginx
name: nginx
description: d
setup:
  - type: run_command
    command: systemctl start nginx
  - type: run_command
    command: echo never
validation:
  - type: check_port_listening
    port: 80
    expected_state: true
)");

    ChallengeRunner runner(ssh_, nullptr);
    ValidationVerdict verdict = runner.run(definition, options_);

    EXPECT_FALSE(verdict.passed);
    EXPECT_EQ(verdict.phase, RunPhase::Setup);
    EXPECT_EQ(verdict.category, ErrorCategory::Environment);
    EXPECT_NE(verdict.error.find("Setup step 1"), std::string::npos);
    EXPECT_TRUE(verdict.outcomes.empty());
    EXPECT_EQ(countCommands("echo never"), 0u);
    EXPECT_EQ(countCommands("ss -lnt"), 0u);
    EXPECT_EQ(verdict.toJson()["phase"].get<std::string>(), "setup");
}

TEST_F(ChallengeRunnerTest, SetupRunsAsRequestedUserAndCopiesFiles) {
    dir_.write("files/app.conf", "listen 8080\n");
    ChallengeDefinition definition = load(R"(
id: copy
name: copy
description: d
setup:
  - type: run_command
    command: mkdir -p /opt/app
    user_context: root
  - type: copy_file
    local_path: files/app.conf
    remote_path: /home/student/app/app.conf
validation:
  - type: check_port_listening
    port: 22
    expected_state: true
)");

    ChallengeRunner runner(ssh_, nullptr);
    ValidationVerdict verdict = runner.run(definition, options_);

    EXPECT_TRUE(verdict.passed) << verdict.error;
    EXPECT_EQ(connector_->commands.front(), "sudo -n sh -c 'mkdir -p /opt/app'");
    EXPECT_EQ(connector_->remoteFiles["/home/student/app/app.conf"], "listen 8080\n");
}

TEST_F(ChallengeRunnerTest, SimulationOnlyWhenRequested) {
    ChallengeDefinition definition = load(R"(
id: sim
name: sim
description: d
user_action_simulation: touch /opt/app/ready
validation:
  - type: check_port_listening
    port: 22
    expected_state: true
)");

    ChallengeRunner runner(ssh_, nullptr);
    runner.run(definition, options_);
    EXPECT_EQ(countCommands("touch /opt/app/ready"), 0u);

    options_.simulateUserAction = true;
    ValidationVerdict verdict = runner.run(definition, options_);
    EXPECT_TRUE(verdict.passed);
    EXPECT_EQ(countCommands("touch /opt/app/ready"), 1u);
}

TEST_F(ChallengeRunnerTest, FailedSimulationStopsRun) {
    connector_->respond("touch /opt/app/ready", replyWith("", 1));
    ChallengeDefinition definition = load(R"(
id: sim
name: sim
description: d
user_action_simulation: touch /opt/app/ready
validation:
  - type: check_port_listening
    port: 22
    expected_state: true
)");

    options_.simulateUserAction = true;
    ChallengeRunner runner(ssh_, nullptr);
    ValidationVerdict verdict = runner.run(definition, options_);

    EXPECT_FALSE(verdict.passed);
    EXPECT_EQ(verdict.phase, RunPhase::Simulation);
    EXPECT_EQ(verdict.category, ErrorCategory::Environment);
    EXPECT_TRUE(verdict.outcomes.empty());
}

TEST_F(ChallengeRunnerTest, UnreachableVmIsConnectivityFailure) {
    connector_->rejectAuth = true;
    ChallengeDefinition definition = load(R"(
id: unreachable
name: unreachable
description: d
setup:
  - type: run_command
    command: echo ok
validation:
  - type: check_port_listening
    port: 22
    expected_state: true
)");

    ChallengeRunner runner(ssh_, nullptr);
    ValidationVerdict verdict = runner.run(definition, options_);

    EXPECT_FALSE(verdict.passed);
    EXPECT_EQ(verdict.phase, RunPhase::Setup);
    EXPECT_EQ(verdict.category, ErrorCategory::Connectivity);
}

TEST_F(ChallengeRunnerTest, SafetySnapshotRevertedAndDeleted) {
    std::string disk = dir_.write("images/lab.qcow2", "QFI");
    auto hypervisor = std::make_shared<FakeHypervisor>();
    hypervisor->addDomain("lab", DomainState::Running, {disk});
    auto snapshots = std::make_shared<SnapshotManager>(hypervisor);

    ChallengeDefinition definition = load(R"(
id: safe
name: safe
description: d
validation:
  - type: check_port_listening
    port: 22
    expected_state: true
)");

    options_.vmName = "lab";
    options_.safetySnapshot = "pre-safe";
    options_.revertAfter = true;
    options_.deleteSnapshotAfter = true;

    ChallengeRunner runner(ssh_, snapshots);
    ValidationVerdict verdict = runner.run(definition, options_);

    EXPECT_TRUE(verdict.passed) << verdict.error;
    EXPECT_EQ(hypervisor->createdXml.size(), 1u);
    EXPECT_EQ(hypervisor->revertCount, 1);
    EXPECT_TRUE(hypervisor->lastDeleteMetadataOnly);

    std::vector<std::string> names;
    ASSERT_TRUE(hypervisor->listSnapshotNames("lab", names));
    EXPECT_TRUE(names.empty());
    EXPECT_TRUE(verdict.warnings.empty());
}

TEST_F(ChallengeRunnerTest, SafetySnapshotNeedsHypervisor) {
    ChallengeDefinition definition = load(R"(
id: safe
name: safe
description: d
setup:
  - type: run_command
    command: echo ok
validation:
  - type: check_port_listening
    port: 22
    expected_state: true
)");

    options_.vmName = "lab";
    options_.safetySnapshot = "pre-safe";

    ChallengeRunner runner(ssh_, nullptr);
    ValidationVerdict verdict = runner.run(definition, options_);

    EXPECT_FALSE(verdict.passed);
    EXPECT_EQ(verdict.phase, RunPhase::Snapshot);
    EXPECT_EQ(verdict.category, ErrorCategory::Configuration);
    EXPECT_TRUE(connector_->commands.empty());
}
