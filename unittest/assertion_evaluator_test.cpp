#include <gtest/gtest.h>
#include "challenge/assertion_evaluator.hpp"
#include "test_fakes.hpp"
#include <filesystem>
#include <memory>

namespace {

const char* kSsOutput =
    "State  Recv-Q Send-Q Local Address:Port  Peer Address:Port Process\n"
    "LISTEN 0      128          0.0.0.0:22         0.0.0.0:*\n"
    "LISTEN 0      511             [::]:80            [::]:*\n"
    "LISTEN 0      4096   127.0.0.53%lo:53         0.0.0.0:*\n";

FakeReply replyWith(const std::string& out, int status = 0, const std::string& err = "") {
    FakeReply reply;
    reply.stdoutText = out;
    reply.stderrText = err;
    reply.exitStatus = status;
    return reply;
}

} // namespace

class AssertionEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<FakeClock>();
        connector_ = std::make_shared<FakeSshConnector>(clock_);
        ssh_ = std::make_unique<SshManager>(connector_, clock_);

        credential_.host = "192.168.122.50";
        credential_.username = "student";
        credential_.keyPath = dir_.write("id_ed25519", "key");
        std::filesystem::permissions(credential_.keyPath,
                                     std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace);
        evaluator_ = std::make_unique<AssertionEvaluator>(*ssh_, credential_, 10);
    }

    void TearDown() override {
        evaluator_.reset();
        ssh_.reset();
    }

    AssertionOutcome evaluate(const std::string& type, const AssertionSpec& spec) {
        Assertion assertion;
        assertion.type = type;
        assertion.spec = spec;
        return evaluator_->evaluate(assertion, 0);
    }

    AssertionOutcome portCheck(int port, bool expectedState) {
        PortListeningAssertion spec;
        spec.port = port;
        spec.expectedState = expectedState;
        return evaluate("check_port_listening", spec);
    }

    TempDir dir_;
    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<FakeSshConnector> connector_;
    std::unique_ptr<SshManager> ssh_;
    std::unique_ptr<AssertionEvaluator> evaluator_;
    SshCredential credential_;
};

TEST_F(AssertionEvaluatorTest, AsUser) {
    EXPECT_EQ(AssertionEvaluator::asUser("id -u", "", "student"), "id -u");
    EXPECT_EQ(AssertionEvaluator::asUser("id -u", "student", "student"), "id -u");
    EXPECT_EQ(AssertionEvaluator::asUser("id -u", "root", "student"), "sudo -n sh -c 'id -u'");
    EXPECT_EQ(AssertionEvaluator::asUser("echo 'hi'", "alice", "student"),
              "sudo -n -u 'alice' sh -c 'echo '\\''hi'\\'''");
}

TEST_F(AssertionEvaluatorTest, RunCommandExitAndOutput) {
    connector_->respond("hostname", replyWith("lab-01\n"));

    RunCommandAssertion spec;
    spec.command = "hostname";
    spec.stdoutMatch.mode = MatchMode::Exact;
    spec.stdoutMatch.value = "lab-01";
    EXPECT_TRUE(evaluate("run_command", spec).passed);

    spec.stdoutMatch.value = "lab-02";
    AssertionOutcome outcome = evaluate("run_command", spec);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.field, "stdout");
    EXPECT_EQ(outcome.observed, "lab-01");
    EXPECT_EQ(outcome.expected, "lab-02");

    spec.stdoutMatch = OutputMatch();
    spec.expectedExitStatus = 1;
    outcome = evaluate("run_command", spec);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.field, "exit_status");
    EXPECT_EQ(outcome.observed, "0");
}

TEST_F(AssertionEvaluatorTest, RunCommandStderrEmptyAndUserContext) {
    connector_->respond("sudo -n sh -c 'cat /etc/shadow'", replyWith("root:*:19000\n", 0, "sudo: warning\n"));

    RunCommandAssertion spec;
    spec.command = "cat /etc/shadow";
    spec.userContext = "root";
    spec.stderrEmpty = true;
    AssertionOutcome outcome = evaluate("run_command", spec);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.field, "stderr");
    EXPECT_EQ(connector_->commands.back(), "sudo -n sh -c 'cat /etc/shadow'");
}

TEST_F(AssertionEvaluatorTest, MatchModes) {
    OutputMatch match;
    EXPECT_TRUE(AssertionEvaluator::matchOutput(match, "anything"));

    match.mode = MatchMode::Exact;
    match.value = "ready";
    EXPECT_TRUE(AssertionEvaluator::matchOutput(match, "  ready\n"));
    EXPECT_FALSE(AssertionEvaluator::matchOutput(match, "ready now"));

    match.mode = MatchMode::Substring;
    EXPECT_TRUE(AssertionEvaluator::matchOutput(match, "system ready now"));

    match.mode = MatchMode::Pattern;
    match.pattern = std::regex("^uid=[0-9]+");
    EXPECT_TRUE(AssertionEvaluator::matchOutput(match, "uid=1001(alice) gid=1001(alice)"));
    EXPECT_FALSE(AssertionEvaluator::matchOutput(match, "no such user"));
}

TEST_F(AssertionEvaluatorTest, ServiceStatus) {
    connector_->respond("systemctl is-active --quiet 'nginx'", replyWith("", 3));
    connector_->respond("systemctl is-active --quiet 'sshd'", replyWith("", 0));
    connector_->respond("systemctl is-enabled --quiet 'sshd'", replyWith("", 1));

    ServiceStatusAssertion spec;
    spec.service = "nginx";
    spec.expectedStatus = "active";
    AssertionOutcome outcome = evaluate("check_service_status", spec);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.field, "status");
    EXPECT_EQ(outcome.observed, "inactive");

    spec.expectedStatus = "inactive";
    EXPECT_TRUE(evaluate("check_service_status", spec).passed);

    spec.service = "sshd";
    spec.expectedStatus = "active";
    EXPECT_TRUE(evaluate("check_service_status", spec).passed);
    spec.checkEnabled = true;
    outcome = evaluate("check_service_status", spec);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.field, "enabled");
}

TEST_F(AssertionEvaluatorTest, PortListeningBothDirections) {
    connector_->respond("ss -lnt", replyWith(kSsOutput));

    EXPECT_TRUE(portCheck(22, true).passed);
    EXPECT_TRUE(portCheck(80, true).passed);
    EXPECT_TRUE(portCheck(8080, false).passed);

    AssertionOutcome open = portCheck(22, false);
    EXPECT_FALSE(open.passed);
    EXPECT_EQ(open.field, "listening");
    EXPECT_EQ(open.observed, "true");
    EXPECT_EQ(open.expected, "false");

    AssertionOutcome closed = portCheck(8080, true);
    EXPECT_FALSE(closed.passed);
    EXPECT_EQ(closed.observed, "false");
}

TEST_F(AssertionEvaluatorTest, ParseListeningPorts) {
    EXPECT_TRUE(AssertionEvaluator::parseListeningPorts(kSsOutput, 53));
    EXPECT_FALSE(AssertionEvaluator::parseListeningPorts(kSsOutput, 2));
    EXPECT_FALSE(AssertionEvaluator::parseListeningPorts("", 22));
}

TEST_F(AssertionEvaluatorTest, FileExistsAttributes) {
    connector_->respond("stat -L -c '%F|%U|%G|%a' -- '/home/alice'", replyWith("directory|alice|developers|750\n"));
    connector_->respond("stat -L -c '%F|%U|%G|%a' -- '/srv/missing'",
                        replyWith("", 1, "stat: cannot statx '/srv/missing': No such file or directory\n"));

    FileExistsAssertion spec;
    spec.path = "/home/alice";
    spec.fileType = "directory";
    spec.group = "developers";
    spec.permissions = "750";
    EXPECT_TRUE(evaluate("check_file_exists", spec).passed);

    spec.owner = "root";
    AssertionOutcome outcome = evaluate("check_file_exists", spec);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.field, "owner");
    EXPECT_EQ(outcome.observed, "alice");

    spec = FileExistsAssertion();
    spec.path = "/home/alice";
    spec.fileType = "file";
    EXPECT_EQ(evaluate("check_file_exists", spec).field, "file_type");

    spec = FileExistsAssertion();
    spec.path = "/srv/missing";
    spec.expectedState = false;
    EXPECT_TRUE(evaluate("check_file_exists", spec).passed);
}

TEST_F(AssertionEvaluatorTest, FileContains) {
    connector_->respond("cat -- '/etc/hosts'", replyWith("127.0.0.1 localhost\n10.0.0.5 db.lab\n"));
    connector_->respond("cat -- '/etc/secret'", replyWith("", 1, "Permission denied\n"));

    FileContainsAssertion spec;
    spec.path = "/etc/hosts";
    spec.match.mode = MatchMode::Substring;
    spec.match.value = "db.lab";
    EXPECT_TRUE(evaluate("check_file_contains", spec).passed);

    spec.match.mode = MatchMode::Pattern;
    spec.match.value = "10\\.0\\.0\\.9";
    spec.match.pattern = std::regex(spec.match.value);
    AssertionOutcome outcome = evaluate("check_file_contains", spec);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.field, "contains");

    spec.expectedState = false;
    EXPECT_TRUE(evaluate("check_file_contains", spec).passed);

    spec.path = "/etc/secret";
    EXPECT_TRUE(evaluate("check_file_contains", spec).passed);
    spec.expectedState = true;
    EXPECT_EQ(evaluate("check_file_contains", spec).field, "readable");
}

TEST_F(AssertionEvaluatorTest, UserAndGroupChecks) {
    connector_->respond("id -u 'alice'", replyWith("1001\n"));
    connector_->respond("id -u 'bob'", replyWith("", 1, "id: 'bob': no such user\n"));
    connector_->respond("id -Gn 'alice'", replyWith("alice developers\n"));
    connector_->respond("id -gn 'alice'", replyWith("alice\n"));
    connector_->respond("getent passwd 'alice' | cut -d: -f7", replyWith("/bin/bash\n"));
    connector_->respond("getent group 'developers'", replyWith("developers:x:1002:alice\n"));

    UserGroupAssertion spec;
    spec.checkType = "user_exists";
    spec.username = "alice";
    EXPECT_TRUE(evaluate("check_user_group", spec).passed);
    spec.username = "bob";
    EXPECT_FALSE(evaluate("check_user_group", spec).passed);
    spec.expectedState = false;
    EXPECT_TRUE(evaluate("check_user_group", spec).passed);

    spec = UserGroupAssertion();
    spec.checkType = "group_exists";
    spec.group = "developers";
    EXPECT_TRUE(evaluate("check_user_group", spec).passed);

    spec = UserGroupAssertion();
    spec.checkType = "user_in_group";
    spec.username = "alice";
    spec.group = "developers";
    EXPECT_TRUE(evaluate("check_user_group", spec).passed);

    spec.checkType = "user_primary_group";
    AssertionOutcome outcome = evaluate("check_user_group", spec);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.field, "group");
    EXPECT_EQ(outcome.observed, "alice");

    spec.checkType = "user_shell";
    spec.shell = "/bin/bash";
    EXPECT_TRUE(evaluate("check_user_group", spec).passed);
    spec.shell = "/bin/zsh";
    EXPECT_EQ(evaluate("check_user_group", spec).field, "shell");
}

TEST_F(AssertionEvaluatorTest, CheckCommandCountsLines) {
    connector_->respond("ls /etc/nginx/sites-enabled", replyWith("default\nlab.conf\n\n"));

    CheckCommandAssertion spec;
    spec.command = "ls /etc/nginx/sites-enabled";
    EXPECT_TRUE(evaluate("check_command", spec).passed);

    CountExpression count;
    std::string error;
    ASSERT_TRUE(CountExpression::parse(">=3", count, error));
    spec.expectedCount = count;
    AssertionOutcome outcome = evaluate("check_command", spec);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.field, "count");
    EXPECT_EQ(outcome.observed, "2");
    EXPECT_EQ(outcome.expected, ">=3");
}

TEST_F(AssertionEvaluatorTest, HistoryCountsMatchingLines) {
    connector_->setHandler([](const std::string& command) {
        if (command.find(".bash_history") != std::string::npos) {
            return replyWith("ls -la\nsudo usermod -aG developers alice\nusermod  -aG docker alice\n");
        }
        return replyWith("", 127);
    });

    HistoryAssertion spec;
    spec.patternText = "usermod\\s+-aG";
    spec.commandPattern = std::regex(spec.patternText);
    std::string e;
    ASSERT_TRUE(CountExpression::parse(">=2", spec.expectedCount, e));
    EXPECT_TRUE(evaluate("check_history", spec).passed);
    EXPECT_EQ(connector_->commands.back().rfind("home=$(getent passwd 'student'", 0), 0u);

    ASSERT_TRUE(CountExpression::parse("==3", spec.expectedCount, e));
    AssertionOutcome outcome = evaluate("check_history", spec);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.observed, "2");

    spec.userContext = "alice";
    evaluate("check_history", spec);
    EXPECT_EQ(connector_->commands.back().rfind("sudo -n -u 'alice' sh -c ", 0), 0u);
}

TEST_F(AssertionEvaluatorTest, MissingHistoryCountsAsZero) {
    connector_->setHandler([](const std::string&) { return replyWith("", 1, "No such file or directory\n"); });

    HistoryAssertion spec;
    spec.patternText = "systemctl";
    spec.commandPattern = std::regex(spec.patternText);
    AssertionOutcome outcome = evaluate("check_history", spec);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.observed, "0");

    std::string e;
    ASSERT_TRUE(CountExpression::parse("0", spec.expectedCount, e));
    EXPECT_TRUE(evaluate("check_history", spec).passed);
}

TEST_F(AssertionEvaluatorTest, ConnectionFailureFailsAssertion) {
    connector_->rejectAuth = true;

    AssertionOutcome outcome = portCheck(22, true);
    EXPECT_FALSE(outcome.passed);
    EXPECT_EQ(outcome.field, "connection");
    EXPECT_NE(outcome.observed.find("Authentication failed"), std::string::npos);
}
