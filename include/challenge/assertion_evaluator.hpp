#pragma once

#include "challenge/challenge_definition.hpp"
#include "challenge/validation_verdict.hpp"
#include "ssh/ssh_manager.hpp"
#include <string>

// Evaluates one assertion against the VM. Every assertion type has a single
// deterministic pass/fail rule; probe failures fail the assertion.
class AssertionEvaluator {
public:
    AssertionEvaluator(SshManager& ssh, const SshCredential& credential, int commandTimeoutSeconds);

    AssertionOutcome evaluate(const Assertion& assertion, size_t index);

    // Wraps a command so it runs as userContext through sudo when that differs from the login user.
    static std::string asUser(const std::string& command, const std::string& userContext,
                              const std::string& loginUser);

    static bool matchOutput(const OutputMatch& match, const std::string& text);
    static bool parseListeningPorts(const std::string& ssOutput, int port);

private:
    bool probe(const std::string& command, CommandResult& result, AssertionOutcome& outcome);

    void check(const RunCommandAssertion& spec, AssertionOutcome& outcome);
    void check(const ServiceStatusAssertion& spec, AssertionOutcome& outcome);
    void check(const PortListeningAssertion& spec, AssertionOutcome& outcome);
    void check(const FileExistsAssertion& spec, AssertionOutcome& outcome);
    void check(const FileContainsAssertion& spec, AssertionOutcome& outcome);
    void check(const UserGroupAssertion& spec, AssertionOutcome& outcome);
    void check(const CheckCommandAssertion& spec, AssertionOutcome& outcome);
    void check(const HistoryAssertion& spec, AssertionOutcome& outcome);

    static void mismatch(AssertionOutcome& outcome, const std::string& field,
                         const std::string& observed, const std::string& expected);

    SshManager& ssh_;
    SshCredential credential_;
    int timeoutSeconds_;
};
