#include "challenge/assertion_evaluator.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <sstream>
#include <variant>

namespace {

std::string boolText(bool value) {
    return value ? "true" : "false";
}

std::vector<std::string> tokenize(const std::string& line) {
    std::istringstream stream(line);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

} // namespace

AssertionEvaluator::AssertionEvaluator(SshManager& ssh, const SshCredential& credential, int commandTimeoutSeconds)
    : ssh_(ssh)
    , credential_(credential)
    , timeoutSeconds_(commandTimeoutSeconds) {
}

AssertionOutcome AssertionEvaluator::evaluate(const Assertion& assertion, size_t index) {
    AssertionOutcome outcome;
    outcome.index = index;
    outcome.type = assertion.type;
    outcome.description = assertion.description;
    outcome.passed = true;

    std::visit([this, &outcome](const auto& spec) { check(spec, outcome); }, assertion.spec);

    if (outcome.passed) {
        Logger::info("Assertion " + std::to_string(index + 1) + " (" + assertion.type + ") passed");
    } else {
        Logger::info("Assertion " + std::to_string(index + 1) + " (" + assertion.type + ") failed on '" +
                     outcome.field + "': observed '" + outcome.observed + "', expected '" + outcome.expected + "'");
    }
    return outcome;
}

std::string AssertionEvaluator::asUser(const std::string& command, const std::string& userContext,
                                       const std::string& loginUser) {
    if (userContext.empty() || userContext == loginUser) {
        return command;
    }
    if (userContext == "root") {
        return "sudo -n sh -c " + utils::shellQuote(command);
    }
    return "sudo -n -u " + utils::shellQuote(userContext) + " sh -c " + utils::shellQuote(command);
}

bool AssertionEvaluator::matchOutput(const OutputMatch& match, const std::string& text) {
    switch (match.mode) {
        case MatchMode::None:
            return true;
        case MatchMode::Exact:
            return utils::trim(text) == utils::trim(match.value);
        case MatchMode::Substring:
            return text.find(match.value) != std::string::npos;
        case MatchMode::Pattern:
            return std::regex_search(text, match.pattern);
    }
    return false;
}

bool AssertionEvaluator::parseListeningPorts(const std::string& ssOutput, int port) {
    const std::string wanted = std::to_string(port);
    for (const auto& line : utils::splitLines(ssOutput)) {
        auto tokens = tokenize(line);
        if (tokens.size() < 4 || tokens[0] == "State" || tokens[0] == "Netid") {
            continue;
        }
        const std::string& local = tokens[3];
        size_t colon = local.rfind(':');
        if (colon != std::string::npos && local.substr(colon + 1) == wanted) {
            return true;
        }
    }
    return false;
}

bool AssertionEvaluator::probe(const std::string& command, CommandResult& result, AssertionOutcome& outcome) {
    result = ssh_.execute(credential_, command, timeoutSeconds_);
    if (!result.ok()) {
        mismatch(outcome, "connection", result.error, "command executed");
        outcome.detail = result.error;
        return false;
    }
    return true;
}

void AssertionEvaluator::check(const RunCommandAssertion& spec, AssertionOutcome& outcome) {
    CommandResult result;
    if (!probe(asUser(spec.command, spec.userContext, credential_.username), result, outcome)) {
        return;
    }

    if (result.exitStatus != spec.expectedExitStatus) {
        mismatch(outcome, "exit_status", std::to_string(result.exitStatus), std::to_string(spec.expectedExitStatus));
        outcome.detail = utils::trim(result.stderrText);
        return;
    }
    if (!matchOutput(spec.stdoutMatch, result.stdoutText)) {
        mismatch(outcome, "stdout", utils::trim(result.stdoutText), spec.stdoutMatch.value);
        return;
    }
    if (!matchOutput(spec.stderrMatch, result.stderrText)) {
        mismatch(outcome, "stderr", utils::trim(result.stderrText), spec.stderrMatch.value);
        return;
    }
    if (spec.stderrEmpty && !utils::trim(result.stderrText).empty()) {
        mismatch(outcome, "stderr", utils::trim(result.stderrText), "");
        outcome.detail = "stderr expected to be empty";
    }
}

void AssertionEvaluator::check(const ServiceStatusAssertion& spec, AssertionOutcome& outcome) {
    CommandResult result;
    if (!probe("systemctl is-active --quiet " + utils::shellQuote(spec.service), result, outcome)) {
        return;
    }

    std::string status;
    switch (result.exitStatus) {
        case 0:  status = "active"; break;
        case 3:  status = "inactive"; break;
        default: status = "failed"; break;
    }
    if (status != spec.expectedStatus) {
        mismatch(outcome, "status", status, spec.expectedStatus);
        return;
    }

    if (spec.checkEnabled) {
        if (!probe("systemctl is-enabled --quiet " + utils::shellQuote(spec.service), result, outcome)) {
            return;
        }
        if (result.exitStatus != 0) {
            mismatch(outcome, "enabled", "false", "true");
        }
    }
}

void AssertionEvaluator::check(const PortListeningAssertion& spec, AssertionOutcome& outcome) {
    CommandResult result;
    std::string command = spec.protocol == "udp" ? "ss -lnu" : "ss -lnt";
    if (!probe(command, result, outcome)) {
        return;
    }
    if (result.exitStatus != 0) {
        mismatch(outcome, "probe", "exit status " + std::to_string(result.exitStatus), "exit status 0");
        outcome.detail = utils::trim(result.stderrText);
        return;
    }

    bool listening = parseListeningPorts(result.stdoutText, spec.port);
    if (listening != spec.expectedState) {
        mismatch(outcome, "listening", boolText(listening), boolText(spec.expectedState));
        outcome.detail = spec.protocol + " port " + std::to_string(spec.port);
    }
}

void AssertionEvaluator::check(const FileExistsAssertion& spec, AssertionOutcome& outcome) {
    CommandResult result;
    if (!probe("stat -L -c '%F|%U|%G|%a' -- " + utils::shellQuote(spec.path), result, outcome)) {
        return;
    }

    bool exists = result.exitStatus == 0;
    if (exists != spec.expectedState) {
        mismatch(outcome, "exists", boolText(exists), boolText(spec.expectedState));
        outcome.detail = spec.path;
        return;
    }
    if (!exists) {
        return;
    }

    std::vector<std::string> fields;
    std::stringstream stream(utils::trim(result.stdoutText));
    std::string field;
    while (std::getline(stream, field, '|')) {
        fields.push_back(field);
    }
    if (fields.size() < 4) {
        mismatch(outcome, "probe", utils::trim(result.stdoutText), "type|owner|group|mode");
        return;
    }

    const std::string& type = fields[0];
    if (spec.fileType == "file" && type.find("regular") == std::string::npos) {
        mismatch(outcome, "file_type", type, "file");
        return;
    }
    if (spec.fileType == "directory" && type != "directory") {
        mismatch(outcome, "file_type", type, "directory");
        return;
    }
    if (!spec.owner.empty() && fields[1] != spec.owner) {
        mismatch(outcome, "owner", fields[1], spec.owner);
        return;
    }
    if (!spec.group.empty() && fields[2] != spec.group) {
        mismatch(outcome, "group", fields[2], spec.group);
        return;
    }
    if (!spec.permissions.empty() && fields[3] != spec.permissions) {
        mismatch(outcome, "permissions", fields[3], spec.permissions);
    }
}

void AssertionEvaluator::check(const FileContainsAssertion& spec, AssertionOutcome& outcome) {
    CommandResult result;
    if (!probe("cat -- " + utils::shellQuote(spec.path), result, outcome)) {
        return;
    }

    if (result.exitStatus != 0) {
        // An unreadable file cannot contain anything.
        if (spec.expectedState) {
            mismatch(outcome, "readable", "false", "true");
            outcome.detail = utils::trim(result.stderrText);
        }
        return;
    }

    bool found = matchOutput(spec.match, result.stdoutText);
    if (found != spec.expectedState) {
        mismatch(outcome, "contains", boolText(found), boolText(spec.expectedState));
        outcome.detail = spec.path + ": " + spec.match.value;
    }
}

void AssertionEvaluator::check(const UserGroupAssertion& spec, AssertionOutcome& outcome) {
    CommandResult result;
    const std::string user = utils::shellQuote(spec.username);
    const std::string& type = spec.checkType;

    if (type == "user_exists" || type == "group_exists") {
        std::string command = type == "user_exists" ? "id -u " + user : "getent group " + utils::shellQuote(spec.group);
        if (!probe(command, result, outcome)) {
            return;
        }
        bool exists = result.exitStatus == 0;
        if (exists != spec.expectedState) {
            mismatch(outcome, "exists", boolText(exists), boolText(spec.expectedState));
            outcome.detail = type == "user_exists" ? spec.username : spec.group;
        }
        return;
    }

    std::string command;
    if (type == "user_primary_group") {
        command = "id -gn " + user;
    } else if (type == "user_in_group") {
        command = "id -Gn " + user;
    } else {
        command = "getent passwd " + user + " | cut -d: -f7";
    }
    if (!probe(command, result, outcome)) {
        return;
    }
    std::string observed = utils::trim(result.stdoutText);
    if (result.exitStatus != 0 || observed.empty()) {
        mismatch(outcome, "username", "missing", spec.username);
        outcome.detail = "user not found";
        return;
    }

    bool holds = false;
    std::string expected;
    if (type == "user_primary_group") {
        holds = observed == spec.group;
        expected = spec.group;
    } else if (type == "user_in_group") {
        auto groups = tokenize(observed);
        holds = std::find(groups.begin(), groups.end(), spec.group) != groups.end();
        expected = spec.group;
    } else {
        holds = observed == spec.shell;
        expected = spec.shell;
    }

    if (holds != spec.expectedState) {
        std::string field = type == "user_shell" ? "shell" : "group";
        mismatch(outcome, field, observed, spec.expectedState ? expected : "not " + expected);
    }
}

void AssertionEvaluator::check(const CheckCommandAssertion& spec, AssertionOutcome& outcome) {
    CommandResult result;
    if (!probe(spec.command, result, outcome)) {
        return;
    }
    if (result.exitStatus != spec.expectedExitStatus) {
        mismatch(outcome, "exit_status", std::to_string(result.exitStatus), std::to_string(spec.expectedExitStatus));
        outcome.detail = utils::trim(result.stderrText);
        return;
    }
    if (spec.expectedCount) {
        long count = 0;
        for (const auto& line : utils::splitLines(result.stdoutText)) {
            if (!utils::trim(line).empty()) {
                ++count;
            }
        }
        if (!spec.expectedCount->matches(count)) {
            mismatch(outcome, "count", std::to_string(count), spec.expectedCount->toString());
        }
    }
}

void AssertionEvaluator::check(const HistoryAssertion& spec, AssertionOutcome& outcome) {
    const std::string user = spec.userContext.empty() ? credential_.username : spec.userContext;
    std::string command = "home=$(getent passwd " + utils::shellQuote(user) +
                          " | cut -d: -f6) && cat \"$home/.bash_history\"";

    CommandResult result;
    if (!probe(asUser(command, user, credential_.username), result, outcome)) {
        return;
    }

    long count = 0;
    if (result.exitStatus == 0) {
        for (const auto& line : utils::splitLines(result.stdoutText)) {
            if (std::regex_search(line, spec.commandPattern)) {
                ++count;
            }
        }
    }

    if (!spec.expectedCount.matches(count)) {
        mismatch(outcome, "count", std::to_string(count), spec.expectedCount.toString());
        outcome.detail = result.exitStatus == 0 ? "history of " + user + " matched /" + spec.patternText + "/"
                                                : "history of " + user + " not readable";
    }
}

void AssertionEvaluator::mismatch(AssertionOutcome& outcome, const std::string& field,
                                  const std::string& observed, const std::string& expected) {
    outcome.passed = false;
    outcome.field = field;
    outcome.observed = observed;
    outcome.expected = expected;
}
