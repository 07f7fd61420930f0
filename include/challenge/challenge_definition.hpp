#pragma once

#include "challenge/count_expression.hpp"
#include <optional>
#include <regex>
#include <string>
#include <variant>
#include <vector>

enum class MatchMode {
    None,
    Exact,      // equal after trimming surrounding whitespace
    Substring,
    Pattern     // ECMAScript regex search
};

struct OutputMatch {
    MatchMode mode = MatchMode::None;
    std::string value;
    std::regex pattern;
};

// Setup steps

struct RunCommandStep {
    std::string command;
    int expectedExitStatus = 0;
    std::string userContext;
};

struct CopyFileStep {
    std::string localPath;  // resolved against the definition's directory
    std::string remotePath;
    bool createDirs = true;
};

struct SetupStep {
    std::string type;
    std::string description;
    std::variant<RunCommandStep, CopyFileStep> action;
};

// Assertions

struct RunCommandAssertion {
    std::string command;
    int expectedExitStatus = 0;
    OutputMatch stdoutMatch;
    OutputMatch stderrMatch;
    bool stderrEmpty = false;
    std::string userContext;
};

struct ServiceStatusAssertion {
    std::string service;
    std::string expectedStatus;  // active, inactive or failed
    bool checkEnabled = false;
};

struct PortListeningAssertion {
    int port = 0;
    std::string protocol = "tcp";
    bool expectedState = true;
};

struct FileExistsAssertion {
    std::string path;
    bool expectedState = true;
    std::string fileType = "any";  // any, file or directory
    std::string owner;
    std::string group;
    std::string permissions;  // octal, e.g. 644
};

struct FileContainsAssertion {
    std::string path;
    OutputMatch match;  // Substring or Pattern
    bool expectedState = true;
};

struct UserGroupAssertion {
    std::string checkType;  // user_exists, group_exists, user_primary_group, user_in_group, user_shell
    std::string username;
    std::string group;
    std::string shell;
    bool expectedState = true;
};

struct CheckCommandAssertion {
    std::string command;
    int expectedExitStatus = 0;
    std::optional<CountExpression> expectedCount;
};

struct HistoryAssertion {
    std::string patternText;
    std::regex commandPattern;
    CountExpression expectedCount;
    std::string userContext;
};

using AssertionSpec = std::variant<RunCommandAssertion,
                                   ServiceStatusAssertion,
                                   PortListeningAssertion,
                                   FileExistsAssertion,
                                   FileContainsAssertion,
                                   UserGroupAssertion,
                                   CheckCommandAssertion,
                                   HistoryAssertion>;

struct Assertion {
    std::string type;
    std::string description;
    AssertionSpec spec;
};

struct HintDefinition {
    std::string text;
    int cost = 0;
};

struct ChallengeDefinition {
    std::string id;
    std::string name;
    std::string description;
    std::string category;
    std::string difficulty;
    int score = 100;
    std::vector<std::string> concepts;
    std::vector<SetupStep> setup;
    std::optional<std::string> userActionSimulation;
    std::vector<Assertion> validation;
    std::vector<HintDefinition> hints;
    std::string flag;

    std::string sourcePath;
    std::string digest;  // SHA-256 of the source file, hex
};
