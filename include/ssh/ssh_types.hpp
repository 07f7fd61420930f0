#pragma once

#include "common/error_category.hpp"
#include <string>

struct SshCredential {
    std::string host;
    int port = 22;
    std::string username;
    std::string keyPath;
    std::string passphrase;

    std::string target() const { return username + "@" + host + ":" + std::to_string(port); }
};

// Outcome of one remote command. error describes a connection or protocol
// failure and is independent of the command's own exit status.
struct CommandResult {
    std::string stdoutText;
    std::string stderrText;
    int exitStatus = -1;
    std::string error;
    ErrorCategory category = ErrorCategory::None;
    bool timedOut = false;

    bool ok() const { return error.empty(); }
    bool succeeded() const { return error.empty() && exitStatus == 0; }
};

struct SshOptions {
    int connectTimeoutSeconds = 10;
    int pollIntervalMs = 100;
    int editorWarmupMs = 1000;
};
