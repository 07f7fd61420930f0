#pragma once

#include "common/clock.hpp"
#include "common/error_category.hpp"
#include "ssh/ssh_connection.hpp"
#include "ssh/ssh_types.hpp"
#include <memory>
#include <string>

// Remote command execution and file transfer. Every call opens its own
// connection and closes it before returning.
class SshManager {
public:
    SshManager(std::shared_ptr<SshConnector> connector, std::shared_ptr<Clock> clock,
               SshOptions options = SshOptions());

    // Throws std::invalid_argument for an empty host, username or command,
    // or a non-positive timeout. All other failures land in the result.
    CommandResult execute(const SshCredential& credential, const std::string& command,
                          int timeoutSeconds, bool allocateTTY = false);

    // PTY execution; vi-family editors are sent a quit sequence after the warm-up delay.
    CommandResult executeInteractive(const SshCredential& credential, const std::string& command,
                                     int timeoutSeconds);

    // Probes immediately, then every pollIntervalSeconds until timeoutSeconds elapse.
    bool waitReady(const SshCredential& credential, int timeoutSeconds, int pollIntervalSeconds);

    bool copyFile(const SshCredential& credential, const std::string& localPath,
                  const std::string& remotePath, bool createDirs = true);

    std::string getLastError() const;
    ErrorCategory getLastErrorCategory() const;

    static bool isEditorCommand(const std::string& command);

    // Expands ~, requires a regular file, tightens group/other permission
    // bits to 0600 where possible.
    static bool prepareKey(const std::string& keyPath, std::string& resolvedPath, std::string& error);

    static const char* editorQuitSequence() { return "\x1b:q!\r"; }

private:
    void validateCredential(const SshCredential& credential) const;
    void runChannel(SshChannel& channel, int timeoutSeconds, bool quitEditor, CommandResult& result);
    void ensureRemoteDirectories(SshConnection& connection, const std::string& remotePath);
    void setError(ErrorCategory category, const std::string& message);

    std::shared_ptr<SshConnector> connector_;
    std::shared_ptr<Clock> clock_;
    SshOptions options_;
    std::string lastError_;
    ErrorCategory lastErrorCategory_;
};
