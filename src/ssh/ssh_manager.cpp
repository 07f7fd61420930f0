#include "ssh/ssh_manager.hpp"
#include "ssh/ssh_errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <vector>

SshManager::SshManager(std::shared_ptr<SshConnector> connector, std::shared_ptr<Clock> clock,
                       SshOptions options)
    : connector_(std::move(connector))
    , clock_(std::move(clock))
    , options_(options)
    , lastErrorCategory_(ErrorCategory::None) {
}

CommandResult SshManager::execute(const SshCredential& credential, const std::string& command,
                                  int timeoutSeconds, bool allocateTTY) {
    validateCredential(credential);
    if (command.empty()) {
        throw std::invalid_argument("Command must not be empty");
    }
    if (timeoutSeconds <= 0) {
        throw std::invalid_argument("Timeout must be positive");
    }

    CommandResult result;
    SshCredential resolved = credential;
    std::string keyError;
    if (!prepareKey(credential.keyPath, resolved.keyPath, keyError)) {
        result.error = keyError;
        result.category = ErrorCategory::Configuration;
        setError(result.category, result.error);
        return result;
    }

    bool quitEditor = allocateTTY && isEditorCommand(command);
    Logger::debug("Executing on " + credential.target() + (allocateTTY ? " (pty): " : ": ") + command);

    try {
        std::unique_ptr<SshConnection> connection = connector_->connect(resolved, options_.connectTimeoutSeconds);
        std::unique_ptr<SshChannel> channel = connection->openChannel(command, allocateTTY);
        runChannel(*channel, timeoutSeconds, quitEditor, result);
        channel->close();
        connection->close();
    } catch (const SshAuthError& e) {
        result.error = "Authentication failed for " + credential.target() + ": " + e.what();
        result.category = ErrorCategory::Connectivity;
    } catch (const SshTimeoutError& e) {
        result.error = e.what();
        result.category = ErrorCategory::Connectivity;
        result.timedOut = true;
    } catch (const SshTransportError& e) {
        result.error = "SSH transport error for " + credential.target() + ": " + e.what();
        result.category = ErrorCategory::Connectivity;
    } catch (const std::exception& e) {
        result.error = "Unexpected SSH error for " + credential.target() + ": " + e.what();
        result.category = ErrorCategory::Connectivity;
    }

    if (result.ok()) {
        lastError_.clear();
        lastErrorCategory_ = ErrorCategory::None;
        Logger::debug("Command finished with exit status " + std::to_string(result.exitStatus));
    } else {
        setError(result.category, result.error);
    }
    return result;
}

CommandResult SshManager::executeInteractive(const SshCredential& credential, const std::string& command,
                                             int timeoutSeconds) {
    return execute(credential, command, timeoutSeconds, true);
}

bool SshManager::waitReady(const SshCredential& credential, int timeoutSeconds, int pollIntervalSeconds) {
    validateCredential(credential);
    if (timeoutSeconds <= 0 || pollIntervalSeconds <= 0) {
        throw std::invalid_argument("Timeout and poll interval must be positive");
    }

    Logger::info("Waiting up to " + std::to_string(timeoutSeconds) + "s for SSH on " + credential.target());

    const auto start = clock_->now();
    const auto timeout = std::chrono::seconds(timeoutSeconds);
    int attempts = 0;
    std::string lastFailure;

    while (clock_->now() - start < timeout) {
        ++attempts;
        CommandResult probe = execute(credential, "true", options_.connectTimeoutSeconds);
        if (probe.succeeded()) {
            Logger::info("SSH ready on " + credential.target() + " after " + std::to_string(attempts) + " attempt(s)");
            lastError_.clear();
            lastErrorCategory_ = ErrorCategory::None;
            return true;
        }

        lastFailure = probe.ok() ? "probe exited with status " + std::to_string(probe.exitStatus) : probe.error;
        if (probe.category == ErrorCategory::Configuration) {
            setError(ErrorCategory::Configuration, lastFailure);
            return false;
        }
        Logger::debug("SSH not ready (attempt " + std::to_string(attempts) + "): " + lastFailure);
        clock_->sleepFor(std::chrono::seconds(pollIntervalSeconds));
    }

    setError(ErrorCategory::Connectivity, "SSH on " + credential.target() + " not ready after " +
             std::to_string(timeoutSeconds) + "s: " + lastFailure);
    return false;
}

bool SshManager::copyFile(const SshCredential& credential, const std::string& localPath,
                          const std::string& remotePath, bool createDirs) {
    validateCredential(credential);
    if (localPath.empty() || remotePath.empty()) {
        throw std::invalid_argument("Local and remote paths must not be empty");
    }

    if (!std::filesystem::is_regular_file(localPath)) {
        setError(ErrorCategory::Configuration, "Local file not found: " + localPath);
        return false;
    }

    SshCredential resolved = credential;
    std::string keyError;
    if (!prepareKey(credential.keyPath, resolved.keyPath, keyError)) {
        setError(ErrorCategory::Configuration, keyError);
        return false;
    }

    try {
        std::unique_ptr<SshConnection> connection = connector_->connect(resolved, options_.connectTimeoutSeconds);
        if (createDirs) {
            ensureRemoteDirectories(*connection, remotePath);
        }
        connection->uploadFile(localPath, remotePath);
        connection->close();
    } catch (const SshAuthError& e) {
        setError(ErrorCategory::Connectivity, "Authentication failed for " + credential.target() + ": " + e.what());
        return false;
    } catch (const SshTransportError& e) {
        setError(ErrorCategory::Connectivity, "SFTP transfer to " + credential.target() + " failed: " + e.what());
        return false;
    } catch (const std::exception& e) {
        setError(ErrorCategory::Connectivity, "Unexpected error copying " + localPath + ": " + e.what());
        return false;
    }

    lastError_.clear();
    lastErrorCategory_ = ErrorCategory::None;
    Logger::info("Copied " + localPath + " to " + credential.host + ":" + remotePath);
    return true;
}

std::string SshManager::getLastError() const {
    return lastError_;
}

ErrorCategory SshManager::getLastErrorCategory() const {
    return lastErrorCategory_;
}

bool SshManager::isEditorCommand(const std::string& command) {
    static const std::vector<std::string> editors = {"vi", "vim", "nvim", "view"};

    std::istringstream stream(command);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }

    size_t i = 0;
    if (i < tokens.size() && tokens[i] == "sudo") {
        ++i;
        while (i < tokens.size() && !tokens[i].empty() && tokens[i][0] == '-') {
            if (tokens[i] == "-u" || tokens[i] == "-g") {
                ++i;
            }
            ++i;
        }
    }
    while (i < tokens.size() && tokens[i].find('=') != std::string::npos) {
        ++i;
    }
    if (i >= tokens.size()) {
        return false;
    }

    std::string program = std::filesystem::path(tokens[i]).filename().string();
    return std::find(editors.begin(), editors.end(), program) != editors.end();
}

bool SshManager::prepareKey(const std::string& keyPath, std::string& resolvedPath, std::string& error) {
    if (keyPath.empty()) {
        error = "No private key configured";
        return false;
    }

    resolvedPath = utils::expandHome(keyPath);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(resolvedPath, ec)) {
        error = "Private key not found: " + resolvedPath;
        return false;
    }

    using std::filesystem::perms;
    perms current = std::filesystem::status(resolvedPath, ec).permissions();
    if (ec) {
        error = "Cannot read permissions of " + resolvedPath + ": " + ec.message();
        return false;
    }
    if ((current & (perms::group_all | perms::others_all)) != perms::none) {
        std::filesystem::permissions(resolvedPath, perms::owner_read | perms::owner_write,
                                     std::filesystem::perm_options::replace, ec);
        if (ec) {
            Logger::warning("Could not restrict permissions of " + resolvedPath + ": " + ec.message());
        } else {
            Logger::info("Restricted permissions of " + resolvedPath + " to 0600");
        }
    }
    return true;
}

void SshManager::validateCredential(const SshCredential& credential) const {
    if (credential.host.empty()) {
        throw std::invalid_argument("SSH host must not be empty");
    }
    if (credential.username.empty()) {
        throw std::invalid_argument("SSH username must not be empty");
    }
}

void SshManager::runChannel(SshChannel& channel, int timeoutSeconds, bool quitEditor, CommandResult& result) {
    const auto start = clock_->now();
    const auto deadline = start + std::chrono::seconds(timeoutSeconds);
    const auto warmup = std::chrono::milliseconds(options_.editorWarmupMs);
    const auto pollInterval = std::chrono::milliseconds(options_.pollIntervalMs);
    bool quitSent = false;

    while (true) {
        channel.readAvailable(result.stdoutText, result.stderrText);
        if (channel.isEof()) {
            channel.readAvailable(result.stdoutText, result.stderrText);
            result.exitStatus = channel.exitStatus();
            return;
        }

        auto now = clock_->now();
        if (quitEditor && !quitSent && now - start >= warmup) {
            Logger::debug("Sending editor quit sequence");
            channel.write(editorQuitSequence());
            quitSent = true;
        }
        if (now >= deadline) {
            throw SshTimeoutError("Command timed out after " + std::to_string(timeoutSeconds) + "s");
        }
        clock_->sleepFor(pollInterval);
    }
}

void SshManager::ensureRemoteDirectories(SshConnection& connection, const std::string& remotePath) {
    std::filesystem::path parent = std::filesystem::path(remotePath).parent_path();

    std::vector<std::string> missing;
    while (!parent.empty() && parent != parent.root_path() && parent.string() != ".") {
        if (connection.remoteExists(parent.string())) {
            break;
        }
        missing.push_back(parent.string());
        parent = parent.parent_path();
    }

    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        try {
            connection.makeRemoteDirectory(*it);
            Logger::debug("Created remote directory " + *it);
        } catch (const SshTransportError&) {
            throw;
        } catch (const SshError& e) {
            // A concurrent creator may have won; the upload reports real path errors.
            Logger::warning(e.what());
        }
    }
}

void SshManager::setError(ErrorCategory category, const std::string& message) {
    lastErrorCategory_ = category;
    lastError_ = message;
    Logger::error(message);
}
