#include "ssh/libssh_connection.hpp"
#include "ssh/ssh_errors.hpp"
#include "common/logger.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <filesystem>
#include <fstream>

LibsshChannel::LibsshChannel(ssh_session session, ssh_channel channel)
    : session_(session)
    , channel_(channel) {
}

LibsshChannel::~LibsshChannel() {
    close();
}

void LibsshChannel::readAvailable(std::string& out, std::string& err) {
    drain(0, out);
    drain(1, err);
}

bool LibsshChannel::isEof() {
    return ssh_channel_is_eof(channel_) != 0 || ssh_channel_is_closed(channel_) != 0;
}

int LibsshChannel::exitStatus() {
    return ssh_channel_get_exit_status(channel_);
}

void LibsshChannel::write(const std::string& data) {
    int written = ssh_channel_write(channel_, data.data(), static_cast<uint32_t>(data.size()));
    if (written < 0) {
        throw SshTransportError("Failed to write to channel: " + std::string(ssh_get_error(session_)));
    }
}

void LibsshChannel::close() {
    if (!channel_) {
        return;
    }
    if (ssh_channel_is_closed(channel_) == 0) {
        ssh_channel_close(channel_);
    }
    ssh_channel_free(channel_);
    channel_ = nullptr;
}

void LibsshChannel::drain(int isStderr, std::string& target) {
    char buffer[4096];
    while (true) {
        int n = ssh_channel_read_nonblocking(channel_, buffer, sizeof(buffer), isStderr);
        if (n > 0) {
            target.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == SSH_ERROR) {
            throw SshTransportError("Failed to read from channel: " + std::string(ssh_get_error(session_)));
        }
        break;
    }
}

LibsshConnection::LibsshConnection(ssh_session session)
    : session_(session)
    , sftp_(nullptr) {
}

LibsshConnection::~LibsshConnection() {
    close();
}

std::unique_ptr<SshChannel> LibsshConnection::openChannel(const std::string& command, bool allocatePty) {
    ssh_channel channel = ssh_channel_new(session_);
    if (!channel) {
        throw SshTransportError("Failed to allocate channel: " + sessionError());
    }
    auto wrapper = std::make_unique<LibsshChannel>(session_, channel);

    if (ssh_channel_open_session(channel) != SSH_OK) {
        throw SshTransportError("Failed to open session channel: " + sessionError());
    }
    if (allocatePty) {
        if (ssh_channel_request_pty_size(channel, "xterm", 80, 24) != SSH_OK) {
            throw SshTransportError("Failed to allocate pseudo-terminal: " + sessionError());
        }
    }
    if (ssh_channel_request_exec(channel, command.c_str()) != SSH_OK) {
        throw SshTransportError("Failed to execute command: " + sessionError());
    }
    return wrapper;
}

bool LibsshConnection::remoteExists(const std::string& path) {
    sftp_attributes attributes = sftp_stat(sftp(), path.c_str());
    if (!attributes) {
        return false;
    }
    sftp_attributes_free(attributes);
    return true;
}

void LibsshConnection::makeRemoteDirectory(const std::string& path) {
    if (sftp_mkdir(sftp(), path.c_str(), 0755) != SSH_OK) {
        throw SshError("Failed to create remote directory " + path + " (sftp error " +
                       std::to_string(sftp_get_error(sftp_)) + ")");
    }
}

void LibsshConnection::uploadFile(const std::string& localPath, const std::string& remotePath) {
    std::ifstream input(localPath, std::ios::binary);
    if (!input) {
        throw SshError("Failed to open local file " + localPath);
    }

    auto perms = std::filesystem::status(localPath).permissions();
    mode_t mode = static_cast<mode_t>(perms) & 0777;

    sftp_file file = sftp_open(sftp(), remotePath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
    if (!file) {
        throw SshTransportError("Failed to open remote file " + remotePath + ": " + sessionError());
    }

    char buffer[32768];
    while (input) {
        input.read(buffer, sizeof(buffer));
        std::streamsize count = input.gcount();
        if (count <= 0) {
            break;
        }
        ssize_t written = sftp_write(file, buffer, static_cast<size_t>(count));
        if (written != count) {
            sftp_close(file);
            throw SshTransportError("Failed to write remote file " + remotePath + ": " + sessionError());
        }
    }
    if (input.bad()) {
        sftp_close(file);
        throw SshError("Failed to read local file " + localPath + ", upload to " + remotePath + " is incomplete");
    }
    if (sftp_close(file) != SSH_OK) {
        throw SshTransportError("Failed to close remote file " + remotePath + ": " + sessionError());
    }
}

void LibsshConnection::close() {
    if (sftp_) {
        sftp_free(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        if (ssh_is_connected(session_)) {
            ssh_disconnect(session_);
        }
        ssh_free(session_);
        session_ = nullptr;
    }
}

sftp_session LibsshConnection::sftp() {
    if (sftp_) {
        return sftp_;
    }
    sftp_session sftp = sftp_new(session_);
    if (!sftp) {
        throw SshTransportError("Failed to create SFTP session: " + sessionError());
    }
    if (sftp_init(sftp) != SSH_OK) {
        std::string error = sessionError();
        sftp_free(sftp);
        throw SshTransportError("Failed to initialize SFTP session: " + error);
    }
    sftp_ = sftp;
    return sftp_;
}

std::string LibsshConnection::sessionError() const {
    return session_ ? std::string(ssh_get_error(session_)) : std::string("session closed");
}

std::unique_ptr<SshConnection> LibsshConnector::connect(const SshCredential& credential, int timeoutSeconds) {
    ssh_session session = ssh_new();
    if (!session) {
        throw SshTransportError("Failed to allocate SSH session");
    }
    auto connection = std::make_unique<LibsshConnection>(session);

    int port = credential.port;
    long timeout = timeoutSeconds;
    if (ssh_options_set(session, SSH_OPTIONS_HOST, credential.host.c_str()) != SSH_OK ||
        ssh_options_set(session, SSH_OPTIONS_PORT, &port) != SSH_OK ||
        ssh_options_set(session, SSH_OPTIONS_USER, credential.username.c_str()) != SSH_OK ||
        ssh_options_set(session, SSH_OPTIONS_TIMEOUT, &timeout) != SSH_OK) {
        throw SshError("Invalid SSH options for " + credential.target() + ": " + ssh_get_error(session));
    }

    if (ssh_connect(session) != SSH_OK) {
        throw SshTransportError("Failed to connect to " + credential.target() + ": " + ssh_get_error(session));
    }

    verifyHostKey(session, credential.host);
    authenticate(session, credential);

    Logger::debug("SSH connection established to " + credential.target());
    return connection;
}

void LibsshConnector::verifyHostKey(ssh_session session, const std::string& host) {
    switch (ssh_session_is_known_server(session)) {
        case SSH_KNOWN_HOSTS_OK:
            break;
        case SSH_KNOWN_HOSTS_CHANGED:
            throw SshTransportError("Host key for " + host + " has changed");
        case SSH_KNOWN_HOSTS_OTHER:
            throw SshTransportError("Host key type for " + host + " has changed");
        case SSH_KNOWN_HOSTS_NOT_FOUND:
        case SSH_KNOWN_HOSTS_UNKNOWN:
            Logger::warning("Accepting unknown host key for " + host);
            break;
        default:
            throw SshTransportError("Failed to verify host key for " + host + ": " + ssh_get_error(session));
    }
}

void LibsshConnector::authenticate(ssh_session session, const SshCredential& credential) {
    ssh_key key = nullptr;
    const char* passphrase = credential.passphrase.empty() ? nullptr : credential.passphrase.c_str();
    if (ssh_pki_import_privkey_file(credential.keyPath.c_str(), passphrase, nullptr, nullptr, &key) != SSH_OK) {
        throw SshAuthError("Failed to load private key " + credential.keyPath);
    }

    int rc = ssh_userauth_publickey(session, nullptr, key);
    ssh_key_free(key);
    if (rc != SSH_AUTH_SUCCESS) {
        throw SshAuthError("Public key authentication failed for " + credential.username + "@" +
                           credential.host + ": " + ssh_get_error(session));
    }
}
