#pragma once

#include "ssh/ssh_types.hpp"
#include <memory>
#include <string>

// A remote exec channel. Failures are reported by throwing SshError subclasses.
class SshChannel {
public:
    virtual ~SshChannel() = default;

    // Appends whatever output is available without blocking.
    virtual void readAvailable(std::string& out, std::string& err) = 0;

    // True once the remote side has finished sending.
    virtual bool isEof() = 0;

    // Valid after isEof(); -1 when the server sent no status.
    virtual int exitStatus() = 0;

    virtual void write(const std::string& data) = 0;
    virtual void close() = 0;
};

// One authenticated transport connection, closed on destruction.
class SshConnection {
public:
    virtual ~SshConnection() = default;

    virtual std::unique_ptr<SshChannel> openChannel(const std::string& command, bool allocatePty) = 0;

    // SFTP operations
    virtual bool remoteExists(const std::string& path) = 0;
    virtual void makeRemoteDirectory(const std::string& path) = 0;
    virtual void uploadFile(const std::string& localPath, const std::string& remotePath) = 0;

    virtual void close() = 0;
};

class SshConnector {
public:
    virtual ~SshConnector() = default;

    // Throws SshAuthError or SshTransportError.
    virtual std::unique_ptr<SshConnection> connect(const SshCredential& credential, int timeoutSeconds) = 0;
};
