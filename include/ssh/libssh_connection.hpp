#pragma once

#include "ssh/ssh_connection.hpp"
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <memory>
#include <string>

class LibsshChannel : public SshChannel {
public:
    LibsshChannel(ssh_session session, ssh_channel channel);
    ~LibsshChannel() override;

    LibsshChannel(const LibsshChannel&) = delete;
    LibsshChannel& operator=(const LibsshChannel&) = delete;

    void readAvailable(std::string& out, std::string& err) override;
    bool isEof() override;
    int exitStatus() override;
    void write(const std::string& data) override;
    void close() override;

private:
    void drain(int isStderr, std::string& target);

    ssh_session session_;
    ssh_channel channel_;
};

class LibsshConnection : public SshConnection {
public:
    explicit LibsshConnection(ssh_session session);
    ~LibsshConnection() override;

    LibsshConnection(const LibsshConnection&) = delete;
    LibsshConnection& operator=(const LibsshConnection&) = delete;

    std::unique_ptr<SshChannel> openChannel(const std::string& command, bool allocatePty) override;

    bool remoteExists(const std::string& path) override;
    void makeRemoteDirectory(const std::string& path) override;
    void uploadFile(const std::string& localPath, const std::string& remotePath) override;

    void close() override;

private:
    sftp_session sftp();
    std::string sessionError() const;

    ssh_session session_;
    sftp_session sftp_;
};

class LibsshConnector : public SshConnector {
public:
    std::unique_ptr<SshConnection> connect(const SshCredential& credential, int timeoutSeconds) override;

private:
    void verifyHostKey(ssh_session session, const std::string& host);
    void authenticate(ssh_session session, const SshCredential& credential);
};
