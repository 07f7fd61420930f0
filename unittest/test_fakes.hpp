#pragma once

#include "common/clock.hpp"
#include "ssh/ssh_connection.hpp"
#include "vm/hypervisor_connection.hpp"
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const;
    std::string write(const std::string& name, const std::string& content) const;

private:
    std::string path_;
};

// Time only moves when someone sleeps.
class FakeClock : public Clock {
public:
    FakeClock();

    TimePoint now() const override;
    void sleepFor(std::chrono::milliseconds duration) override;

    void advance(std::chrono::milliseconds duration);
    std::chrono::milliseconds elapsed() const;
    int sleepCount() const { return sleeps_; }

private:
    TimePoint start_;
    TimePoint now_;
    int sleeps_;
};

// In-memory hypervisor. Snapshot creation writes empty overlay files so the
// post-creation check can be exercised against a real filesystem.
class FakeHypervisor : public HypervisorConnection {
public:
    FakeHypervisor();

    void addDomain(const std::string& name, DomainState state, const std::vector<std::string>& diskFiles);
    void addBlockDisk(const std::string& name, const std::string& target, const std::string& device);
    void setDomainState(const std::string& name, DomainState state);
    void addRawSnapshot(const std::string& domain, const std::string& name, const std::string& xml);

    bool connect(const std::string& uri) override;
    void disconnect() override;
    bool isConnected() const override;

    bool getDomainState(const std::string& domain, DomainState& state) override;
    bool getDomainXML(const std::string& domain, std::string& xml) override;

    bool createSnapshot(const std::string& domain, const std::string& snapshotXml,
                        const SnapshotCreateOptions& options) override;
    bool listSnapshotNames(const std::string& domain, std::vector<std::string>& names) override;
    bool getSnapshotXML(const std::string& domain, const std::string& snapshot, std::string& xml) override;
    bool revertToSnapshot(const std::string& domain, const std::string& snapshot, bool startRunning) override;
    bool deleteSnapshot(const std::string& domain, const std::string& snapshot, bool metadataOnly) override;

    bool agentCommand(const std::string& domain, const std::string& command,
                      int timeoutSeconds, std::string& response) override;

    std::string getLastError() const override;
    HypervisorError getLastErrorCode() const override;

    // Behaviour switches
    bool writeOverlayFiles = true;
    bool agentResponsive = true;
    bool refuseCreate = false;
    bool ignoreStartRunning = false;  // disk-only reverts leave the domain shut off

    // Observations
    std::vector<std::string> agentCommands;
    std::vector<std::string> createdXml;
    SnapshotCreateOptions lastCreateOptions;
    bool lastDeleteMetadataOnly = false;
    int revertCount = 0;
    bool lastRevertStartRunning = false;

private:
    struct Snapshot {
        std::string name;
        std::string xml;
    };

    struct Disk {
        std::string type;  // file or block
        std::string target;
        std::string source;
    };

    struct Domain {
        DomainState state = DomainState::ShutOff;
        std::vector<Disk> disks;
        std::vector<Snapshot> snapshots;
    };

    Domain* find(const std::string& name);
    Snapshot* findSnapshot(Domain& domain, const std::string& name);
    std::string domainXml(const std::string& name, const Domain& domain) const;
    bool fail(HypervisorError code, const std::string& message);

    bool connected_;
    long long nextCreationTime_;
    std::map<std::string, Domain> domains_;
    std::string lastError_;
    HypervisorError lastErrorCode_;
};

struct FakeReply {
    std::string stdoutText;
    std::string stderrText;
    int exitStatus = 0;
    bool waitForQuit = false;  // stays open until the editor quit sequence arrives
    bool hang = false;         // never finishes
};

// Scripted SSH endpoint. Commands are answered from exact-match replies,
// then the handler, then a default empty success.
class FakeSshConnector : public SshConnector {
public:
    explicit FakeSshConnector(std::shared_ptr<FakeClock> clock);

    std::unique_ptr<SshConnection> connect(const SshCredential& credential, int timeoutSeconds) override;

    void respond(const std::string& command, const FakeReply& reply);
    void setHandler(std::function<FakeReply(const std::string&)> handler);
    FakeReply replyFor(const std::string& command) const;

    // Connections are refused until this much fake time has passed.
    std::chrono::milliseconds reachableAfter{0};
    bool rejectAuth = false;
    std::set<std::string> acceptedUsers;  // empty accepts everyone
    bool localReadFails = false;  // uploads stop after the first byte with a read error

    std::vector<std::string> commands;
    std::vector<bool> ptyRequests;
    std::vector<std::string> writes;
    int connectAttempts = 0;

    std::set<std::string> remoteDirs;
    std::map<std::string, std::string> remoteFiles;
    std::vector<std::string> createdDirs;

private:
    std::shared_ptr<FakeClock> clock_;
    std::map<std::string, FakeReply> replies_;
    std::function<FakeReply(const std::string&)> handler_;
};
