#include <gtest/gtest.h>
#include "common/app_config.hpp"
#include "common/checksum.hpp"
#include "common/utils.hpp"
#include "test_fakes.hpp"
#include <stdexcept>

class AppConfigTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(AppConfigTest, Defaults) {
    AppConfig config = AppConfig::loadFromString("{}");
    EXPECT_EQ(config.libvirt.uri, "qemu:///system");
    EXPECT_EQ(config.vm.defaultSnapshot, "baseline");
    EXPECT_EQ(config.vm.readinessTimeoutSeconds, 120);
    EXPECT_EQ(config.ssh.port, 22);
    EXPECT_EQ(config.ssh.commandTimeoutSeconds, 30);
    EXPECT_EQ(config.logging.level, LogLevel::INFO);
}

TEST_F(AppConfigTest, LoadFromFile) {
    TempDir dir;
    std::string path = dir.write("config.json", R"({
        "libvirt": {"uri": "qemu+ssh://lab/system"},
        "vm": {"default_name": "ubuntu-lab", "readiness_poll_seconds": 2},
        "ssh": {"user": "student", "key_path": "/keys/lab", "port": 2222},
        "challenges": {"directory": "/srv/challenges"},
        "logging": {"level": "debug", "path": "/var/log/practicevm.log"}
    })");

    AppConfig config = AppConfig::loadFromFile(path);
    EXPECT_EQ(config.libvirt.uri, "qemu+ssh://lab/system");
    EXPECT_EQ(config.vm.defaultName, "ubuntu-lab");
    EXPECT_EQ(config.vm.readinessPollSeconds, 2);
    EXPECT_EQ(config.vm.readinessTimeoutSeconds, 120);
    EXPECT_EQ(config.ssh.user, "student");
    EXPECT_EQ(config.ssh.keyPath, "/keys/lab");
    EXPECT_EQ(config.ssh.port, 2222);
    EXPECT_EQ(config.challenges.directory, "/srv/challenges");
    EXPECT_EQ(config.logging.level, LogLevel::DEBUG);
    EXPECT_EQ(config.logging.path, "/var/log/practicevm.log");
}

TEST_F(AppConfigTest, RejectsBadValues) {
    EXPECT_THROW(AppConfig::loadFromString("{not json"), std::runtime_error);
    EXPECT_THROW(AppConfig::loadFromString("[]"), std::runtime_error);
    EXPECT_THROW(AppConfig::loadFromString(R"({"ssh": {"port": "twenty-two"}})"), std::runtime_error);
    EXPECT_THROW(AppConfig::loadFromString(R"({"ssh": {"port": 0}})"), std::runtime_error);
    EXPECT_THROW(AppConfig::loadFromString(R"({"vm": "lab"})"), std::runtime_error);
    EXPECT_THROW(AppConfig::loadFromString(R"({"logging": {"level": "loud"}})"), std::runtime_error);
    EXPECT_THROW(AppConfig::loadFromFile("/nonexistent/practicevm.json"), std::runtime_error);
}

TEST_F(AppConfigTest, Sha256Digest) {
    std::string hex;
    std::string error;
    ASSERT_TRUE(checksum::sha256Hex("abc", hex, error));
    EXPECT_EQ(hex, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(AppConfigTest, ShellQuote) {
    EXPECT_EQ(utils::shellQuote("plain"), "'plain'");
    EXPECT_EQ(utils::shellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(utils::trim("  value \r\n"), "value");
    EXPECT_EQ(utils::xmlUnescape(utils::xmlEscape("a<b & 'c'")), "a<b & 'c'");
}
