#pragma once

#include "common/logger.hpp"
#include <string>

struct AppConfig {
    struct {
        std::string uri = "qemu:///system";
    } libvirt;
    struct {
        std::string defaultName;
        std::string defaultSnapshot = "baseline";
        int readinessTimeoutSeconds = 120;
        int readinessPollSeconds = 5;
        int agentTimeoutSeconds = 10;
    } vm;
    struct {
        std::string user;
        std::string keyPath = "~/.ssh/id_ed25519";
        int port = 22;
        int connectTimeoutSeconds = 10;
        int commandTimeoutSeconds = 30;
        int interactivePollMs = 100;
        int editorWarmupMs = 1000;
    } ssh;
    struct {
        std::string directory = "challenges";
    } challenges;
    struct {
        std::string path = "/tmp/practicevm.log";
        LogLevel level = LogLevel::INFO;
    } logging;

    // Missing keys keep their defaults. Throws std::runtime_error on a
    // malformed file or a value of the wrong type.
    static AppConfig loadFromFile(const std::string& path);
    static AppConfig loadFromString(const std::string& text);
};
