#pragma once

#include <string>
#include <mutex>
#include <functional>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

class Logger {
public:
    using CaptureCallback = std::function<void(LogLevel, const std::string&)>;

    static bool initialize(const std::string& logPath, LogLevel level = LogLevel::DEBUG);
    static void shutdown();
    static void setLogLevel(LogLevel level);
    static void setConsoleOutput(bool enabled);

    // Receives every message that passes the level filter, whether or not a
    // log file has been initialized. Pass nullptr to detach.
    static void setCaptureCallback(CaptureCallback callback);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static void fatal(const std::string& message);
    static bool isInitialized() { return initialized_; }

    static bool parseLevel(const std::string& name, LogLevel& level);
    static std::string levelToString(LogLevel level);

private:
    static void log(LogLevel level, const std::string& message);

    static std::mutex mutex_;
    static LogLevel currentLevel_;
    static bool initialized_;
    static bool consoleOutput_;
    static std::string logPath_;
    static CaptureCallback capture_;
};
