#pragma once

#include <stdexcept>
#include <string>

class SshError : public std::runtime_error {
public:
    explicit SshError(const std::string& message) : std::runtime_error(message) {}
};

class SshAuthError : public SshError {
public:
    explicit SshAuthError(const std::string& message) : SshError(message) {}
};

class SshTransportError : public SshError {
public:
    explicit SshTransportError(const std::string& message) : SshError(message) {}
};

class SshTimeoutError : public SshError {
public:
    explicit SshTimeoutError(const std::string& message) : SshError(message) {}
};
