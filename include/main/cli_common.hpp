#pragma once

#include "api/practice_api.hpp"
#include "common/app_config.hpp"
#include <string>

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// Consumes an SSH option (--host, --port, --user, --key, --passphrase) at argv[i].
bool parseSshOption(int& i, int argc, char** argv, SshCredential& credential);

// Reads the value following argv[i]; throws std::invalid_argument when it is missing.
std::string requireValue(int& i, int argc, char** argv);
int requireIntValue(int& i, int argc, char** argv);

// Builds the shared context. The hypervisor is only connected when requested.
bool makeContext(const AppConfig& config, bool connectHypervisor, PracticeContext& context, std::string& error);

void printOperationResult(const OperationResult& result, const std::string& successMessage);
