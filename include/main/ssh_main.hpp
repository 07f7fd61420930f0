#pragma once

#include "common/app_config.hpp"

void printSshUsage();
int sshMain(int argc, char** argv, const AppConfig& config);
