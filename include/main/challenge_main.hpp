#pragma once

#include "common/app_config.hpp"

void printChallengeUsage();
int challengeMain(int argc, char** argv, const AppConfig& config);
