#pragma once

#include "common/app_config.hpp"

void printSnapshotUsage();
int snapshotMain(int argc, char** argv, const AppConfig& config);
