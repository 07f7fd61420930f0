#pragma once

#include "common/error_category.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct AssertionOutcome {
    size_t index = 0;
    std::string type;
    std::string description;
    bool passed = false;
    std::string field;     // the mismatched field on failure
    std::string observed;
    std::string expected;
    std::string detail;
};

enum class RunPhase {
    Load,
    Snapshot,
    Setup,
    Simulation,
    Validation,
    Complete
};

std::string runPhaseToString(RunPhase phase);

struct ValidationVerdict {
    std::string challengeId;
    std::string challengeName;
    std::string digest;

    bool passed = false;
    RunPhase phase = RunPhase::Load;  // last phase reached
    std::string error;                // set when the run aborted before validation finished
    ErrorCategory category = ErrorCategory::None;

    std::vector<AssertionOutcome> outcomes;
    std::vector<std::string> warnings;

    int maxScore = 0;
    int hintPenalty = 0;
    size_t hintsUsed = 0;
    int awardedScore = 0;
    std::string flag;  // only exposed when passed

    size_t failedCount() const;
    nlohmann::json toJson() const;
};
