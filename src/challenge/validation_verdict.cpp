#include "challenge/validation_verdict.hpp"
#include <algorithm>

using json = nlohmann::json;

std::string runPhaseToString(RunPhase phase) {
    switch (phase) {
        case RunPhase::Load:       return "load";
        case RunPhase::Snapshot:   return "snapshot";
        case RunPhase::Setup:      return "setup";
        case RunPhase::Simulation: return "simulation";
        case RunPhase::Validation: return "validation";
        case RunPhase::Complete:   return "complete";
        default:                   return "unknown";
    }
}

size_t ValidationVerdict::failedCount() const {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                             [](const AssertionOutcome& o) { return !o.passed; }));
}

json ValidationVerdict::toJson() const {
    json assertions = json::array();
    for (const auto& outcome : outcomes) {
        json entry = {
            {"index", outcome.index},
            {"type", outcome.type},
            {"passed", outcome.passed}
        };
        if (!outcome.description.empty()) {
            entry["description"] = outcome.description;
        }
        if (!outcome.passed) {
            entry["field"] = outcome.field;
            entry["observed"] = outcome.observed;
            entry["expected"] = outcome.expected;
        }
        if (!outcome.detail.empty()) {
            entry["detail"] = outcome.detail;
        }
        assertions.push_back(entry);
    }

    json result = {
        {"challenge_id", challengeId},
        {"challenge_name", challengeName},
        {"digest", digest},
        {"passed", passed},
        {"phase", runPhaseToString(phase)},
        {"assertions", assertions},
        {"failed_count", failedCount()},
        {"score", {
            {"max", maxScore},
            {"hint_penalty", hintPenalty},
            {"hints_used", hintsUsed},
            {"awarded", awardedScore}
        }}
    };
    if (!error.empty()) {
        result["error"] = error;
        result["category"] = errorCategoryToString(category);
    }
    if (!warnings.empty()) {
        result["warnings"] = warnings;
    }
    if (passed && !flag.empty()) {
        result["flag"] = flag;
    }
    return result;
}
