#pragma once

#include <string>

enum class ErrorCategory {
    None,
    Configuration,  // bad input, fails before any remote call
    Connectivity,   // auth, transport, timeout
    Environment,    // setup failure, agent or hypervisor refusal
    Assertion,      // a challenge check did not hold
    Consistency     // hypervisor reported success but artifacts are missing
};

inline std::string errorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None:          return "none";
        case ErrorCategory::Configuration: return "configuration";
        case ErrorCategory::Connectivity:  return "connectivity";
        case ErrorCategory::Environment:   return "environment";
        case ErrorCategory::Assertion:     return "assertion";
        case ErrorCategory::Consistency:   return "consistency";
        default:                           return "unknown";
    }
}
