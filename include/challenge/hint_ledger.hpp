#pragma once

#include "challenge/challenge_definition.hpp"
#include <optional>
#include <vector>

// Progressive hint disclosure for one challenge run. Revealed hints stay
// revealed and their costs are deducted from the achievable score.
class HintLedger {
public:
    HintLedger(std::vector<HintDefinition> hints, int maxScore);

    // Returns nothing once every hint has been revealed.
    std::optional<HintDefinition> revealNext();

    std::vector<HintDefinition> revealed() const;
    size_t revealedCount() const;
    size_t totalCount() const;
    bool hasMore() const;

    int maxScore() const;
    int penalty() const;
    int achievableScore() const;

private:
    std::vector<HintDefinition> hints_;
    size_t revealed_;
    int maxScore_;
    int penalty_;
};
