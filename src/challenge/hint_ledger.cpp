#include "challenge/hint_ledger.hpp"
#include "common/logger.hpp"
#include <algorithm>

HintLedger::HintLedger(std::vector<HintDefinition> hints, int maxScore)
    : hints_(std::move(hints))
    , revealed_(0)
    , maxScore_(maxScore)
    , penalty_(0) {
}

std::optional<HintDefinition> HintLedger::revealNext() {
    if (!hasMore()) {
        return std::nullopt;
    }
    const HintDefinition& hint = hints_[revealed_++];
    penalty_ += hint.cost;
    Logger::debug("Revealed hint " + std::to_string(revealed_) + "/" + std::to_string(hints_.size()) +
                  " (cost " + std::to_string(hint.cost) + ")");
    return hint;
}

std::vector<HintDefinition> HintLedger::revealed() const {
    return std::vector<HintDefinition>(hints_.begin(), hints_.begin() + static_cast<long>(revealed_));
}

size_t HintLedger::revealedCount() const {
    return revealed_;
}

size_t HintLedger::totalCount() const {
    return hints_.size();
}

bool HintLedger::hasMore() const {
    return revealed_ < hints_.size();
}

int HintLedger::maxScore() const {
    return maxScore_;
}

int HintLedger::penalty() const {
    return penalty_;
}

int HintLedger::achievableScore() const {
    return std::max(0, maxScore_ - penalty_);
}
