#pragma once

#include "card_identifier/types.hpp"
#include <optional>

namespace card_identifier::matching {

/**
 * @brief Maps distances to confidence tiers and decides hash-only acceptance
 */
class ConfidencePolicy {
public:
    explicit ConfidencePolicy(const MatchingParams& params) : params_(params) {}

    ConfidenceTier hashTier(double distance) const;
    ConfidenceTier embeddingTier(double distance) const;

    /**
     * @brief True when the best hash distance is within the high threshold and
     * leads the runner-up by at least min_margin. No runner-up counts as an
     * unbounded margin.
     */
    bool acceptHashMatch(double best, std::optional<double> runner_up) const;

    /**
     * @brief Degraded results never claim more than MEDIUM
     */
    static ConfidenceTier capForDegraded(ConfidenceTier tier) {
        return tier == ConfidenceTier::HIGH ? ConfidenceTier::MEDIUM : tier;
    }

private:
    MatchingParams params_;
};

} // namespace card_identifier::matching
