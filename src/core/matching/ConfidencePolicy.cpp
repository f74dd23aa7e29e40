#include "ConfidencePolicy.hpp"

namespace card_identifier::matching {

ConfidenceTier ConfidencePolicy::hashTier(double distance) const {
    if (distance <= params_.hash_high_threshold) return ConfidenceTier::HIGH;
    if (distance <= params_.hash_medium_threshold) return ConfidenceTier::MEDIUM;
    return ConfidenceTier::LOW;
}

ConfidenceTier ConfidencePolicy::embeddingTier(double distance) const {
    if (distance <= params_.embedding_high_threshold) return ConfidenceTier::HIGH;
    if (distance <= params_.embedding_medium_threshold) return ConfidenceTier::MEDIUM;
    return ConfidenceTier::LOW;
}

bool ConfidencePolicy::acceptHashMatch(double best, std::optional<double> runner_up) const {
    if (best > params_.hash_high_threshold) {
        return false;
    }
    if (!runner_up) {
        return true;
    }
    return (*runner_up - best) >= params_.min_margin;
}

} // namespace card_identifier::matching
