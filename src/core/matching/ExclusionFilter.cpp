#include "ExclusionFilter.hpp"
#include <stdexcept>
#include <utility>

namespace card_identifier::matching {

ExclusionFilter::ExclusionFilter(std::vector<std::string> prefixes) : prefixes_(std::move(prefixes)) {
    for (const auto& prefix : prefixes_) {
        if (prefix.empty()) {
            throw std::invalid_argument("Excluded set prefix must not be empty");
        }
    }
}

bool ExclusionFilter::isExcludedSetId(const std::string& set_id) const {
    for (const auto& prefix : prefixes_) {
        if (set_id.compare(0, prefix.size(), prefix) == 0) {
            return true;
        }
    }
    return false;
}

bool ExclusionFilter::isExcluded(const Card& card) const {
    return isExcludedSetId(card.set_id.empty() ? card.id : card.set_id);
}

std::vector<Card> ExclusionFilter::apply(const std::vector<Card>& cards) const {
    if (prefixes_.empty()) {
        return cards;
    }
    std::vector<Card> kept;
    kept.reserve(cards.size());
    for (const auto& card : cards) {
        if (!isExcluded(card)) {
            kept.push_back(card);
        }
    }
    return kept;
}

} // namespace card_identifier::matching
