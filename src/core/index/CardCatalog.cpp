#include "CardCatalog.hpp"
#include <algorithm>
#include <memory>

namespace card_identifier::index {

CardCatalog::CardCatalog(const std::vector<Card>& cards) {
    cards_.reserve(cards.size());
    for (const auto& card : cards) {
        cards_[card.id] = std::make_shared<const Card>(card);
    }
}

CardPtr CardCatalog::find(const std::string& card_id) const {
    const auto it = cards_.find(card_id);
    return it == cards_.end() ? nullptr : it->second;
}

std::vector<CardPtr> CardCatalog::cards() const {
    std::vector<CardPtr> out;
    out.reserve(cards_.size());
    for (const auto& entry : cards_) {
        out.push_back(entry.second);
    }
    std::sort(out.begin(), out.end(), [](const CardPtr& a, const CardPtr& b) { return a->id < b->id; });
    return out;
}

} // namespace card_identifier::index
