#pragma once

#include "card_identifier/types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace card_identifier::index {

/**
 * @brief Read-only id -> card lookup shared by the matcher and its results
 */
class CardCatalog {
public:
    CardCatalog() = default;
    explicit CardCatalog(const std::vector<Card>& cards);

    /**
     * @return nullptr when the id is unknown
     */
    CardPtr find(const std::string& card_id) const;

    bool contains(const std::string& card_id) const { return cards_.count(card_id) > 0; }
    size_t size() const { return cards_.size(); }
    bool empty() const { return cards_.empty(); }

    /**
     * @brief All cards ordered by id
     */
    std::vector<CardPtr> cards() const;

private:
    std::unordered_map<std::string, CardPtr> cards_;
};

} // namespace card_identifier::index
