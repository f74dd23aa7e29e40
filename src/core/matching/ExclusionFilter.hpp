#pragma once

#include "card_identifier/types.hpp"
#include <string>
#include <vector>

namespace card_identifier::matching {

/**
 * @brief Drops cards whose set identifier starts with a configured prefix
 *
 * Matching is case-sensitive. A card without a set id is judged by its card
 * id, whose prefix follows the set naming in the catalog ("A1-001" -> set "A1").
 */
class ExclusionFilter {
public:
    ExclusionFilter() = default;

    /**
     * @throws std::invalid_argument if any prefix is empty (it would exclude every card)
     */
    explicit ExclusionFilter(std::vector<std::string> prefixes);

    bool isExcluded(const Card& card) const;
    bool isExcludedSetId(const std::string& set_id) const;

    /**
     * @brief Cards that survive the filter, in input order
     */
    std::vector<Card> apply(const std::vector<Card>& cards) const;

    const std::vector<std::string>& prefixes() const { return prefixes_; }
    bool empty() const { return prefixes_.empty(); }

private:
    std::vector<std::string> prefixes_;
};

} // namespace card_identifier::matching
