#pragma once

#include "card_identifier/types.hpp"
#include <optional>
#include <string>

namespace card_identifier {

    /**
     * @brief Source of per-card details that are not part of the imported catalog
     */
    class ICatalogClient {
    public:
        virtual ~ICatalogClient() = default;

        /**
         * @brief Fetch variant flags and set total for one card
         * @return std::nullopt when the card is unknown or the source is unreachable
         */
        virtual std::optional<CardDetails> fetchCardDetails(const std::string& card_id) = 0;

        virtual std::string name() const = 0;
    };

} // namespace card_identifier
