#pragma once

#include "ReferenceIndices.hpp"
#include "card_identifier/database/DatabaseManager.hpp"
#include "src/core/config/IdentifierConfig.hpp"

namespace card_identifier::index {

/**
 * @brief Builds the in-memory indices from the card store
 *
 * Cards under an excluded set prefix never enter the catalog, and hash or
 * embedding rows for cards outside the catalog are dropped, so excluded
 * cards cannot reach any index.
 */
class IndexLoader {
public:
    /**
     * @throws std::invalid_argument if an excluded prefix is empty
     */
    static ReferenceIndices load(const database::DatabaseManager& db, const config::IdentifierConfig& config);

    /**
     * @brief Same as load, from rows already in memory
     */
    static ReferenceIndices build(const std::vector<Card>& cards,
                                  const std::vector<HashSignature>& full_card_signatures,
                                  const std::vector<HashSignature>& art_zone_signatures,
                                  const std::vector<EmbeddingVector>& embeddings,
                                  const config::IdentifierConfig& config);
};

} // namespace card_identifier::index
