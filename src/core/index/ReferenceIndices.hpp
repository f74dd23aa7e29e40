#pragma once

#include "CardCatalog.hpp"
#include "EmbeddingIndex.hpp"
#include "HashIndex.hpp"
#include <memory>

namespace card_identifier::index {

/**
 * @brief Everything the matcher reads, loaded once and shared read-only
 *
 * Null members are treated as empty.
 */
struct ReferenceIndices {
    std::shared_ptr<const CardCatalog> catalog;
    std::shared_ptr<const HashIndex> full_card_hashes;
    std::shared_ptr<const HashIndex> art_zone_hashes;
    std::shared_ptr<const EmbeddingIndex> embeddings;
};

} // namespace card_identifier::index
