#include "IndexLoader.hpp"
#include "src/core/matching/ExclusionFilter.hpp"
#include "card_identifier/logging.hpp"

namespace card_identifier::index {

namespace {

template <typename Row>
std::vector<Row> keepCatalogRows(const std::vector<Row>& rows, const CardCatalog& catalog) {
    std::vector<Row> kept;
    kept.reserve(rows.size());
    for (const auto& row : rows) {
        if (catalog.contains(row.card_id)) {
            kept.push_back(row);
        }
    }
    return kept;
}

} // namespace

ReferenceIndices IndexLoader::build(const std::vector<Card>& cards,
                                    const std::vector<HashSignature>& full_card_signatures,
                                    const std::vector<HashSignature>& art_zone_signatures,
                                    const std::vector<EmbeddingVector>& embeddings,
                                    const config::IdentifierConfig& config) {
    const matching::ExclusionFilter exclusion(config.matching.excluded_set_prefixes);
    const auto kept_cards = exclusion.apply(cards);
    if (kept_cards.size() != cards.size()) {
        LOG_INFO("Excluded " + std::to_string(cards.size() - kept_cards.size()) + " cards by set prefix");
    }

    ReferenceIndices indices;
    auto catalog = std::make_shared<const CardCatalog>(kept_cards);
    const int hash_size = config.hashing.hash_size;

    indices.full_card_hashes = std::make_shared<const HashIndex>(
        HashIndex::fromSignatures(hash_size, keepCatalogRows(full_card_signatures, *catalog)));
    indices.art_zone_hashes = std::make_shared<const HashIndex>(
        HashIndex::fromSignatures(hash_size, keepCatalogRows(art_zone_signatures, *catalog)));
    indices.embeddings = std::make_shared<const EmbeddingIndex>(
        EmbeddingIndex::fromVectors(config.embedding.dimension, config.embedding.metric,
                                    keepCatalogRows(embeddings, *catalog)));
    indices.catalog = std::move(catalog);

    LOG_INFO("Loaded " + std::to_string(indices.catalog->size()) + " cards, " +
             std::to_string(indices.full_card_hashes->size()) + " hashed, " +
             std::to_string(indices.art_zone_hashes->size()) + " with art-zone hashes, " +
             std::to_string(indices.embeddings->size()) + " with embeddings");
    return indices;
}

ReferenceIndices IndexLoader::load(const database::DatabaseManager& db, const config::IdentifierConfig& config) {
    if (!db.isEnabled()) {
        LOG_WARNING("Card store is not available; identification runs against an empty catalog");
    }
    return build(db.getAllCards(),
                 db.getAllHashSignatures(HashRegion::FULL_CARD),
                 db.getAllHashSignatures(HashRegion::ART_ZONE),
                 db.getAllEmbeddings(),
                 config);
}

} // namespace card_identifier::index
