#pragma once

#include "card_identifier/database/DatabaseManager.hpp"
#include "src/core/config/IdentifierConfig.hpp"
#include "src/core/hashing/PerceptualHasher.hpp"
#include "src/core/preprocessing/CardPreprocessor.hpp"
#include "interfaces/IEmbeddingModel.hpp"
#include <memory>

namespace card_identifier::indexing {

struct HashBuildStats {
    int cards_considered = 0;
    int cards_hashed = 0;
    int missing_image = 0;      // no local reference image recorded
    int unreadable = 0;         // recorded path could not be decoded
    int rows_written = 0;
    int failed_flushes = 0;
};

struct EmbeddingBuildStats {
    int cards_considered = 0;
    int cards_embedded = 0;
    int missing_image = 0;
    int unreadable = 0;
    int failed_batches = 0;
    int failed_flushes = 0;
};

/**
 * @brief Precomputes reference fingerprints and embeddings into the card store
 *
 * Reference images go through CardPreprocessor::normalizeReference so that
 * they land in the same normalized frame as queries.
 */
class IndexBuilder {
public:
    IndexBuilder(const database::DatabaseManager& db,
                 const config::IdentifierConfig& config,
                 std::shared_ptr<IEmbeddingModel> model = nullptr);

    /**
     * @brief Fingerprint every card lacking hashes (every card when rebuild is set)
     */
    HashBuildStats buildHashes(bool rebuild = false) const;

    /**
     * @brief Embed every card lacking an embedding (every card when rebuild is set)
     * @throws std::runtime_error if no model was given
     */
    EmbeddingBuildStats buildEmbeddings(bool rebuild = false) const;

private:
    std::vector<Card> pendingCards(bool rebuild, const std::vector<std::string>& missing_ids) const;

    const database::DatabaseManager& db_;
    config::IdentifierConfig config_;
    std::shared_ptr<IEmbeddingModel> model_;
    preprocessing::CardPreprocessor preprocessor_;
    hashing::PerceptualHasher hasher_;
};

} // namespace card_identifier::indexing
