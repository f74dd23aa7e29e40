#include "IndexBuilder.hpp"
#include "card_identifier/logging.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace card_identifier::indexing {

namespace {

cv::Mat readReference(const std::string& path) {
    try {
        return cv::imread(path, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        LOG_WARNING("Decoder failed on " + path + ": " + e.what());
        return {};
    }
}

} // namespace

IndexBuilder::IndexBuilder(const database::DatabaseManager& db,
                           const config::IdentifierConfig& config,
                           std::shared_ptr<IEmbeddingModel> model)
    : db_(db),
      config_(config),
      model_(std::move(model)),
      preprocessor_(config.preprocessing),
      hasher_(config.hashing) {}

std::vector<Card> IndexBuilder::pendingCards(bool rebuild, const std::vector<std::string>& missing_ids) const {
    auto cards = db_.getAllCards();
    if (rebuild) {
        return cards;
    }
    const std::unordered_set<std::string> missing(missing_ids.begin(), missing_ids.end());
    cards.erase(std::remove_if(cards.begin(), cards.end(),
                               [&missing](const Card& card) { return missing.count(card.id) == 0; }),
                cards.end());
    return cards;
}

HashBuildStats IndexBuilder::buildHashes(bool rebuild) const {
    HashBuildStats stats;
    if (!db_.isEnabled()) {
        LOG_ERROR("Card store is not available");
        return stats;
    }

    const auto cards = pendingCards(rebuild, rebuild ? std::vector<std::string>{} : db_.getCardIdsWithoutHashes());
    stats.cards_considered = static_cast<int>(cards.size());
    LOG_INFO("Computing fingerprints for " + std::to_string(cards.size()) + " cards");

    if (!db_.optimizeForBulkOperations()) {
        LOG_WARNING("Bulk PRAGMA settings could not be applied");
    }

    const std::size_t flush_size = static_cast<std::size_t>(std::max(1, config_.performance.hash_flush_size));
    for (std::size_t start = 0; start < cards.size(); start += flush_size) {
        const std::size_t end = std::min(cards.size(), start + flush_size);
        const std::size_t count = end - start;

        std::vector<std::vector<HashSignature>> per_card(count);
        std::vector<int> status(count, 0);   // 0 ok, 1 no image, 2 unreadable

#ifdef _OPENMP
        #pragma omp parallel for schedule(dynamic)
#endif
        for (std::size_t k = 0; k < count; ++k) {
            const Card& card = cards[start + k];
            if (card.local_image_path.empty()) {
                status[k] = 1;
                continue;
            }
            const cv::Mat image = readReference(card.local_image_path);
            if (image.empty()) {
                status[k] = 2;
                continue;
            }
            try {
                per_card[k] = hasher_.signaturesFor(card.id, preprocessor_.normalizeReference(image));
            } catch (const std::exception& e) {
                status[k] = 2;
                LOG_WARNING("Failed to fingerprint " + card.id + ": " + e.what());
            }
        }

        std::vector<HashSignature> batch;
        for (std::size_t k = 0; k < count; ++k) {
            if (status[k] == 1) {
                ++stats.missing_image;
            } else if (status[k] == 2) {
                ++stats.unreadable;
                LOG_DEBUG("Unreadable reference image for " + cards[start + k].id + ": " +
                          cards[start + k].local_image_path);
            } else {
                ++stats.cards_hashed;
                batch.insert(batch.end(), per_card[k].begin(), per_card[k].end());
            }
        }

        if (!batch.empty()) {
            if (db_.upsertHashes(batch)) {
                stats.rows_written += static_cast<int>(batch.size());
            } else {
                ++stats.failed_flushes;
                LOG_ERROR("Failed to store " + std::to_string(batch.size()) + " fingerprint rows");
            }
        }
        LOG_INFO("Fingerprinted " + std::to_string(end) + "/" + std::to_string(cards.size()) + " cards");
    }

    LOG_INFO("Hashing complete: " + std::to_string(stats.cards_hashed) + " cards, " +
             std::to_string(stats.missing_image) + " without image, " +
             std::to_string(stats.unreadable) + " unreadable");
    return stats;
}

EmbeddingBuildStats IndexBuilder::buildEmbeddings(bool rebuild) const {
    if (!model_) {
        throw std::runtime_error("No embedding model configured");
    }

    EmbeddingBuildStats stats;
    if (!db_.isEnabled()) {
        LOG_ERROR("Card store is not available");
        return stats;
    }

    const auto cards = pendingCards(rebuild, rebuild ? std::vector<std::string>{} : db_.getCardIdsWithoutEmbeddings());
    stats.cards_considered = static_cast<int>(cards.size());
    LOG_INFO("Computing " + model_->name() + " embeddings for " + std::to_string(cards.size()) + " cards");

    if (!db_.optimizeForBulkOperations()) {
        LOG_WARNING("Bulk PRAGMA settings could not be applied");
    }

    const std::size_t batch_size = static_cast<std::size_t>(std::max(1, config_.performance.embedding_batch_size));
    const std::size_t flush_size = static_cast<std::size_t>(std::max(1, config_.performance.embedding_flush_size));

    std::vector<EmbeddingVector> pending;
    auto flush = [&]() {
        if (pending.empty()) {
            return;
        }
        if (!db_.upsertEmbeddings(pending)) {
            ++stats.failed_flushes;
            LOG_ERROR("Failed to store " + std::to_string(pending.size()) + " embeddings");
        }
        pending.clear();
    };

    for (std::size_t start = 0; start < cards.size(); start += batch_size) {
        const std::size_t end = std::min(cards.size(), start + batch_size);
        const std::size_t count = end - start;

        std::vector<cv::Mat> normalized(count);
#ifdef _OPENMP
        #pragma omp parallel for schedule(dynamic)
#endif
        for (std::size_t k = 0; k < count; ++k) {
            const Card& card = cards[start + k];
            if (card.local_image_path.empty()) {
                continue;
            }
            const cv::Mat image = readReference(card.local_image_path);
            if (image.empty()) {
                continue;
            }
            try {
                normalized[k] = preprocessor_.normalizeReference(image);
            } catch (const std::exception& e) {
                LOG_WARNING("Failed to normalize " + card.id + ": " + e.what());
            }
        }

        std::vector<cv::Mat> inputs;
        std::vector<const Card*> owners;
        for (std::size_t k = 0; k < count; ++k) {
            const Card& card = cards[start + k];
            if (card.local_image_path.empty()) {
                ++stats.missing_image;
            } else if (normalized[k].empty()) {
                ++stats.unreadable;
            } else {
                inputs.push_back(normalized[k]);
                owners.push_back(&card);
            }
        }
        if (inputs.empty()) {
            continue;
        }

        try {
            auto vectors = model_->computeEmbeddings(inputs);
            if (vectors.size() != inputs.size()) {
                throw std::runtime_error("model returned " + std::to_string(vectors.size()) +
                                         " embeddings for " + std::to_string(inputs.size()) + " images");
            }
            for (std::size_t k = 0; k < vectors.size(); ++k) {
                pending.push_back({owners[k]->id, std::move(vectors[k])});
            }
            stats.cards_embedded += static_cast<int>(vectors.size());
        } catch (const std::exception& e) {
            ++stats.failed_batches;
            LOG_ERROR("Embedding batch starting at " + owners.front()->id + " failed: " + e.what());
        }

        if (pending.size() >= flush_size) {
            flush();
            LOG_INFO("Embedded " + std::to_string(end) + "/" + std::to_string(cards.size()) + " cards");
        }
    }
    flush();

    LOG_INFO("Embedding complete: " + std::to_string(stats.cards_embedded) + " cards, " +
             std::to_string(stats.failed_batches) + " failed batches");
    return stats;
}

} // namespace card_identifier::indexing
