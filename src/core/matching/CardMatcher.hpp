#pragma once

#include "ConfidencePolicy.hpp"
#include "ExclusionFilter.hpp"
#include "src/core/config/IdentifierConfig.hpp"
#include "src/core/hashing/PerceptualHasher.hpp"
#include "src/core/index/ReferenceIndices.hpp"
#include "src/core/preprocessing/CardPreprocessor.hpp"
#include "interfaces/IEmbeddingModel.hpp"
#include <opencv2/core.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace card_identifier::matching {

/**
 * @brief A catalog card with its hash score, after exclusion
 */
struct RankedCard {
    CardPtr card;
    double hash_distance = 0.0;
};

/**
 * @brief Intermediate state of one query between the hash and embedding stages
 *
 * Produced by CardMatcher::prepare and consumed by one of the finalize calls.
 * Batch processing keeps many of these alive while embeddings are computed
 * for several queries at once.
 */
struct QueryState {
    MatchResult result;                 // flags and stages traversed so far
    cv::Mat card;                       // preprocessed card, input of the embedding stage
    std::vector<RankedCard> ranking;    // ascending hash distance, ties by id
    bool accepted_by_hash = false;
    bool embedding_only = false;        // rank the whole catalog by embedding
    bool finished = false;              // result is final (unreadable input)
};

/**
 * @brief Cascade identifier: perceptual hashes first, embeddings only when ambiguous
 *
 * Per query: preprocess, fingerprint, weighted hash ranking (min of full card
 * and art zone when sticker detection is on or a sticker rectangle was given),
 * set-prefix exclusion, then accept
 * the best card outright when it is within the high threshold and clears the
 * margin. Otherwise the top shortlist_size cards are re-ranked by embedding
 * distance. Without a usable model the hash ranking is returned with
 * degraded = true and tiers capped at MEDIUM.
 *
 * Thread safety: identify/prepare/finalize are const and may run
 * concurrently; the model serializes its own inference.
 */
class CardMatcher {
public:
    /**
     * @param model May be null; the matcher then never leaves the hash path
     * @throws std::invalid_argument for an empty excluded prefix or invalid hash size
     */
    CardMatcher(const config::IdentifierConfig& config,
                index::ReferenceIndices indices,
                std::shared_ptr<IEmbeddingModel> model = nullptr);

    /**
     * @brief Identify one scan. Never throws for bad input; see MatchResult::error.
     */
    MatchResult identify(const cv::Mat& image, const std::optional<cv::Rect>& manual_sticker = std::nullopt) const;

    /**
     * @brief Read and identify an image file
     */
    MatchResult identifyFile(const std::string& path) const;

    /**
     * @brief Run from the hashing stage with precomputed query fingerprints
     * @param art_zone Art-zone fingerprints; when set, the query is treated as stickered
     * @param embedding_image Card image for the embedding stage; empty = no embedding available
     */
    MatchResult identifyFingerprints(const hashing::FingerprintSet& full_card,
                                     const std::optional<hashing::FingerprintSet>& art_zone = std::nullopt,
                                     const cv::Mat& embedding_image = cv::Mat()) const;

    // ---------------------------------------------------------------
    // Stage decomposition (used by BatchIdentifier)
    // ---------------------------------------------------------------

    /**
     * @brief Preprocess, hash, rank, exclude and run the hash acceptance test
     */
    QueryState prepare(const cv::Mat& image, const std::optional<cv::Rect>& manual_sticker = std::nullopt) const;

    /**
     * @brief True when the query should be embedded and an embedding path exists
     */
    bool needsEmbedding(const QueryState& state) const;

    /**
     * @brief Re-rank with a query embedding; falls back to degraded on a bad vector
     */
    MatchResult finalizeWithEmbedding(QueryState state, const std::vector<float>& embedding) const;

    /**
     * @brief Final result from the hash ranking alone (accepted or hash-only mode)
     */
    MatchResult finalizeHashOnly(QueryState state) const;

    /**
     * @brief Hash ranking flagged as degraded, tiers capped at MEDIUM
     */
    MatchResult finalizeDegraded(QueryState state) const;

    /**
     * @brief finalizeDegraded when the embedding stage was wanted, otherwise finalizeHashOnly
     */
    MatchResult finalizeWithoutEmbedding(QueryState state) const;

    /**
     * @brief Test-time augmentation crops of a preprocessed card
     */
    std::vector<cv::Mat> queryCrops(const cv::Mat& card) const;

    /**
     * @brief Averaged, renormalized embedding of the query crops
     * @throws std::runtime_error if no model is configured or inference fails
     */
    std::vector<float> embedQuery(const cv::Mat& card) const;

    bool embeddingAvailable() const;

    const index::ReferenceIndices& indices() const { return indices_; }
    const config::IdentifierConfig& config() const { return config_; }
    const std::shared_ptr<IEmbeddingModel>& model() const { return model_; }

private:
    void rankByHash(QueryState& state,
                    const hashing::FingerprintSet& full_card,
                    const std::optional<hashing::FingerprintSet>& art_zone) const;
    bool wantsEmbedding(const QueryState& state) const;
    MatchResult finalizeFromHashes(QueryState state, bool degraded) const;
    MatchResult identifyState(QueryState state) const;

    config::IdentifierConfig config_;
    index::ReferenceIndices indices_;
    std::shared_ptr<IEmbeddingModel> model_;
    preprocessing::CardPreprocessor preprocessor_;
    hashing::PerceptualHasher hasher_;
    ExclusionFilter exclusion_;
    ConfidencePolicy policy_;
};

} // namespace card_identifier::matching
