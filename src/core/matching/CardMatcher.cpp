#include "CardMatcher.hpp"
#include "src/core/embedding/QueryAugmentation.hpp"
#include "card_identifier/logging.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <map>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace card_identifier::matching {

CardMatcher::CardMatcher(const config::IdentifierConfig& config,
                         index::ReferenceIndices indices,
                         std::shared_ptr<IEmbeddingModel> model)
    : config_(config),
      indices_(std::move(indices)),
      model_(std::move(model)),
      preprocessor_(config.preprocessing),
      hasher_(config.hashing),
      exclusion_(config.matching.excluded_set_prefixes),
      policy_(config.matching) {
    if (model_ && model_->dimension() != config_.embedding.dimension) {
        LOG_WARNING("Embedding model '" + model_->name() + "' produces " + std::to_string(model_->dimension()) +
                    " values but the index expects " + std::to_string(config_.embedding.dimension) +
                    "; embedding stage disabled");
        model_.reset();
    }
}

bool CardMatcher::embeddingAvailable() const {
    return model_ && indices_.embeddings && !indices_.embeddings->empty();
}

// ---------------------------------------------------------------
// Hash stage
// ---------------------------------------------------------------

QueryState CardMatcher::prepare(const cv::Mat& image, const std::optional<cv::Rect>& manual_sticker) const {
    QueryState state;
    if (image.empty()) {
        state.result.error = "Empty image";
        state.finished = true;
        return state;
    }

    try {
        const auto preprocessed = preprocessor_.process(image, manual_sticker);
        state.card = preprocessed.image;
        state.result.boundary_detected = preprocessed.boundary_detected;
        state.result.sticker_detected = preprocessed.sticker_detected;
        state.result.stages.push_back(MatchStage::PREPROCESSED);

        const auto full_card = hasher_.computeAll(state.card);
        // A sticker the detector missed still spoils the full-card hash, so the
        // art zone is scored whenever stickers are expected at all
        const bool sticker_expected = config_.preprocessing.sticker_detection || manual_sticker.has_value();
        std::optional<hashing::FingerprintSet> art_zone;
        if (sticker_expected && indices_.art_zone_hashes && !indices_.art_zone_hashes->empty()) {
            art_zone = hasher_.computeArtZone(state.card);
        }
        state.result.stages.push_back(MatchStage::HASHED);

        rankByHash(state, full_card, art_zone);
    } catch (const std::exception& e) {
        LOG_WARNING(std::string("Query failed before ranking: ") + e.what());
        state.result.error = e.what();
        state.finished = true;
        return state;
    }

    state.embedding_only = config_.matching.mode == MatchMode::EMBEDDING_ONLY && embeddingAvailable();
    return state;
}

void CardMatcher::rankByHash(QueryState& state,
                             const hashing::FingerprintSet& full_card,
                             const std::optional<hashing::FingerprintSet>& art_zone) const {
    const auto& weights = config_.hashing.weights;

    // Ordered by card id so the stable sort below keeps id order for equal scores
    std::map<std::string, double> scores;
    if (indices_.full_card_hashes) {
        for (const auto& scored : indices_.full_card_hashes->combinedRanking(full_card, weights)) {
            scores.emplace(scored.card_id, scored.score);
        }
    }
    if (art_zone && indices_.art_zone_hashes) {
        for (const auto& scored : indices_.art_zone_hashes->combinedRanking(*art_zone, weights)) {
            auto [it, inserted] = scores.emplace(scored.card_id, scored.score);
            if (!inserted) {
                it->second = std::min(it->second, scored.score);
            }
        }
    }

    state.ranking.clear();
    state.ranking.reserve(scores.size());
    int unknown = 0;
    for (const auto& [card_id, score] : scores) {
        CardPtr card = indices_.catalog ? indices_.catalog->find(card_id) : nullptr;
        if (!card) {
            ++unknown;
            continue;
        }
        if (exclusion_.isExcluded(*card)) {
            continue;
        }
        state.ranking.push_back({std::move(card), score});
    }
    if (unknown > 0) {
        LOG_DEBUG("Dropped " + std::to_string(unknown) + " hashed cards without a catalog record");
    }

    std::stable_sort(state.ranking.begin(), state.ranking.end(), [](const RankedCard& a, const RankedCard& b) {
        return a.hash_distance < b.hash_distance;
    });
    state.result.stages.push_back(MatchStage::RANKED_BY_HASH);

    state.accepted_by_hash = false;
    if (!state.ranking.empty()) {
        const std::optional<double> runner_up = state.ranking.size() > 1
            ? std::optional<double>(state.ranking[1].hash_distance)
            : std::nullopt;
        state.accepted_by_hash = policy_.acceptHashMatch(state.ranking.front().hash_distance, runner_up);
    }
}

// ---------------------------------------------------------------
// Embedding stage
// ---------------------------------------------------------------

bool CardMatcher::wantsEmbedding(const QueryState& state) const {
    if (state.finished) return false;
    if (state.embedding_only) return true;
    if (config_.matching.mode == MatchMode::HASH_ONLY) return false;
    return !state.accepted_by_hash && !state.ranking.empty();
}

bool CardMatcher::needsEmbedding(const QueryState& state) const {
    return wantsEmbedding(state) && embeddingAvailable() && !state.card.empty();
}

std::vector<cv::Mat> CardMatcher::queryCrops(const cv::Mat& card) const {
    return embedding::QueryAugmentation::makeCrops(card, config_.embedding.tta_crops,
                                                   config_.embedding.tta_jitter, config_.embedding.seed);
}

std::vector<float> CardMatcher::embedQuery(const cv::Mat& card) const {
    if (!model_) {
        throw std::runtime_error("No embedding model configured");
    }
    const auto crops = queryCrops(card);
    const auto vectors = model_->computeEmbeddings(crops);
    if (vectors.size() != crops.size()) {
        throw std::runtime_error("Embedding model returned " + std::to_string(vectors.size()) +
                                 " vectors for " + std::to_string(crops.size()) + " crops");
    }
    return embedding::QueryAugmentation::averageEmbeddings(vectors);
}

MatchResult CardMatcher::finalizeWithEmbedding(QueryState state, const std::vector<float>& embedding) const {
    if (state.finished) {
        return finalizeHashOnly(std::move(state));
    }
    if (!indices_.embeddings || indices_.embeddings->empty()) {
        return finalizeDegraded(std::move(state));
    }
    state.result.stages.push_back(MatchStage::EMBEDDED);

    const auto top_k = static_cast<size_t>(config_.matching.top_k);
    std::vector<index::EmbeddingHit> hits;
    try {
        if (state.embedding_only) {
            hits = indices_.embeddings->lookup(embedding);
        } else {
            std::vector<std::string> shortlist;
            const size_t n = std::min(state.ranking.size(), static_cast<size_t>(config_.matching.shortlist_size));
            shortlist.reserve(n);
            for (size_t i = 0; i < n; ++i) {
                shortlist.push_back(state.ranking[i].card->id);
            }
            hits = indices_.embeddings->lookupSubset(embedding, shortlist);
        }
    } catch (const std::invalid_argument& e) {
        LOG_WARNING(std::string("Query embedding rejected: ") + e.what());
        return finalizeDegraded(std::move(state));
    }

    std::unordered_map<std::string, const RankedCard*> by_id;
    for (const auto& ranked : state.ranking) {
        by_id.emplace(ranked.card->id, &ranked);
    }

    MatchResult result = std::move(state.result);
    result.embedding_used = true;

    if (state.embedding_only) {
        for (const auto& hit : hits) {
            if (result.candidates.size() >= top_k) break;
            CardPtr card = indices_.catalog ? indices_.catalog->find(hit.card_id) : nullptr;
            if (!card || exclusion_.isExcluded(*card)) continue;

            MatchCandidate candidate;
            candidate.card = std::move(card);
            const auto it = by_id.find(hit.card_id);
            if (it != by_id.end()) candidate.hash_distance = it->second->hash_distance;
            candidate.embedding_distance = hit.distance;
            candidate.tier = policy_.embeddingTier(hit.distance);
            result.candidates.push_back(std::move(candidate));
        }
    } else {
        if (hits.empty()) {
            LOG_DEBUG("No shortlisted card has an embedding; keeping hash order");
            state.result = std::move(result);
            state.result.embedding_used = false;
            return finalizeDegraded(std::move(state));
        }

        std::unordered_set<std::string> embedded;
        for (const auto& hit : hits) {
            embedded.insert(hit.card_id);
            if (result.candidates.size() >= top_k) continue;
            const RankedCard* ranked = by_id.at(hit.card_id);

            MatchCandidate candidate;
            candidate.card = ranked->card;
            candidate.hash_distance = ranked->hash_distance;
            candidate.embedding_distance = hit.distance;
            candidate.tier = policy_.embeddingTier(hit.distance);
            result.candidates.push_back(std::move(candidate));
        }

        // Shortlisted cards without a stored vector follow in hash order
        const size_t n = std::min(state.ranking.size(), static_cast<size_t>(config_.matching.shortlist_size));
        for (size_t i = 0; i < n && result.candidates.size() < top_k; ++i) {
            const auto& ranked = state.ranking[i];
            if (embedded.count(ranked.card->id) > 0) continue;

            MatchCandidate candidate;
            candidate.card = ranked.card;
            candidate.hash_distance = ranked.hash_distance;
            candidate.tier = policy_.hashTier(ranked.hash_distance);
            result.candidates.push_back(std::move(candidate));
        }
    }

    result.stages.push_back(MatchStage::RANKED_BY_EMBEDDING);
    result.stages.push_back(MatchStage::FINAL);
    return result;
}

// ---------------------------------------------------------------
// Hash-only finalization
// ---------------------------------------------------------------

MatchResult CardMatcher::finalizeFromHashes(QueryState state, bool degraded) const {
    MatchResult result = std::move(state.result);
    result.degraded = degraded;

    const size_t n = std::min(state.ranking.size(), static_cast<size_t>(config_.matching.top_k));
    result.candidates.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const auto& ranked = state.ranking[i];
        MatchCandidate candidate;
        candidate.card = ranked.card;
        candidate.hash_distance = ranked.hash_distance;
        candidate.tier = policy_.hashTier(ranked.hash_distance);
        if (degraded) {
            candidate.tier = ConfidencePolicy::capForDegraded(candidate.tier);
        }
        result.candidates.push_back(std::move(candidate));
    }

    result.stages.push_back(MatchStage::FINAL);
    return result;
}

MatchResult CardMatcher::finalizeHashOnly(QueryState state) const {
    return finalizeFromHashes(std::move(state), false);
}

MatchResult CardMatcher::finalizeDegraded(QueryState state) const {
    return finalizeFromHashes(std::move(state), true);
}

MatchResult CardMatcher::finalizeWithoutEmbedding(QueryState state) const {
    const bool wanted = wantsEmbedding(state);
    return finalizeFromHashes(std::move(state), wanted);
}

// ---------------------------------------------------------------
// Entry points
// ---------------------------------------------------------------

MatchResult CardMatcher::identifyState(QueryState state) const {
    if (!needsEmbedding(state)) {
        return finalizeWithoutEmbedding(std::move(state));
    }

    std::vector<float> embedding;
    try {
        embedding = embedQuery(state.card);
    } catch (const std::exception& e) {
        LOG_WARNING(std::string("Embedding stage failed, returning hash ranking: ") + e.what());
        return finalizeDegraded(std::move(state));
    }
    return finalizeWithEmbedding(std::move(state), embedding);
}

MatchResult CardMatcher::identify(const cv::Mat& image, const std::optional<cv::Rect>& manual_sticker) const {
    return identifyState(prepare(image, manual_sticker));
}

MatchResult CardMatcher::identifyFile(const std::string& path) const {
    cv::Mat image;
    try {
        image = cv::imread(path, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        LOG_WARNING("Decoder failed on " + path + ": " + e.what());
    }
    if (image.empty()) {
        LOG_WARNING("Cannot read image: " + path);
        MatchResult result;
        result.error = "Cannot read image: " + path;
        return result;
    }
    return identify(image);
}

MatchResult CardMatcher::identifyFingerprints(const hashing::FingerprintSet& full_card,
                                              const std::optional<hashing::FingerprintSet>& art_zone,
                                              const cv::Mat& embedding_image) const {
    QueryState state;
    state.card = embedding_image;
    state.result.sticker_detected = art_zone.has_value();
    state.result.stages.push_back(MatchStage::HASHED);

    try {
        rankByHash(state, full_card, art_zone);
    } catch (const std::invalid_argument& e) {
        LOG_WARNING(std::string("Query fingerprints rejected: ") + e.what());
        state.result.error = e.what();
        state.finished = true;
        return finalizeHashOnly(std::move(state));
    }

    state.embedding_only = config_.matching.mode == MatchMode::EMBEDDING_ONLY &&
                           embeddingAvailable() && !embedding_image.empty();
    return identifyState(std::move(state));
}

} // namespace card_identifier::matching
