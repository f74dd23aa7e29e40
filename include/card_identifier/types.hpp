#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace card_identifier {

    // ================================
    // PIPELINE ENUMS
    // ================================

    /**
     * @brief Perceptual hash families computed for every card
     */
    enum class HashAlgorithm {
        PHASH,                 ///< DCT perceptual hash (primary signal)
        AHASH,                 ///< Average hash
        DHASH,                 ///< Horizontal difference hash
        WHASH                  ///< Haar wavelet hash
    };

    /**
     * @brief Card region a fingerprint was computed from
     */
    enum class HashRegion {
        FULL_CARD,             ///< Whole normalized card face
        ART_ZONE               ///< Artwork band, used when a sticker covers part of the card
    };

    /**
     * @brief Discrete trust level attached to a candidate
     */
    enum class ConfidenceTier {
        HIGH,
        MEDIUM,
        LOW
    };

    /**
     * @brief How the matcher combines hash and embedding signals
     */
    enum class MatchMode {
        CASCADE,               ///< Hash ranking, embedding re-rank of the shortlist when ambiguous
        HASH_ONLY,             ///< Hash ranking only
        EMBEDDING_ONLY         ///< Full-catalog embedding ranking (falls back to cascade)
    };

    /**
     * @brief Vector distance used by the embedding index
     */
    enum class EmbeddingMetric {
        COSINE,
        EUCLIDEAN
    };

    /**
     * @brief Per-query pipeline states, recorded in traversal order
     */
    enum class MatchStage {
        PREPROCESSED,
        HASHED,
        RANKED_BY_HASH,
        EMBEDDED,
        RANKED_BY_EMBEDDING,
        FINAL
    };

    constexpr std::size_t kHashAlgorithmCount = 4;

    constexpr std::array<HashAlgorithm, kHashAlgorithmCount> kAllHashAlgorithms = {
        HashAlgorithm::PHASH,
        HashAlgorithm::AHASH,
        HashAlgorithm::DHASH,
        HashAlgorithm::WHASH
    };

    inline std::size_t algorithmIndex(HashAlgorithm algorithm) {
        return static_cast<std::size_t>(algorithm);
    }

    // ================================
    // STRING CONVERSION FUNCTIONS
    // ================================

    inline std::string toString(HashAlgorithm algorithm) {
        switch (algorithm) {
            case HashAlgorithm::PHASH: return "phash";
            case HashAlgorithm::AHASH: return "ahash";
            case HashAlgorithm::DHASH: return "dhash";
            case HashAlgorithm::WHASH: return "whash";
            default: return "unknown";
        }
    }

    inline std::string toString(HashRegion region) {
        switch (region) {
            case HashRegion::FULL_CARD: return "full_card";
            case HashRegion::ART_ZONE: return "art_zone";
            default: return "unknown";
        }
    }

    inline std::string toString(ConfidenceTier tier) {
        switch (tier) {
            case ConfidenceTier::HIGH: return "high";
            case ConfidenceTier::MEDIUM: return "medium";
            case ConfidenceTier::LOW: return "low";
            default: return "unknown";
        }
    }

    inline std::string toString(MatchMode mode) {
        switch (mode) {
            case MatchMode::CASCADE: return "cascade";
            case MatchMode::HASH_ONLY: return "hash";
            case MatchMode::EMBEDDING_ONLY: return "embedding";
            default: return "unknown";
        }
    }

    inline std::string toString(EmbeddingMetric metric) {
        switch (metric) {
            case EmbeddingMetric::COSINE: return "cosine";
            case EmbeddingMetric::EUCLIDEAN: return "euclidean";
            default: return "unknown";
        }
    }

    inline std::string toString(MatchStage stage) {
        switch (stage) {
            case MatchStage::PREPROCESSED: return "preprocessed";
            case MatchStage::HASHED: return "hashed";
            case MatchStage::RANKED_BY_HASH: return "ranked_by_hash";
            case MatchStage::EMBEDDED: return "embedded";
            case MatchStage::RANKED_BY_EMBEDDING: return "ranked_by_embedding";
            case MatchStage::FINAL: return "final";
            default: return "unknown";
        }
    }

    /**
     * @brief Storage tag for a (algorithm, region) pair, e.g. "phash" or "phash_art"
     */
    inline std::string hashTypeTag(HashAlgorithm algorithm, HashRegion region) {
        return region == HashRegion::ART_ZONE ? toString(algorithm) + "_art" : toString(algorithm);
    }

    inline HashAlgorithm hashAlgorithmFromString(const std::string& str) {
        if (str == "phash") return HashAlgorithm::PHASH;
        if (str == "ahash") return HashAlgorithm::AHASH;
        if (str == "dhash") return HashAlgorithm::DHASH;
        if (str == "whash") return HashAlgorithm::WHASH;
        throw std::runtime_error("Unknown hash algorithm: " + str);
    }

    // ================================
    // CATALOG DATA
    // ================================

    /**
     * @brief Catalog reference card. Never mutated by the identification pipeline.
     */
    struct Card {
        std::string id;
        std::string name;
        std::string set_id;
        std::string set_name;
        std::string series;
        std::string number;
        std::string rarity;
        std::string category;
        std::optional<int> hp;
        std::vector<std::string> types;
        std::string image_url;
        std::string local_image_path;
    };

    using CardPtr = std::shared_ptr<const Card>;

    /**
     * @brief Print variants a card exists in
     */
    struct CardVariants {
        bool normal = false;
        bool reverse = false;
        bool holo = false;
        bool first_edition = false;
        bool w_promo = false;
    };

    /**
     * @brief Lazily fetched secondary attributes of a card
     */
    struct CardDetails {
        std::optional<CardVariants> variants;
        std::optional<int> set_total;   // official card count of the set
    };

    /**
     * @brief One stored fingerprint row, hex encoded
     */
    struct HashSignature {
        std::string card_id;
        HashAlgorithm algorithm = HashAlgorithm::PHASH;
        HashRegion region = HashRegion::FULL_CARD;
        std::string hex;
    };

    /**
     * @brief One stored embedding row
     */
    struct EmbeddingVector {
        std::string card_id;
        std::vector<float> values;
    };

    // ================================
    // MATCH OUTPUT
    // ================================

    struct MatchCandidate {
        CardPtr card;
        std::optional<double> hash_distance;        // combined weighted Hamming distance, when the card was hash-ranked
        std::optional<double> embedding_distance;   // set when the embedding stage ranked this card
        ConfidenceTier tier = ConfidenceTier::LOW;
    };

    struct MatchResult {
        std::vector<MatchCandidate> candidates;
        std::vector<MatchStage> stages;
        bool boundary_detected = false;
        bool sticker_detected = false;
        bool embedding_used = false;
        bool degraded = false;       // embedding stage was required but unavailable
        std::string error;           // non-empty when the input could not be read

        bool passedStage(MatchStage stage) const {
            for (const auto s : stages) {
                if (s == stage) return true;
            }
            return false;
        }
    };

    // ================================
    // CONFIGURATION STRUCTURES
    // ================================

    struct DatabaseParams {
        std::string path = "cards.db";
    };

    struct PreprocessingParams {
        int target_width = 300;
        int target_height = 420;
        bool detect_boundary = true;
        double min_card_area_ratio = 0.05;   // of the input image
        double aspect_tolerance = 0.30;      // relative to 88/63
        bool sticker_detection = true;
        int inpaint_radius = 5;
        bool clahe_enabled = true;
        double clahe_clip_limit = 2.0;
        int clahe_tile_grid = 8;
    };

    struct HashingParams {
        int hash_size = 16;                  // fingerprint is hash_size^2 bits
        std::array<double, kHashAlgorithmCount> weights = {2.0, 1.0, 1.0, 1.0};   // indexed by algorithmIndex()
        bool art_zone_enabled = true;
        double art_zone_top = 0.13;
        double art_zone_bottom = 0.53;
    };

    struct EmbeddingParams {
        std::string model_path;              // empty = hash-only operation
        int input_size = 518;
        int dimension = 768;
        std::string device = "auto";         // "auto", "cpu", "cuda"
        EmbeddingMetric metric = EmbeddingMetric::COSINE;
        int tta_crops = 4;
        double tta_jitter = 0.08;
        unsigned int seed = 42;
    };

    struct MatchingParams {
        MatchMode mode = MatchMode::CASCADE;
        int top_k = 5;
        double hash_high_threshold = 15.0;
        double hash_medium_threshold = 40.0;
        double min_margin = 5.0;
        int shortlist_size = 50;
        double embedding_high_threshold = 0.10;
        double embedding_medium_threshold = 0.25;
        std::vector<std::string> excluded_set_prefixes = {"A", "B", "P-A"};
    };

    struct EnrichmentParams {
        std::string catalog_dir;             // directory of <card_id>.json documents
        bool persist = true;                 // write fetched details back to the store
    };

    struct BatchParams {
        bool paired = false;
    };

    struct PerformanceParams {
        int num_threads = 0;                 // 0 = auto-detect (std::thread::hardware_concurrency)
        int embedding_batch_size = 16;
        int hash_flush_size = 1000;
        int embedding_flush_size = 500;
    };

} // namespace card_identifier
