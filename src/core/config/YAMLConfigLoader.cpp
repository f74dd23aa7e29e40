#include "YAMLConfigLoader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace {

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}

namespace card_identifier::config {

    IdentifierConfig YAMLConfigLoader::loadFromFile(const std::string& yaml_path) {
        try {
            YAML::Node root = YAML::LoadFile(yaml_path);
            return loadFromYAML(root);
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("YAML parsing error in " + yaml_path + ": " + e.what());
        } catch (const std::exception& e) {
            throw std::runtime_error("Error loading " + yaml_path + ": " + e.what());
        }
    }

    IdentifierConfig YAMLConfigLoader::loadFromString(const std::string& yaml_content) {
        try {
            YAML::Node root = YAML::Load(yaml_content);
            return loadFromYAML(root);
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
        }
    }

    IdentifierConfig YAMLConfigLoader::loadFromYAML(const YAML::Node& root) {
        IdentifierConfig config;

        // An empty document parses as a null node; keep every default
        if (!root || root.IsNull()) {
            validate(config);
            return config;
        }
        if (!root.IsMap()) {
            throw std::runtime_error("YAML validation error: top level must be a mapping");
        }

        if (root["database"]) parseDatabase(root["database"], config.database);
        if (root["preprocessing"]) parsePreprocessing(root["preprocessing"], config.preprocessing);
        if (root["hashing"]) parseHashing(root["hashing"], config.hashing);
        if (root["embedding"]) parseEmbedding(root["embedding"], config.embedding);
        if (root["matching"]) parseMatching(root["matching"], config.matching);
        if (root["enrichment"]) parseEnrichment(root["enrichment"], config.enrichment);
        if (root["batch"]) parseBatch(root["batch"], config.batch);
        if (root["performance"]) parsePerformance(root["performance"], config.performance);
        if (root["logging"]) parseLogging(root["logging"], config.logging);

        validate(config);

        return config;
    }

    void YAMLConfigLoader::parseDatabase(const YAML::Node& node, DatabaseParams& database) {
        if (node["path"]) database.path = node["path"].as<std::string>();
    }

    void YAMLConfigLoader::parsePreprocessing(const YAML::Node& node, PreprocessingParams& preprocessing) {
        if (node["target_width"]) preprocessing.target_width = node["target_width"].as<int>();
        if (node["target_height"]) preprocessing.target_height = node["target_height"].as<int>();
        if (node["detect_boundary"]) preprocessing.detect_boundary = node["detect_boundary"].as<bool>();
        if (node["min_card_area_ratio"]) preprocessing.min_card_area_ratio = node["min_card_area_ratio"].as<double>();
        if (node["aspect_tolerance"]) preprocessing.aspect_tolerance = node["aspect_tolerance"].as<double>();

        if (node["sticker"]) {
            const auto& sticker = node["sticker"];
            if (sticker["enabled"]) preprocessing.sticker_detection = sticker["enabled"].as<bool>();
            if (sticker["inpaint_radius"]) preprocessing.inpaint_radius = sticker["inpaint_radius"].as<int>();
        }

        if (node["clahe"]) {
            const auto& clahe = node["clahe"];
            if (clahe["enabled"]) preprocessing.clahe_enabled = clahe["enabled"].as<bool>();
            if (clahe["clip_limit"]) preprocessing.clahe_clip_limit = clahe["clip_limit"].as<double>();
            if (clahe["tile_grid"]) preprocessing.clahe_tile_grid = clahe["tile_grid"].as<int>();
        }
    }

    void YAMLConfigLoader::parseHashing(const YAML::Node& node, HashingParams& hashing) {
        if (node["hash_size"]) hashing.hash_size = node["hash_size"].as<int>();

        if (node["weights"]) {
            const auto& weights = node["weights"];
            if (!weights.IsMap()) {
                throw std::runtime_error("YAML validation error: hashing.weights must be a mapping of algorithm to weight");
            }
            for (const auto& entry : weights) {
                const auto algorithm = hashAlgorithmFromString(entry.first.as<std::string>());
                hashing.weights[algorithmIndex(algorithm)] = entry.second.as<double>();
            }
        }

        if (node["art_zone"]) {
            const auto& art = node["art_zone"];
            if (art["enabled"]) hashing.art_zone_enabled = art["enabled"].as<bool>();
            if (art["top"]) hashing.art_zone_top = art["top"].as<double>();
            if (art["bottom"]) hashing.art_zone_bottom = art["bottom"].as<double>();
        }
    }

    void YAMLConfigLoader::parseEmbedding(const YAML::Node& node, EmbeddingParams& embedding) {
        if (node["model_path"]) embedding.model_path = node["model_path"].as<std::string>();
        if (node["input_size"]) embedding.input_size = node["input_size"].as<int>();
        if (node["dimension"]) embedding.dimension = node["dimension"].as<int>();
        if (node["device"]) embedding.device = node["device"].as<std::string>();
        if (node["metric"]) embedding.metric = stringToEmbeddingMetric(node["metric"].as<std::string>());
        if (node["tta_crops"]) embedding.tta_crops = node["tta_crops"].as<int>();
        if (node["tta_jitter"]) embedding.tta_jitter = node["tta_jitter"].as<double>();
        if (node["seed"]) embedding.seed = node["seed"].as<unsigned int>();
    }

    void YAMLConfigLoader::parseMatching(const YAML::Node& node, MatchingParams& matching) {
        if (node["mode"]) matching.mode = stringToMatchMode(node["mode"].as<std::string>());
        if (node["top_k"]) matching.top_k = node["top_k"].as<int>();
        if (node["min_margin"]) matching.min_margin = node["min_margin"].as<double>();
        if (node["shortlist_size"]) matching.shortlist_size = node["shortlist_size"].as<int>();

        if (node["hash_thresholds"]) {
            const auto& thresholds = node["hash_thresholds"];
            if (thresholds["high"]) matching.hash_high_threshold = thresholds["high"].as<double>();
            if (thresholds["medium"]) matching.hash_medium_threshold = thresholds["medium"].as<double>();
        }

        if (node["embedding_thresholds"]) {
            const auto& thresholds = node["embedding_thresholds"];
            if (thresholds["high"]) matching.embedding_high_threshold = thresholds["high"].as<double>();
            if (thresholds["medium"]) matching.embedding_medium_threshold = thresholds["medium"].as<double>();
        }

        if (node["excluded_set_prefixes"]) {
            const auto& prefixes = node["excluded_set_prefixes"];
            if (!prefixes.IsSequence()) {
                throw std::runtime_error("YAML validation error: matching.excluded_set_prefixes must be a list");
            }
            matching.excluded_set_prefixes.clear();
            for (const auto& prefix : prefixes) {
                if (!prefix.IsScalar()) {
                    throw std::runtime_error("YAML validation error: matching.excluded_set_prefixes entries must be strings");
                }
                matching.excluded_set_prefixes.push_back(prefix.as<std::string>());
            }
        }
    }

    void YAMLConfigLoader::parseEnrichment(const YAML::Node& node, EnrichmentParams& enrichment) {
        if (node["catalog_dir"]) enrichment.catalog_dir = node["catalog_dir"].as<std::string>();
        if (node["persist"]) enrichment.persist = node["persist"].as<bool>();
    }

    void YAMLConfigLoader::parseBatch(const YAML::Node& node, BatchParams& batch) {
        if (node["paired"]) batch.paired = node["paired"].as<bool>();
    }

    void YAMLConfigLoader::parsePerformance(const YAML::Node& node, PerformanceParams& performance) {
        if (node["num_threads"]) performance.num_threads = node["num_threads"].as<int>();
        if (node["embedding_batch_size"]) performance.embedding_batch_size = node["embedding_batch_size"].as<int>();
        if (node["hash_flush_size"]) performance.hash_flush_size = node["hash_flush_size"].as<int>();
        if (node["embedding_flush_size"]) performance.embedding_flush_size = node["embedding_flush_size"].as<int>();
    }

    void YAMLConfigLoader::parseLogging(const YAML::Node& node, IdentifierConfig::Logging& logging_config) {
        if (node["level"]) logging_config.level = logging::stringToLogLevel(node["level"].as<std::string>());
    }

    void YAMLConfigLoader::validate(const IdentifierConfig& config) {
        if (config.database.path.empty()) {
            throw std::runtime_error("YAML validation error: database.path is required");
        }

        const auto& pre = config.preprocessing;
        if (pre.target_width <= 0 || pre.target_height <= 0) {
            throw std::runtime_error("YAML validation error: preprocessing target size must be > 0");
        }
        if (pre.min_card_area_ratio <= 0.0 || pre.min_card_area_ratio >= 1.0) {
            throw std::runtime_error("YAML validation error: preprocessing.min_card_area_ratio must be in (0,1)");
        }
        if (pre.aspect_tolerance <= 0.0) {
            throw std::runtime_error("YAML validation error: preprocessing.aspect_tolerance must be > 0");
        }
        if (pre.inpaint_radius <= 0) {
            throw std::runtime_error("YAML validation error: preprocessing.sticker.inpaint_radius must be > 0");
        }
        if (pre.clahe_clip_limit <= 0.0 || pre.clahe_tile_grid <= 0) {
            throw std::runtime_error("YAML validation error: preprocessing.clahe clip_limit and tile_grid must be > 0");
        }

        const auto& hashing = config.hashing;
        if (hashing.hash_size < 2 || (hashing.hash_size & (hashing.hash_size - 1)) != 0) {
            throw std::runtime_error("YAML validation error: hashing.hash_size must be a power of two >= 2");
        }
        double weight_total = 0.0;
        for (const double weight : hashing.weights) {
            if (weight < 0.0) {
                throw std::runtime_error("YAML validation error: hashing.weights must be >= 0");
            }
            weight_total += weight;
        }
        if (weight_total <= 0.0) {
            throw std::runtime_error("YAML validation error: at least one hashing weight must be > 0");
        }
        if (!(hashing.art_zone_top >= 0.0 && hashing.art_zone_top < hashing.art_zone_bottom && hashing.art_zone_bottom <= 1.0)) {
            throw std::runtime_error("YAML validation error: hashing.art_zone must satisfy 0 <= top < bottom <= 1");
        }

        const auto& embedding = config.embedding;
        if (embedding.input_size <= 0 || embedding.dimension <= 0) {
            throw std::runtime_error("YAML validation error: embedding.input_size and embedding.dimension must be > 0");
        }
        if (embedding.device != "auto" && embedding.device != "cpu" && embedding.device != "cuda") {
            throw std::runtime_error("YAML validation error: embedding.device must be auto, cpu or cuda");
        }
        if (embedding.tta_crops < 1) {
            throw std::runtime_error("YAML validation error: embedding.tta_crops must be >= 1");
        }
        if (embedding.tta_jitter < 0.0 || embedding.tta_jitter >= 0.5) {
            throw std::runtime_error("YAML validation error: embedding.tta_jitter must be in [0,0.5)");
        }

        const auto& matching = config.matching;
        if (matching.top_k <= 0) {
            throw std::runtime_error("YAML validation error: matching.top_k must be > 0");
        }
        if (matching.shortlist_size <= 0) {
            throw std::runtime_error("YAML validation error: matching.shortlist_size must be > 0");
        }
        if (matching.hash_high_threshold < 0.0 || matching.hash_medium_threshold < matching.hash_high_threshold) {
            throw std::runtime_error("YAML validation error: matching.hash_thresholds must satisfy 0 <= high <= medium");
        }
        if (matching.embedding_high_threshold < 0.0 ||
            matching.embedding_medium_threshold < matching.embedding_high_threshold) {
            throw std::runtime_error("YAML validation error: matching.embedding_thresholds must satisfy 0 <= high <= medium");
        }
        if (matching.min_margin < 0.0) {
            throw std::runtime_error("YAML validation error: matching.min_margin must be >= 0");
        }
        for (const auto& prefix : matching.excluded_set_prefixes) {
            if (prefix.empty()) {
                throw std::runtime_error("YAML validation error: matching.excluded_set_prefixes must not contain empty strings");
            }
        }

        const auto& performance = config.performance;
        if (performance.num_threads < 0) {
            throw std::runtime_error("YAML validation error: performance.num_threads must be >= 0");
        }
        if (performance.embedding_batch_size <= 0 || performance.hash_flush_size <= 0 ||
            performance.embedding_flush_size <= 0) {
            throw std::runtime_error("YAML validation error: performance batch and flush sizes must be > 0");
        }
    }

    MatchMode YAMLConfigLoader::stringToMatchMode(const std::string& str) {
        if (str == "cascade") return MatchMode::CASCADE;
        if (str == "hash") return MatchMode::HASH_ONLY;
        if (str == "embedding") return MatchMode::EMBEDDING_ONLY;
        throw std::runtime_error("Unknown matching mode: " + str);
    }

    EmbeddingMetric YAMLConfigLoader::stringToEmbeddingMetric(const std::string& str) {
        if (str == "cosine") return EmbeddingMetric::COSINE;
        if (str == "euclidean") return EmbeddingMetric::EUCLIDEAN;
        throw std::runtime_error("Unknown embedding metric: " + str);
    }

    void YAMLConfigLoader::saveToFile(const IdentifierConfig& config, const std::string& yaml_path) {
        YAML::Emitter out;

        out << YAML::BeginMap;

        out << YAML::Key << "database";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << config.database.path;
        out << YAML::EndMap;

        const auto& pre = config.preprocessing;
        out << YAML::Key << "preprocessing";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "target_width" << YAML::Value << pre.target_width;
        out << YAML::Key << "target_height" << YAML::Value << pre.target_height;
        out << YAML::Key << "detect_boundary" << YAML::Value << pre.detect_boundary;
        out << YAML::Key << "min_card_area_ratio" << YAML::Value << pre.min_card_area_ratio;
        out << YAML::Key << "aspect_tolerance" << YAML::Value << pre.aspect_tolerance;
        out << YAML::Key << "sticker" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << pre.sticker_detection;
        out << YAML::Key << "inpaint_radius" << YAML::Value << pre.inpaint_radius;
        out << YAML::EndMap;
        out << YAML::Key << "clahe" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << pre.clahe_enabled;
        out << YAML::Key << "clip_limit" << YAML::Value << pre.clahe_clip_limit;
        out << YAML::Key << "tile_grid" << YAML::Value << pre.clahe_tile_grid;
        out << YAML::EndMap;
        out << YAML::EndMap;

        const auto& hashing = config.hashing;
        out << YAML::Key << "hashing";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "hash_size" << YAML::Value << hashing.hash_size;
        out << YAML::Key << "weights" << YAML::Value << YAML::BeginMap;
        for (const auto algorithm : kAllHashAlgorithms) {
            out << YAML::Key << toString(algorithm) << YAML::Value << hashing.weights[algorithmIndex(algorithm)];
        }
        out << YAML::EndMap;
        out << YAML::Key << "art_zone" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << hashing.art_zone_enabled;
        out << YAML::Key << "top" << YAML::Value << hashing.art_zone_top;
        out << YAML::Key << "bottom" << YAML::Value << hashing.art_zone_bottom;
        out << YAML::EndMap;
        out << YAML::EndMap;

        const auto& embedding = config.embedding;
        out << YAML::Key << "embedding";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "model_path" << YAML::Value << embedding.model_path;
        out << YAML::Key << "input_size" << YAML::Value << embedding.input_size;
        out << YAML::Key << "dimension" << YAML::Value << embedding.dimension;
        out << YAML::Key << "device" << YAML::Value << embedding.device;
        out << YAML::Key << "metric" << YAML::Value << toString(embedding.metric);
        out << YAML::Key << "tta_crops" << YAML::Value << embedding.tta_crops;
        out << YAML::Key << "tta_jitter" << YAML::Value << embedding.tta_jitter;
        out << YAML::Key << "seed" << YAML::Value << embedding.seed;
        out << YAML::EndMap;

        const auto& matching = config.matching;
        out << YAML::Key << "matching";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "mode" << YAML::Value << toString(matching.mode);
        out << YAML::Key << "top_k" << YAML::Value << matching.top_k;
        out << YAML::Key << "min_margin" << YAML::Value << matching.min_margin;
        out << YAML::Key << "shortlist_size" << YAML::Value << matching.shortlist_size;
        out << YAML::Key << "hash_thresholds" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "high" << YAML::Value << matching.hash_high_threshold;
        out << YAML::Key << "medium" << YAML::Value << matching.hash_medium_threshold;
        out << YAML::EndMap;
        out << YAML::Key << "embedding_thresholds" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "high" << YAML::Value << matching.embedding_high_threshold;
        out << YAML::Key << "medium" << YAML::Value << matching.embedding_medium_threshold;
        out << YAML::EndMap;
        out << YAML::Key << "excluded_set_prefixes" << YAML::Value << YAML::Flow << matching.excluded_set_prefixes;
        out << YAML::EndMap;

        out << YAML::Key << "enrichment";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "catalog_dir" << YAML::Value << config.enrichment.catalog_dir;
        out << YAML::Key << "persist" << YAML::Value << config.enrichment.persist;
        out << YAML::EndMap;

        out << YAML::Key << "batch";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "paired" << YAML::Value << config.batch.paired;
        out << YAML::EndMap;

        const auto& performance = config.performance;
        out << YAML::Key << "performance";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "num_threads" << YAML::Value << performance.num_threads;
        out << YAML::Key << "embedding_batch_size" << YAML::Value << performance.embedding_batch_size;
        out << YAML::Key << "hash_flush_size" << YAML::Value << performance.hash_flush_size;
        out << YAML::Key << "embedding_flush_size" << YAML::Value << performance.embedding_flush_size;
        out << YAML::EndMap;

        out << YAML::Key << "logging";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << toLowerCopy(logging::toString(config.logging.level));
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(yaml_path);
        if (!file) {
            throw std::runtime_error("Cannot write config file: " + yaml_path);
        }
        file << out.c_str();
    }

}
