#pragma once

#include "IdentifierConfig.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

namespace card_identifier::config {

    /**
     * @brief Loads IdentifierConfig from YAML and writes it back
     *
     * Missing sections and keys keep their defaults. Parse failures and
     * unknown enum strings surface as std::runtime_error, semantic problems
     * as std::runtime_error("YAML validation error: ...").
     */
    class YAMLConfigLoader {
    public:
        static IdentifierConfig loadFromFile(const std::string& yaml_path);
        static IdentifierConfig loadFromString(const std::string& yaml_content);
        static void saveToFile(const IdentifierConfig& config, const std::string& yaml_path);

        /**
         * @throws std::runtime_error describing the first invalid value
         */
        static void validate(const IdentifierConfig& config);

        static MatchMode stringToMatchMode(const std::string& str);
        static EmbeddingMetric stringToEmbeddingMetric(const std::string& str);

    private:
        static IdentifierConfig loadFromYAML(const YAML::Node& root);

        static void parseDatabase(const YAML::Node& node, DatabaseParams& database);
        static void parsePreprocessing(const YAML::Node& node, PreprocessingParams& preprocessing);
        static void parseHashing(const YAML::Node& node, HashingParams& hashing);
        static void parseEmbedding(const YAML::Node& node, EmbeddingParams& embedding);
        static void parseMatching(const YAML::Node& node, MatchingParams& matching);
        static void parseEnrichment(const YAML::Node& node, EnrichmentParams& enrichment);
        static void parseBatch(const YAML::Node& node, BatchParams& batch);
        static void parsePerformance(const YAML::Node& node, PerformanceParams& performance);
        static void parseLogging(const YAML::Node& node, IdentifierConfig::Logging& logging);
    };

}
