#pragma once

#include "card_identifier/types.hpp"
#include "card_identifier/logging.hpp"
#include <string>

namespace card_identifier::config {

    /**
     * @brief Complete runtime configuration of the identifier and its tools
     *
     * Every section has usable defaults, so an empty YAML document yields a
     * working hash-only configuration against ./cards.db.
     */
    struct IdentifierConfig {
        DatabaseParams database;
        PreprocessingParams preprocessing;
        HashingParams hashing;
        EmbeddingParams embedding;
        MatchingParams matching;
        EnrichmentParams enrichment;
        BatchParams batch;
        PerformanceParams performance;

        struct Logging {
            logging::LogLevel level = logging::LogLevel::INFO;
        } logging;
    };

}
