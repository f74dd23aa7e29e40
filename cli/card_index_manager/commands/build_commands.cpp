#include "build_commands.hpp"
#include "src/core/embedding/EmbeddingModelFactory.hpp"
#include "src/core/indexing/IndexBuilder.hpp"
#include "interfaces/IEmbeddingModel.hpp"
#include "card_identifier/logging.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

namespace card_identifier::cli::index_commands {

namespace {

bool parseRebuildFlag(int argc, char** argv, const std::string& command, bool& rebuild) {
    rebuild = false;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--rebuild") {
            rebuild = true;
        } else {
            std::cerr << "Usage: " << argv[0] << " " << command << " [--rebuild]" << std::endl;
            return false;
        }
    }
    return true;
}

} // namespace

int computeHashes(card_identifier::database::DatabaseManager& db,
                  const card_identifier::config::IdentifierConfig& config,
                  int argc, char** argv) {
    bool rebuild = false;
    if (!parseRebuildFlag(argc, argv, "compute-hashes", rebuild)) {
        return 1;
    }

    const indexing::IndexBuilder builder(db, config);
    const auto stats = builder.buildHashes(rebuild);

    std::cout << "✅ Fingerprinted " << stats.cards_hashed << "/" << stats.cards_considered << " cards ("
              << stats.rows_written << " rows, " << stats.missing_image << " without image, "
              << stats.unreadable << " unreadable)" << std::endl;
    return stats.failed_flushes == 0 ? 0 : 1;
}

int computeEmbeddings(card_identifier::database::DatabaseManager& db,
                      const card_identifier::config::IdentifierConfig& config,
                      int argc, char** argv) {
    bool rebuild = false;
    if (!parseRebuildFlag(argc, argv, "compute-embeddings", rebuild)) {
        return 1;
    }

    auto model = embedding::EmbeddingModelFactory::create(config.embedding);
    if (!model) {
        std::cerr << "❌ No usable embedding model (set embedding.model_path in the config)" << std::endl;
        return 1;
    }

    try {
        const indexing::IndexBuilder builder(db, config, model);
        const auto stats = builder.buildEmbeddings(rebuild);
        std::cout << "✅ Embedded " << stats.cards_embedded << "/" << stats.cards_considered << " cards with "
                  << model->name() << " (" << stats.failed_batches << " failed batches, "
                  << stats.unreadable << " unreadable)" << std::endl;
        return stats.failed_flushes == 0 ? 0 : 1;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Embedding build failed: ") + e.what());
        return 1;
    }
}

} // namespace card_identifier::cli::index_commands
