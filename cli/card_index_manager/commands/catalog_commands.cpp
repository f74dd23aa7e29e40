#include "catalog_commands.hpp"
#include "src/core/index/IndexLoader.hpp"
#include "src/core/indexing/CatalogImporter.hpp"
#include "card_identifier/logging.hpp"
#include <boost/filesystem.hpp>
#include <iostream>
#include <stdexcept>
#include <string>

namespace card_identifier::cli::index_commands {

int importCatalog(card_identifier::database::DatabaseManager& db, int argc, char** argv) {
    if (argc < 3 || argc > 4) {
        std::cerr << "Usage: " << argv[0] << " import-catalog <cards.json|cards.yaml> [image_dir]" << std::endl;
        std::cerr << "  Example: " << argv[0] << " import-catalog export/cards.json images/" << std::endl;
        return 1;
    }

    const std::string catalog_file = argv[2];
    const std::string image_dir = argc == 4 ? argv[3] : "";

    if (!boost::filesystem::exists(catalog_file)) {
        std::cerr << "❌ Catalog file not found: " << catalog_file << std::endl;
        return 1;
    }
    if (!image_dir.empty() && !boost::filesystem::is_directory(image_dir)) {
        std::cerr << "❌ Image directory not found: " << image_dir << std::endl;
        return 1;
    }

    try {
        const indexing::CatalogImporter importer(image_dir);
        const auto stats = importer.importFile(db, catalog_file);
        std::cout << "✅ Imported " << stats.imported << " cards ("
                  << stats.skipped << " skipped, "
                  << stats.with_local_image << " with a local reference image)" << std::endl;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Catalog import failed: ") + e.what());
        return 1;
    }
    return 0;
}

int showStats(card_identifier::database::DatabaseManager& db) {
    const auto stats = db.getStatistics();
    std::cout << "📋 Card store statistics:" << std::endl;
    for (const auto& [table, count] : stats) {
        std::cout << "  " << table << ": " << count << std::endl;
    }
    return 0;
}

int showNearest(card_identifier::database::DatabaseManager& db,
                const card_identifier::config::IdentifierConfig& config,
                int argc, char** argv) {
    if (argc < 3 || argc > 4) {
        std::cerr << "Usage: " << argv[0] << " nearest <card_id> [count]" << std::endl;
        return 1;
    }

    const std::string card_id = argv[2];
    size_t count = 5;
    if (argc == 4) {
        try {
            count = static_cast<size_t>(std::stoul(argv[3]));
        } catch (const std::exception&) {
            std::cerr << "❌ Invalid count: " << argv[3] << std::endl;
            return 1;
        }
    }

    index::ReferenceIndices indices;
    try {
        indices = index::IndexLoader::load(db, config);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Failed to load indices: ") + e.what());
        return 1;
    }
    if (!indices.full_card_hashes || indices.full_card_hashes->empty()) {
        std::cerr << "❌ No fingerprints stored; run compute-hashes first" << std::endl;
        return 1;
    }

    bool found = false;
    std::cout << "🔎 Nearest fingerprints to " << card_id << ":" << std::endl;
    for (const auto algorithm : kAllHashAlgorithms) {
        if (!indices.full_card_hashes->contains(card_id, algorithm)) {
            continue;
        }
        found = true;
        std::cout << "  " << toString(algorithm) << ":";
        for (const auto& hit : indices.full_card_hashes->neighbours(card_id, algorithm, count)) {
            std::cout << " " << hit.card_id << "(" << hit.distance << ")";
        }
        std::cout << std::endl;
    }
    if (!found) {
        std::cerr << "❌ No fingerprints for card: " << card_id << std::endl;
        return 1;
    }
    return 0;
}

int clearHashes(card_identifier::database::DatabaseManager& db) {
    if (!db.clearHashes()) {
        std::cerr << "❌ Failed to clear fingerprints" << std::endl;
        return 1;
    }
    std::cout << "🗑️  Cleared all fingerprints" << std::endl;
    return 0;
}

int clearEmbeddings(card_identifier::database::DatabaseManager& db) {
    if (!db.clearEmbeddings()) {
        std::cerr << "❌ Failed to clear embeddings" << std::endl;
        return 1;
    }
    std::cout << "🗑️  Cleared all embeddings" << std::endl;
    return 0;
}

} // namespace card_identifier::cli::index_commands
