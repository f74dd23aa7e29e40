#include "card_identifier/database/DatabaseManager.hpp"
#include "cli/common/bootstrap.hpp"
#include "cli/card_index_manager/commands/catalog_commands.hpp"
#include "cli/card_index_manager/commands/build_commands.hpp"
#include "card_identifier/logging.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

static void printUsage(const std::string& binaryName) {
    std::cout << "Usage: " << binaryName << " [--config <file.yaml>] <command> [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --help                                 Show this help message and exit" << std::endl;
    std::cout << "  -c, --config <file.yaml>                   Configuration (database path, hashing, model)" << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  Catalog:" << std::endl;
    std::cout << "    import-catalog <cards.json> [image_dir]  - Import catalog card records, resolving local images" << std::endl;
    std::cout << "  Index Building:" << std::endl;
    std::cout << "    compute-hashes [--rebuild]               - Fingerprint reference images (full card and art zone)" << std::endl;
    std::cout << "    compute-embeddings [--rebuild]           - Embed reference images with the configured model" << std::endl;
    std::cout << "  Maintenance:" << std::endl;
    std::cout << "    clear-hashes                             - Delete all stored fingerprints" << std::endl;
    std::cout << "    clear-embeddings                         - Delete all stored embeddings" << std::endl;
    std::cout << "  Information:" << std::endl;
    std::cout << "    stats                                    - Row counts and index coverage" << std::endl;
    std::cout << "    nearest <card_id> [count]                - Closest other cards per hash algorithm" << std::endl;
}

using namespace card_identifier;

/**
 * @brief CLI tool for building and maintaining the reference card store
 */
int main(int argc, char** argv) {
    std::string config_path;
    try {
        config_path = cli::bootstrap::extractConfigPath(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        return 1;
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        printUsage(argv[0]);
        return 0;
    }

    cli::bootstrap::BootstrapResult boot;
    try {
        boot = cli::bootstrap::loadConfigAndDatabase(config_path);
    } catch (const std::exception& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        return 1;
    }
    if (!boot.db_enabled) {
        std::cerr << "❌ Failed to connect to database" << std::endl;
        return 1;
    }
    auto& db = *boot.db;

    if (command == "import-catalog") {
        return cli::index_commands::importCatalog(db, argc, argv);

    } else if (command == "compute-hashes") {
        return cli::index_commands::computeHashes(db, boot.config, argc, argv);

    } else if (command == "compute-embeddings") {
        return cli::index_commands::computeEmbeddings(db, boot.config, argc, argv);

    } else if (command == "stats") {
        return cli::index_commands::showStats(db);

    } else if (command == "nearest") {
        return cli::index_commands::showNearest(db, boot.config, argc, argv);

    } else if (command == "clear-hashes") {
        return cli::index_commands::clearHashes(db);

    } else if (command == "clear-embeddings") {
        return cli::index_commands::clearEmbeddings(db);

    } else {
        std::cerr << "❌ Unknown command: " << command << std::endl;
        std::cerr << "Run without arguments to see available commands." << std::endl;
        return 1;
    }
}
