#include "bootstrap.hpp"
#include "src/core/config/YAMLConfigLoader.hpp"
#include "card_identifier/logging.hpp"
#include <stdexcept>

namespace card_identifier::cli::bootstrap {

std::string extractConfigPath(int& argc, char** argv) {
    std::string config_path;
    int write = 1;
    for (int read = 1; read < argc; ++read) {
        const std::string arg = argv[read];
        if (arg == "--config" || arg == "-c") {
            if (read + 1 >= argc) {
                throw std::runtime_error("--config requires a path");
            }
            config_path = argv[++read];
            continue;
        }
        argv[write++] = argv[read];
    }
    argc = write;
    return config_path;
}

BootstrapResult loadConfigAndDatabase(const std::string& config_path) {
    BootstrapResult result;
    result.config = config_path.empty()
                        ? config::YAMLConfigLoader::loadFromString("")
                        : config::YAMLConfigLoader::loadFromFile(config_path);

    logging::setMinimumLevel(result.config.logging.level);
    if (!config_path.empty()) {
        LOG_INFO("Loaded configuration from " + config_path);
    }

    result.db = std::make_unique<card_identifier::database::DatabaseManager>(result.config.database.path, true);
    result.db_enabled = result.db->isEnabled();

    if (result.db_enabled) {
        if (!result.db->initializeTables()) {
            throw std::runtime_error("Failed to initialize card store tables in " + result.config.database.path);
        }
        LOG_INFO("Card store: " + result.config.database.path);
    } else {
        LOG_WARNING("Card store unavailable: " + result.config.database.path);
    }

    return result;
}

} // namespace card_identifier::cli::bootstrap
