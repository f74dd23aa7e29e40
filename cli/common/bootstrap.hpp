#pragma once

#include "src/core/config/IdentifierConfig.hpp"
#include "card_identifier/database/DatabaseManager.hpp"
#include <memory>
#include <string>

namespace card_identifier::cli::bootstrap {

struct BootstrapResult {
    config::IdentifierConfig config;
    std::unique_ptr<card_identifier::database::DatabaseManager> db;
    bool db_enabled = false;
};

// Remove "--config <path>" from argv (anywhere after argv[0]) and return the path,
// or an empty string when absent.
std::string extractConfigPath(int& argc, char** argv);

// Load YAML config (defaults when config_path is empty), apply the log level,
// open the card store and create its tables.
BootstrapResult loadConfigAndDatabase(const std::string& config_path);

} // namespace card_identifier::cli::bootstrap
