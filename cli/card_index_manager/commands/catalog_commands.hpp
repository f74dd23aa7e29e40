#pragma once

#include "card_identifier/database/DatabaseManager.hpp"
#include "src/core/config/IdentifierConfig.hpp"

namespace card_identifier::cli::index_commands {

int importCatalog(card_identifier::database::DatabaseManager& db, int argc, char** argv);
int showStats(card_identifier::database::DatabaseManager& db);
int showNearest(card_identifier::database::DatabaseManager& db,
                const card_identifier::config::IdentifierConfig& config,
                int argc, char** argv);
int clearHashes(card_identifier::database::DatabaseManager& db);
int clearEmbeddings(card_identifier::database::DatabaseManager& db);

} // namespace card_identifier::cli::index_commands
