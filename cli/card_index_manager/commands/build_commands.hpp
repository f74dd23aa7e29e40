#pragma once

#include "card_identifier/database/DatabaseManager.hpp"
#include "src/core/config/IdentifierConfig.hpp"

namespace card_identifier::cli::index_commands {

int computeHashes(card_identifier::database::DatabaseManager& db,
                  const card_identifier::config::IdentifierConfig& config,
                  int argc, char** argv);

int computeEmbeddings(card_identifier::database::DatabaseManager& db,
                      const card_identifier::config::IdentifierConfig& config,
                      int argc, char** argv);

} // namespace card_identifier::cli::index_commands
