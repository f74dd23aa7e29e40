#include "card_identifier/database/DatabaseManager.hpp"
#include <sqlite3.h>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace card_identifier::database {

namespace {

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

std::string joinTypes(const std::vector<std::string>& types) {
    std::ostringstream oss;
    for (size_t i = 0; i < types.size(); ++i) {
        if (i > 0) oss << ",";
        oss << types[i];
    }
    return oss.str();
}

std::vector<std::string> splitTypes(const std::string& joined) {
    std::vector<std::string> types;
    std::stringstream ss(joined);
    std::string token;
    while (std::getline(ss, token, ',')) {
        if (!token.empty()) types.push_back(token);
    }
    return types;
}

std::optional<int> parseOptionalInt(const std::string& text) {
    if (text.empty()) return std::nullopt;
    try {
        size_t consumed = 0;
        const int value = std::stoi(text, &consumed);
        if (consumed != text.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Column order shared by every SELECT that materializes a Card
constexpr const char* kCardColumns =
    "id, name, set_id, set_name, series, number, rarity, category, hp, types, image_url, local_image_path";

Card readCardRow(sqlite3_stmt* stmt) {
    Card card;
    card.id = columnText(stmt, 0);
    card.name = columnText(stmt, 1);
    card.set_id = columnText(stmt, 2);
    card.set_name = columnText(stmt, 3);
    card.series = columnText(stmt, 4);
    card.number = columnText(stmt, 5);
    card.rarity = columnText(stmt, 6);
    card.category = columnText(stmt, 7);
    card.hp = parseOptionalInt(columnText(stmt, 8));
    card.types = splitTypes(columnText(stmt, 9));
    card.image_url = columnText(stmt, 10);
    card.local_image_path = columnText(stmt, 11);
    return card;
}

} // namespace

// PIMPL implementation to hide SQLite details
class DatabaseManager::Impl {
public:
    sqlite3* db = nullptr;
    DatabaseConfig config;
    bool enabled = false;

    explicit Impl(const DatabaseConfig& cfg) : config(cfg), enabled(cfg.enabled) {
        if (!enabled) {
            return;
        }

        int rc = sqlite3_open(config.connection_string.c_str(), &db);
        if (rc != SQLITE_OK) {
            std::cerr << "DatabaseManager: Failed to open database: "
                      << sqlite3_errmsg(db) << std::endl;
            enabled = false;
            if (db) {
                sqlite3_close(db);
                db = nullptr;
            }
        } else {
            // Multiple worker threads read the store through one connection
            sqlite3_busy_timeout(db, 5000);
        }
    }

    ~Impl() {
        if (db) {
            sqlite3_close(db);
        }
    }

    bool exec(const char* sql, const std::string& context) const {
        char* error_msg = nullptr;
        if (sqlite3_exec(db, sql, nullptr, nullptr, &error_msg) != SQLITE_OK) {
            std::cerr << "Failed to " << context << ": " << (error_msg ? error_msg : "unknown error") << std::endl;
            sqlite3_free(error_msg);
            return false;
        }
        return true;
    }

    bool initializeTables() const {
        if (!enabled || !db) return !enabled; // Success if disabled

        const auto create_cards_table = R"(
            CREATE TABLE IF NOT EXISTS cards (
                id TEXT PRIMARY KEY,
                name TEXT NOT NULL,
                set_id TEXT,
                set_name TEXT,
                series TEXT,
                number TEXT,
                rarity TEXT,
                category TEXT,
                hp TEXT,
                types TEXT,
                image_url TEXT,
                local_image_path TEXT
            );
        )";

        const auto create_hashes_table = R"(
            CREATE TABLE IF NOT EXISTS card_hashes (
                card_id TEXT NOT NULL REFERENCES cards(id) ON DELETE CASCADE,
                hash_type TEXT NOT NULL,
                hash_value TEXT NOT NULL,
                PRIMARY KEY (card_id, hash_type)
            );
        )";

        const auto create_embeddings_table = R"(
            CREATE TABLE IF NOT EXISTS card_embeddings (
                card_id TEXT PRIMARY KEY REFERENCES cards(id) ON DELETE CASCADE,
                embedding BLOB NOT NULL
            );
        )";

        const auto create_indexes = R"(
            CREATE INDEX IF NOT EXISTS idx_card_hashes_type ON card_hashes(hash_type);
            CREATE INDEX IF NOT EXISTS idx_cards_set ON cards(set_id);
        )";

        if (!exec(create_cards_table, "create cards table")) return false;

        auto ensure_cards_column = [&](const std::string& column_name,
                                       const std::string& alter_statement) -> bool {
            sqlite3_stmt* stmt = nullptr;
            const std::string pragma = "PRAGMA table_info(cards);";
            bool found = false;

            if (sqlite3_prepare_v2(db, pragma.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
                std::cerr << "Failed to inspect cards table schema: "
                          << sqlite3_errmsg(db) << std::endl;
                return false;
            }

            while (sqlite3_step(stmt) == SQLITE_ROW) {
                const unsigned char* text = sqlite3_column_text(stmt, 1);
                if (text && column_name == reinterpret_cast<const char*>(text)) {
                    found = true;
                    break;
                }
            }
            sqlite3_finalize(stmt);

            if (found) {
                return true;
            }

            char* alter_err = nullptr;
            if (sqlite3_exec(db, alter_statement.c_str(), nullptr, nullptr, &alter_err) != SQLITE_OK) {
                std::cerr << "Failed to add column '" << column_name
                          << "' to cards table: " << alter_err << std::endl;
                sqlite3_free(alter_err);
                return false;
            }

            std::cout << "Database upgrade: added cards." << column_name << std::endl;
            return true;
        };

        // Enrichment cache columns
        if (!ensure_cards_column("variants", "ALTER TABLE cards ADD COLUMN variants TEXT;")) return false;
        if (!ensure_cards_column("set_total", "ALTER TABLE cards ADD COLUMN set_total TEXT;")) return false;

        if (!exec(create_hashes_table, "create card_hashes table")) return false;
        if (!exec(create_embeddings_table, "create card_embeddings table")) return false;
        if (!exec(create_indexes, "create indexes")) return false;

        return true;
    }

    std::vector<std::string> selectIds(const char* sql) const {
        std::vector<std::string> ids;
        if (!enabled || !db) return ids;

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            std::cerr << "Failed to prepare id query: " << sqlite3_errmsg(db) << std::endl;
            return ids;
        }
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            ids.push_back(columnText(stmt, 0));
        }
        sqlite3_finalize(stmt);
        return ids;
    }

    int selectCount(const char* sql) const {
        if (!enabled || !db) return -1;

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            std::cerr << "Failed to prepare count query: " << sqlite3_errmsg(db) << std::endl;
            return -1;
        }
        int count = -1;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
        return count;
    }
};

// DatabaseManager implementation
DatabaseManager::DatabaseManager(const DatabaseConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
    if (impl_->enabled && !initializeTables()) {
        std::cerr << "DatabaseManager: Failed to initialize tables" << std::endl;
    }
}

DatabaseManager::DatabaseManager(const std::string& db_path, bool enabled)
    : DatabaseManager(enabled ? DatabaseConfig::sqlite(db_path) : DatabaseConfig::disabled()) {
}

DatabaseManager::~DatabaseManager() = default;

bool DatabaseManager::isEnabled() const {
    return impl_->enabled && impl_->db != nullptr;
}

bool DatabaseManager::optimizeForBulkOperations() const {
    if (!isEnabled()) return true; // Success if disabled

    const char* optimizations[] = {
        "PRAGMA journal_mode = WAL;",
        "PRAGMA synchronous = NORMAL;",
        "PRAGMA cache_size = 10000;",
        "PRAGMA temp_store = MEMORY;",
        "PRAGMA mmap_size = 268435456;"
    };

    for (const char* pragma : optimizations) {
        if (!impl_->exec(pragma, std::string("apply optimization ") + pragma)) {
            return false;
        }
    }
    return true;
}

bool DatabaseManager::initializeTables() const {
    return impl_->initializeTables();
}

// ---------------------------------------------------------------------------
// Cards
// ---------------------------------------------------------------------------

bool DatabaseManager::upsertCards(const std::vector<Card>& cards) const {
    if (!isEnabled()) return false;
    if (cards.empty()) return true;

    // ON CONFLICT keeps cached enrichment columns intact across re-imports
    const auto sql = R"(
        INSERT INTO cards (id, name, set_id, set_name, series, number, rarity,
                           category, hp, types, image_url, local_image_path)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            name = excluded.name,
            set_id = excluded.set_id,
            set_name = excluded.set_name,
            series = excluded.series,
            number = excluded.number,
            rarity = excluded.rarity,
            category = excluded.category,
            hp = excluded.hp,
            types = excluded.types,
            image_url = excluded.image_url,
            local_image_path = excluded.local_image_path
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Failed to prepare card insert statement: " << sqlite3_errmsg(impl_->db) << std::endl;
        return false;
    }

    sqlite3_exec(impl_->db, "BEGIN TRANSACTION", nullptr, nullptr, nullptr);

    bool success = true;
    for (const auto& card : cards) {
        const std::string hp = card.hp ? std::to_string(*card.hp) : std::string();
        const std::string types = joinTypes(card.types);

        sqlite3_bind_text(stmt, 1, card.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, card.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, card.set_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, card.set_name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, card.series.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 6, card.number.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 7, card.rarity.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 8, card.category.c_str(), -1, SQLITE_TRANSIENT);
        if (card.hp) {
            sqlite3_bind_text(stmt, 9, hp.c_str(), -1, SQLITE_TRANSIENT);
        } else {
            sqlite3_bind_null(stmt, 9);
        }
        sqlite3_bind_text(stmt, 10, types.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 11, card.image_url.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 12, card.local_image_path.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            std::cerr << "Failed to insert card " << card.id << ": " << sqlite3_errmsg(impl_->db) << std::endl;
            success = false;
            break;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }

    sqlite3_finalize(stmt);

    if (success) {
        sqlite3_exec(impl_->db, "COMMIT", nullptr, nullptr, nullptr);
    } else {
        sqlite3_exec(impl_->db, "ROLLBACK", nullptr, nullptr, nullptr);
    }
    return success;
}

std::vector<Card> DatabaseManager::getAllCards() const {
    std::vector<Card> cards;
    if (!isEnabled()) return cards;

    const std::string sql = std::string("SELECT ") + kCardColumns + " FROM cards ORDER BY id";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Failed to prepare card select statement: " << sqlite3_errmsg(impl_->db) << std::endl;
        return cards;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        cards.push_back(readCardRow(stmt));
    }
    sqlite3_finalize(stmt);
    return cards;
}

std::optional<Card> DatabaseManager::getCard(const std::string& card_id) const {
    if (!isEnabled()) return std::nullopt;

    const std::string sql = std::string("SELECT ") + kCardColumns + " FROM cards WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Failed to prepare card lookup: " << sqlite3_errmsg(impl_->db) << std::endl;
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, card_id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<Card> card;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        card = readCardRow(stmt);
    }
    sqlite3_finalize(stmt);
    return card;
}

int DatabaseManager::cardCount() const {
    return impl_->selectCount("SELECT COUNT(*) FROM cards");
}

// ---------------------------------------------------------------------------
// Perceptual hashes
// ---------------------------------------------------------------------------

bool DatabaseManager::upsertHashes(const std::vector<HashSignature>& signatures) const {
    if (!isEnabled()) return false;
    if (signatures.empty()) return true;

    const auto sql = R"(
        INSERT OR REPLACE INTO card_hashes (card_id, hash_type, hash_value)
        VALUES (?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Failed to prepare hash insert statement: " << sqlite3_errmsg(impl_->db) << std::endl;
        return false;
    }

    sqlite3_exec(impl_->db, "BEGIN TRANSACTION", nullptr, nullptr, nullptr);

    bool success = true;
    for (const auto& signature : signatures) {
        const std::string tag = hashTypeTag(signature.algorithm, signature.region);
        sqlite3_bind_text(stmt, 1, signature.card_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, tag.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, signature.hex.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            std::cerr << "Failed to insert " << tag << " for " << signature.card_id << ": "
                      << sqlite3_errmsg(impl_->db) << std::endl;
            success = false;
            break;
        }
        sqlite3_reset(stmt);
    }

    sqlite3_finalize(stmt);

    if (success) {
        sqlite3_exec(impl_->db, "COMMIT", nullptr, nullptr, nullptr);
    } else {
        sqlite3_exec(impl_->db, "ROLLBACK", nullptr, nullptr, nullptr);
    }
    return success;
}

std::vector<std::pair<std::string, std::string>> DatabaseManager::getHashes(const std::string& hash_type) const {
    std::vector<std::pair<std::string, std::string>> rows;
    if (!isEnabled()) return rows;

    const auto sql = "SELECT card_id, hash_value FROM card_hashes WHERE hash_type = ? ORDER BY card_id";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Failed to prepare hash select statement: " << sqlite3_errmsg(impl_->db) << std::endl;
        return rows;
    }

    sqlite3_bind_text(stmt, 1, hash_type.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.emplace_back(columnText(stmt, 0), columnText(stmt, 1));
    }
    sqlite3_finalize(stmt);
    return rows;
}

std::vector<HashSignature> DatabaseManager::getAllHashSignatures(HashRegion region) const {
    std::vector<HashSignature> signatures;
    for (const auto algorithm : kAllHashAlgorithms) {
        for (auto& [card_id, hex] : getHashes(hashTypeTag(algorithm, region))) {
            HashSignature signature;
            signature.card_id = std::move(card_id);
            signature.algorithm = algorithm;
            signature.region = region;
            signature.hex = std::move(hex);
            signatures.push_back(std::move(signature));
        }
    }
    return signatures;
}

std::vector<std::string> DatabaseManager::getCardIdsWithoutHashes() const {
    return impl_->selectIds(R"(
        SELECT c.id FROM cards c
        WHERE NOT EXISTS (
            SELECT 1 FROM card_hashes h
            WHERE h.card_id = c.id AND h.hash_type IN ('phash', 'ahash', 'dhash', 'whash')
        )
        ORDER BY c.id
    )");
}

int DatabaseManager::hashCount() const {
    return impl_->selectCount("SELECT COUNT(*) FROM card_hashes");
}

bool DatabaseManager::clearHashes() const {
    if (!isEnabled()) return false;
    return impl_->exec("DELETE FROM card_hashes;", "clear card_hashes");
}

// ---------------------------------------------------------------------------
// Embeddings
// ---------------------------------------------------------------------------

bool DatabaseManager::upsertEmbeddings(const std::vector<EmbeddingVector>& embeddings) const {
    if (!isEnabled()) return false;
    if (embeddings.empty()) return true;

    const auto sql = "INSERT OR REPLACE INTO card_embeddings (card_id, embedding) VALUES (?, ?)";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Failed to prepare embedding insert statement: " << sqlite3_errmsg(impl_->db) << std::endl;
        return false;
    }

    sqlite3_exec(impl_->db, "BEGIN TRANSACTION", nullptr, nullptr, nullptr);

    bool success = true;
    for (const auto& embedding : embeddings) {
        const std::vector<uint8_t> blob = encodeEmbeddingBlob(embedding.values);
        sqlite3_bind_text(stmt, 1, embedding.card_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_blob(stmt, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            std::cerr << "Failed to insert embedding for " << embedding.card_id << ": "
                      << sqlite3_errmsg(impl_->db) << std::endl;
            success = false;
            break;
        }
        sqlite3_reset(stmt);
    }

    sqlite3_finalize(stmt);

    if (success) {
        sqlite3_exec(impl_->db, "COMMIT", nullptr, nullptr, nullptr);
    } else {
        sqlite3_exec(impl_->db, "ROLLBACK", nullptr, nullptr, nullptr);
    }
    return success;
}

std::vector<EmbeddingVector> DatabaseManager::getAllEmbeddings() const {
    std::vector<EmbeddingVector> embeddings;
    if (!isEnabled()) return embeddings;

    const auto sql = "SELECT card_id, embedding FROM card_embeddings ORDER BY card_id";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Failed to prepare embedding select statement: " << sqlite3_errmsg(impl_->db) << std::endl;
        return embeddings;
    }

    int skipped = 0;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const void* blob_data = sqlite3_column_blob(stmt, 1);
        const int blob_size = sqlite3_column_bytes(stmt, 1);
        auto values = decodeEmbeddingBlob(blob_data, blob_size > 0 ? static_cast<size_t>(blob_size) : 0);
        if (!values) {
            ++skipped;
            continue;
        }

        EmbeddingVector embedding;
        embedding.card_id = columnText(stmt, 0);
        embedding.values = std::move(*values);
        embeddings.push_back(std::move(embedding));
    }
    sqlite3_finalize(stmt);

    if (skipped > 0) {
        std::cerr << "Skipped " << skipped << " malformed embedding blobs" << std::endl;
    }
    return embeddings;
}

std::vector<std::string> DatabaseManager::getCardIdsWithoutEmbeddings() const {
    return impl_->selectIds(R"(
        SELECT c.id FROM cards c
        LEFT JOIN card_embeddings e ON e.card_id = c.id
        WHERE e.card_id IS NULL
        ORDER BY c.id
    )");
}

int DatabaseManager::embeddingCount() const {
    return impl_->selectCount("SELECT COUNT(*) FROM card_embeddings");
}

bool DatabaseManager::clearEmbeddings() const {
    if (!isEnabled()) return false;
    return impl_->exec("DELETE FROM card_embeddings;", "clear card_embeddings");
}

// ---------------------------------------------------------------------------
// Enrichment cache
// ---------------------------------------------------------------------------

std::optional<CardDetails> DatabaseManager::getCachedDetails(const std::string& card_id) const {
    if (!isEnabled()) return std::nullopt;

    const auto sql = "SELECT variants, set_total FROM cards WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Failed to prepare details lookup: " << sqlite3_errmsg(impl_->db) << std::endl;
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, card_id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<CardDetails> details;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const bool has_variants = sqlite3_column_type(stmt, 0) != SQLITE_NULL;
        const bool has_total = sqlite3_column_type(stmt, 1) != SQLITE_NULL;
        if (has_variants || has_total) {
            CardDetails cached;
            if (has_variants) {
                cached.variants = decodeVariants(columnText(stmt, 0));
            }
            if (has_total) {
                cached.set_total = parseOptionalInt(columnText(stmt, 1));
            }
            details = cached;
        }
    }
    sqlite3_finalize(stmt);
    return details;
}

bool DatabaseManager::storeDetails(const std::string& card_id, const CardDetails& details) const {
    if (!isEnabled()) return false;

    const auto sql = R"(
        UPDATE cards
        SET variants = COALESCE(?, variants),
            set_total = COALESCE(?, set_total)
        WHERE id = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Failed to prepare details update: " << sqlite3_errmsg(impl_->db) << std::endl;
        return false;
    }

    const std::string variants = details.variants ? encodeVariants(*details.variants) : std::string();
    const std::string total = details.set_total ? std::to_string(*details.set_total) : std::string();

    if (details.variants) {
        sqlite3_bind_text(stmt, 1, variants.c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 1);
    }
    if (details.set_total) {
        sqlite3_bind_text(stmt, 2, total.c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 2);
    }
    sqlite3_bind_text(stmt, 3, card_id.c_str(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        std::cerr << "Failed to store details for " << card_id << ": " << sqlite3_errmsg(impl_->db) << std::endl;
        return false;
    }
    return sqlite3_changes(impl_->db) > 0;
}

std::map<std::string, int> DatabaseManager::getStatistics() const {
    std::map<std::string, int> stats;
    if (!isEnabled()) return stats;

    stats["cards"] = cardCount();
    stats["card_hashes"] = hashCount();
    stats["card_embeddings"] = embeddingCount();
    stats["cards_without_hashes"] = static_cast<int>(getCardIdsWithoutHashes().size());
    stats["cards_without_embeddings"] = static_cast<int>(getCardIdsWithoutEmbeddings().size());
    stats["cards_with_details"] = impl_->selectCount(
        "SELECT COUNT(*) FROM cards WHERE variants IS NOT NULL OR set_total IS NOT NULL");
    return stats;
}

// ---------------------------------------------------------------------------
// Variant encoding
// ---------------------------------------------------------------------------

std::vector<uint8_t> encodeEmbeddingBlob(const std::vector<float>& values) {
    std::vector<uint8_t> blob(values.size() * sizeof(float));
    if (!values.empty()) {
        std::memcpy(blob.data(), values.data(), blob.size());
    }
    return blob;
}

std::optional<std::vector<float>> decodeEmbeddingBlob(const void* data, size_t size) {
    if (!data || size == 0 || size % sizeof(float) != 0) {
        return std::nullopt;
    }
    std::vector<float> values(size / sizeof(float));
    std::memcpy(values.data(), data, size);
    return values;
}

std::string encodeVariants(const CardVariants& variants) {
    std::vector<std::string> flags;
    if (variants.normal) flags.emplace_back("normal");
    if (variants.reverse) flags.emplace_back("reverse");
    if (variants.holo) flags.emplace_back("holo");
    if (variants.first_edition) flags.emplace_back("firstEdition");
    if (variants.w_promo) flags.emplace_back("wPromo");
    return joinTypes(flags);
}

CardVariants decodeVariants(const std::string& encoded) {
    CardVariants variants;
    for (const auto& flag : splitTypes(encoded)) {
        if (flag == "normal") variants.normal = true;
        else if (flag == "reverse") variants.reverse = true;
        else if (flag == "holo") variants.holo = true;
        else if (flag == "firstEdition") variants.first_edition = true;
        else if (flag == "wPromo") variants.w_promo = true;
    }
    return variants;
}

} // namespace card_identifier::database
