#ifndef CARD_IDENTIFIER_DATABASE_MANAGER_HPP
#define CARD_IDENTIFIER_DATABASE_MANAGER_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "card_identifier/types.hpp"

namespace card_identifier {
namespace database {

// Forward declarations
struct DatabaseConfig;

/**
 * @brief Reference card store backed by SQLite
 *
 * Holds the catalog (cards), the perceptual hash rows (card_hashes), the
 * embedding blobs (card_embeddings) and cached enrichment details. All
 * methods are safe to call on a disabled store - reads return empty results
 * and writes return false.
 */
class DatabaseManager {
public:
    /**
     * @brief Construct database manager
     * @param config Database configuration (path, enabled flag)
     */
    explicit DatabaseManager(const DatabaseConfig& config);

    /**
     * @brief Construct with simple parameters
     * @param db_path Path to SQLite database file
     * @param enabled Whether the store is enabled
     */
    DatabaseManager(const std::string& db_path, bool enabled = false);

    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;
    DatabaseManager(DatabaseManager&&) = default;
    DatabaseManager& operator=(DatabaseManager&&) = default;

    /**
     * @brief Check if the store is enabled and the connection is open
     */
    bool isEnabled() const;

    /**
     * @brief Apply PRAGMA settings suited to bulk index builds
     * @return true if optimizations were applied (or store disabled)
     */
    bool optimizeForBulkOperations() const;

    /**
     * @brief Create tables and run column migrations (safe to call multiple times)
     * @return true if successful or disabled
     */
    [[nodiscard]] bool initializeTables() const;

    // ---------------------------------------------------------------
    // Cards
    // ---------------------------------------------------------------

    /**
     * @brief Insert or replace catalog cards in one transaction
     * @return true if every row was written
     */
    bool upsertCards(const std::vector<Card>& cards) const;

    /**
     * @brief All catalog cards ordered by id
     */
    std::vector<Card> getAllCards() const;

    /**
     * @brief Single card lookup
     */
    std::optional<Card> getCard(const std::string& card_id) const;

    /**
     * @return number of cards, or -1 if disabled/error
     */
    int cardCount() const;

    // ---------------------------------------------------------------
    // Perceptual hashes
    // ---------------------------------------------------------------

    /**
     * @brief Insert or replace fingerprint rows in one transaction
     * @return true if every row was written
     */
    bool upsertHashes(const std::vector<HashSignature>& signatures) const;

    /**
     * @brief Fingerprint rows for one storage tag ("phash", "phash_art", ...)
     * @return (card_id, hex) pairs ordered by card id
     */
    std::vector<std::pair<std::string, std::string>> getHashes(const std::string& hash_type) const;

    /**
     * @brief Every fingerprint row for a region
     */
    std::vector<HashSignature> getAllHashSignatures(HashRegion region) const;

    /**
     * @brief Ids of cards that have no full-card fingerprint of any kind
     */
    std::vector<std::string> getCardIdsWithoutHashes() const;

    /**
     * @return number of fingerprint rows, or -1 if disabled/error
     */
    int hashCount() const;

    bool clearHashes() const;

    // ---------------------------------------------------------------
    // Embeddings
    // ---------------------------------------------------------------

    /**
     * @brief Insert or replace embedding blobs (float32) in one transaction
     * @return true if every row was written
     */
    bool upsertEmbeddings(const std::vector<EmbeddingVector>& embeddings) const;

    /**
     * @brief All stored embeddings ordered by card id
     *
     * Blobs whose byte length is not a multiple of sizeof(float) are skipped.
     * Dimension checks are left to the embedding index.
     */
    std::vector<EmbeddingVector> getAllEmbeddings() const;

    std::vector<std::string> getCardIdsWithoutEmbeddings() const;

    /**
     * @return number of embedding rows, or -1 if disabled/error
     */
    int embeddingCount() const;

    bool clearEmbeddings() const;

    // ---------------------------------------------------------------
    // Enrichment cache
    // ---------------------------------------------------------------

    /**
     * @brief Details previously written with storeDetails
     * @return std::nullopt if the card has no cached variants and no set total
     */
    std::optional<CardDetails> getCachedDetails(const std::string& card_id) const;

    /**
     * @brief Persist enrichment details on the card row
     */
    bool storeDetails(const std::string& card_id, const CardDetails& details) const;

    /**
     * @brief Row counts per table
     */
    std::map<std::string, int> getStatistics() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Configuration for database connection
 */
struct DatabaseConfig {
    std::string connection_string;
    bool enabled = false;

    static DatabaseConfig disabled() {
        return DatabaseConfig{};
    }

    static DatabaseConfig sqlite(const std::string& path) {
        DatabaseConfig config;
        config.connection_string = path;
        config.enabled = true;
        return config;
    }
};

/**
 * @brief Raw float32 bytes (host byte order) as stored in card_embeddings.embedding
 */
std::vector<uint8_t> encodeEmbeddingBlob(const std::vector<float>& values);

/**
 * @brief Inverse of encodeEmbeddingBlob
 * @return std::nullopt for a null/empty blob or a length that is not a multiple of 4
 */
std::optional<std::vector<float>> decodeEmbeddingBlob(const void* data, size_t size);

/**
 * @brief Encode variant flags as stored in cards.variants ("normal,holo")
 */
std::string encodeVariants(const CardVariants& variants);

/**
 * @brief Inverse of encodeVariants; unknown tokens are ignored
 */
CardVariants decodeVariants(const std::string& encoded);

} // namespace database
} // namespace card_identifier

#endif // CARD_IDENTIFIER_DATABASE_MANAGER_HPP
