#pragma once

#include "src/core/hashing/Fingerprint.hpp"
#include "src/core/hashing/PerceptualHasher.hpp"
#include "card_identifier/types.hpp"
#include <array>
#include <string>
#include <unordered_map>
#include <vector>

namespace card_identifier::index {

struct HashHit {
    std::string card_id;
    int distance = 0;
};

struct ScoredCard {
    std::string card_id;
    double score = 0.0;
};

/**
 * @brief In-memory perceptual hash index for one card region
 *
 * Holds a packed fingerprint table per algorithm, rows sorted by card id.
 * Immutable after construction; concurrent lookups need no locking.
 * Lookups are exhaustive scans ordered by ascending distance with ties
 * broken by card id ascending.
 */
class HashIndex {
public:
    HashIndex() = default;

    /**
     * @brief Build an index from stored signatures
     *
     * Rows whose width differs from hash_size^2 bits or whose hex is malformed
     * are dropped with a warning. A repeated (card, algorithm) keeps the last row.
     * The region of each signature is not inspected; pass one region at a time.
     */
    static HashIndex fromSignatures(int hash_size, const std::vector<HashSignature>& signatures);

    /**
     * @brief Hamming distance from the query to every stored fingerprint of one algorithm
     * @throws std::invalid_argument if the query width does not match the index
     */
    std::vector<HashHit> lookup(HashAlgorithm algorithm, const hashing::Fingerprint& query) const;

    /**
     * @brief Closest other cards to a stored card under one algorithm
     *
     * Diagnostic entry behind `card_index_manager nearest`: shows which
     * references collide with a card. Empty when the card has no row.
     */
    std::vector<HashHit> neighbours(const std::string& card_id, HashAlgorithm algorithm, size_t count) const;

    /**
     * @brief Weighted-average Hamming ranking across algorithms
     *
     * Uses the algorithms with a positive weight and a non-empty query
     * fingerprint. Cards missing any of those algorithms are left out.
     */
    std::vector<ScoredCard> combinedRanking(const hashing::FingerprintSet& query,
                                            const std::array<double, kHashAlgorithmCount>& weights) const;

    bool contains(const std::string& card_id, HashAlgorithm algorithm) const;

    /**
     * @brief Number of distinct cards holding at least one fingerprint
     */
    size_t size() const { return card_count_; }
    bool empty() const { return card_count_ == 0; }
    size_t rowCount(HashAlgorithm algorithm) const { return tables_[algorithmIndex(algorithm)].card_ids.size(); }
    int fingerprintBits() const { return bits_; }

private:
    struct Table {
        std::vector<std::string> card_ids;
        std::vector<uint8_t> data;                        // rows * bytes_per_row
        std::unordered_map<std::string, size_t> row_of;
    };

    const uint8_t* row(const Table& table, size_t index) const {
        return table.data.data() + index * bytes_per_row_;
    }

    void checkQuery(const hashing::Fingerprint& query) const;

    int bits_ = 0;
    size_t bytes_per_row_ = 0;
    size_t card_count_ = 0;
    std::array<Table, kHashAlgorithmCount> tables_;
};

} // namespace card_identifier::index
