#pragma once

#include "ScanPairer.hpp"
#include "src/core/matching/CardMatcher.hpp"
#include <atomic>
#include <functional>
#include <vector>

namespace card_identifier::batch {

struct ScanResult {
    ScanPair pair;
    MatchResult result;
    bool processed = false;      // false when cancelled before completion
};

/**
 * @brief Called after each completed scan with (completed, total); calls are serialized
 */
using ProgressCallback = std::function<void(std::size_t, std::size_t)>;

/**
 * @brief Identifies many scans, batching embedding inference across queries
 *
 * Phase 1 reads, preprocesses, hashes and ranks every front scan in
 * parallel. Phase 2 embeds the queries that need it, embedding_batch_size
 * queries per model call. Phase 3 finalizes in parallel. Results are
 * indexed by scan id, never by completion order.
 */
class BatchIdentifier {
public:
    BatchIdentifier(const matching::CardMatcher& matcher, const PerformanceParams& performance);

    /**
     * @param cancel Checked before each item and each embedding chunk; may be null
     */
    std::vector<ScanResult> run(const std::vector<ScanPair>& pairs,
                                const std::atomic<bool>* cancel = nullptr,
                                const ProgressCallback& progress = {}) const;

    /**
     * @brief Pair the scans, then run
     * @throws BatchSizeError in paired mode with an odd count
     */
    std::vector<ScanResult> runScans(const std::vector<std::string>& scans,
                                     bool paired,
                                     const std::atomic<bool>* cancel = nullptr,
                                     const ProgressCallback& progress = {}) const;

private:
    void embedChunk(const std::vector<std::size_t>& chunk,
                    const std::vector<matching::QueryState>& states,
                    std::vector<std::vector<float>>& embeddings) const;

    int resolveThreads() const;

    const matching::CardMatcher& matcher_;
    PerformanceParams performance_;
};

} // namespace card_identifier::batch
