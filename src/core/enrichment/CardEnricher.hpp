#pragma once

#include "card_identifier/database/DatabaseManager.hpp"
#include "card_identifier/types.hpp"
#include "interfaces/ICatalogClient.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace card_identifier::enrichment {

/**
 * @brief Lazy, process-wide cache of per-card details
 *
 * Lookup order: memory, then the store's cached columns, then the catalog
 * client. A successful fetch is written back to the store when persisting
 * is enabled. Each id is resolved at most once, also under concurrent
 * callers; a failed fetch is remembered as "no details" and not retried
 * until invalidated.
 */
class CardEnricher {
public:
    /**
     * @param client Source of details; may be null (store cache only)
     * @param store Persistent cache; may be null or disabled
     */
    CardEnricher(std::shared_ptr<ICatalogClient> client,
                 const database::DatabaseManager* store = nullptr,
                 bool persist = true);

    /**
     * @brief Details for one card, resolving them on first use
     * @return std::nullopt when no source knows the card
     */
    std::optional<CardDetails> details(const std::string& card_id);

    /**
     * @brief Forget one card so the next call resolves it again
     */
    void invalidate(const std::string& card_id);

    void clear();

    /**
     * @brief Ids resolved (or being resolved) in memory
     */
    size_t cachedCount() const;

    /**
     * @brief Number of calls made to the catalog client
     */
    size_t fetchCount() const { return fetch_count_.load(); }

private:
    struct Entry {
        std::once_flag once;
        std::optional<CardDetails> details;
    };

    std::shared_ptr<Entry> entryFor(const std::string& card_id);
    std::optional<CardDetails> resolve(const std::string& card_id);

    std::shared_ptr<ICatalogClient> client_;
    const database::DatabaseManager* store_;
    bool persist_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    std::atomic<size_t> fetch_count_{0};
};

} // namespace card_identifier::enrichment
