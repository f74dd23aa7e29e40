#include "CardEnricher.hpp"
#include "card_identifier/logging.hpp"
#include <utility>

namespace card_identifier::enrichment {

CardEnricher::CardEnricher(std::shared_ptr<ICatalogClient> client,
                           const database::DatabaseManager* store,
                           bool persist)
    : client_(std::move(client)), store_(store), persist_(persist) {}

std::shared_ptr<CardEnricher::Entry> CardEnricher::entryFor(const std::string& card_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entries_[card_id];
    if (!entry) {
        entry = std::make_shared<Entry>();
    }
    return entry;
}

std::optional<CardDetails> CardEnricher::details(const std::string& card_id) {
    if (card_id.empty()) {
        return std::nullopt;
    }
    // Callers holding the entry keep it alive across a concurrent invalidate()
    const auto entry = entryFor(card_id);
    std::call_once(entry->once, [&] { entry->details = resolve(card_id); });
    return entry->details;
}

std::optional<CardDetails> CardEnricher::resolve(const std::string& card_id) {
    if (store_ && store_->isEnabled()) {
        if (auto cached = store_->getCachedDetails(card_id)) {
            return cached;
        }
    }

    if (!client_) {
        return std::nullopt;
    }

    std::optional<CardDetails> fetched;
    fetch_count_.fetch_add(1);
    try {
        fetched = client_->fetchCardDetails(card_id);
    } catch (const std::exception& e) {
        LOG_WARNING("Catalog fetch for " + card_id + " via " + client_->name() + " failed: " + e.what());
        return std::nullopt;
    }

    if (!fetched) {
        LOG_DEBUG("No catalog details for " + card_id);
        return std::nullopt;
    }

    if (persist_ && store_ && store_->isEnabled() && !store_->storeDetails(card_id, *fetched)) {
        LOG_WARNING("Could not cache details for " + card_id + " in the card store");
    }
    return fetched;
}

void CardEnricher::invalidate(const std::string& card_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(card_id);
}

void CardEnricher::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t CardEnricher::cachedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace card_identifier::enrichment
