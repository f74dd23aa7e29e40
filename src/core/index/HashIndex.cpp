#include "HashIndex.hpp"
#include "card_identifier/logging.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

namespace card_identifier::index {

HashIndex HashIndex::fromSignatures(int hash_size, const std::vector<HashSignature>& signatures) {
    HashIndex index;
    index.bits_ = hash_size * hash_size;
    index.bytes_per_row_ = (static_cast<size_t>(index.bits_) + 7) / 8;

    std::array<std::map<std::string, hashing::Fingerprint>, kHashAlgorithmCount> sorted;
    int dropped = 0;

    for (const auto& signature : signatures) {
        try {
            auto fingerprint = hashing::Fingerprint::fromHex(signature.hex);
            if (fingerprint.bits() != index.bits_) {
                ++dropped;
                continue;
            }
            sorted[algorithmIndex(signature.algorithm)][signature.card_id] = std::move(fingerprint);
        } catch (const std::invalid_argument&) {
            ++dropped;
        }
    }

    if (dropped > 0) {
        LOG_WARNING("HashIndex: dropped " + std::to_string(dropped) +
                    " fingerprints that are malformed or not " + std::to_string(index.bits_) + " bits wide");
    }

    std::set<std::string> distinct_cards;
    for (size_t a = 0; a < kHashAlgorithmCount; ++a) {
        auto& table = index.tables_[a];
        table.card_ids.reserve(sorted[a].size());
        table.data.reserve(sorted[a].size() * index.bytes_per_row_);
        for (const auto& [card_id, fingerprint] : sorted[a]) {
            table.row_of.emplace(card_id, table.card_ids.size());
            table.card_ids.push_back(card_id);
            const auto& bytes = fingerprint.bytes();
            table.data.insert(table.data.end(), bytes.begin(), bytes.end());
            distinct_cards.insert(card_id);
        }
    }
    index.card_count_ = distinct_cards.size();
    return index;
}

void HashIndex::checkQuery(const hashing::Fingerprint& query) const {
    if (query.bits() != bits_) {
        throw std::invalid_argument("Query fingerprint has " + std::to_string(query.bits()) +
                                    " bits, index expects " + std::to_string(bits_));
    }
}

std::vector<HashHit> HashIndex::lookup(HashAlgorithm algorithm, const hashing::Fingerprint& query) const {
    const auto& table = tables_[algorithmIndex(algorithm)];
    std::vector<HashHit> hits;
    if (table.card_ids.empty()) {
        return hits;
    }
    checkQuery(query);

    hits.reserve(table.card_ids.size());
    const uint8_t* query_bytes = query.bytes().data();
    for (size_t i = 0; i < table.card_ids.size(); ++i) {
        hits.push_back({table.card_ids[i], hashing::hammingDistance(query_bytes, row(table, i), bytes_per_row_)});
    }

    // Rows are already in card id order, so a stable sort keeps the tie-break
    std::stable_sort(hits.begin(), hits.end(), [](const HashHit& a, const HashHit& b) {
        return a.distance < b.distance;
    });
    return hits;
}

std::vector<HashHit> HashIndex::neighbours(const std::string& card_id, HashAlgorithm algorithm, size_t count) const {
    const auto& table = tables_[algorithmIndex(algorithm)];
    const auto it = table.row_of.find(card_id);
    if (it == table.row_of.end()) {
        return {};
    }

    const uint8_t* own = row(table, it->second);
    std::vector<bool> bits(static_cast<size_t>(bits_));
    for (int i = 0; i < bits_; ++i) {
        bits[static_cast<size_t>(i)] = ((own[i / 8] >> (7 - i % 8)) & 1) != 0;
    }

    auto hits = lookup(algorithm, hashing::Fingerprint::fromBits(bits));
    hits.erase(std::remove_if(hits.begin(), hits.end(), [&](const HashHit& hit) { return hit.card_id == card_id; }),
               hits.end());
    if (hits.size() > count) {
        hits.resize(count);
    }
    return hits;
}

std::vector<ScoredCard> HashIndex::combinedRanking(const hashing::FingerprintSet& query,
                                                   const std::array<double, kHashAlgorithmCount>& weights) const {
    std::vector<ScoredCard> ranking;
    if (empty()) {
        return ranking;
    }

    std::vector<size_t> used;
    double weight_total = 0.0;
    for (size_t a = 0; a < kHashAlgorithmCount; ++a) {
        if (weights[a] > 0.0 && !query[a].empty()) {
            checkQuery(query[a]);
            used.push_back(a);
            weight_total += weights[a];
        }
    }

    if (used.empty()) {
        return ranking;
    }

    // Drive the scan from the smallest table; a card must appear in every used table
    const size_t driver = *std::min_element(used.begin(), used.end(), [this](size_t a, size_t b) {
        return tables_[a].card_ids.size() < tables_[b].card_ids.size();
    });
    const auto& driver_table = tables_[driver];
    ranking.reserve(driver_table.card_ids.size());

    for (size_t i = 0; i < driver_table.card_ids.size(); ++i) {
        const std::string& card_id = driver_table.card_ids[i];
        double weighted_sum = 0.0;
        bool complete = true;

        for (const size_t a : used) {
            const auto& table = tables_[a];
            size_t row_index = i;
            if (a != driver) {
                const auto it = table.row_of.find(card_id);
                if (it == table.row_of.end()) {
                    complete = false;
                    break;
                }
                row_index = it->second;
            }
            const int distance = hashing::hammingDistance(query[a].bytes().data(), row(table, row_index), bytes_per_row_);
            weighted_sum += weights[a] * distance;
        }

        if (complete) {
            ranking.push_back({card_id, weighted_sum / weight_total});
        }
    }

    std::stable_sort(ranking.begin(), ranking.end(), [](const ScoredCard& a, const ScoredCard& b) {
        return a.score < b.score;
    });
    return ranking;
}

bool HashIndex::contains(const std::string& card_id, HashAlgorithm algorithm) const {
    const auto& table = tables_[algorithmIndex(algorithm)];
    return table.row_of.find(card_id) != table.row_of.end();
}

} // namespace card_identifier::index
