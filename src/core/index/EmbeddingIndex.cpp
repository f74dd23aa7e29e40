#include "EmbeddingIndex.hpp"
#include "card_identifier/logging.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>

namespace card_identifier::index {

namespace {

void sortHits(std::vector<EmbeddingHit>& hits) {
    std::sort(hits.begin(), hits.end(), [](const EmbeddingHit& a, const EmbeddingHit& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        return a.card_id < b.card_id;
    });
}

} // namespace

EmbeddingIndex EmbeddingIndex::fromVectors(int dimension, EmbeddingMetric metric,
                                           const std::vector<EmbeddingVector>& vectors) {
    if (dimension <= 0) {
        throw std::invalid_argument("Embedding dimension must be positive, got " + std::to_string(dimension));
    }

    EmbeddingIndex index;
    index.dimension_ = dimension;
    index.metric_ = metric;

    std::map<std::string, const std::vector<float>*> sorted;
    int skipped = 0;
    for (const auto& vector : vectors) {
        if (static_cast<int>(vector.values.size()) != dimension) {
            ++skipped;
            continue;
        }
        sorted[vector.card_id] = &vector.values;
    }
    if (skipped > 0) {
        LOG_WARNING("EmbeddingIndex: skipped " + std::to_string(skipped) +
                    " vectors whose length is not " + std::to_string(dimension));
    }

    index.matrix_ = cv::Mat(static_cast<int>(sorted.size()), dimension, CV_32F);
    index.norms_.reserve(sorted.size());
    index.card_ids_.reserve(sorted.size());

    int r = 0;
    for (const auto& [card_id, values] : sorted) {
        cv::Mat row = index.matrix_.row(r);
        std::copy(values->begin(), values->end(), row.ptr<float>());
        index.norms_.push_back(cv::norm(row, cv::NORM_L2));
        index.row_of_.emplace(card_id, index.card_ids_.size());
        index.card_ids_.push_back(card_id);
        ++r;
    }
    return index;
}

cv::Mat EmbeddingIndex::prepareQuery(const std::vector<float>& query, double& norm) const {
    if (static_cast<int>(query.size()) != dimension_) {
        throw std::invalid_argument("Query embedding has " + std::to_string(query.size()) +
                                    " values, index expects " + std::to_string(dimension_));
    }
    cv::Mat q(1, dimension_, CV_32F);
    std::copy(query.begin(), query.end(), q.ptr<float>());
    norm = cv::norm(q, cv::NORM_L2);
    return q;
}

double EmbeddingIndex::distanceToRow(const cv::Mat& query, double query_norm, size_t row) const {
    const cv::Mat stored = matrix_.row(static_cast<int>(row));
    if (metric_ == EmbeddingMetric::EUCLIDEAN) {
        return cv::norm(query, stored, cv::NORM_L2);
    }
    const double denom = query_norm * norms_[row];
    if (denom <= 0.0) {
        return 1.0;
    }
    return 1.0 - query.dot(stored) / denom;
}

std::vector<EmbeddingHit> EmbeddingIndex::lookup(const std::vector<float>& query) const {
    std::vector<EmbeddingHit> hits;
    if (empty()) {
        return hits;
    }
    double query_norm = 0.0;
    const cv::Mat q = prepareQuery(query, query_norm);

    hits.reserve(card_ids_.size());
    for (size_t i = 0; i < card_ids_.size(); ++i) {
        hits.push_back({card_ids_[i], distanceToRow(q, query_norm, i)});
    }
    sortHits(hits);
    return hits;
}

std::vector<EmbeddingHit> EmbeddingIndex::lookupSubset(const std::vector<float>& query,
                                                       const std::vector<std::string>& card_ids) const {
    std::vector<EmbeddingHit> hits;
    if (empty() || card_ids.empty()) {
        return hits;
    }
    double query_norm = 0.0;
    const cv::Mat q = prepareQuery(query, query_norm);

    hits.reserve(card_ids.size());
    for (const auto& card_id : card_ids) {
        const auto it = row_of_.find(card_id);
        if (it == row_of_.end()) continue;
        hits.push_back({card_id, distanceToRow(q, query_norm, it->second)});
    }
    sortHits(hits);
    return hits;
}

} // namespace card_identifier::index
