#pragma once

#include "card_identifier/types.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace card_identifier::index {

struct EmbeddingHit {
    std::string card_id;
    double distance = 0.0;
};

/**
 * @brief Dense matrix of reference embeddings, one row per card
 *
 * Rows are kept in card id order so equal distances come out id-ascending.
 * Cosine distance is 1 - cos(query, row); zero-norm rows get distance 1.
 */
class EmbeddingIndex {
public:
    EmbeddingIndex() = default;

    /**
     * @brief Build the index; vectors whose length differs from dimension are skipped with a warning
     */
    static EmbeddingIndex fromVectors(int dimension, EmbeddingMetric metric,
                                      const std::vector<EmbeddingVector>& vectors);

    /**
     * @brief Distance to every stored vector, ascending
     * @throws std::invalid_argument if the query length differs from dimension()
     */
    std::vector<EmbeddingHit> lookup(const std::vector<float>& query) const;

    /**
     * @brief Distance to the listed cards only; ids without a stored vector are ignored
     */
    std::vector<EmbeddingHit> lookupSubset(const std::vector<float>& query,
                                           const std::vector<std::string>& card_ids) const;

    bool contains(const std::string& card_id) const { return row_of_.count(card_id) > 0; }
    size_t size() const { return card_ids_.size(); }
    bool empty() const { return card_ids_.empty(); }
    int dimension() const { return dimension_; }
    EmbeddingMetric metric() const { return metric_; }

private:
    double distanceToRow(const cv::Mat& query, double query_norm, size_t row) const;
    cv::Mat prepareQuery(const std::vector<float>& query, double& norm) const;

    int dimension_ = 0;
    EmbeddingMetric metric_ = EmbeddingMetric::COSINE;
    cv::Mat matrix_;                 // N x D, CV_32F
    std::vector<double> norms_;
    std::vector<std::string> card_ids_;
    std::unordered_map<std::string, size_t> row_of_;
};

} // namespace card_identifier::index
