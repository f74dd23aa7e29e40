#pragma once

#include "interfaces/ICatalogClient.hpp"
#include "interfaces/IEmbeddingModel.hpp"
#include "src/core/config/IdentifierConfig.hpp"
#include "card_identifier/types.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace card_identifier::test {

/**
 * @brief Embedding model double: fixed output, call counting, optional failure
 */
class StubEmbeddingModel : public IEmbeddingModel {
public:
    explicit StubEmbeddingModel(int dimension = 4) : dimension_(dimension), output_(dimension, 0.0f) {
        if (dimension > 0) output_[0] = 1.0f;
    }

    std::vector<float> computeEmbedding(const cv::Mat& image) override {
        return computeEmbeddings({image}).front();
    }

    std::vector<std::vector<float>> computeEmbeddings(const std::vector<cv::Mat>& images) override {
        ++batch_calls;
        image_count += images.size();
        if (on_batch) {
            on_batch();
        }
        if (fail) {
            throw std::runtime_error("stub model failure");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<std::vector<float>>(images.size(), output_);
    }

    int dimension() const override { return dimension_; }
    std::string name() const override { return "stub"; }

    void setOutput(std::vector<float> output) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = std::move(output);
    }

    std::atomic<int> batch_calls{0};
    std::atomic<size_t> image_count{0};
    std::atomic<bool> fail{false};
    std::function<void()> on_batch;     // runs inside every computeEmbeddings call

private:
    int dimension_;
    std::mutex mutex_;
    std::vector<float> output_;
};

/**
 * @brief Catalog client double backed by a map, with optional latency
 */
class StubCatalogClient : public ICatalogClient {
public:
    std::optional<CardDetails> fetchCardDetails(const std::string& card_id) override {
        ++fetches;
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (fail) {
            throw std::runtime_error("catalog unreachable");
        }
        const auto it = details.find(card_id);
        if (it == details.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::string name() const override { return "stub_catalog"; }

    std::map<std::string, CardDetails> details;
    std::chrono::milliseconds delay{0};
    std::atomic<int> fetches{0};
    std::atomic<bool> fail{false};
};

inline Card makeCard(const std::string& id, const std::string& set_id, const std::string& name = "") {
    Card card;
    card.id = id;
    card.set_id = set_id;
    card.name = name.empty() ? "Card " + id : name;
    return card;
}

inline HashSignature makeSignature(const std::string& card_id, HashAlgorithm algorithm,
                                   const std::string& hex, HashRegion region = HashRegion::FULL_CARD) {
    HashSignature signature;
    signature.card_id = card_id;
    signature.algorithm = algorithm;
    signature.region = region;
    signature.hex = hex;
    return signature;
}

/**
 * @brief 16-bit pHash-only configuration with no excluded sets
 */
inline config::IdentifierConfig smallHashConfig() {
    config::IdentifierConfig config;
    config.hashing.hash_size = 4;
    config.hashing.weights = {1.0, 0.0, 0.0, 0.0};
    config.matching.excluded_set_prefixes.clear();
    config.matching.hash_high_threshold = 3.0;
    config.matching.hash_medium_threshold = 8.0;
    config.matching.min_margin = 2.0;
    config.embedding.dimension = 4;
    config.embedding.tta_crops = 2;
    return config;
}

} // namespace card_identifier::test
