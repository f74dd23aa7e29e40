#include "BatchIdentifier.hpp"
#include "card_identifier/logging.hpp"
#include "src/core/embedding/QueryAugmentation.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <thread>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace card_identifier::batch {

namespace {

bool cancelled(const std::atomic<bool>* cancel) {
    return cancel && cancel->load(std::memory_order_relaxed);
}

// Decoder failures must not escape the parallel region
cv::Mat readScan(const std::string& path) {
    try {
        return cv::imread(path, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        LOG_WARNING("Decoder failed on " + path + ": " + e.what());
        return {};
    }
}

} // namespace

BatchIdentifier::BatchIdentifier(const matching::CardMatcher& matcher, const PerformanceParams& performance)
    : matcher_(matcher), performance_(performance) {}

int BatchIdentifier::resolveThreads() const {
    int resolved_threads = performance_.num_threads;
    if (resolved_threads <= 0) {
        if (const auto hw_threads = std::thread::hardware_concurrency();
            hw_threads > 0 && hw_threads <= static_cast<unsigned int>(std::numeric_limits<int>::max())) {
            resolved_threads = static_cast<int>(hw_threads);
        } else {
            resolved_threads = 4;
        }
    }
    return resolved_threads;
}

std::vector<ScanResult> BatchIdentifier::runScans(const std::vector<std::string>& scans,
                                                  bool paired,
                                                  const std::atomic<bool>* cancel,
                                                  const ProgressCallback& progress) const {
    return run(ScanPairer::pair(scans, paired), cancel, progress);
}

std::vector<ScanResult> BatchIdentifier::run(const std::vector<ScanPair>& pairs,
                                             const std::atomic<bool>* cancel,
                                             const ProgressCallback& progress) const {
    const std::size_t total = pairs.size();
    std::vector<ScanResult> results(total);
    for (std::size_t i = 0; i < total; ++i) {
        results[i].pair = pairs[i];
    }
    if (total == 0) {
        return results;
    }

#ifdef _OPENMP
    const bool use_parallel = total > 1;
    const int resolved_threads = resolveThreads();
    omp_set_num_threads(resolved_threads);
    LOG_INFO("OpenMP enabled: identifying " + std::to_string(total) +
             " scans with " + std::to_string(resolved_threads) + " threads");
#else
    LOG_WARNING("OpenMP not available - running sequentially");
#endif

    std::vector<matching::QueryState> states(total);
    std::vector<char> prepared(total, 0);

    // Phase 1: read, preprocess, hash and rank
#ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic) if(use_parallel)
#endif
    for (std::size_t i = 0; i < total; ++i) {
        if (cancelled(cancel)) {
            continue;
        }
        const cv::Mat image = readScan(pairs[i].front);
        if (image.empty()) {
            states[i].result.error = "Cannot read image: " + pairs[i].front;
            states[i].finished = true;
        } else {
            states[i] = matcher_.prepare(image);
        }
        prepared[i] = 1;
    }

    // Phase 2: batched embedding of ambiguous queries
    std::vector<std::size_t> pending;
    for (std::size_t i = 0; i < total; ++i) {
        if (prepared[i] && matcher_.needsEmbedding(states[i])) {
            pending.push_back(i);
        }
    }

    std::vector<std::vector<float>> embeddings(total);
    const std::size_t chunk_size = static_cast<std::size_t>(std::max(1, performance_.embedding_batch_size));
    for (std::size_t start = 0; start < pending.size(); start += chunk_size) {
        if (cancelled(cancel)) {
            LOG_INFO("Batch cancelled during embedding stage");
            break;
        }
        const auto end = std::min(pending.size(), start + chunk_size);
        const std::vector<std::size_t> chunk(pending.begin() + static_cast<std::ptrdiff_t>(start),
                                             pending.begin() + static_cast<std::ptrdiff_t>(end));
        embedChunk(chunk, states, embeddings);
    }

    // Phase 3: finalize
    std::size_t completed = 0;
#ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic) if(use_parallel)
#endif
    for (std::size_t i = 0; i < total; ++i) {
        if (!prepared[i] || cancelled(cancel)) {
            continue;
        }
        auto& state = states[i];
        if (state.finished) {
            results[i].result = std::move(state.result);
        } else if (!embeddings[i].empty()) {
            results[i].result = matcher_.finalizeWithEmbedding(std::move(state), embeddings[i]);
        } else {
            results[i].result = matcher_.finalizeWithoutEmbedding(std::move(state));
        }
        results[i].processed = true;

#ifdef _OPENMP
        #pragma omp critical(batch_progress)
#endif
        {
            ++completed;
            if (progress) {
                progress(completed, total);
            }
        }
    }

    return results;
}

void BatchIdentifier::embedChunk(const std::vector<std::size_t>& chunk,
                                 const std::vector<matching::QueryState>& states,
                                 std::vector<std::vector<float>>& embeddings) const {
    const auto& model = matcher_.model();
    if (!model) {
        return;
    }

    std::vector<cv::Mat> crops;
    std::vector<std::size_t> crop_counts;
    crop_counts.reserve(chunk.size());
    for (const auto index : chunk) {
        auto query_crops = matcher_.queryCrops(states[index].card);
        crop_counts.push_back(query_crops.size());
        for (auto& crop : query_crops) {
            crops.push_back(std::move(crop));
        }
    }

    try {
        const auto vectors = model->computeEmbeddings(crops);
        if (vectors.size() != crops.size()) {
            throw std::runtime_error("model returned " + std::to_string(vectors.size()) +
                                     " embeddings for " + std::to_string(crops.size()) + " crops");
        }

        std::size_t offset = 0;
        for (std::size_t k = 0; k < chunk.size(); ++k) {
            const std::vector<std::vector<float>> per_query(
                vectors.begin() + static_cast<std::ptrdiff_t>(offset),
                vectors.begin() + static_cast<std::ptrdiff_t>(offset + crop_counts[k]));
            offset += crop_counts[k];
            embeddings[chunk[k]] = embedding::QueryAugmentation::averageEmbeddings(per_query);
        }
    } catch (const std::exception& e) {
        LOG_WARNING("Embedding batch of " + std::to_string(chunk.size()) +
                    " queries failed, falling back to hash results: " + e.what());
        for (const auto index : chunk) {
            embeddings[index].clear();
        }
    }
}

} // namespace card_identifier::batch
