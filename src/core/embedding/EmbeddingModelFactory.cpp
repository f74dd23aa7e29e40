// EmbeddingModelFactory.cpp
#include "EmbeddingModelFactory.hpp"
#include "LibTorchEmbeddingModel.hpp"
#include "card_identifier/logging.hpp"

namespace card_identifier {
namespace embedding {

std::shared_ptr<IEmbeddingModel> EmbeddingModelFactory::create(const EmbeddingParams& params) {
    if (params.model_path.empty()) {
        LOG_WARNING("No embedding model configured; matching runs on perceptual hashes only");
        return nullptr;
    }
    try {
        return std::make_shared<LibTorchEmbeddingModel>(params.model_path, params.input_size,
                                                        params.dimension, params.device);
    } catch (const std::exception& e) {
        LOG_WARNING(std::string("Embedding model unavailable (") + e.what() + "); matching runs on perceptual hashes only");
        return nullptr;
    }
}

} // namespace embedding
} // namespace card_identifier
