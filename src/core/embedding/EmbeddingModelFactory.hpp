// EmbeddingModelFactory.hpp
#pragma once

#include <memory>
#include "card_identifier/types.hpp"

namespace card_identifier {
    class IEmbeddingModel;

    namespace embedding {
        // Keeps torch headers out of callers
        class EmbeddingModelFactory {
        public:
            /**
             * @brief Load the configured embedding model
             * @return nullptr (with a warning) when no model path is set or loading fails;
             *         callers then run hash-only
             */
            static std::shared_ptr<IEmbeddingModel> create(const EmbeddingParams& params);
        };
    }
}
