#include <gtest/gtest.h>
#include "src/core/embedding/EmbeddingModelFactory.hpp"
#include "interfaces/IEmbeddingModel.hpp"

using card_identifier::EmbeddingParams;
using card_identifier::embedding::EmbeddingModelFactory;

TEST(EmbeddingModelFactoryTest, NoModelPathMeansHashOnly) {
    EXPECT_EQ(EmbeddingModelFactory::create(EmbeddingParams{}), nullptr);
}

TEST(EmbeddingModelFactoryTest, UnloadableModelMeansHashOnly) {
    EmbeddingParams params;
    params.model_path = "models/does_not_exist.pt";
    params.device = "cpu";
    EXPECT_EQ(EmbeddingModelFactory::create(params), nullptr);
}
