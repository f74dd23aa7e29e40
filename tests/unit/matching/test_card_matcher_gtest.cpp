#include <gtest/gtest.h>
#include "src/core/matching/CardMatcher.hpp"
#include "src/core/index/IndexLoader.hpp"
#include "support/test_doubles.hpp"
#include <opencv2/core.hpp>

using namespace card_identifier;
using card_identifier::test::StubEmbeddingModel;
using card_identifier::test::makeCard;
using card_identifier::test::makeSignature;

namespace {

hashing::FingerprintSet phashQuery(const std::string& hex) {
    hashing::FingerprintSet set;
    set[algorithmIndex(HashAlgorithm::PHASH)] = hashing::Fingerprint::fromHex(hex);
    return set;
}

cv::Mat grayCard() {
    return cv::Mat(84, 60, CV_8UC3, cv::Scalar(90, 110, 130));
}

} // namespace

class CardMatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = test::smallHashConfig();
        model = std::make_shared<StubEmbeddingModel>(4);
    }

    index::ReferenceIndices load(const std::vector<Card>& cards,
                                 const std::vector<HashSignature>& full,
                                 const std::vector<EmbeddingVector>& embeddings = {},
                                 const std::vector<HashSignature>& art = {}) const {
        return index::IndexLoader::build(cards, full, art, embeddings, config);
    }

    // Catalog A 0000, B 0003, C 00FF
    index::ReferenceIndices scenarioIndices(const std::vector<EmbeddingVector>& embeddings = {}) const {
        return load({makeCard("A", "sv1"), makeCard("B", "sv1"), makeCard("C", "sv1")},
                    {makeSignature("A", HashAlgorithm::PHASH, "0000"),
                     makeSignature("B", HashAlgorithm::PHASH, "0003"),
                     makeSignature("C", HashAlgorithm::PHASH, "00FF")},
                    embeddings);
    }

    // A 0000 and B 0001 are one bit apart: never accepted on hashes alone
    index::ReferenceIndices ambiguousIndices(const std::vector<EmbeddingVector>& embeddings) const {
        return load({makeCard("A", "sv1"), makeCard("B", "sv1")},
                    {makeSignature("A", HashAlgorithm::PHASH, "0000"),
                     makeSignature("B", HashAlgorithm::PHASH, "0001")},
                    embeddings);
    }

    config::IdentifierConfig config;
    std::shared_ptr<StubEmbeddingModel> model;
};

TEST_F(CardMatcherTest, ScenarioRanksByHammingAndAcceptsBestAsHigh) {
    const matching::CardMatcher matcher(config, scenarioIndices({{"A", {1, 0, 0, 0}}}), model);
    const auto result = matcher.identifyFingerprints(phashQuery("0000"), std::nullopt, grayCard());

    ASSERT_EQ(result.candidates.size(), 3u);
    EXPECT_EQ(result.candidates[0].card->id, "A");
    EXPECT_DOUBLE_EQ(*result.candidates[0].hash_distance, 0.0);
    EXPECT_EQ(result.candidates[0].tier, ConfidenceTier::HIGH);
    EXPECT_EQ(result.candidates[1].card->id, "B");
    EXPECT_DOUBLE_EQ(*result.candidates[1].hash_distance, 2.0);
    EXPECT_EQ(result.candidates[2].card->id, "C");
    EXPECT_DOUBLE_EQ(*result.candidates[2].hash_distance, 8.0);

    EXPECT_FALSE(result.embedding_used);
    EXPECT_FALSE(result.degraded);
    EXPECT_EQ(model->batch_calls.load(), 0);
    EXPECT_TRUE(result.passedStage(MatchStage::RANKED_BY_HASH));
    EXPECT_FALSE(result.passedStage(MatchStage::EMBEDDED));
    EXPECT_TRUE(result.passedStage(MatchStage::FINAL));
}

TEST_F(CardMatcherTest, SingleNearIdenticalCardNeverInvokesEmbedding) {
    const auto indices = load({makeCard("solo", "sv1")},
                              {makeSignature("solo", HashAlgorithm::PHASH, "0000")},
                              {{"solo", {0, 1, 0, 0}}});
    const matching::CardMatcher matcher(config, indices, model);

    const auto result = matcher.identifyFingerprints(phashQuery("0001"), std::nullopt, grayCard());
    ASSERT_EQ(result.candidates.size(), 1u);
    EXPECT_EQ(result.candidates[0].card->id, "solo");
    EXPECT_EQ(result.candidates[0].tier, ConfidenceTier::HIGH);
    EXPECT_EQ(model->batch_calls.load(), 0);
}

TEST_F(CardMatcherTest, EmptyCatalogYieldsNoCandidates) {
    const matching::CardMatcher matcher(config, load({}, {}), model);

    const auto from_hashes = matcher.identifyFingerprints(phashQuery("0000"));
    EXPECT_TRUE(from_hashes.candidates.empty());
    EXPECT_TRUE(from_hashes.error.empty());

    cv::Mat scan(600, 450, CV_8UC3);
    cv::randu(scan, cv::Scalar::all(0), cv::Scalar::all(255));
    const auto from_image = matcher.identify(scan);
    EXPECT_TRUE(from_image.candidates.empty());
    EXPECT_TRUE(from_image.error.empty());
    EXPECT_EQ(model->batch_calls.load(), 0);
}

TEST_F(CardMatcherTest, NullIndicesBehaveAsEmpty) {
    const matching::CardMatcher matcher(config, index::ReferenceIndices{}, model);
    const auto result = matcher.identifyFingerprints(phashQuery("0000"));
    EXPECT_TRUE(result.candidates.empty());
    EXPECT_FALSE(matcher.embeddingAvailable());
}

TEST_F(CardMatcherTest, ExcludedSetsNeverReachResults) {
    config.matching.excluded_set_prefixes = {"A"};
    const std::vector<Card> cards = {makeCard("A1-001", "A1"), makeCard("A2-002", "A2"),
                                     makeCard("sv1-001", "sv1"), makeCard("A3-003", "")};

    // Bypass the loader so the matcher's own filter is what removes them
    index::ReferenceIndices indices;
    indices.catalog = std::make_shared<const index::CardCatalog>(cards);
    indices.full_card_hashes = std::make_shared<const index::HashIndex>(index::HashIndex::fromSignatures(4, {
        makeSignature("A1-001", HashAlgorithm::PHASH, "0000"),
        makeSignature("A2-002", HashAlgorithm::PHASH, "0000"),
        makeSignature("sv1-001", HashAlgorithm::PHASH, "00FF"),
        makeSignature("A3-003", HashAlgorithm::PHASH, "0001"),
    }));

    const matching::CardMatcher matcher(config, indices);
    const auto result = matcher.identifyFingerprints(phashQuery("0000"));
    ASSERT_EQ(result.candidates.size(), 1u);
    EXPECT_EQ(result.candidates[0].card->id, "sv1-001");
}

TEST_F(CardMatcherTest, AmbiguousHashesAreReRankedByEmbedding) {
    const matching::CardMatcher matcher(config, ambiguousIndices({{"A", {0, 1, 0, 0}}, {"B", {1, 0, 0, 0}}}), model);

    const auto result = matcher.identifyFingerprints(phashQuery("0000"), std::nullopt, grayCard());
    EXPECT_EQ(model->batch_calls.load(), 1);
    EXPECT_EQ(model->image_count.load(), static_cast<size_t>(config.embedding.tta_crops));

    ASSERT_EQ(result.candidates.size(), 2u);
    EXPECT_TRUE(result.embedding_used);
    EXPECT_FALSE(result.degraded);
    EXPECT_EQ(result.candidates[0].card->id, "B");
    EXPECT_NEAR(*result.candidates[0].embedding_distance, 0.0, 1e-6);
    EXPECT_DOUBLE_EQ(*result.candidates[0].hash_distance, 1.0);
    EXPECT_EQ(result.candidates[0].tier, ConfidenceTier::HIGH);
    EXPECT_EQ(result.candidates[1].card->id, "A");
    EXPECT_EQ(result.candidates[1].tier, ConfidenceTier::LOW);
    EXPECT_TRUE(result.passedStage(MatchStage::RANKED_BY_EMBEDDING));
}

TEST_F(CardMatcherTest, ShortlistedCardsWithoutVectorFollowInHashOrder) {
    const matching::CardMatcher matcher(config, ambiguousIndices({{"B", {1, 0, 0, 0}}}), model);

    const auto result = matcher.identifyFingerprints(phashQuery("0000"), std::nullopt, grayCard());
    ASSERT_EQ(result.candidates.size(), 2u);
    EXPECT_EQ(result.candidates[0].card->id, "B");
    EXPECT_TRUE(result.candidates[0].embedding_distance.has_value());
    EXPECT_EQ(result.candidates[1].card->id, "A");
    EXPECT_FALSE(result.candidates[1].embedding_distance.has_value());
    EXPECT_EQ(result.candidates[1].tier, ConfidenceTier::HIGH);
}

TEST_F(CardMatcherTest, FailingModelDegradesToCappedHashRanking) {
    model->fail = true;
    const matching::CardMatcher matcher(config, ambiguousIndices({{"A", {1, 0, 0, 0}}}), model);

    const auto result = matcher.identifyFingerprints(phashQuery("0000"), std::nullopt, grayCard());
    EXPECT_TRUE(result.degraded);
    EXPECT_FALSE(result.embedding_used);
    ASSERT_EQ(result.candidates.size(), 2u);
    EXPECT_EQ(result.candidates[0].card->id, "A");
    EXPECT_EQ(result.candidates[0].tier, ConfidenceTier::MEDIUM);
    EXPECT_EQ(result.candidates[1].tier, ConfidenceTier::MEDIUM);
}

TEST_F(CardMatcherTest, MissingModelDegradesAmbiguousQueries) {
    const matching::CardMatcher matcher(config, ambiguousIndices({{"A", {1, 0, 0, 0}}}));
    const auto result = matcher.identifyFingerprints(phashQuery("0000"), std::nullopt, grayCard());
    EXPECT_TRUE(result.degraded);
    ASSERT_FALSE(result.candidates.empty());
    EXPECT_NE(result.candidates[0].tier, ConfidenceTier::HIGH);
}

TEST_F(CardMatcherTest, HashOnlyModeIsNeverDegraded) {
    config.matching.mode = MatchMode::HASH_ONLY;
    const matching::CardMatcher matcher(config, ambiguousIndices({{"A", {1, 0, 0, 0}}}), model);

    const auto result = matcher.identifyFingerprints(phashQuery("0000"), std::nullopt, grayCard());
    EXPECT_FALSE(result.degraded);
    EXPECT_EQ(model->batch_calls.load(), 0);
    ASSERT_EQ(result.candidates.size(), 2u);
    EXPECT_EQ(result.candidates[0].tier, ConfidenceTier::HIGH);
}

TEST_F(CardMatcherTest, EmbeddingOnlyModeRanksWholeCatalog) {
    config.matching.mode = MatchMode::EMBEDDING_ONLY;
    const matching::CardMatcher matcher(config, scenarioIndices({{"A", {0, 1, 0, 0}}, {"C", {1, 0, 0, 0}}}), model);

    const auto result = matcher.identifyFingerprints(phashQuery("0000"), std::nullopt, grayCard());
    EXPECT_TRUE(result.embedding_used);
    EXPECT_EQ(model->batch_calls.load(), 1);
    ASSERT_EQ(result.candidates.size(), 2u);
    EXPECT_EQ(result.candidates[0].card->id, "C");
    EXPECT_DOUBLE_EQ(*result.candidates[0].hash_distance, 8.0);
    EXPECT_EQ(result.candidates[1].card->id, "A");
}

TEST_F(CardMatcherTest, ArtZoneDistanceWinsWhenStickerPresent) {
    const auto indices = load({makeCard("A", "sv1"), makeCard("B", "sv1")},
                              {makeSignature("A", HashAlgorithm::PHASH, "00FF"),
                               makeSignature("B", HashAlgorithm::PHASH, "0003")},
                              {},
                              {makeSignature("A", HashAlgorithm::PHASH, "0000", HashRegion::ART_ZONE)});
    const matching::CardMatcher matcher(config, indices);

    const auto result = matcher.identifyFingerprints(phashQuery("0000"), phashQuery("0000"));
    EXPECT_TRUE(result.sticker_detected);
    ASSERT_EQ(result.candidates.size(), 2u);
    EXPECT_EQ(result.candidates[0].card->id, "A");
    EXPECT_DOUBLE_EQ(*result.candidates[0].hash_distance, 0.0);
}

// Reference and query share the art band; the query's lower half is repainted
// with unrelated noise, which the sticker detector does not flag
class ArtZoneRescueTest : public CardMatcherTest {
protected:
    void SetUp() override {
        CardMatcherTest::SetUp();
        config.hashing = HashingParams{};
        config.preprocessing.detect_boundary = false;
        config.preprocessing.clahe_enabled = false;

        cv::RNG rng(23);
        reference = cv::Mat(420, 300, CV_8UC3);
        rng.fill(reference, cv::RNG::UNIFORM, 0, 256);
        query = reference.clone();
        cv::Mat lower = query(cv::Rect(0, 260, 300, 160));
        rng.fill(lower, cv::RNG::UNIFORM, 0, 256);
    }

    index::ReferenceIndices referenceIndices() const {
        const preprocessing::CardPreprocessor preprocessor(config.preprocessing);
        const hashing::PerceptualHasher hasher(config.hashing);
        std::vector<HashSignature> full;
        std::vector<HashSignature> art;
        for (const auto& row : hasher.signaturesFor("ref", preprocessor.process(reference).image)) {
            (row.region == HashRegion::FULL_CARD ? full : art).push_back(row);
        }
        return load({makeCard("ref", "sv1")}, full, {}, art);
    }

    cv::Mat reference;
    cv::Mat query;
};

TEST_F(ArtZoneRescueTest, ArtZoneScoredEvenWhenNoStickerIsFound) {
    config.preprocessing.sticker_detection = true;
    const matching::CardMatcher matcher(config, referenceIndices());

    const auto result = matcher.identify(query);
    EXPECT_FALSE(result.sticker_detected);
    ASSERT_EQ(result.candidates.size(), 1u);
    EXPECT_EQ(result.candidates[0].card->id, "ref");
    EXPECT_DOUBLE_EQ(*result.candidates[0].hash_distance, 0.0);
    EXPECT_EQ(result.candidates[0].tier, ConfidenceTier::HIGH);
}

TEST_F(ArtZoneRescueTest, ArtZoneIgnoredWhenStickerHandlingIsOff) {
    config.preprocessing.sticker_detection = false;
    const matching::CardMatcher matcher(config, referenceIndices());

    const auto result = matcher.identify(query);
    ASSERT_EQ(result.candidates.size(), 1u);
    EXPECT_GT(*result.candidates[0].hash_distance, 0.0);
}

TEST_F(ArtZoneRescueTest, ManualStickerEnablesArtZone) {
    config.preprocessing.sticker_detection = false;
    const matching::CardMatcher matcher(config, referenceIndices());

    const auto result = matcher.identify(query, cv::Rect(10, 380, 40, 30));
    EXPECT_TRUE(result.sticker_detected);
    ASSERT_EQ(result.candidates.size(), 1u);
    EXPECT_DOUBLE_EQ(*result.candidates[0].hash_distance, 0.0);
}

TEST_F(CardMatcherTest, TopKLimitsCandidates) {
    config.matching.top_k = 2;
    const matching::CardMatcher matcher(config, scenarioIndices());
    EXPECT_EQ(matcher.identifyFingerprints(phashQuery("0000")).candidates.size(), 2u);
}

TEST_F(CardMatcherTest, RepeatedQueriesGiveIdenticalOutput) {
    const matching::CardMatcher matcher(config, scenarioIndices());
    const auto first = matcher.identifyFingerprints(phashQuery("0101"));
    const auto second = matcher.identifyFingerprints(phashQuery("0101"));
    ASSERT_EQ(first.candidates.size(), second.candidates.size());
    for (size_t i = 0; i < first.candidates.size(); ++i) {
        EXPECT_EQ(first.candidates[i].card->id, second.candidates[i].card->id);
        EXPECT_EQ(first.candidates[i].hash_distance, second.candidates[i].hash_distance);
    }
}

TEST_F(CardMatcherTest, ModelWithWrongDimensionIsDropped) {
    const matching::CardMatcher matcher(config, scenarioIndices({{"A", {1, 0, 0, 0}}}),
                                        std::make_shared<StubEmbeddingModel>(8));
    EXPECT_EQ(matcher.model(), nullptr);
    EXPECT_FALSE(matcher.embeddingAvailable());
}

TEST_F(CardMatcherTest, EmptyImageReportsError) {
    const matching::CardMatcher matcher(config, scenarioIndices());
    const auto result = matcher.identify(cv::Mat());
    EXPECT_FALSE(result.error.empty());
    EXPECT_TRUE(result.candidates.empty());
}

TEST_F(CardMatcherTest, UnreadableFileReportsError) {
    const matching::CardMatcher matcher(config, scenarioIndices());
    const auto result = matcher.identifyFile("does/not/exist.png");
    EXPECT_NE(result.error.find("Cannot read image"), std::string::npos);
}

TEST_F(CardMatcherTest, ReferenceImageMatchesItself) {
    config.hashing = HashingParams{};
    cv::Mat reference(420, 300, CV_8UC3);
    cv::RNG rng(11);
    rng.fill(reference, cv::RNG::UNIFORM, 0, 256);
    cv::Mat other(420, 300, CV_8UC3);
    rng.fill(other, cv::RNG::UNIFORM, 0, 256);

    const preprocessing::CardPreprocessor preprocessor(config.preprocessing);
    const hashing::PerceptualHasher hasher(config.hashing);
    auto rows = hasher.signaturesFor("ref", preprocessor.normalizeReference(reference));
    const auto other_rows = hasher.signaturesFor("other", preprocessor.normalizeReference(other));
    rows.insert(rows.end(), other_rows.begin(), other_rows.end());

    std::vector<HashSignature> full;
    for (const auto& row : rows) {
        if (row.region == HashRegion::FULL_CARD) full.push_back(row);
    }
    const matching::CardMatcher matcher(config, load({makeCard("ref", "sv1"), makeCard("other", "sv1")}, full));

    const auto result = matcher.identifyFingerprints(hasher.computeAll(preprocessor.normalizeReference(reference)));
    ASSERT_FALSE(result.candidates.empty());
    EXPECT_EQ(result.candidates[0].card->id, "ref");
    EXPECT_DOUBLE_EQ(*result.candidates[0].hash_distance, 0.0);
}
