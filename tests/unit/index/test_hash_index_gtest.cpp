#include <gtest/gtest.h>
#include "src/core/index/HashIndex.hpp"
#include "support/test_doubles.hpp"

using card_identifier::HashAlgorithm;
using card_identifier::HashSignature;
using card_identifier::algorithmIndex;
using card_identifier::hashing::Fingerprint;
using card_identifier::hashing::FingerprintSet;
using card_identifier::index::HashIndex;
using card_identifier::test::makeSignature;

class HashIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        signatures = {
            makeSignature("C", HashAlgorithm::PHASH, "00FF"),
            makeSignature("A", HashAlgorithm::PHASH, "0000"),
            makeSignature("B", HashAlgorithm::PHASH, "0003"),
        };
        index = HashIndex::fromSignatures(4, signatures);
    }

    static FingerprintSet query(const std::string& phash, const std::string& ahash = "") {
        FingerprintSet set;
        set[algorithmIndex(HashAlgorithm::PHASH)] = Fingerprint::fromHex(phash);
        if (!ahash.empty()) {
            set[algorithmIndex(HashAlgorithm::AHASH)] = Fingerprint::fromHex(ahash);
        }
        return set;
    }

    std::vector<HashSignature> signatures;
    HashIndex index;
};

TEST_F(HashIndexTest, RanksByHammingDistance) {
    const auto hits = index.lookup(HashAlgorithm::PHASH, Fingerprint::fromHex("0000"));
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].card_id, "A");
    EXPECT_EQ(hits[0].distance, 0);
    EXPECT_EQ(hits[1].card_id, "B");
    EXPECT_EQ(hits[1].distance, 2);
    EXPECT_EQ(hits[2].card_id, "C");
    EXPECT_EQ(hits[2].distance, 8);
}

TEST_F(HashIndexTest, TiesBreakByCardId) {
    const auto tied = HashIndex::fromSignatures(4, {
        makeSignature("Z", HashAlgorithm::PHASH, "0001"),
        makeSignature("M", HashAlgorithm::PHASH, "0002"),
        makeSignature("K", HashAlgorithm::PHASH, "0004"),
    });
    const auto hits = tied.lookup(HashAlgorithm::PHASH, Fingerprint::fromHex("0000"));
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].card_id, "K");
    EXPECT_EQ(hits[1].card_id, "M");
    EXPECT_EQ(hits[2].card_id, "Z");
}

TEST_F(HashIndexTest, RepeatedLookupsAreIdentical) {
    const auto first = index.combinedRanking(query("0001"), {1.0, 0.0, 0.0, 0.0});
    const auto second = index.combinedRanking(query("0001"), {1.0, 0.0, 0.0, 0.0});
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].card_id, second[i].card_id);
        EXPECT_DOUBLE_EQ(first[i].score, second[i].score);
    }
}

TEST_F(HashIndexTest, NeighboursListOtherCardsByDistance) {
    const auto hits = index.neighbours("A", HashAlgorithm::PHASH, 5);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].card_id, "B");
    EXPECT_EQ(hits[0].distance, 2);
    EXPECT_EQ(hits[1].card_id, "C");
    EXPECT_EQ(hits[1].distance, 8);

    EXPECT_EQ(index.neighbours("A", HashAlgorithm::PHASH, 1).size(), 1u);
    EXPECT_TRUE(index.neighbours("A", HashAlgorithm::DHASH, 5).empty());
    EXPECT_TRUE(index.neighbours("missing", HashAlgorithm::PHASH, 5).empty());
}

TEST_F(HashIndexTest, CombinedRankingIsWeightedAverage) {
    auto rows = signatures;
    rows.push_back(makeSignature("A", HashAlgorithm::AHASH, "FFFF"));
    rows.push_back(makeSignature("B", HashAlgorithm::AHASH, "0000"));
    rows.push_back(makeSignature("C", HashAlgorithm::AHASH, "0000"));
    const auto two = HashIndex::fromSignatures(4, rows);

    // A: (2*0 + 16) / 3, B: (2*2 + 0) / 3, C: (2*8 + 0) / 3
    const auto ranking = two.combinedRanking(query("0000", "0000"), {2.0, 1.0, 0.0, 0.0});
    ASSERT_EQ(ranking.size(), 3u);
    EXPECT_EQ(ranking[0].card_id, "B");
    EXPECT_NEAR(ranking[0].score, 4.0 / 3.0, 1e-9);
    EXPECT_EQ(ranking[1].card_id, "A");
    EXPECT_NEAR(ranking[1].score, 16.0 / 3.0, 1e-9);
    EXPECT_EQ(ranking[2].card_id, "C");
}

TEST_F(HashIndexTest, CardsMissingAnUsedAlgorithmAreLeftOut) {
    auto rows = signatures;
    rows.push_back(makeSignature("A", HashAlgorithm::AHASH, "0000"));
    const auto partial = HashIndex::fromSignatures(4, rows);
    const auto ranking = partial.combinedRanking(query("0000", "0000"), {1.0, 1.0, 0.0, 0.0});
    ASSERT_EQ(ranking.size(), 1u);
    EXPECT_EQ(ranking[0].card_id, "A");
}

TEST_F(HashIndexTest, DropsRowsOfWrongWidthOrMalformedHex) {
    auto rows = signatures;
    rows.push_back(makeSignature("D", HashAlgorithm::PHASH, "000000"));
    rows.push_back(makeSignature("E", HashAlgorithm::PHASH, "zz00"));
    const auto filtered = HashIndex::fromSignatures(4, rows);
    EXPECT_EQ(filtered.rowCount(HashAlgorithm::PHASH), 3u);
    EXPECT_FALSE(filtered.contains("D", HashAlgorithm::PHASH));
    EXPECT_FALSE(filtered.contains("E", HashAlgorithm::PHASH));
}

TEST_F(HashIndexTest, LastDuplicateWins) {
    auto rows = signatures;
    rows.push_back(makeSignature("C", HashAlgorithm::PHASH, "0000"));
    const auto updated = HashIndex::fromSignatures(4, rows);
    EXPECT_EQ(updated.size(), 3u);
    const auto hits = updated.lookup(HashAlgorithm::PHASH, Fingerprint::fromHex("0000"));
    EXPECT_EQ(hits[1].card_id, "C");
    EXPECT_EQ(hits[1].distance, 0);
}

TEST_F(HashIndexTest, QueryWidthMismatchThrows) {
    EXPECT_THROW(index.lookup(HashAlgorithm::PHASH, Fingerprint::fromHex("00")), std::invalid_argument);
}

TEST_F(HashIndexTest, EmptyIndexReturnsNothing) {
    const HashIndex empty;
    EXPECT_TRUE(empty.empty());
    EXPECT_TRUE(empty.combinedRanking(query("0000"), {1.0, 1.0, 1.0, 1.0}).empty());
    EXPECT_TRUE(index.lookup(HashAlgorithm::DHASH, Fingerprint::fromHex("0000")).empty());
}
