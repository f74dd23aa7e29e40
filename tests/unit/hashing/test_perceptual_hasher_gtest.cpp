#include <gtest/gtest.h>
#include "src/core/hashing/PerceptualHasher.hpp"
#include <opencv2/core.hpp>

using card_identifier::HashAlgorithm;
using card_identifier::HashRegion;
using card_identifier::HashingParams;
using card_identifier::algorithmIndex;
using card_identifier::kAllHashAlgorithms;
using card_identifier::hashing::PerceptualHasher;

namespace {

cv::Mat noiseCard(uint64_t seed) {
    cv::Mat card(420, 300, CV_8UC3);
    cv::RNG rng(seed);
    rng.fill(card, cv::RNG::UNIFORM, 0, 256);
    return card;
}

} // namespace

TEST(PerceptualHasherTest, IdenticalImagesHaveZeroDistanceForEveryAlgorithm) {
    const PerceptualHasher hasher(HashingParams{});
    const cv::Mat card = noiseCard(7);
    const auto a = hasher.computeAll(card);
    const auto b = hasher.computeAll(card.clone());
    for (const auto algorithm : kAllHashAlgorithms) {
        const auto index = algorithmIndex(algorithm);
        EXPECT_EQ(a[index].bits(), 256);
        EXPECT_EQ(a[index].hamming(b[index]), 0);
    }
}

TEST(PerceptualHasherTest, UnrelatedImagesAreFarApart) {
    const PerceptualHasher hasher(HashingParams{});
    const auto a = hasher.computeAll(noiseCard(1));
    const auto b = hasher.computeAll(noiseCard(2));
    const auto index = algorithmIndex(HashAlgorithm::PHASH);
    EXPECT_GT(a[index].hamming(b[index]), 40);
}

TEST(PerceptualHasherTest, AverageHashOfSplitImage) {
    cv::Mat gray(64, 64, CV_8UC1, cv::Scalar(0));
    gray(cv::Rect(32, 0, 32, 64)).setTo(cv::Scalar(255));
    EXPECT_EQ(PerceptualHasher::averageHash(gray, 4).toHex(), "3333");
}

TEST(PerceptualHasherTest, DifferenceHashOfRisingGradientIsAllOnes) {
    cv::Mat gray(40, 100, CV_8UC1);
    for (int c = 0; c < gray.cols; ++c) {
        gray.col(c).setTo(cv::Scalar(c * 2));
    }
    EXPECT_EQ(PerceptualHasher::differenceHash(gray, 4).toHex(), "ffff");
}

TEST(PerceptualHasherTest, SignaturesCoverFullCardAndArtZone) {
    const PerceptualHasher hasher(HashingParams{});
    const auto rows = hasher.signaturesFor("sv1-001", noiseCard(3));
    ASSERT_EQ(rows.size(), 8u);
    int art_rows = 0;
    for (const auto& row : rows) {
        EXPECT_EQ(row.card_id, "sv1-001");
        EXPECT_EQ(row.hex.size(), 64u);
        if (row.region == HashRegion::ART_ZONE) ++art_rows;
    }
    EXPECT_EQ(art_rows, 4);
}

TEST(PerceptualHasherTest, ArtZoneRowsCanBeDisabled) {
    HashingParams params;
    params.art_zone_enabled = false;
    const PerceptualHasher hasher(params);
    EXPECT_EQ(hasher.signaturesFor("x", noiseCard(4)).size(), 4u);
}

TEST(PerceptualHasherTest, ArtZoneSpansConfiguredBand) {
    const PerceptualHasher hasher(HashingParams{});
    const auto rect = hasher.artZoneRect(cv::Size(300, 400));
    EXPECT_EQ(rect.x, 0);
    EXPECT_EQ(rect.width, 300);
    EXPECT_EQ(rect.y, 52);
    EXPECT_EQ(rect.y + rect.height, 212);
}

TEST(PerceptualHasherTest, RejectsHashSizeThatIsNotPowerOfTwo) {
    HashingParams params;
    params.hash_size = 12;
    EXPECT_THROW(PerceptualHasher hasher(params), std::invalid_argument);
}

TEST(PerceptualHasherTest, EmptyImageThrows) {
    const PerceptualHasher hasher(HashingParams{});
    EXPECT_THROW(hasher.compute(cv::Mat(), HashAlgorithm::AHASH), std::invalid_argument);
}
