#include <gtest/gtest.h>
#include "src/core/embedding/LibTorchEmbeddingModel.hpp"
#include <opencv2/core.hpp>
#include <stdexcept>

using card_identifier::embedding::LibTorchEmbeddingModel;

namespace {

// 300x420 card: red name bar, gray body, blue footer (BGR)
cv::Mat bandedCard() {
    cv::Mat card(420, 300, CV_8UC3, cv::Scalar(128, 128, 128));
    card(cv::Rect(0, 0, 300, 60)).setTo(cv::Scalar(0, 0, 255));
    card(cv::Rect(0, 360, 300, 60)).setTo(cv::Scalar(255, 0, 0));
    return card;
}

} // namespace

TEST(LibTorchEmbeddingModelTest, NetworkInputIsSquareRgb) {
    const cv::Mat input = LibTorchEmbeddingModel::resizeForNetwork(bandedCard(), 56);
    EXPECT_EQ(input.rows, 56);
    EXPECT_EQ(input.cols, 56);
    EXPECT_EQ(input.type(), CV_8UC3);
}

TEST(LibTorchEmbeddingModelTest, NetworkInputKeepsTopAndBottomOfCard) {
    const cv::Mat input = LibTorchEmbeddingModel::resizeForNetwork(bandedCard(), 56);

    // RGB order: the red name bar and blue footer survive at the edges
    const cv::Vec3b top = input.at<cv::Vec3b>(1, 28);
    const cv::Vec3b bottom = input.at<cv::Vec3b>(54, 28);
    const cv::Vec3b middle = input.at<cv::Vec3b>(28, 28);

    EXPECT_GT(top[0], 200);
    EXPECT_LT(top[2], 50);
    EXPECT_GT(bottom[2], 200);
    EXPECT_LT(bottom[0], 50);
    EXPECT_NEAR(middle[1], 128, 3);
}

TEST(LibTorchEmbeddingModelTest, GrayscaleInputIsExpandedToThreeChannels) {
    const cv::Mat gray(84, 60, CV_8UC1, cv::Scalar(90));
    const cv::Mat input = LibTorchEmbeddingModel::resizeForNetwork(gray, 32);
    EXPECT_EQ(input.channels(), 3);
    EXPECT_EQ(input.at<cv::Vec3b>(16, 16), cv::Vec3b(90, 90, 90));
}

TEST(LibTorchEmbeddingModelTest, EmptyImageThrows) {
    EXPECT_THROW(LibTorchEmbeddingModel::resizeForNetwork(cv::Mat(), 32), std::runtime_error);
}
