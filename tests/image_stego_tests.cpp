#include <gtest/gtest.h>

#include <opencv2/core.hpp>

#include <string>

#include "image_stego.hpp"

namespace stego::tests {

namespace {
cv::Mat makeCover(int rows, int cols) {
    cv::Mat img(rows, cols, CV_8UC3);
    cv::randu(img, cv::Scalar::all(0), cv::Scalar::all(256));
    return img;
}
}  // namespace

TEST(ImageStegoTests, EmbedThenReveal) {
    cv::Mat img = makeCover(32, 32);
    const std::string payload = "QUJDREVGR0hJSktMTU5PUFFSU1RVVldYWVo=";

    ASSERT_TRUE(imgstego::embedTextInImage(img, payload));
    const auto revealed = imgstego::revealTextFromImage(img);
    ASSERT_TRUE(revealed.has_value());
    EXPECT_EQ(*revealed, payload);
}

TEST(ImageStegoTests, OnlyLeastSignificantBitsChange) {
    const cv::Mat cover = makeCover(16, 16);
    cv::Mat stego = cover.clone();
    ASSERT_TRUE(imgstego::embedTextInImage(stego, "payload"));

    for (int y = 0; y < cover.rows; ++y) {
        for (int x = 0; x < cover.cols; ++x) {
            for (int c = 0; c < 3; ++c) {
                EXPECT_EQ(cover.at<cv::Vec3b>(y, x)[c] & 0xFE, stego.at<cv::Vec3b>(y, x)[c] & 0xFE);
            }
        }
    }
}

TEST(ImageStegoTests, CleanImageRevealsNothing) {
    cv::Mat black(8, 8, CV_8UC3, cv::Scalar::all(0));
    EXPECT_FALSE(imgstego::revealTextFromImage(black).has_value());
}

TEST(ImageStegoTests, EmptyTextIsStillAPayload) {
    cv::Mat img = makeCover(8, 8);
    ASSERT_TRUE(imgstego::embedTextInImage(img, ""));
    const auto revealed = imgstego::revealTextFromImage(img);
    ASSERT_TRUE(revealed.has_value());
    EXPECT_TRUE(revealed->empty());
}

TEST(ImageStegoTests, CapacityIsEnforced) {
    cv::Mat img = makeCover(4, 4);   // 48 bits, less than the header
    EXPECT_EQ(imgstego::capacityBits(img), 48U);
    EXPECT_FALSE(imgstego::embedTextInImage(img, "x"));

    cv::Mat exact = makeCover(8, 8);  // 192 bits = header + 16 bytes
    EXPECT_TRUE(imgstego::embedTextInImage(exact, std::string(16, 'a')));
    EXPECT_FALSE(imgstego::embedTextInImage(exact, std::string(17, 'a')));
}

TEST(ImageStegoTests, RejectsNonBgrImages) {
    cv::Mat gray(16, 16, CV_8UC1, cv::Scalar::all(0));
    EXPECT_FALSE(imgstego::embedTextInImage(gray, "x"));
    EXPECT_FALSE(imgstego::revealTextFromImage(gray).has_value());
}

TEST(ImageStegoTests, OverwritingReplacesPayload) {
    cv::Mat img = makeCover(16, 16);
    ASSERT_TRUE(imgstego::embedTextInImage(img, "first and longer payload"));
    ASSERT_TRUE(imgstego::embedTextInImage(img, "second"));
    EXPECT_EQ(imgstego::revealTextFromImage(img).value_or(""), "second");
}

}  // namespace stego::tests
