#include "frame_warper.hpp"
#include "transform_builder.hpp"
#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>
#include <cmath>

using namespace TiltStabilizer;

namespace {

cv::Point2d applyAffine(const cv::Mat& M, const cv::Point2d& p) {
    return cv::Point2d(M.at<double>(0, 0) * p.x + M.at<double>(0, 1) * p.y + M.at<double>(0, 2),
                       M.at<double>(1, 0) * p.x + M.at<double>(1, 1) * p.y + M.at<double>(1, 2));
}

cv::Mat randomImage(int width, int height) {
    cv::Mat image(height, width, CV_8UC3);
    cv::randu(image, cv::Scalar::all(0), cv::Scalar::all(256));
    return image;
}

} // namespace

TEST(FrameWarper, IdentityTransformReproducesFrame) {
    FrameWarper warper;
    const cv::Mat input = randomImage(64, 48);
    cv::Mat output;

    ASSERT_TRUE(warper.warp(input, StabilizationTransform{}, FrameDimensions{64, 48}, output));
    ASSERT_EQ(output.size(), input.size());
    EXPECT_EQ(cv::norm(input, output, cv::NORM_INF), 0.0);
}

TEST(FrameWarper, OutputAlwaysHasRequestedDimensions) {
    FrameWarper warper;
    const cv::Mat input = randomImage(32, 24);
    cv::Mat output;

    StabilizationTransform t;
    t.rotationRadians = 0.3;
    t.scale = 1.4;
    ASSERT_TRUE(warper.warp(input, t, FrameDimensions{64, 48}, output));
    EXPECT_EQ(output.cols, 64);
    EXPECT_EQ(output.rows, 48);
    EXPECT_EQ(output.type(), input.type());
}

TEST(FrameWarper, EmptyFrameIsRejected) {
    FrameWarper warper;
    cv::Mat output = randomImage(8, 8);
    EXPECT_FALSE(warper.warp(cv::Mat(), StabilizationTransform{}, FrameDimensions{8, 8}, output));
    EXPECT_TRUE(output.empty());
}

TEST(FrameWarper, InvalidDimensionsAreRejected) {
    FrameWarper warper;
    cv::Mat output;
    EXPECT_FALSE(warper.warp(randomImage(8, 8), StabilizationTransform{}, FrameDimensions{0, 8}, output));
    EXPECT_TRUE(output.empty());
}

TEST(FrameWarper, InPlaceWarpIsSafe) {
    FrameWarper warper;
    cv::Mat image = randomImage(40, 30);
    const cv::Mat original = image.clone();

    ASSERT_TRUE(warper.warp(image, StabilizationTransform{}, FrameDimensions{40, 30}, image));
    EXPECT_EQ(cv::norm(original, image, cv::NORM_INF), 0.0);
}

TEST(FrameWarper, ComposeWarpMatrixIdentity) {
    const cv::Mat M = FrameWarper::composeWarpMatrix(StabilizationTransform{}, FrameDimensions{640, 480});
    ASSERT_EQ(M.rows, 2);
    ASSERT_EQ(M.cols, 3);
    ASSERT_EQ(M.type(), CV_64F);
    const cv::Mat expected = (cv::Mat_<double>(2, 3) << 1, 0, 0, 0, 1, 0);
    EXPECT_LT(cv::norm(M, expected, cv::NORM_INF), 1e-12);
}

TEST(FrameWarper, FrameCenterIsFixed) {
    StabilizationTransform t;
    t.rotationRadians = 1.1;
    t.scale = 1.7;
    const cv::Mat M = FrameWarper::composeWarpMatrix(t, FrameDimensions{640, 480});
    const cv::Point2d c = applyAffine(M, cv::Point2d(320.0, 240.0));
    EXPECT_NEAR(c.x, 320.0, 1e-9);
    EXPECT_NEAR(c.y, 240.0, 1e-9);
}

TEST(FrameWarper, HalfTurnMirrorsThroughCenter) {
    StabilizationTransform t;
    t.rotationRadians = M_PI;
    const cv::Mat M = FrameWarper::composeWarpMatrix(t, FrameDimensions{100, 100});
    const cv::Point2d p = applyAffine(M, cv::Point2d(60.0, 50.0));
    EXPECT_NEAR(p.x, 40.0, 1e-9);
    EXPECT_NEAR(p.y, 50.0, 1e-9);
}

TEST(FrameWarper, ScaleZoomsAboutCenter) {
    StabilizationTransform t;
    t.scale = 2.0;
    const cv::Mat M = FrameWarper::composeWarpMatrix(t, FrameDimensions{100, 100});
    const cv::Point2d p = applyAffine(M, cv::Point2d(60.0, 45.0));
    EXPECT_NEAR(p.x, 70.0, 1e-9);
    EXPECT_NEAR(p.y, 40.0, 1e-9);
}

TEST(FrameWarper, QuarterTurnMovesContent) {
    cv::Mat input = cv::Mat::zeros(100, 100, CV_8UC1);
    input(cv::Rect(70, 45, 10, 10)).setTo(255);  // right of center

    StabilizationTransform t;
    t.rotationRadians = M_PI_2;
    FrameWarper warper;
    cv::Mat output;
    ASSERT_TRUE(warper.warp(input, t, FrameDimensions{100, 100}, output));

    // Counter-clockwise on screen, (dx, dy) -> (dy, -dx): the block lands above the center
    EXPECT_EQ(output.at<uchar>(25, 50), 255);
    EXPECT_EQ(output.at<uchar>(75, 50), 0);
    EXPECT_EQ(output.at<uchar>(50, 75), 0);
}

TEST(FrameWarper, MatchesOpenCvRotationMatrix) {
    const FrameDimensions dims{640, 360};
    const double angles[] = {0.4, -1.2, 2.9};
    for (double theta : angles) {
        StabilizationTransform t;
        t.rotationRadians = theta;
        t.scale = 1.3;
        const cv::Mat M = FrameWarper::composeWarpMatrix(t, dims);
        const cv::Mat expected = cv::getRotationMatrix2D(cv::Point2f(320.0f, 180.0f),
                                                         radiansToDegrees(theta), 1.3);
        EXPECT_LT(cv::norm(M, expected, cv::NORM_INF), 1e-6) << "theta " << theta;
    }
}

TEST(FrameWarper, CoverScaleLeavesNoEmptyCorners) {
    const FrameDimensions dims{160, 90};
    const cv::Mat white(90, 160, CV_8UC1, cv::Scalar(255));
    FrameWarper warper;

    const StabilizationTransform covered =
        StabilizationTransformBuilder::build(0.3, dims, BaselineOrientation::Portrait);
    cv::Mat output;
    ASSERT_TRUE(warper.warp(white, covered, dims, output));
    const int inset = 3;
    EXPECT_EQ(output.at<uchar>(inset, inset), 255);
    EXPECT_EQ(output.at<uchar>(inset, 159 - inset), 255);
    EXPECT_EQ(output.at<uchar>(89 - inset, inset), 255);
    EXPECT_EQ(output.at<uchar>(89 - inset, 159 - inset), 255);

    // Without the zoom the rotated frame exposes the border
    StabilizationTransform bare = covered;
    bare.scale = 1.0;
    ASSERT_TRUE(warper.warp(white, bare, dims, output));
    EXPECT_EQ(output.at<uchar>(0, 0), 0);
}

TEST(FrameWarper, BorderValueFillsUncoveredArea) {
    WarperOptions options;
    options.borderValue = cv::Scalar(77);
    FrameWarper warper(options);

    cv::Mat output;
    ASSERT_TRUE(warper.warp(cv::Mat(10, 10, CV_8UC1, cv::Scalar(200)), StabilizationTransform{},
                            FrameDimensions{30, 30}, output));
    EXPECT_EQ(output.at<uchar>(29, 29), 77);
    EXPECT_EQ(output.at<uchar>(2, 2), 200);
}
