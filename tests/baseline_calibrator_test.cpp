#include "baseline_calibrator.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace TiltStabilizer;

TEST(BaselineCalibrator, PortraitSnapsToNearestRightAngle) {
    EXPECT_DOUBLE_EQ(BaselineCalibrator::captureBaseline(0.2, BaselineOrientation::Portrait), 0.0);
    EXPECT_DOUBLE_EQ(BaselineCalibrator::captureBaseline(1.2, BaselineOrientation::Portrait), M_PI_2);
    EXPECT_DOUBLE_EQ(BaselineCalibrator::captureBaseline(-1.2, BaselineOrientation::Portrait), -M_PI_2);
    EXPECT_DOUBLE_EQ(BaselineCalibrator::captureBaseline(3.0, BaselineOrientation::Portrait), M_PI);
    EXPECT_DOUBLE_EQ(BaselineCalibrator::captureBaseline(-3.0, BaselineOrientation::Portrait), M_PI);
}

TEST(BaselineCalibrator, LandscapeCanonicalizesNegativeQuarterTurn) {
    EXPECT_DOUBLE_EQ(BaselineCalibrator::captureBaseline(-1.3, BaselineOrientation::Landscape), M_PI_2);
    EXPECT_DOUBLE_EQ(BaselineCalibrator::captureBaseline(-M_PI_2, BaselineOrientation::Landscape), M_PI_2);
    EXPECT_DOUBLE_EQ(BaselineCalibrator::captureBaseline(1.4, BaselineOrientation::Landscape), M_PI_2);
}

TEST(BaselineCalibrator, LandscapeLeavesOtherBaselinesAlone) {
    EXPECT_DOUBLE_EQ(BaselineCalibrator::captureBaseline(0.1, BaselineOrientation::Landscape), 0.0);
    EXPECT_DOUBLE_EQ(BaselineCalibrator::captureBaseline(3.0, BaselineOrientation::Landscape), M_PI);
}

TEST(BaselineCalibrator, CapturingAQuantizedAngleIsStable) {
    const double angles[] = {-M_PI_2, 0.0, M_PI_2, M_PI};
    for (double a : angles) {
        const double once = BaselineCalibrator::captureBaseline(a, BaselineOrientation::Portrait);
        EXPECT_EQ(BaselineCalibrator::captureBaseline(once, BaselineOrientation::Portrait), once);
    }
}

TEST(BaselineCalibrator, OrientationFromGravityUsesDominantScreenAxis) {
    EXPECT_EQ(BaselineCalibrator::orientationFromGravity(GravitySample{0.0, -1.0, 0.0, 0.0}),
              BaselineOrientation::Portrait);
    EXPECT_EQ(BaselineCalibrator::orientationFromGravity(GravitySample{0.2, 0.9, 0.0, 0.0}),
              BaselineOrientation::Portrait);
    EXPECT_EQ(BaselineCalibrator::orientationFromGravity(GravitySample{-1.0, 0.0, 0.0, 0.0}),
              BaselineOrientation::Landscape);
    EXPECT_EQ(BaselineCalibrator::orientationFromGravity(GravitySample{0.9, -0.2, 0.0, 0.0}),
              BaselineOrientation::Landscape);
}

TEST(BaselineCalibrator, FlatDeviceDefaultsToPortrait) {
    EXPECT_EQ(BaselineCalibrator::orientationFromGravity(GravitySample{0.0, 0.0, -1.0, 0.0}),
              BaselineOrientation::Portrait);
}
