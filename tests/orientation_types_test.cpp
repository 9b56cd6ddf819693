#include "orientation_types.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace TiltStabilizer;

TEST(NormalizeAngle, KeepsAnglesAlreadyInRange) {
    EXPECT_DOUBLE_EQ(normalizeAngle(0.0), 0.0);
    EXPECT_DOUBLE_EQ(normalizeAngle(1.0), 1.0);
    EXPECT_DOUBLE_EQ(normalizeAngle(-3.0), -3.0);
    EXPECT_DOUBLE_EQ(normalizeAngle(M_PI), M_PI);
}

TEST(NormalizeAngle, MinusPiCollapsesToPi) {
    EXPECT_DOUBLE_EQ(normalizeAngle(-M_PI), M_PI);
}

TEST(NormalizeAngle, WrapsOnceIntoHalfOpenRange) {
    EXPECT_NEAR(normalizeAngle(3.0 * M_PI_2), -M_PI_2, 1e-12);
    EXPECT_NEAR(normalizeAngle(-3.0 * M_PI_2), M_PI_2, 1e-12);
    EXPECT_NEAR(normalizeAngle(2.5 * M_PI), 0.5 * M_PI, 1e-12);
    EXPECT_NEAR(normalizeAngle(-2.5 * M_PI), -0.5 * M_PI, 1e-12);
}

TEST(QuantizeToRightAngle, SnapsToNearestQuarterTurn) {
    EXPECT_DOUBLE_EQ(quantizeToRightAngle(0.2), 0.0);
    EXPECT_DOUBLE_EQ(quantizeToRightAngle(1.0), M_PI_2);
    EXPECT_DOUBLE_EQ(quantizeToRightAngle(-0.8), -M_PI_2);
    EXPECT_DOUBLE_EQ(quantizeToRightAngle(2.9), M_PI);
    EXPECT_DOUBLE_EQ(quantizeToRightAngle(-2.5), M_PI);
}

TEST(QuantizeToRightAngle, ResultIsAlwaysOneOfFourCanonicalValues) {
    for (double a = -M_PI + 1e-3; a <= M_PI; a += 0.01) {
        const double q = quantizeToRightAngle(a);
        const bool canonical = q == -M_PI_2 || q == 0.0 || q == M_PI_2 || q == M_PI;
        EXPECT_TRUE(canonical) << "angle " << a << " quantized to " << q;
    }
}

TEST(QuantizeToRightAngle, IsIdempotent) {
    for (double a = -M_PI + 1e-3; a <= M_PI; a += 0.05) {
        const double q = quantizeToRightAngle(a);
        EXPECT_EQ(quantizeToRightAngle(q), q);
    }
}

TEST(DescribeDeviceRotation, ClassifiesByQuadrant) {
    EXPECT_EQ(describeDeviceRotation(0.1), "Device is near baseline orientation");
    EXPECT_EQ(describeDeviceRotation(degreesToRadians(90.0)), "Device tilted ~90 deg in one direction");
    EXPECT_EQ(describeDeviceRotation(degreesToRadians(-90.0)), "Device tilted ~90 deg in the opposite direction");
    EXPECT_EQ(describeDeviceRotation(degreesToRadians(170.0)), "Device possibly upside-down or beyond 90 deg tilt");
}

TEST(FrameDimensions, SwapAndValidity) {
    const FrameDimensions dims{1080, 1920};
    EXPECT_TRUE(dims.isValid());
    EXPECT_EQ(dims.swapped(), (FrameDimensions{1920, 1080}));
    EXPECT_EQ(dims.toSize(), cv::Size(1080, 1920));
    EXPECT_FALSE((FrameDimensions{0, 1920}).isValid());
}

TEST(OrientationTypes, ToString) {
    EXPECT_EQ(toString(BaselineOrientation::Portrait), "PORTRAIT");
    EXPECT_EQ(toString(BaselineOrientation::Landscape), "LANDSCAPE");
    EXPECT_EQ(toString(SessionState::Calibrating), "CALIBRATING");
}
