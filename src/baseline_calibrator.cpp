#include "baseline_calibrator.hpp"
#include <cmath>

namespace TiltStabilizer {

double BaselineCalibrator::captureBaseline(double currentAngle, BaselineOrientation orientation) {
    double baseline = quantizeToRightAngle(currentAngle);

    // quantizeToRightAngle() yields exact multiples of pi/2, so the comparison is exact
    if (orientation == BaselineOrientation::Landscape && baseline == -M_PI_2) {
        baseline = normalizeAngle(baseline + M_PI);
    }
    return baseline;
}

BaselineOrientation BaselineCalibrator::orientationFromGravity(const GravitySample& sample) {
    if (std::abs(sample.x) > std::abs(sample.y)) {
        return BaselineOrientation::Landscape;
    }
    return BaselineOrientation::Portrait;
}

} // namespace TiltStabilizer
