#include "orientation_types.hpp"

namespace TiltStabilizer {

double normalizeAngle(double angle) {
    if (angle > M_PI) {
        angle -= 2.0 * M_PI;
    } else if (angle <= -M_PI) {
        angle += 2.0 * M_PI;
    }
    return angle;
}

double quantizeToRightAngle(double angle) {
    const double quarter_turns = std::round(angle / M_PI_2);
    return normalizeAngle(quarter_turns * M_PI_2);
}

std::string toString(BaselineOrientation orientation) {
    switch (orientation) {
        case BaselineOrientation::Portrait:
            return "PORTRAIT";
        case BaselineOrientation::Landscape:
            return "LANDSCAPE";
    }
    return "UNKNOWN";
}

std::string toString(SessionState state) {
    switch (state) {
        case SessionState::Idle:
            return "IDLE";
        case SessionState::Calibrating:
            return "CALIBRATING";
        case SessionState::Active:
            return "ACTIVE";
    }
    return "UNKNOWN";
}

std::string describeDeviceRotation(double effectiveAngle) {
    const double degrees = radiansToDegrees(effectiveAngle);
    if (degrees > -45.0 && degrees < 45.0) {
        return "Device is near baseline orientation";
    }
    if (degrees >= 45.0 && degrees <= 135.0) {
        return "Device tilted ~90 deg in one direction";
    }
    if (degrees <= -45.0 && degrees >= -135.0) {
        return "Device tilted ~90 deg in the opposite direction";
    }
    return "Device possibly upside-down or beyond 90 deg tilt";
}

} // namespace TiltStabilizer
