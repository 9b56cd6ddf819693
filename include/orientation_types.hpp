#pragma once

#include <opencv2/core.hpp>
#include <cmath>
#include <cstdint>
#include <string>

namespace TiltStabilizer {

/**
 * @brief A single reading from the device's motion sensor fusion service.
 *
 * The gravity vector is expressed in device coordinates and points toward the
 * Earth. With the device held upright in portrait, gravity is approximately
 * (0, -1, 0).
 */
struct GravitySample {
    double x{0.0};          ///< Gravity along the device X axis
    double y{0.0};          ///< Gravity along the device Y axis
    double z{0.0};          ///< Gravity along the device Z axis (out of the screen)
    double timestamp{0.0};  ///< Sample time in seconds
};

/**
 * @brief Coarse orientation of the device at the moment recording starts.
 *
 * Decides which frame axis is treated as the long axis of the intended upright
 * rectangle when the compensating scale is computed.
 */
enum class BaselineOrientation {
    Portrait,
    Landscape
};

/**
 * @brief Lifecycle of one recording's stabilization context.
 */
enum class SessionState {
    Idle,
    Calibrating,
    Active
};

/**
 * @brief Pixel dimensions of the frames of one capture session.
 */
struct FrameDimensions {
    uint32_t width{0};
    uint32_t height{0};

    bool isValid() const { return width > 0 && height > 0; }

    /// Same rectangle with width and height exchanged.
    FrameDimensions swapped() const { return FrameDimensions{height, width}; }

    cv::Size toSize() const {
        return cv::Size(static_cast<int>(width), static_cast<int>(height));
    }

    bool operator==(const FrameDimensions& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const FrameDimensions& other) const { return !(*this == other); }
};

/**
 * @brief Per-frame compensation: rotate by rotationRadians about the frame
 * centre, then enlarge uniformly by scale.
 */
struct StabilizationTransform {
    double rotationRadians{0.0};  ///< Rotation applied to the frame
    double scale{1.0};            ///< Uniform enlargement hiding the border gaps
};

/**
 * @brief A video frame together with its capture timestamp.
 */
struct Frame {
    cv::Mat image;          ///< Frame image data, any type supported by cv::warpAffine
    double timestamp{0.0};  ///< Capture time in seconds, never altered by the pipeline
};

/**
 * @brief Normalizes an angle into (-pi, pi].
 *
 * A single 2*pi correction is applied, so the input must lie in (-3*pi, 3*pi].
 * Every producer of angles in this library guarantees that range.
 *
 * @param angle Angle in radians
 * @return Equivalent angle in (-pi, pi]
 */
double normalizeAngle(double angle);

/**
 * @brief Snaps an angle to the nearest multiple of pi/2 and normalizes it.
 *
 * The result is always one of -pi/2, 0, pi/2 or pi. Quantizing an already
 * quantized angle returns it unchanged.
 *
 * @param angle Angle in radians, in (-3*pi, 3*pi]
 * @return Quantized angle in (-pi, pi]
 */
double quantizeToRightAngle(double angle);

inline double radiansToDegrees(double radians) { return radians * 180.0 / M_PI; }
inline double degreesToRadians(double degrees) { return degrees * M_PI / 180.0; }

std::string toString(BaselineOrientation orientation);
std::string toString(SessionState state);

/**
 * @brief Human readable description of how far the device is turned away from
 * the recording's upright.
 * @param effectiveAngle Deviation from the baseline in radians
 */
std::string describeDeviceRotation(double effectiveAngle);

} // namespace TiltStabilizer
