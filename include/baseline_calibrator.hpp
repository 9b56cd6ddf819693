#pragma once

#include "orientation_types.hpp"

namespace TiltStabilizer {

/**
 * @brief Establishes what counts as "upright" for one recording.
 *
 * At record start the current tilt angle is snapped to the nearest right angle.
 * Stabilization then compensates the deviation from that baseline rather than
 * the absolute device tilt, so a user who starts recording in landscape gets a
 * landscape video instead of one rotated back to portrait.
 *
 * The baseline is computed exactly once per recording. Recomputing it while
 * frames are being warped would make consecutive frames disagree on where
 * upright is.
 */
class BaselineCalibrator {
public:
    /**
     * @brief Computes the quantized baseline angle.
     *
     * Landscape baselines that quantize to -pi/2 are turned by pi to +pi/2, so
     * that a device rotated 90 degrees either way calibrates to the same
     * canonical landscape baseline.
     *
     * @param currentAngle Tilt angle at record start, in (-pi, pi]
     * @param orientation Coarse orientation of the device at record start
     * @return Baseline angle, one of -pi/2, 0, pi/2, pi
     */
    static double captureBaseline(double currentAngle, BaselineOrientation orientation);

    /**
     * @brief Classifies the coarse device orientation from a gravity sample.
     *
     * Landscape when gravity lies mostly along the device X axis, portrait
     * otherwise (face up and face down included).
     *
     * @param sample Gravity sample taken at record start
     * @return The baseline orientation to record with
     */
    static BaselineOrientation orientationFromGravity(const GravitySample& sample);
};

} // namespace TiltStabilizer
