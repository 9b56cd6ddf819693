#pragma once

#include "orientation_types.hpp"

namespace TiltStabilizer {

/**
 * @brief Computes the per-frame compensation from the effective angle.
 *
 * The rotation is the effective angle itself: zero deviation from the baseline
 * means no rotation. The scale is the smallest uniform enlargement for which a
 * centred rotate-then-crop of the reference rectangle leaves no unfilled
 * corner:
 *
 *   rotatedW = refW * |cos(theta)| + refH * |sin(theta)|
 *   rotatedH = refW * |sin(theta)| + refH * |cos(theta)|
 *   scale    = max(rotatedW / refW, rotatedH / refH)
 *
 * The reference rectangle is the frame's intended upright rectangle: the frame
 * dimensions for portrait recordings, and the same dimensions swapped for
 * landscape recordings.
 */
class StabilizationTransformBuilder {
public:
    /**
     * @brief Builds the transform for one frame.
     * @param effectiveAngle Tilt minus baseline, in radians
     * @param dims Dimensions of the captured frames
     * @param orientation Baseline orientation of the recording
     * @return Rotation and scale to apply. A non-finite angle yields the
     *         identity transform so the frame is passed through unstabilized.
     * @throws std::invalid_argument if dims has a zero width or height
     */
    static StabilizationTransform build(double effectiveAngle, const FrameDimensions& dims,
                                        BaselineOrientation orientation);

    /**
     * @brief Returns the intended upright rectangle of a recording.
     * @param dims Dimensions of the captured frames
     * @param orientation Baseline orientation of the recording
     * @return dims for portrait, dims swapped for landscape
     */
    static FrameDimensions referenceDimensions(const FrameDimensions& dims,
                                               BaselineOrientation orientation);

    /**
     * @brief Minimum scale covering the reference rectangle rotated by theta.
     * @param theta Rotation in radians
     * @param reference Reference (upright) rectangle, must be valid
     * @return Scale factor, never below 1.0
     */
    static double coverScale(double theta, const FrameDimensions& reference);
};

} // namespace TiltStabilizer
