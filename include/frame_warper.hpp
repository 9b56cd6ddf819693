#pragma once

#include "orientation_types.hpp"
#include <opencv2/imgproc.hpp>

namespace TiltStabilizer {

/**
 * @brief Rendering options of the frame warper.
 */
struct WarperOptions {
    int interpolation{cv::INTER_LINEAR};  ///< OpenCV interpolation flag
    cv::Scalar borderValue{cv::Scalar()};  ///< Fill for pixels not covered by the source
};

/**
 * @brief Applies a stabilization transform to image buffers.
 *
 * The warper is stateless beyond its options and can be shared between
 * threads. Every call renders into a freshly allocated output of exactly the
 * session's frame dimensions, so the downstream encoder never sees a varying
 * frame size, even when a partial or late frame of a different size arrives.
 */
class FrameWarper {
public:
    explicit FrameWarper(const WarperOptions& options = WarperOptions());

    /**
     * @brief Warps one frame.
     *
     * The transform is applied about the centre of the output rectangle:
     * translate(-centre), rotate(theta), scale(s), translate(+centre).
     *
     * @param frame Source image
     * @param transform Rotation and scale to apply
     * @param dims Dimensions of the output image
     * @param output Receives the warped image on success. Left empty on failure.
     * @return true on success. false if the frame is empty, the dimensions are
     *         invalid, or the output could not be allocated or rendered. The
     *         caller is expected to drop the frame.
     */
    bool warp(const cv::Mat& frame, const StabilizationTransform& transform,
              const FrameDimensions& dims, cv::Mat& output) const;

    /**
     * @brief Composes the 2x3 affine matrix mapping source to output pixel coordinates.
     *
     * M = T(+c) * S(s) * R(theta) * T(-c), where c = (width / 2, height / 2) and
     * R(theta) = [cos sin; -sin cos] in image coordinates (y down). A positive
     * theta turns the picture counter-clockwise on screen; the result equals
     * cv::getRotationMatrix2D(c, theta in degrees, s).
     *
     * @param transform Rotation and scale to apply
     * @param dims Output dimensions, defining the centre of rotation
     * @return 2x3 CV_64F matrix
     */
    static cv::Mat composeWarpMatrix(const StabilizationTransform& transform, const FrameDimensions& dims);

    const WarperOptions& options() const { return options_; }

private:
    WarperOptions options_;
};

} // namespace TiltStabilizer
