#include "frame_warper.hpp"
#include <opencv2/core.hpp>
#include <cmath>
#include <iostream>
#include <new>

namespace TiltStabilizer {

FrameWarper::FrameWarper(const WarperOptions& options)
    : options_(options)
{
}

cv::Mat FrameWarper::composeWarpMatrix(const StabilizationTransform& transform, const FrameDimensions& dims) {
    const cv::Point2d center(dims.width / 2.0, dims.height / 2.0);

    cv::Mat to_origin = (cv::Mat_<double>(3, 3) <<
                         1, 0, -center.x,
                         0, 1, -center.y,
                         0, 0, 1);

    const double cos_theta = std::cos(transform.rotationRadians);
    const double sin_theta = std::sin(transform.rotationRadians);
    // Image rows grow downwards, so a positive angle turns the picture
    // counter-clockwise on screen, as cv::getRotationMatrix2D does.
    cv::Mat rotation = (cv::Mat_<double>(3, 3) <<
                         cos_theta, sin_theta, 0,
                        -sin_theta, cos_theta, 0,
                         0,         0,         1);

    cv::Mat scaling = (cv::Mat_<double>(3, 3) <<
                       transform.scale, 0,               0,
                       0,               transform.scale, 0,
                       0,               0,               1);

    cv::Mat from_origin = (cv::Mat_<double>(3, 3) <<
                           1, 0, center.x,
                           0, 1, center.y,
                           0, 0, 1);

    // Applied right to left: the pivot has to be at the origin before rotating
    // and scaling, otherwise the image drifts off-frame.
    cv::Mat H = from_origin * scaling * rotation * to_origin;
    return H.rowRange(0, 2).clone();
}

bool FrameWarper::warp(const cv::Mat& frame, const StabilizationTransform& transform,
                       const FrameDimensions& dims, cv::Mat& output) const {
    // frame and output may refer to the same cv::Mat
    const cv::Mat source = frame;
    output.release();

    if (source.empty()) {
        std::cerr << "Error: FrameWarper: empty input frame, dropping it" << std::endl;
        return false;
    }
    if (!dims.isValid()) {
        std::cerr << "Error: FrameWarper: invalid output dimensions "
                  << dims.width << "x" << dims.height << std::endl;
        return false;
    }

    const cv::Mat M = composeWarpMatrix(transform, dims);

    try {
        cv::Mat warped(dims.toSize(), source.type());
        cv::warpAffine(source, warped, M, dims.toSize(), options_.interpolation,
                       cv::BORDER_CONSTANT, options_.borderValue);
        output = warped;
    } catch (const cv::Exception& e) {
        std::cerr << "Error: FrameWarper: failed to render warped frame: " << e.what() << std::endl;
        output.release();
        return false;
    } catch (const std::bad_alloc& e) {
        std::cerr << "Error: FrameWarper: failed to allocate output frame: " << e.what() << std::endl;
        output.release();
        return false;
    }

    return true;
}

} // namespace TiltStabilizer
