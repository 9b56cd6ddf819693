#include "transform_builder.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace TiltStabilizer {

FrameDimensions StabilizationTransformBuilder::referenceDimensions(const FrameDimensions& dims,
                                                                   BaselineOrientation orientation) {
    if (orientation == BaselineOrientation::Landscape) {
        return dims.swapped();
    }
    return dims;
}

double StabilizationTransformBuilder::coverScale(double theta, const FrameDimensions& reference) {
    const double ref_w = static_cast<double>(reference.width);
    const double ref_h = static_cast<double>(reference.height);

    const double cos_theta = std::abs(std::cos(theta));
    const double sin_theta = std::abs(std::sin(theta));

    // Axis-aligned bounding box of the reference rectangle rotated by theta
    const double rotated_w = ref_w * cos_theta + ref_h * sin_theta;
    const double rotated_h = ref_w * sin_theta + ref_h * cos_theta;

    const double scale = std::max(rotated_w / ref_w, rotated_h / ref_h);
    // |cos| + |sin| >= 1 guarantees this mathematically; clamp rounding noise
    return std::max(scale, 1.0);
}

StabilizationTransform StabilizationTransformBuilder::build(double effectiveAngle,
                                                            const FrameDimensions& dims,
                                                            BaselineOrientation orientation) {
    if (!dims.isValid()) {
        throw std::invalid_argument("StabilizationTransformBuilder: invalid frame dimensions "
                                    + std::to_string(dims.width) + "x" + std::to_string(dims.height));
    }

    if (!std::isfinite(effectiveAngle)) {
        std::cerr << "Warning: StabilizationTransformBuilder: non-finite angle, frame left unstabilized" << std::endl;
        return StabilizationTransform{};
    }

    const FrameDimensions reference = referenceDimensions(dims, orientation);

    StabilizationTransform transform;
    transform.rotationRadians = effectiveAngle;
    transform.scale = coverScale(effectiveAngle, reference);
    return transform;
}

} // namespace TiltStabilizer
