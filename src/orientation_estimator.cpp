#include "orientation_estimator.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace TiltStabilizer {

OrientationEstimator::OrientationEstimator(const EstimatorOptions& options)
    : options_(options)
{
    if (!(options.smoothingFactor >= 0.0 && options.smoothingFactor < 1.0)) {
        throw std::invalid_argument("OrientationEstimator: smoothingFactor must be in [0, 1), got "
                                    + std::to_string(options.smoothingFactor));
    }
}

double OrientationEstimator::tiltFromGravity(double x, double y) {
    double angle = std::atan2(y, x) - M_PI_2;
    angle += M_PI;   // sensor is mounted upside down relative to the image
    angle = -angle;
    // atan2 is in (-pi, pi], so angle is in [-3pi/2, pi/2): one correction suffices
    return normalizeAngle(angle);
}

void OrientationEstimator::ingest(const GravitySample& sample) {
    sampleCount_.fetch_add(1, std::memory_order_relaxed);

    const bool finite = std::isfinite(sample.x) && std::isfinite(sample.y);
    if (!finite || (sample.x == 0.0 && sample.y == 0.0)) {
        degenerateCount_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    const double raw = tiltFromGravity(sample.x, sample.y);

    double angle = raw;
    if (hasSample_.load(std::memory_order_relaxed)) {
        const double alpha = options_.smoothingFactor;
        // Blend along the shortest arc. Both angles are in (-pi, pi], so the
        // difference is in (-2pi, 2pi) and the result stays in range.
        const double delta = normalizeAngle(raw - previousAngle_);
        angle = normalizeAngle(previousAngle_ + (1.0 - alpha) * delta);
    }

    previousAngle_ = angle;
    currentAngle_.store(angle, std::memory_order_release);
    hasSample_.store(true, std::memory_order_release);
}

bool OrientationEstimator::ingestLatest(const SampleMailbox<GravitySample>& mailbox) {
    GravitySample sample;
    if (!mailbox.tryReadNew(sample, lastMailboxSequence_)) {
        return false;
    }
    ingest(sample);
    return true;
}

} // namespace TiltStabilizer
