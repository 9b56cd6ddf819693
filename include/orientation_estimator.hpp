#pragma once

#include "orientation_types.hpp"
#include "sample_mailbox.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>

namespace TiltStabilizer {

/**
 * @brief Tuning of the orientation estimator.
 */
struct EstimatorOptions {
    /// Weight of the previous angle in the exponential filter, in [0, 1).
    /// 0 disables smoothing, 0.9 keeps 90% of the history on every sample.
    double smoothingFactor{0.9};
};

/**
 * @brief Converts raw gravity samples into a smoothed device tilt angle.
 *
 * The estimator runs continuously, independent of whether a recording is in
 * progress. It is written from exactly one context (the sensor callback, or the
 * thread draining a gravity mailbox) and may be read from any number of others,
 * typically the frame-processing thread. The current angle is published
 * through a single atomic double, so a reader always observes a complete value
 * and never blocks the writer.
 *
 * Conversion of a sample (x, y) to a tilt angle:
 * 1. raw = atan2(y, x) - pi/2
 * 2. raw += pi (device mounting correction)
 * 3. raw = -raw
 * 4. raw is normalized into (-pi, pi]
 *
 * The raw angle is then blended with the previous estimate:
 *   angle = alpha * previous + (1 - alpha) * raw
 * measured along the shortest arc between the two, so the filter does not
 * sweep through zero when the device crosses the +/-pi boundary.
 *
 * @note A sample with x == 0 and y == 0 carries no tilt information (the
 *       device lies flat). It is counted and ignored, keeping the previous angle.
 */
class OrientationEstimator {
public:
    /**
     * @brief Constructs an estimator.
     * @param options Smoothing configuration
     * @throws std::invalid_argument if options.smoothingFactor is outside [0, 1)
     */
    explicit OrientationEstimator(const EstimatorOptions& options = EstimatorOptions());

    /**
     * @brief Feeds one gravity sample. Writer side, O(1).
     * @param sample Gravity sample from the motion sensor
     */
    void ingest(const GravitySample& sample);

    /**
     * @brief Feeds the newest sample of a mailbox if one arrived since the last call.
     * @param mailbox Mailbox the sensor publishes into
     * @return true if a new sample was ingested
     */
    bool ingestLatest(const SampleMailbox<GravitySample>& mailbox);

    /**
     * @brief Latest smoothed tilt angle in (-pi, pi]. Reader side, lock-free.
     * @return The current angle, or 0 if no sample has been received yet
     */
    double currentAngle() const {
        return currentAngle_.load(std::memory_order_acquire);
    }

    /// True once at least one usable sample has been ingested.
    bool hasSample() const { return hasSample_.load(std::memory_order_acquire); }

    /// Number of samples received, degenerate ones included.
    uint64_t sampleCount() const { return sampleCount_.load(std::memory_order_relaxed); }

    /// Number of samples ignored because their tilt was undefined.
    uint64_t degenerateCount() const { return degenerateCount_.load(std::memory_order_relaxed); }

    const EstimatorOptions& options() const { return options_; }

    /**
     * @brief Raw, unsmoothed tilt angle of a gravity vector.
     *
     * @param x Gravity along the device X axis
     * @param y Gravity along the device Y axis
     * @return Angle in (-pi, pi]. Undefined for x == y == 0, callers must check.
     */
    static double tiltFromGravity(double x, double y);

private:
    EstimatorOptions options_;

    // Writer-only state
    double previousAngle_{0.0};
    uint32_t lastMailboxSequence_{0};

    std::atomic<double> currentAngle_{0.0};
    std::atomic<bool> hasSample_{false};
    std::atomic<uint64_t> sampleCount_{0};
    std::atomic<uint64_t> degenerateCount_{0};
};

} // namespace TiltStabilizer
