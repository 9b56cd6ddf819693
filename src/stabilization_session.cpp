#include "stabilization_session.hpp"
#include "baseline_calibrator.hpp"
#include "transform_builder.hpp"
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace TiltStabilizer {

StabilizationSession::StabilizationSession(const OrientationEstimator& estimator,
                                           const SessionOptions& options)
    : estimator_(estimator), options_(options), warper_(options.warper)
{
    if (options.logInterval <= 0)
        throw std::invalid_argument("StabilizationSession: logInterval must be positive, got "
                                    + std::to_string(options.logInterval));
}

bool StabilizationSession::start(BaselineOrientation orientation, const FrameDimensions& dims) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (state_.load(std::memory_order_relaxed) != SessionState::Idle) {
        std::cerr << "Warning: StabilizationSession: start() ignored, a recording is already in progress" << std::endl;
        return false;
    }
    if (!dims.isValid()) {
        std::cerr << "Error: StabilizationSession: cannot start with frame dimensions "
                  << dims.width << "x" << dims.height << std::endl;
        return false;
    }

    state_.store(SessionState::Calibrating, std::memory_order_release);

    const double tilt = estimator_.currentAngle();
    if (!estimator_.hasSample()) {
        std::cerr << "Warning: StabilizationSession: no orientation sample received yet, calibrating from "
                  << tilt << " rad" << std::endl;
    }

    baselineAngle_ = BaselineCalibrator::captureBaseline(tilt, orientation);
    baselineOrientation_ = orientation;
    dims_ = dims;
    framesProcessed_.store(0, std::memory_order_relaxed);
    framesDropped_.store(0, std::memory_order_relaxed);
    framesRejected_.store(0, std::memory_order_relaxed);

    std::cout << "Recording started. Baseline orientation: " << toString(orientation)
              << ", baseline angle: " << radiansToDegrees(baselineAngle_) << " deg"
              << ", frame size: " << dims.width << "x" << dims.height << std::endl;

    // Releasing the exclusive lock publishes the baseline to frame threads
    state_.store(SessionState::Active, std::memory_order_release);
    return true;
}

void StabilizationSession::stop() {
    // Waits for shared holders, i.e. frames being warped right now
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (state_.load(std::memory_order_relaxed) != SessionState::Active) {
        return;
    }

    std::cout << "Recording stopped. Frames processed: " << framesProcessed_.load(std::memory_order_relaxed)
              << ", dropped: " << framesDropped_.load(std::memory_order_relaxed) << std::endl;

    baselineAngle_ = 0.0;
    baselineOrientation_ = BaselineOrientation::Portrait;
    dims_ = FrameDimensions{};
    state_.store(SessionState::Idle, std::memory_order_release);
}

double StabilizationSession::effectiveAngleLocked() const {
    return normalizeAngle(estimator_.currentAngle() - baselineAngle_);
}

StabilizationTransform StabilizationSession::transformLocked() const {
    return StabilizationTransformBuilder::build(effectiveAngleLocked(), dims_, baselineOrientation_);
}

std::optional<StabilizationTransform> StabilizationSession::currentTransform() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (state_.load(std::memory_order_acquire) != SessionState::Active) {
        return std::nullopt;
    }
    return transformLocked();
}

bool StabilizationSession::processFrame(const Frame& input, Frame& output) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (state_.load(std::memory_order_acquire) != SessionState::Active) {
        framesRejected_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    const double tilt = estimator_.currentAngle();
    const double effective = normalizeAngle(tilt - baselineAngle_);
    const StabilizationTransform transform =
        StabilizationTransformBuilder::build(effective, dims_, baselineOrientation_);

    cv::Mat warped;
    if (!warper_.warp(input.image, transform, dims_, warped)) {
        framesDropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    output.image = warped;
    output.timestamp = input.timestamp;

    const uint64_t processed = framesProcessed_.fetch_add(1, std::memory_order_relaxed) + 1;
    if (options_.verbose && processed % static_cast<uint64_t>(options_.logInterval) == 0) {
        logDiagnostics(tilt, effective, transform);
    }
    return true;
}

bool StabilizationSession::processFrame(const Frame& input, IFrameSink& sink) {
    Frame output;
    if (!processFrame(input, output)) {
        return false;
    }
    sink.consume(output);
    return true;
}

double StabilizationSession::baselineAngle() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return baselineAngle_;
}

BaselineOrientation StabilizationSession::baselineOrientation() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return baselineOrientation_;
}

FrameDimensions StabilizationSession::dimensions() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return dims_;
}

double StabilizationSession::effectiveAngle() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (state_.load(std::memory_order_acquire) != SessionState::Active) {
        return 0.0;
    }
    return effectiveAngleLocked();
}

SessionStatistics StabilizationSession::statistics() const {
    SessionStatistics stats;
    stats.framesProcessed = framesProcessed_.load(std::memory_order_relaxed);
    stats.framesDropped = framesDropped_.load(std::memory_order_relaxed);
    stats.framesRejected = framesRejected_.load(std::memory_order_relaxed);
    return stats;
}

void StabilizationSession::logDiagnostics(double tilt, double effective,
                                          const StabilizationTransform& transform) const {
    const FrameDimensions reference =
        StabilizationTransformBuilder::referenceDimensions(dims_, baselineOrientation_);
    std::cout << "--- Stabilization (sampled) ---" << std::endl;
    std::cout << "  tiltAngle: " << tilt << " rad, effectiveAngle: " << effective
              << " rad (" << radiansToDegrees(effective) << " deg)" << std::endl;
    std::cout << "  baseline: " << toString(baselineOrientation_) << " "
              << radiansToDegrees(baselineAngle_) << " deg, reference: "
              << reference.width << "x" << reference.height << std::endl;
    std::cout << "  scale: " << transform.scale << std::endl;
    std::cout << "  " << describeDeviceRotation(effective) << std::endl;
}

} // namespace TiltStabilizer
