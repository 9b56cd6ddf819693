#pragma once

#include "orientation_types.hpp"
#include "orientation_estimator.hpp"
#include "frame_warper.hpp"
#include <atomic>
#include <cstdint>
#include <optional>
#include <shared_mutex>

namespace TiltStabilizer {

/**
 * @brief Receiver of stabilized frames, typically an encoder or writer owned by
 * the capture pipeline.
 */
class IFrameSink {
public:
    virtual ~IFrameSink() = default;

    /// Called once per stabilized frame, on the frame-processing thread.
    virtual void consume(const Frame& frame) = 0;
};

/**
 * @brief Options of a stabilization session.
 */
struct SessionOptions {
    bool verbose{false};      ///< Periodically log angle and scale diagnostics
    int logInterval{30};      ///< Frames between two diagnostic logs when verbose
    WarperOptions warper{};   ///< Rendering options of the frame warper
};

/**
 * @brief Frame counters of the current (or last) recording.
 */
struct SessionStatistics {
    uint64_t framesProcessed{0};  ///< Frames warped and returned
    uint64_t framesDropped{0};    ///< Frames lost to a warp failure
    uint64_t framesRejected{0};   ///< Frames offered while no recording was active
};

/**
 * @brief Stabilization context of one recording.
 *
 * State machine: Idle -> Calibrating -> Active -> Idle.
 *
 * - Idle: the estimator keeps running, but no frame is warped.
 * - start(): captures the quantized baseline from the estimator's current
 *   angle (Calibrating) and becomes Active. Synchronous, completes before the
 *   first frame is warped. Rejected while a recording is already in progress.
 * - Active: every frame is rotated by the effective angle (tilt minus baseline)
 *   and enlarged so no empty corners are exposed.
 * - stop(): waits for any frame currently being warped, then discards the
 *   baseline and returns to Idle.
 *
 * Session control (start/stop) and frame processing may run on different
 * threads. Frame processing holds a shared lock for the whole warp, control
 * calls take the lock exclusively, so a frame never observes a half-written
 * baseline and stop() drains in-flight frames.
 */
class StabilizationSession {
public:
    /**
     * @brief Constructs an idle session reading from the given estimator.
     * @param estimator Orientation estimator, must outlive the session
     * @param options Session options
     * @throws std::invalid_argument if options.logInterval is not positive
     */
    explicit StabilizationSession(const OrientationEstimator& estimator,
                                  const SessionOptions& options = SessionOptions());

    /**
     * @brief Starts a recording.
     * @param orientation Coarse device orientation at record start
     * @param dims Dimensions of the frames that will be captured
     * @return true if the session became Active. false if a recording is already
     *         in progress (the existing baseline is kept) or dims is invalid.
     */
    bool start(BaselineOrientation orientation, const FrameDimensions& dims);

    /**
     * @brief Stops the recording, after any in-flight frame has been warped.
     * No-op while idle.
     */
    void stop();

    /**
     * @brief Transform to apply to a frame captured now.
     * @return The transform, or std::nullopt if no recording is active
     */
    std::optional<StabilizationTransform> currentTransform() const;

    /**
     * @brief Stabilizes one frame.
     *
     * @param input Captured frame
     * @param output Receives the stabilized frame with the input's timestamp.
     *               Left untouched when the result is false.
     * @return true on success. false if no recording is active (frame
     *         rejected) or the warp failed (frame dropped). Neither case
     *         changes the session state.
     */
    bool processFrame(const Frame& input, Frame& output);

    /**
     * @brief Stabilizes one frame and hands it to a sink on success.
     * @return true if the frame was delivered to the sink
     */
    bool processFrame(const Frame& input, IFrameSink& sink);

    SessionState state() const { return state_.load(std::memory_order_acquire); }

    /// Baseline angle of the active recording, 0 while idle.
    double baselineAngle() const;

    /// Baseline orientation of the active recording, Portrait while idle.
    BaselineOrientation baselineOrientation() const;

    /// Frame dimensions of the active recording, 0x0 while idle.
    FrameDimensions dimensions() const;

    /// Current tilt relative to the baseline, 0 while idle.
    double effectiveAngle() const;

    SessionStatistics statistics() const;

private:
    // Both require the caller to hold mutex_ (shared or exclusive)
    double effectiveAngleLocked() const;
    StabilizationTransform transformLocked() const;

    void logDiagnostics(double tilt, double effective, const StabilizationTransform& transform) const;

    const OrientationEstimator& estimator_;
    SessionOptions options_;
    FrameWarper warper_;

    mutable std::shared_mutex mutex_;
    std::atomic<SessionState> state_{SessionState::Idle};

    // Written under the exclusive lock in start()/stop(), read-only otherwise
    double baselineAngle_{0.0};
    BaselineOrientation baselineOrientation_{BaselineOrientation::Portrait};
    FrameDimensions dims_{};

    std::atomic<uint64_t> framesProcessed_{0};
    std::atomic<uint64_t> framesDropped_{0};
    std::atomic<uint64_t> framesRejected_{0};
};

} // namespace TiltStabilizer
