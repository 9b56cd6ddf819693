#pragma once

#include "orientation_types.hpp"
#include <opencv2/opencv.hpp>
#include <string>

namespace TiltStabilizer {

/**
 * @brief Simulates a handheld camera whose roll is fully controllable.
 *
 * The DeviceSimulator stands in for the two external producers of the
 * stabilization pipeline: the motion sensor and the camera. It keeps a device
 * roll angle and derives from it both
 * - the gravity vector a motion sensor would report at that roll, and
 * - the frame a camera at that roll would capture from an upright scene.
 *
 * The two are consistent with each other: an OrientationEstimator fed the
 * simulated gravity reports the roll as its tilt angle, and warping the tilted
 * frame by that angle brings the scene back upright.
 *
 * A sinusoidal hand wobble can be superimposed on the roll to mimic an unsteady
 * grip. The scene is either a static image loaded from disk or frames supplied
 * by the caller (camera or video file).
 *
 * @note This class serves as a debugging tool for the stabilization pipeline
 * by providing precise, repeatable roll motion.
 */
class DeviceSimulator {
public:
    /**
     * @brief Structure to hold the simulated device state.
     */
    struct DeviceParams {
        double roll = 0.0;              ///< Device roll in degrees, positive counter-clockwise. The captured scene turns clockwise on screen.
        double wobbleAmplitude = 0.0;   ///< Peak amplitude of the hand wobble in degrees, 0 disables it.
        double wobbleFrequency = 0.5;   ///< Wobble frequency in Hz.
        double gravityMagnitude = 1.0;  ///< Length of the reported gravity vector (1.0 = units of g).
        double faceTilt = 0.0;          ///< Pitch of the screen away from vertical in degrees, moves gravity onto Z.

        DeviceParams() = default;

        /**
         * @brief Parameterized constructor.
         * @param roll Roll angle in degrees.
         * @param wobbleAmplitude Wobble amplitude in degrees.
         * @param wobbleFrequency Wobble frequency in Hz.
         */
        DeviceParams(double roll, double wobbleAmplitude, double wobbleFrequency)
            : roll(roll), wobbleAmplitude(wobbleAmplitude), wobbleFrequency(wobbleFrequency) {}
    };

    /**
     * @brief Constructs a simulator without a scene image. Frames must be
     * supplied to tiltFrame().
     * @param params Initial device state
     */
    explicit DeviceSimulator(const DeviceParams& params = DeviceParams());

    /**
     * @brief Constructs a simulator capturing a static scene.
     * @param sceneImagePath Path to the image shown to the simulated camera.
     * @param params Initial device state
     * @throws std::runtime_error if the scene image cannot be loaded.
     */
    DeviceSimulator(const std::string& sceneImagePath, const DeviceParams& params = DeviceParams());

    /**
     * @brief Advances simulated time, moving the wobble forward.
     * @param seconds Elapsed time in seconds, must not be negative
     */
    void advance(double seconds);

    /**
     * @brief Current device roll in degrees, wobble included.
     */
    double currentRollDegrees() const;

    /**
     * @brief Gravity vector reported by the motion sensor at the current roll.
     * @param timestamp Timestamp stamped on the sample, in seconds
     * @return Gravity sample in device coordinates
     */
    GravitySample gravitySample(double timestamp) const;

    /**
     * @brief Renders what the camera would capture of an upright frame at the current roll.
     * @param upright Frame as seen by a perfectly level camera
     * @return Tilted frame of the same size and type. Uncovered corners are black.
     */
    cv::Mat tiltFrame(const cv::Mat& upright) const;

    /**
     * @brief Rolls the device clockwise.
     * @param amount The amount to roll in degrees, scaled by the current roll speed.
     */
    void rollClockwise(double amount);

    /**
     * @brief Rolls the device counter-clockwise.
     * @param amount The amount to roll in degrees, scaled by the current roll speed.
     */
    void rollCounterClockwise(double amount);

    /**
     * @brief Restores the given device state and rewinds the wobble.
     */
    void reset(const DeviceParams& params);

    bool hasScene() const { return !m_scene.empty(); }

    /// Upright scene image, empty if the simulator was built without one.
    const cv::Mat& scene() const { return m_scene; }

    DeviceParams& getDeviceParams() { return m_params; }

    double getRollSpeed() const { return m_rollSpeed; }
    void setRollSpeed(double speed) { m_rollSpeed = speed; }

private:
    DeviceParams m_params;
    cv::Mat m_scene;
    double m_time;
    double m_rollSpeed;
};

} // namespace TiltStabilizer
