#pragma once

#include "orientation_types.hpp"
#include "orientation_estimator.hpp"
#include "stabilization_session.hpp"
#include "sample_mailbox.hpp"
#include "device_simulator.hpp"
#include <opencv2/opencv.hpp>
#include <memory>
#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace TiltStabilizer {

enum class InputMode {
  UNSPECIFIED,
  SIMULATOR,
  CAMERA,
  FILE
};

struct DemoConfig {
  // Defaults overridden by optional command line arguments
  InputMode mode = InputMode::UNSPECIFIED;
  std::string path;                 // Scene image for --simulator, video for --file
  int cameraId = 0;                 // Camera ID for --camera mode
  double smoothingFactor = 0.9;     // Orientation smoothing, weight of history
  std::optional<BaselineOrientation> forcedOrientation;  // Unset: classify from gravity
  double wobbleDegrees = 0.0;       // Simulated hand wobble amplitude
  double sensorRateHz = 60.0;       // Simulated motion sensor rate
  bool verbose = false;             // Periodic stabilization diagnostics
};

/**
 * Parses command line arguments and populates the DemoConfig structure.
 *
 * @param argc Number of command line arguments
 * @param argv Array of command line argument strings
 * @param config Output parameter that will store the parsed configuration
 *
 * @return true if arguments were parsed successfully, false otherwise
 *
 * @note Validates:
 *       - Exactly one input mode (--simulator, --camera, or --file) is specified
 *       - Required values are provided for the chosen mode
 *       - --smoothing is in [0, 1), --wobble is non-negative, --sensor-rate
 *         is between 1 and 1000 Hz
 *       - --portrait and --landscape are not both given
 */
bool parseCommandLineArgs(int argc, char* argv[], DemoConfig& config);

/**
 * Prints usage information and command line options to stdout.
 *
 * @param programName Name of the program executable
 */
void printUsage(const char* programName);

/**
 * Initializes the video input source and the device simulator.
 *
 * @param config Configuration specifying input mode and related parameters
 * @param fps Output parameter that will store the frames per second of the video source
 * @param simulator Receives the device simulator. In simulator mode it also owns the scene image.
 * @param cap OpenCV VideoCapture object for camera/file input modes (unopened in simulator mode)
 *
 * @return true if initialization succeeds, false if the camera or file cannot be opened
 *
 * @note Camera and file modes default to 30 fps when the source reports none.
 *
 * @throws std::runtime_error If the scene image cannot be loaded in simulator mode
 */
bool initializeInputSource(const DemoConfig& config, double& fps,
                           std::shared_ptr<DeviceSimulator>& simulator,
                           cv::VideoCapture& cap);

/**
 * Captures the next upright frame, i.e. what a perfectly level camera would see.
 *
 * @return false at the end of the input or on capture failure
 */
bool captureUprightFrame(const DemoConfig& config, cv::VideoCapture& cap,
                         const DeviceSimulator& simulator, cv::Mat& frame);

/**
 * Processes keyboard input controlling the simulated device.
 *
 * @note Supported keyboard controls:
 *       - 'Q'/'E': Roll device counter-clockwise/clockwise
 *       - 'P': Reset device roll and wobble
 *
 * @return true if a device command was processed, false otherwise
 */
bool handleDeviceControls(int key, DeviceSimulator& simulator,
                          const DeviceSimulator::DeviceParams& default_params);

/**
 * Processes keyboard input controlling the recording.
 *
 * @note Supported keyboard controls:
 *       - 'R': Start recording. The baseline orientation is the forced one, or
 *              classified from the latest gravity sample.
 *       - 'S': Stop recording
 */
void handleRecordingControls(int key, StabilizationSession& session,
                             const DemoConfig& config, const FrameDimensions& dims,
                             const GravitySample& latest_gravity);

/**
 * Adds the device roll, session state and FPS overlays to a frame.
 */
void addFrameOverlays(cv::Mat& frame, double roll_degrees,
                      const StabilizationSession& session, double fps);

/**
 * Frame sink standing in for the encoder: forwards stabilized frames to the
 * display thread through a mailbox.
 */
class DisplaySink : public IFrameSink {
public:
  explicit DisplaySink(SampleMailbox<Frame>& mailbox) : mailbox_(mailbox) {}

  void consume(const Frame& frame) override { mailbox_.publish(frame); }

private:
  SampleMailbox<Frame>& mailbox_;
};

/**
 * Background threads of the demo, stopped and joined when the group goes out of
 * scope. Every worker loops while the shared running flag is set; stop() clears
 * the flag and joins them, also when the main loop leaves through an exception.
 */
class WorkerGroup {
public:
  explicit WorkerGroup(std::atomic<bool>& running) : running_(running) {}
  ~WorkerGroup() { stop(); }

  WorkerGroup(const WorkerGroup&) = delete;
  WorkerGroup& operator=(const WorkerGroup&) = delete;

  template <typename Fn>
  void spawn(Fn&& fn) { threads_.emplace_back(std::forward<Fn>(fn)); }

  void stop();

  size_t size() const { return threads_.size(); }

private:
  std::atomic<bool>& running_;
  std::vector<std::thread> threads_;
};

/**
 * Performs cleanup operations and releases resources before program termination.
 */
void cleanup();

} // namespace TiltStabilizer
