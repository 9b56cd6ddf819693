#include "orientation_estimator.hpp"
#include "stabilization_session.hpp"
#include "sample_mailbox.hpp"
#include "device_simulator.hpp"
#include "main_utils.hpp"
#include <opencv2/opencv.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

using namespace cv;
using namespace std;
using namespace TiltStabilizer;

// ASCII code for the ESC key, used for graceful program termination.
static const int ESC_KEY = 27;

/**
 * Main entry point of the tilt stabilization demo.
 *
 * @param argc Number of command line arguments passed to the program
 * @param argv Array of command line argument strings
 *
 * @return EXIT_SUCCESS (0) on successful completion, EXIT_FAILURE (1) on error
 *
 * @section tilt_stabilization TILT STABILIZATION
 * A handheld camera rarely stays level. The stabilizer reads the device's
 * gravity vector, derives how far the device is rolled away from the upright it
 * had when recording started, and rotates every frame back by that angle. The
 * rotated frame is enlarged just enough that no empty corner becomes visible.
 *
 * This program stands in for the capture pipeline around the stabilizer. A
 * DeviceSimulator plays the part of both the motion sensor and the camera: it
 * tilts the input frames by a simulated device roll and reports the matching
 * gravity vector.
 *
 * The program supports three input modes:
 * - A static scene image (--simulator)
 * - Live webcam input (--camera)
 * - Pre-recorded video file (--file)
 *
 * @section threads THREADS
 * - Sensor thread: publishes simulated gravity samples at --sensor-rate into a mailbox.
 * - Orientation thread: drains the gravity mailbox into the OrientationEstimator.
 * - Processing thread: takes the latest captured frame from the frame mailbox,
 *   stabilizes it and hands it to the display sink.
 * - Main thread: captures and tilts frames, handles keys and displays windows.
 *
 * @section keyboard_controls KEYBOARD CONTROLS
 *       - R: Start recording (captures the baseline)
 *       - S: Stop recording
 *       - Q: Roll device counter-clockwise
 *       - E: Roll device clockwise
 *       - P: Reset device roll
 *       - ESC: Exit the program gracefully
 *
 * Exceptions thrown by OpenCV inside the main loop end the program with
 * EXIT_FAILURE after the worker threads are joined and the windows closed.
 */
int main(int argc, char* argv[]) {
  double fps = 0.0;  // Frames per second of the input source
  DemoConfig config;

  if (!parseCommandLineArgs(argc, argv, config)) {
    return EXIT_FAILURE;
  }

  std::shared_ptr<DeviceSimulator> simulator;
  VideoCapture cap;  // For camera and file modes

  if (!initializeInputSource(config, fps, simulator, cap)) {
    return EXIT_FAILURE;
  }
  const DeviceSimulator::DeviceParams default_params = simulator->getDeviceParams();
  std::mutex simulatorMutex;  // Device state is changed by keys and read by the sensor thread

  EstimatorOptions estimatorOptions;
  estimatorOptions.smoothingFactor = config.smoothingFactor;
  OrientationEstimator estimator(estimatorOptions);

  SessionOptions sessionOptions;
  sessionOptions.verbose = config.verbose;
  StabilizationSession session(estimator, sessionOptions);

  SampleMailbox<GravitySample> gravityMailbox;
  SampleMailbox<Frame> captureMailbox;
  SampleMailbox<Frame> outputMailbox;
  DisplaySink displaySink(outputMailbox);

  std::atomic<bool> running{true};
  WorkerGroup workers(running);
  const auto t0 = chrono::steady_clock::now();
  auto secondsSinceStart = [t0]() {
    return chrono::duration<double>(chrono::steady_clock::now() - t0).count();
  };

  // --- Sensor thread: simulated motion sensor ---
  workers.spawn([&]() {
    const auto period = chrono::duration<double>(1.0 / config.sensorRateHz);
    while (running.load()) {
      GravitySample sample;
      {
        std::lock_guard<std::mutex> lock(simulatorMutex);
        sample = simulator->gravitySample(secondsSinceStart());
      }
      gravityMailbox.publish(sample);
      std::this_thread::sleep_for(period);
    }
  });

  // --- Orientation thread: sole writer of the estimator ---
  workers.spawn([&]() {
    while (running.load()) {
      if (!estimator.ingestLatest(gravityMailbox)) {
        std::this_thread::sleep_for(chrono::milliseconds(1));
      }
    }
  });

  // --- Processing thread: stabilizes the latest captured frame ---
  workers.spawn([&]() {
    uint32_t lastCaptureSeq = 0;
    Frame frame;
    while (running.load()) {
      if (!captureMailbox.tryReadNew(frame, lastCaptureSeq)) {
        std::this_thread::sleep_for(chrono::milliseconds(1));
        continue;
      }
      // Rejected while idle and dropped on warp failure; both only skip this frame
      session.processFrame(frame, displaySink);
    }
  });

  namedWindow("Captured (tilted)", WINDOW_NORMAL);
  namedWindow("Stabilized Output", WINDOW_NORMAL);
  cout << "\nControls:\n"
       << " R: Start recording\n"
       << " S: Stop recording\n"
       << " Q/E: Roll Counter-Clockwise / Clockwise\n"
       << " P: Reset device roll\n"
       << " ESC: Exit\n" << endl;

  uint32_t lastOutputSeq = 0;
  const double frameInterval = 1.0 / fps;

  // --- Main Interaction Loop ---
  int exitCode = EXIT_SUCCESS;
  try {
    while (true) {
      auto start = chrono::high_resolution_clock::now();

      int key = waitKey(1);
      if (key == ESC_KEY) {
        cout << "ESC pressed, exiting." << endl;
        break;
      }

      cv::Mat upright;
      if (!captureUprightFrame(config, cap, *simulator, upright)) {
        break;
      }
      const FrameDimensions dims{static_cast<uint32_t>(upright.cols), static_cast<uint32_t>(upright.rows)};

      cv::Mat tilted;
      double roll = 0.0;
      {
        std::lock_guard<std::mutex> lock(simulatorMutex);
        handleDeviceControls(key, *simulator, default_params);
        tilted = simulator->tiltFrame(upright);
        roll = simulator->currentRollDegrees();
        simulator->advance(frameInterval);
      }

      handleRecordingControls(key, session, config, dims, gravityMailbox.readLatest());

      captureMailbox.publish(Frame{tilted, secondsSinceStart()});

      auto stop = chrono::high_resolution_clock::now();
      auto duration = chrono::duration_cast<chrono::milliseconds>(stop - start);
      double loopFps = (duration.count() > 0) ? 1000.0 / duration.count() : 2000.0;

      cv::Mat shown = tilted.clone();
      addFrameOverlays(shown, roll, session, loopFps);
      imshow("Captured (tilted)", shown);

      Frame stabilized;
      if (outputMailbox.tryReadNew(stabilized, lastOutputSeq)) {
        imshow("Stabilized Output", stabilized.image);
      }

      // A static scene has no frame clock of its own
      if (config.mode == InputMode::SIMULATOR) {
        std::this_thread::sleep_until(start + chrono::duration_cast<chrono::high_resolution_clock::duration>(
                                                  chrono::duration<double>(frameInterval)));
      }
    }
  } catch (const cv::Exception& e) {
    cerr << "Error: OpenCV failure in the main loop: " << e.what() << endl;
    exitCode = EXIT_FAILURE;
  }

  workers.stop();
  session.stop();

  cleanup();
  return exitCode;
}
