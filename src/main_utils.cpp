#include "main_utils.hpp"
#include "baseline_calibrator.hpp"
#include <cctype>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

using namespace cv;
using namespace std;

namespace TiltStabilizer {

static const double MAX_SENSOR_RATE_HZ = 1000.0;

void printUsage(const char* programName) {
  cout << "Usage: " << programName << " <input_mode> [options]" << endl;
  cout << endl;
  cout << "Input modes (required, choose one):" << endl;
  cout << "  --simulator <path>    Tilt a static scene image" << endl;
  cout << "  --camera <id>         Tilt frames of the camera with given ID (typically 0)" << endl;
  cout << "  --file <path>         Tilt frames of a video file" << endl;
  cout << endl;
  cout << "Optional parameters:" << endl;
  cout << "  --smoothing <alpha>      Orientation smoothing factor in [0, 1) (default: 0.9)" << endl;
  cout << "  --portrait               Record with a portrait baseline" << endl;
  cout << "  --landscape              Record with a landscape baseline" << endl;
  cout << "                           (default: classified from gravity at record start)" << endl;
  cout << "  --wobble <degrees>       Simulated hand wobble amplitude (default: 0)" << endl;
  cout << "  --sensor-rate <hz>       Simulated motion sensor rate (default: 60)" << endl;
  cout << "  --verbose                Print stabilization diagnostics every 30 frames" << endl;
  cout << endl;
  cout << "Examples:" << endl;
  cout << "  " << programName << " --camera 0 --wobble 5" << endl;
  cout << "  " << programName << " --file video.mp4 --smoothing 0.8 --landscape" << endl;
  cout << "  " << programName << " --simulator scene.jpg --verbose" << endl;
}

static const double DEFAULT_FPS = 30.0;

// Takes the value following flag, advancing i past it
static bool takeValue(int argc, char* argv[], int& i, const string& flag, string& value) {
  if (i + 1 >= argc) {
    cerr << "Error: " << flag << " expects a value." << endl;
    return false;
  }
  value = argv[++i];
  return true;
}

// Parses a double option value, reporting errors the same way for every option
static bool parseDoubleValue(int argc, char* argv[], int& i, const string& flag, double& value) {
  string text;
  if (!takeValue(argc, argv, i, flag, text)) {
    return false;
  }
  try {
    size_t consumed = 0;
    value = stod(text, &consumed);
    if (consumed == text.size()) {
      return true;
    }
  } catch (const std::invalid_argument&) {
  } catch (const std::out_of_range&) {
    cerr << "Error: " << flag << " value out of range: " << text << endl;
    return false;
  }
  cerr << "Error: " << flag << " expects a number, got: " << text << endl;
  return false;
}

static bool parseCameraId(const string& text, int& cameraId) {
  try {
    size_t consumed = 0;
    cameraId = stoi(text, &consumed);
    if (consumed == text.size() && cameraId >= 0) {
      return true;
    }
  } catch (const std::invalid_argument&) {
  } catch (const std::out_of_range&) {
  }
  cerr << "Error: --camera expects a non-negative device index, got: " << text << endl;
  return false;
}

// Recognizes the three input-mode flags
static bool inputModeFlag(const string& arg, InputMode& mode) {
  if (arg == "--simulator") {
    mode = InputMode::SIMULATOR;
  } else if (arg == "--camera") {
    mode = InputMode::CAMERA;
  } else if (arg == "--file") {
    mode = InputMode::FILE;
  } else {
    return false;
  }
  return true;
}

bool parseCommandLineArgs(int argc, char* argv[], DemoConfig& config) {
  for (int i = 1; i < argc; ++i) {
    const string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return false;
    }
  }

  // Exactly one input mode, looked up before any option is consumed
  int modeFlags = 0;
  for (int i = 1; i < argc; ++i) {
    InputMode mode;
    if (inputModeFlag(argv[i], mode)) {
      config.mode = mode;
      ++modeFlags;
    }
  }
  if (modeFlags != 1) {
    cerr << "Error: Expected exactly one of --simulator, --camera or --file, got "
         << modeFlags << "." << endl;
    if (modeFlags == 0) {
      printUsage(argv[0]);
    }
    return false;
  }

  std::optional<BaselineOrientation> forced;
  for (int i = 1; i < argc; ++i) {
    const string arg = argv[i];
    InputMode mode;
    if (inputModeFlag(arg, mode)) {
      string value;
      if (!takeValue(argc, argv, i, arg, value)) {
        return false;
      }
      if (mode == InputMode::CAMERA) {
        if (!parseCameraId(value, config.cameraId)) {
          return false;
        }
      } else if (value.empty()) {
        cerr << "Error: " << arg << " expects a non-empty path." << endl;
        return false;
      } else {
        config.path = value;
      }
    } else if (arg == "--smoothing") {
      if (!parseDoubleValue(argc, argv, i, arg, config.smoothingFactor)) {
        return false;
      }
      if (config.smoothingFactor < 0.0 || config.smoothingFactor >= 1.0) {
        cerr << "Error: --smoothing must be in [0, 1)." << endl;
        return false;
      }
    } else if (arg == "--wobble") {
      if (!parseDoubleValue(argc, argv, i, arg, config.wobbleDegrees)) {
        return false;
      }
      if (config.wobbleDegrees < 0.0) {
        cerr << "Error: --wobble must be non-negative." << endl;
        return false;
      }
    } else if (arg == "--sensor-rate") {
      if (!parseDoubleValue(argc, argv, i, arg, config.sensorRateHz)) {
        return false;
      }
      if (config.sensorRateHz < 1.0 || config.sensorRateHz > MAX_SENSOR_RATE_HZ) {
        cerr << "Error: --sensor-rate must be between 1 and " << MAX_SENSOR_RATE_HZ << " Hz." << endl;
        return false;
      }
    } else if (arg == "--portrait" || arg == "--landscape") {
      const BaselineOrientation requested =
          (arg == "--portrait") ? BaselineOrientation::Portrait : BaselineOrientation::Landscape;
      if (forced && *forced != requested) {
        cerr << "Error: --portrait and --landscape are mutually exclusive." << endl;
        return false;
      }
      forced = requested;
    } else if (arg == "--verbose") {
      config.verbose = true;
    } else {
      cerr << "Error: Unknown argument: " << arg << endl;
      return false;
    }
  }

  config.forcedOrientation = forced;
  return true;
}

// Opens the camera or video file named by config and reports its frame rate
static bool openCaptureSource(const DemoConfig& config, VideoCapture& cap, double& fps) {
  const bool camera = config.mode == InputMode::CAMERA;
  const string source = camera ? "camera " + to_string(config.cameraId) : "video file " + config.path;

  if (camera) {
    cap.open(config.cameraId);
  } else {
    cap.open(config.path);
  }
  if (!cap.isOpened()) {
    cerr << "Error: Could not open " << source << "." << endl;
    return false;
  }
  if (camera) {
    cap.set(CAP_PROP_FRAME_WIDTH, 1280);
    cap.set(CAP_PROP_FRAME_HEIGHT, 720);
  }

  fps = cap.get(CAP_PROP_FPS);
  if (fps <= 0.0) {
    fps = DEFAULT_FPS;
    cout << "Warning: " << source << " reports no frame rate, assuming " << fps << " FPS." << endl;
  }
  cout << "Input: " << source << " (" << cap.get(CAP_PROP_FRAME_WIDTH) << "x"
       << cap.get(CAP_PROP_FRAME_HEIGHT) << " @ " << fps << " FPS)" << endl;
  return true;
}

bool initializeInputSource(const DemoConfig& config, double& fps,
                           std::shared_ptr<DeviceSimulator>& simulator,
                           VideoCapture& cap) {
  const DeviceSimulator::DeviceParams params(0.0, config.wobbleDegrees, 0.5);

  if (config.mode == InputMode::SIMULATOR) {
    simulator = std::make_shared<DeviceSimulator>(config.path, params);
    fps = DEFAULT_FPS;
    cout << "Input: scene image " << config.path << " @ " << fps << " FPS" << endl;
    return true;
  }

  if (!openCaptureSource(config, cap, fps)) {
    return false;
  }
  // Live frames are tilted by the simulated device as well
  simulator = std::make_shared<DeviceSimulator>(params);
  return true;
}

bool captureUprightFrame(const DemoConfig& config, VideoCapture& cap,
                         const DeviceSimulator& simulator, Mat& frame) {
  if (config.mode == InputMode::CAMERA || config.mode == InputMode::FILE) {
    cap >> frame;
    if (frame.empty()) {
      if (config.mode == InputMode::FILE) {
        cout << "End of video file reached or cannot read frame." << endl;
      } else {
        cerr << "Error: Could not read frame from camera." << endl;
      }
      return false;
    }
    return true;
  }

  // Simulator mode: the scene itself is the upright view
  if (!simulator.hasScene()) {
    cerr << "Error: DeviceSimulator has no scene image." << endl;
    return false;
  }
  frame = simulator.scene().clone();
  return true;
}

bool handleDeviceControls(int key, DeviceSimulator& simulator,
                          const DeviceSimulator::DeviceParams& default_params) {
  bool has_device_moved = true;
  switch (toupper(key)) {
    case 'Q':
      simulator.rollCounterClockwise(1.0);
      break;
    case 'E':
      simulator.rollClockwise(1.0);
      break;
    case 'P':
      simulator.reset(default_params);
      cout << "Device roll reset." << endl;
      break;
    default:
      has_device_moved = false;
      break;
  }
  return has_device_moved;
}

void handleRecordingControls(int key, StabilizationSession& session,
                             const DemoConfig& config, const FrameDimensions& dims,
                             const GravitySample& latest_gravity) {
  switch (toupper(key)) {
    case 'R': {
      const BaselineOrientation orientation = config.forcedOrientation
          ? *config.forcedOrientation
          : BaselineCalibrator::orientationFromGravity(latest_gravity);
      if (!session.start(orientation, dims)) {
        cerr << "Error: Could not start recording." << endl;
      }
      break;
    }
    case 'S':
      session.stop();
      break;
  }
}

void addFrameOverlays(Mat& frame, double roll_degrees,
                      const StabilizationSession& session, double fps) {
  string rollText = "Roll: " + to_string(static_cast<int>(roll_degrees)) + " deg";
  rectangle(frame, Rect(5, 10, 240, 25), Scalar(0, 0, 0), -1);
  putText(frame, rollText, Point(10, 30), FONT_HERSHEY_SIMPLEX, 0.6, Scalar(0, 255, 0), 1);

  string stateText = "Session: " + toString(session.state());
  if (session.state() == SessionState::Active) {
    stateText += " (" + toString(session.baselineOrientation()) + ")";
  }
  rectangle(frame, Rect(5, 40, 240, 25), Scalar(0, 0, 0), -1);
  putText(frame, stateText, Point(10, 60), FONT_HERSHEY_SIMPLEX, 0.6, Scalar(0, 255, 0), 1);

  string fpsText = "FPS: " + to_string(static_cast<int>(fps));
  rectangle(frame, Rect(5, 70, 120, 25), Scalar(0, 0, 0), -1);
  putText(frame, fpsText, Point(10, 90), FONT_HERSHEY_SIMPLEX, 0.6, Scalar(0, 255, 0), 1);
}

void WorkerGroup::stop() {
  running_.store(false);
  for (auto& t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
}

void cleanup() {
  destroyAllWindows();
  cout << "Windows closed. Application finished." << endl;
}

} // namespace TiltStabilizer
