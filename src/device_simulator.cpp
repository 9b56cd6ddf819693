#include "device_simulator.hpp"
#include "frame_warper.hpp"
#include <iostream>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace TiltStabilizer {

DeviceSimulator::DeviceSimulator(const DeviceParams& params)
    : m_params(params), m_time(0.0), m_rollSpeed(2.0) {
}

DeviceSimulator::DeviceSimulator(const std::string& sceneImagePath, const DeviceParams& params)
    : m_params(params), m_time(0.0), m_rollSpeed(2.0) {
    // Load the scene shown to the simulated camera
    m_scene = imread(sceneImagePath);
    if (m_scene.empty()) {
        cerr << "Error: Could not load scene image from '" << sceneImagePath << "'." << endl;
        cerr << "Please ensure the image file exists and is accessible." << endl;
        throw runtime_error("Failed to load scene image");
    }
    cout << "Scene image loaded successfully ("
         << m_scene.cols << "x" << m_scene.rows << ")" << endl;
}

void DeviceSimulator::advance(double seconds) {
    if (seconds < 0.0) {
        throw invalid_argument("DeviceSimulator: cannot advance by a negative time");
    }
    m_time += seconds;
}

double DeviceSimulator::currentRollDegrees() const {
    double roll = m_params.roll;
    if (m_params.wobbleAmplitude != 0.0) {
        roll += m_params.wobbleAmplitude * sin(2.0 * M_PI * m_params.wobbleFrequency * m_time);
    }
    return roll;
}

GravitySample DeviceSimulator::gravitySample(double timestamp) const {
    const double roll = degreesToRadians(currentRollDegrees());
    const double face = degreesToRadians(m_params.faceTilt);

    // Upright portrait reports (0, -g, 0). Rolling the device by phi moves
    // gravity to (-sin(phi), -cos(phi)) in the screen plane, which is exactly
    // the vector the estimator maps back to a tilt of phi.
    const double in_plane = m_params.gravityMagnitude * cos(face);

    GravitySample sample;
    sample.x = -in_plane * sin(roll);
    sample.y = -in_plane * cos(roll);
    sample.z = -m_params.gravityMagnitude * sin(face);
    sample.timestamp = timestamp;
    return sample;
}

Mat DeviceSimulator::tiltFrame(const Mat& upright) const {
    if (upright.empty()) {
        return Mat();
    }

    // The camera turns with the device, so a counter-clockwise roll shows the
    // scene turned clockwise on screen
    StabilizationTransform camera_roll;
    camera_roll.rotationRadians = -degreesToRadians(currentRollDegrees());
    camera_roll.scale = 1.0;

    const FrameDimensions dims{static_cast<uint32_t>(upright.cols), static_cast<uint32_t>(upright.rows)};
    Mat M = FrameWarper::composeWarpMatrix(camera_roll, dims);

    Mat tilted;
    warpAffine(upright, tilted, M, upright.size(), INTER_LINEAR, BORDER_CONSTANT, Scalar());
    return tilted;
}

void DeviceSimulator::rollClockwise(double amount) {
    m_params.roll -= amount * m_rollSpeed;
}

void DeviceSimulator::rollCounterClockwise(double amount) {
    m_params.roll += amount * m_rollSpeed;
}

void DeviceSimulator::reset(const DeviceParams& params) {
    m_params = params;
    m_time = 0.0;
}

} // namespace TiltStabilizer
