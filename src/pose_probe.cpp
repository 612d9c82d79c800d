#include <chrono>
#include <cstdint>
#include <deque>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/opencv.hpp>

#include "gestify/gesture_config.hpp"
#include "gestify/hand_pose_classifier.hpp"
#include "gestify/utils/mp_utils.hpp"

// Manual camera check for the hand landmarker and the pose classifier.
// Usage: pose_probe [config-file]

namespace {

std::string PatternString(const gestify::HandPoseState& pose) {
  static const char kFingerLetters[] = "TIMRP";
  std::string out;
  for (size_t i = 0; i < pose.fingers.size(); ++i) {
    out += pose.fingers[i] ? kFingerLetters[i] : '.';
  }
  return out;
}

}  // namespace

int main(int argc, char** argv) {
  gestify::GestureConfig config;
  if (argc > 1) {
    try {
      config = gestify::GestureConfig::fromFile(argv[1]);
    } catch (const std::exception& e) {
      std::cerr << "ERROR: " << e.what() << "\n";
      return -1;
    }
  }

  // ---------- Initialize MediaPipe hand landmarker ----------
  std::unique_ptr<gestify::utils::HandLandmarkerMP> hand_mp;
  try {
    hand_mp = gestify::utils::HandLandmarkerMP::FromConfig(config);
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return -1;
  }

  gestify::HandPoseClassifier classifier(config);
  std::deque<cv::Point2f> history[2];

  // ---------- Open camera ----------
  cv::VideoCapture cap(config.camera_index);
  if (!cap.isOpened()) {
    std::cerr << "ERROR: Failed to open camera\n";
    return -1;
  }
  cap.set(cv::CAP_PROP_FRAME_WIDTH, config.camera_width);
  cap.set(cv::CAP_PROP_FRAME_HEIGHT, config.camera_height);

  cv::namedWindow("Pose Probe", cv::WINDOW_AUTOSIZE);

  auto start = std::chrono::steady_clock::now();
  auto p_time = start;
  int64_t last_ts = -1;

  // ---------- Main loop ----------
  while (true) {
    cv::Mat frame;
    cap >> frame;
    if (frame.empty()) {
      std::cerr << "ERROR: Empty frame\n";
      break;
    }

    auto now = std::chrono::steady_clock::now();
    int64_t ts = std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count();
    if (ts <= last_ts) ts = last_ts + 1;
    last_ts = ts;

    std::vector<gestify::HandObservation> hands = hand_mp->Detect(frame, ts);

    int row = 0;
    for (const auto& hand : hands) {
      size_t slot = hand.handedness == gestify::Handedness::LEFT ? 0 : 1;
      gestify::HandPoseState pose = classifier.classify(hand, frame.size(), history[slot]);

      for (const auto& lm : hand.landmarks) {
        int x = static_cast<int>(lm.x() * frame.cols);
        int y = static_cast<int>(lm.y() * frame.rows);
        cv::circle(frame, {x, y}, 3, {0, 255, 0}, -1);
      }
      if (!pose.valid) continue;

      cv::circle(frame, pose.position, 6, {0, 0, 255}, -1);

      std::string info = cv::format("%s %s pinch %.0fpx v(%.1f, %.1f)%s%s",
                                    gestify::handednessName(pose.handedness),
                                    PatternString(pose).c_str(),
                                    pose.pinch_distance,
                                    pose.velocity.x, pose.velocity.y,
                                    pose.is_fist ? " FIST" : "",
                                    pose.is_palm ? " PALM" : "");
      cv::putText(frame, info, {10, 60 + 30 * row}, cv::FONT_HERSHEY_SIMPLEX, 0.6, {255, 255, 255}, 2);
      cv::putText(frame, info, {10, 60 + 30 * row}, cv::FONT_HERSHEY_SIMPLEX, 0.6, {0, 0, 0}, 1);
      ++row;
    }

    // FPS based on loop frequency
    std::chrono::duration<double> total_duration = now - p_time;
    double fps = 1.0 / total_duration.count();
    p_time = now;

    std::string stats = cv::format("Hands: %zu | FPS: %.1f", hands.size(), fps);
    cv::putText(frame, stats, {10, 30}, cv::FONT_HERSHEY_SIMPLEX, 0.7, {255, 255, 255}, 2);
    cv::putText(frame, stats, {10, 30}, cv::FONT_HERSHEY_SIMPLEX, 0.7, {0, 0, 0}, 1);

    cv::imshow("Pose Probe", frame);

    int key = cv::waitKey(1);
    if (key == 27 || key == 'q' || key == 'Q') {
      break;
    }
  }

  return 0;
}
