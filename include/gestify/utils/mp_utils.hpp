#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "gestify/gesture_config.hpp"
#include "gestify/gesture_types.hpp"

namespace gestify {
namespace utils {

// MediaPipe HandLandmarker in VIDEO mode. Timestamps must increase
// strictly between calls.
class HandLandmarkerMP {
 public:
  // Throws std::runtime_error if the model cannot be loaded
  HandLandmarkerMP(const std::string& model_path,
                   int max_num_hands = 2,
                   float min_detection_confidence = 0.7f,
                   float min_tracking_confidence = 0.5f);
  ~HandLandmarkerMP();

  static std::unique_ptr<HandLandmarkerMP> FromConfig(const GestureConfig& config);

  // Empty on detection failure
  std::vector<HandObservation> Detect(const cv::Mat& frame_bgr,
                                      int64_t timestamp_ms);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// MediaPipe FaceLandmarker (single face, iris-refined mesh) in VIDEO mode
class FaceLandmarkerMP {
 public:
  explicit FaceLandmarkerMP(const std::string& model_path,
                            float min_detection_confidence = 0.5f);
  ~FaceLandmarkerMP();

  static std::unique_ptr<FaceLandmarkerMP> FromConfig(const GestureConfig& config);

  std::optional<FaceObservation> Detect(const cv::Mat& frame_bgr,
                                        int64_t timestamp_ms);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace utils
}  // namespace gestify
