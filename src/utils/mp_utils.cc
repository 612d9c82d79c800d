#include "gestify/utils/mp_utils.hpp"

#include <cstring>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

#include "absl/log/log.h"

#include "mediapipe/framework/formats/image.h"
#include "mediapipe/framework/formats/image_frame.h"
#include "mediapipe/tasks/cc/components/containers/category.h"
#include "mediapipe/tasks/cc/components/containers/landmark.h"
#include "mediapipe/tasks/cc/vision/core/running_mode.h"
#include "mediapipe/tasks/cc/vision/face_landmarker/face_landmarker.h"
#include "mediapipe/tasks/cc/vision/face_landmarker/face_landmarker_result.h"
#include "mediapipe/tasks/cc/vision/hand_landmarker/hand_landmarker.h"
#include "mediapipe/tasks/cc/vision/hand_landmarker/hand_landmarker_result.h"

namespace mp = mediapipe;
namespace hl = mediapipe::tasks::vision::hand_landmarker;
namespace fl = mediapipe::tasks::vision::face_landmarker;
namespace containers = mediapipe::tasks::components::containers;

using mediapipe::tasks::vision::core::RunningMode;

namespace gestify {
namespace utils {

using containers::NormalizedLandmarks;

namespace {

// BGR cv::Mat -> SRGB mp::Image (copies the pixels)
mp::Image ToMpImage(const cv::Mat& frame_bgr) {
  cv::Mat frame_rgb;
  cv::cvtColor(frame_bgr, frame_rgb, cv::COLOR_BGR2RGB);

  auto image_frame = std::make_shared<mp::ImageFrame>(
      mp::ImageFormat::SRGB,
      frame_rgb.cols,
      frame_rgb.rows,
      /*alignment_boundary=*/1);

  // cvtColor output is continuous
  std::memcpy(
      image_frame->MutablePixelData(),
      frame_rgb.data,
      frame_rgb.total() * frame_rgb.elemSize());

  return mp::Image(image_frame);
}

std::vector<Eigen::Vector3f> ToLandmarks(const NormalizedLandmarks& source) {
  std::vector<Eigen::Vector3f> points;
  points.reserve(source.landmarks.size());
  for (const auto& lm : source.landmarks) {
    points.emplace_back(lm.x, lm.y, lm.z);
  }
  return points;
}

}  // namespace

// ---------- HandLandmarkerMP ----------

struct HandLandmarkerMP::Impl {
  std::unique_ptr<hl::HandLandmarker> landmarker;
};

HandLandmarkerMP::HandLandmarkerMP(const std::string& model_path,
                                   int max_num_hands,
                                   float min_detection_confidence,
                                   float min_tracking_confidence)
    : impl_(std::make_unique<Impl>()) {
  auto options = std::make_unique<hl::HandLandmarkerOptions>();
  options->base_options.model_asset_path = model_path;
  options->running_mode = RunningMode::VIDEO;
  options->num_hands = max_num_hands;
  options->min_hand_detection_confidence = min_detection_confidence;
  options->min_hand_presence_confidence = min_detection_confidence;
  options->min_tracking_confidence = min_tracking_confidence;

  auto landmarker_or = hl::HandLandmarker::Create(std::move(options));
  if (!landmarker_or.ok()) {
    LOG(ERROR) << "Failed to create HandLandmarker: "
               << landmarker_or.status();
    throw std::runtime_error("Cannot load hand landmark model: " + model_path);
  }

  impl_->landmarker = std::move(landmarker_or.value());
  LOG(INFO) << "HandLandmarker ready (" << model_path << ", "
            << max_num_hands << " hands)";
}

HandLandmarkerMP::~HandLandmarkerMP() = default;

std::unique_ptr<HandLandmarkerMP> HandLandmarkerMP::FromConfig(
    const GestureConfig& config) {
  return std::make_unique<HandLandmarkerMP>(config.hand_model_path,
                                            config.max_hands,
                                            config.hand_confidence,
                                            config.hand_tracking_confidence);
}

std::vector<HandObservation> HandLandmarkerMP::Detect(const cv::Mat& frame_bgr,
                                                      int64_t timestamp_ms) {
  std::vector<HandObservation> output;

  if (frame_bgr.empty()) return output;

  auto result_or = impl_->landmarker->DetectForVideo(ToMpImage(frame_bgr),
                                                     timestamp_ms);
  if (!result_or.ok()) {
    LOG(WARNING) << "HandLandmarker detect failed: "
                 << result_or.status();
    return output;
  }

  const auto& result = result_or.value();
  output.reserve(result.hand_landmarks.size());

  for (size_t i = 0; i < result.hand_landmarks.size(); ++i) {
    HandObservation hand;
    hand.landmarks = ToLandmarks(result.hand_landmarks[i]);

    if (i < result.handedness.size() &&
        !result.handedness[i].categories.empty()) {
      const auto& top = result.handedness[i].categories.front();
      hand.confidence = top.score;
      hand.handedness = top.category_name.value_or("Right") == "Left"
                            ? Handedness::LEFT
                            : Handedness::RIGHT;
    }

    output.push_back(std::move(hand));
  }

  return output;
}

// ---------- FaceLandmarkerMP ----------

struct FaceLandmarkerMP::Impl {
  std::unique_ptr<fl::FaceLandmarker> landmarker;
};

FaceLandmarkerMP::FaceLandmarkerMP(const std::string& model_path,
                                   float min_detection_confidence)
    : impl_(std::make_unique<Impl>()) {
  auto options = std::make_unique<fl::FaceLandmarkerOptions>();
  options->base_options.model_asset_path = model_path;
  options->running_mode = RunningMode::VIDEO;
  options->num_faces = 1;
  options->min_face_detection_confidence = min_detection_confidence;
  options->min_face_presence_confidence = min_detection_confidence;

  auto landmarker_or = fl::FaceLandmarker::Create(std::move(options));
  if (!landmarker_or.ok()) {
    LOG(ERROR) << "Failed to create FaceLandmarker: "
               << landmarker_or.status();
    throw std::runtime_error("Cannot load face landmark model: " + model_path);
  }

  impl_->landmarker = std::move(landmarker_or.value());
  LOG(INFO) << "FaceLandmarker ready (" << model_path << ")";
}

FaceLandmarkerMP::~FaceLandmarkerMP() = default;

std::unique_ptr<FaceLandmarkerMP> FaceLandmarkerMP::FromConfig(
    const GestureConfig& config) {
  return std::make_unique<FaceLandmarkerMP>(config.face_model_path,
                                            config.face_confidence);
}

std::optional<FaceObservation> FaceLandmarkerMP::Detect(const cv::Mat& frame_bgr,
                                                        int64_t timestamp_ms) {
  if (frame_bgr.empty()) return std::nullopt;

  auto result_or = impl_->landmarker->DetectForVideo(ToMpImage(frame_bgr),
                                                     timestamp_ms);
  if (!result_or.ok()) {
    LOG(WARNING) << "FaceLandmarker detect failed: "
                 << result_or.status();
    return std::nullopt;
  }

  const auto& faces = result_or.value().face_landmarks;
  if (faces.empty()) {
    return std::nullopt;
  }

  FaceObservation face;
  face.landmarks = ToLandmarks(faces.front());
  return face;
}

}  // namespace utils
}  // namespace gestify
