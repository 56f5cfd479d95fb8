#pragma once

#include <mutex>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>

#include "inference.hpp"

// Object found by a YOLO-style head. `keypoints` holds (x, y, visibility)
// for pose models and is empty otherwise.
struct Detection {
  int class_id{-1};
  float confidence{0.0f};
  cv::Rect bbox;
  std::string label;
  std::vector<cv::Point3f> keypoints;
  int track_id{-1};
};

struct DecodeParams {
  float confidence_threshold{0.25f};
  float iou_threshold{0.7f};
  int max_detections{100};
  // Model input size the rows are expressed in, and the frame to map back to.
  cv::Size input_size{640, 640};
  cv::Size frame_size{640, 640};
};

// YOLOv8/11 heads emit [1, C, N]; rows are easier to walk as [N, C].
// 2-D outputs are returned as they are.
cv::Mat yolo_output_rows(const cv::Mat& out);

// Decodes a [N x (4 + classes)] matrix of (cx, cy, w, h, class scores...)
// rows, then applies NMS.
std::vector<Detection> decode_yolo_rows(const cv::Mat& rows, const DecodeParams& p,
                                        const std::vector<std::string>& class_names);

// Decodes a [N x (5 + 3 * K)] matrix of (cx, cy, w, h, score, K keypoints)
// rows, then applies NMS.
std::vector<Detection> decode_yolo_pose_rows(const cv::Mat& rows, const DecodeParams& p);

float box_iou(const cv::Rect& a, const cv::Rect& b);

const std::vector<std::string>& coco_class_names();

// Wraps one cv::dnn::Net; forward() is serialized so a model can be shared
// between the sampling thread and one-shot image runs.
class DnnModel {
public:
  // Throws InferenceError when the model file is missing or unreadable.
  explicit DnnModel(const InferenceConfig& cfg);
  cv::Mat forward(const cv::Mat& frame);
  const InferenceConfig& config() const { return cfg_; }
  cv::Size input_size() const { return cfg_.input_size; }

private:
  InferenceConfig cfg_;
  std::mutex mu_;
  cv::dnn::Net net_;
};

class YoloDetector : public Inferencer {
public:
  explicit YoloDetector(const InferenceConfig& cfg);
  InferenceResult process(const cv::Mat& frame) override;
  std::string name() const override { return "detect"; }

  std::vector<Detection> detect(const cv::Mat& frame);

private:
  DnnModel model_;
  std::vector<std::string> class_names_;
};

class YoloPoseEstimator : public Inferencer {
public:
  explicit YoloPoseEstimator(const InferenceConfig& cfg);
  InferenceResult process(const cv::Mat& frame) override;
  std::string name() const override { return "pose"; }

private:
  DnnModel model_;
};

class ImageClassifier : public Inferencer {
public:
  explicit ImageClassifier(const InferenceConfig& cfg);
  InferenceResult process(const cv::Mat& frame) override;
  std::string name() const override { return "classify"; }

private:
  DnnModel model_;
};

// Greedy IoU association of detections to persistent track ids.
class IouTracker {
public:
  explicit IouTracker(float match_iou = 0.3f, int max_missed = 30)
      : match_iou_(match_iou), max_missed_(max_missed) {}

  // Assigns track_id on every detection.
  void update(std::vector<Detection>& detections);
  size_t active_tracks() const { return tracks_.size(); }

private:
  struct Track {
    int id;
    int class_id;
    cv::Rect box;
    int missed;
  };

  float match_iou_;
  int max_missed_;
  int next_id_{1};
  std::vector<Track> tracks_;
};

class TrackingDetector : public Inferencer {
public:
  explicit TrackingDetector(const InferenceConfig& cfg);
  InferenceResult process(const cv::Mat& frame) override;
  std::string name() const override { return "track"; }

private:
  YoloDetector detector_;
  std::mutex mu_;
  IouTracker tracker_;
};

namespace Overlay {
cv::Mat draw_detections(const cv::Mat& frame, const std::vector<Detection>& detections);
cv::Mat draw_keypoints(const cv::Mat& frame, const std::vector<Detection>& detections);
cv::Mat draw_caption(const cv::Mat& frame, const std::string& text);
}  // namespace Overlay
