#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

struct ClassLabel {
  std::string name;
  float confidence{0.0f};
};

// What one inference call hands back to the sampler.
struct InferenceResult {
  cv::Mat annotated;                   // empty: show the input frame instead
  std::optional<int> detection_count;  // objects, keypoint sets, tracks or 1 for a class
  std::optional<float> avg_confidence;
  std::optional<ClassLabel> label;     // classification only
};

// Vision model behind the sampling loop. process() is called repeatedly from
// the sampling thread and must not keep a reference to `frame` after it
// returns. Failures are reported by throwing.
class Inferencer {
public:
  virtual ~Inferencer() = default;
  virtual InferenceResult process(const cv::Mat& frame) = 0;
  virtual std::string name() const = 0;
};

enum class InferenceTask { None, Motion, Detect, Classify, Pose, Track };

// Throws ConfigError for unknown names.
InferenceTask parse_task(const std::string& name);
const char* to_string(InferenceTask t);

struct InferenceConfig {
  InferenceTask task{InferenceTask::None};
  std::string model_path;
  float confidence_threshold{0.25f};
  float iou_threshold{0.7f};
  cv::Size input_size{640, 640};
  int max_detections{100};
  std::vector<std::string> class_names;  // empty: COCO names for detection tasks
};

// Picks and builds the collaborator once, at configuration time. Returns
// nullptr for InferenceTask::None. Throws InferenceError when a model cannot
// be loaded.
std::unique_ptr<Inferencer> create_inferencer(const InferenceConfig& cfg);
