#include "inference.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

#include "dnn_models.hpp"
#include "motion_detector.hpp"
#include "types.hpp"

InferenceTask parse_task(const std::string& name) {
  std::string n = name;
  std::transform(n.begin(), n.end(), n.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (n.empty() || n == "none") return InferenceTask::None;
  if (n == "motion") return InferenceTask::Motion;
  if (n == "detect" || n == "analyzer") return InferenceTask::Detect;
  if (n == "classify" || n == "classifier") return InferenceTask::Classify;
  if (n == "pose" || n == "keypoint") return InferenceTask::Pose;
  if (n == "track" || n == "tracker") return InferenceTask::Track;
  throw ConfigError("unknown inference task '" + name + "'");
}

const char* to_string(InferenceTask t) {
  switch (t) {
    case InferenceTask::None:     return "none";
    case InferenceTask::Motion:   return "motion";
    case InferenceTask::Detect:   return "detect";
    case InferenceTask::Classify: return "classify";
    case InferenceTask::Pose:     return "pose";
    case InferenceTask::Track:    return "track";
  }
  return "unknown";
}

std::unique_ptr<Inferencer> create_inferencer(const InferenceConfig& cfg) {
  spdlog::info("Configuring inference task '{}'", to_string(cfg.task));
  switch (cfg.task) {
    case InferenceTask::None:
      return nullptr;
    case InferenceTask::Motion:
      return std::make_unique<MotionDetector>();
    case InferenceTask::Detect:
      return std::make_unique<YoloDetector>(cfg);
    case InferenceTask::Classify:
      return std::make_unique<ImageClassifier>(cfg);
    case InferenceTask::Pose:
      return std::make_unique<YoloPoseEstimator>(cfg);
    case InferenceTask::Track:
      return std::make_unique<TrackingDetector>(cfg);
  }
  throw InferenceError("unhandled inference task");
}
