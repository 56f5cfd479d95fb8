#include "dnn_models.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <numeric>

#include <opencv2/imgproc.hpp>

#include "types.hpp"

namespace {

cv::Rect to_frame_box(const float* row, const DecodeParams& p) {
  const float scale_x = static_cast<float>(p.frame_size.width) / static_cast<float>(p.input_size.width);
  const float scale_y =
      static_cast<float>(p.frame_size.height) / static_cast<float>(p.input_size.height);

  // (cx, cy, w, h) in model input pixels
  float x = row[0] - row[2] / 2.0f;
  float y = row[1] - row[3] / 2.0f;

  int bbox_x = static_cast<int>(x * scale_x);
  int bbox_y = static_cast<int>(y * scale_y);
  int bbox_w = static_cast<int>(row[2] * scale_x);
  int bbox_h = static_cast<int>(row[3] * scale_y);

  bbox_x = std::max(0, std::min(bbox_x, p.frame_size.width - 1));
  bbox_y = std::max(0, std::min(bbox_y, p.frame_size.height - 1));
  bbox_w = std::min(bbox_w, p.frame_size.width - bbox_x);
  bbox_h = std::min(bbox_h, p.frame_size.height - bbox_y);
  return cv::Rect(bbox_x, bbox_y, bbox_w, bbox_h);
}

std::string class_label(int id, const std::vector<std::string>& names) {
  if (id >= 0 && id < static_cast<int>(names.size())) return names[id];
  return "class_" + std::to_string(id);
}

std::optional<float> mean_confidence(const std::vector<Detection>& dets) {
  if (dets.empty()) return std::nullopt;
  float sum = 0.0f;
  for (const auto& d : dets) sum += d.confidence;
  return sum / static_cast<float>(dets.size());
}

}  // namespace

cv::Mat yolo_output_rows(const cv::Mat& out) {
  if (out.dims == 2) return out;
  if (out.dims != 3) {
    throw InferenceError("unexpected model output rank " + std::to_string(out.dims));
  }
  cv::Mat m(out.size[1], out.size[2], CV_32F, (void*)out.data);
  if (out.size[1] > out.size[2]) return m.clone();
  cv::Mat rows;
  cv::transpose(m, rows);
  return rows;
}

std::vector<Detection> decode_yolo_rows(const cv::Mat& rows, const DecodeParams& p,
                                        const std::vector<std::string>& class_names) {
  std::vector<Detection> detections;
  if (rows.empty()) return detections;
  if (rows.type() != CV_32F || rows.cols <= 4) {
    throw InferenceError("detection output must be CV_32F with more than 4 columns");
  }

  const int num_classes = rows.cols - 4;
  std::vector<cv::Rect> boxes;
  std::vector<float> confidences;
  std::vector<int> class_ids;

  for (int i = 0; i < rows.rows; ++i) {
    const float* row = rows.ptr<float>(i);

    float max_confidence = 0.0f;
    int best_class_id = -1;
    for (int c = 0; c < num_classes; ++c) {
      if (row[4 + c] > max_confidence) {
        max_confidence = row[4 + c];
        best_class_id = c;
      }
    }
    if (max_confidence < p.confidence_threshold) continue;

    cv::Rect box = to_frame_box(row, p);
    if (box.width > 0 && box.height > 0) {
      boxes.push_back(box);
      confidences.push_back(max_confidence);
      class_ids.push_back(best_class_id);
    }
  }

  std::vector<int> nms_indices;
  cv::dnn::NMSBoxes(boxes, confidences, p.confidence_threshold, p.iou_threshold, nms_indices);

  for (int idx : nms_indices) {
    Detection det;
    det.bbox = boxes[idx];
    det.confidence = confidences[idx];
    det.class_id = class_ids[idx];
    det.label = class_label(det.class_id, class_names);
    detections.push_back(std::move(det));
    if (static_cast<int>(detections.size()) >= p.max_detections) break;
  }
  return detections;
}

std::vector<Detection> decode_yolo_pose_rows(const cv::Mat& rows, const DecodeParams& p) {
  std::vector<Detection> detections;
  if (rows.empty()) return detections;
  if (rows.type() != CV_32F || rows.cols <= 5 || (rows.cols - 5) % 3 != 0) {
    throw InferenceError("pose output must be CV_32F with 5 + 3*K columns");
  }

  const int num_keypoints = (rows.cols - 5) / 3;
  const float scale_x = static_cast<float>(p.frame_size.width) / static_cast<float>(p.input_size.width);
  const float scale_y =
      static_cast<float>(p.frame_size.height) / static_cast<float>(p.input_size.height);

  std::vector<cv::Rect> boxes;
  std::vector<float> confidences;
  std::vector<int> source_rows;

  for (int i = 0; i < rows.rows; ++i) {
    const float* row = rows.ptr<float>(i);
    if (row[4] < p.confidence_threshold) continue;
    cv::Rect box = to_frame_box(row, p);
    if (box.width > 0 && box.height > 0) {
      boxes.push_back(box);
      confidences.push_back(row[4]);
      source_rows.push_back(i);
    }
  }

  std::vector<int> nms_indices;
  cv::dnn::NMSBoxes(boxes, confidences, p.confidence_threshold, p.iou_threshold, nms_indices);

  for (int idx : nms_indices) {
    const float* row = rows.ptr<float>(source_rows[idx]);
    Detection det;
    det.bbox = boxes[idx];
    det.confidence = confidences[idx];
    det.class_id = 0;
    det.label = "person";
    det.keypoints.reserve(num_keypoints);
    for (int k = 0; k < num_keypoints; ++k) {
      const float* kp = row + 5 + 3 * k;
      det.keypoints.emplace_back(kp[0] * scale_x, kp[1] * scale_y, kp[2]);
    }
    detections.push_back(std::move(det));
    if (static_cast<int>(detections.size()) >= p.max_detections) break;
  }
  return detections;
}

float box_iou(const cv::Rect& a, const cv::Rect& b) {
  const int inter = (a & b).area();
  const int uni = a.area() + b.area() - inter;
  return uni > 0 ? static_cast<float>(inter) / static_cast<float>(uni) : 0.0f;
}

const std::vector<std::string>& coco_class_names() {
  static const std::vector<std::string> names = {
      "person",        "bicycle",      "car",
      "motorcycle",    "airplane",     "bus",
      "train",         "truck",        "boat",
      "traffic light", "fire hydrant", "stop sign",
      "parking meter", "bench",        "bird",
      "cat",           "dog",          "horse",
      "sheep",         "cow",          "elephant",
      "bear",          "zebra",        "giraffe",
      "backpack",      "umbrella",     "handbag",
      "tie",           "suitcase",     "frisbee",
      "skis",          "snowboard",    "sports ball",
      "kite",          "baseball bat", "baseball glove",
      "skateboard",    "surfboard",    "tennis racket",
      "bottle",        "wine glass",   "cup",
      "fork",          "knife",        "spoon",
      "bowl",          "banana",       "apple",
      "sandwich",      "orange",       "broccoli",
      "carrot",        "hot dog",      "pizza",
      "donut",         "cake",         "chair",
      "couch",         "potted plant", "bed",
      "dining table",  "toilet",       "tv",
      "laptop",        "mouse",        "remote",
      "keyboard",      "cell phone",   "microwave",
      "oven",          "toaster",      "sink",
      "refrigerator",  "book",         "clock",
      "vase",          "scissors",     "teddy bear",
      "hair drier",    "toothbrush"};
  return names;
}

DnnModel::DnnModel(const InferenceConfig& cfg) : cfg_(cfg) {
  if (cfg_.model_path.empty()) {
    throw InferenceError(std::string("no model path configured for task '") +
                         to_string(cfg_.task) + "'");
  }
  if (!std::filesystem::exists(cfg_.model_path)) {
    throw InferenceError("model file not found: " + cfg_.model_path);
  }
  if (cfg_.input_size.width <= 0 || cfg_.input_size.height <= 0) {
    throw InferenceError("model input size must be positive");
  }

  try {
    net_ = cv::dnn::readNet(cfg_.model_path);
  } catch (const cv::Exception& e) {
    throw InferenceError("failed to load model '" + cfg_.model_path + "': " + e.what());
  }
  if (net_.empty()) {
    throw InferenceError("model '" + cfg_.model_path + "' has no layers");
  }
  net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
  net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);

  spdlog::info("Loaded {} model '{}' (input {}x{})", to_string(cfg_.task), cfg_.model_path,
               cfg_.input_size.width, cfg_.input_size.height);
}

cv::Mat DnnModel::forward(const cv::Mat& frame) {
  if (frame.empty()) throw InferenceError("empty input frame");

  cv::Mat blob;
  cv::dnn::blobFromImage(frame, blob, 1.0 / 255.0, cfg_.input_size, cv::Scalar(), true, false);

  std::lock_guard<std::mutex> g(mu_);
  net_.setInput(blob);
  // The output buffer belongs to the net; detach it before unlocking.
  return net_.forward().clone();
}

YoloDetector::YoloDetector(const InferenceConfig& cfg)
    : model_(cfg), class_names_(cfg.class_names.empty() ? coco_class_names() : cfg.class_names) {}

std::vector<Detection> YoloDetector::detect(const cv::Mat& frame) {
  const auto& cfg = model_.config();
  DecodeParams p{cfg.confidence_threshold, cfg.iou_threshold, cfg.max_detections,
                 model_.input_size(), frame.size()};
  return decode_yolo_rows(yolo_output_rows(model_.forward(frame)), p, class_names_);
}

InferenceResult YoloDetector::process(const cv::Mat& frame) {
  std::vector<Detection> dets = detect(frame);
  InferenceResult r;
  r.detection_count = static_cast<int>(dets.size());
  r.avg_confidence = mean_confidence(dets);
  r.annotated = Overlay::draw_detections(frame, dets);
  return r;
}

YoloPoseEstimator::YoloPoseEstimator(const InferenceConfig& cfg) : model_(cfg) {}

InferenceResult YoloPoseEstimator::process(const cv::Mat& frame) {
  const auto& cfg = model_.config();
  DecodeParams p{cfg.confidence_threshold, cfg.iou_threshold, cfg.max_detections,
                 model_.input_size(), frame.size()};
  std::vector<Detection> people = decode_yolo_pose_rows(yolo_output_rows(model_.forward(frame)), p);

  InferenceResult r;
  r.detection_count = static_cast<int>(people.size());
  r.avg_confidence = mean_confidence(people);
  r.annotated = Overlay::draw_keypoints(frame, people);
  return r;
}

ImageClassifier::ImageClassifier(const InferenceConfig& cfg) : model_(cfg) {}

InferenceResult ImageClassifier::process(const cv::Mat& frame) {
  cv::Mat probs = model_.forward(frame).reshape(1, 1);
  if (probs.empty()) throw InferenceError("classifier produced no scores");

  double lo = 0.0, hi = 0.0;
  cv::minMaxLoc(probs, &lo, &hi);
  const double total = cv::sum(probs)[0];
  if (lo < 0.0 || std::abs(total - 1.0) > 1e-3) {
    // Raw logits: softmax them.
    cv::Mat e;
    cv::exp(cv::Mat(probs - hi), e);
    probs = e / cv::sum(e)[0];
  }

  cv::Point best;
  double best_score = 0.0;
  cv::minMaxLoc(probs, nullptr, &best_score, nullptr, &best);

  const auto& names = model_.config().class_names;
  ClassLabel label{class_label(best.x, names), static_cast<float>(best_score)};

  InferenceResult r;
  r.detection_count = label.confidence > 0.0f ? 1 : 0;
  r.avg_confidence = label.confidence;
  r.annotated = Overlay::draw_caption(
      frame, label.name + " " + std::to_string(static_cast<int>(label.confidence * 100)) + "%");
  r.label = std::move(label);
  return r;
}

void IouTracker::update(std::vector<Detection>& detections) {
  std::vector<bool> matched(tracks_.size(), false);

  for (auto& det : detections) {
    int best = -1;
    float best_iou = match_iou_;
    for (size_t i = 0; i < tracks_.size(); ++i) {
      if (matched[i] || tracks_[i].class_id != det.class_id) continue;
      float iou = box_iou(tracks_[i].box, det.bbox);
      if (iou >= best_iou) {
        best_iou = iou;
        best = static_cast<int>(i);
      }
    }

    if (best >= 0) {
      matched[best] = true;
      tracks_[best].box = det.bbox;
      tracks_[best].missed = 0;
      det.track_id = tracks_[best].id;
    } else {
      tracks_.push_back(Track{next_id_++, det.class_id, det.bbox, 0});
      matched.push_back(true);
      det.track_id = tracks_.back().id;
    }
  }

  for (size_t i = 0; i < tracks_.size(); ++i) {
    if (!matched[i]) tracks_[i].missed++;
  }
  tracks_.erase(std::remove_if(tracks_.begin(), tracks_.end(),
                               [this](const Track& t) { return t.missed > max_missed_; }),
                tracks_.end());
}

TrackingDetector::TrackingDetector(const InferenceConfig& cfg) : detector_(cfg) {}

InferenceResult TrackingDetector::process(const cv::Mat& frame) {
  std::vector<Detection> dets = detector_.detect(frame);
  size_t tracks = 0;
  {
    std::lock_guard<std::mutex> g(mu_);
    tracker_.update(dets);
    tracks = tracker_.active_tracks();
  }

  InferenceResult r;
  r.detection_count = static_cast<int>(tracks);
  r.avg_confidence = mean_confidence(dets);
  r.annotated = Overlay::draw_detections(frame, dets);
  return r;
}

namespace Overlay {
cv::Mat draw_detections(const cv::Mat& frame, const std::vector<Detection>& detections) {
  cv::Mat result = frame.clone();

  for (const auto& det : detections) {
    cv::rectangle(result, det.bbox, cv::Scalar(0, 255, 0), 2);

    std::string label =
        det.label + " " + std::to_string(static_cast<int>(det.confidence * 100)) + "%";
    if (det.track_id >= 0) label = "#" + std::to_string(det.track_id) + " " + label;
    int baseline = 0;
    cv::Size label_size = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, 0.5, 1, &baseline);

    cv::rectangle(result, cv::Point(det.bbox.x, det.bbox.y - label_size.height - 10),
                  cv::Point(det.bbox.x + label_size.width, det.bbox.y), cv::Scalar(0, 255, 0),
                  cv::FILLED);

    cv::putText(result, label, cv::Point(det.bbox.x, det.bbox.y - 5), cv::FONT_HERSHEY_SIMPLEX, 0.5,
                cv::Scalar(0, 0, 0), 1);
  }

  return result;
}

cv::Mat draw_keypoints(const cv::Mat& frame, const std::vector<Detection>& detections) {
  cv::Mat result = draw_detections(frame, detections);

  for (const auto& det : detections) {
    for (const auto& kp : det.keypoints) {
      if (kp.z < 0.5f) continue;
      cv::circle(result, cv::Point2f(kp.x, kp.y), 3, cv::Scalar(0, 255, 255), -1);
    }
  }

  return result;
}

cv::Mat draw_caption(const cv::Mat& frame, const std::string& text) {
  cv::Mat result = frame.clone();
  int baseline = 0;
  cv::Size size = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, 0.7, 2, &baseline);
  cv::rectangle(result, cv::Point(5, 5), cv::Point(15 + size.width, 15 + size.height + baseline),
                cv::Scalar(0, 0, 0), cv::FILLED);
  cv::putText(result, text, cv::Point(10, 10 + size.height), cv::FONT_HERSHEY_SIMPLEX, 0.7,
              cv::Scalar(255, 255, 255), 2);
  return result;
}
}  // namespace Overlay
