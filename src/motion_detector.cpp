#include "motion_detector.hpp"

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>
#include <opencv2/video.hpp>

MotionDetector::MotionDetector(Algorithm algo) : algorithm_(algo) {
  if (algorithm_ == Algorithm::BACKGROUND_SUB) {
    bg_subtractor_ = cv::createBackgroundSubtractorMOG2(500, 16, true);
  }
}

MotionDetector::~MotionDetector() = default;

InferenceResult MotionDetector::process(const cv::Mat& frame) {
  MotionResult m = process_frame(frame);

  InferenceResult r;
  r.detection_count = static_cast<int>(m.regions.size());
  r.annotated = frame.clone();
  for (const auto& rect : m.regions) {
    cv::rectangle(r.annotated, rect, cv::Scalar(0, 0, 255), 2);
  }
  std::string text = "Motion: " + std::to_string(static_cast<int>(m.motion_intensity * 100)) + "%";
  cv::putText(r.annotated, text, cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 0.7,
              cv::Scalar(255, 255, 255), 2);
  return r;
}

MotionResult MotionDetector::process_frame(const cv::Mat& frame) {
  if (frame.empty()) return MotionResult{};
  std::lock_guard<std::mutex> g(mu_);
  switch (algorithm_) {
    case Algorithm::FRAME_DIFF:
      return detect_frame_diff(frame);
    case Algorithm::BACKGROUND_SUB:
    default:
      return detect_background_sub(frame);
  }
}

void MotionDetector::reset() {
  std::lock_guard<std::mutex> g(mu_);
  prev_frame_ = cv::Mat();

  if (bg_subtractor_) {
    bg_subtractor_ = cv::createBackgroundSubtractorMOG2(500, 16, true);
  }
}

MotionResult MotionDetector::detect_frame_diff(const cv::Mat& frame) {
  cv::Mat gray;
  if (frame.channels() == 1) {
    gray = frame.clone();
  } else {
    cv::cvtColor(frame, gray, frame.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
  }

  if (prev_frame_.empty() || prev_frame_.size() != gray.size()) {
    prev_frame_ = gray;
    return MotionResult{};  // No motion on first frame
  }

  cv::Mat diff;
  cv::absdiff(prev_frame_, gray, diff);

  cv::Mat thresh;
  cv::threshold(diff, thresh, threshold_, 255, cv::THRESH_BINARY);

  prev_frame_ = gray;
  return summarize(thresh, 0.01);  // 1% threshold
}

MotionResult MotionDetector::detect_background_sub(const cv::Mat& frame) {
  cv::Mat fg_mask;
  bg_subtractor_->apply(frame, fg_mask);

  // MOG2 marks shadows as 127; keep only confident foreground.
  cv::threshold(fg_mask, fg_mask, 200, 255, cv::THRESH_BINARY);
  return summarize(fg_mask, 0.005);  // 0.5% threshold for background subtraction
}

MotionResult MotionDetector::summarize(const cv::Mat& mask, double detect_ratio) const {
  MotionResult result;

  // Apply morphological operations to reduce noise
  cv::Mat clean;
  cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(5, 5));
  cv::morphologyEx(mask, clean, cv::MORPH_OPEN, kernel);
  cv::morphologyEx(clean, clean, cv::MORPH_CLOSE, kernel);

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(clean, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

  double total_area = 0;
  for (const auto& contour : contours) {
    double area = cv::contourArea(contour);
    if (area > min_contour_area_) {
      total_area += area;
      result.regions.push_back(cv::boundingRect(contour));
    }
  }

  const double frame_area = static_cast<double>(mask.rows) * static_cast<double>(mask.cols);
  result.motion_pixels = cv::countNonZero(clean);
  result.motion_intensity = frame_area > 0 ? std::min(1.0, total_area / frame_area) : 0.0;
  result.motion_detected = result.motion_intensity > detect_ratio;

  // Combine all motion rectangles into one bounding box
  if (!result.regions.empty()) {
    cv::Rect combined = result.regions[0];
    for (size_t i = 1; i < result.regions.size(); ++i) {
      combined |= result.regions[i];
    }
    result.bounding_box = combined;
  }

  return result;
}
