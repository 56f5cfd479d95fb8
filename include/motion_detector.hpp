#pragma once

#include <mutex>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/video/background_segm.hpp>

#include "inference.hpp"

struct MotionResult {
    bool motion_detected{false};
    double motion_intensity{0.0};  // 0.0 to 1.0
    int motion_pixels{0};
    std::vector<cv::Rect> regions;  // one per contour above the area floor
    cv::Rect bounding_box;  // union of all regions
};

// Model-free collaborator: reports moving regions between consecutive
// sampled frames. Detection count is the number of regions.
class MotionDetector : public Inferencer {
public:
    enum class Algorithm {
        FRAME_DIFF,      // Simple frame differencing
        BACKGROUND_SUB   // MOG2 background subtraction
    };

    explicit MotionDetector(Algorithm algo = Algorithm::BACKGROUND_SUB);
    ~MotionDetector() override;

    InferenceResult process(const cv::Mat& frame) override;
    std::string name() const override { return "motion"; }

    // Process a frame and return motion detection results
    MotionResult process_frame(const cv::Mat& frame);

    // Reset detector state (useful for scene changes)
    void reset();

    void set_threshold(double threshold) { threshold_ = threshold; }
    void set_min_contour_area(double area) { min_contour_area_ = area; }

private:
    Algorithm algorithm_;
    double threshold_{25.0};
    double min_contour_area_{500.0};

    std::mutex mu_;
    cv::Mat prev_frame_;
    cv::Ptr<cv::BackgroundSubtractor> bg_subtractor_;

    MotionResult detect_frame_diff(const cv::Mat& frame);
    MotionResult detect_background_sub(const cv::Mat& frame);
    MotionResult summarize(const cv::Mat& mask, double detect_ratio) const;
};
