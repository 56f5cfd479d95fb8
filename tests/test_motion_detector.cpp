#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>
#include "motion_detector.hpp"

class MotionDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        frame1 = cv::Mat::zeros(480, 640, CV_8UC3);
        frame2 = cv::Mat::zeros(480, 640, CV_8UC3);

        // Same square, moved far enough that old and new positions do not overlap
        cv::rectangle(frame1, cv::Rect(100, 100, 80, 80), cv::Scalar(255, 255, 255), -1);
        cv::rectangle(frame2, cv::Rect(300, 200, 80, 80), cv::Scalar(255, 255, 255), -1);
    }

    cv::Mat frame1, frame2;
};

TEST_F(MotionDetectorTest, FirstFrameHasNoMotion) {
    MotionDetector det(MotionDetector::Algorithm::FRAME_DIFF);
    MotionResult r = det.process_frame(frame1);
    EXPECT_FALSE(r.motion_detected);
    EXPECT_TRUE(r.regions.empty());
}

TEST_F(MotionDetectorTest, FrameDifferenceFindsMovedObject) {
    MotionDetector det(MotionDetector::Algorithm::FRAME_DIFF);
    det.process_frame(frame1);
    MotionResult r = det.process_frame(frame2);

    EXPECT_TRUE(r.motion_detected);
    EXPECT_EQ(r.regions.size(), 2u);  // vacated and newly covered area
    EXPECT_GT(r.motion_pixels, 0);
    EXPECT_GT(r.motion_intensity, 0.01);
    EXPECT_LT(r.motion_intensity, 1.0);
    EXPECT_TRUE(r.bounding_box.contains(cv::Point(140, 140)));
    EXPECT_TRUE(r.bounding_box.contains(cv::Point(340, 240)));
}

TEST_F(MotionDetectorTest, IdenticalFramesHaveNoMotion) {
    MotionDetector det(MotionDetector::Algorithm::FRAME_DIFF);
    det.process_frame(frame1);
    MotionResult r = det.process_frame(frame1.clone());
    EXPECT_FALSE(r.motion_detected);
    EXPECT_EQ(r.motion_pixels, 0);
}

TEST_F(MotionDetectorTest, SmallChangesBelowContourArea) {
    MotionDetector det(MotionDetector::Algorithm::FRAME_DIFF);
    det.set_min_contour_area(50000.0);
    det.process_frame(frame1);
    MotionResult r = det.process_frame(frame2);
    EXPECT_TRUE(r.regions.empty());
    EXPECT_FALSE(r.motion_detected);
}

TEST_F(MotionDetectorTest, ResetForgetsPreviousFrame) {
    MotionDetector det(MotionDetector::Algorithm::FRAME_DIFF);
    det.process_frame(frame1);
    det.reset();
    MotionResult r = det.process_frame(frame2);
    EXPECT_FALSE(r.motion_detected);
}

TEST_F(MotionDetectorTest, ProcessReportsRegionCountAndAnnotates) {
    MotionDetector det(MotionDetector::Algorithm::FRAME_DIFF);
    det.process(frame1);
    InferenceResult r = det.process(frame2);

    ASSERT_TRUE(r.detection_count.has_value());
    EXPECT_EQ(*r.detection_count, 2);
    ASSERT_FALSE(r.annotated.empty());
    EXPECT_EQ(r.annotated.size(), frame2.size());
    // Input must be left untouched
    EXPECT_EQ(cv::countNonZero(frame2.reshape(1)), 80 * 80 * 3);
}

TEST_F(MotionDetectorTest, EmptyFrameIsIgnored) {
    MotionDetector det;
    MotionResult r = det.process_frame(cv::Mat());
    EXPECT_FALSE(r.motion_detected);
}

TEST_F(MotionDetectorTest, BackgroundSubtractionOnStaticScene) {
    MotionDetector det(MotionDetector::Algorithm::BACKGROUND_SUB);
    MotionResult r;
    for (int i = 0; i < 30; ++i) r = det.process_frame(frame1);
    EXPECT_FALSE(r.motion_detected);
    EXPECT_EQ(det.name(), "motion");
}
