#include <gtest/gtest.h>
#include <filesystem>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include "media_source.hpp"

TEST(MediaSourceOpenTest, MissingFileThrows) {
    EXPECT_THROW(OpenCvMediaSource("/nonexistent/dir/clip.mp4"), SourceOpenError);
}

TEST(MediaSourceOpenTest, EmptyPathThrows) {
    EXPECT_THROW(open_media_source(""), SourceOpenError);
}

TEST(MediaSourceOpenTest, NegativeCameraIndexThrows) {
    EXPECT_THROW(OpenCvMediaSource(-1), SourceOpenError);
}

class VideoFileSourceTest : public ::testing::Test {
protected:
    static constexpr int kFrames = 20;
    static constexpr double kFps = 10.0;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / "frametap_media_tests";
        std::filesystem::create_directories(dir);
        path = (dir / "clip.avi").string();

        cv::VideoWriter writer(path, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), kFps,
                               cv::Size(64, 48));
        if (!writer.isOpened()) {
            GTEST_SKIP() << "MJPG writer unavailable in this OpenCV build";
        }
        for (int i = 0; i < kFrames; ++i) {
            cv::Mat img(48, 64, CV_8UC3, cv::Scalar::all(i * 10));
            writer.write(img);
        }
        writer.release();
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    std::filesystem::path dir;
    std::string path;
};

TEST_F(VideoFileSourceTest, ReportsProperties) {
    auto src = open_media_source(path);
    ASSERT_TRUE(src->is_open());
    SourceProperties p = src->properties();
    EXPECT_FALSE(p.live);
    EXPECT_NEAR(p.frame_rate, kFps, 0.01);
    EXPECT_EQ(p.total_frames, kFrames);
    EXPECT_NEAR(p.duration_sec, kFrames / kFps, 0.01);
}

TEST_F(VideoFileSourceTest, SequentialReadToEnd) {
    OpenCvMediaSource src(path);
    for (int i = 0; i < kFrames; ++i) {
        auto f = src.read_next();
        ASSERT_TRUE(f.has_value()) << "frame " << i;
        EXPECT_EQ(f->index, i);
        EXPECT_NEAR(f->timestamp_sec, i / kFps, 1e-9);
        EXPECT_EQ(f->image.size(), cv::Size(64, 48));
    }
    EXPECT_FALSE(src.read_next().has_value());
}

TEST_F(VideoFileSourceTest, SeekRepositionsAndClamps) {
    OpenCvMediaSource src(path);
    src.seek(5);
    auto f = src.read_next();
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->index, 5);

    src.seek(10000);
    f = src.read_next();
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->index, kFrames - 1);

    src.seek(-3);
    f = src.read_next();
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->index, 0);
}

TEST_F(VideoFileSourceTest, CloseIsIdempotent) {
    OpenCvMediaSource src(path);
    src.close();
    src.close();
    EXPECT_FALSE(src.is_open());
    EXPECT_FALSE(src.read_next().has_value());
}
