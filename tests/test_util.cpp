#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include "controller.hpp"
#include "util.hpp"

class ConfigLoadTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "frametap_config_tests";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string createTestConfig(const std::string& filename, const std::string& content) {
        std::ofstream file(test_dir / filename);
        file << content;
        file.close();
        return (test_dir / filename).string();
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigLoadTest, FullConfigLoad) {
    const std::string path = createTestConfig("full.yaml", R"(
source:
  uri: "clip.mp4"
  camera_index: 2
  loop_playback: false
  camera_width: 1280
  camera_height: 720

sampling:
  delay_ms: 120
  idle_retry_ms: 40
  pace_ms: 10

inference:
  task: detect
  model_path: "models/yolo11n.onnx"
  confidence_threshold: 0.4
  iou_threshold: 0.5
  input_width: 320
  input_height: 256
  max_detections: 20
  class_names: [cat, dog]

server:
  host: "127.0.0.1"
  port: 9000

logging:
  level: debug
)");

    AppConfig c = load_config(path);
    EXPECT_EQ(c.source.uri, "clip.mp4");
    EXPECT_EQ(c.source.camera_index, 2);
    EXPECT_FALSE(c.playback.loop_playback);
    EXPECT_EQ(c.playback.capture.camera_width, 1280);
    EXPECT_EQ(c.playback.capture.camera_height, 720);

    EXPECT_EQ(c.delay_ms, 120);
    EXPECT_EQ(c.sampler.idle_retry.count(), 40);
    EXPECT_EQ(c.sampler.pace.count(), 10);

    EXPECT_EQ(c.inference.task, InferenceTask::Detect);
    EXPECT_EQ(c.inference.model_path, "models/yolo11n.onnx");
    EXPECT_FLOAT_EQ(c.inference.confidence_threshold, 0.4f);
    EXPECT_FLOAT_EQ(c.inference.iou_threshold, 0.5f);
    EXPECT_EQ(c.inference.input_size, cv::Size(320, 256));
    EXPECT_EQ(c.inference.max_detections, 20);
    ASSERT_EQ(c.inference.class_names.size(), 2u);
    EXPECT_EQ(c.inference.class_names[1], "dog");

    EXPECT_EQ(c.server.host, "127.0.0.1");
    EXPECT_EQ(c.server.port, 9000);
    EXPECT_EQ(c.log_level, "debug");
}

TEST_F(ConfigLoadTest, MissingKeysKeepDefaults) {
    const std::string path = createTestConfig("partial.yaml", R"(
sampling:
  delay_ms: 30
)");

    AppConfig c = load_config(path);
    EXPECT_EQ(c.delay_ms, 30);
    EXPECT_TRUE(c.source.uri.empty());
    EXPECT_EQ(c.source.camera_index, -1);
    EXPECT_TRUE(c.playback.loop_playback);
    EXPECT_EQ(c.sampler.idle_retry.count(), 100);
    EXPECT_EQ(c.sampler.pace.count(), 50);
    EXPECT_EQ(c.inference.task, InferenceTask::None);
    EXPECT_FLOAT_EQ(c.inference.confidence_threshold, 0.25f);
    EXPECT_FLOAT_EQ(c.inference.iou_threshold, 0.7f);
    EXPECT_EQ(c.server.port, 8080);
    EXPECT_EQ(c.log_level, "info");
}

TEST_F(ConfigLoadTest, NonExistentFile) {
    EXPECT_THROW(load_config((test_dir / "missing.yaml").string()), ConfigError);
}

TEST_F(ConfigLoadTest, MalformedYaml) {
    const std::string path = createTestConfig("bad.yaml", "source: [unclosed\n");
    EXPECT_THROW(load_config(path), ConfigError);
}

TEST_F(ConfigLoadTest, WrongValueType) {
    const std::string path = createTestConfig("type.yaml", R"(
server:
  port: "not-a-number"
)");
    EXPECT_THROW(load_config(path), ConfigError);
}

TEST_F(ConfigLoadTest, UnknownTaskRejected) {
    const std::string path = createTestConfig("task.yaml", R"(
inference:
  task: segment
)");
    EXPECT_THROW(load_config(path), ConfigError);
}

TEST_F(ConfigLoadTest, PortOutOfRangeRejected) {
    const std::string path = createTestConfig("port.yaml", R"(
server:
  port: 70000
)");
    EXPECT_THROW(load_config(path), ConfigError);
}

TEST_F(ConfigLoadTest, ShippedConfigLoads) {
    const std::filesystem::path shipped =
        std::filesystem::path(__FILE__).parent_path().parent_path() / "configs" / "config.yaml";
    if (!std::filesystem::exists(shipped)) GTEST_SKIP() << "configs/config.yaml not found";

    AppConfig c = load_config(shipped.string());
    EXPECT_EQ(c.inference.task, InferenceTask::Motion);
    EXPECT_EQ(PipelineController::interval_from_delay(c.delay_ms), 5);
}
