#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <optional>
#include <vector>
#include "metrics.hpp"

class RollingHistTest : public ::testing::Test {
protected:
    void SetUp() override {
        hist = std::make_unique<RollingHist>(5);  // Small capacity for testing
    }

    std::unique_ptr<RollingHist> hist;
};

TEST_F(RollingHistTest, EmptyHistogram) {
    EXPECT_EQ(hist->size(), 0);
    EXPECT_DOUBLE_EQ(hist->perc(50.0), 0.0);
    EXPECT_DOUBLE_EQ(hist->perc(95.0), 0.0);
}

TEST_F(RollingHistTest, SingleValue) {
    hist->add(42.0);
    EXPECT_EQ(hist->size(), 1);
    EXPECT_DOUBLE_EQ(hist->perc(0.0), 42.0);
    EXPECT_DOUBLE_EQ(hist->perc(50.0), 42.0);
    EXPECT_DOUBLE_EQ(hist->perc(100.0), 42.0);
}

TEST_F(RollingHistTest, MultipleValues) {
    // Add values: 1, 2, 3, 4, 5
    for (int i = 1; i <= 5; ++i) {
        hist->add(static_cast<double>(i));
    }
    
    EXPECT_EQ(hist->size(), 5);
    EXPECT_DOUBLE_EQ(hist->perc(0.0), 1.0);   // Min value
    EXPECT_DOUBLE_EQ(hist->perc(50.0), 3.0);  // Median
    EXPECT_DOUBLE_EQ(hist->perc(100.0), 5.0); // Max value
}

TEST_F(RollingHistTest, CapacityOverflow) {
    // Add 7 values to a capacity-5 histogram
    for (int i = 1; i <= 7; ++i) {
        hist->add(static_cast<double>(i));
    }
    
    EXPECT_EQ(hist->size(), 5);  // Should cap at 5
    // Should contain values 3, 4, 5, 6, 7 (oldest dropped)
    EXPECT_DOUBLE_EQ(hist->perc(0.0), 3.0);
    EXPECT_DOUBLE_EQ(hist->perc(100.0), 7.0);
}

TEST_F(RollingHistTest, PercentileCalculation) {
    // Add values: 10, 20, 30, 40, 50
    for (int i = 1; i <= 5; ++i) {
        hist->add(static_cast<double>(i * 10));
    }
    
    EXPECT_DOUBLE_EQ(hist->perc(25.0), 20.0);  // 25th percentile
    EXPECT_DOUBLE_EQ(hist->perc(75.0), 40.0);  // 75th percentile
}

TEST_F(RollingHistTest, ThreadSafety) {
    const int num_threads = 4;
    const int values_per_thread = 100;
    
    std::vector<std::thread> threads;
    
    // Launch multiple threads to add values concurrently
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t, values_per_thread]() {
            for (int i = 0; i < values_per_thread; ++i) {
                hist->add(static_cast<double>(t * values_per_thread + i));
            }
        });
    }
    
    // Wait for all threads to complete
    for (auto& thread : threads) {
        thread.join();
    }
    
    // Should have exactly 5 values due to capacity limit
    EXPECT_EQ(hist->size(), 5);
    
    // All values should be valid (no corruption)
    double p50 = hist->perc(50.0);
    double p95 = hist->perc(95.0);
    EXPECT_GE(p50, 0.0);
    EXPECT_GE(p95, p50);
}

class StatisticsAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        start = Clock::now();
        agg.reset(start);
    }

    static SampleOutcome outcome(double ms, std::optional<int> detections) {
        SampleOutcome o;
        o.latency_ms = ms;
        o.detections = detections;
        return o;
    }

    StatisticsAggregator agg;
    TimePoint start;
};

TEST_F(StatisticsAggregatorTest, InitialState) {
    auto s = agg.snapshot();
    EXPECT_EQ(s.frames_observed, 0u);
    EXPECT_EQ(s.total_frames_processed, 0u);
    EXPECT_DOUBLE_EQ(s.avg_inference_ms, 0.0);
    EXPECT_DOUBLE_EQ(s.fps, 0.0);
}

TEST_F(StatisticsAggregatorTest, AccumulatesLatencyAndDetections) {
    for (int i = 0; i < 10; ++i) agg.observe();
    agg.record(outcome(10.0, 3), start + std::chrono::milliseconds(100));
    agg.record(outcome(20.0, 0), start + std::chrono::milliseconds(200));
    agg.record(outcome(30.0, std::nullopt), start + std::chrono::milliseconds(300));

    auto s = agg.snapshot();
    EXPECT_EQ(s.frames_observed, 10u);
    EXPECT_EQ(s.total_frames_processed, 3u);
    EXPECT_EQ(s.total_detections, 3u);
    EXPECT_EQ(s.detection_count, 0);  // latest sample had none
    EXPECT_DOUBLE_EQ(s.total_inference_ms, 60.0);
    EXPECT_DOUBLE_EQ(s.avg_inference_ms, 20.0);
    EXPECT_DOUBLE_EQ(s.last_inference_ms, 30.0);
    EXPECT_DOUBLE_EQ(s.inf_p50, 20.0);
}

TEST_F(StatisticsAggregatorTest, FpsFromGapBetweenSamples) {
    agg.record(outcome(1.0, 1), start + std::chrono::milliseconds(500));
    EXPECT_NEAR(agg.snapshot().fps, 2.0, 1e-6);
    agg.record(outcome(1.0, 1), start + std::chrono::milliseconds(600));
    EXPECT_NEAR(agg.snapshot().fps, 10.0, 1e-6);
}

TEST_F(StatisticsAggregatorTest, ClassificationFields) {
    SampleOutcome o = outcome(5.0, 1);
    o.class_name = "tabby";
    o.class_confidence = 0.8;
    o.avg_confidence = 0.8;
    agg.record(o, start + std::chrono::milliseconds(10));

    auto s = agg.snapshot();
    EXPECT_EQ(s.class_name, "tabby");
    EXPECT_DOUBLE_EQ(s.class_confidence, 0.8);
    EXPECT_DOUBLE_EQ(s.avg_confidence, 0.8);

    agg.record(outcome(5.0, 2), start + std::chrono::milliseconds(20));
    s = agg.snapshot();
    EXPECT_TRUE(s.class_name.empty());
    EXPECT_DOUBLE_EQ(s.class_confidence, 0.0);
}

TEST_F(StatisticsAggregatorTest, ResetStartsNewSession) {
    agg.observe();
    agg.record(outcome(4.0, 2), start + std::chrono::milliseconds(10));
    agg.reset(Clock::now());

    auto s = agg.snapshot();
    EXPECT_EQ(s.frames_observed, 0u);
    EXPECT_EQ(s.total_frames_processed, 0u);
    EXPECT_EQ(s.total_detections, 0u);
    EXPECT_DOUBLE_EQ(s.inf_p95, 0.0);
}

TEST_F(StatisticsAggregatorTest, PrometheusOutput) {
    agg.observe();
    agg.record(outcome(5.0, 1), start + std::chrono::milliseconds(10));
    std::string text = StatisticsAggregator::prometheus_text(agg.snapshot());

    EXPECT_NE(text.find("frametap_frames_observed_total 1"), std::string::npos);
    EXPECT_NE(text.find("frametap_frames_processed_total 1"), std::string::npos);
    EXPECT_NE(text.find("frametap_detections_total 1"), std::string::npos);
    EXPECT_NE(text.find("frametap_inference_ms{quantile=\"0.95\"}"), std::string::npos);
}

TEST_F(StatisticsAggregatorTest, ConcurrentObserveAndSnapshot) {
    const int num_threads = 4;
    const int operations_per_thread = 1000;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, operations_per_thread]() {
            for (int i = 0; i < operations_per_thread; ++i) {
                agg.observe();
                if (i % 100 == 0) (void)agg.snapshot();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(agg.snapshot().frames_observed,
              static_cast<uint64_t>(num_threads * operations_per_thread));
}
