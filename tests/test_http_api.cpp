#include <gtest/gtest.h>
#include "http_api.hpp"

using nlohmann::json;

TEST(SamplingRequestTest, ExplicitIntervalWins) {
    EXPECT_EQ(sampling_interval_from_body(json{{"interval", 7}, {"delay_ms", 500}}, 100), 7);
}

TEST(SamplingRequestTest, DelayMapsToInterval) {
    EXPECT_EQ(sampling_interval_from_body(json{{"delay_ms", 50}}, 100), 5);
    EXPECT_EQ(sampling_interval_from_body(json{{"delay_ms", 3}}, 100), 1);
}

TEST(SamplingRequestTest, EmptyBodyUsesConfiguredDelay) {
    EXPECT_EQ(sampling_interval_from_body(json::object(), 100), 10);
}

TEST(SamplingRequestTest, NonIntegerDelayIsRejected) {
    EXPECT_FALSE(sampling_interval_from_body(json{{"delay_ms", "fast"}}, 100).has_value());
    EXPECT_FALSE(sampling_interval_from_body(json{{"delay_ms", 2.5}}, 100).has_value());
    EXPECT_FALSE(sampling_interval_from_body(json{{"delay_ms", nullptr}}, 100).has_value());
}

TEST(SamplingRequestTest, NonIntegerIntervalIsRejected) {
    EXPECT_FALSE(sampling_interval_from_body(json{{"interval", "5"}}, 100).has_value());
}
