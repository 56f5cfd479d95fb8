#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include "gate.hpp"

using namespace std::chrono;

TEST(GateTest, StartsOpen) {
    Gate gate;
    EXPECT_TRUE(gate.is_open());
    EXPECT_FALSE(gate.cancelled());
    EXPECT_TRUE(gate.wait());
}

TEST(GateTest, WaitBlocksUntilOpened) {
    Gate gate;
    gate.close();

    std::atomic<bool> passed{false};
    std::thread t([&] {
        EXPECT_TRUE(gate.wait());
        passed = true;
    });

    std::this_thread::sleep_for(milliseconds(50));
    EXPECT_FALSE(passed.load());
    gate.open();
    t.join();
    EXPECT_TRUE(passed.load());
}

TEST(GateTest, CancelReleasesWaiters) {
    Gate gate;
    gate.close();
    std::thread t([&] { EXPECT_FALSE(gate.wait()); });
    std::this_thread::sleep_for(milliseconds(20));
    gate.cancel();
    t.join();
    EXPECT_TRUE(gate.cancelled());
}

TEST(GateTest, SleepIsInterruptedByCancel) {
    Gate gate;
    const auto t0 = steady_clock::now();
    std::thread t([&] {
        std::this_thread::sleep_for(milliseconds(20));
        gate.cancel();
    });
    EXPECT_FALSE(gate.sleep_for(seconds(5)));
    t.join();
    EXPECT_LT(steady_clock::now() - t0, seconds(2));
}

TEST(GateTest, SleepReturnsEarlyWhenClosed) {
    Gate gate;
    std::thread t([&] {
        std::this_thread::sleep_for(milliseconds(20));
        gate.close();
    });
    const auto t0 = steady_clock::now();
    EXPECT_TRUE(gate.sleep_for(seconds(5)));
    t.join();
    EXPECT_LT(steady_clock::now() - t0, seconds(2));
}

TEST(GateTest, FullSleepWhenUndisturbed) {
    Gate gate;
    const auto t0 = steady_clock::now();
    EXPECT_TRUE(gate.sleep_for(milliseconds(30)));
    EXPECT_GE(steady_clock::now() - t0, milliseconds(25));
}

TEST(GateTest, ResetClearsCancel) {
    Gate gate;
    gate.close();
    gate.cancel();
    gate.reset();
    EXPECT_TRUE(gate.is_open());
    EXPECT_FALSE(gate.cancelled());
}
