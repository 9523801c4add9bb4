/**
 * @file test_windowing_engine.cpp
 * @brief Unit tests for fixed-duration windowing
 */

#include <gtest/gtest.h>

#include "sysgram/core/errors.hpp"
#include "sysgram/core/windowing_engine.hpp"

#include <chrono>
#include <vector>

using namespace sysgram::core;
using namespace std::chrono_literals;

namespace {

class WindowingEngineTest : public ::testing::Test {
protected:
    std::vector<Window> sealed;

    WindowCallback Collect() {
        return [this](Window&& window) { sealed.push_back(std::move(window)); };
    }

    static SyscallEvent Event(std::chrono::nanoseconds at, SyscallId id) {
        return SyscallEvent{at, id};
    }
};

} // anonymous namespace

TEST_F(WindowingEngineTest, RejectsNonPositiveDuration) {
    EXPECT_THROW(WindowingEngine(0ns, Collect()), ConfigurationError);
    EXPECT_THROW(WindowingEngine(-1s, Collect()), ConfigurationError);
}

TEST_F(WindowingEngineTest, FirstEventDefinesOrigin) {
    WindowingEngine engine(2s, Collect());
    EXPECT_FALSE(engine.OpenWindow().has_value());

    engine.Observe(Event(5s, 1));
    auto open = engine.OpenWindow();
    ASSERT_TRUE(open.has_value());
    EXPECT_EQ(open->index, 0u);
    EXPECT_EQ(open->start, Timestamp(5s));
    EXPECT_EQ(open->end, Timestamp(7s));
}

TEST_F(WindowingEngineTest, WindowsTileWithoutGapsOrOverlap) {
    WindowingEngine engine(2s, Collect());

    engine.Observe(Event(0s, 1));
    engine.Observe(Event(1s, 2));
    engine.Observe(Event(7s, 3));   // windows 1 and 2 are empty
    engine.Flush();

    ASSERT_EQ(sealed.size(), 4u);
    for (std::size_t i = 0; i < sealed.size(); ++i) {
        EXPECT_EQ(sealed[i].index, i);
        EXPECT_EQ(sealed[i].end - sealed[i].start, Timestamp(2s));
        if (i > 0) {
            EXPECT_EQ(sealed[i].start, sealed[i - 1].end);
        }
    }

    EXPECT_EQ(sealed[0].syscalls, (std::vector<SyscallId>{1, 2}));
    EXPECT_TRUE(sealed[1].syscalls.empty());
    EXPECT_TRUE(sealed[2].syscalls.empty());
    EXPECT_EQ(sealed[3].syscalls, (std::vector<SyscallId>{3}));
    EXPECT_EQ(engine.GetStatistics().empty_windows, 2u);
}

TEST_F(WindowingEngineTest, EventAtBoundaryBelongsToNextWindow) {
    WindowingEngine engine(2s, Collect());

    engine.Observe(Event(0s, 1));
    engine.Observe(Event(2s, 2));
    engine.Flush();

    ASSERT_EQ(sealed.size(), 2u);
    EXPECT_EQ(sealed[0].syscalls, (std::vector<SyscallId>{1}));
    EXPECT_EQ(sealed[1].syscalls, (std::vector<SyscallId>{2}));
}

TEST_F(WindowingEngineTest, OutOfOrderEventIsRejectedAndCounted) {
    WindowingEngine engine(2s, Collect());

    EXPECT_TRUE(engine.Observe(Event(1s, 1)));
    EXPECT_TRUE(engine.Observe(Event(1500ms, 2)));
    EXPECT_FALSE(engine.Observe(Event(1200ms, 3)));
    engine.Flush();

    ASSERT_EQ(sealed.size(), 1u);
    EXPECT_EQ(sealed[0].syscalls, (std::vector<SyscallId>{1, 2}));
    EXPECT_EQ(engine.GetStatistics().events_accepted, 2u);
    EXPECT_EQ(engine.GetStatistics().events_rejected, 1u);
}

TEST_F(WindowingEngineTest, EventBeforeSealedWindowIsRejected) {
    WindowingEngine engine(2s, Collect());
    engine.SetOrigin(Timestamp(10s));

    EXPECT_FALSE(engine.Observe(Event(9s, 1)));
    EXPECT_EQ(engine.GetStatistics().events_rejected, 1u);
}

TEST_F(WindowingEngineTest, AdvanceSealsEmptyWindowsOnCadence) {
    WindowingEngine engine(2s, Collect());
    engine.SetOrigin(Timestamp(0s));

    EXPECT_EQ(engine.Advance(Timestamp(1s)), 0u);
    EXPECT_EQ(engine.Advance(Timestamp(6s)), 3u);

    ASSERT_EQ(sealed.size(), 3u);
    EXPECT_EQ(sealed[2].start, Timestamp(4s));
    EXPECT_EQ(sealed[2].end, Timestamp(6s));
    for (const auto& window : sealed) {
        EXPECT_TRUE(window.syscalls.empty());
    }
}

TEST_F(WindowingEngineTest, AdvanceBeforeOriginDoesNothing) {
    WindowingEngine engine(2s, Collect());
    EXPECT_EQ(engine.Advance(Timestamp(100s)), 0u);
    EXPECT_TRUE(sealed.empty());
}

TEST_F(WindowingEngineTest, FlushKeepsTiling) {
    WindowingEngine engine(2s, Collect());

    engine.Observe(Event(0s, 1));
    EXPECT_EQ(engine.Flush(), 1u);
    EXPECT_EQ(engine.Flush(), 0u);

    engine.Observe(Event(3s, 2));
    engine.Flush();

    ASSERT_EQ(sealed.size(), 2u);
    EXPECT_EQ(sealed[1].index, 1u);
    EXPECT_EQ(sealed[1].start, Timestamp(2s));
    EXPECT_EQ(sealed[1].syscalls, (std::vector<SyscallId>{2}));
}
