/**
 * @file test_detection_pipeline.cpp
 * @brief Streaming inference tests: ordering, error isolation, backlog, live cadence
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "sysgram/core/detection_pipeline.hpp"
#include "sysgram/core/errors.hpp"
#include "sysgram/core/trainer.hpp"
#include "sysgram/reporters/score_reporter.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace sysgram;
using namespace sysgram::core;
using namespace std::chrono_literals;

namespace {

/// Sink keeping every record, optionally failing on one window
class RecordingSink : public reporters::ScoreSink {
public:
    explicit RecordingSink(std::int64_t fail_on = -1) : fail_on_(fail_on) {}

    void Emit(const reporters::ScoreRecord& record) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            records_.push_back(record);
        }
        if (static_cast<std::int64_t>(record.window.index) == fail_on_) {
            throw std::runtime_error("sink unavailable");
        }
    }

    std::vector<reporters::ScoreRecord> Records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

private:
    std::int64_t fail_on_;
    mutable std::mutex mutex_;
    std::vector<reporters::ScoreRecord> records_;
};

/// Sink that takes longer per window than the stream produces them
class SlowSink : public RecordingSink {
public:
    explicit SlowSink(std::chrono::milliseconds delay) : delay_(delay) {}

    void Emit(const reporters::ScoreRecord& record) override {
        std::this_thread::sleep_for(delay_);
        RecordingSink::Emit(record);
    }

private:
    std::chrono::milliseconds delay_;
};

/// Sink reporting a model mismatch on one window
class MismatchSink : public RecordingSink {
public:
    explicit MismatchSink(std::uint64_t fail_on) : fail_on_(fail_on) {}

    void Emit(const reporters::ScoreRecord& record) override {
        RecordingSink::Emit(record);
        if (record.window.index == fail_on_) {
            throw ModelMismatchError("vocabulary changed under the pipeline");
        }
    }

private:
    std::uint64_t fail_on_;
};

/// Live source driven by the test
class ManualSource : public capture::SyscallSource {
public:
    bool Start(capture::EventCallback callback) override {
        callback_ = std::move(callback);
        running_ = true;
        return true;
    }
    void Stop() override { running_ = false; }
    bool IsRunning() const override { return running_; }
    std::string Name() const override { return "manual"; }
    capture::CaptureStatistics GetStatistics() const override { return {}; }

private:
    capture::EventCallback callback_;
    std::atomic<bool> running_{false};
};

class DetectionPipelineTest : public ::testing::Test {
protected:
    DetectorConfig config;
    TrainingResult model;

    void SetUp() override {
        config.tree_count = 50;

        Trainer trainer(config);
        trainer.AddWindow({2, 3, 4, 2, 3});
        trainer.AddWindow({2, 3, 4, 2, 3});
        trainer.AddWindow({5, 6, 5, 6, 5});
        model = trainer.Train();
    }

    /// Events placing each sequence in consecutive 2 s windows
    static std::vector<SyscallEvent> Events(const std::vector<std::vector<SyscallId>>& windows) {
        std::vector<SyscallEvent> events;
        for (std::size_t w = 0; w < windows.size(); ++w) {
            for (std::size_t i = 0; i < windows[w].size(); ++i) {
                auto at = std::chrono::seconds(2 * w) + std::chrono::milliseconds(10 * i);
                events.push_back(SyscallEvent{at, windows[w][i]});
            }
        }
        return events;
    }
};

} // anonymous namespace

TEST_F(DetectionPipelineTest, ConstructorChecksArtifacts) {
    EXPECT_THROW(DetectionPipeline(config, nullptr, model.forest), ConfigurationError);
    EXPECT_THROW(DetectionPipeline(config, model.vectorizer, nullptr), ConfigurationError);

    auto unfitted = std::make_shared<const models::IsolationForest>();
    EXPECT_THROW(DetectionPipeline(config, model.vectorizer, unfitted), ConfigurationError);

    DetectorConfig bigrams = config;
    bigrams.gram_size = 2;
    EXPECT_THROW(DetectionPipeline(bigrams, model.vectorizer, model.forest), ModelMismatchError);

    Trainer other(config);
    other.AddWindow({7, 8, 9, 7});
    auto other_model = other.Train();
    EXPECT_THROW(DetectionPipeline(config, model.vectorizer, other_model.forest), ModelMismatchError);
}

TEST_F(DetectionPipelineTest, WindowsArePublishedInOrder) {
    DetectionPipeline pipeline(config, model.vectorizer, model.forest);
    auto sink = std::make_shared<RecordingSink>();
    pipeline.AddSink(sink);

    pipeline.ProcessEvents(Events({{2, 3, 4, 2, 3}, {5, 6, 5, 6, 5}, {9, 9, 9, 9, 9},
                                   {2, 3, 4, 2, 3}, {}, {5, 6, 5}}));
    pipeline.Stop();

    auto records = sink->Records();
    ASSERT_EQ(records.size(), 6u);
    for (std::size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].window.index, i);
        EXPECT_EQ(records[i].window.end - records[i].window.start, Timestamp(2s));
        EXPECT_EQ(records[i].system_id, config.system_id);
    }
    EXPECT_EQ(records[0].syscall_count, 5u);
    EXPECT_EQ(records[4].syscall_count, 0u);

    auto stats = pipeline.GetStatistics();
    EXPECT_EQ(stats.windows_sealed, 6u);
    EXPECT_EQ(stats.windows_scored, 6u);
    EXPECT_EQ(stats.queue_depth, 0u);
}

TEST_F(DetectionPipelineTest, NovelWindowRaisesAlert) {
    DetectionPipeline pipeline(config, model.vectorizer, model.forest);
    auto sink = std::make_shared<RecordingSink>();
    pipeline.AddSink(sink);

    std::vector<detection::Alert> alerts;
    pipeline.SetAlertCallback([&alerts](const detection::Alert& alert) { alerts.push_back(alert); });

    pipeline.ProcessEvents(Events({{5, 6, 5, 6, 5}, {9, 9, 9, 9, 9}}));
    pipeline.Stop();

    auto records = sink->Records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_FALSE(records[0].alert);
    EXPECT_TRUE(records[1].alert);
    EXPECT_LT(records[0].score, records[1].score);

    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].window.index, 1u);
    EXPECT_DOUBLE_EQ(alerts[0].score, records[1].score);
    EXPECT_DOUBLE_EQ(alerts[0].threshold, 0.6);
    EXPECT_EQ(pipeline.GetStatistics().alerts, 1u);
}

TEST_F(DetectionPipelineTest, ThresholdChangeAppliesToLaterWindows) {
    DetectionPipeline pipeline(config, model.vectorizer, model.forest);
    auto sink = std::make_shared<RecordingSink>();
    pipeline.AddSink(sink);

    pipeline.ProcessEvents(Events({{9, 9, 9, 9, 9}}));
    pipeline.GetAlerter().SetThreshold(0.99);

    // Continue the same timeline after the flushed window
    std::vector<SyscallEvent> later;
    for (SyscallId i = 0; i < 5; ++i) {
        later.push_back(SyscallEvent{Timestamp(2s) + std::chrono::milliseconds(10 * i), 9});
    }
    pipeline.ProcessEvents(later);
    pipeline.Stop();

    auto records = sink->Records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_TRUE(records[0].alert);
    EXPECT_DOUBLE_EQ(records[0].threshold, 0.6);
    EXPECT_FALSE(records[1].alert);
    EXPECT_DOUBLE_EQ(records[1].threshold, 0.99);
}

TEST_F(DetectionPipelineTest, FailingWindowDoesNotStopLaterWindows) {
    DetectionPipeline pipeline(config, model.vectorizer, model.forest);
    auto sink = std::make_shared<RecordingSink>(1);
    pipeline.AddSink(sink);

    pipeline.ProcessEvents(Events({{2, 3, 4}, {5, 6, 5}, {2, 3, 4}, {5, 6, 5}}));
    pipeline.Stop();

    auto records = sink->Records();
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[3].window.index, 3u);

    auto stats = pipeline.GetStatistics();
    EXPECT_EQ(stats.windows_failed, 1u);
    EXPECT_EQ(stats.windows_scored, 3u);
    EXPECT_FALSE(pipeline.HasFailed());
}

TEST_F(DetectionPipelineTest, OutOfOrderEventsAreRejected) {
    DetectionPipeline pipeline(config, model.vectorizer, model.forest);

    pipeline.ProcessEvents({{0ms, 2}, {100ms, 3}, {50ms, 4}, {200ms, 4}});
    pipeline.Stop();

    auto stats = pipeline.GetStatistics();
    EXPECT_EQ(stats.events_accepted, 3u);
    EXPECT_EQ(stats.events_rejected, 1u);
    EXPECT_EQ(stats.windows_scored, 1u);
}

TEST_F(DetectionPipelineTest, ScoreWindowMatchesModel) {
    DetectionPipeline pipeline(config, model.vectorizer, model.forest);

    Window window;
    window.syscalls = {5, 6, 5, 6, 5};

    features::NGramExtractor extractor(3);
    auto expected = model.forest->Score(model.vectorizer->Transform(extractor.Extract(window)));
    EXPECT_EQ(pipeline.ScoreWindow(window), expected);

    // A window without a single gram sits at the quietest training score
    EXPECT_EQ(pipeline.ScoreWindow(Window{}), model.forest->GetBaselineScore());
    Window short_window;
    short_window.syscalls = {5, 6};
    EXPECT_EQ(pipeline.ScoreWindow(short_window), model.forest->GetBaselineScore());
}

TEST_F(DetectionPipelineTest, SlowSinkBacklogKeepsEveryWindowInOrder) {
    DetectionPipeline pipeline(config, model.vectorizer, model.forest);
    auto sink = std::make_shared<SlowSink>(50ms);
    pipeline.AddSink(sink);

    std::vector<std::vector<SyscallId>> windows;
    for (int i = 0; i < 8; ++i) {
        windows.push_back(i % 2 == 0 ? std::vector<SyscallId>{2, 3, 4, 2, 3}
                                     : std::vector<SyscallId>{5, 6, 5, 6, 5});
    }
    pipeline.ProcessEvents(Events(windows));
    pipeline.Stop();

    auto records = sink->Records();
    ASSERT_EQ(records.size(), 8u);
    for (std::size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].window.index, i);
    }

    auto stats = pipeline.GetStatistics();
    EXPECT_EQ(stats.windows_scored, 8u);
    EXPECT_EQ(stats.windows_discarded, 0u);
    EXPECT_EQ(stats.windows_failed, 0u);
    EXPECT_GE(stats.peak_queue_depth, 2u);
    EXPECT_GE(stats.max_latency, std::chrono::microseconds(50ms));
    EXPECT_GE(records.back().latency, records.front().latency);
}

TEST_F(DetectionPipelineTest, SlowSinkBacklogGrowsWhileCapturing) {
    DetectorConfig live = config;
    live.window_duration = std::chrono::milliseconds(50);

    DetectionPipeline pipeline(live, model.vectorizer, model.forest);
    auto sink = std::make_shared<SlowSink>(120ms);
    pipeline.AddSink(sink);

    ManualSource source;
    ASSERT_TRUE(pipeline.Start(source));
    std::this_thread::sleep_for(700ms);

    // Still capturing: windows pile up but none is dropped
    auto stats = pipeline.GetStatistics();
    EXPECT_TRUE(source.IsRunning());
    EXPECT_GE(stats.peak_queue_depth, 2u);
    EXPECT_GT(stats.windows_sealed, stats.windows_scored);
    EXPECT_EQ(stats.windows_discarded, 0u);
    EXPECT_GE(stats.max_latency, std::chrono::microseconds(50ms));

    pipeline.Stop();

    auto records = sink->Records();
    ASSERT_GE(records.size(), 2u);
    for (std::size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].window.index, i);
    }
}

TEST_F(DetectionPipelineTest, ModelMismatchStopsThePipeline) {
    DetectionPipeline pipeline(config, model.vectorizer, model.forest);
    auto sink = std::make_shared<MismatchSink>(1);
    pipeline.AddSink(sink);

    // Returns once the worker has given up
    pipeline.ProcessEvents(Events({{2, 3, 4}, {5, 6, 5}, {2, 3, 4}, {5, 6, 5}, {2, 3, 4}, {5, 6, 5}}));

    EXPECT_TRUE(pipeline.HasFailed());
    EXPECT_NE(pipeline.LastError().find("vocabulary changed under the pipeline"), std::string::npos);

    auto records = sink->Records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].window.index, 0u);
    EXPECT_EQ(records[1].window.index, 1u);

    auto stats = pipeline.GetStatistics();
    EXPECT_EQ(stats.windows_sealed, 6u);
    EXPECT_EQ(stats.windows_scored, 1u);
    EXPECT_EQ(stats.windows_failed, 1u);
    EXPECT_EQ(stats.windows_discarded, 4u);

    // Nothing more is scored after the failure
    pipeline.ProcessEvents(Events({{2, 3, 4}}));
    pipeline.Stop();
    EXPECT_EQ(sink->Records().size(), 2u);
    EXPECT_TRUE(pipeline.HasFailed());
}

TEST_F(DetectionPipelineTest, LiveModeSealsWindowsOnCadence) {
    DetectorConfig live = config;
    live.window_duration = std::chrono::milliseconds(100);

    DetectionPipeline pipeline(live, model.vectorizer, model.forest);
    auto sink = std::make_shared<RecordingSink>();
    pipeline.AddSink(sink);

    ManualSource source;
    ASSERT_TRUE(pipeline.Start(source));
    EXPECT_TRUE(source.IsRunning());

    std::this_thread::sleep_for(700ms);
    pipeline.Stop();

    EXPECT_FALSE(source.IsRunning());

    // Windows are sealed without any event arriving
    auto records = sink->Records();
    ASSERT_GE(records.size(), 2u);
    for (std::size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].window.index, i);
        EXPECT_EQ(records[i].syscall_count, 0u);
    }
}

TEST_F(DetectionPipelineTest, JsonLinesFeedIsReadableWhileRunning) {
    DetectorConfig live = config;
    live.window_duration = std::chrono::milliseconds(100);

    auto path = std::filesystem::temp_directory_path() / "sysgram_live_feed.jsonl";
    std::filesystem::remove(path);

    DetectionPipeline pipeline(live, model.vectorizer, model.forest);
    pipeline.AddSink(std::make_shared<reporters::JsonLinesScoreSink>(path));

    ManualSource source;
    ASSERT_TRUE(pipeline.Start(source));

    auto read_lines = [&path]() {
        std::vector<std::string> lines;
        std::ifstream file(path);
        std::string line;
        while (std::getline(file, line)) {
            lines.push_back(line);
        }
        return lines;
    };

    // A tail -f reader sees each window as soon as it is published
    std::vector<std::string> lines;
    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (std::chrono::steady_clock::now() < deadline) {
        lines = read_lines();
        if (lines.size() >= 2) {
            break;
        }
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_TRUE(source.IsRunning());
    pipeline.Stop();

    ASSERT_GE(lines.size(), 2u);
    EXPECT_EQ(nlohmann::json::parse(lines[0]).at("window_index").get<std::uint64_t>(), 0u);
    EXPECT_EQ(nlohmann::json::parse(lines[1]).at("window_index").get<std::uint64_t>(), 1u);

    std::filesystem::remove(path);
}
