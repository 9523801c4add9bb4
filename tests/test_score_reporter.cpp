/**
 * @file test_score_reporter.cpp
 * @brief Unit tests for score feed sinks
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "sysgram/reporters/score_reporter.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace sysgram;
using namespace sysgram::reporters;

namespace {

ScoreRecord MakeRecord(std::uint64_t index, double score, bool alert) {
    ScoreRecord record;
    record.system_id = "plc-01";
    record.window = core::WindowSpan{index, core::Timestamp(4000000000LL), core::Timestamp(6000000000LL)};
    record.syscall_count = 812;
    record.score = score;
    record.filtered_score = score;
    record.threshold = 0.6;
    record.alert = alert;
    record.latency = std::chrono::microseconds(1500);
    return record;
}

} // anonymous namespace

TEST(ScoreReporterTest, JsonLineCarriesEveryField) {
    auto j = json::parse(ToJsonLine(MakeRecord(2, 0.71, true)));

    EXPECT_EQ(j.at("system_id"), "plc-01");
    EXPECT_EQ(j.at("window_index"), 2);
    EXPECT_EQ(j.at("window_start_ns"), 4000000000LL);
    EXPECT_EQ(j.at("window_end_ns"), 6000000000LL);
    EXPECT_EQ(j.at("syscall_count"), 812);
    EXPECT_DOUBLE_EQ(j.at("score").get<double>(), 0.71);
    EXPECT_DOUBLE_EQ(j.at("threshold").get<double>(), 0.6);
    EXPECT_TRUE(j.at("alert").get<bool>());
    EXPECT_DOUBLE_EQ(j.at("latency_ms").get<double>(), 1.5);
}

TEST(ScoreReporterTest, StreamSinkWritesOneLinePerRecord) {
    std::ostringstream out;
    JsonLinesScoreSink sink(out);

    sink.Emit(MakeRecord(0, 0.2, false));
    sink.Emit(MakeRecord(1, 0.3, false));
    sink.Flush();

    EXPECT_EQ(sink.GetWritten(), 2u);

    std::istringstream in(out.str());
    std::string line;
    std::vector<std::uint64_t> indices;
    while (std::getline(in, line)) {
        indices.push_back(json::parse(line).at("window_index").get<std::uint64_t>());
    }
    EXPECT_EQ(indices, (std::vector<std::uint64_t>{0, 1}));
}

TEST(ScoreReporterTest, FileSinkTruncatesAndWrites) {
    auto path = std::filesystem::temp_directory_path() / "sysgram_score_feed_test.jsonl";
    {
        std::ofstream stale(path);
        stale << "stale\n";
    }

    {
        JsonLinesScoreSink sink(path);
        sink.Emit(MakeRecord(5, 0.9, true));
        sink.Flush();
    }

    std::ifstream file(path);
    std::string line;
    ASSERT_TRUE(std::getline(file, line));
    EXPECT_EQ(json::parse(line).at("window_index"), 5);
    EXPECT_FALSE(std::getline(file, line));

    std::filesystem::remove(path);
}

TEST(ScoreReporterTest, FileSinkThrowsOnUnwritablePath) {
    EXPECT_THROW(JsonLinesScoreSink(std::filesystem::path("/nonexistent-dir/feed.jsonl")),
                 std::runtime_error);
}

TEST(ScoreReporterTest, CallbackSinkForwardsRecords) {
    std::vector<double> scores;
    CallbackScoreSink sink([&scores](const ScoreRecord& record) { scores.push_back(record.score); });

    sink.Emit(MakeRecord(0, 0.25, false));
    sink.Emit(MakeRecord(1, 0.75, true));
    EXPECT_EQ(scores, (std::vector<double>{0.25, 0.75}));
}
