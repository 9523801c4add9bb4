/**
 * @file test_trace_file_source.cpp
 * @brief Unit tests for recorded trace replay
 */

#include <gtest/gtest.h>

#include "sysgram/capture/trace_file_source.hpp"
#include "sysgram/core/errors.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace sysgram;
using namespace sysgram::capture;
using namespace std::chrono_literals;

namespace {

class TraceFileSourceTest : public ::testing::Test {
protected:
    std::filesystem::path path;

    void SetUp() override {
        path = std::filesystem::temp_directory_path() /
               (std::string("sysgram_trace_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".txt");
    }

    void TearDown() override {
        std::filesystem::remove(path);
    }

    void WriteTrace(const std::string& content) {
        std::ofstream file(path);
        file << content;
    }
};

} // anonymous namespace

TEST_F(TraceFileSourceTest, ParsesFormatNames) {
    EXPECT_EQ(ParseTraceFormat("ids"), TraceFormat::ID_RECORDS);
    EXPECT_EQ(ParseTraceFormat("id_records"), TraceFormat::ID_RECORDS);
    EXPECT_EQ(ParseTraceFormat("strace"), TraceFormat::STRACE);
    EXPECT_FALSE(ParseTraceFormat("pcap").has_value());
}

TEST_F(TraceFileSourceTest, ReadsIdRecords) {
    WriteTrace("# timestamp_ns syscall_id\n"
               "1000 0\n"
               "2000 1   # inline comment\n"
               "\n"
               "bad line here\n"
               "3000 x\n"
               "4000 3\n");

    TraceFileSource source(path, TraceFormat::ID_RECORDS, nullptr);
    auto events = source.ReadAll();

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].timestamp, core::Timestamp(1000));
    EXPECT_EQ(events[0].syscall_id, 0u);
    EXPECT_EQ(events[1].syscall_id, 1u);
    EXPECT_EQ(events[2].timestamp, core::Timestamp(4000));
    EXPECT_EQ(source.GetStatistics().invalid_records, 2u);
}

TEST_F(TraceFileSourceTest, OutOfRangeIdsAreInvalid) {
    WriteTrace("100 -1\n"
               "200 4294967296\n"
               "300 18446744073709551617\n"
               "400 +5\n"
               "500 4294967295\n"
               "600 2\n");

    TraceFileSource source(path, TraceFormat::ID_RECORDS, nullptr);
    auto events = source.ReadAll();

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].syscall_id, 4294967295u);
    EXPECT_EQ(events[1].syscall_id, 2u);
    EXPECT_EQ(source.GetStatistics().invalid_records, 4u);
}

TEST_F(TraceFileSourceTest, IdRecordsAreCanonicalized) {
    WriteTrace("1 0\n2 1\n3 59\n");

    auto table = std::make_shared<parsers::SyscallTable>(parsers::SyscallTable::BuiltIn());
    table->MapId(0, 10);
    table->MapId(1, 11);

    TraceFileSource source(path, TraceFormat::ID_RECORDS, table);
    auto events = source.ReadAll();

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].syscall_id, 10u);
    EXPECT_EQ(events[1].syscall_id, 11u);
    EXPECT_EQ(source.GetStatistics().unknown_syscalls, 1u);
}

TEST_F(TraceFileSourceTest, ReadsStraceOutput) {
    WriteTrace("100 1700000000.000001 read(3, \"x\", 1) = 1\n"
               "100 1700000000.000002 frobnicate(1) = 0\n"
               "100 1700000000.500000 close(3) = 0\n"
               "100 1700000000.600000 +++ exited with 0 +++\n");

    TraceFileSource source(path, TraceFormat::STRACE, nullptr);
    auto events = source.ReadAll();

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].syscall_id, 0u);
    EXPECT_EQ(events[0].timestamp, 1700000000s + 1000ns);
    EXPECT_EQ(events[1].syscall_id, 3u);
    EXPECT_EQ(source.GetStatistics().unknown_syscalls, 1u);
}

TEST_F(TraceFileSourceTest, StartDeliversSynchronously) {
    WriteTrace("10 0\n20 1\n30 2\n");

    TraceFileSource source(path, TraceFormat::ID_RECORDS, nullptr);
    std::vector<core::SyscallId> delivered;

    EXPECT_TRUE(source.Start([&delivered](const core::SyscallEvent& event) {
        delivered.push_back(event.syscall_id);
    }));

    EXPECT_EQ(delivered, (std::vector<core::SyscallId>{0, 1, 2}));
    EXPECT_FALSE(source.IsRunning());
    EXPECT_EQ(source.GetStatistics().events_delivered, 3u);
    EXPECT_EQ(source.Name(), "trace:" + path.filename().string());
}

TEST_F(TraceFileSourceTest, MissingFile) {
    TraceFileSource source("/nonexistent/trace.txt", TraceFormat::ID_RECORDS, nullptr);
    EXPECT_THROW(source.ReadAll(), core::ConfigurationError);
    EXPECT_FALSE(source.Start([](const core::SyscallEvent&) {}));
}
