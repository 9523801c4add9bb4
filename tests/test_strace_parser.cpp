/**
 * @file test_strace_parser.cpp
 * @brief Unit tests for strace line parsing
 */

#include <gtest/gtest.h>

#include "sysgram/parsers/strace_parser.hpp"

#include <filesystem>
#include <fstream>

using namespace sysgram::parsers;
using namespace std::chrono_literals;

TEST(StraceParserTest, ParsesLineWithPidColumn) {
    StraceParser parser;
    auto record = parser.ParseLine(
        R"(1234  1700000000.123456 openat(AT_FDCWD, "/etc/hosts", O_RDONLY|O_CLOEXEC) = 3)");

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->pid, 1234);
    EXPECT_EQ(record->timestamp, 1700000000s + 123456000ns);
    EXPECT_EQ(record->name, "openat");
    EXPECT_EQ(record->args, R"(AT_FDCWD, "/etc/hosts", O_RDONLY|O_CLOEXEC)");
    ASSERT_TRUE(record->return_value.has_value());
    EXPECT_EQ(*record->return_value, 3);
    EXPECT_FALSE(record->unfinished);
}

TEST(StraceParserTest, ParsesBracketedPidAndNoPid) {
    StraceParser parser;

    auto bracketed = parser.ParseLine("[pid  4321] 1700000001.5 close(3) = 0");
    ASSERT_TRUE(bracketed.has_value());
    EXPECT_EQ(bracketed->pid, 4321);
    EXPECT_EQ(bracketed->timestamp, 1700000001s + 500ms);

    auto bare = parser.ParseLine("1700000002.000001 getpid() = 77");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->pid, 0);
    EXPECT_EQ(bare->name, "getpid");
    EXPECT_EQ(bare->args, "");
    EXPECT_EQ(*bare->return_value, 77);
}

TEST(StraceParserTest, ParsesErrorReturn) {
    StraceParser parser;
    auto record = parser.ParseLine(
        R"(1700000000.1 openat(AT_FDCWD, "/nope", O_RDONLY) = -1 ENOENT (No such file or directory))");

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(*record->return_value, -1);
    EXPECT_EQ(record->args, R"(AT_FDCWD, "/nope", O_RDONLY)");
}

TEST(StraceParserTest, LastResultMarkerWins) {
    StraceParser parser;
    auto record = parser.ParseLine(R"(1700000000.1 write(1, "f() = 5\n", 8) = 8)");

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->name, "write");
    EXPECT_EQ(*record->return_value, 8);
    EXPECT_EQ(record->args, R"(1, "f() = 5\n", 8)");
}

TEST(StraceParserTest, HexAndUnknownReturnValues) {
    StraceParser parser;

    auto mmap = parser.ParseLine("1700000000.1 mmap(NULL, 8192, PROT_READ, MAP_PRIVATE, 3, 0) = 0x7f00");
    ASSERT_TRUE(mmap.has_value());
    EXPECT_EQ(*mmap->return_value, 0x7f00);

    auto exit_group = parser.ParseLine("1700000000.2 exit_group(0) = ?");
    ASSERT_TRUE(exit_group.has_value());
    EXPECT_EQ(exit_group->name, "exit_group");
    EXPECT_FALSE(exit_group->return_value.has_value());
}

TEST(StraceParserTest, UnfinishedCallIsAccepted) {
    StraceParser parser;
    auto record = parser.ParseLine("1234  1700000000.1 wait4(-1,  <unfinished ...>");

    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->unfinished);
    EXPECT_EQ(record->name, "wait4");
    EXPECT_EQ(record->args, "-1");
    EXPECT_FALSE(record->return_value.has_value());
}

TEST(StraceParserTest, SignalExitAndResumedLinesAreSkipped) {
    StraceParser parser;

    const std::string resumed = "1234  1700000000.2 <... wait4 resumed>[{WIFEXITED(s)}], 0, NULL) = 1235";
    const std::string signal = "1234  1700000000.3 --- SIGCHLD {si_signo=SIGCHLD} ---";
    const std::string exited = "1234  1700000000.4 +++ exited with 0 +++";

    for (const auto& line : {resumed, signal, exited}) {
        EXPECT_FALSE(parser.ParseLine(line).has_value()) << line;
        EXPECT_TRUE(parser.IsSkippable(line)) << line;
    }

    EXPECT_FALSE(parser.IsSkippable("garbage"));
}

TEST(StraceParserTest, ParseFileCountsLines) {
    auto path = std::filesystem::temp_directory_path() / "sysgram_strace_parser_test.log";
    {
        std::ofstream file(path);
        file << "100 1700000000.000001 read(3, \"x\", 1) = 1\n";
        file << "100 1700000000.000002 --- SIGCHLD {si_signo=SIGCHLD} ---\n";
        file << "not a trace line\n";
        file << "\n";
        file << "100 1700000000.000003 close(3) = 0\n";
    }

    StraceParser parser;
    StraceParseStatistics stats;
    auto records = parser.ParseFile(path, &stats);

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].name, "read");
    EXPECT_EQ(records[1].name, "close");
    EXPECT_EQ(stats.lines, 5u);
    EXPECT_EQ(stats.syscalls, 2u);
    EXPECT_EQ(stats.skipped, 1u);
    EXPECT_EQ(stats.invalid, 1u);

    std::filesystem::remove(path);
}

TEST(StraceParserTest, MissingFileYieldsNoRecords) {
    StraceParser parser;
    EXPECT_TRUE(parser.ParseFile("/nonexistent/strace.log").empty());
}
