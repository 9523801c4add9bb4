/**
 * @file strace_parser.cpp
 * @brief Implementation of strace log parsing
 *
 * **strace Output Format** (`-f -ttt`):
 * ```
 * [pid] seconds.micros syscall(arg1, arg2, ...) = return_value
 *
 * Example:
 * 1234  1700000000.123456 openat(AT_FDCWD, "/etc/passwd", O_RDONLY) = 3
 * 1234  1700000000.124567 read(3, "root:x:0:0:...", 4096) = 1024
 * 1234  1700000000.125678 close(3) = 0
 * ```
 *
 * **Special Cases**:
 * - **Unfinished Calls**: `wait4(-1,  <unfinished ...>` counts as issued
 * - **Resumed Calls**: `<... wait4 resumed>) = 1235` skipped (already counted)
 * - **Signals**: `--- SIGCHLD {si_signo=SIGCHLD, ...} ---` skipped
 * - **Process Exit**: `+++ exited with 0 +++` skipped
 * - **Attach notices**: `strace: Process 1234 attached` invalid
 *
 * @date 2025
 */

#include "sysgram/parsers/strace_parser.hpp"
#include "sysgram/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace sysgram {
namespace parsers {

namespace {

constexpr const char* kUnfinishedMarker = "<unfinished ...>";

bool StartsSkippable(const std::string& text) {
    return utils::StringUtils::StartsWith(text, "<...") ||
           utils::StringUtils::StartsWith(text, "---") ||
           utils::StringUtils::StartsWith(text, "+++");
}

std::optional<std::chrono::nanoseconds> ParseTimestamp(const std::string& seconds,
                                                       const std::string& fraction) {
    std::string nanos = fraction.substr(0, 9);
    nanos.append(9 - nanos.size(), '0');

    try {
        return std::chrono::seconds(std::stoll(seconds)) +
               std::chrono::nanoseconds(std::stoll(nanos));
    }
    catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<std::int64_t> ParseReturnValue(const std::string& text) {
    if (text == "?") {
        return std::nullopt;
    }

    try {
        if (utils::StringUtils::StartsWith(text, "0x")) {
            return static_cast<std::int64_t>(std::stoull(text.substr(2), nullptr, 16));
        }
        return std::stoll(text);
    }
    catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // anonymous namespace

StraceParser::StraceParser()
    : prefix_regex_(R"(^\s*(?:\[pid\s+(\d+)\]\s*|(\d+)\s+)?(\d+)\.(\d+)\s+(.*)$)")
    , call_regex_(R"(^([A-Za-z_][A-Za-z0-9_]*)\((.*)$)")
    , result_regex_(R"(^(.*)\)\s+=\s+(-?\d+|0x[0-9a-fA-F]+|\?)(?:\s.*)?$)") {
    spdlog::debug("Strace parser initialized");
}

std::optional<StraceRecord> StraceParser::ParseLine(const std::string& line) const {
    std::smatch prefix;
    if (!std::regex_match(line, prefix, prefix_regex_)) {
        return std::nullopt;
    }

    const std::string rest = prefix[5].str();
    if (StartsSkippable(rest)) {
        return std::nullopt;
    }

    std::smatch call;
    if (!std::regex_match(rest, call, call_regex_)) {
        return std::nullopt;
    }

    auto timestamp = ParseTimestamp(prefix[3].str(), prefix[4].str());
    if (!timestamp) {
        return std::nullopt;
    }

    StraceRecord record;
    if (prefix[1].matched) {
        record.pid = std::stoi(prefix[1].str());
    } else if (prefix[2].matched) {
        record.pid = std::stoi(prefix[2].str());
    }
    record.timestamp = *timestamp;
    record.name = call[1].str();

    std::string tail = call[2].str();
    auto unfinished = tail.rfind(kUnfinishedMarker);
    if (unfinished != std::string::npos) {
        record.unfinished = true;
        record.args = utils::StringUtils::Trim(tail.substr(0, unfinished));
        if (!record.args.empty() && record.args.back() == ',') {
            record.args.pop_back();
        }
        return record;
    }

    // Greedy prefix: the last ") = value" closes the call, string arguments may contain earlier ones
    std::smatch result;
    if (std::regex_match(tail, result, result_regex_)) {
        record.args = result[1].str();
        record.return_value = ParseReturnValue(result[2].str());
    } else {
        record.args = tail;
    }

    return record;
}

bool StraceParser::IsSkippable(const std::string& line) const {
    const std::string trimmed = utils::StringUtils::Trim(line);
    if (StartsSkippable(trimmed)) {
        return true;
    }

    std::smatch prefix;
    if (std::regex_match(line, prefix, prefix_regex_)) {
        return StartsSkippable(prefix[5].str());
    }
    return false;
}

std::vector<StraceRecord> StraceParser::ParseFile(const std::filesystem::path& strace_log,
                                                  StraceParseStatistics* statistics) const {
    std::vector<StraceRecord> records;
    StraceParseStatistics stats;

    if (!std::filesystem::exists(strace_log)) {
        spdlog::warn("Strace log not found: {}", strace_log.string());
        return records;
    }

    std::ifstream file(strace_log);
    if (!file.is_open()) {
        spdlog::error("Failed to open strace log: {}", strace_log.string());
        return records;
    }

    spdlog::info("Parsing strace log: {}", strace_log.string());

    std::string line;
    while (std::getline(file, line)) {
        stats.lines++;

        if (auto record = ParseLine(line)) {
            records.push_back(std::move(*record));
            stats.syscalls++;
        } else if (IsSkippable(line)) {
            stats.skipped++;
        } else if (!utils::StringUtils::Trim(line).empty()) {
            stats.invalid++;
            spdlog::debug("Unparsable strace line {}: {}", stats.lines, line);
        }
    }

    spdlog::info("Parsed {} syscalls from {} lines ({} skipped, {} unparsable)",
                 stats.syscalls, stats.lines, stats.skipped, stats.invalid);

    if (statistics) {
        *statistics = stats;
    }
    return records;
}

} // namespace parsers
} // namespace sysgram
