/**
 * @file trace_file_source.cpp
 * @brief Implementation of recorded trace replay
 *
 * @date 2025
 */

#include "sysgram/capture/trace_file_source.hpp"
#include "sysgram/core/errors.hpp"
#include "sysgram/parsers/strace_parser.hpp"
#include "sysgram/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>
#include <set>
#include <stdexcept>
#include <utility>

namespace sysgram {
namespace capture {

std::optional<TraceFormat> ParseTraceFormat(const std::string& name) {
    const std::string lower = utils::StringUtils::ToLower(name);
    if (lower == "ids" || lower == "id_records") {
        return TraceFormat::ID_RECORDS;
    }
    if (lower == "strace") {
        return TraceFormat::STRACE;
    }
    return std::nullopt;
}

std::string TraceFormatName(TraceFormat format) {
    switch (format) {
        case TraceFormat::ID_RECORDS: return "ids";
        case TraceFormat::STRACE:     return "strace";
    }
    return "unknown";
}

TraceFileSource::TraceFileSource(std::filesystem::path path,
                                 TraceFormat format,
                                 std::shared_ptr<const parsers::SyscallTable> table)
    : path_(std::move(path))
    , format_(format)
    , table_(std::move(table)) {
    if (!table_) {
        table_ = std::make_shared<const parsers::SyscallTable>(parsers::SyscallTable::BuiltIn());
    }
}

std::vector<core::SyscallEvent> TraceFileSource::ReadAll() {
    statistics_ = CaptureStatistics{};

    if (!std::filesystem::exists(path_)) {
        throw core::ConfigurationError("trace file not found: " + path_.string());
    }

    auto events = format_ == TraceFormat::STRACE ? ReadStrace() : ReadIdRecords();

    if (statistics_.unknown_syscalls > 0) {
        spdlog::warn("{}: dropped {} syscalls with unknown identifiers",
                     path_.filename().string(), statistics_.unknown_syscalls);
    }
    if (statistics_.invalid_records > 0) {
        spdlog::warn("{}: skipped {} unparsable records",
                     path_.filename().string(), statistics_.invalid_records);
    }
    spdlog::debug("Read {} events from {} ({})", events.size(), path_.string(),
                  TraceFormatName(format_));
    return events;
}

std::vector<core::SyscallEvent> TraceFileSource::ReadIdRecords() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw core::ConfigurationError("cannot open trace file: " + path_.string());
    }

    std::vector<core::SyscallEvent> events;
    std::string line;
    std::uint64_t line_number = 0;

    while (std::getline(file, line)) {
        line_number++;

        auto comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }

        auto fields = utils::StringUtils::SplitWhitespace(line);
        if (fields.empty()) {
            continue;
        }

        core::SyscallEvent event;
        core::SyscallId raw_id = 0;
        try {
            if (fields.size() != 2) {
                throw std::invalid_argument("expected 2 fields");
            }
            std::size_t consumed = 0;
            event.timestamp = core::Timestamp(std::stoll(fields[0], &consumed));
            if (consumed != fields[0].size()) {
                throw std::invalid_argument("bad timestamp");
            }
            // stoull accepts a sign and wraps it, and ids are 32-bit
            if (fields[1].front() == '-' || fields[1].front() == '+') {
                throw std::invalid_argument("signed syscall id");
            }
            const unsigned long long id = std::stoull(fields[1], &consumed);
            if (consumed != fields[1].size()) {
                throw std::invalid_argument("bad syscall id");
            }
            if (id > std::numeric_limits<core::SyscallId>::max()) {
                throw std::out_of_range("syscall id out of range");
            }
            raw_id = static_cast<core::SyscallId>(id);
        }
        catch (const std::logic_error&) {
            statistics_.invalid_records++;
            spdlog::debug("{}:{}: unparsable record '{}'", path_.string(), line_number, line);
            continue;
        }

        auto canonical = table_->Canonicalize(raw_id);
        if (!canonical) {
            statistics_.unknown_syscalls++;
            continue;
        }

        event.syscall_id = *canonical;
        events.push_back(event);
    }

    return events;
}

std::vector<core::SyscallEvent> TraceFileSource::ReadStrace() {
    parsers::StraceParser parser;
    parsers::StraceParseStatistics parse_stats;

    std::ifstream check(path_);
    if (!check.is_open()) {
        throw core::ConfigurationError("cannot open trace file: " + path_.string());
    }
    check.close();

    auto records = parser.ParseFile(path_, &parse_stats);
    statistics_.invalid_records = parse_stats.invalid;

    std::vector<core::SyscallEvent> events;
    events.reserve(records.size());
    std::set<std::string> reported;

    for (const auto& record : records) {
        auto id = table_->Resolve(record.name);
        if (!id) {
            statistics_.unknown_syscalls++;
            if (reported.insert(record.name).second) {
                spdlog::debug("Unknown syscall '{}' in {}", record.name, path_.string());
            }
            continue;
        }
        events.push_back(core::SyscallEvent{record.timestamp, *id});
    }

    return events;
}

bool TraceFileSource::Start(EventCallback callback) {
    if (running_) {
        spdlog::warn("Trace replay already running: {}", path_.string());
        return true;
    }

    std::vector<core::SyscallEvent> events;
    try {
        events = ReadAll();
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to start trace replay: {}", e.what());
        return false;
    }

    running_ = true;
    stop_requested_ = false;
    spdlog::info("Replaying {} events from {}", events.size(), path_.string());

    for (const auto& event : events) {
        if (stop_requested_) {
            break;
        }
        callback(event);
        statistics_.events_delivered++;
    }

    running_ = false;
    return true;
}

void TraceFileSource::Stop() {
    stop_requested_ = true;
}

std::string TraceFileSource::Name() const {
    return "trace:" + path_.filename().string();
}

} // namespace capture
} // namespace sysgram
