/**
 * @file strace_parser.hpp
 * @brief Parser for strace output recorded with absolute timestamps
 *
 * Understands the line layout produced by `strace -f -ttt`, with or without
 * a pid prefix. Signal deliveries, exit notices and `<... resumed>`
 * continuations carry no new syscall and are skipped.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace sysgram {
namespace parsers {

/**
 * @struct StraceRecord
 * @brief One syscall line of strace output
 */
struct StraceRecord {
    int pid{0};                               ///< Thread id (0 if not printed)
    std::chrono::nanoseconds timestamp{0};    ///< Wall-clock time of the call
    std::string name;                         ///< Syscall name (e.g. "openat")
    std::string args;                         ///< Raw argument text
    std::optional<std::int64_t> return_value; ///< Absent for "?" and unfinished calls
    bool unfinished{false};                   ///< Line ended with `<unfinished ...>`
};

/**
 * @struct StraceParseStatistics
 * @brief Line accounting of a parsed log
 */
struct StraceParseStatistics {
    std::uint64_t lines{0};     ///< Lines read
    std::uint64_t syscalls{0};  ///< Syscall records produced
    std::uint64_t skipped{0};   ///< Signal, exit and resumed lines
    std::uint64_t invalid{0};   ///< Lines that matched nothing
};

/**
 * @class StraceParser
 * @brief Line-oriented strace parser
 *
 * **Accepted layouts**:
 * ```
 * 1234  1700000000.123456 openat(AT_FDCWD, "/etc/hosts", O_RDONLY) = 3
 * [pid  1234] 1700000000.123456 read(3, "127.0.0.1 ...", 4096) = 158
 * 1700000000.123456 close(3) = 0
 * 1234  1700000000.123456 wait4(-1,  <unfinished ...>
 * ```
 *
 * **Usage Example**:
 * @code
 * StraceParser parser;
 * if (auto record = parser.ParseLine(line)) {
 *     std::cout << record->name << std::endl;
 * }
 * @endcode
 */
class StraceParser {
public:
    StraceParser();

    /**
     * @brief Parse one line
     * @param line strace output line
     * @return Record if the line issues a syscall
     */
    std::optional<StraceRecord> ParseLine(const std::string& line) const;

    /**
     * @brief Parse every line of a log file
     * @param strace_log Path to strace output
     * @param statistics Optional line accounting
     * @return Parsed records in file order (empty if the file cannot be read)
     */
    std::vector<StraceRecord> ParseFile(const std::filesystem::path& strace_log,
                                        StraceParseStatistics* statistics = nullptr) const;

    /**
     * @brief Classify a line that ParseLine() rejected
     * @return true for signal, exit and resumed lines
     */
    bool IsSkippable(const std::string& line) const;

private:
    std::regex prefix_regex_;   ///< pid + timestamp + remainder
    std::regex call_regex_;     ///< name(args...
    std::regex result_regex_;   ///< ") = value" at line end
};

} // namespace parsers
} // namespace sysgram
