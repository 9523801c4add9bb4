/**
 * @file logging.cpp
 * @brief Implementation of the spdlog setup
 *
 * @date 2025
 */

#include "sysgram/utils/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace sysgram {
namespace utils {

void ConfigureLogging(bool verbose, bool to_stderr) {
    spdlog::sink_ptr sink;
    if (to_stderr) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }

    spdlog::set_default_logger(std::make_shared<spdlog::logger>("sysgram", std::move(sink)));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::debug("Verbose logging enabled");
}

} // namespace utils
} // namespace sysgram
