/**
 * @file config.cpp
 * @brief Implementation of detector configuration loading and validation
 *
 * Validation rules:
 * - window duration, gram size, tree count, sample size: strictly positive
 * - alert threshold: within [0, 1]
 * - contamination: within (0, 0.5]
 * - EWMA alpha: within (0, 1]
 * - filter rank: within [1, filter history]
 *
 * @date 2025
 */

#include "sysgram/core/config.hpp"
#include "sysgram/core/errors.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <set>
#include <type_traits>

using json = nlohmann::json;

namespace sysgram {
namespace core {

namespace {

const std::set<std::string> kKnownKeys = {
    "window_duration_ms", "gram_size", "tree_count", "sample_size",
    "max_depth", "seed", "range_penalty", "alert_threshold", "contamination",
    "ewma_alpha", "filter_history", "filter_rank", "backlog_warning",
    "system_id"
};

template <typename T>
void ReadKey(const json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    if (std::is_integral<T>::value && !std::is_same<T, bool>::value) {
        if (!it->is_number_integer()) {
            throw ConfigurationError(std::string("invalid value for '") + key + "': expected an integer");
        }
        if (std::is_unsigned<T>::value && !it->is_number_unsigned()) {
            throw ConfigurationError(std::string("invalid value for '") + key + "': must not be negative");
        }
    }
    try {
        target = it->get<T>();
    }
    catch (const json::exception& e) {
        throw ConfigurationError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

} // anonymous namespace

void DetectorConfig::Validate() const {
    if (window_duration.count() <= 0) {
        throw ConfigurationError("window_duration_ms must be positive");
    }
    if (gram_size == 0) {
        throw ConfigurationError("gram_size must be positive");
    }
    if (tree_count == 0) {
        throw ConfigurationError("tree_count must be positive");
    }
    if (sample_size == 0) {
        throw ConfigurationError("sample_size must be positive");
    }
    if (!(alert_threshold >= 0.0 && alert_threshold <= 1.0)) {
        throw ConfigurationError("alert_threshold must be within [0, 1]");
    }
    if (!(contamination > 0.0 && contamination <= 0.5)) {
        throw ConfigurationError("contamination must be within (0, 0.5]");
    }
    if (!(ewma_alpha > 0.0 && ewma_alpha <= 1.0)) {
        throw ConfigurationError("ewma_alpha must be within (0, 1]");
    }
    if (filter_history == 0) {
        throw ConfigurationError("filter_history must be positive");
    }
    if (filter_rank == 0 || filter_rank > filter_history) {
        throw ConfigurationError("filter_rank must be within [1, filter_history]");
    }
    if (backlog_warning == 0) {
        throw ConfigurationError("backlog_warning must be positive");
    }
    if (system_id.empty()) {
        throw ConfigurationError("system_id must not be empty");
    }
}

DetectorConfig DetectorConfig::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("cannot open config file: " + path.string());
    }

    json j;
    try {
        j = json::parse(file);
    }
    catch (const json::parse_error& e) {
        throw ConfigurationError("cannot parse config file " + path.string() + ": " + e.what());
    }

    if (!j.is_object()) {
        throw ConfigurationError("config file must hold a JSON object: " + path.string());
    }

    for (const auto& item : j.items()) {
        if (kKnownKeys.count(item.key()) == 0) {
            spdlog::warn("Ignoring unknown configuration key '{}'", item.key());
        }
    }

    DetectorConfig config;

    std::int64_t window_ms = config.window_duration.count();
    ReadKey(j, "window_duration_ms", window_ms);
    config.window_duration = std::chrono::milliseconds(window_ms);

    ReadKey(j, "gram_size", config.gram_size);
    ReadKey(j, "tree_count", config.tree_count);
    ReadKey(j, "sample_size", config.sample_size);
    ReadKey(j, "max_depth", config.max_depth);
    ReadKey(j, "seed", config.seed);
    ReadKey(j, "range_penalty", config.range_penalty);
    ReadKey(j, "alert_threshold", config.alert_threshold);
    ReadKey(j, "contamination", config.contamination);
    ReadKey(j, "ewma_alpha", config.ewma_alpha);
    ReadKey(j, "filter_history", config.filter_history);
    ReadKey(j, "filter_rank", config.filter_rank);
    ReadKey(j, "backlog_warning", config.backlog_warning);
    ReadKey(j, "system_id", config.system_id);

    spdlog::debug("Loaded configuration from {}", path.string());
    return config;
}

std::string DetectorConfig::ToJson() const {
    json j = {
        {"window_duration_ms", window_duration.count()},
        {"gram_size", gram_size},
        {"tree_count", tree_count},
        {"sample_size", sample_size},
        {"max_depth", max_depth},
        {"seed", seed},
        {"range_penalty", range_penalty},
        {"alert_threshold", alert_threshold},
        {"contamination", contamination},
        {"ewma_alpha", ewma_alpha},
        {"filter_history", filter_history},
        {"filter_rank", filter_rank},
        {"backlog_warning", backlog_warning},
        {"system_id", system_id}
    };
    return j.dump(2);
}

} // namespace core
} // namespace sysgram
