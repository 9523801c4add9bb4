/**
 * @file main.cpp
 * @brief sysgram - Command-line interface
 *
 * Entry point of the detector. Two subcommands share one configuration
 * surface:
 * - `train`: window normal-behavior traces, fit the vocabulary and the
 *   isolation forest, write the model directory
 * - `detect`: load a model directory and score a recorded trace or a live
 *   process (attached by pid or spawned after `--`)
 *
 * Configuration precedence: defaults < `--config` file < command-line
 * overrides. The result is validated before anything else runs.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "sysgram/capture/strace_source.hpp"
#include "sysgram/capture/trace_file_source.hpp"
#include "sysgram/core/config.hpp"
#include "sysgram/core/detection_pipeline.hpp"
#include "sysgram/core/errors.hpp"
#include "sysgram/core/model_store.hpp"
#include "sysgram/core/trainer.hpp"
#include "sysgram/parsers/syscall_table.hpp"
#include "sysgram/reporters/score_reporter.hpp"
#include "sysgram/utils/logging.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace sysgram;

namespace {

std::atomic<bool> g_interrupted{false};

void HandleSignal(int) {
    g_interrupted.store(true);
}

/*******************************************************************************
 * Shared Options
 ******************************************************************************/

struct CommonOptions {
    std::string config_path;
    std::string syscall_map_path;
    std::string format{"strace"};
    bool verbose{false};
    std::vector<std::function<void(core::DetectorConfig&)>> overrides;
};

/**
 * @brief Register the configuration options on a subcommand
 *
 * Every DetectorConfig key gets an override; only options actually given
 * are applied on top of the file.
 */
void AddCommonOptions(CLI::App* app, CommonOptions& options) {
    app->add_option("-c,--config", options.config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app->add_option("--syscall-map", options.syscall_map_path,
                    "JSON syscall mapping (names / id_map)")
        ->check(CLI::ExistingFile);
    app->add_option("--format", options.format, "Trace file format: strace or ids")
        ->check(CLI::IsMember({"strace", "ids", "id_records"}));
    app->add_flag("-v,--verbose", options.verbose, "Enable verbose logging");

    auto& o = options.overrides;

    app->add_option_function<long long>("--window-ms", [&o](const long long& v) {
        o.push_back([v](core::DetectorConfig& c) { c.window_duration = std::chrono::milliseconds(v); });
    }, "Window duration in milliseconds");
    app->add_option_function<std::size_t>("--gram-size", [&o](const std::size_t& v) {
        o.push_back([v](core::DetectorConfig& c) { c.gram_size = v; });
    }, "N of the syscall n-grams");
    app->add_option_function<std::size_t>("--trees", [&o](const std::size_t& v) {
        o.push_back([v](core::DetectorConfig& c) { c.tree_count = v; });
    }, "Number of isolation trees");
    app->add_option_function<std::size_t>("--sample-size", [&o](const std::size_t& v) {
        o.push_back([v](core::DetectorConfig& c) { c.sample_size = v; });
    }, "Training vectors drawn per tree");
    app->add_option_function<std::size_t>("--max-depth", [&o](const std::size_t& v) {
        o.push_back([v](core::DetectorConfig& c) { c.max_depth = v; });
    }, "Tree depth limit (0 = automatic)");
    app->add_option_function<std::uint64_t>("--seed", [&o](const std::uint64_t& v) {
        o.push_back([v](core::DetectorConfig& c) { c.seed = v; });
    }, "Seed of the tree-building generator");
    app->add_option_function<bool>("--range-penalty", [&o](const bool& v) {
        o.push_back([v](core::DetectorConfig& c) { c.range_penalty = v; });
    }, "Isolate values outside a node's training range (true/false)");
    app->add_option_function<double>("-t,--threshold", [&o](const double& v) {
        o.push_back([v](core::DetectorConfig& c) { c.alert_threshold = v; });
    }, "Alert threshold in [0,1]");
    app->add_option_function<double>("--contamination", [&o](const double& v) {
        o.push_back([v](core::DetectorConfig& c) { c.contamination = v; });
    }, "Expected anomaly share for the suggested threshold");
    app->add_option_function<double>("--ewma-alpha", [&o](const double& v) {
        o.push_back([v](core::DetectorConfig& c) { c.ewma_alpha = v; });
    }, "Smoothing weight of the newest score");
    app->add_option_function<std::size_t>("--filter-history", [&o](const std::size_t& v) {
        o.push_back([v](core::DetectorConfig& c) { c.filter_history = v; });
    }, "Scores kept for peak clipping");
    app->add_option_function<std::size_t>("--filter-rank", [&o](const std::size_t& v) {
        o.push_back([v](core::DetectorConfig& c) { c.filter_rank = v; });
    }, "Rank used when clipping a new peak");
    app->add_option_function<std::size_t>("--backlog-warning", [&o](const std::size_t& v) {
        o.push_back([v](core::DetectorConfig& c) { c.backlog_warning = v; });
    }, "Queue depth that triggers a backpressure warning");
    app->add_option_function<std::string>("--system-id", [&o](const std::string& v) {
        o.push_back([v](core::DetectorConfig& c) { c.system_id = v; });
    }, "Identifier of the monitored system");
}

core::DetectorConfig ResolveConfig(const CommonOptions& options) {
    core::DetectorConfig config;
    if (!options.config_path.empty()) {
        config = core::DetectorConfig::LoadFromFile(options.config_path);
        spdlog::info("Configuration loaded from {}", options.config_path);
    }
    for (const auto& apply : options.overrides) {
        apply(config);
    }
    config.Validate();
    spdlog::debug("Effective configuration: {}", config.ToJson());
    return config;
}

std::shared_ptr<const parsers::SyscallTable> ResolveSyscallTable(const CommonOptions& options) {
    if (options.syscall_map_path.empty()) {
        return std::make_shared<const parsers::SyscallTable>(parsers::SyscallTable::BuiltIn());
    }
    auto table = std::make_shared<const parsers::SyscallTable>(
        parsers::SyscallTable::LoadFromFile(options.syscall_map_path));
    spdlog::info("Syscall mapping loaded from {} ({} names)", options.syscall_map_path, table->Size());
    return table;
}

capture::TraceFormat ResolveFormat(const CommonOptions& options) {
    auto format = capture::ParseTraceFormat(options.format);
    if (!format) {
        throw core::ConfigurationError("unknown trace format: " + options.format);
    }
    return *format;
}

/*******************************************************************************
 * Subcommands
 ******************************************************************************/

struct TrainOptions {
    std::vector<std::string> traces;
    std::string model_dir;
};

int RunTrain(const CommonOptions& common, const TrainOptions& options) {
    auto config = ResolveConfig(common);
    auto table = ResolveSyscallTable(common);
    auto format = ResolveFormat(common);

    spdlog::info("Reading {} training trace(s)", options.traces.size());

    core::Trainer trainer(config);
    for (const auto& trace : options.traces) {
        trainer.AddTraceFile(trace, format, table);
    }

    auto result = trainer.Train();

    core::ModelStore store(options.model_dir);
    store.Save(*result.vectorizer, *result.forest);

    std::cout << "\n";
    std::cout << "Model:               " << options.model_dir << "\n";
    std::cout << "Training windows:    " << result.report.windows << "\n";
    std::cout << "Vocabulary size:     " << result.report.vocabulary_size << "\n";
    std::cout << "Suggested threshold: " << result.report.suggested_threshold << "\n";
    return 0;
}

struct DetectOptions {
    std::string model_dir;
    std::string trace;
    int pid{0};
    std::vector<std::string> command;
    std::string output;
    std::string strace_binary{"strace"};
};

void PrintPipelineSummary(const core::PipelineStatistics& stats) {
    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
    spdlog::info("Events: {} accepted, {} rejected", stats.events_accepted, stats.events_rejected);
    spdlog::info("Windows: {} sealed, {} scored, {} failed, {} discarded",
                 stats.windows_sealed, stats.windows_scored,
                 stats.windows_failed, stats.windows_discarded);
    spdlog::info("Alerts: {}", stats.alerts);
    spdlog::info("Latency: last {} us, max {} us, peak queue {}",
                 stats.last_latency.count(), stats.max_latency.count(), stats.peak_queue_depth);
    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
}

int RunDetect(const CommonOptions& common, const DetectOptions& options) {
    const int targets = (options.trace.empty() ? 0 : 1) + (options.pid > 0 ? 1 : 0) +
                        (options.command.empty() ? 0 : 1);
    if (targets != 1) {
        spdlog::error("Give exactly one of --trace, --pid or -- <command...>");
        return 2;
    }

    auto config = ResolveConfig(common);
    auto table = ResolveSyscallTable(common);
    auto bundle = core::ModelStore(options.model_dir).Load();

    core::DetectionPipeline pipeline(config, bundle.vectorizer, bundle.forest);
    pipeline.AddSink(std::make_shared<reporters::LogScoreSink>());
    if (options.output == "-") {
        pipeline.AddSink(std::make_shared<reporters::JsonLinesScoreSink>(std::cout));
    } else if (!options.output.empty()) {
        pipeline.AddSink(std::make_shared<reporters::JsonLinesScoreSink>(
            std::filesystem::path(options.output)));
        spdlog::info("Score feed: {}", options.output);
    }

    if (!options.trace.empty()) {
        capture::TraceFileSource source(options.trace, ResolveFormat(common), table);
        if (!pipeline.Replay(source)) {
            spdlog::error("Failed to replay {}", options.trace);
            return 1;
        }
    } else {
        capture::StraceSourceConfig strace_config;
        strace_config.strace_binary = options.strace_binary;
        strace_config.pid = options.pid;
        strace_config.command = options.command;

        capture::StraceSource source(strace_config, table);

        std::signal(SIGINT, HandleSignal);
        std::signal(SIGTERM, HandleSignal);

        if (!pipeline.Start(source)) {
            spdlog::error("Failed to start capture");
            return 1;
        }

        spdlog::info("Monitoring {} (Ctrl+C to stop)", source.Name());
        while (source.IsRunning() && !g_interrupted.load() && !pipeline.HasFailed()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (!g_interrupted.load() && !pipeline.HasFailed()) {
            spdlog::info("Traced process finished");
            pipeline.FlushWindow();
            pipeline.Drain();
        } else if (g_interrupted.load()) {
            spdlog::info("Interrupted, stopping");
        }
    }

    pipeline.Stop();
    PrintPipelineSummary(pipeline.GetStatistics());

    if (pipeline.HasFailed()) {
        spdlog::critical("Detection stopped: {}", pipeline.LastError());
        return 3;
    }
    return 0;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"sysgram - syscall n-gram intrusion detector"};
    app.require_subcommand(1);

    CommonOptions train_common;
    TrainOptions train_options;
    auto* train = app.add_subcommand("train", "Fit a model on normal-behavior traces");
    AddCommonOptions(train, train_common);
    train->add_option("--trace", train_options.traces, "Training trace file (repeatable)")
        ->required()
        ->check(CLI::ExistingFile);
    train->add_option("-m,--model-dir", train_options.model_dir, "Directory to write the model to")
        ->required();

    CommonOptions detect_common;
    DetectOptions detect_options;
    auto* detect = app.add_subcommand("detect", "Score a trace or a live process");
    AddCommonOptions(detect, detect_common);
    detect->add_option("-m,--model-dir", detect_options.model_dir, "Model directory")
        ->required()
        ->check(CLI::ExistingDirectory);
    detect->add_option("--trace", detect_options.trace, "Recorded trace to score")
        ->check(CLI::ExistingFile);
    detect->add_option("-p,--pid", detect_options.pid, "Attach to a running process");
    detect->add_option("-o,--output", detect_options.output, "JSON lines score feed ('-' for stdout)");
    detect->add_option("--strace", detect_options.strace_binary, "strace executable");
    detect->add_option("command", detect_options.command, "Command to spawn and trace (after --)");

    CLI11_PARSE(app, argc, argv);

    try {
        if (*train) {
            utils::ConfigureLogging(train_common.verbose, false);
            return RunTrain(train_common, train_options);
        }
        // A feed on stdout keeps the logs out of it
        utils::ConfigureLogging(detect_common.verbose, detect_options.output == "-");
        return RunDetect(detect_common, detect_options);
    }
    catch (const core::ModelMismatchError& e) {
        spdlog::critical("Model mismatch: {}", e.what());
        return 3;
    }
    catch (const core::ConfigurationError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return 2;
    }
    catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return 1;
    }
    catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
