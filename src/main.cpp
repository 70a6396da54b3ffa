/**
 * @file main.cpp
 * @brief Entry point for Takeout Timefix
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Run log and failure report placement
 *
 *          - Exit status: 0 clean, 101 completed with failures, 1 fatal
 *
 * @note Environment variables tune the run (see config.hpp). Set
 *       PARALLEL_STREAMS to process several sidecars at once.
 */

#include <cstdio>
#include <exception>
#include <filesystem>
#include <string>
#include <system_error>

#include <fmt/core.h>

#include "takeout_timefix/batch_processor.hpp"
#include "takeout_timefix/config.hpp"
#include "takeout_timefix/exiftool_executor.hpp"
#include "takeout_timefix/logging.hpp"
#include "takeout_timefix/process_runner.hpp"
#include "takeout_timefix/system.hpp"

using namespace takeout_timefix;

namespace {

constexpr int kExitClean = 0;
constexpr int kExitFatal = 1;
constexpr int kExitWithFailures = 101;

void print_usage() {
  fmt::print("Usage: takeout_timefix -d <directory>\n"
             "\n"
             "Restores capture dates of exported photos and videos from their\n"
             "JSON sidecars using exiftool.\n"
             "\n"
             "  -d, --directory <dir>   Root directory, walked recursively\n"
             "  -h, --help              Show this help\n"
             "\n"
             "Environment: TIMEFIX_EXIFTOOL, TIMEFIX_TIMEOUT_SEC,\n"
             "  TIMEFIX_MAX_RETRIES, TIMEFIX_RETRY_BASE_MS, TIMEFIX_TZ_OFFSET_MIN,\n"
             "  TIMEFIX_LOG_DIR, PARALLEL_STREAMS\n");
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  namespace fs = std::filesystem;

  std::string dir_arg;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage();
      return kExitClean;
    }
    if ((arg == "-d" || arg == "--directory") && i + 1 < argc) {
      dir_arg = argv[++i];
    } else if (dir_arg.empty() && !arg.empty() && arg[0] != '-') {
      dir_arg = arg;
    } else {
      fmt::print(stderr, "Unexpected argument: {}\n", arg);
      print_usage();
      return kExitFatal;
    }
  }
  if (dir_arg.empty()) {
    print_usage();
    return kExitFatal;
  }

  try {
    const std::string stamp = run_stamp();
    fs::path log_dir = Config::log_dir();
    std::error_code ec;
    fs::create_directories(log_dir, ec);
    fs::path log_path = log_dir / fmt::format("timefix_{}.log", stamp);

    ConsoleFileSink sink(log_path.string());

    fs::path root = fs::absolute(dir_arg, ec);
    if (ec || !fs::is_directory(root)) {
      LOG_ERROR(sink, "Invalid directory: {}", dir_arg);
      return kExitFatal;
    }

    PosixProcessRunner runner;
    BatchProcessor processor(runner, sink, ExecutorOptions::from_config(),
                             Config::parallel_streams());
    RunSummary summary = processor.process(root);

    if (summary.failures.empty()) {
      return kExitClean;
    }

    fs::path report = log_dir / fmt::format("FAILURES_timefix_{}.json", stamp);
    if (write_failure_report(summary.failures, report)) {
      LOG_INFO(sink, "Failure report written: {}", report.string());
    } else {
      LOG_ERROR(sink, "Cannot write failure report: {}", report.string());
    }
    return kExitWithFailures;

  } catch (const std::exception &e) {
    fmt::print(stderr, "[ERROR] Unhandled exception: {}\n", e.what());
    return kExitFatal;
  }
}
