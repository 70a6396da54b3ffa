/**
 * @file exiftool_executor.hpp
 * @brief Metadata writer invocation with timeout, classification and retry
 *
 * @details One call to ExifToolExecutor::run() rewrites the date tags of one
 *          media file:
 *
 *          - Formats the instant in the display timezone
 *
 *          - Selects tags by extension (QuickTime for video, EXIF otherwise,
 *            file-system dates always)
 *
 *          - Runs exiftool under a hard timeout
 *
 *          - Retries file-in-use failures with exponential backoff
 *
 * @attention Retry attempts run with the same timeout and output capture as
 *            the first attempt, but only distinguish success from failure.
 */

#ifndef TAKEOUT_TIMEFIX_EXIFTOOL_EXECUTOR_HPP
#define TAKEOUT_TIMEFIX_EXIFTOOL_EXECUTOR_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "logging.hpp"
#include "process_runner.hpp"
#include "sidecar.hpp"
#include "types.hpp"

namespace takeout_timefix {

/**
 * @struct ExecutorOptions
 * @brief Everything the executor reads from configuration.
 */
struct ExecutorOptions {
  std::string tool = "exiftool";
  std::chrono::seconds timeout{30};
  int max_retries = 3;
  std::chrono::milliseconds retry_base{1000}; //< Doubles per retry
  int tz_offset_minutes = 480;                //< UTC+8

  /// Options populated from the Config environment getters
  static ExecutorOptions from_config();
};

/// Blocks for the given delay; injectable so tests never sleep
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// std::this_thread::sleep_for
void real_sleep(std::chrono::milliseconds delay);

// **---- Command Building ----**

/**
 * @brief Tag assignments for one file.
 * @param media_path Target file (extension selects the tag set)
 * @param display_time Value in exiftool syntax
 * @param geo Optional GPS position to write alongside
 * @return "-Tag=value" arguments
 */
std::vector<std::string>
build_tag_args(const std::filesystem::path &media_path,
               const std::string &display_time,
               const std::optional<GeoPoint> &geo = std::nullopt);

/**
 * @brief Full argv: tool, global flags, tags, target path last.
 */
std::vector<std::string>
build_command(const std::string &tool, const std::filesystem::path &media_path,
              const std::vector<std::string> &tag_args);

// **---- Output Classification ----**

/// stderr carries the "file is in use" signature of a locked file
bool is_file_in_use(const std::string &stderr_text);

/// Remove lines mentioning "minor" (any case) and trim surrounding blanks
std::string filter_minor_lines(const std::string &stderr_text);

/// Upper bound on a single backoff sleep
constexpr std::chrono::milliseconds MAX_BACKOFF{5 * 60 * 1000};

/// Backoff before retry number `retry` (1-based): base * 2^(retry-1),
/// saturating at MAX_BACKOFF
std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base,
                                        int retry);

/**
 * @class ExifToolExecutor
 * @brief Drives the external metadata writer for one file at a time.
 * @note Holds no per-file state; one instance serves a whole run.
 */
class ExifToolExecutor {
public:
  ExifToolExecutor(ProcessRunner &runner, EventSink &log,
                   ExecutorOptions options, Sleeper sleeper = real_sleep);

  /**
   * @brief Write the resolved timestamp (and optional geo) into a file.
   * @param media_path Target media file
   * @param utc Resolved timestamp
   * @param geo Optional GPS position from the sidecar
   * @return Outcome after any retries, with attempt count and detail
   */
  ExecutionResult run(const std::filesystem::path &media_path, EpochSeconds utc,
                      const std::optional<GeoPoint> &geo = std::nullopt);

  const ExecutorOptions &options() const { return options_; }

private:
  /// Retry loop after a file-in-use failure
  ExecutionResult retry(const std::vector<std::string> &command,
                        const std::filesystem::path &media_path,
                        std::string last_error);

  ProcessRunner &runner_;
  EventSink &log_;
  ExecutorOptions options_;
  Sleeper sleeper_;
};

} // namespace takeout_timefix

#endif // TAKEOUT_TIMEFIX_EXIFTOOL_EXECUTOR_HPP
