/**
 * @file types.hpp
 * @brief Core data types and constants for Takeout Timefix
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Media extension allow-lists
 *
 *          - MatchResult for sidecar to media correlation
 *
 *          - ExecutionOutcome / ExecutionResult for external tool runs
 *
 *          - FailureRecord for the run-level failure report
 */

#ifndef TAKEOUT_TIMEFIX_TYPES_HPP
#define TAKEOUT_TIMEFIX_TYPES_HPP

#include <cstdint>
#include <filesystem>
#include <string>

namespace takeout_timefix {

// **----- CONSTANTS -----**

/// Extensions accepted as media files by the matcher (lower-case)
constexpr const char *MEDIA_EXTENSIONS[] = {".jpg", ".jpeg", ".png", ".gif",
                                            ".mp4", ".mov",  ".heic", ".webp"};

/// Extensions that receive the QuickTime tag set (lower-case)
constexpr const char *VIDEO_EXTENSIONS[] = {".mp4", ".mov", ".avi", ".wmv"};

/// Sidecar marker the export tool inserts before ".json", often truncated
constexpr const char *SUPPLEMENTAL_MARKER = "supplemental-metadata";

/// Seconds since the Unix epoch, UTC
using EpochSeconds = std::int64_t;

/// Instants with a four-digit year: 0001-01-01T00:00:00Z .. 9999-12-31T23:59:59Z
constexpr EpochSeconds MIN_EPOCH_SECONDS = -62135596800LL;
constexpr EpochSeconds MAX_EPOCH_SECONDS = 253402300799LL;

// **----- DATA STRUCTURES -----**

/**
 * @struct MatchResult
 * @brief Outcome of correlating one sidecar with its media file.
 * @note media_path is only meaningful when ok is true.
 */
struct MatchResult {
  bool ok = false;                   //< Whether a media file was found
  std::filesystem::path media_path;  //< The single accepted candidate
  std::string reason;                //< Failure reason when !ok
};

/**
 * @enum ExecutionOutcome
 * @brief Terminal state of one external tool invocation (retries included).
 */
enum class ExecutionOutcome {
  Success,
  TransientFailure, //< File-in-use contention, retried until exhausted
  PermanentFailure,
  Timeout
};

/**
 * @struct ExecutionResult
 * @brief What the executor reports back for one media file.
 */
struct ExecutionResult {
  ExecutionOutcome outcome = ExecutionOutcome::PermanentFailure;
  int attempts = 0;   //< Total invocations, first attempt included
  std::string detail; //< Filtered stderr or a short reason for failures

  bool ok() const { return outcome == ExecutionOutcome::Success; }
};

/**
 * @struct FailureRecord
 * @brief One entry of the failure report.
 * @note path is the sidecar for match/parse failures, the media file after.
 */
struct FailureRecord {
  std::string path;
  std::string reason;
};

/// Human-readable outcome name for logs
const char *outcome_name(ExecutionOutcome outcome);

} // namespace takeout_timefix

#endif // TAKEOUT_TIMEFIX_TYPES_HPP
