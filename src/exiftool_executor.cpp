/**
 * @file exiftool_executor.cpp
 * @brief Metadata writer execution implementation
 */

#include "takeout_timefix/exiftool_executor.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <fmt/core.h>

#include "takeout_timefix/config.hpp"
#include "takeout_timefix/matcher.hpp"
#include "takeout_timefix/system.hpp"

namespace takeout_timefix {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

/// Lower-cased phrases exiftool / the OS print for a locked file
constexpr const char *kInUseSignatures[] = {
    "being used by another process",
    "file is locked",
    "device or resource busy",
};

constexpr const char *kVideoTags[] = {
    "QuickTime:CreateDate",      "QuickTime:ModifyDate",
    "QuickTime:TrackCreateDate", "QuickTime:TrackModifyDate",
    "QuickTime:MediaCreateDate", "QuickTime:MediaModifyDate",
};

constexpr const char *kImageTags[] = {"DateTimeOriginal", "CreateDate"};

constexpr const char *kFileTags[] = {"FileCreateDate", "FileModifyDate"};

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string trim(const std::string &s) {
  auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                return std::isspace(c);
              }).base();
  return first < last ? std::string(first, last) : std::string();
}

bool is_video(const fs::path &path) {
  std::string ext = lower_extension(path);
  return std::find(std::begin(VIDEO_EXTENSIONS), std::end(VIDEO_EXTENSIONS),
                   ext) != std::end(VIDEO_EXTENSIONS);
}

std::string failure_detail(const ProcessResult &pr) {
  std::string detail = filter_minor_lines(pr.stderr_text);
  return detail.empty() ? fmt::format("exit code {}", pr.exit_code) : detail;
}

} // anonymous namespace

// **---- Options ----**

ExecutorOptions ExecutorOptions::from_config() {
  ExecutorOptions options;
  options.tool = Config::exiftool_path();
  options.timeout = std::chrono::seconds(std::max(1, Config::timeout_sec()));
  options.max_retries = std::max(0, Config::max_retries());
  options.retry_base =
      std::chrono::milliseconds(std::max(0, Config::retry_base_ms()));
  options.tz_offset_minutes = Config::tz_offset_minutes();
  return options;
}

void real_sleep(std::chrono::milliseconds delay) {
  std::this_thread::sleep_for(delay);
}

// **---- Command Building ----**

std::vector<std::string> build_tag_args(const fs::path &media_path,
                                        const std::string &display_time,
                                        const std::optional<GeoPoint> &geo) {
  std::vector<std::string> args;

  if (is_video(media_path)) {
    for (const char *tag : kVideoTags)
      args.push_back(fmt::format("-{}={}", tag, display_time));
  } else {
    for (const char *tag : kImageTags)
      args.push_back(fmt::format("-{}={}", tag, display_time));
  }
  for (const char *tag : kFileTags)
    args.push_back(fmt::format("-{}={}", tag, display_time));

  if (geo) {
    /// XMP takes signed decimal degrees
    args.push_back(fmt::format("-XMP:GPSLatitude={}", geo->latitude));
    args.push_back(fmt::format("-XMP:GPSLongitude={}", geo->longitude));

    /// GIF has no EXIF block
    if (lower_extension(media_path) != ".gif") {
      args.push_back(fmt::format("-GPSLatitude={}", std::fabs(geo->latitude)));
      args.push_back(fmt::format("-GPSLatitudeRef={}",
                                 geo->latitude >= 0 ? "N" : "S"));
      args.push_back(
          fmt::format("-GPSLongitude={}", std::fabs(geo->longitude)));
      args.push_back(fmt::format("-GPSLongitudeRef={}",
                                 geo->longitude >= 0 ? "E" : "W"));
    }
  }
  return args;
}

std::vector<std::string> build_command(const std::string &tool,
                                       const fs::path &media_path,
                                       const std::vector<std::string> &tag_args) {
  std::vector<std::string> cmd = {tool,       "-m", "-charset", "filename=utf8",
                                  "-overwrite_original"};
  cmd.insert(cmd.end(), tag_args.begin(), tag_args.end());
  cmd.push_back(media_path.string());
  return cmd;
}

// **---- Output Classification ----**

bool is_file_in_use(const std::string &stderr_text) {
  std::string lower = to_lower(stderr_text);
  return std::any_of(std::begin(kInUseSignatures), std::end(kInUseSignatures),
                     [&](const char *sig) {
                       return lower.find(sig) != std::string::npos;
                     });
}

std::string filter_minor_lines(const std::string &stderr_text) {
  std::istringstream in(stderr_text);
  std::string line;
  std::string kept;
  while (std::getline(in, line)) {
    if (to_lower(line).find("minor") != std::string::npos)
      continue;
    if (!kept.empty())
      kept += '\n';
    kept += line;
  }
  return trim(kept);
}

std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base,
                                        int retry) {
  if (base <= std::chrono::milliseconds::zero())
    return std::chrono::milliseconds::zero();

  std::chrono::milliseconds delay = std::min(base, MAX_BACKOFF);
  for (int i = 1; i < retry && delay < MAX_BACKOFF; ++i) {
    delay = std::min(delay * 2, MAX_BACKOFF);
  }
  return delay;
}

// **---- Executor ----**

ExifToolExecutor::ExifToolExecutor(ProcessRunner &runner, EventSink &log,
                                   ExecutorOptions options, Sleeper sleeper)
    : runner_(runner), log_(log), options_(std::move(options)),
      sleeper_(std::move(sleeper)) {}

ExecutionResult ExifToolExecutor::run(const fs::path &media_path,
                                      EpochSeconds utc,
                                      const std::optional<GeoPoint> &geo) {
  ExecutionResult result;

  std::string display_time;
  try {
    display_time = format_display_time(utc, options_.tz_offset_minutes);
  } catch (const std::out_of_range &e) {
    result.outcome = ExecutionOutcome::PermanentFailure;
    result.detail = e.what();
    LOG_ERROR(log_, "{}: {}", media_path.string(), result.detail);
    return result;
  }
  const auto command = build_command(
      options_.tool, media_path, build_tag_args(media_path, display_time, geo));

  LOG_DEBUG(log_, "Writing {} to {}", display_time, media_path.string());

  result.attempts = 1;

  ProcessResult pr;
  try {
    pr = runner_.run(command, options_.timeout);
  } catch (const std::exception &e) {
    result.outcome = ExecutionOutcome::PermanentFailure;
    result.detail = fmt::format("failed to launch {}: {}", options_.tool,
                                e.what());
    LOG_ERROR(log_, "{}: {}", media_path.string(), result.detail);
    return result;
  }

  // **----- CLASSIFY FIRST ATTEMPT -----**

  if (pr.timed_out) {
    result.outcome = ExecutionOutcome::Timeout;
    result.detail =
        fmt::format("timed out after {}s", options_.timeout.count());
    LOG_ERROR(log_, "{}: {}", media_path.string(), result.detail);
    return result;
  }

  if (pr.exit_code == 0) {
    result.outcome = ExecutionOutcome::Success;
    std::string warnings = filter_minor_lines(pr.stderr_text);
    if (!warnings.empty()) {
      LOG_DEBUG(log_, "{}: {}", media_path.string(), warnings);
    }
    return result;
  }

  std::string detail = failure_detail(pr);
  if (is_file_in_use(pr.stderr_text)) {
    LOG_WARN(log_, "File in use: {}\n   {}", media_path.string(), detail);
    return retry(command, media_path, std::move(detail));
  }

  result.outcome = ExecutionOutcome::PermanentFailure;
  result.detail = std::move(detail);
  LOG_ERROR(log_, "Update failed: {}\n   {}", media_path.string(),
            result.detail);
  return result;
}

ExecutionResult ExifToolExecutor::retry(const std::vector<std::string> &command,
                                        const fs::path &media_path,
                                        std::string last_error) {
  ExecutionResult result;
  result.attempts = 1;

  for (int attempt = 1; attempt <= options_.max_retries; ++attempt) {
    auto delay = backoff_delay(options_.retry_base, attempt);
    LOG_INFO(log_, "Retry {}/{} for {} in {}ms", attempt, options_.max_retries,
             media_path.filename().string(), delay.count());
    sleeper_(delay);
    ++result.attempts;

    try {
      ProcessResult pr = runner_.run(command, options_.timeout);
      if (!pr.timed_out && pr.exit_code == 0) {
        result.outcome = ExecutionOutcome::Success;
        LOG_INFO(log_, "Retry {} succeeded: {}", attempt, media_path.string());
        return result;
      }
      last_error = pr.timed_out ? fmt::format("timed out after {}s",
                                              options_.timeout.count())
                                : failure_detail(pr);
      LOG_WARN(log_, "Retry {} failed: {}", attempt, last_error);
    } catch (const std::exception &e) {
      last_error = e.what();
      LOG_ERROR(log_, "Retry {} raised: {}", attempt, last_error);
    }
  }

  result.outcome = ExecutionOutcome::TransientFailure;
  result.detail = fmt::format("failed after {} retries: {}",
                              options_.max_retries, last_error);
  LOG_ERROR(log_, "{}: {}", media_path.string(), result.detail);
  return result;
}

const char *outcome_name(ExecutionOutcome outcome) {
  switch (outcome) {
  case ExecutionOutcome::Success:
    return "Success";
  case ExecutionOutcome::TransientFailure:
    return "TransientFailure";
  case ExecutionOutcome::PermanentFailure:
    return "PermanentFailure";
  case ExecutionOutcome::Timeout:
    return "Timeout";
  }
  return "Unknown";
}

} // namespace takeout_timefix
