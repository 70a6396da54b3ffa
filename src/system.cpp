/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Fixed-offset time formatting
 */

#include "takeout_timefix/system.hpp"

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <fmt/core.h>

namespace takeout_timefix {

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// cgroup v2 quota ("max 100000" when unlimited)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !period_str.empty()) {
        try {
          long quota = std::stol(quota_str);
          long period = std::stol(period_str);
          if (quota > 0 && period > 0) {
            limit = static_cast<int>((quota + period - 1) / period);
          }
        } catch (const std::exception &) {
          limit = -1;
        }
      }
    }
  }

  /// Fallback to hardware_concurrency
  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  if (limit > 64)
    limit = 64;

  return limit;
}

int calculate_parallel_streams(int configured) {
  int available = detect_cpu_limit();

  /// Auto-detect: use all available CPUs
  if (configured == 0) {
    return std::max(1, available);
  }

  /// User configured: take minimum of configured and available
  return std::max(1, std::min(configured, available));
}

// **---- Time Formatting ----**

std::string format_display_time(EpochSeconds utc, int offset_minutes) {
  if (utc < MIN_EPOCH_SECONDS || utc > MAX_EPOCH_SECONDS) {
    throw std::out_of_range(
        fmt::format("timestamp {} outside years 0001-9999", utc));
  }
  std::time_t shifted =
      static_cast<std::time_t>(utc + static_cast<EpochSeconds>(offset_minutes) * 60);
  std::tm tm{};
  if (gmtime_r(&shifted, &tm) == nullptr) {
    throw std::out_of_range(fmt::format("cannot convert timestamp {}", utc));
  }

  char sign = offset_minutes < 0 ? '-' : '+';
  int abs_offset = std::abs(offset_minutes);

  return fmt::format("{:04d}:{:02d}:{:02d} {:02d}:{:02d}:{:02d}{}{:02d}{:02d}",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, sign, abs_offset / 60,
                     abs_offset % 60);
}

std::string run_stamp() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &local);
  return buf;
}

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace takeout_timefix
