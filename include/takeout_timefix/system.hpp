/**
 * @file system.hpp
 * @brief System utilities: CPU detection and time formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Display-timezone formatting in exiftool syntax
 *
 *          - Run stamps for log and report file names
 */

#ifndef TAKEOUT_TIMEFIX_SYSTEM_HPP
#define TAKEOUT_TIMEFIX_SYSTEM_HPP

#include <string>

#include "types.hpp"

namespace takeout_timefix {

// **---- CPU Detection ----**

/**
 * @brief Detect the number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores. The cgroup v2 quota in `/sys/fs/cgroup/cpu.max`
 *       is honoured when present.
 *
 * @return Detected CPU limit in [1, 64]
 */
int detect_cpu_limit();

/**
 * @brief Resolve the configured stream count.
 * @param configured PARALLEL_STREAMS value (0 = auto)
 * @return At least 1, never more than detect_cpu_limit()
 */
int calculate_parallel_streams(int configured);

// **---- Time Formatting ----**

/**
 * @brief Format an instant in a fixed-offset zone, exiftool style.
 *
 * @param utc Seconds since the epoch
 * @param offset_minutes Zone offset from UTC (480 = UTC+8)
 * @return "YYYY:MM:DD HH:MM:SS+HHMM"
 * @throws std::out_of_range if utc lies outside years 0001-9999
 */
std::string format_display_time(EpochSeconds utc, int offset_minutes);

/// Local "YYYYMMDD_HHMMSS" for the current moment
std::string run_stamp();

/// Format seconds as HH:MM:SS for elapsed-time output
std::string format_time(double seconds);

} // namespace takeout_timefix

#endif // TAKEOUT_TIMEFIX_SYSTEM_HPP
