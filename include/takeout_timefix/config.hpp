/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Every value has a default matching the behaviour of a plain
 *          `takeout_timefix -d <dir>` run.
 *
 */

#ifndef TAKEOUT_TIMEFIX_CONFIG_HPP
#define TAKEOUT_TIMEFIX_CONFIG_HPP

#include <cstdlib>
#include <string>

namespace takeout_timefix {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Variable contents or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/// Executable name or path of the metadata writer
inline const std::string &exiftool_path() {
  static std::string val = get_env_string("TIMEFIX_EXIFTOOL", "exiftool");
  return val;
}

/// Hard per-attempt timeout for the metadata writer
inline int timeout_sec() {
  static int val = get_env_int("TIMEFIX_TIMEOUT_SEC", 30);
  return val;
}

/**
 * @brief Retries after a file-in-use failure
 * @note Delays double from TIMEFIX_RETRY_BASE_MS: 1s, 2s, 4s by default.
 */
inline int max_retries() {
  static int val = get_env_int("TIMEFIX_MAX_RETRIES", 3);
  return val;
}

/// First backoff delay in milliseconds
inline int retry_base_ms() {
  static int val = get_env_int("TIMEFIX_RETRY_BASE_MS", 1000);
  return val;
}

/**
 * @brief Display timezone as a fixed offset from UTC in minutes
 * @note Default 480 = UTC+8. No DST rules are applied.
 */
inline int tz_offset_minutes() {
  static int val = get_env_int("TIMEFIX_TZ_OFFSET_MIN", 480);
  return val;
}

/// Directory receiving the run log and the failure report
inline const std::string &log_dir() {
  static std::string val = get_env_string("TIMEFIX_LOG_DIR", ".");
  return val;
}

// **---- PARALLEL PROCESSING ----**

/**
 * @brief Number of sidecars processed concurrently
 * @note 1 (default) keeps the run strictly sequential.
 *       0 = auto-detect based on available CPUs.
 */
inline int parallel_streams() {
  static int val = get_env_int("PARALLEL_STREAMS", 1);
  return val;
}

} // namespace Config
} // namespace takeout_timefix

#endif // TAKEOUT_TIMEFIX_CONFIG_HPP
