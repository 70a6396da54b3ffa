/**
 * @file logging.hpp
 * @brief Logging macros and event sinks
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - EventSink: the destination every component logs through
 *
 *          - ConsoleFileSink: coloured console output plus the run log file
 *
 * @note Components never reach for a global logger. The sink is handed down
 *       from the batch driver so tests can capture events directly.
 *
 */

#ifndef TAKEOUT_TIMEFIX_LOGGING_HPP
#define TAKEOUT_TIMEFIX_LOGGING_HPP

#include <cstdio>
#include <mutex>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

namespace takeout_timefix {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

enum class LogLevel { Debug, Info, Warn, Error, Phase, Success };

/// Fixed-width tag used in the log file ("INFO    ", "WARNING ", ...)
const char *level_tag(LogLevel level);

/**
 * @class EventSink
 * @brief Destination for log events.
 * @note Implementations must be safe to call from several stream workers.
 */
class EventSink {
public:
  virtual ~EventSink() = default;
  virtual void emit(LogLevel level, const std::string &message) = 0;
};

/**
 * @class ConsoleFileSink
 * @brief Prints Info and above to stdout, writes everything to a log file.
 *
 * @attention The log file is optional. If it cannot be opened the sink keeps
 *            working console-only and reports it once.
 */
class ConsoleFileSink : public EventSink {
public:
  /**
   * @param log_path Run log file, truncated on open (empty = console only)
   */
  explicit ConsoleFileSink(const std::string &log_path = "");
  ~ConsoleFileSink() override;

  ConsoleFileSink(const ConsoleFileSink &) = delete;
  ConsoleFileSink &operator=(const ConsoleFileSink &) = delete;

  void emit(LogLevel level, const std::string &message) override;

  bool has_file() const { return file_ != nullptr; }
  const std::string &log_path() const { return log_path_; }

private:
  std::mutex mutex_;
  std::FILE *file_ = nullptr;
  std::string log_path_;
};

/// Sink that drops everything
class NullSink : public EventSink {
public:
  void emit(LogLevel, const std::string &) override {}
};

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define TIMEFIX_LOG(sink, level, format_str, ...)                              \
  do {                                                                         \
    (sink).emit(level, fmt::format(format_str, ##__VA_ARGS__));                \
  } while (0)
#else
#define TIMEFIX_LOG(...) ((void)0)
#endif

#define LOG_DEBUG(sink, ...)                                                   \
  TIMEFIX_LOG(sink, takeout_timefix::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(sink, ...)                                                    \
  TIMEFIX_LOG(sink, takeout_timefix::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(sink, ...)                                                    \
  TIMEFIX_LOG(sink, takeout_timefix::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(sink, ...)                                                   \
  TIMEFIX_LOG(sink, takeout_timefix::LogLevel::Error, __VA_ARGS__)
#define LOG_PHASE(sink, ...)                                                   \
  TIMEFIX_LOG(sink, takeout_timefix::LogLevel::Phase, __VA_ARGS__)
#define LOG_SUCCESS(sink, ...)                                                 \
  TIMEFIX_LOG(sink, takeout_timefix::LogLevel::Success, __VA_ARGS__)

} // namespace takeout_timefix

#endif // TAKEOUT_TIMEFIX_LOGGING_HPP
