/**
 * @file logging.cpp
 * @brief Event sink implementation
 *
 * @details Console lines keep the coloured prefixes of the interactive
 *          output. File lines carry a local timestamp and a fixed-width level
 *          tag so the run log can be grepped.
 */

#include "takeout_timefix/logging.hpp"

#include <ctime>

#include <fmt/color.h>
#include <fmt/core.h>

namespace takeout_timefix {

const char *level_tag(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG   ";
  case LogLevel::Info:
  case LogLevel::Phase:
  case LogLevel::Success:
    return "INFO    ";
  case LogLevel::Warn:
    return "WARNING ";
  case LogLevel::Error:
    return "ERROR   ";
  }
  return "INFO    ";
}

ConsoleFileSink::ConsoleFileSink(const std::string &log_path)
    : log_path_(log_path) {
  if (log_path_.empty())
    return;

  file_ = std::fopen(log_path_.c_str(), "w");
  if (!file_) {
    fmt::print(fg(fmt::color::yellow),
               "[WARN] Cannot open log file {}, logging to console only\n",
               log_path_);
    std::fflush(stdout);
  }
}

ConsoleFileSink::~ConsoleFileSink() {
  if (file_)
    std::fclose(file_);
}

void ConsoleFileSink::emit(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);

  // **----- FILE: every level -----**

  if (file_) {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);
    fmt::print(file_, "[{}] [{}] {}\n", stamp, level_tag(level), message);
    std::fflush(file_);
  }

  // **----- CONSOLE: Info and above -----**

  switch (level) {
  case LogLevel::Debug:
    return;
  case LogLevel::Info:
    fmt::print("[INFO] {}\n", message);
    break;
  case LogLevel::Warn:
    fmt::print(fg(fmt::color::yellow), "[WARN] {}\n", message);
    break;
  case LogLevel::Error:
    fmt::print(fg(fmt::color::red), "[ERROR] {}\n", message);
    break;
  case LogLevel::Phase:
    fmt::print(fg(fmt::color::cyan), "{}\n", message);
    break;
  case LogLevel::Success:
    fmt::print(fg(fmt::color::green), "{}\n", message);
    break;
  }
  std::fflush(stdout);
}

} // namespace takeout_timefix
