/**
 * @file timestamp_resolver.cpp
 * @brief Timestamp resolution implementation
 */

#include "takeout_timefix/timestamp_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace takeout_timefix {

// **---- Internal Helpers ----**

namespace {

/// Layouts for formatted dates, tried in order
constexpr const char *kLayouts[] = {
    "%Y:%m:%d %H:%M:%S",   //< EXIF style, no zone: taken as UTC
    "%Y-%m-%dT%H:%M:%SZ", //< ISO-8601 UTC
};

bool in_calendar_range(EpochSeconds value) {
  return value >= MIN_EPOCH_SECONDS && value <= MAX_EPOCH_SECONDS;
}

bool all_digits(const std::string &s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c);
  });
}

} // anonymous namespace

// **---- Parsing ----**

std::optional<EpochSeconds> parse_formatted_time(const std::string &text) {
  for (const char *layout : kLayouts) {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, layout);
    if (in.fail())
      continue;
    /// Reject trailing garbage such as a zone suffix we do not understand
    if (in.peek() != std::char_traits<char>::eof())
      continue;
    return static_cast<EpochSeconds>(timegm(&tm));
  }
  return std::nullopt;
}

namespace {

std::optional<EpochSeconds> parse_epoch(const TimeProbe &probe) {
  switch (probe.kind) {
  case ValueKind::Absent:
    return std::nullopt;

  case ValueKind::Number: {
    /// Range-checked in double before the cast
    if (!std::isfinite(probe.number) ||
        probe.number <= static_cast<double>(MIN_EPOCH_SECONDS) - 1.0 ||
        probe.number >= static_cast<double>(MAX_EPOCH_SECONDS) + 1.0)
      return std::nullopt;
    return static_cast<EpochSeconds>(probe.number);
  }

  case ValueKind::String: {
    if (all_digits(probe.text)) {
      EpochSeconds value = 0;
      const char *first = probe.text.data();
      const char *last = first + probe.text.size();
      auto [ptr, ec] = std::from_chars(first, last, value);
      if (ec != std::errc() || ptr != last)
        return std::nullopt;
      return value;
    }
    return parse_formatted_time(probe.text);
  }
  }
  return std::nullopt;
}

} // anonymous namespace

std::optional<EpochSeconds> parse_probe(const TimeProbe &probe) {
  auto value = parse_epoch(probe);
  if (value && !in_calendar_range(*value))
    return std::nullopt;
  return value;
}

// **---- Resolver ----**

std::optional<EpochSeconds>
TimestampResolver::resolve(const SidecarRecord &record) const {
  for (const auto &probe : record.probes) {
    if (probe.kind == ValueKind::Absent)
      continue;

    auto value = parse_probe(probe);
    if (value) {
      LOG_DEBUG(log_, "Timestamp {} from {}", *value, probe.path());
      return value;
    }

    if (probe.kind == ValueKind::String) {
      LOG_WARN(log_, "Unparseable {} value \"{}\", trying next field",
               probe.path(), probe.text);
    } else {
      LOG_WARN(log_, "Unparseable {} value {}, trying next field",
               probe.path(), probe.number);
    }
  }
  return std::nullopt;
}

} // namespace takeout_timefix
