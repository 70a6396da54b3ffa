/**
 * @file matcher.cpp
 * @brief Sidecar to media file correlation implementation
 */

#include "takeout_timefix/matcher.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <system_error>

namespace takeout_timefix {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool starts_with(const std::string &s, const std::string &prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

/// Drop a trailing "(N)" duplicate counter
std::string strip_counter(const std::string &segment) {
  if (segment.size() < 3 || segment.back() != ')')
    return segment;
  size_t open = segment.rfind('(');
  if (open == std::string::npos || open + 2 > segment.size() - 1)
    return segment;
  for (size_t i = open + 1; i < segment.size() - 1; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(segment[i])))
      return segment;
  }
  return segment.substr(0, open);
}

} // anonymous namespace

// **---- Name Parsing ----**

bool is_supplemental_marker(const std::string &segment) {
  std::string core = to_lower(strip_counter(segment));
  if (core.empty())
    return false;
  return starts_with(SUPPLEMENTAL_MARKER, core);
}

std::optional<SidecarName> parse_sidecar_name(const std::string &file_name) {
  constexpr size_t kJsonLen = 5; //< ".json"
  if (file_name.size() <= kJsonLen ||
      to_lower(file_name.substr(file_name.size() - kJsonLen)) != ".json") {
    return std::nullopt;
  }

  SidecarName parts;
  std::string stem = file_name.substr(0, file_name.size() - kJsonLen);

  /// Peel the supplemental marker off first; it is never part of the media
  /// name
  size_t dot = stem.rfind('.');
  if (dot != std::string::npos && is_supplemental_marker(stem.substr(dot + 1))) {
    parts.supplement = stem.substr(dot);
    stem.erase(dot);
  }

  dot = stem.rfind('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == stem.size()) {
    return std::nullopt;
  }

  parts.base = stem.substr(0, dot);
  parts.extension = stem.substr(dot);
  return parts;
}

std::string lower_extension(const fs::path &path) {
  return to_lower(path.extension().string());
}

bool is_media_file(const fs::path &path) {
  std::string ext = lower_extension(path);
  if (ext == ".json")
    return false;
  return std::find(std::begin(MEDIA_EXTENSIONS), std::end(MEDIA_EXTENSIONS),
                   ext) != std::end(MEDIA_EXTENSIONS);
}

// **---- Matcher ----**

std::vector<std::string> Matcher::list_directory(const fs::path &dir) {
  std::vector<std::string> names;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec)) {
      names.push_back(it->path().filename().string());
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

MatchResult Matcher::match(const fs::path &sidecar_path) const {
  MatchResult result;

  auto parts = parse_sidecar_name(sidecar_path.filename().string());
  if (!parts) {
    result.reason = "filename format not recognized";
    return result;
  }

  const std::string media_name = parts->media_name();
  const std::string loose_prefix = media_name.substr(0, media_name.find('.'));
  fs::path dir = sidecar_path.parent_path();
  if (dir.empty())
    dir = ".";

  const std::vector<std::string> names = list_directory(dir);

  /// Strategies in strict priority order; first accepted hit wins
  auto exact = [&](const std::string &n) { return n == media_name; };
  auto trailing = [&](const std::string &n) {
    return starts_with(n, media_name);
  };
  auto loose = [&](const std::string &n) {
    return !loose_prefix.empty() && starts_with(n, loose_prefix);
  };

  for (int strategy = 0; strategy < 3; ++strategy) {
    for (const auto &name : names) {
      bool hit = strategy == 0   ? exact(name)
                 : strategy == 1 ? trailing(name)
                                 : loose(name);
      if (hit && is_media_file(name)) {
        result.ok = true;
        result.media_path = dir / name;
        return result;
      }
    }
  }

  result.reason = "no media file found";
  return result;
}

} // namespace takeout_timefix
