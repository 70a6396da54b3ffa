/**
 * @file sidecar.cpp
 * @brief Sidecar record model and reader implementation
 */

#include "takeout_timefix/sidecar.hpp"

#include <cmath>
#include <fstream>
#include <iterator>
#include <utility>

namespace takeout_timefix {

using json = nlohmann::json;

// **---- Internal Helpers ----**

namespace {

/// Probe paths in resolution priority order
constexpr std::array<std::pair<const char *, const char *>, TIME_PROBE_COUNT>
    kProbePaths = {{{"photoTakenTime", "timestamp"},
                    {"creationTime", "timestamp"},
                    {"creationTime", "formatted"},
                    {"modificationTime", "formatted"}}};

void fill_probe(const json &doc, TimeProbe &probe) {
  auto group = doc.find(probe.group);
  if (group == doc.end() || !group->is_object())
    return;
  auto value = group->find(probe.field);
  if (value == group->end())
    return;

  if (value->is_number()) {
    probe.kind = ValueKind::Number;
    probe.number = value->get<double>();
  } else if (value->is_string()) {
    probe.text = value->get<std::string>();
    if (!probe.text.empty())
      probe.kind = ValueKind::String;
  }
}

/// Accept numbers and numeric strings, as the export tool writes both
std::optional<double> coordinate(const json &geo, const char *key) {
  auto it = geo.find(key);
  if (it == geo.end())
    return std::nullopt;
  if (it->is_number())
    return it->get<double>();
  if (it->is_string()) {
    try {
      size_t used = 0;
      const std::string &s = it->get_ref<const std::string &>();
      double v = std::stod(s, &used);
      if (used == s.size())
        return v;
    } catch (const std::exception &) {
      // not a number; treated as absent
    }
  }
  return std::nullopt;
}

} // anonymous namespace

// **---- Projection ----**

SidecarRecord record_from_json(const json &doc) {
  SidecarRecord record;
  for (size_t i = 0; i < TIME_PROBE_COUNT; ++i) {
    record.probes[i].group = kProbePaths[i].first;
    record.probes[i].field = kProbePaths[i].second;
  }
  if (!doc.is_object())
    return record;

  for (auto &probe : record.probes) {
    fill_probe(doc, probe);
  }

  auto geo = doc.find("geoData");
  if (geo != doc.end() && geo->is_object()) {
    auto lat = coordinate(*geo, "latitude");
    auto lon = coordinate(*geo, "longitude");
    /// (0, 0) is what the exporter writes when there is no location
    if (lat && lon && !(std::fabs(*lat) < 1e-6 && std::fabs(*lon) < 1e-6) &&
        *lat >= -90.0 && *lat <= 90.0 && *lon >= -180.0 && *lon <= 180.0) {
      record.geo = GeoPoint{*lat, *lon};
    }
  }
  return record;
}

// **---- Reader ----**

SidecarReadResult read_sidecar(const std::filesystem::path &path) {
  SidecarReadResult result;

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    result.reason = "sidecar parse error: cannot open file";
    return result;
  }
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  if (in.bad()) {
    result.reason = "sidecar parse error: read failed";
    return result;
  }

  /// UTF-8 byte-order mark
  if (content.size() >= 3 && content.compare(0, 3, "\xEF\xBB\xBF") == 0) {
    content.erase(0, 3);
  }

  try {
    result.record = record_from_json(json::parse(content));
    result.ok = true;
  } catch (const json::exception &e) {
    result.reason = std::string("sidecar parse error: ") + e.what();
  }
  return result;
}

} // namespace takeout_timefix
