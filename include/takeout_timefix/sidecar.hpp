/**
 * @file sidecar.hpp
 * @brief Sidecar record model and reader
 *
 * @details A sidecar is read once and projected onto a SidecarRecord: a fixed
 *          list of time probes plus the optional geo point. Nothing else of
 *          the JSON document survives the read, and the record is never
 *          mutated afterwards.
 *
 * @attention Sidecar JSON looks like:
 * @code
 *   {
 *     "title": "IMG_0001.jpg",
 *     "photoTakenTime": { "timestamp": "1609459200", "formatted": "..." },
 *     "creationTime":   { "timestamp": "1609459300", "formatted": "..." },
 *     "geoData": { "latitude": 31.2, "longitude": 121.4, "altitude": 0.0 }
 *   }
 * @endcode
 */

#ifndef TAKEOUT_TIMEFIX_SIDECAR_HPP
#define TAKEOUT_TIMEFIX_SIDECAR_HPP

#include <array>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace takeout_timefix {

/**
 * @enum ValueKind
 * @brief Shape of a probed field value.
 */
enum class ValueKind { Absent, Number, String };

/**
 * @struct TimeProbe
 * @brief One candidate time field, identified by its two-level path.
 */
struct TimeProbe {
  const char *group = ""; //< e.g. "photoTakenTime"
  const char *field = ""; //< e.g. "timestamp"
  ValueKind kind = ValueKind::Absent;
  double number = 0.0; //< Valid for ValueKind::Number
  std::string text;    //< Valid for ValueKind::String

  std::string path() const { return std::string(group) + "." + field; }
};

/// Number of time fields ever consulted
constexpr size_t TIME_PROBE_COUNT = 4;

/**
 * @struct GeoPoint
 * @brief WGS84 position in decimal degrees.
 */
struct GeoPoint {
  double latitude = 0.0;
  double longitude = 0.0;
};

/**
 * @struct SidecarRecord
 * @brief Projection of one sidecar's JSON onto the fields we use.
 * @note probes are in resolution priority order.
 */
struct SidecarRecord {
  std::array<TimeProbe, TIME_PROBE_COUNT> probes;
  std::optional<GeoPoint> geo;
};

/**
 * @brief Project a parsed JSON document onto a SidecarRecord.
 * @note Never throws on unexpected shapes; wrong types are treated as absent.
 *       Null and empty-string values are absent as well.
 */
SidecarRecord record_from_json(const nlohmann::json &doc);

/**
 * @struct SidecarReadResult
 * @brief Outcome of reading and parsing one sidecar file.
 */
struct SidecarReadResult {
  bool ok = false;
  SidecarRecord record;
  std::string reason; //< Failure reason when !ok
};

/**
 * @brief Read a sidecar file as UTF-8 JSON (a leading BOM is skipped).
 * @param path Sidecar path
 * @return Parsed record, or a reason for unreadable / malformed files
 */
SidecarReadResult read_sidecar(const std::filesystem::path &path);

} // namespace takeout_timefix

#endif // TAKEOUT_TIMEFIX_SIDECAR_HPP
