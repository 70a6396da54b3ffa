/**
 * @file matcher.hpp
 * @brief Sidecar to media file correlation
 *
 * @details The export tool names sidecars after their media file but is
 *          sloppy about it: the media name may be truncated, may carry a
 *          "(1)" duplicate counter, and the sidecar may carry a (possibly
 *          truncated) "supplemental-metadata" marker. Three lookup
 *          strategies of decreasing specificity are tried in order:
 *
 *          1. Exact reconstructed name       (IMG_0001.jpg)
 *
 *          2. Reconstructed name + anything  (IMG_0001.jpg(1).jpg)
 *
 *          3. Stem before first dot + anything (IMG_0001*)
 *
 * @note Inside one strategy candidates are examined in lexicographic order so
 *       the result does not depend on directory iteration order.
 */

#ifndef TAKEOUT_TIMEFIX_MATCHER_HPP
#define TAKEOUT_TIMEFIX_MATCHER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace takeout_timefix {

/**
 * @struct SidecarName
 * @brief A sidecar file name split into its meaningful parts.
 */
struct SidecarName {
  std::string base;       //< Everything before the media extension
  std::string extension;  //< Media extension with leading dot, case preserved
  std::string supplement; //< Discarded marker segment ("" if none)

  /// Name of the media file the sidecar was written for
  std::string media_name() const { return base + extension; }
};

/**
 * @brief Split "<base><.ext>[.<marker>].json" (".json" case-insensitive).
 * @param file_name Sidecar file name without directory
 * @return Parsed parts, or nullopt if the name does not fit the shape
 */
std::optional<SidecarName> parse_sidecar_name(const std::string &file_name);

/**
 * @brief Check whether a dot-segment is a (truncated) supplemental marker.
 * @param segment Segment without its leading dot, e.g. "suppl" or
 *                "supplemental-metadata(1)"
 */
bool is_supplemental_marker(const std::string &segment);

/// Lower-cased extension of a path (".JPG" -> ".jpg")
std::string lower_extension(const std::filesystem::path &path);

/// Whether the path's extension is in the media allow-list
bool is_media_file(const std::filesystem::path &path);

/**
 * @class Matcher
 * @brief Finds the media file that belongs to a sidecar.
 * @note Stateless; safe to share between stream workers.
 */
class Matcher {
public:
  /**
   * @brief Locate the media file for a sidecar in the sidecar's directory.
   * @param sidecar_path Path to the *.json sidecar
   * @return MatchResult with the single accepted candidate or a reason
   */
  MatchResult match(const std::filesystem::path &sidecar_path) const;

private:
  /// Sorted regular-file names of a directory
  static std::vector<std::string>
  list_directory(const std::filesystem::path &dir);
};

} // namespace takeout_timefix

#endif // TAKEOUT_TIMEFIX_MATCHER_HPP
