/**
 * @file timestamp_resolver.hpp
 * @brief Picks the authoritative capture time out of a sidecar record
 *
 * @details Probes are tried in priority order:
 *
 *          1. photoTakenTime.timestamp
 *
 *          2. creationTime.timestamp
 *
 *          3. creationTime.formatted
 *
 *          4. modificationTime.formatted
 *
 *          The first probe that parses wins. Values are never merged or
 *          cross-checked between fields.
 */

#ifndef TAKEOUT_TIMEFIX_TIMESTAMP_RESOLVER_HPP
#define TAKEOUT_TIMEFIX_TIMESTAMP_RESOLVER_HPP

#include <optional>
#include <string>

#include "logging.hpp"
#include "sidecar.hpp"
#include "types.hpp"

namespace takeout_timefix {

/**
 * @brief Parse one probe value.
 *
 * @note Accepted encodings, in order:
 *
 *       - JSON number: epoch seconds (fraction truncated)
 *
 *       - all-digit string: epoch seconds
 *
 *       - "YYYY:MM:DD HH:MM:SS" read as UTC
 *
 *       - "YYYY-MM-DDTHH:MM:SSZ"
 *
 * @return Epoch seconds, or nullopt if absent or unparseable
 */
std::optional<EpochSeconds> parse_probe(const TimeProbe &probe);

/**
 * @brief Parse a formatted date against the known layouts.
 * @return Epoch seconds (UTC) for the first layout consuming the whole text
 */
std::optional<EpochSeconds> parse_formatted_time(const std::string &text);

/**
 * @class TimestampResolver
 * @brief Resolves a SidecarRecord to a single UTC instant.
 */
class TimestampResolver {
public:
  explicit TimestampResolver(EventSink &log) : log_(log) {}

  /**
   * @brief First successfully parsed probe, in priority order.
   * @note A probe that is present but unparseable is logged and skipped.
   */
  std::optional<EpochSeconds> resolve(const SidecarRecord &record) const;

private:
  EventSink &log_;
};

} // namespace takeout_timefix

#endif // TAKEOUT_TIMEFIX_TIMESTAMP_RESOLVER_HPP
