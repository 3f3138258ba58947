#pragma once

#include "gcli/core/result.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace gcli {

/// Seconds since the Unix epoch (UTC).
using Timestamp = std::int64_t;

/// Source of "now"; injectable so cache and coordinator logic is testable.
using Clock = std::function<Timestamp()>;

Timestamp system_now();

/**
 * @brief Parse an ISO-8601 date-time as produced by the archive service
 *
 * Accepts "2013-05-07T22:51:52Z", fractional seconds ("...52.339Z") and
 * numeric offsets ("...52+02:00"). The result is normalised to UTC.
 */
Result<Timestamp> parse_iso8601(const std::string& text);

/// Format as "YYYY-MM-DDTHH:MM:SSZ".
std::string format_iso8601(Timestamp timestamp);

/// Format as the compact "YYYYMMDDTHHMMSSZ" form used in request signing.
std::string format_basic_iso8601(Timestamp timestamp);

} // namespace gcli
