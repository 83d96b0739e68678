#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "olr/feature.hpp"

namespace olr {

/// @brief Formats accepted for datetime values, in detection order.
///
/// The list uses strptime(3) syntax: ISO-8601 variants first, then the US,
/// European, surveying (compact, basic ISO-8601 and day-of-year) and 12-hour
/// forms.
auto datetime_formats() -> const std::vector<std::string> &;

/// @brief Strips surrounding blanks and rewrites a trailing 'Z' zone
/// designator as " UTC".
auto normalize_datetime(const std::string &value) -> std::string;

/// @brief Parses a datetime value with the given format.
///
/// The value is normalized first. A value holding a time of day may end with
/// an ISO-8601 UTC offset (+HH, +HHMM or +HH:MM) and may carry fractional
/// seconds: the offset is applied to the result and the fraction is ignored.
///
/// @param[in] value The text to parse.
/// @param[in] format The strptime(3) format. The whole value must match.
/// @return The UTC timestamp, or std::nullopt if the value does not match.
auto parse_datetime(const std::string &value, const std::string &format)
    -> std::optional<std::time_t>;

/// @brief Parses a datetime value with the first accepted format that
/// matches it.
auto parse_datetime(const std::string &value) -> std::optional<std::time_t>;

/// @brief Detects the format shared by a list of sample values.
///
/// The first format of datetime_formats() matching more than 70% of the
/// samples is selected.
/// @return The format, or std::nullopt if there is no sample or no format
/// matches enough of them.
auto detect_datetime_format(const std::vector<std::string> &samples)
    -> std::optional<std::string>;

/// @brief Collects up to max_samples non-empty values of a field.
auto sample_values(const Layer &layer, const std::string &field,
                   size_t max_samples = 10) -> std::vector<std::string>;

/// @brief Searches the layer for a field holding datetime values.
///
/// Fields whose names look like a date (date, time, dt, survey, gps,
/// epoch...) are tried first, then every field of the schema.
/// @return The field name and its detected format.
auto detect_datetime_field(const Layer &layer)
    -> std::optional<std::pair<std::string, std::string>>;

}  // namespace olr
