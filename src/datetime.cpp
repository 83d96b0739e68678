#include "olr/datetime.hpp"

#include <time.h>

#include <algorithm>
#include <array>
#include <boost/algorithm/string.hpp>
#include <boost/log/trivial.hpp>
#include <cctype>
#include <string_view>

namespace olr {

auto datetime_formats() -> const std::vector<std::string> & {
  static const auto formats = std::vector<std::string>{
      // ISO
      "%Y-%m-%d %H:%M:%S",
      "%Y-%m-%d %H:%M",
      "%Y-%m-%d",
      "%Y%m%d%H%M%S",
      "%Y%m%d%H%M",
      // US
      "%m-%d-%Y %H:%M:%S",
      "%m-%d-%Y %H:%M",
      "%m-%d-%Y",
      "%m/%d/%Y %H:%M:%S",
      "%m/%d/%Y %H:%M",
      "%m/%d/%Y",
      // European
      "%d-%m-%Y %H:%M:%S",
      "%d-%m-%Y %H:%M",
      "%d-%m-%Y",
      "%d/%m/%Y %H:%M:%S",
      "%d/%m/%Y %H:%M",
      "%d/%m/%Y",
      // Surveying
      "%Y%m%d",
      "%d%m%Y",
      "%m%d%Y",
      "%Y-%m-%dT%H:%M:%S",
      "%Y-%m-%dT%H:%M",
      "%Y%m%dT%H%M%S",
      "%Y%m%dT%H%M",
      "%d-%b-%Y %H:%M:%S",
      "%d-%b-%Y %H:%M",
      "%d-%b-%Y",
      "%b-%d-%Y %H:%M:%S",
      "%b-%d-%Y %H:%M",
      "%b-%d-%Y",
      // GPS, year and day of year
      "%Y-%j %H:%M:%S",
      "%Y-%j %H:%M",
      "%Y-%j",
      "%Y/%m/%d %H:%M:%S",
      "%Y/%m/%d %H:%M",
      "%Y/%m/%d",
      "%d.%m.%Y %H:%M:%S",
      "%d.%m.%Y %H:%M",
      "%d.%m.%Y",
      // 12-hour clock
      "%Y-%m-%d %I:%M:%S %p",
      "%Y-%m-%d %I:%M %p",
      "%m/%d/%Y %I:%M:%S %p",
      "%m/%d/%Y %I:%M %p",
      "%d/%m/%Y %I:%M:%S %p",
      "%d/%m/%Y %I:%M %p",
      // UTC, a trailing 'Z' or UTC offset is normalized into " UTC"
      "%Y-%m-%d %H:%M:%S UTC",
      "%Y-%m-%d %H:%M UTC",
      "%Y-%m-%dT%H:%M:%S UTC",
      "%Y-%m-%dT%H:%M UTC",
      "%Y%m%dT%H%M%S UTC",
      "%Y%m%dT%H%M UTC",
  };
  return formats;
}

auto normalize_datetime(const std::string &value) -> std::string {
  auto result = boost::algorithm::trim_copy(value);
  if (result.size() > 1 && (result.back() == 'Z' || result.back() == 'z') &&
      std::isdigit(static_cast<unsigned char>(result[result.size() - 2])) !=
          0) {
    result.pop_back();
    result += " UTC";
  }
  return result;
}

static constexpr auto kUtcSuffix = std::string_view(" UTC");

static auto all_digits(std::string_view text) -> bool {
  return !text.empty() &&
         std::all_of(text.begin(), text.end(), [](char item) {
           return std::isdigit(static_cast<unsigned char>(item)) != 0;
         });
}

// Replaces a trailing ISO-8601 UTC offset (+HH, +HHMM or +HH:MM) by " UTC".
// Only a value holding a time of day can carry an offset, which keeps the
// day of "2021-06-15" out of it.
// @return The offset in seconds east of UTC.
static auto split_utc_offset(std::string &text) -> std::time_t {
  auto sign = text.find_last_of("+-");
  if (sign == std::string::npos || sign == 0) {
    return 0;
  }
  auto zone = text.substr(sign + 1);
  if (zone.size() == 5 && zone[2] == ':') {
    zone.erase(2, 1);
  }
  if ((zone.size() != 2 && zone.size() != 4) || !all_digits(zone)) {
    return 0;
  }
  auto prefix = std::string_view(text).substr(0, sign);
  if (std::isdigit(static_cast<unsigned char>(prefix.back())) == 0 ||
      prefix.find_first_of(":T") == std::string_view::npos) {
    return 0;
  }
  auto hours = std::stoi(zone.substr(0, 2));
  auto minutes = zone.size() == 4 ? std::stoi(zone.substr(2, 2)) : 0;
  if (hours > 23 || minutes > 59) {
    return 0;
  }
  auto offset = static_cast<std::time_t>(hours * 3600 + minutes * 60);
  if (text[sign] == '-') {
    offset = -offset;
  }
  text.erase(sign);
  text += kUtcSuffix;
  return offset;
}

// Removes the fractional part of the seconds, e.g. "10:00:00.250".
static auto strip_fraction(std::string &text) -> void {
  auto end = text.size();
  if (boost::algorithm::ends_with(text, kUtcSuffix)) {
    end -= kUtcSuffix.size();
  }
  auto dot = text.rfind('.', end);
  if (dot == std::string::npos || dot == 0 ||
      std::isdigit(static_cast<unsigned char>(text[dot - 1])) == 0 ||
      !all_digits(std::string_view(text).substr(dot + 1, end - dot - 1))) {
    return;
  }
  if (text.find_first_of(":T") > dot) {
    return;
  }
  text.erase(dot, end - dot);
}

auto parse_datetime(const std::string &value, const std::string &format)
    -> std::optional<std::time_t> {
  auto text = normalize_datetime(value);
  if (text.empty()) {
    return std::nullopt;
  }
  auto offset = std::time_t(0);
  if (!boost::algorithm::ends_with(text, kUtcSuffix)) {
    offset = split_utc_offset(text);
  }
  strip_fraction(text);
  // A zoned value also matches the formats without the zone.
  if (boost::algorithm::ends_with(text, kUtcSuffix) &&
      !boost::algorithm::ends_with(format, kUtcSuffix)) {
    text.erase(text.size() - kUtcSuffix.size());
  }

  std::tm tms = {};
  const auto *end = strptime(text.c_str(), format.c_str(), &tms);
  if (end == nullptr || *end != '\0') {
    return std::nullopt;
  }

  // strptime only fills tm_yday for %j; timegm normalizes the overflowing
  // day of month into the right date.
  auto day_of_year = format.find("%j") != std::string::npos;
  if (day_of_year) {
    tms.tm_mon = 0;
    tms.tm_mday = tms.tm_yday + 1;
  }
  tms.tm_isdst = 0;

  auto expected = tms;
  auto result = timegm(&tms);
  if (result == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  // Reject dates normalized by timegm, such as February 30.
  if (!day_of_year && (tms.tm_mday != expected.tm_mday ||
                       tms.tm_mon != expected.tm_mon)) {
    return std::nullopt;
  }
  return result - offset;
}

auto parse_datetime(const std::string &value) -> std::optional<std::time_t> {
  for (const auto &format : datetime_formats()) {
    auto result = parse_datetime(value, format);
    if (result) {
      return result;
    }
  }
  return std::nullopt;
}

auto detect_datetime_format(const std::vector<std::string> &samples)
    -> std::optional<std::string> {
  if (samples.empty()) {
    return std::nullopt;
  }
  for (const auto &format : datetime_formats()) {
    auto valid_count = std::count_if(
        samples.begin(), samples.end(), [&format](const std::string &item) {
          return parse_datetime(item, format).has_value();
        });
    if (static_cast<double>(valid_count) /
            static_cast<double>(samples.size()) >
        0.7) {
      BOOST_LOG_TRIVIAL(debug)
          << "Detected format '" << format << "' with " << valid_count << "/"
          << samples.size() << " matches";
      return format;
    }
  }
  return std::nullopt;
}

auto sample_values(const Layer &layer, const std::string &field,
                   size_t max_samples) -> std::vector<std::string> {
  auto result = std::vector<std::string>();
  for (const auto &feature : layer.features) {
    if (result.size() >= max_samples) {
      break;
    }
    const auto *value = feature.attributes.get(field);
    if (value == nullptr || is_null(*value)) {
      continue;
    }
    auto text = normalize_datetime(to_string(*value));
    if (!text.empty()) {
      result.emplace_back(std::move(text));
    }
  }
  return result;
}

// Checks if the field name suggests a date or a time.
static auto looks_like_datetime(const std::string &name) -> bool {
  static const auto keywords = std::array<const char *, 7>{
      "date", "time", "dt", "datetime", "survey", "gps", "epoch"};
  auto lower = boost::algorithm::to_lower_copy(name);
  return std::any_of(keywords.begin(), keywords.end(),
                     [&lower](const char *keyword) {
                       return lower.find(keyword) != std::string::npos;
                     });
}

auto detect_datetime_field(const Layer &layer)
    -> std::optional<std::pair<std::string, std::string>> {
  BOOST_LOG_TRIVIAL(debug) << "Scanning layer '" << layer.name
                           << "' for datetime fields";
  for (auto by_name : {true, false}) {
    for (const auto &field : layer.schema) {
      if (by_name && !looks_like_datetime(field.name)) {
        continue;
      }
      auto format = detect_datetime_format(sample_values(layer, field.name));
      if (format) {
        BOOST_LOG_TRIVIAL(info) << "Found datetime field '" << field.name
                                << "' in layer '" << layer.name << "'";
        return std::make_pair(field.name, *format);
      }
    }
  }
  return std::nullopt;
}

}  // namespace olr
