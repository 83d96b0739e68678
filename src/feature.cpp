#include "olr/feature.hpp"

#include <algorithm>
#include <cmath>
#include <locale>
#include <sstream>

namespace olr {

auto to_string(const AttributeValue &value) -> std::string {
  if (const auto *integer = std::get_if<std::int64_t>(&value)) {
    return std::to_string(*integer);
  }
  if (const auto *real = std::get_if<double>(&value)) {
    // Numeric date fields such as 20240115 are stored as reals by some
    // writers.
    if (std::isfinite(*real) && *real == std::floor(*real) &&
        std::fabs(*real) < 1e15) {
      return std::to_string(static_cast<std::int64_t>(*real));
    }
    auto ss = std::ostringstream();
    ss.imbue(std::locale::classic());
    ss.precision(15);
    ss << *real;
    return ss.str();
  }
  if (const auto *text = std::get_if<std::string>(&value)) {
    return *text;
  }
  return {};
}

auto find_field(const Schema &schema, const std::string &name)
    -> std::optional<size_t> {
  auto it = std::find_if(schema.begin(), schema.end(),
                         [&name](const Field &item) { return item.name == name; });
  if (it == schema.end()) {
    return std::nullopt;
  }
  return static_cast<size_t>(std::distance(schema.begin(), it));
}

auto Attributes::set(const std::string &name, AttributeValue value) -> void {
  auto it = std::find_if(items_.begin(), items_.end(),
                         [&name](const value_type &item) {
                           return item.first == name;
                         });
  if (it != items_.end()) {
    it->second = std::move(value);
  } else {
    items_.emplace_back(name, std::move(value));
  }
}

auto Attributes::get(const std::string &name) const -> const AttributeValue * {
  auto it = std::find_if(items_.begin(), items_.end(),
                         [&name](const value_type &item) {
                           return item.first == name;
                         });
  return it == items_.end() ? nullptr : &it->second;
}

}  // namespace olr
