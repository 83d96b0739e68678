#include "olr/config.hpp"

#include <algorithm>
#include <boost/log/trivial.hpp>
#include <cmath>
#include <set>

#include "olr/error.hpp"

namespace olr {

auto parse_resolution_mode(const std::string &name) -> ResolutionMode {
  if (name == "datetime") {
    return ResolutionMode::datetime;
  }
  if (name == "priority") {
    return ResolutionMode::priority;
  }
  throw ConfigurationError("unknown resolution mode '" + name +
                           "' (expected 'datetime' or 'priority')");
}

auto to_string(ResolutionMode mode) -> std::string {
  return mode == ResolutionMode::datetime ? "datetime" : "priority";
}

auto Config::priority_rank(const std::string &layer) const
    -> std::optional<int> {
  auto it = std::find(priority_order.begin(), priority_order.end(), layer);
  if (it == priority_order.end()) {
    return std::nullopt;
  }
  return static_cast<int>(std::distance(priority_order.begin(), it));
}

// Checks the datetime field mapping of every layer.
static auto validate_datetime(const Config &config,
                              const std::vector<Layer> &layers) -> void {
  for (const auto &layer : layers) {
    auto it = config.datetime_fields.find(layer.name);
    if (it == config.datetime_fields.end() || it->second.empty()) {
      throw ConfigurationError("no datetime field configured for layer '" +
                               layer.name + "'");
    }
    if (!find_field(layer.schema, it->second)) {
      throw ConfigurationError("layer '" + layer.name + "' has no field '" +
                               it->second + "'");
    }
  }
}

// Checks that the priority order ranks every layer exactly once.
static auto validate_priority(const Config &config,
                              const std::vector<Layer> &layers) -> void {
  if (config.priority_order.empty()) {
    throw ConfigurationError("the priority order is empty");
  }
  auto names = std::set<std::string>();
  for (const auto &name : config.priority_order) {
    if (!names.insert(name).second) {
      throw ConfigurationError("layer '" + name +
                               "' appears twice in the priority order");
    }
  }
  for (const auto &layer : layers) {
    if (names.count(layer.name) == 0) {
      throw ConfigurationError("layer '" + layer.name +
                               "' is missing from the priority order");
    }
  }
  for (const auto &name : config.priority_order) {
    auto known = std::any_of(
        layers.begin(), layers.end(),
        [&name](const Layer &layer) { return layer.name == name; });
    if (!known) {
      BOOST_LOG_TRIVIAL(warning)
          << "Priority order names unknown layer '" << name << "'";
    }
  }
}

auto Config::validate(const std::vector<Layer> &layers) const -> void {
  if (layers.empty()) {
    throw ConfigurationError("no input layer");
  }
  if (!std::isfinite(area_epsilon) || area_epsilon <= 0) {
    throw ConfigurationError("the area epsilon must be a positive number");
  }

  auto names = std::set<std::string>();
  for (const auto &layer : layers) {
    if (layer.name.empty()) {
      throw ConfigurationError("input layers must be named");
    }
    if (!names.insert(layer.name).second) {
      throw ConfigurationError("duplicate layer name '" + layer.name + "'");
    }
  }

  switch (mode) {
    case ResolutionMode::datetime:
      validate_datetime(*this, layers);
      break;
    case ResolutionMode::priority:
      validate_priority(*this, layers);
      break;
  }
}

}  // namespace olr
