#pragma once

#include <string>
#include <utility>
#include <vector>

#include "olr/config.hpp"
#include "olr/feature.hpp"
#include "olr/geometry.hpp"

namespace olr::test {

/// Feature with a "date" attribute.
inline auto dated(const std::string &id, MultiPolygon geometry,
                  const std::string &date) -> Feature {
  return Feature{id, std::move(geometry),
                 Attributes{{"date", AttributeValue(date)}}};
}

/// Feature without attribute.
inline auto plain(const std::string &id, MultiPolygon geometry) -> Feature {
  return Feature{id, std::move(geometry), Attributes{}};
}

/// Layer declaring a string "date" field.
inline auto layer(const std::string &name, std::vector<Feature> features)
    -> Layer {
  return Layer{name, Schema{Field{"date", FieldType::string, 32, 0}},
               std::move(features)};
}

/// Datetime configuration reading the "date" field of every layer.
inline auto datetime_config(const std::vector<Layer> &layers) -> Config {
  auto config = Config();
  config.mode = ResolutionMode::datetime;
  for (const auto &item : layers) {
    config.datetime_fields[item.name] = "date";
  }
  return config;
}

/// Priority configuration ranking the layers in the given order.
inline auto priority_config(std::vector<std::string> order) -> Config {
  auto config = Config();
  config.mode = ResolutionMode::priority;
  config.priority_order = std::move(order);
  return config;
}

}  // namespace olr::test
