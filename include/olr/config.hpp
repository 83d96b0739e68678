#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "olr/feature.hpp"

namespace olr {

/// @brief Rule used to select the winner of an overlap group.
enum class ResolutionMode {
  /// The feature with the newest timestamp wins.
  datetime,
  /// The feature of the layer ranked first in the priority order wins.
  priority
};

/// @brief Parses "datetime" or "priority".
/// @throw ConfigurationError if the name is unknown.
auto parse_resolution_mode(const std::string &name) -> ResolutionMode;

auto to_string(ResolutionMode mode) -> std::string;

/// @brief Parameters of a resolution pass.
struct Config {
  /// Active resolution rule. Datetime and priority are mutually exclusive.
  ResolutionMode mode{ResolutionMode::datetime};

  /// Datetime field of each layer (datetime mode).
  std::map<std::string, std::string> datetime_fields{};

  /// Explicit strptime format of each layer's datetime field. Layers not
  /// listed have their format detected from sample values.
  std::map<std::string, std::string> datetime_formats{};

  /// Layer names, highest priority first (priority mode).
  std::vector<std::string> priority_order{};

  /// If true, the layer with the numerically highest rank wins instead.
  bool prefer_highest_rank{false};

  /// Minimum area of a fragment or of an overlap. Smaller pieces are slivers.
  double area_epsilon{1e-6};

  /// Number of threads resolving groups. 0 uses all CPUs.
  size_t threads{1};

  /// Emit one output feature per polygon part.
  bool split_multipart{false};

  /// @brief Checks the configuration against the input layers.
  /// @throw ConfigurationError on the first problem found.
  auto validate(const std::vector<Layer> &layers) const -> void;

  /// @brief Returns the rank of a layer in the priority order.
  [[nodiscard]] auto priority_rank(const std::string &layer) const
      -> std::optional<int>;
};

}  // namespace olr
