#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "olr/config.hpp"
#include "olr/error.hpp"
#include "olr/feature.hpp"

namespace olr {

/// @brief A feature normalized for the resolution pass.
struct StoredFeature {
  /// Global identity (source layer, id).
  FeatureKey key;
  /// Position of the source layer in the store.
  size_t layer{0};
  /// Valid geometry. Input geometry that was already valid is kept as is.
  MultiPolygon geometry;
  /// Attributes of the input feature, never modified.
  Attributes attributes;
  /// Value ranking the feature inside an overlap group.
  ResolutionKey resolution_key;
};

/// @brief Merges the schemas of the layers, in first-seen order.
///
/// A field declared with different types by two layers becomes a string
/// field; the widest declaration wins.
auto union_schema(const std::vector<Layer> &layers) -> Schema;

/// @brief In-memory representation of every input feature.
///
/// Entries are created once, in layer order then feature order, and never
/// mutated afterwards.
class FeatureStore {
 public:
  /// @brief Builds the store from the input layers.
  ///
  /// Invalid geometries are repaired. Features whose geometry cannot be
  /// repaired are left out and listed by rejected().
  ///
  /// @param[in] layers The input layers.
  /// @param[in] config A validated configuration.
  /// @throw ConfigurationError if a layer holds the same id twice.
  FeatureStore(const std::vector<Layer> &layers, const Config &config);

  [[nodiscard]] inline auto size() const noexcept -> size_t {
    return features_.size();
  }

  [[nodiscard]] inline auto empty() const noexcept -> bool {
    return features_.empty();
  }

  [[nodiscard]] inline auto operator[](size_t ix) const
      -> const StoredFeature & {
    return features_[ix];
  }

  [[nodiscard]] constexpr auto features() const noexcept
      -> const std::vector<StoredFeature> & {
    return features_;
  }

  /// Names of the source layers, in input order.
  [[nodiscard]] constexpr auto layer_names() const noexcept
      -> const std::vector<std::string> & {
    return layer_names_;
  }

  /// Union of the input schemas.
  [[nodiscard]] constexpr auto schema() const noexcept -> const Schema & {
    return schema_;
  }

  /// Datetime values that could not be parsed (datetime mode).
  [[nodiscard]] constexpr auto datetime_warnings() const noexcept
      -> const std::vector<UnparseableDatetimeError> & {
    return datetime_warnings_;
  }

  /// Features left out because their geometry could not be repaired.
  [[nodiscard]] constexpr auto rejected() const noexcept
      -> const std::vector<InvalidGeometryError> & {
    return rejected_;
  }

  /// @brief Searches a feature by identity.
  [[nodiscard]] auto find(const FeatureKey &key) const
      -> std::optional<size_t>;

 private:
  auto add_layer(const Layer &layer, const Config &config) -> void;

  std::vector<StoredFeature> features_{};
  std::vector<std::string> layer_names_{};
  Schema schema_{};
  std::map<FeatureKey, size_t> keys_{};
  std::vector<UnparseableDatetimeError> datetime_warnings_{};
  std::vector<InvalidGeometryError> rejected_{};
};

}  // namespace olr
