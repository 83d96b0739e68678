#pragma once

#include <string>
#include <vector>

#include "olr/config.hpp"
#include "olr/error.hpp"
#include "olr/feature.hpp"
#include "olr/progress.hpp"
#include "olr/resolution.hpp"

namespace olr {

/// @brief Name of the attribute holding the source layer of an output
/// feature.
inline constexpr const char *kSourceLayerField = "src_layer";

/// @brief A feature of the resolved output.
struct ResolvedFeature {
  /// Identity of the input feature.
  FeatureKey key;
  /// Geometry: untouched, or trimmed if the feature lost an overlap.
  MultiPolygon geometry;
  /// Values aligned with the schema of the set, null-filled.
  std::vector<AttributeValue> values;
  /// True if the feature lost part of its area.
  bool trimmed{false};
};

/// @brief Final, non-overlapping feature set.
struct ResolvedFeatureSet {
  /// Union of the input schemas followed by the source layer field.
  Schema schema;
  /// Output features, in input order (layer, then feature).
  std::vector<ResolvedFeature> features;
};

/// @brief Everything a pass produced.
struct ResolveReport {
  Outcome outcome{Outcome::completed};
  /// Why the pass failed, if it did.
  std::string reason{};
  ResolvedFeatureSet features{};
  /// Resolution of every completed group with at least two members.
  std::vector<ResolutionResult> results{};
  /// Groups (or input features) dropped because of an unrepairable geometry.
  std::vector<InvalidGeometryError> failures{};
  /// Features excluded from winner candidacy.
  std::vector<UnparseableDatetimeError> datetime_warnings{};
  /// Number of resolved groups with at least two members.
  size_t group_count{0};
  /// Number of overlapping feature pairs in the resolved groups.
  size_t overlap_count{0};
};

/// @brief Intersection of two overlapping features.
struct OverlapRegion {
  size_t group{0};
  FeatureKey first;
  FeatureKey second;
  MultiPolygon region;
};

/// @brief Resolves the overlaps between the features of the layers.
///
/// Features overlapping nothing are returned unchanged. In each overlap group
/// the winner keeps its geometry and the other members lose the area of the
/// higher-ranked members they overlap. A group whose geometry cannot be
/// repaired is left out of the output and listed in the failures; the other
/// groups are not affected.
///
/// @param[in] layers The input layers.
/// @param[in] config The resolution parameters.
/// @param[in] progress Optional progress sink, consulted before each group.
/// With a single thread it receives the number of features visited out of
/// the number of features. With several threads the detection of the groups
/// counts the visited features out of twice the number of features, then the
/// resolution adds the members of each resolved group to reach that total.
/// @return The report of the pass. On cancellation the output only holds the
/// features of the groups preceding, in emission order, the first group left
/// unprocessed.
/// @throw ConfigurationError before any processing if the configuration is
/// unusable.
auto resolve(const std::vector<Layer> &layers, const Config &config,
             ProgressSink *progress = nullptr) -> ResolveReport;

/// @brief Lists the overlaps between the features of the layers without
/// resolving them.
/// @throw ConfigurationError if the configuration is unusable.
auto detect(const std::vector<Layer> &layers, const Config &config,
            ProgressSink *progress = nullptr) -> std::vector<OverlapRegion>;

}  // namespace olr
