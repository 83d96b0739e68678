#pragma once

#include <vector>

#include "olr/config.hpp"
#include "olr/feature_store.hpp"
#include "olr/overlap_detector.hpp"

namespace olr {

/// @brief A member of a group other than its winner.
struct Loser {
  /// Store index of the feature.
  size_t feature{0};
  /// Remaining geometry. Empty if the feature is fully subsumed.
  MultiPolygon trimmed;
  /// False if no higher-ranked member overlaps the feature, which then keeps
  /// its whole geometry.
  bool contested{true};
};

/// @brief Outcome of the resolution of one overlap group.
///
/// The winner region and the trimmed geometries partition the combined
/// extent of the group, without gap nor overlap (modulo the area epsilon).
struct ResolutionResult {
  /// Index of the resolved group.
  size_t group{0};
  /// Store index of the winning feature.
  size_t winner{0};
  /// Geometry kept by the winner: its full original geometry.
  MultiPolygon winner_region;
  /// The other members, in ascending (source layer, id) order.
  std::vector<Loser> losers;
};

/// @brief Selects winners and trims losers inside overlap groups.
class ResolutionEngine {
 public:
  /// @brief Constructs the engine.
  ///
  /// The store must outlive the engine.
  ResolutionEngine(const FeatureStore &store, const Config &config)
      : store_(store), config_(config) {}

  /// @brief Checks if the first feature takes precedence over the second.
  ///
  /// In datetime mode the newest timestamp wins and features without a valid
  /// timestamp come last. In priority mode the lowest rank wins, or the
  /// highest if configured so. Ties go to the smallest (source layer, id).
  [[nodiscard]] auto outranks(size_t lhs, size_t rhs) const -> bool;

  /// @brief Sorts the members of a group, winner first.
  [[nodiscard]] auto rank(const OverlapGroup &group) const
      -> std::vector<size_t>;

  /// @brief Resolves a group.
  ///
  /// Members are processed in rank order: each one loses the area covered by
  /// the higher-ranked members it overlaps, and keeps everything else
  /// untouched. Every emitted geometry is repaired.
  ///
  /// @throw InvalidGeometryError if an emitted geometry cannot be repaired.
  [[nodiscard]] auto resolve(const OverlapGroup &group) const
      -> ResolutionResult;

 private:
  const FeatureStore &store_;
  Config config_;
};

}  // namespace olr
