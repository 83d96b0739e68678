#pragma once

#include <map>
#include <optional>
#include <vector>

#include "olr/feature_store.hpp"
#include "olr/spatial_index.hpp"

namespace olr {

/// @brief A confirmed overlap between two features of the store.
struct Overlap {
  /// Smaller store index of the pair.
  size_t first{0};
  /// Larger store index of the pair.
  size_t second{0};
  /// Intersection of the two geometries.
  MultiPolygon region;
};

/// @brief Maximal set of features connected by overlaps.
struct OverlapGroup {
  /// Position of the group in the emission sequence.
  size_t index{0};
  /// Store indices of the members, ascending.
  std::vector<size_t> members;
  /// Confirmed overlaps between members, sorted by (first, second).
  std::vector<Overlap> overlaps;

  /// @brief True if the group holds a single feature overlapping nothing.
  [[nodiscard]] inline auto is_trivial() const noexcept -> bool {
    return members.size() == 1;
  }

  /// @brief Returns, for each member, the members it overlaps (ascending).
  [[nodiscard]] auto neighbors() const
      -> std::map<size_t, std::vector<size_t>>;
};

/// @brief Enumerates the overlap groups of a store, lazily.
///
/// Groups are emitted in store order of their first member. Every feature
/// belongs to exactly one group; features overlapping nothing form trivial
/// groups. Two features overlap when their intersection covers more than
/// area_epsilon: envelopes or boundaries that only touch do not count.
class OverlapDetector {
 public:
  /// @brief Constructs the detector.
  ///
  /// The store and the index must outlive the detector.
  OverlapDetector(const FeatureStore &store, const SpatialIndex &index,
                  double area_epsilon);

  /// @brief Computes the next group.
  /// @return The group, or std::nullopt once every feature has been grouped.
  auto next() -> std::optional<OverlapGroup>;

  /// Number of features assigned to a group so far.
  [[nodiscard]] inline auto visited() const noexcept -> size_t {
    return visited_count_;
  }

  /// Number of features to group.
  [[nodiscard]] inline auto total() const noexcept -> size_t {
    return store_.size();
  }

 private:
  /// Intersection of two features if it is larger than the epsilon.
  auto confirm(size_t lhs, size_t rhs) const -> std::optional<MultiPolygon>;

  const FeatureStore &store_;
  const SpatialIndex &index_;
  double area_epsilon_;
  std::vector<bool> visited_;
  size_t visited_count_{0};
  size_t cursor_{0};
  size_t emitted_{0};
};

}  // namespace olr
