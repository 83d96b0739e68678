#pragma once

#include <utility>
#include <vector>

#include "olr/feature_store.hpp"
#include "olr/geometry.hpp"

namespace olr {

/// @brief R-tree over the envelopes of the features of a store.
///
/// The index answers box queries with possible false positives but no false
/// negatives. It is read-only once the pass starts and supports no deletion.
class SpatialIndex {
 public:
  /// @brief Pair of an envelope and the index of a feature in the store.
  using Value = std::pair<Box, size_t>;

  /// @brief RTree index for the envelope of the features.
  using RTree = bg::index::rtree<Value, bg::index::rstar<16>>;

  /// @brief Constructs an empty index.
  SpatialIndex() = default;

  /// @brief Builds the index over every non-empty feature of the store.
  ///
  /// Uses the packing constructor of the R-tree (O(n log n)).
  explicit SpatialIndex(const FeatureStore &store);

  /// @brief Adds the envelope of a feature.
  /// @param[in] feature Index of the feature in the store.
  /// @param[in] box Envelope of the feature's geometry.
  auto insert(size_t feature, const Box &box) -> void {
    rtree_.insert(std::make_pair(box, feature));
  }

  /// @brief Returns the features whose envelope intersects the box, in the
  /// order the R-tree visits them.
  [[nodiscard]] auto query(const Box &box) const -> std::vector<size_t>;

  /// Number of indexed envelopes.
  [[nodiscard]] inline auto size() const noexcept -> size_t {
    return rtree_.size();
  }

  [[nodiscard]] inline auto empty() const noexcept -> bool {
    return rtree_.empty();
  }

 private:
  RTree rtree_{};
};

}  // namespace olr
