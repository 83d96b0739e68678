#include "olr/spatial_index.hpp"

#include <algorithm>
#include <iterator>

namespace olr {

SpatialIndex::SpatialIndex(const FeatureStore &store) {
  std::vector<Value> values;
  values.reserve(store.size());
  for (size_t ix = 0; ix < store.size(); ++ix) {
    const auto &geometry = store[ix].geometry;
    // An empty geometry has no envelope and overlaps nothing.
    if (geometry.empty()) {
      continue;
    }
    values.emplace_back(envelope(geometry), ix);
  }
  rtree_ = RTree(values);
}

auto SpatialIndex::query(const Box &box) const -> std::vector<size_t> {
  std::vector<Value> found;
  rtree_.query(bg::index::intersects(box), std::back_inserter(found));

  auto result = std::vector<size_t>();
  result.reserve(found.size());
  std::transform(found.begin(), found.end(), std::back_inserter(result),
                 [](const Value &item) { return item.second; });
  return result;
}

}  // namespace olr
