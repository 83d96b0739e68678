#include "olr/overlap_detector.hpp"

#include <algorithm>
#include <deque>
#include <set>
#include <tuple>

namespace olr {

auto OverlapGroup::neighbors() const -> std::map<size_t, std::vector<size_t>> {
  auto result = std::map<size_t, std::vector<size_t>>();
  for (auto member : members) {
    result[member];
  }
  for (const auto &item : overlaps) {
    result[item.first].push_back(item.second);
    result[item.second].push_back(item.first);
  }
  for (auto &item : result) {
    std::sort(item.second.begin(), item.second.end());
  }
  return result;
}

OverlapDetector::OverlapDetector(const FeatureStore &store,
                                 const SpatialIndex &index,
                                 double area_epsilon)
    : store_(store),
      index_(index),
      area_epsilon_(area_epsilon),
      visited_(store.size(), false) {}

auto OverlapDetector::confirm(size_t lhs, size_t rhs) const
    -> std::optional<MultiPolygon> {
  const auto &a = store_[lhs].geometry;
  const auto &b = store_[rhs].geometry;
  if (!bg::intersects(a, b)) {
    return std::nullopt;
  }
  auto region = intersection(a, b);
  if (area(region) <= area_epsilon_) {
    return std::nullopt;
  }
  return region;
}

auto OverlapDetector::next() -> std::optional<OverlapGroup> {
  while (cursor_ < visited_.size() && visited_[cursor_]) {
    ++cursor_;
  }
  if (cursor_ == visited_.size()) {
    return std::nullopt;
  }

  auto group = OverlapGroup();
  group.index = emitted_++;

  auto seed = cursor_;
  auto members = std::set<size_t>{seed};
  auto processed = std::set<size_t>();
  auto queue = std::deque<size_t>{seed};
  visited_[seed] = true;
  ++visited_count_;

  while (!queue.empty()) {
    auto current = queue.front();
    queue.pop_front();
    processed.insert(current);

    const auto &geometry = store_[current].geometry;
    if (geometry.empty()) {
      continue;
    }

    for (auto candidate : index_.query(envelope(geometry))) {
      // A processed candidate has already been tested against this feature.
      if (candidate == current || processed.count(candidate) != 0) {
        continue;
      }
      // Members of a previous group are envelope false positives.
      if (visited_[candidate] && members.count(candidate) == 0) {
        continue;
      }
      auto region = confirm(current, candidate);
      if (!region) {
        continue;
      }
      group.overlaps.push_back(Overlap{std::min(current, candidate),
                                       std::max(current, candidate),
                                       std::move(*region)});
      if (!visited_[candidate]) {
        visited_[candidate] = true;
        ++visited_count_;
        members.insert(candidate);
        queue.push_back(candidate);
      }
    }
  }

  group.members.assign(members.begin(), members.end());
  std::sort(group.overlaps.begin(), group.overlaps.end(),
            [](const Overlap &lhs, const Overlap &rhs) {
              return std::tie(lhs.first, lhs.second) <
                     std::tie(rhs.first, rhs.second);
            });
  return group;
}

}  // namespace olr
