#include "olr/resolution.hpp"

#include <algorithm>
#include <boost/log/trivial.hpp>
#include <map>

#include "olr/repair.hpp"

namespace olr {

auto ResolutionEngine::outranks(size_t lhs, size_t rhs) const -> bool {
  const auto &a = store_[lhs];
  const auto &b = store_[rhs];

  if (config_.mode == ResolutionMode::datetime) {
    const auto &ta = a.resolution_key.timestamp;
    const auto &tb = b.resolution_key.timestamp;
    if (ta.has_value() != tb.has_value()) {
      return ta.has_value();
    }
    if (ta && *ta != *tb) {
      return *ta > *tb;
    }
  } else {
    auto pa = a.resolution_key.priority.value_or(0);
    auto pb = b.resolution_key.priority.value_or(0);
    if (pa != pb) {
      return config_.prefer_highest_rank ? pa > pb : pa < pb;
    }
  }
  return a.key < b.key;
}

auto ResolutionEngine::rank(const OverlapGroup &group) const
    -> std::vector<size_t> {
  auto result = group.members;
  std::sort(result.begin(), result.end(), [this](size_t lhs, size_t rhs) {
    return outranks(lhs, rhs);
  });
  return result;
}

auto ResolutionEngine::resolve(const OverlapGroup &group) const
    -> ResolutionResult {
  auto ranked = rank(group);
  auto result = ResolutionResult();
  result.group = group.index;
  result.winner = ranked.front();

  if (config_.mode == ResolutionMode::datetime && !group.is_trivial() &&
      !store_[result.winner].resolution_key.timestamp) {
    BOOST_LOG_TRIVIAL(warning)
        << "No valid datetime in overlap group #" << group.index
        << ", resolving by feature identity";
  }

  auto position = std::map<size_t, size_t>();
  for (size_t ix = 0; ix < ranked.size(); ++ix) {
    position[ranked[ix]] = ix;
  }
  auto neighbors = group.neighbors();

  try {
    const auto &winner = store_[result.winner];
    // A valid winner keeps its exact input geometry.
    result.winner_region =
        invalidity_reason(winner.geometry)
            ? repair(winner.geometry, config_.area_epsilon, winner.key)
            : winner.geometry;

    for (auto it = ranked.begin() + 1; it != ranked.end(); ++it) {
      const auto &loser = store_[*it];
      auto trimmed = loser.geometry;
      auto contested = false;
      for (auto other : neighbors[*it]) {
        if (position[other] > position[*it]) {
          continue;
        }
        contested = true;
        trimmed = difference(trimmed, store_[other].geometry);
        if (trimmed.empty()) {
          break;
        }
      }
      result.losers.push_back(Loser{
          *it, repair(trimmed, config_.area_epsilon, loser.key), contested});
    }
  } catch (const InvalidGeometryError &err) {
    throw InvalidGeometryError(err.key(), err.reason(), group.index);
  }

  std::sort(result.losers.begin(), result.losers.end(),
            [this](const Loser &lhs, const Loser &rhs) {
              return store_[lhs.feature].key < store_[rhs.feature].key;
            });
  return result;
}

}  // namespace olr
