#include "olr/resolver.hpp"

#include <algorithm>
#include <boost/log/trivial.hpp>
#include <mutex>
#include <optional>

#include "olr/feature_store.hpp"
#include "olr/overlap_detector.hpp"
#include "olr/parallel_for.hpp"
#include "olr/spatial_index.hpp"

namespace olr {

namespace {

// What the processing of one group produced.
struct GroupOutcome {
  ResolutionResult result;
  std::optional<InvalidGeometryError> failure;
  size_t overlaps{0};
  bool trivial{false};
};

// Resolves a group. A trivial group keeps its feature untouched.
auto process_group(const ResolutionEngine &engine, const FeatureStore &store,
                   const OverlapGroup &group) -> GroupOutcome {
  auto outcome = GroupOutcome();
  outcome.overlaps = group.overlaps.size();
  if (group.is_trivial()) {
    outcome.trivial = true;
    outcome.result.group = group.index;
    outcome.result.winner = group.members.front();
    outcome.result.winner_region = store[group.members.front()].geometry;
    return outcome;
  }
  try {
    outcome.result = engine.resolve(group);
  } catch (const InvalidGeometryError &err) {
    BOOST_LOG_TRIVIAL(error) << "Overlap group #" << group.index
                             << " skipped: " << err.what();
    outcome.failure = err;
  }
  return outcome;
}

// Geometry assigned to a feature of the store by the pass.
struct Assignment {
  MultiPolygon geometry;
  bool trimmed{false};
};

// Builds the output feature set from the geometries assigned by the pass.
auto materialize(const FeatureStore &store,
                 std::vector<std::optional<Assignment>> &assigned,
                 bool split_multipart) -> ResolvedFeatureSet {
  auto result = ResolvedFeatureSet();
  result.schema = store.schema();

  auto width = size_t(1);
  for (const auto &name : store.layer_names()) {
    width = std::max(width, name.size());
  }
  result.schema.push_back(Field{kSourceLayerField, FieldType::string,
                                static_cast<int>(std::min<size_t>(width, 254)),
                                0});

  for (size_t ix = 0; ix < store.size(); ++ix) {
    auto &item = assigned[ix];
    if (!item || (item->trimmed && item->geometry.empty())) {
      continue;
    }
    const auto &feature = store[ix];

    auto values = std::vector<AttributeValue>();
    values.reserve(result.schema.size());
    for (size_t jx = 0; jx + 1 < result.schema.size(); ++jx) {
      const auto *value = feature.attributes.get(result.schema[jx].name);
      values.emplace_back(value == nullptr ? AttributeValue() : *value);
    }
    values.emplace_back(store.layer_names()[feature.layer]);

    if (split_multipart && item->geometry.size() > 1) {
      for (auto &polygon : item->geometry) {
        result.features.push_back(ResolvedFeature{
            feature.key, MultiPolygon{std::move(polygon)}, values,
            item->trimmed});
      }
    } else {
      result.features.push_back(ResolvedFeature{
          feature.key, std::move(item->geometry), std::move(values),
          item->trimmed});
    }
  }
  return result;
}

}  // namespace

auto resolve(const std::vector<Layer> &layers, const Config &config,
             ProgressSink *progress) -> ResolveReport {
  config.validate(layers);
  BOOST_LOG_TRIVIAL(info) << "Resolving overlaps of " << layers.size()
                          << " layers by " << to_string(config.mode);

  auto store = FeatureStore(layers, config);
  auto report = ResolveReport();
  report.datetime_warnings = store.datetime_warnings();
  report.failures = store.rejected();

  auto cancelled = [progress]() {
    return progress != nullptr && progress->is_cancelled();
  };

  auto outcomes = std::vector<std::optional<GroupOutcome>>();
  auto interrupted = false;
  try {
    auto index = SpatialIndex(store);
    auto detector = OverlapDetector(store, index, config.area_epsilon);
    auto engine = ResolutionEngine(store, config);

    if (config.threads == 1) {
      while (!(interrupted = cancelled())) {
        auto group = detector.next();
        if (!group) {
          break;
        }
        outcomes.emplace_back(process_group(engine, store, *group));
        if (progress != nullptr) {
          progress->report(detector.visited(), detector.total());
        }
      }
    } else {
      // Detection then resolution each account for half of the progress.
      auto steps = 2 * store.size();
      auto groups = std::vector<OverlapGroup>();
      while (!(interrupted = cancelled())) {
        auto group = detector.next();
        if (!group) {
          break;
        }
        groups.emplace_back(std::move(*group));
        if (progress != nullptr) {
          progress->report(detector.visited(), steps);
        }
      }
      outcomes.resize(groups.size());

      auto mutex = std::mutex();
      auto completed = size_t(0);
      auto worker = [&](const size_t i0, const size_t i1) {
        for (size_t ix = i0; ix < i1; ++ix) {
          if (cancelled()) {
            return;
          }
          outcomes[ix] = process_group(engine, store, groups[ix]);
          std::lock_guard<std::mutex> lock(mutex);
          completed += groups[ix].members.size();
          if (progress != nullptr) {
            progress->report(store.size() + completed, steps);
          }
        }
      };
      parallel_for(worker, groups.size(), config.threads);

      // Only the groups preceding the first unprocessed one are kept, as the
      // sequential pass would have done.
      auto first_missing = std::find_if(outcomes.begin(), outcomes.end(),
                                        [](const auto &item) { return !item; });
      interrupted = interrupted || first_missing != outcomes.end();
      outcomes.erase(first_missing, outcomes.end());
    }
  } catch (const std::exception &err) {
    BOOST_LOG_TRIVIAL(error) << "Resolution failed: " << err.what();
    report.outcome = Outcome::failed;
    report.reason = err.what();
    return report;
  }

  // Groups are folded in emission order whatever the thread that resolved
  // them, so the output does not depend on the number of threads.
  auto assigned = std::vector<std::optional<Assignment>>(store.size());
  auto processed = size_t(0);
  for (auto &outcome : outcomes) {
    if (!outcome) {
      continue;
    }
    processed += 1;
    if (outcome->failure) {
      report.failures.push_back(*outcome->failure);
      continue;
    }
    auto &result = outcome->result;
    assigned[result.winner] = Assignment{result.winner_region, false};
    for (const auto &loser : result.losers) {
      assigned[loser.feature] = Assignment{loser.trimmed, loser.contested};
    }
    if (!outcome->trivial) {
      report.group_count += 1;
      report.overlap_count += outcome->overlaps;
      report.results.push_back(std::move(result));
    }
  }

  if (interrupted) {
    report.outcome = Outcome::cancelled;
    BOOST_LOG_TRIVIAL(warning) << "Resolution cancelled after " << processed
                               << " groups";
  }

  report.features = materialize(store, assigned, config.split_multipart);
  BOOST_LOG_TRIVIAL(info) << "Overlap resolution " << to_string(report.outcome)
                          << ": " << report.group_count << " groups, "
                          << report.overlap_count << " overlaps, "
                          << report.features.features.size()
                          << " output features, " << report.failures.size()
                          << " failures";
  return report;
}

auto detect(const std::vector<Layer> &layers, const Config &config,
            ProgressSink *progress) -> std::vector<OverlapRegion> {
  config.validate(layers);

  auto store = FeatureStore(layers, config);
  auto index = SpatialIndex(store);
  auto detector = OverlapDetector(store, index, config.area_epsilon);

  auto result = std::vector<OverlapRegion>();
  while (progress == nullptr || !progress->is_cancelled()) {
    auto group = detector.next();
    if (!group) {
      break;
    }
    for (auto &item : group->overlaps) {
      result.push_back(OverlapRegion{group->index, store[item.first].key,
                                     store[item.second].key,
                                     std::move(item.region)});
    }
    if (progress != nullptr) {
      progress->report(detector.visited(), detector.total());
    }
  }
  BOOST_LOG_TRIVIAL(info) << "Found " << result.size()
                          << " overlapping feature pairs";
  return result;
}

}  // namespace olr
