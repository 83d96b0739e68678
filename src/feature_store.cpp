#include "olr/feature_store.hpp"

#include <algorithm>
#include <boost/log/trivial.hpp>
#include <set>

#include "olr/datetime.hpp"
#include "olr/repair.hpp"

namespace olr {

auto union_schema(const std::vector<Layer> &layers) -> Schema {
  auto result = Schema();
  for (const auto &layer : layers) {
    for (const auto &field : layer.schema) {
      auto ix = find_field(result, field.name);
      if (!ix) {
        result.push_back(field);
        continue;
      }
      auto &known = result[*ix];
      if (known.type != field.type) {
        known.type = FieldType::string;
        known.decimals = 0;
        known.width = 254;
      } else {
        known.width = std::max(known.width, field.width);
        known.decimals = std::max(known.decimals, field.decimals);
      }
    }
  }
  return result;
}

FeatureStore::FeatureStore(const std::vector<Layer> &layers,
                           const Config &config)
    : schema_(union_schema(layers)) {
  auto count = size_t(0);
  for (const auto &layer : layers) {
    count += layer.features.size();
  }
  features_.reserve(count);

  for (const auto &layer : layers) {
    add_layer(layer, config);
  }
  BOOST_LOG_TRIVIAL(info) << "Loaded " << features_.size() << " features from "
                          << layers.size() << " layers";
}

// Resolves the format used to parse the datetime field of a layer.
static auto datetime_format(const Layer &layer, const std::string &field,
                            const Config &config)
    -> std::optional<std::string> {
  auto it = config.datetime_formats.find(layer.name);
  if (it != config.datetime_formats.end()) {
    return it->second;
  }
  auto format = detect_datetime_format(sample_values(layer, field));
  if (!format) {
    BOOST_LOG_TRIVIAL(warning)
        << "No common datetime format in field '" << field << "' of layer '"
        << layer.name << "', trying every format on each value";
  }
  return format;
}

auto FeatureStore::add_layer(const Layer &layer, const Config &config)
    -> void {
  auto layer_ix = layer_names_.size();
  layer_names_.push_back(layer.name);

  auto field = std::string();
  auto format = std::optional<std::string>();
  auto rank = std::optional<int>();
  if (config.mode == ResolutionMode::datetime) {
    field = config.datetime_fields.at(layer.name);
    format = datetime_format(layer, field, config);
  } else {
    rank = config.priority_rank(layer.name);
  }

  auto repaired = size_t(0);
  auto ids = std::set<std::string>();
  for (const auto &feature : layer.features) {
    auto key = FeatureKey{layer.name, feature.id};
    if (!ids.insert(feature.id).second) {
      throw ConfigurationError("duplicate feature id '" + feature.id +
                               "' in layer '" + layer.name + "'");
    }

    auto item = StoredFeature{key, layer_ix, feature.geometry,
                              feature.attributes, ResolutionKey{}};

    if (auto reason = invalidity_reason(item.geometry)) {
      try {
        item.geometry = repair(item.geometry, config.area_epsilon, key);
        ++repaired;
        BOOST_LOG_TRIVIAL(debug)
            << "Repaired geometry of " << key.str() << ": " << *reason;
      } catch (const InvalidGeometryError &err) {
        BOOST_LOG_TRIVIAL(error) << err.what();
        rejected_.push_back(err);
        continue;
      }
    }

    if (config.mode == ResolutionMode::datetime) {
      const auto *value = feature.attributes.get(field);
      auto text = value == nullptr ? std::string() : to_string(*value);
      item.resolution_key.timestamp =
          format ? parse_datetime(text, *format) : parse_datetime(text);
      if (!item.resolution_key.timestamp) {
        auto warning = UnparseableDatetimeError(key, field, text);
        BOOST_LOG_TRIVIAL(warning) << warning.what();
        datetime_warnings_.push_back(std::move(warning));
      }
    } else {
      item.resolution_key.priority = rank;
    }

    keys_.emplace(key, features_.size());
    features_.emplace_back(std::move(item));
  }

  if (repaired != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Fixed " << repaired
                               << " invalid geometries in layer '"
                               << layer.name << "'";
  }
}

auto FeatureStore::find(const FeatureKey &key) const -> std::optional<size_t> {
  auto it = keys_.find(key);
  if (it == keys_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace olr
