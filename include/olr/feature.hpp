#pragma once

#include <cstdint>
#include <ctime>
#include <initializer_list>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include "olr/geometry.hpp"

namespace olr {

/// @brief Value of an attribute: null, integer, real or string.
using AttributeValue =
    std::variant<std::monostate, std::int64_t, double, std::string>;

/// @brief Returns true if the value is null.
inline auto is_null(const AttributeValue &value) noexcept -> bool {
  return std::holds_alternative<std::monostate>(value);
}

/// @brief Formats an attribute value as text. Null gives an empty string,
/// integral reals are written without a fractional part.
auto to_string(const AttributeValue &value) -> std::string;

/// @brief Storage type of an attribute field (the DBF field types).
enum class FieldType { integer, real, string, logical, date };

/// @brief Declaration of an attribute field.
struct Field {
  std::string name;
  FieldType type{FieldType::string};
  int width{254};
  int decimals{0};

  auto operator==(const Field &other) const -> bool {
    return name == other.name && type == other.type && width == other.width &&
           decimals == other.decimals;
  }
};

/// @brief Ordered list of fields.
using Schema = std::vector<Field>;

/// @brief Searches a field by name.
/// @return The position of the field, or std::nullopt.
auto find_field(const Schema &schema, const std::string &name)
    -> std::optional<size_t>;

/// @brief Mapping from field name to value that keeps insertion order.
class Attributes {
 public:
  using value_type = std::pair<std::string, AttributeValue>;
  using const_iterator = std::vector<value_type>::const_iterator;

  Attributes() = default;
  Attributes(std::initializer_list<value_type> items) {
    for (const auto &item : items) {
      set(item.first, item.second);
    }
  }

  /// @brief Sets a value, appending the field if it is not present yet.
  auto set(const std::string &name, AttributeValue value) -> void;

  /// @brief Gets a value.
  /// @return A pointer to the value, or nullptr if the field is absent.
  [[nodiscard]] auto get(const std::string &name) const
      -> const AttributeValue *;

  [[nodiscard]] auto contains(const std::string &name) const -> bool {
    return get(name) != nullptr;
  }

  [[nodiscard]] auto size() const noexcept -> size_t { return items_.size(); }
  [[nodiscard]] auto empty() const noexcept -> bool { return items_.empty(); }
  [[nodiscard]] auto begin() const noexcept -> const_iterator {
    return items_.begin();
  }
  [[nodiscard]] auto end() const noexcept -> const_iterator {
    return items_.end();
  }

  auto operator==(const Attributes &other) const -> bool {
    return items_ == other.items_;
  }

 private:
  std::vector<value_type> items_;
};

/// @brief Global identity of a feature: ids are unique within a layer only.
struct FeatureKey {
  std::string layer;
  std::string id;

  [[nodiscard]] auto str() const -> std::string { return layer + ":" + id; }

  auto operator==(const FeatureKey &other) const -> bool {
    return layer == other.layer && id == other.id;
  }
  auto operator!=(const FeatureKey &other) const -> bool {
    return !(*this == other);
  }
  /// Lexicographic order on (layer, id), used for every tie-break.
  auto operator<(const FeatureKey &other) const -> bool {
    return std::tie(layer, id) < std::tie(other.layer, other.id);
  }
};

/// @brief A feature as supplied by the caller.
struct Feature {
  std::string id;
  MultiPolygon geometry;
  Attributes attributes;
};

/// @brief A named collection of features sharing one schema.
struct Layer {
  std::string name;
  Schema schema;
  std::vector<Feature> features;
};

/// @brief Value used to rank the features of an overlap group.
///
/// Only one of the members is set, depending on the resolution mode. A
/// missing timestamp means the datetime value was absent or unparseable.
struct ResolutionKey {
  std::optional<std::time_t> timestamp;
  std::optional<int> priority;
};

}  // namespace olr
