#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

#include "olr/feature.hpp"

namespace olr {

/// @brief Base class of the exceptions thrown by the resolver.
class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// @brief Raised when the configuration cannot drive a resolution pass.
///
/// Always thrown before the spatial index is built.
class ConfigurationError : public Error {
 public:
  using Error::Error;
};

/// @brief Raised when a geometry cannot be turned into a valid one.
class InvalidGeometryError : public Error {
 public:
  /// Group index used when the geometry does not belong to a group yet.
  static constexpr size_t kNoGroup = static_cast<size_t>(-1);

  InvalidGeometryError(FeatureKey key, const std::string &reason,
                       size_t group = kNoGroup)
      : Error("invalid geometry for feature " + key.str() + ": " + reason),
        key_(std::move(key)),
        reason_(reason),
        group_(group) {}

  /// Identity of the offending feature.
  [[nodiscard]] auto key() const noexcept -> const FeatureKey & {
    return key_;
  }

  /// Why the repair failed.
  [[nodiscard]] auto reason() const noexcept -> const std::string & {
    return reason_;
  }

  /// Index of the overlap group being processed, or kNoGroup.
  [[nodiscard]] auto group() const noexcept -> size_t { return group_; }

 private:
  FeatureKey key_;
  std::string reason_;
  size_t group_;
};

/// @brief A datetime value that matches none of the accepted formats.
///
/// Not fatal: the feature only loses its winner candidacy. Instances are
/// collected in the report rather than thrown out of a pass.
class UnparseableDatetimeError : public Error {
 public:
  UnparseableDatetimeError(FeatureKey key, std::string field,
                           std::string value)
      : Error("unparseable datetime '" + value + "' in field '" + field +
              "' of feature " + key.str()),
        key_(std::move(key)),
        field_(std::move(field)),
        value_(std::move(value)) {}

  [[nodiscard]] auto key() const noexcept -> const FeatureKey & {
    return key_;
  }
  [[nodiscard]] auto field() const noexcept -> const std::string & {
    return field_;
  }
  [[nodiscard]] auto value() const noexcept -> const std::string & {
    return value_;
  }

 private:
  FeatureKey key_;
  std::string field_;
  std::string value_;
};

}  // namespace olr
