#pragma once

#include <optional>
#include <string>

#include "olr/feature.hpp"
#include "olr/geometry.hpp"

namespace olr {

/// @brief Checks the OGC validity of a geometry.
/// @return std::nullopt if the geometry is valid, otherwise the reason why it
/// is not. A NaN or infinite coordinate makes the geometry invalid.
auto invalidity_reason(const MultiPolygon &geometry)
    -> std::optional<std::string>;

/// @brief Cleans a geometry in place without changing its shape: removes
/// duplicate points and spikes, closes and orients rings, and drops the parts
/// and holes whose area is below area_epsilon.
auto normalize(MultiPolygon &geometry, double area_epsilon) -> void;

/// @brief Turns a geometry into a valid one.
///
/// Duplicate points are removed and rings are closed and oriented. A geometry
/// that is then valid is normalized and returned. Otherwise its rings are
/// split into simple loops at their self-intersections and dissolved (union
/// of the outer loops minus the union of the hole loops); if that fails it
/// goes through a buffer round trip of negligible width. Slivers are only
/// filtered out once a candidate is valid, so a bowtie keeps both of its
/// lobes.
///
/// The function is idempotent: repairing a repaired geometry returns it
/// unchanged.
///
/// @param[in] geometry The geometry to repair.
/// @param[in] area_epsilon Parts smaller than this area are slivers.
/// @param[in] key Identity of the feature owning the geometry, used to report
/// errors.
/// @return The repaired geometry, possibly empty if it was only slivers.
/// @throw InvalidGeometryError if a coordinate is not finite, or if no attempt
/// produced a valid geometry keeping the area of the input.
auto repair(const MultiPolygon &geometry, double area_epsilon,
            const FeatureKey &key = {}) -> MultiPolygon;

}  // namespace olr
