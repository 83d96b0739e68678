#pragma once

#include <string>
#include <vector>

#include "olr/feature.hpp"
#include "olr/resolver.hpp"

namespace olr {

/// @brief Loads a polygon shapefile and its attribute table.
///
/// Rings are classified by orientation: clockwise rings are outer
/// boundaries, counter-clockwise rings are holes of the outer ring containing
/// them. Feature ids are the record numbers. Null shapes give features with an
/// empty geometry.
///
/// @param[in] filename The path of the .shp file.
/// @param[in] name The name of the layer. If empty, the file stem is used.
/// @return The layer.
/// @throw std::runtime_error if the file cannot be read or does not hold
/// polygons.
auto load_layer(const std::string &filename, const std::string &name = {})
    -> Layer;

/// @brief Saves a resolved feature set as a polygon shapefile.
///
/// @param[in] filename The path of the .shp file to create.
/// @param[in] features The features to write, with their schema.
/// @throw std::runtime_error if the file cannot be written.
auto save_features(const std::string &filename,
                   const ResolvedFeatureSet &features) -> void;

/// @brief Saves overlap regions as a polygon shapefile with the group index
/// and the identities of the two overlapping features.
auto save_overlaps(const std::string &filename,
                   const std::vector<OverlapRegion> &overlaps) -> void;

}  // namespace olr
