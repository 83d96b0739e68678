#pragma once

#include <boost/geometry.hpp>
#include <boost/geometry/index/rtree.hpp>

namespace bg = boost::geometry;

namespace olr {

using Point = bg::model::point<double, 2, bg::cs::cartesian>;

using Box = bg::model::box<Point>;

/// Clockwise, closed polygon (the ring convention of ESRI shapefiles).
using Polygon = bg::model::polygon<Point>;

using MultiPolygon = bg::model::multi_polygon<Polygon>;

using Ring = bg::model::ring<Point>;

/// @brief Returns the envelope of a multi-polygon.
inline auto envelope(const MultiPolygon &geometry) -> Box {
  return bg::return_envelope<Box>(geometry);
}

/// @brief Returns the area of a multi-polygon (zero for an empty geometry).
inline auto area(const MultiPolygon &geometry) -> double {
  return geometry.empty() ? 0.0 : bg::area(geometry);
}

/// @brief Computes the intersection of two multi-polygons.
inline auto intersection(const MultiPolygon &lhs, const MultiPolygon &rhs)
    -> MultiPolygon {
  auto result = MultiPolygon();
  bg::intersection(lhs, rhs, result);
  return result;
}

/// @brief Computes the geometric difference lhs - rhs.
inline auto difference(const MultiPolygon &lhs, const MultiPolygon &rhs)
    -> MultiPolygon {
  auto result = MultiPolygon();
  bg::difference(lhs, rhs, result);
  return result;
}

/// @brief Computes the union of two multi-polygons.
inline auto union_of(const MultiPolygon &lhs, const MultiPolygon &rhs)
    -> MultiPolygon {
  auto result = MultiPolygon();
  bg::union_(lhs, rhs, result);
  return result;
}

/// @brief Builds a rectangular polygon, mostly useful for tests and previews.
inline auto make_box(double x0, double y0, double x1, double y1)
    -> MultiPolygon {
  auto polygon = Polygon();
  bg::convert(Box(Point(x0, y0), Point(x1, y1)), polygon);
  return MultiPolygon{polygon};
}

}  // namespace olr
