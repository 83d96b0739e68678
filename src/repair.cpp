#include "olr/repair.hpp"

#include <algorithm>
#include <boost/geometry/algorithms/remove_spikes.hpp>
#include <boost/log/trivial.hpp>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <map>
#include <utility>
#include <vector>

#include "olr/error.hpp"

namespace olr {

// Checks that every coordinate of the geometry is a finite number.
static auto has_finite_coordinates(const MultiPolygon &geometry) -> bool {
  auto finite = [](const Ring &ring) {
    return std::all_of(ring.begin(), ring.end(), [](const Point &point) {
      return std::isfinite(point.get<0>()) && std::isfinite(point.get<1>());
    });
  };
  return std::all_of(
      geometry.begin(), geometry.end(), [&finite](const Polygon &polygon) {
        return finite(polygon.outer()) &&
               std::all_of(polygon.inners().begin(), polygon.inners().end(),
                           finite);
      });
}

auto invalidity_reason(const MultiPolygon &geometry)
    -> std::optional<std::string> {
  if (!has_finite_coordinates(geometry)) {
    return "Geometry has a non-finite coordinate";
  }
  auto message = std::string();
  if (bg::is_valid(geometry, message)) {
    return std::nullopt;
  }
  return message;
}

// A ring is degenerate if it cannot enclose an area above the epsilon.
inline auto is_degenerate(const Ring &ring, double area_epsilon) -> bool {
  return ring.size() < 4 || std::fabs(bg::area(ring)) < area_epsilon;
}

auto normalize(MultiPolygon &geometry, double area_epsilon) -> void {
  bg::unique(geometry);
  bg::remove_spikes(geometry);
  bg::unique(geometry);
  bg::correct(geometry);

  for (auto &polygon : geometry) {
    auto &inners = polygon.inners();
    inners.erase(std::remove_if(inners.begin(), inners.end(),
                                [area_epsilon](const Ring &ring) {
                                  return is_degenerate(ring, area_epsilon);
                                }),
                 inners.end());
  }
  geometry.erase(std::remove_if(geometry.begin(), geometry.end(),
                                [area_epsilon](const Polygon &polygon) {
                                  return is_degenerate(polygon.outer(),
                                                       area_epsilon);
                                }),
                 geometry.end());
}

static auto same_point(const Point &lhs, const Point &rhs) -> bool {
  return lhs.get<0>() == rhs.get<0>() && lhs.get<1>() == rhs.get<1>();
}

static auto cross(double ax, double ay, double bx, double by) -> double {
  return ax * by - ay * bx;
}

// Vertices of the ring, without the closing point, with the points where two
// non-adjacent edges cross inserted as new vertices.
static auto node_ring(const Ring &ring) -> std::vector<Point> {
  constexpr double kTolerance = 1e-12;

  auto vertices = std::vector<Point>(ring.begin(), ring.end());
  if (vertices.size() > 1 && same_point(vertices.front(), vertices.back())) {
    vertices.pop_back();
  }
  auto size = vertices.size();
  if (size < 3) {
    return vertices;
  }

  // Crossings found on each edge, with their position along the edge.
  auto crossings = std::vector<std::vector<std::pair<double, Point>>>(size);
  for (size_t ix = 0; ix < size; ++ix) {
    const auto &a0 = vertices[ix];
    const auto &a1 = vertices[(ix + 1) % size];
    for (size_t jx = ix + 2; jx < size; ++jx) {
      if (ix == 0 && jx == size - 1) {
        continue;
      }
      const auto &b0 = vertices[jx];
      const auto &b1 = vertices[(jx + 1) % size];

      auto dax = a1.get<0>() - a0.get<0>();
      auto day = a1.get<1>() - a0.get<1>();
      auto dbx = b1.get<0>() - b0.get<0>();
      auto dby = b1.get<1>() - b0.get<1>();
      auto denominator = cross(dax, day, dbx, dby);
      // Parallel edges: collinear overlaps are left to the buffer attempt.
      if (denominator == 0) {
        continue;
      }
      auto ox = b0.get<0>() - a0.get<0>();
      auto oy = b0.get<1>() - a0.get<1>();
      auto t = cross(ox, oy, dbx, dby) / denominator;
      auto u = cross(ox, oy, dax, day) / denominator;
      if (t < -kTolerance || t > 1 + kTolerance || u < -kTolerance ||
          u > 1 + kTolerance) {
        continue;
      }

      // Crossings at an existing vertex reuse its exact coordinates so that
      // the loops can be split on equal points.
      auto point = Point(a0.get<0>() + t * dax, a0.get<1>() + t * day);
      if (t <= kTolerance) {
        point = a0;
      } else if (t >= 1 - kTolerance) {
        point = a1;
      } else if (u <= kTolerance) {
        point = b0;
      } else if (u >= 1 - kTolerance) {
        point = b1;
      }
      if (t > kTolerance && t < 1 - kTolerance) {
        crossings[ix].emplace_back(t, point);
      }
      if (u > kTolerance && u < 1 - kTolerance) {
        crossings[jx].emplace_back(u, point);
      }
    }
  }

  auto result = std::vector<Point>();
  result.reserve(size);
  for (size_t ix = 0; ix < size; ++ix) {
    result.push_back(vertices[ix]);
    auto &items = crossings[ix];
    std::sort(items.begin(), items.end(),
              [](const auto &lhs, const auto &rhs) {
                return lhs.first < rhs.first;
              });
    for (const auto &item : items) {
      result.push_back(item.second);
    }
  }
  return result;
}

// Splits a ring into simple loops at the points it passes through twice.
//
// Each loop becomes a clockwise polygon. Loops whose area is below the
// epsilon are dropped.
static auto split_ring(const Ring &ring, double area_epsilon)
    -> std::vector<Polygon> {
  auto result = std::vector<Polygon>();
  auto emit = [&result, area_epsilon](std::vector<Point>::const_iterator first,
                                      std::vector<Point>::const_iterator last) {
    if (std::distance(first, last) < 3) {
      return;
    }
    auto polygon = Polygon();
    polygon.outer().assign(first, last);
    bg::correct(polygon);
    if (std::fabs(bg::area(polygon)) >= area_epsilon) {
      result.emplace_back(std::move(polygon));
    }
  };

  auto coordinates = [](const Point &point) {
    return std::make_pair(point.get<0>(), point.get<1>());
  };

  auto path = std::vector<Point>();
  auto positions = std::map<std::pair<double, double>, size_t>();
  for (const auto &point : node_ring(ring)) {
    auto it = positions.find(coordinates(point));
    if (it == positions.end()) {
      positions.emplace(coordinates(point), path.size());
      path.push_back(point);
      continue;
    }
    auto start = it->second;
    emit(path.cbegin() + static_cast<std::ptrdiff_t>(start), path.cend());
    for (auto ix = start + 1; ix < path.size(); ++ix) {
      positions.erase(coordinates(path[ix]));
    }
    path.resize(start + 1);
  }
  emit(path.cbegin(), path.cend());
  return result;
}

// Total area enclosed by the outer rings, each lobe of a self-intersecting
// ring counted once.
static auto outline_area(const MultiPolygon &geometry, double area_epsilon)
    -> double {
  auto result = 0.0;
  for (const auto &polygon : geometry) {
    for (const auto &piece : split_ring(polygon.outer(), area_epsilon)) {
      result += bg::area(piece);
    }
  }
  return result;
}

// Rebuilds the geometry from its rings: self-intersecting rings are split
// into simple loops, overlapping parts are merged and holes are cut out of
// the merged outline.
static auto dissolve_rings(const MultiPolygon &geometry, double area_epsilon)
    -> MultiPolygon {
  auto outers = MultiPolygon();
  auto holes = MultiPolygon();
  for (const auto &polygon : geometry) {
    for (auto &piece : split_ring(polygon.outer(), area_epsilon)) {
      outers = union_of(outers, MultiPolygon{std::move(piece)});
    }
    for (const auto &inner : polygon.inners()) {
      for (auto &piece : split_ring(inner, area_epsilon)) {
        holes = union_of(holes, MultiPolygon{std::move(piece)});
      }
    }
  }
  return holes.empty() ? outers : difference(outers, holes);
}

// Grows then shrinks the geometry by a negligible distance, which rebuilds
// its rings from scratch.
static auto buffer_round_trip(const MultiPolygon &geometry,
                              double area_epsilon) -> MultiPolygon {
  auto width = std::sqrt(area_epsilon) * 1e-3;
  auto side = bg::strategy::buffer::side_straight();
  auto join = bg::strategy::buffer::join_miter();
  auto end = bg::strategy::buffer::end_flat();
  auto point = bg::strategy::buffer::point_square();

  auto grown = MultiPolygon();
  bg::buffer(geometry, grown,
             bg::strategy::buffer::distance_symmetric<double>(width), side,
             join, end, point);
  auto result = MultiPolygon();
  bg::buffer(grown, result,
             bg::strategy::buffer::distance_symmetric<double>(-width), side,
             join, end, point);
  return result;
}

auto repair(const MultiPolygon &geometry, double area_epsilon,
            const FeatureKey &key) -> MultiPolygon {
  if (!has_finite_coordinates(geometry)) {
    throw InvalidGeometryError(key, "Geometry has a non-finite coordinate");
  }

  // Slivers are only filtered out of valid geometries: the signed area of a
  // self-intersecting ring does not measure what it encloses.
  auto result = geometry;
  bg::unique(result);
  bg::correct(result);
  auto reason = invalidity_reason(result);
  if (!reason) {
    normalize(result, area_epsilon);
    return result;
  }

  using Attempt = MultiPolygon (*)(const MultiPolygon &, double);
  const Attempt attempts[] = {dissolve_rings, buffer_round_trip};

  for (const auto &attempt : attempts) {
    BOOST_LOG_TRIVIAL(debug) << "Repairing geometry of " << key.str() << ": "
                             << *reason;
    auto candidate = attempt(result, area_epsilon);
    bg::correct(candidate);
    auto candidate_reason = invalidity_reason(candidate);
    if (candidate_reason) {
      reason = std::move(candidate_reason);
      continue;
    }
    normalize(candidate, area_epsilon);
    if (candidate.empty() && outline_area(result, area_epsilon) > area_epsilon) {
      reason = "Repair lost the whole area of the geometry";
      continue;
    }
    return candidate;
  }
  throw InvalidGeometryError(key, *reason);
}

}  // namespace olr
