#include <catch2/catch.hpp>
#include <initializer_list>
#include <limits>
#include <string>

#include "olr/error.hpp"
#include "olr/repair.hpp"

using namespace olr;

namespace {

auto counter_clockwise_square() -> MultiPolygon {
  auto polygon = Polygon();
  bg::append(polygon.outer(), Point(0, 0));
  bg::append(polygon.outer(), Point(10, 0));
  bg::append(polygon.outer(), Point(10, 10));
  bg::append(polygon.outer(), Point(0, 10));
  return MultiPolygon{polygon};
}

}  // namespace

TEST_CASE("repair keeps valid geometries", "[repair]") {
  auto square = make_box(0, 0, 10, 10);
  REQUIRE_FALSE(invalidity_reason(square));
  auto result = repair(square, 1e-6);
  CHECK(bg::equals(result, square));
  CHECK(result.size() == 1);
}

TEST_CASE("repair closes and orients rings", "[repair]") {
  auto geometry = counter_clockwise_square();
  REQUIRE(invalidity_reason(geometry));

  auto result = repair(geometry, 1e-6);
  CHECK_FALSE(invalidity_reason(result));
  CHECK(area(result) == Approx(100.0));
}

TEST_CASE("repair removes duplicate points", "[repair]") {
  auto geometry = make_box(0, 0, 10, 10);
  auto &ring = geometry.front().outer();
  ring.insert(ring.begin() + 1, ring[1]);
  ring.insert(ring.begin() + 3, ring[3]);

  auto result = repair(geometry, 1e-6);
  CHECK_FALSE(invalidity_reason(result));
  CHECK(result.front().outer().size() == 5);
}

TEST_CASE("repair drops slivers", "[repair]") {
  SECTION("tiny hole") {
    auto geometry = make_box(0, 0, 10, 10);
    auto hole = Ring();
    bg::append(hole, Point(5, 5));
    bg::append(hole, Point(5.0001, 5));
    bg::append(hole, Point(5.0001, 5.0001));
    bg::append(hole, Point(5, 5.0001));
    bg::append(hole, Point(5, 5));
    geometry.front().inners().push_back(hole);

    auto result = repair(geometry, 1e-6);
    REQUIRE(result.size() == 1);
    CHECK(result.front().inners().empty());
    CHECK(area(result) == Approx(100.0));
  }
  SECTION("tiny part") {
    auto geometry = make_box(0, 0, 10, 10);
    geometry.push_back(make_box(20, 20, 20.0001, 20.0001).front());

    auto result = repair(geometry, 1e-6);
    CHECK(result.size() == 1);
  }
  SECTION("only slivers") {
    CHECK(repair(make_box(0, 0, 1e-4, 1e-4), 1e-6).empty());
  }
}

TEST_CASE("repair dissolves overlapping parts", "[repair]") {
  auto geometry = make_box(0, 0, 10, 10);
  geometry.push_back(make_box(5, 0, 15, 10).front());
  REQUIRE(invalidity_reason(geometry));

  auto result = repair(geometry, 1e-6, FeatureKey{"a", "1"});
  CHECK_FALSE(invalidity_reason(result));
  CHECK(result.size() == 1);
  CHECK(area(result) == Approx(150.0));
}

TEST_CASE("repair is idempotent", "[repair]") {
  auto geometry = make_box(0, 0, 10, 10);
  geometry.push_back(make_box(5, 5, 15, 15).front());

  auto once = repair(geometry, 1e-6);
  auto twice = repair(once, 1e-6);
  CHECK(bg::equals(once, twice));
  CHECK(area(once) == Approx(area(twice)));
}

TEST_CASE("InvalidGeometryError carries the feature identity", "[repair]") {
  auto err = InvalidGeometryError(FeatureKey{"parcels", "42"}, "spikes", 3);
  CHECK(err.key().str() == "parcels:42");
  CHECK(err.reason() == "spikes");
  CHECK(err.group() == 3);
  CHECK(std::string(err.what()).find("parcels:42") != std::string::npos);
}

TEST_CASE("repair splits self-intersecting rings into lobes", "[repair]") {
  auto ring_of = [](std::initializer_list<Point> points) {
    auto polygon = Polygon();
    for (const auto &point : points) {
      bg::append(polygon.outer(), point);
    }
    return MultiPolygon{polygon};
  };

  SECTION("bowtie") {
    auto geometry = ring_of({Point(0, 0), Point(0, 10), Point(10, 0),
                             Point(10, 10), Point(0, 0)});
    REQUIRE(invalidity_reason(geometry));

    auto result = repair(geometry, 1e-6, FeatureKey{"a", "1"});
    CHECK_FALSE(invalidity_reason(result));
    CHECK(area(result) == Approx(50.0));
  }
  SECTION("figure eight with unequal lobes") {
    auto geometry = ring_of({Point(0, 0), Point(0, 10), Point(10, 0),
                             Point(10, 4), Point(0, 0)});
    REQUIRE(invalidity_reason(geometry));

    auto result = repair(geometry, 1e-6, FeatureKey{"a", "2"});
    CHECK_FALSE(invalidity_reason(result));
    CHECK(area(result) == Approx(290.0 / 7.0));
  }
  SECTION("repairing the result changes nothing") {
    auto geometry = ring_of({Point(0, 0), Point(0, 10), Point(10, 0),
                             Point(10, 10), Point(0, 0)});
    auto once = repair(geometry, 1e-6);
    CHECK(area(repair(once, 1e-6)) == Approx(area(once)));
  }
}

TEST_CASE("repair rejects non-finite coordinates", "[repair]") {
  auto geometry = make_box(0, 0, 10, 10);
  bg::set<0>(geometry.front().outer()[1],
             std::numeric_limits<double>::quiet_NaN());
  CHECK(invalidity_reason(geometry));
  CHECK_THROWS_AS(repair(geometry, 1e-6, FeatureKey{"a", "3"}),
                  InvalidGeometryError);
}
