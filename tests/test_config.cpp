#include <catch2/catch.hpp>
#include <limits>

#include "olr/config.hpp"
#include "olr/error.hpp"
#include "test_utils.hpp"

using namespace olr;

TEST_CASE("parse_resolution_mode", "[config]") {
  CHECK(parse_resolution_mode("datetime") == ResolutionMode::datetime);
  CHECK(parse_resolution_mode("priority") == ResolutionMode::priority);
  CHECK_THROWS_AS(parse_resolution_mode("newest"), ConfigurationError);
  CHECK(to_string(ResolutionMode::priority) == "priority");
}

TEST_CASE("Config::validate in datetime mode", "[config]") {
  auto layers = std::vector<Layer>{
      test::layer("a", {test::plain("1", make_box(0, 0, 1, 1))}),
      test::layer("b", {test::plain("1", make_box(0, 0, 1, 1))})};
  auto config = test::datetime_config(layers);

  SECTION("valid") { CHECK_NOTHROW(config.validate(layers)); }
  SECTION("no layer") {
    CHECK_THROWS_AS(config.validate({}), ConfigurationError);
  }
  SECTION("missing mapping") {
    config.datetime_fields.erase("b");
    CHECK_THROWS_AS(config.validate(layers), ConfigurationError);
  }
  SECTION("unknown field") {
    config.datetime_fields["b"] = "acquired";
    CHECK_THROWS_AS(config.validate(layers), ConfigurationError);
  }
  SECTION("duplicate layer name") {
    layers[1].name = "a";
    CHECK_THROWS_AS(config.validate(layers), ConfigurationError);
  }
  SECTION("unnamed layer") {
    layers[1].name.clear();
    CHECK_THROWS_AS(config.validate(layers), ConfigurationError);
  }
  SECTION("bad epsilon") {
    config.area_epsilon = 0;
    CHECK_THROWS_AS(config.validate(layers), ConfigurationError);
    config.area_epsilon = -1;
    CHECK_THROWS_AS(config.validate(layers), ConfigurationError);
    config.area_epsilon = std::numeric_limits<double>::quiet_NaN();
    CHECK_THROWS_AS(config.validate(layers), ConfigurationError);
  }
}

TEST_CASE("Config::validate in priority mode", "[config]") {
  auto layers = std::vector<Layer>{
      test::layer("a", {test::plain("1", make_box(0, 0, 1, 1))}),
      test::layer("b", {test::plain("1", make_box(0, 0, 1, 1))})};

  SECTION("valid") {
    CHECK_NOTHROW(test::priority_config({"b", "a"}).validate(layers));
  }
  SECTION("unknown layers are tolerated") {
    CHECK_NOTHROW(test::priority_config({"b", "c", "a"}).validate(layers));
  }
  SECTION("empty order") {
    CHECK_THROWS_AS(test::priority_config({}).validate(layers),
                    ConfigurationError);
  }
  SECTION("missing layer") {
    CHECK_THROWS_AS(test::priority_config({"a"}).validate(layers),
                    ConfigurationError);
  }
  SECTION("layer ranked twice") {
    CHECK_THROWS_AS(test::priority_config({"a", "b", "a"}).validate(layers),
                    ConfigurationError);
  }
}

TEST_CASE("Config::priority_rank", "[config]") {
  auto config = test::priority_config({"roads", "parcels", "buildings"});
  CHECK(config.priority_rank("roads") == 0);
  CHECK(config.priority_rank("buildings") == 2);
  CHECK_FALSE(config.priority_rank("water"));
}
