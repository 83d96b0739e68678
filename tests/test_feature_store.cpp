#include <catch2/catch.hpp>
#include <limits>

#include "olr/datetime.hpp"
#include "olr/error.hpp"
#include "olr/feature_store.hpp"
#include "test_utils.hpp"

using namespace olr;

TEST_CASE("FeatureStore keeps layer then feature order", "[feature_store]") {
  auto layers = std::vector<Layer>{
      test::layer("b", {test::dated("2", make_box(0, 0, 1, 1), "2020-01-01"),
                        test::dated("1", make_box(2, 0, 3, 1), "2020-01-02")}),
      test::layer("a", {test::dated("1", make_box(4, 0, 5, 1), "2020-01-03")})};
  auto store = FeatureStore(layers, test::datetime_config(layers));

  REQUIRE(store.size() == 3);
  CHECK(store[0].key == FeatureKey{"b", "2"});
  CHECK(store[1].key == FeatureKey{"b", "1"});
  CHECK(store[2].key == FeatureKey{"a", "1"});
  CHECK(store[2].layer == 1);
  CHECK(store.layer_names() == std::vector<std::string>{"b", "a"});
  CHECK(store.find(FeatureKey{"a", "1"}) == 2);
  CHECK_FALSE(store.find(FeatureKey{"a", "2"}));
  CHECK(store.datetime_warnings().empty());
  CHECK(store[0].resolution_key.timestamp == 1577836800);
  CHECK(*store[1].resolution_key.timestamp - 86400 == 1577836800);
}

TEST_CASE("FeatureStore rejects duplicate ids", "[feature_store]") {
  auto layers = std::vector<Layer>{test::layer(
      "a", {test::plain("1", make_box(0, 0, 1, 1)),
            test::plain("1", make_box(2, 0, 3, 1))})};
  CHECK_THROWS_AS(FeatureStore(layers, test::priority_config({"a"})),
                  ConfigurationError);
}

TEST_CASE("FeatureStore accepts the same id in two layers",
          "[feature_store]") {
  auto layers = std::vector<Layer>{
      test::layer("a", {test::plain("1", make_box(0, 0, 1, 1))}),
      test::layer("b", {test::plain("1", make_box(0, 0, 1, 1))})};
  auto store = FeatureStore(layers, test::priority_config({"b", "a"}));
  REQUIRE(store.size() == 2);
  CHECK(store[0].resolution_key.priority == 1);
  CHECK(store[1].resolution_key.priority == 0);
}

TEST_CASE("FeatureStore repairs invalid geometries", "[feature_store]") {
  auto broken = make_box(0, 0, 10, 10);
  broken.push_back(make_box(5, 0, 15, 10).front());
  auto layers = std::vector<Layer>{
      test::layer("a", {test::plain("1", broken),
                        test::plain("2", make_box(20, 0, 30, 10))})};
  auto store = FeatureStore(layers, test::priority_config({"a"}));

  REQUIRE(store.size() == 2);
  CHECK(store.rejected().empty());
  CHECK(area(store[0].geometry) == Approx(150.0));
  CHECK(bg::equals(store[1].geometry, layers[0].features[1].geometry));
  CHECK(store[1].attributes == layers[0].features[1].attributes);
}

TEST_CASE("FeatureStore rejects unrepairable geometries", "[feature_store]") {
  auto broken = make_box(20, 0, 30, 10);
  bg::set<0>(broken.front().outer()[1],
             std::numeric_limits<double>::quiet_NaN());
  auto layers = std::vector<Layer>{
      test::layer("a", {test::plain("1", make_box(0, 0, 10, 10)),
                        test::plain("2", broken),
                        test::plain("3", make_box(40, 0, 50, 10))})};
  auto store = FeatureStore(layers, test::priority_config({"a"}));

  REQUIRE(store.size() == 2);
  CHECK(store[0].key == FeatureKey{"a", "1"});
  CHECK(store[1].key == FeatureKey{"a", "3"});
  CHECK_FALSE(store.find(FeatureKey{"a", "2"}));
  REQUIRE(store.rejected().size() == 1);
  CHECK(store.rejected()[0].key() == FeatureKey{"a", "2"});
  CHECK(store.rejected()[0].group() == InvalidGeometryError::kNoGroup);
}

TEST_CASE("FeatureStore records unparseable datetimes", "[feature_store]") {
  auto layers = std::vector<Layer>{test::layer(
      "a", {test::dated("1", make_box(0, 0, 1, 1), "2020-01-01"),
            test::dated("2", make_box(0, 0, 1, 1), "2020-01-02"),
            test::dated("3", make_box(0, 0, 1, 1), "2020-01-03"),
            test::dated("4", make_box(0, 0, 1, 1), "soon"),
            test::plain("5", make_box(0, 0, 1, 1))})};
  auto store = FeatureStore(layers, test::datetime_config(layers));

  REQUIRE(store.size() == 5);
  REQUIRE(store.datetime_warnings().size() == 2);
  CHECK(store.datetime_warnings()[0].key() == FeatureKey{"a", "4"});
  CHECK(store.datetime_warnings()[0].value() == "soon");
  CHECK(store.datetime_warnings()[1].key() == FeatureKey{"a", "5"});
  CHECK(store.datetime_warnings()[1].field() == "date");
  CHECK_FALSE(store[3].resolution_key.timestamp);
  CHECK(store[2].resolution_key.timestamp);
}

TEST_CASE("FeatureStore uses the configured datetime format",
          "[feature_store]") {
  // 01/02/2020 is January 2nd with the detected US format.
  auto layers = std::vector<Layer>{
      test::layer("a", {test::dated("1", make_box(0, 0, 1, 1), "01/02/2020")})};
  auto config = test::datetime_config(layers);
  config.datetime_formats["a"] = "%d/%m/%Y";
  auto store = FeatureStore(layers, config);
  CHECK(store[0].resolution_key.timestamp ==
        parse_datetime("2020-02-01", "%Y-%m-%d"));
}

TEST_CASE("union_schema", "[feature_store]") {
  auto layers = std::vector<Layer>{
      Layer{"a",
            Schema{Field{"name", FieldType::string, 10, 0},
                   Field{"code", FieldType::integer, 5, 0}},
            {}},
      Layer{"b",
            Schema{Field{"name", FieldType::string, 40, 0},
                   Field{"code", FieldType::real, 12, 3},
                   Field{"area", FieldType::real, 19, 8}},
            {}}};
  auto schema = union_schema(layers);
  REQUIRE(schema.size() == 3);
  CHECK(schema[0] == Field{"name", FieldType::string, 40, 0});
  CHECK(schema[1] == Field{"code", FieldType::string, 254, 0});
  CHECK(schema[2] == Field{"area", FieldType::real, 19, 8});
}
