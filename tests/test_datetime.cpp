#include <catch2/catch.hpp>

#include "olr/datetime.hpp"
#include "test_utils.hpp"

using namespace olr;

TEST_CASE("parse_datetime with an explicit format", "[datetime]") {
  SECTION("ISO date") {
    auto result = parse_datetime("2020-01-01", "%Y-%m-%d");
    REQUIRE(result);
    CHECK(*result == 1577836800);
  }
  SECTION("ISO date and time") {
    auto result = parse_datetime("2021-01-01 12:30:00", "%Y-%m-%d %H:%M:%S");
    REQUIRE(result);
    CHECK(*result == 1609459200 + 12 * 3600 + 30 * 60);
  }
  SECTION("trailing characters are rejected") {
    CHECK_FALSE(parse_datetime("2021-01-01 12:30:00", "%Y-%m-%d"));
    CHECK_FALSE(parse_datetime("2021-01-01 12:30:00", "%Y-%m-%d %H:%M"));
  }
  SECTION("surrounding blanks are ignored") {
    CHECK(parse_datetime("  2020-01-01 ", "%Y-%m-%d") == 1577836800);
  }
  SECTION("empty value") {
    CHECK_FALSE(parse_datetime("", "%Y-%m-%d"));
    CHECK_FALSE(parse_datetime("   ", "%Y-%m-%d"));
  }
}

TEST_CASE("parse_datetime rejects impossible dates", "[datetime]") {
  CHECK_FALSE(parse_datetime("2021-02-30", "%Y-%m-%d"));
  CHECK_FALSE(parse_datetime("2021-02-30"));
  CHECK_FALSE(parse_datetime("2021-13-01", "%Y-%m-%d"));
  CHECK(parse_datetime("2020-02-29", "%Y-%m-%d"));
}

TEST_CASE("parse_datetime with a day of year", "[datetime]") {
  auto result = parse_datetime("2021-032", "%Y-%j");
  REQUIRE(result);
  CHECK(*result == parse_datetime("2021-02-01", "%Y-%m-%d"));
}

TEST_CASE("parse_datetime tries every accepted format", "[datetime]") {
  auto expected = parse_datetime("2021-06-15", "%Y-%m-%d");
  REQUIRE(expected);
  CHECK(parse_datetime("2021-06-15") == expected);
  CHECK(parse_datetime("20210615") == expected);
  CHECK(parse_datetime("2021/06/15") == expected);
  CHECK(parse_datetime("15.06.2021") == expected);
  CHECK(parse_datetime("2021-06-15T00:00:00Z") == expected);
  CHECK_FALSE(parse_datetime("not a date"));
}

TEST_CASE("parse_datetime with ISO-8601 zones and fractions", "[datetime]") {
  auto utc = parse_datetime("2021-06-15 08:00:00", "%Y-%m-%d %H:%M:%S");
  REQUIRE(utc);

  SECTION("UTC offsets are applied") {
    CHECK(parse_datetime("2021-06-15T10:00:00+02:00") == utc);
    CHECK(parse_datetime("2021-06-15T10:00:00+0200") == utc);
    CHECK(parse_datetime("2021-06-15T10:00:00+02") == utc);
    CHECK(parse_datetime("2021-06-15T05:30:00-02:30") == utc);
    CHECK(parse_datetime("2021-06-15T10:00:00+02:00",
                         "%Y-%m-%dT%H:%M:%S UTC") == utc);
  }
  SECTION("fractional seconds are ignored") {
    CHECK(parse_datetime("2021-06-15T08:00:00.123Z") == utc);
    CHECK(parse_datetime("2021-06-15T08:00:00.5") == utc);
    CHECK(parse_datetime("2021-06-15T10:00:00.250+02:00") == utc);
  }
  SECTION("basic format") {
    CHECK(parse_datetime("20210615T080000Z") == utc);
    CHECK(parse_datetime("20210615T080000") == utc);
    CHECK(parse_datetime("20210615T1000+0200") == utc);
  }
  SECTION("dates are not mistaken for offsets or fractions") {
    auto day = parse_datetime("2021-06-15", "%Y-%m-%d");
    REQUIRE(day);
    CHECK(parse_datetime("2021-06-15") == day);
    CHECK(parse_datetime("15.06.2021") == day);
    CHECK(parse_datetime("06-15-2021") == day);
  }
  SECTION("out of range offsets are rejected") {
    CHECK_FALSE(parse_datetime("2021-06-15T10:00:00+25:00"));
  }
}

TEST_CASE("normalize_datetime", "[datetime]") {
  CHECK(normalize_datetime(" 2021-06-15 ") == "2021-06-15");
  CHECK(normalize_datetime("2021-06-15T10:00:00Z") ==
        "2021-06-15T10:00:00 UTC");
  CHECK(normalize_datetime("Z") == "Z");
}

TEST_CASE("detect_datetime_format", "[datetime]") {
  SECTION("common format") {
    auto format = detect_datetime_format(
        {"2020-01-15", "2021-03-04", "2019-12-31", "2018-07-01"});
    REQUIRE(format);
    CHECK(*format == "%Y-%m-%d");
  }
  SECTION("a few bad samples are tolerated") {
    auto format = detect_datetime_format(
        {"2020-01-15", "2021-03-04", "2019-12-31", "2018-07-01", "oops"});
    REQUIRE(format);
    CHECK(*format == "%Y-%m-%d");
  }
  SECTION("too many bad samples") {
    CHECK_FALSE(detect_datetime_format({"2020-01-15", "x", "y"}));
  }
  SECTION("no sample") { CHECK_FALSE(detect_datetime_format({})); }
}

TEST_CASE("detect_datetime_field", "[datetime]") {
  auto layer = Layer{"survey",
                     Schema{Field{"name", FieldType::string, 32, 0},
                            Field{"acquired", FieldType::string, 32, 0},
                            Field{"gps_date", FieldType::string, 32, 0}},
                     {}};
  for (auto ix = 0; ix < 3; ++ix) {
    layer.features.push_back(Feature{
        std::to_string(ix), make_box(ix, 0, ix + 1, 1),
        Attributes{{"name", AttributeValue(std::string("parcel"))},
                   {"acquired", AttributeValue(std::string("2020-01-0") +
                                               std::to_string(ix + 1))},
                   {"gps_date", AttributeValue(std::string("2021/05/1") +
                                               std::to_string(ix))}}});
  }

  SECTION("fields named like a date come first") {
    auto found = detect_datetime_field(layer);
    REQUIRE(found);
    CHECK(found->first == "gps_date");
    CHECK(found->second == "%Y/%m/%d");
  }
  SECTION("other fields are scanned next") {
    layer.schema.pop_back();
    auto found = detect_datetime_field(layer);
    REQUIRE(found);
    CHECK(found->first == "acquired");
    CHECK(found->second == "%Y-%m-%d");
  }
  SECTION("nothing looks like a date") {
    layer.schema.resize(1);
    CHECK_FALSE(detect_datetime_field(layer));
  }
}

TEST_CASE("sample_values skips null and blank values", "[datetime]") {
  auto layer = test::layer(
      "a", {Feature{"1", make_box(0, 0, 1, 1), Attributes{}},
            test::dated("2", make_box(0, 0, 1, 1), "  "),
            test::dated("3", make_box(0, 0, 1, 1), "2020-01-01"),
            Feature{"4", make_box(0, 0, 1, 1),
                    Attributes{{"date", AttributeValue(std::int64_t{20200102})}}}});
  auto samples = sample_values(layer, "date");
  REQUIRE(samples.size() == 2);
  CHECK(samples[0] == "2020-01-01");
  CHECK(samples[1] == "20200102");
  CHECK(sample_values(layer, "date", 1).size() == 1);
}
