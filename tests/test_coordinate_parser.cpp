#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "processing/CoordinateParser.hpp"
#include "processing/DmsFormatter.hpp"

#include <cmath>
#include <string>

using Catch::Matchers::WithinAbs;
using processing::parse_coordinate;

namespace
{

double value_of(const std::string& text)
{
    auto result = parse_coordinate(text);
    INFO("input: " << text);
    REQUIRE(result.succeeded());
    return *result.value;
}

} // namespace

TEST_CASE("parse_coordinate - symbol notation", "[parser]")
{
    REQUIRE_THAT(value_of("35°45'30\"N"), WithinAbs(35.758333, 1e-6));
    REQUIRE_THAT(value_of("82°18'45\"W"), WithinAbs(-82.3125, 1e-6));
    REQUIRE_THAT(value_of("35°45′30″ N"), WithinAbs(35.758333, 1e-6));
}

TEST_CASE("parse_coordinate - hemisphere decides sign", "[parser]")
{
    REQUIRE(value_of("35 45 30 S") < 0.0);
    REQUIRE(value_of("35 45 30 N") > 0.0);
    REQUIRE(value_of("10 E") > 0.0);
    REQUIRE(value_of("10 W") < 0.0);
    REQUIRE(value_of("s 10 20") < 0.0);
}

TEST_CASE("parse_coordinate - omitted fields default to zero", "[parser]")
{
    REQUIRE_THAT(value_of("40 44 N"), WithinAbs(40.0 + 44.0 / 60.0, 1e-6));
    REQUIRE_THAT(value_of("40 N"), WithinAbs(40.0, 1e-9));
}

TEST_CASE("parse_coordinate - plain decimals pass through", "[parser]")
{
    REQUIRE(value_of("40.7486") == 40.7486);
    REQUIRE(value_of("-73.9857") == -73.9857);
    REQUIRE(value_of("  40.7486  ") == 40.7486);
    REQUIRE(value_of("+12.5") == 12.5);
}

TEST_CASE("parse_coordinate - decimal comma is accepted", "[parser]")
{
    REQUIRE_THAT(value_of("40,7486"), WithinAbs(40.7486, 1e-9));
}

TEST_CASE("parse_coordinate - explicit minus without hemisphere negates", "[parser]")
{
    REQUIRE_THAT(value_of("-35 45 30"), WithinAbs(-35.758333, 1e-6));
    REQUIRE_THAT(value_of("-35°45'"), WithinAbs(-35.75, 1e-6));
}

TEST_CASE("parse_coordinate - hemisphere letter wins over minus sign", "[parser]")
{
    REQUIRE_THAT(value_of("-35 45 30 N"), WithinAbs(35.758333, 1e-6));
    REQUIRE_THAT(value_of("-35 45 30 S"), WithinAbs(-35.758333, 1e-6));
}

TEST_CASE("parse_coordinate - dash between numbers is a separator", "[parser]")
{
    REQUIRE_THAT(value_of("35-45-30 N"), WithinAbs(35.758333, 1e-6));
    REQUIRE_THAT(value_of("35-45-30"), WithinAbs(35.758333, 1e-6));
}

TEST_CASE("parse_coordinate - words around the value", "[parser]")
{
    // 'e' inside "Latitude" must not be taken for East
    REQUIRE_THAT(value_of("Latitude 40 44 N"), WithinAbs(40.733333, 1e-6));
    REQUIRE_THAT(value_of("Lat: 12 30 S"), WithinAbs(-12.5, 1e-6));
}

TEST_CASE("parse_coordinate - fractional minutes and seconds", "[parser]")
{
    REQUIRE_THAT(value_of("40°26.767'N"), WithinAbs(40.446117, 1e-6));
    REQUIRE_THAT(value_of("40°26'46.02\"N"), WithinAbs(40.446117, 1e-6));
}

TEST_CASE("parse_coordinate - only first three numbers are used", "[parser]")
{
    REQUIRE_THAT(value_of("10 30 0 99 N"), WithinAbs(10.5, 1e-6));
}

TEST_CASE("parse_coordinate - component results are rounded to six places", "[parser]")
{
    REQUIRE(value_of("35 45 30 N") == processing::round_to_places(35.0 + 45.0 / 60.0 + 30.0 / 3600.0));
}

TEST_CASE("parse_coordinate - no components fails with reason and input", "[parser]")
{
    auto result = parse_coordinate("not a coordinate");
    REQUIRE_FALSE(result.succeeded());
    REQUIRE_FALSE(result.value.has_value());
    REQUIRE(result.error.has_value());
    REQUIRE(result.error->reason == "no coordinate components found");
    REQUIRE(result.error->input == "not a coordinate");
}

TEST_CASE("parse_coordinate - empty and blank input fail", "[parser]")
{
    REQUIRE_FALSE(parse_coordinate("").succeeded());
    REQUIRE_FALSE(parse_coordinate("   ").succeeded());
    REQUIRE(parse_coordinate("").error->reason == processing::kNoComponentsReason);
}

TEST_CASE("parse_coordinate - round trip through DMS text", "[parser][dms]")
{
    const double samples[] = { 0.0, 0.000001, 1.5, 35.758333, 40.7486, 89.999999, 123.456789, 179.999999 };
    for (double x : samples)
    {
        for (auto hemisphere : { coordinates::Hemisphere::North, coordinates::Hemisphere::East })
        {
            const std::string text = processing::format_as_dms(x, hemisphere);
            INFO("formatted: " << text);
            REQUIRE_THAT(value_of(text), WithinAbs(x, 1e-6));
        }
    }
}

TEST_CASE("extract_components - keeps absent fields distinguishable", "[parser]")
{
    auto only_degrees = processing::extract_components("40 N");
    REQUIRE(only_degrees.has_value());
    REQUIRE(only_degrees->degrees == 40.0);
    REQUIRE_FALSE(only_degrees->minutes.has_value());
    REQUIRE_FALSE(only_degrees->seconds.has_value());
    REQUIRE(only_degrees->hemisphere == coordinates::Hemisphere::North);

    auto explicit_zero = processing::extract_components("40 0 0 N");
    REQUIRE(explicit_zero.has_value());
    REQUIRE(explicit_zero->minutes == 0.0);
    REQUIRE(explicit_zero->seconds == 0.0);

    REQUIRE(processing::to_decimal(*only_degrees) == processing::to_decimal(*explicit_zero));
}

TEST_CASE("extract_components - records a leading minus", "[parser]")
{
    auto negative = processing::extract_components("-12 30");
    REQUIRE(negative.has_value());
    REQUIRE(negative->negative);
    REQUIRE_FALSE(negative->hemisphere.has_value());

    auto separator = processing::extract_components("12-30");
    REQUIRE(separator.has_value());
    REQUIRE_FALSE(separator->negative);
}

TEST_CASE("round_to_places - never produces negative zero", "[parser]")
{
    double rounded = processing::round_to_places(-0.0000001);
    REQUIRE(rounded == 0.0);
    REQUIRE_FALSE(std::signbit(rounded));
}

TEST_CASE("round_to_places - values without fractional digits are returned as is", "[parser]")
{
    REQUIRE(processing::round_to_places(1.7e308) == 1.7e308);
    REQUIRE(processing::round_to_places(-1e300) == -1e300);
}

TEST_CASE("parse_coordinate - free-standing hemisphere letter takes precedence over one inside a word", "[parser]")
{
    // The 'e' ending "Latitude" is not East
    REQUIRE_THAT(value_of("Latitude 12 30 S"), WithinAbs(-12.5, 1e-9));
    REQUIRE_THAT(value_of("Longitude 12 30 W"), WithinAbs(-12.5, 1e-9));
    REQUIRE_THAT(value_of("12 30 north of Eden N"), WithinAbs(12.5, 1e-9));
}

TEST_CASE("parse_coordinate - hemisphere letter inside a word is used when none stands alone", "[parser]")
{
    REQUIRE_THAT(value_of("West 12 30"), WithinAbs(-12.5, 1e-9));
    REQUIRE_THAT(value_of("12 30 South"), WithinAbs(-12.5, 1e-9));
}
