#include <catch2/catch_test_macros.hpp>
#include "processing/PairExtractor.hpp"
#include <string>

using processing::extract_pair;

TEST_CASE("extract_pair - hemisphere-terminated tokens", "[extractor]")
{
    auto pair = extract_pair("35°45'30\"N 82°18'45\"W");
    REQUIRE(pair.has_value());
    REQUIRE(pair->latitude == "35°45'30\"N");
    REQUIRE(pair->longitude == "82°18'45\"W");
}

TEST_CASE("extract_pair - tokens after normalization", "[extractor]")
{
    auto pair = extract_pair("  35°45′30″N,   82°18′45″W ");
    REQUIRE(pair.has_value());
    REQUIRE(pair->latitude == "35°45'30\"N");
    REQUIRE(pair->longitude == "82°18'45\"W");
}

TEST_CASE("extract_pair - spaced components stay inside one token", "[extractor]")
{
    auto pair = extract_pair("40 26 46 N 79 58 56 W");
    REQUIRE(pair.has_value());
    REQUIRE(pair->latitude == "40 26 46 N");
    REQUIRE(pair->longitude == "79 58 56 W");
}

TEST_CASE("extract_pair - more than two tokens keeps the first two", "[extractor]")
{
    auto pair = extract_pair("10 N 20 E 30 S");
    REQUIRE(pair.has_value());
    REQUIRE(pair->latitude == "10 N");
    REQUIRE(pair->longitude == "20 E");
}

TEST_CASE("extract_pair - delimiter fallback", "[extractor]")
{
    auto comma = extract_pair("35.758, -82.3");
    REQUIRE(comma.has_value());
    REQUIRE(comma->latitude == "35.758");
    REQUIRE(comma->longitude == "-82.3");

    auto semicolon = extract_pair("35.758;-82.3");
    REQUIRE(semicolon.has_value());
    REQUIRE(semicolon->latitude == "35.758");
    REQUIRE(semicolon->longitude == "-82.3");

    auto slash = extract_pair("35.758 / -82.3");
    REQUIRE(slash.has_value());
    REQUIRE(slash->latitude == "35.758");
    REQUIRE(slash->longitude == "-82.3");
}

TEST_CASE("extract_pair - absent when no pair is found", "[extractor]")
{
    REQUIRE_FALSE(extract_pair("").has_value());
    REQUIRE_FALSE(extract_pair("   ").has_value());
    REQUIRE_FALSE(extract_pair("35.758").has_value());
    REQUIRE_FALSE(extract_pair("1, 2, 3").has_value());
    REQUIRE_FALSE(extract_pair("35°45'30\"N").has_value());
}

TEST_CASE("PairExtractor - splitDelimited drops empty pieces", "[extractor]")
{
    processing::PairExtractor extractor;
    auto pieces = extractor.splitDelimited("a, ,b");
    REQUIRE(pieces.size() == 2);
    REQUIRE(pieces[0] == "a");
    REQUIRE(pieces[1] == "b");
}
