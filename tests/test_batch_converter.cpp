#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "processing/BatchConverter.hpp"

#include <cmath>
#include <string>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;
using coordinates::ColumnSelection;
using coordinates::Row;

TEST_CASE("convert_rows - one bad row does not stop the batch", "[batch]")
{
    std::vector<Row> rows = {
        { { "lat", "35°45'30\"N" }, { "lon", "82°18'45\"W" } },
        { { "lat", "garbage" }, { "lon", "82°18'45\"W" } },
        { { "lat", "40.7486" }, { "lon", "-73.9857" } },
    };

    auto report = processing::convert_rows(rows, ColumnSelection::separate("lat", "lon"));

    REQUIRE(report.rows.size() == 2);
    REQUIRE(report.errors.size() == 1);
    REQUIRE(report.skipped == 0);

    REQUIRE(report.rows[0].row_number == 1);
    REQUIRE_THAT(report.rows[0].latitude, WithinAbs(35.758333, 1e-6));
    REQUIRE_THAT(report.rows[0].longitude, WithinAbs(-82.3125, 1e-6));
    REQUIRE(report.rows[0].original_latitude == "35°45'30\"N");

    REQUIRE(report.rows[1].row_number == 3);
    REQUIRE_THAT(report.rows[1].latitude, WithinAbs(40.7486, 1e-9));
    REQUIRE_THAT(report.rows[1].longitude, WithinAbs(-73.9857, 1e-9));

    const auto& error = report.errors[0];
    REQUIRE(error.row_number == 2);
    REQUIRE(error.original_latitude == "garbage");
    REQUIRE(error.reason == "latitude: no coordinate components found");
}

TEST_CASE("convert_rows - both fields failing are reported together", "[batch]")
{
    std::vector<Row> rows = { { { "lat", "x" }, { "lon", "y" } } };
    auto report = processing::convert_rows(rows, ColumnSelection::separate("lat", "lon"));

    REQUIRE(report.rows.empty());
    REQUIRE(report.errors.size() == 1);
    REQUIRE(report.errors[0].reason ==
            "latitude: no coordinate components found; longitude: no coordinate components found");
}

TEST_CASE("convert_rows - empty cell is a row error", "[batch]")
{
    std::vector<Row> rows = { { { "lat", "" }, { "lon", "10 E" } } };
    auto report = processing::convert_rows(rows, ColumnSelection::separate("lat", "lon"));

    REQUIRE(report.rows.empty());
    REQUIRE(report.errors.size() == 1);
    REQUIRE(report.errors[0].row_number == 1);
}

TEST_CASE("convert_rows - missing column is a row error", "[batch]")
{
    std::vector<Row> rows = {
        { { "lat", "10 N" }, { "lon", "20 E" } },
        { { "lat", "10 N" } },
    };
    auto report = processing::convert_rows(rows, ColumnSelection::separate("lat", "lon"));

    REQUIRE(report.rows.size() == 1);
    REQUIRE(report.errors.size() == 1);
    REQUIRE(report.errors[0].row_number == 2);
    REQUIRE(report.errors[0].reason == "column 'lon' not found");
}

TEST_CASE("convert_rows - combined column goes through pair extraction", "[batch]")
{
    std::vector<Row> rows = {
        { { "coords", "35°45'30\"N 82°18'45\"W" } },
        { { "coords", "no pair here" } },
        { { "coords", "12.5, -7.25" } },
    };
    auto report = processing::convert_rows(rows, ColumnSelection::combined("coords"));

    REQUIRE(report.rows.size() == 2);
    REQUIRE(report.errors.empty());
    REQUIRE(report.skipped == 1);
    REQUIRE(report.rows[0].row_number == 1);
    REQUIRE(report.rows[1].row_number == 3);
    REQUIRE_THAT(report.rows[1].latitude, WithinAbs(12.5, 1e-9));
    REQUIRE_THAT(report.rows[1].longitude, WithinAbs(-7.25, 1e-9));
}

TEST_CASE("convert_rows - empty input gives an empty report", "[batch]")
{
    auto report = processing::convert_rows({}, ColumnSelection::separate("lat", "lon"));
    REQUIRE(report.rows.empty());
    REQUIRE(report.errors.empty());
    REQUIRE(report.skipped == 0);
}

TEST_CASE("convert_pairs - numbers rows from one", "[batch]")
{
    std::vector<coordinates::CoordinatePair> pairs = {
        { "10 N", "20 W" },
        { "bad", "20 W" },
    };
    auto report = processing::convert_pairs(pairs);

    REQUIRE(report.rows.size() == 1);
    REQUIRE(report.rows[0].row_number == 1);
    REQUIRE_THAT(report.rows[0].longitude, WithinAbs(-20.0, 1e-9));
    REQUIRE(report.errors.size() == 1);
    REQUIRE(report.errors[0].row_number == 2);
}

TEST_CASE("convert_text - line numbers and skipped lines", "[batch]")
{
    const std::string text = "Survey points\n"
                             "\n"
                             "35°45'30\"N 82°18'45\"W\r\n"
                             "40.7486, -73.9857\n"
                             "nothing useful\n";
    auto report = processing::convert_text(text);

    REQUIRE(report.rows.size() == 2);
    REQUIRE(report.errors.empty());
    // Header and "nothing useful"; the blank line is not counted
    REQUIRE(report.skipped == 2);
    REQUIRE(report.rows[0].row_number == 3);
    REQUIRE(report.rows[1].row_number == 4);
}

TEST_CASE("ConversionError - message names row, originals and reason", "[batch]")
{
    coordinates::ConversionError error{ 7, "abc", "10 E", "latitude: no coordinate components found" };
    REQUIRE(error.message() == "Row 7: Could not process (abc, 10 E). Error: latitude: no coordinate components found");
    REQUIRE_THAT(error.message(), ContainsSubstring("Row 7"));
}

TEST_CASE("convert_pairs - huge decimal values survive rounding", "[batch]")
{
    std::vector<coordinates::CoordinatePair> pairs = { { "1.7e308", "10 E" } };
    auto report = processing::convert_pairs(pairs);

    REQUIRE(report.errors.empty());
    REQUIRE(report.rows.size() == 1);
    REQUIRE(std::isfinite(report.rows[0].latitude));
    REQUIRE(report.rows[0].latitude == 1.7e308);
    REQUIRE_THAT(report.rows[0].longitude, WithinAbs(10.0, 1e-9));
}
