// Test main file - Catch2 provides main() function
// This file is intentionally minimal as Catch2WithMain handles everything

#include <catch2/catch_test_macros.hpp>

#include "processing/CoordinateParser.hpp"

// Simple smoke test to verify test framework and core library are linked
TEST_CASE("Framework smoke test", "[smoke]") {
    REQUIRE(1 + 1 == 2);
    REQUIRE(processing::parse_coordinate("40 N").succeeded());
}
