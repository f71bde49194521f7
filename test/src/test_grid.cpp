#include "gpsmooth/grid.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

using Catch::Matchers::WithinRel;

TEST_CASE("Evenly spaced range grid includes both ends", "[grid]")
{
    const auto grid = gpsmooth::make_range_grid(10.0, 500.0, 50);
    REQUIRE(grid.size() == 50);
    REQUIRE(grid.front() == 10.0);
    REQUIRE(grid.back() == 500.0);
    REQUIRE_THAT(grid[1], WithinRel(20.0));

    const auto single = gpsmooth::make_range_grid(42.0, 500.0, 1);
    REQUIRE(single.size() == 1);
    REQUIRE(single.front() == 42.0);

    REQUIRE_THROWS_AS(gpsmooth::make_range_grid(10.0, 500.0, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(gpsmooth::make_range_grid(0.0, 500.0, 5), std::invalid_argument);
    REQUIRE_THROWS_AS(gpsmooth::make_range_grid(10.0, 5.0, 5), std::invalid_argument);
}

TEST_CASE("Stepped range grid stops at the upper limit", "[grid]")
{
    const auto grid = gpsmooth::make_range_grid_by_step(10.0, 500.0, 10.0);
    REQUIRE(grid.size() == 50);
    REQUIRE(grid.back() == 500.0);

    const auto partial = gpsmooth::make_range_grid_by_step(10.0, 35.0, 10.0);
    REQUIRE(partial == std::vector<double>{ 10.0, 20.0, 30.0 });

    REQUIRE_THROWS_AS(gpsmooth::make_range_grid_by_step(10.0, 500.0, 0.0), std::invalid_argument);
}

TEST_CASE("Grid validation rejects unordered and non-positive ranges", "[grid]")
{
    REQUIRE_NOTHROW(gpsmooth::validate_grid({ 1.0, 2.0, 3.0 }));
    REQUIRE_THROWS_AS(gpsmooth::validate_grid({}), std::invalid_argument);
    REQUIRE_THROWS_AS(gpsmooth::validate_grid({ 1.0, 1.0 }), std::invalid_argument);
    REQUIRE_THROWS_AS(gpsmooth::validate_grid({ 3.0, 2.0 }), std::invalid_argument);
    REQUIRE_THROWS_AS(gpsmooth::validate_grid({ -1.0, 2.0 }), std::invalid_argument);
    REQUIRE_THROWS_AS(gpsmooth::validate_grid({ 1.0, std::nan("") }), std::invalid_argument);
}
