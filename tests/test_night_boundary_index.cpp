/// @file test_night_boundary_index.cpp
/// @brief Unit tests for meridian::observatory::NightBoundaryIndex.

#include <doctest/doctest.h>

#include "astro/astronomy_kit.hpp"
#include "core/config.hpp"
#include "observatory/night_boundary_index.hpp"
#include "test_fakes.hpp"

#include <cmath>
#include <vector>

using namespace meridian;
using namespace meridian::observatory;

// =================================================================
// Lookup over an explicit table
// =================================================================

TEST_CASE("night_of counts boundaries strictly before the instant")
{
    const NightBoundaryIndex index({10.0, 11.0, 12.0});

    CHECK(index.night_of(9.0) == 0);
    CHECK(index.night_of(10.0) == 0);      // Equal is not "strictly less"
    CHECK(index.night_of(10.5) == 1);
    CHECK(index.night_of(11.0) == 1);
    CHECK(index.night_of(12.5) == 3);
    CHECK(index.night_of(1e9) == 3);
}

TEST_CASE("night_of is consistent around every boundary")
{
    const NightBoundaryIndex index({59854.0, 59855.01, 59856.02, 59857.0});
    constexpr f64 kEps = 1e-6;

    for (std::size_t k = 0; k < index.size(); ++k)
    {
        const f64 b = index.boundaries()[k];
        CHECK(index.night_of(b - kEps) == static_cast<i32>(k));
        CHECK(index.night_of(b + kEps) == static_cast<i32>(k + 1));
    }
}

TEST_CASE("Unsorted boundary lists are sorted on construction")
{
    const NightBoundaryIndex index({3.0, 1.0, 2.0});
    CHECK(index.boundaries() == std::vector<f64>{1.0, 2.0, 3.0});
    CHECK(index.night_of(2.5) == 2);
}

TEST_CASE("Empty table puts everything in night 0")
{
    const NightBoundaryIndex index(std::vector<f64>{});
    CHECK(index.size() == 0);
    CHECK(index.night_of(-1e9) == 0);
    CHECK(index.night_of(1e9) == 0);
}

TEST_CASE("Night index never decreases as time advances")
{
    const NightBoundaryIndex index({1.0, 2.0, 3.0, 4.0, 5.0});
    i32 previous = index.night_of(0.0);
    for (f64 mjd = 0.0; mjd < 6.0; mjd += 0.037)
    {
        const i32 night = index.night_of(mjd);
        CHECK(night >= previous);
        previous = night;
    }
}

// =================================================================
// Building from an ephemeris
// =================================================================

TEST_CASE("build collects one sunset per day and drops those before the start")
{
    const testing::FakeKit kit;
    const auto index = NightBoundaryIndex::build(kit, 60000.0, 1, 0.0);

    REQUIRE(index.has_value());
    REQUIRE(index->size() == 365);
    CHECK(index->boundaries().front() == doctest::Approx(60000.95));
    CHECK(index->boundaries().back() == doctest::Approx(60364.95));

    for (std::size_t k = 1; k < index->size(); ++k)
    {
        CHECK(index->boundaries()[k] - index->boundaries()[k - 1] == doctest::Approx(1.0));
    }

    CHECK(index->night_of(60000.5) == 0);
    CHECK(index->night_of(60001.0) == 1);
}

TEST_CASE("build fails when the ephemeris cannot find a sunset")
{
    testing::FakeKit kit;
    kit.fail_sunsets = true;
    CHECK_FALSE(NightBoundaryIndex::build(kit, 60000.0, 1, 0.0).has_value());
}

TEST_CASE("build with the built-in ephemeris yields roughly daily sunsets")
{
    const core::ObservatoryConfig config;
    const astro::SiteAstronomyKit kit(config.site, config.nside);
    const auto index = NightBoundaryIndex::build(kit, config.mjd_start, 1, 10.0);

    REQUIRE(index.has_value());
    CHECK(index->size() >= 374);
    CHECK(index->size() <= 376);
    CHECK(index->boundaries().front() >= config.mjd_start);

    for (std::size_t k = 1; k < index->size(); ++k)
    {
        const f64 gap = index->boundaries()[k] - index->boundaries()[k - 1];
        CHECK(gap > 0.98);
        CHECK(gap < 1.02);
    }
}
