/// @file test_observatory_state.cpp
/// @brief Unit tests for meridian::observatory::ObservatoryState.

#include <doctest/doctest.h>

#include "observatory/night_boundary_index.hpp"
#include "observatory/observatory_state.hpp"

using namespace meridian;
using namespace meridian::observatory;

namespace
{
    const NightBoundaryIndex& nights()
    {
        static const NightBoundaryIndex index({100.9, 101.9, 102.9});
        return index;
    }
} // namespace

TEST_CASE("New state is parked with the night matching the clock")
{
    const ObservatoryState state(101.5, nights());

    CHECK(state.mjd() == 101.5);
    CHECK(state.night() == 1);
    CHECK(state.is_parked());
    CHECK_FALSE(state.filter().has_value());
    CHECK_FALSE(state.snapshot().has_value());
    CHECK_FALSE(state.has_ever_pointed());
}

TEST_CASE("advance_to keeps the night index in step with the clock")
{
    ObservatoryState state(100.0, nights());
    CHECK(state.night() == 0);

    state.advance_to(101.95);
    CHECK(state.mjd() == 101.95);
    CHECK(state.night() == 2);

    state.advance_to(200.0);
    CHECK(state.night() == 3);
}

TEST_CASE("point_at sets pointing and filter and marks the first visit")
{
    ObservatoryState state(101.5, nights());
    state.point_at(astro::EquatorialCoord{.ra = 1.0, .dec = -0.5}, Filter::R);

    CHECK_FALSE(state.is_parked());
    REQUIRE(state.pointing().has_value());
    CHECK(state.pointing()->ra == 1.0);
    CHECK(state.pointing()->dec == -0.5);
    CHECK(state.filter() == Filter::R);
    CHECK(state.has_ever_pointed());
}

TEST_CASE("Leaving the parked state drops the cached status")
{
    ObservatoryState state(101.5, nights());
    state.set_snapshot(StatusSnapshot{.mjd = 101.5});
    REQUIRE(state.snapshot().has_value());

    state.point_at(astro::EquatorialCoord{.ra = 1.0, .dec = -0.5}, Filter::G);
    CHECK_FALSE(state.snapshot().has_value());
}

TEST_CASE("Repointing while unparked keeps the cached status")
{
    ObservatoryState state(101.5, nights());
    state.point_at(astro::EquatorialCoord{.ra = 1.0, .dec = -0.5}, Filter::G);
    state.set_snapshot(StatusSnapshot{.mjd = 101.5});

    state.point_at(astro::EquatorialCoord{.ra = 1.2, .dec = -0.6}, Filter::I);
    REQUIRE(state.snapshot().has_value());
    CHECK(state.snapshot()->mjd == 101.5);
    CHECK(state.filter() == Filter::I);
}

TEST_CASE("park clears pointing, filter and cached status but not the clock")
{
    ObservatoryState state(101.5, nights());
    state.point_at(astro::EquatorialCoord{.ra = 1.0, .dec = -0.5}, Filter::Z);
    state.set_snapshot(StatusSnapshot{.mjd = 101.5});

    state.park();
    CHECK(state.is_parked());
    CHECK_FALSE(state.pointing().has_value());
    CHECK_FALSE(state.filter().has_value());
    CHECK_FALSE(state.snapshot().has_value());
    CHECK(state.mjd() == 101.5);
    CHECK(state.has_ever_pointed());
}
