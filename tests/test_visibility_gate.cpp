/// @file test_visibility_gate.cpp
/// @brief Unit tests for meridian::observatory::VisibilityGate.
///
/// Under FakeKit the Sun sets at N + 0.95 and rises 0.40 day later, so with
/// a 0.1 day sky timeline starting at 60000.0 the dark samples are
/// 60001.0, 60001.1, ..., 60001.3, then 60002.0, ... and so on.

#include <doctest/doctest.h>

#include "core/config.hpp"
#include "observatory/night_boundary_index.hpp"
#include "observatory/visibility_gate.hpp"
#include "test_fakes.hpp"

#include <vector>

using namespace meridian;
using namespace meridian::observatory;

namespace
{
    constexpr f64 kStart = 60000.0;

    core::ObservatoryConfig gate_config()
    {
        core::ObservatoryConfig config;
        config.mjd_start = kStart;
        return config;
    }

    /// @brief Kit, sky, clouds and sunset table wired for a four-day window.
    struct GateFixture
    {
        core::ObservatoryConfig config = gate_config();
        testing::FakeKit kit;
        testing::FakeSky sky{kit, kStart, 4.0, 0.1};
        testing::ScriptedClouds clouds;
        NightBoundaryIndex nights{{60000.95, 60001.95, 60002.95, 60003.95}};

        VisibilityGate make_gate(std::vector<i32> closed = {})
        {
            return VisibilityGate(config, kit, sky, clouds, nights, std::move(closed));
        }
    };
} // namespace

// =================================================================
// Observable instants
// =================================================================

TEST_CASE("Clear dark open night is observable")
{
    GateFixture f;
    VisibilityGate gate = f.make_gate();

    const GateDecision decision = gate.is_observable(60001.1);
    CHECK(decision.observable);
    CHECK(gate.fallback_jumps() == 0);
}

TEST_CASE("Cloud fraction is queried at seconds since the simulation start")
{
    GateFixture f;
    f64 queried = -1.0;
    f.clouds.fraction = [&queried](f64 elapsed_s) {
        queried = elapsed_s;
        return 0.0;
    };
    VisibilityGate gate = f.make_gate();

    (void)gate.is_observable(60001.25);
    CHECK(queried == doctest::Approx(1.25 * 86400.0));
    CHECK(gate.elapsed_seconds(kStart) == doctest::Approx(0.0));
}

// =================================================================
// Clouds
// =================================================================

TEST_CASE("Clouds at the limit close the dome for one cloud step")
{
    GateFixture f;
    f.clouds.fraction = [&f](f64) { return f.config.cloud_limit; };
    VisibilityGate gate = f.make_gate();

    const GateDecision decision = gate.is_observable(60001.1);
    CHECK_FALSE(decision.observable);
    CHECK(decision.next_candidate_mjd == doctest::Approx(60001.1 + 15.0 / 1440.0));
}

TEST_CASE("Just below the cloud limit is still observable")
{
    GateFixture f;
    f.clouds.fraction = [](f64) { return 0.69; };
    VisibilityGate gate = f.make_gate();

    CHECK(gate.is_observable(60001.1).observable);
}

TEST_CASE("Cloud check takes precedence over daylight")
{
    GateFixture f;
    f.clouds.fraction = [](f64) { return 1.0; };
    VisibilityGate gate = f.make_gate();

    const GateDecision decision = gate.is_observable(60001.6);
    CHECK_FALSE(decision.observable);
    CHECK(decision.next_candidate_mjd == doctest::Approx(60001.6 + 15.0 / 1440.0));
}

// =================================================================
// Darkness and downtime
// =================================================================

TEST_CASE("Daylight jumps to the next dark timeline sample")
{
    GateFixture f;
    VisibilityGate gate = f.make_gate();

    const GateDecision decision = gate.is_observable(60001.6);
    CHECK_FALSE(decision.observable);
    CHECK(decision.next_candidate_mjd == doctest::Approx(60002.0));
    CHECK(decision.next_candidate_mjd > 60001.6);
}

TEST_CASE("Closed night jumps past every sample of that night")
{
    GateFixture f;
    VisibilityGate gate = f.make_gate({2});

    CHECK(gate.is_closed_night(2));
    CHECK_FALSE(gate.is_closed_night(1));

    const GateDecision decision = gate.is_observable(60002.1);
    CHECK_FALSE(decision.observable);
    CHECK(decision.next_candidate_mjd == doctest::Approx(60003.0));
    CHECK(f.nights.night_of(decision.next_candidate_mjd) == 3);
}

TEST_CASE("Available instants are dark, ascending and outside closed nights")
{
    GateFixture f;
    VisibilityGate gate = f.make_gate({2});

    const auto& available = gate.available_instants();
    REQUIRE_FALSE(available.empty());
    for (std::size_t i = 0; i < available.size(); ++i)
    {
        CHECK(f.kit.solar_altitude(available[i]) <= f.config.sun_limit_rad);
        CHECK(f.nights.night_of(available[i]) != 2);
        if (i > 0)
        {
            CHECK(available[i] > available[i - 1]);
        }
    }
}

TEST_CASE("Exhausted timeline falls back to a fixed jump and counts it")
{
    GateFixture f;
    VisibilityGate gate = f.make_gate();

    const GateDecision decision = gate.is_observable(60004.5);
    CHECK_FALSE(decision.observable);
    CHECK(decision.next_candidate_mjd == doctest::Approx(60004.75));
    CHECK(gate.fallback_jumps() == 1);

    (void)gate.is_observable(decision.next_candidate_mjd);
    CHECK(gate.fallback_jumps() == 2);
}

TEST_CASE("Fallback jump length follows the configuration")
{
    GateFixture f;
    f.config.fallback_jump_days = 0.5;
    VisibilityGate gate = f.make_gate();

    CHECK(gate.is_observable(60004.5).next_candidate_mjd == doctest::Approx(60005.0));
}

TEST_CASE("Closed night list is sorted on construction")
{
    GateFixture f;
    VisibilityGate gate = f.make_gate({5, 1, 3});
    CHECK(gate.closed_nights() == std::vector<i32>{1, 3, 5});
    CHECK(gate.is_closed_night(3));
}
