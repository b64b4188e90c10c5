/// @file test_coordinates.cpp
/// @brief Unit tests for meridian::astro::Coordinates.
///
/// Verifies equatorial-to-horizontal transforms, angular separation and
/// airmass against known reference values.

#include <doctest/doctest.h>

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <cmath>

using namespace meridian;
using namespace meridian::astro;

// =================================================================
// Tolerance constants
// =================================================================

/// 1 arcminute in radians, loose tolerance for approximate checks
static constexpr f64 kArcMinRad = astro_constants::kDegToRad / 60.0;

/// 1 arcsecond in radians, tight tolerance for precision checks
static constexpr f64 kArcSecRad = astro_constants::kArcSecToRad;

/// Degree tolerance for general angular comparisons
static constexpr f64 kDegTol = 0.5 * astro_constants::kDegToRad;

static constexpr f64 kHourToRad = 15.0 * astro_constants::kDegToRad;

// =================================================================
// Equatorial → Horizontal tests
// =================================================================

TEST_CASE("Polaris near zenith from North Pole")
{
    // Polaris: RA ≈ 02h 31m 49s = 37.954°, Dec ≈ +89°15'51" ≈ +89.264°
    const EquatorialCoord polaris = {
        .ra  = 37.954 * astro_constants::kDegToRad,
        .dec = 89.264 * astro_constants::kDegToRad,
    };

    const ObserverLocation north_pole = {
        .latitude_rad  = 90.0 * astro_constants::kDegToRad,
        .longitude_rad = 0.0,
        .elevation_m   = 0.0,
    };

    // At the North Pole, altitude = declination for any LST
    const auto hz = Coordinates::equatorial_to_horizontal(polaris, north_pole, 0.0);

    CHECK(hz.alt == doctest::Approx(89.264 * astro_constants::kDegToRad).epsilon(kArcMinRad));
}

TEST_CASE("Star transiting at zenith: RA=LST, Dec=Lat → alt≈90°")
{
    const f64 lat = -30.0 * astro_constants::kDegToRad;
    const f64 lst = 6.0 * kHourToRad;

    const EquatorialCoord eq = {
        .ra  = lst,   // RA = LST → hour angle = 0
        .dec = lat,
    };

    const ObserverLocation observer = {
        .latitude_rad  = lat,
        .longitude_rad = 0.0,
        .elevation_m   = 0.0,
    };

    const auto hz = Coordinates::equatorial_to_horizontal(eq, observer, lst);

    CHECK(hz.alt == doctest::Approx(astro_constants::kHalfPi).epsilon(kArcSecRad));
}

TEST_CASE("Star on celestial equator due north at transit from the south")
{
    // Observer at lat 30°S, star with Dec=0 at transit: alt = 60°, az = 0° (north)
    const f64 lat = -30.0 * astro_constants::kDegToRad;
    const f64 lst = 3.0 * kHourToRad;

    const EquatorialCoord eq = {
        .ra  = lst,
        .dec = 0.0,
    };

    const ObserverLocation observer = {
        .latitude_rad  = lat,
        .longitude_rad = 0.0,
        .elevation_m   = 0.0,
    };

    const auto hz = Coordinates::equatorial_to_horizontal(eq, observer, lst);

    CHECK(hz.alt == doctest::Approx(60.0 * astro_constants::kDegToRad).epsilon(kArcSecRad));

    // Azimuth wraps at north; accept either side of 0/2π
    const f64 az_from_north = std::min(hz.az, astro_constants::kTwoPi - hz.az);
    CHECK(az_from_north < kDegTol);
}

TEST_CASE("Star below horizon has negative altitude")
{
    // Dec = -60° from lat 45°N transits at alt = 90° - 105° = -15°
    const EquatorialCoord eq = {
        .ra  = 0.0,
        .dec = -60.0 * astro_constants::kDegToRad,
    };

    const ObserverLocation observer = {
        .latitude_rad  = 45.0 * astro_constants::kDegToRad,
        .longitude_rad = 0.0,
        .elevation_m   = 0.0,
    };

    const auto hz = Coordinates::equatorial_to_horizontal(eq, observer, 0.0);

    CHECK(hz.alt == doctest::Approx(-15.0 * astro_constants::kDegToRad).epsilon(kArcMinRad));
}

TEST_CASE("Altitude is always in [-π/2, π/2]")
{
    const ObserverLocation observer = {
        .latitude_rad  = -30.2446 * astro_constants::kDegToRad,
        .longitude_rad = -70.7494 * astro_constants::kDegToRad,
        .elevation_m   = 2650.0,
    };

    for (f64 ra_deg = 0.0; ra_deg < 360.0; ra_deg += 45.0)
    {
        for (f64 dec_deg = -80.0; dec_deg <= 80.0; dec_deg += 40.0)
        {
            const EquatorialCoord eq = {
                .ra  = ra_deg * astro_constants::kDegToRad,
                .dec = dec_deg * astro_constants::kDegToRad,
            };

            const auto hz = Coordinates::radec_to_altaz(eq, observer, 59853.5);

            CHECK(hz.alt >= -astro_constants::kHalfPi - 1e-10);
            CHECK(hz.alt <=  astro_constants::kHalfPi + 1e-10);
            CHECK(hz.az  >= 0.0);
            CHECK(hz.az  <  astro_constants::kTwoPi + 1e-10);
        }
    }
}

TEST_CASE("radec_to_altaz agrees with the LMST-based transform")
{
    const ObserverLocation observer = {
        .latitude_rad  = -30.2446 * astro_constants::kDegToRad,
        .longitude_rad = -70.7494 * astro_constants::kDegToRad,
        .elevation_m   = 2650.0,
    };
    const EquatorialCoord eq = {.ra = 1.2, .dec = -0.6};
    const f64 mjd = 60000.25;

    const f64 lst = TimeSystem::lmst(TimeSystem::mjd_to_jd(mjd), observer.longitude_rad);
    const auto expected = Coordinates::equatorial_to_horizontal(eq, observer, lst);
    const auto actual = Coordinates::radec_to_altaz(eq, observer, mjd);

    CHECK(actual.alt == doctest::Approx(expected.alt).epsilon(1e-12));
    CHECK(actual.az == doctest::Approx(expected.az).epsilon(1e-12));
}

// =================================================================
// Angular separation
// =================================================================

TEST_CASE("Angular separation of identical points is zero")
{
    const EquatorialCoord a = {.ra = 2.0, .dec = -0.3};
    CHECK(Coordinates::angular_separation(a, a) == doctest::Approx(0.0));
}

TEST_CASE("Angular separation between equator and pole is 90°")
{
    const EquatorialCoord equator = {.ra = 1.0, .dec = 0.0};
    const EquatorialCoord pole = {.ra = 0.0, .dec = astro_constants::kHalfPi};
    CHECK(Coordinates::angular_separation(equator, pole)
          == doctest::Approx(astro_constants::kHalfPi));
}

TEST_CASE("Angular separation across RA = 0 wraps correctly")
{
    const EquatorialCoord a = {.ra = 359.0 * astro_constants::kDegToRad, .dec = 0.0};
    const EquatorialCoord b = {.ra = 1.0 * astro_constants::kDegToRad, .dec = 0.0};
    CHECK(Coordinates::angular_separation(a, b)
          == doctest::Approx(2.0 * astro_constants::kDegToRad));
}

// =================================================================
// Airmass
// =================================================================

TEST_CASE("Airmass is 1 at the zenith and 2 at 30° altitude")
{
    CHECK(Coordinates::airmass(astro_constants::kHalfPi) == doctest::Approx(1.0));
    CHECK(Coordinates::airmass(30.0 * astro_constants::kDegToRad) == doctest::Approx(2.0));
}

TEST_CASE("Airmass below the horizon is UNSEEN")
{
    CHECK(Coordinates::airmass(0.0) == kUnseen);
    CHECK(Coordinates::airmass(-0.1) == kUnseen);
}
