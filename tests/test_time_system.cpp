/// @file test_time_system.cpp
/// @brief Unit tests for meridian::astro::TimeSystem.
///
/// The simulation clock runs in MJD, so the cases here check the MJD/JD
/// offset, the civil calendar behind log timestamps, and the sidereal time
/// seen from the survey sites.

#include <doctest/doctest.h>

#include "astro/astronomy_kit.hpp"
#include "astro/time_system.hpp"
#include "core/config.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace meridian;
using namespace meridian::astro;

namespace
{
    constexpr f64 kSiderealDayDays = 0.99726956633;

    DateTime civil(f64 mjd)
    {
        return TimeSystem::from_julian_date(TimeSystem::mjd_to_jd(mjd));
    }
} // namespace

// =================================================================
// MJD offset
// =================================================================

TEST_CASE("MJD and JD differ by 2400000.5 days")
{
    CHECK(TimeSystem::mjd_to_jd(0.0) == doctest::Approx(2400000.5));
    CHECK(TimeSystem::jd_to_mjd(astro_constants::kJ2000) == doctest::Approx(51544.5));
    CHECK(TimeSystem::jd_to_mjd(TimeSystem::mjd_to_jd(60218.3)) == doctest::Approx(60218.3));
}

// =================================================================
// Civil calendar
// =================================================================

TEST_CASE("Default survey start is noon on 2022-10-01")
{
    const DateTime dt = civil(59853.5);
    CHECK(dt.year   == 2022);
    CHECK(dt.month  == 10);
    CHECK(dt.day    == 1);
    CHECK(dt.hour   == 12);
    CHECK(dt.minute == 0);
}

TEST_CASE("Calendar crosses year ends and leap days")
{
    const DateTime new_year = civil(59945.0);
    CHECK(new_year.year  == 2023);
    CHECK(new_year.month == 1);
    CHECK(new_year.day   == 1);

    const DateTime last_day = civil(60309.0);
    CHECK(last_day.year  == 2023);
    CHECK(last_day.month == 12);
    CHECK(last_day.day   == 31);

    const DateTime leap_day = civil(60369.0);
    CHECK(leap_day.year  == 2024);
    CHECK(leap_day.month == 2);
    CHECK(leap_day.day   == 29);
}

TEST_CASE("format_mjd renders UTC and truncates seconds")
{
    CHECK(TimeSystem::format_mjd(51544.5) == "2000-01-01 12:00:00");
    CHECK(TimeSystem::format_mjd(60000.25) == "2023-02-25 06:00:00");
    CHECK(TimeSystem::format_mjd(60000.0 + 59.6 / 86400.0) == "2023-02-25 00:00:59");
}

// =================================================================
// Sidereal time
// =================================================================

TEST_CASE("GMST at J2000.0 is 280.46 degrees")
{
    const f64 gmst_deg = TimeSystem::gmst(astro_constants::kJ2000) * astro_constants::kRadToDeg;
    CHECK(gmst_deg == doctest::Approx(280.4606).epsilon(1e-6));
    CHECK(TimeSystem::julian_centuries(astro_constants::kJ2000) == doctest::Approx(0.0));
}

TEST_CASE("GMST gains about one degree per solar day and repeats each sidereal day")
{
    const f64 jd = astro_constants::kJ2000;
    const f64 gain_deg = (TimeSystem::gmst(jd + 1.0) - TimeSystem::gmst(jd))
                       * astro_constants::kRadToDeg;
    CHECK(gain_deg == doctest::Approx(0.98565).epsilon(1e-4));

    CHECK(TimeSystem::gmst(jd + kSiderealDayDays)
          == doctest::Approx(TimeSystem::gmst(jd)).epsilon(1e-6));
}

TEST_CASE("LMST at the survey sites stays in [0, 2pi)")
{
    const ObserverLocation sites[] = {core::make_rubin_site(), core::make_kitt_peak_site()};

    for (const auto& site : sites)
    {
        for (f64 mjd = 59853.5; mjd < 59855.5; mjd += 0.1)
        {
            const f64 lmst = TimeSystem::lmst(TimeSystem::mjd_to_jd(mjd), site.longitude_rad);
            CHECK(lmst >= 0.0);
            CHECK(lmst < astro_constants::kTwoPi);
        }
    }
}

TEST_CASE("Western site LMST trails GMST by its longitude")
{
    const ObserverLocation rubin = core::make_rubin_site();
    const f64 jd = TimeSystem::mjd_to_jd(59853.5);

    const f64 expected = TimeSystem::normalize_radians(TimeSystem::gmst(jd) + rubin.longitude_rad);
    CHECK(TimeSystem::lmst(jd, rubin.longitude_rad) == doctest::Approx(expected));
}

TEST_CASE("Astronomy kit reports LMST at its configured site")
{
    const ObserverLocation rubin = core::make_rubin_site();
    const SiteAstronomyKit kit(rubin, 4);

    for (const f64 mjd : {59853.5, 59853.9, 60218.2})
    {
        CHECK(kit.lmst(mjd)
              == doctest::Approx(TimeSystem::lmst(TimeSystem::mjd_to_jd(mjd), rubin.longitude_rad)));
    }
}

TEST_CASE("normalize_radians wraps negative and large angles")
{
    CHECK(TimeSystem::normalize_radians(-astro_constants::kHalfPi)
          == doctest::Approx(1.5 * astro_constants::kPi));
    CHECK(TimeSystem::normalize_radians(5.0 * astro_constants::kPi)
          == doctest::Approx(astro_constants::kPi));
}
