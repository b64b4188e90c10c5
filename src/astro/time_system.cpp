/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities.

#include "astro/time_system.hpp"

#include "core/types.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace meridian::astro
{

// -----------------------------------------------------------------
// Julian Date → civil date/time (Meeus, Ch. 7)
// -----------------------------------------------------------------

DateTime TimeSystem::from_julian_date(f64 jd)
{
    // Add 0.5 to shift from noon-based to midnight-based
    const f64 jd_plus = jd + 0.5;
    const i32 z = static_cast<i32>(std::floor(jd_plus));
    const f64 f = jd_plus - static_cast<f64>(z);

    i32 a = z;
    if (z >= 2299161)
    {
        const i32 alpha = static_cast<i32>(std::floor(
            (static_cast<f64>(z) - 1867216.25) / 36524.25));
        a = z + 1 + alpha - (alpha / 4);
    }

    const i32 b = a + 1524;
    const i32 c = static_cast<i32>(std::floor(
        (static_cast<f64>(b) - 122.1) / 365.25));
    const i32 d = static_cast<i32>(std::floor(
        365.25 * static_cast<f64>(c)));
    const i32 e = static_cast<i32>(std::floor(
        static_cast<f64>(b - d) / 30.6001));

    const f64 day_with_fraction = static_cast<f64>(b - d)
                                - std::floor(30.6001 * static_cast<f64>(e))
                                + f;

    const i32 day = static_cast<i32>(std::floor(day_with_fraction));
    const f64 day_frac = day_with_fraction - static_cast<f64>(day);

    const i32 month = (e < 14) ? (e - 1) : (e - 13);
    const i32 year = (month > 2) ? (c - 4716) : (c - 4715);

    const f64 hours_total = day_frac * 24.0;
    const i32 hour = static_cast<i32>(std::floor(hours_total));

    const f64 minutes_total = (hours_total - static_cast<f64>(hour)) * 60.0;
    const i32 minute = static_cast<i32>(std::floor(minutes_total));

    const f64 second = (minutes_total - static_cast<f64>(minute)) * 60.0;

    return DateTime{
        .year   = year,
        .month  = month,
        .day    = day,
        .hour   = hour,
        .minute = minute,
        .second = second,
    };
}

f64 TimeSystem::mjd_to_jd(f64 mjd)
{
    return mjd + astro_constants::kMjdOffset;
}

f64 TimeSystem::jd_to_mjd(f64 jd)
{
    return jd - astro_constants::kMjdOffset;
}

f64 TimeSystem::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / 36525.0;
}

// -----------------------------------------------------------------
// GMST: IAU 1982 formula
//
// GMST (degrees) = 280.46061837
//                + 360.98564736629 × (JD − 2451545.0)
//                + 0.000387933 × T²
//                − T³ / 38710000
// -----------------------------------------------------------------

f64 TimeSystem::gmst(f64 jd)
{
    const f64 t = julian_centuries(jd);
    const f64 d = jd - astro_constants::kJ2000;

    f64 gmst_deg = 280.46061837
                 + 360.98564736629 * d
                 + 0.000387933 * t * t
                 - (t * t * t) / 38710000.0;

    gmst_deg = std::fmod(gmst_deg, 360.0);
    if (gmst_deg < 0.0)
    {
        gmst_deg += 360.0;
    }

    return gmst_deg * astro_constants::kDegToRad;
}

f64 TimeSystem::lmst(f64 jd, f64 longitude_rad)
{
    return normalize_radians(gmst(jd) + longitude_rad);
}

std::string TimeSystem::format_mjd(f64 mjd)
{
    const DateTime dt = from_julian_date(mjd_to_jd(mjd));
    return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}",
                       dt.year, dt.month, dt.day, dt.hour, dt.minute,
                       static_cast<i32>(std::floor(dt.second)));
}

f64 TimeSystem::normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    return angle;
}

} // namespace meridian::astro
