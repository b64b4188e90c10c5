/// @file ephemeris.cpp
/// @brief Implementation of the low-precision solar/lunar ephemeris.

#include "astro/ephemeris.hpp"

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <cmath>

namespace meridian::astro
{

namespace
{
    constexpr f64 kDeg = astro_constants::kDegToRad;

    /// Mean obliquity of the ecliptic (radians), n = days since J2000.0.
    f64 obliquity(f64 n)
    {
        return (23.439 - 0.0000004 * n) * kDeg;
    }

    /// Ecliptic (lambda, beta) → equatorial (RA, Dec).
    EquatorialCoord ecliptic_to_equatorial(f64 lambda, f64 beta, f64 eps)
    {
        const f64 x = std::cos(beta) * std::cos(lambda);
        const f64 y = std::cos(eps) * std::cos(beta) * std::sin(lambda)
                    - std::sin(eps) * std::sin(beta);
        const f64 z = std::sin(eps) * std::cos(beta) * std::sin(lambda)
                    + std::cos(eps) * std::sin(beta);

        return EquatorialCoord{
            .ra  = TimeSystem::normalize_radians(std::atan2(y, x)),
            .dec = std::asin(std::clamp(z, -1.0, 1.0)),
        };
    }

    f64 sun_altitude_above(const ObserverLocation& site, f64 mjd, f64 horizon_rad)
    {
        return Ephemeris::solar_altitude(site, mjd) - horizon_rad;
    }

    /// Bisect a bracketed sign change of the offset altitude on [lo, hi].
    f64 bisect_crossing(const ObserverLocation& site, f64 lo, f64 hi, f64 horizon_rad)
    {
        const bool lo_above = sun_altitude_above(site, lo, horizon_rad) > 0.0;
        while (hi - lo > Ephemeris::kCrossingTolDays)
        {
            const f64 mid = 0.5 * (lo + hi);
            if ((sun_altitude_above(site, mid, horizon_rad) > 0.0) == lo_above)
            {
                lo = mid;
            }
            else
            {
                hi = mid;
            }
        }
        return 0.5 * (lo + hi);
    }

    bool brackets(f64 f_lo, f64 f_hi, Crossing crossing)
    {
        if (crossing == Crossing::Setting)
        {
            return f_lo > 0.0 && f_hi <= 0.0;
        }
        return f_lo <= 0.0 && f_hi > 0.0;
    }
} // namespace

// -----------------------------------------------------------------
// Sun: Astronomical Almanac low-precision formulae
//
// n = JD − 2451545.0
// L = 280.460° + 0.9856474° n          (mean longitude)
// g = 357.528° + 0.9856003° n          (mean anomaly)
// λ = L + 1.915° sin g + 0.020° sin 2g (ecliptic longitude, β = 0)
// -----------------------------------------------------------------

EquatorialCoord Ephemeris::sun_position(f64 mjd)
{
    const f64 n = TimeSystem::mjd_to_jd(mjd) - astro_constants::kJ2000;

    const f64 mean_lon = std::fmod(280.460 + 0.9856474 * n, 360.0);
    const f64 mean_anom = std::fmod(357.528 + 0.9856003 * n, 360.0) * kDeg;
    const f64 lambda = (mean_lon
                      + 1.915 * std::sin(mean_anom)
                      + 0.020 * std::sin(2.0 * mean_anom)) * kDeg;

    return ecliptic_to_equatorial(lambda, 0.0, obliquity(n));
}

// -----------------------------------------------------------------
// Moon: leading periodic terms (Astronomical Almanac, low precision)
//
// λ = 218.32 + 481267.881 T + 6.29 sin(135.0 + 477198.87 T) − ...
// β = 5.13 sin(93.3 + 483202.02 T) + ...
// -----------------------------------------------------------------

EquatorialCoord Ephemeris::moon_position(f64 mjd)
{
    const f64 n = TimeSystem::mjd_to_jd(mjd) - astro_constants::kJ2000;
    const f64 t = n / 36525.0;

    auto s = [](f64 deg) { return std::sin(std::fmod(deg, 360.0) * kDeg); };

    const f64 lambda_deg = 218.32 + 481267.881 * t
                         + 6.29 * s(135.0 + 477198.87 * t)
                         - 1.27 * s(259.3 - 413335.36 * t)
                         + 0.66 * s(235.7 + 890534.22 * t)
                         + 0.21 * s(269.9 + 954397.74 * t)
                         - 0.19 * s(357.5 + 35999.05 * t)
                         - 0.11 * s(186.5 + 966404.03 * t);

    const f64 beta_deg = 5.13 * s(93.3 + 483202.02 * t)
                       + 0.28 * s(228.2 + 960400.89 * t)
                       - 0.28 * s(318.3 + 6003.15 * t)
                       - 0.17 * s(217.6 - 407332.21 * t);

    return ecliptic_to_equatorial(std::fmod(lambda_deg, 360.0) * kDeg,
                                  beta_deg * kDeg,
                                  obliquity(n));
}

f64 Ephemeris::solar_altitude(const ObserverLocation& site, f64 mjd)
{
    return Coordinates::radec_to_altaz(sun_position(mjd), site, mjd).alt;
}

SunMoonGeometry Ephemeris::sun_moon_geometry(const ObserverLocation& site, f64 mjd)
{
    const EquatorialCoord sun = sun_position(mjd);
    const EquatorialCoord moon = moon_position(mjd);

    const f64 lst = TimeSystem::lmst(TimeSystem::mjd_to_jd(mjd), site.longitude_rad);
    const HorizontalCoord sun_hz = Coordinates::equatorial_to_horizontal(sun, site, lst);
    const HorizontalCoord moon_hz = Coordinates::equatorial_to_horizontal(moon, site, lst);

    return SunMoonGeometry{
        .sun_alt      = sun_hz.alt,
        .sun_az       = sun_hz.az,
        .moon_alt     = moon_hz.alt,
        .moon_az      = moon_hz.az,
        .moon_ra      = moon.ra,
        .moon_dec     = moon.dec,
        .moon_sun_sep = Coordinates::angular_separation(sun, moon),
    };
}

// -----------------------------------------------------------------
// Horizon crossing search
//
// Walk grid-aligned intervals [k·step, (k+1)·step] away from the start
// instant until one brackets the requested crossing, then bisect it.
// Crossings on the wrong side of the start instant are skipped.
// -----------------------------------------------------------------

std::optional<f64> Ephemeris::find_sun_crossing(
    const ObserverLocation& site,
    f64 start_mjd,
    f64 horizon_rad,
    Crossing crossing,
    SearchDirection direction)
{
    const auto max_steps = static_cast<i64>(std::ceil(kSearchWindowDays / kSearchStepDays)) + 1;
    const auto k0 = static_cast<i64>(std::floor(start_mjd / kSearchStepDays));
    const i64 dk = (direction == SearchDirection::Forward) ? 1 : -1;

    for (i64 i = 0; i <= max_steps; ++i)
    {
        const i64 k = k0 + i * dk;
        const f64 lo = static_cast<f64>(k) * kSearchStepDays;
        const f64 hi = static_cast<f64>(k + 1) * kSearchStepDays;

        const f64 f_lo = sun_altitude_above(site, lo, horizon_rad);
        const f64 f_hi = sun_altitude_above(site, hi, horizon_rad);
        if (!brackets(f_lo, f_hi, crossing))
        {
            continue;
        }

        const f64 t = bisect_crossing(site, lo, hi, horizon_rad);
        if (direction == SearchDirection::Forward && t > start_mjd)
        {
            return t;
        }
        if (direction == SearchDirection::Backward && t < start_mjd)
        {
            return t;
        }
    }

    return std::nullopt;
}

} // namespace meridian::astro
