/// @file coordinates.cpp
/// @brief Implementation of astronomical coordinate transformations.

#include "astro/coordinates.hpp"

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <cmath>

namespace meridian::astro
{

// -----------------------------------------------------------------
// Equatorial (RA/Dec) → Horizontal (Alt/Az)
//
// Hour angle: H = LST - RA
//
// sin(alt) = sin(dec) × sin(lat) + cos(dec) × cos(lat) × cos(H)
//
// Azimuth (north-based):
//   az = atan2(-cos(dec)×sin(H), sin(dec)×cos(lat) - cos(dec)×sin(lat)×cos(H))
// -----------------------------------------------------------------

HorizontalCoord Coordinates::equatorial_to_horizontal(
    const EquatorialCoord& eq,
    const ObserverLocation& observer,
    f64 local_sidereal_time_rad)
{
    const f64 hour_angle = local_sidereal_time_rad - eq.ra;

    const f64 sin_dec = std::sin(eq.dec);
    const f64 cos_dec = std::cos(eq.dec);
    const f64 sin_lat = std::sin(observer.latitude_rad);
    const f64 cos_lat = std::cos(observer.latitude_rad);
    const f64 cos_ha  = std::cos(hour_angle);
    const f64 sin_ha  = std::sin(hour_angle);

    const f64 sin_alt = sin_dec * sin_lat + cos_dec * cos_lat * cos_ha;
    const f64 alt = std::asin(std::clamp(sin_alt, -1.0, 1.0));

    const f64 az_y = -cos_dec * sin_ha;
    const f64 az_x = sin_dec * cos_lat - cos_dec * sin_lat * cos_ha;
    const f64 az = TimeSystem::normalize_radians(std::atan2(az_y, az_x));

    return HorizontalCoord{
        .alt = alt,
        .az  = az,
    };
}

HorizontalCoord Coordinates::radec_to_altaz(
    const EquatorialCoord& eq,
    const ObserverLocation& observer,
    f64 mjd)
{
    const f64 lst = TimeSystem::lmst(TimeSystem::mjd_to_jd(mjd), observer.longitude_rad);
    return equatorial_to_horizontal(eq, observer, lst);
}

Vec3d Coordinates::to_unit_vector(f64 lon, f64 lat)
{
    const f64 cos_lat = std::cos(lat);
    return Vec3d{cos_lat * std::cos(lon), cos_lat * std::sin(lon), std::sin(lat)};
}

// -----------------------------------------------------------------
// Separation from the dot product of unit vectors; atan2 of the
// cross-product norm keeps precision for nearly coincident points.
// -----------------------------------------------------------------

f64 Coordinates::angular_separation(const EquatorialCoord& a, const EquatorialCoord& b)
{
    const Vec3d va = to_unit_vector(a.ra, a.dec);
    const Vec3d vb = to_unit_vector(b.ra, b.dec);
    return std::atan2(glm::length(glm::cross(va, vb)), glm::dot(va, vb));
}

f64 Coordinates::airmass(f64 alt_rad)
{
    if (alt_rad <= 0.0)
    {
        return kUnseen;
    }
    return 1.0 / std::sin(alt_rad);
}

} // namespace meridian::astro
