/// @file astronomy_kit.cpp
/// @brief SiteAstronomyKit: AstronomyKit over the built-in ephemeris.

#include "astro/astronomy_kit.hpp"

#include "astro/healpix.hpp"
#include "astro/time_system.hpp"

namespace meridian::astro
{

SiteAstronomyKit::SiteAstronomyKit(const ObserverLocation& site, i32 nside)
    : m_site{site}
    , m_nside{nside}
{
}

HorizontalCoord SiteAstronomyKit::radec_to_altaz(const EquatorialCoord& eq, f64 mjd) const
{
    return Coordinates::radec_to_altaz(eq, m_site, mjd);
}

f64 SiteAstronomyKit::lmst(f64 mjd) const
{
    return TimeSystem::lmst(TimeSystem::mjd_to_jd(mjd), m_site.longitude_rad);
}

f64 SiteAstronomyKit::solar_altitude(f64 mjd) const
{
    return Ephemeris::solar_altitude(m_site, mjd);
}

std::optional<f64> SiteAstronomyKit::previous_sunset(f64 mjd) const
{
    return Ephemeris::find_sun_crossing(m_site, mjd, 0.0,
                                        Crossing::Setting, SearchDirection::Backward);
}

TwilightBoundaries SiteAstronomyKit::twilight_boundaries(f64 mjd, f64 limit_rad) const
{
    return TwilightBoundaries{
        .next_start = Ephemeris::find_sun_crossing(m_site, mjd, limit_rad,
                                                   Crossing::Rising, SearchDirection::Forward),
        .next_end   = Ephemeris::find_sun_crossing(m_site, mjd, limit_rad,
                                                   Crossing::Setting, SearchDirection::Forward),
        .last_end   = Ephemeris::find_sun_crossing(m_site, mjd, limit_rad,
                                                   Crossing::Setting, SearchDirection::Backward),
    };
}

i64 SiteAstronomyKit::healpix_index(const EquatorialCoord& eq) const
{
    return Healpix::ang2pix(m_nside, eq);
}

} // namespace meridian::astro
