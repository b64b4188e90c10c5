/// @file sky_model.cpp
/// @brief Implementation of the analytic sky brightness model.

#include "environment/sky_model.hpp"

#include "astro/healpix.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>

namespace meridian::environment
{

namespace
{
    constexpr f64 kTwilightLimitDeg = -18.0;

    /// Airglow brightening at the horizon relative to the zenith [mag].
    constexpr f64 kAirglowHorizonMag = 0.5;

    /// Angular scale over which scattered moonlight falls off [rad].
    constexpr f64 kMoonHaloScale = 0.35;

    f64 mag_to_flux(f64 mag)
    {
        return std::pow(10.0, -0.4 * mag);
    }

    f64 flux_to_mag(f64 flux)
    {
        return -2.5 * std::log10(flux);
    }

    /// Great-circle distance between two horizontal positions.
    f64 horizontal_separation(const astro::HorizontalCoord& a, const astro::HorizontalCoord& b)
    {
        return astro::Coordinates::angular_separation(
            astro::EquatorialCoord{.ra = a.az, .dec = a.alt},
            astro::EquatorialCoord{.ra = b.az, .dec = b.alt});
    }
} // namespace

AnalyticSkyModel::AnalyticSkyModel(const astro::AstronomyKit& kit, f64 start_mjd,
                                   f64 span_days, f64 step_days)
    : m_kit{kit}
{
    const i64 npix = astro::Healpix::npix(kit.nside());
    m_pixel_centres.reserve(static_cast<std::size_t>(npix));
    for (i64 pix = 0; pix < npix; ++pix)
    {
        m_pixel_centres.push_back(astro::Healpix::pix2ang(kit.nside(), pix));
    }

    const auto steps = static_cast<std::size_t>(std::floor(span_days / step_days)) + 1;
    m_timeline.mjds.reserve(steps);
    m_timeline.sun_alts.reserve(steps);
    for (std::size_t i = 0; i < steps; ++i)
    {
        const f64 mjd = start_mjd + static_cast<f64>(i) * step_days;
        m_timeline.mjds.push_back(mjd);
        m_timeline.sun_alts.push_back(kit.solar_altitude(mjd));
    }

    MRD_CORE_INFO("AnalyticSkyModel: {} pixels (nside {}), timeline of {} samples from MJD {:.5f}",
                  npix, kit.nside(), steps, start_mjd);
}

// -----------------------------------------------------------------
// Per-position brightness
// -----------------------------------------------------------------

f64 AnalyticSkyModel::sky_magnitude(const astro::HorizontalCoord& pixel,
                                    const astro::SunMoonGeometry& geometry,
                                    Filter filter) const
{
    const std::size_t fi = filter_index(filter);
    const f64 zenith_flux = mag_to_flux(kDarkZenithMag[fi]);

    const f64 zenith_distance = astro_constants::kHalfPi - pixel.alt;
    f64 flux = mag_to_flux(kDarkZenithMag[fi]
                           - kAirglowHorizonMag * zenith_distance / astro_constants::kHalfPi);

    // Twilight, brighter toward the Sun
    const f64 sun_alt_deg = geometry.sun_alt * astro_constants::kRadToDeg;
    if (sun_alt_deg > kTwilightLimitDeg)
    {
        const f64 boost = std::pow(10.0, 0.4 * kTwilightSlope[fi] * (sun_alt_deg - kTwilightLimitDeg)) - 1.0;
        const f64 sun_sep = horizontal_separation(
            pixel, astro::HorizontalCoord{.alt = geometry.sun_alt, .az = geometry.sun_az});
        flux += zenith_flux * boost * (0.5 + 0.5 * std::cos(sun_sep));
    }

    // Moonlight
    if (geometry.moon_alt > 0.0)
    {
        const f64 illumination = 0.5 * (1.0 - std::cos(geometry.moon_sun_sep));
        const f64 moon_sep = horizontal_separation(
            pixel, astro::HorizontalCoord{.alt = geometry.moon_alt, .az = geometry.moon_az});
        const f64 halo = 1.0 + 4.0 * std::exp(-moon_sep / kMoonHaloScale);
        flux += zenith_flux * kMoonScale[fi] * illumination
              * std::sqrt(std::sin(geometry.moon_alt)) * halo;
    }

    return flux_to_mag(flux);
}

// -----------------------------------------------------------------
// Maps
// -----------------------------------------------------------------

PerFilter<PixelMap> AnalyticSkyModel::magnitudes(f64 mjd) const
{
    const astro::SunMoonGeometry geometry = sun_moon_geometry(mjd);
    const f64 lst = m_kit.lmst(mjd);

    PerFilter<PixelMap> maps;
    for (auto& map : maps)
    {
        map.assign(m_pixel_centres.size(), kUnseen);
    }

    for (std::size_t pix = 0; pix < m_pixel_centres.size(); ++pix)
    {
        const auto hz = astro::Coordinates::equatorial_to_horizontal(
            m_pixel_centres[pix], m_kit.site(), lst);
        if (hz.alt <= 0.0)
        {
            continue;
        }
        for (const Filter f : kAllFilters)
        {
            maps[filter_index(f)][pix] = sky_magnitude(hz, geometry, f);
        }
    }
    return maps;
}

f64 AnalyticSkyModel::pixel_magnitude(f64 mjd, i64 hpid, Filter filter) const
{
    if (hpid < 0 || static_cast<std::size_t>(hpid) >= m_pixel_centres.size())
    {
        MRD_CORE_WARN("AnalyticSkyModel: pixel {} outside map of {}", hpid, m_pixel_centres.size());
        return kUnseen;
    }

    auto hz = m_kit.radec_to_altaz(m_pixel_centres[static_cast<std::size_t>(hpid)], mjd);
    // Below the horizon, report the brightness at the horizon
    hz.alt = std::max(hz.alt, 0.0);
    return sky_magnitude(hz, sun_moon_geometry(mjd), filter);
}

PixelMap AnalyticSkyModel::airmass(f64 mjd) const
{
    const f64 lst = m_kit.lmst(mjd);
    PixelMap map(m_pixel_centres.size(), kUnseen);
    for (std::size_t pix = 0; pix < m_pixel_centres.size(); ++pix)
    {
        const auto hz = astro::Coordinates::equatorial_to_horizontal(
            m_pixel_centres[pix], m_kit.site(), lst);
        map[pix] = astro::Coordinates::airmass(hz.alt);
    }
    return map;
}

astro::SunMoonGeometry AnalyticSkyModel::sun_moon_geometry(f64 mjd) const
{
    return astro::Ephemeris::sun_moon_geometry(m_kit.site(), mjd);
}

} // namespace meridian::environment
