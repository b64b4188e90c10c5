/// @file status_snapshot.cpp
/// @brief Assembling a StatusSnapshot from the providers.

#include "observatory/status_snapshot.hpp"

#include "core/logger.hpp"
#include "observatory/slew_cost_estimator.hpp"

#include <utility>

namespace meridian::observatory
{

StatusSampler::StatusSampler(const core::ObservatoryConfig& config,
                             const astro::AstronomyKit& kit,
                             const environment::SkyBrightnessProvider& sky,
                             const environment::SeeingProvider& seeing,
                             const environment::CloudProvider& clouds,
                             const SlewCostEstimator& slew)
    : m_config{config}
    , m_kit{kit}
    , m_sky{sky}
    , m_seeing{seeing}
    , m_clouds{clouds}
    , m_slew{slew}
{
}

StatusSnapshot StatusSampler::sample(f64 mjd, i32 night,
                                     const std::optional<astro::EquatorialCoord>& pointing,
                                     std::optional<Filter> filter) const
{
    const f64 elapsed_s = (mjd - m_config.mjd_start) * time_constants::kSecondsPerDay;

    StatusSnapshot status;
    status.mjd = mjd;
    status.night = night;
    status.lmst = m_kit.lmst(mjd);

    status.sky_brightness = m_sky.magnitudes(mjd);
    status.slew_times = m_slew.slew_time_map(pointing, mjd);
    status.airmass = m_sky.airmass(mjd);
    status.clouds = m_clouds.cloud_fraction(elapsed_s);

    for (const Filter f : kAllFilters)
    {
        auto seeing = m_seeing.seeing(elapsed_s, f, status.airmass);
        status.fwhm_eff[filter_index(f)] = std::move(seeing.fwhm_effective);
        status.fwhm_geometric[filter_index(f)] = std::move(seeing.fwhm_geometric);
    }

    status.filter = filter;
    status.pointing = pointing;

    const auto twilight = m_kit.twilight_boundaries(mjd, m_config.twilight_limit_rad);
    status.next_twilight_start = twilight.next_start;
    status.next_twilight_end = twilight.next_end;
    status.last_twilight_end = twilight.last_end;

    const auto geometry = m_sky.sun_moon_geometry(mjd);
    status.sun_alt = geometry.sun_alt;
    status.moon_alt = geometry.moon_alt;
    status.moon_az = geometry.moon_az;
    status.moon_ra = geometry.moon_ra;
    status.moon_dec = geometry.moon_dec;
    status.moon_phase = geometry.moon_sun_sep / astro_constants::kPi * 100.0;

    MRD_CORE_DEBUG("Status sampled at MJD {:.6f} (night {}, clouds {:.2f}, sun {:.1f} deg)",
                   mjd, night, status.clouds, status.sun_alt * astro_constants::kRadToDeg);
    return status;
}

} // namespace meridian::observatory
