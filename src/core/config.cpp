/// @file config.cpp
/// @brief Configuration validation and site presets.

#include "core/config.hpp"

#include "astro/healpix.hpp"
#include "core/logger.hpp"

#include <cmath>

namespace meridian::core
{

namespace
{
    constexpr f64 kDeg = astro_constants::kDegToRad;
} // namespace

bool validate(const ObservatoryConfig& config)
{
    bool ok = true;

    auto require = [&ok](bool condition, const char* message)
    {
        if (!condition)
        {
            MRD_CORE_ERROR("Config: {}", message);
            ok = false;
        }
    };

    require(std::abs(config.site.latitude_rad) <= astro_constants::kHalfPi,
            "site latitude must be within [-90, 90] degrees");
    require(std::isfinite(config.site.longitude_rad), "site longitude must be finite");
    require(std::isfinite(config.mjd_start), "mjd_start must be finite");
    require(config.readtime_s >= 0.0, "readtime must be non-negative");
    require(config.filter_change_s >= 0.0, "filter change time must be non-negative");
    require(config.shutter_s >= 0.0, "shutter time must be non-negative");
    require(config.min_slew_s >= 0.0, "minimum slew time must be non-negative");
    require(astro::Healpix::valid_nside(config.nside), "nside must be a positive power of two");
    require(std::abs(config.sun_limit_rad) <= astro_constants::kHalfPi,
            "sun limit must be within [-90, 90] degrees");
    require(std::abs(config.alt_limit_rad) <= astro_constants::kHalfPi,
            "altitude limit must be within [-90, 90] degrees");
    require(std::abs(config.twilight_limit_rad) <= astro_constants::kHalfPi,
            "twilight limit must be within [-90, 90] degrees");
    require(config.cloud_limit >= 0.0 && config.cloud_limit <= 1.0,
            "cloud limit must be within [0, 1]");
    require(config.cloud_step_days > 0.0, "cloud step must be positive");
    require(config.fallback_jump_days > 0.0, "fallback jump must be positive");
    require(config.horizon_years > 0, "sunset horizon must be at least one year");
    require(config.day_padding >= 0.0, "day padding must be non-negative");

    return ok;
}

bool validate(const EnvironmentConfig& config)
{
    bool ok = true;

    auto require = [&ok](bool condition, const char* message)
    {
        if (!condition)
        {
            MRD_CORE_ERROR("Config: {}", message);
            ok = false;
        }
    };

    require(config.sky_timeline_days > 0.0, "sky timeline span must be positive");
    require(config.sky_timeline_step_days > 0.0, "sky timeline step must be positive");
    require(config.seeing_fwhm500_arcsec > 0.0, "seeing must be positive");
    require(config.cloud_fraction >= 0.0 && config.cloud_fraction <= 1.0,
            "cloud fraction must be within [0, 1]");
    require(config.slew_axis_rate_rad_s > 0.0, "slew rate must be positive");
    require(config.slew_axis_accel_rad_s2 > 0.0, "slew acceleration must be positive");
    require(config.slew_settle_s >= 0.0, "settle time must be non-negative");

    return ok;
}

astro::ObserverLocation make_rubin_site()
{
    return astro::ObserverLocation{
        .latitude_rad  = -30.2446 * kDeg,
        .longitude_rad = -70.7494 * kDeg,
        .elevation_m   = 2650.0,
    };
}

astro::ObserverLocation make_kitt_peak_site()
{
    return astro::ObserverLocation{
        .latitude_rad  = 31.9583 * kDeg,
        .longitude_rad = -111.5967 * kDeg,
        .elevation_m   = 2096.0,
    };
}

} // namespace meridian::core
