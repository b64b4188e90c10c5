#pragma once

/// @file config.hpp
/// @brief Simulation configuration: observatory timing, gating limits, built-in environment.

#include "astro/coordinates.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <string>

namespace meridian::core
{
    /// @brief Observatory timing and gating parameters.
    ///
    /// Angles are stored in radians; each horizon angle has its own field so the
    /// darkness limit, the pointing altitude limit and the twilight limit are
    /// never confused with one another.
    struct ObservatoryConfig
    {
        astro::ObserverLocation site{
            .latitude_rad  = -30.2446 * astro_constants::kDegToRad,
            .longitude_rad = -70.7494 * astro_constants::kDegToRad,
            .elevation_m   = 2650.0,
        };

        f64 mjd_start = 59853.5;            ///< Initial clock value [MJD]

        f64 readtime_s = 2.0;               ///< Readout time between exposures [s]
        f64 filter_change_s = 140.0;        ///< Filter change duration [s]
        f64 shutter_s = 1.0;                ///< Shutter open + close per exposure [s]
        f64 min_slew_s = 2.0;               ///< Slew charged for a zero-displacement move [s]

        i32 nside = 32;                     ///< Healpix resolution of the status maps

        f64 sun_limit_rad      = -13.0 * astro_constants::kDegToRad;  ///< Darkness limit
        f64 alt_limit_rad      =  20.0 * astro_constants::kDegToRad;  ///< Lowest slew-map altitude
        f64 twilight_limit_rad = -18.0 * astro_constants::kDegToRad;  ///< Twilight boundary limit

        f64 cloud_limit = 0.699;            ///< Close for cloud fraction >= this
        f64 cloud_step_days = 15.0 / time_constants::kMinutesPerDay;  ///< Cloud retry cadence
        f64 fallback_jump_days = 0.25;      ///< Jump when the dark timeline is exhausted

        i32 horizon_years = 13;             ///< Sunset table horizon [years]
        f64 day_padding = 50.0;             ///< Extra days appended to the sunset table
    };

    /// @brief Parameters of the built-in environment providers.
    struct EnvironmentConfig
    {
        i64 seed = -1;                      ///< Unscheduled downtime seed (<0: fixed default stream)
        bool unscheduled_downtime = true;   ///< Generate random unscheduled downtime

        f64 sky_timeline_days = 365.25;     ///< Span of the precomputed sky timeline [days]
        f64 sky_timeline_step_days = 5.0 / time_constants::kMinutesPerDay;

        f64 seeing_fwhm500_arcsec = 0.7;    ///< Zenith seeing at 500nm when no series is given
        std::string seeing_file;            ///< Optional CSV: elapsed_s, fwhm500_arcsec

        f64 cloud_fraction = 0.0;           ///< Constant cloud fraction when no series is given
        std::string cloud_file;             ///< Optional CSV: elapsed_s, cloud_fraction

        f64 slew_axis_rate_rad_s  = 3.5 * astro_constants::kDegToRad;  ///< Max axis speed
        f64 slew_axis_accel_rad_s2 = 3.5 * astro_constants::kDegToRad; ///< Axis acceleration
        f64 slew_settle_s = 3.0;            ///< Settle time after any motion [s]
    };

    /// @brief Everything a driver needs to assemble a simulation.
    struct SimulationConfig
    {
        ObservatoryConfig observatory;
        EnvironmentConfig environment;
        LogConfig log;
        i32 attempts = 2000;                ///< Demo driver: number of observation attempts
    };

    /// @brief Check ranges and internal consistency; logs every violation.
    /// @return true when the configuration is usable.
    [[nodiscard]] bool validate(const ObservatoryConfig& config);

    /// @brief Check the built-in provider parameters; logs every violation.
    [[nodiscard]] bool validate(const EnvironmentConfig& config);

    /// @brief Rubin Observatory site on Cerro Pachón (the default).
    [[nodiscard]] astro::ObserverLocation make_rubin_site();

    /// @brief Kitt Peak National Observatory site.
    [[nodiscard]] astro::ObserverLocation make_kitt_peak_site();

} // namespace meridian::core
