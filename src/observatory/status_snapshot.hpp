#pragma once

/// @file status_snapshot.hpp
/// @brief Full observatory and sky status at one instant, and the sampler that builds it.

#include "astro/astronomy_kit.hpp"
#include "core/config.hpp"
#include "core/filter.hpp"
#include "environment/providers.hpp"

#include <optional>

namespace meridian::observatory
{
    class SlewCostEstimator;

    /// @brief Everything a scheduler may want to know about "now".
    ///
    /// Per-pixel maps are RING-ordered at the configured nside; entries that were
    /// not evaluated hold kUnseen. Angles are radians.
    struct StatusSnapshot
    {
        f64 mjd = 0.0;
        i32 night = 0;
        f64 lmst = 0.0;

        PerFilter<environment::PixelMap> sky_brightness;    ///< [mag/arcsec²]
        environment::PixelMap slew_times;                   ///< [s]; empty when parked
        environment::PixelMap airmass;
        f64 clouds = 0.0;
        PerFilter<environment::PixelMap> fwhm_eff;          ///< [arcsec]
        PerFilter<environment::PixelMap> fwhm_geometric;    ///< [arcsec]

        std::optional<Filter> filter;
        std::optional<astro::EquatorialCoord> pointing;

        std::optional<f64> next_twilight_start;
        std::optional<f64> next_twilight_end;
        std::optional<f64> last_twilight_end;

        f64 sun_alt = 0.0;
        f64 moon_alt = 0.0;
        f64 moon_az = 0.0;
        f64 moon_ra = 0.0;
        f64 moon_dec = 0.0;
        f64 moon_phase = 0.0;   ///< Sun-moon elongation scaled to [0, 100]
    };

    /// @brief Queries every provider to assemble a StatusSnapshot.
    class StatusSampler
    {
    public:
        StatusSampler(const core::ObservatoryConfig& config,
                      const astro::AstronomyKit& kit,
                      const environment::SkyBrightnessProvider& sky,
                      const environment::SeeingProvider& seeing,
                      const environment::CloudProvider& clouds,
                      const SlewCostEstimator& slew);

        [[nodiscard]] StatusSnapshot sample(f64 mjd, i32 night,
                                            const std::optional<astro::EquatorialCoord>& pointing,
                                            std::optional<Filter> filter) const;

    private:
        core::ObservatoryConfig m_config;
        const astro::AstronomyKit& m_kit;
        const environment::SkyBrightnessProvider& m_sky;
        const environment::SeeingProvider& m_seeing;
        const environment::CloudProvider& m_clouds;
        const SlewCostEstimator& m_slew;
    };

} // namespace meridian::observatory
