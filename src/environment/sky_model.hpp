#pragma once

/// @file sky_model.hpp
/// @brief Analytic sky surface brightness over a healpix grid.

#include "astro/astronomy_kit.hpp"
#include "environment/providers.hpp"

#include <vector>

namespace meridian::environment
{
    /// @brief Closed-form sky brightness: dark sky with airglow, twilight and moonlight.
    ///
    /// Components are summed in flux:
    ///  - Dark sky: per-filter zenith magnitude, brightening toward the horizon
    ///  - Twilight: exponential in solar altitude above -18°, strongest toward the Sun
    ///  - Moonlight: scaled by illuminated fraction and proximity to the Moon
    ///
    /// Pixel centres are computed once at construction. The sampling timeline
    /// (instants and solar altitudes) covers [start_mjd, start_mjd + span_days]
    /// in steps of step_days.
    class AnalyticSkyModel final : public SkyBrightnessProvider
    {
    public:
        /// @param kit        Site geometry; must outlive the model.
        /// @param start_mjd  First timeline instant.
        /// @param span_days  Timeline length.
        /// @param step_days  Timeline spacing.
        AnalyticSkyModel(const astro::AstronomyKit& kit, f64 start_mjd,
                         f64 span_days, f64 step_days);

        [[nodiscard]] PerFilter<PixelMap> magnitudes(f64 mjd) const override;
        [[nodiscard]] f64 pixel_magnitude(f64 mjd, i64 hpid, Filter filter) const override;
        [[nodiscard]] PixelMap airmass(f64 mjd) const override;
        [[nodiscard]] astro::SunMoonGeometry sun_moon_geometry(f64 mjd) const override;
        [[nodiscard]] const SkyTimeline& timeline() const override { return m_timeline; }

        /// @brief Dark-sky zenith brightness per filter [mag/arcsec²].
        static constexpr PerFilter<f64> kDarkZenithMag{22.95, 22.24, 21.20, 20.47, 19.60, 18.63};

        /// @brief Brightening per degree of solar altitude above -18° [mag/deg].
        static constexpr PerFilter<f64> kTwilightSlope{0.22, 0.28, 0.30, 0.30, 0.28, 0.26};

        /// @brief Zenith moonlight flux at full moon, relative to the dark zenith flux.
        static constexpr PerFilter<f64> kMoonScale{20.0, 15.0, 9.0, 6.0, 4.0, 3.0};

    private:
        /// @brief Magnitude of one sky position, given the pixel's alt/az and the sun/moon state.
        [[nodiscard]] f64 sky_magnitude(const astro::HorizontalCoord& pixel,
                                        const astro::SunMoonGeometry& geometry,
                                        Filter filter) const;

        const astro::AstronomyKit& m_kit;
        std::vector<astro::EquatorialCoord> m_pixel_centres;
        SkyTimeline m_timeline;
    };

} // namespace meridian::environment
