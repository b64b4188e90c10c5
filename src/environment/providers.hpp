#pragma once

/// @file providers.hpp
/// @brief Interfaces to the environment collaborators consulted by the simulation core.
///
/// The core never computes sky brightness, slew times, downtime calendars,
/// seeing or cloud cover itself; it asks these providers. Providers are
/// synchronous and side-effect free from the core's point of view, except for
/// DowntimeProvider's one-time calendar generation.

#include "astro/coordinates.hpp"
#include "astro/ephemeris.hpp"
#include "core/filter.hpp"
#include "core/types.hpp"

#include <optional>
#include <vector>

namespace meridian::environment
{
    /// @brief Per-pixel values of a RING-ordered healpix map (kUnseen = not evaluated).
    using PixelMap = std::vector<f64>;

    /// @brief Precomputed sky sampling timeline: instants and the solar altitude at each.
    struct SkyTimeline
    {
        std::vector<f64> mjds;      ///< Ascending sample instants [MJD]
        std::vector<f64> sun_alts;  ///< Solar altitude at each instant [rad]
    };

    // -----------------------------------------------------------------
    // Sky brightness and airmass
    // -----------------------------------------------------------------
    class SkyBrightnessProvider
    {
    public:
        virtual ~SkyBrightnessProvider() = default;

        /// @brief Sky surface brightness per filter per pixel [mag/arcsec²].
        [[nodiscard]] virtual PerFilter<PixelMap> magnitudes(f64 mjd) const = 0;

        /// @brief Sky brightness of one pixel in one filter, extrapolated below the horizon.
        [[nodiscard]] virtual f64 pixel_magnitude(f64 mjd, i64 hpid, Filter filter) const = 0;

        /// @brief Airmass per pixel.
        [[nodiscard]] virtual PixelMap airmass(f64 mjd) const = 0;

        [[nodiscard]] virtual astro::SunMoonGeometry sun_moon_geometry(f64 mjd) const = 0;

        /// @brief The precomputed timeline the provider was built over.
        [[nodiscard]] virtual const SkyTimeline& timeline() const = 0;
    };

    // -----------------------------------------------------------------
    // Telescope slew time
    // -----------------------------------------------------------------
    class SlewTimeModel
    {
    public:
        virtual ~SlewTimeModel() = default;

        /// @brief Time to move between two alt/az positions [s].
        [[nodiscard]] virtual f64 estimate(const astro::HorizontalCoord& from,
                                           const astro::HorizontalCoord& to) const = 0;
    };

    // -----------------------------------------------------------------
    // Scheduled + unscheduled downtime
    // -----------------------------------------------------------------
    class DowntimeProvider
    {
    public:
        virtual ~DowntimeProvider() = default;

        /// @brief Sorted list of fully closed night indices.
        /// @return std::nullopt if the underlying calendars are malformed.
        [[nodiscard]] virtual std::optional<std::vector<i32>> closed_nights() = 0;
    };

    // -----------------------------------------------------------------
    // Atmospheric seeing
    // -----------------------------------------------------------------

    /// @brief Seeing for one filter: zenith value and per-pixel delivered FWHMs [arcsec].
    struct SeeingMaps
    {
        f64 fwhm_500;               ///< Zenith atmospheric seeing at 500nm
        PixelMap fwhm_geometric;    ///< Geometric FWHM (PSF size)
        PixelMap fwhm_effective;    ///< Effective FWHM (noise-equivalent area)
    };

    class SeeingProvider
    {
    public:
        virtual ~SeeingProvider() = default;

        /// @param elapsed_s Seconds since the simulation start.
        /// @param filter    Bandpass.
        /// @param airmass   Per-pixel airmass (kUnseen entries stay kUnseen).
        [[nodiscard]] virtual SeeingMaps seeing(f64 elapsed_s, Filter filter,
                                                const PixelMap& airmass) const = 0;
    };

    // -----------------------------------------------------------------
    // Cloud cover
    // -----------------------------------------------------------------
    class CloudProvider
    {
    public:
        virtual ~CloudProvider() = default;

        /// @brief Fraction of the sky covered by cloud, in [0, 1].
        [[nodiscard]] virtual f64 cloud_fraction(f64 elapsed_s) const = 0;
    };

} // namespace meridian::environment
