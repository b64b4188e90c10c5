#pragma once

/// @file astronomy_kit.hpp
/// @brief Site-bound celestial geometry service used by the simulation core.

#include "astro/coordinates.hpp"
#include "astro/ephemeris.hpp"
#include "core/types.hpp"

#include <optional>

namespace meridian::astro
{
    /// @brief Twilight instants around a reference time (MJD).
    ///
    /// Each entry is absent when the Sun does not cross the twilight limit
    /// within the ephemeris search window.
    struct TwilightBoundaries
    {
        std::optional<f64> next_start;  ///< Next morning twilight (Sun rising through the limit)
        std::optional<f64> next_end;    ///< Next evening twilight end (Sun setting through the limit)
        std::optional<f64> last_end;    ///< Most recent evening twilight end
    };

    /// @brief Coordinate transforms, solar ephemeris and sky pixelization for one site.
    ///
    /// The simulation core depends on this interface only; the ephemeris and
    /// pixelization behind it may be swapped for a higher-precision service.
    class AstronomyKit
    {
    public:
        virtual ~AstronomyKit() = default;

        [[nodiscard]] virtual const ObserverLocation& site() const = 0;

        /// @brief Healpix nside used by healpix_index().
        [[nodiscard]] virtual i32 nside() const = 0;

        [[nodiscard]] virtual HorizontalCoord radec_to_altaz(const EquatorialCoord& eq,
                                                             f64 mjd) const = 0;

        /// @brief Local mean sidereal time (radians).
        [[nodiscard]] virtual f64 lmst(f64 mjd) const = 0;

        /// @brief Altitude of the Sun's centre (radians).
        [[nodiscard]] virtual f64 solar_altitude(f64 mjd) const = 0;

        /// @brief Most recent sunset (Sun's centre through 0°) strictly before @p mjd.
        /// @return std::nullopt if the ephemeris cannot locate one.
        [[nodiscard]] virtual std::optional<f64> previous_sunset(f64 mjd) const = 0;

        [[nodiscard]] virtual TwilightBoundaries twilight_boundaries(f64 mjd,
                                                                     f64 limit_rad) const = 0;

        [[nodiscard]] virtual i64 healpix_index(const EquatorialCoord& eq) const = 0;
    };

    /// @brief AstronomyKit backed by the built-in low-precision ephemeris.
    class SiteAstronomyKit final : public AstronomyKit
    {
    public:
        SiteAstronomyKit(const ObserverLocation& site, i32 nside);

        [[nodiscard]] const ObserverLocation& site() const override { return m_site; }
        [[nodiscard]] i32 nside() const override { return m_nside; }

        [[nodiscard]] HorizontalCoord radec_to_altaz(const EquatorialCoord& eq,
                                                     f64 mjd) const override;
        [[nodiscard]] f64 lmst(f64 mjd) const override;
        [[nodiscard]] f64 solar_altitude(f64 mjd) const override;
        [[nodiscard]] std::optional<f64> previous_sunset(f64 mjd) const override;
        [[nodiscard]] TwilightBoundaries twilight_boundaries(f64 mjd,
                                                             f64 limit_rad) const override;
        [[nodiscard]] i64 healpix_index(const EquatorialCoord& eq) const override;

    private:
        ObserverLocation m_site;
        i32 m_nside;
    };

} // namespace meridian::astro
