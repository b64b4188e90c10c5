#pragma once

/// @file ephemeris.hpp
/// @brief Low-precision solar and lunar ephemeris, horizon-crossing search.
///
/// Every function is pure: the observer site, the instant and the horizon
/// altitude are explicit arguments, so there is no shared observer object
/// whose date or horizon gets mutated between calls.

#include "astro/coordinates.hpp"
#include "core/types.hpp"

#include <optional>

namespace meridian::astro
{
    /// @brief Direction in which a body crosses a horizon altitude.
    enum class Crossing
    {
        Rising,     ///< Altitude increasing through the horizon
        Setting,    ///< Altitude decreasing through the horizon
    };

    /// @brief Direction of a crossing search relative to the start instant.
    enum class SearchDirection
    {
        Forward,
        Backward,
    };

    /// @brief Sun and moon geometry at a single instant (radians).
    struct SunMoonGeometry
    {
        f64 sun_alt;
        f64 sun_az;
        f64 moon_alt;
        f64 moon_az;
        f64 moon_ra;
        f64 moon_dec;
        f64 moon_sun_sep;   ///< Sun-moon elongation (radians, 0 = new moon)
    };

    /// @brief Static utility class for solar/lunar positions.
    ///
    /// Solar position follows the Astronomical Almanac low-precision formulae
    /// (~0.01° between 1950 and 2050). The lunar position keeps the leading
    /// periodic terms (~0.3°), geocentric. Both are adequate for darkness and
    /// moon-avoidance decisions; neither is an astrometric reference.
    class Ephemeris
    {
    public:
        Ephemeris() = delete;

        /// @brief Apparent geocentric equatorial position of the Sun.
        [[nodiscard]] static EquatorialCoord sun_position(f64 mjd);

        /// @brief Geocentric equatorial position of the Moon.
        [[nodiscard]] static EquatorialCoord moon_position(f64 mjd);

        /// @brief Altitude of the Sun's centre (radians), no refraction.
        [[nodiscard]] static f64 solar_altitude(const ObserverLocation& site, f64 mjd);

        /// @brief Sun/moon altitude, azimuth and elongation for a site.
        [[nodiscard]] static SunMoonGeometry sun_moon_geometry(const ObserverLocation& site,
                                                               f64 mjd);

        /// @brief Find the instant at which the Sun's centre crosses @p horizon_rad.
        ///
        /// Brackets are aligned to a fixed grid of kSearchStepDays so repeated
        /// searches from nearby start instants converge on bit-identical results.
        ///
        /// @param site         Observer location.
        /// @param start_mjd    Search origin; the result is strictly before it
        ///                     (Backward) or strictly after it (Forward).
        /// @param horizon_rad  Altitude threshold (radians).
        /// @param crossing     Rising or setting event.
        /// @param direction    Search forward or backward in time.
        /// @return Crossing instant (MJD), or std::nullopt when the Sun does not
        ///         cross the threshold within kSearchWindowDays (polar day/night).
        [[nodiscard]] static std::optional<f64> find_sun_crossing(
            const ObserverLocation& site,
            f64 start_mjd,
            f64 horizon_rad,
            Crossing crossing,
            SearchDirection direction);

        static constexpr f64 kSearchStepDays   = 1.0 / 48.0;  // 30 minutes
        static constexpr f64 kSearchWindowDays = 2.0;
        static constexpr f64 kCrossingTolDays  = 1e-7;        // ~9 ms
    };

} // namespace meridian::astro
