#pragma once

/// @file coordinates.hpp
/// @brief Astronomical coordinate transforms: Equatorial, Horizontal, unit vectors.

#include "core/types.hpp"

namespace meridian::astro
{
    /// @brief Equatorial coordinate (J2000 epoch).
    struct EquatorialCoord
    {
        f64 ra;     ///< Right ascension (radians, 0..2π)
        f64 dec;    ///< Declination (radians, -π/2..+π/2)
    };

    /// @brief Horizontal (topocentric) coordinate.
    struct HorizontalCoord
    {
        f64 alt;    ///< Altitude (radians, -π/2..+π/2, negative = below horizon)
        f64 az;     ///< Azimuth (radians, 0..2π, 0=North, π/2=East)
    };

    /// @brief Observer geographic location.
    struct ObserverLocation
    {
        f64 latitude_rad;   ///< Geographic latitude (radians, north positive)
        f64 longitude_rad;  ///< Geographic longitude (radians, east positive)
        f64 elevation_m;    ///< Height above sea level (meters)
    };

    /// @brief Static utility class for astronomical coordinate transformations.
    ///
    /// All angular inputs and outputs are in radians.
    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Equatorial (RA/Dec J2000) → Horizontal (Alt/Az).
        /// @param eq Equatorial coordinates of the object.
        /// @param observer Observer geographic location.
        /// @param local_sidereal_time_rad Local Mean Sidereal Time (radians).
        [[nodiscard]] static HorizontalCoord equatorial_to_horizontal(
            const EquatorialCoord& eq,
            const ObserverLocation& observer,
            f64 local_sidereal_time_rad
        );

        /// @brief Equatorial → Horizontal at a simulation instant (MJD).
        ///
        /// Convenience wrapper computing LMST from the observer longitude.
        [[nodiscard]] static HorizontalCoord radec_to_altaz(
            const EquatorialCoord& eq,
            const ObserverLocation& observer,
            f64 mjd
        );

        /// @brief Cartesian unit vector for a (longitude-like, latitude-like) pair.
        [[nodiscard]] static Vec3d to_unit_vector(f64 lon, f64 lat);

        /// @brief Great-circle separation between two equatorial positions (radians).
        [[nodiscard]] static f64 angular_separation(const EquatorialCoord& a,
                                                    const EquatorialCoord& b);

        /// @brief Plane-parallel airmass sec(z) at a given altitude.
        /// Always >= 1; returns kUnseen for altitudes at or below the horizon.
        [[nodiscard]] static f64 airmass(f64 alt_rad);
    };

} // namespace meridian::astro
