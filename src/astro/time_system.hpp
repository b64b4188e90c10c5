#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: Julian Date, Modified Julian Date, sidereal time.

#include "core/types.hpp"

#include <string>

namespace meridian::astro
{
    /// @brief Civil date/time representation (UTC).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// The simulation clock runs in Modified Julian Date; the formulas below
    /// are expressed in Julian Date, so conversions are provided both ways.
    /// All angular results are in radians unless noted otherwise.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert a Julian Date to civil date/time (UTC), Meeus Ch. 7.
        /// @param jd Julian Date (must be positive).
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief MJD → JD.
        [[nodiscard]] static f64 mjd_to_jd(f64 mjd);

        /// @brief JD → MJD.
        [[nodiscard]] static f64 jd_to_mjd(f64 jd);

        /// @brief Compute Julian centuries elapsed since J2000.0.
        /// @return T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Greenwich Mean Sidereal Time (radians), IAU 1982, in [0, 2π).
        [[nodiscard]] static f64 gmst(f64 jd);

        /// @brief Local Mean Sidereal Time (radians), in [0, 2π).
        /// @param longitude_rad Observer longitude in radians (east positive).
        [[nodiscard]] static f64 lmst(f64 jd, f64 longitude_rad);

        /// @brief Format an MJD as "YYYY-MM-DD hh:mm:ss" UTC for log output.
        [[nodiscard]] static std::string format_mjd(f64 mjd);

        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);
    };

} // namespace meridian::astro
