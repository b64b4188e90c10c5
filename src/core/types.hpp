#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace meridian
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (double precision for astronomy)
    using Vec3d = glm::dvec3;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi          = glm::pi<f64>();
        constexpr f64 kTwoPi       = 2.0 * kPi;
        constexpr f64 kHalfPi      = kPi / 2.0;
        constexpr f64 kDegToRad    = kPi / 180.0;
        constexpr f64 kRadToDeg    = 180.0 / kPi;
        constexpr f64 kArcSecToRad = kPi / (180.0 * 3600.0);
        constexpr f64 kJ2000       = 2451545.0;  // Julian Date of J2000.0 epoch
        constexpr f64 kMjdOffset   = 2400000.5;  // JD - MJD
    }

    // Time constants
    namespace time_constants
    {
        constexpr f64 kSecondsPerDay = 86400.0;
        constexpr f64 kSecToDays     = 1.0 / kSecondsPerDay;
        constexpr f64 kMinutesPerDay = 1440.0;
        constexpr f64 kDaysPerYear   = 365.25;
    }

    /// Healpix UNSEEN sentinel for pixels that were not evaluated.
    constexpr f64 kUnseen = -1.6375e30;
}
