/// @file healpix.cpp
/// @brief Implementation of RING-scheme HEALPix indexing.

#include "astro/healpix.hpp"

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <cmath>

namespace meridian::astro
{

namespace
{
    constexpr f64 kHalfPi = astro_constants::kHalfPi;

    i64 isqrt(i64 v)
    {
        auto r = static_cast<i64>(std::sqrt(static_cast<f64>(v) + 0.5));
        while (r * r > v)
        {
            --r;
        }
        while ((r + 1) * (r + 1) <= v)
        {
            ++r;
        }
        return r;
    }

    i64 imodulo(i64 v, i64 m)
    {
        const i64 r = v % m;
        return (r < 0) ? r + m : r;
    }
} // namespace

i64 Healpix::npix(i32 nside)
{
    return 12 * static_cast<i64>(nside) * static_cast<i64>(nside);
}

bool Healpix::valid_nside(i32 nside)
{
    return nside > 0 && (nside & (nside - 1)) == 0;
}

// -----------------------------------------------------------------
// ang2pix (RING)
//
// z = cos θ, tt = φ / (π/2) ∈ [0, 4)
// Equatorial belt (|z| ≤ 2/3): pixel boundaries are straight lines in
// (tt, z); polar caps: rings of 4·i pixels indexed by their distance
// from the pole.
// -----------------------------------------------------------------

i64 Healpix::ang2pix(i32 nside, const EquatorialCoord& eq)
{
    const i64 ns = nside;
    const f64 z = std::clamp(std::sin(eq.dec), -1.0, 1.0);
    const f64 za = std::abs(z);
    const f64 tt = TimeSystem::normalize_radians(eq.ra) / kHalfPi;

    if (za <= 2.0 / 3.0)
    {
        const f64 temp1 = static_cast<f64>(ns) * (0.5 + tt);
        const f64 temp2 = static_cast<f64>(ns) * z * 0.75;
        const auto jp = static_cast<i64>(temp1 - temp2);  // ascending edge line index
        const auto jm = static_cast<i64>(temp1 + temp2);  // descending edge line index

        const i64 ir = ns + 1 + jp - jm;                  // ring number in {1, 2n+1}
        const i64 kshift = 1 - (ir & 1);
        const i64 ip = imodulo((jp + jm - ns + kshift + 1) / 2, 4 * ns);

        const i64 ncap = 2 * ns * (ns - 1);
        return ncap + (ir - 1) * 4 * ns + ip;
    }

    const f64 tp = tt - std::floor(tt);
    const f64 tmp = static_cast<f64>(ns) * std::sqrt(3.0 * (1.0 - za));

    const auto jp = static_cast<i64>(tp * tmp);
    const auto jm = static_cast<i64>((1.0 - tp) * tmp);

    const i64 ir = jp + jm + 1;                           // ring number counted from the pole
    const i64 ip = imodulo(static_cast<i64>(tt * static_cast<f64>(ir)), 4 * ir);

    if (z > 0.0)
    {
        return 2 * ir * (ir - 1) + ip;
    }
    return npix(nside) - 2 * ir * (ir + 1) + ip;
}

// -----------------------------------------------------------------
// pix2ang (RING)
// -----------------------------------------------------------------

EquatorialCoord Healpix::pix2ang(i32 nside, i64 pix)
{
    const i64 ns = nside;
    const i64 n_pix = npix(nside);
    const i64 ncap = 2 * ns * (ns - 1);
    const f64 fact2 = 4.0 / static_cast<f64>(n_pix);

    f64 z = 0.0;
    f64 phi = 0.0;

    if (pix < ncap)
    {
        // North polar cap
        const i64 iring = (1 + isqrt(1 + 2 * pix)) >> 1;
        const i64 iphi = pix + 1 - 2 * iring * (iring - 1);
        z = 1.0 - static_cast<f64>(iring * iring) * fact2;
        phi = (static_cast<f64>(iphi) - 0.5) * kHalfPi / static_cast<f64>(iring);
    }
    else if (pix < n_pix - ncap)
    {
        // Equatorial belt
        const f64 fact1 = static_cast<f64>(2 * ns) * fact2;
        const i64 ip = pix - ncap;
        const i64 iring = ip / (4 * ns) + ns;
        const i64 iphi = ip % (4 * ns) + 1;
        const f64 fodd = ((iring + ns) & 1) ? 1.0 : 0.5;
        z = static_cast<f64>(2 * ns - iring) * fact1;
        phi = (static_cast<f64>(iphi) - fodd) * astro_constants::kPi / static_cast<f64>(2 * ns);
    }
    else
    {
        // South polar cap
        const i64 ip = n_pix - pix;
        const i64 iring = (1 + isqrt(2 * ip - 1)) >> 1;
        const i64 iphi = 4 * iring + 1 - (ip - 2 * iring * (iring - 1));
        z = -1.0 + static_cast<f64>(iring * iring) * fact2;
        phi = (static_cast<f64>(iphi) - 0.5) * kHalfPi / static_cast<f64>(iring);
    }

    return EquatorialCoord{
        .ra  = phi,
        .dec = std::asin(std::clamp(z, -1.0, 1.0)),
    };
}

} // namespace meridian::astro
