#pragma once

/// @file healpix.hpp
/// @brief HEALPix RING-scheme pixel indexing (Górski et al. 2005).

#include "astro/coordinates.hpp"
#include "core/types.hpp"

namespace meridian::astro
{
    /// @brief Static utility class for RING-ordered HEALPix maps.
    ///
    /// Positions are given as equatorial coordinates; RA maps to the HEALPix
    /// longitude φ and Dec to the colatitude θ = π/2 − Dec.
    class Healpix
    {
    public:
        Healpix() = delete;

        /// @brief Number of pixels for a resolution parameter: 12·nside².
        [[nodiscard]] static i64 npix(i32 nside);

        /// @brief Pixel index containing a sky position.
        [[nodiscard]] static i64 ang2pix(i32 nside, const EquatorialCoord& eq);

        /// @brief Pixel centre of a pixel index.
        [[nodiscard]] static EquatorialCoord pix2ang(i32 nside, i64 pix);

        /// @brief True when @p nside is a positive power of two.
        [[nodiscard]] static bool valid_nside(i32 nside);
    };

} // namespace meridian::astro
