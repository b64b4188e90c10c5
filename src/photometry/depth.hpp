#pragma once
// photometry/depth.hpp - Five-sigma point source depth of a visit
//
// Flat-SED m5 from the survey camera's throughput-derived constants:
//   m5 = Cm + dCm + 0.5 (msky - 21) + 2.5 log10(0.7 / FWHMeff)
//        + 1.25 log10(t / 30) - kAtm (X - 1)
// dCm corrects Cm for readout-noise-limited (short or dark) exposures.

#include "core/filter.hpp"
#include "core/types.hpp"

#include <cmath>

namespace meridian::photometry {

// -----------------------------------------------------------------------
// Per-filter constants (u g r i z y)
// -----------------------------------------------------------------------
struct DepthConstants {
    PerFilter<f64> cm{22.74, 24.38, 24.43, 24.30, 24.15, 23.70};
    PerFilter<f64> dcm_infinity{0.75, 0.19, 0.10, 0.07, 0.05, 0.04};
    PerFilter<f64> k_atm{0.50, 0.21, 0.13, 0.10, 0.07, 0.18};
    PerFilter<f64> msky_dark{22.95, 22.24, 21.20, 20.47, 19.60, 18.63};
};

inline constexpr f64 kReferenceExptime = 30.0;   ///< [s]
inline constexpr f64 kReferenceFwhm    = 0.7;    ///< [arcsec]

/// Five-sigma limiting magnitude of a point source.
/// @param sky_brightness  Sky surface brightness [mag/arcsec²]
/// @param fwhm_eff        Effective FWHM [arcsec]
/// @param exptime_s       Open-shutter time [s]
/// @param airmass         Airmass (>= 1)
inline f64 five_sigma_depth(Filter filter, f64 sky_brightness, f64 fwhm_eff,
                            f64 exptime_s, f64 airmass,
                            const DepthConstants& c = {}) {
    const auto fi = filter_index(filter);

    const f64 t_ratio = exptime_s / kReferenceExptime;
    const f64 t_scale = t_ratio * std::pow(10.0, -0.4 * (sky_brightness - c.msky_dark[fi]));
    const f64 dcm = c.dcm_infinity[fi]
                  - 1.25 * std::log10(1.0 + (std::pow(10.0, 0.8 * c.dcm_infinity[fi]) - 1.0) / t_scale);

    return c.cm[fi] + dcm
         + 0.5 * (sky_brightness - 21.0)
         + 2.5 * std::log10(kReferenceFwhm / fwhm_eff)
         + 1.25 * std::log10(t_ratio)
         - c.k_atm[fi] * (airmass - 1.0);
}

} // namespace meridian::photometry
