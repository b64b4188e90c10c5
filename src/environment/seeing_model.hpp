#pragma once
// environment/seeing_model.hpp - Delivered image quality per filter and pixel
//
// Models:
//  - Zenith atmospheric seeing at 500nm as a time series
//  - Kolmogorov scaling with airmass (X^0.6) and wavelength (λ^-0.2)
//  - Fixed system (telescope + optics + camera) contribution
//  - Effective (noise-equivalent) and geometric FWHM

#include "environment/providers.hpp"
#include "environment/time_series.hpp"

#include <cmath>
#include <utility>

namespace meridian::environment {

class SeeingTimeSeries final : public SeeingProvider {
public:
    /// System contribution at zenith [arcsec]
    static constexpr f64 kSystemFwhmZenith = 0.4626;
    /// Ratio between effective FWHM and quadrature sum of components
    static constexpr f64 kEffectiveScale = 1.16;
    static constexpr f64 kAtmosphericWeight = 1.04;

    explicit SeeingTimeSeries(f64 constant_fwhm500_arcsec)
        : m_fwhm500(constant_fwhm500_arcsec) {}

    explicit SeeingTimeSeries(TimeSeries fwhm500_series)
        : m_fwhm500(std::move(fwhm500_series)) {}

    SeeingMaps seeing(f64 elapsed_s, Filter filter,
                      const PixelMap& airmass) const override {
        SeeingMaps out{
            .fwhm_500       = m_fwhm500.value_at(elapsed_s),
            .fwhm_geometric = PixelMap(airmass.size(), kUnseen),
            .fwhm_effective = PixelMap(airmass.size(), kUnseen),
        };

        for (std::size_t i = 0; i < airmass.size(); ++i) {
            if (airmass[i] == kUnseen) continue;
            const f64 eff = effectiveFwhm(out.fwhm_500, filter, airmass[i]);
            out.fwhm_effective[i] = eff;
            out.fwhm_geometric[i] = geometricFwhm(eff);
        }
        return out;
    }

    /// Atmospheric FWHM [arcsec] at a given filter and airmass.
    static f64 atmosphericFwhm(f64 fwhm500, Filter filter, f64 airmass) {
        const f64 lambda_ratio = kFilterWavelengthNm[filter_index(filter)] / 500.0;
        return fwhm500 * std::pow(airmass, 0.6) * std::pow(lambda_ratio, -0.2);
    }

    /// Effective FWHM combining system and atmosphere in quadrature.
    static f64 effectiveFwhm(f64 fwhm500, Filter filter, f64 airmass) {
        const f64 sys = kSystemFwhmZenith * std::pow(airmass, 0.6);
        const f64 atm = atmosphericFwhm(fwhm500, filter, airmass);
        return kEffectiveScale * std::sqrt(sys*sys + kAtmosphericWeight * atm*atm);
    }

    /// Geometric FWHM from effective FWHM (linear fit to PSF simulations).
    static f64 geometricFwhm(f64 fwhm_eff) {
        return 0.822 * fwhm_eff + 0.052;
    }

private:
    TimeSeries m_fwhm500;
};

} // namespace meridian::environment
