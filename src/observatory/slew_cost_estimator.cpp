/// @file slew_cost_estimator.cpp
/// @brief Implementation of the repositioning cost rules.

#include "observatory/slew_cost_estimator.hpp"

#include "astro/healpix.hpp"

namespace meridian::observatory
{

SlewCostEstimator::SlewCostEstimator(const core::ObservatoryConfig& config,
                                     const astro::AstronomyKit& kit,
                                     const environment::SlewTimeModel& model)
    : m_config{config}
    , m_kit{kit}
    , m_model{model}
{
    const i64 npix = astro::Healpix::npix(kit.nside());
    m_pixel_centres.reserve(static_cast<std::size_t>(npix));
    for (i64 pix = 0; pix < npix; ++pix)
    {
        m_pixel_centres.push_back(astro::Healpix::pix2ang(kit.nside(), pix));
    }
}

SlewCost SlewCostEstimator::cost(const std::optional<astro::EquatorialCoord>& current,
                                 std::optional<Filter> current_filter,
                                 const astro::EquatorialCoord& target,
                                 Filter target_filter,
                                 f64 mjd) const
{
    if (!current)
    {
        return SlewCost{};
    }

    if (current_filter != target_filter)
    {
        return SlewCost{.filter_change_s = m_config.filter_change_s, .slew_s = 0.0};
    }

    const auto from = m_kit.radec_to_altaz(*current, mjd);
    const auto to = m_kit.radec_to_altaz(target, mjd);
    return SlewCost{.filter_change_s = 0.0, .slew_s = slew_between(from, to)};
}

f64 SlewCostEstimator::slew_between(const astro::HorizontalCoord& from,
                                    const astro::HorizontalCoord& to) const
{
    // The model is unreliable at zero displacement
    if (from.alt == to.alt && from.az == to.az)
    {
        return m_config.min_slew_s;
    }
    return m_model.estimate(from, to);
}

f64 SlewCostEstimator::visit_duration_s(const SlewCost& cost, f64 exptime_s, i32 nexp) const
{
    return cost.total_s()
         + exptime_s
         + static_cast<f64>(nexp - 1) * m_config.readtime_s
         + static_cast<f64>(nexp) * m_config.shutter_s;
}

environment::PixelMap SlewCostEstimator::slew_time_map(
    const std::optional<astro::EquatorialCoord>& pointing, f64 mjd) const
{
    if (!pointing)
    {
        return {};
    }

    const auto from = m_kit.radec_to_altaz(*pointing, mjd);

    environment::PixelMap map(m_pixel_centres.size(), kUnseen);
    for (std::size_t pix = 0; pix < m_pixel_centres.size(); ++pix)
    {
        const auto to = m_kit.radec_to_altaz(m_pixel_centres[pix], mjd);
        if (to.alt >= m_config.alt_limit_rad)
        {
            map[pix] = slew_between(from, to);
        }
    }
    return map;
}

} // namespace meridian::observatory
