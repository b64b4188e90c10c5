/// @file visibility_gate.cpp
/// @brief Implementation of cloud, darkness and downtime gating.

#include "observatory/visibility_gate.hpp"

#include "astro/time_system.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <utility>

namespace meridian::observatory
{

VisibilityGate::VisibilityGate(const core::ObservatoryConfig& config,
                               const astro::AstronomyKit& kit,
                               const environment::SkyBrightnessProvider& sky,
                               const environment::CloudProvider& clouds,
                               const NightBoundaryIndex& nights,
                               std::vector<i32> closed_nights)
    : m_config{config}
    , m_kit{kit}
    , m_sky{sky}
    , m_clouds{clouds}
    , m_nights{nights}
    , m_closed_nights{std::move(closed_nights)}
{
    std::sort(m_closed_nights.begin(), m_closed_nights.end());
}

f64 VisibilityGate::elapsed_seconds(f64 mjd) const
{
    return (mjd - m_config.mjd_start) * time_constants::kSecondsPerDay;
}

bool VisibilityGate::is_closed_night(i32 night) const
{
    return std::binary_search(m_closed_nights.begin(), m_closed_nights.end(), night);
}

GateDecision VisibilityGate::is_observable(f64 mjd)
{
    // -----------------------------------------------------------------
    // 1. Clouds: short fixed retry cadence
    // -----------------------------------------------------------------
    const f64 cloud = m_clouds.cloud_fraction(elapsed_seconds(mjd));
    if (cloud >= m_config.cloud_limit)
    {
        MRD_CORE_TRACE("Gate: clouds {:.3f} >= {:.3f} at MJD {:.6f}", cloud, m_config.cloud_limit, mjd);
        return GateDecision{.observable = false, .next_candidate_mjd = mjd + m_config.cloud_step_days};
    }

    // -----------------------------------------------------------------
    // 2. Darkness and downtime: jump to the next available instant
    // -----------------------------------------------------------------
    const f64 sun_alt = m_kit.solar_altitude(mjd);
    const i32 night = m_nights.night_of(mjd);
    if (sun_alt > m_config.sun_limit_rad || is_closed_night(night))
    {
        MRD_CORE_TRACE("Gate: sun {:.2f} deg, night {} {} at MJD {:.6f}",
                       sun_alt * astro_constants::kRadToDeg, night,
                       is_closed_night(night) ? "closed" : "open", mjd);
        return GateDecision{.observable = false, .next_candidate_mjd = next_available(mjd)};
    }

    return GateDecision{.observable = true, .next_candidate_mjd = mjd};
}

f64 VisibilityGate::next_available(f64 mjd)
{
    const auto& available = available_instants();
    const auto it = std::upper_bound(available.begin(), available.end(), mjd);
    if (it != available.end())
    {
        return *it;
    }

    ++m_fallback_jumps;
    MRD_CORE_WARN("Gate: dark timeline exhausted at {} (MJD {:.6f}), jumping {} days",
                  astro::TimeSystem::format_mjd(mjd), mjd, m_config.fallback_jump_days);
    return mjd + m_config.fallback_jump_days;
}

const std::vector<f64>& VisibilityGate::available_instants()
{
    if (!m_available)
    {
        const auto& timeline = m_sky.timeline();
        std::vector<f64> available;
        for (std::size_t i = 0; i < timeline.mjds.size() && i < timeline.sun_alts.size(); ++i)
        {
            if (timeline.sun_alts[i] <= m_config.sun_limit_rad
                && !is_closed_night(m_nights.night_of(timeline.mjds[i])))
            {
                available.push_back(timeline.mjds[i]);
            }
        }
        std::sort(available.begin(), available.end());

        MRD_CORE_DEBUG("Gate: {} of {} timeline instants available",
                       available.size(), timeline.mjds.size());
        m_available = std::move(available);
    }
    return *m_available;
}

} // namespace meridian::observatory
