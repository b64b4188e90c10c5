/// @file night_boundary_index.cpp
/// @brief Implementation of the sunset table and night lookup.

#include "observatory/night_boundary_index.hpp"

#include "astro/time_system.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

namespace meridian::observatory
{

NightBoundaryIndex::NightBoundaryIndex(std::vector<f64> boundaries)
    : m_boundaries{std::move(boundaries)}
{
    std::sort(m_boundaries.begin(), m_boundaries.end());
}

std::optional<NightBoundaryIndex> NightBoundaryIndex::build(const astro::AstronomyKit& kit,
                                                            f64 mjd_start,
                                                            i32 horizon_years,
                                                            f64 day_padding)
{
    const f64 span = time_constants::kDaysPerYear * horizon_years + day_padding;
    const auto samples = static_cast<std::size_t>(std::floor(span / kSampleStepDays)) + 1;

    // (rounded key, instant) in sample order
    std::vector<std::pair<f64, f64>> sunsets;
    sunsets.reserve(samples);

    for (std::size_t i = 0; i < samples; ++i)
    {
        const f64 mjd = mjd_start + static_cast<f64>(i) * kSampleStepDays;
        const auto sunset = kit.previous_sunset(mjd);
        if (!sunset)
        {
            MRD_CORE_ERROR("NightBoundaryIndex: no sunset found before {}",
                           astro::TimeSystem::format_mjd(mjd));
            return std::nullopt;
        }
        sunsets.emplace_back(std::round(*sunset * kRoundingScale), *sunset);
    }

    // Stable sort keeps the first sample of each rounded value at the front of its run
    std::stable_sort(sunsets.begin(), sunsets.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
    const auto last = std::unique(sunsets.begin(), sunsets.end(),
                                  [](const auto& a, const auto& b) { return a.first == b.first; });
    sunsets.erase(last, sunsets.end());

    std::vector<f64> boundaries;
    boundaries.reserve(sunsets.size());
    for (const auto& [key, instant] : sunsets)
    {
        if (instant >= mjd_start)
        {
            boundaries.push_back(instant);
        }
    }

    MRD_CORE_INFO("NightBoundaryIndex: {} sunsets from {} ({} samples)",
                  boundaries.size(), astro::TimeSystem::format_mjd(mjd_start), samples);

    return NightBoundaryIndex(std::move(boundaries));
}

i32 NightBoundaryIndex::night_of(f64 mjd) const
{
    const auto it = std::lower_bound(m_boundaries.begin(), m_boundaries.end(), mjd);
    return static_cast<i32>(std::distance(m_boundaries.begin(), it));
}

} // namespace meridian::observatory
