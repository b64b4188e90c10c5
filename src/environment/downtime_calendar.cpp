/// @file downtime_calendar.cpp
/// @brief Implementation of the downtime calendar.

#include "environment/downtime_calendar.hpp"

#include "core/logger.hpp"
#include "core/random.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace meridian::environment
{

namespace
{
    /// Night of the year on which the annual engineering shutdown starts.
    constexpr i32 kShutdownStartNight = 180;
    constexpr i32 kShutdownLength = 14;
} // namespace

DowntimeCalendar::DowntimeCalendar(std::vector<DowntimeBlock> scheduled, i32 survey_nights,
                                   bool unscheduled, i64 seed)
    : m_scheduled{std::move(scheduled)}
    , m_survey_nights{survey_nights}
    , m_unscheduled{unscheduled}
    , m_seed{seed}
{
}

std::optional<std::vector<i32>> DowntimeCalendar::closed_nights()
{
    if (m_closed)
    {
        return m_closed;
    }

    std::vector<i32> nights;
    for (const auto& block : m_scheduled)
    {
        if (block.start_night < 0 || block.length_nights <= 0)
        {
            MRD_CORE_ERROR("DowntimeCalendar: malformed scheduled block (start {}, length {})",
                           block.start_night, block.length_nights);
            return std::nullopt;
        }
        for (i32 n = 0; n < block.length_nights; ++n)
        {
            nights.push_back(block.start_night + n);
        }
    }

    u32 unscheduled_blocks = 0;
    if (m_unscheduled)
    {
        for (const auto& block : draw_unscheduled(m_survey_nights, m_seed))
        {
            for (i32 n = 0; n < block.length_nights; ++n)
            {
                nights.push_back(block.start_night + n);
            }
            ++unscheduled_blocks;
        }
    }

    std::sort(nights.begin(), nights.end());
    nights.erase(std::unique(nights.begin(), nights.end()), nights.end());

    MRD_CORE_INFO("DowntimeCalendar: {} closed nights ({} scheduled blocks, {} unscheduled)",
                  nights.size(), m_scheduled.size(), unscheduled_blocks);

    m_closed = std::move(nights);
    return m_closed;
}

std::vector<DowntimeBlock> DowntimeCalendar::default_schedule(i32 survey_years)
{
    std::vector<DowntimeBlock> blocks;
    for (i32 year = 0; year < survey_years; ++year)
    {
        const auto year_start = static_cast<i32>(std::floor(year * time_constants::kDaysPerYear));
        blocks.push_back(DowntimeBlock{
            .start_night   = year_start + kShutdownStartNight,
            .length_nights = kShutdownLength,
        });
    }
    return blocks;
}

std::vector<DowntimeBlock> DowntimeCalendar::draw_unscheduled(i32 survey_nights, i64 seed)
{
    core::PcgRng rng(static_cast<u64>(seed < 0 ? kDefaultSeed : seed));

    std::vector<DowntimeBlock> blocks;
    i32 night = 0;
    while (night < survey_nights)
    {
        const f64 roll = rng.next_double();
        i32 length = 0;
        if (roll < kMajorProbability)
        {
            length = kMajorLength;
        }
        else if (roll < kMajorProbability + kIntermediateProbability)
        {
            length = kIntermediateLength;
        }
        else if (roll < kMajorProbability + kIntermediateProbability + kMinorProbability)
        {
            length = kMinorLength;
        }

        if (length > 0)
        {
            blocks.push_back(DowntimeBlock{.start_night = night, .length_nights = length});
            night += length;
        }
        else
        {
            ++night;
        }
    }
    return blocks;
}

} // namespace meridian::environment
