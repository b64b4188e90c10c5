#pragma once

/// @file downtime_calendar.hpp
/// @brief Scheduled maintenance plus seeded random unscheduled downtime.

#include "environment/providers.hpp"

#include <optional>
#include <vector>

namespace meridian::environment
{
    /// @brief A run of consecutive closed nights.
    struct DowntimeBlock
    {
        i32 start_night;    ///< First closed night index
        i32 length_nights;  ///< Number of closed nights (>= 1)
    };

    /// @brief DowntimeProvider combining a fixed schedule with random failures.
    ///
    /// Unscheduled downtime is drawn night by night from a PCG stream: each
    /// night may start a major (7 night), intermediate (3 night) or minor
    /// (1 night) outage. The draw is fully determined by the seed, so two
    /// calendars built with the same arguments close the same nights.
    class DowntimeCalendar final : public DowntimeProvider
    {
    public:
        /// @param scheduled       Planned maintenance blocks.
        /// @param survey_nights   Number of nights over which random outages are drawn.
        /// @param unscheduled     Draw random outages when true.
        /// @param seed            Random seed; negative selects kDefaultSeed.
        DowntimeCalendar(std::vector<DowntimeBlock> scheduled, i32 survey_nights,
                         bool unscheduled, i64 seed);

        /// @brief Sorted, de-duplicated closed nights; computed on first call.
        /// @return std::nullopt if a scheduled block is malformed.
        [[nodiscard]] std::optional<std::vector<i32>> closed_nights() override;

        /// @brief Annual engineering shutdowns: one 14-night block per survey year.
        [[nodiscard]] static std::vector<DowntimeBlock> default_schedule(i32 survey_years);

        /// @brief Random outages over [0, survey_nights).
        [[nodiscard]] static std::vector<DowntimeBlock> draw_unscheduled(i32 survey_nights,
                                                                         i64 seed);

        static constexpr i64 kDefaultSeed = 1640995200;

        // Per-night probabilities of starting an outage
        static constexpr f64 kMajorProbability        = 0.0014;
        static constexpr f64 kIntermediateProbability = 0.0055;
        static constexpr f64 kMinorProbability        = 0.0137;

        static constexpr i32 kMajorLength        = 7;
        static constexpr i32 kIntermediateLength = 3;
        static constexpr i32 kMinorLength        = 1;

    private:
        std::vector<DowntimeBlock> m_scheduled;
        i32 m_survey_nights;
        bool m_unscheduled;
        i64 m_seed;
        std::optional<std::vector<i32>> m_closed;
    };

} // namespace meridian::environment
