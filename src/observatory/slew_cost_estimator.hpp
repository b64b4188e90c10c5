#pragma once

/// @file slew_cost_estimator.hpp
/// @brief Time charged to reposition the telescope before a visit.

#include "astro/astronomy_kit.hpp"
#include "core/config.hpp"
#include "core/filter.hpp"
#include "environment/providers.hpp"

#include <optional>
#include <vector>

namespace meridian::observatory
{
    /// @brief Repositioning time split into filter change and slew [s].
    struct SlewCost
    {
        f64 filter_change_s = 0.0;
        f64 slew_s = 0.0;

        [[nodiscard]] f64 total_s() const { return filter_change_s + slew_s; }
    };

    /// @brief Applies the repositioning rules on top of a SlewTimeModel.
    ///
    /// - Parked telescope: nothing is charged.
    /// - Filter change: only the filter change time is charged. The slew is
    ///   taken to happen during the change; this is a simplification of the
    ///   model, not of the hardware.
    /// - Same filter: the model's slew time between current and target alt/az,
    ///   or min_slew when the two positions are identical.
    class SlewCostEstimator
    {
    public:
        SlewCostEstimator(const core::ObservatoryConfig& config,
                          const astro::AstronomyKit& kit,
                          const environment::SlewTimeModel& model);

        [[nodiscard]] SlewCost cost(const std::optional<astro::EquatorialCoord>& current,
                                    std::optional<Filter> current_filter,
                                    const astro::EquatorialCoord& target,
                                    Filter target_filter,
                                    f64 mjd) const;

        /// @brief Wall time of a whole visit [s]:
        /// cost + exptime + (nexp - 1) * readtime + nexp * shutter.
        [[nodiscard]] f64 visit_duration_s(const SlewCost& cost, f64 exptime_s, i32 nexp) const;

        /// @brief Slew time from @p pointing to every pixel at or above alt_limit.
        ///
        /// Pixels below alt_limit hold kUnseen. A parked telescope yields an empty map.
        [[nodiscard]] environment::PixelMap slew_time_map(
            const std::optional<astro::EquatorialCoord>& pointing, f64 mjd) const;

    private:
        [[nodiscard]] f64 slew_between(const astro::HorizontalCoord& from,
                                       const astro::HorizontalCoord& to) const;

        core::ObservatoryConfig m_config;
        const astro::AstronomyKit& m_kit;
        const environment::SlewTimeModel& m_model;
        std::vector<astro::EquatorialCoord> m_pixel_centres;
    };

} // namespace meridian::observatory
