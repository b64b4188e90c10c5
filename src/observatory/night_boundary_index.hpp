#pragma once

/// @file night_boundary_index.hpp
/// @brief Precomputed sunset instants and night-number lookup.

#include "astro/astronomy_kit.hpp"
#include "core/types.hpp"

#include <optional>
#include <vector>

namespace meridian::observatory
{
    /// @brief Sorted table of sunset instants; a night is the span after one sunset.
    ///
    /// The night index of an instant is the number of stored sunsets strictly
    /// before it. Instants before the first sunset are night 0; instants after
    /// the last are night size(). The table must reach far enough past the
    /// simulated interval for that saturation never to matter.
    class NightBoundaryIndex
    {
    public:
        /// @brief Index over an explicit boundary list (sorted on construction).
        explicit NightBoundaryIndex(std::vector<f64> boundaries);

        /// @brief Compute sunsets from @p mjd_start across the horizon.
        ///
        /// Samples every kSampleStepDays up to
        /// mjd_start + 365.25 * horizon_years + day_padding and asks the kit for
        /// the most recent sunset before each sample. Results are rounded to
        /// 1/kRoundingScale day to merge ephemeris jitter; the first instant
        /// of each rounded value is kept. Boundaries before @p mjd_start are
        /// dropped.
        ///
        /// @return std::nullopt if the ephemeris fails to locate a sunset.
        [[nodiscard]] static std::optional<NightBoundaryIndex> build(
            const astro::AstronomyKit& kit,
            f64 mjd_start,
            i32 horizon_years,
            f64 day_padding);

        /// @brief Count of boundaries strictly less than @p mjd.
        [[nodiscard]] i32 night_of(f64 mjd) const;

        [[nodiscard]] const std::vector<f64>& boundaries() const { return m_boundaries; }
        [[nodiscard]] std::size_t size() const { return m_boundaries.size(); }

        static constexpr f64 kSampleStepDays = 0.25;
        static constexpr f64 kRoundingScale = 100.0;

    private:
        std::vector<f64> m_boundaries;
    };

} // namespace meridian::observatory
