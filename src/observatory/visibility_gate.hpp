#pragma once

/// @file visibility_gate.hpp
/// @brief Decides whether an instant is observable and, if not, when to try next.

#include "astro/astronomy_kit.hpp"
#include "core/config.hpp"
#include "environment/providers.hpp"
#include "observatory/night_boundary_index.hpp"

#include <optional>
#include <vector>

namespace meridian::observatory
{
    /// @brief Gate verdict for one instant.
    struct GateDecision
    {
        bool observable;
        f64 next_candidate_mjd;     ///< Retry instant; meaningful only when !observable
    };

    /// @brief Cloud, darkness and downtime gating with deterministic clock jumps.
    ///
    /// Checks run in order and the first failure picks the jump:
    /// 1. Cloud fraction >= cloud_limit: retry after cloud_step.
    /// 2. Sun above sun_limit, or the night is closed: jump to the first
    ///    available instant after @p mjd (sky timeline sample that is dark and
    ///    not in a closed night); when none remain, jump by fallback_jump.
    /// 3. Otherwise observable.
    ///
    /// The available-instant table is derived from the sky timeline on the
    /// first darkness failure and is immutable afterwards.
    class VisibilityGate
    {
    public:
        /// @param closed_nights Sorted closed night indices.
        VisibilityGate(const core::ObservatoryConfig& config,
                       const astro::AstronomyKit& kit,
                       const environment::SkyBrightnessProvider& sky,
                       const environment::CloudProvider& clouds,
                       const NightBoundaryIndex& nights,
                       std::vector<i32> closed_nights);

        [[nodiscard]] GateDecision is_observable(f64 mjd);

        [[nodiscard]] bool is_closed_night(i32 night) const;

        /// @brief Timeline instants that are dark and outside closed nights.
        [[nodiscard]] const std::vector<f64>& available_instants();

        /// @brief Number of times the timeline was exhausted and the fallback jump used.
        [[nodiscard]] u64 fallback_jumps() const { return m_fallback_jumps; }

        /// @brief Seconds since the configured simulation start.
        [[nodiscard]] f64 elapsed_seconds(f64 mjd) const;

        [[nodiscard]] const std::vector<i32>& closed_nights() const { return m_closed_nights; }

    private:
        [[nodiscard]] f64 next_available(f64 mjd);

        core::ObservatoryConfig m_config;
        const astro::AstronomyKit& m_kit;
        const environment::SkyBrightnessProvider& m_sky;
        const environment::CloudProvider& m_clouds;
        const NightBoundaryIndex& m_nights;
        std::vector<i32> m_closed_nights;

        std::optional<std::vector<f64>> m_available;
        u64 m_fallback_jumps = 0;
    };

} // namespace meridian::observatory
