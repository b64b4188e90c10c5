#pragma once

/// @file observation_executor.hpp
/// @brief The observation attempt state machine.

#include "astro/astronomy_kit.hpp"
#include "environment/providers.hpp"
#include "observatory/observation.hpp"
#include "observatory/observatory_state.hpp"
#include "observatory/slew_cost_estimator.hpp"
#include "observatory/status_snapshot.hpp"
#include "observatory/visibility_gate.hpp"

#include <string_view>

namespace meridian::observatory
{
    /// @brief Phase of the attempt in progress; Idle between attempts.
    enum class ExecutorPhase
    {
        Idle,
        Costing,
        Gating,
        Committing,
        Rejecting,
    };

    [[nodiscard]] std::string_view executor_phase_name(ExecutorPhase phase);

    /// @brief Runs one observation attempt to completion against the shared state.
    ///
    /// Idle → Costing → Gating → Committing | Rejecting → Idle.
    ///
    /// Costing prices the repositioning and the visit. Gating asks whether the
    /// instant at which the visit would end is observable. Committing moves
    /// the clock to the exposure start, points the telescope, refreshes the
    /// cached status when leaving the parked state, fills the record and
    /// advances the clock to the visit end. Rejecting parks the telescope and
    /// moves the clock to the gate's retry instant.
    ///
    /// Invalid requests are refused before Costing and leave the state untouched.
    class ObservationExecutor
    {
    public:
        ObservationExecutor(const astro::AstronomyKit& kit,
                            const environment::SkyBrightnessProvider& sky,
                            const SlewCostEstimator& slew,
                            VisibilityGate& gate,
                            const StatusSampler& sampler,
                            ObservatoryState& state);

        [[nodiscard]] AttemptResult attempt_observe(const ObservationRequest& request);

        [[nodiscard]] ExecutorPhase phase() const { return m_phase; }

        /// @brief Check a request's fields; logs the first problem found.
        [[nodiscard]] static bool validate(const ObservationRequest& request);

    private:
        void enter(ExecutorPhase phase);

        [[nodiscard]] ObservationRecord commit(const ObservationRequest& request,
                                               const SlewCost& cost,
                                               const astro::HorizontalCoord& pre_slew,
                                               f64 visit_days);

        void reject(f64 next_candidate_mjd);

        const astro::AstronomyKit& m_kit;
        const environment::SkyBrightnessProvider& m_sky;
        const SlewCostEstimator& m_slew;
        VisibilityGate& m_gate;
        const StatusSampler& m_sampler;
        ObservatoryState& m_state;

        ExecutorPhase m_phase = ExecutorPhase::Idle;
    };

} // namespace meridian::observatory
