#pragma once

/// @file simulated_observatory.hpp
/// @brief Top-level simulator: owns the providers, the night table, the state and the executor.

#include "astro/astronomy_kit.hpp"
#include "core/config.hpp"
#include "environment/providers.hpp"
#include "observatory/night_boundary_index.hpp"
#include "observatory/observation.hpp"
#include "observatory/observation_executor.hpp"
#include "observatory/observatory_state.hpp"
#include "observatory/slew_cost_estimator.hpp"
#include "observatory/status_snapshot.hpp"
#include "observatory/visibility_gate.hpp"

#include <memory>
#include <optional>

namespace meridian::observatory
{
    /// @brief The collaborators a simulation consults. All must be set.
    ///
    /// The sky model may hold a reference to the kit; both are owned here, and
    /// the kit is destroyed last.
    struct ObservatoryProviders
    {
        std::unique_ptr<astro::AstronomyKit> kit;
        std::unique_ptr<environment::SkyBrightnessProvider> sky;
        std::unique_ptr<environment::SlewTimeModel> slew;
        std::unique_ptr<environment::DowntimeProvider> downtime;
        std::unique_ptr<environment::SeeingProvider> seeing;
        std::unique_ptr<environment::CloudProvider> clouds;
    };

    /// @brief Assemble the built-in providers for a configuration.
    /// @return std::nullopt if a configured data file cannot be loaded.
    [[nodiscard]] std::optional<ObservatoryProviders> make_default_providers(
        const core::ObservatoryConfig& observatory,
        const core::EnvironmentConfig& environment);

    /// @brief A survey telescope advancing through simulated time.
    ///
    /// Usage:
    /// @code
    ///   auto sim = SimulatedObservatory::create(config, std::move(providers));
    ///   if (!sim) { /* logged */ }
    ///   auto result = sim->attempt_observe(request);
    /// @endcode
    ///
    /// Starts parked at config.mjd_start. Single-threaded; each call runs to
    /// completion.
    class SimulatedObservatory
    {
    public:
        /// @brief Validate the configuration, build the closed-night calendar
        /// and the sunset table.
        /// @return std::nullopt (after a critical log) when any step fails.
        [[nodiscard]] static std::optional<SimulatedObservatory> create(
            const core::ObservatoryConfig& config,
            ObservatoryProviders providers);

        [[nodiscard]] AttemptResult attempt_observe(const ObservationRequest& request);

        /// @brief Fresh status at the current clock; also replaces the cached one.
        [[nodiscard]] const StatusSnapshot& status();

        [[nodiscard]] f64 mjd() const { return m_state->mjd(); }
        [[nodiscard]] i32 night() const { return m_state->night(); }
        [[nodiscard]] const ObservatoryState& state() const { return *m_state; }
        [[nodiscard]] const core::ObservatoryConfig& config() const { return m_config; }
        [[nodiscard]] const NightBoundaryIndex& boundaries() const { return *m_nights; }
        [[nodiscard]] const astro::AstronomyKit& kit() const { return *m_providers.kit; }
        [[nodiscard]] u64 fallback_jumps() const { return m_gate->fallback_jumps(); }

    private:
        SimulatedObservatory(const core::ObservatoryConfig& config,
                             ObservatoryProviders providers,
                             NightBoundaryIndex nights,
                             std::vector<i32> closed_nights);

        core::ObservatoryConfig m_config;
        ObservatoryProviders m_providers;

        // Heap-held so the references between components survive moves of the facade
        std::unique_ptr<NightBoundaryIndex> m_nights;
        std::unique_ptr<VisibilityGate> m_gate;
        std::unique_ptr<SlewCostEstimator> m_slew;
        std::unique_ptr<StatusSampler> m_sampler;
        std::unique_ptr<ObservatoryState> m_state;
        std::unique_ptr<ObservationExecutor> m_executor;
    };

} // namespace meridian::observatory
