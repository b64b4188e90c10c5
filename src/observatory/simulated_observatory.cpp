/// @file simulated_observatory.cpp
/// @brief Assembly of the simulator and its built-in providers.

#include "observatory/simulated_observatory.hpp"

#include "core/logger.hpp"
#include "environment/cloud_model.hpp"
#include "environment/downtime_calendar.hpp"
#include "environment/seeing_model.hpp"
#include "environment/sky_model.hpp"
#include "environment/slew_model.hpp"
#include "environment/time_series.hpp"

#include <cmath>
#include <utility>

namespace meridian::observatory
{

// -----------------------------------------------------------------
// Built-in providers
// -----------------------------------------------------------------

std::optional<ObservatoryProviders> make_default_providers(const core::ObservatoryConfig& observatory,
                                                           const core::EnvironmentConfig& environment)
{
    ObservatoryProviders providers;

    providers.kit = std::make_unique<astro::SiteAstronomyKit>(observatory.site, observatory.nside);
    providers.sky = std::make_unique<environment::AnalyticSkyModel>(
        *providers.kit, observatory.mjd_start,
        environment.sky_timeline_days, environment.sky_timeline_step_days);
    providers.slew = std::make_unique<environment::KinematicSlewModel>(
        environment.slew_axis_rate_rad_s, environment.slew_axis_accel_rad_s2,
        environment.slew_settle_s);

    const auto survey_nights = static_cast<i32>(std::ceil(
        time_constants::kDaysPerYear * observatory.horizon_years + observatory.day_padding));
    providers.downtime = std::make_unique<environment::DowntimeCalendar>(
        environment::DowntimeCalendar::default_schedule(observatory.horizon_years),
        survey_nights, environment.unscheduled_downtime, environment.seed);

    if (environment.seeing_file.empty())
    {
        providers.seeing = std::make_unique<environment::SeeingTimeSeries>(
            environment.seeing_fwhm500_arcsec);
    }
    else
    {
        auto series = environment::TimeSeries::load_csv(environment.seeing_file, 0.0, 10.0);
        if (!series)
        {
            MRD_CORE_ERROR("Providers: failed to load seeing series {}", environment.seeing_file);
            return std::nullopt;
        }
        providers.seeing = std::make_unique<environment::SeeingTimeSeries>(std::move(*series));
    }

    if (environment.cloud_file.empty())
    {
        providers.clouds = std::make_unique<environment::CloudTimeSeries>(environment.cloud_fraction);
    }
    else
    {
        auto series = environment::TimeSeries::load_csv(environment.cloud_file, 0.0, 1.0);
        if (!series)
        {
            MRD_CORE_ERROR("Providers: failed to load cloud series {}", environment.cloud_file);
            return std::nullopt;
        }
        providers.clouds = std::make_unique<environment::CloudTimeSeries>(std::move(*series));
    }

    return providers;
}

// -----------------------------------------------------------------
// SimulatedObservatory
// -----------------------------------------------------------------

std::optional<SimulatedObservatory> SimulatedObservatory::create(const core::ObservatoryConfig& config,
                                                                 ObservatoryProviders providers)
{
    if (!providers.kit || !providers.sky || !providers.slew
        || !providers.downtime || !providers.seeing || !providers.clouds)
    {
        MRD_CORE_CRITICAL("SimulatedObservatory: every provider must be supplied");
        return std::nullopt;
    }

    if (!core::validate(config))
    {
        MRD_CORE_CRITICAL("SimulatedObservatory: invalid configuration");
        return std::nullopt;
    }

    if (providers.kit->nside() != config.nside)
    {
        MRD_CORE_CRITICAL("SimulatedObservatory: astronomy kit nside {} differs from configured nside {}",
                          providers.kit->nside(), config.nside);
        return std::nullopt;
    }

    auto closed_nights = providers.downtime->closed_nights();
    if (!closed_nights)
    {
        MRD_CORE_CRITICAL("SimulatedObservatory: downtime calendar is malformed");
        return std::nullopt;
    }

    auto nights = NightBoundaryIndex::build(*providers.kit, config.mjd_start,
                                            config.horizon_years, config.day_padding);
    if (!nights)
    {
        MRD_CORE_CRITICAL("SimulatedObservatory: failed to compute sunset boundaries");
        return std::nullopt;
    }

    SimulatedObservatory sim(config, std::move(providers), std::move(*nights),
                             std::move(*closed_nights));

    MRD_CORE_INFO("SimulatedObservatory: ready at MJD {:.5f} (night {}), {} closed nights",
                  sim.mjd(), sim.night(), sim.m_gate->closed_nights().size());
    return sim;
}

SimulatedObservatory::SimulatedObservatory(const core::ObservatoryConfig& config,
                                           ObservatoryProviders providers,
                                           NightBoundaryIndex nights,
                                           std::vector<i32> closed_nights)
    : m_config{config}
    , m_providers{std::move(providers)}
    , m_nights{std::make_unique<NightBoundaryIndex>(std::move(nights))}
{
    m_gate = std::make_unique<VisibilityGate>(m_config, *m_providers.kit, *m_providers.sky,
                                              *m_providers.clouds, *m_nights,
                                              std::move(closed_nights));
    m_slew = std::make_unique<SlewCostEstimator>(m_config, *m_providers.kit, *m_providers.slew);
    m_sampler = std::make_unique<StatusSampler>(m_config, *m_providers.kit, *m_providers.sky,
                                                *m_providers.seeing, *m_providers.clouds, *m_slew);
    m_state = std::make_unique<ObservatoryState>(m_config.mjd_start, *m_nights);
    m_executor = std::make_unique<ObservationExecutor>(*m_providers.kit, *m_providers.sky,
                                                       *m_slew, *m_gate, *m_sampler, *m_state);
}

AttemptResult SimulatedObservatory::attempt_observe(const ObservationRequest& request)
{
    return m_executor->attempt_observe(request);
}

const StatusSnapshot& SimulatedObservatory::status()
{
    m_state->set_snapshot(m_sampler->sample(m_state->mjd(), m_state->night(),
                                            m_state->pointing(), m_state->filter()));
    return *m_state->snapshot();
}

} // namespace meridian::observatory
