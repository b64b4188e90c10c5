/// @file observation_executor.cpp
/// @brief Implementation of the observation attempt state machine.

#include "observatory/observation_executor.hpp"

#include "core/logger.hpp"
#include "photometry/depth.hpp"

#include <cmath>
#include <utility>

namespace meridian::observatory
{

namespace
{
    /// Map entry at @p hpid, kUnseen when the map does not cover it.
    f64 pixel_value(const environment::PixelMap& map, i64 hpid)
    {
        if (hpid < 0 || static_cast<std::size_t>(hpid) >= map.size())
        {
            return kUnseen;
        }
        return map[static_cast<std::size_t>(hpid)];
    }
} // namespace

std::string_view executor_phase_name(ExecutorPhase phase)
{
    switch (phase)
    {
        case ExecutorPhase::Idle:       return "Idle";
        case ExecutorPhase::Costing:    return "Costing";
        case ExecutorPhase::Gating:     return "Gating";
        case ExecutorPhase::Committing: return "Committing";
        case ExecutorPhase::Rejecting:  return "Rejecting";
    }
    return "Unknown";
}

ObservationExecutor::ObservationExecutor(const astro::AstronomyKit& kit,
                                         const environment::SkyBrightnessProvider& sky,
                                         const SlewCostEstimator& slew,
                                         VisibilityGate& gate,
                                         const StatusSampler& sampler,
                                         ObservatoryState& state)
    : m_kit{kit}
    , m_sky{sky}
    , m_slew{slew}
    , m_gate{gate}
    , m_sampler{sampler}
    , m_state{state}
{
}

bool ObservationExecutor::validate(const ObservationRequest& request)
{
    if (!request.filter)
    {
        MRD_WARN("Rejecting request: no filter given");
        return false;
    }
    if (request.nexp < 1)
    {
        MRD_WARN("Rejecting request: nexp {} < 1", request.nexp);
        return false;
    }
    // A zero-length visit would commit without moving the clock
    if (!std::isfinite(request.exptime_s) || !(request.exptime_s > 0.0))
    {
        MRD_WARN("Rejecting request: exposure time {} s", request.exptime_s);
        return false;
    }
    if (!std::isfinite(request.target.ra))
    {
        MRD_WARN("Rejecting request: RA is not finite");
        return false;
    }
    if (!(std::abs(request.target.dec) <= astro_constants::kHalfPi))
    {
        MRD_WARN("Rejecting request: Dec {} rad outside [-pi/2, pi/2]", request.target.dec);
        return false;
    }
    return true;
}

void ObservationExecutor::enter(ExecutorPhase phase)
{
    MRD_TRACE("Executor: {} -> {}", executor_phase_name(m_phase), executor_phase_name(phase));
    m_phase = phase;
}

AttemptResult ObservationExecutor::attempt_observe(const ObservationRequest& request)
{
    if (!validate(request))
    {
        return AttemptResult{.status = AttemptStatus::InvalidRequest, .record = std::nullopt};
    }

    // -----------------------------------------------------------------
    // Costing
    // -----------------------------------------------------------------
    enter(ExecutorPhase::Costing);

    const Filter filter = *request.filter;
    const f64 start = m_state.mjd();
    const auto pre_slew = m_kit.radec_to_altaz(request.target, start);
    const SlewCost cost = m_slew.cost(m_state.pointing(), m_state.filter(),
                                      request.target, filter, start);
    const f64 visit_days = m_slew.visit_duration_s(cost, request.exptime_s, request.nexp)
                         * time_constants::kSecToDays;

    // -----------------------------------------------------------------
    // Gating: the whole visit must end in observable conditions
    // -----------------------------------------------------------------
    enter(ExecutorPhase::Gating);

    const GateDecision decision = m_gate.is_observable(start + visit_days);
    if (!decision.observable)
    {
        enter(ExecutorPhase::Rejecting);
        reject(decision.next_candidate_mjd);
        enter(ExecutorPhase::Idle);
        return AttemptResult{.status = AttemptStatus::Unobservable, .record = std::nullopt};
    }

    enter(ExecutorPhase::Committing);
    ObservationRecord record = commit(request, cost, pre_slew, visit_days);
    enter(ExecutorPhase::Idle);

    return AttemptResult{.status = AttemptStatus::Observed, .record = std::move(record)};
}

ObservationRecord ObservationExecutor::commit(const ObservationRequest& request,
                                              const SlewCost& cost,
                                              const astro::HorizontalCoord& pre_slew,
                                              f64 visit_days)
{
    const Filter filter = *request.filter;
    const bool was_parked = m_state.is_parked();
    const f64 start = m_state.mjd();
    const f64 exposure_start = start + cost.total_s() * time_constants::kSecToDays;

    m_state.advance_to(exposure_start);
    m_state.point_at(request.target, filter);

    // Conditions are only resampled when leaving the parked state
    if (was_parked || !m_state.snapshot())
    {
        m_state.set_snapshot(m_sampler.sample(exposure_start, m_state.night(),
                                              m_state.pointing(), m_state.filter()));
    }
    const StatusSnapshot& status = *m_state.snapshot();

    const i64 hpid = m_kit.healpix_index(request.target);
    const std::size_t fi = filter_index(filter);

    ObservationRecord record{
        .request        = request,
        .mjd            = exposure_start,
        .night          = m_state.night(),
        .slewtime_s     = cost.total_s(),
        .sky_brightness = m_sky.pixel_magnitude(exposure_start, hpid, filter),
        .fwhm_eff       = pixel_value(status.fwhm_eff[fi], hpid),
        .fwhm_geometric = pixel_value(status.fwhm_geometric[fi], hpid),
        .airmass        = pixel_value(status.airmass, hpid),
        .five_sigma_depth = kUnseen,
        .alt            = pre_slew.alt,
        .az             = pre_slew.az,
        .clouds         = status.clouds,
        .sun_alt        = status.sun_alt,
        .moon_alt       = status.moon_alt,
    };

    if (record.airmass != kUnseen && record.fwhm_eff > 0.0 && record.sky_brightness != kUnseen)
    {
        record.five_sigma_depth = photometry::five_sigma_depth(
            filter, record.sky_brightness, record.fwhm_eff, request.exptime_s, record.airmass);
    }
    else
    {
        MRD_DEBUG("Pixel {} not evaluated in the cached status; no depth for this visit", hpid);
    }

    m_state.advance_to(start + visit_days);

    MRD_DEBUG("Observed field {} in {} at MJD {:.6f} (night {}, slew {:.1f} s, X {:.2f}, m5 {:.2f})",
              request.field_id, filter_name(filter), record.mjd, record.night,
              record.slewtime_s, record.airmass, record.five_sigma_depth);
    return record;
}

void ObservationExecutor::reject(f64 next_candidate_mjd)
{
    const f64 from = m_state.mjd();
    m_state.park();
    m_state.advance_to(next_candidate_mjd);

    MRD_DEBUG("Unobservable at MJD {:.6f}; parked, clock jumped {:.4f} days to night {}",
              from, next_candidate_mjd - from, m_state.night());
}

} // namespace meridian::observatory
