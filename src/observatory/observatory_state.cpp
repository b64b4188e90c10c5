/// @file observatory_state.cpp
/// @brief Implementation of the observatory state transitions.

#include "observatory/observatory_state.hpp"

#include <utility>

namespace meridian::observatory
{

ObservatoryState::ObservatoryState(f64 mjd, const NightBoundaryIndex& nights)
    : m_nights{nights}
    , m_mjd{mjd}
    , m_night{nights.night_of(mjd)}
{
}

void ObservatoryState::advance_to(f64 mjd)
{
    m_mjd = mjd;
    m_night = m_nights.night_of(mjd);
}

void ObservatoryState::park()
{
    m_pointing.reset();
    m_filter.reset();
    m_snapshot.reset();
}

void ObservatoryState::point_at(const astro::EquatorialCoord& target, Filter filter)
{
    if (is_parked())
    {
        m_snapshot.reset();
    }
    m_pointing = target;
    m_filter = filter;
    m_has_ever_pointed = true;
}

void ObservatoryState::set_snapshot(StatusSnapshot snapshot)
{
    m_snapshot = std::move(snapshot);
}

} // namespace meridian::observatory
