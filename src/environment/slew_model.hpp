#pragma once
// environment/slew_model.hpp - Telescope mount kinematics
//
// Each axis accelerates at a fixed rate up to a velocity cap, cruises, then
// decelerates symmetrically. Axes move simultaneously, so the slew lasts as
// long as the slower axis, plus a settle time.

#include "environment/providers.hpp"

#include <algorithm>
#include <cmath>

namespace meridian::environment {

class KinematicSlewModel final : public SlewTimeModel {
public:
    KinematicSlewModel(f64 max_rate_rad_s, f64 accel_rad_s2, f64 settle_s)
        : m_rate(max_rate_rad_s), m_accel(accel_rad_s2), m_settle(settle_s) {}

    f64 estimate(const astro::HorizontalCoord& from,
                 const astro::HorizontalCoord& to) const override {
        const f64 d_alt = std::abs(to.alt - from.alt);

        // Azimuth wraps; take the short way round
        f64 d_az = std::fmod(std::abs(to.az - from.az), astro_constants::kTwoPi);
        if (d_az > astro_constants::kPi) d_az = astro_constants::kTwoPi - d_az;

        return std::max(axisTime(d_alt), axisTime(d_az)) + m_settle;
    }

    /// Time [s] to move one axis through d radians from rest to rest.
    f64 axisTime(f64 d) const {
        if (d <= 0.0) return 0.0;
        // Distance covered while accelerating to full rate and back down
        const f64 ramp_distance = m_rate * m_rate / m_accel;
        if (d < ramp_distance) {
            return 2.0 * std::sqrt(d / m_accel);
        }
        return d / m_rate + m_rate / m_accel;
    }

private:
    f64 m_rate;
    f64 m_accel;
    f64 m_settle;
};

} // namespace meridian::environment
