#pragma once
// environment/cloud_model.hpp - Cloud cover time series
//
// Cloud fraction is a step function of elapsed simulation time, either a
// constant or a table loaded from CSV (elapsed_s, cloud_fraction).

#include "environment/providers.hpp"
#include "environment/time_series.hpp"

#include <algorithm>
#include <utility>

namespace meridian::environment {

class CloudTimeSeries final : public CloudProvider {
public:
    explicit CloudTimeSeries(f64 constant_fraction)
        : m_series(std::clamp(constant_fraction, 0.0, 1.0)) {}

    explicit CloudTimeSeries(TimeSeries series)
        : m_series(std::move(series)) {}

    f64 cloud_fraction(f64 elapsed_s) const override {
        return std::clamp(m_series.value_at(elapsed_s), 0.0, 1.0);
    }

private:
    TimeSeries m_series;
};

} // namespace meridian::environment
