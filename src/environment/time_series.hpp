#pragma once

/// @file time_series.hpp
/// @brief Step-function time series keyed by seconds since the simulation start.

#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace meridian::environment
{
    /// @brief One sample of a time series.
    struct TimeSample
    {
        f64 elapsed_s;  ///< Seconds since the simulation start
        f64 value;
    };

    /// @brief Piecewise-constant series: each sample holds until the next one.
    ///
    /// Queries before the first sample return the first value; queries after
    /// the last sample return the last value.
    class TimeSeries
    {
    public:
        /// @brief Series holding a single value for all time.
        explicit TimeSeries(f64 constant);

        /// @brief Series over samples; they are sorted by time if they are not already.
        /// An empty sample list yields a series that is 0 everywhere.
        explicit TimeSeries(std::vector<TimeSample> samples);

        [[nodiscard]] f64 value_at(f64 elapsed_s) const;

        [[nodiscard]] std::size_t size() const { return m_samples.size(); }

        /// @brief Load "elapsed_s,value" rows (header row required).
        ///
        /// Values outside [min_value, max_value] are rejected as malformed.
        /// @return The series on success, std::nullopt if the file cannot be
        ///         opened or contains no valid rows.
        [[nodiscard]] static std::optional<TimeSeries>
            load_csv(const std::filesystem::path& path, f64 min_value, f64 max_value);

    private:
        std::vector<TimeSample> m_samples;
    };

} // namespace meridian::environment
