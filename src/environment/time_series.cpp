/// @file time_series.cpp
/// @brief Implementation of the step-function time series and its CSV loader.

#include "environment/time_series.hpp"

#include "core/logger.hpp"
#include "core/text_parse.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <utility>

namespace meridian::environment
{

TimeSeries::TimeSeries(f64 constant)
    : m_samples{TimeSample{.elapsed_s = 0.0, .value = constant}}
{
}

TimeSeries::TimeSeries(std::vector<TimeSample> samples)
    : m_samples{std::move(samples)}
{
    if (m_samples.empty())
    {
        m_samples.push_back(TimeSample{.elapsed_s = 0.0, .value = 0.0});
    }
    std::stable_sort(m_samples.begin(), m_samples.end(),
                     [](const TimeSample& a, const TimeSample& b) { return a.elapsed_s < b.elapsed_s; });
}

f64 TimeSeries::value_at(f64 elapsed_s) const
{
    // First sample strictly after the query; the one before it is in effect
    const auto it = std::upper_bound(
        m_samples.begin(), m_samples.end(), elapsed_s,
        [](f64 t, const TimeSample& s) { return t < s.elapsed_s; });

    if (it == m_samples.begin())
    {
        return m_samples.front().value;
    }
    return std::prev(it)->value;
}

// -----------------------------------------------------------------
// Load CSV: elapsed_s,value
// -----------------------------------------------------------------

std::optional<TimeSeries> TimeSeries::load_csv(const std::filesystem::path& path,
                                               f64 min_value, f64 max_value)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        MRD_CORE_ERROR("TimeSeries: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::string line;

    // Skip header line
    if (!std::getline(file, line))
    {
        MRD_CORE_ERROR("TimeSeries: File is empty: {}", path.string());
        return std::nullopt;
    }

    std::vector<TimeSample> samples;
    u32 line_number = 1;
    u32 skipped = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        if (core::TextParse::trim(line).empty())
        {
            continue;
        }

        std::istringstream stream(line);
        std::string time_str;
        std::string value_str;

        if (!std::getline(stream, time_str, ',') || !std::getline(stream, value_str))
        {
            MRD_CORE_WARN("TimeSeries: Malformed line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        const auto elapsed = core::TextParse::parse_f64(core::TextParse::trim(time_str));
        const auto value   = core::TextParse::parse_f64(core::TextParse::trim(value_str));

        if (!elapsed || !value || *value < min_value || *value > max_value)
        {
            MRD_CORE_WARN("TimeSeries: Failed to parse values on line {}: {}",
                          line_number, line);
            ++skipped;
            continue;
        }

        samples.push_back(TimeSample{.elapsed_s = *elapsed, .value = *value});
    }

    if (samples.empty())
    {
        MRD_CORE_ERROR("TimeSeries: No valid samples found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        MRD_CORE_WARN("TimeSeries: Skipped {} malformed lines", skipped);
    }

    MRD_CORE_INFO("TimeSeries: Loaded {} samples from {}", samples.size(), path.string());

    return TimeSeries(std::move(samples));
}

} // namespace meridian::environment
