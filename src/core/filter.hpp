#pragma once

/// @file filter.hpp
/// @brief Survey bandpass identifiers.

#include "core/types.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace meridian
{
    /// @brief The six survey bandpasses, in wavelength order.
    enum class Filter : u8
    {
        U = 0,
        G,
        R,
        I,
        Z,
        Y,
    };

    constexpr std::size_t kFilterCount = 6;

    constexpr std::array<Filter, kFilterCount> kAllFilters{
        Filter::U, Filter::G, Filter::R, Filter::I, Filter::Z, Filter::Y,
    };

    /// @brief Per-filter table indexed by filter_index().
    template <typename T>
    using PerFilter = std::array<T, kFilterCount>;

    [[nodiscard]] constexpr std::size_t filter_index(Filter f)
    {
        return static_cast<std::size_t>(f);
    }

    [[nodiscard]] constexpr std::string_view filter_name(Filter f)
    {
        switch (f)
        {
            case Filter::U: return "u";
            case Filter::G: return "g";
            case Filter::R: return "r";
            case Filter::I: return "i";
            case Filter::Z: return "z";
            case Filter::Y: return "y";
        }
        return "?";
    }

    /// @brief Parse a single-letter bandpass name ("u".."y").
    [[nodiscard]] constexpr std::optional<Filter> parse_filter(std::string_view name)
    {
        for (const Filter f : kAllFilters)
        {
            if (filter_name(f) == name)
            {
                return f;
            }
        }
        return std::nullopt;
    }

    /// @brief Effective wavelength of each bandpass [nm].
    constexpr PerFilter<f64> kFilterWavelengthNm{367.0, 482.5, 622.2, 754.5, 869.1, 971.0};

} // namespace meridian
