/// @file text_parse.cpp
/// @brief Implementation of the shared parsing helpers.

#include "core/text_parse.hpp"

#include <charconv>

namespace meridian::core
{

std::string_view TextParse::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

std::optional<f64> TextParse::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    // std::from_chars for double requires C++17 and MSVC/GCC 11+/Clang 16+
    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

std::optional<i64> TextParse::parse_i64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    i64 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

std::optional<bool> TextParse::parse_bool(std::string_view sv)
{
    if (sv == "true" || sv == "1" || sv == "yes")
    {
        return true;
    }
    if (sv == "false" || sv == "0" || sv == "no")
    {
        return false;
    }
    return std::nullopt;
}

} // namespace meridian::core
