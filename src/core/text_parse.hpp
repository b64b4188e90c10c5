#pragma once

/// @file text_parse.hpp
/// @brief Small parsing helpers shared by the configuration and table loaders.

#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace meridian::core
{
    /// @brief Static helpers for whitespace trimming and numeric parsing.
    class TextParse
    {
    public:
        TextParse() = delete;

        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a complete f64 from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure or trailing text.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);

        /// @brief Parse a complete signed integer from a trimmed string_view.
        [[nodiscard]] static std::optional<i64> parse_i64(std::string_view sv);

        /// @brief Parse "true"/"false"/"1"/"0"/"yes"/"no".
        [[nodiscard]] static std::optional<bool> parse_bool(std::string_view sv);
    };

} // namespace meridian::core
