#pragma once

/// @file config_loader.hpp
/// @brief Loads SimulationConfig from "key = value" text files.

#include "core/config.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace meridian::core
{
    /// @brief Static utility class for reading simulation configuration files.
    ///
    /// Format: one `key = value` pair per line, `#` starts a comment, blank
    /// lines are ignored. Keys absent from the file keep their defaults.
    /// Angle keys carry a `_deg` suffix and are converted to radians; durations
    /// carry their unit as a suffix (`_s`, `_min`, `_days`).
    ///
    /// Unknown keys and unparsable values are skipped with a warning. Relative
    /// data-file paths are resolved against the configuration file's directory.
    class ConfigLoader
    {
    public:
        ConfigLoader() = delete;

        /// @brief Load a configuration file on top of the defaults.
        /// @param path Path to the configuration file.
        /// @return The configuration on success; std::nullopt if the file cannot
        ///         be read or the resulting configuration fails validation.
        [[nodiscard]] static std::optional<SimulationConfig>
            load(const std::filesystem::path& path);

        /// @brief Apply a single key/value pair to @p config.
        /// @return false if the key is unknown or the value cannot be parsed.
        [[nodiscard]] static bool apply(SimulationConfig& config,
                                        std::string_view key,
                                        std::string_view value);
    };

} // namespace meridian::core
