/// @file config_loader.cpp
/// @brief Implementation of the "key = value" configuration loader.

#include "core/config_loader.hpp"

#include "core/logger.hpp"
#include "core/text_parse.hpp"

#include <spdlog/common.h>

#include <fstream>
#include <functional>
#include <limits>
#include <string>
#include <type_traits>
#include <unordered_map>

namespace meridian::core
{

namespace
{
    constexpr f64 kDeg = astro_constants::kDegToRad;
    constexpr f64 kMinToDays = 1.0 / time_constants::kMinutesPerDay;

    using Setter = std::function<bool(SimulationConfig&, std::string_view)>;

    /// Setter storing value × scale into a f64 member.
    template <typename Member>
    Setter real(Member member, f64 scale = 1.0)
    {
        return [member, scale](SimulationConfig& cfg, std::string_view v)
        {
            const auto parsed = TextParse::parse_f64(v);
            if (!parsed)
            {
                return false;
            }
            std::invoke(member, cfg) = *parsed * scale;
            return true;
        };
    }

    template <typename Member>
    Setter integer(Member member)
    {
        return [member](SimulationConfig& cfg, std::string_view v)
        {
            const auto parsed = TextParse::parse_i64(v);
            if (!parsed)
            {
                return false;
            }
            using Target = std::remove_reference_t<decltype(std::invoke(member, cfg))>;
            if (*parsed < static_cast<i64>(std::numeric_limits<Target>::min())
                || *parsed > static_cast<i64>(std::numeric_limits<Target>::max()))
            {
                return false;
            }
            std::invoke(member, cfg) = static_cast<Target>(*parsed);
            return true;
        };
    }

    template <typename Member>
    Setter text(Member member)
    {
        return [member](SimulationConfig& cfg, std::string_view v)
        {
            std::invoke(member, cfg) = std::string(v);
            return true;
        };
    }

    const std::unordered_map<std::string_view, Setter>& setters()
    {
        static const std::unordered_map<std::string_view, Setter> table{
            // ---- Site ----
            {"site_lat_deg",        real([](SimulationConfig& c) -> f64& { return c.observatory.site.latitude_rad; }, kDeg)},
            {"site_lon_deg",        real([](SimulationConfig& c) -> f64& { return c.observatory.site.longitude_rad; }, kDeg)},
            {"site_elevation_m",    real([](SimulationConfig& c) -> f64& { return c.observatory.site.elevation_m; })},

            // ---- Observatory timing ----
            {"mjd_start",           real([](SimulationConfig& c) -> f64& { return c.observatory.mjd_start; })},
            {"readtime_s",          real([](SimulationConfig& c) -> f64& { return c.observatory.readtime_s; })},
            {"filter_change_s",     real([](SimulationConfig& c) -> f64& { return c.observatory.filter_change_s; })},
            {"shutter_s",           real([](SimulationConfig& c) -> f64& { return c.observatory.shutter_s; })},
            {"min_slew_s",          real([](SimulationConfig& c) -> f64& { return c.observatory.min_slew_s; })},
            {"nside",               integer([](SimulationConfig& c) -> i32& { return c.observatory.nside; })},

            // ---- Gating limits ----
            {"sun_limit_deg",       real([](SimulationConfig& c) -> f64& { return c.observatory.sun_limit_rad; }, kDeg)},
            {"alt_limit_deg",       real([](SimulationConfig& c) -> f64& { return c.observatory.alt_limit_rad; }, kDeg)},
            {"twilight_limit_deg",  real([](SimulationConfig& c) -> f64& { return c.observatory.twilight_limit_rad; }, kDeg)},
            {"cloud_limit",         real([](SimulationConfig& c) -> f64& { return c.observatory.cloud_limit; })},
            {"cloud_step_min",      real([](SimulationConfig& c) -> f64& { return c.observatory.cloud_step_days; }, kMinToDays)},
            {"fallback_jump_days",  real([](SimulationConfig& c) -> f64& { return c.observatory.fallback_jump_days; })},
            {"horizon_years",       integer([](SimulationConfig& c) -> i32& { return c.observatory.horizon_years; })},
            {"day_padding_days",    real([](SimulationConfig& c) -> f64& { return c.observatory.day_padding; })},

            // ---- Built-in environment ----
            {"seed",                integer([](SimulationConfig& c) -> i64& { return c.environment.seed; })},
            {"sky_timeline_days",   real([](SimulationConfig& c) -> f64& { return c.environment.sky_timeline_days; })},
            {"sky_timeline_step_min", real([](SimulationConfig& c) -> f64& { return c.environment.sky_timeline_step_days; }, kMinToDays)},
            {"seeing_fwhm500_arcsec", real([](SimulationConfig& c) -> f64& { return c.environment.seeing_fwhm500_arcsec; })},
            {"seeing_file",         text([](SimulationConfig& c) -> std::string& { return c.environment.seeing_file; })},
            {"cloud_fraction",      real([](SimulationConfig& c) -> f64& { return c.environment.cloud_fraction; })},
            {"cloud_file",          text([](SimulationConfig& c) -> std::string& { return c.environment.cloud_file; })},
            {"slew_rate_deg_s",     real([](SimulationConfig& c) -> f64& { return c.environment.slew_axis_rate_rad_s; }, kDeg)},
            {"slew_accel_deg_s2",   real([](SimulationConfig& c) -> f64& { return c.environment.slew_axis_accel_rad_s2; }, kDeg)},
            {"slew_settle_s",       real([](SimulationConfig& c) -> f64& { return c.environment.slew_settle_s; })},
            {"unscheduled_downtime", [](SimulationConfig& c, std::string_view v)
                {
                    const auto parsed = TextParse::parse_bool(v);
                    if (!parsed)
                    {
                        return false;
                    }
                    c.environment.unscheduled_downtime = *parsed;
                    return true;
                }},

            // ---- Logging / driver ----
            {"log_file",            text([](SimulationConfig& c) -> std::string& { return c.log.file_path; })},
            {"log_level", [](SimulationConfig& c, std::string_view v)
                {
                    const auto level = spdlog::level::from_str(std::string(v));
                    if (level == spdlog::level::off && v != "off")
                    {
                        return false;
                    }
                    c.log.level = level;
                    return true;
                }},
            {"attempts",            integer([](SimulationConfig& c) -> i32& { return c.attempts; })},
        };
        return table;
    }
} // namespace

bool ConfigLoader::apply(SimulationConfig& config, std::string_view key, std::string_view value)
{
    const auto& table = setters();
    const auto it = table.find(key);
    if (it == table.end())
    {
        return false;
    }
    return it->second(config, value);
}

// -----------------------------------------------------------------
// Load "key = value" file on top of the defaults
// -----------------------------------------------------------------

std::optional<SimulationConfig> ConfigLoader::load(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        MRD_CORE_ERROR("ConfigLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    SimulationConfig config;
    std::string line;
    u32 line_number = 0;
    u32 skipped = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        std::string_view view(line);
        if (const auto hash = view.find('#'); hash != std::string_view::npos)
        {
            view = view.substr(0, hash);
        }
        view = TextParse::trim(view);
        if (view.empty())
        {
            continue;
        }

        const auto eq = view.find('=');
        if (eq == std::string_view::npos)
        {
            MRD_CORE_WARN("ConfigLoader: Malformed line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        const auto key = TextParse::trim(view.substr(0, eq));
        const auto value = TextParse::trim(view.substr(eq + 1));

        if (!apply(config, key, value))
        {
            MRD_CORE_WARN("ConfigLoader: Ignoring line {} (unknown key or bad value): {}",
                          line_number, line);
            ++skipped;
        }
    }

    // Data files are relative to the configuration file
    const auto base = path.parent_path();
    for (std::string* data_file : {&config.environment.seeing_file, &config.environment.cloud_file})
    {
        if (!data_file->empty() && std::filesystem::path(*data_file).is_relative())
        {
            *data_file = (base / *data_file).string();
        }
    }

    if (skipped > 0)
    {
        MRD_CORE_WARN("ConfigLoader: Skipped {} lines in {}", skipped, path.string());
    }

    if (!validate(config.observatory) || !validate(config.environment))
    {
        MRD_CORE_ERROR("ConfigLoader: Invalid configuration in {}", path.string());
        return std::nullopt;
    }

    MRD_CORE_INFO("ConfigLoader: Loaded configuration from {}", path.string());
    return config;
}

} // namespace meridian::core
