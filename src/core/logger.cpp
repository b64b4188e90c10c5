/// @file logger.cpp
/// @brief Logger implementation: two spdlog loggers sharing console and rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace meridian::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_sim_logger;

void Logger::init(const LogConfig& config)
{
    // Re-initialization replaces the previous loggers
    if (s_core_logger || s_sim_logger)
    {
        shutdown();
    }

    // -----------------------------------------------------------------
    // Both loggers write to the same console and file
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console)
    {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (!config.file_path.empty())
    {
        // Rotating file sink: 5 MB max size, 3 rotated files
        constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
        constexpr std::size_t kMaxFiles = 3;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path, kMaxFileSize, kMaxFiles);
        file_sink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(file_sink);
    }

    // -----------------------------------------------------------------
    // Core logger ("MERIDIAN") for engine internals
    // -----------------------------------------------------------------
    s_core_logger = std::make_shared<spdlog::logger>("MERIDIAN", sinks.begin(), sinks.end());
    s_core_logger->set_level(config.level);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // Simulation logger ("SIM") for observation outcomes
    // -----------------------------------------------------------------
    s_sim_logger = std::make_shared<spdlog::logger>("SIM", sinks.begin(), sinks.end());
    s_sim_logger->set_level(config.level);
    s_sim_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_sim_logger);
}

void Logger::shutdown()
{
    if (s_core_logger)
    {
        s_core_logger->flush();
    }
    if (s_sim_logger)
    {
        s_sim_logger->flush();
    }
    s_core_logger.reset();
    s_sim_logger.reset();
    spdlog::drop("MERIDIAN");
    spdlog::drop("SIM");
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    if (!s_core_logger)
    {
        s_core_logger = spdlog::default_logger();
    }
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_sim_logger()
{
    if (!s_sim_logger)
    {
        s_sim_logger = spdlog::default_logger();
    }
    return s_sim_logger;
}

} // namespace meridian::core
