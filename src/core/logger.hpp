#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + simulation loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace meridian::core
{
    /// @brief Logger settings supplied by the driver.
    struct LogConfig
    {
        spdlog::level::level_enum level = spdlog::level::info;
        bool console = true;
        std::string file_path;  ///< Rotating log file; empty disables the file sink
    };

    /// @brief Centralized logging facility for Meridian.
    ///
    /// Provides two separate loggers:
    /// - **MERIDIAN** (core): ephemeris, providers, loaders, gate fallbacks
    /// - **SIM**: observation attempts and their outcomes
    ///
    /// Before init() is called both accessors hand out spdlog's default logger,
    /// so library code may log from tests or tools that never configure logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with the configured sinks.
        static void init(const LogConfig& config = {});

        /// @brief Flush and tear down all loggers.
        static void shutdown();

        /// @brief Access the engine-internal logger ("MERIDIAN").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the simulation logger ("SIM").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_sim_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_sim_logger;
    };

} // namespace meridian::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define MRD_CORE_TRACE(...)    ::meridian::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define MRD_CORE_DEBUG(...)    ::meridian::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define MRD_CORE_INFO(...)     ::meridian::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define MRD_CORE_WARN(...)     ::meridian::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define MRD_CORE_ERROR(...)    ::meridian::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define MRD_CORE_CRITICAL(...) ::meridian::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Simulation log macros
// -----------------------------------------------------------------
#define MRD_TRACE(...)         ::meridian::core::Logger::get_sim_logger()->trace(__VA_ARGS__)
#define MRD_DEBUG(...)         ::meridian::core::Logger::get_sim_logger()->debug(__VA_ARGS__)
#define MRD_INFO(...)          ::meridian::core::Logger::get_sim_logger()->info(__VA_ARGS__)
#define MRD_WARN(...)          ::meridian::core::Logger::get_sim_logger()->warn(__VA_ARGS__)
#define MRD_ERROR(...)         ::meridian::core::Logger::get_sim_logger()->error(__VA_ARGS__)
#define MRD_CRITICAL(...)      ::meridian::core::Logger::get_sim_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
