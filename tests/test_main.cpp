/// @file test_main.cpp
/// @brief doctest runner for meridian_tests.
///
/// Initializes logging before any test runs so library log calls go through
/// the configured MERIDIAN/SIM loggers.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/logger.hpp"

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    meridian::core::Logger::init(meridian::core::LogConfig{
        .level = spdlog::level::warn,
        .console = true,
        .file_path = {},
    });
    const int result = doctest::Context(argc, argv).run();
    meridian::core::Logger::shutdown();
    return result;
}
