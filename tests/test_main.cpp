/// @file test_main.cpp
/// @brief doctest runner for the TransitScan test suite.
///
/// Loggers are initialised before any test runs because every module logs
/// through the TSC_ macros.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/logger.hpp"

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    transitscan::core::LoggingConfig logging;
    logging.level     = "warn";
    logging.file_path = "";
    transitscan::core::Logger::init(logging);

    const int result = doctest::Context(argc, argv).run();

    transitscan::core::Logger::shutdown();
    return result;
}
