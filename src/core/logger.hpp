#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + application loggers).

#include "core/config.hpp"

#include <spdlog/spdlog.h>

#include <memory>

namespace transitscan::core
{
    /// @brief Centralized logging facility for TransitScan.
    ///
    /// Provides two separate loggers:
    /// - **TRANSITSCAN** (core): table reading, period search, storage, network
    /// - **APP**: analysis pipeline and user-facing messages
    ///
    /// Both write to colored console output (unless disabled) and a rotating log file.
    /// Call init() from main() before any logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// Must be called at startup before any TSC_ macros are used. Calling it
        /// again replaces both loggers with the new configuration.
        static void init(const LoggingConfig& config = {});

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the engine-internal logger ("TRANSITSCAN").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace transitscan::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define TSC_CORE_TRACE(...)    ::transitscan::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define TSC_CORE_DEBUG(...)    ::transitscan::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define TSC_CORE_INFO(...)     ::transitscan::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define TSC_CORE_WARN(...)     ::transitscan::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define TSC_CORE_ERROR(...)    ::transitscan::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define TSC_CORE_CRITICAL(...) ::transitscan::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define TSC_TRACE(...)         ::transitscan::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define TSC_DEBUG(...)         ::transitscan::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define TSC_INFO(...)          ::transitscan::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define TSC_WARN(...)          ::transitscan::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define TSC_ERROR(...)         ::transitscan::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define TSC_CRITICAL(...)      ::transitscan::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
