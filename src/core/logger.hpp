#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace starlane::core
{
    /// @brief Logger setup chosen by the host.
    struct LoggerConfig
    {
        spdlog::level::level_enum level = spdlog::level::info;
        std::string log_file;   ///< Rotating file sink path; empty = console only
    };

    /// @brief Centralized logging facility for starlane.
    ///
    /// Provides two separate loggers:
    /// - **STARLANE** (core): index build, serialization, graph construction, search
    /// - **APP**: host-facing messages (CLI)
    ///
    /// Both write to colored console output, plus a rotating log file when
    /// LoggerConfig::log_file is set. The host calls init() once at startup;
    /// library code that logs before init() gets a console-only default,
    /// installed once even when several threads log first. init() and
    /// shutdown() must not run concurrently with logging, and nothing may log
    /// after shutdown().
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console (+ optional file) sinks.
        static void init(const LoggerConfig& config = {});

        /// @brief Flush and tear down all loggers.
        static void shutdown();

        /// @brief Change the level of both loggers at runtime.
        static void set_level(spdlog::level::level_enum level);

        /// @brief Access the engine-internal logger ("STARLANE").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static void install(const LoggerConfig& config);
        static void ensure_default();

        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace starlane::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define SL_CORE_TRACE(...)    ::starlane::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define SL_CORE_DEBUG(...)    ::starlane::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define SL_CORE_INFO(...)     ::starlane::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define SL_CORE_WARN(...)     ::starlane::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define SL_CORE_ERROR(...)    ::starlane::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define SL_CORE_CRITICAL(...) ::starlane::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define SL_TRACE(...)         ::starlane::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define SL_DEBUG(...)         ::starlane::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define SL_INFO(...)          ::starlane::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define SL_WARN(...)          ::starlane::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define SL_ERROR(...)         ::starlane::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define SL_CRITICAL(...)      ::starlane::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
