/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers over a console sink and an optional rotating file sink.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace starlane::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

namespace
{

constexpr const char* kPattern = "[%T.%e] [%n] [%^%l%$] %v";

std::mutex g_init_mutex;
std::once_flag g_default_once;

std::shared_ptr<spdlog::logger> make_logger(const char* name,
                                            const std::vector<spdlog::sink_ptr>& sinks,
                                            spdlog::level::level_enum level)
{
    // A previous init() (or a lazy default) may still be registered under this name.
    spdlog::drop(name);

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // namespace

void Logger::init(const LoggerConfig& config)
{
    std::lock_guard<std::mutex> lock(g_init_mutex);
    install(config);
}

void Logger::install(const LoggerConfig& config)
{
    // -----------------------------------------------------------------
    // Both loggers write to the same console and file sinks.
    // Console goes to stderr so CLI output on stdout stays clean.
    // -----------------------------------------------------------------
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(kPattern);

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    if (!config.log_file.empty())
    {
        // Rotating file sink: 5 MB max size, 3 rotated files
        constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
        constexpr std::size_t kMaxFiles = 3;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file, kMaxFileSize, kMaxFiles);
        file_sink->set_pattern(kPattern);
        sinks.push_back(file_sink);
    }

    s_core_logger = make_logger("STARLANE", sinks, config.level);
    s_app_logger  = make_logger("APP", sinks, config.level);
}

void Logger::shutdown()
{
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (s_core_logger)
    {
        s_core_logger->flush();
    }
    if (s_app_logger)
    {
        s_app_logger->flush();
    }
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
}

void Logger::set_level(spdlog::level::level_enum level)
{
    get_core_logger()->set_level(level);
    get_app_logger()->set_level(level);
}

void Logger::ensure_default()
{
    // Runs once per process; loggers installed by an earlier init() are kept.
    std::call_once(g_default_once, []()
    {
        std::lock_guard<std::mutex> lock(g_init_mutex);
        if (!s_core_logger || !s_app_logger)
        {
            install(LoggerConfig{});
        }
    });
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    ensure_default();
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    ensure_default();
    return s_app_logger;
}

} // namespace starlane::core
