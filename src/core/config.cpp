/// @file config.cpp
/// @brief EngineConfig validation and config file parsing.

#include "core/config.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>

namespace starlane::core
{

namespace
{

std::string_view trim(std::string_view sv)
{
    const auto start = sv.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos)
    {
        return {};
    }
    const auto end = sv.find_last_not_of(" \t\r\n");
    return sv.substr(start, end - start + 1);
}

std::optional<f64> parse_f64(std::string_view sv)
{
    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(value))
    {
        return std::nullopt;
    }
    return value;
}

std::optional<i64> parse_i64(std::string_view sv)
{
    i64 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }
    return value;
}

template <typename T>
T clamp_with_warning(std::string_view key, T value, T lo, T hi)
{
    const T clamped = std::clamp(value, lo, hi);
    if (clamped != value)
    {
        SL_CORE_WARN("ConfigLoader: {} = {} out of range [{}, {}], clamped to {}",
                     key, value, lo, hi, clamped);
    }
    return clamped;
}

} // namespace

// -----------------------------------------------------------------
// EngineConfig::validate
// -----------------------------------------------------------------

std::optional<std::string> EngineConfig::validate() const
{
    if (max_spatial_neighbors == 0)
    {
        return std::string("max_spatial_neighbors must be at least 1");
    }
    if (!(heat_calibration_constant > 0.0) || !std::isfinite(heat_calibration_constant))
    {
        return std::string("heat_calibration_constant must be positive");
    }
    if (!(heat_nominal_threshold < heat_overheated_threshold &&
          heat_overheated_threshold < heat_critical_threshold))
    {
        return std::string("heat thresholds must satisfy nominal < overheated < critical");
    }
    if (fuel_quality < 1.0 || fuel_quality > 100.0)
    {
        return std::string("fuel_quality must be within [1, 100]");
    }
    if (compression_level < 0 || compression_level > 9)
    {
        return std::string("compression_level must be within [0, 9]");
    }
    return std::nullopt;
}

// -----------------------------------------------------------------
// ConfigLoader
// -----------------------------------------------------------------

std::optional<EngineConfig> ConfigLoader::load_file(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SL_CORE_ERROR("ConfigLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    EngineConfig config = parse(contents.str());
    SL_CORE_INFO("ConfigLoader: Loaded config from {}", path.string());
    return config;
}

EngineConfig ConfigLoader::parse(std::string_view text)
{
    EngineConfig config;
    u32 line_number = 0;

    while (!text.empty())
    {
        const auto newline = text.find('\n');
        std::string_view line = text.substr(0, newline);
        text = (newline == std::string_view::npos) ? std::string_view{} : text.substr(newline + 1);
        ++line_number;

        if (const auto hash = line.find('#'); hash != std::string_view::npos)
        {
            line = line.substr(0, hash);
        }
        line = trim(line);
        if (line.empty())
        {
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos)
        {
            SL_CORE_WARN("ConfigLoader: Malformed line {}: {}", line_number, line);
            continue;
        }

        apply(config, trim(line.substr(0, eq)), trim(line.substr(eq + 1)), line_number);
    }

    return config;
}

std::optional<spdlog::level::level_enum> ConfigLoader::parse_level(std::string_view name)
{
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn")     return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    return std::nullopt;
}

void ConfigLoader::apply(EngineConfig& config, std::string_view key,
                         std::string_view value, u32 line_number)
{
    const auto bad_value = [&]()
    {
        SL_CORE_WARN("ConfigLoader: Invalid value for {} on line {}: '{}'",
                     key, line_number, value);
    };

    if (key == "max_spatial_neighbors")
    {
        const auto v = parse_i64(value);
        if (!v) { bad_value(); return; }
        config.max_spatial_neighbors =
            static_cast<std::size_t>(clamp_with_warning<i64>(key, *v, 1, 1024));
    }
    else if (key == "heat_calibration_constant")
    {
        const auto v = parse_f64(value);
        if (!v || *v <= 0.0) { bad_value(); return; }
        config.heat_calibration_constant = *v;
    }
    else if (key == "heat_critical_threshold")
    {
        const auto v = parse_f64(value);
        if (!v) { bad_value(); return; }
        config.heat_critical_threshold = *v;
    }
    else if (key == "heat_overheated_threshold")
    {
        const auto v = parse_f64(value);
        if (!v) { bad_value(); return; }
        config.heat_overheated_threshold = *v;
    }
    else if (key == "heat_nominal_threshold")
    {
        const auto v = parse_f64(value);
        if (!v) { bad_value(); return; }
        config.heat_nominal_threshold = *v;
    }
    else if (key == "fuel_quality")
    {
        const auto v = parse_f64(value);
        if (!v) { bad_value(); return; }
        config.fuel_quality = clamp_with_warning<f64>(key, *v, 1.0, 100.0);
    }
    else if (key == "compression_level")
    {
        const auto v = parse_i64(value);
        if (!v) { bad_value(); return; }
        config.compression_level = static_cast<int>(clamp_with_warning<i64>(key, *v, 0, 9));
    }
    else if (key == "log_level")
    {
        const auto v = parse_level(value);
        if (!v) { bad_value(); return; }
        config.log_level = *v;
    }
    else if (key == "log_file")
    {
        config.log_file = std::string(value);
    }
    else
    {
        SL_CORE_WARN("ConfigLoader: Unknown key '{}' on line {}", key, line_number);
    }
}

} // namespace starlane::core
