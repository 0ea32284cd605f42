#pragma once

/// @file config.hpp
/// @brief Engine tunables and the key = value config file loader.

#include "core/types.hpp"

#include <spdlog/common.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace starlane::core
{
    /// @brief Tunables shared by graph builders, the heat model and the index codec.
    struct EngineConfig
    {
        std::size_t max_spatial_neighbors = routing_constants::kDefaultSpatialNeighbours;
        f64 heat_calibration_constant     = routing_constants::kDefaultHeatCalibration;
        f64 heat_critical_threshold       = routing_constants::kHeatCritical;
        f64 heat_overheated_threshold     = routing_constants::kHeatOverheated;
        f64 heat_nominal_threshold        = routing_constants::kHeatNominal;
        f64 fuel_quality                  = routing_constants::kDefaultFuelQuality;
        int compression_level             = 6;
        spdlog::level::level_enum log_level = spdlog::level::info;
        std::string log_file;

        /// @brief Describe the first invalid field, or std::nullopt when the config is usable.
        [[nodiscard]] std::optional<std::string> validate() const;
    };

    /// @brief Static utility class for reading EngineConfig files.
    ///
    /// Format: one `key = value` per line, `#` starts a comment, blank lines
    /// are ignored. Unknown keys and unparsable values are skipped with a
    /// warning; out-of-range values are clamped with a warning.
    class ConfigLoader
    {
    public:
        ConfigLoader() = delete;

        /// @brief Load a config file on top of the defaults.
        /// @return The config, or std::nullopt when the file cannot be opened.
        [[nodiscard]] static std::optional<EngineConfig>
            load_file(const std::filesystem::path& path);

        /// @brief Parse config text on top of the defaults.
        [[nodiscard]] static EngineConfig parse(std::string_view text);

        /// @brief Parse a log level name (trace|debug|info|warn|error|critical|off).
        [[nodiscard]] static std::optional<spdlog::level::level_enum>
            parse_level(std::string_view name);

    private:
        static void apply(EngineConfig& config, std::string_view key,
                          std::string_view value, u32 line_number);
    };

} // namespace starlane::core
