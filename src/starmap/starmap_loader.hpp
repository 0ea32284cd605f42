#pragma once

/// @file starmap_loader.hpp
/// @brief Loads a point-set fixture from a pair of CSV files.

#include "starmap/point_set.hpp"

#include "core/types.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace starlane::starmap
{
    /// @brief Static utility class for loading starmap fixtures.
    class StarmapLoader
    {
    public:
        StarmapLoader() = delete;

        /// @brief Load systems and gates into a PointSet.
        ///
        /// Systems CSV columns (header row required):
        ///   id, name, x, y, z, temperature, region
        ///
        /// Empty x/y/z means the system has no coordinates; an empty
        /// temperature means it is unknown; region is optional.
        ///
        /// Gates CSV columns (header row required):
        ///   from, to
        ///
        /// Malformed lines are skipped with a warning.
        ///
        /// @param systems_path Path to the systems CSV file.
        /// @param gates_path Path to the gates CSV file.
        /// @return The point-set on success, std::nullopt when a file cannot be read
        ///         or holds no valid systems.
        [[nodiscard]] static std::optional<std::shared_ptr<const PointSet>>
            load_csv(const std::filesystem::path& systems_path,
                     const std::filesystem::path& gates_path);

    private:
        [[nodiscard]] static bool load_systems(const std::filesystem::path& path,
                                               PointSet::Builder& builder);

        [[nodiscard]] static bool load_gates(const std::filesystem::path& path,
                                             PointSet::Builder& builder);

        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a single f64 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);

        /// @brief Parse a single i64 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<i64> parse_i64(std::string_view sv);
    };

} // namespace starlane::starmap
