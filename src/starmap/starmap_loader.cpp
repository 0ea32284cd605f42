/// @file starmap_loader.cpp
/// @brief Implementation of the CSV starmap fixture loader.

#include "starmap/starmap_loader.hpp"

#include "core/logger.hpp"

#include <charconv>
#include <fstream>
#include <string>
#include <vector>

namespace starlane::starmap
{

namespace
{

std::vector<std::string_view> split_columns(std::string_view line)
{
    std::vector<std::string_view> columns;
    std::size_t start = 0;
    while (true)
    {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos)
        {
            columns.push_back(line.substr(start));
            break;
        }
        columns.push_back(line.substr(start, comma - start));
        start = comma + 1;
    }
    return columns;
}

} // namespace

// -----------------------------------------------------------------
// load_csv
// -----------------------------------------------------------------

std::optional<std::shared_ptr<const PointSet>>
StarmapLoader::load_csv(const std::filesystem::path& systems_path,
                        const std::filesystem::path& gates_path)
{
    PointSet::Builder builder;

    if (!load_systems(systems_path, builder) || !load_gates(gates_path, builder))
    {
        return std::nullopt;
    }

    return builder.build();
}

// -----------------------------------------------------------------
// Systems CSV: id,name,x,y,z,temperature,region
// -----------------------------------------------------------------

bool StarmapLoader::load_systems(const std::filesystem::path& path, PointSet::Builder& builder)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SL_CORE_ERROR("StarmapLoader: Failed to open file: {}", path.string());
        return false;
    }

    std::string line;

    // Skip header line
    if (!std::getline(file, line))
    {
        SL_CORE_ERROR("StarmapLoader: File is empty: {}", path.string());
        return false;
    }

    u32 line_number = 1;
    u32 skipped = 0;
    u32 loaded = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        if (trim(line).empty())
        {
            continue;
        }

        const auto columns = split_columns(line);
        if (columns.size() < 6)
        {
            SL_CORE_WARN("StarmapLoader: Malformed line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        const auto id = parse_i64(trim(columns[0]));
        const auto name = trim(columns[1]);
        if (!id || name.empty())
        {
            SL_CORE_WARN("StarmapLoader: Missing id or name on line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        Point point{
            .id       = *id,
            .name     = std::string(name),
            .position = std::nullopt,
            .metadata = {},
        };

        const auto xs = trim(columns[2]);
        const auto ys = trim(columns[3]);
        const auto zs = trim(columns[4]);
        if (!xs.empty() || !ys.empty() || !zs.empty())
        {
            const auto x = parse_f64(xs);
            const auto y = parse_f64(ys);
            const auto z = parse_f64(zs);
            if (!x || !y || !z)
            {
                SL_CORE_WARN("StarmapLoader: Failed to parse coordinates on line {}: {}",
                        line_number, line);
                ++skipped;
                continue;
            }
            point.position = Vec3d(*x, *y, *z);
        }

        if (const auto ts = trim(columns[5]); !ts.empty())
        {
            const auto temperature = parse_f64(ts);
            if (!temperature)
            {
                SL_CORE_WARN("StarmapLoader: Failed to parse temperature on line {}: {}",
                        line_number, line);
                ++skipped;
                continue;
            }
            point.metadata.temperature = *temperature;
        }

        if (columns.size() > 6)
        {
            if (const auto region = trim(columns[6]); !region.empty())
            {
                point.metadata.region_name = std::string(region);
            }
        }

        if (builder.add_point(std::move(point)))
        {
            ++loaded;
        }
        else
        {
            ++skipped;
        }
    }

    if (loaded == 0)
    {
        SL_CORE_ERROR("StarmapLoader: No valid systems found in: {}", path.string());
        return false;
    }

    if (skipped > 0)
    {
        SL_CORE_WARN("StarmapLoader: Skipped {} malformed system lines", skipped);
    }

    SL_CORE_INFO("StarmapLoader: Loaded {} systems from {}", loaded, path.string());
    return true;
}

// -----------------------------------------------------------------
// Gates CSV: from,to
// -----------------------------------------------------------------

bool StarmapLoader::load_gates(const std::filesystem::path& path, PointSet::Builder& builder)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SL_CORE_ERROR("StarmapLoader: Failed to open file: {}", path.string());
        return false;
    }

    std::string line;

    // Skip header line; a header-only file means no gates.
    if (!std::getline(file, line))
    {
        SL_CORE_ERROR("StarmapLoader: File is empty: {}", path.string());
        return false;
    }

    u32 line_number = 1;
    u32 skipped = 0;
    u32 loaded = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        if (trim(line).empty())
        {
            continue;
        }

        const auto columns = split_columns(line);
        const auto from = columns.size() >= 2 ? parse_i64(trim(columns[0])) : std::nullopt;
        const auto to   = columns.size() >= 2 ? parse_i64(trim(columns[1])) : std::nullopt;
        if (!from || !to)
        {
            SL_CORE_WARN("StarmapLoader: Malformed line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        builder.add_gate(*from, *to);
        ++loaded;
    }

    if (skipped > 0)
    {
        SL_CORE_WARN("StarmapLoader: Skipped {} malformed gate lines", skipped);
    }

    SL_CORE_INFO("StarmapLoader: Loaded {} gate links from {}", loaded, path.string());
    return true;
}

// -----------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------

std::string_view StarmapLoader::trim(std::string_view sv)
{
    const auto start = sv.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos)
    {
        return {};
    }
    const auto end = sv.find_last_not_of(" \t\r\n");
    return sv.substr(start, end - start + 1);
}

std::optional<f64> StarmapLoader::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }
    return value;
}

std::optional<i64> StarmapLoader::parse_i64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    i64 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }
    return value;
}

} // namespace starlane::starmap
