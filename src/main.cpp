// src/main.cpp - starlane command-line demo
//
// Commands:
//   route        <systems.csv> <gates.csv> <start> <goal> [bfs|dijkstra|a-star] [max_jump]
//   index-build  <systems.csv> <gates.csv> <out.bin>
//   index-verify <systems.csv> <gates.csv> <index.bin>
//
// STARLANE_CONFIG names an optional engine config file.

#include "core/config.hpp"
#include "core/logger.hpp"
#include "routing/route_planner.hpp"
#include "spatial/index_codec.hpp"
#include "spatial/spatial_index.hpp"
#include "starmap/starmap_loader.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace starlane;

namespace
{

void print_usage()
{
    std::cout << "usage:\n"
              << "  starlane_cli route <systems.csv> <gates.csv> <start> <goal> "
                 "[bfs|dijkstra|a-star] [max_jump]\n"
              << "  starlane_cli index-build <systems.csv> <gates.csv> <out.bin>\n"
              << "  starlane_cli index-verify <systems.csv> <gates.csv> <index.bin>\n";
}

std::optional<std::vector<u8>> read_bytes(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        SL_ERROR("Failed to open index file: {}", path);
        return std::nullopt;
    }
    return std::vector<u8>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

bool write_bytes(const std::string& path, const std::vector<u8>& bytes)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
    {
        SL_ERROR("Failed to open output file: {}", path);
        return false;
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(file);
}

// -----------------------------------------------------------------------
// route
// -----------------------------------------------------------------------

int run_route(const std::vector<std::string>& args, const core::EngineConfig& config)
{
    if (args.size() < 4)
    {
        print_usage();
        return 2;
    }

    auto points = starmap::StarmapLoader::load_csv(args[0], args[1]);
    if (!points)
    {
        return 1;
    }

    routing::RouteRequest request;
    request.start = args[2];
    request.goal = args[3];

    if (args.size() > 4)
    {
        const auto algorithm = routing::parse_algorithm(args[4]);
        if (!algorithm)
        {
            SL_ERROR("Unknown algorithm '{}'", args[4]);
            return 2;
        }
        request.algorithm = *algorithm;
    }
    if (args.size() > 5)
    {
        f64 max_jump = 0.0;
        const auto& text = args[5];
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), max_jump);
        if (ec != std::errc{} || ptr != text.data() + text.size())
        {
            SL_ERROR("Invalid max_jump '{}'", text);
            return 2;
        }
        request.max_jump = max_jump;
    }

    const auto runtime = routing::RouteRuntime::create(std::move(*points), config);
    const auto plan = routing::plan_route(*runtime, request);
    if (!plan)
    {
        std::cout << "error: " << plan.error().message() << "\n";
        return 1;
    }

    const auto& set = runtime->points();
    std::cout << "Route (" << routing::to_string(plan->algorithm) << ", "
              << graph::to_string(plan->graph_mode) << " graph): "
              << plan->hop_count() << " hops, " << plan->gate_count << " gates, "
              << plan->jump_count << " jumps\n";

    std::cout << "  " << set.name_of(plan->start) << "\n";
    for (const auto& hop : plan->hops)
    {
        std::cout << "  -> " << set.name_of(hop.to) << "  [" << graph::to_string(hop.kind);
        if (hop.distance)
        {
            std::cout << " " << std::fixed << std::setprecision(2) << *hop.distance << " ly";
        }
        std::cout << "]\n";
    }
    std::cout << "Total distance: " << std::fixed << std::setprecision(2) << plan->total_distance
              << " ly (spatial " << plan->spatial_distance << " ly)\n";

    for (const auto& warning : plan->warnings)
    {
        std::cout << "warning: " << warning << "\n";
    }
    return 0;
}

// -----------------------------------------------------------------------
// index-build / index-verify
// -----------------------------------------------------------------------

int run_index_build(const std::vector<std::string>& args, const core::EngineConfig& config)
{
    if (args.size() < 3)
    {
        print_usage();
        return 2;
    }

    const auto points = starmap::StarmapLoader::load_csv(args[0], args[1]);
    if (!points)
    {
        return 1;
    }

    const auto index = spatial::SpatialIndex::build(**points);
    const auto bytes = spatial::serialize(index, spatial::SerializeOptions{
        .compression_level = config.compression_level,
    });
    if (!bytes)
    {
        SL_ERROR("{}", bytes.error().message());
        return 1;
    }
    if (!write_bytes(args[2], *bytes))
    {
        return 1;
    }

    std::cout << "Wrote " << index.size() << " nodes (" << bytes->size() << " bytes) to "
              << args[2] << "\n";
    return 0;
}

int run_index_verify(const std::vector<std::string>& args)
{
    if (args.size() < 3)
    {
        print_usage();
        return 2;
    }

    const auto points = starmap::StarmapLoader::load_csv(args[0], args[1]);
    if (!points)
    {
        return 1;
    }
    const auto bytes = read_bytes(args[2]);
    if (!bytes)
    {
        return 1;
    }

    const auto index = spatial::deserialize(*bytes);
    if (!index)
    {
        std::cout << "error: " << index.error().message() << "\n";
        return 1;
    }

    const auto report = spatial::check_freshness(*index, (*points)->fingerprint());
    std::cout << "Index: " << index->size() << " nodes, "
              << (index->has_temperature() ? "with" : "without") << " temperatures\n"
              << "Freshness: " << spatial::to_string(report.status) << "\n";
    if (report.status == spatial::Freshness::Stale)
    {
        std::cout << "  dataset checksum: " << report.expected_checksum << "\n"
                  << "  index checksum:   " << report.actual_checksum << "\n";
    }
    return report.status == spatial::Freshness::Stale ? 1 : 0;
}

} // namespace

int main(int argc, char** argv)
{
    core::EngineConfig config;
    if (const char* config_path = std::getenv("STARLANE_CONFIG"))
    {
        if (auto loaded = core::ConfigLoader::load_file(config_path))
        {
            config = std::move(*loaded);
        }
    }

    core::Logger::init(core::LoggerConfig{.level = config.log_level, .log_file = config.log_file});

    if (const auto invalid = config.validate())
    {
        SL_ERROR("Invalid engine config: {}", *invalid);
        core::Logger::shutdown();
        return 2;
    }

    if (argc < 2)
    {
        print_usage();
        core::Logger::shutdown();
        return 2;
    }

    const std::string_view command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    int status = 2;
    if (command == "route")
    {
        status = run_route(args, config);
    }
    else if (command == "index-build")
    {
        status = run_index_build(args, config);
    }
    else if (command == "index-verify")
    {
        status = run_index_verify(args);
    }
    else
    {
        print_usage();
    }

    core::Logger::shutdown();
    return status;
}
