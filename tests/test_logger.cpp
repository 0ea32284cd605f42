/// @file test_logger.cpp
/// @brief Unit tests for the lazily installed default loggers.
///
/// This binary deliberately skips Logger::init() so that the first log
/// calls come from worker threads.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "routing/route_planner.hpp"
#include "starmap/point_set.hpp"
#include "core/logger.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace starlane;
using starlane::starmap::Point;
using starlane::starmap::PointSet;

int main(int argc, char** argv)
{
    const int result = doctest::Context(argc, argv).run();
    starlane::core::Logger::shutdown();
    return result;
}

// =================================================================
// Default loggers
// =================================================================

TEST_CASE("Concurrent first use installs one default logger pair")
{
    constexpr int kThreads = 8;
    std::vector<spdlog::logger*> core_seen(kThreads, nullptr);
    std::vector<spdlog::logger*> app_seen(kThreads, nullptr);
    std::atomic<bool> go{false};

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t)
    {
        workers.emplace_back([&, t]()
        {
            while (!go.load())
            {
                std::this_thread::yield();
            }
            for (int i = 0; i < 50; ++i)
            {
                SL_CORE_DEBUG("worker {} message {}", t, i);
                SL_DEBUG("worker {} message {}", t, i);
            }
            core_seen[t] = core::Logger::get_core_logger().get();
            app_seen[t] = core::Logger::get_app_logger().get();
        });
    }
    go.store(true);
    for (auto& w : workers)
    {
        w.join();
    }

    REQUIRE(core_seen[0] != nullptr);
    REQUIRE(app_seen[0] != nullptr);
    for (int t = 1; t < kThreads; ++t)
    {
        CHECK(core_seen[t] == core_seen[0]);
        CHECK(app_seen[t] == app_seen[0]);
    }
    CHECK(core_seen[0]->name() == "STARLANE");
    CHECK(app_seen[0]->name() == "APP");
}

TEST_CASE("Concurrent plans on a shared runtime log through the same loggers")
{
    PointSet::Builder builder;
    builder.add_point(Point{.id = 1, .name = "A", .position = Vec3d(0.0, 0.0, 0.0), .metadata = {}});
    builder.add_point(Point{.id = 2, .name = "B", .position = Vec3d(7.5, 6.614378277661476, 0.0), .metadata = {}});
    builder.add_point(Point{.id = 3, .name = "C", .position = Vec3d(15.0, 0.0, 0.0), .metadata = {}});
    builder.add_gate(1, 2);
    builder.add_gate(2, 3);
    const auto runtime = routing::RouteRuntime::create(builder.build());
    spdlog::logger* const core_before = core::Logger::get_core_logger().get();

    constexpr int kThreads = 6;
    std::atomic<int> found{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t)
    {
        workers.emplace_back([&, t]()
        {
            routing::RouteRequest request;
            request.start = "A";
            request.goal = "C";
            request.algorithm = (t % 2 == 0) ? routing::RouteAlgorithm::AStar : routing::RouteAlgorithm::Bfs;
            if (plan_route(*runtime, request).has_value())
            {
                found.fetch_add(1);
            }
        });
    }
    for (auto& w : workers)
    {
        w.join();
    }

    CHECK(found.load() == kThreads);
    CHECK(core::Logger::get_core_logger().get() == core_before);
}
