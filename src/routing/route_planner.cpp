/// @file route_planner.cpp
/// @brief RouteRuntime lazy construction and the plan_route pipeline.

#include "routing/route_planner.hpp"

#include "core/logger.hpp"

#include <cstdlib>
#include <utility>

namespace starlane::routing
{

// -----------------------------------------------------------------
// RouteRuntime
// -----------------------------------------------------------------

std::shared_ptr<RouteRuntime> RouteRuntime::create(std::shared_ptr<const starmap::PointSet> points,
                                                   core::EngineConfig config,
                                                   std::optional<spatial::SpatialIndex> index,
                                                   std::shared_ptr<const starmap::SuggestionProvider> suggestions)
{
    std::shared_ptr<RouteRuntime> runtime(new RouteRuntime());
    runtime->m_points = std::move(points);
    runtime->m_config = std::move(config);
    runtime->m_suggestions = suggestions ? std::move(suggestions)
                                         : std::make_shared<starmap::FuzzyMatcher>();
    runtime->m_names = runtime->m_points->names();

    if (index)
    {
        const auto report = spatial::check_freshness(*index, runtime->m_points->fingerprint());
        switch (report.status)
        {
            case spatial::Freshness::Fresh:
                SL_CORE_INFO("RouteRuntime: Using supplied spatial index ({} nodes)", index->size());
                runtime->m_index = std::move(index);
                break;
            case spatial::Freshness::Legacy:
                SL_CORE_WARN("RouteRuntime: Supplied spatial index has no source metadata; "
                             "using it without a freshness check");
                runtime->m_index = std::move(index);
                break;
            case spatial::Freshness::Stale:
                SL_CORE_WARN("RouteRuntime: Supplied spatial index is stale (built from {}, dataset is {}); "
                             "it will be rebuilt", report.actual_checksum, report.expected_checksum);
                break;
        }
    }

    return runtime;
}

const spatial::SpatialIndex& RouteRuntime::spatial_index() const
{
    std::call_once(m_index_once, [this]()
    {
        if (!m_index)
        {
            m_index = spatial::SpatialIndex::build(*m_points);
        }
    });
    return *m_index;
}

const graph::Graph& RouteRuntime::graph(graph::GraphMode mode) const
{
    const auto options = [this]()
    {
        return graph::GraphBuildOptions{
            .max_spatial_neighbors = m_config.max_spatial_neighbors,
            .spatial_index         = &spatial_index(),
        };
    };

    switch (mode)
    {
        case graph::GraphMode::Gate:
            std::call_once(m_gate_once, [this]() { m_gate_graph = graph::build_gate_graph(*m_points); });
            return *m_gate_graph;

        case graph::GraphMode::Spatial:
            std::call_once(m_spatial_once, [&]()
            {
                m_spatial_graph = graph::build_spatial_graph(*m_points, options());
            });
            return *m_spatial_graph;

        case graph::GraphMode::Hybrid:
            break;
    }

    std::call_once(m_hybrid_once, [&]()
    {
        m_hybrid_graph = graph::build_hybrid_graph(*m_points, options());
    });
    return *m_hybrid_graph;
}

// -----------------------------------------------------------------
// plan_route
// -----------------------------------------------------------------

namespace
{

Result<PointId> resolve(const RouteRuntime& runtime, const std::string& name)
{
    if (const auto id = runtime.points().id_by_name(name))
    {
        return *id;
    }
    auto suggestions = runtime.suggestions().suggest(name, runtime.names(),
                                                     starmap::FuzzyMatcher::kDefaultLimit);
    return Error::unknown_point(name, std::move(suggestions));
}

} // namespace

Result<RoutePlan> plan_route(const RouteRuntime& runtime, const RouteRequest& request)
{
    const auto& points = runtime.points();
    const auto& config = runtime.config();

    // ---- 1. Resolve names ----
    const auto start = resolve(runtime, request.start);
    if (!start)
    {
        return start.error();
    }
    const auto goal = resolve(runtime, request.goal);
    if (!goal)
    {
        return goal.error();
    }

    ConstraintSet constraints;
    for (const auto& name : request.avoid)
    {
        const auto id = resolve(runtime, name);
        if (!id)
        {
            return id.error();
        }
        constraints.avoided.insert(*id);
    }

    // ---- 2. Constraints ----
    std::optional<ship::ShipLoadout> loadout = request.loadout;
    if (request.ship && !loadout)
    {
        loadout = ship::ShipLoadout::full_fuel(*request.ship);
    }

    std::optional<ship::LoadoutHeatModel> heat_model;
    if (request.avoid_critical_heat && request.ship)
    {
        auto model = ship::LoadoutHeatModel::create(*request.ship, *loadout, config);
        if (!model)
        {
            return model.error();
        }
        heat_model = std::move(model).value();
    }

    constraints.max_jump = request.max_jump;
    constraints.avoid_gates = request.avoid_gates;
    constraints.max_temperature = request.max_temperature;
    constraints.avoid_critical_heat = request.avoid_critical_heat;
    constraints.heat_model = heat_model ? &*heat_model : nullptr;

    if (auto valid = constraints.validate(*start, *goal, &points); !valid)
    {
        return valid.error();
    }

    // ---- 3. Graph and planner ----
    const Planner planner = select_planner(request.algorithm);
    const graph::GraphMode mode = request.avoid_gates ? graph::GraphMode::Spatial
                                                      : preferred_graph_mode(planner);
    const graph::Graph& traversal = runtime.graph(mode);

    SL_CORE_DEBUG("plan_route: {} -> {} with {} on the {} graph", request.start, request.goal,
                  to_string(request.algorithm), graph::to_string(mode));
    if (requires_spatial_index(planner))
    {
        SL_CORE_DEBUG("plan_route: {} spatial index nodes available", runtime.spatial_index().size());
    }

    // ---- 4. Search ----
    const SearchInput input{
        .graph       = traversal,
        .points      = points,
        .constraints = constraints,
    };
    SearchStats stats;
    auto steps = find_path(planner, input, *start, *goal, &stats);

    if (!steps)
    {
        std::string hint;
        if (const auto rule = stats.tally.most_restrictive())
        {
            hint = "most restrictive constraint: " + constraints.describe(*rule);
        }
        return Error::route_not_found(std::string(points.name_of(*start)),
                                      std::string(points.name_of(*goal)), std::move(hint));
    }

    // ---- 5. Re-derive hops from the graph ----
    RoutePlan plan;
    plan.algorithm = request.algorithm;
    plan.graph_mode = mode;
    plan.start = *start;
    plan.goal = *goal;
    plan.warnings = traversal.warnings();

    const TraversalState state{};
    for (std::size_t i = 0; i + 1 < steps->size(); ++i)
    {
        const PointId from = (*steps)[i];
        const PointId to = (*steps)[i + 1];
        const graph::Edge* edge = traversal.best_edge(from, to, [&](const graph::Edge& e)
        {
            const EdgeCandidate candidate{.from = from, .edge = &e, .target = points.find(to)};
            return evaluate(constraints, candidate, state).allowed;
        });

        if (edge == nullptr)
        {
            SL_CORE_CRITICAL("plan_route: planner returned hop {} -> {} with no permitted edge", from, to);
            std::abort();
        }

        plan.hops.push_back(RouteHop{.from = from, .to = to, .kind = edge->kind, .distance = edge->distance});
        if (edge->kind == graph::EdgeKind::Gate)
        {
            ++plan.gate_count;
        }
        else
        {
            ++plan.jump_count;
            plan.spatial_distance += edge->distance.value_or(0.0);
        }
        plan.total_distance += edge->distance.value_or(0.0);
    }
    plan.steps = std::move(*steps);
    plan.stats = std::move(stats);

    // ---- 6. Fuel / heat projection ----
    if (request.ship)
    {
        std::vector<ship::ProjectionLeg> legs;
        legs.reserve(plan.hops.size());
        for (const auto& hop : plan.hops)
        {
            const starmap::Point* target = points.find(hop.to);
            legs.push_back(ship::ProjectionLeg{
                .spatial             = hop.kind == graph::EdgeKind::Spatial,
                .distance            = hop.distance,
                .ambient_temperature = target ? target->metadata.temperature : std::nullopt,
            });
        }

        auto projection = ship::project_route(*request.ship, *loadout, legs, config,
                                              ship::ProjectionOptions{.dynamic_mass = request.dynamic_mass});
        if (!projection)
        {
            return projection.error();
        }
        plan.projection = std::move(projection).value();
    }

    SL_CORE_INFO("plan_route: {} -> {}: {} hops ({} gates, {} jumps), {:.2f} ly",
                 points.name_of(plan.start), points.name_of(plan.goal), plan.hop_count(),
                 plan.gate_count, plan.jump_count, plan.total_distance);
    return plan;
}

Result<RoutePlan> plan_route(std::shared_ptr<const starmap::PointSet> points,
                             const RouteRequest& request,
                             const core::EngineConfig& config)
{
    const auto runtime = RouteRuntime::create(std::move(points), config);
    return plan_route(*runtime, request);
}

} // namespace starlane::routing
