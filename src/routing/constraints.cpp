/// @file constraints.cpp
/// @brief Routing rule implementations and request validation.

#include "routing/constraints.hpp"

#include "core/logger.hpp"

#include <cmath>
#include <sstream>

namespace starlane::routing
{

namespace
{

using RuleFn = bool (*)(const ConstraintSet&, const EdgeCandidate&, const TraversalState&);

struct RuleEntry
{
    ConstraintRule rule;
    RuleFn passes;
};

constexpr std::array<RuleEntry, kConstraintRuleCount> kRules{{
    {ConstraintRule::MaxJump,        &passes_max_jump},
    {ConstraintRule::Avoid,          &passes_avoid},
    {ConstraintRule::AvoidGates,     &passes_avoid_gates},
    {ConstraintRule::MaxTemperature, &passes_max_temperature},
    {ConstraintRule::CriticalHeat,   &passes_critical_heat},
}};

std::string point_label(PointId id, const starmap::PointSet* points)
{
    if (points)
    {
        if (const auto name = points->name_of(id); !name.empty())
        {
            return std::string(name);
        }
    }
    return "id " + std::to_string(id);
}

std::string format_number(f64 v)
{
    std::ostringstream out;
    out << v;
    return out.str();
}

} // namespace

const char* to_string(ConstraintRule rule)
{
    switch (rule)
    {
        case ConstraintRule::MaxJump:        return "max_jump";
        case ConstraintRule::Avoid:          return "avoid";
        case ConstraintRule::AvoidGates:     return "avoid_gates";
        case ConstraintRule::MaxTemperature: return "max_temperature";
        case ConstraintRule::CriticalHeat:   return "avoid_critical_heat";
    }
    return "unknown";
}

// -----------------------------------------------------------------
// ConstraintSet
// -----------------------------------------------------------------

Result<void> ConstraintSet::validate(PointId start, PointId goal,
                                     const starmap::PointSet* points) const
{
    if (avoided.contains(start))
    {
        return Error::invalid_constraint("cannot avoid the start point " + point_label(start, points));
    }
    if (avoided.contains(goal))
    {
        return Error::invalid_constraint("cannot avoid the goal point " + point_label(goal, points));
    }
    if (max_jump && (!std::isfinite(*max_jump) || *max_jump < 0.0))
    {
        return Error::invalid_constraint("max_jump must be finite and non-negative, got " +
                                         format_number(*max_jump));
    }
    if (max_temperature && (!std::isfinite(*max_temperature) || *max_temperature < 0.0))
    {
        return Error::invalid_constraint("max_temperature must be finite and non-negative, got " +
                                         format_number(*max_temperature));
    }
    if (avoid_critical_heat && heat_model == nullptr)
    {
        return Error::invalid_constraint("avoid_critical_heat requires a ship and loadout");
    }
    return {};
}

bool ConstraintSet::is_active(ConstraintRule rule) const
{
    switch (rule)
    {
        case ConstraintRule::MaxJump:        return max_jump.has_value();
        case ConstraintRule::Avoid:          return !avoided.empty();
        case ConstraintRule::AvoidGates:     return avoid_gates;
        case ConstraintRule::MaxTemperature: return max_temperature.has_value();
        case ConstraintRule::CriticalHeat:   return avoid_critical_heat;
    }
    return false;
}

std::string ConstraintSet::describe(ConstraintRule rule) const
{
    std::string out = to_string(rule);
    switch (rule)
    {
        case ConstraintRule::MaxJump:
            if (max_jump)
            {
                out += " (" + format_number(*max_jump) + ")";
            }
            break;
        case ConstraintRule::Avoid:
            out += " (" + std::to_string(avoided.size()) + " points)";
            break;
        case ConstraintRule::MaxTemperature:
            if (max_temperature)
            {
                out += " (" + format_number(*max_temperature) + ")";
            }
            break;
        case ConstraintRule::CriticalHeat:
            if (heat_model)
            {
                out += " (" + format_number(heat_model->critical_threshold()) + " K)";
            }
            break;
        case ConstraintRule::AvoidGates:
            break;
    }
    return out;
}

// -----------------------------------------------------------------
// Rules
// -----------------------------------------------------------------

bool passes_max_jump(const ConstraintSet& c, const EdgeCandidate& e, const TraversalState&)
{
    if (!c.max_jump || !e.edge->distance)
    {
        return true;
    }
    return *e.edge->distance <= *c.max_jump;
}

bool passes_avoid(const ConstraintSet& c, const EdgeCandidate& e, const TraversalState&)
{
    return !c.avoided.contains(e.edge->target);
}

bool passes_avoid_gates(const ConstraintSet& c, const EdgeCandidate& e, const TraversalState&)
{
    return !(c.avoid_gates && e.edge->kind == graph::EdgeKind::Gate);
}

bool passes_max_temperature(const ConstraintSet& c, const EdgeCandidate& e, const TraversalState&)
{
    if (!c.max_temperature || e.edge->kind != graph::EdgeKind::Spatial)
    {
        return true;
    }
    if (e.target == nullptr || !e.target->metadata.temperature)
    {
        return true;
    }
    return *e.target->metadata.temperature <= *c.max_temperature;
}

bool passes_critical_heat(const ConstraintSet& c, const EdgeCandidate& e, const TraversalState& s)
{
    if (!c.avoid_critical_heat || e.edge->kind != graph::EdgeKind::Spatial)
    {
        return true;
    }
    if (c.heat_model == nullptr)
    {
        SL_CORE_WARN("CriticalHeat: no heat model, rejecting jump {} -> {}", e.from, e.edge->target);
        return false;
    }
    if (!e.edge->distance)
    {
        SL_CORE_WARN("CriticalHeat: jump {} -> {} has no distance, rejecting", e.from, e.edge->target);
        return false;
    }

    const auto& model = *c.heat_model;
    const f64 mass = s.current_mass.value_or(model.current_mass_kg());
    const auto delta = model.heat_delta(mass, model.hull_mass_kg(), *e.edge->distance,
                                        model.calibration_constant());
    if (!delta)
    {
        SL_CORE_WARN("CriticalHeat: rejecting jump {} -> {}: {}", e.from, e.edge->target,
                     delta.error().message());
        return false;
    }

    f64 ambient = 0.0;
    if (e.target && e.target->metadata.temperature)
    {
        ambient = *e.target->metadata.temperature;
    }
    return ambient + *delta < model.critical_threshold();
}

EdgeVerdict evaluate(const ConstraintSet& constraints, const EdgeCandidate& candidate,
                     const TraversalState& state)
{
    for (const auto& entry : kRules)
    {
        if (!entry.passes(constraints, candidate, state))
        {
            return EdgeVerdict{.allowed = false, .rejected_by = entry.rule};
        }
    }
    return EdgeVerdict{};
}

// -----------------------------------------------------------------
// RejectionTally
// -----------------------------------------------------------------

u64 RejectionTally::total() const
{
    u64 sum = 0;
    for (const u64 c : m_counts)
    {
        sum += c;
    }
    return sum;
}

std::optional<ConstraintRule> RejectionTally::most_restrictive() const
{
    std::optional<ConstraintRule> best;
    u64 best_count = 0;
    for (std::size_t i = 0; i < m_counts.size(); ++i)
    {
        if (m_counts[i] > best_count)
        {
            best_count = m_counts[i];
            best = static_cast<ConstraintRule>(i);
        }
    }
    return best;
}

} // namespace starlane::routing
