#pragma once

/// @file constraints.hpp
/// @brief Per-edge routing rules, evaluated as a fixed-order AND.

#include "graph/graph.hpp"
#include "ship/ship.hpp"
#include "starmap/point_set.hpp"

#include "core/error.hpp"
#include "core/types.hpp"

#include <array>
#include <optional>
#include <string>
#include <unordered_set>

namespace starlane::routing
{
    /// @brief Rules in evaluation order.
    enum class ConstraintRule : u8
    {
        MaxJump,          ///< Reject edges longer than max_jump
        Avoid,            ///< Reject edges into avoided points
        AvoidGates,       ///< Reject gate edges
        MaxTemperature,   ///< Reject spatial edges into hotter points (unknown passes)
        CriticalHeat,     ///< Reject spatial jumps that would reach critical heat (errors reject)
    };

    inline constexpr std::size_t kConstraintRuleCount = 5;

    [[nodiscard]] const char* to_string(ConstraintRule rule);

    /// @brief Restrictions applied to every candidate edge during a search.
    struct ConstraintSet
    {
        std::optional<f64> max_jump;
        std::unordered_set<PointId> avoided;
        bool avoid_gates = false;
        std::optional<f64> max_temperature;
        bool avoid_critical_heat = false;
        const ship::HeatModel* heat_model = nullptr;   ///< Required by avoid_critical_heat; not owned

        /// @brief Reject configurations that cannot be searched meaningfully.
        ///
        /// Avoiding the start or goal, requesting critical-heat avoidance without
        /// a heat model, or a negative/non-finite limit is InvalidConstraint.
        /// `points` is only used to put names in the error.
        [[nodiscard]] Result<void> validate(PointId start, PointId goal,
                                            const starmap::PointSet* points = nullptr) const;

        /// @brief Whether a rule can reject anything under this configuration.
        [[nodiscard]] bool is_active(ConstraintRule rule) const;

        /// @brief Rule name with its parameter, e.g. "max_temperature (300)".
        [[nodiscard]] std::string describe(ConstraintRule rule) const;
    };

    /// @brief The edge being considered and what it leads to.
    struct EdgeCandidate
    {
        PointId from = 0;
        const graph::Edge* edge = nullptr;
        const starmap::Point* target = nullptr;   ///< May be null when the target is unknown
    };

    /// @brief Search-time state the rules may depend on.
    struct TraversalState
    {
        std::optional<f64> current_mass;   ///< Overrides the heat model's mass when set
    };

    struct EdgeVerdict
    {
        bool allowed = true;
        std::optional<ConstraintRule> rejected_by;   ///< First failing rule
    };

    // ---- Individual rules (true = edge passes) ----

    [[nodiscard]] bool passes_max_jump(const ConstraintSet& c, const EdgeCandidate& e, const TraversalState& s);
    [[nodiscard]] bool passes_avoid(const ConstraintSet& c, const EdgeCandidate& e, const TraversalState& s);
    [[nodiscard]] bool passes_avoid_gates(const ConstraintSet& c, const EdgeCandidate& e, const TraversalState& s);
    [[nodiscard]] bool passes_max_temperature(const ConstraintSet& c, const EdgeCandidate& e, const TraversalState& s);
    [[nodiscard]] bool passes_critical_heat(const ConstraintSet& c, const EdgeCandidate& e, const TraversalState& s);

    /// @brief AND of all rules in ConstraintRule order; reports the first failure.
    [[nodiscard]] EdgeVerdict evaluate(const ConstraintSet& constraints,
                                       const EdgeCandidate& candidate,
                                       const TraversalState& state = {});

    /// @brief Per-rule rejection counts gathered during one search.
    class RejectionTally
    {
    public:
        void record(ConstraintRule rule) { ++m_counts[static_cast<std::size_t>(rule)]; }

        [[nodiscard]] u64 count(ConstraintRule rule) const { return m_counts[static_cast<std::size_t>(rule)]; }
        [[nodiscard]] u64 total() const;

        /// @brief Rule with the most rejections (earlier rule wins ties), if any rejected.
        [[nodiscard]] std::optional<ConstraintRule> most_restrictive() const;

    private:
        std::array<u64, kConstraintRuleCount> m_counts{};
    };

} // namespace starlane::routing
