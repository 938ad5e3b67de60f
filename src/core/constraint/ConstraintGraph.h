/**
 * @file ConstraintGraph.h
 * @brief Per-workspace constraint graph with component-local DOF accounting
 *
 * Nodes are entity ids, edges are constraints. Degrees of freedom are
 * accounted per connected component only, so admitting a constraint or
 * reacting to an entity edit touches just the affected subgraph.
 *
 * The graph does not own entities. Every call that needs geometry takes an
 * EntityLookup that resolves ids against the workspace lineage.
 */
#ifndef AGENTCAD_CORE_CONSTRAINT_CONSTRAINT_GRAPH_H
#define AGENTCAD_CORE_CONSTRAINT_CONSTRAINT_GRAPH_H

#include "Constraint.h"
#include "ConstraintEvaluator.h"

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentcad::core::constraint {

using EntityLookup = std::function<std::optional<model::Entity>(const EntityID&)>;

/**
 * @brief Default tolerances when a request does not carry its own
 */
struct ToleranceSettings {
    double length = model::constants::kDefaultLengthTolerance;

    /// Degrees
    double angle = model::constants::kDefaultAngleTolerance;

    double defaultFor(ConstraintType type) const {
        return toleranceUnit(type) == ToleranceUnit::Angle ? angle : length;
    }
};

struct ConstraintRequest {
    ConstraintType type = ConstraintType::Coincident;
    std::vector<EntityID> entityIds;

    /// distance / angle (degrees) / radius / x, y
    model::ParameterMap parameters;

    std::optional<double> tolerance;
    model::AgentID agentId;
};

/**
 * @brief Result of apply/adopt
 */
struct ApplyResult {
    bool success = false;

    model::ErrorKind error = model::ErrorKind::None;
    std::string errorMessage;

    /// The admitted constraint, with its status and last evaluation
    std::optional<Constraint> constraint;

    /// Entities of the affected component (sorted)
    std::vector<EntityID> component;

    int componentDof = 0;
    int componentDofRemoved = 0;

    /// May be negative only on a rejected request
    int dofRemaining = 0;

    /// Existing constraints the request contradicts
    std::vector<ConstraintID> conflictingConstraints;
};

struct StatusChange {
    ConstraintID constraintId;
    ConstraintStatus before = ConstraintStatus::Violated;
    ConstraintStatus after = ConstraintStatus::Violated;
};

/**
 * @brief Result of re-evaluating the components touched by an edit
 */
struct PropagationResult {
    std::vector<EntityID> component;
    std::vector<ConstraintID> reevaluated;
    std::vector<StatusChange> changes;
};

struct StatusReport {
    int satisfied = 0;
    int violated = 0;
    int redundant = 0;

    int totalDof = 0;
    int dofRemoved = 0;
    int dofRemaining = 0;

    std::vector<Constraint> constraints;
};

class ConstraintGraph {
public:
    /**
     * @brief Validate, account and evaluate a new constraint
     *
     * All-or-nothing: on any failure the graph is unchanged.
     */
    ApplyResult apply(const ConstraintRequest& request,
                      const model::WorkspaceID& workspaceId,
                      model::Timestamp now,
                      const EntityLookup& lookup,
                      const ConstraintEvaluator& evaluator,
                      const ToleranceSettings& tolerances);

    /**
     * @brief Admit an existing constraint (carried by a merge) under its own id
     *
     * Runs the same contradiction and DOF checks as apply().
     */
    ApplyResult adopt(const Constraint& constraint,
                      const EntityLookup& lookup,
                      const ConstraintEvaluator& evaluator);

    /**
     * @brief Remove a constraint and re-evaluate what it connected
     *
     * A redundant twin of the removed constraint takes over its DOF removal.
     */
    std::optional<Constraint> remove(const ConstraintID& constraintId,
                                     const EntityLookup& lookup,
                                     const ConstraintEvaluator& evaluator);

    /// Cascade for an entity deletion; returns the removed constraints
    std::vector<Constraint> removeReferencing(const EntityID& entityId);

    /**
     * @brief Reinsert a previously removed constraint (undo)
     *
     * A same-definition twin that took over its DOF removal is demoted back
     * to redundant. Returns false, leaving the graph unchanged, when the
     * component would be over-constrained.
     */
    bool restore(const Constraint& constraint, const EntityLookup& lookup);

    /**
     * @brief Re-evaluate only the components containing @p changed
     */
    PropagationResult propagate(const std::vector<EntityID>& changed,
                                const EntityLookup& lookup,
                                const ConstraintEvaluator& evaluator);

    /**
     * @brief Aggregate report over @p scopeEntities
     *
     * A constraint is in scope when it references any scoped entity.
     */
    StatusReport status(const std::vector<model::Entity>& scopeEntities) const;

    /// Connected component reachable from @p seeds (seeds included, sorted)
    std::vector<EntityID> componentOf(const std::vector<EntityID>& seeds) const;

    const Constraint* find(const ConstraintID& constraintId) const;
    const std::map<ConstraintID, Constraint>& constraints() const { return constraints_; }
    std::size_t size() const { return constraints_.size(); }

    /// Number of satisfaction tests run so far
    std::size_t evaluationCount() const { return evaluations_; }

private:
    ApplyResult admit(Constraint candidate,
                      const std::vector<model::Entity>& entities,
                      const EntityLookup& lookup,
                      const ConstraintEvaluator& evaluator);

    Evaluation evaluateWith(const Constraint& constraint,
                            const EntityLookup& lookup,
                            const ConstraintEvaluator& evaluator);

    std::vector<ConstraintID> constraintsTouching(const std::vector<EntityID>& component) const;
    void link(const Constraint& constraint);
    void unlink(const Constraint& constraint);

    std::map<ConstraintID, Constraint> constraints_;
    std::unordered_map<EntityID, std::set<ConstraintID>> incidence_;
    std::size_t evaluations_ = 0;
};

/// Resolve every id, or report the first missing one through @p missing
std::optional<std::vector<model::Entity>> resolveEntities(const std::vector<EntityID>& ids,
                                                          const EntityLookup& lookup,
                                                          EntityID* missing = nullptr);

} // namespace agentcad::core::constraint

#endif // AGENTCAD_CORE_CONSTRAINT_CONSTRAINT_GRAPH_H
