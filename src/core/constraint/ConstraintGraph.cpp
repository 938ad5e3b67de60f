#include "ConstraintGraph.h"

#include <QLoggingCategory>

#include <algorithm>
#include <cmath>
#include <deque>

namespace agentcad::core::constraint {

Q_LOGGING_CATEGORY(logConstraint, "agentcad.core.constraint")

using model::Entity;
using model::ErrorKind;

namespace {

ApplyResult rejected(ErrorKind kind, std::string message) {
    ApplyResult result;
    result.error = kind;
    result.errorMessage = std::move(message);
    return result;
}

ConstraintStatus statusFor(const Evaluation& eval, double tolerance) {
    return eval.satisfied(tolerance) ? ConstraintStatus::Satisfied : ConstraintStatus::Violated;
}

} // namespace

std::optional<std::vector<Entity>> resolveEntities(const std::vector<EntityID>& ids,
                                                   const EntityLookup& lookup,
                                                   EntityID* missing) {
    std::vector<Entity> entities;
    entities.reserve(ids.size());
    for (const auto& id : ids) {
        auto entity = lookup(id);
        if (!entity) {
            if (missing) {
                *missing = id;
            }
            return std::nullopt;
        }
        entities.push_back(std::move(*entity));
    }
    return entities;
}

ApplyResult ConstraintGraph::apply(const ConstraintRequest& request,
                                   const model::WorkspaceID& workspaceId,
                                   model::Timestamp now,
                                   const EntityLookup& lookup,
                                   const ConstraintEvaluator& evaluator,
                                   const ToleranceSettings& tolerances) {
    const std::string typeName = constraintTypeToString(request.type);
    if (request.entityIds.empty() || request.entityIds.size() > 2) {
        return rejected(ErrorKind::InvalidConstraint, typeName + " takes 1 or 2 entities");
    }

    EntityID missing;
    auto entities = resolveEntities(request.entityIds, lookup, &missing);
    if (!entities) {
        return rejected(ErrorKind::EntityNotFound, "Entity not found: " + missing);
    }

    const std::string incompatibility = ConstraintEvaluator::checkCompatibility(request.type, *entities);
    if (!incompatibility.empty()) {
        return rejected(ErrorKind::InvalidConstraint, incompatibility);
    }

    // Fixed defaults to pinning the point where it currently is
    model::ParameterMap parameters = request.parameters;
    if (request.type == ConstraintType::Fixed) {
        parameters.emplace("x", entities->front().parameter("x"));
        parameters.emplace("y", entities->front().parameter("y"));
    }

    std::string kindError;
    auto kind = makeKind(request.type, parameters, kindError);
    if (!kind) {
        return rejected(ErrorKind::InvalidConstraint, kindError);
    }

    const double tolerance = request.tolerance.value_or(tolerances.defaultFor(request.type));
    if (!std::isfinite(tolerance) || tolerance <= 0.0) {
        return rejected(ErrorKind::InvalidConstraint, "Tolerance must be a positive finite number");
    }

    Constraint candidate;
    candidate.id = generateConstraintId();
    candidate.workspaceId = workspaceId;
    candidate.kind = *kind;
    candidate.entityIds = request.entityIds;
    candidate.tolerance = tolerance;
    candidate.createdBy = request.agentId;
    candidate.createdAt = now;

    return admit(std::move(candidate), *entities, lookup, evaluator);
}

ApplyResult ConstraintGraph::adopt(const Constraint& constraint,
                                   const EntityLookup& lookup,
                                   const ConstraintEvaluator& evaluator) {
    if (constraints_.count(constraint.id) != 0) {
        return rejected(ErrorKind::InvalidConstraint, "Constraint already present: " + constraint.id);
    }

    EntityID missing;
    auto entities = resolveEntities(constraint.entityIds, lookup, &missing);
    if (!entities) {
        return rejected(ErrorKind::EntityNotFound, "Entity not found: " + missing);
    }
    const std::string incompatibility = ConstraintEvaluator::checkCompatibility(constraint.type(), *entities);
    if (!incompatibility.empty()) {
        return rejected(ErrorKind::InvalidConstraint, incompatibility);
    }
    return admit(constraint, *entities, lookup, evaluator);
}

ApplyResult ConstraintGraph::admit(Constraint candidate,
                                   const std::vector<Entity>& entities,
                                   const EntityLookup& lookup,
                                   const ConstraintEvaluator& evaluator) {
    ApplyResult result;
    result.component = componentOf(candidate.entityIds);
    const auto neighbours = constraintsTouching(result.component);

    // Component DOF before the candidate
    for (const auto& entityId : result.component) {
        auto entity = lookup(entityId);
        if (!entity) {
            qCWarning(logConstraint) << "admit: component entity no longer resolves" << entityId.c_str();
            continue;
        }
        result.componentDof += model::entityDegreesOfFreedom(entity->type);
    }
    for (const auto& id : neighbours) {
        result.componentDofRemoved += constraints_.at(id).dofRemoved;
    }

    const Evaluation eval = evaluator.evaluate(candidate, entities);
    ++evaluations_;
    candidate.expectedValue = eval.expected;
    candidate.actualValue = eval.actual;

    const bool redundant = std::any_of(neighbours.begin(), neighbours.end(), [&](const ConstraintID& id) {
        const Constraint& existing = constraints_.at(id);
        return existing.status == ConstraintStatus::Satisfied &&
               sameDefinition(existing, candidate, candidate.tolerance);
    });

    if (redundant) {
        candidate.status = ConstraintStatus::Redundant;
        candidate.dofRemoved = 0;
    } else {
        for (const auto& id : neighbours) {
            const Constraint& existing = constraints_.at(id);
            if (existing.status != ConstraintStatus::Redundant && contradicts(existing, candidate)) {
                result.conflictingConstraints.push_back(id);
            }
        }
        if (!result.conflictingConstraints.empty()) {
            const Constraint& first = constraints_.at(result.conflictingConstraints.front());
            result.error = ErrorKind::ConstraintConflict;
            result.errorMessage = constraintTypeToString(candidate.type()) + " contradicts existing " +
                                  constraintTypeToString(first.type()) + " constraint " + first.id;
            result.dofRemaining = result.componentDof - result.componentDofRemoved;
            qCInfo(logConstraint) << "apply rejected: contradiction" << candidate.id.c_str()
                                  << "vs" << first.id.c_str();
            return result;
        }

        candidate.dofRemoved = degreesRemoved(candidate.type());
        const int remaining = result.componentDof - result.componentDofRemoved - candidate.dofRemoved;
        if (remaining < 0) {
            result.error = ErrorKind::ConstraintConflict;
            result.errorMessage = "Over-constrained: component has " + std::to_string(result.componentDof) +
                                  " DOF, " + std::to_string(result.componentDofRemoved) + " already removed, " +
                                  constraintTypeToString(candidate.type()) + " removes " +
                                  std::to_string(candidate.dofRemoved);
            result.dofRemaining = remaining;
            qCInfo(logConstraint) << "apply rejected: over-constrained" << "dof=" << result.componentDof
                                  << "removed=" << result.componentDofRemoved
                                  << "requested=" << candidate.dofRemoved;
            return result;
        }
        candidate.status = statusFor(eval, candidate.tolerance);
    }

    result.componentDofRemoved += candidate.dofRemoved;
    result.dofRemaining = result.componentDof - result.componentDofRemoved;
    result.success = true;

    qCDebug(logConstraint) << "admit" << candidate.id.c_str()
                           << constraintTypeToString(candidate.type()).c_str()
                           << "status=" << constraintStatusToString(candidate.status).c_str()
                           << "expected=" << candidate.expectedValue << "actual=" << candidate.actualValue
                           << "componentSize=" << result.component.size()
                           << "dofRemaining=" << result.dofRemaining;

    link(candidate);
    result.constraint = candidate;
    constraints_.emplace(candidate.id, std::move(candidate));
    return result;
}

std::optional<Constraint> ConstraintGraph::remove(const ConstraintID& constraintId,
                                                  const EntityLookup& lookup,
                                                  const ConstraintEvaluator& evaluator) {
    auto it = constraints_.find(constraintId);
    if (it == constraints_.end()) {
        return std::nullopt;
    }
    Constraint removed = it->second;
    unlink(removed);
    constraints_.erase(it);

    if (removed.status != ConstraintStatus::Redundant) {
        for (auto& [id, other] : constraints_) {
            if (other.status == ConstraintStatus::Redundant && sameDefinition(other, removed, other.tolerance)) {
                other.dofRemoved = degreesRemoved(other.type());
                other.status = ConstraintStatus::Violated;  // settled by the propagation below
                qCDebug(logConstraint) << "remove: promoted redundant twin" << id.c_str();
                break;
            }
        }
    }

    propagate(removed.entityIds, lookup, evaluator);
    return removed;
}

std::vector<Constraint> ConstraintGraph::removeReferencing(const EntityID& entityId) {
    std::vector<Constraint> removed;
    auto incident = incidence_.find(entityId);
    if (incident == incidence_.end()) {
        return removed;
    }
    const std::set<ConstraintID> ids = incident->second;
    for (const auto& id : ids) {
        auto it = constraints_.find(id);
        if (it == constraints_.end()) {
            continue;
        }
        removed.push_back(it->second);
        unlink(it->second);
        constraints_.erase(it);
    }
    qCDebug(logConstraint) << "removeReferencing" << entityId.c_str() << "removed=" << removed.size();
    return removed;
}

bool ConstraintGraph::restore(const Constraint& constraint, const EntityLookup& lookup) {
    Constraint restored = constraint;
    const auto component = componentOf(restored.entityIds);

    int componentDof = 0;
    for (const auto& entityId : component) {
        if (auto entity = lookup(entityId)) {
            componentDof += model::entityDegreesOfFreedom(entity->type);
        }
    }

    // The same definition may have been promoted from redundant when this
    // constraint was removed; exactly one of the pair removes DOF.
    int dofRemoved = 0;
    Constraint* twin = nullptr;
    for (const auto& id : constraintsTouching(component)) {
        if (id == restored.id) {
            continue;
        }
        Constraint& other = constraints_.at(id);
        dofRemoved += other.dofRemoved;
        if (!twin && other.status != ConstraintStatus::Redundant &&
            sameDefinition(other, restored, restored.tolerance)) {
            twin = &other;
        }
    }

    const bool wasRedundant = restored.status == ConstraintStatus::Redundant;
    if (wasRedundant && twin) {
        restored.dofRemoved = 0;
    } else {
        restored.dofRemoved = degreesRemoved(restored.type());
        if (wasRedundant) {
            restored.status = ConstraintStatus::Violated;  // settled by the next propagation
        }
    }
    const int handedBack = (!wasRedundant && twin) ? twin->dofRemoved : 0;

    const int remaining = componentDof - dofRemoved + handedBack - restored.dofRemoved;
    if (remaining < 0) {
        qCWarning(logConstraint) << "restore rejected: over-constrained" << restored.id.c_str()
                                 << "dof=" << componentDof << "remaining=" << remaining;
        return false;
    }

    if (handedBack != 0) {
        twin->dofRemoved = 0;
        twin->status = ConstraintStatus::Redundant;
        qCDebug(logConstraint) << "restore: demoted twin" << twin->id.c_str();
    }

    auto existing = constraints_.find(restored.id);
    if (existing != constraints_.end()) {
        unlink(existing->second);
        constraints_.erase(existing);
    }
    link(restored);
    constraints_.emplace(restored.id, std::move(restored));
    return true;
}

PropagationResult ConstraintGraph::propagate(const std::vector<EntityID>& changed,
                                             const EntityLookup& lookup,
                                             const ConstraintEvaluator& evaluator) {
    PropagationResult result;
    result.component = componentOf(changed);

    for (const auto& id : constraintsTouching(result.component)) {
        Constraint& constraint = constraints_.at(id);
        const Evaluation eval = evaluateWith(constraint, lookup, evaluator);
        constraint.expectedValue = eval.expected;
        constraint.actualValue = eval.actual;
        result.reevaluated.push_back(id);

        if (constraint.status == ConstraintStatus::Redundant) {
            continue;
        }
        const ConstraintStatus next = statusFor(eval, constraint.tolerance);
        if (next != constraint.status) {
            result.changes.push_back({id, constraint.status, next});
            constraint.status = next;
        }
    }

    qCDebug(logConstraint) << "propagate" << "seeds=" << changed.size()
                           << "componentSize=" << result.component.size()
                           << "reevaluated=" << result.reevaluated.size()
                           << "changed=" << result.changes.size();
    return result;
}

StatusReport ConstraintGraph::status(const std::vector<Entity>& scopeEntities) const {
    StatusReport report;
    std::set<EntityID> scope;
    for (const auto& entity : scopeEntities) {
        scope.insert(entity.id);
        report.totalDof += model::entityDegreesOfFreedom(entity.type);
    }

    for (const auto& [id, constraint] : constraints_) {
        const bool inScope = std::any_of(constraint.entityIds.begin(), constraint.entityIds.end(),
                                         [&](const EntityID& entityId) { return scope.count(entityId) != 0; });
        if (!inScope) {
            continue;
        }
        switch (constraint.status) {
            case ConstraintStatus::Satisfied: ++report.satisfied; break;
            case ConstraintStatus::Violated: ++report.violated; break;
            case ConstraintStatus::Redundant: ++report.redundant; break;
        }
        report.dofRemoved += constraint.dofRemoved;
        report.constraints.push_back(constraint);
    }
    report.dofRemaining = report.totalDof - report.dofRemoved;
    return report;
}

std::vector<EntityID> ConstraintGraph::componentOf(const std::vector<EntityID>& seeds) const {
    std::set<EntityID> visited(seeds.begin(), seeds.end());
    std::deque<EntityID> queue(seeds.begin(), seeds.end());

    while (!queue.empty()) {
        const EntityID current = queue.front();
        queue.pop_front();

        auto incident = incidence_.find(current);
        if (incident == incidence_.end()) {
            continue;
        }
        for (const auto& constraintId : incident->second) {
            for (const auto& neighbour : constraints_.at(constraintId).entityIds) {
                if (visited.insert(neighbour).second) {
                    queue.push_back(neighbour);
                }
            }
        }
    }
    return {visited.begin(), visited.end()};
}

const Constraint* ConstraintGraph::find(const ConstraintID& constraintId) const {
    auto it = constraints_.find(constraintId);
    return it != constraints_.end() ? &it->second : nullptr;
}

Evaluation ConstraintGraph::evaluateWith(const Constraint& constraint,
                                         const EntityLookup& lookup,
                                         const ConstraintEvaluator& evaluator) {
    ++evaluations_;
    EntityID missing;
    auto entities = resolveEntities(constraint.entityIds, lookup, &missing);
    if (!entities) {
        qCWarning(logConstraint) << "evaluate: referenced entity missing" << missing.c_str()
                                 << "constraint=" << constraint.id.c_str();
        Evaluation eval;
        eval.errorMessage = "Entity not found: " + missing;
        return eval;
    }
    return evaluator.evaluate(constraint, *entities);
}

std::vector<ConstraintID> ConstraintGraph::constraintsTouching(const std::vector<EntityID>& component) const {
    std::set<ConstraintID> ids;
    for (const auto& entityId : component) {
        auto incident = incidence_.find(entityId);
        if (incident != incidence_.end()) {
            ids.insert(incident->second.begin(), incident->second.end());
        }
    }
    return {ids.begin(), ids.end()};
}

void ConstraintGraph::link(const Constraint& constraint) {
    for (const auto& entityId : constraint.entityIds) {
        incidence_[entityId].insert(constraint.id);
    }
}

void ConstraintGraph::unlink(const Constraint& constraint) {
    for (const auto& entityId : constraint.entityIds) {
        auto incident = incidence_.find(entityId);
        if (incident == incidence_.end()) {
            continue;
        }
        incident->second.erase(constraint.id);
        if (incident->second.empty()) {
            incidence_.erase(incident);
        }
    }
}

} // namespace agentcad::core::constraint
