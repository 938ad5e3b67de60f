#include "Document.h"

#include <QLoggingCategory>

#include <algorithm>
#include <deque>
#include <set>

namespace agentcad::app {

Q_LOGGING_CATEGORY(logDocument, "agentcad.app.document")

using core::model::Entity;
using core::model::EntityID;
using core::model::ErrorKind;
using core::model::WorkspaceID;

namespace {

template <typename Result>
Result failure(ErrorKind kind, std::string message) {
    Result result;
    result.error = kind;
    result.errorMessage = std::move(message);
    return result;
}

std::string workspaceMissing(const WorkspaceID& workspaceId) {
    return "Workspace not found: " + workspaceId;
}

} // namespace

Document::Document(const core::geometry::GeometryEngine& engine,
                   core::constraint::ToleranceSettings tolerances,
                   core::model::Clock clock)
    : evaluator_(engine)
    , tolerances_(tolerances)
    , clock_(std::move(clock)) {
    workspace::Workspace root;
    root.id = std::string(core::model::constants::kRootWorkspaceId);
    root.name = root.id;
    root.createdAt = clock_();
    store_.registerWorkspace(root.id, std::nullopt, 0);
    workspaces_.emplace(root.id, std::make_unique<WorkspaceState>(std::move(root)));
}

//------------------------------------------------------------------------------
// Workspaces
//------------------------------------------------------------------------------

WorkspaceState* Document::state(const WorkspaceID& workspaceId) {
    auto it = workspaces_.find(workspaceId);
    if (it == workspaces_.end() || it->second->info.deleted) {
        return nullptr;
    }
    return it->second.get();
}

const WorkspaceState* Document::state(const WorkspaceID& workspaceId) const {
    auto it = workspaces_.find(workspaceId);
    if (it == workspaces_.end() || it->second->info.deleted) {
        return nullptr;
    }
    return it->second.get();
}

bool Document::hasWorkspaceId(const WorkspaceID& workspaceId) const {
    return workspaces_.count(workspaceId) != 0;
}

std::vector<const WorkspaceState*> Document::workspaces() const {
    std::vector<const WorkspaceState*> live;
    for (const auto& [id, ws] : workspaces_) {
        if (!ws->info.deleted) {
            live.push_back(ws.get());
        }
    }
    return live;
}

WorkspaceState* Document::addWorkspace(workspace::Workspace info) {
    if (hasWorkspaceId(info.id)) {
        return nullptr;
    }
    const WorkspaceState* base = info.baseId ? state(*info.baseId) : nullptr;
    if (info.baseId && !base) {
        return nullptr;
    }
    if (!store_.registerWorkspace(info.id, info.baseId, info.divergence.sequence)) {
        return nullptr;
    }

    auto ws = std::make_unique<WorkspaceState>(std::move(info));
    if (base) {
        ws->graph = base->graph;
        for (const auto& [constraintId, constraint] : base->graph.constraints()) {
            ws->info.forkConstraintIds.insert(constraintId);
        }
    }
    WorkspaceState* raw = ws.get();
    workspaces_.emplace(raw->info.id, std::move(ws));
    return raw;
}

workspace::BranchStatus Document::branchStatus(const WorkspaceState& ws) const {
    if (localOperationCount(ws) > 0) {
        return workspace::BranchStatus::Modified;
    }
    return ws.info.merged ? workspace::BranchStatus::Merged : workspace::BranchStatus::Clean;
}

std::size_t Document::localOperationCount(const WorkspaceState& ws) const {
    return ws.log.countSince(ws.info.segmentStart);
}

//------------------------------------------------------------------------------
// Entities
//------------------------------------------------------------------------------

EntityResult Document::createEntity(const WorkspaceID& workspaceId,
                                    core::model::EntityType type,
                                    const core::model::ParameterMap& parameters,
                                    const std::vector<EntityID>& parentIds,
                                    const core::model::AgentID& agentId) {
    WorkspaceState* ws = state(workspaceId);
    if (!ws) {
        return failure<EntityResult>(ErrorKind::WorkspaceNotFound, workspaceMissing(workspaceId));
    }

    const auto validation = core::model::validateParameters(type, parameters);
    if (!validation.valid) {
        return failure<EntityResult>(ErrorKind::InvalidRequest, validation.message);
    }

    for (const auto& parentId : parentIds) {
        if (!store_.find(workspaceId, parentId)) {
            return failure<EntityResult>(ErrorKind::EntityNotFound, "Parent entity not found: " + parentId);
        }
    }
    if (type == core::model::EntityType::Solid) {
        const auto parent = parentIds.size() == 1 ? store_.find(workspaceId, parentIds.front()) : std::nullopt;
        if (!parent || parent->type != core::model::EntityType::Sketch) {
            return failure<EntityResult>(ErrorKind::InvalidRequest, "A solid must reference exactly one sketch");
        }
    }

    Entity entity;
    do {
        entity.id = core::model::generateEntityId(workspaceId, type);
    } while (store_.find(workspaceId, entity.id));
    entity.workspaceId = workspaceId;
    entity.type = type;
    entity.parameters = parameters;
    entity.version = 1;
    entity.createdBy = agentId;
    entity.createdAt = now();
    entity.modifiedAt = entity.createdAt;
    entity.parentIds = parentIds;

    store_.put(workspaceId, ws->log.nextSequence(), entity);

    OperationRecord record;
    record.type = OperationType::EntityCreate;
    record.agentId = agentId;
    record.entityIds = {entity.id};
    record.entityDeltas.push_back({entity.id, std::nullopt, entity});

    EntityResult result;
    result.operationId = appendRecord(*ws, std::move(record)).opId;
    result.entity = std::move(entity);
    result.success = true;
    return result;
}

EntityResult Document::modifyEntity(const WorkspaceID& workspaceId,
                                    const EntityID& entityId,
                                    const core::model::ParameterMap& parameters,
                                    const core::model::AgentID& agentId) {
    WorkspaceState* ws = state(workspaceId);
    if (!ws) {
        return failure<EntityResult>(ErrorKind::WorkspaceNotFound, workspaceMissing(workspaceId));
    }
    auto current = store_.find(workspaceId, entityId);
    if (!current) {
        return failure<EntityResult>(ErrorKind::EntityNotFound, "Entity not found: " + entityId);
    }
    if (parameters.empty()) {
        return failure<EntityResult>(ErrorKind::InvalidRequest, "No parameters to modify");
    }

    Entity updated = *current;
    for (const auto& [key, value] : parameters) {
        updated.parameters[key] = value;
    }
    const auto validation = core::model::validateParameters(updated.type, updated.parameters);
    if (!validation.valid) {
        return failure<EntityResult>(ErrorKind::InvalidRequest, validation.message);
    }
    updated.version = current->version + 1;
    updated.modifiedAt = now();

    store_.put(workspaceId, ws->log.nextSequence(), updated);

    OperationRecord record;
    record.type = OperationType::EntityModify;
    record.agentId = agentId;
    record.entityIds = {entityId};
    record.entityDeltas.push_back({entityId, current, updated});

    EntityResult result;
    result.operationId = appendRecord(*ws, std::move(record)).opId;
    result.propagation = ws->graph.propagate({entityId}, lookupFor(workspaceId), evaluator_);
    result.entity = std::move(updated);
    result.success = true;
    return result;
}

EntityDeleteResult Document::deleteEntity(const WorkspaceID& workspaceId,
                                          const EntityID& entityId,
                                          const core::model::AgentID& agentId) {
    WorkspaceState* ws = state(workspaceId);
    if (!ws) {
        return failure<EntityDeleteResult>(ErrorKind::WorkspaceNotFound, workspaceMissing(workspaceId));
    }
    const auto view = store_.snapshot(workspaceId);
    if (view.count(entityId) == 0) {
        return failure<EntityDeleteResult>(ErrorKind::EntityNotFound, "Entity not found: " + entityId);
    }

    // Children go with their parent (a solid with its sketch)
    EntityDeleteResult result;
    std::set<EntityID> doomed{entityId};
    std::deque<EntityID> queue{entityId};
    while (!queue.empty()) {
        const EntityID current = queue.front();
        queue.pop_front();
        result.deletedEntities.push_back(current);
        for (const auto& [id, entity] : view) {
            if (entity.hasParent(current) && doomed.insert(id).second) {
                queue.push_back(id);
            }
        }
    }

    const auto sequence = ws->log.nextSequence();
    OperationRecord record;
    record.type = OperationType::EntityDelete;
    record.agentId = agentId;
    for (const auto& id : result.deletedEntities) {
        store_.erase(workspaceId, sequence, id);
        record.entityIds.push_back(id);
        record.entityDeltas.push_back({id, view.at(id), std::nullopt});
        for (auto& removed : ws->graph.removeReferencing(id)) {
            result.removedConstraints.push_back(removed.id);
            record.constraintDeltas.push_back({removed.id, std::move(removed), std::nullopt});
        }
    }

    result.operationId = appendRecord(*ws, std::move(record)).opId;
    result.success = true;
    qCInfo(logDocument) << "deleteEntity" << workspaceId.c_str() << entityId.c_str()
                        << "cascadedEntities=" << result.deletedEntities.size() - 1
                        << "removedConstraints=" << result.removedConstraints.size();
    return result;
}

std::optional<Entity> Document::findEntity(const WorkspaceID& workspaceId, const EntityID& entityId) const {
    if (!state(workspaceId)) {
        return std::nullopt;
    }
    return store_.find(workspaceId, entityId);
}

std::map<EntityID, Entity> Document::entities(const WorkspaceID& workspaceId) const {
    if (!state(workspaceId)) {
        return {};
    }
    return store_.snapshot(workspaceId);
}

//------------------------------------------------------------------------------
// Constraints
//------------------------------------------------------------------------------

ConstraintApplyResult Document::applyConstraint(const WorkspaceID& workspaceId,
                                                const core::constraint::ConstraintRequest& request) {
    ConstraintApplyResult result;
    WorkspaceState* ws = state(workspaceId);
    if (!ws) {
        result.apply.error = ErrorKind::WorkspaceNotFound;
        result.apply.errorMessage = workspaceMissing(workspaceId);
        return result;
    }

    result.apply = ws->graph.apply(request, workspaceId, now(), lookupFor(workspaceId), evaluator_, tolerances_);
    if (!result.apply.success) {
        return result;
    }

    const auto& constraint = *result.apply.constraint;
    OperationRecord record;
    record.type = OperationType::ConstraintApply;
    record.agentId = request.agentId;
    record.entityIds = constraint.entityIds;
    record.constraintDeltas.push_back({constraint.id, std::nullopt, constraint});
    result.operationId = appendRecord(*ws, std::move(record)).opId;
    return result;
}

ConstraintRemoveResult Document::removeConstraint(const WorkspaceID& workspaceId,
                                                  const core::model::ConstraintID& constraintId,
                                                  const core::model::AgentID& agentId) {
    WorkspaceState* ws = state(workspaceId);
    if (!ws) {
        return failure<ConstraintRemoveResult>(ErrorKind::WorkspaceNotFound, workspaceMissing(workspaceId));
    }
    auto removed = ws->graph.remove(constraintId, lookupFor(workspaceId), evaluator_);
    if (!removed) {
        return failure<ConstraintRemoveResult>(ErrorKind::EntityNotFound, "Constraint not found: " + constraintId);
    }

    OperationRecord record;
    record.type = OperationType::ConstraintRemove;
    record.agentId = agentId;
    record.entityIds = removed->entityIds;
    record.constraintDeltas.push_back({constraintId, removed, std::nullopt});

    ConstraintRemoveResult result;
    result.operationId = appendRecord(*ws, std::move(record)).opId;
    result.removed = std::move(removed);
    result.success = true;
    return result;
}

ConstraintStatusResult Document::constraintStatus(const WorkspaceID& workspaceId,
                                                  const std::optional<EntityID>& sketchId) const {
    const WorkspaceState* ws = state(workspaceId);
    if (!ws) {
        return failure<ConstraintStatusResult>(ErrorKind::WorkspaceNotFound, workspaceMissing(workspaceId));
    }

    const auto view = store_.snapshot(workspaceId);
    std::vector<Entity> scope;
    if (sketchId) {
        auto sketch = view.find(*sketchId);
        if (sketch == view.end()) {
            return failure<ConstraintStatusResult>(ErrorKind::EntityNotFound, "Entity not found: " + *sketchId);
        }
        if (sketch->second.type != core::model::EntityType::Sketch) {
            return failure<ConstraintStatusResult>(ErrorKind::InvalidRequest, *sketchId + " is not a sketch");
        }
        for (const auto& [id, entity] : view) {
            if (id == *sketchId || entity.hasParent(*sketchId)) {
                scope.push_back(entity);
            }
        }
    } else {
        for (const auto& [id, entity] : view) {
            scope.push_back(entity);
        }
    }

    ConstraintStatusResult result;
    result.report = ws->graph.status(scope);
    result.success = true;
    return result;
}

//------------------------------------------------------------------------------
// History
//------------------------------------------------------------------------------

UndoResult Document::undo(const WorkspaceID& workspaceId, const core::model::AgentID& agentId) {
    WorkspaceState* ws = state(workspaceId);
    if (!ws) {
        return failure<UndoResult>(ErrorKind::WorkspaceNotFound, workspaceMissing(workspaceId));
    }
    const OperationRecord* target = ws->log.lastUndoable();
    if (!target) {
        return failure<UndoResult>(ErrorKind::InvalidRequest, "Nothing to undo in workspace " + workspaceId);
    }
    // Copy: appending below may reallocate the log
    const OperationRecord reverted = *target;

    UndoResult result;
    result.revertedOperationId = reverted.opId;
    result.revertedType = reverted.type;

    const auto sequence = ws->log.nextSequence();
    OperationRecord record;
    record.type = OperationType::Undo;
    record.agentId = agentId;
    record.reference = reverted.opId;

    std::vector<EntityID> touched;
    for (auto delta = reverted.entityDeltas.rbegin(); delta != reverted.entityDeltas.rend(); ++delta) {
        auto current = store_.find(workspaceId, delta->entityId);
        if (delta->before) {
            Entity restored = *delta->before;
            restored.version = (current ? current->version : delta->before->version) + 1;
            restored.modifiedAt = now();
            store_.put(workspaceId, sequence, restored);
            record.entityDeltas.push_back({delta->entityId, current, restored});
            result.restoredEntities.push_back(delta->entityId);
        } else if (current) {
            store_.erase(workspaceId, sequence, delta->entityId);
            record.entityDeltas.push_back({delta->entityId, current, std::nullopt});
            for (auto& removed : ws->graph.removeReferencing(delta->entityId)) {
                record.constraintDeltas.push_back({removed.id, std::move(removed), std::nullopt});
            }
        }
        record.entityIds.push_back(delta->entityId);
        touched.push_back(delta->entityId);
    }

    const auto lookup = lookupFor(workspaceId);
    for (auto delta = reverted.constraintDeltas.rbegin(); delta != reverted.constraintDeltas.rend(); ++delta) {
        const core::constraint::Constraint* current = ws->graph.find(delta->constraintId);
        std::optional<core::constraint::Constraint> before;
        if (current) {
            before = *current;
        }

        if (delta->before) {
            if (!core::constraint::resolveEntities(delta->before->entityIds, lookup)) {
                qCWarning(logDocument) << "undo: cannot restore constraint, entities gone"
                                       << delta->constraintId.c_str();
                result.skippedConstraints.push_back(delta->constraintId);
                continue;
            }
            if (!ws->graph.restore(*delta->before, lookup)) {
                result.skippedConstraints.push_back(delta->constraintId);
                continue;
            }
            record.constraintDeltas.push_back({delta->constraintId, before, *ws->graph.find(delta->constraintId)});
            touched.insert(touched.end(), delta->before->entityIds.begin(), delta->before->entityIds.end());
        } else if (current) {
            ws->graph.remove(delta->constraintId, lookup, evaluator_);
            record.constraintDeltas.push_back({delta->constraintId, before, std::nullopt});
            touched.insert(touched.end(), before->entityIds.begin(), before->entityIds.end());
        }
    }

    result.operationId = appendRecord(*ws, std::move(record)).opId;
    result.propagation = ws->graph.propagate(touched, lookup, evaluator_);
    result.success = true;

    qCInfo(logDocument) << "undo" << workspaceId.c_str()
                        << "reverted=" << reverted.opId.c_str()
                        << "type=" << operationTypeToString(reverted.type).c_str()
                        << "skippedConstraints=" << result.skippedConstraints.size();
    return result;
}

//------------------------------------------------------------------------------
// Shared services
//------------------------------------------------------------------------------

core::constraint::EntityLookup Document::lookupFor(const WorkspaceID& workspaceId) const {
    return [this, workspaceId](const EntityID& entityId) { return store_.find(workspaceId, entityId); };
}

const OperationRecord& Document::appendRecord(WorkspaceState& ws, OperationRecord record) {
    record.timestamp = now();
    return ws.log.append(std::move(record));
}

} // namespace agentcad::app
