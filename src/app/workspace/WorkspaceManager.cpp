#include "WorkspaceManager.h"

#include <QLoggingCategory>

#include <algorithm>
#include <set>

namespace agentcad::app::workspace {

Q_LOGGING_CATEGORY(logWorkspace, "agentcad.app.workspace")

using core::constraint::Constraint;
using core::model::Entity;
using core::model::EntityID;
using core::model::ErrorKind;
using core::model::WorkspaceID;

std::string branchStatusToString(BranchStatus status) {
    switch (status) {
        case BranchStatus::Clean: return "clean";
        case BranchStatus::Modified: return "modified";
        case BranchStatus::Merged: return "merged";
    }
    return "unknown";
}

std::string mergeStrategyToString(MergeStrategy strategy) {
    switch (strategy) {
        case MergeStrategy::Auto: return "auto";
        case MergeStrategy::KeepSource: return "keep_source";
        case MergeStrategy::KeepTarget: return "keep_target";
        case MergeStrategy::Manual: return "manual";
    }
    return "unknown";
}

std::optional<MergeStrategy> mergeStrategyFromString(std::string_view name) {
    if (name == "auto") return MergeStrategy::Auto;
    if (name == "keep_source") return MergeStrategy::KeepSource;
    if (name == "keep_target") return MergeStrategy::KeepTarget;
    if (name == "manual") return MergeStrategy::Manual;
    return std::nullopt;
}

namespace {

template <typename Result>
Result failure(ErrorKind kind, std::string message) {
    Result result;
    result.error = kind;
    result.errorMessage = std::move(message);
    return result;
}

/// Strategy-wide answer, or nullopt when each conflict needs its own
std::optional<Resolution> blanketResolution(MergeStrategy strategy) {
    switch (strategy) {
        case MergeStrategy::KeepSource: return Resolution::KeepSource;
        case MergeStrategy::KeepTarget: return Resolution::KeepTarget;
        case MergeStrategy::Auto:
        case MergeStrategy::Manual:
            return std::nullopt;
    }
    return std::nullopt;
}

/**
 * @brief Drop entities whose parent is gone from the merged view
 *
 * A solid added in the target whose sketch the source deleted goes with it.
 */
void cascadeOrphans(EntityView& merged,
                    const EntityView& target,
                    std::map<EntityID, MergeChange>& changes) {
    bool removed = true;
    while (removed) {
        removed = false;
        for (auto it = merged.begin(); it != merged.end();) {
            const auto& parents = it->second.parentIds;
            const bool orphan = std::any_of(parents.begin(), parents.end(), [&](const EntityID& parentId) {
                return merged.count(parentId) == 0;
            });
            if (!orphan) {
                ++it;
                continue;
            }
            const EntityID id = it->first;
            auto current = target.find(id);
            if (current != target.end()) {
                MergeChange change;
                change.kind = ChangeKind::Delete;
                change.entityId = id;
                change.before = current->second;
                changes[id] = std::move(change);
            } else {
                changes.erase(id);
            }
            it = merged.erase(it);
            removed = true;
        }
    }
}

} // namespace

WorkspaceManager::WorkspaceManager(Document& document,
                                   coordination::LeaseLockTable& locks,
                                   std::chrono::seconds mergeLockTtl)
    : document_(document)
    , locks_(locks)
    , mergeLockTtl_(mergeLockTtl) {
}

//------------------------------------------------------------------------------
// Lifecycle
//------------------------------------------------------------------------------

CreateResult WorkspaceManager::create(const std::string& name,
                                      const WorkspaceID& baseId,
                                      const core::model::AgentID& agentId) {
    if (name.empty()) {
        return failure<CreateResult>(ErrorKind::InvalidRequest, "Workspace name is required");
    }
    if (name.find(':') != std::string::npos) {
        return failure<CreateResult>(ErrorKind::InvalidRequest, "Workspace name may not contain ':'");
    }
    if (document_.hasWorkspaceId(name)) {
        return failure<CreateResult>(ErrorKind::InvalidRequest, "Workspace already exists: " + name);
    }
    const WorkspaceState* base = document_.state(baseId);
    if (!base) {
        return failure<CreateResult>(ErrorKind::BaseNotFound, "Base workspace not found: " + baseId);
    }

    Workspace info;
    info.id = name;
    info.name = name;
    info.baseId = baseId;
    info.divergence = {base->log.headOperationId(), base->log.headSequence()};
    info.createdBy = agentId;
    info.createdAt = document_.now();

    WorkspaceState* created = document_.addWorkspace(info);
    if (!created) {
        return failure<CreateResult>(ErrorKind::InternalSolverError, "Could not register workspace " + name);
    }

    qCInfo(logWorkspace) << "create" << name.c_str() << "base=" << baseId.c_str()
                         << "divergence=" << info.divergence.sequence
                         << "constraints=" << created->graph.size();

    CreateResult result;
    result.success = true;
    result.workspace = created->info;
    return result;
}

StatusResult WorkspaceManager::status(const WorkspaceID& workspaceId) const {
    const WorkspaceState* ws = document_.state(workspaceId);
    if (!ws) {
        return failure<StatusResult>(ErrorKind::WorkspaceNotFound, "Workspace not found: " + workspaceId);
    }

    StatusResult result;
    result.success = true;
    result.workspace = ws->info;
    result.status = document_.branchStatus(*ws);
    result.entityCount = document_.store().snapshot(workspaceId).size();
    result.constraintCount = ws->graph.size();
    result.localOperationCount = document_.localOperationCount(*ws);
    result.operationCount = ws->log.size();
    result.canMerge = !ws->info.isRoot()
                      && document_.state(*ws->info.baseId) != nullptr
                      && result.status != BranchStatus::Merged;
    return result;
}

std::vector<Workspace> WorkspaceManager::list() const {
    std::vector<Workspace> out;
    for (const WorkspaceState* ws : document_.workspaces()) {
        out.push_back(ws->info);
    }
    return out;
}

DeleteResult WorkspaceManager::remove(const WorkspaceID& workspaceId) {
    WorkspaceState* ws = document_.state(workspaceId);
    if (!ws) {
        return failure<DeleteResult>(ErrorKind::WorkspaceNotFound, "Workspace not found: " + workspaceId);
    }
    if (ws->info.isRoot()) {
        return failure<DeleteResult>(ErrorKind::InvalidRequest, "The root workspace cannot be deleted");
    }
    ws->info.deleted = true;
    qCInfo(logWorkspace) << "delete" << workspaceId.c_str();

    DeleteResult result;
    result.success = true;
    return result;
}

//------------------------------------------------------------------------------
// Merge
//------------------------------------------------------------------------------

MergeResult WorkspaceManager::merge(const MergeRequest& request) {
    if (request.sourceId.empty() || request.targetId.empty()) {
        return failure<MergeResult>(ErrorKind::InvalidRequest, "Merge needs a source and a target");
    }

    coordination::ScopedLease lease(locks_, {"workspace", request.targetId},
                                    request.agentId, request.sessionId, mergeLockTtl_);
    if (!lease.held()) {
        auto result = failure<MergeResult>(lease.result().error, lease.result().errorMessage);
        qCInfo(logWorkspace) << "merge refused" << request.sourceId.c_str()
                             << "->" << request.targetId.c_str() << result.errorMessage.c_str();
        return result;
    }
    return mergeLocked(request);
}

MergeResult WorkspaceManager::mergeLocked(const MergeRequest& request) {
    WorkspaceState* source = document_.state(request.sourceId);
    if (!source) {
        return failure<MergeResult>(ErrorKind::BaseNotFound, "Source workspace not found: " + request.sourceId);
    }
    WorkspaceState* target = document_.state(request.targetId);
    if (!target) {
        return failure<MergeResult>(ErrorKind::BaseNotFound, "Target workspace not found: " + request.targetId);
    }
    if (source == target) {
        return failure<MergeResult>(ErrorKind::InvalidRequest, "Cannot merge a workspace into itself");
    }
    if (source->info.isRoot()) {
        return failure<MergeResult>(ErrorKind::BaseNotFound,
                                    "Workspace " + request.sourceId + " has no base to merge from");
    }

    auto& store = document_.store();
    const EntityView baseView = store.snapshotAt(*source->info.baseId, source->info.divergence.sequence);
    const EntityView sourceView = store.snapshot(request.sourceId);
    const EntityView targetView = store.snapshot(request.targetId);

    MergePlan plan = planMerge(baseView, sourceView, targetView);

    MergeResult result;
    std::map<EntityID, MergeChange> changes;
    for (auto& change : plan.changes) {
        changes.emplace(change.entityId, std::move(change));
    }

    // Settle conflicts according to the strategy
    const auto blanket = blanketResolution(request.strategy);
    std::vector<MergeConflict> unresolved;
    for (const auto& conflict : plan.conflicts) {
        ConflictResolution resolution;
        if (blanket) {
            resolution.choice = *blanket;
        } else if (request.strategy == MergeStrategy::Manual
                   && request.resolutions.count(conflict.entityId) != 0) {
            resolution = request.resolutions.at(conflict.entityId);
        } else {
            unresolved.push_back(conflict);
            continue;
        }

        std::string error;
        auto change = resolveConflict(conflict, resolution, error);
        if (!error.empty()) {
            return failure<MergeResult>(ErrorKind::InvalidRequest, error);
        }
        if (change) {
            changes[conflict.entityId] = std::move(*change);
        }
        result.resolvedConflicts.push_back(conflict.entityId);
    }

    if (!unresolved.empty()) {
        result.error = ErrorKind::WorkspaceConflict;
        result.errorMessage = std::to_string(unresolved.size()) + " unresolved conflict(s) merging "
                              + request.sourceId + " into " + request.targetId;
        result.conflicts = request.strategy == MergeStrategy::Auto ? plan.conflicts : unresolved;
        qCInfo(logWorkspace) << "merge conflict" << request.sourceId.c_str()
                             << "->" << request.targetId.c_str()
                             << "conflicts=" << result.conflicts.size();
        return result;
    }

    std::vector<MergeChange> resolved;
    resolved.reserve(changes.size());
    for (const auto& [id, change] : changes) {
        resolved.push_back(change);
    }
    EntityView merged = targetView;
    applyChanges(merged, resolved);
    cascadeOrphans(merged, targetView, changes);

    // Constraint changes run on a copy; the target graph is only replaced on commit
    core::constraint::ConstraintGraph graph = target->graph;
    const core::constraint::EntityLookup lookup = [&merged](const EntityID& id) -> std::optional<Entity> {
        auto it = merged.find(id);
        if (it == merged.end()) {
            return std::nullopt;
        }
        return it->second;
    };
    const auto& evaluator = document_.evaluator();

    std::vector<EntityID> affected;
    for (const auto& [id, change] : changes) {
        affected.push_back(id);
        if (change.kind == ChangeKind::Delete) {
            for (const auto& removed : graph.removeReferencing(id)) {
                result.constraintsRemoved.push_back(removed.id);
            }
        }
    }

    const auto& forked = source->info.forkConstraintIds;
    for (const auto& constraintId : forked) {
        if (source->graph.find(constraintId) || !graph.find(constraintId)) {
            continue;
        }
        const auto removed = graph.remove(constraintId, lookup, evaluator);
        if (removed) {
            affected.insert(affected.end(), removed->entityIds.begin(), removed->entityIds.end());
            result.constraintsRemoved.push_back(constraintId);
        }
    }

    std::vector<const Constraint*> carried;
    for (const auto& [constraintId, constraint] : source->graph.constraints()) {
        if (forked.count(constraintId) == 0 && !graph.find(constraintId)) {
            carried.push_back(&constraint);
        }
    }
    std::sort(carried.begin(), carried.end(), [](const Constraint* a, const Constraint* b) {
        return a->createdAt != b->createdAt ? a->createdAt < b->createdAt : a->id < b->id;
    });

    for (const Constraint* constraint : carried) {
        if (!core::constraint::resolveEntities(constraint->entityIds, lookup)) {
            result.constraintsDropped.push_back(constraint->id);
            continue;
        }
        auto adopted = graph.adopt(*constraint, lookup, evaluator);
        if (!adopted.success) {
            if (adopted.error == ErrorKind::ConstraintConflict) {
                auto conflict = failure<MergeResult>(ErrorKind::ConstraintConflict,
                                                     "Merged state over-constrains the target: "
                                                     + adopted.errorMessage);
                conflict.conflictingConstraints = adopted.conflictingConstraints;
                conflict.conflictingConstraints.push_back(constraint->id);
                qCInfo(logWorkspace) << "merge rejected" << request.sourceId.c_str()
                                     << "->" << request.targetId.c_str()
                                     << "constraint=" << constraint->id.c_str();
                return conflict;
            }
            qCWarning(logWorkspace) << "merge: dropping constraint" << constraint->id.c_str()
                                    << adopted.errorMessage.c_str();
            result.constraintsDropped.push_back(constraint->id);
            continue;
        }
        result.constraintsAdded.push_back(constraint->id);
        affected.insert(affected.end(), constraint->entityIds.begin(), constraint->entityIds.end());
    }

    result.statusChanges = graph.propagate(affected, lookup, evaluator).changes;

    //--------------------------------------------------------------------------
    // Commit: nothing below can fail
    //--------------------------------------------------------------------------

    const auto now = document_.now();
    const auto mergeSequence = target->log.nextSequence();

    OperationRecord record;
    record.type = OperationType::Merge;
    record.agentId = request.agentId;
    record.reference = request.sourceId;

    for (const auto& [id, change] : changes) {
        std::optional<Entity> after = change.after;
        if (after) {
            after->modifiedAt = now;
            store.put(request.targetId, mergeSequence, *after);
        } else {
            store.erase(request.targetId, mergeSequence, id);
        }
        switch (change.kind) {
            case ChangeKind::Add: result.entitiesAdded.push_back(id); break;
            case ChangeKind::Modify: result.entitiesModified.push_back(id); break;
            case ChangeKind::Delete: result.entitiesDeleted.push_back(id); break;
        }
        record.entityIds.push_back(id);
        record.entityDeltas.push_back({id, change.before, std::move(after)});
    }

    std::set<core::model::ConstraintID> constraintIds;
    for (const auto& [id, constraint] : target->graph.constraints()) constraintIds.insert(id);
    for (const auto& [id, constraint] : graph.constraints()) constraintIds.insert(id);
    for (const auto& id : constraintIds) {
        const Constraint* before = target->graph.find(id);
        const Constraint* after = graph.find(id);
        if ((before == nullptr) != (after == nullptr)) {
            record.constraintDeltas.push_back({id,
                                               before ? std::optional<Constraint>(*before) : std::nullopt,
                                               after ? std::optional<Constraint>(*after) : std::nullopt});
        }
    }

    target->graph = std::move(graph);
    result.operationId = document_.appendRecord(*target, std::move(record)).opId;

    // Rebase the source onto the new target head
    const auto rebaseSequence = source->log.nextSequence();
    if (!store.rebase(request.sourceId, request.targetId, mergeSequence, rebaseSequence)) {
        qCWarning(logWorkspace) << "merge: rebase of" << request.sourceId.c_str() << "was refused by the store";
    }
    OperationRecord rebase;
    rebase.type = OperationType::Rebase;
    rebase.agentId = request.agentId;
    rebase.reference = request.targetId;
    document_.appendRecord(*source, std::move(rebase));

    source->info.baseId = request.targetId;
    source->info.divergence = {result.operationId, mergeSequence};
    source->info.segmentStart = rebaseSequence;
    source->info.merged = true;
    source->graph = target->graph;
    source->info.forkConstraintIds.clear();
    for (const auto& [id, constraint] : target->graph.constraints()) {
        source->info.forkConstraintIds.insert(id);
    }

    result.divergence = source->info.divergence;
    result.success = true;

    qCInfo(logWorkspace) << "merge" << request.sourceId.c_str() << "->" << request.targetId.c_str()
                         << "strategy=" << mergeStrategyToString(request.strategy).c_str()
                         << "added=" << result.entitiesAdded.size()
                         << "modified=" << result.entitiesModified.size()
                         << "deleted=" << result.entitiesDeleted.size()
                         << "constraintsAdded=" << result.constraintsAdded.size()
                         << "dropped=" << result.constraintsDropped.size();
    return result;
}

} // namespace agentcad::app::workspace
