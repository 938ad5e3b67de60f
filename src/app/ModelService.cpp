#include "ModelService.h"

#include <QLoggingCategory>

#include <exception>

namespace agentcad::app {

Q_LOGGING_CATEGORY(logService, "agentcad.app.service")

using core::model::ErrorKind;

namespace {

template <typename Result>
void markFailed(Result& result, ErrorKind kind, std::string message) {
    result.success = false;
    result.error = kind;
    result.errorMessage = std::move(message);
}

void markFailed(ConstraintApplyResult& result, ErrorKind kind, std::string message) {
    markFailed(result.apply, kind, std::move(message));
}

} // namespace

ModelService::ModelService(EngineConfig config, core::model::Clock clock)
    : config_(std::move(config))
    , document_(engine_, config_.tolerances(), clock)
    , locks_(clock)
    , workspaces_(document_, locks_, config_.mergeLockTtl) {
}

core::model::AgentID ModelService::agentOrDefault(const core::model::AgentID& agentId) const {
    return agentId.empty() ? config_.defaultAgentId.toStdString() : agentId;
}

template <typename Result, typename Fn>
Result ModelService::guarded(const char* operation, Fn&& fn) {
    std::lock_guard<std::mutex> guard(datastoreMutex_);
    try {
        return fn();
    } catch (const std::exception& e) {
        qCCritical(logService) << operation << "failed with exception:" << e.what();
        Result result;
        markFailed(result, ErrorKind::InternalSolverError, std::string(operation) + ": " + e.what());
        return result;
    }
}

//------------------------------------------------------------------------------
// Entities
//------------------------------------------------------------------------------

EntityResult ModelService::createEntity(const core::model::WorkspaceID& workspaceId,
                                        core::model::EntityType type,
                                        const core::model::ParameterMap& parameters,
                                        const std::vector<core::model::EntityID>& parentIds,
                                        const core::model::AgentID& agentId) {
    return guarded<EntityResult>("entity.create", [&] {
        return document_.createEntity(workspaceId, type, parameters, parentIds, agentOrDefault(agentId));
    });
}

EntityResult ModelService::modifyEntity(const core::model::WorkspaceID& workspaceId,
                                        const core::model::EntityID& entityId,
                                        const core::model::ParameterMap& parameters,
                                        const core::model::AgentID& agentId) {
    return guarded<EntityResult>("entity.modify", [&] {
        return document_.modifyEntity(workspaceId, entityId, parameters, agentOrDefault(agentId));
    });
}

EntityDeleteResult ModelService::deleteEntity(const core::model::WorkspaceID& workspaceId,
                                              const core::model::EntityID& entityId,
                                              const core::model::AgentID& agentId) {
    return guarded<EntityDeleteResult>("entity.delete", [&] {
        return document_.deleteEntity(workspaceId, entityId, agentOrDefault(agentId));
    });
}

EntityResult ModelService::queryEntity(const core::model::WorkspaceID& workspaceId,
                                       const core::model::EntityID& entityId) {
    return guarded<EntityResult>("entity.query", [&] {
        EntityResult result;
        if (!document_.state(workspaceId)) {
            markFailed(result, ErrorKind::WorkspaceNotFound, "Workspace not found: " + workspaceId);
            return result;
        }
        result.entity = document_.findEntity(workspaceId, entityId);
        if (!result.entity) {
            markFailed(result, ErrorKind::EntityNotFound, "Entity not found: " + entityId);
            return result;
        }
        result.success = true;
        return result;
    });
}

EntityListResult ModelService::listEntities(const core::model::WorkspaceID& workspaceId,
                                            const std::optional<core::model::EntityType>& type) {
    return guarded<EntityListResult>("entity.list", [&] {
        EntityListResult result;
        if (!document_.state(workspaceId)) {
            markFailed(result, ErrorKind::WorkspaceNotFound, "Workspace not found: " + workspaceId);
            return result;
        }
        for (auto& [id, entity] : document_.entities(workspaceId)) {
            if (!type || entity.type == *type) {
                result.entities.push_back(std::move(entity));
            }
        }
        result.success = true;
        return result;
    });
}

//------------------------------------------------------------------------------
// Constraints
//------------------------------------------------------------------------------

ConstraintApplyResult ModelService::applyConstraint(const core::model::WorkspaceID& workspaceId,
                                                    core::constraint::ConstraintRequest request) {
    request.agentId = agentOrDefault(request.agentId);
    return guarded<ConstraintApplyResult>("constraint.apply", [&] {
        return document_.applyConstraint(workspaceId, request);
    });
}

ConstraintRemoveResult ModelService::removeConstraint(const core::model::WorkspaceID& workspaceId,
                                                      const core::model::ConstraintID& constraintId,
                                                      const core::model::AgentID& agentId) {
    return guarded<ConstraintRemoveResult>("constraint.remove", [&] {
        return document_.removeConstraint(workspaceId, constraintId, agentOrDefault(agentId));
    });
}

ConstraintStatusResult ModelService::constraintStatus(const core::model::WorkspaceID& workspaceId,
                                                      const std::optional<core::model::EntityID>& sketchId) {
    return guarded<ConstraintStatusResult>("constraint.status", [&] {
        return document_.constraintStatus(workspaceId, sketchId);
    });
}

//------------------------------------------------------------------------------
// Workspaces
//------------------------------------------------------------------------------

workspace::CreateResult ModelService::createWorkspace(const std::string& name,
                                                      const core::model::WorkspaceID& baseId,
                                                      const core::model::AgentID& agentId) {
    return guarded<workspace::CreateResult>("workspace.create", [&] {
        return workspaces_.create(name, baseId, agentOrDefault(agentId));
    });
}

workspace::StatusResult ModelService::workspaceStatus(const core::model::WorkspaceID& workspaceId) {
    return guarded<workspace::StatusResult>("workspace.status", [&] {
        return workspaces_.status(workspaceId);
    });
}

WorkspaceListResult ModelService::listWorkspaces() {
    return guarded<WorkspaceListResult>("workspace.list", [&] {
        WorkspaceListResult result;
        result.workspaces = workspaces_.list();
        result.success = true;
        return result;
    });
}

workspace::DeleteResult ModelService::deleteWorkspace(const core::model::WorkspaceID& workspaceId) {
    return guarded<workspace::DeleteResult>("workspace.delete", [&] {
        return workspaces_.remove(workspaceId);
    });
}

workspace::MergeResult ModelService::merge(workspace::MergeRequest request) {
    request.agentId = agentOrDefault(request.agentId);
    return guarded<workspace::MergeResult>("workspace.merge", [&] {
        return workspaces_.merge(request);
    });
}

//------------------------------------------------------------------------------
// History
//------------------------------------------------------------------------------

HistoryResult ModelService::history(const core::model::WorkspaceID& workspaceId) {
    return guarded<HistoryResult>("history.list", [&] {
        HistoryResult result;
        const WorkspaceState* ws = document_.state(workspaceId);
        if (!ws) {
            markFailed(result, ErrorKind::WorkspaceNotFound, "Workspace not found: " + workspaceId);
            return result;
        }
        result.entries = ws->log.entries();
        result.success = true;
        return result;
    });
}

UndoResult ModelService::undo(const core::model::WorkspaceID& workspaceId, const core::model::AgentID& agentId) {
    return guarded<UndoResult>("history.undo", [&] {
        return document_.undo(workspaceId, agentOrDefault(agentId));
    });
}

//------------------------------------------------------------------------------
// Locks
//------------------------------------------------------------------------------

coordination::LockResult ModelService::acquireLock(const coordination::ResourceKey& resource,
                                                   const core::model::AgentID& agentId,
                                                   const std::string& sessionId,
                                                   std::chrono::seconds ttl) {
    return locks_.acquire(resource, agentOrDefault(agentId), sessionId,
                          ttl.count() == 0 ? config_.lockTtl : ttl);
}

LockReleaseResult ModelService::releaseLock(const coordination::ResourceKey& resource,
                                            const core::model::AgentID& agentId) {
    LockReleaseResult result;
    result.released = locks_.release(resource, agentOrDefault(agentId));
    result.success = true;
    return result;
}

LockStatusResult ModelService::lockStatus(const coordination::ResourceKey& resource) {
    LockStatusResult result;
    result.lock = locks_.status(resource);
    result.success = true;
    return result;
}

} // namespace agentcad::app
