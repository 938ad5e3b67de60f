/**
 * @file ModelService.h
 * @brief Serialized entry point for every agent operation.
 *
 * Holds the datastore write mutex for the duration of each call and turns
 * exceptions escaping the core into InternalSolverError results. The lock
 * table has its own mutex and is not covered by the datastore lock.
 */
#ifndef AGENTCAD_APP_MODELSERVICE_H
#define AGENTCAD_APP_MODELSERVICE_H

#include "../core/geometry/AnalyticGeometryEngine.h"
#include "EngineConfig.h"
#include "coordination/LeaseLockTable.h"
#include "document/Document.h"
#include "workspace/WorkspaceManager.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentcad::app {

struct EntityListResult {
    bool success = false;
    core::model::ErrorKind error = core::model::ErrorKind::None;
    std::string errorMessage;

    std::vector<core::model::Entity> entities;
};

struct WorkspaceListResult {
    bool success = false;
    core::model::ErrorKind error = core::model::ErrorKind::None;
    std::string errorMessage;

    std::vector<workspace::Workspace> workspaces;
};

struct HistoryResult {
    bool success = false;
    core::model::ErrorKind error = core::model::ErrorKind::None;
    std::string errorMessage;

    std::vector<OperationRecord> entries;
};

struct LockReleaseResult {
    bool success = false;
    core::model::ErrorKind error = core::model::ErrorKind::None;
    std::string errorMessage;

    bool released = false;
};

struct LockStatusResult {
    bool success = false;
    core::model::ErrorKind error = core::model::ErrorKind::None;
    std::string errorMessage;

    std::optional<coordination::LeaseLock> lock;
};

class ModelService {
public:
    explicit ModelService(EngineConfig config, core::model::Clock clock = core::model::systemClock());

    ModelService(const ModelService&) = delete;
    ModelService& operator=(const ModelService&) = delete;

    const EngineConfig& config() const { return config_; }

    /// @p agentId, or the configured default when empty
    core::model::AgentID agentOrDefault(const core::model::AgentID& agentId) const;

    //--------------------------------------------------------------------------
    // Entities
    //--------------------------------------------------------------------------

    EntityResult createEntity(const core::model::WorkspaceID& workspaceId,
                              core::model::EntityType type,
                              const core::model::ParameterMap& parameters,
                              const std::vector<core::model::EntityID>& parentIds,
                              const core::model::AgentID& agentId);

    EntityResult modifyEntity(const core::model::WorkspaceID& workspaceId,
                              const core::model::EntityID& entityId,
                              const core::model::ParameterMap& parameters,
                              const core::model::AgentID& agentId);

    EntityDeleteResult deleteEntity(const core::model::WorkspaceID& workspaceId,
                                    const core::model::EntityID& entityId,
                                    const core::model::AgentID& agentId);

    EntityResult queryEntity(const core::model::WorkspaceID& workspaceId,
                             const core::model::EntityID& entityId);

    EntityListResult listEntities(const core::model::WorkspaceID& workspaceId,
                                  const std::optional<core::model::EntityType>& type);

    //--------------------------------------------------------------------------
    // Constraints
    //--------------------------------------------------------------------------

    ConstraintApplyResult applyConstraint(const core::model::WorkspaceID& workspaceId,
                                          core::constraint::ConstraintRequest request);

    ConstraintRemoveResult removeConstraint(const core::model::WorkspaceID& workspaceId,
                                            const core::model::ConstraintID& constraintId,
                                            const core::model::AgentID& agentId);

    ConstraintStatusResult constraintStatus(const core::model::WorkspaceID& workspaceId,
                                            const std::optional<core::model::EntityID>& sketchId);

    //--------------------------------------------------------------------------
    // Workspaces
    //--------------------------------------------------------------------------

    workspace::CreateResult createWorkspace(const std::string& name,
                                            const core::model::WorkspaceID& baseId,
                                            const core::model::AgentID& agentId);

    workspace::StatusResult workspaceStatus(const core::model::WorkspaceID& workspaceId);

    WorkspaceListResult listWorkspaces();

    workspace::DeleteResult deleteWorkspace(const core::model::WorkspaceID& workspaceId);

    workspace::MergeResult merge(workspace::MergeRequest request);

    //--------------------------------------------------------------------------
    // History
    //--------------------------------------------------------------------------

    HistoryResult history(const core::model::WorkspaceID& workspaceId);

    UndoResult undo(const core::model::WorkspaceID& workspaceId, const core::model::AgentID& agentId);

    //--------------------------------------------------------------------------
    // Locks
    //--------------------------------------------------------------------------

    /// @p ttl of zero means the configured default
    coordination::LockResult acquireLock(const coordination::ResourceKey& resource,
                                         const core::model::AgentID& agentId,
                                         const std::string& sessionId,
                                         std::chrono::seconds ttl);

    LockReleaseResult releaseLock(const coordination::ResourceKey& resource, const core::model::AgentID& agentId);

    LockStatusResult lockStatus(const coordination::ResourceKey& resource);

private:
    template <typename Result, typename Fn>
    Result guarded(const char* operation, Fn&& fn);

    EngineConfig config_;
    core::geometry::AnalyticGeometryEngine engine_;
    Document document_;
    coordination::LeaseLockTable locks_;
    workspace::WorkspaceManager workspaces_;
    std::mutex datastoreMutex_;
};

} // namespace agentcad::app

#endif // AGENTCAD_APP_MODELSERVICE_H
