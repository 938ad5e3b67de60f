/**
 * @file WorkspaceManager.h
 * @brief Workspace lifecycle and three-way merge between workspaces.
 */
#ifndef AGENTCAD_APP_WORKSPACE_WORKSPACEMANAGER_H
#define AGENTCAD_APP_WORKSPACE_WORKSPACEMANAGER_H

#include "../coordination/LeaseLockTable.h"
#include "../document/Document.h"
#include "ThreeWayMerge.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentcad::app::workspace {

enum class MergeStrategy {
    Auto,
    KeepSource,
    KeepTarget,
    Manual
};

std::string mergeStrategyToString(MergeStrategy strategy);
std::optional<MergeStrategy> mergeStrategyFromString(std::string_view name);

struct CreateResult {
    bool success = false;
    core::model::ErrorKind error = core::model::ErrorKind::None;
    std::string errorMessage;

    std::optional<Workspace> workspace;
};

struct StatusResult {
    bool success = false;
    core::model::ErrorKind error = core::model::ErrorKind::None;
    std::string errorMessage;

    Workspace workspace;
    BranchStatus status = BranchStatus::Clean;
    bool canMerge = false;

    std::size_t entityCount = 0;
    std::size_t constraintCount = 0;
    std::size_t localOperationCount = 0;
    std::size_t operationCount = 0;
};

struct DeleteResult {
    bool success = false;
    core::model::ErrorKind error = core::model::ErrorKind::None;
    std::string errorMessage;
};

struct MergeRequest {
    core::model::WorkspaceID sourceId;
    core::model::WorkspaceID targetId;
    MergeStrategy strategy = MergeStrategy::Auto;

    /// Used by the Manual strategy, keyed by conflicting entity id
    std::map<core::model::EntityID, ConflictResolution> resolutions;

    core::model::AgentID agentId;
    std::string sessionId;
};

struct MergeResult {
    bool success = false;
    core::model::ErrorKind error = core::model::ErrorKind::None;
    std::string errorMessage;

    std::vector<core::model::EntityID> entitiesAdded;
    std::vector<core::model::EntityID> entitiesModified;
    std::vector<core::model::EntityID> entitiesDeleted;

    /// Auto: every conflict. Manual: those left unresolved. Empty on success.
    std::vector<MergeConflict> conflicts;

    /// Conflicts settled by the strategy or an explicit resolution
    std::vector<core::model::EntityID> resolvedConflicts;

    std::vector<core::model::ConstraintID> constraintsAdded;
    std::vector<core::model::ConstraintID> constraintsRemoved;

    /// Carried constraints whose entities are gone from the merged target
    std::vector<core::model::ConstraintID> constraintsDropped;

    /// Filled on ConstraintConflict
    std::vector<core::model::ConstraintID> conflictingConstraints;

    std::vector<core::constraint::StatusChange> statusChanges;

    core::model::OperationID operationId;
    DivergencePoint divergence;
};

class WorkspaceManager {
public:
    WorkspaceManager(Document& document,
                     coordination::LeaseLockTable& locks,
                     std::chrono::seconds mergeLockTtl);

    /**
     * @brief Fork a workspace from the head of @p baseId
     *
     * The workspace id is the name. Fails with BaseNotFound for a missing or
     * deleted base and InvalidRequest for an empty or taken name.
     */
    CreateResult create(const std::string& name,
                        const core::model::WorkspaceID& baseId,
                        const core::model::AgentID& agentId);

    StatusResult status(const core::model::WorkspaceID& workspaceId) const;

    std::vector<Workspace> list() const;

    /// Mark deleted; its revisions stay so workspaces forked from it still resolve
    DeleteResult remove(const core::model::WorkspaceID& workspaceId);

    /**
     * @brief Three-way merge of @p request.sourceId into @p request.targetId
     *
     * All-or-nothing: on any failure neither workspace changes. On success
     * the target gets one merge entry and the source is rebased onto it.
     */
    MergeResult merge(const MergeRequest& request);

private:
    MergeResult mergeLocked(const MergeRequest& request);

    Document& document_;
    coordination::LeaseLockTable& locks_;
    std::chrono::seconds mergeLockTtl_;
};

} // namespace agentcad::app::workspace

#endif // AGENTCAD_APP_WORKSPACE_WORKSPACEMANAGER_H
