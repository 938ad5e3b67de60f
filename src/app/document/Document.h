/**
 * @file Document.h
 * @brief Shared datastore: entity store, per-workspace logs and graphs.
 *
 * Every mutating call here targets one explicit workspace and appends
 * exactly one entry to that workspace's operation log. Document performs
 * no locking; callers serialize access (see ModelService).
 */
#ifndef AGENTCAD_APP_DOCUMENT_DOCUMENT_H
#define AGENTCAD_APP_DOCUMENT_DOCUMENT_H

#include "../../core/constraint/ConstraintEvaluator.h"
#include "../../core/constraint/ConstraintGraph.h"
#include "../../core/geometry/GeometryEngine.h"
#include "../../core/model/EntityStore.h"
#include "../history/OperationLog.h"
#include "../workspace/Workspace.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentcad::app {

struct WorkspaceState {
    explicit WorkspaceState(workspace::Workspace workspaceInfo)
        : info(std::move(workspaceInfo)), log(info.id) {}

    workspace::Workspace info;
    history::OperationLog log;
    core::constraint::ConstraintGraph graph;
};

struct EntityResult {
    bool success = false;
    core::model::ErrorKind error = core::model::ErrorKind::None;
    std::string errorMessage;

    std::optional<core::model::Entity> entity;
    core::model::OperationID operationId;

    /// Filled by modify: the component that was re-evaluated
    core::constraint::PropagationResult propagation;
};

struct EntityDeleteResult {
    bool success = false;
    core::model::ErrorKind error = core::model::ErrorKind::None;
    std::string errorMessage;

    /// Requested entity first, then cascaded children
    std::vector<core::model::EntityID> deletedEntities;
    std::vector<core::model::ConstraintID> removedConstraints;
    core::model::OperationID operationId;
};

struct ConstraintApplyResult {
    core::constraint::ApplyResult apply;
    core::model::OperationID operationId;
};

struct ConstraintRemoveResult {
    bool success = false;
    core::model::ErrorKind error = core::model::ErrorKind::None;
    std::string errorMessage;

    std::optional<core::constraint::Constraint> removed;
    core::model::OperationID operationId;
};

struct ConstraintStatusResult {
    bool success = false;
    core::model::ErrorKind error = core::model::ErrorKind::None;
    std::string errorMessage;

    core::constraint::StatusReport report;
};

struct UndoResult {
    bool success = false;
    core::model::ErrorKind error = core::model::ErrorKind::None;
    std::string errorMessage;

    core::model::OperationID revertedOperationId;
    OperationType revertedType = OperationType::EntityCreate;
    core::model::OperationID operationId;

    std::vector<core::model::EntityID> restoredEntities;

    /// Constraints the undo could not bring back: entities gone, or the component would be over-constrained
    std::vector<core::model::ConstraintID> skippedConstraints;

    core::constraint::PropagationResult propagation;
};

class Document {
public:
    Document(const core::geometry::GeometryEngine& engine,
             core::constraint::ToleranceSettings tolerances,
             core::model::Clock clock = core::model::systemClock());

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    //--------------------------------------------------------------------------
    // Workspaces
    //--------------------------------------------------------------------------

    /// Live (not deleted) workspace, or nullptr
    WorkspaceState* state(const core::model::WorkspaceID& workspaceId);
    const WorkspaceState* state(const core::model::WorkspaceID& workspaceId) const;

    /// Including deleted workspaces
    bool hasWorkspaceId(const core::model::WorkspaceID& workspaceId) const;

    /// Live workspaces ordered by id
    std::vector<const WorkspaceState*> workspaces() const;

    /**
     * @brief Register a workspace forked from its base's head
     *
     * The caller fills info (id, name, base, divergence); the store table is
     * registered here and the graph copied from the base.
     */
    WorkspaceState* addWorkspace(workspace::Workspace info);

    workspace::BranchStatus branchStatus(const WorkspaceState& ws) const;

    /// Local operations in the current lineage segment
    std::size_t localOperationCount(const WorkspaceState& ws) const;

    //--------------------------------------------------------------------------
    // Entities
    //--------------------------------------------------------------------------

    EntityResult createEntity(const core::model::WorkspaceID& workspaceId,
                              core::model::EntityType type,
                              const core::model::ParameterMap& parameters,
                              const std::vector<core::model::EntityID>& parentIds,
                              const core::model::AgentID& agentId);

    /// Partial update: keys present in @p parameters replace current values
    EntityResult modifyEntity(const core::model::WorkspaceID& workspaceId,
                              const core::model::EntityID& entityId,
                              const core::model::ParameterMap& parameters,
                              const core::model::AgentID& agentId);

    EntityDeleteResult deleteEntity(const core::model::WorkspaceID& workspaceId,
                                    const core::model::EntityID& entityId,
                                    const core::model::AgentID& agentId);

    std::optional<core::model::Entity> findEntity(const core::model::WorkspaceID& workspaceId,
                                                  const core::model::EntityID& entityId) const;

    std::map<core::model::EntityID, core::model::Entity> entities(const core::model::WorkspaceID& workspaceId) const;

    //--------------------------------------------------------------------------
    // Constraints
    //--------------------------------------------------------------------------

    ConstraintApplyResult applyConstraint(const core::model::WorkspaceID& workspaceId,
                                          const core::constraint::ConstraintRequest& request);

    ConstraintRemoveResult removeConstraint(const core::model::WorkspaceID& workspaceId,
                                            const core::model::ConstraintID& constraintId,
                                            const core::model::AgentID& agentId);

    /**
     * @brief Constraint report over the whole workspace or one sketch
     * @param sketchId Restrict to the sketch and entities parented to it
     */
    ConstraintStatusResult constraintStatus(const core::model::WorkspaceID& workspaceId,
                                            const std::optional<core::model::EntityID>& sketchId) const;

    //--------------------------------------------------------------------------
    // History
    //--------------------------------------------------------------------------

    /**
     * @brief Revert the most recent undoable entry (best-effort)
     */
    UndoResult undo(const core::model::WorkspaceID& workspaceId, const core::model::AgentID& agentId);

    //--------------------------------------------------------------------------
    // Shared services
    //--------------------------------------------------------------------------

    core::model::EntityStore& store() { return store_; }
    const core::model::EntityStore& store() const { return store_; }

    core::constraint::EntityLookup lookupFor(const core::model::WorkspaceID& workspaceId) const;
    const core::constraint::ConstraintEvaluator& evaluator() const { return evaluator_; }
    const core::constraint::ToleranceSettings& tolerances() const { return tolerances_; }
    core::model::Timestamp now() const { return clock_(); }

    /// Stamp and append one entry to the workspace's log
    const OperationRecord& appendRecord(WorkspaceState& ws, OperationRecord record);

private:
    core::model::EntityStore store_;
    core::constraint::ConstraintEvaluator evaluator_;
    core::constraint::ToleranceSettings tolerances_;
    core::model::Clock clock_;
    std::map<core::model::WorkspaceID, std::unique_ptr<WorkspaceState>> workspaces_;
};

} // namespace agentcad::app

#endif // AGENTCAD_APP_DOCUMENT_DOCUMENT_H
