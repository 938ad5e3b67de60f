/**
 * @file Workspace.h
 * @brief Branch record: lineage, divergence point and merge state.
 */
#ifndef AGENTCAD_APP_WORKSPACE_WORKSPACE_H
#define AGENTCAD_APP_WORKSPACE_WORKSPACE_H

#include "../../core/model/ModelTypes.h"

#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace agentcad::app::workspace {

enum class BranchStatus {
    Clean,
    Modified,
    Merged
};

std::string branchStatusToString(BranchStatus status);

/**
 * @brief Last operation shared with the base
 */
struct DivergencePoint {
    core::model::OperationID operationId;
    core::model::Sequence sequence = 0;
};

struct Workspace {
    core::model::WorkspaceID id;
    std::string name;

    /// nullopt for the root workspace
    std::optional<core::model::WorkspaceID> baseId;

    /// Position in the base's log; only advances, reset by merge
    DivergencePoint divergence;

    /// Local sequence the current lineage segment starts after
    core::model::Sequence segmentStart = 0;

    /// Set by a merge, cleared implicitly by the next local operation
    bool merged = false;

    bool deleted = false;

    core::model::AgentID createdBy;
    core::model::Timestamp createdAt{};

    /// Constraint ids inherited at fork (or at the last rebase)
    std::set<core::model::ConstraintID> forkConstraintIds;

    bool isRoot() const { return !baseId.has_value(); }
};

} // namespace agentcad::app::workspace

#endif // AGENTCAD_APP_WORKSPACE_WORKSPACE_H
