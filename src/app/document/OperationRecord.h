/**
 * @file OperationRecord.h
 * @brief Operation log entries with before/after snapshots.
 */
#ifndef AGENTCAD_APP_DOCUMENT_OPERATIONRECORD_H
#define AGENTCAD_APP_DOCUMENT_OPERATIONRECORD_H

#include "../../core/constraint/Constraint.h"
#include "../../core/model/Entity.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentcad::app {

enum class OperationType {
    EntityCreate,
    EntityModify,
    EntityDelete,
    ConstraintApply,
    ConstraintRemove,
    Merge,
    Rebase,
    Undo
};

std::string operationTypeToString(OperationType type);
std::optional<OperationType> operationTypeFromString(std::string_view name);

/**
 * @brief One entity's state around an operation (nullopt = absent)
 */
struct EntityDelta {
    core::model::EntityID entityId;
    std::optional<core::model::Entity> before;
    std::optional<core::model::Entity> after;
};

struct ConstraintDelta {
    core::model::ConstraintID constraintId;
    std::optional<core::constraint::Constraint> before;
    std::optional<core::constraint::Constraint> after;
};

struct OperationRecord {
    core::model::OperationID opId;
    core::model::Sequence sequence = 0;
    OperationType type = OperationType::EntityCreate;
    core::model::WorkspaceID workspaceId;
    core::model::AgentID agentId;
    core::model::Timestamp timestamp{};

    std::vector<core::model::EntityID> entityIds;
    std::vector<EntityDelta> entityDeltas;
    std::vector<ConstraintDelta> constraintDeltas;

    /// Undo: the reverted operation. Merge/Rebase: the other workspace.
    std::string reference;
};

} // namespace agentcad::app

#endif // AGENTCAD_APP_DOCUMENT_OPERATIONRECORD_H
