/**
 * @file ProtocolJson.cpp
 * @brief Implementation of protocol result encoding
 */

#include "ProtocolJson.h"

namespace agentcad::io {

using namespace app;

namespace {

QString qs(const std::string& value) {
    return QString::fromStdString(value);
}

QJsonValue optionalEntity(const std::optional<core::model::Entity>& entity) {
    if (!entity) {
        return QJsonValue(QJsonValue::Null);
    }
    return ProtocolJson::entity(*entity);
}

QJsonArray statusChanges(const std::vector<core::constraint::StatusChange>& changes) {
    QJsonArray out;
    for (const auto& change : changes) {
        QJsonObject json;
        json["constraint_id"] = qs(change.constraintId);
        json["before"] = qs(core::constraint::constraintStatusToString(change.before));
        json["after"] = qs(core::constraint::constraintStatusToString(change.after));
        out.append(json);
    }
    return out;
}

} // namespace

QJsonObject ProtocolJson::entity(const core::model::Entity& entity) {
    QJsonObject json;
    entity.serialize(json);
    return json;
}

QJsonObject ProtocolJson::constraint(const core::constraint::Constraint& constraint) {
    QJsonObject json;
    constraint.serialize(json);
    return json;
}

QJsonArray ProtocolJson::stringList(const std::vector<std::string>& values) {
    QJsonArray out;
    for (const auto& value : values) {
        out.append(qs(value));
    }
    return out;
}

QJsonObject ProtocolJson::parameters(const core::model::ParameterMap& parameters) {
    QJsonObject json;
    for (const auto& [key, value] : parameters) {
        json[qs(key)] = value;
    }
    return json;
}

//------------------------------------------------------------------------------
// Entities and constraints
//------------------------------------------------------------------------------

QJsonObject ProtocolJson::entityResult(const EntityResult& result) {
    QJsonObject json;
    json["entity"] = optionalEntity(result.entity);
    if (!result.operationId.empty()) {
        json["operation_id"] = qs(result.operationId);
    }
    if (!result.propagation.reevaluated.empty() || !result.propagation.component.empty()) {
        json["propagation"] = propagation(result.propagation);
    }
    return json;
}

QJsonObject ProtocolJson::entityDeleteResult(const EntityDeleteResult& result) {
    QJsonObject json;
    json["deleted_entities"] = stringList(result.deletedEntities);
    json["removed_constraints"] = stringList(result.removedConstraints);
    json["operation_id"] = qs(result.operationId);
    return json;
}

QJsonObject ProtocolJson::propagation(const core::constraint::PropagationResult& propagation) {
    QJsonObject json;
    json["component"] = stringList(propagation.component);
    json["reevaluated"] = stringList(propagation.reevaluated);
    json["status_changes"] = statusChanges(propagation.changes);
    return json;
}

QJsonObject ProtocolJson::applyResult(const ConstraintApplyResult& result) {
    const auto& apply = result.apply;
    QJsonObject json;
    if (apply.constraint) {
        json["constraint_id"] = qs(apply.constraint->id);
        json["status"] = qs(core::constraint::constraintStatusToString(apply.constraint->status));
        json["dof_removed"] = apply.constraint->dofRemoved;
        json["expected"] = apply.constraint->expectedValue;
        json["actual"] = apply.constraint->actualValue;
        json["constraint"] = constraint(*apply.constraint);
    }
    json["component"] = stringList(apply.component);
    json["component_dof"] = apply.componentDof;
    json["component_dof_removed"] = apply.componentDofRemoved;
    json["dof_remaining"] = apply.dofRemaining;
    if (!result.operationId.empty()) {
        json["operation_id"] = qs(result.operationId);
    }
    return json;
}

QJsonObject ProtocolJson::statusReport(const core::constraint::StatusReport& report) {
    QJsonObject counts;
    counts["satisfied"] = report.satisfied;
    counts["violated"] = report.violated;
    counts["redundant"] = report.redundant;

    QJsonArray constraints;
    for (const auto& c : report.constraints) {
        constraints.append(constraint(c));
    }

    QJsonObject json;
    json["counts"] = counts;
    json["total_dof"] = report.totalDof;
    json["dof_removed"] = report.dofRemoved;
    json["dof_remaining"] = report.dofRemaining;
    json["constraints"] = constraints;
    return json;
}

//------------------------------------------------------------------------------
// Workspaces
//------------------------------------------------------------------------------

QJsonObject ProtocolJson::divergence(const workspace::DivergencePoint& divergence) {
    QJsonObject json;
    json["operation_id"] = divergence.operationId.empty() ? QJsonValue(QJsonValue::Null)
                                                          : QJsonValue(qs(divergence.operationId));
    json["sequence"] = static_cast<qint64>(divergence.sequence);
    return json;
}

QJsonObject ProtocolJson::workspace(const workspace::Workspace& workspace) {
    QJsonObject json;
    json["workspace_id"] = qs(workspace.id);
    json["name"] = qs(workspace.name);
    json["base"] = workspace.baseId ? QJsonValue(qs(*workspace.baseId)) : QJsonValue(QJsonValue::Null);
    json["divergence_point"] = divergence(workspace.divergence);
    json["created_by"] = qs(workspace.createdBy);
    json["created_at"] = qs(core::model::timestampToIso(workspace.createdAt));
    json["merged"] = workspace.merged;
    return json;
}

QJsonObject ProtocolJson::workspaceStatus(const workspace::StatusResult& status, const QString& historyHash) {
    QJsonObject json = workspace(status.workspace);
    json["branch_status"] = qs(workspace::branchStatusToString(status.status));
    json["can_merge"] = status.canMerge;
    json["entity_count"] = static_cast<qint64>(status.entityCount);
    json["constraint_count"] = static_cast<qint64>(status.constraintCount);
    json["local_operation_count"] = static_cast<qint64>(status.localOperationCount);
    json["operation_count"] = static_cast<qint64>(status.operationCount);
    json["history_hash"] = historyHash;
    return json;
}

QJsonObject ProtocolJson::conflict(const workspace::MergeConflict& conflict) {
    QJsonArray options;
    for (const auto option : conflict.resolutionOptions) {
        options.append(qs(workspace::resolutionToString(option)));
    }

    QJsonObject json;
    json["entity_id"] = qs(conflict.entityId);
    json["conflict_type"] = qs(workspace::conflictTypeToString(conflict.type));
    json["base"] = optionalEntity(conflict.base);
    json["source"] = optionalEntity(conflict.source);
    json["target"] = optionalEntity(conflict.target);
    json["conflicting_parameters"] = stringList(conflict.conflictingParameters);
    json["resolution_options"] = options;
    return json;
}

QJsonArray ProtocolJson::conflicts(const std::vector<workspace::MergeConflict>& conflicts) {
    QJsonArray out;
    for (const auto& c : conflicts) {
        out.append(conflict(c));
    }
    return out;
}

QJsonObject ProtocolJson::mergeResult(const workspace::MergeResult& result) {
    QJsonObject json;
    json["entities_added"] = static_cast<qint64>(result.entitiesAdded.size());
    json["entities_modified"] = static_cast<qint64>(result.entitiesModified.size());
    json["entities_deleted"] = static_cast<qint64>(result.entitiesDeleted.size());
    json["added"] = stringList(result.entitiesAdded);
    json["modified"] = stringList(result.entitiesModified);
    json["deleted"] = stringList(result.entitiesDeleted);
    json["conflicts"] = conflicts(result.conflicts);
    json["resolved_conflicts"] = stringList(result.resolvedConflicts);
    json["constraints_added"] = stringList(result.constraintsAdded);
    json["constraints_removed"] = stringList(result.constraintsRemoved);
    json["constraints_dropped"] = stringList(result.constraintsDropped);
    json["status_changes"] = statusChanges(result.statusChanges);
    json["operation_id"] = qs(result.operationId);
    json["divergence_point"] = divergence(result.divergence);
    return json;
}

//------------------------------------------------------------------------------
// History and locks
//------------------------------------------------------------------------------

QJsonObject ProtocolJson::undoResult(const UndoResult& result) {
    QJsonObject json;
    json["operation_id"] = qs(result.operationId);
    json["reverted_operation_id"] = qs(result.revertedOperationId);
    json["reverted_type"] = qs(operationTypeToString(result.revertedType));
    json["restored_entities"] = stringList(result.restoredEntities);
    json["skipped_constraints"] = stringList(result.skippedConstraints);
    json["propagation"] = propagation(result.propagation);
    return json;
}

QJsonObject ProtocolJson::lock(const coordination::LeaseLock& lock) {
    QJsonObject json;
    json["resource_type"] = qs(lock.resource.type);
    json["resource_name"] = qs(lock.resource.name);
    json["holder"] = qs(lock.holder);
    json["session"] = qs(lock.sessionId);
    json["acquired_at"] = qs(core::model::timestampToIso(lock.acquiredAt));
    json["expires_at"] = qs(core::model::timestampToIso(lock.expiresAt));
    return json;
}

} // namespace agentcad::io
