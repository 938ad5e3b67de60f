#include "OperationLog.h"

#include <QLoggingCategory>
#include <QUuid>

namespace agentcad::app {

std::string operationTypeToString(OperationType type) {
    switch (type) {
        case OperationType::EntityCreate: return "entity_create";
        case OperationType::EntityModify: return "entity_modify";
        case OperationType::EntityDelete: return "entity_delete";
        case OperationType::ConstraintApply: return "constraint_apply";
        case OperationType::ConstraintRemove: return "constraint_remove";
        case OperationType::Merge: return "merge";
        case OperationType::Rebase: return "rebase";
        case OperationType::Undo: return "undo";
    }
    return "unknown";
}

std::optional<OperationType> operationTypeFromString(std::string_view name) {
    if (name == "entity_create") return OperationType::EntityCreate;
    if (name == "entity_modify") return OperationType::EntityModify;
    if (name == "entity_delete") return OperationType::EntityDelete;
    if (name == "constraint_apply") return OperationType::ConstraintApply;
    if (name == "constraint_remove") return OperationType::ConstraintRemove;
    if (name == "merge") return OperationType::Merge;
    if (name == "rebase") return OperationType::Rebase;
    if (name == "undo") return OperationType::Undo;
    return std::nullopt;
}

} // namespace agentcad::app

namespace agentcad::app::history {

Q_LOGGING_CATEGORY(logHistory, "agentcad.app.history")

OperationLog::OperationLog(core::model::WorkspaceID workspaceId)
    : workspaceId_(std::move(workspaceId)) {
}

const OperationRecord& OperationLog::append(OperationRecord record) {
    record.sequence = nextSequence();
    record.workspaceId = workspaceId_;
    if (record.opId.empty()) {
        record.opId = QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
    }
    if (record.type == OperationType::Undo && !record.reference.empty()) {
        reverted_.insert(record.reference);
    }

    qCDebug(logHistory) << "append" << workspaceId_.c_str()
                        << "seq=" << record.sequence
                        << "type=" << operationTypeToString(record.type).c_str()
                        << "op=" << record.opId.c_str()
                        << "entities=" << record.entityIds.size();

    entries_.push_back(std::move(record));
    return entries_.back();
}

core::model::Sequence OperationLog::headSequence() const {
    return entries_.empty() ? 0 : entries_.back().sequence;
}

core::model::OperationID OperationLog::headOperationId() const {
    return entries_.empty() ? core::model::OperationID{} : entries_.back().opId;
}

std::size_t OperationLog::countSince(core::model::Sequence after) const {
    std::size_t count = 0;
    for (auto it = entries_.rbegin(); it != entries_.rend() && it->sequence > after; ++it) {
        ++count;
    }
    return count;
}

const OperationRecord* OperationLog::find(const core::model::OperationID& opId) const {
    for (const auto& entry : entries_) {
        if (entry.opId == opId) {
            return &entry;
        }
    }
    return nullptr;
}

const OperationRecord* OperationLog::lastUndoable() const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->type == OperationType::Rebase) {
            break;
        }
        if (it->type == OperationType::Undo) {
            continue;
        }
        if (reverted_.count(it->opId) != 0) {
            continue;
        }
        return &*it;
    }
    return nullptr;
}

bool OperationLog::isReverted(const core::model::OperationID& opId) const {
    return reverted_.count(opId) != 0;
}

} // namespace agentcad::app::history
