/**
 * @file OperationLog.h
 * @brief Append-only per-workspace operation log.
 */
#ifndef AGENTCAD_APP_HISTORY_OPERATIONLOG_H
#define AGENTCAD_APP_HISTORY_OPERATIONLOG_H

#include "../document/OperationRecord.h"

#include <set>
#include <vector>

namespace agentcad::app::history {

class OperationLog {
public:
    explicit OperationLog(core::model::WorkspaceID workspaceId);

    /**
     * @brief Append @p record as the next entry
     *
     * Assigns the sequence, the workspace and, when empty, a fresh operation id.
     */
    const OperationRecord& append(OperationRecord record);

    /// Sequence of the last entry (0 for an empty log)
    core::model::Sequence headSequence() const;

    /// Operation id of the last entry (empty for an empty log)
    core::model::OperationID headOperationId() const;

    /// Sequence the next append will receive
    core::model::Sequence nextSequence() const { return headSequence() + 1; }

    const std::vector<OperationRecord>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }

    /// Entries with sequence strictly greater than @p after
    std::size_t countSince(core::model::Sequence after) const;

    const OperationRecord* find(const core::model::OperationID& opId) const;

    /**
     * @brief Most recent entry that undo may revert
     *
     * Skips undo entries and anything already reverted. Nothing before a
     * rebase is undoable: that history has already been merged.
     */
    const OperationRecord* lastUndoable() const;

    bool isReverted(const core::model::OperationID& opId) const;

    const core::model::WorkspaceID& workspaceId() const { return workspaceId_; }

private:
    core::model::WorkspaceID workspaceId_;
    std::vector<OperationRecord> entries_;
    std::set<core::model::OperationID> reverted_;
};

} // namespace agentcad::app::history

#endif // AGENTCAD_APP_HISTORY_OPERATIONLOG_H
