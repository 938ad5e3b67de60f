/**
 * @file ProtocolJson.h
 * @brief JSON encoding of model service results for the agent protocol
 */

#pragma once

#include "../app/ModelService.h"

#include <QJsonArray>
#include <QJsonObject>

namespace agentcad::io {

/**
 * @brief Result payloads, keyed the way agents read them (snake_case)
 *
 * Entities and constraints embed their own serialized form.
 */
class ProtocolJson {
public:
    static QJsonObject entity(const core::model::Entity& entity);
    static QJsonObject constraint(const core::constraint::Constraint& constraint);
    static QJsonArray stringList(const std::vector<std::string>& values);
    static QJsonObject parameters(const core::model::ParameterMap& parameters);

    static QJsonObject entityResult(const app::EntityResult& result);
    static QJsonObject entityDeleteResult(const app::EntityDeleteResult& result);
    static QJsonObject propagation(const core::constraint::PropagationResult& propagation);

    static QJsonObject applyResult(const app::ConstraintApplyResult& result);
    static QJsonObject statusReport(const core::constraint::StatusReport& report);

    static QJsonObject workspace(const app::workspace::Workspace& workspace);
    static QJsonObject divergence(const app::workspace::DivergencePoint& divergence);
    static QJsonObject workspaceStatus(const app::workspace::StatusResult& status, const QString& historyHash);
    static QJsonObject conflict(const app::workspace::MergeConflict& conflict);
    static QJsonArray conflicts(const std::vector<app::workspace::MergeConflict>& conflicts);
    static QJsonObject mergeResult(const app::workspace::MergeResult& result);

    static QJsonObject undoResult(const app::UndoResult& result);
    static QJsonObject lock(const app::coordination::LeaseLock& lock);

private:
    ProtocolJson() = delete;
};

} // namespace agentcad::io
