/**
 * @file RequestDispatcher.cpp
 * @brief Implementation of request routing and parameter parsing
 */

#include "RequestDispatcher.h"
#include "HistoryIO.h"
#include "ProtocolJson.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>

#include <cmath>

namespace agentcad::io {

Q_LOGGING_CATEGORY(logDispatch, "agentcad.io.dispatch")

using core::model::ErrorKind;

namespace {

RpcResponse invalidParams(const QString& message) {
    RpcResponse response;
    response.error = RpcError{rpc::kInvalidParams, message, QJsonValue(QJsonValue::Null)};
    return response;
}

RpcResponse failure(ErrorKind kind, const std::string& message, QJsonValue data = QJsonValue(QJsonValue::Null)) {
    RpcResponse response;
    response.error = RpcError{RequestDispatcher::errorCode(kind), QString::fromStdString(message), std::move(data)};
    return response;
}

RpcResponse success(QJsonObject result) {
    RpcResponse response;
    response.result = std::move(result);
    return response;
}

bool requireString(const QJsonObject& params, const char* key, std::string& out, RpcResponse& error) {
    const QJsonValue value = params.value(QLatin1String(key));
    if (!value.isString() || value.toString().isEmpty()) {
        error = invalidParams(QStringLiteral("Missing or empty string parameter '%1'").arg(QLatin1String(key)));
        return false;
    }
    out = value.toString().toStdString();
    return true;
}

std::string optionalString(const QJsonObject& params, const char* key) {
    return params.value(QLatin1String(key)).toString().toStdString();
}

bool readStringList(const QJsonValue& value, const char* key, std::vector<std::string>& out, RpcResponse& error) {
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    if (!value.isArray()) {
        error = invalidParams(QStringLiteral("Parameter '%1' must be an array of strings").arg(QLatin1String(key)));
        return false;
    }
    for (const auto& item : value.toArray()) {
        if (!item.isString()) {
            error = invalidParams(QStringLiteral("Parameter '%1' must be an array of strings").arg(QLatin1String(key)));
            return false;
        }
        out.push_back(item.toString().toStdString());
    }
    return true;
}

bool readParameters(const QJsonValue& value, core::model::ParameterMap& out, RpcResponse& error) {
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    if (!value.isObject()) {
        error = invalidParams(QStringLiteral("Parameter 'parameters' must be an object of numbers"));
        return false;
    }
    const QJsonObject object = value.toObject();
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (!it.value().isDouble() || !std::isfinite(it.value().toDouble())) {
            error = invalidParams(QStringLiteral("Parameter '%1' must be a finite number").arg(it.key()));
            return false;
        }
        out[it.key().toStdString()] = it.value().toDouble();
    }
    return true;
}

std::string agentOf(const QJsonObject& params) {
    return optionalString(params, "agent");
}

app::coordination::ResourceKey resourceOf(const QJsonObject& params) {
    return {optionalString(params, "resource_type"), optionalString(params, "resource_name")};
}

} // namespace

RequestDispatcher::RequestDispatcher(app::ModelService& service)
    : m_service(service) {
    m_handlers = {
        {QStringLiteral("entity.create"), &RequestDispatcher::entityCreate},
        {QStringLiteral("entity.modify"), &RequestDispatcher::entityModify},
        {QStringLiteral("entity.delete"), &RequestDispatcher::entityDelete},
        {QStringLiteral("entity.query"), &RequestDispatcher::entityQuery},
        {QStringLiteral("entity.list"), &RequestDispatcher::entityList},
        {QStringLiteral("constraint.apply"), &RequestDispatcher::constraintApply},
        {QStringLiteral("constraint.remove"), &RequestDispatcher::constraintRemove},
        {QStringLiteral("constraint.status"), &RequestDispatcher::constraintStatus},
        {QStringLiteral("workspace.create"), &RequestDispatcher::workspaceCreate},
        {QStringLiteral("workspace.status"), &RequestDispatcher::workspaceStatus},
        {QStringLiteral("workspace.list"), &RequestDispatcher::workspaceList},
        {QStringLiteral("workspace.delete"), &RequestDispatcher::workspaceDelete},
        {QStringLiteral("workspace.merge"), &RequestDispatcher::workspaceMerge},
        {QStringLiteral("history.list"), &RequestDispatcher::historyList},
        {QStringLiteral("history.undo"), &RequestDispatcher::historyUndo},
        {QStringLiteral("lock.acquire"), &RequestDispatcher::lockAcquire},
        {QStringLiteral("lock.release"), &RequestDispatcher::lockRelease},
        {QStringLiteral("lock.status"), &RequestDispatcher::lockStatus},
    };
}

int RequestDispatcher::errorCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::EntityNotFound: return rpc::kEntityNotFound;
        case ErrorKind::ConstraintConflict: return rpc::kConstraintConflict;
        case ErrorKind::InvalidConstraint: return rpc::kInvalidConstraint;
        case ErrorKind::WorkspaceConflict: return rpc::kWorkspaceConflict;
        case ErrorKind::BaseNotFound: return rpc::kBaseNotFound;
        case ErrorKind::AlreadyLocked: return rpc::kAlreadyLocked;
        case ErrorKind::WorkspaceNotFound: return rpc::kWorkspaceNotFound;
        case ErrorKind::InvalidRequest: return rpc::kInvalidParams;
        case ErrorKind::InternalSolverError:
        case ErrorKind::None:
            return rpc::kInternalError;
    }
    return rpc::kInternalError;
}

QByteArray RequestDispatcher::handleLine(const QByteArray& line) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);

    QJsonObject response;
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qCWarning(logDispatch) << "Unparseable request:" << parseError.errorString();
        QJsonObject error;
        error["code"] = rpc::kParseError;
        error["message"] = parseError.error != QJsonParseError::NoError
                               ? parseError.errorString()
                               : QStringLiteral("Request must be a JSON object");
        response["id"] = QJsonValue(QJsonValue::Null);
        response["error"] = error;
    } else {
        response = handle(doc.object());
    }
    return QJsonDocument(response).toJson(QJsonDocument::Compact);
}

QJsonObject RequestDispatcher::handle(const QJsonObject& request) {
    QJsonObject response;
    response["id"] = request.contains("id") ? request.value("id") : QJsonValue(QJsonValue::Null);

    RpcResponse outcome;
    const QJsonValue method = request.value("method");
    const QJsonValue params = request.value("params");
    if (!method.isString()) {
        outcome = invalidParams(QStringLiteral("Request 'method' must be a string"));
    } else if (!params.isUndefined() && !params.isNull() && !params.isObject()) {
        outcome = invalidParams(QStringLiteral("Request 'params' must be an object"));
    } else {
        outcome = call(method.toString(), params.toObject());
    }

    if (outcome.error) {
        QJsonObject error;
        error["code"] = outcome.error->code;
        error["message"] = outcome.error->message;
        if (!outcome.error->data.isNull()) {
            error["data"] = outcome.error->data;
        }
        response["error"] = error;
    } else {
        response["result"] = outcome.result;
    }
    return response;
}

RpcResponse RequestDispatcher::call(const QString& method, const QJsonObject& params) {
    auto it = m_handlers.find(method);
    if (it == m_handlers.end()) {
        RpcResponse response;
        response.error = RpcError{rpc::kMethodNotFound,
                                  QStringLiteral("Unknown method: %1").arg(method),
                                  QJsonValue(QJsonValue::Null)};
        return response;
    }

    RpcResponse response = (this->*(it->second))(params);
    if (response.error) {
        qCDebug(logDispatch) << method << "failed" << response.error->code << response.error->message;
    } else {
        qCDebug(logDispatch) << method << "ok";
    }
    return response;
}

//------------------------------------------------------------------------------
// Entities
//------------------------------------------------------------------------------

RpcResponse RequestDispatcher::entityCreate(const QJsonObject& params) {
    RpcResponse error;
    std::string workspaceId;
    std::string typeName;
    core::model::ParameterMap parameters;
    std::vector<std::string> parents;
    if (!requireString(params, "workspace", workspaceId, error) || !requireString(params, "type", typeName, error)
        || !readParameters(params.value("parameters"), parameters, error)
        || !readStringList(params.value("parents"), "parents", parents, error)) {
        return error;
    }
    const auto type = core::model::entityTypeFromString(typeName);
    if (!type) {
        return invalidParams(QStringLiteral("Unknown entity type: %1").arg(QString::fromStdString(typeName)));
    }

    const auto result = m_service.createEntity(workspaceId, *type, parameters, parents, agentOf(params));
    if (!result.success) {
        return failure(result.error, result.errorMessage);
    }
    return success(ProtocolJson::entityResult(result));
}

RpcResponse RequestDispatcher::entityModify(const QJsonObject& params) {
    RpcResponse error;
    std::string workspaceId;
    std::string entityId;
    core::model::ParameterMap parameters;
    if (!requireString(params, "workspace", workspaceId, error) || !requireString(params, "entity_id", entityId, error)
        || !readParameters(params.value("parameters"), parameters, error)) {
        return error;
    }

    const auto result = m_service.modifyEntity(workspaceId, entityId, parameters, agentOf(params));
    if (!result.success) {
        return failure(result.error, result.errorMessage);
    }
    return success(ProtocolJson::entityResult(result));
}

RpcResponse RequestDispatcher::entityDelete(const QJsonObject& params) {
    RpcResponse error;
    std::string workspaceId;
    std::string entityId;
    if (!requireString(params, "workspace", workspaceId, error) || !requireString(params, "entity_id", entityId, error)) {
        return error;
    }

    const auto result = m_service.deleteEntity(workspaceId, entityId, agentOf(params));
    if (!result.success) {
        return failure(result.error, result.errorMessage);
    }
    return success(ProtocolJson::entityDeleteResult(result));
}

RpcResponse RequestDispatcher::entityQuery(const QJsonObject& params) {
    RpcResponse error;
    std::string workspaceId;
    std::string entityId;
    if (!requireString(params, "workspace", workspaceId, error) || !requireString(params, "entity_id", entityId, error)) {
        return error;
    }

    const auto result = m_service.queryEntity(workspaceId, entityId);
    if (!result.success) {
        return failure(result.error, result.errorMessage);
    }
    return success(ProtocolJson::entityResult(result));
}

RpcResponse RequestDispatcher::entityList(const QJsonObject& params) {
    RpcResponse error;
    std::string workspaceId;
    if (!requireString(params, "workspace", workspaceId, error)) {
        return error;
    }
    std::optional<core::model::EntityType> type;
    const std::string typeName = optionalString(params, "type");
    if (!typeName.empty()) {
        type = core::model::entityTypeFromString(typeName);
        if (!type) {
            return invalidParams(QStringLiteral("Unknown entity type: %1").arg(QString::fromStdString(typeName)));
        }
    }

    const auto result = m_service.listEntities(workspaceId, type);
    if (!result.success) {
        return failure(result.error, result.errorMessage);
    }
    QJsonArray entities;
    for (const auto& entity : result.entities) {
        entities.append(ProtocolJson::entity(entity));
    }
    QJsonObject json;
    json["entities"] = entities;
    json["count"] = static_cast<qint64>(entities.size());
    return success(json);
}

//------------------------------------------------------------------------------
// Constraints
//------------------------------------------------------------------------------

RpcResponse RequestDispatcher::constraintApply(const QJsonObject& params) {
    RpcResponse error;
    std::string workspaceId;
    std::string typeName;
    core::constraint::ConstraintRequest request;
    if (!requireString(params, "workspace", workspaceId, error) || !requireString(params, "type", typeName, error)
        || !readStringList(params.value("entities"), "entities", request.entityIds, error)
        || !readParameters(params.value("parameters"), request.parameters, error)) {
        return error;
    }
    const auto type = core::constraint::constraintTypeFromString(typeName);
    if (!type) {
        return failure(ErrorKind::InvalidConstraint, "Unknown constraint type: " + typeName);
    }
    request.type = *type;
    const QJsonValue tolerance = params.value("tolerance");
    if (tolerance.isDouble()) {
        request.tolerance = tolerance.toDouble();
    } else if (!tolerance.isUndefined() && !tolerance.isNull()) {
        return invalidParams(QStringLiteral("Parameter 'tolerance' must be a number"));
    }
    request.agentId = agentOf(params);

    const auto result = m_service.applyConstraint(workspaceId, request);
    const auto& apply = result.apply;
    if (!apply.success) {
        QJsonObject data;
        if (apply.error == ErrorKind::ConstraintConflict) {
            data["conflicting_constraints"] = ProtocolJson::stringList(apply.conflictingConstraints);
            data["component"] = ProtocolJson::stringList(apply.component);
            data["component_dof"] = apply.componentDof;
            data["dof_remaining"] = apply.dofRemaining;
        }
        return failure(apply.error, apply.errorMessage, data.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(data));
    }
    return success(ProtocolJson::applyResult(result));
}

RpcResponse RequestDispatcher::constraintRemove(const QJsonObject& params) {
    RpcResponse error;
    std::string workspaceId;
    std::string constraintId;
    if (!requireString(params, "workspace", workspaceId, error)
        || !requireString(params, "constraint_id", constraintId, error)) {
        return error;
    }

    const auto result = m_service.removeConstraint(workspaceId, constraintId, agentOf(params));
    if (!result.success) {
        return failure(result.error, result.errorMessage);
    }
    QJsonObject json;
    json["removed"] = result.removed ? QJsonValue(ProtocolJson::constraint(*result.removed)) : QJsonValue(QJsonValue::Null);
    json["operation_id"] = QString::fromStdString(result.operationId);
    return success(json);
}

RpcResponse RequestDispatcher::constraintStatus(const QJsonObject& params) {
    RpcResponse error;
    std::string workspaceId;
    if (!requireString(params, "workspace", workspaceId, error)) {
        return error;
    }
    std::optional<core::model::EntityID> scope;
    const std::string scopeId = optionalString(params, "scope");
    if (!scopeId.empty()) {
        scope = scopeId;
    }

    const auto result = m_service.constraintStatus(workspaceId, scope);
    if (!result.success) {
        return failure(result.error, result.errorMessage);
    }
    return success(ProtocolJson::statusReport(result.report));
}

//------------------------------------------------------------------------------
// Workspaces
//------------------------------------------------------------------------------

RpcResponse RequestDispatcher::workspaceCreate(const QJsonObject& params) {
    RpcResponse error;
    std::string name;
    if (!requireString(params, "name", name, error)) {
        return error;
    }
    std::string base = optionalString(params, "base");
    if (base.empty()) {
        base = std::string(core::model::constants::kRootWorkspaceId);
    }

    const auto result = m_service.createWorkspace(name, base, agentOf(params));
    if (!result.success) {
        return failure(result.error, result.errorMessage);
    }
    return success(ProtocolJson::workspace(*result.workspace));
}

RpcResponse RequestDispatcher::workspaceStatus(const QJsonObject& params) {
    RpcResponse error;
    std::string workspaceId;
    if (!requireString(params, "workspace", workspaceId, error)) {
        return error;
    }

    const auto status = m_service.workspaceStatus(workspaceId);
    if (!status.success) {
        return failure(status.error, status.errorMessage);
    }
    const auto history = m_service.history(workspaceId);
    if (!history.success) {
        return failure(history.error, history.errorMessage);
    }
    return success(ProtocolJson::workspaceStatus(status, HistoryIO::computeOpsHash(history.entries)));
}

RpcResponse RequestDispatcher::workspaceList(const QJsonObject& /*params*/) {
    const auto result = m_service.listWorkspaces();
    if (!result.success) {
        return failure(result.error, result.errorMessage);
    }
    QJsonArray workspaces;
    for (const auto& ws : result.workspaces) {
        workspaces.append(ProtocolJson::workspace(ws));
    }
    QJsonObject json;
    json["workspaces"] = workspaces;
    return success(json);
}

RpcResponse RequestDispatcher::workspaceDelete(const QJsonObject& params) {
    RpcResponse error;
    std::string workspaceId;
    if (!requireString(params, "workspace", workspaceId, error)) {
        return error;
    }

    const auto result = m_service.deleteWorkspace(workspaceId);
    if (!result.success) {
        return failure(result.error, result.errorMessage);
    }
    QJsonObject json;
    json["deleted"] = true;
    return success(json);
}

RpcResponse RequestDispatcher::workspaceMerge(const QJsonObject& params) {
    RpcResponse error;
    app::workspace::MergeRequest request;
    if (!requireString(params, "source", request.sourceId, error)
        || !requireString(params, "target", request.targetId, error)) {
        return error;
    }

    const std::string strategy = optionalString(params, "strategy");
    if (!strategy.empty()) {
        const auto parsed = app::workspace::mergeStrategyFromString(strategy);
        if (!parsed) {
            return invalidParams(QStringLiteral("Unknown merge strategy: %1").arg(QString::fromStdString(strategy)));
        }
        request.strategy = *parsed;
    }

    // {"<entity id>": "keep_source"} or {"<entity id>": {"resolution": "manual_merge", "parameters": {...}}}
    const QJsonValue resolutions = params.value("resolutions");
    if (resolutions.isObject()) {
        const QJsonObject object = resolutions.toObject();
        for (auto it = object.begin(); it != object.end(); ++it) {
            app::workspace::ConflictResolution resolution;
            QString choice;
            if (it.value().isString()) {
                choice = it.value().toString();
            } else if (it.value().isObject()) {
                const QJsonObject entry = it.value().toObject();
                choice = entry.value("resolution").toString();
                if (!readParameters(entry.value("parameters"), resolution.parameters, error)) {
                    return error;
                }
            }
            const auto parsed = app::workspace::resolutionFromString(choice.toStdString());
            if (!parsed) {
                return invalidParams(QStringLiteral("Invalid resolution for %1").arg(it.key()));
            }
            resolution.choice = *parsed;
            request.resolutions.emplace(it.key().toStdString(), std::move(resolution));
        }
    } else if (!resolutions.isUndefined() && !resolutions.isNull()) {
        return invalidParams(QStringLiteral("Parameter 'resolutions' must be an object"));
    }

    request.agentId = agentOf(params);
    request.sessionId = optionalString(params, "session");

    const auto result = m_service.merge(request);
    if (!result.success) {
        QJsonObject data;
        if (result.error == ErrorKind::WorkspaceConflict) {
            data["conflicts"] = ProtocolJson::conflicts(result.conflicts);
        } else if (result.error == ErrorKind::ConstraintConflict) {
            data["conflicting_constraints"] = ProtocolJson::stringList(result.conflictingConstraints);
        }
        return failure(result.error, result.errorMessage, data.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(data));
    }
    return success(ProtocolJson::mergeResult(result));
}

//------------------------------------------------------------------------------
// History
//------------------------------------------------------------------------------

RpcResponse RequestDispatcher::historyList(const QJsonObject& params) {
    RpcResponse error;
    std::string workspaceId;
    if (!requireString(params, "workspace", workspaceId, error)) {
        return error;
    }

    const auto result = m_service.history(workspaceId);
    if (!result.success) {
        return failure(result.error, result.errorMessage);
    }
    QJsonArray entries;
    for (const auto& entry : result.entries) {
        entries.append(HistoryIO::serializeOperation(entry));
    }
    QJsonObject json;
    json["entries"] = entries;
    json["count"] = static_cast<qint64>(entries.size());
    json["hash"] = HistoryIO::computeOpsHash(result.entries);
    return success(json);
}

RpcResponse RequestDispatcher::historyUndo(const QJsonObject& params) {
    RpcResponse error;
    std::string workspaceId;
    if (!requireString(params, "workspace", workspaceId, error)) {
        return error;
    }

    const auto result = m_service.undo(workspaceId, agentOf(params));
    if (!result.success) {
        return failure(result.error, result.errorMessage);
    }
    return success(ProtocolJson::undoResult(result));
}

//------------------------------------------------------------------------------
// Locks
//------------------------------------------------------------------------------

RpcResponse RequestDispatcher::lockAcquire(const QJsonObject& params) {
    const QJsonValue ttlValue = params.value("ttl");
    std::chrono::seconds ttl{0};
    if (ttlValue.isDouble()) {
        const double seconds = ttlValue.toDouble();
        if (!(seconds >= 1.0 && seconds <= static_cast<double>(app::coordination::kMaxLeaseTtl.count()))) {
            return invalidParams(QStringLiteral("Parameter 'ttl' must be between 1 and %1 seconds")
                                     .arg(static_cast<qint64>(app::coordination::kMaxLeaseTtl.count())));
        }
        ttl = std::chrono::seconds(static_cast<long long>(ttlValue.toDouble()));
    } else if (!ttlValue.isUndefined() && !ttlValue.isNull()) {
        return invalidParams(QStringLiteral("Parameter 'ttl' must be a number of seconds"));
    }

    const auto result = m_service.acquireLock(resourceOf(params), agentOf(params),
                                              optionalString(params, "session"), ttl);
    if (!result.success) {
        QJsonObject data;
        if (result.error == ErrorKind::AlreadyLocked && result.lock) {
            data["holder"] = QString::fromStdString(result.lock->holder);
            data["expires_at"] = QString::fromStdString(core::model::timestampToIso(result.lock->expiresAt));
        }
        return failure(result.error, result.errorMessage, data.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(data));
    }
    QJsonObject json;
    json["granted"] = true;
    json["renewed"] = result.renewed;
    json["lock"] = ProtocolJson::lock(*result.lock);
    return success(json);
}

RpcResponse RequestDispatcher::lockRelease(const QJsonObject& params) {
    const auto result = m_service.releaseLock(resourceOf(params), agentOf(params));
    if (!result.success) {
        return failure(result.error, result.errorMessage);
    }
    QJsonObject json;
    json["released"] = result.released;
    return success(json);
}

RpcResponse RequestDispatcher::lockStatus(const QJsonObject& params) {
    const auto result = m_service.lockStatus(resourceOf(params));
    if (!result.success) {
        return failure(result.error, result.errorMessage);
    }
    QJsonObject json;
    json["locked"] = result.lock.has_value();
    json["lock"] = result.lock ? QJsonValue(ProtocolJson::lock(*result.lock)) : QJsonValue(QJsonValue::Null);
    return success(json);
}

} // namespace agentcad::io
