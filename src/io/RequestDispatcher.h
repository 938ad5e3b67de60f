/**
 * @file RequestDispatcher.h
 * @brief JSON-lines request routing onto the model service
 */

#pragma once

#include "../app/ModelService.h"

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <map>
#include <optional>

namespace agentcad::io {

/**
 * @brief JSON-RPC style error: code, message and structured detail
 */
struct RpcError {
    int code = 0;
    QString message;
    QJsonValue data;
};

struct RpcResponse {
    QJsonObject result;
    std::optional<RpcError> error;
};

namespace rpc {
constexpr int kParseError = -32700;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kEntityNotFound = -32001;
constexpr int kConstraintConflict = -32002;
constexpr int kInvalidConstraint = -32004;
constexpr int kWorkspaceConflict = -32007;
constexpr int kBaseNotFound = -32013;
constexpr int kAlreadyLocked = -32014;
constexpr int kWorkspaceNotFound = -32015;
} // namespace rpc

/**
 * @brief Routes `{"id", "method", "params"}` requests to ModelService
 *
 * Every request is answered by exactly one response object carrying either
 * `result` or `error`.
 */
class RequestDispatcher {
public:
    explicit RequestDispatcher(app::ModelService& service);

    /// Handle one raw line; malformed JSON yields a parse error response
    QByteArray handleLine(const QByteArray& line);

    QJsonObject handle(const QJsonObject& request);

    /// Dispatch without the envelope
    RpcResponse call(const QString& method, const QJsonObject& params);

    static int errorCode(core::model::ErrorKind kind);

private:
    using Handler = RpcResponse (RequestDispatcher::*)(const QJsonObject&);

    RpcResponse entityCreate(const QJsonObject& params);
    RpcResponse entityModify(const QJsonObject& params);
    RpcResponse entityDelete(const QJsonObject& params);
    RpcResponse entityQuery(const QJsonObject& params);
    RpcResponse entityList(const QJsonObject& params);

    RpcResponse constraintApply(const QJsonObject& params);
    RpcResponse constraintRemove(const QJsonObject& params);
    RpcResponse constraintStatus(const QJsonObject& params);

    RpcResponse workspaceCreate(const QJsonObject& params);
    RpcResponse workspaceStatus(const QJsonObject& params);
    RpcResponse workspaceList(const QJsonObject& params);
    RpcResponse workspaceDelete(const QJsonObject& params);
    RpcResponse workspaceMerge(const QJsonObject& params);

    RpcResponse historyList(const QJsonObject& params);
    RpcResponse historyUndo(const QJsonObject& params);

    RpcResponse lockAcquire(const QJsonObject& params);
    RpcResponse lockRelease(const QJsonObject& params);
    RpcResponse lockStatus(const QJsonObject& params);

    app::ModelService& m_service;
    std::map<QString, Handler> m_handlers;
};

} // namespace agentcad::io
