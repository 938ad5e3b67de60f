/**
 * @file HistoryIO.cpp
 * @brief Implementation of operation history serialization
 */

#include "HistoryIO.h"
#include "../app/document/OperationRecord.h"

#include <QCryptographicHash>
#include <QJsonArray>
#include <QJsonDocument>

namespace agentcad::io {

using namespace app;

namespace {

QJsonValue entityToJson(const std::optional<core::model::Entity>& entity) {
    if (!entity) {
        return QJsonValue(QJsonValue::Null);
    }
    QJsonObject json;
    entity->serialize(json);
    return json;
}

QJsonValue constraintToJson(const std::optional<core::constraint::Constraint>& constraint) {
    if (!constraint) {
        return QJsonValue(QJsonValue::Null);
    }
    QJsonObject json;
    constraint->serialize(json);
    return json;
}

bool entityFromJson(const QJsonValue& value, std::optional<core::model::Entity>& out) {
    if (value.isNull() || value.isUndefined()) {
        out.reset();
        return true;
    }
    core::model::Entity entity;
    if (!value.isObject() || !entity.deserialize(value.toObject())) {
        return false;
    }
    out = std::move(entity);
    return true;
}

bool constraintFromJson(const QJsonValue& value, std::optional<core::constraint::Constraint>& out) {
    if (value.isNull() || value.isUndefined()) {
        out.reset();
        return true;
    }
    core::constraint::Constraint constraint;
    if (!value.isObject() || !constraint.deserialize(value.toObject())) {
        return false;
    }
    out = std::move(constraint);
    return true;
}

} // namespace

QJsonObject HistoryIO::serializeOperation(const OperationRecord& op) {
    QJsonObject json;

    json["opId"] = QString::fromStdString(op.opId);
    json["sequence"] = static_cast<qint64>(op.sequence);
    json["type"] = QString::fromStdString(operationTypeToString(op.type));
    json["workspace"] = QString::fromStdString(op.workspaceId);
    json["agent"] = QString::fromStdString(op.agentId);
    json["timestamp"] = QString::fromStdString(core::model::timestampToIso(op.timestamp));

    QJsonArray entityIds;
    for (const auto& id : op.entityIds) {
        entityIds.append(QString::fromStdString(id));
    }
    json["entities"] = entityIds;

    QJsonArray entityDeltas;
    for (const auto& delta : op.entityDeltas) {
        QJsonObject d;
        d["id"] = QString::fromStdString(delta.entityId);
        d["before"] = entityToJson(delta.before);
        d["after"] = entityToJson(delta.after);
        entityDeltas.append(d);
    }
    json["entityDeltas"] = entityDeltas;

    QJsonArray constraintDeltas;
    for (const auto& delta : op.constraintDeltas) {
        QJsonObject d;
        d["id"] = QString::fromStdString(delta.constraintId);
        d["before"] = constraintToJson(delta.before);
        d["after"] = constraintToJson(delta.after);
        constraintDeltas.append(d);
    }
    json["constraintDeltas"] = constraintDeltas;

    if (!op.reference.empty()) {
        json["reference"] = QString::fromStdString(op.reference);
    }
    return json;
}

bool HistoryIO::deserializeOperation(const QJsonObject& json, OperationRecord& op, QString& errorMessage) {
    if (!json["opId"].isString() || !json["type"].isString()) {
        errorMessage = QStringLiteral("Operation is missing opId or type");
        return false;
    }
    const auto type = operationTypeFromString(json["type"].toString().toStdString());
    if (!type) {
        errorMessage = QStringLiteral("Unknown operation type: %1").arg(json["type"].toString());
        return false;
    }

    op = OperationRecord{};
    op.opId = json["opId"].toString().toStdString();
    op.type = *type;
    op.sequence = static_cast<core::model::Sequence>(json["sequence"].toInteger());
    op.workspaceId = json["workspace"].toString().toStdString();
    op.agentId = json["agent"].toString().toStdString();
    if (auto ts = core::model::timestampFromIso(json["timestamp"].toString().toStdString())) {
        op.timestamp = *ts;
    }
    op.reference = json["reference"].toString().toStdString();

    for (const auto& value : json["entities"].toArray()) {
        op.entityIds.push_back(value.toString().toStdString());
    }

    for (const auto& value : json["entityDeltas"].toArray()) {
        const QJsonObject d = value.toObject();
        EntityDelta delta;
        delta.entityId = d["id"].toString().toStdString();
        if (!entityFromJson(d["before"], delta.before) || !entityFromJson(d["after"], delta.after)) {
            errorMessage = QStringLiteral("Malformed entity snapshot for %1").arg(d["id"].toString());
            return false;
        }
        op.entityDeltas.push_back(std::move(delta));
    }

    for (const auto& value : json["constraintDeltas"].toArray()) {
        const QJsonObject d = value.toObject();
        ConstraintDelta delta;
        delta.constraintId = d["id"].toString().toStdString();
        if (!constraintFromJson(d["before"], delta.before) || !constraintFromJson(d["after"], delta.after)) {
            errorMessage = QStringLiteral("Malformed constraint snapshot for %1").arg(d["id"].toString());
            return false;
        }
        op.constraintDeltas.push_back(std::move(delta));
    }
    return true;
}

QByteArray HistoryIO::toJsonLines(const std::vector<OperationRecord>& operations) {
    QByteArray out;
    for (const auto& op : operations) {
        out.append(QJsonDocument(serializeOperation(op)).toJson(QJsonDocument::Compact));
        out.append('\n');
    }
    return out;
}

QString HistoryIO::computeOpsHash(const std::vector<OperationRecord>& operations) {
    QCryptographicHash hash(QCryptographicHash::Sha256);

    for (const auto& op : operations) {
        QJsonObject opJson = serializeOperation(op);
        QJsonDocument doc(opJson);
        hash.addData(doc.toJson(QJsonDocument::Compact));
    }

    return QString::fromLatin1(hash.result().toHex());
}

} // namespace agentcad::io
