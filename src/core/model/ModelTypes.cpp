#include "ModelTypes.h"

#include <QDateTime>
#include <QString>

namespace agentcad::core::model {

std::string entityTypeToString(EntityType type) {
    switch (type) {
        case EntityType::Point: return "point";
        case EntityType::Line: return "line";
        case EntityType::Circle: return "circle";
        case EntityType::Arc: return "arc";
        case EntityType::Sketch: return "sketch";
        case EntityType::Solid: return "solid";
    }
    return "unknown";
}

std::optional<EntityType> entityTypeFromString(std::string_view name) {
    if (name == "point") return EntityType::Point;
    if (name == "line") return EntityType::Line;
    if (name == "circle") return EntityType::Circle;
    if (name == "arc") return EntityType::Arc;
    if (name == "sketch") return EntityType::Sketch;
    if (name == "solid") return EntityType::Solid;
    return std::nullopt;
}

int entityDegreesOfFreedom(EntityType type) {
    switch (type) {
        case EntityType::Point:
            return 2;   // x, y
        case EntityType::Line:
            return 4;   // two endpoints
        case EntityType::Circle:
            return 3;   // center + radius
        case EntityType::Arc:
            return 5;   // center + radius + start/end angles
        case EntityType::Sketch:
        case EntityType::Solid:
            return 0;
    }
    return 0;
}

bool isCurved(EntityType type) {
    return type == EntityType::Circle || type == EntityType::Arc;
}

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::EntityNotFound: return "EntityNotFound";
        case ErrorKind::InvalidConstraint: return "InvalidConstraint";
        case ErrorKind::ConstraintConflict: return "ConstraintConflict";
        case ErrorKind::WorkspaceConflict: return "WorkspaceConflict";
        case ErrorKind::BaseNotFound: return "BaseNotFound";
        case ErrorKind::AlreadyLocked: return "AlreadyLocked";
        case ErrorKind::InternalSolverError: return "InternalSolverError";
        case ErrorKind::WorkspaceNotFound: return "WorkspaceNotFound";
        case ErrorKind::InvalidRequest: return "InvalidRequest";
    }
    return "Unknown";
}

std::string timestampToIso(const Timestamp& ts) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
    return QDateTime::fromMSecsSinceEpoch(ms).toUTC().toString(Qt::ISODateWithMs).toStdString();
}

std::optional<Timestamp> timestampFromIso(const std::string& text) {
    const QDateTime parsed = QDateTime::fromString(QString::fromStdString(text), Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        return std::nullopt;
    }
    return Timestamp(std::chrono::milliseconds(parsed.toMSecsSinceEpoch()));
}

} // namespace agentcad::core::model
