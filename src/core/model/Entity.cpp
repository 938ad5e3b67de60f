#include "Entity.h"

#include <QJsonArray>
#include <QUuid>

#include <algorithm>
#include <cmath>
#include <set>

namespace agentcad::core::model {

double Entity::parameter(const std::string& key, double fallback) const {
    auto it = parameters.find(key);
    return it != parameters.end() ? it->second : fallback;
}

bool Entity::hasParent(const EntityID& parentId) const {
    return std::find(parentIds.begin(), parentIds.end(), parentId) != parentIds.end();
}

bool Entity::sameGeometry(const Entity& other) const {
    return type == other.type && parameters == other.parameters && parentIds == other.parentIds;
}

void Entity::serialize(QJsonObject& json) const {
    json["id"] = QString::fromStdString(id);
    json["workspace"] = QString::fromStdString(workspaceId);
    json["type"] = QString::fromStdString(entityTypeToString(type));
    json["version"] = static_cast<qint64>(version);
    json["createdBy"] = QString::fromStdString(createdBy);
    json["createdAt"] = QString::fromStdString(timestampToIso(createdAt));
    json["modifiedAt"] = QString::fromStdString(timestampToIso(modifiedAt));

    QJsonObject params;
    for (const auto& [key, value] : parameters) {
        params[QString::fromStdString(key)] = value;
    }
    json["parameters"] = params;

    QJsonArray parents;
    for (const auto& parentId : parentIds) {
        parents.append(QString::fromStdString(parentId));
    }
    json["parents"] = parents;
}

bool Entity::deserialize(const QJsonObject& json) {
    if (!json["id"].isString() || !json["type"].isString() || !json["parameters"].isObject()) {
        return false;
    }
    auto parsedType = entityTypeFromString(json["type"].toString().toStdString());
    if (!parsedType) {
        return false;
    }

    Entity parsed;
    parsed.id = json["id"].toString().toStdString();
    parsed.workspaceId = json["workspace"].toString().toStdString();
    parsed.type = *parsedType;
    parsed.version = static_cast<std::uint64_t>(json["version"].toInteger(1));
    parsed.createdBy = json["createdBy"].toString().toStdString();
    auto createdAt = timestampFromIso(json["createdAt"].toString().toStdString());
    auto modifiedAt = timestampFromIso(json["modifiedAt"].toString().toStdString());
    if (!createdAt || !modifiedAt) {
        return false;
    }
    parsed.createdAt = *createdAt;
    parsed.modifiedAt = *modifiedAt;

    const QJsonObject params = json["parameters"].toObject();
    for (auto it = params.begin(); it != params.end(); ++it) {
        if (!it.value().isDouble()) {
            return false;
        }
        parsed.parameters[it.key().toStdString()] = it.value().toDouble();
    }
    for (const auto& value : json["parents"].toArray()) {
        parsed.parentIds.push_back(value.toString().toStdString());
    }

    *this = std::move(parsed);
    return true;
}

const std::vector<std::string>& requiredParameters(EntityType type) {
    static const std::vector<std::string> kPoint{"x", "y"};
    static const std::vector<std::string> kLine{"x1", "y1", "x2", "y2"};
    static const std::vector<std::string> kCircle{"cx", "cy", "r"};
    static const std::vector<std::string> kArc{"cx", "cy", "r", "start", "end"};
    static const std::vector<std::string> kSketch{};
    static const std::vector<std::string> kSolid{"height"};

    switch (type) {
        case EntityType::Point: return kPoint;
        case EntityType::Line: return kLine;
        case EntityType::Circle: return kCircle;
        case EntityType::Arc: return kArc;
        case EntityType::Sketch: return kSketch;
        case EntityType::Solid: return kSolid;
    }
    return kSketch;
}

EntityValidation validateParameters(EntityType type, const ParameterMap& parameters) {
    const auto& required = requiredParameters(type);
    const std::set<std::string> allowed(required.begin(), required.end());

    for (const auto& key : required) {
        if (parameters.find(key) == parameters.end()) {
            return {false, "Missing parameter '" + key + "' for " + entityTypeToString(type)};
        }
    }
    for (const auto& [key, value] : parameters) {
        if (allowed.count(key) == 0) {
            return {false, "Unknown parameter '" + key + "' for " + entityTypeToString(type)};
        }
        if (!std::isfinite(value)) {
            return {false, "Parameter '" + key + "' must be finite"};
        }
    }

    auto at = [&](const char* key) { return parameters.at(key); };
    switch (type) {
        case EntityType::Line:
            if (std::hypot(at("x2") - at("x1"), at("y2") - at("y1")) < constants::kMinGeometrySize) {
                return {false, "Line endpoints must differ"};
            }
            break;
        case EntityType::Circle:
            if (at("r") <= 0.0) {
                return {false, "Radius must be positive"};
            }
            break;
        case EntityType::Arc:
            if (at("r") <= 0.0) {
                return {false, "Radius must be positive"};
            }
            if (at("start") == at("end")) {
                return {false, "Arc start and end angles must differ"};
            }
            break;
        case EntityType::Solid:
            if (at("height") <= 0.0) {
                return {false, "Extrude height must be positive"};
            }
            break;
        case EntityType::Point:
        case EntityType::Sketch:
            break;
    }
    return {};
}

EntityID generateEntityId(const WorkspaceID& workspaceId, EntityType type) {
    const QString uuid = QUuid::createUuid().toString(QUuid::Id128);
    return workspaceId + ":" + entityTypeToString(type) + "_" + uuid.left(8).toStdString();
}

} // namespace agentcad::core::model
