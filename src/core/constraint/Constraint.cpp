#include "Constraint.h"

#include <QJsonArray>
#include <QUuid>

#include <algorithm>
#include <cmath>

namespace agentcad::core::constraint {

namespace {

std::optional<double> firstOf(const model::ParameterMap& parameters, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = parameters.find(key);
        if (it != parameters.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

bool near(double a, double b, double tolerance) {
    return std::abs(a - b) <= tolerance;
}

/// Angle value compatible with parallel (0 or 180 degrees)
bool parallelAngle(double degrees, double tolerance) {
    return near(degrees, 0.0, tolerance) || near(degrees, 180.0, tolerance);
}

bool isPair(const Constraint& a, const Constraint& b, ConstraintType first, ConstraintType second) {
    return (a.type() == first && b.type() == second) || (a.type() == second && b.type() == first);
}

} // namespace

ConstraintType typeOf(const ConstraintKind& kind) {
    return std::visit([](const auto& k) { return std::decay_t<decltype(k)>::kType; }, kind);
}

std::string constraintTypeToString(ConstraintType type) {
    switch (type) {
        case ConstraintType::Coincident: return "coincident";
        case ConstraintType::Parallel: return "parallel";
        case ConstraintType::Perpendicular: return "perpendicular";
        case ConstraintType::Tangent: return "tangent";
        case ConstraintType::Distance: return "distance";
        case ConstraintType::Angle: return "angle";
        case ConstraintType::Radius: return "radius";
        case ConstraintType::Horizontal: return "horizontal";
        case ConstraintType::Vertical: return "vertical";
        case ConstraintType::Fixed: return "fixed";
        case ConstraintType::Concentric: return "concentric";
        case ConstraintType::Equal: return "equal";
    }
    return "unknown";
}

std::optional<ConstraintType> constraintTypeFromString(std::string_view name) {
    if (name == "coincident") return ConstraintType::Coincident;
    if (name == "parallel") return ConstraintType::Parallel;
    if (name == "perpendicular") return ConstraintType::Perpendicular;
    if (name == "tangent") return ConstraintType::Tangent;
    if (name == "distance") return ConstraintType::Distance;
    if (name == "angle") return ConstraintType::Angle;
    if (name == "radius") return ConstraintType::Radius;
    if (name == "horizontal") return ConstraintType::Horizontal;
    if (name == "vertical") return ConstraintType::Vertical;
    if (name == "fixed") return ConstraintType::Fixed;
    if (name == "concentric") return ConstraintType::Concentric;
    if (name == "equal") return ConstraintType::Equal;
    return std::nullopt;
}

std::string constraintStatusToString(ConstraintStatus status) {
    switch (status) {
        case ConstraintStatus::Satisfied: return "satisfied";
        case ConstraintStatus::Violated: return "violated";
        case ConstraintStatus::Redundant: return "redundant";
    }
    return "violated";
}

std::optional<ConstraintStatus> constraintStatusFromString(std::string_view name) {
    if (name == "satisfied") return ConstraintStatus::Satisfied;
    if (name == "violated") return ConstraintStatus::Violated;
    if (name == "redundant") return ConstraintStatus::Redundant;
    return std::nullopt;
}

int degreesRemoved(ConstraintType type) {
    switch (type) {
        case ConstraintType::Coincident:
        case ConstraintType::Concentric:
        case ConstraintType::Fixed:
            return 2;
        case ConstraintType::Parallel:
        case ConstraintType::Perpendicular:
        case ConstraintType::Tangent:
        case ConstraintType::Distance:
        case ConstraintType::Angle:
        case ConstraintType::Radius:
        case ConstraintType::Horizontal:
        case ConstraintType::Vertical:
        case ConstraintType::Equal:
            return 1;
    }
    return 0;
}

int entityArity(ConstraintType type) {
    switch (type) {
        case ConstraintType::Radius:
        case ConstraintType::Horizontal:
        case ConstraintType::Vertical:
        case ConstraintType::Fixed:
            return 1;
        case ConstraintType::Distance:
            return 0;   // line length, or between two entities
        case ConstraintType::Coincident:
        case ConstraintType::Parallel:
        case ConstraintType::Perpendicular:
        case ConstraintType::Tangent:
        case ConstraintType::Angle:
        case ConstraintType::Concentric:
        case ConstraintType::Equal:
            return 2;
    }
    return 2;
}

ToleranceUnit toleranceUnit(ConstraintType type) {
    switch (type) {
        case ConstraintType::Parallel:
        case ConstraintType::Perpendicular:
        case ConstraintType::Angle:
            return ToleranceUnit::Angle;
        case ConstraintType::Coincident:
        case ConstraintType::Tangent:
        case ConstraintType::Distance:
        case ConstraintType::Radius:
        case ConstraintType::Horizontal:
        case ConstraintType::Vertical:
        case ConstraintType::Fixed:
        case ConstraintType::Concentric:
        case ConstraintType::Equal:
            return ToleranceUnit::Length;
    }
    return ToleranceUnit::Length;
}

std::optional<double> dimensionalValue(const ConstraintKind& kind) {
    if (const auto* d = std::get_if<kinds::Distance>(&kind)) {
        return d->value;
    }
    if (const auto* a = std::get_if<kinds::Angle>(&kind)) {
        return a->degrees;
    }
    if (const auto* r = std::get_if<kinds::Radius>(&kind)) {
        return r->value;
    }
    return std::nullopt;
}

std::optional<ConstraintKind> makeKind(ConstraintType type,
                                       const model::ParameterMap& parameters,
                                       std::string& errorMessage) {
    for (const auto& [key, value] : parameters) {
        if (!std::isfinite(value)) {
            errorMessage = "Parameter '" + key + "' must be finite";
            return std::nullopt;
        }
    }

    switch (type) {
        case ConstraintType::Coincident: return kinds::Coincident{};
        case ConstraintType::Parallel: return kinds::Parallel{};
        case ConstraintType::Perpendicular: return kinds::Perpendicular{};
        case ConstraintType::Tangent: return kinds::Tangent{};
        case ConstraintType::Horizontal: return kinds::Horizontal{};
        case ConstraintType::Vertical: return kinds::Vertical{};
        case ConstraintType::Concentric: return kinds::Concentric{};
        case ConstraintType::Equal: return kinds::Equal{};

        case ConstraintType::Distance: {
            auto value = firstOf(parameters, {"value", "distance"});
            if (!value) {
                errorMessage = "Distance constraint requires a 'distance' value";
                return std::nullopt;
            }
            if (*value < 0.0) {
                errorMessage = "Distance must be non-negative";
                return std::nullopt;
            }
            return kinds::Distance{*value};
        }
        case ConstraintType::Angle: {
            auto value = firstOf(parameters, {"value", "angle"});
            if (!value) {
                errorMessage = "Angle constraint requires an 'angle' value in degrees";
                return std::nullopt;
            }
            if (*value < 0.0 || *value > 180.0) {
                errorMessage = "Angle must be within [0, 180] degrees";
                return std::nullopt;
            }
            return kinds::Angle{*value};
        }
        case ConstraintType::Radius: {
            auto value = firstOf(parameters, {"value", "radius"});
            if (!value) {
                errorMessage = "Radius constraint requires a 'radius' value";
                return std::nullopt;
            }
            if (*value <= 0.0) {
                errorMessage = "Radius must be positive";
                return std::nullopt;
            }
            return kinds::Radius{*value};
        }
        case ConstraintType::Fixed: {
            auto x = firstOf(parameters, {"x"});
            auto y = firstOf(parameters, {"y"});
            if (!x || !y) {
                errorMessage = "Fixed constraint requires 'x' and 'y'";
                return std::nullopt;
            }
            return kinds::Fixed{*x, *y};
        }
    }
    errorMessage = "Unknown constraint type";
    return std::nullopt;
}

model::ParameterMap kindParameters(const ConstraintKind& kind) {
    model::ParameterMap params;
    if (const auto* d = std::get_if<kinds::Distance>(&kind)) {
        params["distance"] = d->value;
    } else if (const auto* a = std::get_if<kinds::Angle>(&kind)) {
        params["angle"] = a->degrees;
    } else if (const auto* r = std::get_if<kinds::Radius>(&kind)) {
        params["radius"] = r->value;
    } else if (const auto* f = std::get_if<kinds::Fixed>(&kind)) {
        params["x"] = f->x;
        params["y"] = f->y;
    }
    return params;
}

bool Constraint::references(const EntityID& entityId) const {
    return std::find(entityIds.begin(), entityIds.end(), entityId) != entityIds.end();
}

bool Constraint::sameEntitySet(const Constraint& other) const {
    auto lhs = entityIds;
    auto rhs = other.entityIds;
    std::sort(lhs.begin(), lhs.end());
    std::sort(rhs.begin(), rhs.end());
    return lhs == rhs;
}

void Constraint::serialize(QJsonObject& json) const {
    json["id"] = QString::fromStdString(id);
    json["workspace"] = QString::fromStdString(workspaceId);
    json["type"] = QString::fromStdString(constraintTypeToString(type()));

    QJsonArray entities;
    for (const auto& entityId : entityIds) {
        entities.append(QString::fromStdString(entityId));
    }
    json["entities"] = entities;

    QJsonObject params;
    for (const auto& [key, value] : kindParameters(kind)) {
        params[QString::fromStdString(key)] = value;
    }
    json["parameters"] = params;

    json["tolerance"] = tolerance;
    json["status"] = QString::fromStdString(constraintStatusToString(status));
    json["dofRemoved"] = dofRemoved;
    json["expected"] = expectedValue;
    json["actual"] = actualValue;
    json["createdBy"] = QString::fromStdString(createdBy);
    json["createdAt"] = QString::fromStdString(model::timestampToIso(createdAt));
}

bool Constraint::deserialize(const QJsonObject& json) {
    auto parsedType = constraintTypeFromString(json["type"].toString().toStdString());
    auto parsedStatus = constraintStatusFromString(json["status"].toString().toStdString());
    if (!json["id"].isString() || !parsedType || !parsedStatus || !json["entities"].isArray()) {
        return false;
    }

    model::ParameterMap params;
    const QJsonObject paramsJson = json["parameters"].toObject();
    for (auto it = paramsJson.begin(); it != paramsJson.end(); ++it) {
        params[it.key().toStdString()] = it.value().toDouble();
    }
    std::string error;
    auto parsedKind = makeKind(*parsedType, params, error);
    if (!parsedKind) {
        return false;
    }

    Constraint parsed;
    parsed.id = json["id"].toString().toStdString();
    parsed.workspaceId = json["workspace"].toString().toStdString();
    parsed.kind = *parsedKind;
    for (const auto& value : json["entities"].toArray()) {
        parsed.entityIds.push_back(value.toString().toStdString());
    }
    parsed.tolerance = json["tolerance"].toDouble(model::constants::kDefaultLengthTolerance);
    parsed.status = *parsedStatus;
    parsed.dofRemoved = json["dofRemoved"].toInt();
    parsed.expectedValue = json["expected"].toDouble();
    parsed.actualValue = json["actual"].toDouble();
    parsed.createdBy = json["createdBy"].toString().toStdString();
    if (auto createdAt = model::timestampFromIso(json["createdAt"].toString().toStdString())) {
        parsed.createdAt = *createdAt;
    }

    *this = std::move(parsed);
    return true;
}

bool sameDefinition(const Constraint& a, const Constraint& b, double tolerance) {
    if (a.type() != b.type() || !a.sameEntitySet(b)) {
        return false;
    }
    const auto lhs = kindParameters(a.kind);
    const auto rhs = kindParameters(b.kind);
    for (const auto& [key, value] : lhs) {
        auto it = rhs.find(key);
        if (it == rhs.end() || !near(value, it->second, tolerance)) {
            return false;
        }
    }
    return true;
}

bool contradicts(const Constraint& a, const Constraint& b) {
    if (!a.sameEntitySet(b)) {
        return false;
    }
    const double tolerance = std::max(a.tolerance, b.tolerance);

    if (isPair(a, b, ConstraintType::Parallel, ConstraintType::Perpendicular) ||
        isPair(a, b, ConstraintType::Horizontal, ConstraintType::Vertical)) {
        return true;
    }

    if (a.type() == b.type()) {
        if (auto fa = std::get_if<kinds::Fixed>(&a.kind)) {
            const auto& fb = std::get<kinds::Fixed>(b.kind);
            return std::hypot(fa->x - fb.x, fa->y - fb.y) > tolerance;
        }
        auto va = dimensionalValue(a.kind);
        auto vb = dimensionalValue(b.kind);
        return va && vb && !near(*va, *vb, tolerance);
    }

    const Constraint& angleSide = a.type() == ConstraintType::Angle ? a : b;
    const Constraint& otherSide = a.type() == ConstraintType::Angle ? b : a;
    if (const auto* angle = std::get_if<kinds::Angle>(&angleSide.kind)) {
        if (otherSide.type() == ConstraintType::Parallel) {
            return !parallelAngle(angle->degrees, tolerance);
        }
        if (otherSide.type() == ConstraintType::Perpendicular) {
            return !near(angle->degrees, 90.0, tolerance);
        }
    }

    const Constraint& distanceSide = a.type() == ConstraintType::Distance ? a : b;
    const Constraint& pinned = a.type() == ConstraintType::Distance ? b : a;
    if (const auto* distance = std::get_if<kinds::Distance>(&distanceSide.kind)) {
        if (pinned.type() == ConstraintType::Coincident || pinned.type() == ConstraintType::Concentric) {
            return distance->value > tolerance;
        }
    }
    return false;
}

ConstraintID generateConstraintId() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
}

} // namespace agentcad::core::constraint
