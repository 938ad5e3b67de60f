#include "ConstraintEvaluator.h"

#include <algorithm>
#include <cmath>

namespace agentcad::core::constraint {

using model::Entity;
using model::EntityType;

namespace {

Evaluation measured(double expected, double actual) {
    Evaluation eval;
    eval.valid = true;
    eval.expected = expected;
    eval.actual = actual;
    eval.residual = std::abs(actual - expected);
    return eval;
}

Evaluation failed(std::string message) {
    Evaluation eval;
    eval.errorMessage = std::move(message);
    return eval;
}

bool isLine(const Entity& e) {
    return e.type == EntityType::Line;
}

bool isPoint(const Entity& e) {
    return e.type == EntityType::Point;
}

bool isMeasurable(const Entity& e) {
    return isPoint(e) || isLine(e) || model::isCurved(e.type);
}

} // namespace

ConstraintEvaluator::ConstraintEvaluator(const geometry::GeometryEngine& engine)
    : engine_(engine) {
}

std::string ConstraintEvaluator::checkCompatibility(ConstraintType type, const std::vector<Entity>& entities) {
    const std::string name = constraintTypeToString(type);
    const int arity = entityArity(type);
    if (entities.empty() || entities.size() > 2) {
        return name + " takes 1 or 2 entities";
    }
    if (arity != 0 && static_cast<int>(entities.size()) != arity) {
        return name + " takes exactly " + std::to_string(arity) + (arity == 1 ? " entity" : " entities");
    }
    if (entities.size() == 2 && entities[0].id == entities[1].id) {
        return name + " requires two distinct entities";
    }

    const Entity& a = entities.front();
    const Entity& b = entities.back();
    bool ok = false;
    switch (type) {
        case ConstraintType::Coincident:
            ok = isPoint(a) && isPoint(b);
            break;
        case ConstraintType::Parallel:
        case ConstraintType::Perpendicular:
        case ConstraintType::Angle:
            ok = isLine(a) && isLine(b);
            break;
        case ConstraintType::Tangent:
            ok = (model::isCurved(a.type) && (isLine(b) || model::isCurved(b.type))) ||
                 (model::isCurved(b.type) && isLine(a));
            break;
        case ConstraintType::Distance:
            ok = entities.size() == 1 ? isLine(a) : (isMeasurable(a) && isMeasurable(b));
            break;
        case ConstraintType::Radius:
            ok = model::isCurved(a.type);
            break;
        case ConstraintType::Horizontal:
        case ConstraintType::Vertical:
            ok = isLine(a);
            break;
        case ConstraintType::Fixed:
            ok = isPoint(a);
            break;
        case ConstraintType::Concentric:
            ok = model::isCurved(a.type) && model::isCurved(b.type);
            break;
        case ConstraintType::Equal:
            ok = (isLine(a) && isLine(b)) || (model::isCurved(a.type) && model::isCurved(b.type));
            break;
    }
    if (ok) {
        return {};
    }

    std::string kinds;
    for (const auto& e : entities) {
        kinds += (kinds.empty() ? "" : ", ") + model::entityTypeToString(e.type);
    }
    return name + " cannot be applied to (" + kinds + ")";
}

Evaluation ConstraintEvaluator::evaluate(const Constraint& constraint, const std::vector<Entity>& entities) const {
    if (entities.size() != constraint.entityIds.size() || entities.empty()) {
        return failed("Entity list does not match constraint references");
    }
    const Entity& a = entities.front();
    const Entity& b = entities.back();

    switch (constraint.type()) {
        case ConstraintType::Coincident:
        case ConstraintType::Concentric: {
            auto d = engine_.distance(a, b);
            return d ? measured(0.0, *d) : failed("Distance undefined");
        }
        case ConstraintType::Parallel: {
            auto angle = engine_.angle(a, b);
            if (!angle) {
                return failed("Angle undefined");
            }
            return measured(0.0, std::min(*angle, 180.0 - *angle));
        }
        case ConstraintType::Perpendicular: {
            auto angle = engine_.angle(a, b);
            if (!angle) {
                return failed("Angle undefined");
            }
            return measured(90.0, std::min(*angle, 180.0 - *angle));
        }
        case ConstraintType::Angle: {
            auto angle = engine_.angle(a, b);
            if (!angle) {
                return failed("Angle undefined");
            }
            return measured(std::get<kinds::Angle>(constraint.kind).degrees, *angle);
        }
        case ConstraintType::Tangent:
            return evaluateTangent(a, b);
        case ConstraintType::Distance: {
            const double target = std::get<kinds::Distance>(constraint.kind).value;
            if (entities.size() == 1) {
                const auto props = engine_.evaluate(a);
                return props.valid ? measured(target, props.length) : failed(props.errorMessage);
            }
            auto d = engine_.distance(a, b);
            return d ? measured(target, *d) : failed("Distance undefined");
        }
        case ConstraintType::Radius: {
            const auto props = engine_.evaluate(a);
            if (!props.valid) {
                return failed(props.errorMessage);
            }
            return measured(std::get<kinds::Radius>(constraint.kind).value, props.radius);
        }
        case ConstraintType::Horizontal:
            return measured(0.0, std::abs(a.parameter("y2") - a.parameter("y1")));
        case ConstraintType::Vertical:
            return measured(0.0, std::abs(a.parameter("x2") - a.parameter("x1")));
        case ConstraintType::Fixed: {
            const auto& target = std::get<kinds::Fixed>(constraint.kind);
            return measured(0.0, std::hypot(a.parameter("x") - target.x, a.parameter("y") - target.y));
        }
        case ConstraintType::Equal:
            return evaluateEqual(a, b);
    }
    return failed("Unknown constraint type");
}

Evaluation ConstraintEvaluator::evaluateTangent(const Entity& a, const Entity& b) const {
    if (isLine(a) || isLine(b)) {
        const Entity& curve = isLine(a) ? b : a;
        const auto props = engine_.evaluate(curve);
        auto d = engine_.distance(a, b);
        if (!props.valid || !d) {
            return failed("Tangency undefined");
        }
        return measured(props.radius, *d);
    }

    const auto pa = engine_.evaluate(a);
    const auto pb = engine_.evaluate(b);
    auto d = engine_.distance(a, b);
    if (!pa.valid || !pb.valid || !d) {
        return failed("Tangency undefined");
    }
    // Externally or internally tangent, whichever is closer
    const double external = pa.radius + pb.radius;
    const double internal = std::abs(pa.radius - pb.radius);
    const double expected = std::abs(*d - external) <= std::abs(*d - internal) ? external : internal;
    return measured(expected, *d);
}

Evaluation ConstraintEvaluator::evaluateEqual(const Entity& a, const Entity& b) const {
    const auto pa = engine_.evaluate(a);
    const auto pb = engine_.evaluate(b);
    if (!pa.valid || !pb.valid) {
        return failed("Equality undefined");
    }
    if (isLine(a)) {
        return measured(pa.length, pb.length);
    }
    return measured(pa.radius, pb.radius);
}

} // namespace agentcad::core::constraint
