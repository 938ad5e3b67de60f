#include "AnalyticGeometryEngine.h"

#include <gp_Ax2d.hxx>
#include <gp_Circ2d.hxx>
#include <gp_Dir2d.hxx>
#include <gp_Lin2d.hxx>
#include <gp_Pnt2d.hxx>
#include <gp_Vec2d.hxx>

#include <cmath>
#include <numbers>

namespace agentcad::core::geometry {

using model::Entity;
using model::EntityType;

namespace {

constexpr double kDegToRad = std::numbers::pi / 180.0;
constexpr double kRadToDeg = 180.0 / std::numbers::pi;

gp_Pnt2d pointOf(const Entity& e) {
    return gp_Pnt2d(e.parameter("x"), e.parameter("y"));
}

gp_Pnt2d lineStart(const Entity& e) {
    return gp_Pnt2d(e.parameter("x1"), e.parameter("y1"));
}

gp_Pnt2d lineEnd(const Entity& e) {
    return gp_Pnt2d(e.parameter("x2"), e.parameter("y2"));
}

gp_Pnt2d centerOf(const Entity& e) {
    return gp_Pnt2d(e.parameter("cx"), e.parameter("cy"));
}

/// Infinite carrier line; nullopt for zero-length lines (gp_Dir2d would throw)
std::optional<gp_Lin2d> carrierOf(const Entity& e) {
    const gp_Vec2d v(lineStart(e), lineEnd(e));
    if (v.Magnitude() <= model::constants::kMinGeometrySize) {
        return std::nullopt;
    }
    return gp_Lin2d(lineStart(e), gp_Dir2d(v));
}

/// Swept angle of an arc in radians, normalized to (0, 2pi]
double arcSweep(const Entity& e) {
    double sweep = std::fmod((e.parameter("end") - e.parameter("start")) * kDegToRad, 2.0 * std::numbers::pi);
    if (sweep <= 0.0) {
        sweep += 2.0 * std::numbers::pi;
    }
    return sweep;
}

/// Reference point used for distance measurement
std::optional<gp_Pnt2d> anchorOf(const Entity& e) {
    switch (e.type) {
        case EntityType::Point:
            return pointOf(e);
        case EntityType::Circle:
        case EntityType::Arc:
            return centerOf(e);
        case EntityType::Line:
        case EntityType::Sketch:
        case EntityType::Solid:
            break;
    }
    return std::nullopt;
}

} // namespace

GeometricProperties AnalyticGeometryEngine::evaluate(const Entity& entity) const {
    GeometricProperties props;
    switch (entity.type) {
        case EntityType::Point: {
            const gp_Pnt2d p = pointOf(entity);
            props.centroidX = p.X();
            props.centroidY = p.Y();
            props.valid = true;
            break;
        }
        case EntityType::Line: {
            const gp_Pnt2d a = lineStart(entity);
            const gp_Pnt2d b = lineEnd(entity);
            props.length = a.Distance(b);
            props.centroidX = 0.5 * (a.X() + b.X());
            props.centroidY = 0.5 * (a.Y() + b.Y());
            auto carrier = carrierOf(entity);
            if (!carrier) {
                props.errorMessage = "Degenerate line";
                break;
            }
            props.directionX = carrier->Direction().X();
            props.directionY = carrier->Direction().Y();
            props.valid = true;
            break;
        }
        case EntityType::Circle: {
            const double r = entity.parameter("r");
            if (r <= 0.0) {
                props.errorMessage = "Non-positive radius";
                break;
            }
            const gp_Circ2d circle(gp_Ax2d(centerOf(entity), gp_Dir2d(1.0, 0.0)), r);
            props.radius = circle.Radius();
            props.length = circle.Length();
            props.area = circle.Area();
            props.centroidX = circle.Location().X();
            props.centroidY = circle.Location().Y();
            props.valid = true;
            break;
        }
        case EntityType::Arc: {
            const double r = entity.parameter("r");
            if (r <= 0.0) {
                props.errorMessage = "Non-positive radius";
                break;
            }
            const double sweep = arcSweep(entity);
            props.radius = r;
            props.length = r * sweep;
            props.area = 0.5 * r * r * sweep;
            props.centroidX = entity.parameter("cx");
            props.centroidY = entity.parameter("cy");
            props.valid = true;
            break;
        }
        case EntityType::Solid:
            props.length = entity.parameter("height");
            props.valid = true;
            break;
        case EntityType::Sketch:
            props.valid = true;
            break;
    }
    return props;
}

std::optional<double> AnalyticGeometryEngine::distance(const Entity& a, const Entity& b) const {
    const bool aLine = a.type == EntityType::Line;
    const bool bLine = b.type == EntityType::Line;

    if (!aLine && !bLine) {
        auto pa = anchorOf(a);
        auto pb = anchorOf(b);
        if (!pa || !pb) {
            return std::nullopt;
        }
        return pa->Distance(*pb);
    }

    if (aLine && bLine) {
        auto la = carrierOf(a);
        auto lb = carrierOf(b);
        if (!la || !lb) {
            return std::nullopt;
        }
        const double cross = la->Direction().Crossed(lb->Direction());
        if (std::abs(cross) > model::constants::kMinGeometrySize) {
            return 0.0;
        }
        return la->Distance(lineStart(b));
    }

    const Entity& line = aLine ? a : b;
    const Entity& other = aLine ? b : a;
    auto carrier = carrierOf(line);
    auto anchor = anchorOf(other);
    if (!carrier || !anchor) {
        return std::nullopt;
    }
    return carrier->Distance(*anchor);
}

std::optional<double> AnalyticGeometryEngine::angle(const Entity& a, const Entity& b) const {
    if (a.type != EntityType::Line || b.type != EntityType::Line) {
        return std::nullopt;
    }
    auto la = carrierOf(a);
    auto lb = carrierOf(b);
    if (!la || !lb) {
        return std::nullopt;
    }
    return std::abs(la->Direction().Angle(lb->Direction())) * kRadToDeg;
}

} // namespace agentcad::core::geometry
