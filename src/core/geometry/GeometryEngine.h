/**
 * @file GeometryEngine.h
 * @brief Boundary to the geometry kernel used by constraint tolerance checks
 *
 * The constraint graph never computes B-rep geometry itself. It asks an
 * engine for the analytic quantities a satisfaction test needs.
 */
#ifndef AGENTCAD_CORE_GEOMETRY_GEOMETRY_ENGINE_H
#define AGENTCAD_CORE_GEOMETRY_GEOMETRY_ENGINE_H

#include "../model/Entity.h"

#include <optional>
#include <string>

namespace agentcad::core::geometry {

/**
 * @brief Numeric properties of one entity
 */
struct GeometricProperties {
    bool valid = false;

    /// Line length, arc length, circle circumference, solid height
    double length = 0.0;

    /// Enclosed area (circle, arc sector)
    double area = 0.0;

    double radius = 0.0;

    /// Point position, line midpoint, circle/arc center
    double centroidX = 0.0;
    double centroidY = 0.0;

    /// Unit direction for lines
    double directionX = 0.0;
    double directionY = 0.0;

    std::string errorMessage;
};

class GeometryEngine {
public:
    virtual ~GeometryEngine() = default;

    virtual GeometricProperties evaluate(const model::Entity& entity) const = 0;

    /**
     * @brief Distance between two entities
     *
     * Circles and arcs are measured at their centers. A point and a line
     * measure perpendicular distance; two lines measure their separation
     * when parallel and 0 when they intersect.
     *
     * @return nullopt for unsupported pairs or degenerate geometry
     */
    virtual std::optional<double> distance(const model::Entity& a, const model::Entity& b) const = 0;

    /**
     * @brief Unsigned angle between two lines in degrees, in [0, 180]
     */
    virtual std::optional<double> angle(const model::Entity& a, const model::Entity& b) const = 0;
};

} // namespace agentcad::core::geometry

#endif // AGENTCAD_CORE_GEOMETRY_GEOMETRY_ENGINE_H
