/**
 * @file AnalyticGeometryEngine.h
 * @brief Closed-form geometry engine on OpenCASCADE gp primitives
 */
#ifndef AGENTCAD_CORE_GEOMETRY_ANALYTIC_GEOMETRY_ENGINE_H
#define AGENTCAD_CORE_GEOMETRY_ANALYTIC_GEOMETRY_ENGINE_H

#include "GeometryEngine.h"

namespace agentcad::core::geometry {

class AnalyticGeometryEngine final : public GeometryEngine {
public:
    GeometricProperties evaluate(const model::Entity& entity) const override;
    std::optional<double> distance(const model::Entity& a, const model::Entity& b) const override;
    std::optional<double> angle(const model::Entity& a, const model::Entity& b) const override;
};

} // namespace agentcad::core::geometry

#endif // AGENTCAD_CORE_GEOMETRY_ANALYTIC_GEOMETRY_ENGINE_H
