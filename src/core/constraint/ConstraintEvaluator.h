/**
 * @file ConstraintEvaluator.h
 * @brief Tolerance-based satisfaction tests for every constraint kind
 */
#ifndef AGENTCAD_CORE_CONSTRAINT_CONSTRAINT_EVALUATOR_H
#define AGENTCAD_CORE_CONSTRAINT_CONSTRAINT_EVALUATOR_H

#include "Constraint.h"
#include "../geometry/GeometryEngine.h"
#include "../model/Entity.h"

#include <string>
#include <vector>

namespace agentcad::core::constraint {

/**
 * @brief One satisfaction test
 *
 * Expected and actual are in the kind's own unit: model lengths, or degrees
 * for parallel, perpendicular and angle.
 */
struct Evaluation {
    bool valid = false;
    double expected = 0.0;
    double actual = 0.0;
    double residual = 0.0;
    std::string errorMessage;

    bool satisfied(double tolerance) const { return valid && residual <= tolerance; }
};

class ConstraintEvaluator {
public:
    explicit ConstraintEvaluator(const geometry::GeometryEngine& engine);

    /**
     * @brief Evaluate @p constraint against resolved entities
     * @param entities One entry per constraint.entityIds, same order
     */
    Evaluation evaluate(const Constraint& constraint, const std::vector<model::Entity>& entities) const;

    /**
     * @brief Type/entity compatibility check done before anything is added
     * @return empty string when compatible, otherwise the reason
     */
    static std::string checkCompatibility(ConstraintType type, const std::vector<model::Entity>& entities);

private:
    Evaluation evaluateTangent(const model::Entity& a, const model::Entity& b) const;
    Evaluation evaluateEqual(const model::Entity& a, const model::Entity& b) const;

    const geometry::GeometryEngine& engine_;
};

} // namespace agentcad::core::constraint

#endif // AGENTCAD_CORE_CONSTRAINT_CONSTRAINT_EVALUATOR_H
