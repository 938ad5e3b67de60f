/**
 * @file Constraint.h
 * @brief Constraint record and the closed set of constraint kinds
 *
 * Each kind is its own struct carrying only its parameters. The variant is
 * closed: adding a kind means adding a struct here and a case to every
 * exhaustive switch over ConstraintType.
 */
#ifndef AGENTCAD_CORE_CONSTRAINT_CONSTRAINT_H
#define AGENTCAD_CORE_CONSTRAINT_CONSTRAINT_H

#include "../model/ModelTypes.h"

#include <QJsonObject>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace agentcad::core::constraint {

using model::ConstraintID;
using model::EntityID;

enum class ConstraintType {
    Coincident,
    Parallel,
    Perpendicular,
    Tangent,
    Distance,
    Angle,
    Radius,
    Horizontal,
    Vertical,
    Fixed,
    Concentric,
    Equal
};

enum class ConstraintStatus {
    Satisfied,
    Violated,
    Redundant
};

/// Whether residuals are measured in model length units or degrees
enum class ToleranceUnit {
    Length,
    Angle
};

namespace kinds {

struct Coincident {
    static constexpr ConstraintType kType = ConstraintType::Coincident;
};

struct Parallel {
    static constexpr ConstraintType kType = ConstraintType::Parallel;
};

struct Perpendicular {
    static constexpr ConstraintType kType = ConstraintType::Perpendicular;
};

struct Tangent {
    static constexpr ConstraintType kType = ConstraintType::Tangent;
};

struct Distance {
    static constexpr ConstraintType kType = ConstraintType::Distance;
    double value = 0.0;
};

struct Angle {
    static constexpr ConstraintType kType = ConstraintType::Angle;
    double degrees = 0.0;
};

struct Radius {
    static constexpr ConstraintType kType = ConstraintType::Radius;
    double value = 0.0;
};

struct Horizontal {
    static constexpr ConstraintType kType = ConstraintType::Horizontal;
};

struct Vertical {
    static constexpr ConstraintType kType = ConstraintType::Vertical;
};

struct Fixed {
    static constexpr ConstraintType kType = ConstraintType::Fixed;
    double x = 0.0;
    double y = 0.0;
};

struct Concentric {
    static constexpr ConstraintType kType = ConstraintType::Concentric;
};

struct Equal {
    static constexpr ConstraintType kType = ConstraintType::Equal;
};

} // namespace kinds

using ConstraintKind = std::variant<kinds::Coincident,
                                    kinds::Parallel,
                                    kinds::Perpendicular,
                                    kinds::Tangent,
                                    kinds::Distance,
                                    kinds::Angle,
                                    kinds::Radius,
                                    kinds::Horizontal,
                                    kinds::Vertical,
                                    kinds::Fixed,
                                    kinds::Concentric,
                                    kinds::Equal>;

ConstraintType typeOf(const ConstraintKind& kind);

std::string constraintTypeToString(ConstraintType type);
std::optional<ConstraintType> constraintTypeFromString(std::string_view name);

std::string constraintStatusToString(ConstraintStatus status);
std::optional<ConstraintStatus> constraintStatusFromString(std::string_view name);

/**
 * @brief DOF removed by one non-redundant constraint of @p type
 */
int degreesRemoved(ConstraintType type);

/// Number of entities a constraint of @p type references (1, 2, or 0 for "1 or 2")
int entityArity(ConstraintType type);

ToleranceUnit toleranceUnit(ConstraintType type);

/**
 * @brief Dimensional target carried by the kind (distance, angle, radius)
 */
std::optional<double> dimensionalValue(const ConstraintKind& kind);

/**
 * @brief Build a kind from request parameters
 *
 * Distance and radius take "value" (or "distance"/"radius"), angle takes
 * "angle" in degrees, fixed takes "x" and "y".
 *
 * @return nullopt with @p errorMessage set when a required value is missing,
 *         non-finite or out of range
 */
std::optional<ConstraintKind> makeKind(ConstraintType type,
                                       const model::ParameterMap& parameters,
                                       std::string& errorMessage);

/// Kind parameters as a flat map (inverse of makeKind)
model::ParameterMap kindParameters(const ConstraintKind& kind);

struct Constraint {
    ConstraintID id;
    model::WorkspaceID workspaceId;
    ConstraintKind kind;
    std::vector<EntityID> entityIds;

    double tolerance = model::constants::kDefaultLengthTolerance;

    ConstraintStatus status = ConstraintStatus::Violated;

    /// 0 when redundant
    int dofRemoved = 0;

    /// Last evaluation, in the kind's unit
    double expectedValue = 0.0;
    double actualValue = 0.0;

    model::AgentID createdBy;
    model::Timestamp createdAt{};

    ConstraintType type() const { return typeOf(kind); }
    bool references(const EntityID& entityId) const;

    /// Same entities regardless of order
    bool sameEntitySet(const Constraint& other) const;

    void serialize(QJsonObject& json) const;
    bool deserialize(const QJsonObject& json);
};

/**
 * @brief Same kind, same entity set, parameters equal within @p tolerance
 */
bool sameDefinition(const Constraint& a, const Constraint& b, double tolerance);

/**
 * @brief Whether @p a and @p b, on the same entity set, can never hold together
 */
bool contradicts(const Constraint& a, const Constraint& b);

ConstraintID generateConstraintId();

} // namespace agentcad::core::constraint

#endif // AGENTCAD_CORE_CONSTRAINT_CONSTRAINT_H
