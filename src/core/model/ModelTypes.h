/**
 * @file ModelTypes.h
 * @brief Shared identifiers, entity type tags and error kinds for the model core
 */
#ifndef AGENTCAD_CORE_MODEL_MODEL_TYPES_H
#define AGENTCAD_CORE_MODEL_MODEL_TYPES_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace agentcad::core::model {

// Type aliases for clarity
using EntityID = std::string;
using ConstraintID = std::string;
using WorkspaceID = std::string;
using OperationID = std::string;
using AgentID = std::string;

/// Position of an operation inside one workspace's log (1-based, 0 = empty log)
using Sequence = std::uint64_t;

using ParameterMap = std::map<std::string, double>;

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Time source injected into everything that stamps or expires state
 */
using Clock = std::function<Timestamp()>;

inline Clock systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

/**
 * @brief Entity type tags
 */
enum class EntityType {
    Point,
    Line,
    Circle,
    Arc,
    Sketch,
    Solid
};

/**
 * @brief Error taxonomy shared by every core operation result
 */
enum class ErrorKind {
    None,
    EntityNotFound,
    InvalidConstraint,
    ConstraintConflict,
    WorkspaceConflict,
    BaseNotFound,
    AlreadyLocked,
    InternalSolverError,
    WorkspaceNotFound,
    InvalidRequest
};

std::string entityTypeToString(EntityType type);
std::optional<EntityType> entityTypeFromString(std::string_view name);

/**
 * @brief Fixed DOF budget per entity type
 *
 * Sketches and solids are containers and carry no free parameters of their own.
 */
int entityDegreesOfFreedom(EntityType type);

/// Circles and arcs
bool isCurved(EntityType type);

std::string errorKindToString(ErrorKind kind);

/// ISO-8601 UTC with milliseconds
std::string timestampToIso(const Timestamp& ts);
std::optional<Timestamp> timestampFromIso(const std::string& text);

namespace constants {

/// Default tolerance for length-valued constraint residuals
constexpr double kDefaultLengthTolerance = 0.01;

/// Default tolerance for angle-valued constraint residuals (degrees)
constexpr double kDefaultAngleTolerance = 0.01;

/// Root workspace every other workspace eventually forks from
constexpr std::string_view kRootWorkspaceId = "main";

/// Minimum line length / radius treated as non-degenerate
constexpr double kMinGeometrySize = 1e-9;

} // namespace constants

} // namespace agentcad::core::model

#endif // AGENTCAD_CORE_MODEL_MODEL_TYPES_H
