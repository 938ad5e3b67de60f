/**
 * @file ThreeWayMerge.h
 * @brief Entity-level three-way merge planning.
 *
 * Planning is pure: it compares three resolved entity views (base, source,
 * target) and produces the changes to apply to the target plus the
 * conflicts that block an automatic merge. Nothing is written here.
 */
#ifndef AGENTCAD_APP_WORKSPACE_THREEWAYMERGE_H
#define AGENTCAD_APP_WORKSPACE_THREEWAYMERGE_H

#include "../../core/model/Entity.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentcad::app::workspace {

using EntityView = std::map<core::model::EntityID, core::model::Entity>;

enum class ConflictType {
    BothModified,
    DeleteModified
};

enum class Resolution {
    KeepSource,
    KeepTarget,
    ManualMerge
};

std::string conflictTypeToString(ConflictType type);
std::string resolutionToString(Resolution resolution);
std::optional<Resolution> resolutionFromString(std::string_view name);

struct MergeConflict {
    core::model::EntityID entityId;
    ConflictType type = ConflictType::BothModified;

    std::optional<core::model::Entity> base;
    std::optional<core::model::Entity> source;
    std::optional<core::model::Entity> target;

    /// Parameters both branches changed to different values
    std::vector<std::string> conflictingParameters;

    std::vector<Resolution> resolutionOptions{Resolution::KeepSource,
                                              Resolution::KeepTarget,
                                              Resolution::ManualMerge};
};

enum class ChangeKind {
    Add,
    Modify,
    Delete
};

/**
 * @brief One write to apply to the target
 */
struct MergeChange {
    ChangeKind kind = ChangeKind::Modify;
    core::model::EntityID entityId;

    /// Target's current state (nullopt for Add)
    std::optional<core::model::Entity> before;

    /// New state (nullopt for Delete)
    std::optional<core::model::Entity> after;
};

struct MergePlan {
    std::vector<MergeChange> changes;
    std::vector<MergeConflict> conflicts;
};

/**
 * @brief Explicit answer to one conflict
 *
 * For ManualMerge, @p parameters overlay the source state (or the target
 * state when the source deleted the entity).
 */
struct ConflictResolution {
    Resolution choice = Resolution::KeepTarget;
    core::model::ParameterMap parameters;
};

MergePlan planMerge(const EntityView& base, const EntityView& source, const EntityView& target);

/**
 * @brief Turn a conflict and its resolution into a change
 *
 * @return nullopt when the resolution keeps the target as is, or when it is
 *         invalid (then @p errorMessage is set)
 */
std::optional<MergeChange> resolveConflict(const MergeConflict& conflict,
                                           const ConflictResolution& resolution,
                                           std::string& errorMessage);

/// Apply @p changes to @p view (used to build the merged target view)
void applyChanges(EntityView& view, const std::vector<MergeChange>& changes);

} // namespace agentcad::app::workspace

#endif // AGENTCAD_APP_WORKSPACE_THREEWAYMERGE_H
