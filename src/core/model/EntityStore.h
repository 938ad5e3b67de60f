/**
 * @file EntityStore.h
 * @brief Per-workspace versioned entity tables with lineage lookup
 *
 * Each workspace keeps only its own revisions. A lookup walks the lineage:
 * the workspace's local revisions first, then its base as of the divergence
 * sequence, and so on up to the root. Forking therefore copies nothing.
 *
 * A revision with no entity is a tombstone and hides the base's entity.
 *
 * A rebase (after a merge) does not rewrite the lineage. It opens a new
 * segment starting at a local sequence: lookups at or after that sequence see
 * only newer local revisions on top of the new base, while lookups before it
 * (and workspaces forked earlier) keep resolving through the old segment.
 */
#ifndef AGENTCAD_CORE_MODEL_ENTITY_STORE_H
#define AGENTCAD_CORE_MODEL_ENTITY_STORE_H

#include "Entity.h"

#include <map>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

namespace agentcad::core::model {

struct EntityRevision {
    Sequence sequence = 0;

    /// nullopt marks a deletion
    std::optional<Entity> entity;
};

/**
 * @brief Where a workspace's view falls through to on a local miss
 */
struct LineageLink {
    std::optional<WorkspaceID> baseId;

    /// Base sequence the lookups fall through at
    Sequence divergence = 0;

    /// First local sequence the segment covers; older revisions are hidden
    Sequence startSequence = 0;
};

class EntityStore {
public:
    /**
     * @brief Register an empty table
     * @return false if the workspace is already registered or the base is unknown
     */
    bool registerWorkspace(const WorkspaceID& workspaceId,
                           const std::optional<WorkspaceID>& baseId,
                           Sequence divergence);

    bool hasWorkspace(const WorkspaceID& workspaceId) const;

    /// Current (newest) lineage segment
    std::optional<LineageLink> lineage(const WorkspaceID& workspaceId) const;

    /**
     * @brief Open a new lineage segment on @p baseId
     *
     * From @p startSequence on, the workspace's view is the base's view at
     * @p divergence plus local revisions recorded after @p startSequence.
     * @p startSequence must be above every revision already recorded.
     */
    bool rebase(const WorkspaceID& workspaceId,
                const WorkspaceID& baseId,
                Sequence divergence,
                Sequence startSequence);

    /// Record a new revision of @p entity at @p sequence
    void put(const WorkspaceID& workspaceId, Sequence sequence, Entity entity);

    /// Record a tombstone for @p entityId at @p sequence
    void erase(const WorkspaceID& workspaceId, Sequence sequence, const EntityID& entityId);

    std::optional<Entity> find(const WorkspaceID& workspaceId, const EntityID& entityId) const;
    std::optional<Entity> findAt(const WorkspaceID& workspaceId, const EntityID& entityId, Sequence at) const;

    /// Resolved view of the workspace at its head
    std::map<EntityID, Entity> snapshot(const WorkspaceID& workspaceId) const;

    /// Resolved view of the workspace as of local sequence @p at
    std::map<EntityID, Entity> snapshotAt(const WorkspaceID& workspaceId, Sequence at) const;

    /// Entities whose parent list names @p parentId, in the resolved head view
    std::vector<EntityID> childrenOf(const WorkspaceID& workspaceId, const EntityID& parentId) const;

    /// Ids with a local revision in the current segment
    std::set<EntityID> localEntityIds(const WorkspaceID& workspaceId) const;

    std::size_t revisionCount(const WorkspaceID& workspaceId) const;

private:
    struct Table {
        /// Ordered by startSequence; the first segment starts at 0
        std::vector<LineageLink> segments;
        std::unordered_map<EntityID, std::vector<EntityRevision>> revisions;
        Sequence lastSequence = 0;
    };

    enum class LocalHit { Missing, Present, Deleted };

    static constexpr Sequence kHead = ~Sequence{0};

    const Table* table(const WorkspaceID& workspaceId) const;
    static const LineageLink& segmentAt(const Table& table, Sequence at);
    LocalHit latestLocal(const Table& table, const LineageLink& segment, const EntityID& entityId,
                         Sequence at, const Entity** out) const;
    void collect(const WorkspaceID& workspaceId, Sequence at, std::map<EntityID, Entity>& out) const;

    std::unordered_map<WorkspaceID, Table> tables_;
};

} // namespace agentcad::core::model

#endif // AGENTCAD_CORE_MODEL_ENTITY_STORE_H
