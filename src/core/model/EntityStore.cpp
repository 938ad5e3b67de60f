#include "EntityStore.h"

#include <QLoggingCategory>

#include <algorithm>

namespace agentcad::core::model {

Q_LOGGING_CATEGORY(logStore, "agentcad.core.store")

bool EntityStore::registerWorkspace(const WorkspaceID& workspaceId,
                                    const std::optional<WorkspaceID>& baseId,
                                    Sequence divergence) {
    if (tables_.count(workspaceId) != 0) {
        qCWarning(logStore) << "registerWorkspace: already registered" << workspaceId.c_str();
        return false;
    }
    if (baseId && tables_.count(*baseId) == 0) {
        qCWarning(logStore) << "registerWorkspace: unknown base" << baseId->c_str();
        return false;
    }

    Table table;
    table.segments.push_back({baseId, divergence, 0});
    tables_.emplace(workspaceId, std::move(table));
    qCDebug(logStore) << "registerWorkspace" << workspaceId.c_str()
                      << "base=" << (baseId ? baseId->c_str() : "<root>")
                      << "divergence=" << divergence;
    return true;
}

bool EntityStore::hasWorkspace(const WorkspaceID& workspaceId) const {
    return tables_.count(workspaceId) != 0;
}

std::optional<LineageLink> EntityStore::lineage(const WorkspaceID& workspaceId) const {
    const Table* t = table(workspaceId);
    if (!t) {
        return std::nullopt;
    }
    return t->segments.back();
}

bool EntityStore::rebase(const WorkspaceID& workspaceId,
                         const WorkspaceID& baseId,
                         Sequence divergence,
                         Sequence startSequence) {
    auto it = tables_.find(workspaceId);
    if (it == tables_.end() || tables_.count(baseId) == 0 || baseId == workspaceId) {
        return false;
    }
    Table& t = it->second;
    if (startSequence <= t.lastSequence || startSequence <= t.segments.back().startSequence) {
        qCWarning(logStore) << "rebase: segment start" << startSequence
                            << "not above recorded history of" << workspaceId.c_str();
        return false;
    }

    // Links only ever point at sequences recorded before the new segment
    // opens, so lookups cannot cycle even if two workspaces rebase onto
    // each other over time.
    t.segments.push_back({baseId, divergence, startSequence});
    qCDebug(logStore) << "rebase" << workspaceId.c_str() << "onto" << baseId.c_str()
                      << "divergence=" << divergence << "start=" << startSequence;
    return true;
}

void EntityStore::put(const WorkspaceID& workspaceId, Sequence sequence, Entity entity) {
    auto it = tables_.find(workspaceId);
    if (it == tables_.end()) {
        qCWarning(logStore) << "put: unknown workspace" << workspaceId.c_str();
        return;
    }
    const EntityID id = entity.id;
    it->second.revisions[id].push_back({sequence, std::move(entity)});
    it->second.lastSequence = std::max(it->second.lastSequence, sequence);
}

void EntityStore::erase(const WorkspaceID& workspaceId, Sequence sequence, const EntityID& entityId) {
    auto it = tables_.find(workspaceId);
    if (it == tables_.end()) {
        qCWarning(logStore) << "erase: unknown workspace" << workspaceId.c_str();
        return;
    }
    it->second.revisions[entityId].push_back({sequence, std::nullopt});
    it->second.lastSequence = std::max(it->second.lastSequence, sequence);
}

std::optional<Entity> EntityStore::find(const WorkspaceID& workspaceId, const EntityID& entityId) const {
    return findAt(workspaceId, entityId, kHead);
}

std::optional<Entity> EntityStore::findAt(const WorkspaceID& workspaceId,
                                          const EntityID& entityId,
                                          Sequence at) const {
    const Table* t = table(workspaceId);
    while (t) {
        const LineageLink& segment = segmentAt(*t, at);
        const Entity* hit = nullptr;
        switch (latestLocal(*t, segment, entityId, at, &hit)) {
            case LocalHit::Present:
                return *hit;
            case LocalHit::Deleted:
                return std::nullopt;
            case LocalHit::Missing:
                break;
        }
        if (!segment.baseId) {
            return std::nullopt;
        }
        at = segment.divergence;
        t = table(*segment.baseId);
    }
    return std::nullopt;
}

std::map<EntityID, Entity> EntityStore::snapshot(const WorkspaceID& workspaceId) const {
    return snapshotAt(workspaceId, kHead);
}

std::map<EntityID, Entity> EntityStore::snapshotAt(const WorkspaceID& workspaceId, Sequence at) const {
    std::map<EntityID, Entity> out;
    collect(workspaceId, at, out);
    return out;
}

std::vector<EntityID> EntityStore::childrenOf(const WorkspaceID& workspaceId, const EntityID& parentId) const {
    std::vector<EntityID> children;
    for (const auto& [id, entity] : snapshot(workspaceId)) {
        if (entity.hasParent(parentId)) {
            children.push_back(id);
        }
    }
    return children;
}

std::set<EntityID> EntityStore::localEntityIds(const WorkspaceID& workspaceId) const {
    std::set<EntityID> ids;
    const Table* t = table(workspaceId);
    if (!t) {
        return ids;
    }
    const Sequence start = t->segments.back().startSequence;
    for (const auto& [id, revisions] : t->revisions) {
        const bool visible = std::any_of(revisions.begin(), revisions.end(), [&](const EntityRevision& rev) {
            return rev.sequence > start;
        });
        if (visible) {
            ids.insert(id);
        }
    }
    return ids;
}

std::size_t EntityStore::revisionCount(const WorkspaceID& workspaceId) const {
    const Table* t = table(workspaceId);
    if (!t) {
        return 0;
    }
    std::size_t count = 0;
    for (const auto& [id, revisions] : t->revisions) {
        count += revisions.size();
    }
    return count;
}

const EntityStore::Table* EntityStore::table(const WorkspaceID& workspaceId) const {
    auto it = tables_.find(workspaceId);
    return it != tables_.end() ? &it->second : nullptr;
}

const LineageLink& EntityStore::segmentAt(const Table& table, Sequence at) {
    for (auto it = table.segments.rbegin(); it != table.segments.rend(); ++it) {
        if (it->startSequence <= at) {
            return *it;
        }
    }
    return table.segments.front();
}

EntityStore::LocalHit EntityStore::latestLocal(const Table& table,
                                               const LineageLink& segment,
                                               const EntityID& entityId,
                                               Sequence at,
                                               const Entity** out) const {
    auto it = table.revisions.find(entityId);
    if (it == table.revisions.end()) {
        return LocalHit::Missing;
    }

    // Revisions are appended in sequence order; scan from the newest
    const auto& revisions = it->second;
    for (auto rev = revisions.rbegin(); rev != revisions.rend(); ++rev) {
        if (rev->sequence > at) {
            continue;
        }
        if (rev->sequence <= segment.startSequence) {
            break;
        }
        if (!rev->entity) {
            return LocalHit::Deleted;
        }
        *out = &*rev->entity;
        return LocalHit::Present;
    }
    return LocalHit::Missing;
}

void EntityStore::collect(const WorkspaceID& workspaceId, Sequence at, std::map<EntityID, Entity>& out) const {
    const Table* t = table(workspaceId);
    if (!t) {
        return;
    }
    const LineageLink& segment = segmentAt(*t, at);
    if (segment.baseId) {
        collect(*segment.baseId, segment.divergence, out);
    }

    for (const auto& [id, revisions] : t->revisions) {
        const Entity* hit = nullptr;
        switch (latestLocal(*t, segment, id, at, &hit)) {
            case LocalHit::Present:
                out[id] = *hit;
                break;
            case LocalHit::Deleted:
                out.erase(id);
                break;
            case LocalHit::Missing:
                break;
        }
    }
}

} // namespace agentcad::core::model
