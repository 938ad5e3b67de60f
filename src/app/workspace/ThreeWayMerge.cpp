#include "ThreeWayMerge.h"

#include <set>

namespace agentcad::app::workspace {

using core::model::Entity;
using core::model::EntityID;

std::string conflictTypeToString(ConflictType type) {
    switch (type) {
        case ConflictType::BothModified: return "both_modified";
        case ConflictType::DeleteModified: return "delete_modified";
    }
    return "unknown";
}

std::string resolutionToString(Resolution resolution) {
    switch (resolution) {
        case Resolution::KeepSource: return "keep_source";
        case Resolution::KeepTarget: return "keep_target";
        case Resolution::ManualMerge: return "manual_merge";
    }
    return "unknown";
}

std::optional<Resolution> resolutionFromString(std::string_view name) {
    if (name == "keep_source") return Resolution::KeepSource;
    if (name == "keep_target") return Resolution::KeepTarget;
    if (name == "manual_merge") return Resolution::ManualMerge;
    return std::nullopt;
}

namespace {

const Entity* lookup(const EntityView& view, const EntityID& id) {
    auto it = view.find(id);
    return it == view.end() ? nullptr : &it->second;
}

bool sameState(const Entity* a, const Entity* b) {
    if (!a || !b) {
        return a == b;
    }
    return a->sameGeometry(*b);
}

std::optional<double> valueOf(const Entity& entity, const std::string& key) {
    auto it = entity.parameters.find(key);
    if (it == entity.parameters.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Entity> copyOf(const Entity* entity) {
    return entity ? std::optional<Entity>(*entity) : std::nullopt;
}

/// Next revision written into the target
Entity nextRevision(Entity entity, const Entity* current) {
    if (current) {
        entity.version = std::max(entity.version, current->version) + 1;
        entity.createdAt = current->createdAt;
        entity.createdBy = current->createdBy;
    }
    return entity;
}

std::vector<std::string> differingKeys(const Entity& a, const Entity& b) {
    std::set<std::string> keys;
    for (const auto& [key, value] : a.parameters) keys.insert(key);
    for (const auto& [key, value] : b.parameters) keys.insert(key);

    std::vector<std::string> out;
    for (const auto& key : keys) {
        if (valueOf(a, key) != valueOf(b, key)) {
            out.push_back(key);
        }
    }
    return out;
}

/**
 * @brief Both sides modified the same entity: merge per parameter
 *
 * A parameter changed on only one side takes that side's value. A parameter
 * changed on both sides to different values is a conflict.
 */
void mergeModified(const Entity& base, const Entity& source, const Entity& target, MergePlan& plan) {
    MergeConflict conflict;
    conflict.entityId = target.id;
    conflict.type = ConflictType::BothModified;
    conflict.base = base;
    conflict.source = source;
    conflict.target = target;

    if (source.type != target.type) {
        conflict.conflictingParameters = differingKeys(source, target);
        plan.conflicts.push_back(std::move(conflict));
        return;
    }

    Entity merged = target;

    const bool sourceParents = source.parentIds != base.parentIds;
    const bool targetParents = target.parentIds != base.parentIds;
    bool parentsConflict = false;
    if (sourceParents && targetParents && source.parentIds != target.parentIds) {
        parentsConflict = true;
    } else if (sourceParents) {
        merged.parentIds = source.parentIds;
    }

    std::set<std::string> keys;
    for (const auto& [key, value] : base.parameters) keys.insert(key);
    for (const auto& [key, value] : source.parameters) keys.insert(key);
    for (const auto& [key, value] : target.parameters) keys.insert(key);

    for (const auto& key : keys) {
        const auto b = valueOf(base, key);
        const auto s = valueOf(source, key);
        const auto t = valueOf(target, key);
        if (s == b || s == t) {
            continue;
        }
        if (t == b) {
            if (s) {
                merged.parameters[key] = *s;
            } else {
                merged.parameters.erase(key);
            }
            continue;
        }
        conflict.conflictingParameters.push_back(key);
    }

    if (parentsConflict || !conflict.conflictingParameters.empty()) {
        plan.conflicts.push_back(std::move(conflict));
        return;
    }

    if (merged.sameGeometry(target)) {
        return;
    }

    MergeChange change;
    change.kind = ChangeKind::Modify;
    change.entityId = target.id;
    change.before = target;
    change.after = nextRevision(std::move(merged), &target);
    plan.changes.push_back(std::move(change));
}

} // namespace

MergePlan planMerge(const EntityView& base, const EntityView& source, const EntityView& target) {
    std::set<EntityID> ids;
    for (const auto& [id, entity] : base) ids.insert(id);
    for (const auto& [id, entity] : source) ids.insert(id);
    for (const auto& [id, entity] : target) ids.insert(id);

    MergePlan plan;
    for (const auto& id : ids) {
        const Entity* b = lookup(base, id);
        const Entity* s = lookup(source, id);
        const Entity* t = lookup(target, id);

        const bool sourceChanged = !sameState(b, s);
        const bool targetChanged = !sameState(b, t);

        if (!sourceChanged) {
            continue;
        }

        if (!targetChanged) {
            MergeChange change;
            change.entityId = id;
            change.before = copyOf(t);
            if (!s) {
                change.kind = ChangeKind::Delete;
            } else {
                change.kind = t ? ChangeKind::Modify : ChangeKind::Add;
                change.after = nextRevision(*s, t);
            }
            plan.changes.push_back(std::move(change));
            continue;
        }

        if (sameState(s, t)) {
            continue;
        }

        if (!s || !t) {
            MergeConflict conflict;
            conflict.entityId = id;
            conflict.type = ConflictType::DeleteModified;
            conflict.base = copyOf(b);
            conflict.source = copyOf(s);
            conflict.target = copyOf(t);
            plan.conflicts.push_back(std::move(conflict));
            continue;
        }

        if (!b) {
            // Added on both sides under the same id with different geometry
            MergeConflict conflict;
            conflict.entityId = id;
            conflict.type = ConflictType::BothModified;
            conflict.source = *s;
            conflict.target = *t;
            conflict.conflictingParameters = differingKeys(*s, *t);
            plan.conflicts.push_back(std::move(conflict));
            continue;
        }

        mergeModified(*b, *s, *t, plan);
    }
    return plan;
}

std::optional<MergeChange> resolveConflict(const MergeConflict& conflict,
                                           const ConflictResolution& resolution,
                                           std::string& errorMessage) {
    const Entity* target = conflict.target ? &*conflict.target : nullptr;

    switch (resolution.choice) {
        case Resolution::KeepTarget:
            return std::nullopt;

        case Resolution::KeepSource: {
            MergeChange change;
            change.entityId = conflict.entityId;
            change.before = conflict.target;
            if (!conflict.source) {
                change.kind = ChangeKind::Delete;
            } else {
                change.kind = target ? ChangeKind::Modify : ChangeKind::Add;
                change.after = nextRevision(*conflict.source, target);
            }
            return change;
        }

        case Resolution::ManualMerge: {
            const auto& start = conflict.source ? conflict.source : conflict.target;
            if (!start) {
                errorMessage = "Nothing to merge for entity " + conflict.entityId;
                return std::nullopt;
            }
            Entity merged = *start;
            for (const auto& [key, value] : resolution.parameters) {
                merged.parameters[key] = value;
            }
            const auto validation = core::model::validateParameters(merged.type, merged.parameters);
            if (!validation.valid) {
                errorMessage = "Manual resolution for " + conflict.entityId + " is invalid: " + validation.message;
                return std::nullopt;
            }

            MergeChange change;
            change.entityId = conflict.entityId;
            change.before = conflict.target;
            change.kind = target ? ChangeKind::Modify : ChangeKind::Add;
            change.after = nextRevision(std::move(merged), target);
            return change;
        }
    }
    errorMessage = "Unknown resolution";
    return std::nullopt;
}

void applyChanges(EntityView& view, const std::vector<MergeChange>& changes) {
    for (const auto& change : changes) {
        if (change.after) {
            view[change.entityId] = *change.after;
        } else {
            view.erase(change.entityId);
        }
    }
}

} // namespace agentcad::app::workspace
