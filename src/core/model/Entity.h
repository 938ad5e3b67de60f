/**
 * @file Entity.h
 * @brief Versioned geometric entity record
 *
 * An Entity value is one immutable revision. Mutations never edit a stored
 * revision in place; the store records a new revision with a bumped version.
 */
#ifndef AGENTCAD_CORE_MODEL_ENTITY_H
#define AGENTCAD_CORE_MODEL_ENTITY_H

#include "ModelTypes.h"

#include <QJsonObject>

#include <string>
#include <vector>

namespace agentcad::core::model {

struct Entity {
    EntityID id;

    /// Workspace the entity was first created in
    WorkspaceID workspaceId;

    EntityType type = EntityType::Point;

    ParameterMap parameters;

    /// Starts at 1, +1 for every recorded mutation
    std::uint64_t version = 1;

    AgentID createdBy;
    Timestamp createdAt{};
    Timestamp modifiedAt{};

    /// Id-based references (a solid names the sketch it was extruded from)
    std::vector<EntityID> parentIds;

    double parameter(const std::string& key, double fallback = 0.0) const;
    bool hasParent(const EntityID& parentId) const;

    /**
     * @brief Geometric identity: type, parameters and parents
     *
     * Bookkeeping fields (version, timestamps, author) are ignored, so two
     * branches that arrive at the same geometry compare equal.
     */
    bool sameGeometry(const Entity& other) const;

    void serialize(QJsonObject& json) const;
    bool deserialize(const QJsonObject& json);
};

/**
 * @brief Outcome of a parameter schema check
 */
struct EntityValidation {
    bool valid = true;
    std::string message;
};

/// Parameter keys every entity of @p type must carry
const std::vector<std::string>& requiredParameters(EntityType type);

/**
 * @brief Check parameters against the per-type schema
 *
 * Requires all keys, rejects unknown keys and non-finite values, and enforces
 * the type rules (positive radius, non-degenerate line, etc.).
 */
EntityValidation validateParameters(EntityType type, const ParameterMap& parameters);

/// Generates "<workspace>:<type>_<8 hex>"
EntityID generateEntityId(const WorkspaceID& workspaceId, EntityType type);

} // namespace agentcad::core::model

#endif // AGENTCAD_CORE_MODEL_ENTITY_H
