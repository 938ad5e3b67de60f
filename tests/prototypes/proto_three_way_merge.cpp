#include "test_harness/TestHarness.h"
#include "app/workspace/ThreeWayMerge.h"

using namespace agentcad::app::workspace;
using agentcad::core::model::Entity;
using agentcad::core::model::EntityType;
using agentcad::core::model::ParameterMap;

namespace {

Entity circle(const std::string& id, double cx, double cy, double r, std::uint64_t version = 1) {
    Entity e;
    e.id = id;
    e.workspaceId = "main";
    e.type = EntityType::Circle;
    e.parameters = {{"cx", cx}, {"cy", cy}, {"r", r}};
    e.version = version;
    return e;
}

Entity point(const std::string& id, double x, double y) {
    Entity e;
    e.id = id;
    e.type = EntityType::Point;
    e.parameters = {{"x", x}, {"y", y}};
    return e;
}

EntityView viewOf(std::initializer_list<Entity> entities) {
    EntityView view;
    for (const auto& e : entities) {
        view[e.id] = e;
    }
    return view;
}

} // namespace

TEST_CASE(UnchangedSource_PlansNothing) {
    const auto base = viewOf({circle("c1", 0.0, 0.0, 5.0)});
    const auto target = viewOf({circle("c1", 2.0, 0.0, 5.0, 2), point("p1", 1.0, 1.0)});
    const auto plan = planMerge(base, base, target);
    EXPECT_TRUE(plan.changes.empty());
    EXPECT_TRUE(plan.conflicts.empty());
}

TEST_CASE(SourceOnlyChanges_CarryOver) {
    const auto base = viewOf({circle("c1", 0.0, 0.0, 5.0), point("p1", 0.0, 0.0)});
    const auto source = viewOf({circle("c1", 0.0, 0.0, 7.0, 2), point("p2", 4.0, 4.0)});
    const auto plan = planMerge(base, source, base);

    EXPECT_TRUE(plan.conflicts.empty());
    EXPECT_EQ(plan.changes.size(), static_cast<std::size_t>(3));
    int adds = 0;
    int modifies = 0;
    int deletes = 0;
    for (const auto& change : plan.changes) {
        switch (change.kind) {
            case ChangeKind::Add: ++adds; EXPECT_EQ(change.entityId, std::string("p2")); break;
            case ChangeKind::Modify: ++modifies; EXPECT_EQ(change.entityId, std::string("c1")); break;
            case ChangeKind::Delete: ++deletes; EXPECT_EQ(change.entityId, std::string("p1")); break;
        }
    }
    EXPECT_EQ(adds, 1);
    EXPECT_EQ(modifies, 1);
    EXPECT_EQ(deletes, 1);
}

TEST_CASE(DisjointParameterEdits_MergePerParameter) {
    const auto base = viewOf({circle("c1", 0.0, 0.0, 5.0)});
    const auto source = viewOf({circle("c1", 0.0, 0.0, 7.0, 2)});
    const auto target = viewOf({circle("c1", 3.0, 1.0, 5.0, 3)});

    const auto plan = planMerge(base, source, target);
    EXPECT_TRUE(plan.conflicts.empty());
    EXPECT_EQ(plan.changes.size(), static_cast<std::size_t>(1));
    if (!plan.changes.empty() && plan.changes.front().after) {
        const Entity& merged = *plan.changes.front().after;
        EXPECT_NEAR(merged.parameter("r"), 7.0, 1e-12);
        EXPECT_NEAR(merged.parameter("cx"), 3.0, 1e-12);
        EXPECT_NEAR(merged.parameter("cy"), 1.0, 1e-12);
        EXPECT_EQ(merged.version, static_cast<std::uint64_t>(4));
    }
}

TEST_CASE(SameParameterDifferentValues_Conflicts) {
    const auto base = viewOf({circle("c1", 0.0, 0.0, 5.0)});
    const auto source = viewOf({circle("c1", 0.0, 0.0, 7.0, 2)});
    const auto target = viewOf({circle("c1", 0.0, 0.0, 10.0, 2)});

    const auto plan = planMerge(base, source, target);
    EXPECT_TRUE(plan.changes.empty());
    EXPECT_EQ(plan.conflicts.size(), static_cast<std::size_t>(1));
    if (!plan.conflicts.empty()) {
        const auto& conflict = plan.conflicts.front();
        EXPECT_TRUE(conflict.type == ConflictType::BothModified);
        EXPECT_EQ(conflict.conflictingParameters.size(), static_cast<std::size_t>(1));
        EXPECT_EQ(conflict.conflictingParameters.front(), std::string("r"));
        EXPECT_EQ(conflict.resolutionOptions.size(), static_cast<std::size_t>(3));
        EXPECT_TRUE(conflict.base && conflict.source && conflict.target);
    }
}

TEST_CASE(IdenticalEditsOnBothSides_NoConflict) {
    const auto base = viewOf({circle("c1", 0.0, 0.0, 5.0)});
    const auto source = viewOf({circle("c1", 0.0, 0.0, 7.0, 2)});
    const auto target = viewOf({circle("c1", 0.0, 0.0, 7.0, 2)});
    const auto plan = planMerge(base, source, target);
    EXPECT_TRUE(plan.changes.empty());
    EXPECT_TRUE(plan.conflicts.empty());
}

TEST_CASE(DeleteAgainstModify_Conflicts) {
    const auto base = viewOf({circle("c1", 0.0, 0.0, 5.0)});
    const auto modified = viewOf({circle("c1", 0.0, 0.0, 7.0, 2)});
    const EntityView deleted;

    auto sourceDeleted = planMerge(base, deleted, modified);
    EXPECT_EQ(sourceDeleted.conflicts.size(), static_cast<std::size_t>(1));
    EXPECT_TRUE(!sourceDeleted.conflicts.empty() &&
                sourceDeleted.conflicts.front().type == ConflictType::DeleteModified);

    auto targetDeleted = planMerge(base, modified, deleted);
    EXPECT_EQ(targetDeleted.conflicts.size(), static_cast<std::size_t>(1));
    EXPECT_TRUE(!targetDeleted.conflicts.empty() && !targetDeleted.conflicts.front().target.has_value());

    // Both sides deleting agree
    EXPECT_TRUE(planMerge(base, deleted, deleted).conflicts.empty());
}

TEST_CASE(ResolveConflict_EachOption) {
    const auto base = viewOf({circle("c1", 0.0, 0.0, 5.0)});
    const auto source = viewOf({circle("c1", 0.0, 0.0, 7.0, 2)});
    const auto target = viewOf({circle("c1", 0.0, 0.0, 10.0, 3)});
    const auto plan = planMerge(base, source, target);
    EXPECT_EQ(plan.conflicts.size(), static_cast<std::size_t>(1));
    if (plan.conflicts.empty()) {
        return;
    }
    const auto& conflict = plan.conflicts.front();
    std::string error;

    EXPECT_FALSE(resolveConflict(conflict, {Resolution::KeepTarget, {}}, error).has_value());
    EXPECT_TRUE(error.empty());

    auto keepSource = resolveConflict(conflict, {Resolution::KeepSource, {}}, error);
    EXPECT_TRUE(keepSource && keepSource->after);
    if (keepSource && keepSource->after) {
        EXPECT_NEAR(keepSource->after->parameter("r"), 7.0, 1e-12);
        EXPECT_EQ(keepSource->after->version, static_cast<std::uint64_t>(4));
    }

    auto manual = resolveConflict(conflict, {Resolution::ManualMerge, {{"r", 8.5}}}, error);
    EXPECT_TRUE(manual && manual->after);
    if (manual && manual->after) {
        EXPECT_NEAR(manual->after->parameter("r"), 8.5, 1e-12);
        EXPECT_TRUE(manual->kind == ChangeKind::Modify);
    }

    auto invalid = resolveConflict(conflict, {Resolution::ManualMerge, {{"r", -1.0}}}, error);
    EXPECT_FALSE(invalid.has_value());
    EXPECT_FALSE(error.empty());
}

TEST_CASE(KeepSourceOfDeletion_Deletes) {
    const auto base = viewOf({circle("c1", 0.0, 0.0, 5.0)});
    const auto target = viewOf({circle("c1", 0.0, 0.0, 9.0, 2)});
    const auto plan = planMerge(base, EntityView{}, target);
    EXPECT_EQ(plan.conflicts.size(), static_cast<std::size_t>(1));
    if (plan.conflicts.empty()) {
        return;
    }
    std::string error;
    auto change = resolveConflict(plan.conflicts.front(), {Resolution::KeepSource, {}}, error);
    EXPECT_TRUE(change && change->kind == ChangeKind::Delete && !change->after);

    // Manual starts from the surviving target state
    auto manual = resolveConflict(plan.conflicts.front(), {Resolution::ManualMerge, {{"cx", 1.0}}}, error);
    EXPECT_TRUE(manual && manual->after && manual->after->parameter("r") == 9.0);
}

TEST_CASE(DisjointEdits_CommuteAcrossMergeOrder) {
    const auto base = viewOf({circle("c1", 0.0, 0.0, 5.0), point("p1", 0.0, 0.0)});
    const auto left = viewOf({circle("c1", 0.0, 0.0, 6.0, 2), point("p1", 0.0, 0.0), point("p2", 1.0, 2.0)});
    const auto right = viewOf({circle("c1", 0.0, 0.0, 5.0), point("p1", 8.0, 8.0)});

    EntityView leftThenRight = base;
    applyChanges(leftThenRight, planMerge(base, left, leftThenRight).changes);
    const auto secondPlan = planMerge(base, right, leftThenRight);
    EXPECT_TRUE(secondPlan.conflicts.empty());
    applyChanges(leftThenRight, secondPlan.changes);

    EntityView rightThenLeft = base;
    applyChanges(rightThenLeft, planMerge(base, right, rightThenLeft).changes);
    const auto otherPlan = planMerge(base, left, rightThenLeft);
    EXPECT_TRUE(otherPlan.conflicts.empty());
    applyChanges(rightThenLeft, otherPlan.changes);

    EXPECT_EQ(leftThenRight.size(), rightThenLeft.size());
    for (const auto& [id, entity] : leftThenRight) {
        auto other = rightThenLeft.find(id);
        EXPECT_TRUE(other != rightThenLeft.end() && other->second.sameGeometry(entity));
    }
}

TEST_CASE(ResolutionNames) {
    EXPECT_EQ(conflictTypeToString(ConflictType::DeleteModified), std::string("delete_modified"));
    EXPECT_EQ(resolutionToString(Resolution::ManualMerge), std::string("manual_merge"));
    EXPECT_TRUE(resolutionFromString("keep_source") == Resolution::KeepSource);
    EXPECT_FALSE(resolutionFromString("keep_both").has_value());
}

int main() {
    return agentcad::test::runAllTests();
}
