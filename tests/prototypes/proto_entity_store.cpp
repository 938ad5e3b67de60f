#include "test_harness/TestHarness.h"
#include "core/model/EntityStore.h"

using namespace agentcad::core::model;

namespace {

Entity makePoint(const EntityID& id, double x, double y, std::uint64_t version = 1) {
    Entity e;
    e.id = id;
    e.workspaceId = "main";
    e.type = EntityType::Point;
    e.parameters = {{"x", x}, {"y", y}};
    e.version = version;
    return e;
}

} // namespace

TEST_CASE(Fork_SeesBaseAtDivergenceOnly) {
    EntityStore store;
    EXPECT_TRUE(store.registerWorkspace("main", std::nullopt, 0));
    store.put("main", 1, makePoint("p1", 0.0, 0.0));
    EXPECT_TRUE(store.registerWorkspace("w1", std::string("main"), 1));

    // Later base edits stay invisible to the fork
    store.put("main", 2, makePoint("p1", 5.0, 5.0, 2));
    store.put("main", 3, makePoint("p2", 1.0, 1.0));

    auto forked = store.find("w1", "p1");
    EXPECT_TRUE(forked.has_value());
    if (forked) {
        EXPECT_NEAR(forked->parameter("x"), 0.0, 1e-12);
    }
    EXPECT_FALSE(store.find("w1", "p2").has_value());
    EXPECT_EQ(store.snapshot("w1").size(), static_cast<std::size_t>(1));
    EXPECT_EQ(store.snapshot("main").size(), static_cast<std::size_t>(2));
}

TEST_CASE(LocalRevision_ShadowsBase) {
    EntityStore store;
    store.registerWorkspace("main", std::nullopt, 0);
    store.put("main", 1, makePoint("p1", 0.0, 0.0));
    store.registerWorkspace("w1", std::string("main"), 1);

    store.put("w1", 1, makePoint("p1", 2.0, 3.0, 2));
    EXPECT_NEAR(store.find("w1", "p1")->parameter("x"), 2.0, 1e-12);
    EXPECT_NEAR(store.find("main", "p1")->parameter("x"), 0.0, 1e-12);
    EXPECT_EQ(store.localEntityIds("w1").size(), static_cast<std::size_t>(1));
    EXPECT_EQ(store.revisionCount("w1"), static_cast<std::size_t>(1));
}

TEST_CASE(Tombstone_HidesBaseEntity) {
    EntityStore store;
    store.registerWorkspace("main", std::nullopt, 0);
    store.put("main", 1, makePoint("p1", 0.0, 0.0));
    store.registerWorkspace("w1", std::string("main"), 1);

    store.erase("w1", 1, "p1");
    EXPECT_FALSE(store.find("w1", "p1").has_value());
    EXPECT_TRUE(store.snapshot("w1").empty());
    EXPECT_TRUE(store.find("main", "p1").has_value());
}

TEST_CASE(SnapshotAt_ReturnsHistoricalView) {
    EntityStore store;
    store.registerWorkspace("main", std::nullopt, 0);
    store.put("main", 1, makePoint("p1", 0.0, 0.0));
    store.put("main", 2, makePoint("p1", 1.0, 0.0, 2));
    store.erase("main", 3, "p1");

    EXPECT_NEAR(store.snapshotAt("main", 1).at("p1").parameter("x"), 0.0, 1e-12);
    EXPECT_NEAR(store.snapshotAt("main", 2).at("p1").parameter("x"), 1.0, 1e-12);
    EXPECT_TRUE(store.snapshotAt("main", 3).empty());
    EXPECT_FALSE(store.findAt("main", "p1", 3).has_value());
}

TEST_CASE(GrandchildResolvesThroughLineage) {
    EntityStore store;
    store.registerWorkspace("main", std::nullopt, 0);
    store.put("main", 1, makePoint("p1", 0.0, 0.0));
    store.registerWorkspace("w1", std::string("main"), 1);
    store.put("w1", 1, makePoint("p2", 4.0, 4.0));
    store.registerWorkspace("w2", std::string("w1"), 1);

    const auto view = store.snapshot("w2");
    EXPECT_EQ(view.size(), static_cast<std::size_t>(2));
    EXPECT_TRUE(view.count("p1") == 1);
    EXPECT_TRUE(view.count("p2") == 1);
}

TEST_CASE(Rebase_OpensNewSegment) {
    EntityStore store;
    store.registerWorkspace("main", std::nullopt, 0);
    store.put("main", 1, makePoint("p1", 0.0, 0.0));
    store.registerWorkspace("w1", std::string("main"), 1);
    store.put("w1", 1, makePoint("p1", 9.0, 9.0, 2));

    // main absorbs the edit and more, then w1 is rebased onto main's head
    store.put("main", 2, makePoint("p1", 9.0, 9.0, 3));
    store.put("main", 2, makePoint("p2", 1.0, 2.0));
    EXPECT_FALSE(store.rebase("w1", "main", 2, 1));
    EXPECT_TRUE(store.rebase("w1", "main", 2, 2));

    const auto lineage = store.lineage("w1");
    EXPECT_TRUE(lineage.has_value());
    if (lineage) {
        EXPECT_EQ(lineage->startSequence, static_cast<Sequence>(2));
        EXPECT_EQ(lineage->divergence, static_cast<Sequence>(2));
    }
    EXPECT_TRUE(store.localEntityIds("w1").empty());
    EXPECT_EQ(store.find("w1", "p1")->version, static_cast<std::uint64_t>(3));
    EXPECT_TRUE(store.find("w1", "p2").has_value());

    // History before the rebase still resolves through the old segment
    EXPECT_FALSE(store.findAt("w1", "p2", 1).has_value());
    EXPECT_EQ(store.findAt("w1", "p1", 1)->version, static_cast<std::uint64_t>(2));

    store.put("w1", 3, makePoint("p2", 7.0, 7.0, 2));
    EXPECT_NEAR(store.find("w1", "p2")->parameter("x"), 7.0, 1e-12);
}

TEST_CASE(Register_RejectsDuplicatesAndUnknownBase) {
    EntityStore store;
    EXPECT_TRUE(store.registerWorkspace("main", std::nullopt, 0));
    EXPECT_FALSE(store.registerWorkspace("main", std::nullopt, 0));
    EXPECT_FALSE(store.registerWorkspace("w1", std::string("nope"), 0));
    EXPECT_FALSE(store.hasWorkspace("w1"));
}

TEST_CASE(ChildrenOf_FollowsParentIds) {
    EntityStore store;
    store.registerWorkspace("main", std::nullopt, 0);
    Entity sketch;
    sketch.id = "s1";
    sketch.type = EntityType::Sketch;
    store.put("main", 1, sketch);

    Entity solid;
    solid.id = "b1";
    solid.type = EntityType::Solid;
    solid.parameters = {{"height", 10.0}};
    solid.parentIds = {"s1"};
    store.put("main", 2, solid);

    const auto children = store.childrenOf("main", "s1");
    EXPECT_EQ(children.size(), static_cast<std::size_t>(1));
    EXPECT_TRUE(!children.empty() && children.front() == "b1");
}

TEST_CASE(Validation_PerTypeSchema) {
    EXPECT_TRUE(validateParameters(EntityType::Point, {{"x", 1.0}, {"y", 2.0}}).valid);
    EXPECT_FALSE(validateParameters(EntityType::Point, {{"x", 1.0}}).valid);
    EXPECT_FALSE(validateParameters(EntityType::Point, {{"x", 1.0}, {"y", 2.0}, {"z", 0.0}}).valid);
    EXPECT_FALSE(validateParameters(EntityType::Circle, {{"cx", 0.0}, {"cy", 0.0}, {"r", 0.0}}).valid);
    EXPECT_FALSE(validateParameters(EntityType::Line, {{"x1", 1.0}, {"y1", 1.0}, {"x2", 1.0}, {"y2", 1.0}}).valid);
    EXPECT_TRUE(validateParameters(EntityType::Sketch, {}).valid);
}

TEST_CASE(EntitySerialization_PreservesGeometry) {
    Entity original = makePoint("main:point_0000abcd", 1.5, -2.5, 4);
    original.createdBy = "agent-a";
    original.parentIds = {"main:sketch_00000001"};

    QJsonObject json;
    original.serialize(json);
    Entity restored;
    EXPECT_TRUE(restored.deserialize(json));
    EXPECT_TRUE(restored.sameGeometry(original));
    EXPECT_EQ(restored.version, static_cast<std::uint64_t>(4));
    EXPECT_EQ(restored.createdBy, std::string("agent-a"));
}

TEST_CASE(EntityIds_CarryWorkspaceAndType) {
    const EntityID id = generateEntityId("main", EntityType::Circle);
    EXPECT_EQ(id.rfind("main:circle_", 0), static_cast<std::size_t>(0));
    EXPECT_EQ(id.size(), std::string("main:circle_").size() + 8);
}

int main() {
    return agentcad::test::runAllTests();
}
