#include "test_harness/TestHarness.h"
#include "app/document/Document.h"
#include "core/geometry/AnalyticGeometryEngine.h"
#include "io/HistoryIO.h"

using namespace agentcad;
using app::OperationRecord;
using app::OperationType;
using core::constraint::ConstraintRequest;
using core::constraint::ConstraintType;
using core::model::EntityID;
using core::model::EntityType;
using core::model::ErrorKind;
namespace history = agentcad::app::history;

namespace {

const std::string kMain = "main";

struct Fixture {
    core::model::Timestamp clockNow = std::chrono::system_clock::time_point(std::chrono::seconds(1760000000));
    core::geometry::AnalyticGeometryEngine engine;
    app::Document doc{engine, core::constraint::ToleranceSettings{}, [this] { return clockNow; }};

    EntityID point(double x, double y) {
        auto r = doc.createEntity(kMain, EntityType::Point, {{"x", x}, {"y", y}}, {}, "agent-a");
        return r.entity ? r.entity->id : EntityID{};
    }

    app::ConstraintApplyResult distance(const EntityID& a, const EntityID& b, double value) {
        ConstraintRequest request;
        request.type = ConstraintType::Distance;
        request.entityIds = {a, b};
        request.parameters = {{"value", value}};
        request.agentId = "agent-a";
        return doc.applyConstraint(kMain, request);
    }

    app::ConstraintApplyResult constrain(ConstraintType type, std::vector<EntityID> ids) {
        ConstraintRequest request;
        request.type = type;
        request.entityIds = std::move(ids);
        request.agentId = "agent-a";
        return doc.applyConstraint(kMain, request);
    }
};

} // namespace

TEST_CASE(Log_AssignsSequentialEntries) {
    Fixture f;
    const auto p1 = f.point(0.0, 0.0);
    f.clockNow += std::chrono::seconds(1);
    const auto p2 = f.point(3.0, 4.0);
    f.distance(p1, p2, 5.0);

    const auto& entries = f.doc.state(kMain)->log.entries();
    EXPECT_EQ(entries.size(), static_cast<std::size_t>(3));
    for (std::size_t i = 0; i < entries.size(); ++i) {
        EXPECT_EQ(entries[i].sequence, static_cast<core::model::Sequence>(i + 1));
        EXPECT_EQ(entries[i].workspaceId, kMain);
        EXPECT_FALSE(entries[i].opId.empty());
    }
    EXPECT_TRUE(entries[0].type == OperationType::EntityCreate);
    EXPECT_TRUE(entries[2].type == OperationType::ConstraintApply);
    EXPECT_TRUE(entries[1].timestamp > entries[0].timestamp);
    EXPECT_FALSE(entries[0].entityDeltas.front().before.has_value());
    EXPECT_TRUE(entries[0].entityDeltas.front().after.has_value());

    const auto& log = f.doc.state(kMain)->log;
    EXPECT_EQ(log.countSince(1), static_cast<std::size_t>(2));
    EXPECT_TRUE(log.find(entries[1].opId) == &entries[1]);
    EXPECT_EQ(log.headOperationId(), entries[2].opId);
}

TEST_CASE(Undo_Create) {
    Fixture f;
    const auto p = f.point(1.0, 2.0);
    auto undone = f.doc.undo(kMain, "agent-a");
    EXPECT_OK(undone);
    EXPECT_TRUE(undone.revertedType == OperationType::EntityCreate);
    EXPECT_FALSE(f.doc.findEntity(kMain, p).has_value());

    const auto& entries = f.doc.state(kMain)->log.entries();
    EXPECT_EQ(entries.size(), static_cast<std::size_t>(2));
    EXPECT_TRUE(entries.back().type == OperationType::Undo);
    EXPECT_EQ(entries.back().reference, entries.front().opId);

    EXPECT_ERROR(f.doc.undo(kMain, "agent-a"), ErrorKind::InvalidRequest);
}

TEST_CASE(Undo_ModifyThenCreate) {
    Fixture f;
    const auto p = f.point(0.0, 0.0);
    EXPECT_OK(f.doc.modifyEntity(kMain, p, {{"x", 5.0}}, "agent-a"));

    auto first = f.doc.undo(kMain, "agent-a");
    EXPECT_OK(first);
    EXPECT_TRUE(first.revertedType == OperationType::EntityModify);
    auto restored = f.doc.findEntity(kMain, p);
    EXPECT_TRUE(restored.has_value());
    if (restored) {
        EXPECT_NEAR(restored->parameter("x"), 0.0, 1e-12);
        EXPECT_EQ(restored->version, static_cast<std::uint64_t>(3));
    }

    auto second = f.doc.undo(kMain, "agent-a");
    EXPECT_OK(second);
    EXPECT_TRUE(second.revertedType == OperationType::EntityCreate);
    EXPECT_FALSE(f.doc.findEntity(kMain, p).has_value());
}

TEST_CASE(Undo_DeleteRestoresEntitiesAndConstraints) {
    Fixture f;
    const auto p1 = f.point(0.0, 0.0);
    const auto p2 = f.point(3.0, 4.0);
    auto applied = f.distance(p1, p2, 5.0);
    EXPECT_OK(applied.apply);

    auto deleted = f.doc.deleteEntity(kMain, p1, "agent-a");
    EXPECT_OK(deleted);
    EXPECT_EQ(f.doc.state(kMain)->graph.size(), static_cast<std::size_t>(0));

    auto undone = f.doc.undo(kMain, "agent-a");
    EXPECT_OK(undone);
    EXPECT_TRUE(undone.revertedType == OperationType::EntityDelete);
    EXPECT_TRUE(f.doc.findEntity(kMain, p1).has_value());
    EXPECT_EQ(f.doc.state(kMain)->graph.size(), static_cast<std::size_t>(1));
    EXPECT_TRUE(undone.skippedConstraints.empty());
    if (applied.apply.constraint) {
        EXPECT_TRUE(f.doc.state(kMain)->graph.find(applied.apply.constraint->id) != nullptr);
    }
}

TEST_CASE(Undo_ConstraintApply) {
    Fixture f;
    const auto p1 = f.point(0.0, 0.0);
    const auto p2 = f.point(3.0, 4.0);
    EXPECT_OK(f.distance(p1, p2, 5.0).apply);

    auto undone = f.doc.undo(kMain, "agent-a");
    EXPECT_OK(undone);
    EXPECT_TRUE(undone.revertedType == OperationType::ConstraintApply);
    EXPECT_EQ(f.doc.state(kMain)->graph.size(), static_cast<std::size_t>(0));
    EXPECT_TRUE(f.doc.findEntity(kMain, p1).has_value());
}

TEST_CASE(Undo_ConstraintRemoveDemotesPromotedTwin) {
    Fixture f;
    const auto p1 = f.point(0.0, 0.0);
    const auto p2 = f.point(0.0, 0.0);
    auto c1 = f.constrain(ConstraintType::Coincident, {p1, p2});
    EXPECT_OK(c1.apply);
    EXPECT_OK(f.constrain(ConstraintType::Fixed, {p1}).apply);
    auto c2 = f.constrain(ConstraintType::Coincident, {p1, p2});
    EXPECT_OK(c2.apply);
    EXPECT_TRUE(c1.apply.constraint.has_value());
    EXPECT_TRUE(c2.apply.constraint.has_value());
    if (!c1.apply.constraint || !c2.apply.constraint) {
        return;
    }
    const auto c1Id = c1.apply.constraint->id;
    const auto c2Id = c2.apply.constraint->id;
    EXPECT_TRUE(c2.apply.constraint->status == core::constraint::ConstraintStatus::Redundant);

    EXPECT_OK(f.doc.removeConstraint(kMain, c1Id, "agent-a"));
    const auto* promoted = f.doc.state(kMain)->graph.find(c2Id);
    EXPECT_TRUE(promoted != nullptr && promoted->dofRemoved == 2);

    auto undone = f.doc.undo(kMain, "agent-a");
    EXPECT_OK(undone);
    EXPECT_TRUE(undone.revertedType == OperationType::ConstraintRemove);
    EXPECT_TRUE(undone.skippedConstraints.empty());

    const auto& graph = f.doc.state(kMain)->graph;
    const auto* original = graph.find(c1Id);
    const auto* twin = graph.find(c2Id);
    EXPECT_TRUE(original != nullptr);
    EXPECT_TRUE(twin != nullptr);
    if (original && twin) {
        EXPECT_EQ(original->dofRemoved, 2);
        EXPECT_TRUE(original->status == core::constraint::ConstraintStatus::Satisfied);
        EXPECT_EQ(twin->dofRemoved, 0);
        EXPECT_TRUE(twin->status == core::constraint::ConstraintStatus::Redundant);
    }

    auto status = f.doc.constraintStatus(kMain, std::nullopt);
    EXPECT_OK(status);
    EXPECT_EQ(status.report.totalDof, 4);
    EXPECT_EQ(status.report.dofRemaining, 0);
    EXPECT_EQ(status.report.redundant, 1);
}

TEST_CASE(Undo_StopsAtRebase) {
    history::OperationLog log("w1");
    OperationRecord create;
    create.type = OperationType::EntityCreate;
    log.append(create);
    EXPECT_TRUE(log.lastUndoable() != nullptr);

    OperationRecord rebase;
    rebase.type = OperationType::Rebase;
    rebase.reference = "main";
    log.append(rebase);
    EXPECT_TRUE(log.lastUndoable() == nullptr);

    OperationRecord modify;
    modify.type = OperationType::EntityModify;
    const auto& appended = log.append(modify);
    const OperationRecord* undoable = log.lastUndoable();
    EXPECT_TRUE(undoable != nullptr && undoable->opId == appended.opId);
    EXPECT_EQ(appended.sequence, static_cast<core::model::Sequence>(3));
}

TEST_CASE(Undo_UnknownWorkspace) {
    Fixture f;
    EXPECT_ERROR(f.doc.undo("ghost", "agent-a"), ErrorKind::WorkspaceNotFound);
}

TEST_CASE(HistoryIO_PreservesEntryContents) {
    Fixture f;
    const auto p1 = f.point(0.0, 0.0);
    const auto p2 = f.point(3.0, 4.0);
    EXPECT_OK(f.distance(p1, p2, 5.0).apply);

    for (const auto& entry : f.doc.state(kMain)->log.entries()) {
        OperationRecord parsed;
        QString error;
        EXPECT_TRUE(io::HistoryIO::deserializeOperation(io::HistoryIO::serializeOperation(entry), parsed, error));
        EXPECT_EQ(parsed.opId, entry.opId);
        EXPECT_EQ(parsed.sequence, entry.sequence);
        EXPECT_TRUE(parsed.type == entry.type);
        EXPECT_EQ(parsed.entityDeltas.size(), entry.entityDeltas.size());
        EXPECT_EQ(parsed.constraintDeltas.size(), entry.constraintDeltas.size());
        EXPECT_TRUE(parsed.timestamp == entry.timestamp);
    }

    QJsonObject broken;
    broken["opId"] = QStringLiteral("x");
    broken["type"] = QStringLiteral("teleport");
    OperationRecord ignored;
    QString error;
    EXPECT_FALSE(io::HistoryIO::deserializeOperation(broken, ignored, error));
    EXPECT_FALSE(error.isEmpty());
}

TEST_CASE(HistoryIO_HashTracksLog) {
    Fixture f;
    f.point(0.0, 0.0);
    const auto& entries = f.doc.state(kMain)->log.entries();
    const QString first = io::HistoryIO::computeOpsHash(entries);
    EXPECT_EQ(first.size(), 64);
    EXPECT_TRUE(first == io::HistoryIO::computeOpsHash(entries));

    f.point(1.0, 1.0);
    EXPECT_FALSE(first == io::HistoryIO::computeOpsHash(f.doc.state(kMain)->log.entries()));

    const QByteArray lines = io::HistoryIO::toJsonLines(f.doc.state(kMain)->log.entries());
    EXPECT_EQ(lines.count('\n'), 2);
}

int main() {
    return agentcad::test::runAllTests();
}
