#include "test_harness/TestHarness.h"
#include "io/RequestDispatcher.h"

#include <QJsonArray>
#include <QJsonDocument>

using namespace agentcad;

namespace {

struct Fixture {
    core::model::Timestamp clockNow = std::chrono::system_clock::time_point(std::chrono::seconds(1760000000));
    app::ModelService service{app::EngineConfig{}, [this] { return clockNow; }};
    io::RequestDispatcher dispatcher{service};
    int nextId = 1;

    QJsonObject call(const QString& method, const QJsonObject& params) {
        QJsonObject request;
        request["id"] = nextId++;
        request["method"] = method;
        request["params"] = params;
        return dispatcher.handle(request);
    }

    QJsonObject result(const QString& method, const QJsonObject& params) {
        return call(method, params).value("result").toObject();
    }

    int errorCode(const QJsonObject& response) {
        return response.value("error").toObject().value("code").toInt();
    }

    QString createPoint(const QString& ws, double x, double y) {
        QJsonObject params{{"workspace", ws}, {"type", "point"},
                           {"parameters", QJsonObject{{"x", x}, {"y", y}}}, {"agent", "agent-a"}};
        return result("entity.create", params).value("entity").toObject().value("id").toString();
    }

    QString createLine(const QString& ws, double x1, double y1, double x2, double y2) {
        QJsonObject params{{"workspace", ws}, {"type", "line"},
                           {"parameters", QJsonObject{{"x1", x1}, {"y1", y1}, {"x2", x2}, {"y2", y2}}}};
        return result("entity.create", params).value("entity").toObject().value("id").toString();
    }

    QString createCircle(const QString& ws, double cx, double cy, double r) {
        QJsonObject params{{"workspace", ws}, {"type", "circle"},
                           {"parameters", QJsonObject{{"cx", cx}, {"cy", cy}, {"r", r}}}};
        return result("entity.create", params).value("entity").toObject().value("id").toString();
    }
};

} // namespace

TEST_CASE(Dispatch_EntityLifecycle) {
    Fixture f;
    const QString id = f.createPoint("main", 1.0, 2.0);
    EXPECT_FALSE(id.isEmpty());

    auto query = f.result("entity.query", {{"workspace", "main"}, {"entity_id", id}});
    const QJsonObject entity = query.value("entity").toObject();
    EXPECT_EQ(entity.value("type").toString().toStdString(), std::string("point"));
    EXPECT_NEAR(entity.value("parameters").toObject().value("y").toDouble(), 2.0, 1e-12);
    EXPECT_EQ(entity.value("createdBy").toString().toStdString(), std::string("agent-a"));

    auto modified = f.result("entity.modify", {{"workspace", "main"}, {"entity_id", id},
                                               {"parameters", QJsonObject{{"x", 4.0}}}});
    EXPECT_EQ(modified.value("entity").toObject().value("version").toInt(), 2);

    auto listed = f.result("entity.list", {{"workspace", "main"}, {"type", "point"}});
    EXPECT_EQ(listed.value("count").toInt(), 1);

    auto deleted = f.result("entity.delete", {{"workspace", "main"}, {"entity_id", id}});
    EXPECT_EQ(deleted.value("deleted_entities").toArray().size(), 1);
    EXPECT_EQ(f.errorCode(f.call("entity.query", {{"workspace", "main"}, {"entity_id", id}})),
              io::rpc::kEntityNotFound);
}

TEST_CASE(Dispatch_DistanceConstraintSatisfied) {
    Fixture f;
    const QString p1 = f.createPoint("main", 0.0, 0.0);
    const QString p2 = f.createPoint("main", 3.0, 4.0);

    auto applied = f.result("constraint.apply", {{"workspace", "main"}, {"type", "distance"},
                                                 {"entities", QJsonArray{p1, p2}},
                                                 {"parameters", QJsonObject{{"value", 5.0}}}});
    EXPECT_EQ(applied.value("status").toString().toStdString(), std::string("satisfied"));
    EXPECT_EQ(applied.value("dof_removed").toInt(), 1);
    EXPECT_EQ(applied.value("dof_remaining").toInt(), 3);

    auto duplicate = f.result("constraint.apply", {{"workspace", "main"}, {"type", "distance"},
                                                   {"entities", QJsonArray{p1, p2}},
                                                   {"parameters", QJsonObject{{"value", 5.0}}}});
    EXPECT_EQ(duplicate.value("status").toString().toStdString(), std::string("redundant"));

    auto status = f.result("constraint.status", {{"workspace", "main"}});
    EXPECT_EQ(status.value("counts").toObject().value("redundant").toInt(), 1);
    EXPECT_EQ(status.value("dof_remaining").toInt(), 3);
}

TEST_CASE(Dispatch_ConstraintConflictCarriesDetail) {
    Fixture f;
    const QString l1 = f.createLine("main", 0.0, 0.0, 1.0, 0.0);
    const QString l2 = f.createLine("main", 0.0, 0.0, 0.0, 1.0);
    auto perpendicular = f.result("constraint.apply", {{"workspace", "main"}, {"type", "perpendicular"},
                                                       {"entities", QJsonArray{l1, l2}}});
    const QString perpendicularId = perpendicular.value("constraint_id").toString();

    auto response = f.call("constraint.apply", {{"workspace", "main"}, {"type", "parallel"},
                                                {"entities", QJsonArray{l1, l2}}});
    EXPECT_EQ(f.errorCode(response), io::rpc::kConstraintConflict);
    const QJsonArray conflicting =
        response.value("error").toObject().value("data").toObject().value("conflicting_constraints").toArray();
    EXPECT_EQ(conflicting.size(), 1);
    EXPECT_TRUE(!conflicting.isEmpty() && conflicting.first().toString() == perpendicularId);
}

TEST_CASE(Dispatch_ErrorCodes) {
    Fixture f;
    EXPECT_EQ(f.errorCode(f.call("entity.teleport", {})), io::rpc::kMethodNotFound);
    EXPECT_EQ(f.errorCode(f.call("entity.create", {{"workspace", "main"}})), io::rpc::kInvalidParams);
    EXPECT_EQ(f.errorCode(f.call("entity.create", {{"workspace", "ghost"}, {"type", "point"},
                                                   {"parameters", QJsonObject{{"x", 0.0}, {"y", 0.0}}}})),
              io::rpc::kWorkspaceNotFound);
    EXPECT_EQ(f.errorCode(f.call("constraint.apply", {{"workspace", "main"}, {"type", "glue"},
                                                      {"entities", QJsonArray{"a"}}})),
              io::rpc::kInvalidConstraint);
    EXPECT_EQ(f.errorCode(f.call("workspace.create", {{"name", "W1"}, {"base", "ghost"}})), io::rpc::kBaseNotFound);
    EXPECT_EQ(f.errorCode(f.call("history.undo", {{"workspace", "main"}})), io::rpc::kInvalidParams);

    const QByteArray garbage = f.dispatcher.handleLine("{not json");
    const QJsonObject parsed = QJsonDocument::fromJson(garbage).object();
    EXPECT_EQ(parsed.value("error").toObject().value("code").toInt(), io::rpc::kParseError);
    EXPECT_TRUE(parsed.value("id").isNull());
}

TEST_CASE(Dispatch_ResponseEchoesId) {
    Fixture f;
    const QByteArray line = R"({"id":"req-7","method":"workspace.list","params":{}})";
    const QJsonObject response = QJsonDocument::fromJson(f.dispatcher.handleLine(line)).object();
    EXPECT_EQ(response.value("id").toString().toStdString(), std::string("req-7"));
    EXPECT_EQ(response.value("result").toObject().value("workspaces").toArray().size(), 1);
}

TEST_CASE(Dispatch_MergeConflictAndResolution) {
    Fixture f;
    const QString c = f.createCircle("main", 0.0, 0.0, 5.0);
    auto created = f.result("workspace.create", {{"name", "W1"}, {"agent", "agent-a"}});
    EXPECT_EQ(created.value("workspace_id").toString().toStdString(), std::string("W1"));
    EXPECT_EQ(created.value("base").toString().toStdString(), std::string("main"));

    f.call("entity.modify", {{"workspace", "W1"}, {"entity_id", c}, {"parameters", QJsonObject{{"r", 7.0}}}});
    f.call("entity.modify", {{"workspace", "main"}, {"entity_id", c}, {"parameters", QJsonObject{{"r", 10.0}}}});

    auto status = f.result("workspace.status", {{"workspace", "W1"}});
    EXPECT_EQ(status.value("branch_status").toString().toStdString(), std::string("modified"));
    EXPECT_TRUE(status.value("can_merge").toBool());
    EXPECT_EQ(status.value("history_hash").toString().size(), 64);

    auto conflict = f.call("workspace.merge", {{"source", "W1"}, {"target", "main"}});
    EXPECT_EQ(f.errorCode(conflict), io::rpc::kWorkspaceConflict);
    const QJsonArray conflicts = conflict.value("error").toObject().value("data").toObject().value("conflicts").toArray();
    EXPECT_EQ(conflicts.size(), 1);
    if (!conflicts.isEmpty()) {
        const QJsonObject first = conflicts.first().toObject();
        EXPECT_EQ(first.value("conflict_type").toString().toStdString(), std::string("both_modified"));
        EXPECT_EQ(first.value("resolution_options").toArray().size(), 3);
    }

    QJsonObject manual{{"resolution", "manual_merge"}, {"parameters", QJsonObject{{"r", 8.0}}}};
    auto merged = f.result("workspace.merge", {{"source", "W1"}, {"target", "main"}, {"strategy", "manual"},
                                               {"resolutions", QJsonObject{{c, manual}}}});
    EXPECT_EQ(merged.value("entities_modified").toInt(), 1);
    EXPECT_EQ(merged.value("resolved_conflicts").toArray().size(), 1);

    auto query = f.result("entity.query", {{"workspace", "main"}, {"entity_id", c}});
    EXPECT_NEAR(query.value("entity").toObject().value("parameters").toObject().value("r").toDouble(), 8.0, 1e-12);
    auto after = f.result("workspace.status", {{"workspace", "W1"}});
    EXPECT_EQ(after.value("branch_status").toString().toStdString(), std::string("merged"));
}

TEST_CASE(Dispatch_LockLeaseExpires) {
    Fixture f;
    QJsonObject a{{"resource_type", "entity"}, {"resource_name", "main:sketch_1"},
                  {"agent", "agent-a"}, {"session", "s1"}, {"ttl", 30}};
    QJsonObject b = a;
    b["agent"] = "agent-b";
    b["session"] = "s2";

    auto granted = f.result("lock.acquire", a);
    EXPECT_TRUE(granted.value("granted").toBool());

    auto refused = f.call("lock.acquire", b);
    EXPECT_EQ(f.errorCode(refused), io::rpc::kAlreadyLocked);
    EXPECT_EQ(refused.value("error").toObject().value("data").toObject().value("holder").toString().toStdString(),
              std::string("agent-a"));

    f.clockNow += std::chrono::seconds(31);
    auto later = f.result("lock.acquire", b);
    EXPECT_TRUE(later.value("granted").toBool());
    EXPECT_EQ(later.value("lock").toObject().value("holder").toString().toStdString(), std::string("agent-b"));

    auto released = f.result("lock.release", b);
    EXPECT_TRUE(released.value("released").toBool());
    auto status = f.result("lock.status", b);
    EXPECT_FALSE(status.value("locked").toBool());
}

TEST_CASE(Dispatch_LockTtlOutOfRange) {
    Fixture f;
    QJsonObject request{{"resource_type", "entity"}, {"resource_name", "main:sketch_1"},
                        {"agent", "agent-a"}, {"ttl", 1e300}};
    EXPECT_EQ(f.errorCode(f.call("lock.acquire", request)), io::rpc::kInvalidParams);

    request["ttl"] = static_cast<double>(app::coordination::kMaxLeaseTtl.count()) + 1.0;
    EXPECT_EQ(f.errorCode(f.call("lock.acquire", request)), io::rpc::kInvalidParams);

    request["ttl"] = 0.5;
    EXPECT_EQ(f.errorCode(f.call("lock.acquire", request)), io::rpc::kInvalidParams);

    auto status = f.result("lock.status", request);
    EXPECT_FALSE(status.value("locked").toBool());

    request["ttl"] = static_cast<double>(app::coordination::kMaxLeaseTtl.count());
    EXPECT_TRUE(f.result("lock.acquire", request).value("granted").toBool());
}

TEST_CASE(Dispatch_HistoryAndUndo) {
    Fixture f;
    const QString p = f.createPoint("main", 0.0, 0.0);
    auto before = f.result("history.list", {{"workspace", "main"}});
    EXPECT_EQ(before.value("count").toInt(), 1);

    auto undone = f.result("history.undo", {{"workspace", "main"}});
    EXPECT_EQ(undone.value("reverted_type").toString().toStdString(), std::string("entity_create"));

    auto after = f.result("history.list", {{"workspace", "main"}});
    EXPECT_EQ(after.value("count").toInt(), 2);
    EXPECT_FALSE(after.value("hash").toString() == before.value("hash").toString());
    EXPECT_EQ(f.errorCode(f.call("entity.query", {{"workspace", "main"}, {"entity_id", p}})),
              io::rpc::kEntityNotFound);
}

int main() {
    return agentcad::test::runAllTests();
}
