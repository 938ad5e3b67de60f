#include "test_harness/TestHarness.h"
#include "app/EngineConfig.h"
#include "app/Logging.h"

#include <QJsonDocument>
#include <QTemporaryFile>

using agentcad::app::EngineConfig;
using agentcad::app::EngineConfigLoader;

namespace {

void clearEnvironment() {
    qunsetenv("AGENTCAD_CONFIG");
    qunsetenv("AGENTCAD_LENGTH_TOLERANCE");
    qunsetenv("AGENTCAD_ANGLE_TOLERANCE");
    qunsetenv("AGENTCAD_LOCK_TTL");
    qunsetenv("AGENTCAD_MERGE_LOCK_TTL");
}

} // namespace

TEST_CASE(Defaults_WithoutFileOrEnvironment) {
    clearEnvironment();
    const auto loaded = EngineConfigLoader::load(QString());
    EXPECT_TRUE(loaded.success);
    EXPECT_NEAR(loaded.config.lengthTolerance, 0.01, 1e-12);
    EXPECT_EQ(loaded.config.lockTtl.count(), 300);
    EXPECT_EQ(loaded.config.mergeLockTtl.count(), 120);
    EXPECT_TRUE(loaded.warnings.isEmpty());
}

TEST_CASE(Json_OverridesAndRejectsBadValues) {
    EngineConfig config;
    QStringList warnings;
    QJsonObject json{{"lengthTolerance", 0.5},
                     {"angleTolerance", -1.0},
                     {"lockTtlSeconds", 45},
                     {"mergeLockTtlSeconds", "soon"},
                     {"defaultAgentId", "planner"}};
    EngineConfigLoader::applyJson(json, config, warnings);

    EXPECT_NEAR(config.lengthTolerance, 0.5, 1e-12);
    EXPECT_NEAR(config.angleTolerance, 0.01, 1e-12);
    EXPECT_EQ(config.lockTtl.count(), 45);
    EXPECT_EQ(config.mergeLockTtl.count(), 120);
    EXPECT_TRUE(config.defaultAgentId == QStringLiteral("planner"));
    EXPECT_EQ(warnings.size(), 2);
    EXPECT_NEAR(config.tolerances().length, 0.5, 1e-12);
}

TEST_CASE(Json_RejectsOversizedTtl) {
    EngineConfig config;
    QStringList warnings;
    EngineConfigLoader::applyJson(QJsonObject{{"lockTtlSeconds", 1e300}}, config, warnings);
    EXPECT_EQ(config.lockTtl.count(), 300);
    EXPECT_EQ(warnings.size(), 1);
}

TEST_CASE(Environment_WinsOverFile) {
    clearEnvironment();
    QTemporaryFile file;
    EXPECT_TRUE(file.open());
    file.write(QJsonDocument(QJsonObject{{"lockTtlSeconds", 60}, {"lengthTolerance", 0.2}}).toJson());
    file.flush();

    qputenv("AGENTCAD_LOCK_TTL", "90");
    qputenv("AGENTCAD_ANGLE_TOLERANCE", "abc");
    const auto loaded = EngineConfigLoader::load(file.fileName());
    clearEnvironment();

    EXPECT_TRUE(loaded.success);
    EXPECT_EQ(loaded.config.lockTtl.count(), 90);
    EXPECT_NEAR(loaded.config.lengthTolerance, 0.2, 1e-12);
    EXPECT_NEAR(loaded.config.angleTolerance, 0.01, 1e-12);
    EXPECT_EQ(loaded.warnings.size(), 1);
}

TEST_CASE(MissingExplicitFile_IsAnError) {
    clearEnvironment();
    const auto loaded = EngineConfigLoader::load(QStringLiteral("/nonexistent/agentcad.json"));
    EXPECT_FALSE(loaded.success);
    EXPECT_FALSE(loaded.errorMessage.isEmpty());

    qputenv("AGENTCAD_CONFIG", "/nonexistent/agentcad.json");
    const auto fromEnvironment = EngineConfigLoader::load(QString());
    clearEnvironment();
    EXPECT_TRUE(fromEnvironment.success);
    EXPECT_EQ(fromEnvironment.warnings.size(), 1);
}

TEST_CASE(MalformedFile_IsAnError) {
    clearEnvironment();
    QTemporaryFile file;
    EXPECT_TRUE(file.open());
    file.write("{ lockTtlSeconds: ");
    file.flush();
    const auto loaded = EngineConfigLoader::load(file.fileName());
    EXPECT_FALSE(loaded.success);
}

TEST_CASE(LoggingOptions_ReadFromEnvironment) {
    qputenv("AGENTCAD_LOG_DEBUG", "yes");
    qputenv("AGENTCAD_LOG_DIR", "/tmp/agentcad-logs");
    qputenv("AGENTCAD_LOG_DEBUG_CATEGORIES", " agentcad.app.locks, agentcad.app.locks ,agentcad.io.dispatch");
    const auto options = agentcad::app::LoggingOptions::fromEnvironment(QStringLiteral("AgentCAD"), false);
    qunsetenv("AGENTCAD_LOG_DEBUG");
    qunsetenv("AGENTCAD_LOG_DIR");
    qunsetenv("AGENTCAD_LOG_DEBUG_CATEGORIES");

    EXPECT_TRUE(options.debugAll);
    EXPECT_TRUE(options.directory == QStringLiteral("/tmp/agentcad-logs"));
    EXPECT_EQ(options.debugCategories.size(), 2);
    EXPECT_EQ(options.retainedFiles, 20);
}

TEST_CASE(LoggingFilterRules_ReleaseEnablesOnlyListedCategories) {
    agentcad::app::LoggingOptions options;
    options.debugCategories << QStringLiteral("agentcad.app.locks");
    const QString rules = agentcad::app::Logging::filterRules(options);
    EXPECT_TRUE(rules.contains(QStringLiteral("*.debug=false")));
    EXPECT_TRUE(rules.contains(QStringLiteral("agentcad.app.locks.debug=true")));
    EXPECT_FALSE(rules.contains(QStringLiteral("agentcad.*.debug=true")));

    options.debugAll = true;
    EXPECT_TRUE(agentcad::app::Logging::filterRules(options).contains(QStringLiteral("agentcad.*.debug=true")));
}

int main() {
    return agentcad::test::runAllTests();
}
