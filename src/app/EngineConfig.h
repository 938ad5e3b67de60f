#ifndef AGENTCAD_APP_ENGINECONFIG_H
#define AGENTCAD_APP_ENGINECONFIG_H

#include "../core/constraint/ConstraintGraph.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <chrono>

namespace agentcad::app {

/**
 * @brief Runtime settings of the model service
 *
 * Defaults, then the JSON config file, then AGENTCAD_* environment overrides.
 */
struct EngineConfig {
    double lengthTolerance = core::model::constants::kDefaultLengthTolerance;

    /// Degrees
    double angleTolerance = core::model::constants::kDefaultAngleTolerance;

    std::chrono::seconds lockTtl{300};
    std::chrono::seconds mergeLockTtl{120};

    QString defaultAgentId = QStringLiteral("anonymous");

    core::constraint::ToleranceSettings tolerances() const { return {lengthTolerance, angleTolerance}; }
};

struct ConfigLoadResult {
    bool success = false;
    QString errorMessage;

    EngineConfig config;

    /// Values that were rejected; the default was kept for each
    QStringList warnings;
};

class EngineConfigLoader {
public:
    /**
     * @brief Build the effective configuration
     *
     * @param explicitPath File named on the command line; when empty,
     *        AGENTCAD_CONFIG is consulted. A missing file is an error only
     *        when it was named explicitly.
     */
    static ConfigLoadResult load(const QString& explicitPath);

    /// Apply the keys present in @p json on top of @p config
    static void applyJson(const QJsonObject& json, EngineConfig& config, QStringList& warnings);

    /// Apply AGENTCAD_* environment overrides
    static void applyEnvironment(EngineConfig& config, QStringList& warnings);

private:
    EngineConfigLoader() = delete;
};

} // namespace agentcad::app

#endif // AGENTCAD_APP_ENGINECONFIG_H
