#include "EngineConfig.h"
#include "coordination/LeaseLockTable.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>

#include <cmath>
#include <optional>

namespace agentcad::app {

Q_LOGGING_CATEGORY(logConfig, "agentcad.app.config")

namespace {

constexpr const char* kConfigEnv = "AGENTCAD_CONFIG";

bool acceptTolerance(double value) {
    return std::isfinite(value) && value > 0.0;
}

void setTolerance(const QString& source, double value, double& target, QStringList& warnings) {
    if (!acceptTolerance(value)) {
        warnings << QStringLiteral("%1: tolerance must be a positive number").arg(source);
        return;
    }
    target = value;
}

void setTtl(const QString& source, double value, std::chrono::seconds& target, QStringList& warnings) {
    if (!(value >= 1.0 && value <= static_cast<double>(coordination::kMaxLeaseTtl.count()))) {
        warnings << QStringLiteral("%1: ttl must be between 1 and %2 seconds")
                        .arg(source)
                        .arg(static_cast<qint64>(coordination::kMaxLeaseTtl.count()));
        return;
    }
    target = std::chrono::seconds(static_cast<long long>(value));
}

/// Environment value parsed as a number; nullopt when unset
std::optional<double> environmentNumber(const char* name, QStringList& warnings) {
    if (!qEnvironmentVariableIsSet(name)) {
        return std::nullopt;
    }
    bool ok = false;
    const double value = qEnvironmentVariable(name).trimmed().toDouble(&ok);
    if (!ok) {
        warnings << QStringLiteral("%1: not a number").arg(QString::fromLatin1(name));
        return std::nullopt;
    }
    return value;
}

} // namespace

void EngineConfigLoader::applyJson(const QJsonObject& json, EngineConfig& config, QStringList& warnings) {
    auto number = [&](const char* key) -> std::optional<double> {
        const QJsonValue value = json.value(QLatin1String(key));
        if (value.isUndefined()) {
            return std::nullopt;
        }
        if (!value.isDouble()) {
            warnings << QStringLiteral("%1: expected a number").arg(QLatin1String(key));
            return std::nullopt;
        }
        return value.toDouble();
    };

    if (auto v = number("lengthTolerance")) setTolerance("lengthTolerance", *v, config.lengthTolerance, warnings);
    if (auto v = number("angleTolerance")) setTolerance("angleTolerance", *v, config.angleTolerance, warnings);
    if (auto v = number("lockTtlSeconds")) setTtl("lockTtlSeconds", *v, config.lockTtl, warnings);
    if (auto v = number("mergeLockTtlSeconds")) setTtl("mergeLockTtlSeconds", *v, config.mergeLockTtl, warnings);

    const QJsonValue agent = json.value(QLatin1String("defaultAgentId"));
    if (agent.isString() && !agent.toString().trimmed().isEmpty()) {
        config.defaultAgentId = agent.toString().trimmed();
    } else if (!agent.isUndefined()) {
        warnings << QStringLiteral("defaultAgentId: expected a non-empty string");
    }
}

void EngineConfigLoader::applyEnvironment(EngineConfig& config, QStringList& warnings) {
    if (auto v = environmentNumber("AGENTCAD_LENGTH_TOLERANCE", warnings)) {
        setTolerance("AGENTCAD_LENGTH_TOLERANCE", *v, config.lengthTolerance, warnings);
    }
    if (auto v = environmentNumber("AGENTCAD_ANGLE_TOLERANCE", warnings)) {
        setTolerance("AGENTCAD_ANGLE_TOLERANCE", *v, config.angleTolerance, warnings);
    }
    if (auto v = environmentNumber("AGENTCAD_LOCK_TTL", warnings)) {
        setTtl("AGENTCAD_LOCK_TTL", *v, config.lockTtl, warnings);
    }
    if (auto v = environmentNumber("AGENTCAD_MERGE_LOCK_TTL", warnings)) {
        setTtl("AGENTCAD_MERGE_LOCK_TTL", *v, config.mergeLockTtl, warnings);
    }
}

ConfigLoadResult EngineConfigLoader::load(const QString& explicitPath) {
    ConfigLoadResult result;

    const bool named = !explicitPath.isEmpty();
    const QString path = named ? explicitPath : qEnvironmentVariable(kConfigEnv).trimmed();

    if (!path.isEmpty()) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            if (named) {
                result.errorMessage = QStringLiteral("Cannot open config file: %1").arg(path);
                return result;
            }
            result.warnings << QStringLiteral("%1 names an unreadable file: %2")
                                   .arg(QString::fromLatin1(kConfigEnv), path);
        } else {
            QJsonParseError parseError;
            const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
            if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
                result.errorMessage = QStringLiteral("Invalid config file %1: %2").arg(path, parseError.errorString());
                return result;
            }
            applyJson(doc.object(), result.config, result.warnings);
            qCInfo(logConfig) << "Loaded config file" << path;
        }
    }

    applyEnvironment(result.config, result.warnings);

    for (const QString& warning : result.warnings) {
        qCWarning(logConfig).noquote() << "Config value ignored:" << warning;
    }

    qCInfo(logConfig) << "Effective config"
                      << "lengthTolerance=" << result.config.lengthTolerance
                      << "angleTolerance=" << result.config.angleTolerance
                      << "lockTtl=" << static_cast<qint64>(result.config.lockTtl.count())
                      << "mergeLockTtl=" << static_cast<qint64>(result.config.mergeLockTtl.count())
                      << "defaultAgent=" << result.config.defaultAgentId;

    result.success = true;
    return result;
}

} // namespace agentcad::app
