#ifndef AGENTCAD_APP_APPLICATION_H
#define AGENTCAD_APP_APPLICATION_H

#include "EngineConfig.h"

#include <QString>

#include <memory>

namespace agentcad::app {

class ModelService;

/**
 * @brief Process-level controller for the AgentCAD model service.
 *
 * Owns the ModelService that every transport forwards requests to.
 */
class Application {
public:
    explicit Application(EngineConfig config);
    ~Application();

    bool initialize();
    void shutdown();

    /// Valid between initialize() and shutdown()
    ModelService& service();

    const EngineConfig& config() const { return m_config; }

    // Application metadata
    static QString appName() { return QStringLiteral("AgentCAD"); }
    static QString appVersion() { return QStringLiteral("0.1.0"); }
    static QString orgName() { return QStringLiteral("AgentCAD"); }
    static QString orgDomain() { return QStringLiteral("agentcad.dev"); }

private:
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    EngineConfig m_config;
    std::unique_ptr<ModelService> m_service;
    bool m_initialized = false;
};

} // namespace agentcad::app

#endif // AGENTCAD_APP_APPLICATION_H
