#include "Application.h"
#include "ModelService.h"

#include <QLoggingCategory>

#include <stdexcept>

namespace agentcad::app {

Q_LOGGING_CATEGORY(logApp, "agentcad.app")

Application::Application(EngineConfig config)
    : m_config(std::move(config)) {
}

Application::~Application() {
    if (m_initialized) {
        shutdown();
    }
}

bool Application::initialize() {
    if (m_initialized) {
        qCWarning(logApp) << "initialize: service already running";
        return true;
    }

    qCInfo(logApp) << "Effective configuration"
                   << "lengthTolerance=" << m_config.lengthTolerance
                   << "angleTolerance=" << m_config.angleTolerance
                   << "lockTtl=" << static_cast<qint64>(m_config.lockTtl.count())
                   << "mergeLockTtl=" << static_cast<qint64>(m_config.mergeLockTtl.count())
                   << "defaultAgent=" << m_config.defaultAgentId;

    if (m_config.lockTtl.count() <= 0 || m_config.mergeLockTtl.count() <= 0) {
        qCCritical(logApp) << "Lock TTLs must be positive";
        return false;
    }

    m_service = std::make_unique<ModelService>(m_config);
    m_initialized = true;
    qCInfo(logApp) << "Model service ready";
    return true;
}

void Application::shutdown() {
    if (!m_initialized) {
        return;
    }
    m_service.reset();
    m_initialized = false;
    qCInfo(logApp) << "Model service stopped";
}

ModelService& Application::service() {
    if (!m_service) {
        throw std::logic_error("Application::service() called before initialize()");
    }
    return *m_service;
}

} // namespace agentcad::app
