#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>

#include "app/Application.h"
#include "app/EngineConfig.h"
#include "app/Logging.h"
#include "io/RequestDispatcher.h"

// OpenCASCADE (OCCT)
#include <Standard_Version.hxx>

#include <iostream>
#include <string>

Q_LOGGING_CATEGORY(logMain, "agentcad.main")

int main(int argc, char* argv[]) {
#ifdef NDEBUG
    constexpr bool debugBuild = false;
#else
    constexpr bool debugBuild = true;
#endif

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(agentcad::app::Application::appName());
    QCoreApplication::setApplicationVersion(agentcad::app::Application::appVersion());
    QCoreApplication::setOrganizationName(agentcad::app::Application::orgName());
    QCoreApplication::setOrganizationDomain(agentcad::app::Application::orgDomain());

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Geometric model service for concurrent agents (JSON lines on stdin/stdout)"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(QStringList() << QStringLiteral("c") << QStringLiteral("config"),
                                          QStringLiteral("Engine configuration file (JSON)."),
                                          QStringLiteral("file"));
    parser.addOption(configOption);
    parser.process(app);

    const auto logging = agentcad::app::LoggingOptions::fromEnvironment(agentcad::app::Application::appName(), debugBuild);
    if (!agentcad::app::Logging::initialize(logging)) {
        return 1;
    }

    qCInfo(logMain) << "Application startup initiated"
                    << "argc=" << argc
                    << "debugBuild=" << debugBuild;

    const auto loaded = agentcad::app::EngineConfigLoader::load(parser.value(configOption));
    if (!loaded.success) {
        qCCritical(logMain).noquote() << loaded.errorMessage;
        agentcad::app::Logging::shutdown();
        return 2;
    }

    agentcad::app::Application agentCAD(loaded.config);
    if (!agentCAD.initialize()) {
        qCCritical(logMain) << "Failed to initialize AgentCAD application";
        agentcad::app::Logging::shutdown();
        return 1;
    }

    qCInfo(logMain) << "Dependency versions"
                    << "qt=" << qVersion()
                    << "occt=" << OCC_VERSION_COMPLETE;

    agentcad::io::RequestDispatcher dispatcher(agentCAD.service());
    qCInfo(logMain) << "Serving requests on stdin"
                    << "logFilePath=" << agentcad::app::Logging::logFilePath();

    std::size_t handled = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        const QByteArray response = dispatcher.handleLine(QByteArray::fromStdString(line));
        std::cout << response.toStdString() << '\n';
        std::cout.flush();
        ++handled;
    }

    qCInfo(logMain) << "Input closed" << "requestsHandled=" << static_cast<qulonglong>(handled);

    agentCAD.shutdown();
    agentcad::app::Logging::shutdown();
    return 0;
}
