#include "Logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMessageLogContext>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QTextStream>

#include <cstdlib>
#include <exception>
#include <iostream>

namespace agentcad::app {
namespace {

struct SessionSink {
    QMutex mutex;
    QFile file;
    bool installed = false;
    bool debugEnabled = false;
    QtMessageHandler previousHandler = nullptr;
    std::terminate_handler previousTerminate = nullptr;
};

SessionSink& sink() {
    static SessionSink instance;
    return instance;
}

bool isTruthy(const QString& value) {
    const QString v = value.trimmed().toLower();
    return v == QLatin1String("1") || v == QLatin1String("true") || v == QLatin1String("yes")
           || v == QLatin1String("on");
}

QLatin1String levelTag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:
            return QLatin1String("debug");
        case QtInfoMsg:
            return QLatin1String("info");
        case QtWarningMsg:
            return QLatin1String("warn");
        case QtCriticalMsg:
            return QLatin1String("error");
        case QtFatalMsg:
            return QLatin1String("fatal");
    }
    return QLatin1String("?");
}

QString formatRecord(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    QString line = QStringLiteral("%1 %2 %3: %4")
                       .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs),
                            QString(levelTag(type)),
                            context.category ? QString::fromUtf8(context.category) : QStringLiteral("default"),
                            msg);
    if (context.file && context.line > 0 && type != QtInfoMsg) {
        line += QStringLiteral(" (%1:%2)").arg(QFileInfo(QString::fromUtf8(context.file)).fileName()).arg(context.line);
    }
    return line;
}

// Caller holds the sink mutex
void appendToFile(SessionSink& s, const QString& line) {
    if (!s.file.isOpen()) {
        return;
    }
    QTextStream stream(&s.file);
    stream << line << '\n';
    stream.flush();
}

void handleMessage(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString line = formatRecord(type, context, msg);
    SessionSink& s = sink();
    {
        QMutexLocker lock(&s.mutex);
        appendToFile(s, line);
    }
    std::cerr << line.toStdString() << std::endl;

    if (type == QtFatalMsg) {
        std::abort();
    }
}

void handleTerminate() {
    const QString line = QStringLiteral("%1 fatal agentcad: std::terminate called (unhandled exception)")
                             .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs));
    SessionSink& s = sink();
    {
        QMutexLocker lock(&s.mutex);
        appendToFile(s, line);
    }
    std::cerr << line.toStdString() << std::endl;

    if (s.previousTerminate) {
        s.previousTerminate();
    }
    std::abort();
}

QString resolveDirectory(const LoggingOptions& options) {
    if (!options.directory.trimmed().isEmpty()) {
        return QDir::cleanPath(options.directory.trimmed());
    }
    const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (!dataDir.isEmpty()) {
        return QDir(dataDir).filePath(QStringLiteral("logs"));
    }
    return QDir(QStandardPaths::writableLocation(QStandardPaths::TempLocation))
        .filePath(QStringLiteral("agentcad/logs"));
}

/// Removes the oldest session files beyond @p keep; returns how many were removed
int pruneSessions(const QDir& dir, int keep, const QString& current) {
    const QFileInfoList sessions = dir.entryInfoList({QStringLiteral("*.log")}, QDir::Files, QDir::Time);
    int removed = 0;
    for (int i = keep; i < sessions.size(); ++i) {
        const QString path = sessions.at(i).absoluteFilePath();
        if (path == current) {
            continue;
        }
        if (QFile::remove(path)) {
            ++removed;
        } else {
            qWarning().noquote() << "Could not remove old log" << path;
        }
    }
    return removed;
}

} // namespace

LoggingOptions LoggingOptions::fromEnvironment(const QString& appName, bool debugBuild) {
    LoggingOptions options;
    options.appName = appName;
    options.debugBuild = debugBuild;
    options.debugAll = isTruthy(qEnvironmentVariable("AGENTCAD_LOG_DEBUG"));
    options.directory = qEnvironmentVariable("AGENTCAD_LOG_DIR");

    for (const QString& token : qEnvironmentVariable("AGENTCAD_LOG_DEBUG_CATEGORIES").split(',', Qt::SkipEmptyParts)) {
        const QString category = token.trimmed();
        if (!category.isEmpty() && !options.debugCategories.contains(category)) {
            options.debugCategories.push_back(category);
        }
    }
    return options;
}

QString Logging::filterRules(const LoggingOptions& options) {
    QStringList rules{
        QStringLiteral("*.debug=false"),
        QStringLiteral("agentcad*.info=true"),
    };

    if (options.debugBuild || options.debugAll) {
        rules << QStringLiteral("agentcad.debug=true") << QStringLiteral("agentcad.*.debug=true");
    } else {
        for (const QString& category : options.debugCategories) {
            rules << QStringLiteral("%1.debug=true").arg(category);
        }
    }
    return rules.join('\n');
}

bool Logging::initialize(const LoggingOptions& options) {
    SessionSink& s = sink();
    QString openedPath;
    QString problem;
    {
        QMutexLocker lock(&s.mutex);
        if (s.installed) {
            return true;
        }

        QLoggingCategory::setFilterRules(filterRules(options));
        s.debugEnabled = options.debugBuild || options.debugAll;

        const QDir dir(resolveDirectory(options));
        if (!dir.exists() && !QDir().mkpath(dir.path())) {
            problem = QStringLiteral("cannot create log directory %1").arg(dir.path());
        } else {
            const QString name = QStringLiteral("%1-%2-%3.log")
                                     .arg(options.appName.toLower(),
                                          QDateTime::currentDateTimeUtc().toString(QStringLiteral("yyyyMMdd-HHmmss")))
                                     .arg(QCoreApplication::applicationPid());
            s.file.setFileName(dir.filePath(name));
            if (s.file.open(QIODevice::WriteOnly | QIODevice::Text)) {
                openedPath = QFileInfo(s.file).absoluteFilePath();
            } else {
                problem = QStringLiteral("cannot open log file %1").arg(s.file.fileName());
            }
        }

        s.previousHandler = qInstallMessageHandler(handleMessage);
        s.previousTerminate = std::set_terminate(handleTerminate);
        s.installed = true;
    }

    if (!problem.isEmpty()) {
        qWarning().noquote() << "File logging disabled:" << problem;
        return true;
    }

    const int pruned = pruneSessions(QFileInfo(openedPath).absoluteDir(), options.retainedFiles, openedPath);
    qInfo().noquote() << "Logging to" << openedPath << "debug=" << s.debugEnabled << "pruned=" << pruned;
    return true;
}

void Logging::shutdown() {
    SessionSink& s = sink();
    QMutexLocker lock(&s.mutex);
    if (!s.installed) {
        return;
    }
    qInstallMessageHandler(s.previousHandler);
    std::set_terminate(s.previousTerminate);
    s.previousHandler = nullptr;
    s.previousTerminate = nullptr;
    if (s.file.isOpen()) {
        s.file.close();
    }
    s.installed = false;
}

QString Logging::logFilePath() {
    SessionSink& s = sink();
    QMutexLocker lock(&s.mutex);
    return s.file.isOpen() ? QFileInfo(s.file).absoluteFilePath() : QString();
}

bool Logging::isDebugLoggingEnabled() {
    SessionSink& s = sink();
    QMutexLocker lock(&s.mutex);
    return s.debugEnabled;
}

} // namespace agentcad::app
