#ifndef AGENTCAD_APP_LOGGING_H
#define AGENTCAD_APP_LOGGING_H

#include <QString>
#include <QStringList>

namespace agentcad::app {

struct LoggingOptions {
    QString appName;
    bool debugBuild = false;

    /// AGENTCAD_LOG_DEBUG: debug output for every agentcad category
    bool debugAll = false;

    /// AGENTCAD_LOG_DEBUG_CATEGORIES, used when debugAll is off
    QStringList debugCategories;

    /// AGENTCAD_LOG_DIR; empty selects the application data directory
    QString directory;

    int retainedFiles = 20;

    static LoggingOptions fromEnvironment(const QString& appName, bool debugBuild);
};

/**
 * @brief Process-wide Qt message handler
 *
 * Every record goes to stderr, since stdout carries protocol responses, and
 * to a per-session file when one could be opened.
 */
class Logging {
public:
    static bool initialize(const LoggingOptions& options);
    static void shutdown();
    static QString logFilePath();
    static bool isDebugLoggingEnabled();

    /// QLoggingCategory filter rules for @p options, one rule per line
    static QString filterRules(const LoggingOptions& options);

private:
    Logging() = delete;
};

} // namespace agentcad::app

#endif // AGENTCAD_APP_LOGGING_H
