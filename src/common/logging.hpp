#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace clusterstat::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Call once from main(). Debug events are dropped unless trace is on.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// $CLUSTERSTAT_LOG_DIR, else ~/.local/share/clusterstat/logs.
QString logsDirPath();
// <logs dir>/<process>.log, rotated at 5 MiB into .1 .. .3.
QString logFilePath(const QString &processName);

// Correlation ids tie together the events of one collection pass or command.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();
QString newCorrelationId(const QString &prefix);

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

/**
 * Append one JSON line to the process event log:
 * what happened (what), the trigger (why), the mechanism (how) and the
 * acting user and host (who). An empty correlation id falls back to the
 * current scope.
 */
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace clusterstat::logging

#define CLUSTERSTAT_LOG_EVENT(level, component, where, what, why, how, who, corr, ctxJson) \
    ::clusterstat::logging::logEvent((level), ::clusterstat::logging::defaultProcessName(), \
                                     (component), (where), (what), (why), (how), (who), \
                                     (corr), (ctxJson))

#define CLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    CLUSTERSTAT_LOG_EVENT(::clusterstat::logging::LogLevel::Debug, component, where, what, \
                          why, how, who, corr, ctxJson)

#define CLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    CLUSTERSTAT_LOG_EVENT(::clusterstat::logging::LogLevel::Info, component, where, what, \
                          why, how, who, corr, ctxJson)

#define CLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    CLUSTERSTAT_LOG_EVENT(::clusterstat::logging::LogLevel::Warn, component, where, what, \
                          why, how, who, corr, ctxJson)

#define CLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    CLUSTERSTAT_LOG_EVENT(::clusterstat::logging::LogLevel::Error, component, where, what, \
                          why, how, who, corr, ctxJson)
