#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <QUuid>

#include <unistd.h>

#include <memory>
#include <mutex>

namespace clusterstat::logging {

namespace {

constexpr qint64 kRotateAtBytes = 5 * 1024 * 1024;
// clusterstat.log.1 is the newest rotated file.
constexpr int kRotatedGenerations = 3;

struct LogState {
    std::mutex mutex;
    bool traceEnabled = false;
    QString processName;
    // The sink stays open between events and follows $CLUSTERSTAT_LOG_DIR.
    QString sinkPath;
    std::unique_ptr<QFile> sink;
};

LogState &state()
{
    static LogState s;
    return s;
}

thread_local QString t_corrId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString rotatedPath(const QString &path, int generation)
{
    return path + QLatin1Char('.') + QString::number(generation);
}

void shiftGenerations(const QString &path)
{
    QFile::remove(rotatedPath(path, kRotatedGenerations));
    for (int generation = kRotatedGenerations - 1; generation >= 1; --generation) {
        QFile::rename(rotatedPath(path, generation), rotatedPath(path, generation + 1));
    }
    QFile::rename(path, rotatedPath(path, 1));
}

// Caller holds the state mutex.
QFile *openSink(LogState &s, const QString &path)
{
    if (s.sink && s.sinkPath == path && s.sink->size() < kRotateAtBytes) {
        return s.sink.get();
    }

    s.sink.reset();
    QDir().mkpath(QFileInfo(path).absolutePath());
    if (QFileInfo(path).size() >= kRotateAtBytes) {
        shiftGenerations(path);
    }

    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return nullptr;
    }
    s.sinkPath = path;
    s.sink = std::move(file);
    return s.sink.get();
}

QString threadTag()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

nlohmann::json eventPayload(LogLevel level,
                            const QString &processName,
                            const QString &component,
                            const QString &where,
                            const QString &what,
                            const QString &why,
                            const QString &how,
                            const QString &who,
                            const QString &corr,
                            const nlohmann::json &context)
{
    return nlohmann::json{
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", processName.toStdString()},
        {"pid", static_cast<qint64>(::getpid())},
        {"thread", threadTag().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    LogState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.processName = processName;
    s.traceEnabled = traceEnabled;
}

bool isTraceEnabled()
{
    LogState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.traceEnabled;
}

QString logsDirPath()
{
    const QString overridden = qEnvironmentVariable("CLUSTERSTAT_LOG_DIR");
    if (!overridden.isEmpty()) {
        return overridden;
    }
    return QDir(qEnvironmentVariable("HOME")).filePath(QStringLiteral(".local/share/clusterstat/logs"));
}

QString logFilePath(const QString &processName)
{
    return QDir(logsDirPath()).filePath(processName + QStringLiteral(".log"));
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

QString newCorrelationId(const QString &prefix)
{
    const QString shortId = QUuid::createUuid().toString(QUuid::Id128).left(8);
    return prefix + QLatin1Char('-') + shortId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        LogState &s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (!s.processName.isEmpty()) {
            return s.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("clusterstat");
}

QString defaultWho()
{
    static const QString who = [] {
        char hostname[256] = {};
        if (::gethostname(hostname, sizeof(hostname) - 1) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2")
            .arg(QString::fromLocal8Bit(hostname))
            .arg(static_cast<qint64>(::getuid()));
    }();
    return who;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    if (level == LogLevel::Debug && !isTraceEnabled()) {
        return;
    }

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    const std::string line = eventPayload(level, process, component, where, what, why, how,
                                          who, corr, context)
                                 .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
        + "\n";
    const QString path = logFilePath(process);

    LogState &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    QFile *sink = openSink(s, path);
    if (!sink) {
        // Event logging never fails a command.
        return;
    }
    sink->write(line.data(), static_cast<qint64>(line.size()));
    sink->flush();
}

} // namespace clusterstat::logging
