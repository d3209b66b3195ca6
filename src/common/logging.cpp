#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QUuid>

#include <cstdio>
#include <mutex>

namespace driftwatch::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
LogLevel g_threshold = LogLevel::Info;
QString g_processName;
QString g_logFilePath;

thread_local QString t_corrId;

void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void writeLine(const QString &path, const QByteArray &line)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return;
    }

    file.write(line);
    file.write("\n");
}

} // namespace

void initLogging(const QString &processName,
                 LogLevel threshold,
                 const QString &logFilePath)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_threshold = threshold;
    g_logFilePath = logFilePath;
}

LogLevel threshold()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_threshold;
}

bool parseLogLevel(const QString &value, LogLevel *level)
{
    const QString normalized = value.trimmed().toLower();
    LogLevel parsed;
    if (normalized == QStringLiteral("debug")) {
        parsed = LogLevel::Debug;
    } else if (normalized == QStringLiteral("info")) {
        parsed = LogLevel::Info;
    } else if (normalized == QStringLiteral("warn")
               || normalized == QStringLiteral("warning")) {
        parsed = LogLevel::Warn;
    } else if (normalized == QStringLiteral("error")) {
        parsed = LogLevel::Error;
    } else {
        return false;
    }

    if (level) {
        *level = parsed;
    }
    return true;
}

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

QString generateCorrelationId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
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
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (!g_processName.isEmpty()) {
            return g_processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("driftwatch");
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &correlationId,
              const nlohmann::json &context)
{
    if (level < threshold()) {
        return;
    }

    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", process.toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    std::lock_guard<std::mutex> lock(g_logMutex);
    std::fprintf(stderr, "%s\n", line.constData());
    if (!g_logFilePath.isEmpty()) {
        writeLine(g_logFilePath, line);
    }
}

} // namespace driftwatch::logging
