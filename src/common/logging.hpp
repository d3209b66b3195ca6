#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace driftwatch::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// Events below threshold are dropped. An empty logFilePath logs to stderr only.
void initLogging(const QString &processName,
                 LogLevel threshold,
                 const QString &logFilePath = QString());

LogLevel threshold();

// Accepts debug, info, warn/warning and error, case-insensitively.
bool parseLogLevel(const QString &value, LogLevel *level);
QString levelToString(LogLevel level);

// Thread-local correlation support for linking the events of one scan.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();
QString generateCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event, written as one JSON line. Use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();

} // namespace driftwatch::logging

#define DWLOG_DEBUG(component, where, what, why, ctxJson) \
    ::driftwatch::logging::logEvent(::driftwatch::logging::LogLevel::Debug, \
                                    ::driftwatch::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), QString(), (ctxJson))

#define DWLOG_INFO(component, where, what, why, ctxJson) \
    ::driftwatch::logging::logEvent(::driftwatch::logging::LogLevel::Info, \
                                    ::driftwatch::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), QString(), (ctxJson))

#define DWLOG_WARN(component, where, what, why, ctxJson) \
    ::driftwatch::logging::logEvent(::driftwatch::logging::LogLevel::Warn, \
                                    ::driftwatch::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), QString(), (ctxJson))

#define DWLOG_ERROR(component, where, what, why, ctxJson) \
    ::driftwatch::logging::logEvent(::driftwatch::logging::LogLevel::Error, \
                                    ::driftwatch::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), QString(), (ctxJson))
