#include "common/config.hpp"

#include <system_error>

#include <QtGlobal>

#include "common/errors.hpp"

namespace driftwatch {

bool parseStateBackend(const QString &value, StateBackend *backend)
{
    const QString normalized = value.trimmed().toLower();
    StateBackend parsed;
    if (normalized == QStringLiteral("json")) {
        parsed = StateBackend::Json;
    } else if (normalized == QStringLiteral("sqlite")) {
        parsed = StateBackend::Sqlite;
    } else {
        return false;
    }

    if (backend) {
        *backend = parsed;
    }
    return true;
}

QString toBackendString(StateBackend backend)
{
    switch (backend) {
    case StateBackend::Json:
        return QStringLiteral("json");
    case StateBackend::Sqlite:
        return QStringLiteral("sqlite");
    }
    return QStringLiteral("json");
}

std::filesystem::path absolutePath(const std::filesystem::path &path)
{
    if (path.empty()) {
        return path;
    }

    std::error_code error;
    auto absolute = std::filesystem::absolute(path, error);
    if (error) {
        return path;
    }

    absolute = absolute.lexically_normal();
    // "/data/dir/" and "/data/dir" must key the same snapshot entries.
    if (absolute.has_relative_path() && !absolute.has_filename()) {
        absolute = absolute.parent_path();
    }
    return absolute;
}

DetectorConfig loadConfigFromEnvironment()
{
    DetectorConfig config;

    const QString monitored = qEnvironmentVariable("MONITORED_FOLDER");
    if (!monitored.isEmpty()) {
        config.monitoredDir = monitored.toStdString();
    }

    const QString state = qEnvironmentVariable("STATE_FILE");
    if (!state.isEmpty()) {
        config.statePath = state.toStdString();
    }

    const QString backend = qEnvironmentVariable("DRIFTWATCH_STATE_BACKEND");
    if (!backend.isEmpty() && !parseStateBackend(backend, &config.backend)) {
        throw DriftwatchError("unknown state backend: " + backend.toStdString());
    }

    config.monitoredDir = absolutePath(config.monitoredDir);
    config.statePath = absolutePath(config.statePath);
    return config;
}

} // namespace driftwatch
