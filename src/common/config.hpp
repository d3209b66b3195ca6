#pragma once

#include <filesystem>
#include <string>

#include <QString>

namespace driftwatch {

inline constexpr const char *kDefaultMonitoredDir = "/app/monitored-folder";
inline constexpr const char *kDefaultStatePath = "/app/scripts/file-state.json";

enum class StateBackend {
    Json,
    Sqlite
};

// Everything the ChangeDetector needs. Nothing in the detector reads the
// environment; callers fill this in.
struct DetectorConfig {
    std::filesystem::path monitoredDir = kDefaultMonitoredDir;
    std::filesystem::path statePath = kDefaultStatePath;
    StateBackend backend = StateBackend::Json;
    int lockTimeoutMs = 5000;
    int staleLockSeconds = 300;
};

bool parseStateBackend(const QString &value, StateBackend *backend);
QString toBackendString(StateBackend backend);

// Defaults overridden by MONITORED_FOLDER, STATE_FILE and
// DRIFTWATCH_STATE_BACKEND. Paths are made absolute.
// Throws DriftwatchError on an unknown backend name.
DetectorConfig loadConfigFromEnvironment();

std::filesystem::path absolutePath(const std::filesystem::path &path);

} // namespace driftwatch
