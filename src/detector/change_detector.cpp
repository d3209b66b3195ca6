#include "detector/change_detector.hpp"

#include <system_error>
#include <utility>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLockFile>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "detector/snapshot_builder.hpp"

namespace driftwatch {

namespace {

QString lockPathFor(const std::filesystem::path &statePath)
{
    return QFile::decodeName(QByteArray::fromStdString(statePath.string() + ".lock"));
}

QString lockErrorString(QLockFile::LockError error)
{
    switch (error) {
    case QLockFile::NoError:
        return QStringLiteral("no error");
    case QLockFile::LockFailedError:
        return QStringLiteral("held by another process");
    case QLockFile::PermissionError:
        return QStringLiteral("permission denied");
    case QLockFile::UnknownError:
        return QStringLiteral("unknown error");
    }
    return QStringLiteral("unknown error");
}

} // namespace

ChangeSet diffSnapshots(const Snapshot &previous, const Snapshot &current)
{
    ChangeSet changes;

    for (const auto &[path, record] : current) {
        const auto prev = previous.find(path);
        if (prev == previous.end()) {
            changes.created.push_back({ChangeKind::Created, path, record, std::nullopt});
        } else if (prev->second.modifiedAt != record.modifiedAt) {
            changes.modified.push_back({ChangeKind::Modified, path, record, prev->second});
        }
    }

    for (const auto &[path, record] : previous) {
        if (!current.contains(path)) {
            changes.deleted.push_back({ChangeKind::Deleted, path, std::nullopt, record});
        }
    }

    return changes;
}

ChangeDetector::ChangeDetector(DetectorConfig config)
    : m_config(std::move(config))
    , m_store(makeStateStore(m_config.backend, m_config.statePath))
{
}

ChangeDetector::ChangeDetector(DetectorConfig config, std::unique_ptr<StateStore> store)
    : m_config(std::move(config))
    , m_store(std::move(store))
{
}

ChangeDetector::~ChangeDetector() = default;

const DetectorConfig &ChangeDetector::config() const
{
    return m_config;
}

ChangeSet ChangeDetector::detectChanges()
{
    DWLOG_INFO(QStringLiteral("ChangeDetector"),
               QStringLiteral("detectChanges"),
               QStringLiteral("scan_start"),
               QStringLiteral("scheduled_scan"),
               (nlohmann::json{{"directory", m_config.monitoredDir.string()},
                               {"statePath", m_store->location().string()}}));

    // No state directory is created for a scan that cannot run.
    std::error_code error;
    if (!std::filesystem::is_directory(m_config.monitoredDir, error)) {
        throw DirectoryUnavailable(m_config.monitoredDir.string(),
                                   error ? error.message() : "not a directory");
    }

    const QString lockPath = lockPathFor(m_store->location());
    if (!QDir().mkpath(QFileInfo(lockPath).absolutePath())) {
        throw StateLockUnavailable("cannot create state directory for "
                                   + lockPath.toStdString());
    }

    QLockFile lock(lockPath);
    lock.setStaleLockTime(m_config.staleLockSeconds * 1000);
    if (!lock.tryLock(m_config.lockTimeoutMs)) {
        throw StateLockUnavailable("cannot lock " + lockPath.toStdString() + ": "
                                   + lockErrorString(lock.error()).toStdString());
    }

    const Snapshot previous = loadPreviousState();
    const Snapshot current = buildSnapshot(m_config.monitoredDir);

    ChangeSet changes = diffSnapshots(previous, current);
    persistState(current);

    DWLOG_DEBUG(QStringLiteral("ChangeDetector"),
                QStringLiteral("detectChanges"),
                QStringLiteral("scan_diffed"),
                QStringLiteral("scheduled_scan"),
                (nlohmann::json{{"previousFiles", previous.size()},
                                {"currentFiles", current.size()},
                                {"created", changes.created.size()},
                                {"modified", changes.modified.size()},
                                {"deleted", changes.deleted.size()}}));
    return changes;
}

Snapshot ChangeDetector::loadPreviousState()
{
    try {
        auto snapshot = m_store->load();
        if (!snapshot) {
            DWLOG_WARN(QStringLiteral("ChangeDetector"),
                       QStringLiteral("loadPreviousState"),
                       QStringLiteral("state_missing"),
                       QStringLiteral("starting_fresh"),
                       (nlohmann::json{{"statePath", m_store->location().string()}}));
            return {};
        }
        return std::move(*snapshot);
    } catch (const StateLoadFailure &ex) {
        DWLOG_WARN(QStringLiteral("ChangeDetector"),
                   QStringLiteral("loadPreviousState"),
                   QStringLiteral("state_load_failed"),
                   QStringLiteral("starting_fresh"),
                   (nlohmann::json{{"statePath", m_store->location().string()},
                                   {"error", ex.what()}}));
        return {};
    }
}

void ChangeDetector::persistState(const Snapshot &snapshot)
{
    try {
        m_store->save(snapshot);
        DWLOG_DEBUG(QStringLiteral("ChangeDetector"),
                    QStringLiteral("persistState"),
                    QStringLiteral("state_saved"),
                    QStringLiteral("scan_complete"),
                    (nlohmann::json{{"statePath", m_store->location().string()},
                                    {"files", snapshot.size()}}));
    } catch (const StateSaveFailure &ex) {
        DWLOG_ERROR(QStringLiteral("ChangeDetector"),
                    QStringLiteral("persistState"),
                    QStringLiteral("state_save_failed"),
                    QStringLiteral("state_drift"),
                    (nlohmann::json{{"statePath", m_store->location().string()},
                                    {"error", ex.what()}}));
    }
}

} // namespace driftwatch
