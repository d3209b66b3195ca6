#include "detector/snapshot_builder.hpp"

#include <chrono>
#include <string>
#include <system_error>

#include <QDateTime>
#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace driftwatch {

namespace {

TimePoint toTimePoint(const QDateTime &value)
{
    return TimePoint{std::chrono::milliseconds(value.toMSecsSinceEpoch())};
}

// Names that are not valid UTF-8 do not survive QFile::decodeName, so their
// times come from std::filesystem and the birth time stays unknown.
TimePoint lastWriteTime(const std::filesystem::path &path)
{
    std::error_code error;
    const auto written = std::filesystem::last_write_time(path, error);
    if (error) {
        throw EntryMetadataFailure(path.string() + ": " + error.message());
    }
    return std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::file_clock::to_sys(written));
}

} // namespace

std::optional<FileRecord> readFileRecord(const std::filesystem::path &path)
{
    std::error_code error;
    const auto status = std::filesystem::symlink_status(path, error);
    if (error) {
        throw EntryMetadataFailure(path.string() + ": " + error.message());
    }
    if (!std::filesystem::is_regular_file(status)) {
        return std::nullopt;
    }

    const std::uintmax_t size = std::filesystem::file_size(path, error);
    if (error) {
        throw EntryMetadataFailure(path.string() + ": " + error.message());
    }

    FileRecord record;
    record.path = path.string();
    record.name = path.filename().string();
    record.size = size;
    record.extension = path.extension().string();

    const QByteArray encoded = QByteArray::fromStdString(record.path);
    const QString qtPath = QFile::decodeName(encoded);
    if (QFile::encodeName(qtPath) != encoded) {
        record.modifiedAt = lastWriteTime(path);
        return record;
    }

    const QFileInfo info(qtPath);
    if (!info.exists()) {
        throw EntryMetadataFailure(path.string() + ": removed during scan");
    }

    const QDateTime modified = info.lastModified();
    if (!modified.isValid()) {
        throw EntryMetadataFailure(path.string() + ": modification time unavailable");
    }
    record.modifiedAt = toTimePoint(modified);

    const QDateTime birth = info.birthTime();
    if (birth.isValid()) {
        record.createdAt = toTimePoint(birth);
    }

    return record;
}

Snapshot buildSnapshot(const std::filesystem::path &directory)
{
    return buildSnapshot(directory, readFileRecord);
}

Snapshot buildSnapshot(const std::filesystem::path &directory,
                       const FileRecordReader &readRecord)
{
    std::error_code error;
    if (!std::filesystem::is_directory(directory, error)) {
        throw DirectoryUnavailable(directory.string(),
                                   error ? error.message() : "not a directory");
    }

    std::filesystem::directory_iterator it(directory, error);
    if (error) {
        throw DirectoryUnavailable(directory.string(), error.message());
    }

    Snapshot snapshot;
    int skipped = 0;
    for (; it != std::filesystem::directory_iterator(); it.increment(error)) {
        const std::filesystem::path entryPath = it->path();
        try {
            auto record = readRecord(entryPath);
            if (!record) {
                ++skipped;
                continue;
            }
            snapshot.emplace(record->path, std::move(*record));
        } catch (const EntryMetadataFailure &ex) {
            ++skipped;
            DWLOG_WARN(QStringLiteral("SnapshotBuilder"),
                       QStringLiteral("buildSnapshot"),
                       QStringLiteral("entry_skipped"),
                       QStringLiteral("metadata_failure"),
                       (nlohmann::json{{"path", entryPath.string()},
                                       {"error", ex.what()}}));
        }
    }

    // An interrupted listing counts as an unavailable directory.
    if (error) {
        throw DirectoryUnavailable(directory.string(), error.message());
    }

    DWLOG_DEBUG(QStringLiteral("SnapshotBuilder"),
                QStringLiteral("buildSnapshot"),
                QStringLiteral("snapshot_built"),
                QStringLiteral("scan"),
                (nlohmann::json{{"directory", directory.string()},
                                {"files", snapshot.size()},
                                {"skipped", skipped}}));
    return snapshot;
}

} // namespace driftwatch
