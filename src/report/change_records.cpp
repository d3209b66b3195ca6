#include "report/change_records.hpp"

#include <QString>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/size_format.hpp"

namespace driftwatch {

namespace {

std::string displayExtension(const FileRecord &record)
{
    return record.extension.empty() ? "no extension" : record.extension;
}

nlohmann::json optionalTimestamp(const std::optional<TimePoint> &value)
{
    if (!value) {
        return nlohmann::json();
    }
    return toIso8601Utc(*value);
}

nlohmann::json baseRecord(ChangeKind kind, const std::string &path, const FileRecord &record)
{
    return nlohmann::json{
        {"change", toChangeKindString(kind)},
        {"path", path},
        {"name", record.name},
        {"size", record.size},
        {"sizeFormatted", formatBytes(record.size)},
        {"extension", displayExtension(record)}
    };
}

QString eventNameFor(ChangeKind kind)
{
    switch (kind) {
    case ChangeKind::Created:
        return QStringLiteral("file_created");
    case ChangeKind::Modified:
        return QStringLiteral("file_modified");
    case ChangeKind::Deleted:
        return QStringLiteral("file_deleted");
    }
    return QStringLiteral("file_changed");
}

} // namespace

nlohmann::json toChangeRecord(const FileChange &change)
{
    switch (change.kind) {
    case ChangeKind::Created: {
        const FileRecord &current = *change.current;
        nlohmann::json record = baseRecord(change.kind, change.path, current);
        record["created"] = optionalTimestamp(current.createdAt);
        record["modified"] = toIso8601Utc(current.modifiedAt);
        return record;
    }
    case ChangeKind::Modified: {
        const FileRecord &current = *change.current;
        const FileRecord &previous = *change.previous;
        const auto delta = static_cast<std::int64_t>(current.size)
            - static_cast<std::int64_t>(previous.size);

        nlohmann::json record = baseRecord(change.kind, change.path, current);
        record["previousSize"] = previous.size;
        record["previousSizeFormatted"] = formatBytes(previous.size);
        record["sizeDelta"] = delta;
        record["sizeChange"] = formatSizeDelta(delta);
        record["previousModified"] = toIso8601Utc(previous.modifiedAt);
        record["currentModified"] = toIso8601Utc(current.modifiedAt);
        return record;
    }
    case ChangeKind::Deleted: {
        const FileRecord &previous = *change.previous;
        nlohmann::json record = baseRecord(change.kind, change.path, previous);
        record["lastSize"] = formatBytes(previous.size);
        record["lastModified"] = toIso8601Utc(previous.modifiedAt);
        return record;
    }
    }
    return nlohmann::json::object();
}

nlohmann::json toChangeRecords(const ChangeSet &changes)
{
    nlohmann::json records = nlohmann::json::array();
    for (const auto *group : {&changes.created, &changes.modified, &changes.deleted}) {
        for (const auto &change : *group) {
            records.push_back(toChangeRecord(change));
        }
    }
    return records;
}

nlohmann::json summarize(const ChangeSet &changes)
{
    return nlohmann::json{
        {"created", changes.created.size()},
        {"modified", changes.modified.size()},
        {"deleted", changes.deleted.size()},
        {"total", changes.total()}
    };
}

void logChangeRecords(const ChangeSet &changes)
{
    for (const auto *group : {&changes.created, &changes.modified, &changes.deleted}) {
        for (const auto &change : *group) {
            DWLOG_INFO(QStringLiteral("ChangeRecords"),
                       QStringLiteral("logChangeRecords"),
                       eventNameFor(change.kind),
                       QStringLiteral("scan_diff"),
                       toChangeRecord(change));
        }
    }

    DWLOG_INFO(QStringLiteral("ChangeRecords"),
               QStringLiteral("logChangeRecords"),
               changes.empty() ? QStringLiteral("no_changes") : QStringLiteral("changes_detected"),
               QStringLiteral("scan_diff"),
               summarize(changes));
}

} // namespace driftwatch
