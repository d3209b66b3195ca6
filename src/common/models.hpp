#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace driftwatch {

using TimePoint = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::milliseconds>;

struct FileRecord {
    std::string path;
    std::string name;
    std::uint64_t size = 0;
    TimePoint modifiedAt;
    // Not every filesystem reports a birth time.
    std::optional<TimePoint> createdAt;
    std::string extension;
};

inline bool operator==(const FileRecord &a, const FileRecord &b)
{
    return a.path == b.path && a.name == b.name && a.size == b.size
        && a.modifiedAt == b.modifiedAt && a.createdAt == b.createdAt
        && a.extension == b.extension;
}

// Keyed by absolute path. Only regular files present at scan time.
using Snapshot = std::unordered_map<std::string, FileRecord>;

enum class ChangeKind {
    Created,
    Modified,
    Deleted
};

struct FileChange {
    ChangeKind kind;
    std::string path;
    std::optional<FileRecord> current;  // absent for Deleted
    std::optional<FileRecord> previous; // absent for Created
};

struct ChangeSet {
    std::vector<FileChange> created;
    std::vector<FileChange> modified;
    std::vector<FileChange> deleted;

    std::size_t total() const
    {
        return created.size() + modified.size() + deleted.size();
    }

    bool empty() const
    {
        return total() == 0;
    }
};

} // namespace driftwatch
