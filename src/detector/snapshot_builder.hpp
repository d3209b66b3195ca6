#pragma once

#include <filesystem>
#include <functional>
#include <optional>

#include "common/models.hpp"

namespace driftwatch {

/**
 * Build a snapshot of the regular files directly inside `directory`:
 * - one level only, subdirectories are not entered
 * - directories, symlinks, sockets, fifos and devices are left out
 * - entries that cannot be inspected (removed mid-scan, permission denied)
 *   are logged as warnings and left out
 *
 * Throws DirectoryUnavailable when the directory is missing, is not a
 * directory, or cannot be listed. This function does not persist anything.
 */
Snapshot buildSnapshot(const std::filesystem::path &directory);

// Reads one directory entry. Returns nullopt for entries that are not
// regular files and throws EntryMetadataFailure when the entry cannot be
// inspected.
using FileRecordReader =
    std::function<std::optional<FileRecord>(const std::filesystem::path &)>;

std::optional<FileRecord> readFileRecord(const std::filesystem::path &path);

Snapshot buildSnapshot(const std::filesystem::path &directory,
                       const FileRecordReader &readRecord);

} // namespace driftwatch
