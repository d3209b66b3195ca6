#pragma once

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace driftwatch {

// Structured record for one change, consumed by loggers and reports.
// Every record carries change, path, name, size, sizeFormatted and extension
// ("no extension" when empty). Modified records add the previous size, the
// signed size delta and both modification times; deleted records carry the
// last known size and modification time.
nlohmann::json toChangeRecord(const FileChange &change);

// Created, then modified, then deleted.
nlohmann::json toChangeRecords(const ChangeSet &changes);

nlohmann::json summarize(const ChangeSet &changes);

// Emits one INFO event per change and a summary event.
void logChangeRecords(const ChangeSet &changes);

} // namespace driftwatch
