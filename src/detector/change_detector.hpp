#pragma once

#include <memory>

#include "common/config.hpp"
#include "common/models.hpp"
#include "detector/state_store.hpp"

namespace driftwatch {

// Three-way comparison keyed by path. modifiedAt is the only change signal:
// a file whose size changed but whose modifiedAt did not is unchanged.
ChangeSet diffSnapshots(const Snapshot &previous, const Snapshot &current);

/**
 * ChangeDetector runs one read-diff-write cycle per detectChanges() call:
 * - locks <statePath>.lock so overlapping scans cannot interleave
 * - loads the previous snapshot (missing or corrupt state counts as empty)
 * - builds the current snapshot of the monitored directory
 * - diffs, then replaces the persisted snapshot with the current one
 *
 * DirectoryUnavailable and StateLockUnavailable propagate and leave the
 * persisted state untouched. A failed save is logged; the returned ChangeSet
 * is still accurate for this run.
 */
class ChangeDetector {
public:
    explicit ChangeDetector(DetectorConfig config);
    ChangeDetector(DetectorConfig config, std::unique_ptr<StateStore> store);
    ~ChangeDetector();

    ChangeSet detectChanges();

    const DetectorConfig &config() const;

private:
    Snapshot loadPreviousState();
    void persistState(const Snapshot &snapshot);

    DetectorConfig m_config;
    std::unique_ptr<StateStore> m_store;
};

} // namespace driftwatch
