#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include "common/config.hpp"
#include "common/models.hpp"

namespace driftwatch {

// Durable home of the most recent snapshot. Owned by the ChangeDetector;
// nothing else reads or writes it.
class StateStore {
public:
    virtual ~StateStore() = default;

    // Returns nullopt when nothing has been persisted yet.
    // Throws StateLoadFailure when the state exists but cannot be decoded.
    virtual std::optional<Snapshot> load() = 0;

    // Replaces the persisted state entirely. Throws StateSaveFailure.
    virtual void save(const Snapshot &snapshot) = 0;

    virtual const std::filesystem::path &location() const = 0;
};

std::unique_ptr<StateStore> makeStateStore(StateBackend backend,
                                           const std::filesystem::path &statePath);

} // namespace driftwatch
