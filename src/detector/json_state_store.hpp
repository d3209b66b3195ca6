#pragma once

#include "detector/state_store.hpp"

namespace driftwatch {

// Keeps the snapshot as a pretty-printed JSON object keyed by absolute path.
// Saves go through a temporary file that is renamed over the target.
class JsonStateStore : public StateStore {
public:
    explicit JsonStateStore(std::filesystem::path path);

    std::optional<Snapshot> load() override;
    void save(const Snapshot &snapshot) override;
    const std::filesystem::path &location() const override;

private:
    std::filesystem::path m_path;
};

} // namespace driftwatch
