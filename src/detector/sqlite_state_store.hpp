#pragma once

#include <memory>
#include <optional>
#include <string>

#include "detector/state_store.hpp"

namespace driftwatch {

// SQLite-backed state: one row per file in `files`, plus a `meta` table.
// A save replaces every row inside a single transaction.
class SqliteStateStore : public StateStore {
public:
    explicit SqliteStateStore(std::filesystem::path path);
    ~SqliteStateStore() override;

    std::optional<Snapshot> load() override;
    void save(const Snapshot &snapshot) override;
    const std::filesystem::path &location() const override;

    // Reads a meta value such as "last_scan". Returns nullopt when the
    // database or key is absent.
    std::optional<std::string> getMeta(const std::string &key) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace driftwatch
