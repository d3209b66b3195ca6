#include "detector/state_store.hpp"

#include "detector/json_state_store.hpp"
#include "detector/sqlite_state_store.hpp"

namespace driftwatch {

std::unique_ptr<StateStore> makeStateStore(StateBackend backend,
                                           const std::filesystem::path &statePath)
{
    switch (backend) {
    case StateBackend::Json:
        return std::make_unique<JsonStateStore>(statePath);
    case StateBackend::Sqlite:
        return std::make_unique<SqliteStateStore>(statePath);
    }
    return std::make_unique<JsonStateStore>(statePath);
}

} // namespace driftwatch
