#include "detector/sqlite_state_store.hpp"

#include <chrono>
#include <system_error>
#include <utility>

#include <sqlite3.h>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/size_format.hpp"

namespace driftwatch {

namespace {

constexpr const char *kCreateFilesTable =
    "CREATE TABLE IF NOT EXISTS files ("
    "    path TEXT PRIMARY KEY,"
    "    name TEXT NOT NULL,"
    "    size INTEGER NOT NULL,"
    "    size_formatted TEXT,"
    "    modified TEXT NOT NULL,"
    "    created TEXT,"
    "    extension TEXT NOT NULL"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

class Connection {
public:
    Connection(const std::filesystem::path &path, int flags)
    {
        if (sqlite3_open_v2(path.string().c_str(), &db, flags, nullptr) != SQLITE_OK) {
            std::string message = db ? sqlite3_errmsg(db) : "sqlite open failed";
            sqlite3_close(db);
            db = nullptr;
            throw std::runtime_error(message);
        }
    }

    ~Connection()
    {
        if (db) {
            sqlite3_close(db);
        }
    }

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    sqlite3 *get() const
    {
        return db;
    }

private:
    sqlite3 *db = nullptr;
};

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ")
                                     + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return std::string(reinterpret_cast<const char *>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt, index)));
}

bool databaseExists(const std::filesystem::path &path)
{
    std::error_code error;
    return std::filesystem::exists(path, error);
}

} // namespace

struct SqliteStateStore::Impl {
    std::filesystem::path path;
};

SqliteStateStore::SqliteStateStore(std::filesystem::path path)
    : impl(std::make_unique<Impl>())
{
    impl->path = std::move(path);
}

SqliteStateStore::~SqliteStateStore() = default;

std::optional<Snapshot> SqliteStateStore::load()
{
    if (!databaseExists(impl->path)) {
        return std::nullopt;
    }

    try {
        Connection connection(impl->path, SQLITE_OPEN_READONLY);
        Statement stmt(connection.get(),
                       "SELECT path, name, size, modified, created, extension FROM files;");

        Snapshot snapshot;
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            FileRecord record;
            record.path = columnText(stmt.get(), 0);
            record.name = columnText(stmt.get(), 1);
            record.size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 2));

            const auto modified = fromIso8601Utc(columnText(stmt.get(), 3));
            if (!modified) {
                throw StateLoadFailure("invalid modified timestamp for " + record.path);
            }
            record.modifiedAt = *modified;

            if (sqlite3_column_type(stmt.get(), 4) != SQLITE_NULL) {
                record.createdAt = fromIso8601Utc(columnText(stmt.get(), 4));
            }
            record.extension = columnText(stmt.get(), 5);

            snapshot.emplace(record.path, std::move(record));
        }
        if (rc != SQLITE_DONE) {
            throw StateLoadFailure(std::string("sqlite read failed: ")
                                   + sqlite3_errmsg(connection.get()));
        }
        return snapshot;
    } catch (const StateLoadFailure &) {
        throw;
    } catch (const std::exception &ex) {
        throw StateLoadFailure("cannot read " + impl->path.string() + ": " + ex.what());
    }
}

void SqliteStateStore::save(const Snapshot &snapshot)
{
    std::error_code dirError;
    if (impl->path.has_parent_path()) {
        std::filesystem::create_directories(impl->path.parent_path(), dirError);
        if (dirError) {
            throw StateSaveFailure("cannot create state directory: " + dirError.message());
        }
    }

    try {
        Connection connection(impl->path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        sqlite3 *db = connection.get();

        execOrThrow(db, kCreateFilesTable);
        execOrThrow(db, kCreateMetaTable);
        execOrThrow(db, "BEGIN IMMEDIATE;");

        try {
            execOrThrow(db, "DELETE FROM files;");

            Statement insert(db,
                             "INSERT INTO files (path, name, size, size_formatted, "
                             "modified, created, extension) VALUES (?, ?, ?, ?, ?, ?, ?);");
            for (const auto &[path, record] : snapshot) {
                sqlite3_reset(insert.get());
                sqlite3_clear_bindings(insert.get());
                bindText(insert.get(), 1, path);
                bindText(insert.get(), 2, record.name);
                sqlite3_bind_int64(insert.get(), 3, static_cast<sqlite3_int64>(record.size));
                bindText(insert.get(), 4, formatBytes(record.size));
                bindText(insert.get(), 5, toIso8601Utc(record.modifiedAt));
                if (record.createdAt) {
                    bindText(insert.get(), 6, toIso8601Utc(*record.createdAt));
                } else {
                    sqlite3_bind_null(insert.get(), 6);
                }
                bindText(insert.get(), 7, record.extension);
                if (sqlite3_step(insert.get()) != SQLITE_DONE) {
                    throw std::runtime_error(std::string("sqlite insert failed: ")
                                             + sqlite3_errmsg(db));
                }
            }

            Statement meta(db,
                           "INSERT INTO meta (key, value) VALUES ('last_scan', ?) "
                           "ON CONFLICT(key) DO UPDATE SET value = excluded.value;");
            bindText(meta.get(), 1,
                     toIso8601Utc(std::chrono::time_point_cast<std::chrono::milliseconds>(
                         std::chrono::system_clock::now())));
            if (sqlite3_step(meta.get()) != SQLITE_DONE) {
                throw std::runtime_error(std::string("sqlite meta update failed: ")
                                         + sqlite3_errmsg(db));
            }

            execOrThrow(db, "COMMIT;");
        } catch (const std::exception &) {
            sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
            throw;
        }
    } catch (const std::exception &ex) {
        throw StateSaveFailure("cannot write " + impl->path.string() + ": " + ex.what());
    }
}

const std::filesystem::path &SqliteStateStore::location() const
{
    return impl->path;
}

std::optional<std::string> SqliteStateStore::getMeta(const std::string &key) const
{
    if (!databaseExists(impl->path)) {
        return std::nullopt;
    }

    try {
        Connection connection(impl->path, SQLITE_OPEN_READONLY);
        Statement stmt(connection.get(), "SELECT value FROM meta WHERE key = ?;");
        bindText(stmt.get(), 1, key);
        if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            return columnText(stmt.get(), 0);
        }
    } catch (const std::runtime_error &) {
        return std::nullopt;
    }
    return std::nullopt;
}

} // namespace driftwatch
