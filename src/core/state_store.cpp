#include "core/state_store.hpp"

#include <cstdint>
#include <string>
#include <system_error>

#include <sqlite3.h>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace hashprint {

namespace {

namespace fs = std::filesystem;

constexpr int kHashSize = 32;

constexpr const char *kCreateMetaTable =
    "CREATE TABLE meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kCreateEntriesTable =
    "CREATE TABLE entries ("
    "    path TEXT PRIMARY KEY,"
    "    hash BLOB NOT NULL,"
    "    mtime_ns INTEGER NOT NULL"
    ");";

enum class Access {
    Read,
    Write
};

// Failures while writing are always I/O errors. While reading, anything that
// is not an I/O condition means the file is not a usable state file.
ErrorKind errorKindFor(int code, Access access)
{
    if (access == Access::Write) {
        return ErrorKind::Io;
    }
    switch (code & 0xFF) {
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_PERM:
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
    case SQLITE_NOMEM:
    case SQLITE_FULL:
        return ErrorKind::Io;
    default:
        return ErrorKind::Deserialize;
    }
}

HashprintError sqliteError(sqlite3 *db, int code, Access access,
                           const std::string &what)
{
    std::string message = what;
    if (db) {
        message += ": ";
        message += sqlite3_errmsg(db);
    } else {
        message += ": ";
        message += sqlite3_errstr(code);
    }
    return HashprintError(errorKindFor(code, access), message);
}

class Database {
public:
    Database(const fs::path &path, Access access)
        : m_access(access)
    {
        const int flags = access == Access::Read
            ? SQLITE_OPEN_READONLY
            : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        const int rc = sqlite3_open_v2(path.c_str(), &m_db, flags, nullptr);
        if (rc != SQLITE_OK) {
            HashprintError error = sqliteError(m_db, rc, access,
                                               "cannot open state file " + path.string());
            sqlite3_close(m_db);
            m_db = nullptr;
            throw error;
        }
    }

    ~Database()
    {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    Database(const Database &) = delete;
    Database &operator=(const Database &) = delete;

    sqlite3 *get() const
    {
        return m_db;
    }

    Access access() const
    {
        return m_access;
    }

    void exec(const char *sql, const std::string &what)
    {
        char *error = nullptr;
        const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &error);
        if (rc != SQLITE_OK) {
            std::string message = what + ": " + (error ? error : sqlite3_errstr(rc));
            sqlite3_free(error);
            throw HashprintError(errorKindFor(rc, m_access), message);
        }
    }

private:
    sqlite3 *m_db = nullptr;
    Access m_access;
};

class Statement {
public:
    Statement(Database &db, const char *sql)
        : m_db(db)
    {
        const int rc = sqlite3_prepare_v2(db.get(), sql, -1, &m_stmt, nullptr);
        if (rc != SQLITE_OK) {
            throw sqliteError(db.get(), rc, db.access(), "sqlite prepare failed");
        }
    }

    ~Statement()
    {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return m_stmt;
    }

    // Returns true while rows are available.
    bool step(const std::string &what)
    {
        const int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw sqliteError(m_db.get(), rc, m_db.access(), what);
    }

    void reset()
    {
        sqlite3_reset(m_stmt);
        sqlite3_clear_bindings(m_stmt);
    }

private:
    Database &m_db;
    sqlite3_stmt *m_stmt = nullptr;
};

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

void bindBlob(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_blob(stmt, index, value.data(), static_cast<int>(value.size()),
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

std::string columnBlob(sqlite3_stmt *stmt, int index)
{
    const void *blob = sqlite3_column_blob(stmt, index);
    const int size = sqlite3_column_bytes(stmt, index);
    if (!blob || size <= 0) {
        return {};
    }
    return std::string(static_cast<const char *>(blob), static_cast<std::size_t>(size));
}

std::string readMeta(Database &db, const std::string &key)
{
    Statement stmt(db, "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);
    if (!stmt.step("failed to read state metadata")) {
        throw HashprintError(ErrorKind::Deserialize,
                             "state file has no '" + key + "' metadata");
    }
    return columnText(stmt.get(), 0);
}

void writeMeta(Statement &stmt, const std::string &key, const std::string &value)
{
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    stmt.step("failed to write state metadata");
    stmt.reset();
}

void removeIfPresent(const fs::path &path)
{
    std::error_code error;
    fs::remove(path, error);
    if (error) {
        throw HashprintError(ErrorKind::Io,
                             "cannot replace " + path.string() + ": " + error.message());
    }
}

} // namespace

fs::path StateStore::statePath(const fs::path &root) const
{
    return root / kStateFileName;
}

bool StateStore::exists(const fs::path &root) const
{
    std::error_code error;
    return fs::exists(statePath(root), error);
}

std::optional<Snapshot> StateStore::load(const fs::path &root) const
{
    const fs::path path = statePath(root);

    std::error_code error;
    const fs::file_status status = fs::status(path, error);
    if (status.type() == fs::file_type::not_found) {
        return std::nullopt;
    }
    if (error) {
        throw HashprintError(ErrorKind::Io,
                             "cannot stat " + path.string() + ": " + error.message());
    }
    if (!fs::is_regular_file(status)) {
        throw HashprintError(ErrorKind::Io, path.string() + " is not a regular file");
    }

    HLOG_INFO("StateStore", "state_load_start", {{"path", path.string()}});

    Database db(path, Access::Read);

    const std::string version = readMeta(db, "schema_version");
    if (version != std::to_string(kStateSchemaVersion)) {
        throw HashprintError(ErrorKind::Deserialize,
                             "unsupported state schema version '" + version + "'");
    }

    Snapshot snapshot;
    snapshot.root = readMeta(db, "root");
    if (snapshot.root != root) {
        throw HashprintError(ErrorKind::RootMismatch,
                             "mismatching roots found: " + snapshot.root.string()
                                 + " vs " + root.string());
    }

    Statement stmt(db, "SELECT path, hash, mtime_ns FROM entries;");
    while (stmt.step("failed to read state entries")) {
        Entry entry;
        entry.hash = columnBlob(stmt.get(), 1);
        if (entry.hash.size() != kHashSize) {
            throw HashprintError(ErrorKind::Deserialize,
                                 "malformed hash for " + columnText(stmt.get(), 0));
        }
        entry.mtime = fileTimeFromNanos(sqlite3_column_int64(stmt.get(), 2));
        snapshot.entries.emplace(columnText(stmt.get(), 0), std::move(entry));
    }

    HLOG_INFO("StateStore", "state_loaded",
              {{"path", path.string()},
               {"entries", snapshot.entries.size()}});
    return snapshot;
}

void StateStore::save(const Snapshot &snapshot) const
{
    const fs::path path = statePath(snapshot.root);

    // A leftover rollback journal would be replayed into the fresh file.
    removeIfPresent(path.string() + "-journal");
    removeIfPresent(path);

    Database db(path, Access::Write);
    db.exec(kCreateMetaTable, "failed to create meta table");
    db.exec(kCreateEntriesTable, "failed to create entries table");
    db.exec("BEGIN;", "failed to begin state transaction");

    {
        Statement meta(db, "INSERT INTO meta (key, value) VALUES (?, ?);");
        writeMeta(meta, "schema_version", std::to_string(kStateSchemaVersion));
        writeMeta(meta, "root", snapshot.root.string());

        Statement insert(db,
                         "INSERT INTO entries (path, hash, mtime_ns) VALUES (?, ?, ?);");
        for (const auto &[path, entry] : snapshot.entries) {
            bindText(insert.get(), 1, path.string());
            bindBlob(insert.get(), 2, entry.hash);
            sqlite3_bind_int64(insert.get(), 3, fileTimeToNanos(entry.mtime));
            insert.step("failed to insert state entry");
            insert.reset();
        }
    }

    db.exec("COMMIT;", "failed to commit state");

    HLOG_INFO("StateStore", "state_saved",
              {{"path", path.string()},
               {"entries", snapshot.entries.size()}});
}

} // namespace hashprint
