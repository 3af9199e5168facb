#include "session/sqlite_backend.hpp"
#include "logger.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <memory>
#include <span>

namespace session
{

namespace
{

using stmt_ptr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

stmt_ptr prepare(sqlite3* db, const char* sql)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        sqlite3_finalize(stmt);
        return stmt_ptr(nullptr, sqlite3_finalize);
    }
    return stmt_ptr(stmt, sqlite3_finalize);
}

void bind_text(sqlite3_stmt* stmt, int idx, std::string_view sv)
{
    sqlite3_bind_text(stmt, idx, sv.data(), static_cast<int>(sv.size()), SQLITE_STATIC);
}

void bind_blob(sqlite3_stmt* stmt, int idx, std::span<const uint8_t> data)
{
    sqlite3_bind_blob(stmt, idx, data.data(), static_cast<int>(data.size()), SQLITE_STATIC);
}

std::string column_text(sqlite3_stmt* stmt, int col)
{
    const auto* txt = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return txt ? std::string(txt) : std::string();
}

template<size_t N>
bool column_array(sqlite3_stmt* stmt, int col, std::array<uint8_t, N>& out)
{
    const auto* blob = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, col));
    if (!blob || sqlite3_column_bytes(stmt, col) != static_cast<int>(N))
    {
        return false;
    }
    std::copy_n(blob, N, out.begin());
    return true;
}

constexpr const char* select_columns =
    "SELECT session_id, handshake_id, cipher_suite, kem_algorithm, sig_algorithm, "
    "kem_key_version, sig_key_version, client_write_key, server_write_key, "
    "client_write_iv, server_write_iv, verify_data, transcript_hash, "
    "client_address, server_address, created_at, expires_at, state "
    "FROM sessions WHERE session_id = ?;";

} // namespace

std::expected<std::unique_ptr<SqliteBackend>, std::string> SqliteBackend::open(
    std::string_view db_path,
    const Clock& clock)
{
    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(std::string(db_path).c_str(), &handle,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        std::string err = handle ? sqlite3_errmsg(handle) : "out of memory";
        sqlite3_close(handle);
        return std::unexpected(err);
    }

    // Owns the handle from here on, so every early return closes it.
    auto backend = std::make_unique<SqliteBackend>(Token{}, handle, clock);

    sqlite3_busy_timeout(handle, 2000);
    if (sqlite3_exec(handle, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr) != SQLITE_OK ||
        sqlite3_exec(handle, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr) != SQLITE_OK)
    {
        LOG_WARN("Session database {} keeps its default journal: {}", db_path, sqlite3_errmsg(handle));
    }

    if (!backend->init_schema())
    {
        return std::unexpected(std::format("Failed to initialize session schema: {}", sqlite3_errmsg(handle)));
    }
    return backend;
}

SqliteBackend::SqliteBackend(Token, sqlite3* handle, const Clock& clk)
    : db(handle)
    , clock(clk)
{
}

SqliteBackend::~SqliteBackend()
{
    if (db)
    {
        sqlite3_close(db);
    }
}

bool SqliteBackend::init_schema()
{
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS sessions (
            session_id TEXT PRIMARY KEY,
            handshake_id TEXT NOT NULL,
            cipher_suite TEXT NOT NULL,
            kem_algorithm TEXT NOT NULL,
            sig_algorithm TEXT NOT NULL,
            kem_key_version INTEGER NOT NULL,
            sig_key_version INTEGER NOT NULL,
            client_write_key BLOB NOT NULL,
            server_write_key BLOB NOT NULL,
            client_write_iv BLOB NOT NULL,
            server_write_iv BLOB NOT NULL,
            verify_data BLOB NOT NULL,
            transcript_hash BLOB NOT NULL,
            client_address TEXT NOT NULL DEFAULT '',
            server_address TEXT NOT NULL DEFAULT '',
            created_at INTEGER NOT NULL,
            expires_at INTEGER NOT NULL,
            state INTEGER NOT NULL DEFAULT 0,
            CHECK (expires_at > created_at)
        ) WITHOUT ROWID;

        CREATE INDEX IF NOT EXISTS idx_sessions_expires ON sessions(expires_at);
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, std::addressof(err));
    if (rc != SQLITE_OK && err)
    {
        LOG_ERROR("Session schema error: {}", err);
        sqlite3_free(err);
        return false;
    }
    return rc == SQLITE_OK;
}

Error SqliteBackend::db_error(std::string_view what) const
{
    return Error{ErrorCode::StorageBackendUnavailable, std::format("{}: {}", what, sqlite3_errmsg(db))};
}

Result<void> SqliteBackend::insert(const SessionRecord& rec)
{
    std::lock_guard lock(mtx);
    if (sqlite3_exec(db, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) != SQLITE_OK)
    {
        return std::unexpected(db_error("begin"));
    }

    auto rollback = [this](Error err) -> Result<void>
    {
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        return std::unexpected(std::move(err));
    };

    auto purge = prepare(db, "DELETE FROM sessions WHERE expires_at < ?;");
    if (!purge)
    {
        return rollback(db_error("prepare purge"));
    }
    sqlite3_bind_int64(purge.get(), 1, to_unix_ms(clock.now()));
    if (sqlite3_step(purge.get()) != SQLITE_DONE)
    {
        return rollback(db_error("purge expired"));
    }
    auto purged = static_cast<uint64_t>(sqlite3_changes(db));

    auto stmt = prepare(db,
        "INSERT INTO sessions (session_id, handshake_id, cipher_suite, kem_algorithm, sig_algorithm, "
        "kem_key_version, sig_key_version, client_write_key, server_write_key, client_write_iv, "
        "server_write_iv, verify_data, transcript_hash, client_address, server_address, "
        "created_at, expires_at, state) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    if (!stmt)
    {
        return rollback(db_error("prepare insert"));
    }

    auto* s = stmt.get();
    bind_text(s, 1, rec.session_id);
    bind_text(s, 2, rec.handshake_id);
    bind_text(s, 3, rec.cipher_suite);
    bind_text(s, 4, rec.kem_algorithm);
    bind_text(s, 5, rec.sig_algorithm);
    sqlite3_bind_int64(s, 6, rec.kem_key_version);
    sqlite3_bind_int64(s, 7, rec.sig_key_version);
    bind_blob(s, 8, rec.keys.client_write_key);
    bind_blob(s, 9, rec.keys.server_write_key);
    bind_blob(s, 10, rec.keys.client_write_iv);
    bind_blob(s, 11, rec.keys.server_write_iv);
    bind_blob(s, 12, rec.verify_data);
    bind_blob(s, 13, rec.transcript_hash);
    bind_text(s, 14, rec.client_address);
    bind_text(s, 15, rec.server_address);
    sqlite3_bind_int64(s, 16, to_unix_ms(rec.created_at));
    sqlite3_bind_int64(s, 17, to_unix_ms(rec.expires_at));
    sqlite3_bind_int(s, 18, static_cast<int>(rec.state));

    int rc = sqlite3_step(s);
    if (rc == SQLITE_CONSTRAINT && sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY)
    {
        return rollback(Error{ErrorCode::DuplicateSession, rec.session_id});
    }
    if (rc != SQLITE_DONE)
    {
        return rollback(db_error("insert session"));
    }

    if (sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK)
    {
        return rollback(db_error("commit"));
    }
    swept_total += purged;
    return {};
}

Result<std::optional<SessionRecord>> SqliteBackend::find(std::string_view session_id)
{
    std::lock_guard lock(mtx);
    auto stmt = prepare(db, select_columns);
    if (!stmt)
    {
        return std::unexpected(db_error("prepare select"));
    }
    bind_text(stmt.get(), 1, session_id);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE)
    {
        return std::optional<SessionRecord>{};
    }
    if (rc != SQLITE_ROW)
    {
        return std::unexpected(db_error("select session"));
    }

    auto* s = stmt.get();
    SessionRecord rec;
    rec.session_id = column_text(s, 0);
    rec.handshake_id = column_text(s, 1);
    rec.cipher_suite = column_text(s, 2);
    rec.kem_algorithm = column_text(s, 3);
    rec.sig_algorithm = column_text(s, 4);
    rec.kem_key_version = static_cast<uint32_t>(sqlite3_column_int64(s, 5));
    rec.sig_key_version = static_cast<uint32_t>(sqlite3_column_int64(s, 6));
    bool blobs_ok = column_array(s, 7, rec.keys.client_write_key)
                 && column_array(s, 8, rec.keys.server_write_key)
                 && column_array(s, 9, rec.keys.client_write_iv)
                 && column_array(s, 10, rec.keys.server_write_iv)
                 && column_array(s, 11, rec.verify_data)
                 && column_array(s, 12, rec.transcript_hash);
    rec.client_address = column_text(s, 13);
    rec.server_address = column_text(s, 14);
    rec.created_at = from_unix_ms(sqlite3_column_int64(s, 15));
    rec.expires_at = from_unix_ms(sqlite3_column_int64(s, 16));
    auto state = sqlite3_column_int(s, 17);

    if (state == static_cast<int>(SessionState::Invalidated))
    {
        rec.state = SessionState::Invalidated;
        rec.keys.wipe();
    }
    else if (!blobs_ok)
    {
        return std::unexpected(Error{ErrorCode::StorageBackendUnavailable,
                                     std::format("session {} has malformed key columns", rec.session_id)});
    }
    return std::optional<SessionRecord>{std::move(rec)};
}

Result<bool> SqliteBackend::mark_invalidated(std::string_view session_id)
{
    std::lock_guard lock(mtx);
    auto stmt = prepare(db,
        "UPDATE sessions SET state = ?, client_write_key = zeroblob(32), server_write_key = zeroblob(32), "
        "client_write_iv = zeroblob(12), server_write_iv = zeroblob(12) WHERE session_id = ?;");
    if (!stmt)
    {
        return std::unexpected(db_error("prepare invalidate"));
    }
    sqlite3_bind_int(stmt.get(), 1, static_cast<int>(SessionState::Invalidated));
    bind_text(stmt.get(), 2, session_id);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        return std::unexpected(db_error("invalidate session"));
    }
    return sqlite3_changes(db) > 0;
}

Result<size_t> SqliteBackend::remove_expired(time_point now)
{
    std::lock_guard lock(mtx);
    auto stmt = prepare(db, "DELETE FROM sessions WHERE expires_at < ?;");
    if (!stmt)
    {
        return std::unexpected(db_error("prepare purge"));
    }
    sqlite3_bind_int64(stmt.get(), 1, to_unix_ms(now));
    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        return std::unexpected(db_error("purge expired"));
    }
    auto removed = static_cast<size_t>(sqlite3_changes(db));
    swept_total += removed;
    return removed;
}

Result<BackendCounts> SqliteBackend::count(time_point now)
{
    std::lock_guard lock(mtx);
    auto stmt = prepare(db,
        "SELECT "
        "  COALESCE(SUM(CASE WHEN state != ?1 AND expires_at >= ?2 THEN 1 ELSE 0 END), 0), "
        "  COALESCE(SUM(CASE WHEN state != ?1 AND expires_at < ?2 THEN 1 ELSE 0 END), 0), "
        "  COALESCE(SUM(CASE WHEN state = ?1 THEN 1 ELSE 0 END), 0) "
        "FROM sessions;");
    if (!stmt)
    {
        return std::unexpected(db_error("prepare count"));
    }
    sqlite3_bind_int(stmt.get(), 1, static_cast<int>(SessionState::Invalidated));
    sqlite3_bind_int64(stmt.get(), 2, to_unix_ms(now));
    if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    {
        return std::unexpected(db_error("count sessions"));
    }
    return BackendCounts{
        .active = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0)),
        .expired = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 1)),
        .invalidated = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 2)),
    };
}

} // namespace session
