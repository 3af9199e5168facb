#pragma once

#include <sqlite3.h>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "fundamentals/clock.hpp"
#include "session/storage_backend.hpp"

namespace session
{

/**
 * Durable session table in a SQLite database (WAL mode), shareable by every
 * gateway process on the host. Expired rows are purged inside each insert
 * transaction, so the table stays bounded without a reaper.
 */
class SqliteBackend final : public StorageBackend
{
    struct Token
    {
        explicit Token() = default;
    };

public:
    [[nodiscard]] static std::expected<std::unique_ptr<SqliteBackend>, std::string> open(
        std::string_view db_path,
        const Clock& clock
    );
    // Reachable only through open().
    SqliteBackend(Token, sqlite3* handle, const Clock& clock);
    ~SqliteBackend() override;

    SqliteBackend(const SqliteBackend&) = delete;
    SqliteBackend& operator=(const SqliteBackend&) = delete;

    [[nodiscard]] std::string_view name() const override { return "durable"; }

    [[nodiscard]] Result<void> insert(const SessionRecord& rec) override;
    [[nodiscard]] Result<std::optional<SessionRecord>> find(std::string_view session_id) override;
    [[nodiscard]] Result<bool> mark_invalidated(std::string_view session_id) override;
    [[nodiscard]] Result<size_t> remove_expired(time_point now) override;
    [[nodiscard]] Result<BackendCounts> count(time_point now) override;

    [[nodiscard]] uint64_t swept() const override { return swept_total; }

private:
    [[nodiscard]] bool init_schema();
    [[nodiscard]] Error db_error(std::string_view what) const;

    sqlite3* db;
    const Clock& clock;
    std::mutex mtx;
    uint64_t swept_total = 0;
};

} // namespace session
