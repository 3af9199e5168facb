#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "fundamentals/clock.hpp"
#include "session/local_backend.hpp"
#include "session/session_record.hpp"
#include "session/storage_backend.hpp"

namespace runtime
{
class Scheduler;
}

namespace session
{

struct StorageOptions
{
    std::string backend = "local";
    std::string durable_target = "pqgate_sessions.db";
    bool degraded_read_cache = false;
    std::chrono::milliseconds sweep_interval{std::chrono::seconds(60)};
};

/**
 * Completed sessions, keyed by session id. Expiry is checked on every read
 * and, for the local backend, enforced eagerly by its reaper.
 */
class SessionStore
{
public:
    SessionStore(std::unique_ptr<StorageBackend> primary,
                 const Clock& clock,
                 std::unique_ptr<LocalBackend> read_cache = nullptr,
                 bool degraded = false);

    // Falls back to the local backend, flagged degraded, if the durable one cannot be opened.
    [[nodiscard]] static std::unique_ptr<SessionStore> create(const StorageOptions& opts, const Clock& clock);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    [[nodiscard]] Result<void> put(const SessionRecord& rec);
    // The record with its state as of now; SessionNotFound if absent.
    [[nodiscard]] Result<SessionRecord> get(std::string_view session_id);
    [[nodiscard]] VerifyResult verify(std::string_view session_id);
    [[nodiscard]] Result<void> invalidate(std::string_view session_id);
    [[nodiscard]] StoreStats stats();

    [[nodiscard]] Result<size_t> sweep();

    void start(runtime::Scheduler& sched);
    void stop();

    [[nodiscard]] bool degraded() const { return degraded_mode; }
    [[nodiscard]] std::string_view backend_name() const { return primary->name(); }

private:
    std::unique_ptr<StorageBackend> primary;
    std::unique_ptr<LocalBackend> read_cache;
    const Clock& clock;
    bool degraded_mode;
};

} // namespace session
