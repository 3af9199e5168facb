#include "session/session_store.hpp"
#include "session/sqlite_backend.hpp"
#include "runtime/scheduler.hpp"
#include "logger.hpp"

#include <format>
#include <tuple>

namespace session
{

SessionStore::SessionStore(std::unique_ptr<StorageBackend> backend,
                           const Clock& clk,
                           std::unique_ptr<LocalBackend> cache,
                           bool degraded)
    : primary(std::move(backend))
    , read_cache(std::move(cache))
    , clock(clk)
    , degraded_mode(degraded)
{
}

std::unique_ptr<SessionStore> SessionStore::create(const StorageOptions& opts, const Clock& clock)
{
    if (opts.backend == "durable")
    {
        auto durable = SqliteBackend::open(opts.durable_target, clock);
        if (durable)
        {
            LOG_INFO("Session store using durable backend at {}", opts.durable_target);
            std::unique_ptr<LocalBackend> cache;
            if (opts.degraded_read_cache)
            {
                cache = std::make_unique<LocalBackend>(clock, opts.sweep_interval);
            }
            return std::make_unique<SessionStore>(std::move(*durable), clock, std::move(cache));
        }
        LOG_AUDIT("Durable session backend '{}' unavailable ({}); running in degraded mode on the local backend",
                  opts.durable_target, durable.error());
        return std::make_unique<SessionStore>(
            std::make_unique<LocalBackend>(clock, opts.sweep_interval), clock, nullptr, true);
    }

    if (opts.backend != "local")
    {
        LOG_WARN("Unknown storage backend '{}', using local", opts.backend);
    }
    return std::make_unique<SessionStore>(std::make_unique<LocalBackend>(clock, opts.sweep_interval), clock);
}

Result<void> SessionStore::put(const SessionRecord& rec)
{
    if (rec.session_id.empty())
    {
        return fail(ErrorCode::InvalidArgument, "session id must not be empty");
    }
    if (rec.expires_at <= rec.created_at)
    {
        return fail(ErrorCode::InvalidArgument, "session must expire after it was created");
    }

    if (auto res = primary->insert(rec); !res)
    {
        if (res.error().code != ErrorCode::DuplicateSession)
        {
            LOG_ERROR("Session {} not stored: {}", rec.session_id, res.error());
        }
        return res;
    }

    if (read_cache)
    {
        read_cache->upsert(rec);
    }
    return {};
}

Result<SessionRecord> SessionStore::get(std::string_view session_id)
{
    auto found = primary->find(session_id);
    if (!found && read_cache)
    {
        LOG_WARN("Session backend read failed ({}), serving {} from read cache", found.error(), session_id);
        found = read_cache->find(session_id);
    }
    if (!found)
    {
        return std::unexpected(found.error());
    }
    if (!found->has_value())
    {
        return fail(ErrorCode::SessionNotFound, std::string(session_id));
    }

    SessionRecord rec = std::move(**found);
    if (rec.state == SessionState::Active && rec.expired_at(clock.now()))
    {
        rec.state = SessionState::Expired;
    }
    return rec;
}

VerifyResult SessionStore::verify(std::string_view session_id)
{
    auto rec = get(session_id);
    if (!rec)
    {
        return VerifyResult{.valid = false, .reason = rec.error().code, .expires_at = std::nullopt};
    }

    switch (rec->state)
    {
        case SessionState::Active:
            return VerifyResult{.valid = true, .reason = std::nullopt, .expires_at = rec->expires_at};
        case SessionState::Expired:
            return VerifyResult{.valid = false, .reason = ErrorCode::SessionExpired, .expires_at = rec->expires_at};
        case SessionState::Invalidated:
            return VerifyResult{.valid = false, .reason = ErrorCode::SessionInvalidated, .expires_at = rec->expires_at};
    }
    return VerifyResult{.valid = false, .reason = ErrorCode::SessionInvalidated, .expires_at = rec->expires_at};
}

Result<void> SessionStore::invalidate(std::string_view session_id)
{
    auto marked = primary->mark_invalidated(session_id);
    if (!marked)
    {
        LOG_ERROR("Failed to invalidate session {}: {}", session_id, marked.error());
        return std::unexpected(marked.error());
    }
    if (read_cache)
    {
        std::ignore = read_cache->mark_invalidated(session_id);
    }
    if (!*marked)
    {
        return fail(ErrorCode::SessionNotFound, std::string(session_id));
    }

    LOG_INFO("Session {} invalidated", session_id);
    return {};
}

StoreStats SessionStore::stats()
{
    StoreStats st;
    st.backend = std::string(primary->name());
    st.degraded = degraded_mode;
    st.swept = primary->swept();

    if (auto counts = primary->count(clock.now()); counts)
    {
        st.active = counts->active;
        st.expired = counts->expired;
        st.invalidated = counts->invalidated;
    }
    else
    {
        LOG_WARN("Session stats unavailable: {}", counts.error());
        st.degraded = true;
    }
    return st;
}

Result<size_t> SessionStore::sweep()
{
    auto now = clock.now();
    if (read_cache)
    {
        std::ignore = read_cache->remove_expired(now);
    }
    return primary->remove_expired(now);
}

void SessionStore::start(runtime::Scheduler& sched)
{
    primary->start_maintenance(sched);
    if (read_cache)
    {
        read_cache->start_maintenance(sched);
    }
}

void SessionStore::stop()
{
    primary->stop_maintenance();
    if (read_cache)
    {
        read_cache->stop_maintenance();
    }
}

} // namespace session
