#include "session/local_backend.hpp"
#include "logger.hpp"

namespace session
{

LocalBackend::LocalBackend(const Clock& clk, std::chrono::milliseconds interval)
    : clock(clk)
    , sweep_interval(interval)
{
}

LocalBackend::~LocalBackend()
{
    stop_maintenance();
}

Result<void> LocalBackend::insert(const SessionRecord& rec)
{
    std::lock_guard lock(mtx);
    auto [it, inserted] = records.try_emplace(rec.session_id, rec);
    if (!inserted)
    {
        return fail(ErrorCode::DuplicateSession, rec.session_id);
    }
    return {};
}

void LocalBackend::upsert(const SessionRecord& rec)
{
    std::lock_guard lock(mtx);
    records.insert_or_assign(rec.session_id, rec);
}

Result<std::optional<SessionRecord>> LocalBackend::find(std::string_view session_id)
{
    std::lock_guard lock(mtx);
    auto it = records.find(std::string(session_id));
    if (it == records.end())
    {
        return std::optional<SessionRecord>{};
    }
    return std::optional<SessionRecord>{it->second};
}

Result<bool> LocalBackend::mark_invalidated(std::string_view session_id)
{
    std::lock_guard lock(mtx);
    auto it = records.find(std::string(session_id));
    if (it == records.end())
    {
        return false;
    }
    it->second.state = SessionState::Invalidated;
    it->second.keys.wipe();
    return true;
}

Result<size_t> LocalBackend::remove_expired(time_point now)
{
    std::lock_guard lock(mtx);
    size_t removed = std::erase_if(records, [now](const auto& kv)
    {
        return kv.second.expired_at(now);
    });
    swept_total.fetch_add(removed, std::memory_order_relaxed);
    return removed;
}

Result<BackendCounts> LocalBackend::count(time_point now)
{
    BackendCounts counts;
    std::lock_guard lock(mtx);
    for (const auto& [id, rec] : records)
    {
        if (rec.state == SessionState::Invalidated)
        {
            ++counts.invalidated;
        }
        else if (rec.expired_at(now))
        {
            ++counts.expired;
        }
        else
        {
            ++counts.active;
        }
    }
    return counts;
}

void LocalBackend::start_maintenance(runtime::Scheduler& sched)
{
    if (reaper)
    {
        return;
    }
    reaper = sched.every("session-reaper", sweep_interval, [this]
    {
        auto removed = remove_expired(clock.now());
        if (removed && *removed > 0)
        {
            LOG_DEBUG("Session reaper removed {} expired sessions", *removed);
        }
    });
}

void LocalBackend::stop_maintenance()
{
    if (reaper)
    {
        reaper->cancel();
        reaper.reset();
    }
}

} // namespace session
