#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "fundamentals/clock.hpp"
#include "runtime/scheduler.hpp"
#include "session/storage_backend.hpp"

namespace session
{

// In-process map guarded by one mutex, swept by its own periodic reaper.
class LocalBackend final : public StorageBackend
{
public:
    LocalBackend(const Clock& clock, std::chrono::milliseconds sweep_interval);
    ~LocalBackend() override;

    [[nodiscard]] std::string_view name() const override { return "local"; }

    [[nodiscard]] Result<void> insert(const SessionRecord& rec) override;
    [[nodiscard]] Result<std::optional<SessionRecord>> find(std::string_view session_id) override;
    [[nodiscard]] Result<bool> mark_invalidated(std::string_view session_id) override;
    [[nodiscard]] Result<size_t> remove_expired(time_point now) override;
    [[nodiscard]] Result<BackendCounts> count(time_point now) override;

    void start_maintenance(runtime::Scheduler& sched) override;
    void stop_maintenance() override;
    [[nodiscard]] uint64_t swept() const override { return swept_total.load(); }

    // Inserts or replaces; used when mirroring a durable store.
    void upsert(const SessionRecord& rec);

private:
    const Clock& clock;
    std::chrono::milliseconds sweep_interval;

    std::mutex mtx;
    std::unordered_map<std::string, SessionRecord> records;

    std::atomic<uint64_t> swept_total{0};
    std::shared_ptr<runtime::PeriodicTask> reaper;
};

} // namespace session
