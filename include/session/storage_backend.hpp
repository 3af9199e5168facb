#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "errors.hpp"
#include "session/session_record.hpp"

namespace runtime
{
class Scheduler;
}

namespace session
{

struct BackendCounts
{
    size_t active = 0;
    size_t expired = 0;
    size_t invalidated = 0;
};

/**
 * Persistence seam behind SessionStore. Every call is atomic for its key;
 * implementations never hold their lock across anything slower than memory
 * or a single local database transaction.
 */
class StorageBackend
{
public:
    virtual ~StorageBackend() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    // DuplicateSession if the id exists; on any error nothing was written.
    [[nodiscard]] virtual Result<void> insert(const SessionRecord& rec) = 0;
    [[nodiscard]] virtual Result<std::optional<SessionRecord>> find(std::string_view session_id) = 0;
    // false when the id is unknown.
    [[nodiscard]] virtual Result<bool> mark_invalidated(std::string_view session_id) = 0;
    [[nodiscard]] virtual Result<size_t> remove_expired(time_point now) = 0;
    [[nodiscard]] virtual Result<BackendCounts> count(time_point now) = 0;

    // Background upkeep owned by the backend itself, if it needs any.
    virtual void start_maintenance(runtime::Scheduler&) {}
    virtual void stop_maintenance() {}
    [[nodiscard]] virtual uint64_t swept() const { return 0; }
};

} // namespace session
