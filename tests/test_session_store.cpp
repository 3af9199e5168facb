#include <catch2/catch_test_macros.hpp>

#include "session/local_backend.hpp"
#include "session/session_store.hpp"
#include "session/sqlite_backend.hpp"
#include "runtime/scheduler.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace session;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace
{

SessionRecord make_record(const Clock& clock, std::string id, std::chrono::seconds ttl = 3600s)
{
    SessionRecord rec;
    rec.session_id = std::move(id);
    rec.handshake_id = "hs-" + rec.session_id;
    rec.keys.client_write_key.fill(0xA1);
    rec.keys.server_write_key.fill(0xB2);
    rec.keys.client_write_iv.fill(0xC3);
    rec.keys.server_write_iv.fill(0xD4);
    rec.verify_data.fill(0x5A);
    rec.transcript_hash.fill(0x6B);
    rec.cipher_suite = "PQ_ML_KEM_768_ML_DSA_65";
    rec.kem_algorithm = "ML-KEM-768";
    rec.sig_algorithm = "ML-DSA-65";
    rec.kem_key_version = 2;
    rec.sig_key_version = 1;
    rec.created_at = clock.now();
    rec.expires_at = rec.created_at + ttl;
    rec.client_address = "198.51.100.7";
    rec.server_address = "0.0.0.0";
    return rec;
}

SessionStore make_local_store(const Clock& clock, std::chrono::milliseconds sweep = 60s)
{
    return SessionStore(std::make_unique<LocalBackend>(clock, sweep), clock);
}

// Backend that forwards to a LocalBackend until `down` is set, then fails every call.
class OutageBackend final : public StorageBackend
{
public:
    OutageBackend(const Clock& clock, const bool& outage) : inner(clock, 60s), down(outage) {}

    [[nodiscard]] std::string_view name() const override { return "durable"; }

    [[nodiscard]] Result<void> insert(const SessionRecord& rec) override
    {
        if (down) return unavailable();
        return inner.insert(rec);
    }

    [[nodiscard]] Result<std::optional<SessionRecord>> find(std::string_view session_id) override
    {
        if (down) return unavailable();
        return inner.find(session_id);
    }

    [[nodiscard]] Result<bool> mark_invalidated(std::string_view session_id) override
    {
        if (down) return unavailable();
        return inner.mark_invalidated(session_id);
    }

    [[nodiscard]] Result<size_t> remove_expired(time_point now) override
    {
        if (down) return unavailable();
        return inner.remove_expired(now);
    }

    [[nodiscard]] Result<BackendCounts> count(time_point now) override
    {
        if (down) return unavailable();
        return inner.count(now);
    }

private:
    LocalBackend inner;
    const bool& down;

    static std::unexpected<Error> unavailable()
    {
        return fail(ErrorCode::StorageBackendUnavailable, "database is down");
    }
};

struct TempDb
{
    std::string path;

    explicit TempDb(std::string p) : path(std::move(p)) { cleanup(); }
    ~TempDb() { cleanup(); }

    void cleanup() const
    {
        std::error_code ec;
        for (const char* suffix : {"", "-wal", "-shm"})
        {
            fs::remove(path + suffix, ec);
        }
    }
};

} // namespace

TEST_CASE("SessionStore::put then get returns the stored record")
{
    ManualClock clock;
    auto store = make_local_store(clock);
    auto rec = make_record(clock, "s1");

    REQUIRE(store.put(rec).has_value());

    auto got = store.get("s1");
    REQUIRE(got.has_value());
    CHECK(got->state == SessionState::Active);
    CHECK(got->keys.client_write_key == rec.keys.client_write_key);
    CHECK(got->verify_data == rec.verify_data);
    CHECK(got->kem_key_version == 2);
}

TEST_CASE("SessionStore::put rejects duplicates and malformed records")
{
    ManualClock clock;
    auto store = make_local_store(clock);
    REQUIRE(store.put(make_record(clock, "dup")).has_value());

    auto again = store.put(make_record(clock, "dup"));
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error().code == ErrorCode::DuplicateSession);

    auto empty_id = store.put(make_record(clock, ""));
    REQUIRE_FALSE(empty_id.has_value());
    CHECK(empty_id.error().code == ErrorCode::InvalidArgument);

    auto backwards = make_record(clock, "bad");
    backwards.expires_at = backwards.created_at;
    CHECK_FALSE(store.put(backwards).has_value());
}

TEST_CASE("SessionStore::verify reports why a session is not valid")
{
    ManualClock clock;
    auto store = make_local_store(clock);
    REQUIRE(store.put(make_record(clock, "live", 3600s)).has_value());
    REQUIRE(store.put(make_record(clock, "short", 60s)).has_value());
    REQUIRE(store.put(make_record(clock, "revoked", 3600s)).has_value());
    REQUIRE(store.invalidate("revoked").has_value());

    clock.advance(61s);

    auto live = store.verify("live");
    CHECK(live.valid);
    CHECK_FALSE(live.reason.has_value());

    auto expired = store.verify("short");
    CHECK_FALSE(expired.valid);
    CHECK(expired.reason == ErrorCode::SessionExpired);

    auto revoked = store.verify("revoked");
    CHECK_FALSE(revoked.valid);
    CHECK(revoked.reason == ErrorCode::SessionInvalidated);

    auto missing = store.verify("nope");
    CHECK_FALSE(missing.valid);
    CHECK(missing.reason == ErrorCode::SessionNotFound);
}

TEST_CASE("SessionStore treats a session as valid up to its exact expiry")
{
    ManualClock clock;
    auto store = make_local_store(clock);
    REQUIRE(store.put(make_record(clock, "edge", 100s)).has_value());

    clock.advance(100s);
    CHECK(store.verify("edge").valid);
    clock.advance(1ms);
    CHECK_FALSE(store.verify("edge").valid);
}

TEST_CASE("SessionStore::invalidate wipes keys and reports unknown ids")
{
    ManualClock clock;
    auto store = make_local_store(clock);
    REQUIRE(store.put(make_record(clock, "s1")).has_value());

    REQUIRE(store.invalidate("s1").has_value());
    auto got = store.get("s1");
    REQUIRE(got.has_value());
    CHECK(got->state == SessionState::Invalidated);
    CHECK(got->keys.client_write_key == std::array<uint8_t, SessionKeys::key_sz>{});

    auto missing = store.invalidate("s2");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == ErrorCode::SessionNotFound);
}

TEST_CASE("SessionStore::sweep removes only expired sessions")
{
    ManualClock clock;
    auto store = make_local_store(clock);
    REQUIRE(store.put(make_record(clock, "old", 10s)).has_value());
    REQUIRE(store.put(make_record(clock, "new", 3600s)).has_value());

    clock.advance(11s);
    auto swept = store.sweep();
    REQUIRE(swept.has_value());
    CHECK(*swept == 1);

    auto st = store.stats();
    CHECK(st.active == 1);
    CHECK(st.expired == 0);
    CHECK(st.swept == 1);
    CHECK(store.verify("old").reason == ErrorCode::SessionNotFound);
}

TEST_CASE("LocalBackend reaper sweeps expired sessions in the background")
{
    ManualClock clock;
    runtime::Scheduler sched(1);
    auto store = make_local_store(clock, 20ms);
    REQUIRE(store.put(make_record(clock, "r1", 10s)).has_value());
    REQUIRE(store.put(make_record(clock, "r2", 10s)).has_value());
    REQUIRE(store.put(make_record(clock, "keep", 3600s)).has_value());

    store.start(sched);
    clock.advance(11s);

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (store.stats().swept < 2 && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(10ms);
    }
    store.stop();

    auto st = store.stats();
    CHECK(st.swept == 2);
    CHECK(st.active == 1);
    sched.stop();
}

TEST_CASE("SqliteBackend stores sessions durably across reopen")
{
    ManualClock clock;
    TempDb db("/tmp/pqgate_test_sessions.db");

    auto rec = make_record(clock, "durable-1");
    {
        auto backend = SqliteBackend::open(db.path, clock);
        REQUIRE(backend.has_value());
        SessionStore store(std::move(*backend), clock);
        REQUIRE(store.put(rec).has_value());

        auto dup = store.put(rec);
        REQUIRE_FALSE(dup.has_value());
        CHECK(dup.error().code == ErrorCode::DuplicateSession);
    }

    auto backend = SqliteBackend::open(db.path, clock);
    REQUIRE(backend.has_value());
    SessionStore store(std::move(*backend), clock);
    CHECK(store.backend_name() == "durable");

    auto got = store.get("durable-1");
    REQUIRE(got.has_value());
    CHECK(got->handshake_id == rec.handshake_id);
    CHECK(got->keys.server_write_iv == rec.keys.server_write_iv);
    CHECK(got->transcript_hash == rec.transcript_hash);
    CHECK(got->cipher_suite == rec.cipher_suite);
    CHECK(got->client_address == rec.client_address);
    CHECK(to_unix_ms(got->expires_at) == to_unix_ms(rec.expires_at));

    REQUIRE(store.invalidate("durable-1").has_value());
    CHECK(store.verify("durable-1").reason == ErrorCode::SessionInvalidated);
}

TEST_CASE("SqliteBackend::open reports files it cannot use")
{
    ManualClock clock;

    auto missing_dir = SqliteBackend::open("/nonexistent-pqgate-dir/sessions.db", clock);
    CHECK_FALSE(missing_dir.has_value());

    TempDb db("/tmp/pqgate_test_sessions_garbage.db");
    {
        std::ofstream out(db.path, std::ios::binary);
        out << std::string(4096, 'x');
    }
    auto garbage = SqliteBackend::open(db.path, clock);
    REQUIRE_FALSE(garbage.has_value());
    CHECK_FALSE(garbage.error().empty());

    // The rejected handle was released, so the path can be reused.
    db.cleanup();
    auto fresh = SqliteBackend::open(db.path, clock);
    REQUIRE(fresh.has_value());
    CHECK((*fresh)->name() == "durable");
}

TEST_CASE("SqliteBackend purges expired rows when new sessions arrive")
{
    ManualClock clock;
    TempDb db("/tmp/pqgate_test_sessions_purge.db");
    auto backend = SqliteBackend::open(db.path, clock);
    REQUIRE(backend.has_value());
    SessionStore store(std::move(*backend), clock);

    REQUIRE(store.put(make_record(clock, "stale", 10s)).has_value());
    clock.advance(11s);
    CHECK(store.verify("stale").reason == ErrorCode::SessionExpired);

    REQUIRE(store.put(make_record(clock, "fresh", 10s)).has_value());
    CHECK(store.verify("stale").reason == ErrorCode::SessionNotFound);
    CHECK(store.verify("fresh").valid);
    CHECK(store.stats().swept == 1);
}

TEST_CASE("SessionStore::create falls back to local in degraded mode")
{
    ManualClock clock;
    auto store = SessionStore::create(StorageOptions{
        .backend = "durable",
        .durable_target = "/nonexistent/pqgate/dir/sessions.db",
        .degraded_read_cache = false,
        .sweep_interval = 60s,
    }, clock);

    REQUIRE(store != nullptr);
    CHECK(store->degraded());
    CHECK(store->backend_name() == "local");
    CHECK(store->stats().degraded);

    REQUIRE(store->put(make_record(clock, "still-works")).has_value());
    CHECK(store->verify("still-works").valid);
}

TEST_CASE("SessionStore::create with a read cache keeps the durable backend primary")
{
    ManualClock clock;
    TempDb db("/tmp/pqgate_test_sessions_cache.db");
    auto store = SessionStore::create(StorageOptions{
        .backend = "durable",
        .durable_target = db.path,
        .degraded_read_cache = true,
        .sweep_interval = 60s,
    }, clock);

    REQUIRE(store != nullptr);
    CHECK_FALSE(store->degraded());
    CHECK(store->backend_name() == "durable");
    REQUIRE(store->put(make_record(clock, "cached")).has_value());
    CHECK(store->verify("cached").valid);
}

TEST_CASE("SessionStore fails new writes closed while the durable backend is down")
{
    ManualClock clock;
    bool down = false;
    SessionStore store(std::make_unique<OutageBackend>(clock, down), clock);

    down = true;
    auto res = store.put(make_record(clock, "during-outage"));
    REQUIRE_FALSE(res.has_value());
    CHECK(res.error().code == ErrorCode::StorageBackendUnavailable);

    auto vr = store.verify("during-outage");
    CHECK_FALSE(vr.valid);
    CHECK(vr.reason == ErrorCode::StorageBackendUnavailable);

    down = false;
    auto after = store.get("during-outage");
    REQUIRE_FALSE(after.has_value());
    CHECK(after.error().code == ErrorCode::SessionNotFound);
}

TEST_CASE("SessionStore serves mirrored sessions from the read cache during an outage")
{
    ManualClock clock;
    bool down = false;
    SessionStore store(std::make_unique<OutageBackend>(clock, down), clock,
                       std::make_unique<LocalBackend>(clock, 60s));

    REQUIRE(store.put(make_record(clock, "mirrored")).has_value());

    down = true;
    auto rec = store.get("mirrored");
    REQUIRE(rec.has_value());
    CHECK(rec->session_id == "mirrored");
    CHECK(rec->state == SessionState::Active);
    CHECK(store.verify("mirrored").valid);

    // Writes still fail closed and do not land in the cache.
    auto res = store.put(make_record(clock, "not-mirrored"));
    REQUIRE_FALSE(res.has_value());
    CHECK(res.error().code == ErrorCode::StorageBackendUnavailable);
    auto missing = store.get("not-mirrored");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == ErrorCode::SessionNotFound);

    clock.advance(3601s);
    auto vr = store.verify("mirrored");
    CHECK_FALSE(vr.valid);
    CHECK(vr.reason == ErrorCode::SessionExpired);
}

TEST_CASE("to_string names every SessionState")
{
    STATIC_REQUIRE(to_string(SessionState::Active) == "active");
    STATIC_REQUIRE(to_string(SessionState::Expired) == "expired");
    STATIC_REQUIRE(to_string(SessionState::Invalidated) == "invalidated");
}
