#include <catch2/catch_test_macros.hpp>

#include "handshake/client_handshake.hpp"
#include "handshake/handshake_coordinator.hpp"
#include "handshake/key_schedule.hpp"
#include "crypto/x25519.hpp"
#include "crypto/kem.hpp"
#include "keys/key_manager.hpp"
#include "logger/metrics.hpp"
#include "runtime/scheduler.hpp"
#include "session/session_store.hpp"

#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace handshake;
using namespace std::chrono_literals;

namespace
{

const std::vector<std::string> kem_offer{"ML-KEM-768", "Kyber768"};
const std::vector<std::string> sig_offer{"ML-DSA-65", "Dilithium3"};

struct Fixture
{
    ManualClock clock;
    GatewayMetrics metrics;
    keys::KeyManager km;
    session::SessionStore store;
    HandshakeCoordinator hs;

    explicit Fixture(HandshakeOptions opts = {}, std::chrono::seconds grace = 30s)
        : km(std::make_unique<keys::SoftwareKeyProvider>(), clock,
             keys::KeyManagerOptions{.grace_period = grace, .rotation_interval = 180 * 24h})
        , store(std::make_unique<session::LocalBackend>(clock, 60s), clock)
        , hs(km, store, clock, metrics, std::move(opts))
    {
        REQUIRE(km.generate_kem_keypair("ML-KEM-768").has_value());
        REQUIRE(km.generate_sig_keypair("ML-DSA-65").has_value());
    }
};

struct Completed
{
    ServerFinished finished;
    session::SessionKeys client_keys;
};

Result<Completed> run_handshake(HandshakeCoordinator& hs, bool offer_x25519 = true)
{
    ClientHandshake client(kem_offer, sig_offer, std::nullopt, offer_x25519);
    auto ch = client.hello("192.0.2.10");
    if (!ch) return std::unexpected(ch.error());
    auto sh = hs.client_hello(*ch);
    if (!sh) return std::unexpected(sh.error());
    auto cke = client.on_server_hello(*sh);
    if (!cke) return std::unexpected(cke.error());
    auto sf = hs.client_key_exchange(*cke);
    if (!sf) return std::unexpected(sf.error());
    auto keys = client.on_server_finished(*sf);
    if (!keys) return std::unexpected(keys.error());
    return Completed{std::move(*sf), *keys};
}

// Key exchange without client confirmation, for hand-built hellos.
ClientKeyExchange raw_exchange(const ServerHello& sh)
{
    auto enc = crypto::Kem(sh.suite.kem).encapsulate(sh.kem_public_key);
    REQUIRE(enc.has_value());
    return ClientKeyExchange{
        .handshake_id = sh.handshake_id,
        .ciphertext = std::move(enc->ciphertext),
        .client_verify_data = std::nullopt,
    };
}

ClientHello plain_hello(const nonce_t& nonce)
{
    return ClientHello{
        .kem_algorithms = kem_offer,
        .sig_algorithms = sig_offer,
        .client_nonce = nonce,
        .client_address = "203.0.113.5",
        .x25519_share = std::nullopt,
    };
}

} // namespace

TEST_CASE("HandshakeCoordinator completes a handshake both sides agree on")
{
    Fixture f;

    auto done = run_handshake(f.hs);
    REQUIRE(done.has_value());

    auto rec = f.store.get(done->finished.session_id);
    REQUIRE(rec.has_value());
    CHECK(rec->keys.client_write_key == done->client_keys.client_write_key);
    CHECK(rec->keys.server_write_key == done->client_keys.server_write_key);
    CHECK(rec->keys.client_write_iv == done->client_keys.client_write_iv);
    CHECK(rec->keys.client_write_key != rec->keys.server_write_key);
    CHECK(rec->cipher_suite == "PQ_ML_KEM_768_ML_DSA_65");
    CHECK(rec->verify_data == done->finished.verify_data);
    CHECK(rec->client_address == "192.0.2.10");

    CHECK(f.metrics.handshakes_started.load() == 1);
    CHECK(f.metrics.handshakes_completed.load() == 1);
    CHECK(f.metrics.sessions_created.load() == 1);
}

TEST_CASE("HandshakeCoordinator sessions expire after the session TTL")
{
    Fixture f;
    auto done = run_handshake(f.hs);
    REQUIRE(done.has_value());
    const auto& id = done->finished.session_id;

    CHECK(f.store.verify(id).valid);
    f.clock.advance(3600s);
    CHECK(f.store.verify(id).valid);
    f.clock.advance(1s);
    auto late = f.store.verify(id);
    CHECK_FALSE(late.valid);
    CHECK(late.reason == ErrorCode::SessionExpired);
}

TEST_CASE("HandshakeCoordinator assigns distinct session ids even when nonces collide")
{
    Fixture f;
    nonce_t shared_nonce{};
    shared_nonce.fill(0x42);

    auto sh1 = f.hs.client_hello(plain_hello(shared_nonce));
    auto sh2 = f.hs.client_hello(plain_hello(shared_nonce));
    REQUIRE(sh1.has_value());
    REQUIRE(sh2.has_value());
    CHECK(sh1->handshake_id != sh2->handshake_id);

    auto sf1 = f.hs.client_key_exchange(raw_exchange(*sh1));
    auto sf2 = f.hs.client_key_exchange(raw_exchange(*sh2));
    REQUIRE(sf1.has_value());
    REQUIRE(sf2.has_value());
    CHECK(sf1->session_id != sf2->session_id);
}

TEST_CASE("HandshakeCoordinator handles concurrent handshakes independently")
{
    Fixture f;
    std::mutex ids_mtx;
    std::set<std::string> ids;
    std::atomic<int> failures{0};

    std::vector<std::jthread> workers;
    for (int t = 0; t < 4; ++t)
    {
        workers.emplace_back([&]
        {
            for (int i = 0; i < 5; ++i)
            {
                auto done = run_handshake(f.hs);
                if (!done)
                {
                    failures++;
                    continue;
                }
                std::lock_guard lock(ids_mtx);
                ids.insert(done->finished.session_id);
            }
        });
    }
    workers.clear();

    CHECK(failures.load() == 0);
    CHECK(ids.size() == 20);
    CHECK(f.store.stats().active == 20);
}

TEST_CASE("HandshakeCoordinator finishes a handshake across a rotation within grace")
{
    Fixture f;
    ClientHandshake client(kem_offer, sig_offer);
    auto ch = client.hello();
    REQUIRE(ch.has_value());
    auto sh = f.hs.client_hello(*ch);
    REQUIRE(sh.has_value());
    auto cke = client.on_server_hello(*sh);
    REQUIRE(cke.has_value());

    REQUIRE(f.km.rotate_kem_key().has_value());
    REQUIRE(f.km.rotate_sig_key().has_value());
    f.clock.advance(10s);

    auto sf = f.hs.client_key_exchange(*cke);
    REQUIRE(sf.has_value());
    CHECK(sf->sig_key_version == sh->sig_key_version);
    REQUIRE(client.on_server_finished(*sf).has_value());

    auto rec = f.store.get(sf->session_id);
    REQUIRE(rec.has_value());
    CHECK(rec->kem_key_version == 1);
}

TEST_CASE("HandshakeCoordinator fails cleanly once the rotated key left its grace period")
{
    Fixture f(HandshakeOptions{.timeout = 120s}, 30s);
    ClientHandshake client(kem_offer, sig_offer);
    auto ch = client.hello();
    REQUIRE(ch.has_value());
    auto sh = f.hs.client_hello(*ch);
    REQUIRE(sh.has_value());
    auto cke = client.on_server_hello(*sh);
    REQUIRE(cke.has_value());

    REQUIRE(f.km.rotate_kem_key().has_value());
    f.clock.advance(31s);

    auto sf = f.hs.client_key_exchange(*cke);
    REQUIRE_FALSE(sf.has_value());
    CHECK(sf.error().code == ErrorCode::DecapsulationFailed);
    CHECK(f.hs.status(sh->handshake_id) == HandshakeStatus::Failed);
    CHECK(f.store.stats().total() == 0);
}

TEST_CASE("HandshakeCoordinator rejects a corrupted ciphertext without storing a session")
{
    Fixture f;
    ClientHandshake client(kem_offer, sig_offer);
    auto ch = client.hello();
    REQUIRE(ch.has_value());
    auto sh = f.hs.client_hello(*ch);
    REQUIRE(sh.has_value());
    auto cke = client.on_server_hello(*sh);
    REQUIRE(cke.has_value());

    cke->ciphertext[cke->ciphertext.size() / 2] ^= 0x5A;
    auto sf = f.hs.client_key_exchange(*cke);

    REQUIRE_FALSE(sf.has_value());
    CHECK(sf.error().code == ErrorCode::TranscriptIntegrityFailure);
    CHECK(f.hs.status(sh->handshake_id) == HandshakeStatus::Failed);
    CHECK(f.store.stats().total() == 0);
    CHECK(f.metrics.integrity_failures.load() == 1);
    CHECK(f.metrics.handshakes_failed.load() == 1);
}

TEST_CASE("HandshakeCoordinator rejects a truncated ciphertext")
{
    Fixture f;
    auto sh = f.hs.client_hello(plain_hello(nonce_t{}));
    REQUIRE(sh.has_value());

    auto cke = raw_exchange(*sh);
    cke.ciphertext.resize(10);
    auto sf = f.hs.client_key_exchange(cke);

    REQUIRE_FALSE(sf.has_value());
    CHECK(sf.error().code == ErrorCode::DecapsulationFailed);
    CHECK(f.store.stats().total() == 0);
}

TEST_CASE("HandshakeCoordinator requires client verify data when configured")
{
    Fixture f(HandshakeOptions{.require_client_verify_data = true});
    auto sh = f.hs.client_hello(plain_hello(nonce_t{}));
    REQUIRE(sh.has_value());

    auto sf = f.hs.client_key_exchange(raw_exchange(*sh));
    REQUIRE_FALSE(sf.has_value());
    CHECK(sf.error().code == ErrorCode::TranscriptIntegrityFailure);

    CHECK(run_handshake(f.hs).has_value());
}

TEST_CASE("HandshakeCoordinator answers a repeated key exchange with ProtocolOrderViolation")
{
    Fixture f;
    ClientHandshake client(kem_offer, sig_offer);
    auto ch = client.hello();
    REQUIRE(ch.has_value());
    auto sh = f.hs.client_hello(*ch);
    REQUIRE(sh.has_value());
    auto cke = client.on_server_hello(*sh);
    REQUIRE(cke.has_value());

    auto first = f.hs.client_key_exchange(*cke);
    REQUIRE(first.has_value());
    auto second = f.hs.client_key_exchange(*cke);
    REQUIRE_FALSE(second.has_value());
    CHECK(second.error().code == ErrorCode::ProtocolOrderViolation);

    CHECK(f.store.verify(first->session_id).valid);
    CHECK(f.store.stats().active == 1);
    CHECK(f.metrics.order_violations.load() == 1);
}

TEST_CASE("HandshakeCoordinator lets exactly one concurrent key exchange win")
{
    Fixture f;
    auto sh = f.hs.client_hello(plain_hello(nonce_t{}));
    REQUIRE(sh.has_value());
    auto cke = raw_exchange(*sh);

    std::atomic<int> successes{0};
    std::atomic<int> violations{0};
    {
        std::vector<std::jthread> racers;
        for (int i = 0; i < 4; ++i)
        {
            racers.emplace_back([&]
            {
                auto res = f.hs.client_key_exchange(cke);
                if (res)
                {
                    successes++;
                }
                else if (res.error().code == ErrorCode::ProtocolOrderViolation)
                {
                    violations++;
                }
            });
        }
    }

    CHECK(successes.load() == 1);
    CHECK(violations.load() == 3);
    CHECK(f.store.stats().active == 1);
}

TEST_CASE("HandshakeCoordinator fails negotiation without creating state")
{
    Fixture f;
    auto hello = plain_hello(nonce_t{});
    hello.kem_algorithms = {"Kyber512"};

    auto sh = f.hs.client_hello(hello);
    REQUIRE_FALSE(sh.has_value());
    CHECK(sh.error().code == ErrorCode::AlgorithmNegotiationFailed);
    CHECK(f.hs.pending() == 0);
    CHECK(f.metrics.negotiation_failures.load() == 1);
    CHECK(f.metrics.handshakes_started.load() == 0);
}

TEST_CASE("HandshakeCoordinator reports unknown and expired handshakes as not found")
{
    Fixture f;
    auto unknown = f.hs.client_key_exchange(ClientKeyExchange{.handshake_id = "missing", .ciphertext = {1, 2, 3}});
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::HandshakeNotFound);

    auto sh = f.hs.client_hello(plain_hello(nonce_t{}));
    REQUIRE(sh.has_value());
    f.clock.advance(31s);

    auto late = f.hs.client_key_exchange(raw_exchange(*sh));
    REQUIRE_FALSE(late.has_value());
    CHECK(late.error().code == ErrorCode::HandshakeNotFound);
    CHECK(f.metrics.handshakes_expired.load() == 1);
}

TEST_CASE("HandshakeCoordinator::sweep_expired reclaims abandoned handshakes")
{
    Fixture f;
    auto abandoned = f.hs.client_hello(plain_hello(nonce_t{}));
    REQUIRE(abandoned.has_value());
    f.clock.advance(20s);
    auto recent = f.hs.client_hello(plain_hello(nonce_t{}));
    REQUIRE(recent.has_value());
    CHECK(f.hs.pending() == 2);

    f.clock.advance(11s);
    CHECK(f.hs.sweep_expired() == 1);
    CHECK(f.hs.pending() == 1);
    CHECK_FALSE(f.hs.status(abandoned->handshake_id).has_value());

    auto res = f.hs.client_key_exchange(raw_exchange(*abandoned));
    REQUIRE_FALSE(res.has_value());
    CHECK(res.error().code == ErrorCode::HandshakeNotFound);

    CHECK(f.hs.client_key_exchange(raw_exchange(*recent)).has_value());
}

TEST_CASE("HandshakeCoordinator sweep runs as a scheduled task")
{
    Fixture f(HandshakeOptions{.sweep_interval = 20ms});
    runtime::Scheduler sched(1);
    auto sh = f.hs.client_hello(plain_hello(nonce_t{}));
    REQUIRE(sh.has_value());

    f.hs.start(sched);
    f.clock.advance(31s);
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (f.hs.pending() > 0 && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(10ms);
    }
    f.hs.stop();
    sched.stop();

    CHECK(f.hs.pending() == 0);
    CHECK(f.metrics.handshakes_expired.load() == 1);
}

TEST_CASE("ClientHandshake rejects a tampered ServerFinished")
{
    Fixture f;
    ClientHandshake client(kem_offer, sig_offer);
    auto ch = client.hello();
    REQUIRE(ch.has_value());
    auto sh = f.hs.client_hello(*ch);
    REQUIRE(sh.has_value());
    auto cke = client.on_server_hello(*sh);
    REQUIRE(cke.has_value());
    auto sf = f.hs.client_key_exchange(*cke);
    REQUIRE(sf.has_value());

    sf->verify_data[0] ^= 0x01;
    auto keys = client.on_server_finished(*sf);
    REQUIRE_FALSE(keys.has_value());
    CHECK(keys.error().code == ErrorCode::TranscriptIntegrityFailure);
}

TEST_CASE("ClientHandshake refuses a server key that does not match the pin")
{
    Fixture f;
    ClientHandshake client(kem_offer, sig_offer, std::vector<uint8_t>(32, 0xEE));
    auto ch = client.hello();
    REQUIRE(ch.has_value());
    auto sh = f.hs.client_hello(*ch);
    REQUIRE(sh.has_value());

    auto cke = client.on_server_hello(*sh);
    REQUIRE_FALSE(cke.has_value());
    CHECK(cke.error().code == ErrorCode::TranscriptIntegrityFailure);
}

TEST_CASE("ClientHandshake enforces message order")
{
    ClientHandshake client(kem_offer, sig_offer);
    auto early = client.on_server_finished(ServerFinished{});
    REQUIRE_FALSE(early.has_value());
    CHECK(early.error().code == ErrorCode::ProtocolOrderViolation);

    REQUIRE(client.hello().has_value());
    CHECK_FALSE(client.hello().has_value());
}

TEST_CASE("HandshakeCoordinator answers an X25519 share and both sides agree on hybrid keys")
{
    Fixture f;
    ClientHandshake client(kem_offer, sig_offer);
    auto ch = client.hello("192.0.2.10");
    REQUIRE(ch.has_value());
    REQUIRE(ch->x25519_share.has_value());
    CHECK(ch->x25519_share->size() == crypto::X25519::key_sz);

    auto sh = f.hs.client_hello(*ch);
    REQUIRE(sh.has_value());
    REQUIRE(sh->x25519_share.has_value());
    CHECK(sh->x25519_share->size() == crypto::X25519::key_sz);
    CHECK(*sh->x25519_share != *ch->x25519_share);

    auto cke = client.on_server_hello(*sh);
    REQUIRE(cke.has_value());
    auto sf = f.hs.client_key_exchange(*cke);
    REQUIRE(sf.has_value());
    auto keys = client.on_server_finished(*sf);
    REQUIRE(keys.has_value());

    auto rec = f.store.get(sf->session_id);
    REQUIRE(rec.has_value());
    CHECK(rec->keys.client_write_key == keys->client_write_key);
    CHECK(rec->keys.server_write_iv == keys->server_write_iv);
}

TEST_CASE("HandshakeCoordinator falls back to the KEM secret when either side skips X25519")
{
    SECTION("client does not offer a share")
    {
        Fixture f;
        auto done = run_handshake(f.hs, false);
        REQUIRE(done.has_value());
        CHECK(f.store.verify(done->finished.session_id).valid);
    }
    SECTION("server has the hybrid exchange disabled")
    {
        Fixture f(HandshakeOptions{.hybrid_x25519 = false});
        ClientHandshake client(kem_offer, sig_offer);
        auto ch = client.hello();
        REQUIRE(ch.has_value());
        auto sh = f.hs.client_hello(*ch);
        REQUIRE(sh.has_value());
        CHECK_FALSE(sh->x25519_share.has_value());

        auto cke = client.on_server_hello(*sh);
        REQUIRE(cke.has_value());
        auto sf = f.hs.client_key_exchange(*cke);
        REQUIRE(sf.has_value());
        CHECK(client.on_server_finished(*sf).has_value());
    }
}

TEST_CASE("HandshakeCoordinator rejects unusable X25519 shares")
{
    Fixture f;
    nonce_t nonce{};
    nonce.fill(0x11);

    auto short_share = plain_hello(nonce);
    short_share.x25519_share = std::vector<uint8_t>(16, 0x09);
    auto res = f.hs.client_hello(short_share);
    REQUIRE_FALSE(res.has_value());
    CHECK(res.error().code == ErrorCode::InvalidArgument);

    // The identity point yields an all-zero secret.
    auto low_order = plain_hello(nonce);
    low_order.x25519_share = std::vector<uint8_t>(crypto::X25519::key_sz, 0x00);
    auto zero = f.hs.client_hello(low_order);
    REQUIRE_FALSE(zero.has_value());
    CHECK(zero.error().code == ErrorCode::InvalidArgument);

    CHECK(f.hs.pending() == 0);
}

TEST_CASE("HandshakeCoordinator detects a substituted X25519 share")
{
    Fixture f;
    ClientHandshake client(kem_offer, sig_offer);
    auto ch = client.hello();
    REQUIRE(ch.has_value());
    auto sh = f.hs.client_hello(*ch);
    REQUIRE(sh.has_value());

    auto attacker = crypto::X25519::generate_keypair();
    REQUIRE(attacker.has_value());
    auto forged = *sh;
    forged.x25519_share = attacker->public_key;

    auto cke = client.on_server_hello(forged);
    REQUIRE(cke.has_value());
    auto sf = f.hs.client_key_exchange(*cke);
    REQUIRE_FALSE(sf.has_value());
    CHECK(sf.error().code == ErrorCode::TranscriptIntegrityFailure);
    CHECK(f.store.stats().active == 0);
}

TEST_CASE("ClientHandshake refuses an X25519 share it never offered")
{
    Fixture f;
    ClientHandshake client(kem_offer, sig_offer, std::nullopt, false);
    auto ch = client.hello();
    REQUIRE(ch.has_value());
    CHECK_FALSE(ch->x25519_share.has_value());

    auto sh = f.hs.client_hello(*ch);
    REQUIRE(sh.has_value());
    auto injected = *sh;
    injected.x25519_share = std::vector<uint8_t>(crypto::X25519::key_sz, 0x42);

    auto cke = client.on_server_hello(injected);
    REQUIRE_FALSE(cke.has_value());
    CHECK(cke.error().code == ErrorCode::TranscriptIntegrityFailure);
}

TEST_CASE("derive_key_block depends on the classical secret")
{
    std::vector<uint8_t> kem_secret(32, 0x01);
    std::vector<uint8_t> classical(32, 0x02);
    nonce_t cn{};
    nonce_t sn{};
    cn.fill(0x03);
    sn.fill(0x04);

    auto pq_only = derive_key_block(kem_secret, cn, sn);
    auto hybrid = derive_key_block(kem_secret, cn, sn, classical);
    auto hybrid_again = derive_key_block(kem_secret, cn, sn, classical);
    REQUIRE(pq_only.has_value());
    REQUIRE(hybrid.has_value());
    REQUIRE(hybrid_again.has_value());
    CHECK(pq_only->keys.client_write_key != hybrid->keys.client_write_key);
    CHECK(pq_only->finished_key != hybrid->finished_key);
    CHECK(hybrid->keys.client_write_key == hybrid_again->keys.client_write_key);
}

TEST_CASE("to_string names every HandshakeStatus")
{
    STATIC_REQUIRE(to_string(HandshakeStatus::Init) == "INIT");
    STATIC_REQUIRE(to_string(HandshakeStatus::HelloReceived) == "HELLO_RECEIVED");
    STATIC_REQUIRE(to_string(HandshakeStatus::KeyExchanged) == "KEY_EXCHANGED");
    STATIC_REQUIRE(to_string(HandshakeStatus::Finished) == "FINISHED");
    STATIC_REQUIRE(to_string(HandshakeStatus::Failed) == "FAILED");
    STATIC_REQUIRE(to_string(HandshakeStatus::Timeout) == "TIMEOUT");
}
