#include "handshake/handshake_coordinator.hpp"
#include "handshake/key_schedule.hpp"
#include "crypto/utils.hpp"
#include "crypto/x25519.hpp"
#include "logger.hpp"

#include <algorithm>
#include <format>

namespace handshake
{

namespace
{

constexpr int session_id_attempts = 3;

} // namespace

HandshakeCoordinator::HandshakeCoordinator(keys::KeyManager& km,
                                           session::SessionStore& session_store,
                                           const Clock& clk,
                                           GatewayMetrics& m,
                                           HandshakeOptions options)
    : key_manager(km)
    , store(session_store)
    , clock(clk)
    , metrics(m)
    , opts(std::move(options))
{
}

HandshakeCoordinator::~HandshakeCoordinator()
{
    stop();
}

Result<ServerHello> HandshakeCoordinator::client_hello(const ClientHello& hello)
{
    auto kem_alg = keys::negotiate(hello.kem_algorithms, key_manager.supported_algorithms(keys::KeyKind::Kem),
                                   keys::KeyKind::Kem);
    auto sig_alg = keys::negotiate(hello.sig_algorithms, key_manager.supported_algorithms(keys::KeyKind::Signature),
                                   keys::KeyKind::Signature);
    if (!kem_alg || !sig_alg)
    {
        metrics.negotiation_failures++;
        LOG_INFO("Negotiation failed for {}: no common {} algorithm",
                 hello.client_address.empty() ? "client" : hello.client_address, !kem_alg ? "KEM" : "signature");
        return fail(ErrorCode::AlgorithmNegotiationFailed,
                    std::format("no common {} algorithm", !kem_alg ? "KEM" : "signature"));
    }

    auto kem_key = key_manager.current_key(keys::KeyKind::Kem, *kem_alg);
    auto sig_key = key_manager.current_key(keys::KeyKind::Signature, *sig_alg);
    if (!kem_key || !sig_key)
    {
        return fail(ErrorCode::NoActiveKey, std::format("no active key for {}/{}", *kem_alg, *sig_alg));
    }

    auto server_nonce = crypto::random_array<nonce_sz>();
    if (!server_nonce)
    {
        return fail(ErrorCode::CryptoFailure, "failed to generate server nonce");
    }

    auto entry = std::make_shared<Entry>();
    entry->suite = keys::AlgorithmSuite{
        .kem = *kem_alg,
        .sig = *sig_alg,
        .rank = std::min(keys::find_algorithm(*kem_alg, keys::KeyKind::Kem)->rank,
                         keys::find_algorithm(*sig_alg, keys::KeyKind::Signature)->rank),
    };
    entry->client_nonce = hello.client_nonce;
    entry->server_nonce = *server_nonce;
    entry->kem_key = kem_key;
    entry->sig_key = sig_key;
    entry->created_at = clock.now();
    entry->expires_at = entry->created_at + opts.timeout;
    entry->client_address = hello.client_address;

    auto share = answer_share(hello, *entry);
    if (!share)
    {
        return std::unexpected(share.error());
    }

    ServerHello reply{
        .handshake_id = {},
        .suite = entry->suite,
        .kem_public_key = kem_key->public_key(),
        .kem_key_version = kem_key->version(),
        .sig_public_key = sig_key->public_key(),
        .sig_key_version = sig_key->version(),
        .server_nonce = *server_nonce,
        .expires_at = entry->expires_at,
        .x25519_share = std::move(*share),
    };

    for (;;)
    {
        auto id = crypto::random_id("", 16);
        if (!id)
        {
            return fail(ErrorCode::CryptoFailure, "failed to allocate handshake id");
        }
        reply.handshake_id = std::move(*id);

        entry->transcript = crypto::TranscriptHash();
        if (!entry->transcript.absorb(encode(hello)) || !entry->transcript.absorb(encode(reply)))
        {
            return fail(ErrorCode::CryptoFailure, "transcript hash failure");
        }
        entry->status.store(HandshakeStatus::HelloReceived, std::memory_order_release);

        std::lock_guard lock(table_mtx);
        if (auto [it, inserted] = table.try_emplace(reply.handshake_id, entry); inserted)
        {
            break;
        }
    }

    metrics.handshakes_started++;
    LOG_DEBUG("Handshake {} negotiated {}{} (kem key v{}, sig key v{})",
              reply.handshake_id, reply.suite.cipher_suite(), reply.x25519_share ? " + X25519" : "",
              reply.kem_key_version, reply.sig_key_version);
    return reply;
}

Result<std::optional<std::vector<uint8_t>>> HandshakeCoordinator::answer_share(const ClientHello& hello, Entry& entry)
{
    if (!hello.x25519_share || !opts.hybrid_x25519)
    {
        return std::nullopt;
    }
    if (hello.x25519_share->size() != crypto::X25519::key_sz)
    {
        return fail(ErrorCode::InvalidArgument,
                    std::format("X25519 share is {} bytes, expected {}", hello.x25519_share->size(), crypto::X25519::key_sz));
    }

    auto ephemeral = crypto::X25519::generate_keypair();
    if (!ephemeral)
    {
        return fail(ErrorCode::CryptoFailure, "failed to generate X25519 key");
    }
    auto shared = crypto::X25519::exchange(ephemeral->secret_key.view(), *hello.x25519_share);
    if (!shared)
    {
        return fail(ErrorCode::InvalidArgument, "X25519 share is not a usable public key");
    }
    entry.classical_secret = std::move(*shared);
    return std::move(ephemeral->public_key);
}

Result<ServerFinished> HandshakeCoordinator::client_key_exchange(const ClientKeyExchange& cke)
{
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard lock(table_mtx);
        auto it = table.find(cke.handshake_id);
        if (it == table.end())
        {
            return fail(ErrorCode::HandshakeNotFound, cke.handshake_id);
        }
        if (clock.now() > it->second->expires_at)
        {
            auto expected = HandshakeStatus::HelloReceived;
            if (it->second->status.compare_exchange_strong(expected, HandshakeStatus::Timeout))
            {
                it->second->discard_secrets();
                metrics.handshakes_expired++;
            }
            table.erase(it);
            return fail(ErrorCode::HandshakeNotFound, std::format("{} expired", cke.handshake_id));
        }
        entry = it->second;
    }

    // Exactly one caller moves the handshake out of HELLO_RECEIVED.
    auto expected = HandshakeStatus::HelloReceived;
    if (!entry->status.compare_exchange_strong(expected, HandshakeStatus::KeyExchanged, std::memory_order_acq_rel))
    {
        metrics.order_violations++;
        LOG_WARN("Handshake {}: key exchange received in state {}", cke.handshake_id, to_string(expected));
        return fail(ErrorCode::ProtocolOrderViolation,
                    std::format("handshake {} is {}", cke.handshake_id, to_string(expected)));
    }

    auto result = complete(cke.handshake_id, *entry, cke);
    if (!result)
    {
        abort(*entry, cke.handshake_id, result.error());
        return result;
    }

    entry->discard_secrets();
    entry->status.store(HandshakeStatus::Finished, std::memory_order_release);
    metrics.handshakes_completed++;
    return result;
}

Result<ServerFinished> HandshakeCoordinator::complete(const std::string& handshake_id,
                                                      Entry& entry,
                                                      const ClientKeyExchange& cke)
{
    if (!entry.transcript.absorb(encode(cke)))
    {
        return fail(ErrorCode::CryptoFailure, "transcript hash failure");
    }

    auto shared_secret = key_manager.decapsulate(*entry.kem_key, cke.ciphertext);
    if (!shared_secret)
    {
        return std::unexpected(shared_secret.error());
    }

    auto kb = derive_key_block(shared_secret->view(), entry.client_nonce, entry.server_nonce,
                               entry.classical_secret.view());
    shared_secret->wipe();
    entry.classical_secret.wipe();
    auto transcript = entry.transcript.peek();
    if (!kb || !transcript)
    {
        return fail(ErrorCode::CryptoFailure, "key schedule failure");
    }

    if (cke.client_verify_data)
    {
        auto expect = client_verify_data(*kb, *transcript);
        if (!expect || !crypto::constant_time_equal(*expect, *cke.client_verify_data))
        {
            kb->wipe();
            return fail(ErrorCode::TranscriptIntegrityFailure, "client verify data mismatch");
        }
    }
    else if (opts.require_client_verify_data)
    {
        kb->wipe();
        return fail(ErrorCode::TranscriptIntegrityFailure, "client verify data required");
    }

    const auto& sig_key = entry.sig_key;
    auto signature = key_manager.sign(*sig_key, signature_input(*transcript));
    auto verify_data = server_verify_data(*kb, *transcript);
    if (!signature || !verify_data)
    {
        kb->wipe();
        return signature ? fail(ErrorCode::CryptoFailure, "verify data failure") : std::unexpected(signature.error());
    }

    auto now = clock.now();
    session::SessionRecord rec;
    rec.handshake_id = handshake_id;
    rec.keys = kb->keys;
    rec.verify_data = *verify_data;
    rec.transcript_hash = *transcript;
    rec.cipher_suite = entry.suite.cipher_suite();
    rec.kem_algorithm = entry.suite.kem;
    rec.sig_algorithm = entry.suite.sig;
    rec.kem_key_version = entry.kem_key->version();
    rec.sig_key_version = sig_key->version();
    rec.created_at = now;
    rec.expires_at = now + opts.session_ttl;
    rec.client_address = entry.client_address;
    rec.server_address = opts.server_address;
    kb->wipe();

    auto session_id = store_session(rec);
    if (!session_id)
    {
        return std::unexpected(session_id.error());
    }

    metrics.sessions_created++;
    LOG_INFO("Handshake {} finished: session {} ({})", handshake_id, *session_id, rec.cipher_suite);
    return ServerFinished{
        .session_id = std::move(*session_id),
        .signature = std::move(*signature),
        .verify_data = *verify_data,
        .sig_key_version = sig_key->version(),
        .session_expires_at = rec.expires_at,
    };
}

Result<std::string> HandshakeCoordinator::store_session(session::SessionRecord& rec)
{
    for (int attempt = 0; attempt < session_id_attempts; ++attempt)
    {
        auto id = crypto::random_id("", 16);
        if (!id)
        {
            return fail(ErrorCode::CryptoFailure, "failed to allocate session id");
        }
        rec.session_id = *id;

        auto stored = store.put(rec);
        if (stored)
        {
            return std::move(*id);
        }
        if (stored.error().code != ErrorCode::DuplicateSession)
        {
            return std::unexpected(stored.error());
        }
        LOG_WARN("Session id collision on {}, regenerating", *id);
    }
    return fail(ErrorCode::DuplicateSession, "could not allocate a unique session id");
}

void HandshakeCoordinator::abort(Entry& entry, const std::string& handshake_id, const Error& err)
{
    entry.discard_secrets();
    entry.status.store(HandshakeStatus::Failed, std::memory_order_release);
    metrics.handshakes_failed++;

    if (err.code == ErrorCode::TranscriptIntegrityFailure)
    {
        metrics.integrity_failures++;
        LOG_AUDIT("Handshake {} from {} failed integrity check: {}",
                  handshake_id, entry.client_address.empty() ? "unknown" : entry.client_address, err.detail);
    }
    else
    {
        LOG_WARN("Handshake {} failed: {}", handshake_id, err);
    }
}

size_t HandshakeCoordinator::sweep_expired()
{
    size_t timed_out = 0;
    auto now = clock.now();
    std::lock_guard lock(table_mtx);
    std::erase_if(table, [&](auto& kv)
    {
        auto& entry = *kv.second;
        if (now <= entry.expires_at)
        {
            return false;
        }
        auto expected = HandshakeStatus::HelloReceived;
        if (entry.status.compare_exchange_strong(expected, HandshakeStatus::Timeout))
        {
            entry.discard_secrets();
            ++timed_out;
        }
        // A handshake mid-exchange keeps its own reference and finishes normally.
        return true;
    });

    if (timed_out > 0)
    {
        metrics.handshakes_expired += timed_out;
        LOG_DEBUG("Handshake sweep expired {} pending handshakes", timed_out);
    }
    return timed_out;
}

void HandshakeCoordinator::start(runtime::Scheduler& sched)
{
    if (sweeper)
    {
        return;
    }
    sweeper = sched.every("handshake-sweep", opts.sweep_interval, [this] { sweep_expired(); });
}

void HandshakeCoordinator::stop()
{
    if (sweeper)
    {
        sweeper->cancel();
        sweeper.reset();
    }
}

std::optional<HandshakeStatus> HandshakeCoordinator::status(std::string_view handshake_id) const
{
    std::lock_guard lock(table_mtx);
    auto it = table.find(std::string(handshake_id));
    if (it == table.end())
    {
        return std::nullopt;
    }
    return it->second->status.load(std::memory_order_acquire);
}

size_t HandshakeCoordinator::pending() const
{
    std::lock_guard lock(table_mtx);
    return static_cast<size_t>(std::ranges::count_if(table, [](const auto& kv)
    {
        return kv.second->status.load(std::memory_order_acquire) == HandshakeStatus::HelloReceived;
    }));
}

} // namespace handshake
