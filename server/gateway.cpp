#include "gateway.hpp"
#include "logger.hpp"

#include <format>

std::expected<std::unique_ptr<Gateway>, std::string> Gateway::create(const Config& config, const Clock& clock)
{
    auto provider = keys::make_key_provider(config.keys().provider);
    if (!provider)
    {
        return std::unexpected(provider.error());
    }

    for (const auto& alg : config.keys().kem_algorithms)
    {
        if (!keys::find_algorithm(alg, keys::KeyKind::Kem))
        {
            return std::unexpected(std::format("Unknown KEM algorithm '{}' in config", alg));
        }
    }
    for (const auto& alg : config.keys().sig_algorithms)
    {
        if (!keys::find_algorithm(alg, keys::KeyKind::Signature))
        {
            return std::unexpected(std::format("Unknown signature algorithm '{}' in config", alg));
        }
    }

    return std::make_unique<Gateway>(config, clock, std::move(*provider));
}

Gateway::Gateway(const Config& config, const Clock& clk, std::unique_ptr<keys::KeyProvider> provider)
    : cfg(config)
    , clock(clk)
    , scheduler(std::make_unique<runtime::Scheduler>(config.runtime().worker_threads))
{
    km = std::make_unique<keys::KeyManager>(std::move(provider), clock, keys::KeyManagerOptions{
        .grace_period = cfg.grace_period(),
        .rotation_interval = std::chrono::duration_cast<std::chrono::seconds>(cfg.keys().rotation_interval),
    });

    store = session::SessionStore::create(session::StorageOptions{
        .backend = cfg.storage().backend,
        .durable_target = cfg.storage().durable_target,
        .degraded_read_cache = cfg.storage().degraded_read_cache,
        .sweep_interval = cfg.session().sweep_interval,
    }, clock);

    hs = std::make_unique<handshake::HandshakeCoordinator>(*km, *store, clock, stats, handshake::HandshakeOptions{
        .timeout = cfg.handshake().timeout,
        .session_ttl = cfg.session().ttl,
        .sweep_interval = cfg.handshake().sweep_interval,
        .require_client_verify_data = cfg.handshake().require_client_verify_data,
        .hybrid_x25519 = cfg.handshake().hybrid_x25519,
        .server_address = cfg.handshake().server_address,
    });
}

Gateway::~Gateway()
{
    stop();
}

Result<void> Gateway::generate_keys()
{
    for (const auto& alg : cfg.keys().kem_algorithms)
    {
        if (auto res = km->generate_kem_keypair(alg, "startup"); !res)
        {
            return std::unexpected(res.error());
        }
    }
    for (const auto& alg : cfg.keys().sig_algorithms)
    {
        if (auto res = km->generate_sig_keypair(alg, "startup"); !res)
        {
            return std::unexpected(res.error());
        }
    }
    return {};
}

Result<void> Gateway::restore_keys(std::string_view passphrase, std::span<const uint8_t> blob)
{
    auto res = km->restore_keys(passphrase, blob);
    if (res)
    {
        stats.key_restores++;
    }
    return res;
}

Result<std::vector<uint8_t>> Gateway::backup_keys(std::string_view passphrase)
{
    auto res = km->backup_keys(passphrase);
    if (res)
    {
        stats.key_backups++;
    }
    return res;
}

void Gateway::start()
{
    std::lock_guard lock(lifecycle_mtx);
    if (running.load())
    {
        return;
    }
    if (!scheduler->running())
    {
        LOG_WARN("Gateway cannot restart after stop");
        return;
    }
    running.store(true);

    store->start(*scheduler);
    hs->start(*scheduler);

    rotation_task = scheduler->every("key-rotation", cfg.keys().rotation_check_interval, [this]
    {
        if (auto rotated = km->rotate_if_due(); rotated > 0)
        {
            stats.key_rotations += rotated;
        }
    });
    prune_task = scheduler->every("key-grace-prune", cfg.handshake().sweep_interval, [this]
    {
        std::ignore = km->prune_retired();
    });

    LOG_INFO("Gateway started: {} worker threads, {} session backend{}, key provider {}",
             scheduler->size(), store->backend_name(), store->degraded() ? " (degraded)" : "", km->provider_name());
}

void Gateway::stop()
{
    std::lock_guard lock(lifecycle_mtx);
    if (!running.exchange(false))
    {
        return;
    }

    for (auto* task : {&rotation_task, &prune_task})
    {
        if (*task)
        {
            (*task)->cancel();
            task->reset();
        }
    }
    hs->stop();
    store->stop();
    scheduler->stop();
    LOG_INFO("Gateway stopped");
}

keys::PublicKeyBundle Gateway::public_keys() const
{
    return km->export_public_keys();
}

Result<handshake::ServerHello> Gateway::client_hello(const handshake::ClientHello& hello)
{
    return hs->client_hello(hello);
}

Result<handshake::ServerFinished> Gateway::client_key_exchange(const handshake::ClientKeyExchange& cke)
{
    return hs->client_key_exchange(cke);
}

session::VerifyResult Gateway::verify_session(std::string_view session_id)
{
    return store->verify(session_id);
}

Result<void> Gateway::invalidate_session(std::string_view session_id)
{
    auto res = store->invalidate(session_id);
    if (res)
    {
        stats.sessions_invalidated++;
    }
    return res;
}

HealthReport Gateway::health()
{
    HealthReport report;
    report.running = running.load();
    report.keys_ready = km->has_active_keys();
    report.key_provider = std::string(km->provider_name());
    report.storage_backend = std::string(store->backend_name());
    report.sessions = store->stats();
    report.storage_degraded = store->degraded() || report.sessions.degraded;
    report.pending_handshakes = hs->pending();
    report.healthy = report.keys_ready && !report.storage_degraded;
    stats.sessions_swept = report.sessions.swept;
    return report;
}
