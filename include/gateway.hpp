#pragma once

#include <atomic>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "config.hpp"
#include "errors.hpp"
#include "fundamentals/clock.hpp"
#include "handshake/handshake_coordinator.hpp"
#include "keys/key_manager.hpp"
#include "logger/metrics.hpp"
#include "runtime/scheduler.hpp"
#include "session/session_store.hpp"

struct HealthReport
{
    bool healthy = false;
    bool running = false;
    bool keys_ready = false;
    std::string key_provider;
    std::string storage_backend;
    bool storage_degraded = false;
    size_t pending_handshakes = 0;
    session::StoreStats sessions;
};

/**
 * Owns the whole core: scheduler, key manager, session store and handshake
 * coordinator, wired together from one Config. Nothing runs in the
 * background until start(); stop() cancels every periodic task.
 */
class Gateway
{
public:
    [[nodiscard]] static std::expected<std::unique_ptr<Gateway>, std::string> create(const Config& config,
                                                                                     const Clock& clock);

    Gateway(const Config& config, const Clock& clock, std::unique_ptr<keys::KeyProvider> provider);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // One fresh key pair per configured algorithm.
    [[nodiscard]] Result<void> generate_keys();
    [[nodiscard]] Result<void> restore_keys(std::string_view passphrase, std::span<const uint8_t> blob);
    [[nodiscard]] Result<std::vector<uint8_t>> backup_keys(std::string_view passphrase);

    void start();
    void stop();

    [[nodiscard]] keys::PublicKeyBundle public_keys() const;
    [[nodiscard]] Result<handshake::ServerHello> client_hello(const handshake::ClientHello& hello);
    [[nodiscard]] Result<handshake::ServerFinished> client_key_exchange(const handshake::ClientKeyExchange& cke);
    [[nodiscard]] session::VerifyResult verify_session(std::string_view session_id);
    [[nodiscard]] Result<void> invalidate_session(std::string_view session_id);
    [[nodiscard]] HealthReport health();

    [[nodiscard]] keys::KeyManager& key_manager() { return *km; }
    [[nodiscard]] session::SessionStore& sessions() { return *store; }
    [[nodiscard]] handshake::HandshakeCoordinator& coordinator() { return *hs; }
    [[nodiscard]] GatewayMetrics& metrics() { return stats; }
    [[nodiscard]] const Config& config() const { return cfg; }

private:
    Config cfg;
    const Clock& clock;
    GatewayMetrics stats;

    // Declared first so it is destroyed after everything that owns a task.
    std::unique_ptr<runtime::Scheduler> scheduler;
    std::unique_ptr<keys::KeyManager> km;
    std::unique_ptr<session::SessionStore> store;
    std::unique_ptr<handshake::HandshakeCoordinator> hs;

    std::shared_ptr<runtime::PeriodicTask> rotation_task;
    std::shared_ptr<runtime::PeriodicTask> prune_task;
    // Serializes start/stop; health() reads the flag without it.
    std::mutex lifecycle_mtx;
    std::atomic<bool> running{false};
};
