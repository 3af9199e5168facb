#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "errors.hpp"
#include "crypto/kdf.hpp"
#include "crypto/utils.hpp"
#include "fundamentals/clock.hpp"
#include "handshake/messages.hpp"
#include "keys/key_manager.hpp"
#include "logger/metrics.hpp"
#include "runtime/scheduler.hpp"
#include "session/session_store.hpp"

namespace handshake
{

enum class HandshakeStatus : uint8_t
{
    Init,
    HelloReceived,
    KeyExchanged,
    Finished,
    Failed,
    Timeout,
};

[[nodiscard]] constexpr std::string_view to_string(HandshakeStatus st)
{
    switch (st)
    {
        case HandshakeStatus::Init:          return "INIT";
        case HandshakeStatus::HelloReceived: return "HELLO_RECEIVED";
        case HandshakeStatus::KeyExchanged:  return "KEY_EXCHANGED";
        case HandshakeStatus::Finished:      return "FINISHED";
        case HandshakeStatus::Failed:        return "FAILED";
        case HandshakeStatus::Timeout:       return "TIMEOUT";
    }
    return "UNKNOWN";
}

struct HandshakeOptions
{
    std::chrono::seconds timeout{30};
    std::chrono::seconds session_ttl{3600};
    std::chrono::milliseconds sweep_interval{std::chrono::seconds(5)};
    bool require_client_verify_data = false;
    // Answer a client's X25519 share and mix the classical secret into the key schedule.
    bool hybrid_x25519 = true;
    std::string server_address = "0.0.0.0";
};

/**
 * Server side of the handshake. Each handshake id moves
 * INIT -> HELLO_RECEIVED -> KEY_EXCHANGED -> FINISHED, or ends in FAILED or
 * TIMEOUT. The step out of HELLO_RECEIVED is claimed with a compare-exchange
 * so exactly one ClientKeyExchange per id can proceed; no lock is held while
 * decapsulating, signing or writing the session.
 *
 * Finished and failed ids stay in the table, stripped of key material, until
 * their original deadline so late duplicates are reported as out of order.
 */
class HandshakeCoordinator
{
public:
    HandshakeCoordinator(keys::KeyManager& key_manager,
                         session::SessionStore& store,
                         const Clock& clock,
                         GatewayMetrics& metrics,
                         HandshakeOptions opts = {});
    ~HandshakeCoordinator();

    HandshakeCoordinator(const HandshakeCoordinator&) = delete;
    HandshakeCoordinator& operator=(const HandshakeCoordinator&) = delete;

    [[nodiscard]] Result<ServerHello> client_hello(const ClientHello& hello);
    [[nodiscard]] Result<ServerFinished> client_key_exchange(const ClientKeyExchange& cke);

    // Drops entries past their deadline; returns how many pending handshakes timed out.
    size_t sweep_expired();

    void start(runtime::Scheduler& sched);
    void stop();

    [[nodiscard]] std::optional<HandshakeStatus> status(std::string_view handshake_id) const;
    [[nodiscard]] size_t pending() const;
    [[nodiscard]] const HandshakeOptions& options() const { return opts; }

private:
    struct Entry
    {
        std::atomic<HandshakeStatus> status{HandshakeStatus::Init};
        keys::AlgorithmSuite suite;
        nonce_t client_nonce{};
        nonce_t server_nonce{};
        std::shared_ptr<const keys::KeyPair> kem_key;
        std::shared_ptr<const keys::KeyPair> sig_key;
        crypto::SecretBytes classical_secret;
        crypto::TranscriptHash transcript;
        time_point created_at;
        time_point expires_at;
        std::string client_address;

        void discard_secrets()
        {
            kem_key.reset();
            sig_key.reset();
            classical_secret.wipe();
            transcript = crypto::TranscriptHash();
        }
    };

    keys::KeyManager& key_manager;
    session::SessionStore& store;
    const Clock& clock;
    GatewayMetrics& metrics;
    HandshakeOptions opts;

    mutable std::mutex table_mtx;
    std::unordered_map<std::string, std::shared_ptr<Entry>> table;

    std::shared_ptr<runtime::PeriodicTask> sweeper;

    [[nodiscard]] Result<ServerFinished> complete(const std::string& handshake_id, Entry& entry, const ClientKeyExchange& cke);
    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>> answer_share(const ClientHello& hello, Entry& entry);
    [[nodiscard]] Result<std::string> store_session(session::SessionRecord& rec);
    void abort(Entry& entry, const std::string& handshake_id, const Error& err);
};

} // namespace handshake
