#pragma once

#include <boost/json.hpp>
#include <string>
#include <vector>
#include <expected>
#include <optional>
#include <cstdint>
#include <chrono>

namespace json = boost::json;

/**
 * Gateway configuration loaded from JSON file.
 * Load-once at startup, immutable thereafter.
 */
class Config
{
public:
    struct HandshakeCfg
    {
        std::chrono::seconds timeout{30};
        std::chrono::seconds sweep_interval{5};
        bool require_client_verify_data = false;
        bool hybrid_x25519 = true;
        std::string server_address = "0.0.0.0";
    };

    struct SessionCfg
    {
        std::chrono::seconds ttl{3600};
        std::chrono::seconds sweep_interval{60};
    };

    struct KeysCfg
    {
        std::vector<std::string> kem_algorithms{"ML-KEM-768", "Kyber768"};
        std::vector<std::string> sig_algorithms{"ML-DSA-65", "Dilithium3"};
        std::chrono::days rotation_interval{180};
        // Unset means one handshake timeout window.
        std::optional<std::chrono::seconds> grace_period;
        std::chrono::seconds rotation_check_interval{3600};
        std::string provider = "software";
        std::string backup_file = "";
    };

    struct StorageCfg
    {
        std::string backend = "local";
        std::string durable_target = "pqgate_sessions.db";
        bool degraded_read_cache = false;
    };

    struct RuntimeCfg
    {
        size_t worker_threads = 2;
    };

    struct LoggingCfg
    {
        std::string level = "info";
        std::string file = "";
        size_t max_size_mb = 100;
        bool enable_console = true;
    };

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath);
    [[nodiscard]] static Config load_defaults();
    [[nodiscard]] static Config load_or_defaults(const std::string& filepath);
    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);

    [[nodiscard]] const HandshakeCfg& handshake() const { return hs; }
    [[nodiscard]] const SessionCfg& session() const { return sess; }
    [[nodiscard]] const KeysCfg& keys() const { return key; }
    [[nodiscard]] const StorageCfg& storage() const { return store; }
    [[nodiscard]] const RuntimeCfg& runtime() const { return rt; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

    [[nodiscard]] std::chrono::seconds grace_period() const { return key.grace_period.value_or(hs.timeout); }

private:
    HandshakeCfg hs;
    SessionCfg sess;
    KeysCfg key;
    StorageCfg store;
    RuntimeCfg rt;
    LoggingCfg log;
};
