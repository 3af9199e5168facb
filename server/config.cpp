#include "config.hpp"

#include <fstream>
#include <sstream>
#include <format>
#include <initializer_list>

namespace {

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_int64() && it->value().as_int64() < 0)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}", key, min_val, max_val));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

std::string get_string(const json::object& obj, std::string_view key, std::string_view default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string())
    {
        return std::string(default_val);
    }
    return std::string(it->value().as_string());
}

bool get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_bool())
    {
        return default_val;
    }
    return it->value().as_bool();
}

std::expected<std::vector<std::string>, std::string> get_string_list(
    const json::object& obj, std::string_view key, const std::vector<std::string>& default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_array() || it->value().as_array().empty())
    {
        return std::unexpected(std::format("'{}' must be a non-empty array of strings", key));
    }
    std::vector<std::string> out;
    for (const auto& jv : it->value().as_array())
    {
        if (!jv.is_string())
        {
            return std::unexpected(std::format("'{}' must be a non-empty array of strings", key));
        }
        out.emplace_back(jv.as_string());
    }
    return out;
}

std::expected<std::string, std::string> get_choice(const json::object& obj, std::string_view key,
                                                   std::initializer_list<std::string_view> choices,
                                                   std::string_view default_val)
{
    auto val = get_string(obj, key, default_val);
    for (auto choice : choices)
    {
        if (val == choice)
        {
            return val;
        }
    }
    return std::unexpected(std::format("'{}' has unsupported value '{}'", key, val));
}

const json::object* section(const json::object& root, std::string_view name)
{
    auto it = root.find(name);
    if (it == root.end() || !it->value().is_object())
    {
        return nullptr;
    }
    return std::addressof(it->value().as_object());
}

} // namespace

std::expected<Config, std::string> Config::load(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    json::value jv;
    try
    {
        jv = json::parse(buffer.str());
    }
    catch (const std::exception& e)
    {
        return std::unexpected(std::format("JSON parse error: {}", e.what()));
    }
    return parse(jv);
}

Config Config::load_defaults()
{
    return Config{};
}

Config Config::load_or_defaults(const std::string& filepath)
{
    auto result = load(filepath);
    if (result)
    {
        return *result;
    }
    return load_defaults();
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();
    Config config;

    if (const auto* hs = section(root, "handshake"))
    {
        auto timeout = get_uint<uint64_t>(*hs, "timeout_sec", 1, 300, 30);
        if (!timeout)
        {
            return std::unexpected(timeout.error());
        }
        config.hs.timeout = std::chrono::seconds(*timeout);

        auto sweep = get_uint<uint64_t>(*hs, "sweep_interval_sec", 1, 300, 5);
        if (!sweep)
        {
            return std::unexpected(sweep.error());
        }
        config.hs.sweep_interval = std::chrono::seconds(*sweep);

        config.hs.require_client_verify_data = get_bool(*hs, "require_client_verify_data", false);
        config.hs.hybrid_x25519 = get_bool(*hs, "hybrid_x25519", true);
        config.hs.server_address = get_string(*hs, "server_address", "0.0.0.0");
    }

    if (const auto* sess = section(root, "session"))
    {
        auto ttl = get_uint<uint64_t>(*sess, "ttl_sec", 10, 86400 * 30, 3600);
        if (!ttl)
        {
            return std::unexpected(ttl.error());
        }
        config.sess.ttl = std::chrono::seconds(*ttl);

        auto sweep = get_uint<uint64_t>(*sess, "sweep_interval_sec", 1, 3600, 60);
        if (!sweep)
        {
            return std::unexpected(sweep.error());
        }
        config.sess.sweep_interval = std::chrono::seconds(*sweep);
    }

    if (const auto* keys = section(root, "keys"))
    {
        auto kems = get_string_list(*keys, "kem_algorithms", config.key.kem_algorithms);
        if (!kems)
        {
            return std::unexpected(kems.error());
        }
        config.key.kem_algorithms = std::move(*kems);

        auto sigs = get_string_list(*keys, "sig_algorithms", config.key.sig_algorithms);
        if (!sigs)
        {
            return std::unexpected(sigs.error());
        }
        config.key.sig_algorithms = std::move(*sigs);

        auto rot = get_uint<uint64_t>(*keys, "rotation_interval_days", 1, 3650, 180);
        if (!rot)
        {
            return std::unexpected(rot.error());
        }
        config.key.rotation_interval = std::chrono::days(*rot);

        if (keys->contains("grace_period_sec"))
        {
            auto grace = get_uint<uint64_t>(*keys, "grace_period_sec", 1, 86400 * 7, 30);
            if (!grace)
            {
                return std::unexpected(grace.error());
            }
            config.key.grace_period = std::chrono::seconds(*grace);
        }

        auto check = get_uint<uint64_t>(*keys, "rotation_check_interval_sec", 10, 86400, 3600);
        if (!check)
        {
            return std::unexpected(check.error());
        }
        config.key.rotation_check_interval = std::chrono::seconds(*check);

        auto provider = get_choice(*keys, "provider", {"software", "hsm"}, "software");
        if (!provider)
        {
            return std::unexpected(provider.error());
        }
        config.key.provider = std::move(*provider);
        config.key.backup_file = get_string(*keys, "backup_file", "");
    }

    if (const auto* st = section(root, "storage"))
    {
        auto backend = get_choice(*st, "backend", {"local", "durable"}, "local");
        if (!backend)
        {
            return std::unexpected(backend.error());
        }
        config.store.backend = std::move(*backend);
        config.store.durable_target = get_string(*st, "durable_target", "pqgate_sessions.db");
        config.store.degraded_read_cache = get_bool(*st, "degraded_read_cache", false);
    }

    if (const auto* rt = section(root, "runtime"))
    {
        auto workers = get_uint<size_t>(*rt, "worker_threads", 1, 64, 2);
        if (!workers)
        {
            return std::unexpected(workers.error());
        }
        config.rt.worker_threads = *workers;
    }

    if (const auto* log = section(root, "logging"))
    {
        config.log.level = get_string(*log, "level", "info");
        config.log.file = get_string(*log, "file", "");
        if (auto max_size = get_uint<size_t>(*log, "max_size_mb", 1, 10000, 100); max_size)
        {
            config.log.max_size_mb = *max_size;
        }
        else
        {
            return std::unexpected(max_size.error());
        }
        config.log.enable_console = get_bool(*log, "enable_console", true);
    }
    return config;
}
