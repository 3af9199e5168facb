#include "config.hpp"
#include "gateway.hpp"
#include "logger.hpp"
#include "fundamentals/file_io.hpp"

#include <boost/asio.hpp>

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <print>
#include <string>

namespace net = boost::asio;

namespace
{

constexpr const char* passphrase_env = "PQGATE_BACKUP_PASSPHRASE";

std::optional<std::string> backup_passphrase()
{
    if (const char* pass = std::getenv(passphrase_env); pass && *pass)
    {
        return std::string(pass);
    }
    return std::nullopt;
}

bool load_keys(Gateway& gw, const Config& config)
{
    const auto& file = config.keys().backup_file;
    auto pass = backup_passphrase();

    if (!file.empty() && std::filesystem::exists(file))
    {
        if (!pass)
        {
            LOG_ERROR("Key backup {} exists but {} is not set", file, passphrase_env);
            return false;
        }
        auto blob = file_io::read_file(file);
        if (!blob)
        {
            LOG_ERROR("{}", blob.error());
            return false;
        }
        if (auto res = gw.restore_keys(*pass, *blob); !res)
        {
            LOG_ERROR("Cannot restore keys from {}: {}", file, res.error());
            return false;
        }
        LOG_INFO("Restored server keys from {}", file);
        return true;
    }

    if (auto res = gw.generate_keys(); !res)
    {
        LOG_ERROR("Key generation failed: {}", res.error());
        return false;
    }
    LOG_INFO("Generated fresh server keys");
    return true;
}

void save_keys(Gateway& gw, const Config& config)
{
    const auto& file = config.keys().backup_file;
    if (file.empty())
    {
        return;
    }
    auto pass = backup_passphrase();
    if (!pass)
    {
        LOG_WARN("{} not set, keys are not written to {}", passphrase_env, file);
        return;
    }

    auto blob = gw.backup_keys(*pass);
    if (!blob)
    {
        LOG_ERROR("Key backup failed: {}", blob.error());
        return;
    }
    if (auto res = file_io::write_private_file(file, *blob); !res)
    {
        LOG_ERROR("{}", res.error());
        return;
    }
    LOG_INFO("Server keys written to {}", file);
}

void await_usr1(net::signal_set& usr1, Gateway& gw)
{
    usr1.async_wait([&usr1, &gw](const boost::system::error_code& ec, int)
    {
        if (ec)
        {
            return;
        }
        LOG_INFO("{}", gw.metrics());
        await_usr1(usr1, gw);
    });
}

} // namespace

int main(int argc, char** argv)
{
    std::string config_path = argc > 1 ? argv[1] : "pqgated.json";
    auto config = Config::load_defaults();
    if (std::filesystem::exists(config_path))
    {
        auto loaded = Config::load(config_path);
        if (!loaded)
        {
            std::println(stderr, "Invalid config {}: {}", config_path, loaded.error());
            return 1;
        }
        config = std::move(*loaded);
    }

    auto log_cfg = config.logging();
    if (auto result = Logger::init(log_cfg.level, log_cfg.file, log_cfg.max_size_mb, log_cfg.enable_console);
        !result)
    {
        std::println(stderr, "Failed to initialize logger: {}", result.error());
        return 1;
    }

    SystemClock clock;
    int rc = 0;

    try
    {
        auto gw = Gateway::create(config, clock);
        if (!gw)
        {
            LOG_ERROR("Cannot create gateway: {}", gw.error());
            Logger::shutdown();
            return 1;
        }
        auto& gateway = **gw;

        if (!load_keys(gateway, config))
        {
            Logger::shutdown();
            return 1;
        }

        gateway.start();

        net::io_context ic;
        net::signal_set stop_signals(ic, SIGINT, SIGTERM);
        net::signal_set usr1(ic, SIGUSR1);

        stop_signals.async_wait([&](const boost::system::error_code& ec, int sig)
        {
            if (ec)
            {
                return;
            }
            LOG_INFO("Signal {} received, shutting down", sig);
            usr1.cancel();
            gateway.stop();
        });
        await_usr1(usr1, gateway);

        LOG_INFO("pqgated running ({} KEM, {} signature algorithms)",
                 config.keys().kem_algorithms.size(), config.keys().sig_algorithms.size());
        ic.run();

        save_keys(gateway, config);
        LOG_INFO("{}", gateway.metrics());
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("Fatal: {}", e.what());
        rc = 1;
    }

    LOG_INFO("pqgated exiting...");
    Logger::shutdown();
    return rc;
}
