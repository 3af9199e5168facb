#pragma once

#include <chrono>
#include <ctime>
#include <expected>
#include <format>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

/**
 * Process-wide logger. Lines go to the console, to an optional size-rotated
 * file and to an optional sink. Audit lines bypass the level filter.
 */
class Logger
{
public:
    enum class Level { Debug, Info, Warn, Error, Audit };

    using Sink = std::function<void(Level, std::string_view)>;

    [[nodiscard]] static std::expected<void, std::string> init(std::string_view level,
                                                                std::string_view file,
                                                                size_t max_size_mb,
                                                                bool enable_console);
    static void shutdown();

    // Receives every emitted line after formatting; pass nullptr to detach.
    static void set_sink(Sink sink);
    static void set_level(Level lvl);
    [[nodiscard]] static bool enabled(Level lvl);

    template<Level L, typename... Args>
    static void write(std::format_string<Args...> fmt, Args&&... args)
    {
        if (L == Level::Audit || enabled(L))
        {
            log_msg(L, std::format(fmt, std::forward<Args>(args)...));
        }
    }

private:
    struct State
    {
        Level lvl = Level::Info;
        std::ofstream file;
        bool console = true;
        std::mutex mtx;
        size_t max_size = 100 * 1024 * 1024;
        size_t written = 0;
        std::string filename;
        Sink sink;
    };

    static State& instance();
    static Level parse_level(std::string_view lvl);
    static std::string_view level_str(Level l);
    static std::string timestamp();
    static void log_msg(Level l, const std::string& msg);
    static void rotate_file(State& s);
};

#define LOG_DEBUG(...) Logger::write<Logger::Level::Debug>(__VA_ARGS__)
#define LOG_INFO(...)  Logger::write<Logger::Level::Info>(__VA_ARGS__)
#define LOG_WARN(...)  Logger::write<Logger::Level::Warn>(__VA_ARGS__)
#define LOG_ERROR(...) Logger::write<Logger::Level::Error>(__VA_ARGS__)
#define LOG_AUDIT(...) Logger::write<Logger::Level::Audit>(__VA_ARGS__)
