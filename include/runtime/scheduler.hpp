#pragma once

#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace net = boost::asio;

namespace runtime
{

/**
 * Callback re-run every `interval` on its own strand until cancelled.
 * cancel() waits for a run already in progress and guarantees no later run;
 * it must not be called from inside the callback.
 */
class PeriodicTask : public std::enable_shared_from_this<PeriodicTask>
{
public:
    PeriodicTask(net::any_io_executor ex, std::string name, std::chrono::milliseconds interval, std::function<void()> fn);

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void cancel();

    [[nodiscard]] const std::string& name() const { return task_name; }
    [[nodiscard]] uint64_t runs() const { return run_count.load(); }
    [[nodiscard]] bool cancelled() const { return stopped.load(); }

private:
    net::strand<net::any_io_executor> strand;
    net::steady_timer timer;
    std::string task_name;
    std::chrono::milliseconds interval;
    std::function<void()> fn;

    std::atomic<bool> stopped{false};
    std::atomic<uint64_t> run_count{0};
    std::mutex run_mtx;

    net::awaitable<void> loop();
};

/**
 * Worker threads driving an io_context. Owns every PeriodicTask it creates
 * and cancels them before the workers are joined.
 */
class Scheduler
{
public:
    explicit Scheduler(size_t n_threads);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    [[nodiscard]] std::shared_ptr<PeriodicTask> every(std::string name,
                                                      std::chrono::milliseconds interval,
                                                      std::function<void()> fn);

    net::any_io_executor get_executor() const { return pool_exec; }
    size_t size() const { return workers.size(); }
    [[nodiscard]] bool running() const { return is_running.load(); }
    void stop();

private:
    net::io_context pool_ctx;
    net::executor_work_guard<net::io_context::executor_type> work_guard;
    std::vector<std::jthread> workers;
    std::atomic<bool> is_running{true};

    std::mutex tasks_mtx;
    std::vector<std::weak_ptr<PeriodicTask>> tasks;

    net::any_io_executor pool_exec{pool_ctx.get_executor()};
};

} // namespace runtime
