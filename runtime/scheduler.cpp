#include "runtime/scheduler.hpp"
#include "logger.hpp"

namespace runtime
{

PeriodicTask::PeriodicTask(net::any_io_executor ex,
                           std::string name,
                           std::chrono::milliseconds period,
                           std::function<void()> callback)
    : strand(net::make_strand(ex))
    , timer(strand)
    , task_name(std::move(name))
    , interval(period)
    , fn(std::move(callback))
{
}

void PeriodicTask::start()
{
    net::co_spawn(strand,
        [self = shared_from_this()]() -> net::awaitable<void>
        {
            co_await self->loop();
        },
        net::detached);
    LOG_DEBUG("Periodic task '{}' scheduled every {}ms", task_name, interval.count());
}

net::awaitable<void> PeriodicTask::loop()
{
    while (!stopped.load(std::memory_order_acquire))
    {
        timer.expires_after(interval);
        auto [ec] = co_await timer.async_wait(net::as_tuple(net::use_awaitable));
        if (ec)
        {
            co_return;
        }

        std::lock_guard lock(run_mtx);
        if (stopped.load(std::memory_order_acquire))
        {
            co_return;
        }
        try
        {
            fn();
        }
        catch (const std::exception& e)
        {
            LOG_ERROR("Periodic task '{}' failed: {}", task_name, e.what());
        }
        run_count.fetch_add(1, std::memory_order_relaxed);
    }
}

void PeriodicTask::cancel()
{
    if (stopped.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }

    net::post(strand, [self = shared_from_this()]
    {
        boost::system::error_code ec;
        self->timer.cancel(ec);
    });

    // Wait out a run that already passed the stopped check.
    std::lock_guard lock(run_mtx);
    LOG_DEBUG("Periodic task '{}' cancelled after {} runs", task_name, run_count.load());
}

Scheduler::Scheduler(size_t n_threads)
    : work_guard(net::make_work_guard(pool_ctx))
    , workers(n_threads == 0 ? 1 : n_threads)
{
    for (auto& t : workers)
    {
        t = std::jthread([this] {pool_ctx.run();});
    }
}

Scheduler::~Scheduler()
{
    stop();
}

std::shared_ptr<PeriodicTask> Scheduler::every(std::string name,
                                               std::chrono::milliseconds interval,
                                               std::function<void()> fn)
{
    auto task = std::make_shared<PeriodicTask>(pool_exec, std::move(name), interval, std::move(fn));
    {
        std::lock_guard lock(tasks_mtx);
        std::erase_if(tasks, [](const auto& w) { return w.expired(); });
        tasks.push_back(task);
    }
    if (is_running.load())
    {
        task->start();
    }
    else
    {
        task->cancel();
    }
    return task;
}

void Scheduler::stop()
{
    if (bool was_running = is_running.exchange(false); !was_running)
    {
        return;
    }

    std::vector<std::weak_ptr<PeriodicTask>> pending;
    {
        std::lock_guard lock(tasks_mtx);
        pending.swap(tasks);
    }
    for (auto& w : pending)
    {
        if (auto task = w.lock())
        {
            task->cancel();
        }
    }

    work_guard.reset();
    pool_ctx.stop();

    for (auto& t : workers)
    {
        if (t.joinable())
        {
            t.join();
        }
    }
}

} // namespace runtime
