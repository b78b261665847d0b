#include "event_loop.hpp"

#include <algorithm>
#include <exception>
#include <tabsync/logger.hpp>
#include <utility>
#include <vector>

namespace tabsync
{

EventLoop::EventLoop() : now_([] { return Clock::now(); }) {}

EventLoop::EventLoop(NowFn now) : now_(std::move(now))
{
    if (!now_)
        now_ = [] { return Clock::now(); };
}

void EventLoop::post(Task task)
{
    if (!task)
        return;
    std::lock_guard lock(post_mutex_);
    posted_.push_back(std::move(task));
}

EventLoop::TimerId EventLoop::schedule(Duration delay, Task task)
{
    if (!task)
        return INVALID_TIMER;
    TimerId id = next_timer_id_++;
    timers_.emplace(id, Timer{now_() + delay, std::move(task)});
    return id;
}

bool EventLoop::cancel(TimerId id)
{
    return timers_.erase(id) != 0;
}

size_t EventLoop::pending_tasks() const
{
    std::lock_guard lock(post_mutex_);
    return posted_.size();
}

void EventLoop::invoke(const Task& task, const char* what)
{
    try
    {
        task();
    }
    catch (const std::exception& e)
    {
        TABSYNC_LOG_ERROR("loop", "{} threw: {}", what, e.what());
    }
    catch (...)
    {
        TABSYNC_LOG_ERROR("loop", "{} threw a non-standard exception", what);
    }
}

size_t EventLoop::run_pending()
{
    size_t ran = 0;

    // Posted tasks
    std::deque<Task> batch;
    {
        std::lock_guard lock(post_mutex_);
        batch.swap(posted_);
    }
    for (auto& task : batch)
    {
        invoke(task, "posted task");
        ++ran;
    }

    // Due timers, earliest first; ties keep scheduling order.
    const TimePoint now = now_();
    std::vector<std::pair<TimePoint, TimerId>> due;
    for (const auto& [id, timer] : timers_)
    {
        if (timer.due <= now)
            due.emplace_back(timer.due, id);
    }
    std::sort(due.begin(), due.end());

    for (const auto& entry : due)
    {
        // An earlier callback may have cancelled this one.
        auto it = timers_.find(entry.second);
        if (it == timers_.end())
            continue;
        Task task = std::move(it->second.task);
        timers_.erase(it);
        invoke(task, "timer");
        ++ran;
    }

    return ran;
}

size_t EventLoop::run_until_idle(size_t max_passes)
{
    size_t total = 0;
    for (size_t pass = 0; pass < max_passes; ++pass)
    {
        size_t ran = run_pending();
        if (ran == 0)
            break;
        total += ran;
    }
    return total;
}

std::optional<EventLoop::Duration> EventLoop::time_until_next_timer() const
{
    if (timers_.empty())
        return std::nullopt;

    TimePoint earliest = TimePoint::max();
    for (const auto& [id, timer] : timers_)
        earliest = std::min(earliest, timer.due);

    auto now = now_();
    if (earliest <= now)
        return Duration::zero();
    return std::chrono::ceil<Duration>(earliest - now);
}

}   // namespace tabsync
