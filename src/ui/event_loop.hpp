#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace tabsync
{

// ─── EventLoop ───────────────────────────────────────────────────────────────
// Single-threaded cooperative loop for the UI side. Pointer handling, snapshot
// application, channel callbacks and timer callbacks all run from
// run_pending() on the thread that owns the loop.
//
// post() may be called from any thread; everything else is loop-thread only.
// The clock is injectable so tests can drive timers deterministically.
//
// A task that throws std::exception is logged and dropped; the loop keeps
// running.

class EventLoop
{
   public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::milliseconds;
    using Task      = std::function<void()>;
    using NowFn     = std::function<TimePoint()>;
    using TimerId   = uint64_t;

    static constexpr TimerId INVALID_TIMER = 0;

    EventLoop();
    explicit EventLoop(NowFn now);
    ~EventLoop() = default;

    EventLoop(const EventLoop&)            = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Queue a task to run on the next run_pending().
    void post(Task task);

    // Run `task` once `delay` has elapsed. A zero delay fires on the next
    // run_pending() after the posted tasks.
    TimerId schedule(Duration delay, Task task);

    // Returns false if the timer already fired or was never scheduled.
    bool cancel(TimerId id);
    bool is_scheduled(TimerId id) const { return timers_.count(id) != 0; }

    // Run every posted task, then every timer that is due. Tasks posted or
    // timers scheduled while running wait for the next call.
    // Returns the number of callbacks run.
    size_t run_pending();

    // Repeat run_pending() until a pass runs nothing. Timers that are not yet
    // due are left alone. Returns the total number of callbacks run.
    size_t run_until_idle(size_t max_passes = 1000);

    TimePoint now() const { return now_(); }

    // Time until the earliest timer is due (zero if overdue), or nullopt if
    // no timer is scheduled.
    std::optional<Duration> time_until_next_timer() const;

    size_t pending_tasks() const;
    size_t pending_timers() const { return timers_.size(); }

   private:
    struct Timer
    {
        TimePoint due;
        Task      task;
    };

    void invoke(const Task& task, const char* what);

    NowFn                   now_;
    mutable std::mutex      post_mutex_;
    std::deque<Task>        posted_;
    std::map<TimerId, Timer> timers_;
    TimerId                 next_timer_id_ = 1;
};

}   // namespace tabsync
