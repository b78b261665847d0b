#pragma once

#include <chrono>
#include <functional>
#include <optional>

#include "event_loop.hpp"

namespace tabsync
{

// Time-boxed flag that tells the replica store to ignore routine snapshots
// while a local optimistic edit is in flight. Not a lock: nothing waits on it.
//
// Invariant: active() is true exactly when one expiry timer is scheduled on
// the loop. arm() while active renews the window and replaces the timer.
class SuppressionWindow
{
   public:
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{2000};

    using ExpiredCallback = std::function<void()>;

    explicit SuppressionWindow(EventLoop& loop, std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);
    ~SuppressionWindow();

    SuppressionWindow(const SuppressionWindow&)            = delete;
    SuppressionWindow& operator=(const SuppressionWindow&) = delete;

    // Activate (or renew) with a fresh expiry of now + timeout.
    void arm();

    // Deactivate and cancel the pending timer. No-op when inactive.
    void clear();

    bool active() const { return timer_ != EventLoop::INVALID_TIMER; }

    std::optional<EventLoop::TimePoint> expires_at() const;
    EventLoop::TimerId                  timer_id() const { return timer_; }

    std::chrono::milliseconds timeout() const { return timeout_; }
    void                      set_timeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

    // Fired from the loop when the window lapses without being cleared.
    void set_on_expired(ExpiredCallback cb) { on_expired_ = std::move(cb); }

   private:
    void expire();

    EventLoop&                 loop_;
    std::chrono::milliseconds  timeout_;
    EventLoop::TimerId         timer_ = EventLoop::INVALID_TIMER;
    EventLoop::TimePoint       expires_at_{};
    ExpiredCallback            on_expired_;
};

}   // namespace tabsync
