#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace tabsync::daemon
{

// Coalesces routine snapshot pushes per session.
//
// The first routine request for a session opens a window of `window`
// length; further requests inside it are folded in. When the window closes
// the session is reported by collect_due() and the caller sends one snapshot
// built from the registry at that moment, so the latest state wins.
// An immediate push for a session supersedes its pending routine push.
//
// Time is passed in explicitly; the class owns no timers and no threads.
class PushDebouncer
{
   public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using SessionKey = uint64_t;

    static constexpr std::chrono::milliseconds DEFAULT_WINDOW{100};

    explicit PushDebouncer(std::chrono::milliseconds window = DEFAULT_WINDOW);

    void request_routine(SessionKey session, TimePoint now);

    // Called when an immediate snapshot was just sent to `session`.
    void note_immediate(SessionKey session);

    void remove_session(SessionKey session);

    // Sessions whose window has closed at `now`, in ascending key order.
    // They are removed from the pending set.
    std::vector<SessionKey> collect_due(TimePoint now);

    std::optional<TimePoint> next_due() const;
    bool                     has_pending(SessionKey session) const;
    size_t                   pending_count() const { return due_.size(); }

    std::chrono::milliseconds window() const { return window_; }

    // Requests folded into an already open window since construction.
    uint64_t coalesced_count() const { return coalesced_; }

   private:
    std::chrono::milliseconds                 window_;
    std::unordered_map<SessionKey, TimePoint> due_;
    uint64_t                                  coalesced_ = 0;
};

}   // namespace tabsync::daemon
