#include "inproc_channel.hpp"

#include <tabsync/logger.hpp>

namespace tabsync::ipc
{

InProcChannel::InProcChannel(EventLoop&                loop,
                             daemon::TabRegistry&      registry,
                             std::chrono::milliseconds push_debounce)
    : loop_(loop), registry_(registry), dispatcher_(registry), debouncer_(push_debounce)
{
}

InProcChannel::~InProcChannel()
{
    if (flush_timer_ != EventLoop::INVALID_TIMER)
        loop_.cancel(flush_timer_);
    *alive_ = false;
}

void InProcChannel::send(const Command& cmd)
{
    invoke(cmd, nullptr);
}

void InProcChannel::invoke(const Command& cmd, ResponseHandler handler)
{
    std::weak_ptr<bool> alive = alive_;
    loop_.post(
        [this, alive, cmd, handler = std::move(handler)]() mutable
        {
            auto token = alive.lock();
            if (!token || !*token)
            {
                if (handler)
                    handler(CommandResponse::failure(TabError::Transport, "channel closed"));
                return;
            }
            execute(cmd, std::move(handler));
        });
}

void InProcChannel::execute(const Command& cmd, ResponseHandler handler)
{
    auto outcome = dispatcher_.dispatch(cmd);

    if (handler)
    {
        loop_.post([handler = std::move(handler), response = outcome.response]
                   { handler(response); });
    }

    if (outcome.response.success)
    {
        debouncer_.note_immediate(LOCAL_SESSION);
        push_now(SnapshotReason::Immediate);
    }
}

AuthorityChannel::SubscriptionId InProcChannel::subscribe(PushHandler handler)
{
    SubscriptionId id = next_subscription_++;
    subscribers_.emplace(id, std::move(handler));
    return id;
}

void InProcChannel::unsubscribe(SubscriptionId id)
{
    subscribers_.erase(id);
}

void InProcChannel::notify_external_change()
{
    debouncer_.request_routine(LOCAL_SESSION, loop_.now());
    arm_flush();
}

void InProcChannel::push_now(SnapshotReason reason)
{
    deliver(registry_.snapshot(reason));
}

void InProcChannel::deliver(const Snapshot& snap)
{
    std::weak_ptr<bool> alive = alive_;
    loop_.post(
        [this, alive, snap]
        {
            auto token = alive.lock();
            if (!token || !*token)
                return;
            // Copy: a handler may unsubscribe while we iterate.
            auto handlers = subscribers_;
            for (auto& [id, handler] : handlers)
            {
                if (handler)
                    handler(snap);
            }
        });
}

void InProcChannel::arm_flush()
{
    if (flush_timer_ != EventLoop::INVALID_TIMER)
        return;
    auto due = debouncer_.next_due();
    if (!due)
        return;
    auto delay = std::chrono::ceil<EventLoop::Duration>(*due - loop_.now());
    if (delay.count() < 0)
        delay = EventLoop::Duration::zero();
    flush_timer_ = loop_.schedule(delay, [this] { flush_routine(); });
}

void InProcChannel::flush_routine()
{
    flush_timer_ = EventLoop::INVALID_TIMER;
    // Single local session: at most one entry comes back.
    if (!debouncer_.collect_due(loop_.now()).empty())
    {
        TABSYNC_LOG_TRACE("ipc", "routine push (revision {})", registry_.revision());
        push_now(SnapshotReason::Routine);
    }
    arm_flush();
}

}   // namespace tabsync::ipc
