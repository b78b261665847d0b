#pragma once

#include <chrono>
#include <map>
#include <memory>

#include "../daemon/command_dispatcher.hpp"
#include "../daemon/push_debouncer.hpp"
#include "../ui/event_loop.hpp"
#include "authority_channel.hpp"

namespace tabsync::ipc
{

// Channel to a registry living in the same process. Behaves like a remote
// peer: commands execute on a later loop turn, responses and pushes are
// delivered through EventLoop::post, the issuer gets an immediate snapshot
// after every successful command, and changes made through
// notify_external_change() reach subscribers as debounced routine pushes.
class InProcChannel : public AuthorityChannel
{
   public:
    InProcChannel(EventLoop&                loop,
                  daemon::TabRegistry&      registry,
                  std::chrono::milliseconds push_debounce = daemon::PushDebouncer::DEFAULT_WINDOW);
    ~InProcChannel() override;

    InProcChannel(const InProcChannel&)            = delete;
    InProcChannel& operator=(const InProcChannel&) = delete;

    void           send(const Command& cmd) override;
    void           invoke(const Command& cmd, ResponseHandler handler) override;
    SubscriptionId subscribe(PushHandler handler) override;
    void           unsubscribe(SubscriptionId id) override;

    // The registry was changed by someone other than this channel's user
    // (another session, content updates). Queues a debounced routine push.
    void notify_external_change();

    // Push the current registry state right away with the given reason,
    // bypassing the debouncer.
    void push_now(SnapshotReason reason);

    daemon::CommandDispatcher& dispatcher() { return dispatcher_; }
    size_t                     subscriber_count() const { return subscribers_.size(); }

   private:
    static constexpr daemon::PushDebouncer::SessionKey LOCAL_SESSION = 1;

    void execute(const Command& cmd, ResponseHandler handler);
    void deliver(const Snapshot& snap);
    void arm_flush();
    void flush_routine();

    EventLoop&                             loop_;
    daemon::TabRegistry&                   registry_;
    daemon::CommandDispatcher              dispatcher_;
    daemon::PushDebouncer                  debouncer_;
    EventLoop::TimerId                     flush_timer_ = EventLoop::INVALID_TIMER;
    std::map<SubscriptionId, PushHandler>  subscribers_;
    SubscriptionId                         next_subscription_ = 1;
    std::shared_ptr<bool>                  alive_ = std::make_shared<bool>(true);
};

}   // namespace tabsync::ipc
