#pragma once

// Scripted AuthorityChannel for replica store and drag controller tests.
//
// Records every command. invoke() handlers are held until the test answers
// them with respond(); push() delivers a snapshot to every subscriber. Both
// go through EventLoop::post like a real channel, so the test drains the
// loop to see their effect.

#include <deque>
#include <map>
#include <string>
#include <vector>

#include "core/tab_state.hpp"
#include "ipc/authority_channel.hpp"
#include "ui/event_loop.hpp"

namespace tabsync::test
{

class FakeAuthority : public ipc::AuthorityChannel
{
   public:
    explicit FakeAuthority(EventLoop& loop) : loop_(loop) {}

    void send(const ipc::Command& cmd) override { sent.push_back(cmd); }

    void invoke(const ipc::Command& cmd, ResponseHandler handler) override
    {
        invoked.push_back(cmd);
        pending_.push_back(std::move(handler));
    }

    SubscriptionId subscribe(PushHandler handler) override
    {
        SubscriptionId id = next_id_++;
        subscribers_.emplace(id, std::move(handler));
        return id;
    }

    void unsubscribe(SubscriptionId id) override { subscribers_.erase(id); }

    // ── Test controls ───────────────────────────────────────────────────

    size_t pending() const { return pending_.size(); }
    size_t subscriber_count() const { return subscribers_.size(); }

    // Answer the oldest outstanding invoke.
    void respond(const ipc::CommandResponse& response)
    {
        if (pending_.empty())
            return;
        auto handler = std::move(pending_.front());
        pending_.pop_front();
        loop_.post([handler = std::move(handler), response] { handler(response); });
    }

    void respond_ok(std::string data = {}) { respond(ipc::CommandResponse::ok(std::move(data))); }

    void respond_failure(TabError error, std::string detail = {})
    {
        respond(ipc::CommandResponse::failure(error, detail));
    }

    void push(const Snapshot& snapshot)
    {
        for (auto& [id, handler] : subscribers_)
        {
            PushHandler h = handler;
            loop_.post([h, snapshot] { h(snapshot); });
        }
    }

    std::vector<ipc::Command> sent;
    std::vector<ipc::Command> invoked;

   private:
    EventLoop&                            loop_;
    std::deque<ResponseHandler>           pending_;
    std::map<SubscriptionId, PushHandler> subscribers_;
    SubscriptionId                        next_id_ = 1;
};

// ─── Snapshot builders ───────────────────────────────────────────────────────

struct TabSpec
{
    std::string id;
    bool        pinned = false;
};

// Tabs in the given order, first one active unless `active` is named.
inline TabState make_state(const std::vector<TabSpec>& tabs, const std::string& active = {})
{
    TabState state;
    for (const auto& tab : tabs)
    {
        TabItem item;
        item.id        = tab.id;
        item.url       = "https://example.test/" + tab.id;
        item.title     = tab.id;
        item.is_pinned = tab.pinned;
        state.tabs.emplace(item.id, item);
        state.order.push_back(item.id);
        if (tab.pinned)
            state.pinned_id = item.id;
    }
    if (!active.empty())
        state.active_id = active;
    else if (!state.order.empty())
        state.active_id = state.order.front();
    return state;
}

inline Snapshot make_snapshot(const std::vector<TabSpec>& tabs,
                              SnapshotReason              reason,
                              uint64_t                    revision,
                              const std::string&          active = {})
{
    Snapshot snap;
    snap.state    = make_state(tabs, active);
    snap.reason   = reason;
    snap.revision = revision;
    return snap;
}

}   // namespace tabsync::test
