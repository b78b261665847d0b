#include "replica_store.hpp"

#include <algorithm>
#include <tabsync/logger.hpp>

namespace tabsync
{

ReplicaStore::ReplicaStore(EventLoop&                loop,
                           ipc::AuthorityChannel&    channel,
                           std::chrono::milliseconds suppression_timeout)
    : channel_(channel), suppression_(loop, suppression_timeout)
{
    suppression_.set_on_expired(
        [this]
        {
            TABSYNC_LOG_DEBUG("store", "suppression expired, routine snapshots resume");
            notify(ChangeKind::Suppression);
        });
}

ReplicaStore::~ReplicaStore()
{
    detach();
    *alive_ = false;
}

// ─── Push stream ─────────────────────────────────────────────────────────────

void ReplicaStore::attach()
{
    if (attached())
        return;
    std::weak_ptr<bool> alive = alive_;
    subscription_             = channel_.subscribe(
        [this, alive](const Snapshot& snap)
        {
            auto token = alive.lock();
            if (token && *token)
                apply_incoming(snap);
        });
}

void ReplicaStore::detach()
{
    if (!attached())
        return;
    channel_.unsubscribe(subscription_);
    subscription_ = ipc::AuthorityChannel::INVALID_SUBSCRIPTION;
}

bool ReplicaStore::apply_incoming(const Snapshot& snapshot)
{
    const bool immediate = snapshot.reason == SnapshotReason::Immediate;

    if (suppression_.active() && !immediate)
    {
        ++stats_.dropped_snapshots;
        TABSYNC_LOG_DEBUG("store",
                          "dropped routine snapshot (revision {}) during suppression",
                          snapshot.revision);
        return false;
    }

    auto violations = snapshot.state.check_invariants();
    if (!violations.empty())
    {
        ++stats_.rejected_snapshots;
        TABSYNC_LOG_ERROR("store",
                          "rejected {} snapshot (revision {}): {}",
                          reason_to_string(snapshot.reason),
                          snapshot.revision,
                          violations.front());
        return false;
    }

    const bool changed = snapshot.state != state_;
    if (changed)
        state_ = snapshot.state;
    applied_revision_ = snapshot.revision;
    ++snapshot_generation_;
    ++stats_.applied_snapshots;

    TABSYNC_LOG_TRACE("store",
                      "applied {} snapshot (revision {}, {} tabs)",
                      reason_to_string(snapshot.reason),
                      snapshot.revision,
                      state_.size());

    if (immediate)
        set_suppressed(false);
    if (changed)
        notify(ChangeKind::State);
    return true;
}

// ─── Local edits ─────────────────────────────────────────────────────────────

void ReplicaStore::apply_local_reorder(size_t from, size_t to)
{
    const size_t count = state_.order.size();

    if (count == 0)
    {
        size_t elements = fallback_ ? fallback_->element_count() : 0;
        if (elements > 0)
        {
            from = std::min(from, elements - 1);
            to   = std::min(to, elements - 1);
            if (from != to)
            {
                ++stats_.visual_fallbacks;
                TABSYNC_LOG_WARN("store",
                                 "no tab order known, moving element {} -> {} visually only",
                                 from,
                                 to);
                fallback_->move_element(from, to);
            }
        }
        release_drag_hold();
        set_suppressed(false);
        return;
    }

    const size_t lo = state_.first_movable_index();
    const size_t hi = count - 1;
    if (lo > hi)
    {
        // Only the pinned tab exists; nothing can move.
        release_drag_hold();
        set_suppressed(false);
        return;
    }

    from = std::clamp(from, lo, hi);
    to   = std::clamp(to, lo, hi);
    if (from == to)
    {
        TABSYNC_LOG_TRACE("store", "no-op reorder at {}", from);
        release_drag_hold();
        set_suppressed(false);
        return;
    }

    drag_holds_window_ = false;

    PendingReorder pending;
    pending.seq               = next_reorder_seq_++;
    pending.last_good_order   = state_.order;
    pending.applied_at_splice = snapshot_generation_;

    // A parked rejection whose splice is still on screen: the new splice
    // builds on it, so a later rollback has to undo both.
    if (pending_reorder_ && pending_reorder_->rejected
        && pending_reorder_->applied_at_splice == snapshot_generation_)
    {
        pending.last_good_order = std::move(pending_reorder_->last_good_order);
    }

    move_index(state_.order, from, to);
    pending.id = state_.order[to];

    const uint64_t seq = pending.seq;
    const TabId    id  = pending.id;
    pending_reorder_   = std::move(pending);
    ++stats_.local_reorders;

    // Renews the window if a drag already raised it.
    set_suppressed(true);
    notify(ChangeKind::State);

    TABSYNC_LOG_DEBUG("store", "local reorder {} {} -> {}", id, from, to);

    std::weak_ptr<bool> alive = alive_;
    channel_.invoke(ipc::Command::reorder(id, static_cast<uint32_t>(to)),
                    [this, alive, seq](const ipc::CommandResponse& response)
                    {
                        auto token = alive.lock();
                        if (token && *token)
                            on_reorder_response(seq, response);
                    });
}

void ReplicaStore::on_reorder_response(uint64_t seq, const ipc::CommandResponse& response)
{
    const bool latest = pending_reorder_ && pending_reorder_->seq == seq;

    if (response.success)
    {
        if (latest)
            pending_reorder_.reset();
        return;
    }

    ++stats_.failed_commands;
    TABSYNC_LOG_WARN("store", "reorder rejected by authority: {}", response.error);

    if (pending_reorder_ && !latest)
    {
        // A newer splice is in flight and owns the window.
        return;
    }

    if (latest)
    {
        pending_reorder_->rejected = true;
        if (drag_holds_window_)
        {
            TABSYNC_LOG_DEBUG("store", "drag in progress, rollback of {} waits for it", pending_reorder_->id);
            return;
        }
        settle_rejected_reorder();
    }
    set_suppressed(false);
}

void ReplicaStore::settle_rejected_reorder()
{
    if (!pending_reorder_ || !pending_reorder_->rejected)
        return;

    if (pending_reorder_->applied_at_splice == snapshot_generation_)
    {
        state_.order = std::move(pending_reorder_->last_good_order);
        ++stats_.rollbacks;
        TABSYNC_LOG_INFO("store", "rolled back optimistic reorder of {}", pending_reorder_->id);
        pending_reorder_.reset();
        notify(ChangeKind::State);
        return;
    }
    pending_reorder_.reset();
}

void ReplicaStore::release_drag_hold()
{
    drag_holds_window_ = false;
    settle_rejected_reorder();
}

void ReplicaStore::begin_suppression()
{
    drag_holds_window_ = true;
    set_suppressed(true);
}

void ReplicaStore::clear_suppression()
{
    release_drag_hold();
    set_suppressed(false);
}

void ReplicaStore::set_suppressed(bool on)
{
    const bool was_active = suppression_.active();
    if (on)
        suppression_.arm();
    else
        suppression_.clear();
    if (was_active != suppression_.active())
        notify(ChangeKind::Suppression);
}

// ─── Intents ─────────────────────────────────────────────────────────────────

void ReplicaStore::request_create(const std::string& url, const CreateOptions& options)
{
    issue(ipc::Command::create(url, options));
}

void ReplicaStore::request_close(const TabId& id)
{
    issue(ipc::Command::close(id));
}

void ReplicaStore::request_activate(const TabId& id)
{
    issue(ipc::Command::switch_to(id));
}

void ReplicaStore::request_close_others(const TabId& keep_id)
{
    issue(ipc::Command::close_others(keep_id));
}

void ReplicaStore::request_duplicate(const TabId& id)
{
    issue(ipc::Command::duplicate(id));
}

void ReplicaStore::request_close_all()
{
    issue(ipc::Command::close_all());
}

void ReplicaStore::request_create_batch(const std::vector<std::string>& urls)
{
    if (urls.empty())
        return;
    issue(ipc::Command::create_batch(urls));
}

void ReplicaStore::request_stats(StatsHandler handler)
{
    std::weak_ptr<bool> alive = alive_;
    channel_.invoke(ipc::Command::get_stats(),
                    [this, alive, handler = std::move(handler)](const ipc::CommandResponse& response)
                    {
                        auto token = alive.lock();
                        if (!token || !*token)
                            return;
                        if (!response.success)
                        {
                            ++stats_.failed_commands;
                            TABSYNC_LOG_WARN("store", "get_stats rejected by authority: {}", response.error);
                            if (handler)
                                handler(Result<TabStats>(response.error_code(), response.error));
                            return;
                        }
                        auto counts = stats_from_string(response.data);
                        if (!handler)
                            return;
                        if (counts)
                            handler(Result<TabStats>(*counts));
                        else
                            handler(Result<TabStats>(TabError::Malformed, "unreadable tab counts: " + response.data));
                    });
}

void ReplicaStore::issue(const ipc::Command& cmd)
{
    std::weak_ptr<bool> alive = alive_;
    channel_.invoke(cmd,
                    [this, alive, type = cmd.type](const ipc::CommandResponse& response)
                    {
                        auto token = alive.lock();
                        if (!token || !*token || response.success)
                            return;
                        ++stats_.failed_commands;
                        TABSYNC_LOG_WARN("store",
                                         "{} rejected by authority: {}",
                                         ipc::command_type_to_string(type),
                                         response.error);
                    });
}

// ─── Listeners ───────────────────────────────────────────────────────────────

ReplicaStore::ListenerId ReplicaStore::subscribe(Listener listener)
{
    ListenerId id = next_listener_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void ReplicaStore::unsubscribe(ListenerId id)
{
    listeners_.erase(id);
}

void ReplicaStore::notify(ChangeKind kind)
{
    auto listeners = listeners_;
    for (auto& [id, listener] : listeners)
    {
        if (listener)
            listener(kind);
    }
}

}   // namespace tabsync
