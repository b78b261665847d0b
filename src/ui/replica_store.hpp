#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../core/tab_state.hpp"
#include "../ipc/authority_channel.hpp"
#include "event_loop.hpp"
#include "suppression_window.hpp"

namespace tabsync
{

// ─── ReplicaStore ────────────────────────────────────────────────────────────
// The UI's last-known copy of the authority's tab state.
//
// Incoming snapshots replace the state wholesale, except that routine
// snapshots are dropped while the suppression window is active. A local
// reorder is applied optimistically, re-arms the window and sends a reorder
// command; the authority's immediate snapshot then overrides the window.
//
// If the reorder is rejected and no snapshot has been applied since the
// splice, the store restores the pre-splice order and clears suppression.
// While a drag holds the window (begin_suppression() until the drop or
// clear_suppression()), a rejection is parked and settled when the drag ends.
//
// Loop-thread only.
class ReplicaStore
{
   public:
    enum class ChangeKind
    {
        State,         // tab set, order, titles or active tab changed
        Suppression,   // suppression window armed, cleared or expired
    };

    using Listener     = std::function<void(ChangeKind)>;
    using ListenerId   = uint64_t;
    using StatsHandler = std::function<void(const Result<TabStats>&)>;

    // Visual-only fallback used when the store holds no order but the render
    // layer still shows elements (e.g. before the first snapshot arrived).
    // Best effort: it moves elements on screen only, sends no command and
    // gives no consistency guarantee. The next snapshot overwrites it.
    class VisualFallback
    {
       public:
        virtual ~VisualFallback()                          = default;
        virtual size_t element_count() const               = 0;
        virtual void   move_element(size_t from, size_t to) = 0;
    };

    struct Stats
    {
        uint64_t applied_snapshots  = 0;
        uint64_t dropped_snapshots  = 0;   // routine, during suppression
        uint64_t rejected_snapshots = 0;   // failed the invariant check
        uint64_t local_reorders     = 0;
        uint64_t rollbacks          = 0;
        uint64_t failed_commands    = 0;
        uint64_t visual_fallbacks   = 0;
    };

    ReplicaStore(EventLoop&                loop,
                 ipc::AuthorityChannel&    channel,
                 std::chrono::milliseconds suppression_timeout = SuppressionWindow::DEFAULT_TIMEOUT);
    ~ReplicaStore();

    ReplicaStore(const ReplicaStore&)            = delete;
    ReplicaStore& operator=(const ReplicaStore&) = delete;

    // ── Push stream ─────────────────────────────────────────────────────

    // Subscribe to the channel's snapshot pushes. Idempotent.
    void attach();
    void detach();
    bool attached() const { return subscription_ != ipc::AuthorityChannel::INVALID_SUBSCRIPTION; }

    // Apply an authority snapshot. Returns true if it was applied (even if it
    // matched the current state), false if dropped or rejected.
    bool apply_incoming(const Snapshot& snapshot);

    // ── Local edits ─────────────────────────────────────────────────────

    // Move the tab at `from` to `to` (remove-then-insert). Indices are clamped
    // to the movable range. Equal indices clear suppression and send nothing.
    void apply_local_reorder(size_t from, size_t to);

    // Raise the window at drag start; clear it on cancel. A drop through
    // apply_local_reorder() also ends the drag's hold on the window.
    void begin_suppression();
    void clear_suppression();
    bool drag_holds_window() const { return drag_holds_window_; }
    bool suppression_active() const { return suppression_.active(); }

    const SuppressionWindow& suppression() const { return suppression_; }

    // ── Intents (no local mutation) ─────────────────────────────────────

    void request_create(const std::string& url, const CreateOptions& options = {});
    void request_close(const TabId& id);
    void request_activate(const TabId& id);
    void request_close_others(const TabId& keep_id);
    void request_duplicate(const TabId& id);
    void request_close_all();
    void request_create_batch(const std::vector<std::string>& urls);

    // Ask the authority for its tab counts. The handler runs on the loop
    // with the counts or the failure.
    void request_stats(StatsHandler handler);

    // ── Observation ─────────────────────────────────────────────────────

    const TabState& state() const { return state_; }
    const Stats&    stats() const { return stats_; }

    // Revision of the last applied snapshot (0 before the first).
    uint64_t applied_revision() const { return applied_revision_; }

    ListenerId subscribe(Listener listener);
    void       unsubscribe(ListenerId id);

    void set_visual_fallback(VisualFallback* fallback) { fallback_ = fallback; }

   private:
    struct PendingReorder
    {
        uint64_t           seq = 0;
        TabId              id;
        std::vector<TabId> last_good_order;
        uint64_t           applied_at_splice = 0;   // snapshot_generation_ then
        bool               rejected          = false;
    };

    void issue(const ipc::Command& cmd);
    void on_reorder_response(uint64_t seq, const ipc::CommandResponse& response);
    void settle_rejected_reorder();
    void release_drag_hold();
    void set_suppressed(bool on);
    void notify(ChangeKind kind);

    ipc::AuthorityChannel&                    channel_;
    SuppressionWindow                         suppression_;
    TabState                                  state_;
    Stats                                     stats_;
    uint64_t                                  applied_revision_    = 0;
    uint64_t                                  snapshot_generation_ = 0;
    uint64_t                                  next_reorder_seq_    = 1;
    std::optional<PendingReorder>             pending_reorder_;
    bool                                      drag_holds_window_ = false;
    ipc::AuthorityChannel::SubscriptionId     subscription_ = ipc::AuthorityChannel::INVALID_SUBSCRIPTION;
    std::map<ListenerId, Listener>            listeners_;
    ListenerId                                next_listener_ = 1;
    VisualFallback*                           fallback_      = nullptr;
    std::shared_ptr<bool>                     alive_         = std::make_shared<bool>(true);
};

}   // namespace tabsync
