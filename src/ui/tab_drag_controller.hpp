#pragma once

#include <cstddef>
#include <string_view>
#include <tabsync/fwd.hpp>
#include <vector>

#include "replica_store.hpp"
#include "tab_strip.hpp"

namespace tabsync
{

// Candidate drop index for dragging element `source_index` to `pointer_x`.
//
// Every element other than the source is compared by its horizontal
// midpoint, in order. The result is the index, in the list without the
// source, of the first element whose midpoint the pointer has not passed.
// A pointer exactly on a midpoint counts as having passed it. Clamped to
// [min_index, N-1]; with fewer than two elements the source index is
// returned unchanged.
size_t compute_drop_index(const std::vector<Rect>& bounds,
                          size_t                   source_index,
                          float                    pointer_x,
                          size_t                   min_index);

// ─── TabDragController ───────────────────────────────────────────────────────
// Drag state machine for reordering tabs within the strip.
//
// State machine:
//
//   Idle ──pointer_down on draggable tab──► Armed
//                                             │
//                              move > threshold│     pointer_up
//                                             ▼     (click → activate)
//                                          Dragging ──cancel(reason)──► Idle
//                                             │
//                                        pointer_up
//                                             │
//                                             ▼
//                                           Drop ──► Idle
//
// Drop and Cancel are transient: they run their side effects and return to
// Idle in the same call. Suppression is raised on entering Dragging, not on
// pointer-down.
class TabDragController
{
   public:
    // ── State enum ──────────────────────────────────────────────────────

    enum class State
    {
        Idle,
        Armed,
        Dragging,
    };

    enum class CancelReason
    {
        PointerCaptureLost,
        FocusLost,
        Escape,
        TabSetChanged,
    };

    static constexpr float DEFAULT_DRAG_THRESHOLD = 5.0f;

    TabDragController(ReplicaStore& store, TabStrip& strip);
    ~TabDragController();

    // Non-copyable
    TabDragController(const TabDragController&)            = delete;
    TabDragController& operator=(const TabDragController&) = delete;

    // Pixel distance before a press becomes a drag.
    void  set_drag_threshold(float px) { drag_threshold_ = px; }
    float drag_threshold() const { return drag_threshold_; }

    // ── Input events ────────────────────────────────────────────────────

    void on_pointer_down(float x, float y);
    void on_pointer_move(float x, float y);
    void on_pointer_up(float x, float y);

    // Abort any gesture. Idempotent; a no-op in Idle.
    void cancel(CancelReason reason);

    // ── Queries ─────────────────────────────────────────────────────────

    State state() const { return state_; }
    bool  is_dragging() const { return state_ == State::Dragging; }
    bool  is_active() const { return state_ != State::Idle; }

    size_t       source_index() const { return source_index_; }
    const TabId& source_id() const { return source_id_; }
    size_t       candidate_drop_index() const { return candidate_; }

    float pointer_start_x() const { return start_x_; }
    float pointer_start_y() const { return start_y_; }
    float pointer_x() const { return current_x_; }
    float pointer_y() const { return current_y_; }

    uint64_t drop_count() const { return drops_; }
    uint64_t cancel_count() const { return cancels_; }

   private:
    void transition_to_idle();
    void transition_to_dragging();
    void execute_drop();
    void on_store_change(ReplicaStore::ChangeKind kind);

    ReplicaStore& store_;
    TabStrip&     strip_;

    ReplicaStore::ListenerId listener_ = 0;

    // ── State ───────────────────────────────────────────────────────────

    State  state_        = State::Idle;
    size_t source_index_ = NO_INDEX;
    TabId  source_id_;
    size_t source_tab_count_ = 0;
    size_t candidate_        = NO_INDEX;

    float start_x_   = 0.0f;
    float start_y_   = 0.0f;
    float current_x_ = 0.0f;
    float current_y_ = 0.0f;

    // Press on a tab that cannot be dragged (the pinned tab): click only.
    TabId click_only_id_;

    float drag_threshold_ = DEFAULT_DRAG_THRESHOLD;

    uint64_t drops_   = 0;
    uint64_t cancels_ = 0;
};

std::string_view cancel_reason_to_string(TabDragController::CancelReason reason);

}   // namespace tabsync
