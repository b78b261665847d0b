#include "tab_drag_controller.hpp"

#include <algorithm>
#include <cmath>
#include <tabsync/logger.hpp>

namespace tabsync
{

size_t compute_drop_index(const std::vector<Rect>& bounds,
                          size_t                   source_index,
                          float                    pointer_x,
                          size_t                   min_index)
{
    const size_t count = bounds.size();
    if (count < 2 || source_index >= count)
        return source_index;

    size_t candidate = 0;
    for (size_t i = 0; i < count; ++i)
    {
        if (i == source_index)
            continue;
        if (pointer_x < bounds[i].center_x())
            break;
        ++candidate;
    }
    return std::clamp(candidate, std::min(min_index, count - 1), count - 1);
}

std::string_view cancel_reason_to_string(TabDragController::CancelReason reason)
{
    switch (reason)
    {
        case TabDragController::CancelReason::PointerCaptureLost:
            return "pointer capture lost";
        case TabDragController::CancelReason::FocusLost:
            return "focus lost";
        case TabDragController::CancelReason::Escape:
            return "escape";
        case TabDragController::CancelReason::TabSetChanged:
            return "tab set changed";
    }
    return "unknown";
}

TabDragController::TabDragController(ReplicaStore& store, TabStrip& strip) : store_(store), strip_(strip)
{
    listener_ = store_.subscribe([this](ReplicaStore::ChangeKind kind) { on_store_change(kind); });
}

TabDragController::~TabDragController()
{
    store_.unsubscribe(listener_);
}

// ─── Input events ────────────────────────────────────────────────────────────

void TabDragController::on_pointer_down(float x, float y)
{
    if (state_ == State::Dragging)
        return;
    if (state_ == State::Armed)
        transition_to_idle();
    click_only_id_.clear();

    auto hit = strip_.hit_test(x, y);
    if (!hit.hit())
        return;

    const TabId& id = strip_.element_id(hit.index);
    if (hit.on_close)
    {
        TABSYNC_LOG_DEBUG("drag", "close button on {}", id);
        store_.request_close(id);
        return;
    }
    if (!strip_.is_draggable(hit.index))
    {
        click_only_id_ = id;
        return;
    }

    state_            = State::Armed;
    source_index_     = hit.index;
    source_id_        = id;
    source_tab_count_ = store_.state().size();
    candidate_        = hit.index;
    start_x_ = current_x_ = x;
    start_y_ = current_y_ = y;
    TABSYNC_LOG_TRACE("drag", "armed on {} at index {}", source_id_, source_index_);
}

void TabDragController::on_pointer_move(float x, float y)
{
    strip_.on_hover(x, y);

    if (state_ == State::Idle)
        return;

    current_x_ = x;
    current_y_ = y;

    if (state_ == State::Armed)
    {
        float dx   = x - start_x_;
        float dy   = y - start_y_;
        float dist = std::sqrt(dx * dx + dy * dy);
        if (dist <= drag_threshold_)
            return;
        transition_to_dragging();
    }

    candidate_ =
        compute_drop_index(strip_.element_rects(), source_index_, x, store_.state().first_movable_index());
}

void TabDragController::on_pointer_up(float x, float y)
{
    switch (state_)
    {
        case State::Idle:
        {
            if (click_only_id_.empty())
                return;
            auto hit = strip_.hit_test(x, y);
            if (hit.hit() && strip_.element_id(hit.index) == click_only_id_)
                store_.request_activate(click_only_id_);
            click_only_id_.clear();
            break;
        }

        case State::Armed:
        {
            // Never crossed the threshold: a click.
            TabId id = source_id_;
            transition_to_idle();
            store_.request_activate(id);
            break;
        }

        case State::Dragging:
        {
            current_x_ = x;
            current_y_ = y;
            candidate_ = compute_drop_index(
                strip_.element_rects(), source_index_, x, store_.state().first_movable_index());
            execute_drop();
            break;
        }
    }
}

void TabDragController::cancel(CancelReason reason)
{
    click_only_id_.clear();
    if (state_ == State::Idle)
        return;

    const bool was_dragging = state_ == State::Dragging;
    TABSYNC_LOG_DEBUG("drag", "cancelled drag of {} ({})", source_id_, cancel_reason_to_string(reason));

    strip_.clear_drag_visuals();
    transition_to_idle();
    ++cancels_;

    if (was_dragging)
        store_.clear_suppression();
}

// ─── Transitions ─────────────────────────────────────────────────────────────

void TabDragController::transition_to_idle()
{
    state_            = State::Idle;
    source_index_     = NO_INDEX;
    source_id_.clear();
    source_tab_count_ = 0;
    candidate_        = NO_INDEX;
}

void TabDragController::transition_to_dragging()
{
    state_ = State::Dragging;
    store_.begin_suppression();
    strip_.set_drag_visuals(source_index_, true);
    TABSYNC_LOG_DEBUG("drag", "dragging {} from index {}", source_id_, source_index_);
}

void TabDragController::execute_drop()
{
    const size_t from = source_index_;
    const size_t to   = candidate_;
    const TabId  id   = source_id_;

    strip_.clear_drag_visuals();
    transition_to_idle();
    ++drops_;

    // With no order known the store falls back to a visual-only move.
    if (!store_.state().empty() && store_.state().index_of(id) != from)
    {
        // An immediate snapshot moved the source under the pointer.
        TABSYNC_LOG_INFO("drag", "abandoning drop of {}: it no longer sits at {}", id, from);
        store_.clear_suppression();
        return;
    }

    TABSYNC_LOG_DEBUG("drag", "drop {} {} -> {}", id, from, to);
    // from == to still goes through the store so suppression is cleared.
    store_.apply_local_reorder(from, to);
}

void TabDragController::on_store_change(ReplicaStore::ChangeKind kind)
{
    if (kind != ReplicaStore::ChangeKind::State || state_ == State::Idle)
        return;

    const auto& state = store_.state();
    if (state.index_of(source_id_) == NO_INDEX || state.size() != source_tab_count_)
        cancel(CancelReason::TabSetChanged);
}

}   // namespace tabsync
