#include <gtest/gtest.h>

#include "ui/tab_drag_controller.hpp"
#include "util/fake_authority.hpp"
#include "util/manual_clock.hpp"

using namespace tabsync;
using namespace std::chrono_literals;
using tabsync::test::FakeAuthority;
using tabsync::test::make_snapshot;
using tabsync::test::make_state;
using tabsync::test::ManualClock;
using State        = TabDragController::State;
using CancelReason = TabDragController::CancelReason;

namespace
{

// Four 80 px elements starting at x = 0: midpoints at 40, 120, 200, 280.
std::vector<Rect> four_rects()
{
    std::vector<Rect> rects;
    for (int i = 0; i < 4; ++i)
        rects.push_back(Rect{80.0f * static_cast<float>(i), 0.0f, 80.0f, 32.0f});
    return rects;
}

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// compute_drop_index
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ComputeDropIndex, CountsPassedMidpointsOfOtherElements)
{
    auto rects = four_rects();
    EXPECT_EQ(compute_drop_index(rects, 0, 10.0f, 0), 0u);
    EXPECT_EQ(compute_drop_index(rects, 0, 130.0f, 0), 1u);
    EXPECT_EQ(compute_drop_index(rects, 0, 210.0f, 0), 2u);
    EXPECT_EQ(compute_drop_index(rects, 0, 290.0f, 0), 3u);
    EXPECT_EQ(compute_drop_index(rects, 3, 0.0f, 0), 0u);
}

TEST(ComputeDropIndex, SourceMidpointIsIgnored)
{
    auto rects = four_rects();
    // Source 1 sits at 80..160; its own midpoint (120) does not count.
    EXPECT_EQ(compute_drop_index(rects, 1, 120.0f, 0), 1u);
    EXPECT_EQ(compute_drop_index(rects, 1, 30.0f, 0), 0u);
}

TEST(ComputeDropIndex, PointerOnMidpointCountsAsPassed)
{
    auto rects = four_rects();
    EXPECT_EQ(compute_drop_index(rects, 0, 200.0f, 0), 2u);
    EXPECT_EQ(compute_drop_index(rects, 0, 199.9f, 0), 1u);
}

TEST(ComputeDropIndex, ClampedToMovableRange)
{
    auto rects = four_rects();
    EXPECT_EQ(compute_drop_index(rects, 2, -50.0f, 1), 1u);
    EXPECT_EQ(compute_drop_index(rects, 2, 5000.0f, 1), 3u);
}

TEST(ComputeDropIndex, DegenerateInputsReturnSource)
{
    std::vector<Rect> one{Rect{0.0f, 0.0f, 80.0f, 32.0f}};
    EXPECT_EQ(compute_drop_index(one, 0, 500.0f, 0), 0u);
    EXPECT_EQ(compute_drop_index({}, 0, 500.0f, 0), 0u);
    EXPECT_EQ(compute_drop_index(four_rects(), 9, 500.0f, 0), 9u);
}

TEST(CancelReasonNames, AllReasonsHaveText)
{
    EXPECT_EQ(cancel_reason_to_string(CancelReason::Escape), "escape");
    EXPECT_EQ(cancel_reason_to_string(CancelReason::FocusLost), "focus lost");
    EXPECT_EQ(cancel_reason_to_string(CancelReason::PointerCaptureLost), "pointer capture lost");
    EXPECT_EQ(cancel_reason_to_string(CancelReason::TabSetChanged), "tab set changed");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Controller fixture: [A(pinned), B, C], 80 px each
// ═══════════════════════════════════════════════════════════════════════════════

class TabDragControllerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        store.attach();
        // Strip first so the controller sees a synced strip.
        strip_listener = store.subscribe(
            [this](ReplicaStore::ChangeKind kind)
            {
                if (kind == ReplicaStore::ChangeKind::State)
                    strip.sync(store.state());
            });
        drag = std::make_unique<TabDragController>(store, strip);
        deliver(make_snapshot({{"A", true}, {"B"}, {"C"}}, SnapshotReason::Routine, 1));
    }

    void deliver(const Snapshot& snap)
    {
        auth.push(snap);
        loop.run_until_idle();
    }

    std::vector<TabId> order() const { return store.state().order; }

    static constexpr float Y = 16.0f;

    ManualClock                        clock;
    EventLoop                          loop{clock.now_fn()};
    FakeAuthority                      auth{loop};
    ReplicaStore                       store{loop, auth, 2000ms};
    TabStrip                           strip;
    ReplicaStore::ListenerId           strip_listener = 0;
    std::unique_ptr<TabDragController> drag;
};

TEST_F(TabDragControllerTest, DragRightReordersAndSendsCommand)
{
    drag->on_pointer_down(100.0f, Y);
    EXPECT_EQ(drag->state(), State::Armed);
    EXPECT_FALSE(store.suppression_active());

    drag->on_pointer_move(230.0f, Y);
    EXPECT_EQ(drag->state(), State::Dragging);
    EXPECT_TRUE(store.suppression_active());
    EXPECT_EQ(drag->source_id(), "B");
    EXPECT_EQ(drag->candidate_drop_index(), 2u);
    EXPECT_FLOAT_EQ(strip.element(1).opacity, TabStrip::DRAG_OPACITY);

    drag->on_pointer_up(230.0f, Y);
    EXPECT_EQ(drag->state(), State::Idle);
    EXPECT_EQ(drag->drop_count(), 1u);
    EXPECT_EQ(order(), (std::vector<TabId>{"A", "C", "B"}));
    EXPECT_EQ(strip.element_id(2), "B");
    EXPECT_FLOAT_EQ(strip.element(2).opacity, 1.0f);

    ASSERT_EQ(auth.invoked.size(), 1u);
    EXPECT_EQ(auth.invoked[0].type, ipc::CommandType::Reorder);
    EXPECT_EQ(auth.invoked[0].tab_id, "B");
    EXPECT_EQ(auth.invoked[0].target_index, 2u);
    EXPECT_TRUE(store.suppression_active());
}

TEST_F(TabDragControllerTest, StaleRoutinePushDuringDropIsIgnored)
{
    drag->on_pointer_down(100.0f, Y);
    drag->on_pointer_move(230.0f, Y);
    drag->on_pointer_up(230.0f, Y);

    clock.advance(10ms);
    deliver(make_snapshot({{"A", true}, {"B"}, {"C"}}, SnapshotReason::Routine, 1));
    EXPECT_EQ(order(), (std::vector<TabId>{"A", "C", "B"}));

    deliver(make_snapshot({{"A", true}, {"C"}, {"B"}}, SnapshotReason::Immediate, 2));
    EXPECT_FALSE(store.suppression_active());
    EXPECT_EQ(order(), (std::vector<TabId>{"A", "C", "B"}));
}

TEST_F(TabDragControllerTest, DragLeftStopsAtPinnedTab)
{
    drag->on_pointer_down(170.0f, Y);   // C
    drag->on_pointer_move(5.0f, Y);
    EXPECT_EQ(drag->candidate_drop_index(), 1u);

    drag->on_pointer_up(5.0f, Y);
    EXPECT_EQ(order(), (std::vector<TabId>{"A", "C", "B"}));
    ASSERT_EQ(auth.invoked.size(), 1u);
    EXPECT_EQ(auth.invoked[0].target_index, 1u);
}

TEST_F(TabDragControllerTest, MovementWithinThresholdIsAClick)
{
    drag->on_pointer_down(100.0f, Y);
    drag->on_pointer_move(103.0f, Y + 4.0f);   // distance 5
    EXPECT_EQ(drag->state(), State::Armed);

    drag->on_pointer_up(103.0f, Y + 4.0f);
    EXPECT_EQ(drag->state(), State::Idle);
    ASSERT_EQ(auth.invoked.size(), 1u);
    EXPECT_EQ(auth.invoked[0].type, ipc::CommandType::Switch);
    EXPECT_EQ(auth.invoked[0].tab_id, "B");
    EXPECT_FALSE(store.suppression_active());
    EXPECT_EQ(drag->drop_count(), 0u);
}

TEST_F(TabDragControllerTest, ThresholdIsConfigurable)
{
    drag->set_drag_threshold(50.0f);
    drag->on_pointer_down(100.0f, Y);
    drag->on_pointer_move(140.0f, Y);
    EXPECT_EQ(drag->state(), State::Armed);
    drag->on_pointer_move(151.0f, Y);
    EXPECT_EQ(drag->state(), State::Dragging);
}

TEST_F(TabDragControllerTest, PinnedTabIsClickOnly)
{
    drag->on_pointer_down(40.0f, Y);
    EXPECT_EQ(drag->state(), State::Idle);
    drag->on_pointer_move(200.0f, Y);
    EXPECT_FALSE(drag->is_dragging());
    EXPECT_FALSE(store.suppression_active());

    // Released elsewhere: not a click.
    drag->on_pointer_up(200.0f, Y);
    EXPECT_TRUE(auth.invoked.empty());

    drag->on_pointer_down(40.0f, Y);
    drag->on_pointer_up(42.0f, Y);
    ASSERT_EQ(auth.invoked.size(), 1u);
    EXPECT_EQ(auth.invoked[0].type, ipc::CommandType::Switch);
    EXPECT_EQ(auth.invoked[0].tab_id, "A");
}

TEST_F(TabDragControllerTest, CloseButtonRequestsClose)
{
    drag->on_pointer_down(148.0f, Y);
    EXPECT_EQ(drag->state(), State::Idle);
    ASSERT_EQ(auth.invoked.size(), 1u);
    EXPECT_EQ(auth.invoked[0].type, ipc::CommandType::Close);
    EXPECT_EQ(auth.invoked[0].tab_id, "B");

    drag->on_pointer_up(148.0f, Y);
    EXPECT_EQ(auth.invoked.size(), 1u);
}

TEST_F(TabDragControllerTest, PressOutsideStripDoesNothing)
{
    drag->on_pointer_down(500.0f, Y);
    drag->on_pointer_move(600.0f, Y);
    drag->on_pointer_up(600.0f, Y);
    EXPECT_EQ(drag->state(), State::Idle);
    EXPECT_TRUE(auth.invoked.empty());
}

TEST_F(TabDragControllerTest, DropInPlaceSendsNothingAndClearsSuppression)
{
    drag->on_pointer_down(100.0f, Y);
    drag->on_pointer_move(130.0f, Y);
    ASSERT_TRUE(drag->is_dragging());
    EXPECT_EQ(drag->candidate_drop_index(), 1u);

    drag->on_pointer_up(130.0f, Y);
    EXPECT_TRUE(auth.invoked.empty());
    EXPECT_FALSE(store.suppression_active());
    EXPECT_EQ(drag->drop_count(), 1u);
    EXPECT_FLOAT_EQ(strip.element(1).opacity, 1.0f);
}

TEST_F(TabDragControllerTest, SecondPressDuringDragIsIgnored)
{
    drag->on_pointer_down(100.0f, Y);
    drag->on_pointer_move(230.0f, Y);
    drag->on_pointer_down(10.0f, Y);
    EXPECT_TRUE(drag->is_dragging());
    EXPECT_EQ(drag->source_id(), "B");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Cancellation
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TabDragControllerTest, CancelDuringDragRestoresEverything)
{
    drag->on_pointer_down(100.0f, Y);
    drag->on_pointer_move(230.0f, Y);
    drag->cancel(CancelReason::Escape);

    EXPECT_EQ(drag->state(), State::Idle);
    EXPECT_FALSE(store.suppression_active());
    EXPECT_EQ(order(), (std::vector<TabId>{"A", "B", "C"}));
    EXPECT_FLOAT_EQ(strip.element(1).opacity, 1.0f);
    EXPECT_TRUE(auth.invoked.empty());
    EXPECT_EQ(drag->cancel_count(), 1u);

    // Idempotent; the release that follows is ignored.
    drag->cancel(CancelReason::PointerCaptureLost);
    drag->on_pointer_up(230.0f, Y);
    EXPECT_EQ(drag->cancel_count(), 1u);
    EXPECT_TRUE(auth.invoked.empty());
}

TEST_F(TabDragControllerTest, CancelWhileArmedSuppressesClick)
{
    drag->on_pointer_down(100.0f, Y);
    drag->cancel(CancelReason::FocusLost);
    drag->on_pointer_up(100.0f, Y);
    EXPECT_TRUE(auth.invoked.empty());
    EXPECT_EQ(drag->cancel_count(), 1u);
}

TEST_F(TabDragControllerTest, CancelWhenIdleIsNoOp)
{
    drag->cancel(CancelReason::Escape);
    EXPECT_EQ(drag->cancel_count(), 0u);
}

TEST_F(TabDragControllerTest, SourceClosedRemotelyCancelsDrag)
{
    drag->on_pointer_down(100.0f, Y);
    drag->on_pointer_move(230.0f, Y);

    deliver(make_snapshot({{"A", true}, {"C"}}, SnapshotReason::Immediate, 2));
    EXPECT_EQ(drag->state(), State::Idle);
    EXPECT_EQ(drag->cancel_count(), 1u);
    EXPECT_FALSE(store.suppression_active());

    drag->on_pointer_up(230.0f, Y);
    EXPECT_TRUE(auth.invoked.empty());
}

TEST_F(TabDragControllerTest, TabAddedRemotelyCancelsDrag)
{
    drag->on_pointer_down(100.0f, Y);
    drag->on_pointer_move(230.0f, Y);

    deliver(make_snapshot({{"A", true}, {"B"}, {"C"}, {"D"}}, SnapshotReason::Immediate, 2));
    EXPECT_EQ(drag->state(), State::Idle);
    EXPECT_EQ(drag->cancel_count(), 1u);
}

TEST_F(TabDragControllerTest, TitleChangeKeepsDragAlive)
{
    drag->on_pointer_down(100.0f, Y);
    drag->on_pointer_move(230.0f, Y);

    auto snap = make_snapshot({{"A", true}, {"B"}, {"C"}}, SnapshotReason::Immediate, 2);
    snap.state.tabs["C"].title = "renamed";
    deliver(snap);

    EXPECT_TRUE(drag->is_dragging());
    EXPECT_FLOAT_EQ(strip.element(1).opacity, TabStrip::DRAG_OPACITY);
}

TEST_F(TabDragControllerTest, DropIsAbandonedWhenSourceMoved)
{
    drag->on_pointer_down(100.0f, Y);
    drag->on_pointer_move(230.0f, Y);

    // Another session moved B; same tab set, so the drag survives.
    deliver(make_snapshot({{"A", true}, {"C"}, {"B"}}, SnapshotReason::Immediate, 2));
    ASSERT_TRUE(drag->is_dragging());

    drag->on_pointer_up(230.0f, Y);
    EXPECT_EQ(drag->state(), State::Idle);
    EXPECT_TRUE(auth.invoked.empty());
    EXPECT_FALSE(store.suppression_active());
    EXPECT_EQ(order(), (std::vector<TabId>{"A", "C", "B"}));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Strip ahead of the store: no order known yet
// ═══════════════════════════════════════════════════════════════════════════════

TEST(TabDragControllerNoOrder, DropMovesElementsVisuallyOnly)
{
    ManualClock   clock;
    EventLoop     loop{clock.now_fn()};
    FakeAuthority auth{loop};
    ReplicaStore  store{loop, auth, 2000ms};
    TabStrip      strip;
    strip.sync(make_state({{"A"}, {"B"}, {"C"}}));
    store.set_visual_fallback(&strip);
    ASSERT_TRUE(store.state().empty());

    TabDragController drag(store, strip);
    drag.on_pointer_down(40.0f, 16.0f);
    drag.on_pointer_move(230.0f, 16.0f);
    ASSERT_TRUE(drag.is_dragging());
    EXPECT_TRUE(store.suppression_active());

    drag.on_pointer_up(230.0f, 16.0f);
    EXPECT_EQ(drag.state(), State::Idle);
    EXPECT_EQ(drag.drop_count(), 1u);
    EXPECT_EQ(store.stats().visual_fallbacks, 1u);
    EXPECT_EQ(strip.element_id(0), "B");
    EXPECT_EQ(strip.element_id(2), "A");
    EXPECT_FALSE(store.suppression_active());
    EXPECT_TRUE(auth.invoked.empty());
}
