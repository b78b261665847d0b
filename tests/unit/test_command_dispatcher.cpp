#include <gtest/gtest.h>

#include "daemon/command_dispatcher.hpp"
#include "daemon/tab_registry.hpp"
#include "ipc/codec.hpp"

using namespace tabsync;
using namespace tabsync::daemon;
using namespace tabsync::ipc;

class CommandDispatcherTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        CreateOptions pinned;
        pinned.pinned = true;
        home          = registry.create("tabsync://home", pinned).value();
        b             = registry.create("https://b.test/").value();
        c             = registry.create("https://c.test/").value();
    }

    TabRegistry       registry;
    CommandDispatcher dispatcher{registry};
    TabId             home, b, c;
};

TEST_F(CommandDispatcherTest, CreateReturnsNewId)
{
    auto out = dispatcher.dispatch(Command::create("https://d.test/"));
    ASSERT_TRUE(out.response.success);
    EXPECT_TRUE(registry.has_tab(out.response.data));
    EXPECT_TRUE(out.state_changed);
}

TEST_F(CommandDispatcherTest, ReorderChangesState)
{
    auto out = dispatcher.dispatch(Command::reorder(b, 2));
    EXPECT_TRUE(out.response.success);
    EXPECT_TRUE(out.state_changed);
    EXPECT_EQ(registry.state().order, (std::vector<TabId>{home, c, b}));
}

TEST_F(CommandDispatcherTest, RejectedPinnedReorderLeavesStateAlone)
{
    auto rev = registry.revision();
    auto out = dispatcher.dispatch(Command::reorder(home, 1));
    EXPECT_FALSE(out.response.success);
    EXPECT_EQ(out.response.error_code(), TabError::PinnedViolation);
    EXPECT_FALSE(out.state_changed);
    EXPECT_EQ(registry.revision(), rev);
    EXPECT_EQ(dispatcher.failed_count(), 1u);
}

TEST_F(CommandDispatcherTest, SuccessWithoutChange)
{
    auto out = dispatcher.dispatch(Command::switch_to(c));   // already active
    EXPECT_TRUE(out.response.success);
    EXPECT_FALSE(out.state_changed);
}

TEST_F(CommandDispatcherTest, CloseOthersReportsCount)
{
    auto out = dispatcher.dispatch(Command::close_others(b));
    ASSERT_TRUE(out.response.success);
    EXPECT_EQ(out.response.data, "1");
}

TEST_F(CommandDispatcherTest, ContentUpdates)
{
    EXPECT_TRUE(dispatcher.dispatch(Command::update_title(b, "Bee")).response.success);
    EXPECT_TRUE(dispatcher.dispatch(Command::set_loading(b, false)).response.success);
    auto state = registry.state();
    EXPECT_EQ(state.find(b)->title, "Bee");
    EXPECT_FALSE(state.find(b)->is_loading);
}

TEST_F(CommandDispatcherTest, DuplicateAndClose)
{
    auto dup = dispatcher.dispatch(Command::duplicate(b));
    ASSERT_TRUE(dup.response.success);
    EXPECT_EQ(registry.state().index_of(dup.response.data), 2u);

    EXPECT_TRUE(dispatcher.dispatch(Command::close(dup.response.data)).response.success);
    EXPECT_FALSE(registry.has_tab(dup.response.data));
}

TEST_F(CommandDispatcherTest, CloseAllReportsCountAndKeepsHome)
{
    auto out = dispatcher.dispatch(Command::close_all());
    ASSERT_TRUE(out.response.success);
    EXPECT_EQ(out.response.data, "2");
    EXPECT_TRUE(out.state_changed);
    EXPECT_EQ(registry.state().order, (std::vector<TabId>{home}));
}

TEST_F(CommandDispatcherTest, CreateBatchListsCreatedIds)
{
    auto out = dispatcher.dispatch(Command::create_batch({"https://d.test/", "bogus", "https://e.test/"}));
    ASSERT_TRUE(out.response.success);

    auto comma = out.response.data.find(',');
    ASSERT_NE(comma, std::string::npos);
    TabId d = out.response.data.substr(0, comma);
    TabId e = out.response.data.substr(comma + 1);
    auto state = registry.state();
    EXPECT_EQ(state.index_of(d), 3u);
    EXPECT_EQ(state.index_of(e), 4u);
    EXPECT_EQ(state.active_id, c);
}

TEST_F(CommandDispatcherTest, CreateBatchWithOnlyBadUrlsFails)
{
    auto out = dispatcher.dispatch(Command::create_batch({"bogus", "also bogus"}));
    EXPECT_FALSE(out.response.success);
    EXPECT_EQ(out.response.error_code(), TabError::InvalidUrl);
    EXPECT_FALSE(out.state_changed);
}

TEST_F(CommandDispatcherTest, GetStatsDoesNotTouchState)
{
    auto out = dispatcher.dispatch(Command::get_stats());
    ASSERT_TRUE(out.response.success);
    EXPECT_FALSE(out.state_changed);

    auto stats = stats_from_string(out.response.data);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total, 3u);
    EXPECT_EQ(stats->active, 1u);
    EXPECT_EQ(stats->pinned, 1u);
    EXPECT_EQ(stats->loading, 3u);
}

TEST_F(CommandDispatcherTest, PayloadRoundTrip)
{
    auto out = dispatcher.dispatch_payload(encode_command(Command::reorder(c, 1)));
    EXPECT_TRUE(out.response.success);
    EXPECT_EQ(registry.state().order, (std::vector<TabId>{home, c, b}));
}

TEST_F(CommandDispatcherTest, MalformedPayloadIsRejected)
{
    std::vector<uint8_t> junk = {0x30, 0xFF};
    auto                 out  = dispatcher.dispatch_payload(junk);
    EXPECT_FALSE(out.response.success);
    EXPECT_EQ(out.response.error_code(), TabError::Malformed);
    EXPECT_FALSE(out.state_changed);
    EXPECT_EQ(dispatcher.dispatched_count(), 1u);
    EXPECT_EQ(dispatcher.failed_count(), 1u);
}
